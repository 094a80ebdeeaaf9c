// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/Log.hpp>
#include <mcp/Framing.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <format>
#include <mutex>
#include <thread>

#include <sys/stat.h>
#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace mcpgate
{

namespace
{
    auto isExecutableFile(const std::string& path) -> bool
    {
        struct stat st {};
        return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
    }

    void ignoreSigPipeOnce()
    {
        static std::once_flag flag;
        std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
    }

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    auto describeWaitStatus(int status) -> std::string
    {
        if (WIFEXITED(status))
            return std::format("process exited with code {}", WEXITSTATUS(status));
        if (WIFSIGNALED(status))
            return std::format("process terminated by signal {}", WTERMSIG(status));
        return "process ended";
    }
} // namespace

auto findExecutable(std::string_view command) -> std::optional<std::string>
{
    if (command.empty())
        return std::nullopt;

    auto const commandStr = std::string(command);
    if (commandStr.find('/') != std::string::npos)
        return isExecutableFile(commandStr) ? std::optional(commandStr) : std::nullopt;

    auto const* pathEnv = std::getenv("PATH");
    auto const searchPath = std::string_view(pathEnv ? pathEnv : "/usr/local/bin:/usr/bin:/bin");

    auto start = size_t { 0 };
    while (start <= searchPath.size())
    {
        auto end = searchPath.find(':', start);
        if (end == std::string_view::npos)
            end = searchPath.size();

        auto dir = std::string(searchPath.substr(start, end - start));
        if (dir.empty())
            dir = ".";

        auto candidate = std::format("{}/{}", dir, commandStr);
        if (isExecutableFile(candidate))
            return candidate;

        start = end + 1;
    }
    return std::nullopt;
}

struct StdioTransport::Impl
{
    StdioTransportConfig config;
    TransportHandlers handlers;

    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;
    int wakeRead = -1;
    int wakeWrite = -1;

    std::atomic<bool> connected = false;
    std::atomic<bool> closing = false;

    std::mutex writeMutex;
    std::mutex processMutex;
    bool reaped = false;
    int waitStatus = 0;

    std::thread reader;
    framing::FrameDecoder decoder;
    std::string stderrBuffer;

    void readerLoop();
    void drainStdout();
    void drainStderr(bool flushPartial);
    auto tryReap(std::chrono::milliseconds patience) -> bool;
    auto exitReason() -> std::string;
};

void StdioTransport::Impl::readerLoop()
{
    auto buf = std::array<char, 4096> {};
    auto eofReason = std::string {};

    while (true)
    {
        auto fds = std::array<pollfd, 3> { {
            { .fd = stdoutRead, .events = POLLIN, .revents = 0 },
            { .fd = stderrRead, .events = POLLIN, .revents = 0 },
            { .fd = wakeRead, .events = POLLIN, .revents = 0 },
        } };

        if (::poll(fds.data(), fds.size(), -1) < 0)
        {
            if (errno == EINTR)
                continue;
            eofReason = std::format("poll failed: {}", std::strerror(errno));
            break;
        }

        if (fds[2].revents != 0)
            break; // close() asked us to stop

        if (fds[1].revents != 0)
        {
            auto const n = ::read(stderrRead, buf.data(), buf.size());
            if (n > 0)
            {
                stderrBuffer.append(buf.data(), static_cast<size_t>(n));
                drainStderr(false);
            }
            else if (n == 0 || errno != EINTR)
            {
                drainStderr(true);
                closeFd(stderrRead);
            }
        }

        if (fds[0].revents != 0)
        {
            auto const n = ::read(stdoutRead, buf.data(), buf.size());
            if (n > 0)
            {
                decoder.feed(std::string_view(buf.data(), static_cast<size_t>(n)));
                drainStdout();
            }
            else if (n == 0 || errno != EINTR)
            {
                break;
            }
        }
    }

    // Collect whatever the process still wrote to stderr before it went away.
    if (stderrRead >= 0 && !closing)
    {
        ::fcntl(stderrRead, F_SETFL, ::fcntl(stderrRead, F_GETFL) | O_NONBLOCK);
        auto n = ssize_t { 0 };
        while ((n = ::read(stderrRead, buf.data(), buf.size())) > 0)
            stderrBuffer.append(buf.data(), static_cast<size_t>(n));
        drainStderr(true);
    }

    if (closing)
        return;

    connected = false;
    auto reason = eofReason.empty() ? exitReason() : eofReason;
    log::debug("MCP server '{}' went away: {}", config.command, reason);
    if (handlers.onClosed)
        handlers.onClosed(std::move(reason));
}

void StdioTransport::Impl::drainStdout()
{
    while (auto next = decoder.next())
    {
        if (!next->has_value())
        {
            log::warning("Dropping malformed message from '{}': {}", config.command, next->error().message);
            continue;
        }
        if (handlers.onMessage)
            handlers.onMessage(std::move(next->value()));
    }
}

void StdioTransport::Impl::drainStderr(bool flushPartial)
{
    auto pos = size_t { 0 };
    while ((pos = stderrBuffer.find('\n')) != std::string::npos)
    {
        auto line = stderrBuffer.substr(0, pos);
        stderrBuffer.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (!line.empty() && handlers.onLog)
            handlers.onLog(line);
    }

    if (flushPartial && !stderrBuffer.empty())
    {
        if (handlers.onLog)
            handlers.onLog(stderrBuffer);
        stderrBuffer.clear();
    }
}

auto StdioTransport::Impl::tryReap(std::chrono::milliseconds patience) -> bool
{
    // Caller holds processMutex.
    auto const deadline = std::chrono::steady_clock::now() + patience;
    while (!reaped)
    {
        auto status = 0;
        auto const rc = ::waitpid(childPid, &status, WNOHANG);
        if (rc == childPid || (rc < 0 && errno == ECHILD))
        {
            reaped = true;
            waitStatus = rc == childPid ? status : 0;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline)
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return reaped;
}

auto StdioTransport::Impl::exitReason() -> std::string
{
    auto lock = std::lock_guard(processMutex);
    if (childPid > 0 && tryReap(std::chrono::milliseconds(200)))
        return describeWaitStatus(waitStatus);
    return "process closed its standard output";
}

StdioTransport::StdioTransport(StdioTransportConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

StdioTransport::~StdioTransport()
{
    close();
}

auto StdioTransport::start(TransportHandlers handlers) -> VoidResult
{
    if (_impl->connected || _impl->childPid > 0)
        return makeError(ErrorCode::TransportError, "Transport already started");

    auto const& config = _impl->config;
    auto const executable = findExecutable(config.command);
    if (!executable)
        return makeError(ErrorCode::TransportError, std::format("Executable not found: {}", config.command));

    ignoreSigPipeOnce();

    // POSIX: posix_spawn with pipes. All parent-side ends are close-on-exec.
    int stdinPipe[2];
    int stdoutPipe[2];
    int stderrPipe[2];
    int wakePipe[2];

    if (::pipe2(stdinPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::TransportError, "Failed to create stdin pipe");
    if (::pipe2(stdoutPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::TransportError, "Failed to create stdout pipe");
    }
    if (::pipe2(stderrPipe, O_CLOEXEC) != 0)
    {
        for (auto fd: { stdinPipe[0], stdinPipe[1], stdoutPipe[0], stdoutPipe[1] })
            ::close(fd);
        return makeError(ErrorCode::TransportError, "Failed to create stderr pipe");
    }
    if (::pipe2(wakePipe, O_CLOEXEC) != 0)
    {
        for (auto fd: { stdinPipe[0], stdinPipe[1], stdoutPipe[0], stdoutPipe[1], stderrPipe[0], stderrPipe[1] })
            ::close(fd);
        return makeError(ErrorCode::TransportError, "Failed to create wake pipe");
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment (inherit + config overrides)
    auto envMap = std::map<std::string, std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto const entry = std::string_view(*e);
            auto const eq = entry.find('=');
            if (eq != std::string_view::npos)
                envMap[std::string(entry.substr(0, eq))] = std::string(entry.substr(eq + 1));
        }
    }
    for (const auto& [key, value]: config.env)
        envMap[key] = value;

    auto envStrings = std::vector<std::string> {};
    envStrings.reserve(envMap.size());
    for (const auto& [key, value]: envMap)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status = posix_spawn(&pid, executable->c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);
    ::close(stderrPipe[1]);

    if (status != 0)
    {
        for (auto fd: { stdinPipe[1], stdoutPipe[0], stderrPipe[0], wakePipe[0], wakePipe[1] })
            ::close(fd);
        return makeError(ErrorCode::TransportError,
                         std::format("Failed to spawn process '{}': {}", config.command, std::strerror(status)));
    }

    ::fcntl(stdinPipe[1], F_SETFL, ::fcntl(stdinPipe[1], F_GETFL) | O_NONBLOCK);

    _impl->handlers = std::move(handlers);
    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->stderrRead = stderrPipe[0];
    _impl->wakeRead = wakePipe[0];
    _impl->wakeWrite = wakePipe[1];
    _impl->connected = true;
    _impl->reader = std::thread([impl = _impl.get()] { impl->readerLoop(); });

    log::info("MCP server started: {} (pid {})", config.command, pid);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message, std::chrono::milliseconds timeout) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportClosed, "Transport not connected");

    auto const data = framing::encode(message, _impl->config.framing);
    auto const deadline = std::chrono::steady_clock::now() + timeout;

    auto lock = std::lock_guard(_impl->writeMutex);
    auto offset = size_t { 0 };
    while (offset < data.size())
    {
        if (_impl->stdinWrite < 0)
            return makeError(ErrorCode::TransportClosed, "Transport closed");

        auto const n = ::write(_impl->stdinWrite, data.data() + offset, data.size() - offset);
        if (n > 0)
        {
            offset += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
        {
            auto const remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
                return makeError(ErrorCode::Timeout, "Timed out writing to process stdin");
            auto pfd = pollfd { .fd = _impl->stdinWrite, .events = POLLOUT, .revents = 0 };
            (void) ::poll(&pfd, 1, static_cast<int>(remaining.count()));
            continue;
        }
        if (n < 0 && errno == EPIPE)
            return makeError(ErrorCode::TransportClosed, "Process stdin closed");
        return makeError(ErrorCode::TransportError,
                         std::format("Failed to write to process stdin: {}", std::strerror(errno)));
    }

    return {};
}

void StdioTransport::close()
{
    if (_impl->closing.exchange(true))
        return;

    _impl->connected = false;

    {
        auto lock = std::lock_guard(_impl->writeMutex);
        closeFd(_impl->stdinWrite);
    }

    if (_impl->childPid > 0)
    {
        auto lock = std::lock_guard(_impl->processMutex);
        if (!_impl->reaped)
        {
            ::kill(_impl->childPid, SIGTERM);
            if (!_impl->tryReap(_impl->config.gracePeriod))
            {
                log::warning("MCP server '{}' ignored SIGTERM, killing it", _impl->config.command);
                ::kill(_impl->childPid, SIGKILL);
                auto status = 0;
                ::waitpid(_impl->childPid, &status, 0);
                _impl->reaped = true;
                _impl->waitStatus = status;
            }
        }
    }

    if (_impl->reader.joinable())
    {
        auto const wake = char { 'x' };
        (void) ::write(_impl->wakeWrite, &wake, 1);
        _impl->reader.join();
    }

    closeFd(_impl->stdoutRead);
    closeFd(_impl->stderrRead);
    closeFd(_impl->wakeRead);
    closeFd(_impl->wakeWrite);

    log::debug("MCP transport closed");
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto StdioTransport::pid() const -> int
{
    return _impl->childPid;
}

} // namespace mcpgate
