// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/Protocol.hpp>

#include <format>
#include <set>

namespace mcpgate
{

namespace
{
    auto parseToolDefinition(const nlohmann::json& toolJson) -> std::optional<ToolDefinition>
    {
        auto name = json::getStringOr(toolJson, "name", "");
        if (name.empty())
            return std::nullopt;

        auto title = json::getStringOr(toolJson, "title", "");
        if (title.empty() && toolJson.contains("annotations"))
            title = json::getStringOr(toolJson["annotations"], "title", "");

        auto schema = toolJson.value("inputSchema", nlohmann::json::object());
        if (!schema.is_object())
            schema = nlohmann::json { { "type", "object" } };

        return ToolDefinition {
            .name = std::move(name),
            .title = std::move(title),
            .description = json::getStringOr(toolJson, "description", ""),
            .inputSchema = std::move(schema),
        };
    }
} // namespace

McpClient::McpClient(std::unique_ptr<Transport> transport, McpClientOptions options):
    _transport(std::move(transport)), _options(std::move(options))
{
}

McpClient::~McpClient()
{
    close();
}

auto McpClient::start() -> VoidResult
{
    auto handlers = TransportHandlers {
        .onMessage = [this](nlohmann::json message) { handleMessage(std::move(message)); },
        .onLog =
            [this](std::string_view line) {
                touch();
                _notifications.push(Notification {
                    .method = std::string(protocol::methods::LogMessage),
                    .params = { { "level", "debug" }, { "logger", "stderr" }, { "data", line } },
                });
            },
        .onClosed = [this](std::string reason) { markClosed(std::move(reason), true); },
    };

    touch();
    return _transport->start(std::move(handlers));
}

auto McpClient::initialize(std::optional<std::chrono::milliseconds> timeout) -> Result<ServerCapabilities>
{
    auto const deadline = Clock::now() + timeout.value_or(_options.requestTimeout);

    {
        auto lock = std::unique_lock(_mutex);
        _handshakeCv.wait_until(lock, deadline, [this] { return _handshake != Handshake::InProgress || _closed; });
        if (_handshake == Handshake::Done)
            return _capabilities;
        if (_handshake == Handshake::InProgress)
            return makeError(ErrorCode::Timeout, "Timed out waiting for a concurrent handshake");
        _handshake = Handshake::InProgress;
    }

    auto params = nlohmann::json {
        { "protocolVersion", protocol::ClientProtocolVersion },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", protocol::ImplementationName },
              { "version", protocol::ImplementationVersion },
          } },
    };

    auto result = sendRequest(protocol::methods::Initialize, std::move(params), deadline);
    if (!result)
    {
        {
            auto lock = std::lock_guard(_mutex);
            _handshake = Handshake::NotStarted;
        }
        _handshakeCv.notify_all();
        return std::unexpected(result.error());
    }

    auto caps = ServerCapabilities {};
    auto const serverInfo = result->value("serverInfo", nlohmann::json::object());
    caps.serverName = json::getStringOr(serverInfo, "name", "unknown");
    caps.serverVersion = json::getStringOr(serverInfo, "version", "unknown");
    caps.protocolVersion = json::getStringOr(*result, "protocolVersion", protocol::ClientProtocolVersion);
    caps.instructions = json::getStringOr(*result, "instructions", "");

    if (result->contains("capabilities") && (*result)["capabilities"].is_object())
    {
        auto const& serverCaps = (*result)["capabilities"];
        caps.hasTools = serverCaps.contains("tools");
        caps.hasResources = serverCaps.contains("resources");
        caps.hasPrompts = serverCaps.contains("prompts");
        caps.toolsListChanged = caps.hasTools && json::getBoolOr(serverCaps["tools"], "listChanged", false);
    }

    if (protocol::negotiateVersion(caps.protocolVersion) != caps.protocolVersion)
        log::warning("[{}] Server answered with unknown protocol version {}", _options.label, caps.protocolVersion);

    if (auto sent = notify(protocol::methods::Initialized); !sent)
        log::warning("[{}] Failed to send initialized notification: {}", _options.label, sent.error());

    _transport->onInitialized(caps.protocolVersion, caps.toolsListChanged);

    {
        auto lock = std::lock_guard(_mutex);
        _capabilities = caps;
        _handshake = Handshake::Done;
    }
    _handshakeCv.notify_all();

    log::info("[{}] MCP server initialized: {} v{} (protocol {})",
              _options.label,
              caps.serverName,
              caps.serverVersion,
              caps.protocolVersion);
    return caps;
}

auto McpClient::listTools(std::optional<std::chrono::milliseconds> timeout) -> Result<std::vector<ToolDefinition>>
{
    auto tools = std::vector<ToolDefinition> {};
    auto seenCursors = std::set<std::string> {};
    auto cursor = std::optional<std::string> {};

    do
    {
        auto params = nlohmann::json::object();
        if (cursor)
            params["cursor"] = *cursor;

        auto result = request(protocol::methods::ToolsList, std::move(params), timeout);
        if (!result)
            return std::unexpected(result.error());

        if (result->contains("tools") && (*result)["tools"].is_array())
        {
            for (const auto& toolJson: (*result)["tools"])
            {
                if (auto tool = parseToolDefinition(toolJson))
                    tools.push_back(std::move(*tool));
                else
                    log::warning("[{}] Ignoring tool without a name", _options.label);
            }
        }

        cursor.reset();
        auto next = json::getStringOr(*result, "nextCursor", "");
        if (!next.empty() && seenCursors.insert(next).second)
            cursor = std::move(next);
    } while (cursor);

    return tools;
}

auto McpClient::callTool(std::string_view name,
                         const nlohmann::json& arguments,
                         std::optional<std::chrono::milliseconds> timeout) -> Result<nlohmann::json>
{
    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };

    auto result = request(protocol::methods::ToolsCall, std::move(params), timeout);
    if (result)
        log::debug("[{}] Tool '{}' returned (isError: {})", _options.label, name, result->value("isError", false));
    return result;
}

auto McpClient::request(std::string_view method,
                        nlohmann::json params,
                        std::optional<std::chrono::milliseconds> timeout) -> Result<nlohmann::json>
{
    auto const deadline = Clock::now() + timeout.value_or(_options.requestTimeout);
    return waitForHandshake(deadline).and_then(
        [&]() -> Result<nlohmann::json> { return sendRequest(method, std::move(params), deadline); });
}

auto McpClient::notify(std::string_view method, nlohmann::json params) -> VoidResult
{
    if (isClosed())
        return makeError(ErrorCode::TransportClosed, "Session closed");
    return _transport->send(jsonrpc::makeNotification(method, std::move(params)), _options.requestTimeout);
}

auto McpClient::nextNotification() -> std::optional<Notification>
{
    return _notifications.pop();
}

void McpClient::close()
{
    markClosed("closed by client", false);
    _transport->close();

    auto watchdog = std::thread {};
    {
        auto lock = std::lock_guard(_mutex);
        watchdog = std::move(_watchdog);
    }
    if (watchdog.joinable())
        watchdog.join();
}

auto McpClient::capabilities() const -> ServerCapabilities
{
    auto lock = std::lock_guard(_mutex);
    return _capabilities;
}

auto McpClient::isInitialized() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _handshake == Handshake::Done;
}

auto McpClient::isClosed() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _closed;
}

auto McpClient::closeReason() const -> std::string
{
    auto lock = std::lock_guard(_mutex);
    return _closeReason;
}

auto McpClient::closedUnexpectedly() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _closedUnexpectedly;
}

auto McpClient::waitForHandshake(Clock::time_point deadline) -> VoidResult
{
    auto lock = std::unique_lock(_mutex);
    _handshakeCv.wait_until(lock, deadline, [this] { return _handshake == Handshake::Done || _closed; });
    if (_closed)
    {
        return makeError(_closedUnexpectedly ? ErrorCode::TransportClosed : ErrorCode::Cancelled,
                         std::format("Session closed: {}", _closeReason));
    }
    if (_handshake != Handshake::Done)
        return makeError(ErrorCode::Timeout, "Timed out waiting for the initialize handshake");
    return {};
}

auto McpClient::sendRequest(std::string_view method, nlohmann::json params, Clock::time_point deadline)
    -> Result<nlohmann::json>
{
    auto const requestStart = Clock::now();
    auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - requestStart);
    if (remaining.count() <= 0)
        return makeError(ErrorCode::Timeout, std::format("Request '{}' timed out before it was sent", method));

    auto const id = _nextId++;
    auto promise = std::make_shared<PendingPromise>();
    auto future = promise->get_future();

    {
        auto lock = std::lock_guard(_mutex);
        if (_closed)
        {
            return makeError(_closedUnexpectedly ? ErrorCode::TransportClosed : ErrorCode::Cancelled,
                             std::format("Session closed: {}", _closeReason));
        }
        _pending[id] = promise;
    }

    log::trace("[{}] -> {} #{}", _options.label, method, id);

    if (auto sent = _transport->send(jsonrpc::makeRequest(id, method, std::move(params)), remaining); !sent)
    {
        auto erased = false;
        {
            auto lock = std::lock_guard(_mutex);
            erased = _pending.erase(id) > 0;
        }
        // A concurrent close may already have resolved the promise; its verdict wins.
        if (!erased)
            return future.get();
        return std::unexpected(sent.error());
    }

    if (future.wait_until(deadline) == std::future_status::timeout)
    {
        {
            auto lock = std::lock_guard(_mutex);
            if (_pending.erase(id) == 0)
                return future.get();
        }
        handleTimeout(requestStart);
        return makeError(ErrorCode::Timeout, std::format("Request '{}' timed out", method));
    }

    return future.get();
}

void McpClient::handleMessage(nlohmann::json message)
{
    touch();

    if (message.is_array())
    {
        for (auto& element: message)
            handleMessage(std::move(element));
        return;
    }

    switch (jsonrpc::classify(message))
    {
        case jsonrpc::MessageKind::Response: handleResponse(message); break;
        case jsonrpc::MessageKind::Request: handleServerRequest(message); break;
        case jsonrpc::MessageKind::Notification:
            _notifications.push(Notification {
                .method = message["method"].get<std::string>(),
                .params = message.value("params", nlohmann::json::object()),
            });
            break;
        case jsonrpc::MessageKind::Invalid:
            log::warning("[{}] Ignoring invalid JSON-RPC message: {}", _options.label, message.dump());
            break;
    }
}

void McpClient::handleResponse(const nlohmann::json& message)
{
    auto parsed = jsonrpc::parseResponse(message);
    if (!parsed)
    {
        log::warning("[{}] {}", _options.label, parsed.error());
        return;
    }

    if (!parsed->id.is_number_integer())
    {
        log::warning("[{}] Response with unexpected id {}", _options.label, parsed->id.dump());
        return;
    }

    auto promise = std::shared_ptr<PendingPromise> {};
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _pending.find(parsed->id.get<int64_t>());
        if (it == _pending.end())
        {
            log::debug("[{}] Late or unknown response #{}", _options.label, parsed->id.dump());
            return;
        }
        promise = std::move(it->second);
        _pending.erase(it);
    }

    if (parsed->error)
    {
        promise->set_value(makeError(ErrorCode::RemoteError,
                                     std::format("RPC error {}: {}", parsed->error->code, parsed->error->message)));
        return;
    }
    promise->set_value(parsed->result.value_or(nlohmann::json::object()));
}

void McpClient::handleServerRequest(const nlohmann::json& message)
{
    auto const method = message["method"].get<std::string>();
    auto const reply = method == protocol::methods::Ping
                           ? jsonrpc::makeResult(message["id"], nlohmann::json::object())
                           : jsonrpc::makeErrorResponse(message["id"],
                                                        jsonrpc::codes::MethodNotFound,
                                                        std::format("Method not found: {}", method));

    if (auto sent = _transport->send(reply, _options.requestTimeout); !sent)
        log::warning("[{}] Failed to answer server request '{}': {}", _options.label, method, sent.error());
}

void McpClient::handleTimeout(Clock::time_point requestStart)
{
    if (_transport->kind() != TransportKind::Process || !silentSince(requestStart))
        return;

    auto previous = std::thread {};
    {
        auto lock = std::lock_guard(_mutex);
        if (_closed || _watching)
            return;
        _watching = true;
        previous = std::move(_watchdog);
        _watchdog = std::thread([this, requestStart] { watchSilence(requestStart); });
    }
    if (previous.joinable())
        previous.join();
}

void McpClient::watchSilence(Clock::time_point requestStart)
{
    auto const graceDeadline = Clock::now() + _options.processGracePeriod;
    {
        auto lock = std::unique_lock(_mutex);
        auto const settled =
            _watchCv.wait_until(lock, graceDeadline, [&] { return _closed || !silentSince(requestStart); });
        _watching = false;
        if (settled)
            return;
    }

    log::warning("[{}] Server process unresponsive, tearing it down", _options.label);
    markClosed("server process unresponsive", true);
    _transport->close();
}

auto McpClient::silentSince(Clock::time_point requestStart) const -> bool
{
    return Clock::time_point(Clock::duration(_lastActivity.load())) < requestStart;
}

void McpClient::markClosed(std::string reason, bool unexpected)
{
    auto pending = std::map<int64_t, std::shared_ptr<PendingPromise>> {};
    {
        auto lock = std::lock_guard(_mutex);
        if (_closed)
            return;
        _closed = true;
        _closedUnexpectedly = unexpected;
        _closeReason = reason;
        pending.swap(_pending);
    }
    _handshakeCv.notify_all();
    _watchCv.notify_all();

    for (auto& [id, promise]: pending)
    {
        if (unexpected)
            promise->set_value(makeError(ErrorCode::TransportClosed, std::format("Transport closed: {}", reason)));
        else
            promise->set_value(makeError(ErrorCode::Cancelled, "Request cancelled by disconnect"));
    }

    if (unexpected)
    {
        log::warning("[{}] Connection lost: {}", _options.label, reason);
        _notifications.push(Notification {
            .method = std::string(protocol::methods::TransportClosed),
            .params = { { "reason", reason } },
        });
    }
    _notifications.close();
}

void McpClient::touch()
{
    _lastActivity = Clock::now().time_since_epoch().count();
}

} // namespace mcpgate
