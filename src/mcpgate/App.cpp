// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <auth/AuthorizationManager.hpp>
#include <auth/GrantStore.hpp>
#include <catalog/ToolCatalog.hpp>
#include <core/EventBus.hpp>
#include <core/Log.hpp>
#include <http/CurlHttpClient.hpp>
#include <router/RequestRouter.hpp>
#include <server/ProxyServer.hpp>
#include <supervisor/ConnectionSupervisor.hpp>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <format>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace mcpgate
{

namespace
{
    // Write end of the self-pipe the termination handler signals through.
    int gShutdownPipe = -1; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    void terminationHandler(int /*sig*/)
    {
        if (gShutdownPipe >= 0)
        {
            auto const byte = char { 1 };
            [[maybe_unused]] auto const n = ::write(gShutdownPipe, &byte, 1);
        }
    }

    auto levelForEvent(const Event& event) -> log::Level
    {
        if (std::holds_alternative<ServerErrorEvent>(event)
            || std::holds_alternative<AuthorizationRequiredEvent>(event))
            return log::Level::Warning;
        if (std::holds_alternative<ServerLogEvent>(event) || std::holds_alternative<CallCompletedEvent>(event))
            return log::Level::Trace;
        return log::Level::Debug;
    }
} // namespace

struct App::Impl
{
    AppConfig config;
    EventBus events;
    ToolCatalog catalog;
    std::shared_ptr<http::HttpClient> httpClient;
    AuthorizationManager auth;
    ConnectionSupervisor supervisor;
    RequestRouter router;
    server::ProxyServer proxy;
    EventBus::SubscriberId eventLogger = 0;

    explicit Impl(AppConfig cfg):
        config(std::move(cfg)),
        httpClient(std::make_shared<http::CurlHttpClient>()),
        auth(httpClient,
             events,
             AuthorizationOptions {
                 .refreshMargin = std::chrono::seconds(config.refreshMarginSeconds),
             }),
        supervisor(catalog,
                   events,
                   &auth,
                   httpClient,
                   SupervisorOptions {
                       .requestTimeout = std::chrono::milliseconds(config.requestTimeoutMs),
                       .processGracePeriod = std::chrono::milliseconds(config.processGracePeriodMs),
                   }),
        router(supervisor, catalog, events),
        proxy(router, server::ProxyServerOptions { .host = config.proxy.host, .port = config.proxy.port })
    {
    }

    ~Impl()
    {
        auth.stopBackgroundRefresh();
        supervisor.shutdown();
        proxy.stop();
        events.stop();
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    auto& impl = *_impl;

    impl.eventLogger = impl.events.subscribe([](const Event& event) {
        auto const level = levelForEvent(event);
        if (log::getLevel() >= level)
            log::write(level, std::format("[{}] {}", eventName(event), eventToJson(event).dump()));
    });

    auto const dataDir = impl.config.dataDir.empty() ? defaultDataDir() : impl.config.dataDir;
    impl.auth.setGrantStore(std::make_shared<oauth::GrantStore>(std::filesystem::path(dataDir) / "tokens.json"));

    // The endpoint comes first: without it there is nothing to serve.
    auto port = impl.proxy.start();
    if (!port)
        return std::unexpected(port.error());

    for (const auto& server: impl.config.servers)
    {
        if (auto added = impl.supervisor.addBackend(server); !added)
            return std::unexpected(added.error());
    }

    impl.supervisor.connectEnabled();
    impl.auth.startBackgroundRefresh();

    for (const auto& backend: impl.supervisor.snapshot())
    {
        log::info("  {} [{}] {}{}",
                  backend.config.name,
                  transportKindToString(backend.config.transport),
                  connectionStatusToString(backend.state.status),
                  backend.state.reason.empty() ? std::string {} : std::format(" ({})", backend.state.reason));
    }
    log::info("Endpoints: http://{0}:{1}/mcp, http://{0}:{1}/discovery, http://{0}:{1}/servers/<id>",
              impl.config.proxy.host,
              *port);
    return {};
}

auto App::run() -> int
{
    auto fds = std::array<int, 2> { -1, -1 };
    if (::pipe2(fds.data(), O_CLOEXEC) != 0)
    {
        log::error("Failed to create shutdown pipe: {}", std::strerror(errno));
        return 1;
    }
    gShutdownPipe = fds[1];

    struct sigaction sa {};
    sa.sa_handler = terminationHandler;
    sigemptyset(&sa.sa_mask);
    struct sigaction prevInt {};
    struct sigaction prevTerm {};
    sigaction(SIGINT, &sa, &prevInt);
    sigaction(SIGTERM, &sa, &prevTerm);

    log::info("mcpgate is running, press Ctrl+C to stop");
    auto pfd = pollfd { .fd = fds[0], .events = POLLIN, .revents = 0 };
    while (::poll(&pfd, 1, -1) < 0 && errno == EINTR)
    {
    }

    log::info("Shutting down");
    sigaction(SIGINT, &prevInt, nullptr);
    sigaction(SIGTERM, &prevTerm, nullptr);
    gShutdownPipe = -1;
    ::close(fds[0]);
    ::close(fds[1]);

    _impl->auth.stopBackgroundRefresh();
    _impl->supervisor.shutdown();
    _impl->proxy.stop();
    _impl->events.flush();
    return 0;
}

} // namespace mcpgate
