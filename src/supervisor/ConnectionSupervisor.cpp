// SPDX-License-Identifier: Apache-2.0
#include "ConnectionSupervisor.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/Protocol.hpp>

#include <format>

namespace mcpgate
{

ConnectionSupervisor::ConnectionSupervisor(ToolCatalog& catalog,
                                           EventBus& events,
                                           AuthorizationManager* auth,
                                           std::shared_ptr<http::HttpClient> httpClient,
                                           SupervisorOptions options):
    _catalog(catalog),
    _events(events),
    _auth(auth),
    _httpClient(std::move(httpClient)),
    _options(options),
    _transportFactory(makeTransport)
{
}

ConnectionSupervisor::~ConnectionSupervisor()
{
    shutdown();
}

void ConnectionSupervisor::setTransportFactory(TransportFactory factory)
{
    _transportFactory = std::move(factory);
}

auto ConnectionSupervisor::find(const std::string& backendId) const -> std::shared_ptr<Backend>
{
    auto lock = std::shared_lock(_backendsMutex);
    auto const it = _backends.find(backendId);
    return it != _backends.end() ? it->second : nullptr;
}

void ConnectionSupervisor::registerWithAuth(const BackendConfig& config)
{
    if (!_auth)
        return;
    if (config.transport == TransportKind::Remote)
        _auth->registerBackend(config.id, config.url, config.oauth);
    else
        _auth->unregisterBackend(config.id);
}

auto ConnectionSupervisor::addBackend(BackendConfig config) -> VoidResult
{
    if (config.id.empty())
        return makeError(ErrorCode::InvalidArgument, "Backend id must not be empty");

    auto const id = config.id;
    {
        auto lock = std::unique_lock(_backendsMutex);
        if (_backends.contains(id))
            return makeError(ErrorCode::InvalidArgument, std::format("Backend '{}' already exists", id));

        auto backend = std::make_shared<Backend>();
        backend->config = config;
        _backends.emplace(id, std::move(backend));
    }

    registerWithAuth(config);
    log::debug("Registered backend '{}' ({})", id, transportKindToString(config.transport));
    return {};
}

auto ConnectionSupervisor::updateBackend(BackendConfig config) -> VoidResult
{
    auto backend = find(config.id);
    if (!backend)
        return makeError(ErrorCode::NotFound, std::format("Unknown backend: {}", config.id));

    auto wasActive = false;
    {
        auto lock = std::lock_guard(backend->stateMutex);
        wasActive = backend->state.status == ConnectionStatus::Connecting
                    || backend->state.status == ConnectionStatus::Connected;
    }

    disconnect(config.id);
    {
        auto lock = std::lock_guard(backend->stateMutex);
        backend->config = config;
    }
    registerWithAuth(config);

    if (wasActive && config.enabled)
        return connect(config.id);
    return {};
}

auto ConnectionSupervisor::removeBackend(const std::string& backendId) -> VoidResult
{
    if (!find(backendId))
        return makeError(ErrorCode::NotFound, std::format("Unknown backend: {}", backendId));

    disconnect(backendId);
    {
        auto lock = std::unique_lock(_backendsMutex);
        _backends.erase(backendId);
    }
    if (_auth)
        _auth->unregisterBackend(backendId);
    return {};
}

auto ConnectionSupervisor::connect(const std::string& backendId) -> VoidResult
{
    auto backend = find(backendId);
    if (!backend)
        return makeError(ErrorCode::NotFound, std::format("Unknown backend: {}", backendId));

    // A connect issued while a disconnect of the same backend is running waits for it to settle.
    auto lifecycle = std::unique_lock(backend->lifecycleMutex, std::defer_lock);
    auto generation = uint64_t { 0 };
    auto const connecting = ConnectionState { .status = ConnectionStatus::Connecting };
    while (true)
    {
        {
            auto lock = std::unique_lock(backend->stateMutex);
            backend->disconnectSettled.wait(lock, [&] { return backend->pendingDisconnects == 0; });
        }
        lifecycle.lock();

        {
            auto lock = std::lock_guard(backend->stateMutex);
            if (backend->pendingDisconnects == 0
                && (backend->state.status == ConnectionStatus::Connecting
                    || backend->state.status == ConnectionStatus::Connected))
                return {};
        }

        // The previous session's watcher has either finished or is about to.
        if (backend->watcher.joinable())
            backend->watcher.join();

        {
            auto lock = std::lock_guard(backend->stateMutex);
            if (backend->pendingDisconnects == 0)
            {
                generation = ++backend->generation;
                backend->stopRequested = false;
                backend->state = connecting;
                break;
            }
        }
        lifecycle.unlock();
    }
    publishStatus(backendId, connecting);

    return establish(backend, generation);
}

auto ConnectionSupervisor::establish(const std::shared_ptr<Backend>& backend, uint64_t generation) -> VoidResult
{
    auto config = BackendConfig {};
    {
        auto lock = std::lock_guard(backend->stateMutex);
        config = backend->config;
    }

    auto const usesAuth =
        config.transport == TransportKind::Remote && _auth != nullptr && _auth->isRegistered(config.id);
    if (usesAuth)
    {
        if (auto fresh = _auth->ensureFresh(config.id); !fresh)
            log::debug("Pre-connect refresh for '{}' failed: {}", config.id, fresh.error());

        if (config.requiresAuthorization && !_auth->isAuthorized(config.id) && !_auth->refresh(config.id))
            return failConnect(backend,
                               generation,
                               nullptr,
                               Error { ErrorCode::Unauthorized, "Authorization required" });
    }

    auto context = TransportContext {
        .httpClient = _httpClient,
        .tokens = [auth = _auth, id = config.id]() -> std::optional<std::string> {
            return auth ? auth->accessToken(id) : std::nullopt;
        },
        .onAuthorizationHint =
            [auth = _auth, id = config.id](const std::string& url) {
                if (auth)
                    auth->setResourceMetadataHint(id, url);
            },
        .processGracePeriod = _options.processGracePeriod,
    };

    for (auto attempt = 0;; ++attempt)
    {
        auto transport = _transportFactory(config, context);
        if (!transport)
            return failConnect(backend, generation, nullptr, transport.error());

        auto client = std::make_shared<McpClient>(std::move(*transport),
                                                  McpClientOptions {
                                                      .label = config.name,
                                                      .requestTimeout = _options.requestTimeout,
                                                      .processGracePeriod = _options.processGracePeriod,
                                                  });
        {
            auto lock = std::lock_guard(backend->stateMutex);
            if (backend->generation != generation)
                return makeError(ErrorCode::Cancelled, "Connect cancelled by disconnect");
            backend->client = client;
        }

        auto tools = [&]() -> Result<std::vector<ToolDefinition>> {
            if (auto started = client->start(); !started)
                return std::unexpected(started.error());
            if (auto capabilities = client->initialize(); !capabilities)
                return std::unexpected(capabilities.error());
            return client->listTools();
        }();

        if (!tools)
        {
            // An expired token is refreshed once before asking the user.
            if (tools.error().code == ErrorCode::Unauthorized && usesAuth && attempt == 0
                && _auth->refresh(config.id))
            {
                {
                    auto lock = std::lock_guard(backend->stateMutex);
                    if (backend->client == client)
                        backend->client.reset();
                }
                client->close();
                continue;
            }
            return failConnect(backend, generation, client, tools.error());
        }

        auto event = ToolsUpdatedEvent { .backendId = config.id, .backendName = config.name };
        for (const auto& tool: *tools)
            event.toolNames.push_back(tool.name);

        auto const connected = ConnectionState { .status = ConnectionStatus::Connected };
        {
            auto lock = std::lock_guard(backend->stateMutex);
            if (backend->generation != generation)
                return makeError(ErrorCode::Cancelled, "Connect cancelled by disconnect");

            _catalog.replaceBackendEntries(config.id, config.name, *tools);
            backend->state = connected;
            backend->lastConnected = std::chrono::system_clock::now();
            backend->watcher = std::thread(&ConnectionSupervisor::watch, this, backend, client, generation);
        }

        log::info("Backend '{}' connected with {} tools", config.name, tools->size());
        _events.publish(std::move(event));
        publishStatus(config.id, connected);
        return {};
    }
}

auto ConnectionSupervisor::failConnect(const std::shared_ptr<Backend>& backend,
                                       uint64_t generation,
                                       const std::shared_ptr<McpClient>& client,
                                       Error error) -> VoidResult
{
    auto const awaiting = error.code == ErrorCode::Unauthorized;
    auto state = awaiting ? ConnectionState { .status = ConnectionStatus::AwaitingAuthorization }
                          : ConnectionState { .status = ConnectionStatus::Error, .reason = error.message };
    auto backendId = std::string {};
    auto stale = false;
    {
        auto lock = std::lock_guard(backend->stateMutex);
        backendId = backend->config.id;
        stale = backend->generation != generation;
        if (!stale)
        {
            backend->client.reset();
            _catalog.removeBackend(backendId);
            backend->state = state;
        }
    }

    if (client)
        client->close();
    if (stale)
        return makeError(ErrorCode::Cancelled, "Connect cancelled by disconnect");

    publishStatus(backendId, state);
    if (awaiting)
    {
        log::info("Backend '{}' requires authorization", backendId);
        _events.publish(AuthorizationRequiredEvent { .backendId = backendId });
    }
    else
    {
        log::warning("Failed to connect backend '{}': {}", backendId, error);
        _events.publish(ServerErrorEvent { .backendId = backendId, .message = error.message });
    }
    return std::unexpected(std::move(error));
}

void ConnectionSupervisor::disconnect(const std::string& backendId)
{
    auto backend = find(backendId);
    if (!backend)
        return;

    // Phase one cancels whatever is in flight without waiting for it.
    auto client = std::shared_ptr<McpClient> {};
    {
        auto lock = std::lock_guard(backend->stateMutex);
        backend->stopRequested = true;
        ++backend->generation;
        ++backend->pendingDisconnects;
        client = std::move(backend->client);
    }
    if (_auth)
        _auth->cancel(backendId);
    if (client)
        client->close();

    // Phase two waits for a running connect and the watcher, then settles the state.
    auto lifecycle = std::lock_guard(backend->lifecycleMutex);
    if (backend->watcher.joinable())
        backend->watcher.join();

    auto changed = false;
    auto const disconnected = ConnectionState { .status = ConnectionStatus::Disconnected };
    {
        auto lock = std::lock_guard(backend->stateMutex);
        _catalog.removeBackend(backendId);
        changed = backend->state != disconnected;
        backend->state = disconnected;
    }

    if (changed)
    {
        log::info("Backend '{}' disconnected", backendId);
        publishStatus(backendId, disconnected);
    }

    {
        auto lock = std::lock_guard(backend->stateMutex);
        --backend->pendingDisconnects;
    }
    backend->disconnectSettled.notify_all();
}

void ConnectionSupervisor::connectEnabled()
{
    auto ids = std::vector<std::string> {};
    {
        auto lock = std::shared_lock(_backendsMutex);
        for (const auto& [id, backend]: _backends)
        {
            auto stateLock = std::lock_guard(backend->stateMutex);
            if (backend->config.enabled)
                ids.push_back(id);
        }
    }

    auto workers = std::vector<std::thread> {};
    workers.reserve(ids.size());
    for (const auto& id: ids)
    {
        workers.emplace_back([this, id] {
            if (auto connected = connect(id); !connected)
                log::debug("Initial connect of '{}' did not succeed: {}", id, connected.error());
        });
    }
    for (auto& worker: workers)
        worker.join();
}

auto ConnectionSupervisor::status(const std::string& backendId) const -> Result<ConnectionState>
{
    auto backend = find(backendId);
    if (!backend)
        return makeError(ErrorCode::NotFound, std::format("Unknown backend: {}", backendId));

    auto lock = std::lock_guard(backend->stateMutex);
    return backend->state;
}

auto ConnectionSupervisor::config(const std::string& backendId) const -> Result<BackendConfig>
{
    auto backend = find(backendId);
    if (!backend)
        return makeError(ErrorCode::NotFound, std::format("Unknown backend: {}", backendId));

    auto lock = std::lock_guard(backend->stateMutex);
    return backend->config;
}

auto ConnectionSupervisor::snapshot() const -> std::vector<BackendSnapshot>
{
    auto backends = std::vector<std::shared_ptr<Backend>> {};
    {
        auto lock = std::shared_lock(_backendsMutex);
        for (const auto& [id, backend]: _backends)
            backends.push_back(backend);
    }

    auto result = std::vector<BackendSnapshot> {};
    result.reserve(backends.size());
    for (const auto& backend: backends)
    {
        auto entry = BackendSnapshot {};
        {
            auto lock = std::lock_guard(backend->stateMutex);
            entry.config = backend->config;
            entry.state = backend->state;
            entry.lastConnected = backend->lastConnected;
        }
        entry.authStatus = _auth ? _auth->status(entry.config.id) : AuthStatus::None;
        entry.toolCount = _catalog.entries(entry.config.id).size();
        result.push_back(std::move(entry));
    }
    return result;
}

auto ConnectionSupervisor::findByName(std::string_view name) const -> std::optional<std::string>
{
    auto lock = std::shared_lock(_backendsMutex);
    for (const auto& [id, backend]: _backends)
    {
        auto stateLock = std::lock_guard(backend->stateMutex);
        if (backend->config.name == name)
            return id;
    }
    return std::nullopt;
}

auto ConnectionSupervisor::callTool(const std::string& backendId,
                                    std::string_view name,
                                    const nlohmann::json& arguments,
                                    std::optional<std::chrono::milliseconds> timeout) -> Result<nlohmann::json>
{
    return dispatch(backendId, [&](McpClient& client) { return client.callTool(name, arguments, timeout); });
}

auto ConnectionSupervisor::forward(const std::string& backendId,
                                   std::string_view method,
                                   nlohmann::json params,
                                   std::optional<std::chrono::milliseconds> timeout) -> Result<nlohmann::json>
{
    return dispatch(backendId, [&](McpClient& client) { return client.request(method, params, timeout); });
}

auto ConnectionSupervisor::dispatch(const std::string& backendId, const Operation& operation)
    -> Result<nlohmann::json>
{
    auto backend = find(backendId);
    if (!backend)
        return makeError(ErrorCode::NotFound, std::format("Unknown backend: {}", backendId));

    auto client = std::shared_ptr<McpClient> {};
    auto remote = false;
    {
        auto lock = std::lock_guard(backend->stateMutex);
        if (backend->state.status != ConnectionStatus::Connected || !backend->client)
            return makeError(ErrorCode::BackendNotConnected,
                             std::format("Backend '{}' is not connected ({})",
                                         backendId,
                                         connectionStatusToString(backend->state.status)));
        client = backend->client;
        remote = backend->config.transport == TransportKind::Remote;
    }

    auto const usesAuth = remote && _auth != nullptr && _auth->isRegistered(backendId);
    if (usesAuth)
    {
        if (auto fresh = _auth->ensureFresh(backendId); !fresh)
            log::debug("Refresh before dispatch to '{}' failed: {}", backendId, fresh.error());
    }

    auto result = operation(*client);
    if (!result && result.error().code == ErrorCode::Unauthorized && usesAuth)
    {
        if (_auth->refresh(backendId))
            result = operation(*client);
        if (!result && result.error().code == ErrorCode::Unauthorized)
            awaitAuthorization(backend, client);
    }
    return result;
}

void ConnectionSupervisor::awaitAuthorization(const std::shared_ptr<Backend>& backend,
                                              const std::shared_ptr<McpClient>& client)
{
    auto backendId = std::string {};
    auto const awaiting = ConnectionState { .status = ConnectionStatus::AwaitingAuthorization };
    {
        auto lock = std::lock_guard(backend->stateMutex);
        if (backend->client != client)
            return;
        ++backend->generation;
        backend->client.reset();
        backendId = backend->config.id;
        _catalog.removeBackend(backendId);
        backend->state = awaiting;
    }

    client->close();
    log::info("Backend '{}' lost its authorization", backendId);
    publishStatus(backendId, awaiting);
    _events.publish(AuthorizationRequiredEvent { .backendId = backendId });
}

void ConnectionSupervisor::watch(std::shared_ptr<Backend> backend,
                                 std::shared_ptr<McpClient> client,
                                 uint64_t generation)
{
    auto backendId = std::string {};
    auto backendName = std::string {};
    {
        auto lock = std::lock_guard(backend->stateMutex);
        backendId = backend->config.id;
        backendName = backend->config.name;
    }

    while (auto notification = client->nextNotification())
    {
        if (notification->method == protocol::methods::ToolsListChanged)
        {
            refreshTools(backend, client, generation);
        }
        else if (notification->method == protocol::methods::LogMessage)
        {
            auto const& params = notification->params;
            auto message = std::string {};
            if (params.contains("data"))
                message = params["data"].is_string() ? params["data"].get<std::string>() : params["data"].dump();

            auto level = json::getStringOr(params, "level", "info");
            log::backend(log::fromMcpLevel(level), backendName, "{}", message);
            _events.publish(ServerLogEvent {
                .backendId = backendId,
                .level = std::move(level),
                .message = std::move(message),
            });
        }
        else if (notification->method != protocol::methods::TransportClosed)
        {
            log::backend(log::Level::Trace, backendName, "Ignoring notification {}", notification->method);
        }
    }

    // The session ended. Only an unrequested end is an error.
    auto const reason = client->closeReason().empty() ? std::string("connection closed") : client->closeReason();
    auto const failed = ConnectionState { .status = ConnectionStatus::Error, .reason = reason };
    {
        auto lock = std::lock_guard(backend->stateMutex);
        if (backend->generation != generation || backend->stopRequested)
            return;
        ++backend->generation;
        backend->client.reset();
        _catalog.removeBackend(backendId);
        backend->state = failed;
    }

    client->close();
    log::warning("Backend '{}' closed unexpectedly: {}", backendName, reason);
    publishStatus(backendId, failed);
    _events.publish(ServerErrorEvent { .backendId = backendId, .message = reason });
}

void ConnectionSupervisor::refreshTools(const std::shared_ptr<Backend>& backend,
                                        const std::shared_ptr<McpClient>& client,
                                        uint64_t generation)
{
    auto tools = client->listTools();
    if (!tools)
    {
        log::warning("Failed to refresh tools of '{}': {}", client->capabilities().serverName, tools.error());
        return;
    }

    auto event = ToolsUpdatedEvent {};
    {
        auto lock = std::lock_guard(backend->stateMutex);
        if (backend->generation != generation || backend->state.status != ConnectionStatus::Connected)
            return;
        _catalog.replaceBackendEntries(backend->config.id, backend->config.name, *tools);
        event.backendId = backend->config.id;
        event.backendName = backend->config.name;
    }

    for (const auto& tool: *tools)
        event.toolNames.push_back(tool.name);
    log::debug("Backend '{}' now advertises {} tools", event.backendName, tools->size());
    _events.publish(std::move(event));
}

auto ConnectionSupervisor::startAuthorization(const std::string& backendId) -> VoidResult
{
    auto backendConfig = config(backendId);
    if (!backendConfig)
        return std::unexpected(backendConfig.error());
    if (!_auth)
        return makeError(ErrorCode::InvalidArgument, "Authorization is not available");
    if (backendConfig->transport != TransportKind::Remote)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Backend '{}' does not use authorization", backendId));

    if (!_auth->isRegistered(backendId))
        registerWithAuth(*backendConfig);

    if (auto authorized = _auth->authorize(backendId); !authorized)
        return authorized;

    return connect(backendId);
}

auto ConnectionSupervisor::clearAuthorization(const std::string& backendId) -> VoidResult
{
    auto backendConfig = config(backendId);
    if (!backendConfig)
        return std::unexpected(backendConfig.error());
    if (!_auth)
        return makeError(ErrorCode::InvalidArgument, "Authorization is not available");
    if (backendConfig->transport != TransportKind::Remote)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Backend '{}' does not use authorization", backendId));

    _auth->clear(backendId);
    return {};
}

void ConnectionSupervisor::shutdown()
{
    auto ids = std::vector<std::string> {};
    {
        auto lock = std::shared_lock(_backendsMutex);
        for (const auto& [id, backend]: _backends)
            ids.push_back(id);
    }

    auto workers = std::vector<std::thread> {};
    workers.reserve(ids.size());
    for (const auto& id: ids)
        workers.emplace_back([this, id] { disconnect(id); });
    for (auto& worker: workers)
        worker.join();
}

void ConnectionSupervisor::publishStatus(const std::string& backendId, ConnectionState state)
{
    log::debug("Backend '{}' is now {}", backendId, connectionStatusToString(state.status));
    _events.publish(StatusChangedEvent { .backendId = backendId, .state = std::move(state) });
}

} // namespace mcpgate
