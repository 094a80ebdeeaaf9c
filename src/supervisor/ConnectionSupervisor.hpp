// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <auth/AuthorizationManager.hpp>
#include <catalog/ToolCatalog.hpp>
#include <core/BackendConfig.hpp>
#include <core/Error.hpp>
#include <core/EventBus.hpp>
#include <core/Types.hpp>
#include <mcp/McpClient.hpp>
#include <mcp/TransportFactory.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace mcpgate
{

/// @brief Creates a transport for a backend; replaceable for tests.
using TransportFactory =
    std::function<Result<std::unique_ptr<Transport>>(const BackendConfig&, const TransportContext&)>;

/// @brief Tunables shared by every backend session.
struct SupervisorOptions
{
    std::chrono::milliseconds requestTimeout { 30000 };
    std::chrono::milliseconds processGracePeriod { 5000 };
};

/// @brief Read-only view of one backend for status displays.
struct BackendSnapshot
{
    BackendConfig config;
    ConnectionState state;
    AuthStatus authStatus = AuthStatus::None;
    std::optional<std::chrono::system_clock::time_point> lastConnected;
    size_t toolCount = 0;
};

/// @brief Owns every backend connection and drives its lifecycle state machine.
///
/// Each backend has its own lifecycle mutex and watcher thread, so a slow or failing
/// backend never holds up the others. The backend map lock is only held for lookups.
class ConnectionSupervisor
{
  public:
    /// @param auth Optional; without it remote backends cannot be authorized.
    ConnectionSupervisor(ToolCatalog& catalog,
                         EventBus& events,
                         AuthorizationManager* auth,
                         std::shared_ptr<http::HttpClient> httpClient,
                         SupervisorOptions options = {});
    ~ConnectionSupervisor();

    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    void setTransportFactory(TransportFactory factory);

    /// @brief Registers a backend in Disconnected state. Fails on an empty or duplicate id.
    [[nodiscard]] auto addBackend(BackendConfig config) -> VoidResult;

    /// @brief Replaces a backend's configuration, reconnecting it if it was active.
    [[nodiscard]] auto updateBackend(BackendConfig config) -> VoidResult;

    /// @brief Disconnects and forgets a backend.
    [[nodiscard]] auto removeBackend(const std::string& backendId) -> VoidResult;

    /// @brief Opens the transport, performs the handshake and publishes the backend's tools.
    ///
    /// No-op if the backend is already Connecting or Connected. Failures leave the backend
    /// in Error (or AwaitingAuthorization) and are not retried.
    [[nodiscard]] auto connect(const std::string& backendId) -> VoidResult;

    /// @brief Tears down the backend's session. Idempotent; unknown ids are ignored.
    void disconnect(const std::string& backendId);

    /// @brief Connects every enabled backend concurrently and waits for all attempts.
    void connectEnabled();

    [[nodiscard]] auto status(const std::string& backendId) const -> Result<ConnectionState>;
    [[nodiscard]] auto config(const std::string& backendId) const -> Result<BackendConfig>;
    [[nodiscard]] auto snapshot() const -> std::vector<BackendSnapshot>;

    /// @brief Backend id of the backend named @p name, if any.
    [[nodiscard]] auto findByName(std::string_view name) const -> std::optional<std::string>;

    /// @brief Invokes a tool on a connected backend.
    [[nodiscard]] auto callTool(const std::string& backendId,
                                std::string_view name,
                                const nlohmann::json& arguments,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Result<nlohmann::json>;

    /// @brief Forwards an arbitrary request to a connected backend.
    [[nodiscard]] auto forward(const std::string& backendId,
                               std::string_view method,
                               nlohmann::json params,
                               std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Result<nlohmann::json>;

    /// @brief Runs the interactive authorization flow and connects on success.
    [[nodiscard]] auto startAuthorization(const std::string& backendId) -> VoidResult;

    /// @brief Drops the stored grant of a remote backend.
    [[nodiscard]] auto clearAuthorization(const std::string& backendId) -> VoidResult;

    /// @brief Disconnects every backend.
    void shutdown();

  private:
    struct Backend
    {
        std::mutex lifecycleMutex; ///< Serializes connect against the tail of disconnect.
        mutable std::mutex stateMutex;
        std::condition_variable disconnectSettled;
        int pendingDisconnects = 0; ///< Disconnects that have not yet published Disconnected.
        BackendConfig config;
        ConnectionState state;
        std::shared_ptr<McpClient> client;
        uint64_t generation = 0;
        bool stopRequested = false;
        std::optional<std::chrono::system_clock::time_point> lastConnected;
        std::thread watcher;
    };

    using Operation = std::function<Result<nlohmann::json>(McpClient&)>;

    [[nodiscard]] auto find(const std::string& backendId) const -> std::shared_ptr<Backend>;
    [[nodiscard]] auto establish(const std::shared_ptr<Backend>& backend, uint64_t generation) -> VoidResult;
    [[nodiscard]] auto failConnect(const std::shared_ptr<Backend>& backend,
                                   uint64_t generation,
                                   const std::shared_ptr<McpClient>& client,
                                   Error error) -> VoidResult;
    [[nodiscard]] auto dispatch(const std::string& backendId, const Operation& operation) -> Result<nlohmann::json>;
    void awaitAuthorization(const std::shared_ptr<Backend>& backend, const std::shared_ptr<McpClient>& client);
    void watch(std::shared_ptr<Backend> backend, std::shared_ptr<McpClient> client, uint64_t generation);
    void refreshTools(const std::shared_ptr<Backend>& backend,
                      const std::shared_ptr<McpClient>& client,
                      uint64_t generation);
    void publishStatus(const std::string& backendId, ConnectionState state);
    void registerWithAuth(const BackendConfig& config);

    ToolCatalog& _catalog;
    EventBus& _events;
    AuthorizationManager* _auth;
    std::shared_ptr<http::HttpClient> _httpClient;
    SupervisorOptions _options;
    TransportFactory _transportFactory;

    mutable std::shared_mutex _backendsMutex;
    std::map<std::string, std::shared_ptr<Backend>> _backends;
};

} // namespace mcpgate
