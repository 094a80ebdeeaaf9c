// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <catalog/ToolCatalog.hpp>
#include <core/Error.hpp>
#include <core/EventBus.hpp>
#include <supervisor/ConnectionSupervisor.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpgate
{

/// @brief Names of the discovery-mode meta tools.
namespace discovery
{
    constexpr auto DiscoverTools = std::string_view { "discover_tools" };
    constexpr auto ListServers = std::string_view { "list_servers" };
    constexpr auto CallTool = std::string_view { "call_tool" };
} // namespace discovery

/// @brief Backend lifecycle operations offered on the admin routes.
enum class AdminAction : std::uint8_t
{
    Connect,
    Disconnect,
    Authorize,
    Logout,
};

[[nodiscard]] auto adminActionFromString(std::string_view name) -> std::optional<AdminAction>;
[[nodiscard]] auto adminActionName(AdminAction action) -> std::string_view;

/// @brief Resolves inbound calls to a backend and dispatches them through the supervisor.
///
/// Three surfaces share one dispatch path: direct per-backend calls, the discovery
/// meta tools and the aggregate endpoint with "serverName.toolName" names.
class RequestRouter
{
  public:
    RequestRouter(ConnectionSupervisor& supervisor, ToolCatalog& catalog, EventBus& events);

    /// @brief Validates and dispatches one tool call to @p backendId.
    ///
    /// Fails with NotFound (unknown backend or operation), BackendNotConnected or
    /// SchemaViolation before anything is sent to the backend.
    [[nodiscard]] auto callDirect(const std::string& backendId,
                                  const std::string& operationName,
                                  const nlohmann::json& arguments,
                                  std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Result<nlohmann::json>;

    [[nodiscard]] auto discoverTools(std::string_view query) const -> std::vector<CatalogEntry>;
    [[nodiscard]] auto listServers() const -> std::vector<BackendSummary>;

    /// @brief The discovery-mode call_tool; identical to callDirect.
    [[nodiscard]] auto callTool(const std::string& backendId,
                                const std::string& operationName,
                                const nlohmann::json& arguments) -> Result<nlohmann::json>;

    /// @brief Handles a JSON-RPC message addressed to one backend.
    /// @return The response, or std::nullopt for notifications.
    [[nodiscard]] auto handleDirect(const std::string& backendId, const nlohmann::json& message)
        -> std::optional<nlohmann::json>;

    /// @brief Handles a JSON-RPC message on the discovery endpoint.
    [[nodiscard]] auto handleDiscovery(const nlohmann::json& message) -> std::optional<nlohmann::json>;

    /// @brief Handles a JSON-RPC message on the aggregate endpoint.
    [[nodiscard]] auto handleAggregate(const nlohmann::json& message) -> std::optional<nlohmann::json>;

    /// @brief Runs a lifecycle operation on one backend.
    ///
    /// Authorize blocks until the interactive flow has finished and the backend was reconnected.
    /// @return The backend's state afterwards, as returned by backendsStatus().
    [[nodiscard]] auto administer(const std::string& backendId, AdminAction action) -> Result<nlohmann::json>;

    /// @brief Connection and authorization state of every configured backend.
    [[nodiscard]] auto backendsStatus() const -> nlohmann::json;

    /// @brief Tool definitions of the three discovery meta tools.
    [[nodiscard]] static auto discoveryToolDefinitions() -> nlohmann::json;

  private:
    [[nodiscard]] auto dispatchDiscovery(const nlohmann::json& params) -> Result<nlohmann::json>;
    [[nodiscard]] auto callAggregate(const nlohmann::json& params) -> Result<nlohmann::json>;

    ConnectionSupervisor& _supervisor;
    ToolCatalog& _catalog;
    EventBus& _events;
};

} // namespace mcpgate
