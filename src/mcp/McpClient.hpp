// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Channel.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Transport.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mcpgate
{

/// @brief MCP server capabilities reported during initialization.
struct ServerCapabilities
{
    bool hasTools = false;
    bool hasResources = false;
    bool hasPrompts = false;
    bool toolsListChanged = false;
    std::string serverName;
    std::string serverVersion;
    std::string protocolVersion;
    std::string instructions;
};

/// @brief Tunables of an McpClient session.
struct McpClientOptions
{
    std::string label = "mcp";                           ///< Used in log messages.
    std::chrono::milliseconds requestTimeout { 30000 };  ///< Default per-request timeout.
    std::chrono::milliseconds processGracePeriod { 5000 }; ///< Silence tolerated after a process timeout.
};

/// @brief Client for the Model Context Protocol (MCP).
///
/// Handles the MCP lifecycle on top of any Transport: initialize, list tools, call tools.
/// Requests may be issued concurrently from several threads; responses are correlated by id.
/// Server-initiated notifications are queued and consumed through nextNotification().
class McpClient
{
  public:
    /// @brief Constructs an McpClient with the given transport.
    /// @param transport The transport to use for communication.
    /// @param options Session tunables.
    explicit McpClient(std::unique_ptr<Transport> transport, McpClientOptions options = {});
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    /// @brief Opens the underlying transport.
    [[nodiscard]] auto start() -> VoidResult;

    /// @brief Performs the MCP initialize handshake. Only one handshake runs at a time.
    /// @return The server's capabilities or an error.
    [[nodiscard]] auto initialize(std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Result<ServerCapabilities>;

    /// @brief Lists available tools from the server, following pagination cursors.
    /// @return A vector of tool definitions or an error.
    [[nodiscard]] auto listTools(std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Result<std::vector<ToolDefinition>>;

    /// @brief Calls a tool on the server.
    /// @param name The tool name.
    /// @param arguments The tool arguments.
    /// @param timeout Overrides the default request timeout.
    /// @return The raw tools/call result object or an error.
    [[nodiscard]] auto callTool(std::string_view name,
                                const nlohmann::json& arguments,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Result<nlohmann::json>;

    /// @brief Issues an arbitrary request once the handshake has completed.
    [[nodiscard]] auto request(std::string_view method,
                               nlohmann::json params,
                               std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Result<nlohmann::json>;

    /// @brief Sends a notification to the server.
    [[nodiscard]] auto notify(std::string_view method, nlohmann::json params = nullptr) -> VoidResult;

    /// @brief Blocks for the next server notification.
    /// @return The notification, or std::nullopt once the session has ended.
    [[nodiscard]] auto nextNotification() -> std::optional<Notification>;

    /// @brief Ends the session. Outstanding requests resolve with Cancelled. Idempotent.
    /// Waits for a running unresponsiveness watchdog to finish.
    void close();

    /// @brief Returns the server capabilities (valid after initialize).
    [[nodiscard]] auto capabilities() const -> ServerCapabilities;

    /// @brief Returns true if the client has been initialized.
    [[nodiscard]] auto isInitialized() const -> bool;

    [[nodiscard]] auto isClosed() const -> bool;

    /// @brief Why the session ended; empty while open.
    [[nodiscard]] auto closeReason() const -> std::string;

    /// @brief True if the session ended because the backend went away.
    [[nodiscard]] auto closedUnexpectedly() const -> bool;

    [[nodiscard]] auto transportKind() const -> TransportKind { return _transport->kind(); }

  private:
    enum class Handshake : std::uint8_t
    {
        NotStarted,
        InProgress,
        Done,
    };

    using Clock = std::chrono::steady_clock;
    using PendingPromise = std::promise<Result<nlohmann::json>>;

    [[nodiscard]] auto sendRequest(std::string_view method, nlohmann::json params, Clock::time_point deadline)
        -> Result<nlohmann::json>;
    [[nodiscard]] auto waitForHandshake(Clock::time_point deadline) -> VoidResult;
    void handleMessage(nlohmann::json message);
    void handleResponse(const nlohmann::json& message);
    void handleServerRequest(const nlohmann::json& message);
    void handleTimeout(Clock::time_point requestStart);
    void watchSilence(Clock::time_point requestStart);
    [[nodiscard]] auto silentSince(Clock::time_point requestStart) const -> bool;
    void markClosed(std::string reason, bool unexpected);
    void touch();

    std::unique_ptr<Transport> _transport;
    McpClientOptions _options;

    mutable std::mutex _mutex;
    std::condition_variable _handshakeCv;
    std::condition_variable _watchCv;
    std::thread _watchdog;
    bool _watching = false;
    std::map<int64_t, std::shared_ptr<PendingPromise>> _pending;
    Handshake _handshake = Handshake::NotStarted;
    ServerCapabilities _capabilities;
    bool _closed = false;
    bool _closedUnexpectedly = false;
    std::string _closeReason;

    std::atomic<int64_t> _nextId = 1;
    std::atomic<Clock::rep> _lastActivity = 0;
    Channel<Notification> _notifications;
};

} // namespace mcpgate
