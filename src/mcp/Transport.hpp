// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <string_view>

namespace mcpgate
{

/// @brief Callbacks through which a transport delivers inbound traffic.
///
/// Handlers are invoked from the transport's own threads (or, for request/response
/// transports, from within send()) and must not call back into Transport::close().
struct TransportHandlers
{
    /// @brief A complete JSON-RPC message (request, notification or response).
    std::function<void(nlohmann::json message)> onMessage;

    /// @brief A diagnostic line produced by the backend outside of the protocol stream.
    std::function<void(std::string_view line)> onLog;

    /// @brief The backend went away without close() being called.
    std::function<void(std::string reason)> onClosed;
};

/// @brief Abstract interface for MCP transport communication.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Returns which kind of channel this transport speaks.
    [[nodiscard]] virtual auto kind() const -> TransportKind = 0;

    /// @brief Opens the transport and begins delivering inbound messages to @p handlers.
    /// @return Success or an error (e.g. TransportError when the executable is missing).
    [[nodiscard]] virtual auto start(TransportHandlers handlers) -> VoidResult = 0;

    /// @brief Sends a JSON message to the server.
    /// @param message The JSON message to send.
    /// @param timeout Upper bound for the write (and, for HTTP, the whole exchange).
    /// @return Success or an error.
    [[nodiscard]] virtual auto send(const nlohmann::json& message, std::chrono::milliseconds timeout)
        -> VoidResult = 0;

    /// @brief Informs the transport that the handshake finished.
    /// @param protocolVersion The version agreed with the server.
    /// @param serverEvents Whether the server announced server-pushed notifications.
    virtual void onInitialized(std::string_view protocolVersion, bool serverEvents)
    {
        (void) protocolVersion;
        (void) serverEvents;
    }

    /// @brief Closes the transport connection. Idempotent.
    virtual void close() = 0;

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace mcpgate
