// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mcpgate
{

/// @brief The kind of channel used to reach a backend.
enum class TransportKind : std::uint8_t
{
    Process,
    Remote,
};

[[nodiscard]] constexpr auto transportKindToString(TransportKind kind) -> std::string_view
{
    switch (kind)
    {
        case TransportKind::Process: return "process";
        case TransportKind::Remote: return "remote";
    }
    return "unknown";
}

/// @brief Parses a transport name. Accepts "process"/"stdio" and "remote"/"http".
[[nodiscard]] constexpr auto transportKindFromString(std::string_view str) -> std::optional<TransportKind>
{
    if (str == "process" || str == "stdio")
        return TransportKind::Process;
    if (str == "remote" || str == "http")
        return TransportKind::Remote;
    return std::nullopt;
}

/// @brief How messages are delimited on a process transport's standard streams.
enum class FramingMode : std::uint8_t
{
    Line,          ///< One JSON document per line.
    ContentLength, ///< "Content-Length: N" header block followed by N bytes.
};

/// @brief Runtime state of a backend connection.
enum class ConnectionStatus : std::uint8_t
{
    Disconnected,
    Connecting,
    Connected,
    Error,
    AwaitingAuthorization,
};

[[nodiscard]] constexpr auto connectionStatusToString(ConnectionStatus status) -> std::string_view
{
    switch (status)
    {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting: return "connecting";
        case ConnectionStatus::Connected: return "connected";
        case ConnectionStatus::Error: return "error";
        case ConnectionStatus::AwaitingAuthorization: return "awaiting_authorization";
    }
    return "unknown";
}

/// @brief A connection status together with the failure reason for ConnectionStatus::Error.
struct ConnectionState
{
    ConnectionStatus status = ConnectionStatus::Disconnected;
    std::string reason;

    [[nodiscard]] auto operator==(const ConnectionState&) const -> bool = default;
};

/// @brief Progress of a backend's authorization flow.
enum class AuthStatus : std::uint8_t
{
    None, ///< Backend does not take part in authorization.
    Idle,
    Discovering,
    Authorizing,
    Authorized,
    Refreshing,
    Error,
};

[[nodiscard]] constexpr auto authStatusToString(AuthStatus status) -> std::string_view
{
    switch (status)
    {
        case AuthStatus::None: return "none";
        case AuthStatus::Idle: return "idle";
        case AuthStatus::Discovering: return "discovering";
        case AuthStatus::Authorizing: return "authorizing";
        case AuthStatus::Authorized: return "authorized";
        case AuthStatus::Refreshing: return "refreshing";
        case AuthStatus::Error: return "error";
    }
    return "unknown";
}

/// @brief A tool as advertised by a backend in its tools/list response.
struct ToolDefinition
{
    std::string name;
    std::string title;
    std::string description;
    nlohmann::json inputSchema;
};

/// @brief A server-initiated JSON-RPC notification, or a synthetic one raised by a transport.
struct Notification
{
    std::string method;
    nlohmann::json params;
};

} // namespace mcpgate
