// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace mcpgate
{

/// @brief Error codes for categorizing failures across the gateway.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    NotFound,
    BackendNotConnected,
    SchemaViolation,
    Unauthorized,
    Timeout,
    TransportClosed,
    TransportError,
    ProtocolError,
    RemoteError,
    AuthorizationFailed,
    Cancelled,
};

/// @brief Returns the symbolic name of an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::BackendNotConnected: return "BackendNotConnected";
        case ErrorCode::SchemaViolation: return "SchemaViolation";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::TransportClosed: return "TransportClosed";
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::RemoteError: return "RemoteError";
        case ErrorCode::AuthorizationFailed: return "AuthorizationFailed";
        case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace mcpgate

template <>
struct std::formatter<mcpgate::Error>: std::formatter<std::string>
{
    auto format(const mcpgate::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", mcpgate::errorCodeName(error.code), error.message), ctx);
    }
};
