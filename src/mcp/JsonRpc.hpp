// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace mcpgate::jsonrpc
{

/// @brief Standard JSON-RPC 2.0 error codes plus the gateway's server-defined range.
namespace codes
{
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
    constexpr int BackendNotConnected = -32001;
    constexpr int Unauthorized = -32002;
    constexpr int Timeout = -32003;
} // namespace codes

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Represents a parsed JSON-RPC 2.0 response.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }
};

/// @brief Shape of an inbound JSON-RPC message.
enum class MessageKind
{
    Request,
    Notification,
    Response,
    Invalid,
};

/// @brief Classifies a single (non-batch) JSON-RPC message.
[[nodiscard]] auto classify(const nlohmann::json& message) -> MessageKind;

/// @brief Builds a JSON-RPC 2.0 request message.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a success response echoing @p id.
[[nodiscard]] auto makeResult(nlohmann::json id, nlohmann::json result) -> nlohmann::json;

/// @brief Builds an error response echoing @p id.
[[nodiscard]] auto makeErrorResponse(nlohmann::json id, int code, std::string_view message) -> nlohmann::json;

/// @brief Parses a JSON-RPC 2.0 response.
/// @param message The JSON message to parse.
/// @return The parsed response or an Error.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

/// @brief Maps a gateway error to the JSON-RPC error code reported to local clients.
[[nodiscard]] auto errorCodeFor(ErrorCode code) -> int;

} // namespace mcpgate::jsonrpc
