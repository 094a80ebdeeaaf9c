// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <format>

namespace mcpgate::jsonrpc
{

auto classify(const nlohmann::json& message) -> MessageKind
{
    if (!message.is_object() || message.value("jsonrpc", "") != "2.0")
        return MessageKind::Invalid;

    if (message.contains("method"))
    {
        if (!message["method"].is_string())
            return MessageKind::Invalid;
        return message.contains("id") ? MessageKind::Request : MessageKind::Notification;
    }

    if (message.contains("id") && (message.contains("result") || message.contains("error")))
        return MessageKind::Response;

    return MessageKind::Invalid;
}

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeResult(nlohmann::json id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", std::move(id) },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(nlohmann::json id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", std::move(id) },
        { "error",
          {
              { "code", code },
              { "message", message },
          } },
    };
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error") && message["error"].is_object())
    {
        auto const& err = message["error"];
        response.error = RpcError {
            .code = err.value("code", 0),
            .message = err.value("message", "Unknown error"),
            .data = err.value("data", nlohmann::json {}),
        };
    }
    else if (!message.contains("method"))
    {
        // It's neither a valid response nor a notification
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");
    }

    return response;
}

auto errorCodeFor(ErrorCode code) -> int
{
    switch (code)
    {
        case ErrorCode::NotFound:
        case ErrorCode::SchemaViolation:
        case ErrorCode::InvalidArgument: return codes::InvalidParams;
        case ErrorCode::BackendNotConnected: return codes::BackendNotConnected;
        case ErrorCode::Unauthorized: return codes::Unauthorized;
        case ErrorCode::Timeout: return codes::Timeout;
        default: return codes::InternalError;
    }
}

} // namespace mcpgate::jsonrpc
