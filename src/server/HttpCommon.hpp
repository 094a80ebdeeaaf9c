// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcpgate::server
{

/// @brief Origin check of the MCP Streamable HTTP endpoint.
///
/// Allows requests without an Origin (non-browser clients), localhost, 127.0.0.1 and
/// [::1] on any port, and the tauri:// and https://tauri. webview origins.
[[nodiscard]] auto isOriginAllowed(std::string_view origin) -> bool;

/// @brief True if an Accept header value admits text/event-stream.
[[nodiscard]] auto acceptsSse(std::string_view accept) -> bool;

/// @brief Formats a JSON-RPC message as a single SSE "message" event.
[[nodiscard]] auto formatSseMessage(const nlohmann::json& message) -> std::string;

/// @brief Generates a random (version 4) UUID for Mcp-Session-Id.
[[nodiscard]] auto newSessionId() -> std::string;

/// @brief A transport-independent HTTP response produced by the endpoint.
struct Reply
{
    unsigned status = 200;
    std::string contentType;
    std::string body;
    std::optional<std::string> sessionId;
};

/// @brief Builds a 200 reply carrying @p message as JSON or as an SSE event.
[[nodiscard]] auto messageReply(const nlohmann::json& message, bool sse, std::optional<std::string> sessionId = {})
    -> Reply;

/// @brief Builds a plain-text reply.
[[nodiscard]] auto textReply(unsigned status, std::string text) -> Reply;

} // namespace mcpgate::server
