// SPDX-License-Identifier: Apache-2.0
#include "HttpCommon.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <array>
#include <format>

namespace mcpgate::server
{

namespace
{
    constexpr auto LocalOrigins = std::array<std::string_view, 3> {
        "http://localhost",
        "http://127.0.0.1",
        "http://[::1]",
    };

    auto isLocalhostOrigin(std::string_view origin) -> bool
    {
        for (auto const prefix: LocalOrigins)
        {
            if (origin == prefix)
                return true;
            if (origin.starts_with(prefix) && origin.substr(prefix.size()).starts_with(':'))
                return true;
        }
        return false;
    }
} // namespace

auto isOriginAllowed(std::string_view origin) -> bool
{
    if (origin.empty() || isLocalhostOrigin(origin))
        return true;
    return origin.starts_with("tauri://") || origin.starts_with("https://tauri.");
}

auto acceptsSse(std::string_view accept) -> bool
{
    return accept.find("text/event-stream") != std::string_view::npos;
}

auto formatSseMessage(const nlohmann::json& message) -> std::string
{
    return std::format("event: message\ndata: {}\n\n", message.dump());
}

auto newSessionId() -> std::string
{
    thread_local auto generator = boost::uuids::random_generator {};
    return boost::uuids::to_string(generator());
}

auto messageReply(const nlohmann::json& message, bool sse, std::optional<std::string> sessionId) -> Reply
{
    return Reply {
        .status = 200,
        .contentType = sse ? "text/event-stream" : "application/json",
        .body = sse ? formatSseMessage(message) : message.dump(),
        .sessionId = std::move(sessionId),
    };
}

auto textReply(unsigned status, std::string text) -> Reply
{
    return Reply {
        .status = status,
        .contentType = "text/plain",
        .body = std::move(text),
        .sessionId = std::nullopt,
    };
}

} // namespace mcpgate::server
