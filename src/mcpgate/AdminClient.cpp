// SPDX-License-Identifier: Apache-2.0
#include "AdminClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <http/Url.hpp>

#include <chrono>
#include <format>

namespace mcpgate
{

namespace
{
    constexpr auto LifecycleTimeout = std::chrono::milliseconds(120000);

    auto errorCodeForStatus(int status) -> ErrorCode
    {
        switch (status)
        {
            case 400: return ErrorCode::InvalidArgument;
            case 403: return ErrorCode::Unauthorized;
            case 404: return ErrorCode::NotFound;
            case 409: return ErrorCode::Cancelled;
            default: return ErrorCode::RemoteError;
        }
    }
} // namespace

AdminClient::AdminClient(std::shared_ptr<http::HttpClient> http, std::string baseUrl):
    _http(std::move(http)), _baseUrl(std::move(baseUrl))
{
    while (_baseUrl.ends_with('/'))
        _baseUrl.pop_back();
}

auto AdminClient::listBackends() -> Result<nlohmann::json>
{
    auto response = call(http::HttpRequest {
        .method = "GET",
        .url = _baseUrl + "/servers",
        .headers = { { "Accept", "application/json" } },
        .timeout = LifecycleTimeout,
    });
    if (!response)
        return response;
    if (!response->contains("servers") || !(*response)["servers"].is_array())
        return makeError(ErrorCode::ProtocolError, "Malformed backend list");
    return (*response)["servers"];
}

auto AdminClient::perform(const std::string& backendId, AdminAction action) -> Result<nlohmann::json>
{
    // The authorization flow ends when the user finishes it in the browser or the gateway gives up.
    auto const timeout = action == AdminAction::Authorize ? std::chrono::milliseconds(0) : LifecycleTimeout;

    return call(http::HttpRequest {
        .method = "POST",
        .url = std::format("{}/servers/{}/{}", _baseUrl, http::percentEncode(backendId), adminActionName(action)),
        .headers = { { "Accept", "application/json" } },
        .timeout = timeout,
    });
}

auto AdminClient::call(http::HttpRequest request) -> Result<nlohmann::json>
{
    log::debug("Admin: {} {}", request.method, request.url);
    auto response = _http->send(request);
    if (!response)
        return makeError(response.error().code,
                         std::format("Cannot reach mcpgate at {}: {}", _baseUrl, response.error().message));

    auto body = json::parse(response->body);
    if (!response->isSuccess())
    {
        auto message = response->body;
        if (body && body->contains("error") && (*body)["error"].is_object())
            message = json::getStringOr((*body)["error"], "message", message);
        return makeError(errorCodeForStatus(response->status),
                         std::format("HTTP {}: {}", response->status, message));
    }

    if (!body)
        return makeError(ErrorCode::ProtocolError, std::format("Invalid admin response: {}", body.error().message));
    return std::move(*body);
}

auto formatBackendLine(const nlohmann::json& backend) -> std::string
{
    auto line = std::format("{} ({}) [{}] {}, {} tools",
                            json::getStringOr(backend, "name", "?"),
                            json::getStringOr(backend, "id", "?"),
                            json::getStringOr(backend, "transport", "?"),
                            json::getStringOr(backend, "status", "?"),
                            json::getIntOr(backend, "toolCount", 0));

    auto const authStatus = json::getStringOr(backend, "authStatus", "none");
    if (authStatus != "none")
        line += std::format(", authorization {}", authStatus);

    auto const reason = json::getStringOr(backend, "reason", "");
    if (!reason.empty())
        line += std::format(": {}", reason);
    return line;
}

} // namespace mcpgate
