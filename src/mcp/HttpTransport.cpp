// SPDX-License-Identifier: Apache-2.0
#include "HttpTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <http/SseParser.hpp>

#include <format>

namespace mcpgate
{

namespace
{
    constexpr auto MaxErrorBodyInMessage = size_t { 200 };

    auto truncated(std::string_view text) -> std::string
    {
        if (text.size() <= MaxErrorBodyInMessage)
            return std::string(text);
        return std::format("{}...", text.substr(0, MaxErrorBodyInMessage));
    }
} // namespace

auto parseResourceMetadataHint(std::string_view wwwAuthenticate) -> std::optional<std::string>
{
    constexpr auto Key = std::string_view { "resource_metadata=" };
    auto const pos = wwwAuthenticate.find(Key);
    if (pos == std::string_view::npos)
        return std::nullopt;

    auto value = wwwAuthenticate.substr(pos + Key.size());
    if (value.starts_with('"'))
    {
        value.remove_prefix(1);
        auto const end = value.find('"');
        if (end == std::string_view::npos)
            return std::nullopt;
        return std::string(value.substr(0, end));
    }

    auto const end = value.find_first_of(", ");
    return std::string(value.substr(0, end));
}

HttpTransport::HttpTransport(HttpTransportConfig config,
                             std::shared_ptr<http::HttpClient> client,
                             TokenProvider tokens):
    _config(std::move(config)), _client(std::move(client)), _tokens(std::move(tokens))
{
}

HttpTransport::~HttpTransport()
{
    close();
}

auto HttpTransport::start(TransportHandlers handlers) -> VoidResult
{
    if (_connected)
        return makeError(ErrorCode::TransportError, "Transport already started");
    if (_config.url.empty())
        return makeError(ErrorCode::InvalidArgument, "Remote transport without URL");

    _handlers = std::move(handlers);
    _connected = true;
    log::debug("Remote MCP endpoint: {}", _config.url);
    return {};
}

auto HttpTransport::baseHeaders() const -> std::vector<std::pair<std::string, std::string>>
{
    auto headers = std::vector<std::pair<std::string, std::string>> {};
    for (const auto& [name, value]: _config.headers)
        headers.emplace_back(name, value);

    {
        auto lock = std::lock_guard(_mutex);
        if (!_sessionId.empty())
            headers.emplace_back("Mcp-Session-Id", _sessionId);
        if (!_protocolVersion.empty())
            headers.emplace_back("MCP-Protocol-Version", _protocolVersion);
    }

    if (_tokens)
    {
        if (auto token = _tokens())
            headers.emplace_back("Authorization", std::format("Bearer {}", *token));
    }
    return headers;
}

auto HttpTransport::send(const nlohmann::json& message, std::chrono::milliseconds timeout) -> VoidResult
{
    if (!_connected)
        return makeError(ErrorCode::TransportClosed, "Transport not connected");

    auto request = http::HttpRequest {
        .method = "POST",
        .url = _config.url,
        .headers = baseHeaders(),
        .body = message.dump(),
        .timeout = timeout,
        .cancelled = [this] { return _closing.load(); },
    };
    request.headers.emplace_back("Content-Type", "application/json");
    request.headers.emplace_back("Accept", "application/json, text/event-stream");

    auto const hadSession = !sessionId().empty();
    auto response = _client->send(request);
    if (!response)
    {
        if (_closing)
            return makeError(ErrorCode::Cancelled, "Request cancelled by disconnect");
        return std::unexpected(response.error());
    }

    if (response->status == 401 || response->status == 403)
    {
        if (auto hint = parseResourceMetadataHint(response->header("www-authenticate")))
        {
            if (_config.onAuthorizationHint)
                _config.onAuthorizationHint(*hint);
            auto lock = std::lock_guard(_mutex);
            _resourceMetadataHint = std::move(hint);
        }
        return makeError(ErrorCode::Unauthorized,
                         std::format("{} answered HTTP {}", _config.url, response->status));
    }

    if (response->status == 404 && hadSession)
    {
        lostConnection("session expired (HTTP 404)");
        return makeError(ErrorCode::TransportClosed, "Session expired");
    }

    if (!response->isSuccess())
    {
        return makeError(ErrorCode::TransportError,
                         std::format("{} answered HTTP {}: {}", _config.url, response->status, truncated(response->body)));
    }

    if (auto session = response->header("mcp-session-id"); !session.empty())
    {
        auto lock = std::lock_guard(_mutex);
        _sessionId = std::move(session);
    }

    return deliverBody(*response);
}

auto HttpTransport::deliverBody(const http::HttpResponse& response) -> VoidResult
{
    if (response.status == 202 || response.body.empty())
        return {};

    if (response.header("content-type").find("text/event-stream") != std::string::npos)
    {
        auto parser = http::SseParser {};
        auto events = parser.feed(response.body);
        for (auto& event: parser.finish())
            events.push_back(std::move(event));
        for (const auto& event: events)
            deliverText(event.data);
        return {};
    }

    return json::parse(response.body).and_then([this](nlohmann::json message) -> VoidResult {
        if (_handlers.onMessage)
            _handlers.onMessage(std::move(message));
        return {};
    });
}

void HttpTransport::deliverText(std::string_view text)
{
    if (text.empty())
        return;

    auto message = json::parse(text);
    if (!message)
    {
        log::warning("Ignoring malformed event from {}: {}", _config.url, message.error().message);
        return;
    }
    if (_handlers.onMessage)
        _handlers.onMessage(std::move(*message));
}

void HttpTransport::onInitialized(std::string_view protocolVersion, bool serverEvents)
{
    {
        auto lock = std::lock_guard(_mutex);
        _protocolVersion = std::string(protocolVersion);
    }

    if (serverEvents && !_eventStream.joinable() && !_closing)
        _eventStream = std::thread([this] { eventStreamLoop(); });
}

void HttpTransport::eventStreamLoop()
{
    auto request = http::HttpRequest {
        .method = "GET",
        .url = _config.url,
        .headers = baseHeaders(),
        .body = {},
        .timeout = std::chrono::milliseconds(0),
        .cancelled = [this] { return _closing.load(); },
    };
    request.headers.emplace_back("Accept", "text/event-stream");

    auto parser = http::SseParser {};
    auto const onChunk = [&](std::string_view chunk) {
        for (const auto& event: parser.feed(chunk))
            deliverText(event.data);
        return !_closing.load();
    };

    auto response = _client->stream(request, onChunk);
    if (_closing)
        return;

    if (!response)
    {
        lostConnection(std::format("event stream failed: {}", response.error().message));
        return;
    }

    if (response->status == 405)
    {
        log::debug("{} does not offer a server event stream", _config.url);
        return;
    }

    if (!response->isSuccess())
    {
        log::warning("{} refused the server event stream (HTTP {})", _config.url, response->status);
        return;
    }

    lostConnection("event stream ended");
}

void HttpTransport::lostConnection(std::string reason)
{
    if (_closing)
        return;
    if (_connected.exchange(false) && _handlers.onClosed)
        _handlers.onClosed(std::move(reason));
}

void HttpTransport::close()
{
    if (_closing.exchange(true))
        return;

    auto const wasConnected = _connected.exchange(false);

    if (_eventStream.joinable())
        _eventStream.join();

    auto const session = sessionId();
    if (!wasConnected || session.empty())
        return;

    auto request = http::HttpRequest {
        .method = "DELETE",
        .url = _config.url,
        .headers = {},
        .body = {},
        .timeout = std::chrono::milliseconds(2000),
        .cancelled = {},
    };
    {
        auto lock = std::lock_guard(_mutex);
        request.headers.emplace_back("Mcp-Session-Id", _sessionId);
        _sessionId.clear();
    }

    if (auto response = _client->send(request); !response)
        log::debug("Session DELETE to {} failed: {}", _config.url, response.error().message);
    else
        log::debug("Session {} closed (HTTP {})", session, response->status);
}

auto HttpTransport::isConnected() const -> bool
{
    return _connected;
}

auto HttpTransport::sessionId() const -> std::string
{
    auto lock = std::lock_guard(_mutex);
    return _sessionId;
}

auto HttpTransport::resourceMetadataHint() const -> std::optional<std::string>
{
    auto lock = std::lock_guard(_mutex);
    return _resourceMetadataHint;
}

} // namespace mcpgate
