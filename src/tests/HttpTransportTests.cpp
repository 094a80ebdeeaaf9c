// SPDX-License-Identifier: Apache-2.0
#include <mcp/HttpTransport.hpp>
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <mutex>

#include "TestSupport.hpp"

using namespace mcpgate;
using namespace std::chrono_literals;

namespace
{

constexpr auto Endpoint = "https://mcp.example.com/mcp";

struct Inbox
{
    std::mutex mutex;
    std::vector<nlohmann::json> messages;
    std::string closeReason;
    std::atomic<bool> closed = false;

    auto handlers() -> TransportHandlers
    {
        return TransportHandlers {
            .onMessage =
                [this](nlohmann::json message) {
                    auto lock = std::lock_guard(mutex);
                    messages.push_back(std::move(message));
                },
            .onLog = {},
            .onClosed =
                [this](std::string reason) {
                    {
                        auto lock = std::lock_guard(mutex);
                        closeReason = std::move(reason);
                    }
                    closed = true;
                },
        };
    }

    auto count() -> size_t
    {
        auto lock = std::lock_guard(mutex);
        return messages.size();
    }
};

auto headerValue(const http::HttpRequest& request, std::string_view name) -> std::optional<std::string>
{
    for (const auto& [key, value]: request.headers)
    {
        if (key == name)
            return value;
    }
    return std::nullopt;
}

auto jsonResponse(const nlohmann::json& body, std::map<std::string, std::string> headers = {}) -> http::HttpResponse
{
    headers["content-type"] = "application/json";
    return http::HttpResponse { .status = 200, .headers = std::move(headers), .body = body.dump() };
}

} // namespace

TEST_CASE("parseResourceMetadataHint reads quoted and bare values", "[http-transport]")
{
    CHECK(parseResourceMetadataHint(
              R"(Bearer error="invalid_token", resource_metadata="https://a.example/.well-known/oauth-protected-resource")")
          == "https://a.example/.well-known/oauth-protected-resource");
    CHECK(parseResourceMetadataHint("Bearer resource_metadata=https://b.example/meta, scope=x")
          == "https://b.example/meta");
    CHECK(!parseResourceMetadataHint("Bearer realm=\"x\"").has_value());
}

TEST_CASE("HttpTransport posts messages and delivers JSON replies", "[http-transport]")
{
    auto client = std::make_shared<test::FakeHttpClient>();
    client->on("POST", Endpoint, [](const http::HttpRequest& request) -> Result<http::HttpResponse> {
        auto const message = nlohmann::json::parse(request.body);
        return jsonResponse(jsonrpc::makeResult(message["id"], { { "ok", true } }), { { "mcp-session-id", "s-1" } });
    });

    auto transport = HttpTransport(HttpTransportConfig { .url = Endpoint, .headers = { { "X-Team", "core" } } },
                                   client,
                                   [] { return std::optional<std::string>("tok-123"); });

    auto inbox = Inbox {};
    REQUIRE(transport.start(inbox.handlers()).has_value());
    CHECK(transport.isConnected());
    CHECK(transport.kind() == TransportKind::Remote);

    REQUIRE(transport.send(jsonrpc::makeRequest(1, "initialize"), 1000ms).has_value());
    REQUIRE(inbox.count() == 1);
    CHECK(inbox.messages[0]["result"]["ok"] == true);
    CHECK(transport.sessionId() == "s-1");

    transport.onInitialized("2025-03-26", false);
    REQUIRE(transport.send(jsonrpc::makeRequest(2, "tools/list"), 1000ms).has_value());

    auto const requests = client->requests();
    REQUIRE(requests.size() == 2);
    CHECK(headerValue(requests[0], "Authorization") == "Bearer tok-123");
    CHECK(headerValue(requests[0], "X-Team") == "core");
    CHECK(headerValue(requests[0], "Accept") == "application/json, text/event-stream");
    CHECK(!headerValue(requests[0], "Mcp-Session-Id").has_value());
    CHECK(headerValue(requests[1], "Mcp-Session-Id") == "s-1");
    CHECK(headerValue(requests[1], "MCP-Protocol-Version") == "2025-03-26");
}

TEST_CASE("HttpTransport unpacks SSE reply bodies", "[http-transport]")
{
    auto client = std::make_shared<test::FakeHttpClient>();
    client->on("POST", Endpoint, [](const http::HttpRequest&) -> Result<http::HttpResponse> {
        auto body = std::string(": keep-alive\n\n");
        body += "event: message\ndata: " + jsonrpc::makeNotification("notifications/progress").dump() + "\n\n";
        body += "data: " + jsonrpc::makeResult(1, { { "done", true } }).dump() + "\n\n";
        return http::HttpResponse { .status = 200, .headers = { { "content-type", "text/event-stream" } }, .body = body };
    });

    auto transport = HttpTransport(HttpTransportConfig { .url = Endpoint }, client);
    auto inbox = Inbox {};
    REQUIRE(transport.start(inbox.handlers()).has_value());
    REQUIRE(transport.send(jsonrpc::makeRequest(1, "tools/call"), 1000ms).has_value());

    REQUIRE(inbox.count() == 2);
    CHECK(inbox.messages[0]["method"] == "notifications/progress");
    CHECK(inbox.messages[1]["result"]["done"] == true);
}

TEST_CASE("HttpTransport accepts 202 for notifications", "[http-transport]")
{
    auto client = std::make_shared<test::FakeHttpClient>();
    client->on("POST", Endpoint, [](const http::HttpRequest&) -> Result<http::HttpResponse> {
        return http::HttpResponse { .status = 202, .headers = {}, .body = {} };
    });

    auto transport = HttpTransport(HttpTransportConfig { .url = Endpoint }, client);
    auto inbox = Inbox {};
    REQUIRE(transport.start(inbox.handlers()).has_value());
    REQUIRE(transport.send(jsonrpc::makeNotification("notifications/initialized"), 1000ms).has_value());
    CHECK(inbox.count() == 0);
}

TEST_CASE("HttpTransport maps 401 to Unauthorized and records the metadata hint", "[http-transport]")
{
    auto client = std::make_shared<test::FakeHttpClient>();
    client->on("POST", Endpoint, [](const http::HttpRequest&) -> Result<http::HttpResponse> {
        return http::HttpResponse {
            .status = 401,
            .headers = { { "www-authenticate",
                           R"(Bearer resource_metadata="https://mcp.example.com/.well-known/oauth-protected-resource")" } },
            .body = "unauthorized",
        };
    });

    auto announced = std::string {};
    auto transport = HttpTransport(
        HttpTransportConfig {
            .url = Endpoint,
            .headers = {},
            .onAuthorizationHint = [&](const std::string& url) { announced = url; },
        },
        client);

    auto inbox = Inbox {};
    REQUIRE(transport.start(inbox.handlers()).has_value());

    auto result = transport.send(jsonrpc::makeRequest(1, "initialize"), 1000ms);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::Unauthorized);
    CHECK(announced == "https://mcp.example.com/.well-known/oauth-protected-resource");
    CHECK(transport.resourceMetadataHint() == announced);
    CHECK(transport.isConnected());
}

TEST_CASE("HttpTransport reports other HTTP failures as transport errors", "[http-transport]")
{
    auto client = std::make_shared<test::FakeHttpClient>();
    client->on("POST", Endpoint, [](const http::HttpRequest&) -> Result<http::HttpResponse> {
        return http::HttpResponse { .status = 500, .headers = {}, .body = "boom" };
    });

    auto transport = HttpTransport(HttpTransportConfig { .url = Endpoint }, client);
    auto inbox = Inbox {};
    REQUIRE(transport.start(inbox.handlers()).has_value());

    auto result = transport.send(jsonrpc::makeRequest(1, "initialize"), 1000ms);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
    CHECK(result.error().message.find("500") != std::string::npos);
}

TEST_CASE("HttpTransport treats 404 on an established session as a lost connection", "[http-transport]")
{
    auto calls = std::make_shared<int>(0);
    auto client = std::make_shared<test::FakeHttpClient>();
    client->on("POST", Endpoint, [calls](const http::HttpRequest& request) -> Result<http::HttpResponse> {
        if ((*calls)++ == 0)
        {
            auto const message = nlohmann::json::parse(request.body);
            return jsonResponse(jsonrpc::makeResult(message["id"], nlohmann::json::object()),
                                { { "mcp-session-id", "s-9" } });
        }
        return http::HttpResponse { .status = 404, .headers = {}, .body = {} };
    });

    auto transport = HttpTransport(HttpTransportConfig { .url = Endpoint }, client);
    auto inbox = Inbox {};
    REQUIRE(transport.start(inbox.handlers()).has_value());
    REQUIRE(transport.send(jsonrpc::makeRequest(1, "initialize"), 1000ms).has_value());

    auto result = transport.send(jsonrpc::makeRequest(2, "tools/list"), 1000ms);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportClosed);
    CHECK(inbox.closed);
    CHECK(!transport.isConnected());
}

TEST_CASE("HttpTransport close ends the session with DELETE", "[http-transport]")
{
    auto client = std::make_shared<test::FakeHttpClient>();
    client->on("POST", Endpoint, [](const http::HttpRequest& request) -> Result<http::HttpResponse> {
        auto const message = nlohmann::json::parse(request.body);
        return jsonResponse(jsonrpc::makeResult(message["id"], nlohmann::json::object()),
                            { { "mcp-session-id", "s-2" } });
    });
    client->onJson("DELETE", Endpoint, nlohmann::json::object());

    auto transport = HttpTransport(HttpTransportConfig { .url = Endpoint }, client);
    auto inbox = Inbox {};
    REQUIRE(transport.start(inbox.handlers()).has_value());
    REQUIRE(transport.send(jsonrpc::makeRequest(1, "initialize"), 1000ms).has_value());

    transport.close();
    transport.close();

    auto const deletes = client->requestsTo(Endpoint);
    REQUIRE(deletes.size() == 2);
    CHECK(deletes[1].method == "DELETE");
    CHECK(headerValue(deletes[1], "Mcp-Session-Id") == "s-2");
    CHECK(!inbox.closed);

    auto result = transport.send(jsonrpc::makeRequest(2, "ping"), 1000ms);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportClosed);
}

TEST_CASE("HttpTransport delivers server events from the GET stream", "[http-transport]")
{
    auto client = std::make_shared<test::FakeHttpClient>();
    client->on("GET", Endpoint, [](const http::HttpRequest&) -> Result<http::HttpResponse> {
        return http::HttpResponse {
            .status = 200,
            .headers = { { "content-type", "text/event-stream" } },
            .body = "data: " + jsonrpc::makeNotification("notifications/tools/list_changed").dump() + "\n\n",
        };
    });

    auto transport = HttpTransport(HttpTransportConfig { .url = Endpoint }, client);
    auto inbox = Inbox {};
    REQUIRE(transport.start(inbox.handlers()).has_value());
    transport.onInitialized("2025-03-26", true);

    REQUIRE(test::waitUntil([&] { return inbox.closed.load(); }));
    REQUIRE(inbox.count() == 1);
    CHECK(inbox.messages[0]["method"] == "notifications/tools/list_changed");
    CHECK(inbox.closeReason == "event stream ended");
}

TEST_CASE("HttpTransport tolerates servers without an event stream", "[http-transport]")
{
    auto client = std::make_shared<test::FakeHttpClient>();
    client->on("GET", Endpoint, [](const http::HttpRequest&) -> Result<http::HttpResponse> {
        return http::HttpResponse { .status = 405, .headers = {}, .body = {} };
    });

    auto transport = HttpTransport(HttpTransportConfig { .url = Endpoint }, client);
    auto inbox = Inbox {};
    REQUIRE(transport.start(inbox.handlers()).has_value());
    transport.onInitialized("2025-03-26", true);

    REQUIRE(test::waitUntil([&] { return client->requests().size() == 1; }));
    transport.close();
    CHECK(!inbox.closed);
}
