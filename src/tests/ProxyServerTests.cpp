// SPDX-License-Identifier: Apache-2.0
#include <server/ProxyServer.hpp>

#include <http/CurlHttpClient.hpp>
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

#include <format>

#include "TestSupport.hpp"

using namespace mcpgate;
using namespace std::chrono_literals;

namespace
{

/// One connected backend named "github" behind a proxy that is not listening.
struct ProxyHarness
{
    EventBus events;
    ToolCatalog catalog;
    std::shared_ptr<test::FakeServer> backend = std::make_shared<test::FakeServer>();
    std::unique_ptr<ConnectionSupervisor> supervisor;
    std::unique_ptr<RequestRouter> router;
    std::unique_ptr<server::ProxyServer> proxy;

    ProxyHarness()
    {
        backend->addTool("create_issue", "Create an issue");
        supervisor = std::make_unique<ConnectionSupervisor>(catalog, events, nullptr, nullptr);
        supervisor->setTransportFactory(
            [server = backend](const BackendConfig&, const TransportContext&) -> Result<std::unique_ptr<Transport>> {
                return std::make_unique<test::FakeTransport>(server);
            });
        REQUIRE(supervisor
                    ->addBackend(BackendConfig {
                        .id = "gh 1",
                        .name = "github",
                        .transport = TransportKind::Process,
                        .command = "fake-server",
                    })
                    .has_value());
        REQUIRE(supervisor->connect("gh 1").has_value());

        router = std::make_unique<RequestRouter>(*supervisor, catalog, events);
        proxy = std::make_unique<server::ProxyServer>(*router);
    }

    ~ProxyHarness()
    {
        proxy.reset();
        router.reset();
        supervisor.reset();
    }

    auto admin(std::string method, std::string target, bool loopback = true) -> server::Reply
    {
        return proxy->handle(server::ProxyRequest {
            .method = std::move(method),
            .target = std::move(target),
            .origin = {},
            .accept = "application/json",
            .body = {},
            .loopbackPeer = loopback,
        });
    }

    auto post(std::string target, const nlohmann::json& body, std::string accept = "application/json")
        -> server::Reply
    {
        return proxy->handle(server::ProxyRequest {
            .method = "POST",
            .target = std::move(target),
            .origin = {},
            .accept = std::move(accept),
            .body = body.dump(),
        });
    }
};

auto rpc(int64_t id, std::string_view method, nlohmann::json params = nlohmann::json::object()) -> nlohmann::json
{
    return jsonrpc::makeRequest(id, method, std::move(params));
}

} // namespace

TEST_CASE("isOriginAllowed", "[server]")
{
    CHECK(server::isOriginAllowed(""));
    CHECK(server::isOriginAllowed("http://localhost"));
    CHECK(server::isOriginAllowed("http://localhost:5173"));
    CHECK(server::isOriginAllowed("http://127.0.0.1:8080"));
    CHECK(server::isOriginAllowed("http://[::1]:3000"));
    CHECK(server::isOriginAllowed("tauri://localhost"));
    CHECK(server::isOriginAllowed("https://tauri.localhost"));

    CHECK(!server::isOriginAllowed("https://evil.example.com"));
    CHECK(!server::isOriginAllowed("http://localhost.evil.com"));
    CHECK(!server::isOriginAllowed("http://127.0.0.1.nip.io"));
    CHECK(!server::isOriginAllowed("null"));
}

TEST_CASE("SSE helpers", "[server]")
{
    CHECK(server::acceptsSse("application/json, text/event-stream"));
    CHECK(!server::acceptsSse("application/json"));
    CHECK(server::formatSseMessage({ { "id", 1 } }) == "event: message\ndata: {\"id\":1}\n\n");

    auto const first = server::newSessionId();
    CHECK(first.size() == 36);
    CHECK(first != server::newSessionId());
}

TEST_CASE("ProxyServer routes by path", "[server]")
{
    auto harness = ProxyHarness {};

    SECTION("aggregate")
    {
        auto reply = harness.post("/mcp", rpc(1, "tools/list"));
        CHECK(reply.status == 200);
        CHECK(reply.contentType == "application/json");
        auto const body = nlohmann::json::parse(reply.body);
        CHECK(body["result"]["tools"][0]["name"] == "github.create_issue");
    }

    SECTION("discovery")
    {
        auto reply = harness.post("/discovery", rpc(1, "tools/list"));
        CHECK(reply.status == 200);
        CHECK(nlohmann::json::parse(reply.body)["result"]["tools"].size() == 3);
    }

    SECTION("direct with a percent-encoded id")
    {
        auto reply = harness.post("/servers/gh%201?x=1", rpc(1, "tools/list"));
        CHECK(reply.status == 200);
        CHECK(nlohmann::json::parse(reply.body)["result"]["tools"][0]["name"] == "create_issue");
    }

    SECTION("direct with an unknown id")
    {
        auto reply = harness.post("/servers/nope", rpc(1, "tools/call", { { "name", "x" } }));
        CHECK(reply.status == 200);
        CHECK(nlohmann::json::parse(reply.body)["error"]["code"] == jsonrpc::codes::InvalidParams);
    }

    SECTION("unknown paths")
    {
        CHECK(harness.post("/", rpc(1, "ping")).status == 404);
        CHECK(harness.post("/servers/", rpc(1, "ping")).status == 404);
        CHECK(harness.post("/servers/a/b/c", rpc(1, "ping")).status == 404);
    }
}

TEST_CASE("ProxyServer rejects foreign origins and other verbs", "[server]")
{
    auto harness = ProxyHarness {};

    auto foreign = harness.proxy->handle({ .method = "POST",
                                           .target = "/mcp",
                                           .origin = "https://evil.example.com",
                                           .accept = {},
                                           .body = rpc(1, "ping").dump() });
    CHECK(foreign.status == 403);

    auto preflight = harness.proxy->handle({ .method = "OPTIONS", .target = "/mcp" });
    CHECK(preflight.status == 204);

    auto get = harness.proxy->handle({ .method = "GET", .target = "/mcp" });
    CHECK(get.status == 405);
}

TEST_CASE("ProxyServer admin routes drive the backend lifecycle", "[server]")
{
    auto harness = ProxyHarness {};

    SECTION("listing")
    {
        auto reply = harness.admin("GET", "/servers");
        CHECK(reply.status == 200);
        auto const servers = nlohmann::json::parse(reply.body)["servers"];
        REQUIRE(servers.size() == 1);
        CHECK(servers[0]["id"] == "gh 1");
        CHECK(servers[0]["status"] == "connected");
        CHECK(servers[0]["toolCount"] == 1);
    }

    SECTION("disconnect and connect")
    {
        auto disconnected = harness.admin("POST", "/servers/gh%201/disconnect");
        CHECK(disconnected.status == 200);
        CHECK(nlohmann::json::parse(disconnected.body)["status"] == "disconnected");
        CHECK(!harness.catalog.hasBackend("gh 1"));

        auto connected = harness.admin("POST", "/servers/gh%201/connect");
        CHECK(connected.status == 200);
        CHECK(nlohmann::json::parse(connected.body)["status"] == "connected");
        CHECK(harness.backend->startCount() == 2);
    }

    SECTION("errors")
    {
        auto unknownBackend = harness.admin("POST", "/servers/nope/connect");
        CHECK(unknownBackend.status == 404);
        CHECK(nlohmann::json::parse(unknownBackend.body)["error"]["code"] == "NotFound");

        auto processAuthorize = harness.admin("POST", "/servers/gh%201/authorize");
        CHECK(processAuthorize.status == 400);
        CHECK(nlohmann::json::parse(processAuthorize.body)["error"]["code"] == "InvalidArgument");

        CHECK(harness.admin("POST", "/servers/gh%201/reboot").status == 404);
        CHECK(harness.admin("GET", "/servers/gh%201/connect").status == 405);
        CHECK(harness.admin("POST", "/servers").status == 405);
        CHECK(harness.admin("OPTIONS", "/servers/gh%201/connect").status == 204);
    }

    SECTION("only loopback clients")
    {
        CHECK(harness.admin("GET", "/servers", false).status == 403);
        CHECK(harness.admin("POST", "/servers/gh%201/disconnect", false).status == 403);
        CHECK(harness.supervisor->status("gh 1")->status == ConnectionStatus::Connected);
    }
}

TEST_CASE("ProxyServer JSON-RPC envelope handling", "[server]")
{
    auto harness = ProxyHarness {};

    SECTION("unparsable body")
    {
        auto reply = harness.proxy->handle({ .method = "POST", .target = "/mcp", .body = "{not json" });
        CHECK(reply.status == 400);
        CHECK(nlohmann::json::parse(reply.body)["error"]["code"] == jsonrpc::codes::ParseError);
    }

    SECTION("empty batch")
    {
        auto reply = harness.post("/mcp", nlohmann::json::array());
        CHECK(reply.status == 400);
        CHECK(nlohmann::json::parse(reply.body)["error"]["code"] == jsonrpc::codes::InvalidRequest);
    }

    SECTION("notifications are accepted without a body")
    {
        auto reply = harness.post("/mcp", jsonrpc::makeNotification("notifications/initialized"));
        CHECK(reply.status == 202);
        CHECK(reply.body.empty());
    }

    SECTION("batches answer every request")
    {
        auto reply = harness.post("/mcp",
                                  nlohmann::json::array({
                                      rpc(1, "ping"),
                                      jsonrpc::makeNotification("notifications/initialized"),
                                      rpc(2, "tools/list"),
                                  }));
        CHECK(reply.status == 200);
        auto const body = nlohmann::json::parse(reply.body);
        REQUIRE(body.is_array());
        REQUIRE(body.size() == 2);
        CHECK(body[0]["id"] == 1);
        CHECK(body[1]["id"] == 2);
    }

    SECTION("initialize assigns a session id")
    {
        auto reply = harness.post("/mcp", rpc(1, "initialize", { { "protocolVersion", "2025-03-26" } }));
        CHECK(reply.status == 200);
        REQUIRE(reply.sessionId.has_value());
        CHECK(reply.sessionId->size() == 36);

        CHECK(!harness.post("/mcp", rpc(2, "tools/list")).sessionId.has_value());
    }

    SECTION("SSE replies when the client accepts them")
    {
        auto reply = harness.post("/mcp", rpc(5, "ping"), "application/json, text/event-stream");
        CHECK(reply.status == 200);
        CHECK(reply.contentType == "text/event-stream");
        CHECK(reply.body == std::format("event: message\ndata: {}\n\n", jsonrpc::makeResult(5, nlohmann::json::object()).dump()));
    }
}

TEST_CASE("ProxyServer serves over HTTP", "[server][network]")
{
    auto harness = ProxyHarness {};
    auto port = harness.proxy->start();
    REQUIRE(port.has_value());
    CHECK(*port != 0);
    CHECK(harness.proxy->isRunning());

    auto client = http::CurlHttpClient {};
    auto response = client.send(http::HttpRequest {
        .method = "POST",
        .url = std::format("http://127.0.0.1:{}/mcp", *port),
        .headers = { { "Content-Type", "application/json" }, { "Accept", "application/json, text/event-stream" } },
        .body = rpc(1, "initialize").dump(),
        .timeout = 5000ms,
    });
    REQUIRE(response.has_value());
    CHECK(response->status == 200);
    CHECK(response->header("content-type") == "text/event-stream");
    CHECK(response->header("mcp-session-id").size() == 36);
    CHECK(response->body.find("\"serverInfo\"") != std::string::npos);

    auto call = client.send(http::HttpRequest {
        .method = "POST",
        .url = std::format("http://127.0.0.1:{}/mcp", *port),
        .headers = { { "Content-Type", "application/json" } },
        .body = rpc(2, "tools/call", { { "name", "github.create_issue" }, { "arguments", { { "title", "t" } } } }).dump(),
        .timeout = 5000ms,
    });
    REQUIRE(call.has_value());
    CHECK(call->status == 200);
    CHECK(nlohmann::json::parse(call->body)["result"]["content"][0]["text"] == R"({"title":"t"})");

    harness.proxy->stop();
    CHECK(!harness.proxy->isRunning());

    auto restart = harness.proxy->start();
    CHECK(!restart.has_value());
}
