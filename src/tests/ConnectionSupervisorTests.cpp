// SPDX-License-Identifier: Apache-2.0
#include <supervisor/ConnectionSupervisor.hpp>

#include <http/Url.hpp>
#include <mcp/Protocol.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <format>
#include <future>

#include "TestSupport.hpp"

using namespace mcpgate;
using namespace std::chrono_literals;

namespace
{

constexpr auto RemoteUrl = "https://mcp.example.com/mcp";

auto processBackend(std::string id, std::string name, bool enabled = true) -> BackendConfig
{
    return BackendConfig {
        .id = std::move(id),
        .name = std::move(name),
        .enabled = enabled,
        .transport = TransportKind::Process,
        .command = "fake-server",
    };
}

auto remoteBackend(std::string id, std::string name, bool requiresAuthorization = false) -> BackendConfig
{
    auto config = BackendConfig {
        .id = std::move(id),
        .name = std::move(name),
        .transport = TransportKind::Remote,
    };
    config.url = RemoteUrl;
    config.requiresAuthorization = requiresAuthorization;
    return config;
}

/// Supervisor whose transports talk to in-memory servers keyed by backend id.
struct SupervisorHarness
{
    EventBus events;
    ToolCatalog catalog;
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<test::FakeServer>> servers;
    std::unique_ptr<ConnectionSupervisor> supervisor;

    explicit SupervisorHarness(AuthorizationManager* auth = nullptr,
                               std::shared_ptr<http::HttpClient> httpClient = nullptr)
    {
        supervisor = std::make_unique<ConnectionSupervisor>(
            catalog,
            events,
            auth,
            std::move(httpClient),
            SupervisorOptions { .requestTimeout = 2000ms, .processGracePeriod = 100ms });
        supervisor->setTransportFactory(
            [this](const BackendConfig& config, const TransportContext& context) -> Result<std::unique_ptr<Transport>> {
                auto lock = std::lock_guard(mutex);
                auto const it = servers.find(config.id);
                if (it == servers.end())
                    return makeError(ErrorCode::TransportError, std::format("Executable not found: {}", config.command));
                it->second->tokens = context.tokens;
                return std::make_unique<test::FakeTransport>(it->second);
            });
    }

    ~SupervisorHarness() { supervisor.reset(); }

    auto serve(const std::string& backendId) -> std::shared_ptr<test::FakeServer>
    {
        auto server = std::make_shared<test::FakeServer>();
        server->name = backendId;
        server->addTool("echo", "Echo the arguments back");
        auto lock = std::lock_guard(mutex);
        servers[backendId] = server;
        return server;
    }

    auto state(const std::string& backendId) -> ConnectionStatus
    {
        auto current = supervisor->status(backendId);
        REQUIRE(current.has_value());
        return current->status;
    }
};

auto statusesOf(test::EventRecorder& recorder, const std::string& backendId) -> std::vector<ConnectionStatus>
{
    auto statuses = std::vector<ConnectionStatus> {};
    for (const auto& event: recorder.eventsOf<StatusChangedEvent>())
    {
        if (event.backendId == backendId)
            statuses.push_back(event.state.status);
    }
    return statuses;
}

} // namespace

TEST_CASE("ConnectionSupervisor registers backends", "[supervisor]")
{
    auto harness = SupervisorHarness {};
    REQUIRE(harness.supervisor->addBackend(processBackend("fs", "filesystem")).has_value());
    CHECK(harness.state("fs") == ConnectionStatus::Disconnected);

    auto duplicate = harness.supervisor->addBackend(processBackend("fs", "other"));
    REQUIRE(!duplicate.has_value());
    CHECK(duplicate.error().code == ErrorCode::InvalidArgument);

    auto unnamed = harness.supervisor->addBackend(processBackend("", "nameless"));
    REQUIRE(!unnamed.has_value());
    CHECK(unnamed.error().code == ErrorCode::InvalidArgument);

    auto unknown = harness.supervisor->status("nope");
    REQUIRE(!unknown.has_value());
    CHECK(unknown.error().code == ErrorCode::NotFound);

    CHECK(harness.supervisor->findByName("filesystem") == std::optional<std::string>("fs"));
    CHECK(!harness.supervisor->findByName("fs").has_value());
}

TEST_CASE("ConnectionSupervisor connect publishes the backend's tools", "[supervisor]")
{
    auto harness = SupervisorHarness {};
    auto recorder = test::EventRecorder(harness.events);
    auto server = harness.serve("fs");
    server->addTool("read_file", "Read a file");

    REQUIRE(harness.supervisor->addBackend(processBackend("fs", "filesystem")).has_value());
    REQUIRE(harness.supervisor->connect("fs").has_value());

    CHECK(harness.state("fs") == ConnectionStatus::Connected);
    CHECK(harness.catalog.entries("fs").size() == 2);
    CHECK(harness.catalog.get("fs", "read_file")->backendName == "filesystem");
    CHECK(statusesOf(recorder, "fs") == std::vector { ConnectionStatus::Connecting, ConnectionStatus::Connected });

    auto const updates = recorder.eventsOf<ToolsUpdatedEvent>();
    REQUIRE(updates.size() == 1);
    CHECK(updates[0].toolNames == std::vector<std::string> { "echo", "read_file" });

    auto const snapshots = harness.supervisor->snapshot();
    REQUIRE(snapshots.size() == 1);
    CHECK(snapshots[0].toolCount == 2);
    CHECK(snapshots[0].lastConnected.has_value());
    CHECK(snapshots[0].authStatus == AuthStatus::None);

    // Connecting a connected backend is a no-op.
    REQUIRE(harness.supervisor->connect("fs").has_value());
    CHECK(server->startCount() == 1);
}

TEST_CASE("ConnectionSupervisor reports connect failures without retrying", "[supervisor]")
{
    auto harness = SupervisorHarness {};
    auto recorder = test::EventRecorder(harness.events);
    REQUIRE(harness.supervisor->addBackend(processBackend("fs", "filesystem")).has_value());

    auto result = harness.supervisor->connect("fs");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);

    auto state = harness.supervisor->status("fs");
    REQUIRE(state.has_value());
    CHECK(state->status == ConnectionStatus::Error);
    CHECK(state->reason == "Executable not found: fake-server");
    CHECK(!harness.catalog.hasBackend("fs"));

    auto const errors = recorder.eventsOf<ServerErrorEvent>();
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].backendId == "fs");

    // A later explicit connect succeeds once the backend is available.
    harness.serve("fs");
    REQUIRE(harness.supervisor->connect("fs").has_value());
    CHECK(harness.state("fs") == ConnectionStatus::Connected);
}

TEST_CASE("ConnectionSupervisor reports handshake failures", "[supervisor]")
{
    auto harness = SupervisorHarness {};
    auto server = harness.serve("fs");
    server->sendFailure = Error { ErrorCode::TransportError, "broken pipe" };
    REQUIRE(harness.supervisor->addBackend(processBackend("fs", "filesystem")).has_value());

    auto result = harness.supervisor->connect("fs");
    REQUIRE(!result.has_value());
    CHECK(harness.state("fs") == ConnectionStatus::Error);
    CHECK(harness.supervisor->status("fs")->reason == "broken pipe");
    CHECK(server->isClosed());
}

TEST_CASE("ConnectionSupervisor connect of an unknown backend fails", "[supervisor]")
{
    auto harness = SupervisorHarness {};
    auto result = harness.supervisor->connect("nope");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::NotFound);
    harness.supervisor->disconnect("nope");
}

TEST_CASE("ConnectionSupervisor disconnect clears the catalog slice", "[supervisor]")
{
    auto harness = SupervisorHarness {};
    auto recorder = test::EventRecorder(harness.events);
    auto server = harness.serve("fs");
    REQUIRE(harness.supervisor->addBackend(processBackend("fs", "filesystem")).has_value());
    REQUIRE(harness.supervisor->connect("fs").has_value());

    harness.supervisor->disconnect("fs");
    CHECK(harness.state("fs") == ConnectionStatus::Disconnected);
    CHECK(!harness.catalog.hasBackend("fs"));
    CHECK(server->isClosed());

    harness.supervisor->disconnect("fs");
    CHECK(statusesOf(recorder, "fs")
          == std::vector { ConnectionStatus::Connecting, ConnectionStatus::Connected, ConnectionStatus::Disconnected });
    CHECK(recorder.eventsOf<ServerErrorEvent>().empty());

    // Reconnecting starts a fresh session.
    REQUIRE(harness.supervisor->connect("fs").has_value());
    CHECK(server->startCount() == 2);
}

TEST_CASE("ConnectionSupervisor detects a backend that goes away", "[supervisor]")
{
    auto harness = SupervisorHarness {};
    auto recorder = test::EventRecorder(harness.events);
    auto server = harness.serve("fs");
    REQUIRE(harness.supervisor->addBackend(processBackend("fs", "filesystem")).has_value());
    REQUIRE(harness.supervisor->connect("fs").has_value());

    server->crash("process exited with code 1");

    REQUIRE(test::waitUntil([&] { return harness.state("fs") == ConnectionStatus::Error; }));
    CHECK(harness.supervisor->status("fs")->reason == "process exited with code 1");
    CHECK(!harness.catalog.hasBackend("fs"));

    auto const errors = recorder.eventsOf<ServerErrorEvent>();
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].message == "process exited with code 1");

    auto call = harness.supervisor->callTool("fs", "echo", nlohmann::json::object());
    REQUIRE(!call.has_value());
    CHECK(call.error().code == ErrorCode::BackendNotConnected);

    // No automatic reconnect; an explicit one works.
    CHECK(server->startCount() == 1);
    REQUIRE(harness.supervisor->connect("fs").has_value());
}

TEST_CASE("ConnectionSupervisor refreshes tools on list_changed", "[supervisor]")
{
    auto harness = SupervisorHarness {};
    auto recorder = test::EventRecorder(harness.events);
    auto server = harness.serve("fs");
    REQUIRE(harness.supervisor->addBackend(processBackend("fs", "filesystem")).has_value());
    REQUIRE(harness.supervisor->connect("fs").has_value());

    server->addTool("new_tool", "Appeared later");
    server->notify(protocol::methods::ToolsListChanged);

    REQUIRE(test::waitUntil([&] { return harness.catalog.entries("fs").size() == 2; }));
    CHECK(harness.catalog.get("fs", "new_tool").has_value());
    REQUIRE(test::waitUntil([&] { return recorder.eventsOf<ToolsUpdatedEvent>().size() == 2; }));
}

TEST_CASE("ConnectionSupervisor forwards backend log messages", "[supervisor]")
{
    auto harness = SupervisorHarness {};
    auto recorder = test::EventRecorder(harness.events);
    auto server = harness.serve("fs");
    REQUIRE(harness.supervisor->addBackend(processBackend("fs", "filesystem")).has_value());
    REQUIRE(harness.supervisor->connect("fs").has_value());

    server->notify(protocol::methods::LogMessage, { { "level", "warning" }, { "data", "disk almost full" } });

    REQUIRE(test::waitUntil([&] { return !recorder.eventsOf<ServerLogEvent>().empty(); }));
    auto const logs = recorder.eventsOf<ServerLogEvent>();
    CHECK(logs[0].backendId == "fs");
    CHECK(logs[0].level == "warning");
    CHECK(logs[0].message == "disk almost full");
}

TEST_CASE("ConnectionSupervisor dispatches tool calls to connected backends only", "[supervisor]")
{
    auto harness = SupervisorHarness {};
    auto server = harness.serve("fs");
    REQUIRE(harness.supervisor->addBackend(processBackend("fs", "filesystem")).has_value());

    auto early = harness.supervisor->callTool("fs", "echo", nlohmann::json::object());
    REQUIRE(!early.has_value());
    CHECK(early.error().code == ErrorCode::BackendNotConnected);
    CHECK(server->sent().empty());

    REQUIRE(harness.supervisor->connect("fs").has_value());
    auto result = harness.supervisor->callTool("fs", "echo", { { "text", "hi" } });
    REQUIRE(result.has_value());
    CHECK((*result)["content"][0]["text"] == R"({"text":"hi"})");

    auto forwarded = harness.supervisor->forward("fs", "resources/list", nlohmann::json::object());
    REQUIRE(!forwarded.has_value());
    CHECK(forwarded.error().code == ErrorCode::RemoteError);

    auto unknown = harness.supervisor->callTool("nope", "echo", nlohmann::json::object());
    REQUIRE(!unknown.has_value());
    CHECK(unknown.error().code == ErrorCode::NotFound);
}

TEST_CASE("ConnectionSupervisor disconnect cancels in-flight calls", "[supervisor]")
{
    auto harness = SupervisorHarness {};
    auto server = harness.serve("fs");
    server->hangToolCalls = true;
    REQUIRE(harness.supervisor->addBackend(processBackend("fs", "filesystem")).has_value());
    REQUIRE(harness.supervisor->connect("fs").has_value());

    auto call = std::async(std::launch::async, [&] {
        return harness.supervisor->callTool("fs", "slow", nlohmann::json::object(), 10000ms);
    });
    REQUIRE(test::waitUntil([&] {
        auto const methods = server->sentMethods();
        return std::ranges::find(methods, "tools/call") != methods.end();
    }));

    harness.supervisor->disconnect("fs");

    REQUIRE(call.wait_for(2s) == std::future_status::ready);
    auto result = call.get();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::Cancelled);
    CHECK(harness.state("fs") == ConnectionStatus::Disconnected);
}

TEST_CASE("ConnectionSupervisor fails in-flight calls when the backend exits", "[supervisor]")
{
    auto harness = SupervisorHarness {};
    auto server = harness.serve("fs");
    server->hangToolCalls = true;
    REQUIRE(harness.supervisor->addBackend(processBackend("fs", "filesystem")).has_value());
    REQUIRE(harness.supervisor->connect("fs").has_value());

    auto call = std::async(std::launch::async, [&] {
        return harness.supervisor->callTool("fs", "slow", nlohmann::json::object(), 10000ms);
    });
    REQUIRE(test::waitUntil([&] {
        auto const methods = server->sentMethods();
        return std::ranges::find(methods, "tools/call") != methods.end();
    }));

    server->crash("process exited with code 137");

    REQUIRE(call.wait_for(2s) == std::future_status::ready);
    auto result = call.get();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportClosed);
    REQUIRE(test::waitUntil([&] { return harness.state("fs") == ConnectionStatus::Error; }));
    CHECK(!harness.catalog.hasBackend("fs"));
}

TEST_CASE("ConnectionSupervisor isolates backends from each other", "[supervisor]")
{
    auto harness = SupervisorHarness {};
    harness.serve("fs");
    harness.serve("gh");
    REQUIRE(harness.supervisor->addBackend(processBackend("fs", "filesystem")).has_value());
    REQUIRE(harness.supervisor->addBackend(processBackend("gh", "github")).has_value());
    REQUIRE(harness.supervisor->addBackend(processBackend("broken", "broken")).has_value());
    REQUIRE(harness.supervisor->addBackend(processBackend("off", "disabled", false)).has_value());
    harness.serve("off");

    harness.supervisor->connectEnabled();

    CHECK(harness.state("fs") == ConnectionStatus::Connected);
    CHECK(harness.state("gh") == ConnectionStatus::Connected);
    CHECK(harness.state("broken") == ConnectionStatus::Error);
    CHECK(harness.state("off") == ConnectionStatus::Disconnected);

    harness.supervisor->disconnect("fs");
    CHECK(harness.state("gh") == ConnectionStatus::Connected);
    CHECK(harness.supervisor->callTool("gh", "echo", nlohmann::json::object()).has_value());

    harness.supervisor->shutdown();
    CHECK(harness.state("gh") == ConnectionStatus::Disconnected);
    CHECK(harness.catalog.allEntries().empty());
}

TEST_CASE("ConnectionSupervisor updateBackend reconnects active backends", "[supervisor]")
{
    auto harness = SupervisorHarness {};
    auto server = harness.serve("fs");
    REQUIRE(harness.supervisor->addBackend(processBackend("fs", "filesystem")).has_value());
    REQUIRE(harness.supervisor->connect("fs").has_value());

    REQUIRE(harness.supervisor->updateBackend(processBackend("fs", "files")).has_value());
    CHECK(harness.state("fs") == ConnectionStatus::Connected);
    CHECK(server->startCount() == 2);
    CHECK(harness.catalog.get("fs", "echo")->backendName == "files");
    CHECK(harness.supervisor->findByName("files") == std::optional<std::string>("fs"));

    auto missing = harness.supervisor->updateBackend(processBackend("nope", "x"));
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::NotFound);
}

TEST_CASE("ConnectionSupervisor reconnect waits for a running disconnect", "[supervisor]")
{
    auto harness = SupervisorHarness {};
    auto recorder = test::EventRecorder(harness.events);
    auto server = harness.serve("fs");
    REQUIRE(harness.supervisor->addBackend(processBackend("fs", "filesystem")).has_value());
    REQUIRE(harness.supervisor->connect("fs").has_value());

    auto gate = std::promise<void> {};
    auto closeEntered = std::make_shared<std::atomic<bool>>(false);
    server->beforeClose = [released = gate.get_future().share(), closeEntered] {
        *closeEntered = true;
        released.wait();
    };

    auto disconnecting = std::async(std::launch::async, [&] { harness.supervisor->disconnect("fs"); });
    REQUIRE(test::waitUntil([&] { return closeEntered->load(); }));

    auto reconnecting = std::async(std::launch::async, [&] { return harness.supervisor->connect("fs"); });
    CHECK(reconnecting.wait_for(200ms) == std::future_status::timeout);
    CHECK(server->startCount() == 1);

    gate.set_value();
    disconnecting.get();
    REQUIRE(reconnecting.get().has_value());

    CHECK(server->startCount() == 2);
    CHECK(!server->overlappingStart());
    CHECK(harness.state("fs") == ConnectionStatus::Connected);
    CHECK(statusesOf(recorder, "fs")
          == std::vector { ConnectionStatus::Connecting,
                           ConnectionStatus::Connected,
                           ConnectionStatus::Disconnected,
                           ConnectionStatus::Connecting,
                           ConnectionStatus::Connected });
}

TEST_CASE("ConnectionSupervisor removeBackend forgets the backend", "[supervisor]")
{
    auto harness = SupervisorHarness {};
    harness.serve("fs");
    REQUIRE(harness.supervisor->addBackend(processBackend("fs", "filesystem")).has_value());
    REQUIRE(harness.supervisor->connect("fs").has_value());

    REQUIRE(harness.supervisor->removeBackend("fs").has_value());
    CHECK(!harness.supervisor->status("fs").has_value());
    CHECK(!harness.catalog.hasBackend("fs"));
    CHECK(harness.supervisor->snapshot().empty());

    auto again = harness.supervisor->removeBackend("fs");
    REQUIRE(!again.has_value());
    CHECK(again.error().code == ErrorCode::NotFound);
}

namespace
{

/// Authorization server plus auto-approving browser for remote backend scenarios.
struct AuthorizedHarness
{
    std::shared_ptr<test::FakeHttpClient> http = std::make_shared<test::FakeHttpClient>();
    std::shared_ptr<test::FakeCallbackReceiver::Shared> browser =
        std::make_shared<test::FakeCallbackReceiver::Shared>();
    std::shared_ptr<std::atomic<int>> issued = std::make_shared<std::atomic<int>>(0);
    EventBus authEvents;
    AuthorizationManager auth { http, authEvents, AuthorizationOptions { .callbackTimeout = 3000ms } };
    SupervisorHarness harness { &auth, http };

    AuthorizedHarness()
    {
        test::serveAuthorizationServer(*http, issued);
        auth.setCallbackReceiverFactory(
            [shared = browser] { return std::make_unique<test::FakeCallbackReceiver>(shared); });
        auth.setBrowserLauncher(test::autoApprovingBrowser(browser));
    }
};

} // namespace

TEST_CASE("ConnectionSupervisor waits for authorization before connecting", "[supervisor][auth]")
{
    auto fixture = AuthorizedHarness {};
    auto& harness = fixture.harness;
    auto recorder = test::EventRecorder(harness.events);
    auto server = harness.serve("linear");
    server->kind = TransportKind::Remote;
    server->expectedToken = "access-1";

    REQUIRE(harness.supervisor->addBackend(remoteBackend("linear", "linear", true)).has_value());
    CHECK(fixture.auth.isRegistered("linear"));

    auto result = harness.supervisor->connect("linear");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::Unauthorized);
    CHECK(harness.state("linear") == ConnectionStatus::AwaitingAuthorization);
    CHECK(server->startCount() == 0);
    CHECK(recorder.eventsOf<AuthorizationRequiredEvent>().size() == 1);

    REQUIRE(harness.supervisor->startAuthorization("linear").has_value());
    CHECK(harness.state("linear") == ConnectionStatus::Connected);
    CHECK(harness.supervisor->snapshot()[0].authStatus == AuthStatus::Authorized);
    CHECK(harness.supervisor->callTool("linear", "echo", nlohmann::json::object()).has_value());
}

TEST_CASE("ConnectionSupervisor moves to AwaitingAuthorization on a rejected token", "[supervisor][auth]")
{
    auto fixture = AuthorizedHarness {};
    auto& harness = fixture.harness;
    auto server = harness.serve("linear");
    server->kind = TransportKind::Remote;
    server->expectedToken = "some-token";

    REQUIRE(harness.supervisor->addBackend(remoteBackend("linear", "linear")).has_value());
    auto result = harness.supervisor->connect("linear");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::Unauthorized);
    CHECK(harness.state("linear") == ConnectionStatus::AwaitingAuthorization);
    CHECK(!harness.catalog.hasBackend("linear"));
}

TEST_CASE("ConnectionSupervisor refreshes a revoked token once and retries", "[supervisor][auth]")
{
    auto fixture = AuthorizedHarness {};
    auto& harness = fixture.harness;
    auto server = harness.serve("linear");
    server->kind = TransportKind::Remote;
    server->expectedToken = "access-1";

    REQUIRE(harness.supervisor->addBackend(remoteBackend("linear", "linear", true)).has_value());
    REQUIRE(harness.supervisor->startAuthorization("linear").has_value());

    // The server stops accepting the first token; a refresh yields the accepted one.
    server->expectedToken = "access-2";
    auto result = harness.supervisor->callTool("linear", "echo", nlohmann::json::object());
    REQUIRE(result.has_value());
    CHECK(fixture.auth.accessToken("linear") == "access-2");
    CHECK(harness.state("linear") == ConnectionStatus::Connected);

    // A token no refresh can fix sends the backend back to AwaitingAuthorization.
    server->expectedToken = "never";
    auto rejected = harness.supervisor->callTool("linear", "echo", nlohmann::json::object());
    REQUIRE(!rejected.has_value());
    CHECK(rejected.error().code == ErrorCode::Unauthorized);
    CHECK(harness.state("linear") == ConnectionStatus::AwaitingAuthorization);
    CHECK(!harness.catalog.hasBackend("linear"));
}

TEST_CASE("ConnectionSupervisor rejects authorization for process backends", "[supervisor][auth]")
{
    auto fixture = AuthorizedHarness {};
    auto& harness = fixture.harness;
    REQUIRE(harness.supervisor->addBackend(processBackend("fs", "filesystem")).has_value());

    auto started = harness.supervisor->startAuthorization("fs");
    REQUIRE(!started.has_value());
    CHECK(started.error().code == ErrorCode::InvalidArgument);

    auto cleared = harness.supervisor->clearAuthorization("fs");
    REQUIRE(!cleared.has_value());
    CHECK(cleared.error().code == ErrorCode::InvalidArgument);

    auto unknown = harness.supervisor->startAuthorization("nope");
    REQUIRE(!unknown.has_value());
    CHECK(unknown.error().code == ErrorCode::NotFound);
}
