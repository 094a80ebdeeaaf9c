// SPDX-License-Identifier: Apache-2.0
#include <core/EventBus.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <stdexcept>

#include "TestSupport.hpp"

using namespace mcpgate;
using namespace std::chrono_literals;

TEST_CASE("EventBus delivers events to every subscriber in order", "[events]")
{
    auto bus = EventBus {};
    auto first = test::EventRecorder(bus);
    auto second = test::EventRecorder(bus);

    bus.publish(StatusChangedEvent { .backendId = "a", .state = { .status = ConnectionStatus::Connecting } });
    bus.publish(StatusChangedEvent { .backendId = "a", .state = { .status = ConnectionStatus::Connected } });
    bus.publish(ServerErrorEvent { .backendId = "b", .message = "boom" });

    auto const statuses = first.eventsOf<StatusChangedEvent>();
    REQUIRE(statuses.size() == 2);
    CHECK(statuses[0].state.status == ConnectionStatus::Connecting);
    CHECK(statuses[1].state.status == ConnectionStatus::Connected);
    CHECK(first.events().size() == 3);
    CHECK(second.events().size() == 3);
}

TEST_CASE("EventBus unsubscribe stops delivery", "[events]")
{
    auto bus = EventBus {};
    auto count = std::atomic<int> { 0 };
    auto const id = bus.subscribe([&](const Event&) { ++count; });

    bus.publish(AuthorizationRequiredEvent { .backendId = "x" });
    bus.flush();
    CHECK(count == 1);

    bus.unsubscribe(id);
    bus.publish(AuthorizationRequiredEvent { .backendId = "x" });
    bus.flush();
    CHECK(count == 1);
}

TEST_CASE("EventBus keeps delivering after a subscriber throws", "[events]")
{
    auto bus = EventBus {};
    auto const failing = bus.subscribe([](const Event&) { throw std::runtime_error("subscriber bug"); });
    auto recorder = test::EventRecorder(bus);

    bus.publish(ServerLogEvent { .backendId = "x", .level = "info", .message = "one" });
    bus.publish(ServerLogEvent { .backendId = "x", .level = "info", .message = "two" });

    CHECK(recorder.eventsOf<ServerLogEvent>().size() == 2);
    bus.unsubscribe(failing);
}

TEST_CASE("EventBus publish does not wait for slow subscribers", "[events]")
{
    auto bus = EventBus {};
    auto release = std::atomic<bool> { false };
    auto const id = bus.subscribe([&](const Event&) {
        while (!release)
            std::this_thread::sleep_for(1ms);
    });

    auto const started = std::chrono::steady_clock::now();
    for (auto i = 0; i < 10; ++i)
        bus.publish(ServerErrorEvent { .backendId = "x", .message = "slow" });
    CHECK(std::chrono::steady_clock::now() - started < 500ms);

    release = true;
    bus.flush();
    bus.unsubscribe(id);
}

TEST_CASE("EventBus stop delivers queued events and ignores later ones", "[events]")
{
    auto bus = EventBus {};
    auto count = std::atomic<int> { 0 };
    auto const id = bus.subscribe([&](const Event&) { ++count; });

    bus.publish(AuthorizationRequiredEvent { .backendId = "x" });
    bus.stop();
    CHECK(count == 1);

    bus.publish(AuthorizationRequiredEvent { .backendId = "x" });
    bus.flush();
    CHECK(count == 1);
    bus.unsubscribe(id);
}

TEST_CASE("eventName and eventToJson", "[events]")
{
    auto const status = Event { StatusChangedEvent {
        .backendId = "fs",
        .state = { .status = ConnectionStatus::Error, .reason = "process exited with code 1" },
    } };
    CHECK(eventName(status) == "server-status-changed");
    CHECK(eventToJson(status)
          == nlohmann::json {
              { "serverId", "fs" },
              { "status", "error" },
              { "error", "process exited with code 1" },
          });

    auto const tools = Event { ToolsUpdatedEvent { .backendId = "fs", .backendName = "filesystem", .toolNames = { "a" } } };
    CHECK(eventName(tools) == "tools-updated");
    CHECK(eventToJson(tools)["tools"] == nlohmann::json { "a" });

    auto const auth = Event { AuthorizationStatusEvent { .backendId = "gh", .status = AuthStatus::Authorizing } };
    CHECK(eventName(auth) == "authorization-status-changed");
    CHECK(eventToJson(auth) == nlohmann::json { { "serverId", "gh" }, { "status", "authorizing" } });

    auto const call = Event { CallCompletedEvent {
        .backendId = "gh",
        .operation = "create_issue",
        .duration = 42ms,
        .success = false,
        .error = "timeout",
    } };
    CHECK(eventName(call) == "call-completed");
    auto const payload = eventToJson(call);
    CHECK(payload["durationMs"] == 42);
    CHECK(payload["success"] == false);
    CHECK(payload["error"] == "timeout");

    CHECK(eventName(Event { ServerLogEvent {} }) == "server-log");
    CHECK(eventName(Event { ServerErrorEvent {} }) == "server-error");
    CHECK(eventName(Event { AuthorizationRequiredEvent {} }) == "authorization-required");
}
