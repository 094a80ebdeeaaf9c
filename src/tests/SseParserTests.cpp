// SPDX-License-Identifier: Apache-2.0
#include <http/SseParser.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcpgate;

TEST_CASE("SseParser dispatches events on blank lines", "[sse]")
{
    auto parser = http::SseParser {};
    auto events = parser.feed("event: message\ndata: {\"a\":1}\n\n");
    REQUIRE(events.size() == 1);
    CHECK(events[0].event == "message");
    CHECK(events[0].data == "{\"a\":1}");
}

TEST_CASE("SseParser handles events split across chunks", "[sse]")
{
    auto parser = http::SseParser {};
    CHECK(parser.feed("da").empty());
    CHECK(parser.feed("ta: hel").empty());
    CHECK(parser.feed("lo\r\n").empty());

    auto events = parser.feed("\r\n");
    REQUIRE(events.size() == 1);
    CHECK(events[0].data == "hello");
}

TEST_CASE("SseParser joins multi-line data and tracks ids", "[sse]")
{
    auto parser = http::SseParser {};
    auto events = parser.feed("id: 7\nevent: update\ndata: one\ndata: two\n\n");
    REQUIRE(events.size() == 1);
    CHECK(events[0].event == "update");
    CHECK(events[0].data == "one\ntwo");
    CHECK(events[0].id == "7");
    CHECK(parser.lastEventId() == "7");
}

TEST_CASE("SseParser ignores comments and events without data", "[sse]")
{
    auto parser = http::SseParser {};
    auto events = parser.feed(": ping\n\nevent: empty\n\nretry: 100\ndata:x\n\n");
    REQUIRE(events.size() == 1);
    CHECK(events[0].event == "message");
    CHECK(events[0].data == "x");
}

TEST_CASE("SseParser finish flushes an unterminated event", "[sse]")
{
    auto parser = http::SseParser {};
    CHECK(parser.feed("data: tail").empty());

    auto events = parser.finish();
    REQUIRE(events.size() == 1);
    CHECK(events[0].data == "tail");
    CHECK(parser.finish().empty());
}
