// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace mcpgate;

namespace
{

/// Routes log output into a vector for the lifetime of the guard.
struct CapturedLog
{
    std::vector<std::pair<log::Level, std::string>> lines;
    log::Level previous = log::getLevel();

    explicit CapturedLog(log::Level level)
    {
        log::setLevel(level);
        log::setCallback([this](log::Level l, std::string_view message) { lines.emplace_back(l, std::string(message)); });
    }

    ~CapturedLog()
    {
        log::setCallback({});
        log::setLevel(previous);
    }

    CapturedLog(const CapturedLog&) = delete;
    CapturedLog& operator=(const CapturedLog&) = delete;
};

} // namespace

TEST_CASE("parseLevel", "[log]")
{
    CHECK(log::parseLevel("error") == log::Level::Error);
    CHECK(log::parseLevel("warn") == log::Level::Warning);
    CHECK(log::parseLevel("warning") == log::Level::Warning);
    CHECK(log::parseLevel("trace") == log::Level::Trace);
    CHECK(!log::parseLevel("verbose").has_value());
}

TEST_CASE("fromMcpLevel folds RFC 5424 levels", "[log]")
{
    CHECK(log::fromMcpLevel("emergency") == log::Level::Error);
    CHECK(log::fromMcpLevel("critical") == log::Level::Error);
    CHECK(log::fromMcpLevel("warning") == log::Level::Warning);
    CHECK(log::fromMcpLevel("notice") == log::Level::Info);
    CHECK(log::fromMcpLevel("debug") == log::Level::Debug);
    CHECK(log::fromMcpLevel("bogus") == log::Level::Info);
    CHECK(log::levelTag(log::Level::Warning) == "WARN ");
}

TEST_CASE("log filters by the global level", "[log]")
{
    auto captured = CapturedLog(log::Level::Info);

    log::info("connected {} backends", 3);
    log::debug("hidden");
    log::backend(log::Level::Warning, "github", "rate limited for {}s", 30);
    log::backend(log::Level::Debug, "github", "hidden too");

    REQUIRE(captured.lines.size() == 2);
    CHECK(captured.lines[0] == std::pair { log::Level::Info, std::string("connected 3 backends") });
    CHECK(captured.lines[1] == std::pair { log::Level::Warning, std::string("[github] rate limited for 30s") });
}
