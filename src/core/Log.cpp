// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <print>

namespace mcpgate::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalCallback = LogCallback {};
    auto globalMutex = std::mutex {};
} // namespace

void setCallback(LogCallback callback)
{
    auto lock = std::lock_guard(globalMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    if (name == "error")
        return Level::Error;
    if (name == "warning" || name == "warn")
        return Level::Warning;
    if (name == "info")
        return Level::Info;
    if (name == "debug")
        return Level::Debug;
    if (name == "trace")
        return Level::Trace;
    return std::nullopt;
}

auto fromMcpLevel(std::string_view name) -> Level
{
    if (name == "emergency" || name == "alert" || name == "critical" || name == "error")
        return Level::Error;
    if (name == "warning")
        return Level::Warning;
    if (name == "debug")
        return Level::Debug;
    return Level::Info;
}

auto levelTag(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "ERROR";
        case Level::Warning: return "WARN ";
        case Level::Info: return "INFO ";
        case Level::Debug: return "DEBUG";
        case Level::Trace: return "TRACE";
    }
    return "?????";
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

    auto lock = std::lock_guard(globalMutex);

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    std::println(stderr, "{:%H:%M:%S} [{}] {}", now, levelTag(level), message);
}

} // namespace mcpgate::log
