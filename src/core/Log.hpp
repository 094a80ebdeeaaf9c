// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace mcpgate::log
{

/// @brief Verbosity level for log messages.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Callback type that receives all log messages.
/// @param level The log level of the message.
/// @param message The formatted log message text (without level prefix).
using LogCallback = std::function<void(Level level, std::string_view message)>;

/// @brief Sets a callback that receives all log messages.
///
/// When set, log messages are routed to the callback instead of stderr.
/// Pass an empty callback to revert to stderr output.
/// The callback may be invoked concurrently from supervisor, transport and server threads
/// but never re-entrantly for the same message.
void setCallback(LogCallback callback);

/// @brief Sets the global log verbosity level.
void setLevel(Level level);

/// @brief Returns the current global log verbosity level.
[[nodiscard]] auto getLevel() -> Level;

/// @brief Parses a level name ("error", "warning"/"warn", "info", "debug", "trace").
[[nodiscard]] auto parseLevel(std::string_view name) -> std::optional<Level>;

/// @brief Maps a backend's notifications/message level (RFC 5424 names such as
/// "notice", "critical" or "emergency") onto a Level. Unknown names map to Info.
[[nodiscard]] auto fromMcpLevel(std::string_view name) -> Level;

/// @brief Fixed-width tag printed in front of stderr lines, e.g. "WARN ".
[[nodiscard]] auto levelTag(Level level) -> std::string_view;

/// @brief Writes a log message at the given level.
///
/// If a callback is installed via setCallback(), the message is routed there.
/// Otherwise, it is written to stderr with a timestamp and level prefix.
void write(Level level, std::string_view message);

/// @brief Logs a line attributed to a backend, e.g. "[github] rate limited".
template <typename... Args>
void backend(Level level, std::string_view backendName, std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= level)
        write(level, std::format("[{}] {}", backendName, std::format(fmt, std::forward<Args>(args)...)));
}

/// @brief Logs an error message.
template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a warning message.
template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Warning)
        write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs an info message.
template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Info)
        write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a debug message.
template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Debug)
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a trace message.
template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Trace)
        write(Level::Trace, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace mcpgate::log
