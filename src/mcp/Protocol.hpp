// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <array>
#include <string_view>

namespace mcpgate::protocol
{

/// @brief MCP protocol versions the gateway speaks, newest first.
constexpr auto SupportedVersions = std::array<std::string_view, 3> {
    "2025-06-18",
    "2025-03-26",
    "2024-11-05",
};

/// @brief Version requested when the gateway acts as a client towards a backend.
constexpr auto ClientProtocolVersion = std::string_view { "2025-03-26" };

constexpr auto ImplementationName = std::string_view { "mcpgate" };
constexpr auto ImplementationVersion = std::string_view { "0.1.0" };

/// @brief Echoes @p requested if supported, otherwise returns the newest supported version.
[[nodiscard]] constexpr auto negotiateVersion(std::string_view requested) -> std::string_view
{
    for (auto const version: SupportedVersions)
    {
        if (version == requested)
            return version;
    }
    return SupportedVersions.front();
}

namespace methods
{
    constexpr auto Initialize = std::string_view { "initialize" };
    constexpr auto Initialized = std::string_view { "notifications/initialized" };
    constexpr auto Ping = std::string_view { "ping" };
    constexpr auto ToolsList = std::string_view { "tools/list" };
    constexpr auto ToolsCall = std::string_view { "tools/call" };
    constexpr auto ToolsListChanged = std::string_view { "notifications/tools/list_changed" };
    constexpr auto LogMessage = std::string_view { "notifications/message" };

    /// @brief Synthetic notification raised by the gateway when a transport ends.
    constexpr auto TransportClosed = std::string_view { "notifications/transport/closed" };
} // namespace methods

} // namespace mcpgate::protocol
