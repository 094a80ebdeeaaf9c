// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/BackendConfig.hpp>
#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mcpgate
{

/// @brief Local endpoint configuration section.
struct ProxyConfig
{
    std::string host = "127.0.0.1";
    unsigned short port = 0; ///< 0 picks an ephemeral port.
};

/// @brief Top-level application configuration.
struct AppConfig
{
    ProxyConfig proxy;
    std::string logLevel = "info";
    int64_t requestTimeoutMs = 30000;
    int64_t processGracePeriodMs = 5000;
    int64_t refreshMarginSeconds = 60;

    /// @brief Where authorization grants are stored; empty means defaultDataDir().
    std::string dataDir;

    std::vector<BackendConfig> servers;
};

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration (defaults if no file exists) or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Builds and validates a configuration from a parsed document.
///
/// Besides the "servers" array, a "mcpServers" object in the common MCP client format
/// ({name: {command, args, env} | {url, headers}}) is accepted; its keys become ids.
[[nodiscard]] auto parseConfig(const nlohmann::json& root) -> Result<AppConfig>;

/// @brief Serializes a configuration in the shape parseConfig() reads.
[[nodiscard]] auto configToJson(const AppConfig& config) -> nlohmann::json;

/// @brief Checks ids, names and transport parameters of every server.
[[nodiscard]] auto validateConfig(const AppConfig& config) -> VoidResult;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the default data directory path for the current platform.
/// On Linux: $XDG_DATA_HOME/mcpgate or ~/.local/share/mcpgate
/// On macOS: ~/Library/Application Support/mcpgate
[[nodiscard]] auto defaultDataDir() -> std::string;

} // namespace mcpgate
