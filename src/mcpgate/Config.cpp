// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <set>
#include <sstream>

namespace mcpgate
{

namespace
{
    auto parseFraming(std::string_view name) -> Result<FramingMode>
    {
        if (name == "line" || name == "newline")
            return FramingMode::Line;
        if (name == "content-length")
            return FramingMode::ContentLength;
        return makeError(ErrorCode::ConfigError, std::format("Unknown framing mode: {}", name));
    }

    auto parseServer(const nlohmann::json& serverJson, std::string id) -> Result<BackendConfig>
    {
        if (!serverJson.is_object())
            return makeError(ErrorCode::ConfigError, std::format("Server entry '{}' is not an object", id));

        auto server = BackendConfig {
            .id = id.empty() ? json::getStringOr(serverJson, "id", "") : std::move(id),
        };
        server.name = json::getStringOr(serverJson, "name", server.id);
        server.enabled = json::getBoolOr(serverJson, "enabled", true);

        // Entries without a transport are inferred from the presence of a URL.
        auto const defaultTransport = serverJson.contains("url") ? "http" : "stdio";
        auto const transportName = json::getStringOr(serverJson, "transport", defaultTransport);
        auto const transport = transportKindFromString(transportName);
        if (!transport)
            return makeError(ErrorCode::ConfigError,
                             std::format("Server '{}': unknown transport '{}'", server.id, transportName));
        server.transport = *transport;

        server.command = json::getStringOr(serverJson, "command", "");
        server.args = json::getStringArray(serverJson, "args");
        server.env = json::getStringMap(serverJson, "env");
        auto framing = parseFraming(json::getStringOr(serverJson, "framing", "line"));
        if (!framing)
            return std::unexpected(framing.error());
        server.framing = *framing;

        server.url = json::getStringOr(serverJson, "url", "");
        server.headers = json::getStringMap(serverJson, "headers");
        server.requiresAuthorization = json::getBoolOr(serverJson, "requiresAuthorization", false);

        if (serverJson.contains("oauth"))
        {
            auto const& oauth = serverJson["oauth"];
            server.oauth.clientId = json::getStringOr(oauth, "clientId", "");
            server.oauth.clientSecret = json::getStringOr(oauth, "clientSecret", "");
            server.oauth.scopes = json::getStringArray(oauth, "scopes");
        }

        return server;
    }

    auto positiveOr(const nlohmann::json& root, std::string_view key, int64_t defaultValue) -> Result<int64_t>
    {
        auto const value = json::getIntOr(root, key, defaultValue);
        if (value <= 0)
            return makeError(ErrorCode::ConfigError, std::format("'{}' must be positive", key));
        return value;
    }
} // namespace

auto defaultConfigDir() -> std::string
{
#if defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/mcpgate";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/mcpgate";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mcpgate";
    return ".";
#endif
}

auto defaultDataDir() -> std::string
{
#if defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/mcpgate";
    return ".";
#else
    auto const* const xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData)
        return std::string(xdgData) + "/mcpgate";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/share/mcpgate";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto validateConfig(const AppConfig& config) -> VoidResult
{
    auto ids = std::set<std::string> {};
    for (const auto& server: config.servers)
    {
        if (server.id.empty())
            return makeError(ErrorCode::ConfigError, "Server entry without id");
        if (server.name.empty())
            return makeError(ErrorCode::ConfigError, std::format("Server '{}' has no name", server.id));
        if (!ids.insert(server.id).second)
            return makeError(ErrorCode::ConfigError, std::format("Duplicate server id: {}", server.id));

        if (server.transport == TransportKind::Process && server.command.empty())
            return makeError(ErrorCode::ConfigError,
                             std::format("Server '{}' uses the stdio transport but has no command", server.id));
        if (server.transport == TransportKind::Remote && server.url.empty())
            return makeError(ErrorCode::ConfigError,
                             std::format("Server '{}' uses the http transport but has no url", server.id));
    }
    return {};
}

auto parseConfig(const nlohmann::json& root) -> Result<AppConfig>
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be an object");

    auto config = AppConfig {};

    // Proxy section
    if (root.contains("proxy"))
    {
        auto const& proxy = root["proxy"];
        config.proxy.host = json::getStringOr(proxy, "host", config.proxy.host);
        auto const port = json::getIntOr(proxy, "port", 0);
        if (port < 0 || port > 65535)
            return makeError(ErrorCode::ConfigError, std::format("Invalid proxy port: {}", port));
        config.proxy.port = static_cast<unsigned short>(port);
    }

    config.logLevel = json::getStringOr(root, "logLevel", config.logLevel);
    config.dataDir = json::getStringOr(root, "dataDir", "");

    auto requestTimeout = positiveOr(root, "requestTimeoutMs", config.requestTimeoutMs);
    if (!requestTimeout)
        return std::unexpected(requestTimeout.error());
    config.requestTimeoutMs = *requestTimeout;

    auto gracePeriod = positiveOr(root, "processGracePeriodMs", config.processGracePeriodMs);
    if (!gracePeriod)
        return std::unexpected(gracePeriod.error());
    config.processGracePeriodMs = *gracePeriod;

    auto refreshMargin = positiveOr(root, "refreshMarginSeconds", config.refreshMarginSeconds);
    if (!refreshMargin)
        return std::unexpected(refreshMargin.error());
    config.refreshMarginSeconds = *refreshMargin;

    // Servers section
    if (root.contains("servers"))
    {
        if (!root["servers"].is_array())
            return makeError(ErrorCode::ConfigError, "'servers' must be an array");
        for (const auto& serverJson: root["servers"])
        {
            auto server = parseServer(serverJson, {});
            if (!server)
                return std::unexpected(server.error());
            config.servers.push_back(std::move(*server));
        }
    }

    if (root.contains("mcpServers") && root["mcpServers"].is_object())
    {
        for (const auto& [name, serverJson]: root["mcpServers"].items())
        {
            auto server = parseServer(serverJson, name);
            if (!server)
                return std::unexpected(server.error());
            config.servers.push_back(std::move(*server));
        }
    }

    if (auto valid = validateConfig(config); !valid)
        return std::unexpected(valid.error());
    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str());
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, parseResult.error().message));

    return parseConfig(*parseResult);
}

auto configToJson(const AppConfig& config) -> nlohmann::json
{
    auto root = nlohmann::json::object();
    root["proxy"] = { { "host", config.proxy.host }, { "port", config.proxy.port } };
    root["logLevel"] = config.logLevel;
    root["requestTimeoutMs"] = config.requestTimeoutMs;
    root["processGracePeriodMs"] = config.processGracePeriodMs;
    root["refreshMarginSeconds"] = config.refreshMarginSeconds;
    if (!config.dataDir.empty())
        root["dataDir"] = config.dataDir;

    auto servers = nlohmann::json::array();
    for (const auto& server: config.servers)
    {
        auto entry = nlohmann::json::object();
        entry["id"] = server.id;
        entry["name"] = server.name;
        entry["enabled"] = server.enabled;
        if (server.transport == TransportKind::Process)
        {
            entry["transport"] = "stdio";
            entry["command"] = server.command;
            if (!server.args.empty())
                entry["args"] = server.args;
            if (!server.env.empty())
                entry["env"] = server.env;
            entry["framing"] = server.framing == FramingMode::ContentLength ? "content-length" : "line";
        }
        else
        {
            entry["transport"] = "http";
            entry["url"] = server.url;
            if (!server.headers.empty())
                entry["headers"] = server.headers;
            entry["requiresAuthorization"] = server.requiresAuthorization;
            if (!server.oauth.clientId.empty() || !server.oauth.scopes.empty())
            {
                auto oauth = nlohmann::json::object();
                if (!server.oauth.clientId.empty())
                    oauth["clientId"] = server.oauth.clientId;
                if (!server.oauth.clientSecret.empty())
                    oauth["clientSecret"] = server.oauth.clientSecret;
                if (!server.oauth.scopes.empty())
                    oauth["scopes"] = server.oauth.scopes;
                entry["oauth"] = std::move(oauth);
            }
        }
        servers.push_back(std::move(entry));
    }
    root["servers"] = std::move(servers);
    return root;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << configToJson(config).dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace mcpgate
