// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <http/CurlHttpClient.hpp>
#include <mcpgate/AdminClient.hpp>
#include <mcpgate/App.hpp>
#include <mcpgate/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>
#include <memory>
#include <print>

namespace
{

/// Runs one admin subcommand against the gateway described by @p config.
auto runAdminCommand(const mcpgate::AppConfig& config, const std::string& command, const std::string& backendId)
    -> int
{
    if (config.proxy.port == 0)
    {
        mcpgate::log::error("No gateway port configured; pass --port or set proxy.port in the config file");
        return 1;
    }

    auto client = mcpgate::AdminClient(std::make_shared<mcpgate::http::CurlHttpClient>(),
                                       std::format("http://{}:{}", config.proxy.host, config.proxy.port));

    if (command == "status")
    {
        auto backends = client.listBackends();
        if (!backends)
        {
            mcpgate::log::error("{}", backends.error().message);
            return 1;
        }
        for (const auto& backend: *backends)
            std::println("{}", mcpgate::formatBackendLine(backend));
        return 0;
    }

    auto const action = mcpgate::adminActionFromString(command);
    if (!action)
    {
        mcpgate::log::error("Unknown command: {}", command);
        return 1;
    }

    if (*action == mcpgate::AdminAction::Authorize)
        std::println("Complete the authorization of '{}' in your browser", backendId);

    auto result = client.perform(backendId, *action);
    if (!result)
    {
        mcpgate::log::error("{} of '{}' failed: {}", command, backendId, result.error().message);
        return 1;
    }
    std::println("{}", mcpgate::formatBackendLine(*result));
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcpgate - one local endpoint for many MCP servers" };

    auto configPath = std::string {};
    auto port = -1;
    auto logLevel = std::string {};
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-p,--port", port, "Port of the local endpoint (0 = ephemeral)")->check(CLI::Range(0, 65535));
    app.add_option("--log-level", logLevel, "Log level (error|warning|info|debug|trace)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    // Management commands talk to an already running gateway and accept the options above.
    app.fallthrough();
    auto backendId = std::string {};
    app.add_subcommand("status", "Show the state of every backend of a running gateway");
    app.add_subcommand("connect", "Connect a backend")->add_option("id", backendId, "Backend id")->required();
    app.add_subcommand("disconnect", "Disconnect a backend")->add_option("id", backendId, "Backend id")->required();
    app.add_subcommand("authorize", "Authorize a remote backend through the browser")
        ->add_option("id", backendId, "Backend id")
        ->required();
    app.add_subcommand("logout", "Forget a remote backend's authorization")
        ->add_option("id", backendId, "Backend id")
        ->required();
    app.require_subcommand(0, 1);

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? mcpgate::loadConfig() : mcpgate::loadConfigFromFile(configPath);

    if (!configResult)
    {
        mcpgate::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (port >= 0)
        config.proxy.port = static_cast<unsigned short>(port);
    if (!logLevel.empty())
        config.logLevel = logLevel;
    if (verbose)
        config.logLevel = "debug";

    auto const level = mcpgate::log::parseLevel(config.logLevel);
    if (!level)
    {
        mcpgate::log::error("Unknown log level: {}", config.logLevel);
        return 1;
    }
    mcpgate::log::setLevel(*level);

    if (auto const subcommands = app.get_subcommands(); !subcommands.empty())
        return runAdminCommand(config, subcommands.front()->get_name(), backendId);

    auto application = mcpgate::App(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        mcpgate::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
