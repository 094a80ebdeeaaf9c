// SPDX-License-Identifier: Apache-2.0
#include "RequestRouter.hpp"

#include <catalog/SchemaValidator.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/Protocol.hpp>

#include <chrono>
#include <format>
#include <functional>

namespace mcpgate
{

namespace
{
    auto snapshotToJson(const BackendSnapshot& backend) -> nlohmann::json
    {
        auto entry = nlohmann::json {
            { "id", backend.config.id },
            { "name", backend.config.name },
            { "transport", transportKindToString(backend.config.transport) },
            { "enabled", backend.config.enabled },
            { "status", connectionStatusToString(backend.state.status) },
            { "authStatus", authStatusToString(backend.authStatus) },
            { "toolCount", backend.toolCount },
        };
        if (!backend.state.reason.empty())
            entry["reason"] = backend.state.reason;
        return entry;
    }

    using MethodHandler =
        std::function<std::optional<Result<nlohmann::json>>(const std::string& method, const nlohmann::json& params)>;

    auto initializeResult(const nlohmann::json& params, std::string_view instructions) -> nlohmann::json
    {
        auto const requested = json::getStringOr(params, "protocolVersion", "");
        auto result = nlohmann::json {
            { "protocolVersion", protocol::negotiateVersion(requested) },
            { "capabilities", { { "tools", { { "listChanged", false } } } } },
            { "serverInfo",
              { { "name", protocol::ImplementationName }, { "version", protocol::ImplementationVersion } } },
        };
        if (!instructions.empty())
            result["instructions"] = instructions;
        return result;
    }

    /// Shared JSON-RPC envelope handling of the three local surfaces.
    auto respond(const nlohmann::json& message, std::string_view instructions, const MethodHandler& handler)
        -> std::optional<nlohmann::json>
    {
        switch (jsonrpc::classify(message))
        {
            case jsonrpc::MessageKind::Invalid:
                return jsonrpc::makeErrorResponse(nullptr, jsonrpc::codes::InvalidRequest, "Invalid JSON-RPC message");
            case jsonrpc::MessageKind::Notification:
            case jsonrpc::MessageKind::Response: return std::nullopt;
            case jsonrpc::MessageKind::Request: break;
        }

        auto const& id = message["id"];
        auto const method = message["method"].get<std::string>();
        auto const params = message.contains("params") ? message["params"] : nlohmann::json();

        if (method == protocol::methods::Initialize)
            return jsonrpc::makeResult(id, initializeResult(params, instructions));
        if (method == protocol::methods::Ping)
            return jsonrpc::makeResult(id, nlohmann::json::object());

        auto result = handler(method, params);
        if (!result)
            return jsonrpc::makeErrorResponse(
                id, jsonrpc::codes::MethodNotFound, std::format("Method not found: {}", method));
        if (!*result)
            return jsonrpc::makeErrorResponse(
                id, jsonrpc::errorCodeFor(result->error().code), result->error().message);
        return jsonrpc::makeResult(id, std::move(**result));
    }

    auto textResult(std::string text, bool isError = false) -> nlohmann::json
    {
        auto result = nlohmann::json {
            { "content", nlohmann::json::array({ { { "type", "text" }, { "text", std::move(text) } } }) },
        };
        if (isError)
            result["isError"] = true;
        return result;
    }

    auto structuredResult(nlohmann::json structured) -> nlohmann::json
    {
        auto result = textResult(structured.dump(2));
        result["structuredContent"] = std::move(structured);
        return result;
    }

    auto entryToJson(const CatalogEntry& entry) -> nlohmann::json
    {
        auto doc = nlohmann::json {
            { "backend_id", entry.backendId },
            { "backend_name", entry.backendName },
            { "name", entry.name },
            { "description", entry.description },
            { "input_schema", entry.inputSchema.is_null() ? nlohmann::json::object() : entry.inputSchema },
        };
        if (!entry.title.empty())
            doc["title"] = entry.title;
        return doc;
    }

    auto toolToJson(std::string name, const CatalogEntry& entry) -> nlohmann::json
    {
        auto doc = nlohmann::json {
            { "name", std::move(name) },
            { "description", entry.description },
            { "inputSchema", entry.inputSchema.is_null() ? nlohmann::json { { "type", "object" } } : entry.inputSchema },
        };
        // Some clients reject a null title.
        if (!entry.title.empty())
            doc["title"] = entry.title;
        return doc;
    }

    auto callArguments(const nlohmann::json& params, std::string_view key) -> Result<nlohmann::json>
    {
        auto const keyStr = std::string(key);
        if (!params.is_object() || !params.contains(keyStr) || params[keyStr].is_null())
            return nlohmann::json::object();
        if (!params[keyStr].is_object())
            return makeError(ErrorCode::InvalidArgument, std::format("'{}' must be an object", key));
        return params[keyStr];
    }

    auto requireString(const nlohmann::json& params, std::string_view key) -> Result<std::string>
    {
        auto const keyStr = std::string(key);
        if (!params.is_object() || !params.contains(keyStr) || !params[keyStr].is_string())
            return makeError(ErrorCode::InvalidArgument, std::format("Missing string argument '{}'", key));
        return params[keyStr].get<std::string>();
    }

    constexpr auto DiscoveryInstructions = std::string_view {
        "Use discover_tools to search the tools of every connected server, list_servers to see "
        "what is available and call_tool to invoke a tool by backend id and name."
    };
} // namespace

auto adminActionFromString(std::string_view name) -> std::optional<AdminAction>
{
    if (name == "connect")
        return AdminAction::Connect;
    if (name == "disconnect")
        return AdminAction::Disconnect;
    if (name == "authorize")
        return AdminAction::Authorize;
    if (name == "logout")
        return AdminAction::Logout;
    return std::nullopt;
}

auto adminActionName(AdminAction action) -> std::string_view
{
    switch (action)
    {
        case AdminAction::Connect: return "connect";
        case AdminAction::Disconnect: return "disconnect";
        case AdminAction::Authorize: return "authorize";
        case AdminAction::Logout: return "logout";
    }
    return "unknown";
}

RequestRouter::RequestRouter(ConnectionSupervisor& supervisor, ToolCatalog& catalog, EventBus& events):
    _supervisor(supervisor), _catalog(catalog), _events(events)
{
}

auto RequestRouter::callDirect(const std::string& backendId,
                               const std::string& operationName,
                               const nlohmann::json& arguments,
                               std::optional<std::chrono::milliseconds> timeout) -> Result<nlohmann::json>
{
    auto const state = _supervisor.status(backendId);
    if (!state)
        return std::unexpected(state.error());
    if (state->status != ConnectionStatus::Connected)
        return makeError(ErrorCode::BackendNotConnected,
                         std::format("Backend '{}' is not connected ({})",
                                     backendId,
                                     connectionStatusToString(state->status)));

    auto const entry = _catalog.get(backendId, operationName);
    if (!entry)
        return std::unexpected(entry.error());

    auto const args = arguments.is_null() ? nlohmann::json::object() : arguments;
    if (auto valid = schema::validate(entry->inputSchema, args); !valid)
        return std::unexpected(valid.error());

    auto const started = std::chrono::steady_clock::now();
    auto result = _supervisor.callTool(backendId, operationName, args, timeout);
    auto const duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    auto const success = result.has_value() && !json::getBoolOr(*result, "isError", false);
    log::debug("Call {}/{} finished in {} ({})", backendId, operationName, duration, success ? "ok" : "error");
    _events.publish(CallCompletedEvent {
        .backendId = backendId,
        .operation = operationName,
        .duration = duration,
        .success = success,
        .error = result ? std::string {} : result.error().message,
    });
    return result;
}

auto RequestRouter::discoverTools(std::string_view query) const -> std::vector<CatalogEntry>
{
    return _catalog.search(query);
}

auto RequestRouter::listServers() const -> std::vector<BackendSummary>
{
    return _catalog.listBackendsSummary();
}

auto RequestRouter::administer(const std::string& backendId, AdminAction action) -> Result<nlohmann::json>
{
    if (auto const state = _supervisor.status(backendId); !state)
        return std::unexpected(state.error());

    auto done = VoidResult {};
    switch (action)
    {
        case AdminAction::Connect: done = _supervisor.connect(backendId); break;
        case AdminAction::Disconnect: _supervisor.disconnect(backendId); break;
        case AdminAction::Authorize: done = _supervisor.startAuthorization(backendId); break;
        case AdminAction::Logout: done = _supervisor.clearAuthorization(backendId); break;
    }
    if (!done)
        return std::unexpected(done.error());

    for (const auto& backend: _supervisor.snapshot())
    {
        if (backend.config.id == backendId)
            return snapshotToJson(backend);
    }
    return makeError(ErrorCode::NotFound, std::format("Unknown backend: {}", backendId));
}

auto RequestRouter::backendsStatus() const -> nlohmann::json
{
    auto backends = nlohmann::json::array();
    for (const auto& backend: _supervisor.snapshot())
        backends.push_back(snapshotToJson(backend));
    return backends;
}

auto RequestRouter::callTool(const std::string& backendId,
                             const std::string& operationName,
                             const nlohmann::json& arguments) -> Result<nlohmann::json>
{
    return callDirect(backendId, operationName, arguments);
}

auto RequestRouter::handleDirect(const std::string& backendId, const nlohmann::json& message)
    -> std::optional<nlohmann::json>
{
    auto const handler = [&](const std::string& method,
                             const nlohmann::json& params) -> std::optional<Result<nlohmann::json>> {
        if (method == protocol::methods::ToolsList)
        {
            auto const state = _supervisor.status(backendId);
            if (!state)
                return std::unexpected(state.error());
            if (state->status != ConnectionStatus::Connected)
                return makeError(ErrorCode::BackendNotConnected,
                                 std::format("Backend '{}' is not connected", backendId));

            auto tools = nlohmann::json::array();
            for (const auto& entry: _catalog.entries(backendId))
                tools.push_back(toolToJson(entry.name, entry));
            return nlohmann::json { { "tools", std::move(tools) } };
        }

        if (method == protocol::methods::ToolsCall)
        {
            auto name = requireString(params, "name");
            if (!name)
                return std::unexpected(name.error());
            auto args = callArguments(params, "arguments");
            if (!args)
                return std::unexpected(args.error());
            return callDirect(backendId, *name, *args);
        }

        return _supervisor.forward(backendId, method, params);
    };
    return respond(message, {}, handler);
}

auto RequestRouter::handleDiscovery(const nlohmann::json& message) -> std::optional<nlohmann::json>
{
    auto const handler = [&](const std::string& method,
                             const nlohmann::json& params) -> std::optional<Result<nlohmann::json>> {
        if (method == protocol::methods::ToolsList)
            return nlohmann::json { { "tools", discoveryToolDefinitions() } };
        if (method == protocol::methods::ToolsCall)
            return dispatchDiscovery(params);
        return std::nullopt;
    };
    return respond(message, DiscoveryInstructions, handler);
}

auto RequestRouter::dispatchDiscovery(const nlohmann::json& params) -> Result<nlohmann::json>
{
    auto name = requireString(params, "name");
    if (!name)
        return std::unexpected(name.error());
    auto args = callArguments(params, "arguments");
    if (!args)
        return std::unexpected(args.error());

    if (*name == discovery::DiscoverTools)
    {
        auto query = requireString(*args, "query");
        if (!query)
            return std::unexpected(query.error());

        auto matches = nlohmann::json::array();
        for (const auto& entry: discoverTools(*query))
            matches.push_back(entryToJson(entry));
        return structuredResult({ { "tools", std::move(matches) } });
    }

    if (*name == discovery::ListServers)
    {
        auto servers = nlohmann::json::array();
        for (const auto& summary: listServers())
        {
            servers.push_back({
                { "backend_id", summary.backendId },
                { "name", summary.name },
                { "tools", summary.operationNames },
            });
        }
        return structuredResult({ { "servers", std::move(servers) } });
    }

    if (*name == discovery::CallTool)
    {
        auto backendId = requireString(*args, "backend_id");
        auto operation = requireString(*args, "operation_name");
        auto callArgs = callArguments(*args, "arguments");
        auto result = [&]() -> Result<nlohmann::json> {
            if (!backendId)
                return std::unexpected(backendId.error());
            if (!operation)
                return std::unexpected(operation.error());
            if (!callArgs)
                return std::unexpected(callArgs.error());
            return callTool(*backendId, *operation, *callArgs);
        }();

        // Failures are reported to the model as a tool result.
        if (!result)
            return textResult(std::format("Error: {}", result.error().message), true);
        return result;
    }

    return makeError(ErrorCode::NotFound, std::format("Unknown discovery tool: {}", *name));
}

auto RequestRouter::handleAggregate(const nlohmann::json& message) -> std::optional<nlohmann::json>
{
    auto const handler = [&](const std::string& method,
                             const nlohmann::json& params) -> std::optional<Result<nlohmann::json>> {
        if (method == protocol::methods::ToolsList)
        {
            auto tools = nlohmann::json::array();
            for (const auto& entry: _catalog.allEntries())
                tools.push_back(toolToJson(std::format("{}.{}", entry.backendName, entry.name), entry));
            return nlohmann::json { { "tools", std::move(tools) } };
        }
        if (method == protocol::methods::ToolsCall)
            return callAggregate(params);
        return std::nullopt;
    };
    return respond(message, {}, handler);
}

auto RequestRouter::callAggregate(const nlohmann::json& params) -> Result<nlohmann::json>
{
    auto name = requireString(params, "name");
    if (!name)
        return std::unexpected(name.error());
    auto args = callArguments(params, "arguments");
    if (!args)
        return std::unexpected(args.error());

    auto const dot = name->find('.');
    if (dot == std::string::npos)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Tool name must be namespaced as 'serverName.toolName', got: {}", *name));

    auto const serverName = name->substr(0, dot);
    auto const backendId = _supervisor.findByName(serverName);
    if (!backendId)
        return makeError(ErrorCode::NotFound, std::format("No server found with name: {}", serverName));

    log::info("Proxy tool call: {}", *name);
    return callDirect(*backendId, name->substr(dot + 1), *args);
}

auto RequestRouter::discoveryToolDefinitions() -> nlohmann::json
{
    return nlohmann::json::array({
        {
            { "name", discovery::DiscoverTools },
            { "description",
              "Search the tools of every connected server. All whitespace-separated keywords must "
              "match the tool name, its description or its server name." },
            { "inputSchema",
              {
                  { "type", "object" },
                  { "properties", { { "query", { { "type", "string" }, { "description", "Search keywords" } } } } },
                  { "required", nlohmann::json::array({ "query" }) },
              } },
        },
        {
            { "name", discovery::ListServers },
            { "description", "List every connected server together with the names of its tools." },
            { "inputSchema", { { "type", "object" }, { "properties", nlohmann::json::object() } } },
        },
        {
            { "name", discovery::CallTool },
            { "description", "Invoke a tool of a connected server." },
            { "inputSchema",
              {
                  { "type", "object" },
                  { "properties",
                    {
                        { "backend_id", { { "type", "string" } } },
                        { "operation_name", { { "type", "string" } } },
                        { "arguments", { { "type", "object" } } },
                    } },
                  { "required", nlohmann::json::array({ "backend_id", "operation_name" }) },
              } },
        },
    });
}

} // namespace mcpgate
