// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpgate
{

/// @brief Configuration for spawning an MCP server process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    FramingMode framing = FramingMode::Line;
    std::chrono::milliseconds gracePeriod { 5000 };
};

/// @brief Resolves @p command against PATH the way a shell would.
/// @return The absolute or relative path of an executable file, or std::nullopt.
[[nodiscard]] auto findExecutable(std::string_view command) -> std::optional<std::string>;

/// @brief Transport that communicates with an MCP server via stdio pipes.
///
/// Spawns a child process and communicates via its stdin/stdout; stderr lines are
/// reported through TransportHandlers::onLog. A reader thread decodes stdout.
class StdioTransport: public Transport
{
  public:
    explicit StdioTransport(StdioTransportConfig config);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    [[nodiscard]] auto kind() const -> TransportKind override { return TransportKind::Process; }
    [[nodiscard]] auto start(TransportHandlers handlers) -> VoidResult override;
    [[nodiscard]] auto send(const nlohmann::json& message, std::chrono::milliseconds timeout)
        -> VoidResult override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief Process id of the spawned server, or -1.
    [[nodiscard]] auto pid() const -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpgate
