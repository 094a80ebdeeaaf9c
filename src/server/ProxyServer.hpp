// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <router/RequestRouter.hpp>
#include <server/HttpCommon.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace mcpgate::server
{

struct ProxyServerOptions
{
    std::string host = "127.0.0.1";
    unsigned short port = 0; ///< 0 picks an ephemeral port.
    size_t workerThreads = 8;
};

/// @brief The parts of an inbound HTTP request the endpoint looks at.
struct ProxyRequest
{
    std::string method; ///< Upper-case HTTP verb.
    std::string target;
    std::string origin;
    std::string accept;
    std::string body;
    bool loopbackPeer = false; ///< The client connected from a loopback address.
};

/// @brief Local MCP Streamable HTTP endpoint.
///
/// Serves POST /mcp (aggregate), POST /discovery (discovery mode) and
/// POST /servers/{id} (direct proxy of one backend).
///
/// Loopback clients additionally reach the admin routes: GET /servers lists every backend,
/// POST /servers/{id}/{connect|disconnect|authorize|logout} drives one backend's lifecycle.
class ProxyServer
{
  public:
    ProxyServer(RequestRouter& router, ProxyServerOptions options = {});
    ~ProxyServer();

    ProxyServer(const ProxyServer&) = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;

    /// @brief Binds and starts serving.
    /// @return The bound port, or IoError if the address cannot be bound.
    [[nodiscard]] auto start() -> Result<unsigned short>;

    /// @brief Stops accepting, waits for running handlers. Idempotent.
    void stop();

    [[nodiscard]] auto port() const -> unsigned short;
    [[nodiscard]] auto isRunning() const -> bool;

    /// @brief Routes one request. Used by the network layer and directly by tests.
    [[nodiscard]] auto handle(const ProxyRequest& request) -> Reply;

  private:
    [[nodiscard]] static auto isAdminPath(std::string_view path) -> bool;
    [[nodiscard]] auto handleAdmin(const ProxyRequest& request, std::string_view path) -> Reply;

    struct Impl;
    RequestRouter& _router;
    ProxyServerOptions _options;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpgate::server
