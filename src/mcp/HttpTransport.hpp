// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <http/HttpClient.hpp>
#include <mcp/Transport.hpp>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace mcpgate
{

/// @brief Supplies the current bearer token for a remote backend, if any.
using TokenProvider = std::function<std::optional<std::string>()>;

/// @brief Configuration of an MCP Streamable HTTP endpoint.
struct HttpTransportConfig
{
    std::string url;
    std::map<std::string, std::string> headers;

    /// @brief Invoked with the resource_metadata URL whenever a 401/403 announces one.
    std::function<void(const std::string& resourceMetadataUrl)> onAuthorizationHint;
};

/// @brief Extracts the resource_metadata parameter of a WWW-Authenticate header, if present.
[[nodiscard]] auto parseResourceMetadataHint(std::string_view wwwAuthenticate) -> std::optional<std::string>;

/// @brief Transport speaking MCP Streamable HTTP.
///
/// Every outbound message is a POST whose response (JSON, JSON batch or an SSE body)
/// is delivered to TransportHandlers::onMessage before send() returns. After the handshake
/// a GET event stream is held open for server-pushed notifications when the server
/// announced them.
class HttpTransport: public Transport
{
  public:
    HttpTransport(HttpTransportConfig config, std::shared_ptr<http::HttpClient> client, TokenProvider tokens = {});
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    [[nodiscard]] auto kind() const -> TransportKind override { return TransportKind::Remote; }
    [[nodiscard]] auto start(TransportHandlers handlers) -> VoidResult override;
    [[nodiscard]] auto send(const nlohmann::json& message, std::chrono::milliseconds timeout)
        -> VoidResult override;
    void onInitialized(std::string_view protocolVersion, bool serverEvents) override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief Session id assigned by the server, empty before the handshake.
    [[nodiscard]] auto sessionId() const -> std::string;

    /// @brief Protected-resource metadata URL announced by the last 401/403, if any.
    [[nodiscard]] auto resourceMetadataHint() const -> std::optional<std::string>;

  private:
    [[nodiscard]] auto baseHeaders() const -> std::vector<std::pair<std::string, std::string>>;
    [[nodiscard]] auto deliverBody(const http::HttpResponse& response) -> VoidResult;
    void deliverText(std::string_view text);
    void eventStreamLoop();
    void lostConnection(std::string reason);

    HttpTransportConfig _config;
    std::shared_ptr<http::HttpClient> _client;
    TokenProvider _tokens;
    TransportHandlers _handlers;

    mutable std::mutex _mutex;
    std::string _sessionId;
    std::string _protocolVersion;
    std::optional<std::string> _resourceMetadataHint;

    std::atomic<bool> _connected = false;
    std::atomic<bool> _closing = false;
    std::thread _eventStream;
};

} // namespace mcpgate
