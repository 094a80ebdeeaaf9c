// SPDX-License-Identifier: Apache-2.0
#include "ProxyServer.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <http/Url.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/Protocol.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <format>
#include <thread>

namespace mcpgate::server
{

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace
{
    constexpr auto ServersPrefix = std::string_view { "/servers/" };
    constexpr auto IdleTimeout = std::chrono::seconds(60);

    enum class Surface : std::uint8_t
    {
        Aggregate,
        Discovery,
        Direct,
    };

    auto isInitializeRequest(const nlohmann::json& message) -> bool
    {
        return jsonrpc::classify(message) == jsonrpc::MessageKind::Request
               && message["method"].get<std::string>() == protocol::methods::Initialize;
    }

    auto toString(beast::string_view text) -> std::string
    {
        return std::string(text.data(), text.size());
    }

    auto jsonReply(unsigned status, const nlohmann::json& body) -> Reply
    {
        return Reply { .status = status, .contentType = "application/json", .body = body.dump() };
    }

    auto adminStatusFor(ErrorCode code) -> unsigned
    {
        switch (code)
        {
            case ErrorCode::NotFound: return 404;
            case ErrorCode::InvalidArgument: return 400;
            case ErrorCode::Cancelled: return 409;
            case ErrorCode::Unauthorized:
            case ErrorCode::AuthorizationFailed:
            case ErrorCode::Timeout:
            case ErrorCode::TransportClosed:
            case ErrorCode::TransportError:
            case ErrorCode::ProtocolError:
            case ErrorCode::RemoteError: return 502;
            default: return 500;
        }
    }

    auto adminErrorReply(const Error& error) -> Reply
    {
        return jsonReply(adminStatusFor(error.code),
                         { { "error", { { "code", errorCodeName(error.code) }, { "message", error.message } } } });
    }

    /// One keep-alive HTTP connection. Requests are handled on the worker pool.
    class Connection: public std::enable_shared_from_this<Connection>
    {
      public:
        Connection(tcp::socket socket, ProxyServer& server, asio::thread_pool& workers):
            _stream(std::move(socket)), _server(server), _workers(workers)
        {
        }

        void start() { read(); }

      private:
        void read()
        {
            _request = {};
            _stream.expires_after(IdleTimeout);
            bhttp::async_read(_stream, _buffer, _request, [self = shared_from_this()](beast::error_code ec, size_t) {
                if (ec)
                {
                    if (ec != bhttp::error::end_of_stream)
                        log::debug("Proxy: read failed: {}", ec.message());
                    self->shutdown();
                    return;
                }
                self->process();
            });
        }

        void process()
        {
            auto ec = beast::error_code {};
            auto const peer = _stream.socket().remote_endpoint(ec);
            auto request = ProxyRequest {
                .method = toString(_request.method_string()),
                .target = toString(_request.target()),
                .origin = toString(_request[bhttp::field::origin]),
                .accept = toString(_request[bhttp::field::accept]),
                .body = std::move(_request.body()),
                .loopbackPeer = !ec && peer.address().is_loopback(),
            };

            // Tool calls block; keep them off the I/O thread.
            asio::post(_workers, [self = shared_from_this(), request = std::move(request)] {
                auto reply = self->_server.handle(request);
                asio::post(self->_stream.get_executor(), [self, reply = std::move(reply)]() mutable {
                    self->write(std::move(reply));
                });
            });
        }

        void write(Reply reply)
        {
            _response = {};
            _response.version(_request.version());
            _response.result(static_cast<bhttp::status>(reply.status));
            _response.keep_alive(_request.keep_alive());
            _response.set(bhttp::field::server, std::string(protocol::ImplementationName));
            _response.set(bhttp::field::access_control_allow_origin, "*");
            _response.set(bhttp::field::access_control_allow_methods, "POST, GET, OPTIONS");
            _response.set(bhttp::field::access_control_allow_headers,
                          "Content-Type, Accept, Authorization, Mcp-Session-Id, MCP-Protocol-Version");
            _response.set(bhttp::field::access_control_expose_headers, "Mcp-Session-Id");
            if (reply.status == 405)
                _response.set(bhttp::field::allow, "POST, OPTIONS");
            if (!reply.contentType.empty())
                _response.set(bhttp::field::content_type, reply.contentType);
            if (reply.contentType == "text/event-stream")
                _response.set(bhttp::field::cache_control, "no-cache");
            if (reply.sessionId)
                _response.set("Mcp-Session-Id", *reply.sessionId);
            _response.body() = std::move(reply.body);
            _response.prepare_payload();

            bhttp::async_write(_stream, _response, [self = shared_from_this()](beast::error_code ec, size_t) {
                if (ec)
                {
                    log::debug("Proxy: write failed: {}", ec.message());
                    return;
                }
                if (!self->_response.keep_alive())
                {
                    self->shutdown();
                    return;
                }
                self->read();
            });
        }

        void shutdown()
        {
            auto ec = beast::error_code {};
            _stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        }

        beast::tcp_stream _stream;
        beast::flat_buffer _buffer;
        bhttp::request<bhttp::string_body> _request;
        bhttp::response<bhttp::string_body> _response;
        ProxyServer& _server;
        asio::thread_pool& _workers;
    };
} // namespace

struct ProxyServer::Impl
{
    Impl(ProxyServer& server, size_t workerThreads): owner(server), workers(workerThreads) {}

    ProxyServer& owner;
    asio::io_context ioc;
    tcp::acceptor acceptor { ioc };
    asio::thread_pool workers;
    std::thread thread;
    unsigned short port = 0;
    std::atomic<bool> running = false;
    bool stopped = false;

    void accept()
    {
        acceptor.async_accept([this](beast::error_code ec, tcp::socket socket) {
            if (ec)
            {
                if (ec != asio::error::operation_aborted)
                    log::warning("Proxy: accept failed: {}", ec.message());
                if (!acceptor.is_open())
                    return;
            }
            else
            {
                std::make_shared<Connection>(std::move(socket), owner, workers)->start();
            }
            accept();
        });
    }
};

ProxyServer::ProxyServer(RequestRouter& router, ProxyServerOptions options):
    _router(router), _options(std::move(options)), _impl(std::make_unique<Impl>(*this, _options.workerThreads))
{
}

ProxyServer::~ProxyServer()
{
    stop();
}

auto ProxyServer::start() -> Result<unsigned short>
{
    if (_impl->running)
        return _impl->port;
    if (_impl->stopped)
        return makeError(ErrorCode::InvalidArgument, "Proxy server cannot be restarted");

    auto ec = beast::error_code {};
    auto const address = asio::ip::make_address(_options.host, ec);
    if (ec)
        return makeError(ErrorCode::ConfigError,
                         std::format("Invalid bind address '{}': {}", _options.host, ec.message()));

    auto const endpoint = tcp::endpoint { address, _options.port };
    _impl->acceptor.open(endpoint.protocol(), ec);
    if (!ec)
        _impl->acceptor.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec)
        _impl->acceptor.bind(endpoint, ec);
    if (!ec)
        _impl->acceptor.listen(asio::socket_base::max_listen_connections, ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to bind {}:{}: {}", _options.host, _options.port, ec.message()));

    _impl->port = _impl->acceptor.local_endpoint(ec).port();
    if (ec)
        return makeError(ErrorCode::IoError, std::format("Failed to get bound address: {}", ec.message()));

    _impl->accept();
    _impl->thread = std::thread([impl = _impl.get()] { impl->ioc.run(); });
    _impl->running = true;

    log::info("MCP proxy listening on http://{}:{}/mcp", _options.host, _impl->port);
    return _impl->port;
}

void ProxyServer::stop()
{
    if (_impl->stopped)
        return;
    _impl->stopped = true;
    _impl->running = false;

    _impl->ioc.stop();
    if (_impl->thread.joinable())
        _impl->thread.join();

    auto ec = beast::error_code {};
    if (_impl->acceptor.is_open())
        _impl->acceptor.close(ec);

    _impl->workers.join();
}

auto ProxyServer::port() const -> unsigned short
{
    return _impl->port;
}

auto ProxyServer::isRunning() const -> bool
{
    return _impl->running;
}

auto ProxyServer::isAdminPath(std::string_view path) -> bool
{
    if (!path.starts_with(ServersPrefix))
        return false;
    auto const slash = path.find('/', ServersPrefix.size());
    return slash != std::string_view::npos && slash > ServersPrefix.size() && slash + 1 < path.size()
           && path.find('/', slash + 1) == std::string_view::npos;
}

auto ProxyServer::handleAdmin(const ProxyRequest& request, std::string_view path) -> Reply
{
    if (!request.loopbackPeer)
    {
        log::warning("Proxy: rejected admin request {} from a non-loopback client", path);
        return textReply(403, "Admin routes are only served to loopback clients");
    }
    if (request.method == "OPTIONS")
        return Reply { .status = 204 };

    if (path == "/servers")
    {
        if (request.method != "GET")
            return textReply(405, "Method not allowed");
        return jsonReply(200, { { "servers", _router.backendsStatus() } });
    }

    if (request.method != "POST")
        return textReply(405, "Method not allowed");

    auto const slash = path.find('/', ServersPrefix.size());
    auto const backendId = http::percentDecode(path.substr(ServersPrefix.size(), slash - ServersPrefix.size()));
    auto const actionName = path.substr(slash + 1);
    auto const action = adminActionFromString(actionName);
    if (!action)
        return textReply(404, std::format("Unknown admin action: {}", actionName));

    log::info("Proxy: {} requested for backend '{}'", actionName, backendId);
    auto result = _router.administer(backendId, *action);
    if (!result)
    {
        log::warning("Proxy: {} of '{}' failed: {}", actionName, backendId, result.error());
        return adminErrorReply(result.error());
    }
    return jsonReply(200, *result);
}

auto ProxyServer::handle(const ProxyRequest& request) -> Reply
{
    if (!isOriginAllowed(request.origin))
    {
        log::warning("Proxy: rejected request from origin {}", request.origin);
        return textReply(403, std::format("Origin not allowed: {}", request.origin));
    }

    auto const path = std::string_view(request.target).substr(0, request.target.find('?'));
    if (path == "/servers" || isAdminPath(path))
        return handleAdmin(request, path);

    auto surface = Surface::Aggregate;
    auto backendId = std::string {};
    if (path == "/mcp")
        surface = Surface::Aggregate;
    else if (path == "/discovery")
        surface = Surface::Discovery;
    else if (path.starts_with(ServersPrefix) && path.size() > ServersPrefix.size()
             && path.find('/', ServersPrefix.size()) == std::string_view::npos)
    {
        surface = Surface::Direct;
        backendId = http::percentDecode(path.substr(ServersPrefix.size()));
    }
    else
        return textReply(404, "Not found");

    if (request.method == "OPTIONS")
        return Reply { .status = 204 };
    if (request.method != "POST")
        return textReply(405, "Method not allowed");

    auto document = json::parse(request.body);
    if (!document)
        return jsonReply(400,
                         jsonrpc::makeErrorResponse(nullptr,
                                                    jsonrpc::codes::ParseError,
                                                    std::format("Parse error: {}", document.error().message)));

    auto const route = [&](const nlohmann::json& message) -> std::optional<nlohmann::json> {
        switch (surface)
        {
            case Surface::Aggregate: return _router.handleAggregate(message);
            case Surface::Discovery: return _router.handleDiscovery(message);
            case Surface::Direct: return _router.handleDirect(backendId, message);
        }
        return std::nullopt;
    };

    auto const sse = acceptsSse(request.accept);
    auto sessionId = std::optional<std::string> {};

    if (document->is_array())
    {
        if (document->empty())
            return jsonReply(400,
                             jsonrpc::makeErrorResponse(nullptr, jsonrpc::codes::InvalidRequest, "Empty batch"));

        auto responses = nlohmann::json::array();
        for (const auto& message: *document)
        {
            if (isInitializeRequest(message) && !sessionId)
                sessionId = newSessionId();
            if (auto response = route(message))
                responses.push_back(std::move(*response));
        }
        if (responses.empty())
            return Reply { .status = 202 };
        return messageReply(responses, sse, std::move(sessionId));
    }

    auto response = route(*document);
    if (!response)
        return Reply { .status = 202 };

    if (isInitializeRequest(*document) && response->contains("result"))
        sessionId = newSessionId();
    return messageReply(*response, sse, std::move(sessionId));
}

} // namespace mcpgate::server
