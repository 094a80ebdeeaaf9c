// SPDX-License-Identifier: Apache-2.0
#include "LoopbackCallbackServer.hpp"

#include <core/Log.hpp>
#include <http/Url.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <condition_variable>
#include <format>
#include <mutex>
#include <optional>
#include <thread>

namespace mcpgate::oauth
{

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace
{
    constexpr auto CallbackPath = std::string_view { "/oauth/callback" };

    constexpr auto CompletionPage = std::string_view {
        R"(<!DOCTYPE html>
<html>
<head><title>mcpgate</title></head>
<body style="font-family: system-ui, sans-serif; display: flex; justify-content: center; align-items: center; min-height: 100vh; margin: 0;">
<div style="text-align: center;">
<h1 style="font-size: 1.5rem; margin-bottom: 0.5rem;">Authorization Complete</h1>
<p>You can close this tab and return to your MCP client.</p>
</div>
</body>
</html>)"
    };

    struct Session
    {
        explicit Session(tcp::socket socket): stream(std::move(socket)) {}

        beast::tcp_stream stream;
        beast::flat_buffer buffer;
        bhttp::request<bhttp::string_body> request;
        bhttp::response<bhttp::string_body> response;
    };

    auto interpretCallback(std::string_view query) -> Result<CallbackResult>
    {
        auto params = http::parseQuery(query);

        if (auto const error = params.find("error"); error != params.end())
        {
            auto const description = params.contains("error_description") ? params["error_description"] : "";
            return makeError(ErrorCode::AuthorizationFailed,
                             std::format("Authorization denied: {} {}", error->second, description));
        }

        auto const code = params.find("code");
        auto const state = params.find("state");
        if (code == params.end() || state == params.end())
            return makeError(ErrorCode::AuthorizationFailed, "Missing code or state in OAuth callback");

        return CallbackResult { .code = code->second, .state = state->second };
    }
} // namespace

struct LoopbackCallbackServer::Impl
{
    asio::io_context ioc;
    tcp::acceptor acceptor { ioc };
    std::thread thread;
    unsigned short port = 0;

    std::mutex mutex;
    std::condition_variable cv;
    std::optional<Result<CallbackResult>> result;

    void accept();
    void respond(std::shared_ptr<Session> session);
};

void LoopbackCallbackServer::Impl::accept()
{
    acceptor.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec)
            return; // acceptor closed

        auto session = std::make_shared<Session>(std::move(socket));
        session->stream.expires_after(std::chrono::seconds(10));
        bhttp::async_read(session->stream,
                          session->buffer,
                          session->request,
                          [this, session](beast::error_code readEc, std::size_t) {
                              if (readEc)
                              {
                                  log::debug("OAuth callback: read failed: {}", readEc.message());
                                  return;
                              }
                              respond(session);
                          });
        accept();
    });
}

void LoopbackCallbackServer::Impl::respond(std::shared_ptr<Session> session)
{
    auto const target = std::string_view(session->request.target().data(), session->request.target().size());
    auto const queryStart = target.find('?');
    auto const path = target.substr(0, queryStart);
    auto const query = queryStart == std::string_view::npos ? std::string_view {} : target.substr(queryStart + 1);

    auto& res = session->response;
    res.version(session->request.version());
    res.keep_alive(false);

    if (path != CallbackPath)
    {
        res.result(bhttp::status::not_found);
        res.set(bhttp::field::content_type, "text/plain");
        res.body() = "Not found";
    }
    else
    {
        auto outcome = interpretCallback(query);
        {
            auto lock = std::lock_guard(mutex);
            if (!result)
                result = std::move(outcome);
        }
        cv.notify_all();

        res.result(bhttp::status::ok);
        res.set(bhttp::field::content_type, "text/html; charset=utf-8");
        res.body() = std::string(CompletionPage);
    }
    res.prepare_payload();

    bhttp::async_write(session->stream, res, [session](beast::error_code ec, std::size_t) {
        session->stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    });
}

LoopbackCallbackServer::LoopbackCallbackServer(): _impl(std::make_unique<Impl>())
{
}

LoopbackCallbackServer::~LoopbackCallbackServer()
{
    stop();
}

auto LoopbackCallbackServer::listen() -> Result<std::string>
{
    auto ec = beast::error_code {};
    auto const endpoint = tcp::endpoint { asio::ip::make_address("127.0.0.1"), 0 };

    _impl->acceptor.open(endpoint.protocol(), ec);
    if (!ec)
        _impl->acceptor.bind(endpoint, ec);
    if (!ec)
        _impl->acceptor.listen(asio::socket_base::max_listen_connections, ec);
    if (ec)
        return makeError(ErrorCode::AuthorizationFailed,
                         std::format("Failed to bind callback server: {}", ec.message()));

    _impl->port = _impl->acceptor.local_endpoint(ec).port();
    if (ec)
        return makeError(ErrorCode::AuthorizationFailed,
                         std::format("Failed to get callback server address: {}", ec.message()));

    _impl->accept();
    _impl->thread = std::thread([impl = _impl.get()] { impl->ioc.run(); });

    auto redirectUri = std::format("http://127.0.0.1:{}{}", _impl->port, CallbackPath);
    log::info("OAuth callback server listening on {}", redirectUri);
    return redirectUri;
}

auto LoopbackCallbackServer::wait(std::chrono::milliseconds timeout, const std::function<bool()>& cancelled)
    -> Result<CallbackResult>
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    auto lock = std::unique_lock(_impl->mutex);
    while (!_impl->result)
    {
        if (cancelled && cancelled())
            return makeError(ErrorCode::Cancelled, "Authorization cancelled");
        if (std::chrono::steady_clock::now() >= deadline)
            return makeError(ErrorCode::Timeout,
                             std::format("OAuth callback timed out, no response received within {}s",
                                         std::chrono::duration_cast<std::chrono::seconds>(timeout).count()));
        _impl->cv.wait_for(lock, std::chrono::milliseconds(100));
    }
    return *_impl->result;
}

void LoopbackCallbackServer::stop()
{
    _impl->ioc.stop();
    if (_impl->thread.joinable())
        _impl->thread.join();

    auto ec = beast::error_code {};
    if (_impl->acceptor.is_open())
        _impl->acceptor.close(ec);
}

auto LoopbackCallbackServer::port() const -> unsigned short
{
    return _impl->port;
}

} // namespace mcpgate::oauth
