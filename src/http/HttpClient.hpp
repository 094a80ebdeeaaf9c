// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mcpgate::http
{

/// @brief An outbound HTTP request.
struct HttpRequest
{
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    /// @brief Total transfer timeout; zero means unbounded (long-lived streams).
    std::chrono::milliseconds timeout { 30000 };

    /// @brief Polled during the transfer; returning true aborts it with ErrorCode::Cancelled.
    std::function<bool()> cancelled;
};

/// @brief A received HTTP response. Header names are lower-cased.
struct HttpResponse
{
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    /// @brief Returns a header value by lower-case name, or an empty string.
    [[nodiscard]] auto header(const std::string& name) const -> std::string
    {
        auto const it = headers.find(name);
        return it != headers.end() ? it->second : std::string {};
    }

    [[nodiscard]] auto isSuccess() const -> bool { return status >= 200 && status < 300; }
};

/// @brief Receives body bytes of a streamed 2xx response. Return false to stop the stream.
using ChunkHandler = std::function<bool(std::string_view chunk)>;

/// @brief Abstract HTTP client used by the remote transport and the authorization flow.
class HttpClient
{
  public:
    virtual ~HttpClient() = default;

    /// @brief Performs a request and buffers the whole response.
    /// @return The response (any status), or Timeout / Cancelled / TransportError.
    [[nodiscard]] virtual auto send(const HttpRequest& request) -> Result<HttpResponse> = 0;

    /// @brief Performs a request whose 2xx body is delivered incrementally to @p onChunk.
    ///
    /// Non-2xx bodies are buffered into the returned response instead.
    /// A stream ended by @p onChunk returning false counts as success.
    [[nodiscard]] virtual auto stream(const HttpRequest& request, const ChunkHandler& onChunk)
        -> Result<HttpResponse> = 0;
};

} // namespace mcpgate::http
