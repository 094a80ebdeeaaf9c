// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <http/HttpClient.hpp>

namespace mcpgate::http
{

/// @brief HttpClient backed by the libcurl easy API. One easy handle per request.
class CurlHttpClient: public HttpClient
{
  public:
    CurlHttpClient();

    [[nodiscard]] auto send(const HttpRequest& request) -> Result<HttpResponse> override;
    [[nodiscard]] auto stream(const HttpRequest& request, const ChunkHandler& onChunk)
        -> Result<HttpResponse> override;

  private:
    [[nodiscard]] auto perform(const HttpRequest& request, const ChunkHandler* onChunk) -> Result<HttpResponse>;
};

} // namespace mcpgate::http
