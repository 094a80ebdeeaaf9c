// SPDX-License-Identifier: Apache-2.0
#include "CurlHttpClient.hpp"

#include <core/Log.hpp>

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <format>
#include <mutex>

namespace mcpgate::http
{

namespace
{
    auto toLower(std::string_view s) -> std::string
    {
        auto out = std::string {};
        out.reserve(s.size());
        for (unsigned char c: s)
            out.push_back(static_cast<char>(std::tolower(c)));
        return out;
    }

    auto trim(std::string_view s) -> std::string_view
    {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
            s.remove_prefix(1);
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
            s.remove_suffix(1);
        return s;
    }

    struct TransferContext
    {
        HttpResponse response;
        const HttpRequest* request = nullptr;
        const ChunkHandler* onChunk = nullptr;
        CURL* curl = nullptr;
        bool cancelled = false;
        bool stoppedByHandler = false;
    };

    auto headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) -> size_t
    {
        auto const total = size * nitems;
        auto* ctx = static_cast<TransferContext*>(userdata);
        auto const line = trim(std::string_view(buffer, total));

        // A new status line starts a fresh header block (redirects, 100-continue).
        if (line.starts_with("HTTP/"))
        {
            ctx->response.headers.clear();
            return total;
        }

        auto const colon = line.find(':');
        if (colon == std::string_view::npos)
            return total;

        ctx->response.headers[toLower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
        return total;
    }

    auto writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t
    {
        auto const total = size * nmemb;
        auto* ctx = static_cast<TransferContext*>(userdata);

        if (ctx->request->cancelled && ctx->request->cancelled())
        {
            ctx->cancelled = true;
            return 0; // CURLE_WRITE_ERROR
        }

        if (ctx->onChunk)
        {
            auto status = long { 0 };
            curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
            if (status >= 200 && status < 300)
            {
                if (!(*ctx->onChunk)(std::string_view(ptr, total)))
                {
                    ctx->stoppedByHandler = true;
                    return 0;
                }
                return total;
            }
        }

        ctx->response.body.append(ptr, total);
        return total;
    }

    auto progressCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int
    {
        auto* ctx = static_cast<TransferContext*>(userdata);
        if (ctx->request->cancelled && ctx->request->cancelled())
        {
            ctx->cancelled = true;
            return 1; // CURLE_ABORTED_BY_CALLBACK
        }
        return 0;
    }

    auto makeCurlError(CURLcode code, std::string_view url) -> std::unexpected<Error>
    {
        auto const message = std::format("{}: {}", url, curl_easy_strerror(code));
        switch (code)
        {
            case CURLE_OPERATION_TIMEDOUT: return makeError(ErrorCode::Timeout, message);
            case CURLE_ABORTED_BY_CALLBACK: return makeError(ErrorCode::Cancelled, message);
            case CURLE_URL_MALFORMAT:
            case CURLE_UNSUPPORTED_PROTOCOL: return makeError(ErrorCode::InvalidArgument, message);
            default: return makeError(ErrorCode::TransportError, message);
        }
    }

    void globalInitOnce()
    {
        static std::once_flag flag;
        std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }
} // namespace

CurlHttpClient::CurlHttpClient()
{
    globalInitOnce();
}

auto CurlHttpClient::send(const HttpRequest& request) -> Result<HttpResponse>
{
    return perform(request, nullptr);
}

auto CurlHttpClient::stream(const HttpRequest& request, const ChunkHandler& onChunk) -> Result<HttpResponse>
{
    return perform(request, &onChunk);
}

auto CurlHttpClient::perform(const HttpRequest& request, const ChunkHandler* onChunk) -> Result<HttpResponse>
{
    auto* curl = curl_easy_init();
    if (!curl)
        return makeError(ErrorCode::TransportError, "curl_easy_init failed");

    curl_slist* headerList = nullptr;
    for (const auto& [name, value]: request.headers)
        headerList = curl_slist_append(headerList, std::format("{}: {}", name, value).c_str());
    // Suppress libcurl's automatic "Expect: 100-continue" on larger bodies.
    headerList = curl_slist_append(headerList, "Expect:");

    auto ctx = TransferContext {};
    ctx.request = &request;
    ctx.onChunk = onChunk;
    ctx.curl = curl;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    if (request.method == "GET")
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    if (!request.body.empty() || request.method == "POST")
    {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

    if (request.timeout.count() > 0)
    {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(std::min<long>(request.timeout.count(), 30000)));
    }
    else
    {
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 30000L);
    }

    log::trace("HTTP {} {}", request.method, request.url);
    auto const rc = curl_easy_perform(curl);

    auto status = long { 0 };
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    ctx.response.status = static_cast<int>(status);

    curl_slist_free_all(headerList);
    curl_easy_cleanup(curl);

    if (ctx.cancelled)
        return makeError(ErrorCode::Cancelled, std::format("{}: request cancelled", request.url));
    if (rc != CURLE_OK && !(rc == CURLE_WRITE_ERROR && ctx.stoppedByHandler))
        return makeCurlError(rc, request.url);

    log::trace("HTTP {} {} -> {}", request.method, request.url, ctx.response.status);
    return std::move(ctx.response);
}

} // namespace mcpgate::http
