// SPDX-License-Identifier: Apache-2.0
#include "Url.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>

namespace mcpgate::http
{

namespace
{
    auto defaultPort(std::string_view scheme) -> uint16_t
    {
        return scheme == "https" ? 443 : 80;
    }

    auto hexValue(char c) -> int
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    }
} // namespace

auto Url::parse(std::string_view text) -> Result<Url>
{
    auto url = Url {};

    auto const schemeEnd = text.find("://");
    if (schemeEnd == std::string_view::npos || schemeEnd == 0)
        return makeError(ErrorCode::InvalidArgument, std::format("Not an absolute URL: '{}'", text));

    url.scheme = std::string(text.substr(0, schemeEnd));
    std::ranges::transform(url.scheme, url.scheme.begin(), [](unsigned char c) { return std::tolower(c); });
    if (url.scheme != "http" && url.scheme != "https")
        return makeError(ErrorCode::InvalidArgument, std::format("Unsupported URL scheme: '{}'", url.scheme));

    auto rest = text.substr(schemeEnd + 3);
    if (auto const fragment = rest.find('#'); fragment != std::string_view::npos)
        rest = rest.substr(0, fragment);

    auto const authorityEnd = rest.find_first_of("/?");
    auto authority = rest.substr(0, authorityEnd);
    rest = authorityEnd == std::string_view::npos ? std::string_view {} : rest.substr(authorityEnd);

    if (auto const at = authority.rfind('@'); at != std::string_view::npos)
        authority = authority.substr(at + 1);

    auto portText = std::string_view {};
    if (authority.starts_with('['))
    {
        auto const close = authority.find(']');
        if (close == std::string_view::npos)
            return makeError(ErrorCode::InvalidArgument, std::format("Malformed IPv6 host in '{}'", text));
        url.host = std::string(authority.substr(0, close + 1));
        if (close + 1 < authority.size() && authority[close + 1] == ':')
            portText = authority.substr(close + 2);
    }
    else
    {
        auto const colon = authority.rfind(':');
        url.host = std::string(authority.substr(0, colon));
        if (colon != std::string_view::npos)
            portText = authority.substr(colon + 1);
    }

    if (url.host.empty())
        return makeError(ErrorCode::InvalidArgument, std::format("URL without host: '{}'", text));

    if (!portText.empty())
    {
        auto port = uint16_t { 0 };
        auto const [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
        if (ec != std::errc() || ptr != portText.data() + portText.size())
            return makeError(ErrorCode::InvalidArgument, std::format("Invalid port in '{}'", text));
        url.port = port;
    }

    auto const queryStart = rest.find('?');
    url.path = std::string(rest.substr(0, queryStart));
    if (queryStart != std::string_view::npos)
        url.query = std::string(rest.substr(queryStart + 1));
    if (url.path.empty())
        url.path = "/";

    return url;
}

auto Url::origin() const -> std::string
{
    if (port && *port != defaultPort(scheme))
        return std::format("{}://{}:{}", scheme, host, *port);
    return std::format("{}://{}", scheme, host);
}

auto Url::toString() const -> std::string
{
    auto result = origin() + path;
    if (!query.empty())
        result += "?" + query;
    return result;
}

auto percentEncode(std::string_view text) -> std::string
{
    auto out = std::string {};
    out.reserve(text.size());
    for (unsigned char c: text)
    {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~')
            out.push_back(static_cast<char>(c));
        else
            out += std::format("%{:02X}", c);
    }
    return out;
}

auto percentDecode(std::string_view text) -> std::string
{
    auto out = std::string {};
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '+')
        {
            out.push_back(' ');
        }
        else if (text[i] == '%' && i + 2 < text.size() && hexValue(text[i + 1]) >= 0
                 && hexValue(text[i + 2]) >= 0)
        {
            out.push_back(static_cast<char>(hexValue(text[i + 1]) * 16 + hexValue(text[i + 2])));
            i += 2;
        }
        else
        {
            out.push_back(text[i]);
        }
    }
    return out;
}

auto encodeForm(const QueryParams& params) -> std::string
{
    auto out = std::string {};
    for (const auto& [key, value]: params)
    {
        if (!out.empty())
            out.push_back('&');
        out += percentEncode(key);
        out.push_back('=');
        out += percentEncode(value);
    }
    return out;
}

auto parseQuery(std::string_view query) -> std::map<std::string, std::string>
{
    auto result = std::map<std::string, std::string> {};
    while (!query.empty())
    {
        auto const amp = query.find('&');
        auto const pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view {} : query.substr(amp + 1);
        if (pair.empty())
            continue;

        auto const eq = pair.find('=');
        auto key = percentDecode(pair.substr(0, eq));
        auto value = eq == std::string_view::npos ? std::string {} : percentDecode(pair.substr(eq + 1));
        result[std::move(key)] = std::move(value);
    }
    return result;
}

auto appendQuery(std::string_view url, const QueryParams& params) -> std::string
{
    auto result = std::string(url);
    if (params.empty())
        return result;
    result.push_back(result.find('?') == std::string::npos ? '?' : '&');
    result += encodeForm(params);
    return result;
}

} // namespace mcpgate::http
