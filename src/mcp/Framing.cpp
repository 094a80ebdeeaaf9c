// SPDX-License-Identifier: Apache-2.0
#include "Framing.hpp"

#include <core/JsonUtils.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>

namespace mcpgate::framing
{

namespace
{
    constexpr auto ContentLengthHeader = std::string_view { "content-length:" };

    auto startsWithIgnoreCase(std::string_view text, std::string_view prefix) -> bool
    {
        if (text.size() < prefix.size())
            return false;
        return std::equal(prefix.begin(), prefix.end(), text.begin(), [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
        });
    }

    auto trim(std::string_view s) -> std::string_view
    {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
            s.remove_prefix(1);
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
            s.remove_suffix(1);
        return s;
    }
} // namespace

auto encode(const nlohmann::json& message, FramingMode mode) -> std::string
{
    auto const body = message.dump();
    if (mode == FramingMode::ContentLength)
        return std::format("Content-Length: {}\r\n\r\n{}", body.size(), body);
    return body + "\n";
}

void FrameDecoder::feed(std::string_view bytes)
{
    _buffer.append(bytes);
}

auto FrameDecoder::next() -> std::optional<Result<nlohmann::json>>
{
    // Skip blank separators between messages.
    auto const first = _buffer.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
    {
        _buffer.clear();
        return std::nullopt;
    }
    if (first > 0)
        _buffer.erase(0, first);

    if (startsWithIgnoreCase(_buffer, ContentLengthHeader))
        return nextContentLength();

    // A partial header prefix must not be mistaken for a JSON line.
    if (_buffer.size() < ContentLengthHeader.size()
        && startsWithIgnoreCase(ContentLengthHeader, _buffer))
        return std::nullopt;

    return nextLine();
}

auto FrameDecoder::nextContentLength() -> std::optional<Result<nlohmann::json>>
{
    auto headerEnd = _buffer.find("\r\n\r\n");
    auto separatorSize = size_t { 4 };
    if (headerEnd == std::string::npos)
    {
        headerEnd = _buffer.find("\n\n");
        separatorSize = 2;
    }
    if (headerEnd == std::string::npos)
        return std::nullopt;

    auto length = std::optional<size_t> {};
    auto headers = std::string_view(_buffer).substr(0, headerEnd);
    while (!headers.empty())
    {
        auto const eol = headers.find('\n');
        auto const line = trim(headers.substr(0, eol));
        headers = eol == std::string_view::npos ? std::string_view {} : headers.substr(eol + 1);

        if (!startsWithIgnoreCase(line, ContentLengthHeader))
            continue; // Content-Type and friends are ignored.

        auto const value = trim(line.substr(ContentLengthHeader.size()));
        auto parsed = size_t { 0 };
        auto const [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
        if (ec != std::errc() || ptr != value.data() + value.size())
        {
            _buffer.erase(0, headerEnd + separatorSize);
            return makeError(ErrorCode::ProtocolError, std::format("Invalid Content-Length: '{}'", value));
        }
        length = parsed;
    }

    if (!length || *length > MaxFrameSize)
    {
        _buffer.erase(0, headerEnd + separatorSize);
        return makeError(ErrorCode::ProtocolError, "Missing or oversized Content-Length header");
    }

    auto const bodyStart = headerEnd + separatorSize;
    if (_buffer.size() < bodyStart + *length)
        return std::nullopt;

    auto body = _buffer.substr(bodyStart, *length);
    _buffer.erase(0, bodyStart + *length);
    return json::parse(body);
}

auto FrameDecoder::nextLine() -> std::optional<Result<nlohmann::json>>
{
    auto const newlinePos = _buffer.find('\n');
    if (newlinePos == std::string::npos)
        return std::nullopt;

    auto line = _buffer.substr(0, newlinePos);
    _buffer.erase(0, newlinePos + 1);
    if (!line.empty() && line.back() == '\r')
        line.pop_back();

    return json::parse(line);
}

} // namespace mcpgate::framing
