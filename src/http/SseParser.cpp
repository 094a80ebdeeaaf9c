// SPDX-License-Identifier: Apache-2.0
#include "SseParser.hpp"

namespace mcpgate::http
{

auto SseParser::feed(std::string_view chunk) -> std::vector<SseEvent>
{
    auto events = std::vector<SseEvent> {};
    _buffer.append(chunk);

    auto pos = size_t { 0 };
    while ((pos = _buffer.find('\n')) != std::string::npos)
    {
        auto line = std::string_view(_buffer).substr(0, pos);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        processLine(line, events);
        _buffer.erase(0, pos + 1);
    }

    return events;
}

auto SseParser::finish() -> std::vector<SseEvent>
{
    auto events = std::vector<SseEvent> {};
    if (!_buffer.empty())
    {
        auto line = std::string(std::move(_buffer));
        _buffer.clear();
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        processLine(line, events);
    }
    dispatch(events);
    return events;
}

void SseParser::processLine(std::string_view line, std::vector<SseEvent>& out)
{
    if (line.empty())
    {
        dispatch(out);
        return;
    }

    if (line.front() == ':')
        return; // comment / keep-alive

    auto const colon = line.find(':');
    auto const field = line.substr(0, colon);
    auto value = colon == std::string_view::npos ? std::string_view {} : line.substr(colon + 1);
    if (!value.empty() && value.front() == ' ')
        value.remove_prefix(1);

    if (field == "data")
    {
        if (_hasData)
            _data.push_back('\n');
        _data.append(value);
        _hasData = true;
    }
    else if (field == "event")
    {
        _eventType = std::string(value);
    }
    else if (field == "id")
    {
        _lastEventId = std::string(value);
    }
}

void SseParser::dispatch(std::vector<SseEvent>& out)
{
    if (_hasData)
    {
        out.push_back(SseEvent {
            .event = _eventType.empty() ? std::string("message") : _eventType,
            .data = std::move(_data),
            .id = _lastEventId,
        });
    }
    _data.clear();
    _eventType.clear();
    _hasData = false;
}

} // namespace mcpgate::http
