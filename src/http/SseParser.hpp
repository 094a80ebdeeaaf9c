// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace mcpgate::http
{

/// @brief One dispatched server-sent event.
struct SseEvent
{
    std::string event = "message";
    std::string data;
    std::string id;
};

/// @brief Incremental text/event-stream parser.
///
/// Feed arbitrary chunks; complete events are returned as soon as their terminating
/// blank line arrives. Comment lines and unknown fields are ignored.
class SseParser
{
  public:
    [[nodiscard]] auto feed(std::string_view chunk) -> std::vector<SseEvent>;

    /// @brief Dispatches a trailing event that was not terminated by a blank line.
    [[nodiscard]] auto finish() -> std::vector<SseEvent>;

    /// @brief Last event id seen on the stream.
    [[nodiscard]] auto lastEventId() const -> const std::string& { return _lastEventId; }

  private:
    void processLine(std::string_view line, std::vector<SseEvent>& out);
    void dispatch(std::vector<SseEvent>& out);

    std::string _buffer;
    std::string _eventType;
    std::string _data;
    bool _hasData = false;
    std::string _lastEventId;
};

} // namespace mcpgate::http
