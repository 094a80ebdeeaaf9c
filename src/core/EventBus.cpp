// SPDX-License-Identifier: Apache-2.0
#include "EventBus.hpp"

#include <core/Log.hpp>

#include <exception>

namespace mcpgate
{

namespace
{
    template <typename... Ts>
    struct Overloaded: Ts...
    {
        using Ts::operator()...;
    };
} // namespace

auto eventName(const Event& event) -> std::string_view
{
    return std::visit(Overloaded {
                          [](const StatusChangedEvent&) { return std::string_view { "server-status-changed" }; },
                          [](const ServerErrorEvent&) { return std::string_view { "server-error" }; },
                          [](const ToolsUpdatedEvent&) { return std::string_view { "tools-updated" }; },
                          [](const AuthorizationRequiredEvent&) {
                              return std::string_view { "authorization-required" };
                          },
                          [](const AuthorizationStatusEvent&) {
                              return std::string_view { "authorization-status-changed" };
                          },
                          [](const ServerLogEvent&) { return std::string_view { "server-log" }; },
                          [](const CallCompletedEvent&) { return std::string_view { "call-completed" }; },
                      },
                      event);
}

auto eventToJson(const Event& event) -> nlohmann::json
{
    return std::visit(
        Overloaded {
            [](const StatusChangedEvent& e) {
                auto payload = nlohmann::json {
                    { "serverId", e.backendId },
                    { "status", connectionStatusToString(e.state.status) },
                };
                if (!e.state.reason.empty())
                    payload["error"] = e.state.reason;
                return payload;
            },
            [](const ServerErrorEvent& e) {
                return nlohmann::json { { "serverId", e.backendId }, { "error", e.message } };
            },
            [](const ToolsUpdatedEvent& e) {
                return nlohmann::json {
                    { "serverId", e.backendId },
                    { "serverName", e.backendName },
                    { "tools", e.toolNames },
                };
            },
            [](const AuthorizationRequiredEvent& e) { return nlohmann::json { { "serverId", e.backendId } }; },
            [](const AuthorizationStatusEvent& e) {
                auto payload = nlohmann::json {
                    { "serverId", e.backendId },
                    { "status", authStatusToString(e.status) },
                };
                if (!e.message.empty())
                    payload["message"] = e.message;
                return payload;
            },
            [](const ServerLogEvent& e) {
                return nlohmann::json {
                    { "serverId", e.backendId },
                    { "level", e.level },
                    { "message", e.message },
                };
            },
            [](const CallCompletedEvent& e) {
                auto payload = nlohmann::json {
                    { "serverId", e.backendId },
                    { "operation", e.operation },
                    { "durationMs", e.duration.count() },
                    { "success", e.success },
                };
                if (!e.error.empty())
                    payload["error"] = e.error;
                return payload;
            },
        },
        event);
}

EventBus::EventBus(): _dispatcher([this] { dispatchLoop(); })
{
}

EventBus::~EventBus()
{
    stop();
}

auto EventBus::subscribe(Handler handler) -> SubscriberId
{
    auto lock = std::lock_guard(_mutex);
    auto const id = _nextId++;
    _subscribers.emplace(id, std::move(handler));
    return id;
}

void EventBus::unsubscribe(SubscriberId id)
{
    auto lock = std::lock_guard(_mutex);
    _subscribers.erase(id);
}

void EventBus::publish(Event event)
{
    {
        auto lock = std::lock_guard(_mutex);
        ++_published;
    }

    if (!_queue.push(std::move(event)))
    {
        auto lock = std::lock_guard(_mutex);
        --_published;
    }
}

void EventBus::flush()
{
    auto lock = std::unique_lock(_mutex);
    _drained.wait(lock, [this] { return _delivered >= _published || _stopped; });
}

void EventBus::stop()
{
    _queue.close();
    if (_dispatcher.joinable() && _dispatcher.get_id() != std::this_thread::get_id())
        _dispatcher.join();

    {
        auto lock = std::lock_guard(_mutex);
        _stopped = true;
    }
    _drained.notify_all();
}

void EventBus::dispatchLoop()
{
    while (auto event = _queue.pop())
    {
        auto handlers = std::vector<Handler> {};
        {
            auto lock = std::lock_guard(_mutex);
            handlers.reserve(_subscribers.size());
            for (const auto& [id, handler]: _subscribers)
                handlers.push_back(handler);
        }

        for (const auto& handler: handlers)
        {
            try
            {
                handler(*event);
            }
            catch (const std::exception& e)
            {
                log::warning("Event subscriber failed on '{}': {}", eventName(*event), e.what());
            }
        }

        {
            auto lock = std::lock_guard(_mutex);
            ++_delivered;
        }
        _drained.notify_all();
    }
}

} // namespace mcpgate
