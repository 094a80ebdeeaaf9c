// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Channel.hpp>
#include <core/Types.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

namespace mcpgate
{

/// @brief A backend's connection state changed.
struct StatusChangedEvent
{
    std::string backendId;
    ConnectionState state;
};

/// @brief A backend reported an error outside of a status transition.
struct ServerErrorEvent
{
    std::string backendId;
    std::string message;
};

/// @brief A backend's catalog slice was replaced.
struct ToolsUpdatedEvent
{
    std::string backendId;
    std::string backendName;
    std::vector<std::string> toolNames;
};

/// @brief A backend needs interactive authorization before it can connect.
struct AuthorizationRequiredEvent
{
    std::string backendId;
};

/// @brief A backend's authorization flow moved to a new state.
struct AuthorizationStatusEvent
{
    std::string backendId;
    AuthStatus status = AuthStatus::None;
    std::string message;
};

/// @brief A log line produced by a backend (stderr or notifications/message).
struct ServerLogEvent
{
    std::string backendId;
    std::string level;
    std::string message;
};

/// @brief A dispatched tool call finished, successfully or not.
struct CallCompletedEvent
{
    std::string backendId;
    std::string operation;
    std::chrono::milliseconds duration {};
    bool success = false;
    std::string error;
};

using Event = std::variant<StatusChangedEvent,
                           ServerErrorEvent,
                           ToolsUpdatedEvent,
                           AuthorizationRequiredEvent,
                           AuthorizationStatusEvent,
                           ServerLogEvent,
                           CallCompletedEvent>;

/// @brief Returns the wire name of an event, e.g. "server-status-changed".
[[nodiscard]] auto eventName(const Event& event) -> std::string_view;

/// @brief Serializes an event payload for external consumers.
[[nodiscard]] auto eventToJson(const Event& event) -> nlohmann::json;

/// @brief Asynchronous publish/subscribe hub for gateway events.
///
/// publish() only enqueues; subscribers run on a dedicated dispatcher thread,
/// so a slow or failing subscriber never blocks the publisher.
class EventBus
{
  public:
    using SubscriberId = uint64_t;
    using Handler = std::function<void(const Event&)>;

    EventBus();
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /// @brief Registers a subscriber that receives every event published afterwards.
    [[nodiscard]] auto subscribe(Handler handler) -> SubscriberId;

    void unsubscribe(SubscriberId id);

    /// @brief Enqueues an event for delivery. Never blocks on subscribers.
    void publish(Event event);

    /// @brief Blocks until every event published so far has been delivered.
    void flush();

    /// @brief Delivers remaining events and stops the dispatcher thread.
    void stop();

  private:
    void dispatchLoop();

    Channel<Event> _queue;
    std::mutex _mutex;
    std::condition_variable _drained;
    std::map<SubscriberId, Handler> _subscribers;
    SubscriberId _nextId = 1;
    uint64_t _published = 0;
    uint64_t _delivered = 0;
    bool _stopped = false;
    std::thread _dispatcher;
};

} // namespace mcpgate
