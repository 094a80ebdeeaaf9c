// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace mcpgate
{

/// @brief Closable multi-producer/multi-consumer queue.
///
/// pop() blocks until an item is available or the channel is closed and drained,
/// which makes a channel usable as a finite, lazily consumed sequence.
template <typename T>
class Channel
{
  public:
    /// @brief Enqueues an item.
    /// @return false if the channel is already closed (the item is dropped).
    auto push(T item) -> bool
    {
        {
            auto lock = std::lock_guard(_mutex);
            if (_closed)
                return false;
            _items.push_back(std::move(item));
        }
        _cv.notify_one();
        return true;
    }

    /// @brief Dequeues the next item, blocking while the channel is open and empty.
    /// @return The item, or std::nullopt once closed and drained.
    [[nodiscard]] auto pop() -> std::optional<T>
    {
        auto lock = std::unique_lock(_mutex);
        _cv.wait(lock, [this] { return !_items.empty() || _closed; });
        return takeFront();
    }

    /// @brief Like pop() but gives up after @p timeout.
    [[nodiscard]] auto popFor(std::chrono::milliseconds timeout) -> std::optional<T>
    {
        auto lock = std::unique_lock(_mutex);
        _cv.wait_for(lock, timeout, [this] { return !_items.empty() || _closed; });
        return takeFront();
    }

    /// @brief Closes the channel. Already queued items can still be popped.
    void close()
    {
        {
            auto lock = std::lock_guard(_mutex);
            _closed = true;
        }
        _cv.notify_all();
    }

    [[nodiscard]] auto isClosed() const -> bool
    {
        auto lock = std::lock_guard(_mutex);
        return _closed;
    }

    [[nodiscard]] auto size() const -> size_t
    {
        auto lock = std::lock_guard(_mutex);
        return _items.size();
    }

  private:
    auto takeFront() -> std::optional<T>
    {
        if (_items.empty())
            return std::nullopt;
        auto item = std::move(_items.front());
        _items.pop_front();
        return item;
    }

    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<T> _items;
    bool _closed = false;
};

} // namespace mcpgate
