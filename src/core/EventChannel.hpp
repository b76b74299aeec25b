// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace voicetutor
{

/// @brief Multi-producer, single-consumer FIFO of events.
///
/// Device callbacks and background tasks post events; one conversation thread
/// drains them in order. Once closed, posts are ignored and waiting consumers wake up.
template <typename Event>
class EventChannel
{
  public:
    EventChannel() = default;

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    /// @brief Appends an event. Returns false if the channel is closed.
    auto post(Event event) -> bool
    {
        {
            auto lock = std::lock_guard(_mutex);
            if (_closed)
                return false;
            _queue.push_back(std::move(event));
        }
        _cv.notify_one();
        return true;
    }

    /// @brief Blocks until an event is available, the channel is closed, or a stop is requested.
    /// @return The next event, or std::nullopt when closed or stopped with nothing queued.
    [[nodiscard]] auto waitPop(const std::stop_token& stopToken) -> std::optional<Event>
    {
        auto lock = std::unique_lock(_mutex);
        _cv.wait(lock, stopToken, [this] { return !_queue.empty() || _closed; });
        if (_queue.empty())
            return std::nullopt;

        auto event = std::move(_queue.front());
        _queue.pop_front();
        return event;
    }

    /// @brief Waits at most @p timeout for an event.
    template <typename Rep, typename Period>
    [[nodiscard]] auto waitPopFor(const std::stop_token& stopToken, std::chrono::duration<Rep, Period> timeout)
        -> std::optional<Event>
    {
        auto lock = std::unique_lock(_mutex);
        _cv.wait_for(lock, stopToken, timeout, [this] { return !_queue.empty() || _closed; });
        if (_queue.empty())
            return std::nullopt;

        auto event = std::move(_queue.front());
        _queue.pop_front();
        return event;
    }

    /// @brief Returns the next event without blocking.
    [[nodiscard]] auto tryPop() -> std::optional<Event>
    {
        auto lock = std::lock_guard(_mutex);
        if (_queue.empty())
            return std::nullopt;

        auto event = std::move(_queue.front());
        _queue.pop_front();
        return event;
    }

    /// @brief Closes the channel and drops any queued events.
    void close()
    {
        {
            auto lock = std::lock_guard(_mutex);
            _closed = true;
            _queue.clear();
        }
        _cv.notify_all();
    }

    /// @brief Reopens a closed channel.
    void reopen()
    {
        auto lock = std::lock_guard(_mutex);
        _closed = false;
    }

    [[nodiscard]] auto size() const -> std::size_t
    {
        auto lock = std::lock_guard(_mutex);
        return _queue.size();
    }

    [[nodiscard]] auto isClosed() const -> bool
    {
        auto lock = std::lock_guard(_mutex);
        return _closed;
    }

  private:
    mutable std::mutex _mutex;
    std::condition_variable_any _cv;
    std::deque<Event> _queue;
    bool _closed = false;
};

} // namespace voicetutor
