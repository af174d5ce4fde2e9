#pragma once
#include "events.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

/// @brief Inbound channel of the event loop. Workers push, the UI thread drains.
class EventQueue
{
public:
    void push(Event ev)
    {
        {
            std::scoped_lock lk(_mtx);
            _queue.push_back(std::move(ev));
        }
        _cv.notify_one();
    }

    std::optional<Event> pop()
    {
        std::scoped_lock lk(_mtx);
        if (_queue.empty()) return std::nullopt;
        auto ev = std::move(_queue.front());
        _queue.pop_front();
        return ev;
    }

    // Waits up to `d` for an event.
    std::optional<Event> popFor(std::chrono::milliseconds d)
    {
        std::unique_lock<std::mutex> lk(_mtx);
        if (!_cv.wait_for(lk, d, [&] { return !_queue.empty(); }))
            return std::nullopt;
        auto ev = std::move(_queue.front());
        _queue.pop_front();
        return ev;
    }

    size_t size() const
    {
        std::scoped_lock lk(_mtx);
        return _queue.size();
    }

private:
    mutable std::mutex _mtx;
    std::condition_variable _cv;
    std::deque<Event> _queue;
};
