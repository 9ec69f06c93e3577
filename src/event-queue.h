#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>

// FIFO of events run on a single consumer thread. Any thread may post.
class EventQueue {
public:
    using Event = std::function<void()>;

    EventQueue() = default;

    EventQueue(const EventQueue &) = delete;
    EventQueue & operator=(const EventQueue &) = delete;

    void post(Event ev);

    // Run the oldest event, waiting up to timeout for one to arrive.
    // Returns false if nothing ran.
    bool dispatch(std::chrono::milliseconds timeout);

    // Run every event already queued (and those they post)
    size_t dispatch_pending();

    size_t size() const;

private:
    mutable std::mutex      m_mutex;
    std::condition_variable m_cv;
    std::deque<Event>       m_events;
};
