#include "event-queue.h"

#include <utility>

void EventQueue::post(Event ev) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.push_back(std::move(ev));
    }
    m_cv.notify_one();
}

bool EventQueue::dispatch(std::chrono::milliseconds timeout) {
    Event ev;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_cv.wait_for(lock, timeout, [this] { return !m_events.empty(); })) {
            return false;
        }
        ev = std::move(m_events.front());
        m_events.pop_front();
    }

    // Run outside the lock so the event may post
    ev();
    return true;
}

size_t EventQueue::dispatch_pending() {
    size_t n = 0;
    while (dispatch(std::chrono::milliseconds(0))) {
        n++;
    }
    return n;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.size();
}
