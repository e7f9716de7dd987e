#ifndef MOP_EVENT_QUEUE_HPP
#define MOP_EVENT_QUEUE_HPP

#include <deque>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>
#include <stdexcept>

namespace discovery
{

/// Bounded FIFO between the discovery thread and the consumer.
/// push blocks while the queue is full, nothing is ever dropped.
template<typename T>
class event_queue
{
public:

    event_queue(const event_queue&) = delete;
    event_queue& operator=(const event_queue&) = delete;
    event_queue(event_queue&&) = delete;
    event_queue& operator=(event_queue&&) = delete;

    explicit event_queue(size_t capacity)
        : m_capacity {capacity}
    {
        if(m_capacity == 0)
            throw std::invalid_argument {"Event queue capacity must not be zero"};
    }

    void push(T event)
    {
        std::unique_lock<std::mutex> lock {m_mutex};
        m_not_full.wait(lock, [this] { return m_events.size() < m_capacity; });
        m_events.push_back(std::move(event));
        lock.unlock();
        m_not_empty.notify_one();
    }

    T pop()
    {
        std::unique_lock<std::mutex> lock {m_mutex};
        m_not_empty.wait(lock, [this] { return !m_events.empty(); });
        return take(lock);
    }

    std::optional<T> try_pop()
    {
        std::unique_lock<std::mutex> lock {m_mutex};
        if(m_events.empty())
            return std::nullopt;
        return take(lock);
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lock {m_mutex};
        if(!m_not_empty.wait_for(lock, timeout, [this] { return !m_events.empty(); }))
            return std::nullopt;
        return take(lock);
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        return m_events.size();
    }

    size_t capacity() const
    {
        return m_capacity;
    }

private:

    T take(std::unique_lock<std::mutex>& lock)
    {
        T event = std::move(m_events.front());
        m_events.pop_front();
        lock.unlock();
        m_not_full.notify_one();
        return event;
    }

    const size_t m_capacity;

    std::deque<T> m_events;

    mutable std::mutex m_mutex;

    std::condition_variable m_not_empty;

    std::condition_variable m_not_full;

};

} // namespace discovery

#endif
