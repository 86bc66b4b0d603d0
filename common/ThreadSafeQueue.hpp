#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace net_recon::common
{
    // Multi-producer, multi-consumer FIFO. A non-zero capacity makes Push() block while the
    // queue is full. After Close() producers are refused and consumers drain what is left;
    // Pop() then returns nullopt.
    template <typename T>
    class ThreadSafeQueue
    {
    private:
        std::deque<T> m_items;
        std::size_t m_capacity;
        bool m_closed = false;

        mutable std::mutex m_mutex;
        std::condition_variable m_not_empty;
        std::condition_variable m_not_full;

    public:
        explicit ThreadSafeQueue(std::size_t capacity = 0) : m_capacity(capacity) {}

        ThreadSafeQueue(const ThreadSafeQueue &) = delete;
        ThreadSafeQueue &operator=(const ThreadSafeQueue &) = delete;

        // False once the queue is closed; the value is dropped.
        bool Push(T value)
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_not_full.wait(lock, [this]
                            { return m_closed || m_capacity == 0 || m_items.size() < m_capacity; });
            if (m_closed)
                return false;

            m_items.push_back(std::move(value));
            lock.unlock();
            m_not_empty.notify_one();
            return true;
        }

        std::optional<T> Pop()
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_not_empty.wait(lock, [this]
                             { return !m_items.empty() || m_closed; });
            if (m_items.empty())
                return std::nullopt;

            T value = std::move(m_items.front());
            m_items.pop_front();
            lock.unlock();
            m_not_full.notify_one();
            return value;
        }

        void Close()
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_closed = true;
            }
            m_not_empty.notify_all();
            m_not_full.notify_all();
        }

        std::size_t Size() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_items.size();
        }
    };
}
