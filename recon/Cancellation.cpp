#include "Cancellation.hpp"

#include <algorithm>

namespace net_recon::recon
{
    namespace
    {
        void Trigger(const std::shared_ptr<detail::CancelState>& state)
        {
            std::vector<std::weak_ptr<detail::CancelState>> children;
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                if (state->cancelled)
                    return;
                state->cancelled = true;
                children.swap(state->children);
            }
            state->cv.notify_all();

            for (const auto& weak : children)
            {
                if (auto child = weak.lock())
                    Trigger(child);
            }
        }
    }

    CancelToken::CancelToken() : m_state(std::make_shared<detail::CancelState>()) {}

    CancelToken::CancelToken(std::shared_ptr<detail::CancelState> state) : m_state(std::move(state)) {}

    bool CancelToken::IsCancelled() const
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->cancelled;
    }

    bool CancelToken::WaitFor(std::chrono::milliseconds timeout) const
    {
        return WaitUntil(std::chrono::steady_clock::now() + timeout);
    }

    bool CancelToken::WaitUntil(std::chrono::steady_clock::time_point deadline) const
    {
        std::unique_lock<std::mutex> lock(m_state->mutex);
        return m_state->cv.wait_until(lock, deadline, [this] { return m_state->cancelled; });
    }

    void CancelToken::Wait() const
    {
        std::unique_lock<std::mutex> lock(m_state->mutex);
        m_state->cv.wait(lock, [this] { return m_state->cancelled; });
    }

    CancelSource::CancelSource() : m_state(std::make_shared<detail::CancelState>()) {}

    CancelSource::CancelSource(const CancelToken &parent) : m_state(std::make_shared<detail::CancelState>())
    {
        Follow(parent);
    }

    void CancelSource::Follow(const CancelToken &other)
    {
        bool cancelNow = false;
        {
            std::lock_guard<std::mutex> lock(other.m_state->mutex);
            if (other.m_state->cancelled)
            {
                cancelNow = true;
            }
            else
            {
                auto &children = other.m_state->children;
                children.erase(std::remove_if(children.begin(), children.end(),
                                              [](const auto &weak) { return weak.expired(); }),
                               children.end());
                children.push_back(m_state);
            }
        }

        if (cancelNow)
            Trigger(m_state);
    }

    CancelToken CancelSource::Token() const
    {
        return CancelToken(m_state);
    }

    void CancelSource::Cancel()
    {
        Trigger(m_state);
    }

    bool CancelSource::IsCancelled() const
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->cancelled;
    }
}
