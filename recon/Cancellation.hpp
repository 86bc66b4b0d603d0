#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace net_recon::recon
{
    namespace detail
    {
        struct CancelState
        {
            std::mutex mutex;
            std::condition_variable cv;
            bool cancelled = false;
            std::vector<std::weak_ptr<CancelState>> children;
        };
    }

    // Read side of a cancellation signal. Copies share state with their CancelSource.
    // A default-constructed token is never cancelled.
    class CancelToken
    {
    public:
        CancelToken();

        bool IsCancelled() const;

        // Sleeps up to `timeout`; returns true as soon as the token is cancelled.
        bool WaitFor(std::chrono::milliseconds timeout) const;
        bool WaitUntil(std::chrono::steady_clock::time_point deadline) const;

        // Blocks until cancelled.
        void Wait() const;

    private:
        friend class CancelSource;
        explicit CancelToken(std::shared_ptr<detail::CancelState> state);

        std::shared_ptr<detail::CancelState> m_state;
    };

    // Write side. A source created from a parent token is cancelled together with it.
    class CancelSource
    {
    public:
        CancelSource();
        explicit CancelSource(const CancelToken& parent);

        CancelToken Token() const;

        // Also cancel this source when `other` is cancelled.
        void Follow(const CancelToken &other);

        void Cancel();
        bool IsCancelled() const;

    private:
        std::shared_ptr<detail::CancelState> m_state;
    };
}
