#include "Resolver.hpp"
#include "Errors.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace net_recon::recon
{
    namespace
    {
        // Shared with a detached worker, which may outlive the caller's wait.
        template <typename T>
        struct PendingLookup
        {
            std::mutex mutex;
            std::condition_variable cv;
            bool done = false;
            T value{};
            std::string error;

            void Finish(T result, std::string failure)
            {
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    value = std::move(result);
                    error = std::move(failure);
                    done = true;
                }
                cv.notify_all();
            }

            bool WaitFor(std::chrono::milliseconds timeout)
            {
                std::unique_lock<std::mutex> lock(mutex);
                return cv.wait_for(lock, timeout, [this] { return done; });
            }
        };

        std::string FormatSockaddr(const sockaddr *addr, socklen_t len)
        {
            char host[NI_MAXHOST] = {0};
            if (getnameinfo(addr, len, host, sizeof(host), nullptr, 0, NI_NUMERICHOST) != 0)
                return "";
            return host;
        }
    }

    SystemResolver::SystemResolver(std::chrono::milliseconds lookupTimeout) : m_lookupTimeout(lookupTimeout) {}

    std::vector<std::string> SystemResolver::LookupHost(const std::string &name, const CancelToken &cancel)
    {
        auto pending = std::make_shared<PendingLookup<std::vector<std::string>>>();

        std::thread([pending, name] {
            addrinfo hints{};
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_DGRAM;

            addrinfo *result = nullptr;
            int rc = getaddrinfo(name.c_str(), nullptr, &hints, &result);
            if (rc != 0)
            {
                pending->Finish({}, gai_strerror(rc));
                return;
            }

            std::vector<std::string> addresses;
            for (addrinfo *ai = result; ai != nullptr; ai = ai->ai_next)
            {
                std::string text = FormatSockaddr(ai->ai_addr, ai->ai_addrlen);
                if (!text.empty())
                    addresses.push_back(text);
            }
            freeaddrinfo(result);
            pending->Finish(std::move(addresses), "");
        }).detach();

        auto deadline = std::chrono::steady_clock::now() + m_lookupTimeout;
        while (!pending->WaitFor(std::chrono::milliseconds(100)))
        {
            if (cancel.IsCancelled())
                throw OperationCancelled();
            if (std::chrono::steady_clock::now() >= deadline)
                throw PreconditionError("resolve " + name + ": lookup timed out");
        }

        std::lock_guard<std::mutex> lock(pending->mutex);
        if (!pending->error.empty())
            throw PreconditionError("resolve " + name + ": " + pending->error);
        if (pending->value.empty())
            throw PreconditionError("resolve " + name + ": no addresses");
        return pending->value;
    }

    std::optional<std::string> SystemResolver::ReverseLookup(const std::string &ip, std::chrono::milliseconds timeout)
    {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1)
            return std::nullopt;

        auto pending = std::make_shared<PendingLookup<std::string>>();
        std::thread([pending, addr] {
            char host[NI_MAXHOST] = {0};
            int rc = getnameinfo(reinterpret_cast<const sockaddr *>(&addr), sizeof(addr),
                                 host, sizeof(host), nullptr, 0, NI_NAMEREQD);
            if (rc != 0)
                pending->Finish("", gai_strerror(rc));
            else
                pending->Finish(host, "");
        }).detach();

        if (!pending->WaitFor(timeout))
            return std::nullopt;

        std::lock_guard<std::mutex> lock(pending->mutex);
        if (!pending->error.empty() || pending->value.empty())
            return std::nullopt;

        std::string name = pending->value;
        if (name.back() == '.')
            name.pop_back();
        if (name.empty())
            return std::nullopt;
        return name;
    }
}
