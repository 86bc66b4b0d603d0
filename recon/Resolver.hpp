#pragma once

#include "Cancellation.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace net_recon::recon
{
    class Resolver
    {
    public:
        virtual ~Resolver() = default;

        // Numeric addresses (any family) for `name`. Throws PreconditionError when the
        // lookup fails and OperationCancelled when `cancel` fires first.
        virtual std::vector<std::string> LookupHost(const std::string &name, const CancelToken &cancel) = 0;

        // PTR name without the trailing dot; nullopt on failure or timeout.
        virtual std::optional<std::string> ReverseLookup(const std::string &ip, std::chrono::milliseconds timeout) = 0;
    };

    // getaddrinfo/getnameinfo run on a detached helper thread so callers can stop waiting.
    class SystemResolver : public Resolver
    {
    public:
        explicit SystemResolver(std::chrono::milliseconds lookupTimeout = std::chrono::seconds(10));

        std::vector<std::string> LookupHost(const std::string &name, const CancelToken &cancel) override;
        std::optional<std::string> ReverseLookup(const std::string &ip, std::chrono::milliseconds timeout) override;

    private:
        std::chrono::milliseconds m_lookupTimeout;
    };
}
