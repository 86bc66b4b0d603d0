#pragma once

#include "Cancellation.hpp"
#include "Platform.hpp"

#include <chrono>
#include <string>

namespace net_recon::recon
{
    struct PingResult
    {
        bool reachable = false;
        double rtt_ms = 0.0;
    };

    class Pinger
    {
    public:
        virtual ~Pinger() = default;

        // A host that does not answer is a normal result, not an error. Throws ProbeError
        // when no probing socket can be opened at all.
        virtual PingResult Ping(const std::string &ip, std::chrono::milliseconds timeout, const CancelToken &cancel) = 0;
    };

    // One ICMP echo per call over its own socket, so concurrent pings never share identifiers.
    class IcmpPinger : public Pinger
    {
    public:
        explicit IcmpPinger(Platform platform);

        PingResult Ping(const std::string &ip, std::chrono::milliseconds timeout, const CancelToken &cancel) override;

    private:
        Platform m_platform;
    };
}
