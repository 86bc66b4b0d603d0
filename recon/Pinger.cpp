#include "Pinger.hpp"
#include "IcmpSocket.hpp"

#include <algorithm>

namespace net_recon::recon
{
    namespace
    {
        constexpr uint16_t kPingSequence = 1;
        constexpr std::chrono::milliseconds kCancelPoll{100};
    }

    IcmpPinger::IcmpPinger(Platform platform) : m_platform(platform) {}

    PingResult IcmpPinger::Ping(const std::string &ip, std::chrono::milliseconds timeout, const CancelToken &cancel)
    {
        auto socket = IcmpSocket::Open(m_platform);

        PingResult result;
        auto start = std::chrono::steady_clock::now();
        auto deadline = start + timeout;

        if (!socket->SendEcho(ip, kPingSequence))
            return result;

        while (!cancel.IsCancelled())
        {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
                break;

            auto reply = socket->Receive(std::min(deadline, now + kCancelPoll));
            if (!reply || reply->kind != IcmpKind::EchoReply || !reply->has_echo)
                continue;
            if (reply->id != socket->Identifier() || reply->sequence != kPingSequence || reply->peer != ip)
                continue;

            result.reachable = true;
            result.rtt_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
            break;
        }
        return result;
    }
}
