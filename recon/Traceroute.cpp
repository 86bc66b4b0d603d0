#include "Traceroute.hpp"
#include "Subnet.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <future>
#include <iostream>
#include <vector>

namespace net_recon::recon
{
    namespace
    {
        constexpr int kMinHops = 1;
        constexpr int kMaxHops = 64;
        constexpr std::chrono::milliseconds kMinTimeout{100};
        constexpr std::chrono::milliseconds kMaxTimeout{10000};
        constexpr std::chrono::milliseconds kCancelPoll{100};

        double ElapsedMs(std::chrono::steady_clock::time_point since)
        {
            return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
        }

        bool IsIpv6Literal(const std::string &text)
        {
            in6_addr addr{};
            return inet_pton(AF_INET6, text.c_str(), &addr) == 1;
        }
    }

    int ClampMaxHops(int maxHops, int fallback)
    {
        if (maxHops <= 0)
            maxHops = fallback;
        return std::clamp(maxHops, kMinHops, kMaxHops);
    }

    std::chrono::milliseconds ClampHopTimeout(std::chrono::milliseconds timeout, std::chrono::milliseconds fallback)
    {
        if (timeout.count() <= 0)
            timeout = fallback;
        return std::clamp(timeout, kMinTimeout, kMaxTimeout);
    }

    TracerouteEngine::TracerouteEngine(Platform platform, std::shared_ptr<Resolver> resolver, TracerouteOptions defaults)
        : TracerouteEngine([platform]() -> std::unique_ptr<IcmpTransport> { return IcmpSocket::Open(platform); },
                           std::move(resolver), defaults)
    {
    }

    TracerouteEngine::TracerouteEngine(TransportFactory factory, std::shared_ptr<Resolver> resolver, TracerouteOptions defaults)
        : m_factory(std::move(factory)), m_resolver(std::move(resolver)), m_defaults(defaults)
    {
    }

    std::string TracerouteEngine::ResolveTarget(const std::string &target, const CancelToken &cancel)
    {
        if (ParseIpv4(target))
            return target;
        if (IsIpv6Literal(target))
            throw PreconditionError("target " + target + " is not an IPv4 address");
        if (!m_resolver)
            throw PreconditionError("cannot resolve " + target + ": no resolver configured");

        for (const auto &address : m_resolver->LookupHost(target, cancel))
        {
            if (ParseIpv4(address))
                return address;
        }
        throw PreconditionError("target " + target + " has no IPv4 address");
    }

    TracerouteResult TracerouteEngine::Run(const std::string &target, int maxHops, std::chrono::milliseconds hopTimeout,
                                           const CancelToken &cancel)
    {
        std::unique_lock<std::mutex> flight(m_inFlight, std::try_to_lock);
        if (!flight.owns_lock())
            throw ResourceBusyError("a traceroute is already in progress");

        if (target.empty())
            throw PreconditionError("traceroute target is empty");

        int hops = ClampMaxHops(maxHops, m_defaults.max_hops);
        auto timeout = ClampHopTimeout(hopTimeout, m_defaults.hop_timeout);
        std::string address = ResolveTarget(target, cancel);

        std::unique_ptr<IcmpTransport> transport = m_factory();

        TracerouteResult result;
        result.target = target;
        result.address = address;
        auto start = std::chrono::steady_clock::now();

        std::cout << "[Traceroute] Tracing " << target << " (" << address << "), max " << hops << " hops\n";

        for (int ttl = 1; ttl <= hops; ++ttl)
        {
            bool reached = false;
            std::optional<TracerouteHop> hop;
            if (!cancel.IsCancelled())
                hop = ProbeHop(*transport, address, ttl, timeout, cancel, reached);

            if (!hop)
            {
                result.total_hops = static_cast<int>(result.hops.size());
                result.duration_ms = ElapsedMs(start);
                std::cout << "[Traceroute] Cancelled after " << result.total_hops << " hops\n";
                throw TracerouteCancelled(std::move(result));
            }

            result.hops.push_back(*hop);
            if (reached)
            {
                result.reached = true;
                break;
            }
        }

        result.total_hops = static_cast<int>(result.hops.size());
        result.duration_ms = ElapsedMs(start);

        ResolveHostnames(result);

        std::cout << "[Traceroute] " << target << ": " << result.total_hops << " hops, "
                  << (result.reached ? "reached" : "not reached") << "\n";
        return result;
    }

    std::optional<TracerouteHop> TracerouteEngine::ProbeHop(IcmpTransport &transport, const std::string &address, int ttl,
                                                            std::chrono::milliseconds timeout, const CancelToken &cancel,
                                                            bool &reached)
    {
        TracerouteHop hop;
        hop.hop = ttl;

        auto sequence = static_cast<uint16_t>(ttl);
        if (!transport.SetTtl(ttl) || !transport.SendEcho(address, sequence))
        {
            std::cerr << "[Traceroute] Probe with TTL " << ttl << " could not be sent\n";
            hop.timeout = true;
            return hop;
        }

        auto sent = std::chrono::steady_clock::now();
        auto deadline = sent + timeout;

        while (true)
        {
            if (cancel.IsCancelled())
                return std::nullopt;

            auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
            {
                hop.timeout = true;
                return hop;
            }

            auto reply = transport.Receive(std::min(deadline, now + kCancelPoll));
            if (!reply || !reply->has_echo)
                continue;
            if (reply->id != transport.Identifier() || reply->sequence != sequence)
                continue;

            switch (reply->kind)
            {
            case IcmpKind::EchoReply:
                reached = true;
                break;
            case IcmpKind::TimeExceeded:
                break;
            case IcmpKind::DestUnreachable:
                reached = (reply->peer == address);
                break;
            case IcmpKind::Other:
                continue;
            }

            hop.ip = reply->peer;
            hop.rtt_ms = ElapsedMs(sent);
            return hop;
        }
    }

    void TracerouteEngine::ResolveHostnames(TracerouteResult &result)
    {
        if (!m_resolver)
            return;

        std::vector<std::pair<size_t, std::future<std::optional<std::string>>>> lookups;
        for (size_t i = 0; i < result.hops.size(); ++i)
        {
            if (result.hops[i].timeout || result.hops[i].ip.empty())
                continue;

            auto resolver = m_resolver;
            auto ip = result.hops[i].ip;
            auto timeout = m_defaults.reverse_lookup_timeout;
            lookups.emplace_back(i, std::async(std::launch::async, [resolver, ip, timeout] {
                                     return resolver->ReverseLookup(ip, timeout);
                                 }));
        }

        for (auto &[index, lookup] : lookups)
        {
            try
            {
                if (auto name = lookup.get())
                    result.hops[index].hostname = *name;
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Traceroute] Reverse lookup of " << result.hops[index].ip << " failed: " << e.what() << "\n";
            }
        }
    }
}
