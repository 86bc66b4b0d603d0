#pragma once

#include "Cancellation.hpp"
#include "Errors.hpp"
#include "IcmpSocket.hpp"
#include "Models.hpp"
#include "Platform.hpp"
#include "Resolver.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace net_recon::recon
{
    struct TracerouteOptions
    {
        int max_hops = 30;
        std::chrono::milliseconds hop_timeout{1000};
        std::chrono::milliseconds reverse_lookup_timeout{500};
    };

    // Thrown when a run is cancelled; carries the hops collected so far.
    class TracerouteCancelled : public OperationCancelled
    {
    public:
        explicit TracerouteCancelled(TracerouteResult partial)
            : OperationCancelled("traceroute cancelled"), m_partial(std::move(partial)) {}

        const TracerouteResult &Partial() const { return m_partial; }

    private:
        TracerouteResult m_partial;
    };

    // Non-positive values select the default; the rest is clamped to 1..64 hops and 100..10000 ms.
    int ClampMaxHops(int maxHops, int fallback = 30);
    std::chrono::milliseconds ClampHopTimeout(std::chrono::milliseconds timeout,
                                              std::chrono::milliseconds fallback = std::chrono::milliseconds(1000));

    // ICMP echo traceroute. One run at a time: a second concurrent Run throws ResourceBusyError.
    class TracerouteEngine
    {
    public:
        using TransportFactory = std::function<std::unique_ptr<IcmpTransport>()>;

        TracerouteEngine(Platform platform, std::shared_ptr<Resolver> resolver, TracerouteOptions defaults = {});
        TracerouteEngine(TransportFactory factory, std::shared_ptr<Resolver> resolver, TracerouteOptions defaults = {});

        TracerouteResult Run(const std::string &target, int maxHops, std::chrono::milliseconds hopTimeout,
                             const CancelToken &cancel = CancelToken());

        const TracerouteOptions &Defaults() const { return m_defaults; }

    private:
        std::string ResolveTarget(const std::string &target, const CancelToken &cancel);

        // nullopt when cancelled before the hop settled.
        std::optional<TracerouteHop> ProbeHop(IcmpTransport &transport, const std::string &address, int ttl,
                                              std::chrono::milliseconds timeout, const CancelToken &cancel,
                                              bool &reached);

        void ResolveHostnames(TracerouteResult &result);

        TransportFactory m_factory;
        std::shared_ptr<Resolver> m_resolver;
        TracerouteOptions m_defaults;
        std::mutex m_inFlight;
    };
}
