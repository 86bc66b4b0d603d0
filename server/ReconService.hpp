#pragma once

#include <cstdint>
#include <string>

#include "../common/Codec.hpp"
#include "../common/protocol.hpp"
#include "../recon/Cancellation.hpp"
#include "../recon/DeviceStore.hpp"
#include "../recon/ScanOrchestrator.hpp"
#include "../recon/Traceroute.hpp"

namespace net_recon::server
{
    using common::wire::ControlResponse;

    inline constexpr int DEFAULT_LIST_LIMIT = 50;
    inline constexpr int MAX_LIST_LIMIT = 1000;

    // Maps control requests onto the discovery core. Bodies are JSON; failures come back as
    // problem documents {type, title, status, detail}.
    class ReconService
    {
    private:
        recon::DeviceStore &store_;
        recon::ScanOrchestrator &scanner_;
        recon::TracerouteEngine &traceroute_;
        recon::CancelSource shutdown_;

    public:
        ReconService(recon::DeviceStore &store, recon::ScanOrchestrator &scanner, recon::TracerouteEngine &traceroute);

        ControlResponse Handle(protocol::MessageType type, const std::string &body);

        ControlResponse Heartbeat();
        ControlResponse StartScan(const std::string &body);
        ControlResponse ListScans(const std::string &body);
        ControlResponse GetScan(const std::string &body);
        ControlResponse Topology();
        ControlResponse Traceroute(const std::string &body);

        // Cancels in-flight traceroutes.
        void Shutdown();

        static ControlResponse Problem(std::uint32_t status, const std::string &title, const std::string &detail);
    };
}
