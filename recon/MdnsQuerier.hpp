#pragma once

#include "Cancellation.hpp"
#include "Platform.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace net_recon::recon
{
    struct MdnsServiceEntry
    {
        std::string name;    // service instance name
        std::string host;    // target host, may end with '.'
        std::string addr_v4; // resolved A record, may be empty
        std::string addr;    // address the response came from
        uint16_t port = 0;
        std::vector<std::string> info_fields;
    };

    using MdnsEntrySink = std::function<void(MdnsServiceEntry entry)>;

    class MdnsQuerier
    {
    public:
        virtual ~MdnsQuerier() = default;

        // Browses `service` (e.g. "_http._tcp") for up to `timeout`, handing each instance to
        // `sink` as it is decoded. Throws std::runtime_error when the query cannot be sent.
        virtual void Query(const std::string &service, std::chrono::milliseconds timeout,
                           const MdnsEntrySink &sink, const CancelToken &cancel) = 0;
    };

    // One-shot multicast PTR query to 224.0.0.251:5353 from an ephemeral port; responses
    // are decoded with libtins.
    class MulticastDnsQuerier : public MdnsQuerier
    {
    public:
        void Query(const std::string &service, std::chrono::milliseconds timeout,
                   const MdnsEntrySink &sink, const CancelToken &cancel) override;
    };

    // nullptr where multicast DNS browsing is unavailable (Windows).
    std::unique_ptr<MdnsQuerier> MakeMdnsQuerier(Platform platform);
}
