#pragma once

#include "Cancellation.hpp"
#include "DeviceStore.hpp"
#include "EventBus.hpp"
#include "MdnsQuerier.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace net_recon::recon
{
    // Periodic multicast DNS browse of well-known service types; every answering host
    // becomes (or refreshes) a device.
    class MdnsListener
    {
    public:
        static const std::vector<std::string> &ServiceCatalog();

        // printer/ipp -> printer, media and home automation services -> iot, else unknown.
        static DeviceType InferDeviceType(const std::string &service);

        // A record address, else the responder address. Empty when neither is IPv4.
        static std::string ExtractIp(const MdnsServiceEntry &entry);

        // A null querier makes Run() idle until cancelled.
        MdnsListener(DeviceStore &store, EventBus &events, std::unique_ptr<MdnsQuerier> querier,
                     std::chrono::milliseconds interval = std::chrono::seconds(60),
                     std::chrono::milliseconds queryTimeout = std::chrono::seconds(3));

        // Blocks until cancelled: one sweep immediately, then one per interval.
        void Run(const CancelToken &cancel);

        // One pass over the catalog. Returns the number of devices upserted.
        int Sweep(const CancelToken &cancel);

        size_t TrackedAddressCount() const;

    private:
        int QueryService(const std::string &service, const CancelToken &cancel, bool &storeFailed);
        bool HandleEntry(const MdnsServiceEntry &entry, const std::string &service);

        // Atomically checks the seen cache and records `ip`; false when seen within the interval.
        bool MarkSeen(const std::string &ip);
        void CleanSeen();

        DeviceStore &m_store;
        EventBus &m_events;
        std::unique_ptr<MdnsQuerier> m_querier;
        std::chrono::milliseconds m_interval;
        std::chrono::milliseconds m_queryTimeout;

        mutable std::mutex m_seenMutex;
        std::map<std::string, std::chrono::steady_clock::time_point> m_seen;
    };
}
