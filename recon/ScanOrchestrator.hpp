#pragma once

#include "ArpReader.hpp"
#include "Cancellation.hpp"
#include "DeviceStore.hpp"
#include "EventBus.hpp"
#include "LocalInterface.hpp"
#include "OuiLookup.hpp"
#include "Pinger.hpp"
#include "Subnet.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace net_recon::recon
{
    struct ScanOptions
    {
        size_t max_concurrency = 64;
        std::chrono::milliseconds ping_timeout{1000};
        uint64_t max_hosts = 1024;
        int progress_interval = 16;
        // Scans allowed in flight at once. Each one holds up to max_concurrency probe sockets.
        size_t max_active_scans = 1;
    };

    // Ping sweep of a subnet correlated with the ARP cache. Each Run() is executed on its own
    // background thread; the returned ScanResult is the `running` record.
    class ScanOrchestrator
    {
    public:
        ScanOrchestrator(DeviceStore &store, EventBus &events, Pinger &pinger, ArpReader &arp,
                         const OuiLookup &oui, InterfaceProvider &interfaces, ScanOptions options = {});
        ~ScanOrchestrator();

        ScanOrchestrator(const ScanOrchestrator &) = delete;
        ScanOrchestrator &operator=(const ScanOrchestrator &) = delete;

        // Throws PreconditionError for a malformed or oversized CIDR, ResourceBusyError while
        // max_active_scans scans are running and StoreError when the scan record cannot be
        // created. Nothing is started in any of these cases.
        ScanResult Run(const std::string &cidr, const CancelToken &cancel = CancelToken());

        // Waits for every started scan to finish.
        void Drain();

        // Cancels running scans, then drains.
        void Shutdown();

        const ScanOptions &Options() const { return m_options; }

    private:
        struct Job
        {
            std::thread thread;
            std::shared_ptr<std::atomic<bool>> done;
        };

        void Execute(ScanResult scan, const Subnet &subnet, const CancelToken &cancel);
        void Sweep(ScanResult &scan, const Subnet &subnet, const CancelToken &cancel);
        ArpTable ReadNeighbours(const Subnet &subnet);
        Device RegisterSelf(const ScanResult &scan, const LocalInterface &local, bool reachable);
        void MarkLost(const Subnet &subnet, const std::set<std::string> &seen);
        void Finalize(ScanResult &scan, ScanStatus status, const std::string &error);
        void ReapFinished();

        DeviceStore &m_store;
        EventBus &m_events;
        Pinger &m_pinger;
        ArpReader &m_arp;
        const OuiLookup &m_oui;
        InterfaceProvider &m_interfaces;
        ScanOptions m_options;

        CancelSource m_shutdown;
        std::mutex m_jobsMutex;
        std::vector<Job> m_jobs;
        size_t m_activeScans = 0;
    };
}
