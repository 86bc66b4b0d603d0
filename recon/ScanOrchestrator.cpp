#include "ScanOrchestrator.hpp"
#include "Errors.hpp"
#include "HierarchyInferrer.hpp"
#include "../common/ThreadSafeQueue.hpp"

#include <unistd.h>

#include <algorithm>
#include <climits>
#include <iostream>
#include <map>
#include <system_error>

namespace net_recon::recon
{
    namespace
    {
        const std::string kCancelledMessage = "scan cancelled";

        std::string LocalHostname()
        {
            char name[HOST_NAME_MAX + 1] = {0};
            if (gethostname(name, sizeof(name)) != 0)
                return "";
            return name;
        }
    }

    ScanOrchestrator::ScanOrchestrator(DeviceStore &store, EventBus &events, Pinger &pinger, ArpReader &arp,
                                       const OuiLookup &oui, InterfaceProvider &interfaces, ScanOptions options)
        : m_store(store), m_events(events), m_pinger(pinger), m_arp(arp), m_oui(oui),
          m_interfaces(interfaces), m_options(options)
    {
        if (m_options.max_concurrency == 0)
            m_options.max_concurrency = 1;
        if (m_options.progress_interval <= 0)
            m_options.progress_interval = 1;
        if (m_options.max_active_scans == 0)
            m_options.max_active_scans = 1;
    }

    ScanOrchestrator::~ScanOrchestrator()
    {
        Shutdown();
    }

    ScanResult ScanOrchestrator::Run(const std::string &cidr, const CancelToken &cancel)
    {
        Subnet subnet = Subnet::Parse(cidr);
        uint64_t hosts = subnet.HostCount();
        if (hosts > m_options.max_hosts)
        {
            throw PreconditionError("subnet " + subnet.ToString() + " has " + std::to_string(hosts) +
                                    " hosts, the limit is " + std::to_string(m_options.max_hosts));
        }
        if (m_shutdown.IsCancelled())
            throw PreconditionError("scanner is shutting down");

        std::lock_guard<std::mutex> lock(m_jobsMutex);
        ReapFinished();
        if (m_activeScans >= m_options.max_active_scans)
            throw ResourceBusyError("a scan is already running");

        ScanResult scan;
        scan.subnet = subnet.ToString();
        scan.status = ScanStatus::Running;
        m_store.CreateScan(scan);
        m_events.Publish(MakeScanEvent(topics::ScanStarted, scan));

        std::cout << "[Scan] " << scan.id << " started on " << scan.subnet << " (" << hosts << " hosts)\n";

        auto source = std::make_shared<CancelSource>(cancel);
        source->Follow(m_shutdown.Token());
        auto done = std::make_shared<std::atomic<bool>>(false);

        std::thread thread;
        try
        {
            thread = std::thread([this, scan, subnet, source, done]() {
                Execute(scan, subnet, source->Token());
                {
                    std::lock_guard<std::mutex> lock(m_jobsMutex);
                    --m_activeScans;
                }
                done->store(true);
            });
        }
        catch (const std::system_error &e)
        {
            Finalize(scan, ScanStatus::Failed, e.what());
            throw;
        }
        ++m_activeScans;
        m_jobs.push_back({std::move(thread), done});
        return scan;
    }

    void ScanOrchestrator::Execute(ScanResult scan, const Subnet &subnet, const CancelToken &cancel)
    {
        try
        {
            Sweep(scan, subnet, cancel);
        }
        catch (const OperationCancelled &)
        {
            Finalize(scan, ScanStatus::Failed, kCancelledMessage);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Scan] " << scan.id << " failed: " << e.what() << "\n";
            Finalize(scan, ScanStatus::Failed, e.what());
        }
    }

    void ScanOrchestrator::Sweep(ScanResult &scan, const Subnet &subnet, const CancelToken &cancel)
    {
        size_t workerCount = std::min<size_t>(m_options.max_concurrency, static_cast<size_t>(subnet.HostCount()));
        common::ThreadSafeQueue<std::string> queue(workerCount * 2);

        // Stops the remaining workers when probing turns out to be impossible.
        CancelSource abort(cancel);

        std::mutex mutex;
        std::map<std::string, PingResult> reachable;
        std::string probeFailure;

        auto worker = [&]() {
            while (auto ip = queue.Pop())
            {
                if (abort.IsCancelled())
                {
                    queue.Close();
                    break;
                }

                PingResult result;
                try
                {
                    result = m_pinger.Ping(*ip, m_options.ping_timeout, abort.Token());
                }
                catch (const std::exception &e)
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    if (probeFailure.empty())
                        probeFailure = e.what();
                    abort.Cancel();
                    queue.Close();
                    break;
                }

                if (abort.IsCancelled())
                {
                    queue.Close();
                    break;
                }

                std::lock_guard<std::mutex> lock(mutex);
                ++scan.total;
                if (result.reachable)
                {
                    reachable[*ip] = result;
                    ++scan.online;
                }
                if (scan.total % m_options.progress_interval == 0)
                {
                    try
                    {
                        m_store.UpdateScan(scan);
                    }
                    catch (const StoreError &e)
                    {
                        std::cerr << "[Scan] Progress update failed: " << e.what() << "\n";
                    }
                }
            }
        };

        std::vector<std::thread> workers;
        workers.reserve(workerCount);
        try
        {
            for (size_t i = 0; i < workerCount; ++i)
                workers.emplace_back(worker);
        }
        catch (const std::system_error &)
        {
            abort.Cancel();
            queue.Close();
            for (auto &t : workers)
                t.join();
            throw;
        }

        // Workers close the queue when they abort, which also releases a blocked Push().
        for (auto &host : subnet.Hosts())
        {
            if (abort.IsCancelled() || !queue.Push(std::move(host)))
                break;
        }
        queue.Close();

        for (auto &t : workers)
            t.join();

        if (!probeFailure.empty())
            throw ProbeError(probeFailure);
        if (cancel.IsCancelled())
            throw OperationCancelled();

        // A host is online when it answered the ping or the neighbour cache knows it.
        ArpTable neighbours = ReadNeighbours(subnet);
        std::map<uint32_t, std::string> online;
        for (const auto &[ip, result] : reachable)
            online.emplace(*ParseIpv4(ip), ip);
        for (const auto &[ip, mac] : neighbours)
            online.emplace(*ParseIpv4(ip), ip);
        scan.online = static_cast<int>(online.size());

        std::set<std::string> seen;
        std::optional<Device> self;
        if (auto local = m_interfaces.DefaultInterface(); local && subnet.Contains(local->ip))
        {
            self = RegisterSelf(scan, *local, reachable.count(local->ip) > 0);
            seen.insert(self->id);
        }

        for (const auto &[key, ip] : online)
        {
            if (cancel.IsCancelled())
                throw OperationCancelled();
            if (self && self->PrimaryIp() == ip)
                continue;

            auto arpEntry = neighbours.find(ip);
            bool pinged = reachable.count(ip) > 0;

            Device device;
            device.ip_addresses = {ip};
            if (arpEntry != neighbours.end())
            {
                device.mac_address = arpEntry->second;
                device.manufacturer = m_oui.Lookup(device.mac_address);
            }
            device.status = DeviceStatus::Online;
            device.discovery_method = pinged ? DiscoveryMethod::Icmp : DiscoveryMethod::Arp;
            device.first_seen = NowUtc();
            device.last_seen = device.first_seen;

            bool created = m_store.UpsertDevice(device);
            m_store.LinkScanDevice(scan.id, device.id);
            seen.insert(device.id);
            m_events.Publish(MakeDeviceEvent(created, device));

            if (self && arpEntry != neighbours.end())
                m_store.InsertLink({self->id, device.id, LinkType::Arp, NowUtc()});
        }

        MarkLost(subnet, seen);

        try
        {
            HierarchyInferrer(m_store).Apply();
        }
        catch (const StoreError &e)
        {
            std::cerr << "[Scan] Hierarchy inference skipped: " << e.what() << "\n";
        }

        Finalize(scan, ScanStatus::Completed, "");
    }

    ArpTable ScanOrchestrator::ReadNeighbours(const Subnet &subnet)
    {
        ArpTable table;
        try
        {
            table = m_arp.ReadTable();
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Scan] ARP table unavailable: " << e.what() << "\n";
            return {};
        }

        for (auto it = table.begin(); it != table.end();)
        {
            if (subnet.Contains(it->first))
                ++it;
            else
                it = table.erase(it);
        }
        return table;
    }

    Device ScanOrchestrator::RegisterSelf(const ScanResult &scan, const LocalInterface &local, bool reachable)
    {
        Device self;
        self.ip_addresses = {local.ip};
        self.mac_address = local.mac;
        self.hostname = LocalHostname();
        if (!self.mac_address.empty())
            self.manufacturer = m_oui.Lookup(self.mac_address);
        self.status = DeviceStatus::Online;
        self.discovery_method = reachable ? DiscoveryMethod::Icmp : DiscoveryMethod::Manual;
        self.tags = {"scanner"};
        self.first_seen = NowUtc();
        self.last_seen = self.first_seen;

        bool created = m_store.UpsertDevice(self);
        m_store.LinkScanDevice(scan.id, self.id);
        m_events.Publish(MakeDeviceEvent(created, self));
        return self;
    }

    void ScanOrchestrator::MarkLost(const Subnet &subnet, const std::set<std::string> &seen)
    {
        for (const auto &device : m_store.ListDevices())
        {
            if (device.status != DeviceStatus::Online || seen.count(device.id))
                continue;

            std::string ip = device.PrimaryIp();
            if (ip.empty() || !subnet.Contains(ip))
                continue;

            m_store.UpdateDeviceStatus(device.id, DeviceStatus::Offline);
            m_events.Publish(MakeLostEvent(device));
            std::cout << "[Scan] Device " << device.id << " (" << ip << ") no longer answers\n";
        }
    }

    void ScanOrchestrator::Finalize(ScanResult &scan, ScanStatus status, const std::string &error)
    {
        scan.status = status;
        scan.error_msg = error;
        scan.ended_at = NowUtc();

        try
        {
            m_store.UpdateScan(scan);
        }
        catch (const StoreError &e)
        {
            std::cerr << "[Scan] Could not record final state of " << scan.id << ": " << e.what() << "\n";
        }
        m_events.Publish(MakeScanEvent(topics::ScanCompleted, scan));

        std::cout << "[Scan] " << scan.id << " " << ToString(status) << ": " << scan.online << "/" << scan.total
                  << " online" << (error.empty() ? "" : " (" + error + ")") << "\n";
    }

    void ScanOrchestrator::ReapFinished()
    {
        for (auto it = m_jobs.begin(); it != m_jobs.end();)
        {
            if (it->done->load())
            {
                it->thread.join();
                it = m_jobs.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    void ScanOrchestrator::Drain()
    {
        std::vector<Job> jobs;
        {
            std::lock_guard<std::mutex> lock(m_jobsMutex);
            jobs.swap(m_jobs);
        }
        for (auto &job : jobs)
        {
            if (job.thread.joinable())
                job.thread.join();
        }
    }

    void ScanOrchestrator::Shutdown()
    {
        m_shutdown.Cancel();
        Drain();
    }
}
