#include "MdnsListener.hpp"
#include "Errors.hpp"
#include "Subnet.hpp"
#include "../common/ThreadSafeQueue.hpp"

#include <iostream>
#include <thread>

namespace net_recon::recon
{
    namespace
    {
        constexpr size_t kEntryBacklog = 256;
    }

    const std::vector<std::string> &MdnsListener::ServiceCatalog()
    {
        static const std::vector<std::string> catalog = {
            "_http._tcp",
            "_https._tcp",
            "_ssh._tcp",
            "_smb._tcp",
            "_nfs._tcp",
            "_ipp._tcp",
            "_printer._tcp",
            "_airplay._tcp",
            "_raop._tcp",
            "_googlecast._tcp",
            "_homekit._tcp",
            "_hap._tcp",
            "_mqtt._tcp",
            "_workstation._tcp",
        };
        return catalog;
    }

    DeviceType MdnsListener::InferDeviceType(const std::string &service)
    {
        auto has = [&service](const char *needle) { return service.find(needle) != std::string::npos; };

        if (has("printer") || has("ipp"))
            return DeviceType::Printer;
        if (has("airplay") || has("raop") || has("googlecast") || has("homekit") || has("hap") || has("mqtt"))
            return DeviceType::IoT;
        return DeviceType::Unknown;
    }

    std::string MdnsListener::ExtractIp(const MdnsServiceEntry &entry)
    {
        if (ParseIpv4(entry.addr_v4))
            return entry.addr_v4;
        if (ParseIpv4(entry.addr))
            return entry.addr;
        return "";
    }

    MdnsListener::MdnsListener(DeviceStore &store, EventBus &events, std::unique_ptr<MdnsQuerier> querier,
                               std::chrono::milliseconds interval, std::chrono::milliseconds queryTimeout)
        : m_store(store), m_events(events), m_querier(std::move(querier)),
          m_interval(interval), m_queryTimeout(queryTimeout)
    {
    }

    void MdnsListener::Run(const CancelToken &cancel)
    {
        if (!m_querier)
        {
            std::cout << "[mDNS] Multicast DNS is not available on this platform, listener idle\n";
            cancel.Wait();
            return;
        }

        std::cout << "[mDNS] Listener started, interval " << m_interval.count() / 1000 << "s\n";
        do
        {
            try
            {
                int found = Sweep(cancel);
                if (found > 0)
                    std::cout << "[mDNS] Sweep upserted " << found << " devices\n";
            }
            catch (const std::exception &e)
            {
                std::cerr << "[mDNS] Sweep failed: " << e.what() << "\n";
            }
        } while (!cancel.WaitFor(m_interval));

        std::cout << "[mDNS] Listener stopped\n";
    }

    int MdnsListener::Sweep(const CancelToken &cancel)
    {
        int upserted = 0;
        for (const auto &service : ServiceCatalog())
        {
            if (cancel.IsCancelled())
                break;

            bool storeFailed = false;
            upserted += QueryService(service, cancel, storeFailed);
            if (storeFailed)
            {
                std::cerr << "[mDNS] Store unavailable, sweep aborted\n";
                break;
            }
        }

        CleanSeen();
        return upserted;
    }

    int MdnsListener::QueryService(const std::string &service, const CancelToken &cancel, bool &storeFailed)
    {
        common::ThreadSafeQueue<MdnsServiceEntry> entries(kEntryBacklog);
        int upserted = 0;

        std::thread consumer([&]() {
            while (auto entry = entries.Pop())
            {
                if (storeFailed)
                    continue;
                try
                {
                    if (HandleEntry(*entry, service))
                        ++upserted;
                }
                catch (const StoreError &e)
                {
                    std::cerr << "[mDNS] " << e.what() << "\n";
                    storeFailed = true;
                }
            }
        });

        try
        {
            m_querier->Query(service, m_queryTimeout,
                             [&entries, &service](MdnsServiceEntry entry) {
                                 if (!entries.Push(std::move(entry)))
                                     std::cerr << "[mDNS] Dropped late answer for " << service << "\n";
                             },
                             cancel);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[mDNS] Query " << service << " failed: " << e.what() << "\n";
        }

        entries.Close();
        consumer.join();
        return upserted;
    }

    bool MdnsListener::HandleEntry(const MdnsServiceEntry &entry, const std::string &service)
    {
        std::string ip = ExtractIp(entry);
        if (ip.empty())
            return false;
        if (!MarkSeen(ip))
            return false;

        std::string hostname = entry.host;
        if (!hostname.empty() && hostname.back() == '.')
            hostname.pop_back();
        if (hostname.empty())
            hostname = entry.name;

        Device device;
        device.ip_addresses = {ip};
        device.hostname = hostname;
        device.device_type = InferDeviceType(service);
        device.status = DeviceStatus::Online;
        device.discovery_method = DiscoveryMethod::Mdns;
        device.first_seen = NowUtc();
        device.last_seen = device.first_seen;

        bool created = m_store.UpsertDevice(device);
        m_events.Publish(MakeDeviceEvent(created, device));
        return true;
    }

    bool MdnsListener::MarkSeen(const std::string &ip)
    {
        auto now = std::chrono::steady_clock::now();
        std::lock_guard<std::mutex> lock(m_seenMutex);

        auto it = m_seen.find(ip);
        if (it != m_seen.end() && now - it->second < m_interval)
            return false;
        m_seen[ip] = now;
        return true;
    }

    void MdnsListener::CleanSeen()
    {
        auto cutoff = std::chrono::steady_clock::now() - 2 * m_interval;
        std::lock_guard<std::mutex> lock(m_seenMutex);
        for (auto it = m_seen.begin(); it != m_seen.end();)
        {
            if (it->second < cutoff)
                it = m_seen.erase(it);
            else
                ++it;
        }
    }

    size_t MdnsListener::TrackedAddressCount() const
    {
        std::lock_guard<std::mutex> lock(m_seenMutex);
        return m_seen.size();
    }
}
