#include "Models.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace net_recon::recon
{
    std::string ToString(DeviceType type)
    {
        switch (type)
        {
        case DeviceType::Router: return "router";
        case DeviceType::Firewall: return "firewall";
        case DeviceType::Switch: return "switch";
        case DeviceType::AccessPoint: return "access_point";
        case DeviceType::Server: return "server";
        case DeviceType::Desktop: return "desktop";
        case DeviceType::Printer: return "printer";
        case DeviceType::IoT: return "iot";
        case DeviceType::Unknown: break;
        }
        return "unknown";
    }

    std::string ToString(DeviceStatus status)
    {
        switch (status)
        {
        case DeviceStatus::Online: return "online";
        case DeviceStatus::Offline: return "offline";
        case DeviceStatus::Unknown: break;
        }
        return "unknown";
    }

    std::string ToString(DiscoveryMethod method)
    {
        switch (method)
        {
        case DiscoveryMethod::Icmp: return "icmp";
        case DiscoveryMethod::Arp: return "arp";
        case DiscoveryMethod::Mdns: return "mdns";
        case DiscoveryMethod::Snmp: return "snmp";
        case DiscoveryMethod::Manual: break;
        }
        return "manual";
    }

    std::string ToString(NetworkLayer layer)
    {
        switch (layer)
        {
        case NetworkLayer::Gateway: return "gateway";
        case NetworkLayer::Distribution: return "distribution";
        case NetworkLayer::Access: return "access";
        case NetworkLayer::Endpoint: return "endpoint";
        case NetworkLayer::Unknown: break;
        }
        return "unknown";
    }

    std::string ToString(LinkType type)
    {
        switch (type)
        {
        case LinkType::Fdb: return "fdb";
        case LinkType::Lldp: return "lldp";
        case LinkType::Cdp: return "cdp";
        case LinkType::Arp: break;
        }
        return "arp";
    }

    std::string ToString(ScanStatus status)
    {
        switch (status)
        {
        case ScanStatus::Completed: return "completed";
        case ScanStatus::Failed: return "failed";
        case ScanStatus::Running: break;
        }
        return "running";
    }

    DeviceType DeviceTypeFromString(const std::string &name)
    {
        if (name == "router") return DeviceType::Router;
        if (name == "firewall") return DeviceType::Firewall;
        if (name == "switch") return DeviceType::Switch;
        if (name == "access_point") return DeviceType::AccessPoint;
        if (name == "server") return DeviceType::Server;
        if (name == "desktop") return DeviceType::Desktop;
        if (name == "printer") return DeviceType::Printer;
        if (name == "iot") return DeviceType::IoT;
        return DeviceType::Unknown;
    }

    DeviceStatus DeviceStatusFromString(const std::string &name)
    {
        if (name == "online") return DeviceStatus::Online;
        if (name == "offline") return DeviceStatus::Offline;
        return DeviceStatus::Unknown;
    }

    DiscoveryMethod DiscoveryMethodFromString(const std::string &name)
    {
        if (name == "icmp") return DiscoveryMethod::Icmp;
        if (name == "arp") return DiscoveryMethod::Arp;
        if (name == "mdns") return DiscoveryMethod::Mdns;
        if (name == "snmp") return DiscoveryMethod::Snmp;
        return DiscoveryMethod::Manual;
    }

    NetworkLayer NetworkLayerFromString(const std::string &name)
    {
        if (name == "gateway") return NetworkLayer::Gateway;
        if (name == "distribution") return NetworkLayer::Distribution;
        if (name == "access") return NetworkLayer::Access;
        if (name == "endpoint") return NetworkLayer::Endpoint;
        return NetworkLayer::Unknown;
    }

    LinkType LinkTypeFromString(const std::string &name)
    {
        if (name == "fdb") return LinkType::Fdb;
        if (name == "lldp") return LinkType::Lldp;
        if (name == "cdp") return LinkType::Cdp;
        return LinkType::Arp;
    }

    ScanStatus ScanStatusFromString(const std::string &name)
    {
        if (name == "completed") return ScanStatus::Completed;
        if (name == "failed") return ScanStatus::Failed;
        return ScanStatus::Running;
    }

    bool IsInfrastructure(DeviceType type)
    {
        return type == DeviceType::Router || type == DeviceType::Firewall ||
               type == DeviceType::Switch || type == DeviceType::AccessPoint;
    }

    std::string FormatTimestamp(Timestamp ts)
    {
        std::time_t t = std::chrono::system_clock::to_time_t(ts);
        std::tm utc{};
        gmtime_r(&t, &utc);

        std::stringstream ss;
        ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    std::optional<Timestamp> ParseTimestamp(const std::string &text)
    {
        std::tm utc{};
        std::istringstream ss(text);
        ss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail())
            return std::nullopt;

        std::time_t t = timegm(&utc);
        if (t == static_cast<std::time_t>(-1))
            return std::nullopt;
        return std::chrono::system_clock::from_time_t(t);
    }

    Timestamp NowUtc()
    {
        return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
    }
}
