#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace net_recon::recon
{
    using Timestamp = std::chrono::system_clock::time_point;

    enum class DeviceType
    {
        Router,
        Firewall,
        Switch,
        AccessPoint,
        Server,
        Desktop,
        Printer,
        IoT,
        Unknown
    };

    enum class DeviceStatus
    {
        Online,
        Offline,
        Unknown
    };

    enum class DiscoveryMethod
    {
        Icmp,
        Arp,
        Mdns,
        Snmp,
        Manual
    };

    // Structural role in the discovered tree, not a cabling layer.
    enum class NetworkLayer
    {
        Unknown = 0,
        Gateway = 1,
        Distribution = 2,
        Access = 3,
        Endpoint = 4
    };

    enum class LinkType
    {
        Arp,
        Fdb,
        Lldp,
        Cdp
    };

    enum class ScanStatus
    {
        Running,
        Completed,
        Failed
    };

    struct Device
    {
        std::string id;
        std::string mac_address;               // AA:BB:CC:DD:EE:FF or empty
        std::vector<std::string> ip_addresses; // first entry is the primary address

        std::string hostname;
        std::string manufacturer;
        DeviceType device_type = DeviceType::Unknown;
        std::string os;

        DeviceStatus status = DeviceStatus::Unknown;
        DiscoveryMethod discovery_method = DiscoveryMethod::Manual;
        Timestamp first_seen{};
        Timestamp last_seen{};

        NetworkLayer network_layer = NetworkLayer::Unknown;
        std::string parent_device_id;

        std::string notes;
        std::vector<std::string> tags;
        std::map<std::string, std::string> custom_fields;

        std::string PrimaryIp() const { return ip_addresses.empty() ? std::string() : ip_addresses.front(); }
    };

    struct TopologyLink
    {
        std::string source_device_id;
        std::string target_device_id;
        LinkType link_type = LinkType::Arp;
        Timestamp discovered_at{};
    };

    struct ScanResult
    {
        std::string id;
        std::string subnet;
        Timestamp started_at{};
        std::optional<Timestamp> ended_at;
        ScanStatus status = ScanStatus::Running;
        int total = 0;
        int online = 0;
        std::string error_msg;
    };

    struct HierarchyAssignment
    {
        std::string device_id;
        std::string parent_device_id;
        NetworkLayer network_layer = NetworkLayer::Unknown;
    };

    struct TracerouteHop
    {
        int hop = 0;
        std::string ip;
        std::string hostname;
        double rtt_ms = 0.0;
        bool timeout = false;
    };

    struct TracerouteResult
    {
        std::string target;
        // IPv4 address the target resolved to; equal to target for a literal address.
        std::string address;
        std::vector<TracerouteHop> hops;
        bool reached = false;
        int total_hops = 0;
        double duration_ms = 0.0;
    };

    std::string ToString(DeviceType type);
    std::string ToString(DeviceStatus status);
    std::string ToString(DiscoveryMethod method);
    std::string ToString(NetworkLayer layer);
    std::string ToString(LinkType type);
    std::string ToString(ScanStatus status);

    // Unrecognised names map to the Unknown member (or the first member where there is none).
    DeviceType DeviceTypeFromString(const std::string &name);
    DeviceStatus DeviceStatusFromString(const std::string &name);
    DiscoveryMethod DiscoveryMethodFromString(const std::string &name);
    NetworkLayer NetworkLayerFromString(const std::string &name);
    LinkType LinkTypeFromString(const std::string &name);
    ScanStatus ScanStatusFromString(const std::string &name);

    bool IsInfrastructure(DeviceType type);

    // RFC 3339 UTC with second precision, e.g. 2026-01-02T03:04:05Z.
    std::string FormatTimestamp(Timestamp ts);
    std::optional<Timestamp> ParseTimestamp(const std::string &text);

    // Truncated to whole seconds so values survive a store round trip unchanged.
    Timestamp NowUtc();
}
