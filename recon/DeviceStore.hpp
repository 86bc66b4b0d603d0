#pragma once

#include "Models.hpp"

#include <optional>
#include <string>
#include <vector>

namespace net_recon::recon
{
    // Persistence seen by the discovery core. Every operation throws StoreError on failure.
    class DeviceStore
    {
    public:
        virtual ~DeviceStore() = default;

        // Create-or-update keyed by MAC when known, else by IP. The merged row is written
        // back into `device`. Returns true when a new row was created.
        virtual bool UpsertDevice(Device &device) = 0;

        virtual std::optional<Device> GetDevice(const std::string &id) = 0;
        virtual std::vector<Device> ListDevices() = 0;
        virtual void UpdateDeviceStatus(const std::string &id, DeviceStatus status) = 0;
        virtual void UpdateDeviceHierarchy(const std::string &id, NetworkLayer layer, const std::string &parent_id) = 0;

        // Duplicate (source, target, type) triples are ignored.
        virtual void InsertLink(const TopologyLink &link) = 0;
        virtual std::vector<TopologyLink> ListLinks() = 0;

        // Assigns id and started_at.
        virtual void CreateScan(ScanResult &scan) = 0;
        virtual void UpdateScan(const ScanResult &scan) = 0;
        virtual std::optional<ScanResult> GetScan(const std::string &id) = 0;

        // Newest first.
        virtual std::vector<ScanResult> ListScans(int limit, int offset) = 0;
        virtual int CountScans() = 0;

        virtual void LinkScanDevice(const std::string &scan_id, const std::string &device_id) = 0;
        virtual std::vector<std::string> ListScanDevices(const std::string &scan_id) = 0;
    };
}
