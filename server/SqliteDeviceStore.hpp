#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>

#include "../recon/DeviceStore.hpp"

namespace net_recon::server
{
    // DeviceStore on a single SQLite connection. All access is serialized by one mutex;
    // upserts additionally run inside an IMMEDIATE transaction.
    class SqliteDeviceStore : public recon::DeviceStore
    {
    private:
        sqlite3 *db_;
        std::mutex db_mutex_;

        void Exec(const char *sql);
        void WriteAddresses(const std::string &device_id, const std::vector<std::string> &ips);
        std::optional<std::string> FindDeviceByMac(const std::string &mac);
        std::optional<std::string> FindDeviceByIp(const std::string &ip, const std::string &mac);
        std::optional<recon::Device> LoadDevice(const std::string &id);
        std::vector<std::string> LoadAddresses(const std::string &id);
        bool ScanExists(const std::string &id);

    public:
        SqliteDeviceStore();
        ~SqliteDeviceStore() override;

        SqliteDeviceStore(const SqliteDeviceStore &) = delete;
        SqliteDeviceStore &operator=(const SqliteDeviceStore &) = delete;

        // Opens (or creates) the database and its schema. ":memory:" gives a private in-memory store.
        void Initialize(const std::string &db_path);
        void Shutdown();

        bool UpsertDevice(recon::Device &device) override;
        std::optional<recon::Device> GetDevice(const std::string &id) override;
        std::vector<recon::Device> ListDevices() override;
        void UpdateDeviceStatus(const std::string &id, recon::DeviceStatus status) override;
        void UpdateDeviceHierarchy(const std::string &id, recon::NetworkLayer layer, const std::string &parent_id) override;

        void InsertLink(const recon::TopologyLink &link) override;
        std::vector<recon::TopologyLink> ListLinks() override;

        void CreateScan(recon::ScanResult &scan) override;
        void UpdateScan(const recon::ScanResult &scan) override;
        std::optional<recon::ScanResult> GetScan(const std::string &id) override;
        std::vector<recon::ScanResult> ListScans(int limit, int offset) override;
        int CountScans() override;

        void LinkScanDevice(const std::string &scan_id, const std::string &device_id) override;
        std::vector<std::string> ListScanDevices(const std::string &scan_id) override;
    };
}
