#include "SqliteDeviceStore.hpp"
#include "../common/Uuid.hpp"
#include "../recon/Errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <map>
#include <set>

namespace net_recon::server
{
    using recon::Device;
    using recon::ScanResult;
    using recon::StoreError;
    using recon::TopologyLink;

    namespace
    {
        // Owns one prepared statement; every failure becomes a StoreError.
        class Statement
        {
        public:
            Statement(sqlite3 *db, const char *sql) : db_(db), stmt_(nullptr)
            {
                if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK)
                    throw StoreError(std::string("prepare failed: ") + sqlite3_errmsg(db_));
            }

            ~Statement() { sqlite3_finalize(stmt_); }

            Statement(const Statement &) = delete;
            Statement &operator=(const Statement &) = delete;

            Statement &Bind(int index, const std::string &value)
            {
                Check(sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT));
                return *this;
            }

            Statement &Bind(int index, int value)
            {
                Check(sqlite3_bind_int(stmt_, index, value));
                return *this;
            }

            Statement &BindNull(int index)
            {
                Check(sqlite3_bind_null(stmt_, index));
                return *this;
            }

            // True while rows are available.
            bool Step()
            {
                int rc = sqlite3_step(stmt_);
                if (rc == SQLITE_ROW)
                    return true;
                if (rc == SQLITE_DONE)
                    return false;
                throw StoreError(std::string("step failed: ") + sqlite3_errmsg(db_));
            }

            void Run()
            {
                while (Step())
                {
                }
            }

            std::string Text(int col) const
            {
                const char *p = reinterpret_cast<const char *>(sqlite3_column_text(stmt_, col));
                return p ? std::string(p) : std::string();
            }

            int Int(int col) const { return sqlite3_column_int(stmt_, col); }
            bool IsNull(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

        private:
            void Check(int rc)
            {
                if (rc != SQLITE_OK)
                    throw StoreError(std::string("bind failed: ") + sqlite3_errmsg(db_));
            }

            sqlite3 *db_;
            sqlite3_stmt *stmt_;
        };

        class Transaction
        {
        public:
            explicit Transaction(sqlite3 *db) : db_(db)
            {
                char *err = nullptr;
                if (sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, &err) != SQLITE_OK)
                {
                    std::string msg = err ? err : "unknown error";
                    sqlite3_free(err);
                    throw StoreError("begin transaction: " + msg);
                }
            }

            ~Transaction()
            {
                if (!committed_ && sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK)
                    std::cerr << "[Store] Rollback failed: " << sqlite3_errmsg(db_) << "\n";
            }

            void Commit()
            {
                char *err = nullptr;
                if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, &err) != SQLITE_OK)
                {
                    std::string msg = err ? err : "unknown error";
                    sqlite3_free(err);
                    throw StoreError("commit: " + msg);
                }
                committed_ = true;
            }

        private:
            sqlite3 *db_;
            bool committed_ = false;
        };

        const char *kSchema =
            "CREATE TABLE IF NOT EXISTS devices ("
            "id TEXT PRIMARY KEY, "
            "mac_address TEXT NOT NULL DEFAULT '', "
            "hostname TEXT NOT NULL DEFAULT '', "
            "manufacturer TEXT NOT NULL DEFAULT '', "
            "device_type TEXT NOT NULL DEFAULT 'unknown', "
            "os TEXT NOT NULL DEFAULT '', "
            "status TEXT NOT NULL DEFAULT 'unknown', "
            "discovery_method TEXT NOT NULL DEFAULT 'manual', "
            "first_seen TEXT NOT NULL, "
            "last_seen TEXT NOT NULL, "
            "network_layer INTEGER NOT NULL DEFAULT 0, "
            "parent_device_id TEXT NOT NULL DEFAULT '', "
            "notes TEXT NOT NULL DEFAULT '', "
            "tags TEXT NOT NULL DEFAULT '[]', "
            "custom_fields TEXT NOT NULL DEFAULT '{}'"
            ");"

            "CREATE UNIQUE INDEX IF NOT EXISTS idx_devices_mac ON devices(mac_address) WHERE mac_address <> '';"

            "CREATE TABLE IF NOT EXISTS device_addresses ("
            "device_id TEXT NOT NULL, "
            "ip TEXT NOT NULL, "
            "position INTEGER NOT NULL, "
            "PRIMARY KEY(device_id, ip), "
            "FOREIGN KEY(device_id) REFERENCES devices(id) ON DELETE CASCADE"
            ");"

            "CREATE INDEX IF NOT EXISTS idx_device_addresses_ip ON device_addresses(ip);"

            "CREATE TABLE IF NOT EXISTS topology_links ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "source_device_id TEXT NOT NULL, "
            "target_device_id TEXT NOT NULL, "
            "link_type TEXT NOT NULL, "
            "discovered_at TEXT NOT NULL, "
            "UNIQUE(source_device_id, target_device_id, link_type)"
            ");"

            "CREATE TABLE IF NOT EXISTS scans ("
            "id TEXT PRIMARY KEY, "
            "subnet TEXT NOT NULL, "
            "started_at TEXT NOT NULL, "
            "ended_at TEXT, "
            "status TEXT NOT NULL, "
            "total INTEGER NOT NULL DEFAULT 0, "
            "online INTEGER NOT NULL DEFAULT 0, "
            "error_msg TEXT NOT NULL DEFAULT ''"
            ");"

            "CREATE TABLE IF NOT EXISTS scan_devices ("
            "scan_id TEXT NOT NULL, "
            "device_id TEXT NOT NULL, "
            "UNIQUE(scan_id, device_id), "
            "FOREIGN KEY(scan_id) REFERENCES scans(id) ON DELETE CASCADE"
            ");";

        const char *kDeviceColumns =
            "id, mac_address, hostname, manufacturer, device_type, os, status, discovery_method, "
            "first_seen, last_seen, network_layer, parent_device_id, notes, tags, custom_fields";

        recon::Timestamp ReadTime(const std::string &text)
        {
            return recon::ParseTimestamp(text).value_or(recon::Timestamp{});
        }

        Device ReadDevice(const Statement &stmt)
        {
            Device d;
            d.id = stmt.Text(0);
            d.mac_address = stmt.Text(1);
            d.hostname = stmt.Text(2);
            d.manufacturer = stmt.Text(3);
            d.device_type = recon::DeviceTypeFromString(stmt.Text(4));
            d.os = stmt.Text(5);
            d.status = recon::DeviceStatusFromString(stmt.Text(6));
            d.discovery_method = recon::DiscoveryMethodFromString(stmt.Text(7));
            d.first_seen = ReadTime(stmt.Text(8));
            d.last_seen = ReadTime(stmt.Text(9));
            d.network_layer = static_cast<recon::NetworkLayer>(stmt.Int(10));
            d.parent_device_id = stmt.Text(11);
            d.notes = stmt.Text(12);

            auto tags = nlohmann::json::parse(stmt.Text(13), nullptr, false);
            if (tags.is_array())
            {
                for (const auto &t : tags)
                {
                    if (t.is_string())
                        d.tags.push_back(t.get<std::string>());
                }
            }

            auto fields = nlohmann::json::parse(stmt.Text(14), nullptr, false);
            if (fields.is_object())
            {
                for (auto it = fields.begin(); it != fields.end(); ++it)
                {
                    if (it.value().is_string())
                        d.custom_fields[it.key()] = it.value().get<std::string>();
                }
            }
            return d;
        }

        ScanResult ReadScan(const Statement &stmt)
        {
            ScanResult s;
            s.id = stmt.Text(0);
            s.subnet = stmt.Text(1);
            s.started_at = ReadTime(stmt.Text(2));
            if (!stmt.IsNull(3))
                s.ended_at = recon::ParseTimestamp(stmt.Text(3));
            s.status = recon::ScanStatusFromString(stmt.Text(4));
            s.total = stmt.Int(5);
            s.online = stmt.Int(6);
            s.error_msg = stmt.Text(7);
            return s;
        }

        void BindDeviceFields(Statement &stmt, const Device &d)
        {
            stmt.Bind(1, d.mac_address)
                .Bind(2, d.hostname)
                .Bind(3, d.manufacturer)
                .Bind(4, recon::ToString(d.device_type))
                .Bind(5, d.os)
                .Bind(6, recon::ToString(d.status))
                .Bind(7, recon::ToString(d.discovery_method))
                .Bind(8, recon::FormatTimestamp(d.first_seen))
                .Bind(9, recon::FormatTimestamp(d.last_seen))
                .Bind(10, static_cast<int>(d.network_layer))
                .Bind(11, d.parent_device_id)
                .Bind(12, d.notes)
                .Bind(13, nlohmann::json(d.tags).dump())
                .Bind(14, nlohmann::json(d.custom_fields).dump())
                .Bind(15, d.id);
        }

        // Observed addresses first, then the previously known ones.
        std::vector<std::string> MergeAddresses(const std::vector<std::string> &observed,
                                                const std::vector<std::string> &known)
        {
            std::vector<std::string> merged;
            for (const auto &list : {observed, known})
            {
                for (const auto &ip : list)
                {
                    if (!ip.empty() && std::find(merged.begin(), merged.end(), ip) == merged.end())
                        merged.push_back(ip);
                }
            }
            return merged;
        }

        Device Merge(Device existing, const Device &incoming)
        {
            existing.ip_addresses = MergeAddresses(incoming.ip_addresses, existing.ip_addresses);
            existing.status = incoming.status;
            existing.last_seen = incoming.last_seen == recon::Timestamp{} ? recon::NowUtc() : incoming.last_seen;

            if (!incoming.mac_address.empty())
                existing.mac_address = incoming.mac_address;
            if (!incoming.hostname.empty())
                existing.hostname = incoming.hostname;
            if (!incoming.manufacturer.empty())
                existing.manufacturer = incoming.manufacturer;
            if (!incoming.os.empty())
                existing.os = incoming.os;
            if (existing.device_type == recon::DeviceType::Unknown)
                existing.device_type = incoming.device_type;

            for (const auto &tag : incoming.tags)
            {
                if (std::find(existing.tags.begin(), existing.tags.end(), tag) == existing.tags.end())
                    existing.tags.push_back(tag);
            }
            for (const auto &[key, value] : incoming.custom_fields)
                existing.custom_fields[key] = value;

            return existing;
        }
    }

    SqliteDeviceStore::SqliteDeviceStore() : db_(nullptr) {}

    SqliteDeviceStore::~SqliteDeviceStore()
    {
        Shutdown();
    }

    void SqliteDeviceStore::Exec(const char *sql)
    {
        char *err_msg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::string msg = err_msg ? err_msg : "unknown error";
            sqlite3_free(err_msg);
            throw StoreError(msg);
        }
    }

    void SqliteDeviceStore::Initialize(const std::string &db_path)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);

        if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK)
        {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
            sqlite3_close(db_);
            db_ = nullptr;
            throw StoreError("open " + db_path + ": " + msg);
        }

        if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr) != SQLITE_OK)
            std::cerr << "[Store] WAL journal unavailable: " << sqlite3_errmsg(db_) << "\n";
        sqlite3_busy_timeout(db_, 5000);

        Exec("PRAGMA foreign_keys = ON;");
        Exec(kSchema);

        std::cout << "[Store] Opened " << db_path << "\n";
    }

    void SqliteDeviceStore::Shutdown()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    std::optional<std::string> SqliteDeviceStore::FindDeviceByMac(const std::string &mac)
    {
        Statement stmt(db_, "SELECT id FROM devices WHERE mac_address = ?;");
        stmt.Bind(1, mac);
        if (stmt.Step())
            return stmt.Text(0);
        return std::nullopt;
    }

    std::optional<std::string> SqliteDeviceStore::FindDeviceByIp(const std::string &ip, const std::string &mac)
    {
        // Without a MAC the address alone identifies the host. A known MAC only claims rows
        // that carry no MAC or the same one.
        Statement stmt(db_,
                       "SELECT d.id FROM devices d JOIN device_addresses a ON a.device_id = d.id "
                       "WHERE a.ip = ? AND (? = '' OR d.mac_address = '' OR d.mac_address = ?) "
                       "ORDER BY a.position ASC, d.last_seen DESC LIMIT 1;");
        stmt.Bind(1, ip).Bind(2, mac).Bind(3, mac);
        if (stmt.Step())
            return stmt.Text(0);
        return std::nullopt;
    }

    std::vector<std::string> SqliteDeviceStore::LoadAddresses(const std::string &id)
    {
        std::vector<std::string> ips;
        Statement stmt(db_, "SELECT ip FROM device_addresses WHERE device_id = ? ORDER BY position;");
        stmt.Bind(1, id);
        while (stmt.Step())
            ips.push_back(stmt.Text(0));
        return ips;
    }

    std::optional<Device> SqliteDeviceStore::LoadDevice(const std::string &id)
    {
        std::string sql = std::string("SELECT ") + kDeviceColumns + " FROM devices WHERE id = ?;";
        Statement stmt(db_, sql.c_str());
        stmt.Bind(1, id);
        if (!stmt.Step())
            return std::nullopt;

        Device d = ReadDevice(stmt);
        d.ip_addresses = LoadAddresses(id);
        return d;
    }

    void SqliteDeviceStore::WriteAddresses(const std::string &device_id, const std::vector<std::string> &ips)
    {
        Statement clear(db_, "DELETE FROM device_addresses WHERE device_id = ?;");
        clear.Bind(1, device_id).Run();

        for (size_t i = 0; i < ips.size(); ++i)
        {
            // An address belongs to one device at a time.
            Statement moved(db_, "DELETE FROM device_addresses WHERE ip = ? AND device_id <> ?;");
            moved.Bind(1, ips[i]).Bind(2, device_id).Run();

            Statement insert(db_, "INSERT INTO device_addresses (device_id, ip, position) VALUES (?, ?, ?);");
            insert.Bind(1, device_id).Bind(2, ips[i]).Bind(3, static_cast<int>(i)).Run();
        }
    }

    bool SqliteDeviceStore::UpsertDevice(Device &device)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        Transaction tx(db_);

        std::optional<std::string> existing;
        if (!device.mac_address.empty())
            existing = FindDeviceByMac(device.mac_address);
        for (size_t i = 0; !existing && i < device.ip_addresses.size(); ++i)
            existing = FindDeviceByIp(device.ip_addresses[i], device.mac_address);

        bool created = false;
        if (existing)
        {
            auto current = LoadDevice(*existing);
            if (!current)
                throw StoreError("device " + *existing + " vanished during upsert");

            Device merged = Merge(*current, device);
            Statement update(db_,
                             "UPDATE devices SET mac_address = ?, hostname = ?, manufacturer = ?, device_type = ?, "
                             "os = ?, status = ?, discovery_method = ?, first_seen = ?, last_seen = ?, "
                             "network_layer = ?, parent_device_id = ?, notes = ?, tags = ?, custom_fields = ? "
                             "WHERE id = ?;");
            BindDeviceFields(update, merged);
            update.Run();
            WriteAddresses(merged.id, merged.ip_addresses);
            device = std::move(merged);
        }
        else
        {
            device.id = common::NewUuid();
            auto now = recon::NowUtc();
            if (device.first_seen == recon::Timestamp{})
                device.first_seen = now;
            if (device.last_seen == recon::Timestamp{})
                device.last_seen = now;
            device.ip_addresses = MergeAddresses(device.ip_addresses, {});

            Statement insert(db_,
                             "INSERT INTO devices (mac_address, hostname, manufacturer, device_type, os, status, "
                             "discovery_method, first_seen, last_seen, network_layer, parent_device_id, notes, "
                             "tags, custom_fields, id) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
            BindDeviceFields(insert, device);
            insert.Run();
            WriteAddresses(device.id, device.ip_addresses);
            created = true;
        }

        tx.Commit();
        return created;
    }

    std::optional<Device> SqliteDeviceStore::GetDevice(const std::string &id)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        return LoadDevice(id);
    }

    std::vector<Device> SqliteDeviceStore::ListDevices()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);

        std::map<std::string, std::vector<std::string>> addresses;
        {
            Statement stmt(db_, "SELECT device_id, ip FROM device_addresses ORDER BY device_id, position;");
            while (stmt.Step())
                addresses[stmt.Text(0)].push_back(stmt.Text(1));
        }

        std::vector<Device> devices;
        std::string sql = std::string("SELECT ") + kDeviceColumns + " FROM devices ORDER BY id;";
        Statement stmt(db_, sql.c_str());
        while (stmt.Step())
        {
            Device d = ReadDevice(stmt);
            d.ip_addresses = addresses[d.id];
            devices.push_back(std::move(d));
        }
        return devices;
    }

    void SqliteDeviceStore::UpdateDeviceStatus(const std::string &id, recon::DeviceStatus status)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        Statement stmt(db_, "UPDATE devices SET status = ? WHERE id = ?;");
        stmt.Bind(1, recon::ToString(status)).Bind(2, id).Run();
        if (sqlite3_changes(db_) == 0)
            throw StoreError("device " + id + " not found");
    }

    void SqliteDeviceStore::UpdateDeviceHierarchy(const std::string &id, recon::NetworkLayer layer,
                                                  const std::string &parent_id)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        Statement stmt(db_, "UPDATE devices SET network_layer = ?, parent_device_id = ? WHERE id = ?;");
        stmt.Bind(1, static_cast<int>(layer)).Bind(2, parent_id).Bind(3, id).Run();
        if (sqlite3_changes(db_) == 0)
            throw StoreError("device " + id + " not found");
    }

    void SqliteDeviceStore::InsertLink(const TopologyLink &link)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        auto discovered = link.discovered_at == recon::Timestamp{} ? recon::NowUtc() : link.discovered_at;

        Statement stmt(db_,
                       "INSERT OR IGNORE INTO topology_links (source_device_id, target_device_id, link_type, discovered_at) "
                       "VALUES (?, ?, ?, ?);");
        stmt.Bind(1, link.source_device_id)
            .Bind(2, link.target_device_id)
            .Bind(3, recon::ToString(link.link_type))
            .Bind(4, recon::FormatTimestamp(discovered))
            .Run();
    }

    std::vector<TopologyLink> SqliteDeviceStore::ListLinks()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<TopologyLink> links;
        Statement stmt(db_,
                       "SELECT source_device_id, target_device_id, link_type, discovered_at "
                       "FROM topology_links ORDER BY id;");
        while (stmt.Step())
        {
            TopologyLink link;
            link.source_device_id = stmt.Text(0);
            link.target_device_id = stmt.Text(1);
            link.link_type = recon::LinkTypeFromString(stmt.Text(2));
            link.discovered_at = ReadTime(stmt.Text(3));
            links.push_back(std::move(link));
        }
        return links;
    }

    void SqliteDeviceStore::CreateScan(ScanResult &scan)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        scan.id = common::NewUuid();
        scan.started_at = recon::NowUtc();
        scan.ended_at.reset();
        scan.status = recon::ScanStatus::Running;

        Statement stmt(db_,
                       "INSERT INTO scans (id, subnet, started_at, status, total, online, error_msg) "
                       "VALUES (?, ?, ?, ?, ?, ?, ?);");
        stmt.Bind(1, scan.id)
            .Bind(2, scan.subnet)
            .Bind(3, recon::FormatTimestamp(scan.started_at))
            .Bind(4, recon::ToString(scan.status))
            .Bind(5, scan.total)
            .Bind(6, scan.online)
            .Bind(7, scan.error_msg)
            .Run();
    }

    bool SqliteDeviceStore::ScanExists(const std::string &id)
    {
        Statement stmt(db_, "SELECT 1 FROM scans WHERE id = ?;");
        stmt.Bind(1, id);
        return stmt.Step();
    }

    void SqliteDeviceStore::UpdateScan(const ScanResult &scan)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);

        // Terminal scans are immutable, so only running rows are touched.
        Statement stmt(db_,
                       "UPDATE scans SET status = ?, ended_at = ?, total = ?, online = ?, error_msg = ? "
                       "WHERE id = ? AND status = 'running';");
        stmt.Bind(1, recon::ToString(scan.status));
        if (scan.ended_at)
            stmt.Bind(2, recon::FormatTimestamp(*scan.ended_at));
        else
            stmt.BindNull(2);
        stmt.Bind(3, scan.total).Bind(4, scan.online).Bind(5, scan.error_msg).Bind(6, scan.id).Run();

        if (sqlite3_changes(db_) == 0 && !ScanExists(scan.id))
            throw StoreError("scan " + scan.id + " not found");
    }

    std::optional<ScanResult> SqliteDeviceStore::GetScan(const std::string &id)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        Statement stmt(db_,
                       "SELECT id, subnet, started_at, ended_at, status, total, online, error_msg "
                       "FROM scans WHERE id = ?;");
        stmt.Bind(1, id);
        if (!stmt.Step())
            return std::nullopt;
        return ReadScan(stmt);
    }

    std::vector<ScanResult> SqliteDeviceStore::ListScans(int limit, int offset)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<ScanResult> scans;
        Statement stmt(db_,
                       "SELECT id, subnet, started_at, ended_at, status, total, online, error_msg "
                       "FROM scans ORDER BY started_at DESC, rowid DESC LIMIT ? OFFSET ?;");
        stmt.Bind(1, std::max(limit, 0)).Bind(2, std::max(offset, 0));
        while (stmt.Step())
            scans.push_back(ReadScan(stmt));
        return scans;
    }

    int SqliteDeviceStore::CountScans()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        Statement stmt(db_, "SELECT COUNT(*) FROM scans;");
        return stmt.Step() ? stmt.Int(0) : 0;
    }

    void SqliteDeviceStore::LinkScanDevice(const std::string &scan_id, const std::string &device_id)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        Statement stmt(db_, "INSERT OR IGNORE INTO scan_devices (scan_id, device_id) VALUES (?, ?);");
        stmt.Bind(1, scan_id).Bind(2, device_id).Run();
    }

    std::vector<std::string> SqliteDeviceStore::ListScanDevices(const std::string &scan_id)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<std::string> ids;
        Statement stmt(db_, "SELECT device_id FROM scan_devices WHERE scan_id = ? ORDER BY rowid;");
        stmt.Bind(1, scan_id);
        while (stmt.Step())
            ids.push_back(stmt.Text(0));
        return ids;
    }
}
