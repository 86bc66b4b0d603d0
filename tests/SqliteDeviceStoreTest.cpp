#include <gtest/gtest.h>

#include "../recon/Errors.hpp"
#include "../server/SqliteDeviceStore.hpp"

#include <chrono>

using namespace net_recon::recon;
using net_recon::server::SqliteDeviceStore;

namespace
{
    class SqliteDeviceStoreTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            store.Initialize(":memory:");
        }

        SqliteDeviceStore store;
    };

    Device Observed(const std::string &ip, const std::string &mac = "")
    {
        Device d;
        d.ip_addresses = {ip};
        d.mac_address = mac;
        d.status = DeviceStatus::Online;
        d.discovery_method = DiscoveryMethod::Icmp;
        return d;
    }
}

TEST_F(SqliteDeviceStoreTest, UpsertCreatesThenMergesByMac)
{
    Device first = Observed("192.168.1.20", "AA:BB:CC:DD:EE:01");
    first.hostname = "nas";
    first.tags = {"storage"};
    first.custom_fields = {{"rack", "2"}};
    ASSERT_TRUE(store.UpsertDevice(first));
    ASSERT_FALSE(first.id.empty());

    Device again = Observed("192.168.1.21", "AA:BB:CC:DD:EE:01");
    again.device_type = DeviceType::Server;
    again.tags = {"storage", "backup"};
    again.status = DeviceStatus::Offline;
    again.last_seen = first.last_seen + std::chrono::hours(1);
    EXPECT_FALSE(store.UpsertDevice(again));
    EXPECT_EQ(first.id, again.id);

    auto stored = store.GetDevice(first.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ((std::vector<std::string>{"192.168.1.21", "192.168.1.20"}), stored->ip_addresses);
    EXPECT_EQ("192.168.1.21", stored->PrimaryIp());
    EXPECT_EQ("nas", stored->hostname);
    EXPECT_EQ(DeviceType::Server, stored->device_type);
    EXPECT_EQ((std::vector<std::string>{"storage", "backup"}), stored->tags);
    EXPECT_EQ("2", stored->custom_fields["rack"]);
    EXPECT_EQ(DeviceStatus::Offline, stored->status);
    EXPECT_TRUE(stored->last_seen == first.last_seen + std::chrono::hours(1));
    EXPECT_TRUE(stored->first_seen == first.first_seen);
    EXPECT_EQ(1u, store.ListDevices().size());
}

TEST_F(SqliteDeviceStoreTest, HostKnownByMacIsMatchedWithoutMac)
{
    Device arp = Observed("192.168.1.5", "AA:BB:CC:DD:EE:05");
    arp.discovery_method = DiscoveryMethod::Arp;
    ASSERT_TRUE(store.UpsertDevice(arp));

    Device mdns = Observed("192.168.1.5");
    mdns.hostname = "printer";
    mdns.discovery_method = DiscoveryMethod::Mdns;
    EXPECT_FALSE(store.UpsertDevice(mdns));
    EXPECT_EQ(arp.id, mdns.id);

    auto devices = store.ListDevices();
    ASSERT_EQ(1u, devices.size());
    EXPECT_EQ("AA:BB:CC:DD:EE:05", devices[0].mac_address);
    EXPECT_EQ("printer", devices[0].hostname);
    EXPECT_EQ((std::vector<std::string>{"192.168.1.5"}), devices[0].ip_addresses);
}

TEST_F(SqliteDeviceStoreTest, UpsertMatchesByIpWhenMacUnknown)
{
    Device pinged = Observed("192.168.1.30");
    ASSERT_TRUE(store.UpsertDevice(pinged));

    Device arp = Observed("192.168.1.30", "AA:BB:CC:DD:EE:30");
    arp.discovery_method = DiscoveryMethod::Arp;
    arp.manufacturer = "Acme";
    EXPECT_FALSE(store.UpsertDevice(arp));
    EXPECT_EQ(pinged.id, arp.id);

    auto stored = store.GetDevice(pinged.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ("AA:BB:CC:DD:EE:30", stored->mac_address);
    EXPECT_EQ("Acme", stored->manufacturer);
}

TEST_F(SqliteDeviceStoreTest, KnownTypeIsNotDowngraded)
{
    Device printer = Observed("192.168.1.40");
    printer.device_type = DeviceType::Printer;
    store.UpsertDevice(printer);

    Device plain = Observed("192.168.1.40");
    store.UpsertDevice(plain);

    EXPECT_EQ(DeviceType::Printer, store.GetDevice(printer.id)->device_type);
}

TEST_F(SqliteDeviceStoreTest, AddressMovesToNewOwner)
{
    Device a = Observed("192.168.1.50", "AA:BB:CC:DD:EE:0A");
    store.UpsertDevice(a);

    Device b = Observed("192.168.1.50", "AA:BB:CC:DD:EE:0B");
    EXPECT_TRUE(store.UpsertDevice(b));
    EXPECT_NE(a.id, b.id);

    EXPECT_TRUE(store.GetDevice(a.id)->ip_addresses.empty());
    EXPECT_EQ((std::vector<std::string>{"192.168.1.50"}), store.GetDevice(b.id)->ip_addresses);
}

TEST_F(SqliteDeviceStoreTest, StatusAndHierarchyUpdates)
{
    Device d = Observed("192.168.1.60");
    store.UpsertDevice(d);

    store.UpdateDeviceStatus(d.id, DeviceStatus::Offline);
    store.UpdateDeviceHierarchy(d.id, NetworkLayer::Endpoint, "router-id");

    auto stored = store.GetDevice(d.id);
    EXPECT_EQ(DeviceStatus::Offline, stored->status);
    EXPECT_EQ(NetworkLayer::Endpoint, stored->network_layer);
    EXPECT_EQ("router-id", stored->parent_device_id);

    EXPECT_THROW(store.UpdateDeviceStatus("missing", DeviceStatus::Online), StoreError);
    EXPECT_THROW(store.UpdateDeviceHierarchy("missing", NetworkLayer::Access, ""), StoreError);
    EXPECT_FALSE(store.GetDevice("missing").has_value());
}

TEST_F(SqliteDeviceStoreTest, DuplicateLinksAreIgnored)
{
    store.InsertLink({"a", "b", LinkType::Arp, {}});
    store.InsertLink({"a", "b", LinkType::Arp, {}});
    store.InsertLink({"a", "b", LinkType::Fdb, {}});

    auto links = store.ListLinks();
    ASSERT_EQ(2u, links.size());
    EXPECT_EQ(LinkType::Arp, links[0].link_type);
    EXPECT_EQ(LinkType::Fdb, links[1].link_type);
    EXPECT_NE(Timestamp{}, links[0].discovered_at);
}

TEST_F(SqliteDeviceStoreTest, ScanLifecycle)
{
    ScanResult scan;
    scan.subnet = "192.168.1.0/24";
    store.CreateScan(scan);
    ASSERT_FALSE(scan.id.empty());
    EXPECT_EQ(ScanStatus::Running, scan.status);

    scan.total = 100;
    scan.online = 3;
    store.UpdateScan(scan);
    EXPECT_EQ(100, store.GetScan(scan.id)->total);

    scan.total = 254;
    scan.status = ScanStatus::Completed;
    scan.ended_at = NowUtc();
    store.UpdateScan(scan);

    // Terminal records no longer change.
    ScanResult late = scan;
    late.status = ScanStatus::Failed;
    late.error_msg = "late";
    store.UpdateScan(late);

    auto stored = store.GetScan(scan.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(ScanStatus::Completed, stored->status);
    EXPECT_EQ(254, stored->total);
    EXPECT_EQ(3, stored->online);
    EXPECT_EQ("", stored->error_msg);
    ASSERT_TRUE(stored->ended_at.has_value());
    EXPECT_EQ(*scan.ended_at, *stored->ended_at);

    ScanResult ghost;
    ghost.id = "missing";
    EXPECT_THROW(store.UpdateScan(ghost), StoreError);
    EXPECT_FALSE(store.GetScan("missing").has_value());
}

TEST_F(SqliteDeviceStoreTest, ListScansNewestFirstWithPaging)
{
    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i)
    {
        ScanResult scan;
        scan.subnet = "10.0." + std::to_string(i) + ".0/24";
        store.CreateScan(scan);
        ids.push_back(scan.id);
    }

    EXPECT_EQ(3, store.CountScans());

    auto all = store.ListScans(10, 0);
    ASSERT_EQ(3u, all.size());
    EXPECT_EQ(ids[2], all[0].id);
    EXPECT_EQ(ids[0], all[2].id);

    auto page = store.ListScans(1, 1);
    ASSERT_EQ(1u, page.size());
    EXPECT_EQ(ids[1], page[0].id);

    EXPECT_TRUE(store.ListScans(10, 5).empty());
}

TEST_F(SqliteDeviceStoreTest, ScanDevicesAreDeduplicated)
{
    ScanResult scan;
    scan.subnet = "192.168.1.0/24";
    store.CreateScan(scan);

    Device d = Observed("192.168.1.70");
    store.UpsertDevice(d);

    store.LinkScanDevice(scan.id, d.id);
    store.LinkScanDevice(scan.id, d.id);

    EXPECT_EQ((std::vector<std::string>{d.id}), store.ListScanDevices(scan.id));
    EXPECT_TRUE(store.ListScanDevices("missing").empty());
}

TEST(SqliteDeviceStore, OpenFailureThrows)
{
    SqliteDeviceStore store;
    EXPECT_THROW(store.Initialize("/nonexistent-dir/sub/netrecon.db"), StoreError);
}
