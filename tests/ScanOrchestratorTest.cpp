#include <gtest/gtest.h>

#include "Fakes.hpp"
#include "../recon/ScanOrchestrator.hpp"
#include "../server/SqliteDeviceStore.hpp"

#include <algorithm>

using namespace net_recon::recon;
using net_recon::server::SqliteDeviceStore;
using namespace net_recon::test;

namespace
{
    class ScanOrchestratorTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            store.Initialize(":memory:");
        }

        std::unique_ptr<ScanOrchestrator> MakeScanner(ScanOptions options = {})
        {
            return std::make_unique<ScanOrchestrator>(store, events, pinger, arp, oui, interfaces, options);
        }

        ScanResult RunToCompletion(ScanOrchestrator &scanner, const std::string &cidr,
                                   const CancelToken &cancel = CancelToken())
        {
            ScanResult started = scanner.Run(cidr, cancel);
            scanner.Drain();
            auto finished = store.GetScan(started.id);
            EXPECT_TRUE(finished.has_value());
            return finished.value_or(started);
        }

        std::optional<Device> FindByIp(const std::string &ip)
        {
            for (auto &d : store.ListDevices())
            {
                if (std::find(d.ip_addresses.begin(), d.ip_addresses.end(), ip) != d.ip_addresses.end())
                    return d;
            }
            return std::nullopt;
        }

        SqliteDeviceStore store;
        RecordingEventBus events;
        FakePinger pinger{{"192.168.1.1", "192.168.1.2", "192.168.1.3"}};
        FakeArpReader arp{{
            {"192.168.1.2", "AA:BB:CC:00:00:02"},
            {"192.168.1.3", "AA:BB:CC:00:00:03"},
            {"192.168.1.50", "DC:A6:32:00:00:50"},
            {"10.0.0.5", "AA:BB:CC:00:00:99"},
        }};
        OuiTable oui{std::unordered_map<std::string, std::string>{{"DC:A6:32", "Raspberry Pi Trading Ltd"}}};
        FakeInterfaceProvider interfaces;
    };
}

TEST_F(ScanOrchestratorTest, CombinesPingAndArp)
{
    auto scanner = MakeScanner();
    ScanResult scan = RunToCompletion(*scanner, "192.168.1.0/24");

    EXPECT_EQ(ScanStatus::Completed, scan.status);
    EXPECT_EQ(254, scan.total);
    EXPECT_EQ(4, scan.online);
    EXPECT_TRUE(scan.ended_at.has_value());
    EXPECT_EQ("", scan.error_msg);
    EXPECT_EQ(254, pinger.calls.load());

    EXPECT_EQ(4u, store.ListScanDevices(scan.id).size());
    EXPECT_EQ(4u, store.ListDevices().size());
    EXPECT_FALSE(FindByIp("10.0.0.5").has_value());

    auto arpOnly = FindByIp("192.168.1.50");
    ASSERT_TRUE(arpOnly.has_value());
    EXPECT_EQ(DiscoveryMethod::Arp, arpOnly->discovery_method);
    EXPECT_EQ("DC:A6:32:00:00:50", arpOnly->mac_address);
    EXPECT_EQ("Raspberry Pi Trading Ltd", arpOnly->manufacturer);
    EXPECT_EQ(DeviceStatus::Online, arpOnly->status);

    auto pingOnly = FindByIp("192.168.1.1");
    ASSERT_TRUE(pingOnly.has_value());
    EXPECT_EQ(DiscoveryMethod::Icmp, pingOnly->discovery_method);
    EXPECT_EQ("", pingOnly->mac_address);
    EXPECT_EQ(NetworkLayer::Endpoint, pingOnly->network_layer);

    EXPECT_EQ(1u, events.Count(topics::ScanStarted));
    EXPECT_EQ(4u, events.Count(topics::DeviceDiscovered));
    EXPECT_EQ(1u, events.Count(topics::ScanCompleted));
    EXPECT_EQ(topics::ScanCompleted, events.Events().back().topic);
}

TEST_F(ScanOrchestratorTest, RunReturnsRunningRecord)
{
    auto scanner = MakeScanner();
    ScanResult started = scanner->Run("192.168.1.0/28");

    EXPECT_FALSE(started.id.empty());
    EXPECT_EQ(ScanStatus::Running, started.status);
    EXPECT_EQ("192.168.1.0/28", started.subnet);
    scanner->Drain();
}

TEST_F(ScanOrchestratorTest, SecondScanUpdatesExistingDevices)
{
    auto scanner = MakeScanner();
    RunToCompletion(*scanner, "192.168.1.0/24");
    RunToCompletion(*scanner, "192.168.1.0/24");

    EXPECT_EQ(4u, store.ListDevices().size());
    EXPECT_EQ(4u, events.Count(topics::DeviceDiscovered));
    EXPECT_EQ(4u, events.Count(topics::DeviceUpdated));
    EXPECT_EQ(2, store.CountScans());
}

TEST_F(ScanOrchestratorTest, RegistersScannerHost)
{
    interfaces.local = LocalInterface{"eth0", "192.168.1.10", "DC:A6:32:00:00:10"};

    auto scanner = MakeScanner();
    ScanResult scan = RunToCompletion(*scanner, "192.168.1.0/24");

    EXPECT_EQ(4, scan.online);
    EXPECT_EQ(5u, store.ListScanDevices(scan.id).size());

    auto self = FindByIp("192.168.1.10");
    ASSERT_TRUE(self.has_value());
    EXPECT_EQ(DiscoveryMethod::Manual, self->discovery_method);
    EXPECT_EQ("Raspberry Pi Trading Ltd", self->manufacturer);
    ASSERT_EQ(1u, self->tags.size());
    EXPECT_EQ("scanner", self->tags[0]);

    auto links = store.ListLinks();
    EXPECT_EQ(3u, links.size());
    for (const auto &link : links)
    {
        EXPECT_EQ(self->id, link.source_device_id);
        EXPECT_EQ(LinkType::Arp, link.link_type);
    }
}

TEST_F(ScanOrchestratorTest, SilentDevicesAreMarkedLost)
{
    Device old;
    old.ip_addresses = {"192.168.1.77"};
    old.status = DeviceStatus::Online;
    old.discovery_method = DiscoveryMethod::Icmp;
    store.UpsertDevice(old);

    Device elsewhere;
    elsewhere.ip_addresses = {"10.9.9.9"};
    elsewhere.status = DeviceStatus::Online;
    store.UpsertDevice(elsewhere);

    auto scanner = MakeScanner();
    RunToCompletion(*scanner, "192.168.1.0/24");

    EXPECT_EQ(DeviceStatus::Offline, store.GetDevice(old.id)->status);
    EXPECT_EQ(DeviceStatus::Online, store.GetDevice(elsewhere.id)->status);

    ASSERT_EQ(1u, events.Count(topics::DeviceLost));
    for (const auto &event : events.Events())
    {
        if (event.topic == topics::DeviceLost)
        {
            ASSERT_TRUE(event.lost.has_value());
            EXPECT_EQ(old.id, event.lost->device_id);
            EXPECT_EQ("192.168.1.77", event.lost->ip);
        }
    }
}

TEST_F(ScanOrchestratorTest, RejectsBadSubnetsWithoutRecording)
{
    auto scanner = MakeScanner();
    EXPECT_THROW(scanner->Run("192.168.1.0"), PreconditionError);
    EXPECT_THROW(scanner->Run("192.168.0.0/16"), PreconditionError);
    EXPECT_EQ(0, store.CountScans());
    EXPECT_EQ(0u, events.Events().size());
}

TEST_F(ScanOrchestratorTest, HostLimitIsConfigurable)
{
    ScanOptions options;
    options.max_hosts = 16;
    auto scanner = MakeScanner(options);

    EXPECT_THROW(scanner->Run("192.168.1.0/27"), PreconditionError);
    ScanResult scan = RunToCompletion(*scanner, "192.168.1.0/28");
    EXPECT_EQ(14, scan.total);
}

TEST_F(ScanOrchestratorTest, ProbeFailureFailsScan)
{
    pinger.fail = true;
    auto scanner = MakeScanner();
    ScanResult scan = RunToCompletion(*scanner, "192.168.1.0/24");

    EXPECT_EQ(ScanStatus::Failed, scan.status);
    EXPECT_EQ("no ICMP socket available", scan.error_msg);
    EXPECT_TRUE(scan.ended_at.has_value());
    EXPECT_TRUE(store.ListDevices().empty());
    EXPECT_EQ(1u, events.Count(topics::ScanCompleted));
}

TEST_F(ScanOrchestratorTest, CancelledScanFails)
{
    CancelSource cancel;
    cancel.Cancel();

    auto scanner = MakeScanner();
    ScanResult scan = RunToCompletion(*scanner, "192.168.1.0/24", cancel.Token());

    EXPECT_EQ(ScanStatus::Failed, scan.status);
    EXPECT_EQ("scan cancelled", scan.error_msg);
    EXPECT_TRUE(store.ListDevices().empty());
}

TEST_F(ScanOrchestratorTest, ShutdownRefusesNewScans)
{
    auto scanner = MakeScanner();
    scanner->Shutdown();
    EXPECT_THROW(scanner->Run("192.168.1.0/24"), PreconditionError);
}

TEST_F(ScanOrchestratorTest, OverlappingScanIsRejected)
{
    pinger.delay = std::chrono::milliseconds(50);
    ScanOptions options;
    options.max_concurrency = 2;
    auto scanner = MakeScanner(options);

    ScanResult first = scanner->Run("192.168.1.0/28");
    EXPECT_THROW(scanner->Run("192.168.1.0/24"), ResourceBusyError);
    EXPECT_EQ(1, store.CountScans());
    EXPECT_EQ(1u, events.Count(topics::ScanStarted));

    scanner->Drain();
    EXPECT_EQ(ScanStatus::Completed, store.GetScan(first.id)->status);

    ScanResult next = scanner->Run("192.168.1.0/28");
    EXPECT_NE(first.id, next.id);
    scanner->Drain();
}

TEST_F(ScanOrchestratorTest, UnexpectedPingerErrorFailsScan)
{
    pinger.fault = true;
    auto scanner = MakeScanner();
    ScanResult scan = RunToCompletion(*scanner, "192.168.1.0/24");

    EXPECT_EQ(ScanStatus::Failed, scan.status);
    EXPECT_EQ("driver fault", scan.error_msg);
    EXPECT_TRUE(store.ListDevices().empty());
}
