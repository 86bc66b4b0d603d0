#include <gtest/gtest.h>

#include "../recon/EventBus.hpp"

#include <stdexcept>

using namespace net_recon::recon;

TEST(InProcessEventBus, DeliversByTopic)
{
    InProcessEventBus bus;
    std::vector<std::string> scans;
    std::vector<std::string> everything;

    bus.Subscribe(topics::ScanCompleted, [&](const Event &e) { scans.push_back(e.scan->id); });
    bus.Subscribe("", [&](const Event &e) { everything.push_back(e.topic); });

    ScanResult scan;
    scan.id = "scan-1";
    bus.Publish(MakeScanEvent(topics::ScanStarted, scan));
    bus.Publish(MakeScanEvent(topics::ScanCompleted, scan));

    ASSERT_EQ(1u, scans.size());
    EXPECT_EQ("scan-1", scans[0]);
    EXPECT_EQ((std::vector<std::string>{topics::ScanStarted, topics::ScanCompleted}), everything);
}

TEST(InProcessEventBus, ThrowingSubscriberDoesNotStopOthers)
{
    InProcessEventBus bus;
    int delivered = 0;

    bus.Subscribe("", [](const Event &) { throw std::runtime_error("boom"); });
    bus.Subscribe("", [&](const Event &) { ++delivered; });

    Device device;
    device.id = "d1";
    EXPECT_NO_THROW(bus.Publish(MakeDeviceEvent(true, device)));
    EXPECT_EQ(1, delivered);
}

TEST(InProcessEventBus, SubscriberMayPublish)
{
    InProcessEventBus bus;
    int lost = 0;

    bus.Subscribe(topics::DeviceUpdated, [&](const Event &e) { bus.Publish(MakeLostEvent(*e.device)); });
    bus.Subscribe(topics::DeviceLost, [&](const Event &) { ++lost; });

    Device device;
    device.id = "d1";
    bus.Publish(MakeDeviceEvent(false, device));
    EXPECT_EQ(1, lost);
}

TEST(Events, PayloadMatchesTopic)
{
    Device device;
    device.id = "d1";
    device.ip_addresses = {"192.168.1.5", "10.0.0.5"};
    device.last_seen = NowUtc();

    Event created = MakeDeviceEvent(true, device);
    EXPECT_EQ(topics::DeviceDiscovered, created.topic);
    EXPECT_EQ("recon", created.source);
    ASSERT_TRUE(created.device.has_value());
    EXPECT_FALSE(created.scan.has_value());

    EXPECT_EQ(topics::DeviceUpdated, MakeDeviceEvent(false, device).topic);

    Event lost = MakeLostEvent(device);
    EXPECT_EQ(topics::DeviceLost, lost.topic);
    ASSERT_TRUE(lost.lost.has_value());
    EXPECT_EQ("d1", lost.lost->device_id);
    EXPECT_EQ("192.168.1.5", lost.lost->ip);
    EXPECT_EQ(device.last_seen, lost.lost->last_seen);
    EXPECT_FALSE(lost.device.has_value());
}
