#include "EventBus.hpp"

#include <iostream>

namespace net_recon::recon
{
    Event MakeDeviceEvent(bool created, const Device &device)
    {
        Event event;
        event.topic = created ? topics::DeviceDiscovered : topics::DeviceUpdated;
        event.timestamp = NowUtc();
        event.device = device;
        return event;
    }

    Event MakeScanEvent(const char *topic, const ScanResult &scan)
    {
        Event event;
        event.topic = topic;
        event.timestamp = NowUtc();
        event.scan = scan;
        return event;
    }

    Event MakeLostEvent(const Device &device)
    {
        Event event;
        event.topic = topics::DeviceLost;
        event.timestamp = NowUtc();
        event.lost = LostDevice{device.id, device.PrimaryIp(), device.last_seen};
        return event;
    }

    void InProcessEventBus::Subscribe(const std::string &topic, EventHandler handler)
    {
        if (!handler)
            return;
        std::lock_guard<std::mutex> lock(m_mutex);
        m_subscriptions.push_back({topic, std::move(handler)});
    }

    void InProcessEventBus::Publish(const Event &event)
    {
        std::vector<Subscription> targets;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (const auto &sub : m_subscriptions)
            {
                if (sub.topic.empty() || sub.topic == event.topic)
                    targets.push_back(sub);
            }
        }

        for (const auto &sub : targets)
        {
            try
            {
                sub.handler(event);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Events] Subscriber for " << event.topic << " failed: " << e.what() << "\n";
            }
        }
    }
}
