#pragma once

#include "Models.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace net_recon::recon
{
    namespace topics
    {
        inline constexpr const char *DeviceDiscovered = "recon.device.discovered";
        inline constexpr const char *DeviceUpdated = "recon.device.updated";
        inline constexpr const char *DeviceLost = "recon.device.lost";
        inline constexpr const char *ScanStarted = "recon.scan.started";
        inline constexpr const char *ScanCompleted = "recon.scan.completed";
    }

    struct LostDevice
    {
        std::string device_id;
        std::string ip;
        Timestamp last_seen{};
    };

    // Exactly one payload member is set, depending on the topic.
    struct Event
    {
        std::string topic;
        std::string source = "recon";
        Timestamp timestamp{};

        std::optional<Device> device;
        std::optional<ScanResult> scan;
        std::optional<LostDevice> lost;
    };

    Event MakeDeviceEvent(bool created, const Device &device);
    Event MakeScanEvent(const char *topic, const ScanResult &scan);
    Event MakeLostEvent(const Device &device);

    class EventBus
    {
    public:
        virtual ~EventBus() = default;
        virtual void Publish(const Event &event) = 0;
    };

    using EventHandler = std::function<void(const Event &event)>;

    // Synchronous fan-out in subscription order. A throwing handler is logged and skipped.
    class InProcessEventBus : public EventBus
    {
    public:
        // An empty topic subscribes to everything.
        void Subscribe(const std::string &topic, EventHandler handler);
        void Publish(const Event &event) override;

    private:
        struct Subscription
        {
            std::string topic;
            EventHandler handler;
        };

        std::mutex m_mutex;
        std::vector<Subscription> m_subscriptions;
    };
}
