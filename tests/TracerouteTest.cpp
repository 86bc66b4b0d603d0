#include <gtest/gtest.h>

#include "Fakes.hpp"
#include "../recon/Traceroute.hpp"

#include <future>

using namespace net_recon::recon;
using net_recon::test::FakeResolver;
using net_recon::test::FakeTransport;

namespace
{
    TracerouteOptions FastOptions()
    {
        TracerouteOptions options;
        options.hop_timeout = std::chrono::milliseconds(100);
        options.reverse_lookup_timeout = std::chrono::milliseconds(100);
        return options;
    }

    // Lets the test inspect the transport after the engine has released it.
    class SharedTransport : public IcmpTransport
    {
    public:
        explicit SharedTransport(std::shared_ptr<FakeTransport> inner) : m_inner(std::move(inner)) {}

        uint16_t Identifier() const override { return m_inner->Identifier(); }
        bool SetTtl(int ttl) override { return m_inner->SetTtl(ttl); }
        bool SendEcho(const std::string &target, uint16_t sequence) override { return m_inner->SendEcho(target, sequence); }
        std::optional<IcmpReply> Receive(std::chrono::steady_clock::time_point deadline) override
        {
            return m_inner->Receive(deadline);
        }

    private:
        std::shared_ptr<FakeTransport> m_inner;
    };

    TracerouteEngine::TransportFactory Sharing(std::shared_ptr<FakeTransport> transport)
    {
        return [transport]() { return std::make_unique<SharedTransport>(transport); };
    }
}

TEST(TracerouteClamp, MaxHops)
{
    EXPECT_EQ(30, ClampMaxHops(0));
    EXPECT_EQ(30, ClampMaxHops(-4));
    EXPECT_EQ(5, ClampMaxHops(5));
    EXPECT_EQ(64, ClampMaxHops(100));
    EXPECT_EQ(12, ClampMaxHops(0, 12));
}

TEST(TracerouteClamp, HopTimeout)
{
    using std::chrono::milliseconds;
    EXPECT_EQ(milliseconds(1000), ClampHopTimeout(milliseconds(0)));
    EXPECT_EQ(milliseconds(100), ClampHopTimeout(milliseconds(20)));
    EXPECT_EQ(milliseconds(2500), ClampHopTimeout(milliseconds(2500)));
    EXPECT_EQ(milliseconds(10000), ClampHopTimeout(milliseconds(60000)));
}

TEST(Traceroute, ReachesTargetAfterSilentHops)
{
    auto resolver = std::make_shared<FakeResolver>();
    resolver->reverse["10.0.0.254"] = "edge.isp.example";

    TracerouteEngine engine(
        []() {
            auto transport = std::make_unique<FakeTransport>();
            transport->Script(3, IcmpKind::TimeExceeded, "10.0.0.254");
            transport->Script(4, IcmpKind::EchoReply, "8.8.8.8");
            return transport;
        },
        resolver, FastOptions());

    TracerouteResult result = engine.Run("8.8.8.8", 10, std::chrono::milliseconds(100));

    EXPECT_EQ("8.8.8.8", result.target);
    EXPECT_EQ("8.8.8.8", result.address);
    EXPECT_TRUE(result.reached);
    EXPECT_EQ(4, result.total_hops);
    ASSERT_EQ(4u, result.hops.size());

    EXPECT_TRUE(result.hops[0].timeout);
    EXPECT_TRUE(result.hops[1].timeout);
    EXPECT_EQ(1, result.hops[0].hop);

    EXPECT_FALSE(result.hops[2].timeout);
    EXPECT_EQ("10.0.0.254", result.hops[2].ip);
    EXPECT_EQ("edge.isp.example", result.hops[2].hostname);

    EXPECT_FALSE(result.hops[3].timeout);
    EXPECT_EQ(4, result.hops[3].hop);
    EXPECT_EQ("8.8.8.8", result.hops[3].ip);
    EXPECT_EQ("", result.hops[3].hostname);
    EXPECT_GE(result.duration_ms, 0.0);
}

TEST(Traceroute, IgnoresRepliesToOtherProbes)
{
    auto transport = std::make_shared<FakeTransport>();
    transport->Script(1, IcmpKind::EchoReply, "192.0.2.99", FakeTransport::kIdent, 7);
    transport->Script(1, IcmpKind::EchoReply, "192.0.2.98", 0x1111, 1);
    transport->Script(1, IcmpKind::TimeExceeded, "192.168.1.1");
    transport->Script(2, IcmpKind::EchoReply, "192.0.2.10");
    TracerouteEngine engine(Sharing(transport), nullptr, FastOptions());

    TracerouteResult result = engine.Run("192.0.2.10", 5, std::chrono::milliseconds(100));

    ASSERT_EQ(2u, result.hops.size());
    EXPECT_EQ("192.168.1.1", result.hops[0].ip);
    EXPECT_FALSE(result.hops[0].timeout);
    EXPECT_TRUE(result.reached);

    ASSERT_EQ(2u, transport->sequences.size());
    EXPECT_EQ(1, transport->sequences[0]);
    EXPECT_EQ(2, transport->sequences[1]);
}

// A matching Destination Unreachable from a router resolves that hop and the trace goes on.
// Sent by the target itself it means the echo arrived, so the trace ends there as reached.
TEST(Traceroute, UnreachableFromTargetCountsAsReached)
{
    TracerouteEngine engine(
        []() {
            auto transport = std::make_unique<FakeTransport>();
            transport->Script(1, IcmpKind::DestUnreachable, "192.168.1.1");
            transport->Script(2, IcmpKind::DestUnreachable, "192.0.2.10");
            return transport;
        },
        nullptr, FastOptions());

    TracerouteResult result = engine.Run("192.0.2.10", 5, std::chrono::milliseconds(100));

    EXPECT_TRUE(result.reached);
    EXPECT_EQ(2, result.total_hops);
    ASSERT_EQ(2u, result.hops.size());
    EXPECT_FALSE(result.hops[0].timeout);
    EXPECT_EQ("192.168.1.1", result.hops[0].ip);
    EXPECT_EQ("192.0.2.10", result.hops[1].ip);
}

TEST(Traceroute, StopsAtMaxHops)
{
    TracerouteEngine engine([]() { return std::make_unique<FakeTransport>(); }, nullptr, FastOptions());

    TracerouteResult result = engine.Run("192.0.2.10", 2, std::chrono::milliseconds(100));

    EXPECT_FALSE(result.reached);
    EXPECT_EQ(2, result.total_hops);
    for (const auto &hop : result.hops)
        EXPECT_TRUE(hop.timeout);
}

TEST(Traceroute, ResolvesHostnameTargets)
{
    auto resolver = std::make_shared<FakeResolver>();
    resolver->forward["gateway.example"] = {"2001:db8::1", "192.0.2.1"};

    auto transport = std::make_shared<FakeTransport>();
    TracerouteEngine engine(Sharing(transport), resolver, FastOptions());
    TracerouteResult result = engine.Run("gateway.example", 1, std::chrono::milliseconds(100));

    ASSERT_EQ(1u, transport->targets.size());
    EXPECT_EQ("192.0.2.1", transport->targets[0]);
    EXPECT_EQ("gateway.example", result.target);
    EXPECT_EQ("192.0.2.1", result.address);
}

TEST(Traceroute, RejectsBadTargets)
{
    auto resolver = std::make_shared<FakeResolver>();
    resolver->forward["v6only.example"] = {"2001:db8::1"};
    TracerouteEngine engine([]() { return std::make_unique<FakeTransport>(); }, resolver, FastOptions());

    EXPECT_THROW(engine.Run("", 5, std::chrono::milliseconds(100)), PreconditionError);
    EXPECT_THROW(engine.Run("::1", 5, std::chrono::milliseconds(100)), PreconditionError);
    EXPECT_THROW(engine.Run("v6only.example", 5, std::chrono::milliseconds(100)), PreconditionError);
    EXPECT_THROW(engine.Run("nowhere.example", 5, std::chrono::milliseconds(100)), PreconditionError);
}

TEST(Traceroute, SecondRunIsBusyAndCancelKeepsPartialHops)
{
    std::promise<void> started;
    auto startedFuture = started.get_future();

    TracerouteEngine engine(
        [&started]() {
            started.set_value();
            auto transport = std::make_unique<FakeTransport>();
            transport->Script(1, IcmpKind::TimeExceeded, "192.168.1.1");
            return transport;
        },
        nullptr, FastOptions());

    CancelSource cancel;
    auto first = std::async(std::launch::async, [&]() {
        return engine.Run("192.0.2.10", 64, std::chrono::milliseconds(10000), cancel.Token());
    });

    ASSERT_EQ(std::future_status::ready, startedFuture.wait_for(std::chrono::seconds(5)));
    EXPECT_THROW(engine.Run("192.0.2.10", 5, std::chrono::milliseconds(100)), ResourceBusyError);

    // Give hop 1 time to settle; hop 2 waits for its 10 s timeout.
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    cancel.Cancel();

    try
    {
        first.get();
        FAIL() << "cancelled run returned normally";
    }
    catch (const TracerouteCancelled &e)
    {
        ASSERT_EQ(1u, e.Partial().hops.size());
        EXPECT_EQ("192.168.1.1", e.Partial().hops[0].ip);
        EXPECT_EQ(1, e.Partial().total_hops);
        EXPECT_FALSE(e.Partial().reached);
    }
}
