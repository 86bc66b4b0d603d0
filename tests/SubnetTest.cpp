#include <gtest/gtest.h>

#include "../recon/Errors.hpp"
#include "../recon/Subnet.hpp"

using namespace net_recon::recon;

TEST(Subnet, SlashTwentyFour)
{
    Subnet subnet = Subnet::Parse("192.168.1.0/24");
    EXPECT_EQ(254u, subnet.HostCount());

    auto hosts = subnet.Hosts();
    ASSERT_EQ(254u, hosts.size());
    EXPECT_EQ("192.168.1.1", hosts.front());
    EXPECT_EQ("192.168.1.254", hosts.back());
    EXPECT_EQ("192.168.1.0/24", subnet.ToString());
}

TEST(Subnet, HostBitsAreMasked)
{
    Subnet subnet = Subnet::Parse("10.1.2.77/16");
    EXPECT_EQ("10.1.0.0/16", subnet.ToString());
    EXPECT_TRUE(subnet.Contains("10.1.255.3"));
    EXPECT_FALSE(subnet.Contains("10.2.0.1"));
    EXPECT_FALSE(subnet.Contains("not-an-ip"));
}

TEST(Subnet, SmallPrefixes)
{
    EXPECT_EQ(2u, Subnet::Parse("192.168.1.4/30").HostCount());
    EXPECT_EQ(2u, Subnet::Parse("192.168.1.4/31").HostCount());

    auto single = Subnet::Parse("192.168.1.9/32").Hosts();
    ASSERT_EQ(1u, single.size());
    EXPECT_EQ("192.168.1.9", single.front());
}

TEST(Subnet, RejectsMalformedInput)
{
    EXPECT_THROW(Subnet::Parse("192.168.1.0"), PreconditionError);
    EXPECT_THROW(Subnet::Parse("192.168.1.0/33"), PreconditionError);
    EXPECT_THROW(Subnet::Parse("192.168.1.0/"), PreconditionError);
    EXPECT_THROW(Subnet::Parse("192.168.300.0/24"), PreconditionError);
    EXPECT_THROW(Subnet::Parse("fe80::/64"), PreconditionError);
    EXPECT_THROW(Subnet::Parse("192.168.1.0/2x"), PreconditionError);
}

TEST(Ipv4, RoundTripsThroughHostOrder)
{
    auto value = ParseIpv4("192.168.1.10");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(0xC0A8010Au, *value);
    EXPECT_EQ("192.168.1.10", FormatIpv4(*value));
    EXPECT_FALSE(ParseIpv4("192.168.1").has_value());
}
