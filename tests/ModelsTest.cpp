#include <gtest/gtest.h>

#include "../recon/ModelJson.hpp"
#include "../recon/Models.hpp"

using namespace net_recon::recon;

TEST(Models, EnumNames)
{
    EXPECT_EQ("access_point", ToString(DeviceType::AccessPoint));
    EXPECT_EQ(DeviceType::AccessPoint, DeviceTypeFromString("access_point"));
    EXPECT_EQ(DeviceType::Unknown, DeviceTypeFromString("toaster"));
    EXPECT_EQ(ScanStatus::Failed, ScanStatusFromString(ToString(ScanStatus::Failed)));
    EXPECT_EQ(LinkType::Fdb, LinkTypeFromString("fdb"));
    EXPECT_EQ(NetworkLayer::Distribution, NetworkLayerFromString(ToString(NetworkLayer::Distribution)));
}

TEST(Models, Infrastructure)
{
    EXPECT_TRUE(IsInfrastructure(DeviceType::Router));
    EXPECT_TRUE(IsInfrastructure(DeviceType::AccessPoint));
    EXPECT_FALSE(IsInfrastructure(DeviceType::Printer));
    EXPECT_FALSE(IsInfrastructure(DeviceType::Unknown));
}

TEST(Models, Timestamps)
{
    auto parsed = ParseTimestamp("2026-01-02T03:04:05Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ("2026-01-02T03:04:05Z", FormatTimestamp(*parsed));
    EXPECT_FALSE(ParseTimestamp("yesterday").has_value());

    Timestamp now = NowUtc();
    auto reparsed = ParseTimestamp(FormatTimestamp(now));
    ASSERT_TRUE(reparsed.has_value());
    EXPECT_TRUE(now == *reparsed);
}

TEST(ModelJson, ScanOmitsUnsetFields)
{
    ScanResult scan;
    scan.id = "s1";
    scan.subnet = "10.0.0.0/24";
    scan.started_at = *ParseTimestamp("2026-01-02T03:04:05Z");
    scan.total = 254;

    nlohmann::json j = scan;
    EXPECT_EQ("running", j["status"]);
    EXPECT_EQ("2026-01-02T03:04:05Z", j["started_at"]);
    EXPECT_FALSE(j.contains("ended_at"));
    EXPECT_FALSE(j.contains("error_msg"));

    scan.status = ScanStatus::Failed;
    scan.error_msg = "scan cancelled";
    scan.ended_at = scan.started_at;
    j = scan;
    EXPECT_EQ("failed", j["status"]);
    EXPECT_EQ("scan cancelled", j["error_msg"]);
    EXPECT_TRUE(j.contains("ended_at"));
}
