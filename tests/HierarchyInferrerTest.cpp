#include <gtest/gtest.h>

#include "../recon/HierarchyInferrer.hpp"

#include <map>

using namespace net_recon::recon;

namespace
{
    Device MakeDevice(const std::string &id, DeviceType type)
    {
        Device d;
        d.id = id;
        d.device_type = type;
        return d;
    }

    TopologyLink MakeLink(const std::string &from, const std::string &to, LinkType type = LinkType::Arp)
    {
        return TopologyLink{from, to, type, {}};
    }

    std::map<std::string, HierarchyAssignment> ById(const std::vector<HierarchyAssignment> &result)
    {
        std::map<std::string, HierarchyAssignment> out;
        for (const auto &a : result)
            out[a.device_id] = a;
        return out;
    }
}

TEST(HierarchyInferrer, EmptyInput)
{
    EXPECT_TRUE(HierarchyInferrer::Infer({}, {}).empty());
}

TEST(HierarchyInferrer, BuildsLayeredTree)
{
    std::vector<Device> devices = {
        MakeDevice("ap", DeviceType::AccessPoint),
        MakeDevice("desktop", DeviceType::Desktop),
        MakeDevice("firewall", DeviceType::Firewall),
        MakeDevice("laptop", DeviceType::Unknown),
        MakeDevice("router", DeviceType::Router),
        MakeDevice("sw-access", DeviceType::Switch),
        MakeDevice("sw-core", DeviceType::Switch),
    };
    std::vector<TopologyLink> links = {
        MakeLink("router", "sw-core"),
        MakeLink("sw-access", "sw-core"),
        MakeLink("sw-access", "ap"),
        MakeLink("sw-access", "desktop", LinkType::Fdb),
    };

    auto result = HierarchyInferrer::Infer(devices, links);
    ASSERT_EQ(devices.size(), result.size());
    auto byId = ById(result);

    EXPECT_EQ(NetworkLayer::Gateway, byId["router"].network_layer);
    EXPECT_EQ("", byId["router"].parent_device_id);

    EXPECT_EQ(NetworkLayer::Gateway, byId["firewall"].network_layer);
    EXPECT_EQ("router", byId["firewall"].parent_device_id);

    EXPECT_EQ(NetworkLayer::Distribution, byId["sw-core"].network_layer);
    EXPECT_EQ("router", byId["sw-core"].parent_device_id);

    EXPECT_EQ(NetworkLayer::Access, byId["sw-access"].network_layer);
    EXPECT_EQ("sw-core", byId["sw-access"].parent_device_id);

    EXPECT_EQ(NetworkLayer::Access, byId["ap"].network_layer);
    EXPECT_EQ("sw-access", byId["ap"].parent_device_id);

    EXPECT_EQ(NetworkLayer::Endpoint, byId["desktop"].network_layer);
    EXPECT_EQ("sw-access", byId["desktop"].parent_device_id);

    EXPECT_EQ(NetworkLayer::Endpoint, byId["laptop"].network_layer);
    EXPECT_EQ("router", byId["laptop"].parent_device_id);
}

TEST(HierarchyInferrer, ResultIsOrderedById)
{
    std::vector<Device> devices = {
        MakeDevice("c", DeviceType::Desktop),
        MakeDevice("a", DeviceType::Router),
        MakeDevice("b", DeviceType::Server),
    };

    auto result = HierarchyInferrer::Infer(devices, {});
    ASSERT_EQ(3u, result.size());
    EXPECT_EQ("a", result[0].device_id);
    EXPECT_EQ("b", result[1].device_id);
    EXPECT_EQ("c", result[2].device_id);
}

TEST(HierarchyInferrer, FirstRouterByIdIsRoot)
{
    std::vector<Device> devices = {
        MakeDevice("r2", DeviceType::Router),
        MakeDevice("r1", DeviceType::Router),
    };

    auto byId = ById(HierarchyInferrer::Infer(devices, {}));
    EXPECT_EQ("", byId["r1"].parent_device_id);
    EXPECT_EQ(NetworkLayer::Gateway, byId["r2"].network_layer);
    EXPECT_EQ("r1", byId["r2"].parent_device_id);
}

TEST(HierarchyInferrer, FirewallBecomesRootWithoutRouter)
{
    std::vector<Device> devices = {
        MakeDevice("fw", DeviceType::Firewall),
        MakeDevice("pc", DeviceType::Desktop),
        MakeDevice("sw", DeviceType::Switch),
    };

    auto byId = ById(HierarchyInferrer::Infer(devices, {MakeLink("fw", "sw")}));
    EXPECT_EQ("", byId["fw"].parent_device_id);
    EXPECT_EQ(NetworkLayer::Distribution, byId["sw"].network_layer);
    EXPECT_EQ("fw", byId["sw"].parent_device_id);
    EXPECT_EQ("fw", byId["pc"].parent_device_id);
}

TEST(HierarchyInferrer, NoGatewayLeavesEndpointsUnparented)
{
    std::vector<Device> devices = {
        MakeDevice("pc", DeviceType::Desktop),
        MakeDevice("sw", DeviceType::Switch),
    };

    auto byId = ById(HierarchyInferrer::Infer(devices, {MakeLink("sw", "pc", LinkType::Fdb)}));
    EXPECT_EQ(NetworkLayer::Access, byId["sw"].network_layer);
    EXPECT_EQ("", byId["sw"].parent_device_id);
    EXPECT_EQ(NetworkLayer::Endpoint, byId["pc"].network_layer);
    EXPECT_EQ("sw", byId["pc"].parent_device_id);
}

TEST(HierarchyInferrer, FdbDoesNotReparentInfrastructure)
{
    std::vector<Device> devices = {
        MakeDevice("router", DeviceType::Router),
        MakeDevice("sw", DeviceType::Switch),
    };

    auto byId = ById(HierarchyInferrer::Infer(devices, {MakeLink("sw", "router", LinkType::Fdb)}));
    EXPECT_EQ("", byId["router"].parent_device_id);
    EXPECT_EQ("router", byId["sw"].parent_device_id);
}
