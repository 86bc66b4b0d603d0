#include <gtest/gtest.h>

#include "../recon/Errors.hpp"
#include "../server/ReconConfig.hpp"

#include <cstdio>
#include <fstream>

using net_recon::recon::ConfigError;
using net_recon::server::ReconConfig;

TEST(ReconConfig, Defaults)
{
    ReconConfig cfg = ReconConfig::Load("");
    EXPECT_EQ("netrecon.db", cfg.database_path);
    EXPECT_EQ(8080, cfg.control_port);
    EXPECT_EQ(4u, cfg.worker_threads);
    EXPECT_EQ(64u, cfg.scan_max_concurrency);
    EXPECT_EQ(std::chrono::milliseconds(1000), cfg.scan_ping_timeout);
    EXPECT_EQ(1024u, cfg.scan_max_hosts);
    EXPECT_TRUE(cfg.mdns_enabled);
    EXPECT_EQ(std::chrono::seconds(60), cfg.mdns_interval);
    EXPECT_EQ(30, cfg.traceroute_max_hops);
}

TEST(ReconConfig, OverridesNestedKeys)
{
    ReconConfig cfg = ReconConfig::FromString(R"({
        "database_path": "/var/lib/netrecon/db.sqlite",
        "control_port": 9443,
        "scan": {"max_concurrency": 16, "ping_timeout_ms": 250},
        "mdns": {"enabled": false},
        "traceroute": {"max_hops": 12, "timeout_ms": 500}
    })");

    EXPECT_EQ("/var/lib/netrecon/db.sqlite", cfg.database_path);
    EXPECT_EQ(9443, cfg.control_port);
    EXPECT_EQ(16u, cfg.scan_max_concurrency);
    EXPECT_EQ(std::chrono::milliseconds(250), cfg.scan_ping_timeout);
    EXPECT_EQ(1024u, cfg.scan_max_hosts);
    EXPECT_FALSE(cfg.mdns_enabled);
    EXPECT_EQ(std::chrono::seconds(60), cfg.mdns_interval);
    EXPECT_EQ(12, cfg.traceroute_max_hops);
    EXPECT_EQ(std::chrono::milliseconds(500), cfg.traceroute_timeout);
    EXPECT_EQ("certs/server.crt", cfg.tls_cert);
}

TEST(ReconConfig, RejectsBadInput)
{
    EXPECT_THROW(ReconConfig::FromString("{\"control_port\": "), ConfigError);
    EXPECT_THROW(ReconConfig::FromString("[1, 2]"), ConfigError);
    EXPECT_THROW(ReconConfig::FromString(R"({"control_port": "eighty"})"), ConfigError);
    EXPECT_THROW(ReconConfig::FromString(R"({"control_port": 70000})"), ConfigError);
    EXPECT_THROW(ReconConfig::FromString(R"({"worker_threads": 0})"), ConfigError);
    EXPECT_THROW(ReconConfig::FromString(R"({"scan": 5})"), ConfigError);
    EXPECT_THROW(ReconConfig::FromString(R"({"scan": {"max_hosts": -1}})"), ConfigError);
}

TEST(ReconConfig, LoadsFile)
{
    const std::string path = ::testing::TempDir() + "netrecon_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"oui_path": "/usr/share/netrecon/oui.txt", "worker_threads": 2})";
    }

    ReconConfig cfg = ReconConfig::Load(path);
    EXPECT_EQ("/usr/share/netrecon/oui.txt", cfg.oui_path);
    EXPECT_EQ(2u, cfg.worker_threads);
    std::remove(path.c_str());

    EXPECT_THROW(ReconConfig::Load(path), ConfigError);
}
