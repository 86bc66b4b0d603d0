#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace net_recon::server
{
    struct ReconConfig
    {
        std::string database_path = "netrecon.db";
        int control_port = 8080;
        std::string tls_cert = "certs/server.crt";
        std::string tls_key = "certs/server.key";
        std::string oui_path = "oui.txt";
        size_t worker_threads = 4;

        size_t scan_max_concurrency = 64;
        std::chrono::milliseconds scan_ping_timeout{1000};
        uint64_t scan_max_hosts = 1024;

        bool mdns_enabled = true;
        std::chrono::seconds mdns_interval{60};
        std::chrono::milliseconds mdns_query_timeout{3000};

        int traceroute_max_hops = 30;
        std::chrono::milliseconds traceroute_timeout{1000};

        // Absent keys keep their defaults. Throws ConfigError on malformed JSON, wrong value
        // types or out-of-range numbers.
        static ReconConfig FromJson(const nlohmann::json &j);
        static ReconConfig FromString(const std::string &text);

        // An empty path yields the defaults.
        static ReconConfig Load(const std::string &path);
    };
}
