#include "ReconConfig.hpp"
#include "../recon/Errors.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace net_recon::server
{
    namespace
    {
        const nlohmann::json *Section(const nlohmann::json &j, const char *name)
        {
            auto it = j.find(name);
            if (it == j.end())
                return nullptr;
            if (!it->is_object())
                throw recon::ConfigError(std::string("'") + name + "' must be an object");
            return &*it;
        }

        template <typename T>
        void Read(const nlohmann::json &j, const char *key, T &out)
        {
            auto it = j.find(key);
            if (it == j.end())
                return;
            try
            {
                out = it->get<T>();
            }
            catch (const nlohmann::json::exception &e)
            {
                throw recon::ConfigError(std::string("bad value for '") + key + "': " + e.what());
            }
        }

        int64_t ReadPositive(const nlohmann::json &j, const char *key, int64_t fallback)
        {
            int64_t value = fallback;
            Read(j, key, value);
            if (value <= 0)
                throw recon::ConfigError(std::string("'") + key + "' must be positive");
            return value;
        }
    }

    ReconConfig ReconConfig::FromJson(const nlohmann::json &j)
    {
        if (!j.is_object())
            throw recon::ConfigError("configuration root must be an object");

        ReconConfig cfg;
        Read(j, "database_path", cfg.database_path);
        Read(j, "tls_cert", cfg.tls_cert);
        Read(j, "tls_key", cfg.tls_key);
        Read(j, "oui_path", cfg.oui_path);

        Read(j, "control_port", cfg.control_port);
        if (cfg.control_port < 0 || cfg.control_port > 65535)
            throw recon::ConfigError("'control_port' out of range");

        cfg.worker_threads = static_cast<size_t>(ReadPositive(j, "worker_threads", static_cast<int64_t>(cfg.worker_threads)));

        if (auto scan = Section(j, "scan"))
        {
            cfg.scan_max_concurrency = static_cast<size_t>(ReadPositive(*scan, "max_concurrency", static_cast<int64_t>(cfg.scan_max_concurrency)));
            cfg.scan_ping_timeout = std::chrono::milliseconds(ReadPositive(*scan, "ping_timeout_ms", cfg.scan_ping_timeout.count()));
            cfg.scan_max_hosts = static_cast<uint64_t>(ReadPositive(*scan, "max_hosts", static_cast<int64_t>(cfg.scan_max_hosts)));
        }

        if (auto mdns = Section(j, "mdns"))
        {
            Read(*mdns, "enabled", cfg.mdns_enabled);
            cfg.mdns_interval = std::chrono::seconds(ReadPositive(*mdns, "interval_s", cfg.mdns_interval.count()));
            cfg.mdns_query_timeout = std::chrono::milliseconds(ReadPositive(*mdns, "query_timeout_ms", cfg.mdns_query_timeout.count()));
        }

        if (auto tr = Section(j, "traceroute"))
        {
            Read(*tr, "max_hops", cfg.traceroute_max_hops);
            int64_t timeout = cfg.traceroute_timeout.count();
            Read(*tr, "timeout_ms", timeout);
            cfg.traceroute_timeout = std::chrono::milliseconds(timeout);
        }

        return cfg;
    }

    ReconConfig ReconConfig::FromString(const std::string &text)
    {
        nlohmann::json j;
        try
        {
            j = nlohmann::json::parse(text);
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw recon::ConfigError(std::string("malformed configuration: ") + e.what());
        }
        return FromJson(j);
    }

    ReconConfig ReconConfig::Load(const std::string &path)
    {
        if (path.empty())
            return ReconConfig();

        std::ifstream file(path);
        if (!file.is_open())
            throw recon::ConfigError("cannot open configuration file '" + path + "'");

        std::stringstream ss;
        ss << file.rdbuf();

        std::cout << "[Config] Loaded " << path << std::endl;
        return FromString(ss.str());
    }
}
