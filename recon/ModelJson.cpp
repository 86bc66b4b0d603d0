#include "ModelJson.hpp"

namespace net_recon::recon
{
    void to_json(nlohmann::json &j, const Device &device)
    {
        j = nlohmann::json{
            {"id", device.id},
            {"hostname", device.hostname},
            {"ip_addresses", device.ip_addresses},
            {"device_type", ToString(device.device_type)},
            {"status", ToString(device.status)},
            {"discovery_method", ToString(device.discovery_method)},
            {"first_seen", FormatTimestamp(device.first_seen)},
            {"last_seen", FormatTimestamp(device.last_seen)},
            {"network_layer", ToString(device.network_layer)},
        };

        if (!device.mac_address.empty())
            j["mac_address"] = device.mac_address;
        if (!device.manufacturer.empty())
            j["manufacturer"] = device.manufacturer;
        if (!device.os.empty())
            j["os"] = device.os;
        if (!device.parent_device_id.empty())
            j["parent_device_id"] = device.parent_device_id;
        if (!device.notes.empty())
            j["notes"] = device.notes;
        if (!device.tags.empty())
            j["tags"] = device.tags;
        if (!device.custom_fields.empty())
            j["custom_fields"] = device.custom_fields;
    }

    void to_json(nlohmann::json &j, const TopologyLink &link)
    {
        j = nlohmann::json{
            {"source_device_id", link.source_device_id},
            {"target_device_id", link.target_device_id},
            {"link_type", ToString(link.link_type)},
            {"discovered_at", FormatTimestamp(link.discovered_at)},
        };
    }

    void to_json(nlohmann::json &j, const ScanResult &scan)
    {
        j = nlohmann::json{
            {"id", scan.id},
            {"subnet", scan.subnet},
            {"started_at", FormatTimestamp(scan.started_at)},
            {"status", ToString(scan.status)},
            {"total", scan.total},
            {"online", scan.online},
        };
        if (scan.ended_at)
            j["ended_at"] = FormatTimestamp(*scan.ended_at);
        if (!scan.error_msg.empty())
            j["error_msg"] = scan.error_msg;
    }

    void from_json(const nlohmann::json &j, ScanResult &scan)
    {
        scan.id = j.value("id", "");
        scan.subnet = j.value("subnet", "");
        scan.status = ScanStatusFromString(j.value("status", "running"));
        scan.total = j.value("total", 0);
        scan.online = j.value("online", 0);
        scan.error_msg = j.value("error_msg", "");

        if (auto started = ParseTimestamp(j.value("started_at", "")))
            scan.started_at = *started;
        if (j.contains("ended_at"))
            scan.ended_at = ParseTimestamp(j.at("ended_at").get<std::string>());
    }

    void to_json(nlohmann::json &j, const TracerouteHop &hop)
    {
        j = nlohmann::json{
            {"hop", hop.hop},
            {"rtt_ms", hop.rtt_ms},
            {"timeout", hop.timeout},
        };
        if (!hop.ip.empty())
            j["ip"] = hop.ip;
        if (!hop.hostname.empty())
            j["hostname"] = hop.hostname;
    }

    void from_json(const nlohmann::json &j, TracerouteHop &hop)
    {
        hop.hop = j.value("hop", 0);
        hop.ip = j.value("ip", "");
        hop.hostname = j.value("hostname", "");
        hop.rtt_ms = j.value("rtt_ms", 0.0);
        hop.timeout = j.value("timeout", false);
    }

    void to_json(nlohmann::json &j, const TracerouteResult &result)
    {
        j = nlohmann::json{
            {"target", result.target},
            {"address", result.address},
            {"hops", result.hops},
            {"reached", result.reached},
            {"total_hops", result.total_hops},
            {"duration_ms", result.duration_ms},
        };
    }

    void from_json(const nlohmann::json &j, TracerouteResult &result)
    {
        result.target = j.value("target", "");
        result.address = j.value("address", "");
        result.reached = j.value("reached", false);
        result.total_hops = j.value("total_hops", 0);
        result.duration_ms = j.value("duration_ms", 0.0);
        result.hops.clear();
        if (j.contains("hops"))
            result.hops = j.at("hops").get<std::vector<TracerouteHop>>();
    }
}
