#pragma once

#include <nlohmann/json.hpp>
#include "Models.hpp"

namespace net_recon::recon
{
    // Wire shapes of the control channel. Field names follow the snake_case used by the
    // persisted columns; absent optionals are omitted.
    void to_json(nlohmann::json &j, const Device &device);
    void to_json(nlohmann::json &j, const TopologyLink &link);
    void to_json(nlohmann::json &j, const ScanResult &scan);
    void to_json(nlohmann::json &j, const TracerouteHop &hop);
    void to_json(nlohmann::json &j, const TracerouteResult &result);

    void from_json(const nlohmann::json &j, ScanResult &scan);
    void from_json(const nlohmann::json &j, TracerouteHop &hop);
    void from_json(const nlohmann::json &j, TracerouteResult &result);
}
