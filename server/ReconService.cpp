#include "ReconService.hpp"
#include "../recon/Errors.hpp"
#include "../recon/ModelJson.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <limits>

namespace net_recon::server
{
    using nlohmann::json;

    namespace
    {
        json ParseBody(const std::string &body)
        {
            if (body.empty())
                return json::object();

            json doc = json::parse(body);
            if (!doc.is_object())
                throw recon::PreconditionError("request body must be a JSON object");
            return doc;
        }

        std::string RequireString(const json &doc, const char *field)
        {
            auto it = doc.find(field);
            if (it == doc.end() || !it->is_string() || it->get<std::string>().empty())
                throw recon::PreconditionError(std::string("missing field '") + field + "'");
            return it->get<std::string>();
        }

        int OptionalInt(const json &doc, const char *field, int fallback)
        {
            auto it = doc.find(field);
            if (it == doc.end() || it->is_null())
                return fallback;
            if (!it->is_number_integer())
                throw recon::PreconditionError(std::string("field '") + field + "' must be an integer");

            bool inRange = it->is_number_unsigned()
                               ? it->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                               : it->get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                                     it->get<std::int64_t>() <= std::numeric_limits<int>::max();
            if (!inRange)
                throw recon::PreconditionError(std::string("field '") + field + "' is out of range");
            return static_cast<int>(it->get<std::int64_t>());
        }

        ControlResponse Ok(std::uint32_t status, const json &body)
        {
            return {status, body.dump()};
        }
    }

    ReconService::ReconService(recon::DeviceStore &store, recon::ScanOrchestrator &scanner,
                               recon::TracerouteEngine &traceroute)
        : store_(store), scanner_(scanner), traceroute_(traceroute)
    {
    }

    ControlResponse ReconService::Problem(std::uint32_t status, const std::string &title, const std::string &detail)
    {
        json problem = {
            {"type", "about:blank"},
            {"title", title},
            {"status", status},
            {"detail", detail},
        };
        return {status, problem.dump()};
    }

    ControlResponse ReconService::Handle(protocol::MessageType type, const std::string &body)
    {
        using protocol::MessageType;

        try
        {
            switch (type)
            {
            case MessageType::HeartbeatReq:
                return Heartbeat();
            case MessageType::ScanStartReq:
                return StartScan(body);
            case MessageType::ScanListReq:
                return ListScans(body);
            case MessageType::ScanGetReq:
                return GetScan(body);
            case MessageType::TopologyReq:
                return Topology();
            case MessageType::TracerouteReq:
                return Traceroute(body);
            default:
                return Problem(400, "Bad Request",
                               std::string("unsupported request type ") + protocol::MessageTypeName(type));
            }
        }
        catch (const json::exception &e)
        {
            return Problem(400, "Bad Request", std::string("malformed request body: ") + e.what());
        }
        catch (const recon::PreconditionError &e)
        {
            return Problem(400, "Bad Request", e.what());
        }
        catch (const recon::ResourceBusyError &e)
        {
            return Problem(409, "Conflict", e.what());
        }
        catch (const recon::StoreError &e)
        {
            std::cerr << "[Service] Store failure: " << e.what() << "\n";
            return Problem(500, "Internal Server Error", e.what());
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Service] " << protocol::MessageTypeName(type) << " failed: " << e.what() << "\n";
            return Problem(500, "Internal Server Error", e.what());
        }
    }

    ControlResponse ReconService::Heartbeat()
    {
        return Ok(200, {{"status", "ok"}});
    }

    ControlResponse ReconService::StartScan(const std::string &body)
    {
        json doc = ParseBody(body);
        std::string subnet = RequireString(doc, "subnet");

        recon::ScanResult scan = scanner_.Run(subnet);
        return Ok(202, json(scan));
    }

    ControlResponse ReconService::ListScans(const std::string &body)
    {
        json doc = ParseBody(body);
        int limit = OptionalInt(doc, "limit", DEFAULT_LIST_LIMIT);
        int offset = OptionalInt(doc, "offset", 0);

        if (limit <= 0)
            limit = DEFAULT_LIST_LIMIT;
        limit = std::min(limit, MAX_LIST_LIMIT);
        offset = std::max(offset, 0);

        json items = json::array();
        for (const auto &scan : store_.ListScans(limit, offset))
            items.push_back(scan);

        return Ok(200, {
                           {"items", items},
                           {"total", store_.CountScans()},
                           {"limit", limit},
                           {"offset", offset},
                       });
    }

    ControlResponse ReconService::GetScan(const std::string &body)
    {
        json doc = ParseBody(body);
        std::string id = RequireString(doc, "id");

        auto scan = store_.GetScan(id);
        if (!scan)
            return Problem(404, "Not Found", "scan " + id + " not found");

        json result = *scan;
        result["devices"] = store_.ListScanDevices(id);
        return Ok(200, result);
    }

    ControlResponse ReconService::Topology()
    {
        json nodes = json::array();
        for (const auto &device : store_.ListDevices())
            nodes.push_back(device);

        json edges = json::array();
        for (const auto &link : store_.ListLinks())
            edges.push_back(link);

        return Ok(200, {{"nodes", nodes}, {"edges", edges}});
    }

    ControlResponse ReconService::Traceroute(const std::string &body)
    {
        json doc = ParseBody(body);
        std::string target = RequireString(doc, "target");
        int maxHops = OptionalInt(doc, "max_hops", 0);
        int timeoutMs = OptionalInt(doc, "timeout_ms", 0);

        try
        {
            recon::TracerouteResult result =
                traceroute_.Run(target, maxHops, std::chrono::milliseconds(timeoutMs), shutdown_.Token());
            return Ok(200, json(result));
        }
        catch (const recon::TracerouteCancelled &e)
        {
            return Problem(500, "Internal Server Error",
                           std::string(e.what()) + " after " + std::to_string(e.Partial().total_hops) + " hops");
        }
        catch (const recon::ProbeError &e)
        {
            return Problem(500, "Internal Server Error", e.what());
        }
    }

    void ReconService::Shutdown()
    {
        shutdown_.Cancel();
    }
}
