#include "HierarchyInferrer.hpp"
#include "Errors.hpp"

#include <algorithm>
#include <iostream>
#include <map>

namespace net_recon::recon
{
    namespace
    {
        struct Adjacency
        {
            std::map<std::string, std::vector<std::string>> outgoing;
            std::map<std::string, std::vector<std::string>> incoming;
            std::map<std::string, std::vector<std::string>> fdb;

            const std::vector<std::string> &Out(const std::string &id) const { return Lookup(outgoing, id); }
            const std::vector<std::string> &In(const std::string &id) const { return Lookup(incoming, id); }
            const std::vector<std::string> &Fdb(const std::string &id) const { return Lookup(fdb, id); }

            bool Linked(const std::string &a, const std::string &b) const
            {
                const auto &out = Out(a);
                const auto &in = In(a);
                return std::find(out.begin(), out.end(), b) != out.end() ||
                       std::find(in.begin(), in.end(), b) != in.end();
            }

        private:
            static const std::vector<std::string> &Lookup(const std::map<std::string, std::vector<std::string>> &m,
                                                          const std::string &id)
            {
                static const std::vector<std::string> empty;
                auto it = m.find(id);
                return it == m.end() ? empty : it->second;
            }
        };
    }

    std::vector<HierarchyAssignment> HierarchyInferrer::Infer(std::vector<Device> devices,
                                                              const std::vector<TopologyLink> &links)
    {
        std::sort(devices.begin(), devices.end(),
                  [](const Device &a, const Device &b) { return a.id < b.id; });

        std::map<std::string, const Device *> byId;
        std::map<std::string, HierarchyAssignment> assigned;
        for (const auto &d : devices)
        {
            byId[d.id] = &d;
            assigned[d.id] = HierarchyAssignment{d.id, "", NetworkLayer::Unknown};
        }

        Adjacency adj;
        for (const auto &link : links)
        {
            adj.outgoing[link.source_device_id].push_back(link.target_device_id);
            adj.incoming[link.target_device_id].push_back(link.source_device_id);
            if (link.link_type == LinkType::Fdb)
                adj.fdb[link.source_device_id].push_back(link.target_device_id);
        }

        auto typeOf = [&byId](const std::string &id) {
            auto it = byId.find(id);
            return it == byId.end() ? DeviceType::Unknown : it->second->device_type;
        };

        // 1. Gateways and the root.
        std::string firstGateway;
        std::string root;
        for (const auto &d : devices)
        {
            if (d.device_type != DeviceType::Router && d.device_type != DeviceType::Firewall)
                continue;
            assigned[d.id].network_layer = NetworkLayer::Gateway;
            if (firstGateway.empty())
                firstGateway = d.id;
            if (root.empty() && d.device_type == DeviceType::Router)
                root = d.id;
        }
        if (root.empty())
            root = firstGateway;

        // 2. Firewalls sit beside the root.
        if (!root.empty())
        {
            for (const auto &d : devices)
            {
                if (d.device_type == DeviceType::Firewall && d.id != root)
                    assigned[d.id].parent_device_id = root;
            }
        }

        // 3. Switches next to the root are distribution, the rest access.
        for (const auto &d : devices)
        {
            if (d.device_type != DeviceType::Switch)
                continue;
            if (!root.empty() && adj.Linked(d.id, root))
            {
                assigned[d.id].network_layer = NetworkLayer::Distribution;
                assigned[d.id].parent_device_id = root;
            }
            else
            {
                assigned[d.id].network_layer = NetworkLayer::Access;
            }
        }

        // 4. Access switches hang off an adjacent distribution switch, else the root.
        for (const auto &d : devices)
        {
            if (d.device_type != DeviceType::Switch || assigned[d.id].network_layer != NetworkLayer::Access)
                continue;

            auto isDistribution = [&](const std::string &id) {
                return typeOf(id) == DeviceType::Switch && assigned.count(id) &&
                       assigned[id].network_layer == NetworkLayer::Distribution;
            };

            std::string parent;
            for (const auto &id : adj.Out(d.id))
            {
                if (isDistribution(id))
                {
                    parent = id;
                    break;
                }
            }
            if (parent.empty())
            {
                for (const auto &id : adj.In(d.id))
                {
                    if (isDistribution(id))
                    {
                        parent = id;
                        break;
                    }
                }
            }
            assigned[d.id].parent_device_id = parent.empty() ? root : parent;
        }

        // 5. Access points.
        for (const auto &d : devices)
        {
            if (d.device_type != DeviceType::AccessPoint)
                continue;
            assigned[d.id].network_layer = NetworkLayer::Access;

            auto isUplink = [&](const std::string &id) {
                DeviceType t = typeOf(id);
                return byId.count(id) && (t == DeviceType::Switch || t == DeviceType::Router);
            };

            std::string parent;
            for (const auto &id : adj.In(d.id))
            {
                if (isUplink(id))
                {
                    parent = id;
                    break;
                }
            }
            if (parent.empty())
            {
                for (const auto &id : adj.Out(d.id))
                {
                    if (isUplink(id))
                    {
                        parent = id;
                        break;
                    }
                }
            }
            assigned[d.id].parent_device_id = parent.empty() ? root : parent;
        }

        // 6. Forwarding database entries place end hosts behind their switch.
        for (const auto &d : devices)
        {
            if (d.device_type != DeviceType::Switch)
                continue;
            for (const auto &target : adj.Fdb(d.id))
            {
                auto it = byId.find(target);
                if (it == byId.end() || IsInfrastructure(it->second->device_type))
                    continue;
                if (assigned[target].parent_device_id.empty())
                    assigned[target].parent_device_id = d.id;
            }
        }

        // 7. Whatever is left is an endpoint; 8. and hangs off the root.
        std::vector<HierarchyAssignment> result;
        result.reserve(devices.size());
        for (const auto &d : devices)
        {
            auto &a = assigned[d.id];
            if (a.network_layer == NetworkLayer::Unknown)
                a.network_layer = NetworkLayer::Endpoint;
            if (a.parent_device_id.empty() && !root.empty() && d.id != root)
                a.parent_device_id = root;
            result.push_back(a);
        }
        return result;
    }

    HierarchyInferrer::HierarchyInferrer(DeviceStore &store) : m_store(store) {}

    int HierarchyInferrer::Apply()
    {
        std::vector<Device> devices = m_store.ListDevices();
        if (devices.empty())
            return 0;

        std::vector<TopologyLink> links = m_store.ListLinks();
        auto assignments = Infer(devices, links);

        int updated = 0;
        for (const auto &a : assignments)
        {
            try
            {
                m_store.UpdateDeviceHierarchy(a.device_id, a.network_layer, a.parent_device_id);
                ++updated;
            }
            catch (const StoreError &e)
            {
                std::cerr << "[Hierarchy] Update of " << a.device_id << " failed: " << e.what() << "\n";
            }
        }

        std::cout << "[Hierarchy] Inference done: " << devices.size() << " devices, " << updated << " updated\n";
        return updated;
    }
}
