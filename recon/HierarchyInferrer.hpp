#pragma once

#include "DeviceStore.hpp"
#include "Models.hpp"

#include <vector>

namespace net_recon::recon
{
    // Places every device in a gateway / distribution / access / endpoint tree using device
    // types and topology links.
    class HierarchyInferrer
    {
    public:
        // Pure. Devices are ordered by id first; the first router (else the first gateway)
        // becomes the root. One assignment per device, in id order.
        static std::vector<HierarchyAssignment> Infer(std::vector<Device> devices,
                                                      const std::vector<TopologyLink> &links);

        explicit HierarchyInferrer(DeviceStore &store);

        // Loads devices and links, infers and writes layer + parent back. Returns the number of
        // devices updated; a failed write is logged and skipped.
        int Apply();

    private:
        DeviceStore &m_store;
    };
}
