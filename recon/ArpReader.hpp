#pragma once

#include "ArpParser.hpp"
#include "Platform.hpp"

#include <string>

namespace net_recon::recon
{
    class ArpReader
    {
    public:
        virtual ~ArpReader() = default;

        // IP -> MAC. Failures are soft: they are logged and yield an empty table.
        virtual ArpTable ReadTable() = 0;
    };

    // Reads the operating system neighbour cache: /proc/net/arp on Linux, `arp -a` elsewhere.
    class SystemArpReader : public ArpReader
    {
    public:
        explicit SystemArpReader(Platform platform);

        ArpTable ReadTable() override;

    private:
        bool ReadProcTable(std::string &out) const;
        bool RunArpCommand(std::string &out) const;

        Platform m_platform;
    };
}
