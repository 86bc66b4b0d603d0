#include "ArpReader.hpp"

#include <array>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>

namespace net_recon::recon
{
    SystemArpReader::SystemArpReader(Platform platform) : m_platform(platform) {}

    ArpTable SystemArpReader::ReadTable()
    {
        std::string raw;
        bool ok = (m_platform == Platform::Linux) ? ReadProcTable(raw) : RunArpCommand(raw);
        if (!ok)
            return {};

        ArpTable table = ParseArpOutput(raw, m_platform);
        std::cout << "[ARP] " << table.size() << " neighbour entries read (" << PlatformName(m_platform) << ")\n";
        return table;
    }

    bool SystemArpReader::ReadProcTable(std::string &out) const
    {
        std::ifstream arpFile("/proc/net/arp");
        if (!arpFile.is_open())
        {
            std::cerr << "[ARP] Cannot open /proc/net/arp\n";
            return false;
        }

        std::stringstream ss;
        ss << arpFile.rdbuf();
        out = ss.str();
        return true;
    }

    bool SystemArpReader::RunArpCommand(std::string &out) const
    {
        FILE *pipe = popen("arp -a", "r");
        if (!pipe)
        {
            std::cerr << "[ARP] Failed to run 'arp -a'\n";
            return false;
        }

        std::array<char, 512> buffer{};
        while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr)
        {
            out += buffer.data();
        }

        int rc = pclose(pipe);
        if (rc != 0)
        {
            std::cerr << "[ARP] 'arp -a' exited with status " << rc << "\n";
            return !out.empty();
        }
        return true;
    }
}
