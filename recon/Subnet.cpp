#include "Subnet.hpp"
#include "Errors.hpp"

#include <arpa/inet.h>
#include <cctype>

namespace net_recon::recon
{
    std::optional<uint32_t> ParseIpv4(const std::string &text)
    {
        struct in_addr addr;
        if (inet_pton(AF_INET, text.c_str(), &addr) != 1)
            return std::nullopt;
        return ntohl(addr.s_addr);
    }

    std::string FormatIpv4(uint32_t address)
    {
        struct in_addr addr;
        addr.s_addr = htonl(address);
        char buf[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &addr, buf, sizeof(buf)) == nullptr)
            return "";
        return buf;
    }

    Subnet Subnet::Parse(const std::string &cidr)
    {
        auto slash = cidr.find('/');
        if (slash == std::string::npos)
            throw PreconditionError("invalid CIDR \"" + cidr + "\": missing prefix length");

        auto address = ParseIpv4(cidr.substr(0, slash));
        if (!address)
            throw PreconditionError("invalid CIDR \"" + cidr + "\": bad IPv4 address");

        std::string prefix_text = cidr.substr(slash + 1);
        if (prefix_text.empty() || prefix_text.size() > 2)
            throw PreconditionError("invalid CIDR \"" + cidr + "\": bad prefix length");
        for (char c : prefix_text)
        {
            if (!std::isdigit(static_cast<unsigned char>(c)))
                throw PreconditionError("invalid CIDR \"" + cidr + "\": bad prefix length");
        }

        int prefix = std::stoi(prefix_text);
        if (prefix > 32)
            throw PreconditionError("invalid CIDR \"" + cidr + "\": prefix length above 32");

        Subnet subnet(0, prefix);
        subnet.m_network = *address & subnet.Mask();
        return subnet;
    }

    uint32_t Subnet::Mask() const
    {
        if (m_prefix == 0)
            return 0;
        return 0xFFFFFFFFu << (32 - m_prefix);
    }

    uint32_t Subnet::Broadcast() const
    {
        return m_network | ~Mask();
    }

    uint64_t Subnet::HostCount() const
    {
        uint64_t size = uint64_t{1} << (32 - m_prefix);
        if (m_prefix >= 31)
            return size;
        return size - 2;
    }

    std::vector<std::string> Subnet::Hosts() const
    {
        std::vector<std::string> hosts;
        hosts.reserve(static_cast<size_t>(HostCount()));

        uint64_t first = m_network;
        uint64_t last = Broadcast();
        if (m_prefix < 31)
        {
            ++first;
            --last;
        }

        for (uint64_t ip = first; ip <= last; ++ip)
            hosts.push_back(FormatIpv4(static_cast<uint32_t>(ip)));
        return hosts;
    }

    bool Subnet::Contains(uint32_t address) const
    {
        return (address & Mask()) == m_network;
    }

    bool Subnet::Contains(const std::string &address) const
    {
        auto parsed = ParseIpv4(address);
        return parsed && Contains(*parsed);
    }

    std::string Subnet::ToString() const
    {
        return FormatIpv4(m_network) + "/" + std::to_string(m_prefix);
    }
}
