#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace net_recon::recon
{
    // Host-order IPv4 helpers.
    std::optional<uint32_t> ParseIpv4(const std::string &text);
    std::string FormatIpv4(uint32_t address);

    // An IPv4 CIDR block. Host bits in the input are masked off, so "192.168.1.7/24"
    // describes 192.168.1.0/24.
    class Subnet
    {
    public:
        // Throws PreconditionError for anything that is not a.b.c.d/prefix.
        static Subnet Parse(const std::string &cidr);

        uint32_t Network() const { return m_network; }
        uint32_t Broadcast() const;
        int Prefix() const { return m_prefix; }

        // Usable host addresses; network and broadcast are excluded up to /30,
        // /31 yields both addresses and /32 the single one.
        uint64_t HostCount() const;
        std::vector<std::string> Hosts() const;

        bool Contains(uint32_t address) const;
        bool Contains(const std::string &address) const;

        std::string ToString() const;

    private:
        Subnet(uint32_t network, int prefix) : m_network(network), m_prefix(prefix) {}

        uint32_t Mask() const;

        uint32_t m_network;
        int m_prefix;
    };
}
