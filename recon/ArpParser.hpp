#pragma once

#include <map>
#include <string>
#include "Platform.hpp"

namespace net_recon::recon
{
    using ArpTable = std::map<std::string, std::string>; // IPv4 -> AA:BB:CC:DD:EE:FF

    // Canonical uppercase colon form from colon, hyphen, Cisco dot or bare hex notation.
    // BSD style single digit octets ("0:1c:42:...") are zero padded. Returns an empty
    // string when the input is not a 48-bit address.
    std::string NormalizeMac(const std::string &raw);

    // Parses the neighbour table text of the given platform:
    //   linux   - /proc/net/arp
    //   windows - `arp -a`, per-interface sections
    //   darwin  - `arp -a`, "? (ip) at mac on iface ..."
    // Incomplete, all-zero and broadcast entries and unparsable lines are skipped.
    ArpTable ParseArpOutput(const std::string &output, Platform platform);
}
