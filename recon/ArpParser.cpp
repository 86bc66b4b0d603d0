#include "ArpParser.hpp"
#include "Subnet.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <vector>

namespace net_recon::recon
{
    namespace
    {
        const std::string kZeroMac = "00:00:00:00:00:00";
        const std::string kBroadcastMac = "FF:FF:FF:FF:FF:FF";

        bool IsHex(const std::string &s)
        {
            return std::all_of(s.begin(), s.end(),
                               [](unsigned char c) { return std::isxdigit(c) != 0; });
        }

        std::vector<std::string> Split(const std::string &s, char sep)
        {
            std::vector<std::string> parts;
            std::string part;
            std::istringstream ss(s);
            while (std::getline(ss, part, sep))
                parts.push_back(part);
            if (!s.empty() && s.back() == sep)
                parts.emplace_back();
            return parts;
        }

        std::string FromHex12(const std::string &hex)
        {
            std::string out;
            for (size_t i = 0; i < 12; i += 2)
            {
                if (!out.empty())
                    out += ':';
                out += hex.substr(i, 2);
            }
            return out;
        }

        std::string Trim(const std::string &s)
        {
            auto begin = s.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
                return "";
            auto end = s.find_last_not_of(" \t\r\n");
            return s.substr(begin, end - begin + 1);
        }

        ArpTable ParseLinux(const std::string &output)
        {
            ArpTable table;
            std::istringstream lines(output);
            std::string line;
            while (std::getline(lines, line))
            {
                std::stringstream ss(line);
                std::string ip, hw_type, flags, mac, mask, dev;
                ss >> ip >> hw_type >> flags >> mac >> mask >> dev;

                if (mac.empty() || !ParseIpv4(ip))
                    continue;

                std::string normalized = NormalizeMac(mac);
                if (normalized.empty() || normalized == kZeroMac)
                    continue;

                table[ip] = normalized;
            }
            return table;
        }

        ArpTable ParseWindows(const std::string &output)
        {
            static const std::regex row(
                R"(^\s*(\d{1,3}(?:\.\d{1,3}){3})\s+([0-9A-Fa-f]{2}(?:-[0-9A-Fa-f]{2}){5})\s+\S+\s*$)");

            ArpTable table;
            std::istringstream lines(output);
            std::string line;
            while (std::getline(lines, line))
            {
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();

                std::smatch m;
                if (!std::regex_match(line, m, row))
                    continue;

                std::string ip = m[1].str();
                if (!ParseIpv4(ip))
                    continue;

                std::string normalized = NormalizeMac(m[2].str());
                if (normalized.empty() || normalized == kBroadcastMac)
                    continue;

                table[ip] = normalized;
            }
            return table;
        }

        ArpTable ParseDarwin(const std::string &output)
        {
            static const std::regex row(R"(\((\d{1,3}(?:\.\d{1,3}){3})\)\s+at\s+(\S+))");

            ArpTable table;
            std::istringstream lines(output);
            std::string line;
            while (std::getline(lines, line))
            {
                if (line.find("(incomplete)") != std::string::npos)
                    continue;

                std::smatch m;
                if (!std::regex_search(line, m, row))
                    continue;

                std::string ip = m[1].str();
                if (!ParseIpv4(ip))
                    continue;

                std::string normalized = NormalizeMac(m[2].str());
                if (normalized.empty())
                    continue;

                table[ip] = normalized;
            }
            return table;
        }
    }

    std::string NormalizeMac(const std::string &raw)
    {
        std::string mac = Trim(raw);
        std::transform(mac.begin(), mac.end(), mac.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

        char sep = 0;
        if (mac.find(':') != std::string::npos)
            sep = ':';
        else if (mac.find('-') != std::string::npos)
            sep = '-';

        if (sep != 0)
        {
            auto parts = Split(mac, sep);
            if (parts.size() != 6)
                return "";

            std::string hex;
            for (auto &part : parts)
            {
                if (part.empty() || part.size() > 2 || !IsHex(part))
                    return "";
                if (part.size() == 1)
                    part.insert(part.begin(), '0');
                hex += part;
            }
            return FromHex12(hex);
        }

        mac.erase(std::remove(mac.begin(), mac.end(), '.'), mac.end());
        if (mac.size() != 12 || !IsHex(mac))
            return "";
        return FromHex12(mac);
    }

    ArpTable ParseArpOutput(const std::string &output, Platform platform)
    {
        switch (platform)
        {
        case Platform::Linux:
            return ParseLinux(output);
        case Platform::Windows:
            return ParseWindows(output);
        case Platform::Darwin:
            return ParseDarwin(output);
        default:
            return {};
        }
    }
}
