#include "OuiLookup.hpp"
#include "ArpParser.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

namespace net_recon::recon
{
    namespace
    {
        // "AA:BB:CC", "aa-bb-cc", "AABBCC" -> "AA:BB:CC"
        std::string NormalizePrefix(const std::string &text)
        {
            std::string hex;
            for (unsigned char c : text)
            {
                if (c == ':' || c == '-' || c == '.' || c == ' ')
                    continue;
                if (!std::isxdigit(c))
                    return "";
                hex += static_cast<char>(std::toupper(c));
            }
            if (hex.size() != 6)
                return "";
            return hex.substr(0, 2) + ":" + hex.substr(2, 2) + ":" + hex.substr(4, 2);
        }
    }

    std::string OuiPrefix(const std::string &mac)
    {
        std::string normalized = NormalizeMac(mac);
        if (normalized.empty())
            return "";
        return normalized.substr(0, 8);
    }

    OuiTable::OuiTable(std::string path) : m_path(std::move(path)) {}

    OuiTable::OuiTable(std::unordered_map<std::string, std::string> entries)
    {
        std::call_once(m_loadOnce, [] {});
        for (auto &[prefix, vendor] : entries)
        {
            std::string key = NormalizePrefix(prefix);
            if (!key.empty())
                m_vendors.emplace(key, std::move(vendor));
        }
    }

    void OuiTable::EnsureLoaded() const
    {
        std::call_once(m_loadOnce, [this] {
            std::ifstream file(m_path);
            if (!file.is_open())
            {
                std::cerr << "[OUI] Vendor table " << m_path << " not found, manufacturers stay empty\n";
                return;
            }

            std::string line;
            while (std::getline(file, line))
            {
                if (line.empty() || line[0] == '#')
                    continue;

                auto tab = line.find('\t');
                if (tab == std::string::npos)
                    continue;

                std::string key = NormalizePrefix(line.substr(0, tab));
                std::string vendor = line.substr(tab + 1);
                while (!vendor.empty() && (vendor.back() == '\r' || vendor.back() == ' '))
                    vendor.pop_back();

                if (!key.empty() && !vendor.empty())
                    m_vendors.emplace(key, vendor);
            }
            std::cout << "[OUI] Loaded " << m_vendors.size() << " vendor prefixes from " << m_path << "\n";
        });
    }

    std::string OuiTable::Lookup(const std::string &mac) const
    {
        std::string prefix = OuiPrefix(mac);
        if (prefix.empty())
            return "";

        EnsureLoaded();
        auto it = m_vendors.find(prefix);
        return it == m_vendors.end() ? std::string() : it->second;
    }

    size_t OuiTable::Size() const
    {
        EnsureLoaded();
        return m_vendors.size();
    }
}
