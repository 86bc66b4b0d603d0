#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

namespace net_recon::recon
{
    class OuiLookup
    {
    public:
        virtual ~OuiLookup() = default;

        // Vendor name for the MAC's organizationally unique identifier, or "" when unknown.
        virtual std::string Lookup(const std::string &mac) const = 0;
    };

    // "AA:BB:CC" for any notation NormalizeMac accepts, "" otherwise.
    std::string OuiPrefix(const std::string &mac);

    // Tab separated "AA:BB:CC<TAB>Vendor" table. The file is read on first lookup.
    class OuiTable : public OuiLookup
    {
    public:
        explicit OuiTable(std::string path);
        explicit OuiTable(std::unordered_map<std::string, std::string> entries);

        std::string Lookup(const std::string &mac) const override;
        size_t Size() const;

    private:
        void EnsureLoaded() const;

        std::string m_path;
        mutable std::once_flag m_loadOnce;
        mutable std::unordered_map<std::string, std::string> m_vendors;
    };
}
