#pragma once

#include <optional>
#include <string>

namespace net_recon::recon
{
    struct LocalInterface
    {
        std::string name;
        std::string ip;
        std::string mac; // normalized, may be empty for point-to-point links
    };

    class InterfaceProvider
    {
    public:
        virtual ~InterfaceProvider() = default;
        virtual std::optional<LocalInterface> DefaultInterface() = 0;
    };

    // Interface holding the default route, as libtins reports it.
    class TinsInterfaceProvider : public InterfaceProvider
    {
    public:
        std::optional<LocalInterface> DefaultInterface() override;
    };
}
