#include "LocalInterface.hpp"
#include "ArpParser.hpp"

#include <tins/network_interface.h>

#include <iostream>

namespace net_recon::recon
{
    std::optional<LocalInterface> TinsInterfaceProvider::DefaultInterface()
    {
        try
        {
            Tins::NetworkInterface iface = Tins::NetworkInterface::default_interface();
            Tins::NetworkInterface::Info info = iface.info();

            LocalInterface local;
            local.name = iface.name();
            local.ip = info.ip_addr.to_string();
            local.mac = NormalizeMac(info.hw_addr.to_string());
            if (local.mac == "00:00:00:00:00:00")
                local.mac.clear();
            return local;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Iface] Default interface lookup failed: " << e.what() << "\n";
            return std::nullopt;
        }
    }
}
