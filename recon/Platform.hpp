#pragma once

#include <string>

namespace net_recon::recon
{
    enum class Platform
    {
        Linux,
        Windows,
        Darwin,
        Unknown
    };

    // Platform the binary was built for. Resolved once and passed to the capability factories.
    Platform CurrentPlatform();

    Platform ParsePlatform(const std::string &name);
    std::string PlatformName(Platform platform);
}
