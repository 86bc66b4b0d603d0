#include "Platform.hpp"

#include <algorithm>
#include <cctype>

namespace net_recon::recon
{
    Platform CurrentPlatform()
    {
#if defined(_WIN32)
        return Platform::Windows;
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
        return Platform::Darwin;
#elif defined(__linux__)
        return Platform::Linux;
#else
        return Platform::Unknown;
#endif
    }

    Platform ParsePlatform(const std::string &name)
    {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "linux")
            return Platform::Linux;
        if (lower == "windows")
            return Platform::Windows;
        if (lower == "darwin" || lower == "macos" || lower == "freebsd" || lower == "bsd")
            return Platform::Darwin;
        return Platform::Unknown;
    }

    std::string PlatformName(Platform platform)
    {
        switch (platform)
        {
        case Platform::Linux:
            return "linux";
        case Platform::Windows:
            return "windows";
        case Platform::Darwin:
            return "darwin";
        default:
            return "unknown";
        }
    }
}
