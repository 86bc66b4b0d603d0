#pragma once

#include <stdexcept>
#include <string>

namespace net_recon::recon
{
    // Bad input from the caller: malformed CIDR, oversized subnet, non-IPv4 target.
    class PreconditionError : public std::runtime_error
    {
    public:
        explicit PreconditionError(const std::string &what) : std::runtime_error(what) {}
    };

    // The resource is held by another caller; retrying later may succeed.
    class ResourceBusyError : public std::runtime_error
    {
    public:
        explicit ResourceBusyError(const std::string &what) : std::runtime_error(what) {}
    };

    // No probing socket could be opened, so the operation cannot proceed at all.
    class ProbeError : public std::runtime_error
    {
    public:
        explicit ProbeError(const std::string &what) : std::runtime_error(what) {}
    };

    class StoreError : public std::runtime_error
    {
    public:
        explicit StoreError(const std::string &what) : std::runtime_error(what) {}
    };

    class ConfigError : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
    };

    class OperationCancelled : public std::runtime_error
    {
    public:
        OperationCancelled() : std::runtime_error("operation cancelled") {}
        explicit OperationCancelled(const std::string &what) : std::runtime_error(what) {}
    };
}
