#pragma once

#include "Platform.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace net_recon::recon
{
    enum class IcmpKind
    {
        EchoReply,
        TimeExceeded,
        DestUnreachable,
        Other
    };

    struct IcmpReply
    {
        IcmpKind kind = IcmpKind::Other;
        std::string peer; // sender of the ICMP message

        // For echo replies: the reply's own id/sequence. For errors: the id/sequence of the
        // echo request quoted in the payload, when the quote holds one.
        bool has_echo = false;
        uint16_t id = 0;
        uint16_t sequence = 0;
    };

    // Echo request bytes (ICMP header + payload, checksummed) for the given id/sequence.
    std::vector<uint8_t> BuildEchoRequest(uint16_t id, uint16_t sequence, const std::string &payload);

    // `data` starts at the ICMP header.
    std::optional<IcmpReply> ParseIcmpMessage(const uint8_t *data, size_t size, const std::string &peer);

    // `data` starts at the IPv4 header, as raw sockets deliver it.
    std::optional<IcmpReply> ParseIpPacket(const uint8_t *data, size_t size);

    // Looks for an echo request inside the quoted "IP header + 8 bytes" of an ICMP error.
    bool ParseQuotedEcho(const std::vector<uint8_t> &quoted, uint16_t &id, uint16_t &sequence);

    class IcmpTransport
    {
    public:
        virtual ~IcmpTransport() = default;

        // Echo identifier replies are matched against.
        virtual uint16_t Identifier() const = 0;

        virtual bool SetTtl(int ttl) = 0;
        virtual bool SendEcho(const std::string &target, uint16_t sequence) = 0;

        // Next parsable ICMP message, or nullopt once `deadline` passes.
        virtual std::optional<IcmpReply> Receive(std::chrono::steady_clock::time_point deadline) = 0;
    };

    class IcmpSocket : public IcmpTransport
    {
    public:
        // Unprivileged datagram socket first, raw socket as fallback (raw only on Windows).
        // Throws ProbeError when neither can be opened.
        static std::unique_ptr<IcmpSocket> Open(Platform platform);

        ~IcmpSocket() override;
        IcmpSocket(const IcmpSocket &) = delete;
        IcmpSocket &operator=(const IcmpSocket &) = delete;

        uint16_t Identifier() const override { return m_id; }
        bool IsDatagram() const { return m_datagram; }

        bool SetTtl(int ttl) override;
        bool SendEcho(const std::string &target, uint16_t sequence) override;
        std::optional<IcmpReply> Receive(std::chrono::steady_clock::time_point deadline) override;

    private:
        IcmpSocket(int fd, bool datagram, bool kernelIdent);

        std::optional<IcmpReply> ReadErrorQueue();

        int m_fd = -1;
        bool m_datagram = false;
        bool m_errorQueue = false;
        uint16_t m_id = 0;
    };
}
