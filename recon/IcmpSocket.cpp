#include "IcmpSocket.hpp"
#include "Errors.hpp"

#include <tins/icmp.h>
#include <tins/ip.h>
#include <tins/rawpdu.h>
#include <tins/exceptions.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#ifdef __linux__
#include <linux/errqueue.h>
#endif

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace net_recon::recon
{
    namespace
    {
        const std::string kProbePayload = "NetRecon-Probe";

        uint16_t ReadU16(const uint8_t *p)
        {
            return static_cast<uint16_t>((p[0] << 8) | p[1]);
        }

        std::string FormatAddress(const sockaddr_in &addr)
        {
            char buf[INET_ADDRSTRLEN] = {0};
            if (!inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf)))
                return "";
            return buf;
        }

        IcmpKind KindOf(int type)
        {
            switch (type)
            {
            case Tins::ICMP::ECHO_REPLY:
                return IcmpKind::EchoReply;
            case Tins::ICMP::TIME_EXCEEDED:
                return IcmpKind::TimeExceeded;
            case Tins::ICMP::DEST_UNREACHABLE:
                return IcmpKind::DestUnreachable;
            default:
                return IcmpKind::Other;
            }
        }

        IcmpReply FromPdu(const Tins::ICMP &icmp, const std::string &peer)
        {
            IcmpReply reply;
            reply.kind = KindOf(icmp.type());
            reply.peer = peer;

            if (reply.kind == IcmpKind::EchoReply)
            {
                reply.has_echo = true;
                reply.id = icmp.id();
                reply.sequence = icmp.sequence();
            }
            else if (reply.kind != IcmpKind::Other)
            {
                if (const auto *raw = icmp.find_pdu<Tins::RawPDU>())
                    reply.has_echo = ParseQuotedEcho(raw->payload(), reply.id, reply.sequence);
            }
            return reply;
        }

        uint16_t NextLocalIdentifier()
        {
            static std::atomic<uint16_t> counter{0};
            return static_cast<uint16_t>((static_cast<unsigned>(getpid()) + counter++) & 0xffff);
        }
    }

    std::vector<uint8_t> BuildEchoRequest(uint16_t id, uint16_t sequence, const std::string &payload)
    {
        Tins::ICMP icmp(Tins::ICMP::ECHO_REQUEST);
        icmp.id(id);
        icmp.sequence(sequence);
        icmp /= Tins::RawPDU(payload);
        return icmp.serialize();
    }

    bool ParseQuotedEcho(const std::vector<uint8_t> &quoted, uint16_t &id, uint16_t &sequence)
    {
        if (quoted.size() < 28)
            return false;

        size_t ihl = static_cast<size_t>(quoted[0] & 0x0f) * 4;
        if ((quoted[0] >> 4) != 4 || ihl < 20 || quoted.size() < ihl + 8)
            return false;
        if (quoted[9] != IPPROTO_ICMP)
            return false;

        const uint8_t *inner = quoted.data() + ihl;
        if (inner[0] != Tins::ICMP::ECHO_REQUEST)
            return false;

        id = ReadU16(inner + 4);
        sequence = ReadU16(inner + 6);
        return true;
    }

    std::optional<IcmpReply> ParseIcmpMessage(const uint8_t *data, size_t size, const std::string &peer)
    {
        try
        {
            Tins::ICMP icmp(data, static_cast<uint32_t>(size));
            return FromPdu(icmp, peer);
        }
        catch (const Tins::exception_base &)
        {
            return std::nullopt;
        }
    }

    std::optional<IcmpReply> ParseIpPacket(const uint8_t *data, size_t size)
    {
        try
        {
            Tins::IP ip(data, static_cast<uint32_t>(size));
            const auto *icmp = ip.find_pdu<Tins::ICMP>();
            if (!icmp)
                return std::nullopt;
            return FromPdu(*icmp, ip.src_addr().to_string());
        }
        catch (const Tins::exception_base &)
        {
            return std::nullopt;
        }
    }

    std::unique_ptr<IcmpSocket> IcmpSocket::Open(Platform platform)
    {
        std::string datagramError = "not attempted";
        if (platform != Platform::Windows)
        {
            int fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP);
            if (fd >= 0)
                return std::unique_ptr<IcmpSocket>(new IcmpSocket(fd, true, platform == Platform::Linux));
            datagramError = std::strerror(errno);
        }

        int fd = ::socket(AF_INET, SOCK_RAW, IPPROTO_ICMP);
        if (fd < 0)
        {
            throw ProbeError("cannot open ICMP socket (datagram: " + datagramError +
                             ", raw: " + std::strerror(errno) + "); raw sockets need root or CAP_NET_RAW");
        }
        return std::unique_ptr<IcmpSocket>(new IcmpSocket(fd, false, false));
    }

    IcmpSocket::IcmpSocket(int fd, bool datagram, bool kernelIdent) : m_fd(fd), m_datagram(datagram)
    {
        m_id = NextLocalIdentifier();
        if (!kernelIdent)
            return;

        // Linux ping sockets rewrite the echo id to the socket's local "port".
        sockaddr_in local{};
        local.sin_family = AF_INET;
        local.sin_addr.s_addr = htonl(INADDR_ANY);
        socklen_t len = sizeof(local);
        if (::bind(m_fd, reinterpret_cast<sockaddr *>(&local), sizeof(local)) < 0 ||
            ::getsockname(m_fd, reinterpret_cast<sockaddr *>(&local), &len) < 0)
        {
            std::string reason = std::strerror(errno);
            ::close(m_fd);
            m_fd = -1;
            throw ProbeError("cannot bind ICMP datagram socket: " + reason);
        }
        m_id = ntohs(local.sin_port);

#ifdef __linux__
        int on = 1;
        if (::setsockopt(m_fd, IPPROTO_IP, IP_RECVERR, &on, sizeof(on)) == 0)
            m_errorQueue = true;
#endif
    }

    IcmpSocket::~IcmpSocket()
    {
        if (m_fd >= 0)
            ::close(m_fd);
    }

    bool IcmpSocket::SetTtl(int ttl)
    {
        return ::setsockopt(m_fd, IPPROTO_IP, IP_TTL, &ttl, sizeof(ttl)) == 0;
    }

    bool IcmpSocket::SendEcho(const std::string &target, uint16_t sequence)
    {
        sockaddr_in dest{};
        dest.sin_family = AF_INET;
        if (inet_pton(AF_INET, target.c_str(), &dest.sin_addr) != 1)
            return false;

        std::vector<uint8_t> packet = BuildEchoRequest(m_id, sequence, kProbePayload);
        ssize_t sent = ::sendto(m_fd, packet.data(), packet.size(), 0,
                                reinterpret_cast<sockaddr *>(&dest), sizeof(dest));
        return sent == static_cast<ssize_t>(packet.size());
    }

    std::optional<IcmpReply> IcmpSocket::Receive(std::chrono::steady_clock::time_point deadline)
    {
        std::array<uint8_t, 1500> buffer{};

        while (true)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 deadline - std::chrono::steady_clock::now())
                                 .count();
            if (remaining <= 0)
                return std::nullopt;

            pollfd pfd{m_fd, POLLIN, 0};
            int rc = ::poll(&pfd, 1, static_cast<int>(remaining));
            if (rc < 0 && errno == EINTR)
                continue;
            if (rc <= 0)
                return std::nullopt;

            if (m_errorQueue && (pfd.revents & POLLERR))
            {
                if (auto reply = ReadErrorQueue())
                    return reply;
            }

            if (!(pfd.revents & POLLIN))
                continue;

            sockaddr_in from{};
            socklen_t len = sizeof(from);
            ssize_t n = ::recvfrom(m_fd, buffer.data(), buffer.size(), 0,
                                   reinterpret_cast<sockaddr *>(&from), &len);
            if (n <= 0)
                continue;

            std::optional<IcmpReply> reply;
            // Datagram sockets hand back the bare ICMP message on Linux, the full packet elsewhere.
            if (!m_datagram || (buffer[0] >> 4) == 4)
                reply = ParseIpPacket(buffer.data(), static_cast<size_t>(n));
            else
                reply = ParseIcmpMessage(buffer.data(), static_cast<size_t>(n), FormatAddress(from));

            if (reply)
                return reply;
        }
    }

    std::optional<IcmpReply> IcmpSocket::ReadErrorQueue()
    {
#ifdef __linux__
        std::array<uint8_t, 1500> data{};
        std::array<char, 512> control{};
        sockaddr_in target{};

        iovec iov{data.data(), data.size()};
        msghdr msg{};
        msg.msg_name = &target;
        msg.msg_namelen = sizeof(target);
        msg.msg_iov = &iov;
        msg.msg_iovlen = 1;
        msg.msg_control = control.data();
        msg.msg_controllen = control.size();

        ssize_t n = ::recvmsg(m_fd, &msg, MSG_ERRQUEUE | MSG_DONTWAIT);
        if (n < 0)
        {
            // Reading SO_ERROR clears a pending error so poll stops flagging POLLERR.
            int pending = 0;
            socklen_t len = sizeof(pending);
            if (::getsockopt(m_fd, SOL_SOCKET, SO_ERROR, &pending, &len) < 0)
                std::cerr << "[ICMP] getsockopt(SO_ERROR) failed: " << std::strerror(errno) << "\n";
            return std::nullopt;
        }

        for (cmsghdr *cmsg = CMSG_FIRSTHDR(&msg); cmsg != nullptr; cmsg = CMSG_NXTHDR(&msg, cmsg))
        {
            if (cmsg->cmsg_level != IPPROTO_IP || cmsg->cmsg_type != IP_RECVERR)
                continue;

            const auto *err = reinterpret_cast<const sock_extended_err *>(CMSG_DATA(cmsg));
            if (err->ee_origin != SO_EE_ORIGIN_ICMP)
                continue;

            IcmpReply reply;
            reply.kind = KindOf(err->ee_type);
            reply.peer = FormatAddress(*reinterpret_cast<const sockaddr_in *>(SO_EE_OFFENDER(err)));

            // The queued payload is the echo request the error refers to.
            try
            {
                Tins::ICMP echo(data.data(), static_cast<uint32_t>(n));
                if (echo.type() == Tins::ICMP::ECHO_REQUEST)
                {
                    reply.has_echo = true;
                    reply.id = echo.id();
                    reply.sequence = echo.sequence();
                }
            }
            catch (const Tins::exception_base &)
            {
                reply.has_echo = false;
            }
            return reply;
        }
#endif
        return std::nullopt;
    }
}
