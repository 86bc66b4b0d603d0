#include "MdnsQuerier.hpp"

#include <tins/dns.h>
#include <tins/exceptions.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>

namespace net_recon::recon
{
    namespace
    {
        constexpr uint32_t kMdnsGroup = 0xE00000FB; // 224.0.0.251
        constexpr uint16_t kMdnsPort = 5353;
        constexpr std::chrono::milliseconds kCancelPoll{100};

        class SocketGuard
        {
        public:
            explicit SocketGuard(int fd) : m_fd(fd) {}
            ~SocketGuard()
            {
                if (m_fd >= 0)
                    ::close(m_fd);
            }
            SocketGuard(const SocketGuard &) = delete;
            SocketGuard &operator=(const SocketGuard &) = delete;

            int Get() const { return m_fd; }

        private:
            int m_fd;
        };

        std::string Lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::string StripDot(std::string name)
        {
            if (!name.empty() && name.back() == '.')
                name.pop_back();
            return name;
        }

        struct SrvTarget
        {
            std::string host;
            uint16_t port = 0;
        };

        // libtins renders SRV data as "priority weight port target".
        bool ParseSrv(const std::string &data, SrvTarget &out)
        {
            std::istringstream ss(data);
            unsigned priority = 0, weight = 0, port = 0;
            std::string target;
            if (!(ss >> priority >> weight >> port >> target) || port > 0xffff)
                return false;
            out.host = target;
            out.port = static_cast<uint16_t>(port);
            return true;
        }

        std::vector<MdnsServiceEntry> DecodeResponse(const Tins::DNS &response, const std::string &service,
                                                     const std::string &sender)
        {
            const std::string browseName = Lower(service + ".local");

            std::vector<Tins::DNS::resource> records = response.answers();
            for (const auto &extra : response.additional())
                records.push_back(extra);

            std::vector<std::string> instances;
            std::map<std::string, SrvTarget> targets;
            std::map<std::string, std::string> addresses;
            std::map<std::string, std::vector<std::string>> texts;

            for (const auto &record : records)
            {
                std::string owner = Lower(StripDot(record.dname()));
                switch (record.query_type())
                {
                case Tins::DNS::PTR:
                    if (owner == browseName)
                        instances.push_back(StripDot(record.data()));
                    break;
                case Tins::DNS::SRV:
                {
                    SrvTarget target;
                    if (ParseSrv(record.data(), target))
                        targets[owner] = target;
                    break;
                }
                case Tins::DNS::A:
                    addresses[owner] = record.data();
                    break;
                case Tins::DNS::TXT:
                    texts[owner].push_back(record.data());
                    break;
                default:
                    break;
                }
            }

            std::vector<MdnsServiceEntry> entries;
            for (const auto &instance : instances)
            {
                MdnsServiceEntry entry;
                entry.name = instance;
                entry.addr = sender;

                const std::string key = Lower(instance);
                auto srv = targets.find(key);
                if (srv != targets.end())
                {
                    entry.host = srv->second.host;
                    entry.port = srv->second.port;
                    auto a = addresses.find(Lower(StripDot(entry.host)));
                    if (a != addresses.end())
                        entry.addr_v4 = a->second;
                }
                else if (addresses.size() == 1)
                {
                    entry.host = addresses.begin()->first;
                    entry.addr_v4 = addresses.begin()->second;
                }

                auto txt = texts.find(key);
                if (txt != texts.end())
                    entry.info_fields = txt->second;

                entries.push_back(std::move(entry));
            }
            return entries;
        }
    }

    void MulticastDnsQuerier::Query(const std::string &service, std::chrono::milliseconds timeout,
                                    const MdnsEntrySink &sink, const CancelToken &cancel)
    {
        SocketGuard sock(::socket(AF_INET, SOCK_DGRAM, 0));
        if (sock.Get() < 0)
            throw std::runtime_error(std::string("mDNS socket: ") + std::strerror(errno));

        unsigned char ttl = 255;
        if (::setsockopt(sock.Get(), IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0)
            throw std::runtime_error(std::string("mDNS multicast TTL: ") + std::strerror(errno));

        sockaddr_in local{};
        local.sin_family = AF_INET;
        local.sin_addr.s_addr = htonl(INADDR_ANY);
        if (::bind(sock.Get(), reinterpret_cast<sockaddr *>(&local), sizeof(local)) < 0)
            throw std::runtime_error(std::string("mDNS bind: ") + std::strerror(errno));

        Tins::DNS query;
        query.id(0);
        query.type(Tins::DNS::QUERY);
        query.add_query(Tins::DNS::query(service + ".local", Tins::DNS::PTR, Tins::DNS::INTERNET));
        Tins::PDU::serialized_type packet = query.serialize();

        sockaddr_in group{};
        group.sin_family = AF_INET;
        group.sin_port = htons(kMdnsPort);
        group.sin_addr.s_addr = htonl(kMdnsGroup);

        if (::sendto(sock.Get(), packet.data(), packet.size(), 0,
                     reinterpret_cast<sockaddr *>(&group), sizeof(group)) < 0)
            throw std::runtime_error(std::string("mDNS send: ") + std::strerror(errno));

        std::set<std::string> delivered;
        std::array<uint8_t, 9000> buffer{};
        auto deadline = std::chrono::steady_clock::now() + timeout;

        while (!cancel.IsCancelled())
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
                break;

            pollfd pfd{sock.Get(), POLLIN, 0};
            int rc = ::poll(&pfd, 1, static_cast<int>(std::min(remaining, kCancelPoll).count()));
            if (rc < 0 && errno != EINTR)
                throw std::runtime_error(std::string("mDNS poll: ") + std::strerror(errno));
            if (rc <= 0)
                continue;

            sockaddr_in from{};
            socklen_t len = sizeof(from);
            ssize_t n = ::recvfrom(sock.Get(), buffer.data(), buffer.size(), 0,
                                   reinterpret_cast<sockaddr *>(&from), &len);
            if (n <= 0)
                continue;

            char sender[INET_ADDRSTRLEN] = {0};
            if (!inet_ntop(AF_INET, &from.sin_addr, sender, sizeof(sender)))
                continue;

            try
            {
                Tins::DNS response(buffer.data(), static_cast<uint32_t>(n));
                if (response.type() != Tins::DNS::RESPONSE)
                    continue;

                for (auto &entry : DecodeResponse(response, service, sender))
                {
                    if (delivered.insert(Lower(entry.name)).second)
                        sink(std::move(entry));
                }
            }
            catch (const Tins::exception_base &)
            {
                // Not a DNS message we can decode; keep listening.
            }
        }
    }

    std::unique_ptr<MdnsQuerier> MakeMdnsQuerier(Platform platform)
    {
        if (platform == Platform::Windows)
            return nullptr;
        return std::make_unique<MulticastDnsQuerier>();
    }
}
