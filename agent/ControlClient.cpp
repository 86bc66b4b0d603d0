#include "ControlClient.hpp"

#include <arpa/inet.h>
#include <cstring>
#include <iostream>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace net_recon::agent
{
    namespace
    {
        bool wait_fd(int fd, short events, int timeout_ms)
        {
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = events;

            int r = poll(&pfd, 1, timeout_ms);
            return r > 0;
        }

        bool resolve_ipv4(const std::string &host, in_addr &out)
        {
            if (inet_pton(AF_INET, host.c_str(), &out) == 1)
                return true;

            addrinfo hints{};
            hints.ai_family = AF_INET;
            hints.ai_socktype = SOCK_STREAM;
            addrinfo *res = nullptr;
            if (getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || res == nullptr)
                return false;

            out = reinterpret_cast<sockaddr_in *>(res->ai_addr)->sin_addr;
            freeaddrinfo(res);
            return true;
        }
    }

    ControlClient::ControlClient(std::string host, int port, int timeout_ms)
        : m_host(std::move(host)), m_port(port), m_timeout_ms(timeout_ms), m_socket_fd(-1),
          m_ssl_ctx(nullptr), m_ssl_handle(nullptr)
    {
    }

    ControlClient::~ControlClient()
    {
        Disconnect();
        if (m_ssl_ctx)
            SSL_CTX_free(m_ssl_ctx);
    }

    bool ControlClient::Connect()
    {
        if (!m_ssl_ctx)
        {
            m_ssl_ctx = SSL_CTX_new(TLS_client_method());
            if (!m_ssl_ctx)
            {
                ERR_print_errors_fp(stderr);
                return false;
            }
            // The daemon ships a self-signed certificate.
            SSL_CTX_set_verify(m_ssl_ctx, SSL_VERIFY_NONE, nullptr);
        }

        sockaddr_in serv_addr{};
        serv_addr.sin_family = AF_INET;
        serv_addr.sin_port = htons(static_cast<uint16_t>(m_port));
        if (!resolve_ipv4(m_host, serv_addr.sin_addr))
        {
            std::cerr << "[Client] Invalid address or host not found: " << m_host << std::endl;
            return false;
        }

        m_socket_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (m_socket_fd < 0)
        {
            perror("Socket creation failed");
            return false;
        }

        if (connect(m_socket_fd, reinterpret_cast<sockaddr *>(&serv_addr), sizeof(serv_addr)) < 0)
        {
            perror("Connection failed");
            Disconnect();
            return false;
        }

        m_ssl_handle = SSL_new(m_ssl_ctx);
        if (!m_ssl_handle)
        {
            ERR_print_errors_fp(stderr);
            Disconnect();
            return false;
        }
        SSL_set_fd(m_ssl_handle, m_socket_fd);

        if (SSL_connect(m_ssl_handle) <= 0)
        {
            ERR_print_errors_fp(stderr);
            Disconnect();
            return false;
        }

        return true;
    }

    void ControlClient::Disconnect()
    {
        if (m_ssl_handle)
        {
            SSL_shutdown(m_ssl_handle);
            SSL_free(m_ssl_handle);
            m_ssl_handle = nullptr;
        }
        if (m_socket_fd != -1)
        {
            close(m_socket_fd);
            m_socket_fd = -1;
        }
        m_rx_buf = net_recon::common::ByteBuffer{};
    }

    bool ControlClient::WriteAll(const std::vector<uint8_t> &frame)
    {
        size_t off = 0;
        while (off < frame.size())
        {
            int n = SSL_write(m_ssl_handle, frame.data() + off, static_cast<int>(frame.size() - off));
            if (n > 0)
            {
                off += static_cast<size_t>(n);
                continue;
            }

            int err = SSL_get_error(m_ssl_handle, n);
            if (err == SSL_ERROR_WANT_READ && wait_fd(m_socket_fd, POLLIN, m_timeout_ms))
                continue;
            if (err == SSL_ERROR_WANT_WRITE && wait_fd(m_socket_fd, POLLOUT, m_timeout_ms))
                continue;

            return false;
        }
        return true;
    }

    bool ControlClient::ReadNextFrame(net_recon::protocol::Header &out_hdr, std::vector<uint8_t> &out_payload)
    {
        uint8_t tmp[4096];

        while (true)
        {
            if (m_rx_buf.HasHeader())
            {
                auto hdr = m_rx_buf.PeekHeader();
                if (m_rx_buf.IsMalformed(hdr))
                {
                    std::cerr << "[Client] Malformed frame from server\n";
                    return false;
                }
                if (m_rx_buf.HasCompleteMessage(hdr))
                {
                    out_hdr = hdr;
                    out_payload = m_rx_buf.ExtractPayload(hdr.payload_length);
                    m_rx_buf.Consume(net_recon::protocol::HEADER_SIZE + hdr.payload_length);
                    return true;
                }
            }

            if (!wait_fd(m_socket_fd, POLLIN, m_timeout_ms) && SSL_pending(m_ssl_handle) == 0)
            {
                std::cerr << "[Client] Timed out waiting for the server\n";
                return false;
            }

            int n = SSL_read(m_ssl_handle, tmp, sizeof(tmp));
            if (n > 0)
            {
                m_rx_buf.Append(tmp, static_cast<size_t>(n));
                continue;
            }

            int err = SSL_get_error(m_ssl_handle, n);
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                continue;

            if (err == SSL_ERROR_ZERO_RETURN)
                std::cerr << "[Client] Server closed connection.\n";
            else
                std::cerr << "[Client] SSL_read fatal error: " << err << "\n";
            return false;
        }
    }

    std::optional<ControlReply> ControlClient::Call(net_recon::protocol::MessageType type, const std::string &body)
    {
        if (!IsConnected() && !Connect())
            return std::nullopt;

        auto frame = net_recon::protocol::BuildFrame(type, net_recon::common::wire::EncodeRequest(body));
        if (!WriteAll(frame))
        {
            std::cerr << "[Client] Failed to send request\n";
            Disconnect();
            return std::nullopt;
        }

        net_recon::protocol::Header hdr{};
        std::vector<uint8_t> payload;
        if (!ReadNextFrame(hdr, payload))
        {
            Disconnect();
            return std::nullopt;
        }

        auto decoded = net_recon::common::wire::DecodeResponse(payload);
        if (!decoded)
        {
            std::cerr << "[Client] Undecodable reply\n";
            return std::nullopt;
        }

        return ControlReply{static_cast<net_recon::protocol::MessageType>(hdr.msg_type), *decoded};
    }
}
