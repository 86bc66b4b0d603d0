#include <fcntl.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <stdexcept>
#include <sys/socket.h>
#include <iostream>

#include "NetworkCore.hpp"
#include "Worker.hpp"
#include "../common/ByteBuffer.hpp"
#include "../common/Codec.hpp"
#include "../common/protocol.hpp"
#include <netinet/in.h>

namespace net_recon::server
{

    void NetworkCore::LogOpenSSLErrors()
    {
        unsigned long err;
        while ((err = ERR_get_error()) != 0)
        {
            char buf[256];
            ERR_error_string_n(err, buf, sizeof(buf));
            std::cerr << "[TLS] " << buf << std::endl;
        }
    }

    void NetworkCore::NonBlockingMode(int fd)
    {
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        {
            throw std::runtime_error("Failed to set O_NONBLOCK");
        }
    }

    void NetworkCore::EpollControlAdd(int fd)
    {
        struct epoll_event event;

        std::memset(&event, 0, sizeof(event));

        event.events = EPOLLIN;
        event.data.fd = fd;

        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_ADD, fd, &event) == -1)
        {
            throw std::runtime_error("Failed to add FD to epoll");
        }
    }

    void NetworkCore::EpollControlModify(int fd, uint32_t events)
    {
        struct epoll_event event;
        std::memset(&event, 0, sizeof(event));
        event.events = events;
        event.data.fd = fd;

        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_MOD, fd, &event) == -1)
        {
            std::cerr << "[Server] Warning: Failed to modify epoll events for " << fd << std::endl;
        }
    }

    void NetworkCore::EpollControlRemove(int fd)
    {
        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_DEL, fd, nullptr) == -1)
        {
            std::cerr << "[Server] Warning: Failed to remove FD from epoll" << std::endl;
        }
    }

    void NetworkCore::DisconnectClient(int fd)
    {
        auto it = registry.find(fd);
        if (it == registry.end())
            return;

        EpollControlRemove(fd);
        if (it->second.ssl_handle)
        {
            if (it->second.is_handshake_complete)
                SSL_shutdown(it->second.ssl_handle);
            SSL_free(it->second.ssl_handle);
        }
        close(fd);
        registry.erase(it);
        std::cout << "[Server] Client " << fd << " disconnected" << std::endl;
    }

    void NetworkCore::HandleNewConnection()
    {
        while (true)
        {
            struct sockaddr_in clientAddress;
            socklen_t clientAddressLength = sizeof(clientAddress);
            int client_fd = accept(m_server_fd, reinterpret_cast<struct sockaddr *>(&clientAddress), &clientAddressLength);
            if (client_fd == -1)
            {
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                    std::cerr << "[Server] accept failed: " << std::strerror(errno) << std::endl;
                return;
            }

            try
            {
                NonBlockingMode(client_fd);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Server] " << e.what() << ", dropping client" << std::endl;
                close(client_fd);
                continue;
            }

            SSL *ssl_handle = SSL_new(m_ssl_ctx);
            if (!ssl_handle)
            {
                LogOpenSSLErrors();
                close(client_fd);
                continue;
            }
            SSL_set_fd(ssl_handle, client_fd);
            SSL_set_mode(ssl_handle, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

            ClientContext &ctx = registry[client_fd];
            ctx.socketfd = client_fd;
            ctx.connection_id = ++m_next_connection_id;
            ctx.ssl_handle = ssl_handle;
            ctx.is_handshake_complete = false;

            try
            {
                EpollControlAdd(client_fd);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Server] " << e.what() << std::endl;
                SSL_free(ssl_handle);
                close(client_fd);
                registry.erase(client_fd);
                continue;
            }

            std::cout << "[Server] New connection accepted, handshake pending: " << client_fd << std::endl;
            HandleClientData(client_fd);
        }
    }

    void NetworkCore::HandleClientData(int fd)
    {
        auto found = registry.find(fd);
        if (found == registry.end())
            return;
        ClientContext &ctx = found->second;

        if (ctx.is_handshake_complete == false)
        {
            int ret = SSL_accept(ctx.ssl_handle);

            if (ret == 1)
            {
                ctx.is_handshake_complete = true;
                std::cout << "[Server] TLS Handshake complete for client " << fd << std::endl;
            }
            else
            {
                int err = SSL_get_error(ctx.ssl_handle, ret);
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                {
                    return;
                }
                std::cerr << "[Server] SSL Handshake Failed. Error: " << err << std::endl;
                LogOpenSSLErrors();
                DisconnectClient(fd);
                return;
            }
        }

        uint8_t temp_buffer[4096];

        while (true)
        {
            int count = SSL_read(ctx.ssl_handle, temp_buffer, sizeof(temp_buffer));

            if (count > 0)
            {
                ctx.buff.Append(temp_buffer, static_cast<size_t>(count));
                continue;
            }

            int err = SSL_get_error(ctx.ssl_handle, count);
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                break;

            if (err != SSL_ERROR_ZERO_RETURN)
                LogOpenSSLErrors();
            DisconnectClient(fd);
            return;
        }

        while (ctx.buff.HasHeader())
        {
            auto header = ctx.buff.PeekHeader();
            if (ctx.buff.IsMalformed(header))
            {
                std::cerr << "[Server] Malformed frame from client " << fd << ", disconnecting" << std::endl;
                DisconnectClient(fd);
                return;
            }
            if (!ctx.buff.HasCompleteMessage(header))
                break;

            std::vector<uint8_t> payload = ctx.buff.ExtractPayload(header.payload_length);
            ctx.buff.Consume(net_recon::protocol::HEADER_SIZE + header.payload_length);

            ProcessMessage(fd, static_cast<net_recon::protocol::MessageType>(header.msg_type), std::move(payload));
        }
    }

    void NetworkCore::ProcessMessage(int fd, net_recon::protocol::MessageType type, std::vector<uint8_t> payload)
    {
        using namespace net_recon::protocol;

        std::cout << "[Client " << fd << "] Received " << MessageTypeName(type)
                  << " | Size: " << payload.size() << " bytes." << std::endl;

        ClientContext &ctx = registry[fd];

        if (!m_worker)
        {
            auto body = common::wire::EncodeResponse(503, "{\"type\":\"about:blank\",\"title\":\"Service Unavailable\",\"status\":503,\"detail\":\"no worker attached\"}");
            auto frame = BuildFrame(MessageType::ErrorResp, body);
            ctx.outbox.insert(ctx.outbox.end(), frame.begin(), frame.end());
            FlushClient(fd);
            return;
        }

        m_worker->AddJob(fd, ctx.connection_id, type, std::move(payload));
    }

    void NetworkCore::QueueResponse(int fd, uint64_t connection_id, net_recon::protocol::MessageType type, const std::vector<uint8_t> &payload)
    {
        {
            std::lock_guard<std::mutex> lock(m_outbound_mutex);
            m_outbound.push_back({fd, connection_id, net_recon::protocol::BuildFrame(type, payload)});
        }

        uint64_t one = 1;
        if (write(m_wake_fd, &one, sizeof(one)) != sizeof(one))
        {
            std::cerr << "[Server] Warning: failed to wake event loop" << std::endl;
        }
    }

    void NetworkCore::DrainOutbound()
    {
        uint64_t counter = 0;
        if (read(m_wake_fd, &counter, sizeof(counter)) < 0 && errno != EAGAIN)
        {
            std::cerr << "[Server] Warning: eventfd read failed" << std::endl;
        }

        std::vector<Outbound> pending;
        {
            std::lock_guard<std::mutex> lock(m_outbound_mutex);
            pending.swap(m_outbound);
        }

        for (auto &out : pending)
        {
            auto it = registry.find(out.fd);
            if (it == registry.end() || it->second.connection_id != out.connection_id)
                continue; // client went away while its request was being served

            it->second.outbox.insert(it->second.outbox.end(), out.frame.begin(), out.frame.end());
            FlushClient(out.fd);
        }
    }

    void NetworkCore::FlushClient(int fd)
    {
        auto it = registry.find(fd);
        if (it == registry.end())
            return;
        ClientContext &ctx = it->second;

        while (!ctx.outbox.empty())
        {
            int written = SSL_write(ctx.ssl_handle, ctx.outbox.data(), static_cast<int>(ctx.outbox.size()));
            if (written > 0)
            {
                ctx.outbox.erase(ctx.outbox.begin(), ctx.outbox.begin() + written);
                continue;
            }

            int err = SSL_get_error(ctx.ssl_handle, written);
            if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
            {
                EpollControlModify(fd, EPOLLIN | EPOLLOUT);
                return;
            }

            LogOpenSSLErrors();
            DisconnectClient(fd);
            return;
        }

        EpollControlModify(fd, EPOLLIN);
    }

    void NetworkCore::HandleWritable(int fd)
    {
        FlushClient(fd);
    }

    NetworkCore::NetworkCore(int port, std::string cert_path, std::string key_path)
        : m_server_fd(-1), m_epoll_fd(-1), m_wake_fd(-1), m_port(port),
          m_cert_path(std::move(cert_path)), m_key_path(std::move(key_path)),
          m_running(false), m_next_connection_id(0), m_ssl_ctx(nullptr), m_worker(nullptr)
    {
    }

    NetworkCore::~NetworkCore()
    {
        for (auto &it : registry)
        {
            if (it.second.ssl_handle)
                SSL_free(it.second.ssl_handle);
            close(it.first);
        }
        registry.clear();

        if (m_server_fd != -1)
            close(m_server_fd);
        if (m_wake_fd != -1)
            close(m_wake_fd);
        if (m_epoll_fd != -1)
            close(m_epoll_fd);
        if (m_ssl_ctx)
            SSL_CTX_free(m_ssl_ctx);
    }

    void NetworkCore::Init()
    {
        m_ssl_ctx = SSL_CTX_new(TLS_server_method());
        if (m_ssl_ctx == nullptr)
        {
            LogOpenSSLErrors();
            throw std::runtime_error("Failed to create SSL Context.");
        }
        SSL_CTX_set_min_proto_version(m_ssl_ctx, TLS1_2_VERSION);

        if (SSL_CTX_use_certificate_file(m_ssl_ctx, m_cert_path.c_str(), SSL_FILETYPE_PEM) <= 0)
        {
            LogOpenSSLErrors();
            throw std::runtime_error("Failed to load certificate '" + m_cert_path + "'");
        }

        if (SSL_CTX_use_PrivateKey_file(m_ssl_ctx, m_key_path.c_str(), SSL_FILETYPE_PEM) <= 0)
        {
            LogOpenSSLErrors();
            throw std::runtime_error("Failed to load private key '" + m_key_path + "'");
        }

        if (!SSL_CTX_check_private_key(m_ssl_ctx))
        {
            throw std::runtime_error("Private Key does not match the Certificate!");
        }

        m_server_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (m_server_fd == -1)
        {
            throw std::runtime_error("Failed to create socket.");
        }

        int opt = 1;
        if (setsockopt(m_server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0)
        {
            throw std::runtime_error("Failed to set SO_REUSEADDR.");
        }

        NonBlockingMode(m_server_fd);

        struct sockaddr_in serverAddress;
        std::memset(&serverAddress, 0, sizeof(serverAddress));
        serverAddress.sin_family = AF_INET;
        serverAddress.sin_port = htons(static_cast<uint16_t>(m_port));
        serverAddress.sin_addr.s_addr = INADDR_ANY;

        if (bind(m_server_fd, reinterpret_cast<struct sockaddr *>(&serverAddress), sizeof(serverAddress)) != 0)
        {
            throw std::runtime_error("Failed to bind server socket. Is the port taken?");
        }

        if ((listen(m_server_fd, SOMAXCONN)) != 0)
        {
            throw std::runtime_error("Failed to listen server socket.");
        }

        m_epoll_fd = epoll_create1(0);
        if (m_epoll_fd == -1)
        {
            throw std::runtime_error("Failed to create epoll file descriptor.");
        }

        m_wake_fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (m_wake_fd == -1)
        {
            throw std::runtime_error("Failed to create eventfd.");
        }

        EpollControlAdd(m_server_fd);
        EpollControlAdd(m_wake_fd);
    }

    void NetworkCore::Run()
    {
        m_running = true;

        std::cout << "[Server] Control channel listening on port " << m_port << std::endl;

        struct epoll_event ev[128];
        int count = 0;
        while (m_running)
        {
            if ((count = epoll_wait(m_epoll_fd, ev, 128, -1)) == -1)
            {
                if (errno == EINTR)
                    continue;
                std::cerr << "[Server] epoll_wait failed: " << std::strerror(errno) << std::endl;
                break;
            }

            for (int i = 0; i < count; i++)
            {
                int current_fd = ev[i].data.fd;
                if (current_fd == m_server_fd)
                    HandleNewConnection();
                else if (current_fd == m_wake_fd)
                    DrainOutbound();
                else
                {
                    if (ev[i].events & (EPOLLHUP | EPOLLERR))
                    {
                        DisconnectClient(current_fd);
                        continue;
                    }
                    if (ev[i].events & EPOLLOUT)
                        HandleWritable(current_fd);
                    if (ev[i].events & EPOLLIN)
                        HandleClientData(current_fd);
                }
            }
        }

        std::cout << "[Server] Event loop stopped" << std::endl;
    }

    void NetworkCore::Stop()
    {
        m_running = false;
        if (m_wake_fd != -1)
        {
            uint64_t one = 1;
            if (write(m_wake_fd, &one, sizeof(one)) != sizeof(one))
                std::cerr << "[Server] Warning: failed to wake event loop" << std::endl;
        }
    }
}
