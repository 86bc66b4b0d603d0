#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <cstdint>
#include <string>
#include <sys/epoll.h>
#include <vector>

#include <openssl/ssl.h>
#include <openssl/err.h>

#include "../common/ByteBuffer.hpp"
#include "../common/protocol.hpp"

namespace net_recon::server
{
    class Worker;

    struct ClientContext
    {
        int socketfd = -1;
        uint64_t connection_id = 0;
        SSL* ssl_handle = nullptr;
        net_recon::common::ByteBuffer buff;
        std::vector<uint8_t> outbox;
        bool is_handshake_complete = false;
    };

    // Single-threaded epoll loop terminating TLS. Complete frames go to the Worker; replies come
    // back through QueueResponse from any thread and are written by the loop.
    class NetworkCore
    {
    private:
        struct Outbound
        {
            int fd;
            uint64_t connection_id;
            std::vector<uint8_t> frame;
        };

        int m_server_fd;
        int m_epoll_fd;
        int m_wake_fd;
        int m_port;
        std::string m_cert_path;
        std::string m_key_path;
        std::atomic<bool> m_running;
        uint64_t m_next_connection_id;
        std::map<int, ClientContext> registry;

        std::mutex m_outbound_mutex;
        std::vector<Outbound> m_outbound;

        SSL_CTX* m_ssl_ctx;
        Worker* m_worker;

        void LogOpenSSLErrors();

        void NonBlockingMode(int fd);
        void EpollControlAdd(int fd);
        void EpollControlModify(int fd, uint32_t events);
        void EpollControlRemove(int fd);
        void DisconnectClient(int fd);

        void HandleNewConnection();
        void HandleClientData(int fd);
        void HandleWritable(int fd);
        void DrainOutbound();
        void FlushClient(int fd);

        void ProcessMessage(int fd, net_recon::protocol::MessageType type, std::vector<uint8_t> payload);

    public:
        NetworkCore(int port, std::string cert_path, std::string key_path);

        ~NetworkCore();

        void SetWorker(Worker* worker) { m_worker = worker; }

        void Init();
        void Run();

        // Thread safe; wakes the loop.
        void Stop();
        void QueueResponse(int fd, uint64_t connection_id, net_recon::protocol::MessageType type, const std::vector<uint8_t>& payload);
    };
}
