#pragma once

#include <optional>
#include <string>
#include <vector>

#include <openssl/ssl.h>
#include <openssl/err.h>

#include "../common/ByteBuffer.hpp"
#include "../common/Codec.hpp"
#include "../common/protocol.hpp"

namespace net_recon::agent
{
    struct ControlReply
    {
        net_recon::protocol::MessageType type;
        net_recon::common::wire::ControlResponse response;
    };

    // Blocking TLS client for the control channel: one request, one reply.
    class ControlClient
    {
    private:
        std::string m_host;
        int m_port;
        int m_timeout_ms;
        int m_socket_fd;

        SSL_CTX *m_ssl_ctx;
        SSL *m_ssl_handle;

        net_recon::common::ByteBuffer m_rx_buf;

        bool WriteAll(const std::vector<uint8_t> &frame);
        bool ReadNextFrame(net_recon::protocol::Header &out_hdr, std::vector<uint8_t> &out_payload);

    public:
        ControlClient(std::string host, int port, int timeout_ms = 120000);
        ~ControlClient();

        ControlClient(const ControlClient &) = delete;
        ControlClient &operator=(const ControlClient &) = delete;

        bool Connect();
        void Disconnect();
        bool IsConnected() const { return m_socket_fd != -1 && m_ssl_handle != nullptr; }

        // nullopt when the connection fails or the reply cannot be decoded.
        std::optional<ControlReply> Call(net_recon::protocol::MessageType type, const std::string &body);
    };
}
