#pragma once

#include <cstdint>
#include <vector>
#include <cstring>
#include "protocol.hpp"

namespace net_recon::common
{

    // Reassembles framed control messages from an arbitrarily fragmented byte stream.
    class ByteBuffer
    {
    private:
        std::vector<uint8_t> m_buffer;

    public:
        ByteBuffer() = default;
        void Append(const uint8_t *data, size_t size);
        bool HasHeader() const;
        net_recon::protocol::Header PeekHeader() const;

        // A header with the wrong magic or an oversized length can never complete.
        bool IsMalformed(const net_recon::protocol::Header &hdr) const;
        bool HasCompleteMessage(const net_recon::protocol::Header &hdr) const;
        void Consume(size_t bytes);
        std::vector<uint8_t> ExtractPayload(size_t payload_len);
        size_t Size() const { return m_buffer.size(); }
    };

}
