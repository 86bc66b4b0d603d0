#include "ByteBuffer.hpp"
#include <stdexcept>

namespace net_recon::common
{
    void ByteBuffer::Append(const uint8_t *data, size_t size)
    {
        m_buffer.insert(m_buffer.end(), data, data + size);
    }

    bool ByteBuffer::HasHeader() const
    {
        return m_buffer.size() >= net_recon::protocol::HEADER_SIZE;
    }

    net_recon::protocol::Header ByteBuffer::PeekHeader() const
    {
        if (!HasHeader())
            throw std::runtime_error("ByteBuffer::PeekHeader - Not enough bytes");
        return net_recon::protocol::DeserializeHeader(m_buffer.data());
    }

    bool ByteBuffer::IsMalformed(const net_recon::protocol::Header &hdr) const
    {
        return hdr.magic != net_recon::protocol::EXPECTED_MAGIC ||
               hdr.payload_length > net_recon::protocol::MAX_PAYLOAD_LENGTH;
    }

    bool ByteBuffer::HasCompleteMessage(const net_recon::protocol::Header &hdr) const
    {
        if (IsMalformed(hdr))
            return false;

        return m_buffer.size() >= (net_recon::protocol::HEADER_SIZE + hdr.payload_length);
    }

    void ByteBuffer::Consume(size_t bytes)
    {
        if (bytes > m_buffer.size())
        {
            m_buffer.clear();
            return;
        }
        m_buffer.erase(m_buffer.begin(), m_buffer.begin() + bytes);
    }

    std::vector<uint8_t> ByteBuffer::ExtractPayload(size_t payload_len)
    {
        if (net_recon::protocol::HEADER_SIZE + payload_len > m_buffer.size())
            throw std::runtime_error("ByteBuffer::ExtractPayload - Buffer underflow");

        auto start_it = m_buffer.begin() + net_recon::protocol::HEADER_SIZE;
        return std::vector<uint8_t>(start_it, start_it + payload_len);
    }
}
