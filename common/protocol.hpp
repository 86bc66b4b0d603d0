#pragma once

#include <cstdint>
#include <vector>
#include <cstddef>

namespace net_recon::protocol
{

    inline constexpr uint16_t EXPECTED_MAGIC = 0xBBBB;
    inline constexpr uint32_t MAX_PAYLOAD_LENGTH = 4 * 1024 * 1024; // 4MB
    inline constexpr size_t HEADER_SIZE = 8;

    struct Header
    {
        uint16_t magic;
        uint8_t msg_type;
        uint32_t payload_length;
        uint8_t reserved;
    };

    // Requests carry a JSON body string, responses a u32 status followed by a JSON body string.
    enum class MessageType : std::uint8_t
    {
        HeartbeatReq = 0x05,
        HeartbeatResp = 0x06,

        ScanStartReq = 0x10,
        ScanStartResp = 0x11,
        ScanListReq = 0x12,
        ScanListResp = 0x13,
        ScanGetReq = 0x14,
        ScanGetResp = 0x15,

        TopologyReq = 0x20,
        TopologyResp = 0x21,

        TracerouteReq = 0x30,
        TracerouteResp = 0x31,

        ErrorResp = 0xFF
    };

    inline void SerializeHeader(const Header &hdr, std::uint8_t *buffer)
    {
        buffer[0] = static_cast<uint8_t>((hdr.magic >> 8) & 0xFF);
        buffer[1] = static_cast<uint8_t>(hdr.magic & 0xFF);

        buffer[2] = hdr.msg_type;

        buffer[3] = static_cast<uint8_t>((hdr.payload_length >> 24) & 0xFF);
        buffer[4] = static_cast<uint8_t>((hdr.payload_length >> 16) & 0xFF);
        buffer[5] = static_cast<uint8_t>((hdr.payload_length >> 8) & 0xFF);
        buffer[6] = static_cast<uint8_t>(hdr.payload_length & 0xFF);

        buffer[7] = hdr.reserved;
    }

    inline Header DeserializeHeader(const std::uint8_t *buffer)
    {
        Header hdr;

        hdr.magic = (static_cast<uint16_t>(buffer[0]) << 8) |
                    static_cast<uint16_t>(buffer[1]);

        hdr.msg_type = buffer[2];

        hdr.payload_length = (static_cast<uint32_t>(buffer[3]) << 24) |
                             (static_cast<uint32_t>(buffer[4]) << 16) |
                             (static_cast<uint32_t>(buffer[5]) << 8) |
                             static_cast<uint32_t>(buffer[6]);

        hdr.reserved = buffer[7];

        return hdr;
    }

    // Response type paired with a request type, ErrorResp for anything unknown.
    MessageType ResponseTypeFor(MessageType request);

    const char *MessageTypeName(MessageType type);

    // Header + payload, ready to be written to the wire.
    std::vector<std::uint8_t> BuildFrame(MessageType type, const std::vector<std::uint8_t> &payload);

}
