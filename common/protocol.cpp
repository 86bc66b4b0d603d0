#include "protocol.hpp"

#include <algorithm>

namespace net_recon::protocol
{
    MessageType ResponseTypeFor(MessageType request)
    {
        switch (request)
        {
        case MessageType::HeartbeatReq:
            return MessageType::HeartbeatResp;
        case MessageType::ScanStartReq:
            return MessageType::ScanStartResp;
        case MessageType::ScanListReq:
            return MessageType::ScanListResp;
        case MessageType::ScanGetReq:
            return MessageType::ScanGetResp;
        case MessageType::TopologyReq:
            return MessageType::TopologyResp;
        case MessageType::TracerouteReq:
            return MessageType::TracerouteResp;
        default:
            return MessageType::ErrorResp;
        }
    }

    const char *MessageTypeName(MessageType type)
    {
        switch (type)
        {
        case MessageType::HeartbeatReq: return "HeartbeatReq";
        case MessageType::HeartbeatResp: return "HeartbeatResp";
        case MessageType::ScanStartReq: return "ScanStartReq";
        case MessageType::ScanStartResp: return "ScanStartResp";
        case MessageType::ScanListReq: return "ScanListReq";
        case MessageType::ScanListResp: return "ScanListResp";
        case MessageType::ScanGetReq: return "ScanGetReq";
        case MessageType::ScanGetResp: return "ScanGetResp";
        case MessageType::TopologyReq: return "TopologyReq";
        case MessageType::TopologyResp: return "TopologyResp";
        case MessageType::TracerouteReq: return "TracerouteReq";
        case MessageType::TracerouteResp: return "TracerouteResp";
        case MessageType::ErrorResp: return "ErrorResp";
        }
        return "Unknown";
    }

    std::vector<std::uint8_t> BuildFrame(MessageType type, const std::vector<std::uint8_t> &payload)
    {
        Header hdr;
        hdr.magic = EXPECTED_MAGIC;
        hdr.msg_type = static_cast<uint8_t>(type);
        hdr.payload_length = static_cast<uint32_t>(payload.size());
        hdr.reserved = 0;

        std::vector<std::uint8_t> frame(HEADER_SIZE + payload.size());
        SerializeHeader(hdr, frame.data());
        std::copy(payload.begin(), payload.end(), frame.begin() + HEADER_SIZE);
        return frame;
    }
}
