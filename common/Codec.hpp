#pragma once

#include <arpa/inet.h>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace net_recon::common::wire
{
    inline void append_u32_be(std::vector<std::uint8_t> &out, std::uint32_t value)
    {
        std::uint32_t be = htonl(value);
        const auto *p = reinterpret_cast<const std::uint8_t *>(&be);
        out.insert(out.end(), p, p + 4);
    }

    inline bool read_u32_be(const std::vector<std::uint8_t> &in, std::size_t &offset, std::uint32_t &value_out)
    {
        if (offset + 4 > in.size())
            return false;

        std::uint32_t be = 0;
        std::memcpy(&be, in.data() + offset, 4);
        value_out = ntohl(be);
        offset += 4;
        return true;
    }

    inline void append_string(std::vector<std::uint8_t> &out, std::string_view s)
    {
        append_u32_be(out, static_cast<std::uint32_t>(s.size()));
        out.insert(out.end(), s.begin(), s.end());
    }

    inline bool read_string(const std::vector<std::uint8_t> &in, std::size_t &offset, std::string &out)
    {
        std::size_t tmp = offset;

        std::uint32_t len = 0;
        if (!read_u32_be(in, tmp, len))
            return false;

        if (tmp + len > in.size())
            return false;

        out.assign(reinterpret_cast<const char *>(in.data() + tmp), len);
        tmp += len;

        offset = tmp;
        return true;
    }

    // Control payloads: a request is one body string, a response is a status then a body string.
    struct ControlResponse
    {
        std::uint32_t status = 0;
        std::string body;
    };

    inline std::vector<std::uint8_t> EncodeRequest(std::string_view body)
    {
        std::vector<std::uint8_t> out;
        append_string(out, body);
        return out;
    }

    inline std::optional<std::string> DecodeRequest(const std::vector<std::uint8_t> &payload)
    {
        std::size_t offset = 0;
        std::string body;
        if (payload.empty())
            return body;
        if (!read_string(payload, offset, body) || offset != payload.size())
            return std::nullopt;
        return body;
    }

    inline std::vector<std::uint8_t> EncodeResponse(std::uint32_t status, std::string_view body)
    {
        std::vector<std::uint8_t> out;
        append_u32_be(out, status);
        append_string(out, body);
        return out;
    }

    inline std::optional<ControlResponse> DecodeResponse(const std::vector<std::uint8_t> &payload)
    {
        std::size_t offset = 0;
        ControlResponse resp;
        if (!read_u32_be(payload, offset, resp.status))
            return std::nullopt;
        if (!read_string(payload, offset, resp.body))
            return std::nullopt;
        return resp;
    }
}
