// SPDX-License-Identifier: Apache-2.0
// Length-prefixed framing (4-byte big-endian length + payload) used for replay streams.
#pragma once
#include <arpa/inet.h>

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

namespace kick::netutil {

inline constexpr uint32_t kMaxFrameBytes = 16u * 1024u * 1024u;

inline void append_frame(std::string &out, std::string_view payload)
{
    uint32_t net = htonl(static_cast<uint32_t>(payload.size()));
    size_t at = out.size();
    out.resize(at + 4 + payload.size());
    std::memcpy(out.data() + at, &net, 4);
    std::memcpy(out.data() + at + 4, payload.data(), payload.size());
}

inline std::string build_frame(std::string_view payload)
{
    std::string frame;
    append_frame(frame, payload);
    return frame;
}

enum class FrameStatus
{
    ok,
    incomplete,
    invalid
};

// Reads one frame starting at `offset`; on ok advances `offset` past it and fills `out`.
// An empty or oversized length prefix is reported as invalid (corrupt stream).
inline FrameStatus read_frame(std::string_view buffer, size_t &offset, std::string &out)
{
    if (buffer.size() < offset + 4)
        return FrameStatus::incomplete;
    uint32_t net;
    std::memcpy(&net, buffer.data() + offset, 4);
    uint32_t len = ntohl(net);
    if (len == 0 || len > kMaxFrameBytes)
        return FrameStatus::invalid;
    if (buffer.size() < offset + 4 + len)
        return FrameStatus::incomplete;
    out.assign(buffer.data() + offset + 4, len);
    offset += 4 + len;
    return FrameStatus::ok;
}

} // namespace kick::netutil
