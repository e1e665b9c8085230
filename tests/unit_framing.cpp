// SPDX-License-Identifier: Apache-2.0
// unit_framing.cpp
// Length-prefixed frame reader: split buffers, truncation, random payloads and corrupt length prefixes.
#include "common/framing.hpp"

#include <cassert>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace kick::netutil;

int main()
{
    std::string p1 = "hello";
    std::string p2 = std::string(100, 'x');
    std::string all = build_frame(p1) + build_frame(p2);
    assert(all.size() == 4 + p1.size() + 4 + p2.size());

    // Every split point: the first frame is readable once it is whole, never before
    for (size_t cut = 0; cut <= all.size(); ++cut) {
        std::string part = all.substr(0, cut);
        size_t offset = 0;
        std::string out;
        FrameStatus st = read_frame(part, offset, out);
        if (cut >= 4 + p1.size()) {
            assert(st == FrameStatus::ok && out == p1 && offset == 4 + p1.size());
            FrameStatus st2 = read_frame(part, offset, out);
            assert(st2 == (cut == all.size() ? FrameStatus::ok : FrameStatus::incomplete));
        } else {
            assert(st == FrameStatus::incomplete && offset == 0);
        }
    }
    {
        size_t offset = 0;
        std::string out;
        assert(read_frame(all, offset, out) == FrameStatus::ok);
        assert(read_frame(all, offset, out) == FrameStatus::ok && out == p2);
        assert(offset == all.size());
        assert(read_frame(all, offset, out) == FrameStatus::incomplete);
    }

    // Random payloads appended back to back come out intact and in order
    std::mt19937 rng(12345);
    std::vector<std::string> payloads;
    std::string stream;
    for (int i = 0; i < 200; ++i) {
        size_t len = std::uniform_int_distribution<size_t>{1, 2048}(rng);
        std::string payload(len, '\0');
        for (auto &c : payload)
            c = static_cast<char>(std::uniform_int_distribution<int>{0, 255}(rng));
        append_frame(stream, payload);
        payloads.push_back(std::move(payload));
    }
    {
        size_t offset = 0;
        std::string out;
        for (const auto &expected : payloads) {
            assert(read_frame(stream, offset, out) == FrameStatus::ok);
            assert(out == expected);
        }
        assert(offset == stream.size());
    }

    // Truncated frames never yield output
    for (int i = 0; i < 100; ++i) {
        size_t len = std::uniform_int_distribution<size_t>{10, 4096}(rng);
        std::string frame = build_frame(std::string(len, 'x'));
        frame.resize(frame.size() - std::uniform_int_distribution<size_t>{1, len}(rng));
        size_t offset = 0;
        std::string out;
        assert(read_frame(frame, offset, out) == FrameStatus::incomplete);
        assert(offset == 0 && out.empty());
    }

    // Oversized and zero lengths mark the stream corrupt
    {
        std::string bad(4, '\0');
        uint32_t len = htonl(kMaxFrameBytes + 1);
        std::memcpy(bad.data(), &len, 4);
        size_t offset = 0;
        std::string out;
        assert(read_frame(bad, offset, out) == FrameStatus::invalid);
        std::string zero(4, '\0');
        assert(read_frame(zero, offset, out) == FrameStatus::invalid);
        assert(offset == 0);
    }

    std::cout << "unit_framing OK" << std::endl;
    return 0;
}
