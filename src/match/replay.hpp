// SPDX-License-Identifier: Apache-2.0
// replay.hpp - framed replay stream: one ReplayHeader frame, then one MatchSnapshot frame per tick
#pragma once
#include "match.pb.h"

#include <condition_variable>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace kick::game {

// Streams frames to a file. record() serializes and queues; a writer thread appends the queue to the
// file, so memory only holds frames that are not written yet.
class ReplayRecorder
{
public:
    // Truncates `path` and queues the header frame. Throws kick::ReplayError when the file cannot be opened.
    ReplayRecorder(const std::string &path, const kick::ReplayHeader &header);
    // Closes the stream; a write failure at this point is logged.
    ~ReplayRecorder();

    ReplayRecorder(const ReplayRecorder &) = delete;
    ReplayRecorder &operator=(const ReplayRecorder &) = delete;

    // Throws kick::ReplayError after close() or when the snapshot cannot be serialized.
    void record(const kick::MatchSnapshot &snap);
    // Blocks until everything queued is written. Throws kick::ReplayError if a write failed.
    void flush();
    // Final flush, then stops the writer and closes the file. Later calls do nothing.
    void close();

    const std::string &path() const noexcept { return m_path; }
    size_t frames() const noexcept { return m_frames; }
    uint64_t queued_bytes() const;
    uint64_t bytes_written() const;

private:
    void write_loop();
    void enqueue(const std::string &payload);
    void throw_if_failed() const;

    std::string m_path;
    std::ofstream m_out; // touched by the writer thread only, until close() joins it
    size_t m_frames{0};
    bool m_closed{false};

    mutable std::mutex m_mtx; // guards the members below
    std::condition_variable m_cv;
    std::condition_variable m_drained;
    std::string m_queue;
    uint64_t m_queued{0}; // bytes queued or being written
    uint64_t m_written{0};
    bool m_failed{false};
    bool m_stop{false};

    std::thread m_writer;
};

class ReplayReader
{
public:
    // Throws kick::ReplayError on a truncated or corrupt stream.
    static ReplayReader from_buffer(const std::string &data);
    static ReplayReader from_file(const std::string &path);

    const kick::ReplayHeader &header() const noexcept { return m_header; }
    const std::vector<kick::MatchSnapshot> &frames() const noexcept { return m_frames; }

private:
    kick::ReplayHeader m_header;
    std::vector<kick::MatchSnapshot> m_frames;
};

} // namespace kick::game
