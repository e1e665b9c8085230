// SPDX-License-Identifier: Apache-2.0
#include "match/replay.hpp"

#include "common/error.hpp"
#include "common/framing.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <fstream>
#include <iterator>

namespace kick::game {

ReplayRecorder::ReplayRecorder(const std::string &path, const kick::ReplayHeader &header)
    : m_path(path)
    , m_out(path, std::ios::binary | std::ios::trunc)
{
    if (!m_out)
        throw kick::ReplayError("cannot open replay file " + path);
    std::string payload;
    if (!header.SerializeToString(&payload))
        throw kick::ReplayError("cannot serialize replay header");
    enqueue(payload);
    m_writer = std::thread([this] { write_loop(); });
}

ReplayRecorder::~ReplayRecorder()
{
    try {
        close();
    } catch (const kick::ReplayError &e) {
        kick::log::error("[replay] {}", e.what());
    }
}

void ReplayRecorder::enqueue(const std::string &payload)
{
    {
        std::lock_guard lk(m_mtx);
        size_t before = m_queue.size();
        kick::netutil::append_frame(m_queue, payload);
        m_queued += m_queue.size() - before;
    }
    m_cv.notify_one();
}

void ReplayRecorder::record(const kick::MatchSnapshot &snap)
{
    if (m_closed)
        throw kick::ReplayError("replay " + m_path + " is already closed");
    std::string payload;
    if (!snap.SerializeToString(&payload))
        throw kick::ReplayError("cannot serialize snapshot for tick " + std::to_string(snap.tick()));
    enqueue(payload);
    ++m_frames;
    kick::metrics::add_replay_frame(payload.size() + 4);
}

void ReplayRecorder::write_loop()
{
    std::unique_lock lk(m_mtx);
    for (;;) {
        m_cv.wait(lk, [this] { return m_stop || !m_queue.empty(); });
        if (m_queue.empty())
            return; // stopped and drained
        std::string batch;
        batch.swap(m_queue);
        bool skip = m_failed;
        lk.unlock();
        bool ok = false;
        if (!skip) {
            m_out.write(batch.data(), static_cast<std::streamsize>(batch.size()));
            m_out.flush();
            ok = static_cast<bool>(m_out);
        }
        lk.lock();
        m_queued -= batch.size();
        if (ok)
            m_written += batch.size();
        else
            m_failed = true;
        m_drained.notify_all();
    }
}

void ReplayRecorder::throw_if_failed() const
{
    std::lock_guard lk(m_mtx);
    if (m_failed)
        throw kick::ReplayError("short write to replay file " + m_path);
}

void ReplayRecorder::flush()
{
    {
        std::unique_lock lk(m_mtx);
        m_drained.wait(lk, [this] { return m_queued == 0; });
    }
    throw_if_failed();
}

void ReplayRecorder::close()
{
    if (m_closed)
        return;
    m_closed = true;
    {
        std::lock_guard lk(m_mtx);
        m_stop = true;
    }
    m_cv.notify_all();
    if (m_writer.joinable())
        m_writer.join();
    m_out.close();
    throw_if_failed();
    kick::log::info("[replay] closed {} frames ({} bytes) to {}", m_frames, bytes_written(), m_path);
}

uint64_t ReplayRecorder::queued_bytes() const
{
    std::lock_guard lk(m_mtx);
    return m_queued;
}

uint64_t ReplayRecorder::bytes_written() const
{
    std::lock_guard lk(m_mtx);
    return m_written;
}

ReplayReader ReplayReader::from_buffer(const std::string &data)
{
    ReplayReader r;
    size_t offset = 0;
    std::string payload;
    auto next = [&](const char *what)
    {
        auto st = kick::netutil::read_frame(data, offset, payload);
        if (st == kick::netutil::FrameStatus::invalid)
            throw kick::ReplayError(std::string("corrupt frame length in ") + what);
        if (st == kick::netutil::FrameStatus::incomplete)
            throw kick::ReplayError(std::string("truncated ") + what);
    };
    next("replay header");
    if (!r.m_header.ParseFromString(payload))
        throw kick::ReplayError("unparseable replay header");
    while (offset < data.size()) {
        next("snapshot frame");
        kick::MatchSnapshot snap;
        if (!snap.ParseFromString(payload))
            throw kick::ReplayError("unparseable snapshot at frame " + std::to_string(r.m_frames.size()));
        r.m_frames.push_back(std::move(snap));
    }
    return r;
}

ReplayReader ReplayReader::from_file(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw kick::ReplayError("cannot open replay file " + path);
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return from_buffer(data);
}

} // namespace kick::game
