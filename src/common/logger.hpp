// SPDX-License-Identifier: Apache-2.0
// logger.hpp - asynchronous logger (header-only)
// Callers format and enqueue; a single background thread writes to stderr, so a tick never waits on
// the terminal.
//  - KICK_LOG_LEVEL (trace|debug|info|warn|error) or set_level() sets the threshold
//  - KICK_LOG_JSON presence or set_json() switches to JSON lines
//  - KICK_LOG_APP_ID prefixes plain lines, handy when several matches share a terminal
//  - set_callback() mirrors every written line to the host (tests, embedding)

#pragma once

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>

namespace kick::log {

enum class level
{
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4
};

namespace detail {

inline constexpr std::array<const char *, 5> kLevelNames{"trace", "debug", "info", "warn", "error"};

inline int parse_level(std::string_view name)
{
    std::string v;
    for (char c : name)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "warning")
        return (int)level::warn;
    if (v == "err")
        return (int)level::error;
    for (size_t i = 0; i < kLevelNames.size(); ++i) {
        if (v == kLevelNames[i])
            return static_cast<int>(i);
    }
    return (int)level::info;
}

using callback_fn = void (*)(int, const char *, void *);

struct line
{
    level lv;
    std::string msg;
    std::chrono::system_clock::time_point ts;
};

// Process-wide queue plus its writer thread. Built on first use; the destructor drains what is left.
class sink
{
public:
    static sink &instance()
    {
        static sink inst;
        return inst;
    }

    std::atomic<int> threshold{(int)level::info};
    std::atomic<bool> json{false};
    std::atomic<void *> cb{nullptr};
    std::atomic<void *> cb_user{nullptr};

    void push(level lv, std::string msg)
    {
        {
            std::lock_guard lk(m_mtx);
            m_queue.push_back(line{lv, std::move(msg), std::chrono::system_clock::now()});
            ++m_pending;
        }
        m_cv.notify_one();
    }

    void wait_drained()
    {
        std::unique_lock lk(m_mtx);
        m_drained.wait(lk, [this] { return m_pending == 0; });
    }

    ~sink()
    {
        {
            std::lock_guard lk(m_mtx);
            m_stop = true;
        }
        m_cv.notify_all();
        if (m_thread.joinable())
            m_thread.join();
    }

private:
    sink()
    {
        if (const char *lvl = std::getenv("KICK_LOG_LEVEL"))
            threshold.store(parse_level(lvl), std::memory_order_relaxed);
        if (std::getenv("KICK_LOG_JSON"))
            json.store(true, std::memory_order_relaxed);
        if (const char *app = std::getenv("KICK_LOG_APP_ID"))
            m_app_id = app;
        m_thread = std::thread([this] { consume(); });
    }

    void consume()
    {
        std::unique_lock lk(m_mtx);
        for (;;) {
            m_cv.wait(lk, [this] { return m_stop || !m_queue.empty(); });
            if (m_queue.empty())
                return; // stopped and drained
            std::deque<line> batch;
            batch.swap(m_queue);
            lk.unlock();
            for (const auto &l : batch)
                emit(l);
            std::cerr.flush();
            lk.lock();
            m_pending -= batch.size();
            m_drained.notify_all();
        }
    }

    void emit(const line &l) const
    {
        std::time_t tt = std::chrono::system_clock::to_time_t(l.ts);
        std::tm tm{};
        localtime_r(&tt, &tm);
        if (json.load(std::memory_order_relaxed)) {
            std::cerr << "{\"ts\":\"" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "\",\"level\":\""
                      << kLevelNames[static_cast<size_t>(l.lv)] << "\",\"msg\":\"";
            for (char c : l.msg) {
                if (c == '"' || c == '\\')
                    std::cerr << '\\';
                std::cerr << c;
            }
            std::cerr << "\"}\n";
        } else {
            if (!m_app_id.empty())
                std::cerr << m_app_id << ' ';
            char tag = static_cast<char>(std::toupper(static_cast<unsigned char>(kLevelNames[(size_t)l.lv][0])));
            std::cerr << '[' << tag << ' ' << std::put_time(&tm, "%H:%M:%S") << "] " << l.msg << '\n';
        }
        if (auto fn = reinterpret_cast<callback_fn>(cb.load(std::memory_order_acquire)))
            fn((int)l.lv, l.msg.c_str(), cb_user.load(std::memory_order_acquire));
    }

    std::mutex m_mtx;
    std::condition_variable m_cv;
    std::condition_variable m_drained;
    std::deque<line> m_queue;
    size_t m_pending{0};
    bool m_stop{false};
    std::string m_app_id; // fixed before the writer starts
    std::thread m_thread;
};

template <typename T>
inline std::string to_text(const T &v)
{
    if constexpr (std::is_convertible_v<const T &, std::string_view>)
        return std::string(std::string_view(v));
    else if constexpr (std::is_floating_point_v<T>) {
        std::ostringstream oss;
        oss.setf(std::ios::fixed, std::ios::floatfield);
        oss.precision(3);
        oss << v;
        return oss.str();
    } else if constexpr (std::is_arithmetic_v<T>)
        return std::to_string(v);
    else {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }
}

// Replaces each "{}" in order; arguments without a placeholder are appended space-separated.
template <typename... Args>
inline std::string format(std::string_view fmt, const Args &...args)
{
    std::string out;
    std::string surplus;
    size_t pos = 0;
    auto put = [&](std::string value)
    {
        size_t p = fmt.find("{}", pos);
        if (p == std::string_view::npos) {
            surplus.push_back(' ');
            surplus += value;
            return;
        }
        out.append(fmt.substr(pos, p - pos));
        out += value;
        pos = p + 2;
    };
    (put(to_text(args)), ...);
    out.append(fmt.substr(pos));
    out += surplus;
    return out;
}

} // namespace detail

// Starts the writer thread; logging starts it on demand as well.
inline void init()
{
    detail::sink::instance();
}

inline void set_level(const std::string &name) noexcept
{
    detail::sink::instance().threshold.store(detail::parse_level(name), std::memory_order_relaxed);
}

inline void set_json(bool on) noexcept
{
    detail::sink::instance().json.store(on, std::memory_order_relaxed);
}

inline bool enabled(level lv) noexcept
{
    return (int)lv >= detail::sink::instance().threshold.load(std::memory_order_relaxed);
}

inline void set_callback(void (*cb)(int, const char *, void *), void *ud) noexcept
{
    auto &s = detail::sink::instance();
    s.cb_user.store(ud, std::memory_order_release);
    s.cb.store(reinterpret_cast<void *>(cb), std::memory_order_release);
}

// Blocks until every line queued so far has been written (between ticks, at match end, in tests).
inline void flush()
{
    detail::sink::instance().wait_drained();
}

template <typename... Args>
inline void write(level lv, const char *fmt, const Args &...args)
{
    if (enabled(lv))
        detail::sink::instance().push(lv, detail::format(fmt, args...));
}

template <typename... Args>
inline void trace(const char *fmt, const Args &...args)
{
    write(level::trace, fmt, args...);
}

template <typename... Args>
inline void debug(const char *fmt, const Args &...args)
{
    write(level::debug, fmt, args...);
}

template <typename... Args>
inline void info(const char *fmt, const Args &...args)
{
    write(level::info, fmt, args...);
}

template <typename... Args>
inline void warn(const char *fmt, const Args &...args)
{
    write(level::warn, fmt, args...);
}

template <typename... Args>
inline void error(const char *fmt, const Args &...args)
{
    write(level::error, fmt, args...);
}

} // namespace kick::log
