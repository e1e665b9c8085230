// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Process-wide simulation counters (atomics, no dynamic allocation). Shared by every match instance
// in the process; readers get approximate values without synchronising with the tick.
#pragma once
#include <atomic>
#include <cstdint>

namespace kick::metrics {

struct RuntimeCounters
{
    std::atomic<uint64_t> ticks_total{0};
    std::atomic<uint64_t> tick_duration_ns_accum{0};
    std::atomic<uint64_t> tick_samples{0};
    // Power-of-two buckets for tick duration (base 50us) -> up to ~51ms.
    static constexpr int TICK_BUCKETS = 11;
    static constexpr uint64_t TICK_BASE_NS = 50'000;
    std::atomic<uint64_t> tick_hist[TICK_BUCKETS]{};
    // Time spent waiting for agent decisions (part of tick duration)
    std::atomic<uint64_t> decision_wait_ns_accum{0};
    std::atomic<uint64_t> decision_wait_samples{0};
    // Fault / event counters
    std::atomic<uint64_t> agent_timeouts{0};
    std::atomic<uint64_t> agent_faults{0};
    std::atomic<uint64_t> malformed_actions{0};
    std::atomic<uint64_t> physics_anomalies{0};
    std::atomic<uint64_t> out_of_bounds{0};
    std::atomic<uint64_t> goals{0};
    std::atomic<uint64_t> fouls{0};
    std::atomic<uint64_t> tackles_attempted{0};
    std::atomic<uint64_t> tackles_won{0};
    // Gauges
    std::atomic<uint64_t> active_matches{0};
    std::atomic<uint64_t> abandoned_decisions_inflight{0};
    // Replay output
    std::atomic<uint64_t> replay_frames{0};
    std::atomic<uint64_t> replay_bytes{0};
};

inline RuntimeCounters &runtime()
{
    static RuntimeCounters inst;
    return inst;
}

inline void add_tick_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.tick_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.tick_samples.fetch_add(1, std::memory_order_relaxed);
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        if (ns < (RuntimeCounters::TICK_BASE_NS << i)) {
            rt.tick_hist[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    rt.tick_hist[RuntimeCounters::TICK_BUCKETS - 1].fetch_add(1, std::memory_order_relaxed);
}

// Upper bound of the histogram bucket that contains the 99th percentile tick.
inline uint64_t approx_tick_p99()
{
    auto &rt = runtime();
    uint64_t total = rt.tick_samples.load(std::memory_order_relaxed);
    if (total == 0)
        return 0;
    uint64_t target = (total * 99 + 99 - 1) / 100;
    uint64_t cumulative = 0;
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        cumulative += rt.tick_hist[i].load(std::memory_order_relaxed);
        if (cumulative >= target)
            return RuntimeCounters::TICK_BASE_NS << i;
    }
    return RuntimeCounters::TICK_BASE_NS << (RuntimeCounters::TICK_BUCKETS - 1);
}

inline uint64_t mean_tick_ns()
{
    auto &rt = runtime();
    uint64_t samples = rt.tick_samples.load(std::memory_order_relaxed);
    return samples ? rt.tick_duration_ns_accum.load(std::memory_order_relaxed) / samples : 0;
}

inline void add_decision_wait(uint64_t ns)
{
    auto &rt = runtime();
    rt.decision_wait_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.decision_wait_samples.fetch_add(1, std::memory_order_relaxed);
}

inline uint64_t mean_decision_wait_ns()
{
    auto &rt = runtime();
    uint64_t samples = rt.decision_wait_samples.load(std::memory_order_relaxed);
    return samples ? rt.decision_wait_ns_accum.load(std::memory_order_relaxed) / samples : 0;
}

inline void add_replay_frame(uint64_t bytes)
{
    auto &rt = runtime();
    rt.replay_frames.fetch_add(1, std::memory_order_relaxed);
    rt.replay_bytes.fetch_add(bytes, std::memory_order_relaxed);
}

} // namespace kick::metrics
