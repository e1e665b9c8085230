// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/logger.hpp"

#include <atomic>
#include <cstdint>

// Per-callsite rate-limited logging for the tick hot path.
// Emits the 1st, (N+1)th, (2N+1)th... invocation so the first occurrence is never hidden.
// Usage: KICK_LOG_EVERY_N(warn, 60, "[agent] timeout player={}", id);
#define KICK_LOG_EVERY_N(level, N, ...) \
    do { \
        static std::atomic<uint64_t> kick_log_counter{0}; \
        if ((kick_log_counter.fetch_add(1, std::memory_order_relaxed) % (N)) == 0) { \
            kick::log::level(__VA_ARGS__); \
        } \
    } while (0)
