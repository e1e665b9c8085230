// SPDX-License-Identifier: Apache-2.0
// decision_collector.hpp - gathers one action per player per tick under a wall-clock budget
#pragma once
#include "ai/agent.hpp"

#include <coro/io_scheduler.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace kick::ai {

enum class FaultKind : uint8_t
{
    timeout,
    exception
};

struct DecisionFault
{
    game::PlayerId player{game::kNoPlayer};
    FaultKind kind{FaultKind::timeout};
    std::string detail;
};

struct CollectResult
{
    std::vector<game::Action> actions; // aligned with view->players()
    std::vector<DecisionFault> faults; // ordered by player id
    uint64_t wait_ns{0};
};

// With a scheduler every decide() runs as its own task and the collector waits for all of them or the
// budget, whichever comes first; stragglers are abandoned and their results dropped on arrival.
// Without a scheduler the calls run inline in player order; an overrun is only detected once the call
// returns, so inline collection is for trusted agents.
class DecisionCollector
{
public:
    DecisionCollector(std::shared_ptr<coro::io_scheduler> scheduler, std::chrono::milliseconds budget);

    CollectResult collect(
        const std::shared_ptr<const game::GameState> &view, const std::vector<std::shared_ptr<AIAgent>> &agents);

    bool parallel() const noexcept { return m_scheduler != nullptr; }
    std::chrono::milliseconds budget() const noexcept { return m_budget; }

private:
    CollectResult collect_inline(
        const std::shared_ptr<const game::GameState> &view, const std::vector<std::shared_ptr<AIAgent>> &agents);
    CollectResult collect_parallel(
        const std::shared_ptr<const game::GameState> &view, const std::vector<std::shared_ptr<AIAgent>> &agents);

    std::shared_ptr<coro::io_scheduler> m_scheduler;
    std::chrono::milliseconds m_budget;
};

} // namespace kick::ai
