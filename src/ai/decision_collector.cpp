// SPDX-License-Identifier: Apache-2.0
#include "ai/decision_collector.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <coro/task.hpp>

#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>

namespace kick::ai {

namespace {

struct Outcome
{
    game::Action action{game::Hold{}};
    bool faulted{false};
    std::string detail;
};

Outcome invoke_agent(AIAgent &agent, const game::GameState &view)
{
    Outcome o;
    try {
        o.action = agent.decide(view);
    } catch (const std::exception &e) {
        o.faulted = true;
        o.detail = e.what();
    } catch (...) {
        o.faulted = true;
        o.detail = "non-standard exception";
    }
    if (o.faulted)
        o.action = game::Hold{};
    return o;
}

// Shared between the waiting tick and every decide task of one tick. Tasks that complete after the
// batch is closed only release their slot in the in-flight gauge.
struct DecisionBatch
{
    std::mutex mtx;
    std::condition_variable cv;
    std::vector<std::optional<Outcome>> slots;
    size_t pending{0};
    bool closed{false};

    explicit DecisionBatch(size_t n)
        : slots(n)
        , pending(n)
    {
    }

    void complete(size_t slot, Outcome o)
    {
        std::lock_guard lk(mtx);
        if (closed) {
            kick::metrics::runtime().abandoned_decisions_inflight.fetch_sub(1, std::memory_order_relaxed);
            return;
        }
        slots[slot] = std::move(o);
        if (--pending == 0)
            cv.notify_all();
    }
};

// Borrows the scheduler; it outlives the tasks spawned on it.
coro::task<void> decide_task(
    coro::io_scheduler *scheduler,
    std::shared_ptr<AIAgent> agent,
    std::shared_ptr<const game::GameState> view,
    std::shared_ptr<DecisionBatch> batch,
    size_t slot)
{
    co_await scheduler->schedule();
    batch->complete(slot, invoke_agent(*agent, *view));
}

void record(CollectResult &res, game::PlayerId id, const AIAgent &agent, Outcome &&o)
{
    if (o.faulted) {
        kick::metrics::runtime().agent_faults.fetch_add(1, std::memory_order_relaxed);
        KICK_LOG_EVERY_N(warn, 60, "[agent] decide failed player={} agent={} what={}", id, agent.name(), o.detail);
        res.faults.push_back(DecisionFault{id, FaultKind::exception, std::move(o.detail)});
    }
    res.actions.push_back(std::move(o.action));
}

void record_timeout(CollectResult &res, game::PlayerId id, const AIAgent &agent, std::string detail)
{
    kick::metrics::runtime().agent_timeouts.fetch_add(1, std::memory_order_relaxed);
    KICK_LOG_EVERY_N(warn, 60, "[agent] timeout player={} agent={} {}", id, agent.name(), detail);
    res.faults.push_back(DecisionFault{id, FaultKind::timeout, std::move(detail)});
    res.actions.push_back(game::Hold{});
}

} // namespace

DecisionCollector::DecisionCollector(std::shared_ptr<coro::io_scheduler> scheduler, std::chrono::milliseconds budget)
    : m_scheduler(std::move(scheduler))
    , m_budget(budget)
{
}

CollectResult DecisionCollector::collect(
    const std::shared_ptr<const game::GameState> &view, const std::vector<std::shared_ptr<AIAgent>> &agents)
{
    auto t0 = std::chrono::steady_clock::now();
    CollectResult res = m_scheduler ? collect_parallel(view, agents) : collect_inline(view, agents);
    res.wait_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - t0).count());
    kick::metrics::add_decision_wait(res.wait_ns);
    return res;
}

CollectResult DecisionCollector::collect_inline(
    const std::shared_ptr<const game::GameState> &view, const std::vector<std::shared_ptr<AIAgent>> &agents)
{
    const auto &players = view->players();
    CollectResult res;
    res.actions.reserve(players.size());
    for (size_t i = 0; i < players.size(); ++i) {
        auto start = std::chrono::steady_clock::now();
        Outcome o = invoke_agent(*agents[i], *view);
        auto took = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        if (took > m_budget) {
            record_timeout(
                res, players[i].id, *agents[i], "inline decide took " + std::to_string(took.count()) + "ms");
            continue;
        }
        record(res, players[i].id, *agents[i], std::move(o));
    }
    return res;
}

CollectResult DecisionCollector::collect_parallel(
    const std::shared_ptr<const game::GameState> &view, const std::vector<std::shared_ptr<AIAgent>> &agents)
{
    const auto &players = view->players();
    auto batch = std::make_shared<DecisionBatch>(players.size());
    std::vector<bool> rejected(players.size(), false);
    for (size_t i = 0; i < players.size(); ++i) {
        if (!m_scheduler->spawn(decide_task(m_scheduler.get(), agents[i], view, batch, i))) {
            rejected[i] = true;
            std::lock_guard lk(batch->mtx);
            --batch->pending;
        }
    }
    auto deadline = std::chrono::steady_clock::now() + m_budget;
    std::vector<std::optional<Outcome>> slots;
    {
        std::unique_lock lk(batch->mtx);
        batch->cv.wait_until(lk, deadline, [&] { return batch->pending == 0; });
        batch->closed = true;
        if (batch->pending > 0)
            kick::metrics::runtime().abandoned_decisions_inflight.fetch_add(
                batch->pending, std::memory_order_relaxed);
        slots = std::move(batch->slots);
    }
    CollectResult res;
    res.actions.reserve(players.size());
    for (size_t i = 0; i < players.size(); ++i) {
        if (rejected[i]) {
            record_timeout(res, players[i].id, *agents[i], "scheduler rejected decide task");
        } else if (!slots[i]) {
            record_timeout(
                res, players[i].id, *agents[i], "no decision within " + std::to_string(m_budget.count()) + "ms");
        } else {
            record(res, players[i].id, *agents[i], std::move(*slots[i]));
        }
    }
    return res;
}

} // namespace kick::ai
