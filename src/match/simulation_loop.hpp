// SPDX-License-Identifier: Apache-2.0
// simulation_loop.hpp - fixed-step match driver: decide -> resolve -> physics -> commit
#pragma once
#include "ai/agent.hpp"
#include "ai/decision_collector.hpp"
#include "match/action_resolver.hpp"
#include "match/game_state.hpp"
#include "match/match_config.hpp"
#include "match/physics.hpp"
#include "match/replay.hpp"

#include <coro/io_scheduler.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kick::game {

enum class LoopStatus : uint8_t
{
    running,
    paused,
    finished
};

const char *status_name(LoopStatus s);

using AgentBindings = std::map<PlayerId, std::shared_ptr<ai::AIAgent>>;

struct TickReport
{
    uint64_t tick{0};
    uint32_t agent_timeouts{0};
    uint32_t agent_faults{0};
    uint32_t malformed_actions{0};
    uint32_t physics_anomalies{0};
    uint32_t contacts{0};
    bool goal{false};
    std::optional<PlayerId> ball_winner;
    std::vector<Action> effective_actions; // aligned with players()
    uint64_t duration_ns{0};
};

// Owns the authoritative GameState and every tick stage. tick() is meant to be driven from one thread;
// snapshot(), drain_events(), status(), pause(), resume() and abandon() may be called from any thread.
class SimulationLoop
{
public:
    // Throws kick::ConfigError for an invalid config or state, or a player without an agent, and
    // kick::ReplayError when cfg.replay_path cannot be created. Applies the config's log settings.
    // With cfg.parallel_decisions the decisions run on `scheduler`, or on a scheduler of the loop's own
    // when none is given; an overrunning agent is then abandoned at the budget instead of awaited.
    // Without it agents are called inline and must be trusted to return.
    SimulationLoop(
        MatchConfig cfg,
        GameState initial,
        AgentBindings agents,
        std::shared_ptr<coro::io_scheduler> scheduler = nullptr);
    ~SimulationLoop();

    SimulationLoop(const SimulationLoop &) = delete;
    SimulationLoop &operator=(const SimulationLoop &) = delete;

    // Runs one tick; returns false without touching the state when paused or finished.
    bool tick();
    // Runs until max_ticks have run, the loop pauses, or the match ends. Returns ticks run.
    uint64_t run(uint64_t max_ticks);
    // Runs until finished (or paused). The replay file is complete once the match has finished.
    uint64_t run_to_end();

    void pause();
    void resume();
    void abandon(const std::string &reason);

    LoopStatus status() const noexcept { return m_status.load(std::memory_order_acquire); }
    uint64_t tick_index() const noexcept { return m_tick_index.load(std::memory_order_acquire); }
    std::shared_ptr<const GameState> snapshot() const;
    // Events committed since the previous drain, in commit order.
    std::vector<MatchEvent> drain_events();
    const TickReport &last_report() const noexcept { return m_report; }
    const MatchConfig &config() const noexcept { return m_cfg; }
    const ReplayRecorder *replay() const noexcept { return m_replay.get(); }

private:
    void record_faults(const ai::CollectResult &decisions);
    void emit_possession_change(std::optional<PlayerId> before, const ResolveResult &resolved);
    bool check_goal();
    void kickoff_reset();
    void commit(std::vector<MatchEvent> tick_events);
    void close_replay();

    MatchConfig m_cfg;
    GameState m_state;
    std::vector<std::shared_ptr<ai::AIAgent>> m_agents; // aligned with players()
    ai::DecisionCollector m_collector;
    ActionResolver m_resolver;
    phys::PhysicsEngine m_physics;
    std::unique_ptr<ReplayRecorder> m_replay;
    uint64_t m_duration_ticks{0};
    TickReport m_report;

    std::mutex m_tick_mtx; // held for a whole tick and by control operations
    std::atomic<LoopStatus> m_status{LoopStatus::running};
    std::atomic<uint64_t> m_tick_index{0};

    mutable std::mutex m_commit_mtx; // guards the two members below
    std::shared_ptr<const GameState> m_snapshot;
    std::vector<MatchEvent> m_pending_events;
};

} // namespace kick::game
