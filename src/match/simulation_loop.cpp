// SPDX-License-Identifier: Apache-2.0
#include "match/simulation_loop.hpp"

#include "common/error.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "match/snapshot.hpp"

#include <chrono>
#include <cmath>

namespace kick::game {

const char *status_name(LoopStatus s)
{
    switch (s) {
        case LoopStatus::running:
            return "running";
        case LoopStatus::paused:
            return "paused";
        case LoopStatus::finished:
            return "finished";
    }
    return "unknown";
}

static MatchConfig validated(MatchConfig cfg)
{
    validate(cfg);
    return cfg;
}

static std::shared_ptr<coro::io_scheduler> decision_scheduler(
    const MatchConfig &cfg, std::shared_ptr<coro::io_scheduler> scheduler)
{
    if (!cfg.parallel_decisions)
        return nullptr;
    if (!scheduler)
        scheduler = coro::io_scheduler::make_shared();
    return scheduler;
}

static std::string score_line(const Scoreboard &sb)
{
    return std::to_string(sb.goals_for(Team::home)) + "-" + std::to_string(sb.goals_for(Team::away));
}

SimulationLoop::SimulationLoop(
    MatchConfig cfg, GameState initial, AgentBindings agents, std::shared_ptr<coro::io_scheduler> scheduler)
    : m_cfg(validated(std::move(cfg)))
    , m_state(std::move(initial))
    , m_collector(
          decision_scheduler(m_cfg, std::move(scheduler)), std::chrono::milliseconds(m_cfg.agent_budget_ms))
    , m_resolver(m_cfg.resolver, m_cfg.seed)
    , m_physics(m_cfg.physics, m_cfg.dt)
{
    apply_log_settings(m_cfg);
    m_state.validate(m_cfg.physics.epsilon);
    if (m_state.dt() != m_cfg.dt)
        throw kick::ConfigError("initial state dt does not match the match dt");
    if (m_state.tick() != 0)
        throw kick::ConfigError("initial state must start at tick 0");
    for (const auto &[id, agent] : agents) {
        if (!m_state.find_player(id))
            throw kick::ConfigError("agent bound to unknown player " + std::to_string(id));
    }
    m_agents.reserve(m_state.players().size());
    for (const auto &p : m_state.players()) {
        auto it = agents.find(p.id);
        if (it == agents.end() || !it->second)
            throw kick::ConfigError("no agent bound to player " + std::to_string(p.id));
        m_agents.push_back(it->second);
    }
    m_duration_ticks = m_cfg.duration_ticks();
    if (!m_cfg.replay_path.empty())
        m_replay = std::make_unique<ReplayRecorder>(m_cfg.replay_path, make_replay_header(m_cfg));
    commit({});
    kick::metrics::runtime().active_matches.fetch_add(1, std::memory_order_relaxed);
    kick::log::info(
        "[match] start seed={} players={} dt={} ticks={} decisions={}", m_cfg.seed, m_state.players().size(), m_cfg.dt,
        m_duration_ticks, m_collector.parallel() ? "parallel" : "inline");
}

SimulationLoop::~SimulationLoop()
{
    kick::metrics::runtime().active_matches.fetch_sub(1, std::memory_order_relaxed);
}

std::shared_ptr<const GameState> SimulationLoop::snapshot() const
{
    std::lock_guard lk(m_commit_mtx);
    return m_snapshot;
}

std::vector<MatchEvent> SimulationLoop::drain_events()
{
    std::lock_guard lk(m_commit_mtx);
    std::vector<MatchEvent> out;
    out.swap(m_pending_events);
    return out;
}

void SimulationLoop::pause()
{
    std::lock_guard lk(m_tick_mtx);
    LoopStatus expected = LoopStatus::running;
    if (m_status.compare_exchange_strong(expected, LoopStatus::paused))
        kick::log::info("[match] {} at tick={}", status_name(LoopStatus::paused), m_state.tick());
}

void SimulationLoop::resume()
{
    std::lock_guard lk(m_tick_mtx);
    LoopStatus expected = LoopStatus::paused;
    if (m_status.compare_exchange_strong(expected, LoopStatus::running))
        kick::log::info("[match] {} again at tick={}", status_name(LoopStatus::running), m_state.tick());
}

void SimulationLoop::abandon(const std::string &reason)
{
    std::lock_guard lk(m_tick_mtx);
    if (m_status.load(std::memory_order_acquire) == LoopStatus::finished)
        return;
    m_status.store(LoopStatus::finished, std::memory_order_release);
    MatchEvent ev;
    ev.kind = EventKind::match_end;
    ev.position = m_state.ball().position;
    ev.detail = "abandoned: " + reason;
    auto &sb = m_state.mutable_scoreboard();
    sb.latest_tick_begin = sb.events.size();
    m_state.append_event(std::move(ev));
    {
        auto snap = std::make_shared<const GameState>(m_state);
        std::lock_guard clk(m_commit_mtx);
        m_snapshot = std::move(snap);
        auto latest = m_state.scoreboard().latest_events();
        m_pending_events.insert(m_pending_events.end(), latest.begin(), latest.end());
    }
    kick::log::warn("[match] abandoned at tick={} reason={}", m_state.tick(), reason);
    close_replay();
}

void SimulationLoop::close_replay()
{
    if (!m_replay)
        return;
    try {
        m_replay->close();
    } catch (const kick::ReplayError &e) {
        kick::log::error("[match] replay incomplete: {}", e.what());
    }
}

void SimulationLoop::record_faults(const ai::CollectResult &decisions)
{
    for (const auto &f : decisions.faults) {
        const PlayerState *p = m_state.find_player(f.player);
        MatchEvent ev;
        ev.kind = EventKind::anomaly;
        ev.player = f.player;
        if (p) {
            ev.team = p->team;
            ev.position = p->position;
        }
        if (f.kind == ai::FaultKind::timeout) {
            ++m_report.agent_timeouts;
            ev.detail = "agent timeout, Hold substituted: " + f.detail;
        } else {
            ++m_report.agent_faults;
            ev.detail = "agent failed, Hold substituted: " + f.detail;
        }
        m_state.append_event(std::move(ev));
    }
}

void SimulationLoop::emit_possession_change(std::optional<PlayerId> before, const ResolveResult &resolved)
{
    std::optional<PlayerId> after = m_state.ball().possessor;
    if (!after || after == before)
        return;
    const PlayerState *p = m_state.find_player(*after);
    const char *how = "capture";
    const auto &instr = resolved.inputs.possession;
    if (instr && instr->player == *after && instr->kind != phys::PossessionKind::release)
        how = instr->kind == phys::PossessionKind::transfer ? "tackle" : "claim";
    MatchEvent ev;
    ev.kind = EventKind::possession_change;
    ev.team = p->team;
    ev.player = *after;
    ev.other_player = before.value_or(kNoPlayer);
    ev.position = p->position;
    ev.detail = how;
    m_state.append_event(std::move(ev));
}

void SimulationLoop::kickoff_reset()
{
    for (auto &p : m_state.mutable_players()) {
        p.position = p.home_position;
        p.velocity = b2Vec2_zero;
        p.orientation = p.team == Team::home ? 0.f : (float)M_PI;
        p.action_in_progress.reset();
        p.out_of_bounds = false;
    }
    m_state.set_possessor(std::nullopt);
    auto &ball = m_state.mutable_ball();
    ball.position = b2Vec2_zero;
    ball.velocity = b2Vec2_zero;
    ball.spin = 0.f;
    ball.last_touch.reset();
}

bool SimulationLoop::check_goal()
{
    const auto &ball = m_state.ball();
    std::optional<Team> scorer = m_state.field().goal_scored(ball.position, ball.radius);
    if (!scorer)
        return false;
    auto &sb = m_state.mutable_scoreboard();
    ++sb.goals[static_cast<size_t>(*scorer)];
    MatchEvent ev;
    ev.kind = EventKind::goal;
    ev.team = scorer;
    ev.position = ball.position;
    ev.detail = score_line(sb);
    if (ball.last_touch) {
        ev.player = *ball.last_touch;
        const PlayerState *toucher = m_state.find_player(*ball.last_touch);
        if (toucher && toucher->team != *scorer)
            ev.detail += " (own goal)";
    }
    kick::metrics::runtime().goals.fetch_add(1, std::memory_order_relaxed);
    kick::log::info(
        "[match] goal tick={} team={} player={} score={}", m_state.tick(), team_name(*scorer), ev.player,
        score_line(sb));
    m_state.append_event(std::move(ev));
    kickoff_reset();
    return true;
}

void SimulationLoop::commit(std::vector<MatchEvent> tick_events)
{
    auto snap = std::make_shared<const GameState>(m_state);
    if (m_replay)
        m_replay->record(to_snapshot(*snap));
    std::lock_guard lk(m_commit_mtx);
    m_snapshot = std::move(snap);
    m_pending_events.insert(
        m_pending_events.end(), std::make_move_iterator(tick_events.begin()),
        std::make_move_iterator(tick_events.end()));
    m_tick_index.store(m_state.tick(), std::memory_order_release);
}

bool SimulationLoop::tick()
{
    std::lock_guard lk(m_tick_mtx);
    if (m_status.load(std::memory_order_acquire) != LoopStatus::running)
        return false;
    auto t0 = std::chrono::steady_clock::now();
    const uint64_t n = m_state.tick();
    auto &sb = m_state.mutable_scoreboard();
    sb.latest_tick_begin = sb.events.size();
    m_report = TickReport{};
    m_report.tick = n;
    std::optional<PlayerId> before = m_state.ball().possessor;

    // 1. decisions against the last committed snapshot (identical to m_state at this point)
    ai::CollectResult decisions = m_collector.collect(snapshot(), m_agents);
    record_faults(decisions);

    // 2. arbitration
    ResolveResult resolved = m_resolver.resolve(m_state, decisions.actions, n);
    for (auto &ev : resolved.events)
        m_state.append_event(std::move(ev));
    m_report.malformed_actions = resolved.malformed;
    m_report.ball_winner = resolved.ball_winner;

    // 3. physics
    phys::StepResult step = m_physics.step(m_state, resolved.inputs);
    m_report.physics_anomalies = step.anomalies;
    m_report.contacts = step.contacts;

    // 4. derived state
    emit_possession_change(before, resolved);
    m_report.goal = check_goal();
    if (!m_report.goal && step.ball_out_of_bounds && m_cfg.dead_ball_restart) {
        auto &ball = m_state.mutable_ball();
        ball.velocity = b2Vec2_zero;
        ball.spin = 0.f;
    }
    const bool full_time = n + 1 >= m_duration_ticks;
    if (full_time) {
        MatchEvent ev;
        ev.kind = EventKind::match_end;
        ev.position = m_state.ball().position;
        ev.detail = "full time " + score_line(m_state.scoreboard());
        m_state.append_event(std::move(ev));
    }
    ++m_state.mutable_scoreboard().elapsed_ticks;
    m_report.effective_actions = std::move(resolved.effective);

    // 5. commit + publish
    commit(m_state.scoreboard().latest_events());
    if (full_time) {
        m_status.store(LoopStatus::finished, std::memory_order_release);
        kick::log::info(
            "[match] finished ticks={} score={} events={} mean_tick_ns={} p99_tick_ns<={} mean_decision_wait_ns={}",
            m_state.tick(), score_line(m_state.scoreboard()), m_state.scoreboard().events.size(),
            kick::metrics::mean_tick_ns(), kick::metrics::approx_tick_p99(), kick::metrics::mean_decision_wait_ns());
        close_replay();
    }

    auto &rt = kick::metrics::runtime();
    rt.ticks_total.fetch_add(1, std::memory_order_relaxed);
    m_report.duration_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - t0).count());
    kick::metrics::add_tick_duration(m_report.duration_ns);
    kick::log::trace(
        "[match] tick={} winner={} anomalies={} took_ns={}", n, m_report.ball_winner.value_or(kNoPlayer),
        m_report.physics_anomalies, m_report.duration_ns);
    return true;
}

uint64_t SimulationLoop::run(uint64_t max_ticks)
{
    uint64_t ran = 0;
    while (ran < max_ticks && tick())
        ++ran;
    return ran;
}

uint64_t SimulationLoop::run_to_end()
{
    uint64_t ran = 0;
    while (tick())
        ++ran;
    return ran;
}

} // namespace kick::game
