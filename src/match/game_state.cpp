// SPDX-License-Identifier: Apache-2.0
#include "match/game_state.hpp"

#include "common/error.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace kick::game {

const char *team_name(Team t)
{
    return t == Team::home ? "home" : "away";
}

const char *event_kind_name(EventKind k)
{
    switch (k) {
        case EventKind::goal:
            return "goal";
        case EventKind::out_of_bounds:
            return "out_of_bounds";
        case EventKind::foul:
            return "foul";
        case EventKind::anomaly:
            return "anomaly";
        case EventKind::possession_change:
            return "possession_change";
        case EventKind::match_end:
            return "match_end";
    }
    return "unknown";
}

bool FieldState::inside_field(b2Vec2 p, float eps) const
{
    return std::fabs(p.x) <= half_length() + eps && std::fabs(p.y) <= half_width() + eps;
}

bool FieldState::inside_extended(b2Vec2 p, float eps) const
{
    return std::fabs(p.x) <= half_length() + overrun_margin + eps
        && std::fabs(p.y) <= half_width() + overrun_margin + eps;
}

bool FieldState::in_goal_mouth(float y) const
{
    return std::fabs(y) <= half_goal_width() - post_radius;
}

b2Vec2 FieldState::clamp_to_extended(b2Vec2 p) const
{
    float hx = half_length() + overrun_margin;
    float hy = half_width() + overrun_margin;
    return {std::clamp(p.x, -hx, hx), std::clamp(p.y, -hy, hy)};
}

std::optional<Team> FieldState::goal_scored(b2Vec2 ball_pos, float ball_radius) const
{
    if (!in_goal_mouth(ball_pos.y))
        return std::nullopt;
    // Whole ball behind the line: centre past the line by at least one radius
    if (ball_pos.x <= -half_length() - ball_radius)
        return Team::away; // home goal breached
    if (ball_pos.x >= half_length() + ball_radius)
        return Team::home;
    return std::nullopt;
}

b2Vec2 FieldState::goal_center(Team defender) const
{
    return {defender == Team::home ? -half_length() : half_length(), 0.f};
}

std::array<b2Vec2, 4> FieldState::post_positions() const
{
    float hx = half_length();
    float hg = half_goal_width();
    return {b2Vec2{-hx, -hg}, b2Vec2{-hx, hg}, b2Vec2{hx, -hg}, b2Vec2{hx, hg}};
}

GameState::GameState(std::shared_ptr<const FieldState> field, std::vector<PlayerState> players, BallState ball, float dt)
    : m_field(std::move(field))
    , m_players(std::move(players))
    , m_ball(std::move(ball))
    , m_dt(dt)
{
    if (!m_field)
        m_field = std::make_shared<const FieldState>();
    std::sort(
        m_players.begin(), m_players.end(), [](const PlayerState &a, const PlayerState &b) { return a.id < b.id; });
    // The ball's possessor is authoritative; derive the per-player flags from it
    for (auto &p : m_players)
        p.has_possession = m_ball.possessor && *m_ball.possessor == p.id;
}

std::optional<size_t> GameState::index_of(PlayerId id) const
{
    auto it = std::lower_bound(
        m_players.begin(), m_players.end(), id, [](const PlayerState &p, PlayerId v) { return p.id < v; });
    if (it == m_players.end() || it->id != id)
        return std::nullopt;
    return static_cast<size_t>(it - m_players.begin());
}

const PlayerState *GameState::find_player(PlayerId id) const
{
    auto idx = index_of(id);
    return idx ? &m_players[*idx] : nullptr;
}

PlayerState *GameState::mutable_player(PlayerId id)
{
    auto idx = index_of(id);
    return idx ? &m_players[*idx] : nullptr;
}

const PlayerState *GameState::possessor() const
{
    return m_ball.possessor ? find_player(*m_ball.possessor) : nullptr;
}

void GameState::set_possessor(std::optional<PlayerId> id)
{
    if (id && !find_player(*id))
        id.reset();
    m_ball.possessor = id;
    if (id)
        m_ball.last_touch = id;
    for (auto &p : m_players)
        p.has_possession = id && *id == p.id;
}

std::vector<MatchEvent> EventLog::slice(size_t from) const
{
    std::vector<MatchEvent> out;
    if (!m_storage || from >= m_size)
        return out;
    std::lock_guard lk(m_storage->mtx);
    out.assign(m_storage->events.begin() + from, m_storage->events.begin() + m_size);
    return out;
}

void EventLog::append(MatchEvent ev)
{
    if (m_storage) {
        std::lock_guard lk(m_storage->mtx);
        if (m_storage->events.size() == m_size) {
            m_storage->events.push_back(std::move(ev));
            ++m_size;
            return;
        }
    }
    auto own = std::make_shared<Storage>();
    if (m_storage) {
        std::lock_guard lk(m_storage->mtx);
        own->events.assign(m_storage->events.begin(), m_storage->events.begin() + m_size);
    }
    own->events.push_back(std::move(ev));
    m_storage = std::move(own);
    ++m_size;
}

void GameState::append_event(MatchEvent ev)
{
    ev.tick = m_scoreboard.elapsed_ticks;
    ev.time = static_cast<float>(elapsed_seconds());
    m_scoreboard.events.append(std::move(ev));
}

static bool finite(b2Vec2 v)
{
    return std::isfinite(v.x) && std::isfinite(v.y);
}

void GameState::validate(float eps) const
{
    const FieldState &f = *m_field;
    if (!(f.length > 0.f) || !(f.width > 0.f))
        throw ConfigError("field dimensions must be positive");
    if (!(f.goal_width > 0.f) || f.goal_width >= f.width)
        throw ConfigError("goal width must be positive and narrower than the field");
    if (f.goal_depth < 0.f || f.overrun_margin < 0.f || f.post_radius < 0.f)
        throw ConfigError("goal depth, overrun margin and post radius must be non-negative");
    if (!(m_dt > 0.f) || !std::isfinite(m_dt))
        throw ConfigError("dt must be positive");
    if (m_players.empty())
        throw ConfigError("match has no players");
    for (size_t i = 0; i < m_players.size(); ++i) {
        const auto &p = m_players[i];
        std::string who = "player " + std::to_string(p.id);
        if (p.id == kNoPlayer)
            throw ConfigError("player id 0 is reserved for the ball");
        if (i > 0 && m_players[i - 1].id == p.id)
            throw ConfigError("duplicate " + who);
        if (!finite(p.position) || !finite(p.velocity) || !std::isfinite(p.orientation))
            throw ConfigError(who + " has non-finite kinematics");
        if (!f.inside_extended(p.position, eps))
            throw ConfigError(who + " starts outside the extended field bounds");
        if (!(p.radius > 0.f) || !(p.mass > 0.f) || !(p.max_speed > 0.f) || !(p.max_acceleration > 0.f))
            throw ConfigError(who + " has a non-positive physical constant");
        if (b2Length(p.velocity) > p.max_speed + eps)
            throw ConfigError(who + " exceeds its max speed");
        if (p.stamina < 0.f || p.stamina > 1.f)
            throw ConfigError(who + " stamina outside [0,1]");
    }
    if (!finite(m_ball.position) || !finite(m_ball.velocity) || !std::isfinite(m_ball.spin))
        throw ConfigError("ball has non-finite kinematics");
    if (!(m_ball.radius > 0.f) || !(m_ball.mass > 0.f))
        throw ConfigError("ball radius and mass must be positive");
    if (m_ball.possessor && !find_player(*m_ball.possessor))
        throw ConfigError("ball possessor " + std::to_string(*m_ball.possessor) + " is not on the field");
    size_t holders = 0;
    for (const auto &p : m_players) {
        if (p.has_possession) {
            ++holders;
            if (!m_ball.possessor || *m_ball.possessor != p.id)
                throw ConfigError("possession flag disagrees with ball possessor");
        }
    }
    if (holders > 1)
        throw ConfigError("more than one player holds the ball");
}

} // namespace kick::game
