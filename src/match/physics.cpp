// SPDX-License-Identifier: Apache-2.0
#include "match/physics.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace kick::phys {

namespace {

bool finite(b2Vec2 v)
{
    return std::isfinite(v.x) && std::isfinite(v.y);
}

b2Vec2 heading(float angle)
{
    return {std::cos(angle), std::sin(angle)};
}

b2Vec2 clamp_length(b2Vec2 v, float max_len)
{
    float len = b2Length(v);
    if (len > max_len && len > 0.f)
        return b2MulSV(max_len / len, v);
    return v;
}

// Wraps to [-pi, pi]
float wrap_angle(float a)
{
    const float two_pi = 2.f * (float)M_PI;
    a = std::fmod(a + (float)M_PI, two_pi);
    if (a < 0.f)
        a += two_pi;
    return a - (float)M_PI;
}

float turn_towards(float current, float target, float max_step)
{
    float diff = wrap_angle(target - current);
    if (std::fabs(diff) <= max_step)
        return wrap_angle(target);
    return wrap_angle(current + (diff > 0.f ? max_step : -max_step));
}

} // namespace

PhysicsEngine::PhysicsEngine(PhysicsConfig cfg, float dt)
    : m_cfg(cfg)
    , m_dt(dt)
{
}

StepResult PhysicsEngine::step(game::GameState &state, const PhysicsInputs &inputs)
{
    StepResult res;
    m_prev_players = state.players();
    m_prev_ball = state.ball();
    apply_controls(state, inputs);
    integrate(state, inputs);
    check_finite(state, res);
    detect_contacts(state);
    capture_free_ball(state, inputs, res);
    resolve_contacts(state);
    res.contacts = static_cast<uint32_t>(m_contacts.size());
    enforce_ball_bounds(state, res);
    enforce_player_bounds(state);
    clamp_speeds(state);
    return res;
}

void PhysicsEngine::apply_controls(game::GameState &state, const PhysicsInputs &inputs)
{
    auto &players = state.mutable_players();
    for (size_t i = 0; i < players.size(); ++i) {
        auto &p = players[i];
        if (p.action_in_progress) {
            if (p.action_in_progress->remaining_ticks <= 1)
                p.action_in_progress.reset();
            else
                --p.action_in_progress->remaining_ticks;
        }
        if (i < inputs.commands.size() && inputs.commands[i].start_activity)
            p.action_in_progress = inputs.commands[i].start_activity;
    }
    if (inputs.possession) {
        const auto &pi = *inputs.possession;
        if (pi.kind == PossessionKind::release)
            state.set_possessor(std::nullopt);
        else
            state.set_possessor(pi.player);
    }
    if (inputs.ball_impulse) {
        auto &ball = state.mutable_ball();
        ball.velocity = b2MulAdd(ball.velocity, 1.f / ball.mass, inputs.ball_impulse->impulse);
        ball.spin = inputs.ball_impulse->spin;
        ball.last_touch = inputs.ball_impulse->kicker;
    }
}

void PhysicsEngine::integrate(game::GameState &state, const PhysicsInputs &inputs)
{
    const float dt = m_dt;
    auto &players = state.mutable_players();
    for (size_t i = 0; i < players.size(); ++i) {
        auto &p = players[i];
        const PlayerCommand *cmd = i < inputs.commands.size() ? &inputs.commands[i] : nullptr;
        b2Vec2 force = cmd ? cmd->force : b2Vec2_zero;
        b2Vec2 accel = b2MulSV(1.f / p.mass, force);
        accel = b2MulAdd(accel, -m_cfg.player_drag, p.velocity);
        p.velocity = clamp_length(b2MulAdd(p.velocity, dt, accel), p.max_speed);
        p.position = b2MulAdd(p.position, dt, p.velocity);
        float max_turn = m_cfg.turn_rate * dt;
        if (cmd && cmd->facing)
            p.orientation = turn_towards(p.orientation, *cmd->facing, max_turn);
        else if (b2Length(p.velocity) > m_cfg.epsilon)
            p.orientation = turn_towards(p.orientation, std::atan2(p.velocity.y, p.velocity.x), max_turn);
        float effort = std::min(1.f, b2Length(force) / (p.mass * p.max_acceleration));
        float delta = (m_cfg.stamina_recovery * (1.f - effort) - m_cfg.stamina_drain * effort) * dt;
        p.stamina = std::clamp(p.stamina + delta, 0.f, 1.f);
    }
    auto &ball = state.mutable_ball();
    if (ball.possessor) {
        carry_possessed_ball(state);
        return;
    }
    float speed = b2Length(ball.velocity);
    b2Vec2 accel = b2MulSV(-m_cfg.ball_air_drag * speed, ball.velocity);
    b2Vec2 side{-ball.velocity.y, ball.velocity.x};
    accel = b2MulAdd(accel, m_cfg.magnus_coefficient * ball.spin, side);
    ball.velocity = b2MulAdd(ball.velocity, dt, accel);
    // Rolling friction only ever slows the ball down, it never reverses it
    speed = b2Length(ball.velocity);
    float slowed = speed - m_cfg.ball_rolling_friction * dt;
    if (slowed <= m_cfg.epsilon)
        ball.velocity = b2Vec2_zero;
    else
        ball.velocity = b2MulSV(slowed / speed, ball.velocity);
    ball.velocity = clamp_length(ball.velocity, m_cfg.ball_max_speed);
    ball.position = b2MulAdd(ball.position, dt, ball.velocity);
    ball.spin -= ball.spin * std::min(1.f, m_cfg.spin_decay * dt);
    if (std::fabs(ball.spin) < m_cfg.epsilon)
        ball.spin = 0.f;
}

void PhysicsEngine::carry_possessed_ball(game::GameState &state)
{
    auto &ball = state.mutable_ball();
    const game::PlayerState *holder = ball.possessor ? state.find_player(*ball.possessor) : nullptr;
    if (!holder)
        return;
    float reach = holder->radius + ball.radius + m_cfg.carry_offset;
    ball.position = b2MulAdd(holder->position, reach, heading(holder->orientation));
    ball.velocity = holder->velocity;
    ball.spin = 0.f;
}

void PhysicsEngine::check_finite(game::GameState &state, StepResult &res)
{
    auto &players = state.mutable_players();
    for (size_t i = 0; i < players.size(); ++i) {
        auto &p = players[i];
        if (finite(p.position) && finite(p.velocity) && std::isfinite(p.orientation) && std::isfinite(p.stamina))
            continue;
        const auto &prev = m_prev_players[i];
        p.position = prev.position;
        p.orientation = prev.orientation;
        p.stamina = prev.stamina;
        p.velocity = b2Vec2_zero;
        ++res.anomalies;
        kick::metrics::runtime().physics_anomalies.fetch_add(1, std::memory_order_relaxed);
        KICK_LOG_EVERY_N(warn, 30, "[phys] non-finite player state restored id={}", p.id);
        game::MatchEvent ev;
        ev.kind = game::EventKind::anomaly;
        ev.team = p.team;
        ev.player = p.id;
        ev.position = p.position;
        ev.detail = "non-finite player state restored";
        state.append_event(std::move(ev));
    }
    auto &ball = state.mutable_ball();
    if (finite(ball.position) && finite(ball.velocity) && std::isfinite(ball.spin))
        return;
    ball.position = m_prev_ball.position;
    ball.velocity = b2Vec2_zero;
    ball.spin = 0.f;
    ++res.anomalies;
    kick::metrics::runtime().physics_anomalies.fetch_add(1, std::memory_order_relaxed);
    KICK_LOG_EVERY_N(warn, 30, "[phys] non-finite ball state restored");
    game::MatchEvent ev;
    ev.kind = game::EventKind::anomaly;
    ev.position = ball.position;
    ev.detail = "non-finite ball state restored";
    state.append_event(std::move(ev));
}

void PhysicsEngine::detect_contacts(const game::GameState &state)
{
    m_contacts.clear();
    const auto &players = state.players();
    const auto &ball = state.ball();
    const game::PlayerId post_base = players.empty() ? 1 : players.back().id + 1;
    auto posts = state.field().post_positions();
    const float post_radius = state.field().post_radius;

    auto test = [&](uint32_t ida, size_t ia, b2Vec2 pa, float ra, uint32_t idb, size_t ib, b2Vec2 pb, float rb)
    {
        b2Circle ca{b2Vec2_zero, ra};
        b2Circle cb{b2Vec2_zero, rb};
        b2Manifold m = b2CollideCircles(&ca, b2Transform{pa, b2Rot_identity}, &cb, b2Transform{pb, b2Rot_identity});
        if (m.pointCount == 0 || m.points[0].separation >= -m_cfg.epsilon)
            return;
        Contact c;
        c.a = ida;
        c.b = idb;
        c.ia = ia;
        c.ib = ib;
        c.depth = -m.points[0].separation;
        // Coincident centres leave the manifold without a direction
        c.normal = b2LengthSquared(m.normal) > 0.f ? m.normal : b2Vec2{1.f, 0.f};
        m_contacts.push_back(c);
    };

    // Generated in ascending (a, b) order: ball pairs first (players then posts), then player pairs.
    for (size_t j = 0; j < players.size(); ++j)
        test(kBallEntity, 0, ball.position, ball.radius, players[j].id, j, players[j].position, players[j].radius);
    if (post_radius > 0.f) {
        for (size_t k = 0; k < posts.size(); ++k)
            test(kBallEntity, 0, ball.position, ball.radius, post_base + (uint32_t)k, k, posts[k], post_radius);
    }
    for (size_t i = 0; i < players.size(); ++i) {
        for (size_t j = i + 1; j < players.size(); ++j) {
            test(
                players[i].id, i, players[i].position, players[i].radius, players[j].id, j, players[j].position,
                players[j].radius);
        }
    }
}

void PhysicsEngine::capture_free_ball(game::GameState &state, const PhysicsInputs &inputs, StepResult &res)
{
    // A possession instruction this tick means a stronger contest already decided the ball.
    if (state.ball().possessor || inputs.possession)
        return;
    const auto &ball = state.ball();
    std::optional<game::PlayerId> best;
    float best_dist = 0.f;
    for (const auto &p : state.players()) {
        if (p.busy())
            continue;
        float d = b2Distance(p.position, ball.position);
        if (d > m_cfg.capture_radius + m_cfg.epsilon)
            continue;
        if (b2Length(b2Sub(ball.velocity, p.velocity)) >= m_cfg.capture_max_speed)
            continue;
        // players are sorted by id, so a strict improvement keeps the lowest id on ties
        if (!best || d < best_dist - m_cfg.epsilon) {
            best = p.id;
            best_dist = d;
        }
    }
    if (!best)
        return;
    state.set_possessor(best);
    res.captured_by = best;
    kick::log::trace("[phys] capture player={} d={}", *best, best_dist);
}

void PhysicsEngine::resolve_contacts(game::GameState &state)
{
    auto &players = state.mutable_players();
    auto &ball = state.mutable_ball();
    const game::PlayerId post_base = players.empty() ? 1 : players.back().id + 1;
    b2Vec2 post_velocity = b2Vec2_zero;
    auto posts = state.field().post_positions();

    for (const auto &c : m_contacts) {
        b2Vec2 *pos_a;
        b2Vec2 *vel_a;
        float inv_a;
        float restitution;
        if (c.a == kBallEntity) {
            pos_a = &ball.position;
            vel_a = &ball.velocity;
            inv_a = 1.f / ball.mass;
        } else {
            pos_a = &players[c.ia].position;
            vel_a = &players[c.ia].velocity;
            inv_a = 1.f / players[c.ia].mass;
        }
        b2Vec2 *pos_b;
        b2Vec2 *vel_b;
        float inv_b;
        if (c.b >= post_base) {
            pos_b = &posts[c.ib];
            vel_b = &post_velocity;
            inv_b = 0.f; // posts are static
            restitution = m_cfg.restitution_ball_post;
        } else {
            auto &pb = players[c.ib];
            if (c.a == kBallEntity) {
                // The carried ball rides on its possessor
                if (ball.possessor && *ball.possessor == pb.id)
                    continue;
                ball.last_touch = pb.id;
                restitution = m_cfg.restitution_player_ball;
            } else {
                restitution = m_cfg.restitution_player_player;
            }
            pos_b = &pb.position;
            vel_b = &pb.velocity;
            inv_b = 1.f / pb.mass;
        }
        float inv_sum = inv_a + inv_b;
        if (inv_sum <= 0.f)
            continue;
        float correction = std::max(c.depth - m_cfg.correction_slop, 0.f) * m_cfg.correction_percent / inv_sum;
        *pos_a = b2MulSub(*pos_a, correction * inv_a, c.normal);
        *pos_b = b2MulAdd(*pos_b, correction * inv_b, c.normal);
        float vn = b2Dot(b2Sub(*vel_b, *vel_a), c.normal);
        if (vn >= 0.f)
            continue; // already separating
        float j = -(1.f + restitution) * vn / inv_sum;
        *vel_a = b2MulSub(*vel_a, j * inv_a, c.normal);
        *vel_b = b2MulAdd(*vel_b, j * inv_b, c.normal);
    }
}

void PhysicsEngine::enforce_ball_bounds(game::GameState &state, StepResult &res)
{
    const auto &field = state.field();
    const float eps = m_cfg.epsilon;
    const float hl = field.half_length();
    const float hw = field.half_width();
    const float e = m_cfg.restitution_ball_boundary;
    auto &ball = state.mutable_ball();
    const char *where = nullptr;

    bool was_in_goal = std::fabs(m_prev_ball.position.x) > hl + eps;
    if (std::fabs(ball.position.x) > hl + eps) {
        float sx = ball.position.x > 0.f ? 1.f : -1.f;
        bool mouth = was_in_goal ? field.in_goal_mouth(m_prev_ball.position.y) : field.in_goal_mouth(ball.position.y);
        if (mouth) {
            // Inside the goal: back net and side nets keep the ball
            float back = hl + field.goal_depth;
            if (std::fabs(ball.position.x) > back) {
                ball.position.x = sx * back;
                ball.velocity.x = -ball.velocity.x * e;
            }
            float side = field.half_goal_width() - field.post_radius;
            if (std::fabs(ball.position.y) > side) {
                ball.position.y = ball.position.y > 0.f ? side : -side;
                ball.velocity.y = -ball.velocity.y * e;
            }
        } else {
            ball.position.x = sx * hl;
            ball.velocity.x = -ball.velocity.x * e;
            where = "goal line";
        }
    }
    if (std::fabs(ball.position.y) > hw + eps) {
        ball.position.y = ball.position.y > 0.f ? hw : -hw;
        ball.velocity.y = -ball.velocity.y * e;
        where = "touch line";
    }
    if (!where)
        return;
    std::optional<game::PlayerId> holder = ball.possessor;
    state.set_possessor(std::nullopt);
    res.ball_out_of_bounds = true;
    kick::metrics::runtime().out_of_bounds.fetch_add(1, std::memory_order_relaxed);
    game::MatchEvent ev;
    ev.kind = game::EventKind::out_of_bounds;
    ev.position = state.ball().position;
    ev.detail = std::string("ball over the ") + where;
    if (const auto &lt = state.ball().last_touch) {
        ev.player = *lt;
        if (const auto *p = state.find_player(*lt))
            ev.team = game::opponent(p->team); // restart goes to the other side
    }
    if (holder)
        ev.other_player = *holder;
    kick::log::debug("[phys] ball out ({}) at {},{}", where, ev.position.x, ev.position.y);
    state.append_event(std::move(ev));
}

void PhysicsEngine::enforce_player_bounds(game::GameState &state)
{
    const auto &field = state.field();
    const float eps = m_cfg.epsilon;
    const float lx = field.half_length() + field.overrun_margin;
    const float ly = field.half_width() + field.overrun_margin;
    std::vector<game::MatchEvent> events;
    for (auto &p : state.mutable_players()) {
        bool clamped = false;
        if (std::fabs(p.position.x) > lx) {
            float s = p.position.x > 0.f ? 1.f : -1.f;
            p.position.x = s * lx;
            if (p.velocity.x * s > 0.f)
                p.velocity.x = 0.f;
            clamped = true;
        }
        if (std::fabs(p.position.y) > ly) {
            float s = p.position.y > 0.f ? 1.f : -1.f;
            p.position.y = s * ly;
            if (p.velocity.y * s > 0.f)
                p.velocity.y = 0.f;
            clamped = true;
        }
        if (clamped) {
            if (!p.out_of_bounds) {
                p.out_of_bounds = true;
                game::MatchEvent ev;
                ev.kind = game::EventKind::out_of_bounds;
                ev.team = p.team;
                ev.player = p.id;
                ev.position = p.position;
                ev.detail = "player clamped to extended bounds";
                events.push_back(std::move(ev));
            }
        } else if (std::fabs(p.position.x) < lx - eps && std::fabs(p.position.y) < ly - eps) {
            p.out_of_bounds = false;
        }
    }
    for (auto &ev : events) {
        kick::metrics::runtime().out_of_bounds.fetch_add(1, std::memory_order_relaxed);
        state.append_event(std::move(ev));
    }
}

void PhysicsEngine::clamp_speeds(game::GameState &state)
{
    for (auto &p : state.mutable_players())
        p.velocity = clamp_length(p.velocity, p.max_speed);
    auto &ball = state.mutable_ball();
    ball.velocity = clamp_length(ball.velocity, m_cfg.ball_max_speed);
}

} // namespace kick::phys
