// SPDX-License-Identifier: Apache-2.0
#include "match/action_resolver.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <string>

namespace kick::game {

namespace {

bool finite(b2Vec2 v)
{
    return std::isfinite(v.x) && std::isfinite(v.y);
}

// hash_combine step followed by the splitmix64 finaliser
uint64_t mix(uint64_t h, uint64_t v)
{
    h ^= v + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
    h ^= h >> 30;
    h *= 0xbf58476d1ce4e5b9ull;
    h ^= h >> 27;
    h *= 0x94d049bb133111ebull;
    h ^= h >> 31;
    return h;
}

MatchEvent anomaly(const PlayerState &actor, std::string detail)
{
    MatchEvent ev;
    ev.kind = EventKind::anomaly;
    ev.team = actor.team;
    ev.player = actor.id;
    ev.position = actor.position;
    ev.detail = std::move(detail);
    return ev;
}

} // namespace

ActionResolver::ActionResolver(ResolverConfig cfg, uint64_t seed)
    : m_cfg(cfg)
    , m_seed(seed)
{
}

double ActionResolver::tackle_roll(uint64_t tick, PlayerId tackler, PlayerId target) const
{
    uint64_t h = mix(mix(mix(m_seed, tick), tackler), target);
    std::mt19937 rng(static_cast<uint32_t>(h ^ (h >> 32)));
    return rng() / 4294967296.0;
}

float ActionResolver::tackle_success_probability(float distance) const
{
    float range = std::max(m_cfg.tackle_range, m_cfg.epsilon);
    return std::clamp(m_cfg.tackle_base_success - m_cfg.tackle_distance_falloff * distance / range, 0.f, 1.f);
}

float ActionResolver::force_cap(const PlayerState &p) const
{
    float stamina_factor = m_cfg.min_stamina_factor + (1.f - m_cfg.min_stamina_factor) * p.stamina;
    float cap = p.mass * p.max_acceleration * stamina_factor;
    if (p.action_in_progress && p.action_in_progress->kind == Activity::tackling)
        cap *= m_cfg.tackle_recovery_force_factor;
    return cap;
}

phys::PlayerCommand ActionResolver::steer(const PlayerState &p, b2Vec2 target, float speed) const
{
    phys::PlayerCommand cmd;
    b2Vec2 to = b2Sub(target, p.position);
    float dist = b2Length(to);
    b2Vec2 desired = b2Vec2_zero;
    if (dist > m_cfg.epsilon) {
        float arrive = m_cfg.arrival_radius > 0.f ? std::min(1.f, dist / m_cfg.arrival_radius) : 1.f;
        desired = b2MulSV(speed * arrive / dist, to);
        cmd.facing = std::atan2(to.y, to.x);
    }
    b2Vec2 force = b2MulSV(m_cfg.steering_gain * p.mass, b2Sub(desired, p.velocity));
    float cap = force_cap(p);
    float mag = b2Length(force);
    if (mag > cap && mag > 0.f)
        force = b2MulSV(cap / mag, force);
    cmd.force = force;
    return cmd;
}

bool ActionResolver::in_reach(const GameState &state, const PlayerState &p) const
{
    if (p.busy())
        return false;
    if (p.has_possession)
        return true;
    return b2Distance(p.position, state.ball().position) <= m_cfg.interaction_radius + m_cfg.epsilon;
}

Action ActionResolver::sanitize(const GameState &state, const PlayerState &actor, const Action &in, ResolveResult &out)
    const
{
    const FieldState &field = state.field();
    auto reject = [&](std::string why) -> Action
    {
        ++out.malformed;
        kick::metrics::runtime().malformed_actions.fetch_add(1, std::memory_order_relaxed);
        KICK_LOG_EVERY_N(warn, 60, "[resolve] player={} {} -> Hold", actor.id, why);
        out.events.push_back(anomaly(actor, std::move(why)));
        return Hold{};
    };
    auto scalar = [&](float v, float hi, const char *what) -> float
    {
        if (!std::isfinite(v)) {
            ++out.malformed;
            kick::metrics::runtime().malformed_actions.fetch_add(1, std::memory_order_relaxed);
            out.events.push_back(anomaly(actor, std::string("non-finite ") + what + " replaced by 0"));
            return 0.f;
        }
        return std::clamp(v, 0.f, hi);
    };

    if (const auto *m = std::get_if<MoveTo>(&in)) {
        if (!finite(m->target))
            return reject("MoveTo with non-finite target");
        return MoveTo{field.clamp_to_extended(m->target), scalar(m->desired_speed, actor.max_speed, "speed")};
    }
    if (const auto *p = std::get_if<PassTo>(&in)) {
        if (!state.find_player(p->target_player))
            return reject("PassTo unknown player " + std::to_string(p->target_player));
        if (p->target_player == actor.id)
            return reject("PassTo self");
        return PassTo{p->target_player, scalar(p->power, 1.f, "power")};
    }
    if (const auto *s = std::get_if<Shoot>(&in)) {
        if (!finite(s->target))
            return reject("Shoot with non-finite target");
        return Shoot{field.clamp_to_extended(s->target), scalar(s->power, 1.f, "power")};
    }
    if (const auto *t = std::get_if<Tackle>(&in)) {
        if (!state.find_player(t->target_player))
            return reject("Tackle unknown player " + std::to_string(t->target_player));
        if (t->target_player == actor.id)
            return reject("Tackle self");
        if (actor.has_possession)
            return reject("Tackle while holding the ball");
        return *t;
    }
    return Hold{};
}

void ActionResolver::apply_kick(const GameState &state, size_t idx, b2Vec2 direction, float speed, ResolveResult &out)
    const
{
    const PlayerState &kicker = state.players()[idx];
    const BallState &ball = state.ball();
    float len = b2Length(direction);
    b2Vec2 dir = len > m_cfg.epsilon ? b2MulSV(1.f / len, direction)
                                     : b2Vec2{std::cos(kicker.orientation), std::sin(kicker.orientation)};
    b2Vec2 desired_v = b2MulSV(speed, dir);
    phys::BallImpulse kick;
    kick.impulse = b2MulSV(ball.mass, b2Sub(desired_v, ball.velocity));
    // Kicker's motion across the kick direction curls the ball
    kick.spin = m_cfg.spin_factor * (dir.x * kicker.velocity.y - dir.y * kicker.velocity.x);
    kick.kicker = kicker.id;
    out.inputs.ball_impulse = kick;
    if (kicker.has_possession)
        out.inputs.possession = phys::PossessionInstruction{phys::PossessionKind::release, kicker.id, kicker.id};
    auto &cmd = out.inputs.commands[idx];
    cmd = steer(kicker, kicker.position, 0.f);
    cmd.facing = std::atan2(dir.y, dir.x);
    cmd.start_activity = ActionInProgress{Activity::kicking, m_cfg.kick_recovery_ticks};
}

void ActionResolver::apply_tackle(
    const GameState &state, size_t idx, const Tackle &t, uint64_t tick, ResolveResult &out) const
{
    const PlayerState &tackler = state.players()[idx];
    const PlayerState *target = state.find_player(t.target_player);
    const BallState &ball = state.ball();
    auto &rt = kick::metrics::runtime();
    if (!ball.possessor) {
        out.inputs.possession = phys::PossessionInstruction{phys::PossessionKind::claim, tackler.id, kNoPlayer};
        out.inputs.commands[idx] = steer(tackler, ball.position, 0.f);
        out.tackle = TackleOutcome::claimed;
        return;
    }
    rt.tackles_attempted.fetch_add(1, std::memory_order_relaxed);
    float d = b2Distance(tackler.position, target->position);
    float p = tackle_success_probability(d);
    double roll = tackle_roll(tick, tackler.id, target->id);
    auto &cmd = out.inputs.commands[idx];
    cmd = steer(tackler, target->position, tackler.max_speed);
    cmd.start_activity = ActionInProgress{Activity::tackling, m_cfg.tackle_recovery_ticks};
    if (roll < p) {
        out.inputs.possession = phys::PossessionInstruction{phys::PossessionKind::transfer, tackler.id, target->id};
        out.tackle = TackleOutcome::won;
        rt.tackles_won.fetch_add(1, std::memory_order_relaxed);
        kick::log::debug("[resolve] tackle won by={} on={} p={} roll={}", tackler.id, target->id, p, roll);
        return;
    }
    if (roll >= 1.0 - m_cfg.foul_probability) {
        out.tackle = TackleOutcome::foul;
        rt.fouls.fetch_add(1, std::memory_order_relaxed);
        MatchEvent ev;
        ev.kind = EventKind::foul;
        ev.team = tackler.team;
        ev.player = tackler.id;
        ev.other_player = target->id;
        ev.position = target->position;
        ev.detail = "foul in tackle";
        out.events.push_back(std::move(ev));
        kick::log::debug("[resolve] foul by={} on={} roll={}", tackler.id, target->id, roll);
        return;
    }
    out.tackle = TackleOutcome::lost;
}

ResolveResult ActionResolver::resolve(const GameState &state, const std::vector<Action> &actions, uint64_t tick)
    const
{
    const auto &players = state.players();
    const BallState &ball = state.ball();
    ResolveResult out;
    out.inputs.commands.resize(players.size());
    out.effective.reserve(players.size());
    if (actions.size() != players.size())
        KICK_LOG_EVERY_N(
            error, 600, "[resolve] {} actions for {} players, missing ones count as Hold", actions.size(),
            players.size());

    // 1. sanitise
    for (size_t i = 0; i < players.size(); ++i) {
        Action a = i < actions.size() ? actions[i] : Action{Hold{}};
        out.effective.push_back(sanitize(state, players[i], a, out));
    }

    // 2. arbitrate ball actions: possessor first, then nearest, then lowest id
    std::optional<size_t> winner;
    float winner_dist = 0.f;
    for (size_t i = 0; i < players.size(); ++i) {
        if (!is_ball_action(out.effective[i]))
            continue;
        const PlayerState &p = players[i];
        bool eligible = in_reach(state, p);
        // A ball held by someone else can only be taken by tackling its holder; anything else whiffs
        if (eligible && ball.possessor && !p.has_possession) {
            const auto *t = std::get_if<Tackle>(&out.effective[i]);
            if (!t || t->target_player != *ball.possessor)
                eligible = false;
        }
        if (!eligible) {
            out.effective[i] = MoveTo{ball.position, p.max_speed};
            continue;
        }
        float d = b2Distance(p.position, ball.position);
        if (!winner) {
            winner = i;
            winner_dist = d;
            continue;
        }
        const PlayerState &cur = players[*winner];
        if (cur.has_possession) {
            out.effective[i] = MoveTo{ball.position, p.max_speed};
            continue;
        }
        if (p.has_possession || d < winner_dist - m_cfg.epsilon) {
            out.effective[*winner] = MoveTo{ball.position, cur.max_speed};
            winner = i;
            winner_dist = d;
        } else {
            out.effective[i] = MoveTo{ball.position, p.max_speed};
        }
    }

    // 3. movement for everyone not executing a ball action
    for (size_t i = 0; i < players.size(); ++i) {
        if (winner && *winner == i)
            continue;
        const PlayerState &p = players[i];
        if (const auto *m = std::get_if<MoveTo>(&out.effective[i]))
            out.inputs.commands[i] = steer(p, m->target, m->desired_speed);
        else
            out.inputs.commands[i] = steer(p, p.position, 0.f);
    }

    // 4. winner effects
    if (winner) {
        size_t i = *winner;
        const PlayerState &p = players[i];
        out.ball_winner = p.id;
        const Action &a = out.effective[i];
        if (const auto *pass = std::get_if<PassTo>(&a)) {
            const PlayerState *mate = state.find_player(pass->target_player);
            apply_kick(state, i, b2Sub(mate->position, ball.position), pass->power * m_cfg.max_pass_speed, out);
        } else if (const auto *shot = std::get_if<Shoot>(&a)) {
            apply_kick(state, i, b2Sub(shot->target, ball.position), shot->power * m_cfg.max_shot_speed, out);
        } else if (const auto *tackle = std::get_if<Tackle>(&a)) {
            apply_tackle(state, i, *tackle, tick, out);
        }
        kick::log::trace("[resolve] tick={} ball winner={} {}", tick, p.id, to_string(out.effective[i]));
    }
    return out;
}

} // namespace kick::game
