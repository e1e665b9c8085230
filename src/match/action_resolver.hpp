// SPDX-License-Identifier: Apache-2.0
// action_resolver.hpp - turns one tick of agent intents into physics inputs
#pragma once
#include "match/action.hpp"
#include "match/game_state.hpp"
#include "match/physics.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace kick::game {

struct ResolverConfig
{
    float epsilon{1e-4f};
    // Steering: force = (desired_v - v) * gain * mass, desired speed fades inside arrival_radius
    float steering_gain{4.f};
    float arrival_radius{2.f};
    // Max player-centre to ball-centre distance for passing, shooting or tackling
    float interaction_radius{1.2f};
    float max_pass_speed{25.f};
    float max_shot_speed{32.f};
    uint32_t kick_recovery_ticks{12};
    uint32_t tackle_recovery_ticks{30};
    // Tackle contest: p = clamp(base - falloff * d / range, 0, 1), d = tackler to target distance
    float tackle_range{1.5f};
    float tackle_base_success{0.7f};
    float tackle_distance_falloff{0.5f};
    // Share of the failure band that counts as a foul
    float foul_probability{0.15f};
    // Force cap multiplier while recovering from a tackle
    float tackle_recovery_force_factor{0.3f};
    // Spin imparted per m/s of kicker velocity across the kick direction
    float spin_factor{0.1f};
    // Acceleration cap at zero stamina, as a fraction of the fresh cap
    float min_stamina_factor{0.5f};
};

enum class TackleOutcome : uint8_t
{
    won,
    lost,
    foul,
    claimed // free ball taken
};

struct ResolveResult
{
    phys::PhysicsInputs inputs;
    std::vector<Action> effective; // post-arbitration action per player, aligned with players()
    std::vector<MatchEvent> events; // anomalies in player order, then a tackle foul if any
    std::optional<PlayerId> ball_winner;
    std::optional<TackleOutcome> tackle;
    uint32_t malformed{0};
};

class ActionResolver
{
public:
    ActionResolver(ResolverConfig cfg, uint64_t seed);

    // actions[i] belongs to state.players()[i]; missing entries count as Hold.
    ResolveResult resolve(const GameState &state, const std::vector<Action> &actions, uint64_t tick) const;

    // Deterministic roll in [0,1) for one tackle attempt.
    double tackle_roll(uint64_t tick, PlayerId tackler, PlayerId target) const;
    float tackle_success_probability(float distance) const;

    const ResolverConfig &config() const noexcept { return m_cfg; }

private:
    Action sanitize(const GameState &state, const PlayerState &actor, const Action &in, ResolveResult &out) const;
    phys::PlayerCommand steer(const PlayerState &p, b2Vec2 target, float speed) const;
    float force_cap(const PlayerState &p) const;
    bool in_reach(const GameState &state, const PlayerState &p) const;
    void apply_kick(
        const GameState &state, size_t idx, b2Vec2 direction, float speed, ResolveResult &out) const;
    void apply_tackle(const GameState &state, size_t idx, const Tackle &t, uint64_t tick, ResolveResult &out) const;

    ResolverConfig m_cfg;
    uint64_t m_seed;
};

} // namespace kick::game
