// SPDX-License-Identifier: Apache-2.0
// physics.hpp - fixed-step player/ball integration, circle contacts and field boundaries
#pragma once
#include "match/game_state.hpp"

#include <box2d/box2d.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace kick::phys {

struct PhysicsConfig
{
    float epsilon{1e-4f};
    // Player linear drag (1/s), applied on top of steering forces
    float player_drag{0.4f};
    // Ball: constant rolling deceleration (m/s^2), quadratic air drag, Magnus coefficient
    float ball_rolling_friction{0.8f};
    float ball_air_drag{0.012f};
    float magnus_coefficient{0.015f};
    float spin_decay{0.8f}; // 1/s
    float ball_max_speed{40.f};
    // Restitution per contact type
    float restitution_player_player{0.1f};
    float restitution_player_ball{0.5f};
    float restitution_ball_post{0.8f};
    float restitution_ball_boundary{0.6f};
    // Positional correction: penetration allowed before correcting, fraction corrected per step
    float correction_slop{0.005f};
    float correction_percent{0.8f};
    // Free-ball capture: centre-to-centre reach and max relative speed
    float capture_radius{0.8f};
    float capture_max_speed{6.f};
    // Gap between a possessor's surface and the carried ball
    float carry_offset{0.15f};
    float turn_rate{10.f}; // rad/s
    // Stamina change per second at full effort / at rest
    float stamina_drain{0.015f};
    float stamina_recovery{0.01f};
};

struct PlayerCommand
{
    b2Vec2 force{0.f, 0.f};
    std::optional<float> facing; // requested heading (radians)
    std::optional<game::ActionInProgress> start_activity; // recovery begun by this tick's action
};

enum class PossessionKind : uint8_t
{
    transfer, // successful tackle on the possessor
    claim, // free ball taken by a tackle winner
    release // pass or shot
};

struct PossessionInstruction
{
    PossessionKind kind{PossessionKind::release};
    game::PlayerId player{game::kNoPlayer}; // new holder (transfer/claim) or releasing kicker
    game::PlayerId from{game::kNoPlayer};
};

struct BallImpulse
{
    b2Vec2 impulse{0.f, 0.f}; // N*s
    float spin{0.f};
    game::PlayerId kicker{game::kNoPlayer};
};

// Everything the resolver may ask of the physics step. Agents never write physical quantities directly.
struct PhysicsInputs
{
    std::vector<PlayerCommand> commands; // aligned with GameState::players()
    std::optional<BallImpulse> ball_impulse;
    std::optional<PossessionInstruction> possession;
};

struct StepResult
{
    uint32_t contacts{0};
    uint32_t anomalies{0};
    bool ball_out_of_bounds{false};
    std::optional<game::PlayerId> captured_by;
};

class PhysicsEngine
{
public:
    PhysicsEngine(PhysicsConfig cfg, float dt);

    // Advances `state` by exactly one dt. Appends anomaly and out-of-bounds events to the state's
    // scoreboard; never throws for numeric trouble.
    StepResult step(game::GameState &state, const PhysicsInputs &inputs);

    float dt() const noexcept { return m_dt; }
    const PhysicsConfig &config() const noexcept { return m_cfg; }

    // Entity ids used for contact ordering: ball = 0, players = PlayerId, posts above every player.
    static constexpr uint32_t kBallEntity = 0;

private:
    struct Contact
    {
        uint32_t a{0};
        uint32_t b{0};
        size_t ia{0}; // index into players(), or into post_positions() for posts
        size_t ib{0};
        b2Vec2 normal{1.f, 0.f}; // a -> b
        float depth{0.f};
    };

    void apply_controls(game::GameState &state, const PhysicsInputs &inputs);
    void integrate(game::GameState &state, const PhysicsInputs &inputs);
    void carry_possessed_ball(game::GameState &state);
    void check_finite(game::GameState &state, StepResult &res);
    void detect_contacts(const game::GameState &state);
    void capture_free_ball(game::GameState &state, const PhysicsInputs &inputs, StepResult &res);
    void resolve_contacts(game::GameState &state);
    void enforce_ball_bounds(game::GameState &state, StepResult &res);
    void enforce_player_bounds(game::GameState &state);
    void clamp_speeds(game::GameState &state);

    PhysicsConfig m_cfg;
    float m_dt;
    // Per-step scratch, reused across steps
    std::vector<game::PlayerState> m_prev_players;
    game::BallState m_prev_ball;
    std::vector<Contact> m_contacts;
};

} // namespace kick::phys
