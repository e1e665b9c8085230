// SPDX-License-Identifier: Apache-2.0
// match_config.hpp - match setup parameters, YAML loading and validation
#pragma once
#include "match/action_resolver.hpp"
#include "match/game_state.hpp"
#include "match/physics.hpp"

#include <cstdint>
#include <string>

namespace kick::game {

struct MatchConfig
{
    FieldState field;
    float duration_sec{5400.f}; // 90 minutes, no stoppage time
    float dt{1.f / 60.f};
    uint64_t seed{42};
    // Wall-clock budget for one tick of agent decisions
    uint32_t agent_budget_ms{10};
    bool parallel_decisions{true};
    // Stop the ball on the line after it goes out (no throw-in / corner modelling)
    bool dead_ball_restart{true};
    std::string log_level{"info"};
    bool log_json{false};
    // Empty disables replay recording
    std::string replay_path;
    // Roster profile used by make_kickoff_state
    float player_radius{0.35f};
    float player_mass{75.f};
    float player_max_speed{8.f};
    float player_max_acceleration{6.f};
    float ball_radius{0.11f};
    float ball_mass{0.43f};
    phys::PhysicsConfig physics;
    ResolverConfig resolver;

    uint64_t duration_ticks() const;
};

// Keys absent from the file keep their defaults. Throws kick::ConfigError on unreadable or ill-typed YAML.
MatchConfig load_match_config(const std::string &path);
MatchConfig parse_match_config(const std::string &yaml_text);

// Throws kick::ConfigError naming the first offending key.
void validate(const MatchConfig &cfg);

// Starts the async logger and applies log_level / log_json.
void apply_log_settings(const MatchConfig &cfg);

// Both teams in a 4-4-2 on their own half, ids 1..11 home and 12..22 away, ball on the centre spot.
GameState make_kickoff_state(const MatchConfig &cfg);

} // namespace kick::game
