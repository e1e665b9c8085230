// SPDX-License-Identifier: Apache-2.0
#include "match/match_config.hpp"

#include "common/error.hpp"
#include "common/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <array>
#include <cmath>
#include <memory>

namespace kick::game {

namespace {

// Only keys present in the node override the current value.
template<typename T>
void read(const YAML::Node &node, const char *key, T &out)
{
    if (node[key])
        out = node[key].as<T>();
}

MatchConfig from_yaml(const YAML::Node &root)
{
    MatchConfig cfg;
    read(root, "duration_sec", cfg.duration_sec);
    read(root, "dt", cfg.dt);
    read(root, "seed", cfg.seed);
    read(root, "agent_budget_ms", cfg.agent_budget_ms);
    read(root, "parallel_decisions", cfg.parallel_decisions);
    read(root, "dead_ball_restart", cfg.dead_ball_restart);
    read(root, "log_level", cfg.log_level);
    read(root, "log_json", cfg.log_json);
    read(root, "replay_path", cfg.replay_path);
    if (const YAML::Node f = root["field"]) {
        read(f, "length", cfg.field.length);
        read(f, "width", cfg.field.width);
        read(f, "goal_width", cfg.field.goal_width);
        read(f, "goal_depth", cfg.field.goal_depth);
        read(f, "overrun_margin", cfg.field.overrun_margin);
        read(f, "post_radius", cfg.field.post_radius);
    }
    if (const YAML::Node r = root["roster"]) {
        read(r, "player_radius", cfg.player_radius);
        read(r, "player_mass", cfg.player_mass);
        read(r, "player_max_speed", cfg.player_max_speed);
        read(r, "player_max_acceleration", cfg.player_max_acceleration);
        read(r, "ball_radius", cfg.ball_radius);
        read(r, "ball_mass", cfg.ball_mass);
    }
    if (const YAML::Node p = root["physics"]) {
        auto &ph = cfg.physics;
        read(p, "epsilon", ph.epsilon);
        read(p, "player_drag", ph.player_drag);
        read(p, "ball_rolling_friction", ph.ball_rolling_friction);
        read(p, "ball_air_drag", ph.ball_air_drag);
        read(p, "magnus_coefficient", ph.magnus_coefficient);
        read(p, "spin_decay", ph.spin_decay);
        read(p, "ball_max_speed", ph.ball_max_speed);
        read(p, "restitution_player_player", ph.restitution_player_player);
        read(p, "restitution_player_ball", ph.restitution_player_ball);
        read(p, "restitution_ball_post", ph.restitution_ball_post);
        read(p, "restitution_ball_boundary", ph.restitution_ball_boundary);
        read(p, "correction_slop", ph.correction_slop);
        read(p, "correction_percent", ph.correction_percent);
        read(p, "capture_radius", ph.capture_radius);
        read(p, "capture_max_speed", ph.capture_max_speed);
        read(p, "carry_offset", ph.carry_offset);
        read(p, "turn_rate", ph.turn_rate);
        read(p, "stamina_drain", ph.stamina_drain);
        read(p, "stamina_recovery", ph.stamina_recovery);
    }
    if (const YAML::Node r = root["resolver"]) {
        auto &rc = cfg.resolver;
        read(r, "steering_gain", rc.steering_gain);
        read(r, "arrival_radius", rc.arrival_radius);
        read(r, "interaction_radius", rc.interaction_radius);
        read(r, "max_pass_speed", rc.max_pass_speed);
        read(r, "max_shot_speed", rc.max_shot_speed);
        read(r, "kick_recovery_ticks", rc.kick_recovery_ticks);
        read(r, "tackle_recovery_ticks", rc.tackle_recovery_ticks);
        read(r, "tackle_range", rc.tackle_range);
        read(r, "tackle_base_success", rc.tackle_base_success);
        read(r, "tackle_distance_falloff", rc.tackle_distance_falloff);
        read(r, "foul_probability", rc.foul_probability);
        read(r, "tackle_recovery_force_factor", rc.tackle_recovery_force_factor);
        read(r, "spin_factor", rc.spin_factor);
        read(r, "min_stamina_factor", rc.min_stamina_factor);
    }
    // One tolerance for the whole tick
    cfg.resolver.epsilon = cfg.physics.epsilon;
    return cfg;
}

void require(bool ok, const char *what)
{
    if (!ok)
        throw kick::ConfigError(std::string("invalid config: ") + what);
}

bool unit(float v)
{
    return v >= 0.f && v <= 1.f;
}

} // namespace

uint64_t MatchConfig::duration_ticks() const
{
    return static_cast<uint64_t>(std::llround(static_cast<double>(duration_sec) / dt));
}

MatchConfig load_match_config(const std::string &path)
{
    try {
        return from_yaml(YAML::LoadFile(path));
    } catch (const YAML::Exception &e) {
        kick::log::error("[config] failed to load {}: {}", path, e.what());
        throw kick::ConfigError("config " + path + ": " + e.what());
    }
}

MatchConfig parse_match_config(const std::string &yaml_text)
{
    try {
        return from_yaml(YAML::Load(yaml_text));
    } catch (const YAML::Exception &e) {
        throw kick::ConfigError(std::string("config: ") + e.what());
    }
}

void validate(const MatchConfig &cfg)
{
    const auto &f = cfg.field;
    require(std::isfinite(cfg.dt) && cfg.dt > 0.f, "dt must be positive");
    require(std::isfinite(cfg.duration_sec) && cfg.duration_sec > 0.f, "duration_sec must be positive");
    require(cfg.duration_ticks() > 0, "duration_sec shorter than one tick");
    require(cfg.agent_budget_ms > 0, "agent_budget_ms must be positive");
    require(f.length > 0.f && f.width > 0.f, "field.length and field.width must be positive");
    require(f.goal_width > 0.f && f.goal_width < f.width, "field.goal_width must be in (0, width)");
    require(f.goal_depth >= 0.f, "field.goal_depth must be non-negative");
    require(f.overrun_margin >= 0.f, "field.overrun_margin must be non-negative");
    require(f.post_radius >= 0.f && f.post_radius < f.goal_width * 0.5f, "field.post_radius out of range");
    require(cfg.player_radius > 0.f && cfg.player_mass > 0.f, "roster radius and mass must be positive");
    require(cfg.player_max_speed > 0.f && cfg.player_max_acceleration > 0.f, "roster speed limits must be positive");
    require(cfg.ball_radius > 0.f && cfg.ball_mass > 0.f, "ball radius and mass must be positive");

    const auto &ph = cfg.physics;
    require(ph.epsilon > 0.f, "physics.epsilon must be positive");
    require(ph.player_drag >= 0.f && ph.ball_air_drag >= 0.f, "physics drag must be non-negative");
    require(ph.ball_rolling_friction >= 0.f && ph.spin_decay >= 0.f, "physics friction must be non-negative");
    require(ph.ball_max_speed > 0.f, "physics.ball_max_speed must be positive");
    require(
        unit(ph.restitution_player_player) && unit(ph.restitution_player_ball) && unit(ph.restitution_ball_post)
            && unit(ph.restitution_ball_boundary),
        "physics restitution must be in [0,1]");
    require(ph.correction_slop >= 0.f && unit(ph.correction_percent), "physics correction out of range");
    require(ph.capture_radius > 0.f && ph.capture_max_speed > 0.f, "physics capture limits must be positive");
    require(ph.carry_offset >= 0.f && ph.turn_rate > 0.f, "physics carry_offset/turn_rate out of range");
    require(ph.stamina_drain >= 0.f && ph.stamina_recovery >= 0.f, "physics stamina rates must be non-negative");

    const auto &rc = cfg.resolver;
    require(rc.steering_gain > 0.f && rc.arrival_radius >= 0.f, "resolver steering out of range");
    require(rc.interaction_radius > 0.f, "resolver.interaction_radius must be positive");
    require(rc.max_pass_speed > 0.f && rc.max_shot_speed > 0.f, "resolver kick speeds must be positive");
    require(rc.tackle_range > 0.f, "resolver.tackle_range must be positive");
    require(
        unit(rc.tackle_base_success) && rc.tackle_distance_falloff >= 0.f && unit(rc.foul_probability),
        "resolver tackle probabilities must be in [0,1]");
    require(unit(rc.tackle_recovery_force_factor) && unit(rc.min_stamina_factor), "resolver factors must be in [0,1]");
}

void apply_log_settings(const MatchConfig &cfg)
{
    kick::log::init();
    kick::log::set_level(cfg.log_level);
    if (cfg.log_json)
        kick::log::set_json(true);
}

GameState make_kickoff_state(const MatchConfig &cfg)
{
    auto field = std::make_shared<const FieldState>(cfg.field);
    // Home formation as fractions of (half length, half width); away is mirrored in x.
    static constexpr std::array<std::array<float, 2>, 11> k442{{
        {-0.92f, 0.f},
        {-0.65f, -0.6f},
        {-0.70f, -0.2f},
        {-0.70f, 0.2f},
        {-0.65f, 0.6f},
        {-0.38f, -0.6f},
        {-0.40f, -0.2f},
        {-0.40f, 0.2f},
        {-0.38f, 0.6f},
        {-0.12f, -0.15f},
        {-0.12f, 0.15f},
    }};
    std::vector<PlayerState> players;
    players.reserve(22);
    for (int side = 0; side < 2; ++side) {
        Team team = side == 0 ? Team::home : Team::away;
        float mirror = side == 0 ? 1.f : -1.f;
        for (size_t k = 0; k < k442.size(); ++k) {
            PlayerState p;
            p.id = static_cast<PlayerId>(side * 11 + k + 1);
            p.team = team;
            p.jersey = static_cast<uint32_t>(k + 1);
            p.position = {mirror * k442[k][0] * field->half_length(), k442[k][1] * field->half_width()};
            p.home_position = p.position;
            p.orientation = side == 0 ? 0.f : (float)M_PI;
            p.radius = cfg.player_radius;
            p.mass = cfg.player_mass;
            p.max_speed = cfg.player_max_speed;
            p.max_acceleration = cfg.player_max_acceleration;
            players.push_back(p);
        }
    }
    BallState ball;
    ball.radius = cfg.ball_radius;
    ball.mass = cfg.ball_mass;
    return GameState(std::move(field), std::move(players), ball, cfg.dt);
}

} // namespace kick::game
