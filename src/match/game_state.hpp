// SPDX-License-Identifier: Apache-2.0
// game_state.hpp - match snapshot: players, ball, field geometry, clock and scoreboard
#pragma once
#include <box2d/math_functions.h>

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kick::phys {
class PhysicsEngine;
}

namespace kick::game {

class SimulationLoop;

using PlayerId = uint32_t;
inline constexpr PlayerId kNoPlayer = 0; // player ids start at 1

enum class Team : uint8_t
{
    home = 0,
    away = 1
};

inline Team opponent(Team t)
{
    return t == Team::home ? Team::away : Team::home;
}

const char *team_name(Team t);

// Multi-tick activity started by a resolved action; blocks ball interaction while running.
enum class Activity : uint8_t
{
    kicking = 1,
    tackling = 2
};

struct ActionInProgress
{
    Activity kind{Activity::kicking};
    uint32_t remaining_ticks{0};
};

struct PlayerState
{
    PlayerId id{kNoPlayer};
    Team team{Team::home};
    uint32_t jersey{0};
    b2Vec2 position{0.f, 0.f};
    b2Vec2 velocity{0.f, 0.f};
    float orientation{0.f}; // radians, 0 = facing +x
    float stamina{1.f}; // [0,1]
    std::optional<ActionInProgress> action_in_progress;
    bool has_possession{false};
    // Physical profile (per player so rosters can differ)
    float radius{0.35f};
    float mass{75.f};
    float max_speed{8.f};
    float max_acceleration{6.f};
    // Kick-off spot, restored after every goal
    b2Vec2 home_position{0.f, 0.f};
    // Set while clamped against the extended bounds; one out-of-bounds event per excursion
    bool out_of_bounds{false};

    bool busy() const noexcept { return action_in_progress.has_value(); }
};

struct BallState
{
    b2Vec2 position{0.f, 0.f};
    b2Vec2 velocity{0.f, 0.f};
    float spin{0.f}; // rad/s about the vertical axis, positive = counter-clockwise
    std::optional<PlayerId> possessor;
    std::optional<PlayerId> last_touch;
    float radius{0.11f};
    float mass{0.43f};
};

// Immutable pitch geometry. Origin at the centre spot, x along the length.
// Home defends the goal at -length/2, away defends +length/2.
struct FieldState
{
    float length{105.f};
    float width{68.f};
    float goal_width{7.32f};
    float goal_depth{2.0f};
    float overrun_margin{3.0f}; // players may run this far past the lines
    float post_radius{0.06f};

    float half_length() const noexcept { return length * 0.5f; }
    float half_width() const noexcept { return width * 0.5f; }
    float half_goal_width() const noexcept { return goal_width * 0.5f; }

    bool inside_field(b2Vec2 p, float eps) const;
    bool inside_extended(b2Vec2 p, float eps) const;
    // True when a ball centred at y passes between the posts; the side nets hold it at the boundary
    bool in_goal_mouth(float y) const;
    b2Vec2 clamp_to_extended(b2Vec2 p) const;
    // Team credited with a goal when the ball lies wholly behind a goal line inside the mouth
    std::optional<Team> goal_scored(b2Vec2 ball_pos, float ball_radius) const;
    // Centre of the goal line defended by `defender`
    b2Vec2 goal_center(Team defender) const;
    // Left goal (bottom, top) then right goal (bottom, top)
    std::array<b2Vec2, 4> post_positions() const;
};

enum class EventKind : uint8_t
{
    goal = 0,
    out_of_bounds = 1,
    foul = 2,
    anomaly = 3,
    possession_change = 4,
    match_end = 5
};

const char *event_kind_name(EventKind k);

struct MatchEvent
{
    EventKind kind{EventKind::anomaly};
    uint64_t tick{0};
    float time{0.f};
    std::optional<Team> team;
    PlayerId player{kNoPlayer};
    PlayerId other_player{kNoPlayer};
    b2Vec2 position{0.f, 0.f};
    std::string detail;
};

// Append-only event history. Copies share the storage; each copy sees the prefix that existed when it
// was taken, so a snapshot carries the whole history without duplicating it. A copy that appends after
// another copy has moved on continues on private storage.
class EventLog
{
public:
    size_t size() const noexcept { return m_size; }
    bool empty() const noexcept { return m_size == 0; }
    // Events [from, size()) in emission order.
    std::vector<MatchEvent> slice(size_t from = 0) const;

private:
    friend class GameState;
    void append(MatchEvent ev);

    struct Storage
    {
        std::mutex mtx;
        std::vector<MatchEvent> events;
    };
    std::shared_ptr<Storage> m_storage;
    size_t m_size{0};
};

struct Scoreboard
{
    std::array<uint32_t, 2> goals{0, 0};
    uint64_t elapsed_ticks{0};
    EventLog events; // every event of the match so far
    size_t latest_tick_begin{0}; // index in events of the first event of the latest tick

    uint32_t goals_for(Team t) const noexcept { return goals[static_cast<size_t>(t)]; }
    std::vector<MatchEvent> latest_events() const { return events.slice(latest_tick_begin); }
};

// Value type: copying a GameState yields an independent snapshot. Only the physics engine and the
// simulation loop can mutate one; everything else (agents, exporters, tests) reads.
class GameState
{
public:
    GameState(std::shared_ptr<const FieldState> field, std::vector<PlayerState> players, BallState ball, float dt);

    const std::vector<PlayerState> &players() const noexcept { return m_players; }
    const PlayerState *find_player(PlayerId id) const;
    std::optional<size_t> index_of(PlayerId id) const;
    const BallState &ball() const noexcept { return m_ball; }
    const FieldState &field() const noexcept { return *m_field; }
    const std::shared_ptr<const FieldState> &field_ptr() const noexcept { return m_field; }
    const Scoreboard &scoreboard() const noexcept { return m_scoreboard; }
    const PlayerState *possessor() const;

    uint64_t tick() const noexcept { return m_scoreboard.elapsed_ticks; }
    float dt() const noexcept { return m_dt; }
    double elapsed_seconds() const noexcept { return static_cast<double>(m_scoreboard.elapsed_ticks) * m_dt; }

    // Structural check run at setup; throws kick::ConfigError.
    void validate(float eps) const;

private:
    friend class kick::phys::PhysicsEngine;
    friend class SimulationLoop;

    std::vector<PlayerState> &mutable_players() noexcept { return m_players; }
    PlayerState *mutable_player(PlayerId id);
    BallState &mutable_ball() noexcept { return m_ball; }
    Scoreboard &mutable_scoreboard() noexcept { return m_scoreboard; }
    // Keeps ball.possessor and every has_possession flag in agreement.
    void set_possessor(std::optional<PlayerId> id);
    void append_event(MatchEvent ev);

    std::shared_ptr<const FieldState> m_field;
    std::vector<PlayerState> m_players; // sorted by id
    BallState m_ball;
    Scoreboard m_scoreboard;
    float m_dt{1.f / 60.f};
};

} // namespace kick::game
