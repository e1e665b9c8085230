// SPDX-License-Identifier: Apache-2.0
// unit_physics.cpp
// PhysicsEngine step: rest stays rest, circle separation, non-finite recovery, ball and player bounds,
// free-ball capture ordering, kick release and rolling friction.
#include "match/physics.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace kick::game;
using kick::phys::PhysicsConfig;
using kick::phys::PhysicsEngine;
using kick::phys::PhysicsInputs;

static const float kDt = 1.f / 60.f;

static PlayerState player(PlayerId id, Team team, b2Vec2 pos, b2Vec2 vel = {0.f, 0.f})
{
    PlayerState p;
    p.id = id;
    p.team = team;
    p.position = pos;
    p.velocity = vel;
    p.home_position = pos;
    return p;
}

static BallState ball_at(b2Vec2 pos, b2Vec2 vel = {0.f, 0.f})
{
    BallState b;
    b.position = pos;
    b.velocity = vel;
    return b;
}

static GameState make_state(std::vector<PlayerState> players, BallState ball)
{
    return GameState(std::make_shared<const FieldState>(), std::move(players), std::move(ball), kDt);
}

static PhysicsInputs idle(const GameState &s)
{
    PhysicsInputs in;
    in.commands.resize(s.players().size());
    return in;
}

static size_t count_events(const GameState &s, EventKind kind)
{
    size_t n = 0;
    for (const auto &ev : s.scoreboard().latest_events())
        n += ev.kind == kind;
    return n;
}

int main()
{
    PhysicsEngine engine(PhysicsConfig{}, kDt);

    // Hold everywhere keeps a resting scene at rest
    {
        GameState s = make_state(
            {player(1, Team::home, {-10.f, 0.f}), player(2, Team::away, {10.f, 5.f})}, ball_at({0.f, 20.f}));
        GameState before = s;
        auto res = engine.step(s, idle(s));
        assert(res.contacts == 0 && res.anomalies == 0 && !res.ball_out_of_bounds);
        for (size_t i = 0; i < s.players().size(); ++i) {
            assert(s.players()[i].position.x == before.players()[i].position.x);
            assert(s.players()[i].position.y == before.players()[i].position.y);
            assert(s.players()[i].velocity.x == 0.f && s.players()[i].velocity.y == 0.f);
        }
        assert(s.ball().position.x == 0.f && s.ball().position.y == 20.f);
        assert(s.scoreboard().events.empty());
        assert(s.scoreboard().latest_events().empty());
    }

    // Overlapping players are pushed apart and stop approaching each other
    {
        GameState s = make_state(
            {player(1, Team::home, {0.f, 0.f}, {2.f, 0.f}), player(2, Team::away, {0.5f, 0.f}, {-2.f, 0.f})},
            ball_at({0.f, 20.f}));
        auto res = engine.step(s, idle(s));
        assert(res.contacts == 1);
        const auto &a = s.players()[0];
        const auto &b = s.players()[1];
        assert(b2Distance(a.position, b.position) > 0.5f);
        assert(b.velocity.x - a.velocity.x >= 0.f);
    }

    // A non-finite force is contained: previous position restored, velocity zeroed, anomaly recorded
    {
        GameState s = make_state({player(3, Team::home, {5.f, 5.f}, {1.f, 0.f})}, ball_at({0.f, 20.f}));
        PhysicsInputs in = idle(s);
        in.commands[0].force = {std::numeric_limits<float>::quiet_NaN(), 0.f};
        auto res = engine.step(s, in);
        assert(res.anomalies == 1);
        assert(s.players()[0].position.x == 5.f && s.players()[0].position.y == 5.f);
        assert(s.players()[0].velocity.x == 0.f && s.players()[0].velocity.y == 0.f);
        assert(count_events(s, EventKind::anomaly) == 1);
        assert(s.scoreboard().latest_events()[0].player == 3);
    }

    // Ball over the touch line: clamped, reflected and credited against the last toucher
    {
        BallState b = ball_at({0.f, 33.9f}, {0.f, 20.f});
        b.last_touch = 5;
        GameState s = make_state({player(5, Team::home, {-20.f, 0.f})}, b);
        auto res = engine.step(s, idle(s));
        assert(res.ball_out_of_bounds);
        assert(s.ball().position.y == 34.f);
        assert(s.ball().velocity.y < 0.f);
        assert(count_events(s, EventKind::out_of_bounds) == 1);
        const auto ev = s.scoreboard().latest_events().back();
        assert(ev.team == Team::away && ev.player == 5);
    }

    // Ball over the goal line wide of the posts is out; inside the mouth it enters the goal
    {
        GameState wide = make_state({player(1, Team::home, {0.f, 0.f})}, ball_at({52.4f, 10.f}, {20.f, 0.f}));
        assert(engine.step(wide, idle(wide)).ball_out_of_bounds);
        assert(wide.ball().position.x == 52.5f && wide.ball().velocity.x < 0.f);

        GameState mouth = make_state({player(1, Team::home, {0.f, 0.f})}, ball_at({52.4f, 0.f}, {20.f, 0.f}));
        assert(!engine.step(mouth, idle(mouth)).ball_out_of_bounds);
        assert(mouth.ball().position.x > 52.5f);
        assert(mouth.field().goal_scored(mouth.ball().position, mouth.ball().radius) == Team::home);

        // Back of the net holds it
        GameState net = make_state({player(1, Team::home, {0.f, 0.f})}, ball_at({54.4f, 0.f}, {20.f, 0.f}));
        engine.step(net, idle(net));
        assert(net.ball().position.x == 54.5f && net.ball().velocity.x < 0.f);
    }

    // A ball sliding along the side net stays in the goal: no out-of-bounds, still a goal
    {
        GameState s = make_state({player(1, Team::home, {0.f, 0.f})}, ball_at({53.5f, 3.45f}, {0.f, 6.f}));
        const float side_net = s.field().half_goal_width() - s.field().post_radius;
        bool hit_net = false;
        for (int i = 0; i < 30; ++i) {
            auto res = engine.step(s, idle(s));
            assert(!res.ball_out_of_bounds);
            assert(count_events(s, EventKind::out_of_bounds) == 0);
            const auto &b = s.ball();
            assert(std::fabs(b.position.x - 53.5f) < 1e-4f);
            assert(std::fabs(b.position.y) <= side_net);
            assert(s.field().goal_scored(b.position, b.radius) == Team::home);
            if (b.position.y == side_net) {
                hit_net = true;
                assert(b.velocity.y < 0.f);
            }
        }
        assert(hit_net);
        assert(s.scoreboard().events.empty());
    }

    // Players are clamped to the extended field and reported once per excursion
    {
        GameState s = make_state({player(4, Team::away, {55.4f, 0.f}, {8.f, 0.f})}, ball_at({0.f, 0.f}));
        PhysicsInputs push = idle(s);
        push.commands[0].force = {450.f, 0.f};
        engine.step(s, push);
        assert(s.players()[0].position.x == 55.5f);
        assert(s.players()[0].velocity.x == 0.f);
        assert(s.players()[0].out_of_bounds);
        engine.step(s, push);
        assert(count_events(s, EventKind::out_of_bounds) == 1);

        PhysicsInputs back = idle(s);
        back.commands[0].force = {-450.f, 0.f};
        engine.step(s, back);
        assert(!s.players()[0].out_of_bounds);
        PhysicsInputs hard = idle(s);
        hard.commands[0].force = {45000.f, 0.f};
        engine.step(s, hard);
        assert(s.players()[0].position.x == 55.5f);
        assert(count_events(s, EventKind::out_of_bounds) == 2);
    }

    // Free-ball capture: nearest player wins, ties go to the lowest id, busy players cannot capture
    {
        GameState tie = make_state(
            {player(7, Team::away, {-0.5f, 0.f}), player(3, Team::home, {0.5f, 0.f})}, ball_at({0.f, 0.f}));
        auto res = engine.step(tie, idle(tie));
        assert(res.captured_by == PlayerId(3));
        assert(tie.ball().possessor == PlayerId(3) && tie.ball().last_touch == PlayerId(3));
        assert(tie.find_player(3)->has_possession && !tie.find_player(7)->has_possession);

        GameState near = make_state(
            {player(2, Team::home, {0.7f, 0.f}), player(9, Team::away, {-0.6f, 0.f})}, ball_at({0.f, 0.f}));
        assert(engine.step(near, idle(near)).captured_by == PlayerId(9));

        PlayerState busy = player(2, Team::home, {0.6f, 0.f});
        busy.action_in_progress = ActionInProgress{Activity::tackling, 10};
        GameState blocked = make_state({busy}, ball_at({0.f, 0.f}));
        assert(!engine.step(blocked, idle(blocked)).captured_by);
        assert(!blocked.ball().possessor);

        // Too fast to control
        GameState fast = make_state({player(2, Team::home, {0.6f, 0.f})}, ball_at({0.f, 0.f}, {0.f, 15.f}));
        assert(!engine.step(fast, idle(fast)).captured_by);
    }

    // Kick: possession released, impulse applied, kicker starts recovering
    {
        BallState b = ball_at({0.61f, 0.f});
        b.possessor = 4;
        GameState s = make_state({player(4, Team::home, {0.f, 0.f}), player(8, Team::away, {-20.f, 0.f})}, b);
        PhysicsInputs in = idle(s);
        in.possession = kick::phys::PossessionInstruction{kick::phys::PossessionKind::release, 4, 4};
        in.ball_impulse = kick::phys::BallImpulse{{0.43f * 20.f, 0.f}, 0.f, 4};
        in.commands[0].start_activity = ActionInProgress{Activity::kicking, 12};
        auto res = engine.step(s, in);
        assert(!res.captured_by);
        assert(!s.ball().possessor && !s.find_player(4)->has_possession);
        assert(s.ball().last_touch == PlayerId(4));
        assert(s.ball().velocity.x > 19.f && s.ball().position.x > 0.61f);
        assert(s.find_player(4)->busy());
        assert(s.find_player(4)->action_in_progress->remaining_ticks == 12);
        engine.step(s, idle(s));
        assert(s.find_player(4)->action_in_progress->remaining_ticks == 11);
    }

    // A carried ball follows its holder
    {
        BallState b = ball_at({0.f, 0.f});
        b.possessor = 6;
        GameState s = make_state({player(6, Team::home, {10.f, 10.f}, {4.f, 0.f})}, b);
        engine.step(s, idle(s));
        const auto &p = s.players()[0];
        assert(s.ball().possessor == PlayerId(6));
        assert(b2Distance(s.ball().position, p.position) < p.radius + s.ball().radius + 0.2f);
        assert(s.ball().velocity.x == p.velocity.x);
    }

    // Rolling friction slows the ball to a stop without reversing it
    {
        GameState s = make_state({player(1, Team::home, {-30.f, 0.f})}, ball_at({0.f, 0.f}, {1.f, 0.f}));
        for (int i = 0; i < 200; ++i) {
            engine.step(s, idle(s));
            assert(s.ball().velocity.x >= 0.f);
        }
        assert(s.ball().velocity.x == 0.f && s.ball().velocity.y == 0.f);
        assert(s.ball().position.x > 0.f && s.ball().position.x < 1.f);
    }

    // Spin bends a free ball's path
    {
        BallState b = ball_at({0.f, 0.f}, {20.f, 0.f});
        b.spin = 10.f;
        GameState s = make_state({player(1, Team::home, {-30.f, 0.f})}, b);
        for (int i = 0; i < 30; ++i)
            engine.step(s, idle(s));
        assert(s.ball().position.y > 0.f);
        assert(std::fabs(s.ball().spin) < 10.f);
    }

    std::cout << "unit_physics OK" << std::endl;
    return 0;
}
