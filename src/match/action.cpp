// SPDX-License-Identifier: Apache-2.0
#include "match/action.hpp"

#include "match.pb.h"

#include <cstdio>

namespace kick::game {

namespace {

template<class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

void set_vec(kick::Vec2 *out, b2Vec2 v)
{
    out->set_x(v.x);
    out->set_y(v.y);
}

b2Vec2 get_vec(const kick::Vec2 &v)
{
    return {v.x(), v.y()};
}

} // namespace

ActionKind kind_of(const Action &a)
{
    return std::visit(
        overloaded{
            [](const MoveTo &) { return ActionKind::move_to; },
            [](const PassTo &) { return ActionKind::pass_to; },
            [](const Shoot &) { return ActionKind::shoot; },
            [](const Tackle &) { return ActionKind::tackle; },
            [](const Hold &) { return ActionKind::hold; },
        },
        a);
}

const char *action_kind_name(ActionKind k)
{
    switch (k) {
        case ActionKind::move_to:
            return "MoveTo";
        case ActionKind::pass_to:
            return "PassTo";
        case ActionKind::shoot:
            return "Shoot";
        case ActionKind::tackle:
            return "Tackle";
        case ActionKind::hold:
            return "Hold";
    }
    return "Unknown";
}

std::string to_string(const Action &a)
{
    char buf[96];
    std::visit(
        overloaded{
            [&](const MoveTo &m)
            {
                std::snprintf(
                    buf, sizeof(buf), "MoveTo(%.2f,%.2f v=%.2f)", (double)m.target.x, (double)m.target.y,
                    (double)m.desired_speed);
            },
            [&](const PassTo &p)
            { std::snprintf(buf, sizeof(buf), "PassTo(#%u p=%.2f)", p.target_player, (double)p.power); },
            [&](const Shoot &s)
            {
                std::snprintf(
                    buf, sizeof(buf), "Shoot(%.2f,%.2f p=%.2f)", (double)s.target.x, (double)s.target.y,
                    (double)s.power);
            },
            [&](const Tackle &t) { std::snprintf(buf, sizeof(buf), "Tackle(#%u)", t.target_player); },
            [&](const Hold &) { std::snprintf(buf, sizeof(buf), "Hold"); },
        },
        a);
    return buf;
}

bool is_ball_action(const Action &a)
{
    auto k = kind_of(a);
    return k == ActionKind::pass_to || k == ActionKind::shoot || k == ActionKind::tackle;
}

void to_proto(const Action &a, ActionMsg &out)
{
    out.Clear();
    std::visit(
        overloaded{
            [&](const MoveTo &m)
            {
                auto *mv = out.mutable_move_to();
                set_vec(mv->mutable_target(), m.target);
                mv->set_desired_speed(m.desired_speed);
            },
            [&](const PassTo &p)
            {
                auto *pm = out.mutable_pass_to();
                pm->set_target_player_id(p.target_player);
                pm->set_power(p.power);
            },
            [&](const Shoot &s)
            {
                auto *sm = out.mutable_shoot();
                set_vec(sm->mutable_target(), s.target);
                sm->set_power(s.power);
            },
            [&](const Tackle &t) { out.mutable_tackle()->set_target_player_id(t.target_player); },
            [&](const Hold &) { out.mutable_hold(); },
        },
        a);
}

Action from_proto(const ActionMsg &msg)
{
    switch (msg.kind_case()) {
        case ActionMsg::kMoveTo:
            return MoveTo{get_vec(msg.move_to().target()), msg.move_to().desired_speed()};
        case ActionMsg::kPassTo:
            return PassTo{msg.pass_to().target_player_id(), msg.pass_to().power()};
        case ActionMsg::kShoot:
            return Shoot{get_vec(msg.shoot().target()), msg.shoot().power()};
        case ActionMsg::kTackle:
            return Tackle{msg.tackle().target_player_id()};
        case ActionMsg::kHold:
        case ActionMsg::KIND_NOT_SET:
            break;
    }
    return Hold{};
}

} // namespace kick::game
