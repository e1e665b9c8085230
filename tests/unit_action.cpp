// SPDX-License-Identifier: Apache-2.0
// unit_action.cpp
// Action kinds, log formatting and the protobuf mapping (unset oneof decodes as Hold).
#include "match.pb.h"
#include "match/action.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace kick::game;

int main()
{
    assert(kind_of(Action{MoveTo{{1.f, 2.f}, 3.f}}) == ActionKind::move_to);
    assert(kind_of(Action{Hold{}}) == ActionKind::hold);
    assert(kind_of(Action{}) == ActionKind::move_to); // variant default is its first alternative
    assert(std::string(action_kind_name(ActionKind::tackle)) == "Tackle");

    assert(is_ball_action(PassTo{3, 0.5f}));
    assert(is_ball_action(Shoot{{52.5f, 0.f}, 1.f}));
    assert(is_ball_action(Tackle{4}));
    assert(!is_ball_action(MoveTo{}));
    assert(!is_ball_action(Hold{}));

    assert(to_string(Hold{}) == "Hold");
    assert(to_string(Tackle{9}) == "Tackle(#9)");
    assert(to_string(Shoot{{52.5f, 0.f}, 0.8f}) == "Shoot(52.50,0.00 p=0.80)");
    assert(to_string(PassTo{7, 0.25f}) == "PassTo(#7 p=0.25)");

    // proto mapping
    kick::ActionMsg msg;
    to_proto(MoveTo{{10.f, -4.f}, 6.f}, msg);
    assert(msg.kind_case() == kick::ActionMsg::kMoveTo);
    assert(msg.move_to().target().x() == 10.f && msg.move_to().desired_speed() == 6.f);
    Action back = from_proto(msg);
    auto *mv = std::get_if<MoveTo>(&back);
    assert(mv && mv->target.y == -4.f && mv->desired_speed == 6.f);

    to_proto(Tackle{12}, msg);
    assert(msg.kind_case() == kick::ActionMsg::kTackle && !msg.has_move_to());
    assert(std::get<Tackle>(from_proto(msg)).target_player == 12);

    // Survives the wire
    to_proto(Shoot{{-52.5f, 1.5f}, 0.9f}, msg);
    std::string bytes;
    assert(msg.SerializeToString(&bytes));
    kick::ActionMsg parsed;
    assert(parsed.ParseFromString(bytes));
    auto shot = std::get<Shoot>(from_proto(parsed));
    assert(shot.target.x == -52.5f && shot.target.y == 1.5f && shot.power == 0.9f);

    kick::ActionMsg empty;
    assert(kind_of(from_proto(empty)) == ActionKind::hold);
    to_proto(Hold{}, msg);
    assert(msg.kind_case() == kick::ActionMsg::kHold);
    assert(kind_of(from_proto(msg)) == ActionKind::hold);

    std::cout << "unit_action OK" << std::endl;
    return 0;
}
