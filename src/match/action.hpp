// SPDX-License-Identifier: Apache-2.0
// action.hpp - agent intents. Closed set; parameters are requests, never trusted.
#pragma once
#include "match/game_state.hpp"

#include <string>
#include <variant>

namespace kick {
class ActionMsg;
}

namespace kick::game {

struct MoveTo
{
    b2Vec2 target{0.f, 0.f};
    float desired_speed{0.f};
};

struct PassTo
{
    PlayerId target_player{kNoPlayer};
    float power{0.f}; // [0,1]
};

struct Shoot
{
    b2Vec2 target{0.f, 0.f};
    float power{0.f}; // [0,1]
};

struct Tackle
{
    PlayerId target_player{kNoPlayer};
};

struct Hold
{
};

using Action = std::variant<MoveTo, PassTo, Shoot, Tackle, Hold>;

enum class ActionKind : uint8_t
{
    move_to,
    pass_to,
    shoot,
    tackle,
    hold
};

ActionKind kind_of(const Action &a);
const char *action_kind_name(ActionKind k);
// Short human readable form for logs, e.g. "Shoot(52.5,0.0 p=0.80)"
std::string to_string(const Action &a);
// True for actions that contend for the ball this tick
bool is_ball_action(const Action &a);

void to_proto(const Action &a, ActionMsg &out);
// An empty oneof decodes as Hold.
Action from_proto(const ActionMsg &msg);

} // namespace kick::game
