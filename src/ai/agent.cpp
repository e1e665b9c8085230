// SPDX-License-Identifier: Apache-2.0
#include "ai/agent.hpp"

namespace kick::ai {

game::Action ScriptedAgent::decide(const game::GameState &view)
{
    if (!m_script)
        return game::Hold{};
    return m_script(view);
}

game::Action ChaseBallAgent::decide(const game::GameState &view)
{
    const game::PlayerState *me = view.find_player(m_self);
    if (!me)
        return game::Hold{};
    const auto &ball = view.ball();
    game::Team rival = game::opponent(me->team);
    b2Vec2 goal = view.field().goal_center(rival);
    if (me->has_possession) {
        if (b2Distance(me->position, goal) <= m_shoot_range)
            return game::Shoot{goal, m_shot_power};
        return game::MoveTo{goal, me->max_speed};
    }
    const game::PlayerState *holder = view.possessor();
    if (holder && holder->team == rival && b2Distance(me->position, ball.position) < 1.0f)
        return game::Tackle{holder->id};
    return game::MoveTo{ball.position, me->max_speed};
}

} // namespace kick::ai
