// SPDX-License-Identifier: Apache-2.0
// agent.hpp - decision interface for player controllers plus reference controllers
#pragma once
#include "match/action.hpp"
#include "match/game_state.hpp"

#include <functional>
#include <string>

namespace kick::ai {

// One call per controlled player per tick against an immutable snapshot. Implementations must not
// keep references into the view past the call and should return well within the tick budget.
class AIAgent
{
public:
    virtual ~AIAgent() = default;
    virtual game::Action decide(const game::GameState &view) = 0;
    virtual std::string name() const { return "agent"; }
};

// Always stands still.
class HoldAgent : public AIAgent
{
public:
    game::Action decide(const game::GameState &) override { return game::Hold{}; }
    std::string name() const override { return "hold"; }
};

// Delegates to a callback; used by tests to script exact intents.
class ScriptedAgent : public AIAgent
{
public:
    using Script = std::function<game::Action(const game::GameState &)>;

    explicit ScriptedAgent(Script script)
        : m_script(std::move(script))
    {
    }
    game::Action decide(const game::GameState &view) override;
    std::string name() const override { return "scripted"; }

private:
    Script m_script;
};

// Runs at the ball; dribbles toward the opponent goal when holding it and shoots inside range.
class ChaseBallAgent : public AIAgent
{
public:
    explicit ChaseBallAgent(game::PlayerId self, float shoot_range = 25.f, float shot_power = 0.85f)
        : m_self(self)
        , m_shoot_range(shoot_range)
        , m_shot_power(shot_power)
    {
    }
    game::Action decide(const game::GameState &view) override;
    std::string name() const override { return "chase"; }

private:
    game::PlayerId m_self;
    float m_shoot_range;
    float m_shot_power;
};

} // namespace kick::ai
