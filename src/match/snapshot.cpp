// SPDX-License-Identifier: Apache-2.0
#include "match/snapshot.hpp"

namespace kick::game {

// Bumped whenever MatchSnapshot field meaning changes
static constexpr uint32_t kReplayFormatVersion = 1;

static void set_vec(kick::Vec2 *out, b2Vec2 v)
{
    out->set_x(v.x);
    out->set_y(v.y);
}

static kick::TeamSide side(Team t)
{
    return t == Team::home ? kick::TEAM_HOME : kick::TEAM_AWAY;
}

void to_proto(const MatchEvent &ev, kick::MatchEventMsg &out)
{
    out.set_kind(static_cast<kick::EventKind>(ev.kind));
    out.set_tick(ev.tick);
    out.set_time(ev.time);
    out.set_team_known(ev.team.has_value());
    if (ev.team)
        out.set_team(side(*ev.team));
    out.set_player_id(ev.player);
    out.set_other_player_id(ev.other_player);
    set_vec(out.mutable_position(), ev.position);
    out.set_detail(ev.detail);
}

MatchEvent from_proto(const kick::MatchEventMsg &msg)
{
    MatchEvent ev;
    ev.kind = static_cast<EventKind>(msg.kind());
    ev.tick = msg.tick();
    ev.time = msg.time();
    if (msg.team_known())
        ev.team = msg.team() == kick::TEAM_HOME ? Team::home : Team::away;
    ev.player = msg.player_id();
    ev.other_player = msg.other_player_id();
    ev.position = {msg.position().x(), msg.position().y()};
    ev.detail = msg.detail();
    return ev;
}

kick::MatchSnapshot to_snapshot(const GameState &state)
{
    kick::MatchSnapshot snap;
    const auto &sb = state.scoreboard();
    snap.set_tick(state.tick());
    snap.set_time(static_cast<float>(state.elapsed_seconds()));
    snap.set_home_goals(sb.goals_for(Team::home));
    snap.set_away_goals(sb.goals_for(Team::away));
    for (const auto &p : state.players()) {
        auto *ps = snap.add_players();
        ps->set_id(p.id);
        ps->set_team(side(p.team));
        ps->set_jersey(p.jersey);
        set_vec(ps->mutable_position(), p.position);
        set_vec(ps->mutable_velocity(), p.velocity);
        ps->set_orientation(p.orientation);
        ps->set_stamina(p.stamina);
        ps->set_has_possession(p.has_possession);
        if (p.action_in_progress) {
            ps->set_action_in_progress(static_cast<uint32_t>(p.action_in_progress->kind));
            ps->set_action_remaining_ticks(p.action_in_progress->remaining_ticks);
        }
    }
    const auto &b = state.ball();
    auto *bs = snap.mutable_ball();
    set_vec(bs->mutable_position(), b.position);
    set_vec(bs->mutable_velocity(), b.velocity);
    bs->set_spin(b.spin);
    bs->set_possessor_id(b.possessor.value_or(kNoPlayer));
    bs->set_last_touch_id(b.last_touch.value_or(kNoPlayer));
    for (const auto &ev : sb.latest_events())
        to_proto(ev, *snap.add_events());
    return snap;
}

kick::ReplayHeader make_replay_header(const MatchConfig &cfg)
{
    kick::ReplayHeader h;
    h.set_format_version(kReplayFormatVersion);
    h.set_seed(cfg.seed);
    h.set_dt(cfg.dt);
    auto *f = h.mutable_field();
    f->set_length(cfg.field.length);
    f->set_width(cfg.field.width);
    f->set_goal_width(cfg.field.goal_width);
    f->set_goal_depth(cfg.field.goal_depth);
    f->set_overrun_margin(cfg.field.overrun_margin);
    f->set_post_radius(cfg.field.post_radius);
    return h;
}

} // namespace kick::game
