// SPDX-License-Identifier: Apache-2.0
// snapshot.hpp - GameState <-> protobuf export
#pragma once
#include "match/game_state.hpp"
#include "match/match_config.hpp"

#include "match.pb.h"

namespace kick::game {

// Full snapshot of a committed state; events are the ones appended during that tick.
kick::MatchSnapshot to_snapshot(const GameState &state);
void to_proto(const MatchEvent &ev, kick::MatchEventMsg &out);
MatchEvent from_proto(const kick::MatchEventMsg &msg);
kick::ReplayHeader make_replay_header(const MatchConfig &cfg);

} // namespace kick::game
