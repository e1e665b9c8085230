// SPDX-License-Identifier: Apache-2.0
// unit_snapshot_replay.cpp
// Snapshot export of a committed state, replay recording to a framed stream and reading it back,
// including truncated and corrupt streams.
#include "common/error.hpp"
#include "common/framing.hpp"
#include "common/metrics.hpp"
#include "match/physics.hpp"
#include "match/replay.hpp"
#include "match/snapshot.hpp"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

using namespace kick::game;

static std::string read_file(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

static bool replay_error(const std::string &data)
{
    try {
        ReplayReader::from_buffer(data);
    } catch (const kick::ReplayError &) {
        return true;
    }
    return false;
}

int main()
{
    MatchConfig cfg;
    GameState state = make_kickoff_state(cfg);

    // Snapshot mirrors the state, including events of the latest step
    kick::phys::PhysicsEngine engine(cfg.physics, cfg.dt);
    kick::phys::PhysicsInputs idle;
    idle.commands.resize(state.players().size());
    auto s0 = to_snapshot(state);
    assert(s0.tick() == 0 && s0.players_size() == 22 && s0.events_size() == 0);
    assert(s0.players(0).id() == 1 && s0.players(0).team() == kick::TEAM_HOME);
    assert(s0.players(21).id() == 22 && s0.players(21).team() == kick::TEAM_AWAY);
    assert(s0.players(3).position().x() == state.players()[3].position.x);
    assert(s0.ball().possessor_id() == kNoPlayer);

    kick::phys::PhysicsInputs nan_push = idle;
    nan_push.commands[4].force = {std::nanf(""), 0.f};
    engine.step(state, nan_push);
    auto s1 = to_snapshot(state);
    assert(s1.events_size() == 1);
    assert(s1.events(0).kind() == kick::EVENT_ANOMALY && s1.events(0).player_id() == 5);
    assert(s1.events(0).team_known() && s1.events(0).team() == kick::TEAM_HOME);

    // Event mapping keeps the optional team distinct from "home"
    MatchEvent ev;
    ev.kind = EventKind::out_of_bounds;
    ev.tick = 77;
    ev.position = {10.f, 34.f};
    ev.detail = "ball over the touch line";
    kick::MatchEventMsg msg;
    to_proto(ev, msg);
    MatchEvent back = from_proto(msg);
    assert(back.kind == EventKind::out_of_bounds && back.tick == 77 && !back.team);
    assert(back.position.y == 34.f && back.detail == ev.detail);
    ev.team = Team::away;
    to_proto(ev, msg);
    assert(from_proto(msg).team == Team::away);

    // Recorder streams to disk; the reader gets the same frames back
    auto dir = std::filesystem::temp_directory_path();
    auto path = (dir / "kick_unit_snapshot_replay.replay").string();
    auto &rt = kick::metrics::runtime();
    uint64_t bytes_before = rt.replay_bytes.load();
    ReplayRecorder rec(path, make_replay_header(cfg));
    rec.record(s0);
    rec.record(s1);
    assert(rec.frames() == 2);
    rec.flush();
    assert(rec.queued_bytes() == 0);
    assert(rec.bytes_written() == std::filesystem::file_size(path));
    assert(rt.replay_bytes.load() - bytes_before == rec.bytes_written() - (4 + make_replay_header(cfg).ByteSizeLong()));
    {
        auto reader = ReplayReader::from_file(path);
        assert(reader.header().format_version() == 1);
        assert(reader.header().seed() == cfg.seed);
        assert(reader.header().field().length() == cfg.field.length);
        assert(reader.frames().size() == 2);
        assert(reader.frames()[1].events(0).detail() == s1.events(0).detail());
        assert(reader.frames()[0].players(7).position().y() == s0.players(7).position().y());
    }
    // Frames recorded after a flush land behind the earlier ones
    for (int i = 0; i < 50; ++i)
        rec.record(s0);
    rec.close();
    rec.close();
    assert(rec.frames() == 52 && rec.queued_bytes() == 0);
    std::string buf = read_file(path);
    assert(buf.size() == rec.bytes_written());
    assert(ReplayReader::from_buffer(buf).frames().size() == 52);
    bool threw = false;
    try {
        rec.record(s1);
    } catch (const kick::ReplayError &) {
        threw = true;
    }
    assert(threw);

    // Header only is a valid, empty replay
    auto empty_path = (dir / "kick_unit_snapshot_replay_empty.replay").string();
    {
        ReplayRecorder empty(empty_path, make_replay_header(cfg));
    }
    assert(ReplayReader::from_file(empty_path).frames().empty());
    std::filesystem::remove(empty_path);

    // Truncated anywhere inside a frame
    assert(replay_error(buf.substr(0, buf.size() - 1)));
    assert(replay_error(buf.substr(0, 2)));
    assert(replay_error(std::string()));
    // Corrupt length prefix
    std::string corrupt = buf;
    corrupt.append(4, '\0');
    assert(replay_error(corrupt));
    std::filesystem::remove(path);

    threw = false;
    try {
        ReplayReader::from_file("/nonexistent/dir/match.replay");
    } catch (const kick::ReplayError &) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        ReplayRecorder unwritable("/nonexistent/dir/match.replay", make_replay_header(cfg));
    } catch (const kick::ReplayError &) {
        threw = true;
    }
    assert(threw);

    std::cout << "unit_snapshot_replay OK" << std::endl;
    return 0;
}
