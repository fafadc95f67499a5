#include "actor.hpp"
#include "behavior_profile.hpp"
#include "level.hpp"
#include "monster_ai.hpp"
#include "pathfinding.hpp"
#include "profile_overrides.hpp"
#include "rng.hpp"
#include "scheduler.hpp"
#include "settings.hpp"
#include "sim_log.hpp"
#include "sim_runner.hpp"
#include "state_hash.hpp"
#include "wake_detector.hpp"
#include "world.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

// Parses `map` and sets up a world on it. Wandering spawns are off unless a
// test turns them back on.
bool setupWorld(World& w, const std::string& map, uint32_t seed = 1) {
    Level lvl;
    LevelMarkers markers;
    std::string err;
    if (!parseLevelAscii(map, lvl, &markers, &err)) {
        expect(false, "map should parse: " + err);
        return false;
    }
    if (!initWorld(w, lvl, markers, seed, &err)) {
        expect(false, "initWorld should succeed: " + err);
        return false;
    }
    w.settings.maxWanderers = 0;
    return true;
}

Level openFloor(int width, int height) {
    Level lvl(width, height);
    for (auto& t : lvl.tiles) t.type = TileType::Floor;
    return lvl;
}

void makeHunting(Monster& m, const World& w) {
    m.state = MonsterState::Hunting;
    m.mean = false;
    m.lastKnownPlayerPos = w.player.pos;
    m.turnsWithoutSight = 0;
}

// Player and one monster in two rooms with no line of sight between them.
const char* kSealedRooms = R"(
##########
#@.......#
##########
#.......A#
##########
)";

void test_rng_reproducible() {
    RNG rng(123u);
    const std::vector<uint32_t> expected = {
        31682556u,
        4018661298u,
        2101636938u,
        3842487452u,
        1628673942u,
    };

    for (size_t i = 0; i < expected.size(); ++i) {
        const uint32_t v = rng.nextU32();
        expect(v == expected[i], "RNG sequence mismatch at index " + std::to_string(i));
    }

    // Also validate range() stays within bounds.
    for (int i = 0; i < 1000; ++i) {
        int r = rng.range(-3, 7);
        expect(r >= -3 && r <= 7, "RNG range() out of bounds");
    }

    for (int i = 0; i < 200; ++i) {
        expect(!rng.chancePct(0), "chancePct(0) must never succeed");
        expect(rng.chancePct(100), "chancePct(100) must always succeed");
    }
}

void test_scheduler_equal_speed_fairness() {
    World w;
    if (!setupWorld(w, kSealedRooms)) return;

    const uint32_t ticks = 1000;
    for (uint32_t i = 0; i < ticks; ++i) advanceTick(w, {});

    expect(w.monsters.size() == 1, "sealed-room world should keep its one monster");
    if (w.monsters.empty()) return;

    const Monster& m = w.monsters[0];
    const int64_t diff = static_cast<int64_t>(w.player.actionsTaken) - static_cast<int64_t>(m.actionsTaken);
    expect(w.player.actionsTaken == ticks, "player should act once per tick");
    expect(std::llabs(diff) <= 1, "equal-speed actors should act equally often (player " +
                                   std::to_string(w.player.actionsTaken) + ", monster " +
                                   std::to_string(m.actionsTaken) + ")");
    expect(w.stats.invariantViolations == 0, "fair run should record no invariant violations");
    expect(w.stats.grantPhases == ticks * 10, "speed 10 actors need ten grant phases per tick");
}

void test_scheduler_double_speed() {
    World w;
    if (!setupWorld(w, kSealedRooms)) return;
    if (w.monsters.empty()) return;
    w.monsters[0].speed = 20;

    for (int i = 0; i < 1000; ++i) advanceTick(w, {});

    expect(w.player.actionsTaken == 1000, "speed 10 player should act 1000 times");
    expect(w.monsters[0].actionsTaken == 2000, "speed 20 monster should act exactly twice as often");

    World w2;
    if (!setupWorld(w2, kSealedRooms)) return;
    if (w2.monsters.empty()) return;
    w2.monsters[0].speed = 15;
    for (int i = 0; i < 1000; ++i) advanceTick(w2, {});
    expect(w2.monsters[0].actionsTaken == 1500, "speed 15 monster should act 1.5x as often");
}

void test_scheduler_haste_doubles_gain() {
    Actor a;
    a.speed = 10;
    expect(energyGain(a) == 10, "energy gain should equal speed");
    a.effects.hasteTurns = 3;
    expect(energyGain(a) == 20, "haste should double energy gain");

    World w;
    if (!setupWorld(w, kSealedRooms)) return;
    if (w.monsters.empty()) return;
    w.monsters[0].effects.hasteTurns = 1000;
    for (int i = 0; i < 100; ++i) advanceTick(w, {});
    expect(w.monsters[0].actionsTaken == 200, "hasted monster should act twice per tick");
}

void test_scheduler_fast_monster_spends_all_energy() {
    // Monster ten times the player's speed: ten actions per player action,
    // with nothing left over between ticks.
    World w;
    if (!setupWorld(w, kSealedRooms)) return;
    if (w.monsters.empty()) return;
    w.settings.playerSpeed = 1;
    w.player.speed = 1;
    w.monsters[0].speed = 10;

    int maxEnergy = 0;
    for (int i = 0; i < 1000; ++i) {
        advanceTick(w, {});
        maxEnergy = std::max(maxEnergy, w.monsters[0].energy);
    }

    expect(w.player.actionsTaken == 1000, "speed 1 player should act once per tick");
    expect(w.monsters[0].actionsTaken == 10000, "speed 10 monster should act ten times per player action (got " +
                                                std::to_string(w.monsters[0].actionsTaken) + ")");
    expect(maxEnergy < ACTION_COST, "monster energy should not pile up across ticks (max " +
                                    std::to_string(maxEnergy) + ")");
    expect(w.stats.invariantViolations == 0, "fast monster run should record no invariant violations");
}

void test_consume_energy_refuses_overdraw() {
    Actor a;
    a.energy = 60;
    expect(!consumeEnergy(a, ACTION_COST), "consumeEnergy should refuse when energy < cost");
    expect(a.energy == 60, "refused consumeEnergy must leave energy untouched");
    a.energy = 100;
    expect(consumeEnergy(a, ACTION_COST), "consumeEnergy should succeed at exactly the cost");
    expect(a.energy == 0, "energy should drop by the cost");
}

// Drives player/monster turns with a pluggable grant step and reports whether
// the equal-speed fairness property held.
bool fairnessHolds(const std::function<void(World&, int grantNo)>& grant) {
    World w;
    if (!setupWorld(w, kSealedRooms)) return false;
    if (w.monsters.empty()) return false;

    int grantNo = 0;
    for (int t = 0; t < 1000; ++t) {
        while (!canAct(w.player)) grant(w, grantNo++);
        if (consumeEnergy(w.player)) ++w.player.actionsTaken;
        Monster& m = w.monsters[0];
        while (canAct(m)) {
            if (!consumeEnergy(m)) break;
            ++m.actionsTaken;
        }
    }

    const int64_t diff = static_cast<int64_t>(w.player.actionsTaken) -
                         static_cast<int64_t>(w.monsters[0].actionsTaken);
    return std::llabs(diff) <= 1;
}

void test_scheduler_starvation_regression() {
    const bool fair = fairnessHolds([](World& w, int) { grantEnergyToAllActors(w); });
    expect(fair, "simultaneous grants should satisfy the fairness property");

    // Player-only grants on 9 of every 10 phases starve the monster.
    const bool starved = fairnessHolds([](World& w, int grantNo) {
        if (grantNo % 10 != 9) {
            w.player.energy += energyGain(w.player);
        } else {
            grantEnergyToAllActors(w);
        }
    });
    expect(!starved, "player-only grants must break the fairness property");
}

void test_astar_open_room_diagonal() {
    const Level lvl = openFloor(8, 8);
    const auto path = findPath(lvl, {0, 0}, {5, 5});
    expect(path.has_value(), "open-room path should exist");
    if (!path) return;

    expect(path->size() == 5, "path (0,0)->(5,5) should take 5 steps");
    for (size_t i = 0; i < path->size(); ++i) {
        const Vec2i want{static_cast<int>(i) + 1, static_cast<int>(i) + 1};
        expect((*path)[i] == want, "step " + std::to_string(i) + " should be diagonal");
    }

    const auto again = findPath(lvl, {0, 0}, {5, 5});
    expect(again.has_value() && *again == *path, "A* should be deterministic");

    const auto self = findPath(lvl, {3, 3}, {3, 3});
    expect(self.has_value() && self->empty(), "start == goal should give an empty path");
}

void test_astar_walled_off_goal() {
    Level lvl = openFloor(10, 10);
    for (const auto& dv : DIRS8) lvl.at(7 + dv[0], 7 + dv[1]).type = TileType::Wall;

    expect(!findPath(lvl, {0, 0}, {7, 7}).has_value(), "walled-off goal should have no path");

    lvl.at(7, 6).type = TileType::DoorClosed;
    expect(!findPath(lvl, {0, 0}, {7, 7}).has_value(), "a closed door should still block the path");

    lvl.at(7, 6).type = TileType::DoorOpen;
    expect(findPath(lvl, {0, 0}, {7, 7}).has_value(), "an open door should let the path through");
}

void test_astar_no_corner_cutting() {
    Level lvl = openFloor(3, 3);
    lvl.at(1, 0).type = TileType::Wall;
    lvl.at(0, 1).type = TileType::Wall;

    const auto path = findPath(lvl, {0, 0}, {1, 1});
    expect(!path.has_value(), "diagonal squeeze between two walls should be refused");
}

void test_astar_expansion_cap() {
    const Level lvl = openFloor(40, 40);
    int expansions = 0;

    auto passable = [&](int x, int y) { return lvl.isWalkable(x, y); };
    const auto capped = astarPath(lvl.width, lvl.height, {0, 0}, {39, 0}, passable, {}, 5, &expansions);
    expect(!capped.has_value(), "search over the expansion cap should give up");
    expect(expansions <= 5, "search should stop at the expansion cap");

    const auto full = astarPath(lvl.width, lvl.height, {0, 0}, {39, 0}, passable, {},
                                DEFAULT_PATH_MAX_EXPANSIONS, &expansions);
    expect(full.has_value() && full->size() == 39, "uncapped search should find the 39-step path");
}

void test_path_replan_policy() {
    const Level lvl = openFloor(10, 10);

    MonsterPath p;
    p.waypoints = {{2, 1}, {3, 1}, {4, 1}};
    const std::optional<MonsterPath> cached = p;

    expect(pathNeedsReplan(std::nullopt, {1, 1}, {4, 1}, 1, lvl, {}), "missing path should replan");
    expect(!pathNeedsReplan(cached, {1, 1}, {4, 1}, 1, lvl, {}), "fresh path should be kept");
    expect(!pathNeedsReplan(cached, {1, 1}, {5, 1}, 1, lvl, {}), "goal drift within tolerance should keep the path");
    expect(pathNeedsReplan(cached, {1, 1}, {6, 1}, 1, lvl, {}), "goal drift past tolerance should replan");

    auto blocked = [](int x, int y) { return x == 2 && y == 1; };
    expect(pathNeedsReplan(cached, {1, 1}, {4, 1}, 1, lvl, blocked), "occupied next waypoint should replan");
    expect(pathNeedsReplan(cached, {5, 5}, {4, 1}, 1, lvl, {}), "non-adjacent next waypoint should replan");
}

void test_coward_flee_threshold() {
    World w;
    if (!setupWorld(w, R"(
##########
#@.......#
##########
#.......V#
##########
)")) return;
    if (w.monsters.empty()) return;

    Monster& v = w.monsters[0];
    expect(v.coward, "vampire should be a coward");
    makeHunting(v, w);
    v.fleePct = 25;
    v.hpMax = 100;

    v.hp = 26;
    updateMonsterState(v, w);
    expect(v.state == MonsterState::Hunting, "coward at 0.26 hp should keep hunting");

    v.hp = 25;
    updateMonsterState(v, w);
    expect(v.state == MonsterState::Hunting, "coward at exactly 0.25 hp should keep hunting");

    v.hp = 24;
    updateMonsterState(v, w);
    expect(v.state == MonsterState::Fleeing, "coward below 0.25 hp should flee");
    expect(w.stats.fleeTransitions == 1, "flee transition should be counted");

    Monster brave = v;
    brave.coward = false;
    brave.state = MonsterState::Hunting;
    brave.hp = 1;
    updateMonsterState(brave, w);
    expect(brave.state == MonsterState::Hunting, "non-coward should not flee on low hp");
}

void test_flee_hysteresis_recovery() {
    World w;
    if (!setupWorld(w, R"(
##########
#@.......#
##########
#.......V#
##########
)")) return;
    if (w.monsters.empty()) return;

    Monster& v = w.monsters[0];
    v.state = MonsterState::Fleeing;
    v.fleePct = 30;
    v.hpMax = 100;
    w.settings.fleeHysteresisPct = 10;

    v.hp = 35;
    updateMonsterState(v, w);
    expect(v.state == MonsterState::Fleeing, "coward inside the hysteresis band should keep fleeing");

    v.hp = 40;
    updateMonsterState(v, w);
    expect(v.state == MonsterState::Hunting, "coward past threshold + hysteresis should resume hunting");

    v.hp = 39;
    expect(!recoveredFromFlee(v, 10), "39% hp is still inside the hysteresis band");
    v.hp = v.hpMax;
    expect(recoveredFromFlee(v, 80), "recovery point should cap at full hp");
}

void test_monster_regeneration() {
    World w;
    if (!setupWorld(w, R"(
##########
#@.......#
##########
#...T...A#
##########
)")) return;
    Monster* troll = w.monsterAt(4, 3);
    Monster* aquator = w.monsterAt(8, 3);
    if (!troll || !aquator) {
        expect(false, "regeneration map should have a troll and an aquator");
        return;
    }
    expect(troll->regenAmount == 1 && troll->regenChancePct == 25, "troll should regenerate by default");

    troll->regenChancePct = 100;
    troll->hp = 1;
    aquator->hp = 1;
    for (int i = 0; i < 3; ++i) regenerateMonsters(w);
    expect(troll->hp == 4, "troll should heal regenAmount per roll (hp " + std::to_string(troll->hp) + ")");
    expect(aquator->hp == 1, "monster without regeneration should not heal");

    troll->hp = troll->hpMax;
    regenerateMonsters(w);
    expect(troll->hp == troll->hpMax, "regeneration should never exceed hpMax");

    // A wounded coward flees, regenerates inside the tick loop, and turns to
    // fight once it is past the hysteresis margin.
    const char* vampMap = R"(
##########
#@.......#
##########
#.......V#
##########
)";
    auto runVampire = [&](int regenPct, int& outTicks) -> bool {
        World v;
        if (!setupWorld(v, vampMap)) return false;
        if (v.monsters.empty()) return false;
        Monster& vamp = v.monsters[0];
        makeHunting(vamp, v);
        vamp.state = MonsterState::Fleeing;
        vamp.hp = 1;
        vamp.regenChancePct = regenPct;
        v.settings.fleeCalmTurns = 1000;
        v.settings.trackTurns = 1000;

        for (outTicks = 0; outTicks < 200; ++outTicks) {
            advanceTick(v, {});
            const Monster& now = v.monsters[0];
            if (now.state == MonsterState::Hunting) {
                expect(now.hp * 100 >= now.hpMax * (now.fleePct + v.settings.fleeHysteresisPct),
                       "coward should only turn to fight above the hysteresis margin");
                return true;
            }
        }
        return false;
    };

    int ticks = 0;
    expect(runVampire(100, ticks), "regenerating coward should stop fleeing");
    expect(ticks > 0, "coward should not recover on the first tick");
    expect(!runVampire(0, ticks), "coward without regeneration should keep fleeing");
}

void test_flee_calms_down() {
    World w;
    if (!setupWorld(w, kSealedRooms)) return;
    if (w.monsters.empty()) return;

    Monster& m = w.monsters[0];
    m.state = MonsterState::Fleeing;
    w.settings.fleeCalmTurns = 3;

    updateMonsterState(m, w);
    updateMonsterState(m, w);
    expect(m.state == MonsterState::Fleeing, "fleeing monster should not calm down early");
    updateMonsterState(m, w);
    expect(m.state == MonsterState::Wandering, "fleeing monster out of reach should calm down");
    expect(w.stats.calmDowns == 1, "calm down should be counted");

    // The count is in the monster's own turns. At half the player's speed it
    // acts every second tick, so three calm turns take six ticks.
    World slow;
    if (!setupWorld(slow, kSealedRooms)) return;
    if (slow.monsters.empty()) return;
    Monster& z = slow.monsters[0];
    z.speed = 5;
    z.state = MonsterState::Fleeing;
    slow.settings.fleeCalmTurns = 3;

    for (int i = 0; i < 5; ++i) advanceTick(slow, {});
    expect(slow.monsters[0].state == MonsterState::Fleeing, "half-speed monster should still flee after five ticks");
    expect(slow.monsters[0].actionsTaken == 2, "half-speed monster should have acted twice in five ticks");
    advanceTick(slow, {});
    expect(slow.monsters[0].state == MonsterState::Wandering, "half-speed monster should calm down on its third turn");
}

void test_hunting_loses_track() {
    World w;
    if (!setupWorld(w, kSealedRooms)) return;
    if (w.monsters.empty()) return;

    Monster& m = w.monsters[0];
    makeHunting(m, w);
    w.settings.trackTurns = 16;

    for (int i = 0; i < 16; ++i) updateMonsterState(m, w);
    expect(m.state == MonsterState::Hunting, "monster should track the last known position for trackTurns");
    updateMonsterState(m, w);
    expect(m.state == MonsterState::Wandering, "monster should give up after trackTurns without sight");
    expect(w.stats.lostTrack == 1, "lost track should be counted");
}

void test_erratic_random_step_rate() {
    World w;
    if (!setupWorld(w, R"(
#################
#...............#
#.B.............#
#...............#
#...........@...#
#################
)")) return;
    if (w.monsters.empty()) return;

    Monster& bat = w.monsters[0];
    makeHunting(bat, w);
    expect(bat.tag == BehaviorTag::Erratic, "bat should be erratic");
    expect(bat.erraticPct == 50, "bat erratic chance should be 0.5");

    RNG rng(4242u);
    int randomMoves = 0;
    bool directedOk = true;
    const int trials = 10000;
    for (int i = 0; i < trials; ++i) {
        const MonsterIntent in = getMonsterIntent(bat, w, rng);
        if (in.randomStep) {
            ++randomMoves;
        } else if (in.kind != IntentKind::Move || in.target != Vec2i{3, 3}) {
            directedOk = false;
        }
    }

    expect(randomMoves >= 4700 && randomMoves <= 5300,
           "erratic rate should be near 50% (got " + std::to_string(randomMoves) + "/10000)");
    expect(directedOk, "non-random erratic moves should step toward the player");
}

void test_aggro_distance() {
    Level lvl;
    LevelMarkers markers;
    std::string err;
    const bool ok = parseLevelAscii(R"(
########################
#......................#
#......................#
#......................#
########################
)", lvl, &markers, &err);
    expect(ok, "aggro map should parse: " + err);
    if (!ok) return;

    Monster m;
    m.pos = {1, 2};
    m.aggroRange = 8;
    m.state = MonsterState::Sleeping;

    Player p;
    const VisibilityFn vis = losVisibility();

    p.pos = {10, 2};
    expect(!checkAggro(m, p, lvl, vis, false), "player at distance 9 should not wake aggro 8");
    p.pos = {9, 2};
    expect(checkAggro(m, p, lvl, vis, false), "player at distance 8 should wake aggro 8");
    p.pos = {5, 3};
    expect(checkAggro(m, p, lvl, vis, false), "diagonal distance 5 should wake aggro 8");

    p.pos = {10, 2};
    expect(checkAggro(m, p, lvl, vis, true, 150), "running player should be noticed further away");
    expect(effectiveAggroRange(m, true, 150) == 12, "running range should scale by 150%");

    lvl.at(3, 2).type = TileType::Wall;
    p.pos = {5, 2};
    expect(!checkAggro(m, p, lvl, vis, false), "wall should block aggro even in range");

    // A host-supplied oracle that sees nothing keeps everyone asleep.
    const VisibilityFn blind = [](const Level& l, Vec2i, int, std::vector<uint8_t>& out) {
        out.assign(static_cast<size_t>(l.width * l.height), uint8_t{0});
    };
    p.pos = {2, 2};
    expect(!checkAggro(m, p, lvl, blind, false), "visibility oracle should gate aggro");
}

void test_sleeping_monster_wakes_in_range() {
    World w;
    if (!setupWorld(w, R"(
########################
#A.......@.............#
########################
)")) return;
    if (w.monsters.empty()) return;

    Monster& m = w.monsters[0];
    m.aggroRange = 8;

    w.player.pos = {10, 1};
    updateMonsterState(m, w);
    expect(m.state == MonsterState::Sleeping, "sleeping monster should ignore a player at distance 9");

    w.player.pos = {9, 1};
    updateMonsterState(m, w);
    expect(m.state == MonsterState::Hunting, "sleeping monster should wake at distance 8");
    expect(m.lastKnownPlayerPos == Vec2i{9, 1}, "waking should record the player's position");
    expect(w.stats.wakeups == 1, "wakeup should be counted");
}

void test_mean_monsters_start_awake() {
    const ProfileTable t = defaultProfileTable();
    RNG rng(5u);
    const Monster emu = createMonster(t, MonsterKind::Emu, {1, 1}, 1, rng);
    const Monster aquator = createMonster(t, MonsterKind::Aquator, {2, 2}, 2, rng);
    expect(emu.mean && emu.state == MonsterState::Hunting, "mean kinds should be created hunting");
    expect(!aquator.mean && aquator.state == MonsterState::Sleeping, "other kinds should be created asleep");

    World w;
    if (!setupWorld(w, R"(
##############
#@..........E#
#............#
#A...........#
##############
)")) return;
    Monster* e = w.monsterAt(12, 1);
    Monster* a = w.monsterAt(1, 3);
    if (!e || !a) {
        expect(false, "mean map should have an emu and an aquator");
        return;
    }
    expect(e->state == MonsterState::Hunting, "mean monster should start the level hunting");
    expect(e->lastKnownPlayerPos == w.player.pos, "mean monster should head for the player start");
    expect(a->state == MonsterState::Sleeping, "other monsters should start the level asleep");

    w.settings.meanChasePct = 0;
    expect(getMonsterIntent(*e, w).kind == IntentKind::Wait, "mean monster with 0% chase should hold still");
    w.settings.meanChasePct = 100;
    const MonsterIntent chase = getMonsterIntent(*e, w);
    expect(chase.kind == IntentKind::Move && chase.target == Vec2i{11, 1}, "mean monster with 100% chase should close in");

    w.settings.meanChasePct = 67;
    RNG roll(99u);
    int moves = 0;
    for (int i = 0; i < 3000; ++i) {
        if (getMonsterIntent(*e, w, roll).kind == IntentKind::Move) ++moves;
    }
    expect(moves > 1850 && moves < 2170, "mean chase rate should follow mean_chase_pct (" + std::to_string(moves) + "/3000)");
}

void test_door_slam_wakes_connected_rooms() {
    std::vector<Vec2i> hist = {{3, 2}, {4, 2}, {3, 2}, {4, 2}};
    expect(detectDoorSlam(hist, {4, 2}), "door -> off -> door should be a slam");
    hist = {{2, 2}, {3, 2}, {4, 2}};
    expect(!detectDoorSlam(hist, {4, 2}), "a single door step should not be a slam");

    World w;
    if (!setupWorld(w, R"(
###########
#...#.....#
#.@.'..A..#
#...#.....#
#####+#####
#.........#
#....C....#
###########
)")) return;
    if (w.monsters.size() != 2) {
        expect(false, "door slam map should have two monsters");
        return;
    }

    const int near = w.monsters[0].id;
    const int far = w.monsters[1].id;

    PlayerAction right;
    right.kind = PlayerActionKind::Move;
    right.dir = {1, 0};
    PlayerAction left = right;
    left.dir = {-1, 0};

    applyPlayerAction(w, right);
    applyPlayerAction(w, right);
    expect(w.player.pos == Vec2i{4, 2}, "player should stand in the doorway");
    expect(w.stats.doorSlams == 0, "first step into a doorway is not a slam");

    applyPlayerAction(w, left);
    applyPlayerAction(w, right);
    expect(w.stats.doorSlams == 1, "door -> off -> door should slam");

    const Monster* a = w.monsterById(near);
    const Monster* c = w.monsterById(far);
    expect(a && a->state == MonsterState::Hunting, "monster in a room reached by the slam should wake");
    expect(a && a->lastKnownPlayerPos == Vec2i{4, 2}, "woken monster should head for the door");
    expect(c && c->state == MonsterState::Sleeping, "monster behind a closed door should sleep on");
}

void test_wandering_spawn_cap() {
    World w;
    if (!setupWorld(w, demoMapText(), 99u)) return;

    w.settings.maxWanderers = 5;
    w.settings.wanderSpawnBasePctX100 = 10000;
    w.settings.wanderSpawnCapPctX100 = 10000;

    int most = 0;
    bool spawnsHidden = true;
    for (int t = 0; t < 1000; ++t) {
        const TickReport r = advanceTick(w, {});
        const int live = countLiveWanderers(w);
        most = std::max(most, live);
        expect(live <= 5, "live wanderers should never exceed the cap");

        if (r.spawnedId != 0) {
            const Monster* m = w.monsterById(r.spawnedId);
            if (!m) continue;
            const Room* pr = w.level.roomAt(w.player.pos.x, w.player.pos.y);
            if (pr && pr->contains(m->pos.x, m->pos.y)) spawnsHidden = false;
            if (isVisibleFrom(w.visibility, w.level, w.player.pos, m->pos, w.settings.playerSightRadius)) spawnsHidden = false;
        }
    }
    expect(most == 5, "certain spawns should fill the cap");
    expect(spawnsHidden, "wanderers should appear outside the player's room and sight");
    expect(w.stats.invariantViolations == 0, "spawn run should record no invariant violations");

    // Killing a wanderer frees a slot.
    for (auto& m : w.monsters) {
        if (m.wanderer) {
            m.hp = 0;
            break;
        }
    }
    advanceTick(w, {});
    expect(countLiveWanderers(w) == 5, "dead wanderer should be replaced");

    World quiet;
    if (!setupWorld(quiet, demoMapText(), 99u)) return;
    quiet.settings.maxWanderers = 5;
    quiet.settings.wanderSpawnBasePctX100 = 0;
    quiet.settings.wanderSpawnRampPctX100 = 0;
    for (int t = 0; t < 1000; ++t) advanceTick(quiet, {});
    expect(quiet.stats.wanderSpawns == 0, "zero spawn chance should never spawn");
}

void test_thief_steals_and_flees() {
    const char* map = R"(
#########
#.......#
#..@L...#
#.......#
#.......#
#########
)";

    World w;
    if (!setupWorld(w, map)) return;
    if (w.monsters.empty()) return;

    Monster& l = w.monsters[0];
    makeHunting(l, w);

    const MonsterIntent in = getMonsterIntent(l, w);
    expect(in.kind == IntentKind::Steal, "adjacent thief should try to steal");
    expect(std::string(intentKindName(in.kind)) == "steal", "intent names should be readable");

    const Vec2i before = l.pos;
    applyMonsterIntent(l, in, w);
    expect(l.hasStolen, "successful steal should be remembered");
    expect(l.state == MonsterState::Fleeing, "thief should flee after stealing");
    expect(l.pos != before, "thief should teleport away after stealing");
    expect(w.stats.steals == 1, "steal should be counted");

    w.settings.fleeCalmTurns = 1;
    for (int i = 0; i < 10; ++i) updateMonsterState(l, w);
    expect(l.state == MonsterState::Fleeing, "thief that stole should keep fleeing");

    World w2;
    if (!setupWorld(w2, map)) return;
    if (w2.monsters.empty()) return;
    w2.hooks.monsterSteal = [](Monster&, Player&) { return false; };
    Monster& l2 = w2.monsters[0];
    makeHunting(l2, w2);
    applyMonsterIntent(l2, getMonsterIntent(l2, w2), w2);
    expect(!l2.hasStolen, "failed steal should not mark the thief");
    expect(l2.state == MonsterState::Hunting, "failed steal should leave the thief hunting");
    expect(l2.pos == Vec2i{4, 2}, "failed steal should not teleport");

    // A steal resolver that grows the monster list moves every Monster in
    // memory. The thief must still be the one marked and teleported.
    World w3;
    if (!setupWorld(w3, map)) return;
    if (w3.monsters.empty()) return;
    const int thiefId = w3.monsters[0].id;
    w3.hooks.monsterSteal = [&w3](Monster&, Player&) {
        w3.monsters.reserve(w3.monsters.capacity() + 16);
        spawnMonster(w3, MonsterKind::Zombie, {7, 4});
        return true;
    };
    makeHunting(w3.monsters[0], w3);
    applyMonsterIntent(w3.monsters[0], getMonsterIntent(w3.monsters[0], w3), w3);
    const Monster* t3 = w3.monsterById(thiefId);
    expect(t3 && t3->hasStolen, "thief should be marked after the resolver grew the monster list");
    expect(t3 && t3->state == MonsterState::Fleeing, "thief should flee after the resolver grew the monster list");
    expect(t3 && t3->pos != Vec2i{4, 2}, "thief should teleport after the resolver grew the monster list");
    expect(w3.monsters.size() == 2, "resolver's new monster should stay");

    // A resolver that removes the thief ends its action.
    World w4;
    if (!setupWorld(w4, map)) return;
    if (w4.monsters.empty()) return;
    w4.hooks.monsterSteal = [&w4](Monster&, Player&) {
        w4.monsters.clear();
        return true;
    };
    makeHunting(w4.monsters[0], w4);
    applyMonsterIntent(w4.monsters[0], getMonsterIntent(w4.monsters[0], w4), w4);
    expect(w4.monsters.empty(), "removed thief should stay removed");
    expect(w4.stats.steals == 0, "removed thief should not be credited with a steal");
}

void test_smart_monster_follows_cached_path() {
    World w;
    if (!setupWorld(w, R"(
##########
#........#
#.######.#
#C#....#@#
##########
)")) return;
    if (w.monsters.empty()) return;

    Monster& c = w.monsters[0];
    expect(c.tag == BehaviorTag::Smart, "centaur should be smart");
    makeHunting(c, w);

    monsterAct(c, w);
    expect(c.pos == Vec2i{1, 2}, "smart monster should start around the wall");
    expect(c.path.has_value(), "smart monster should cache its path");
    expect(w.stats.replans == 1, "first step should plan once");

    for (int i = 0; i < 20 && !isAdjacent8(c.pos, w.player.pos); ++i) monsterAct(c, w);
    expect(isAdjacent8(c.pos, w.player.pos), "smart monster should reach the player");
    expect(w.stats.replans == 1, "unchanged goal should not trigger a replan");
    expect(w.stats.pathFailures == 0, "reachable goal should not fail");

    int hits = 0;
    w.hooks.monsterAttack = [&hits](Monster&, Player&) { ++hits; };
    monsterAct(c, w);
    expect(hits == 1, "adjacent hunter should attack");
}

void test_smart_monster_falls_back_to_greedy() {
    World w;
    if (!setupWorld(w, R"(
##########
#C.......#
#........#
#####....#
#@..#....#
##########
)")) return;
    if (w.monsters.empty()) return;

    Monster& c = w.monsters[0];
    makeHunting(c, w);

    const MonsterIntent in = getMonsterIntent(c, w);
    expect(in.pathFailed, "unreachable goal should report a path failure");
    expect(in.kind == IntentKind::Move && in.target == Vec2i{1, 2}, "fallback should be the greedy step");

    applyMonsterIntent(c, in, w);
    expect(!c.path.has_value(), "failed search should leave no cached path");
    expect(w.stats.pathFailures == 1, "path failure should be counted");
}

void test_paths_ignore_monsters_when_configured() {
    World w;
    if (!setupWorld(w, R"(
#########
#C.O...@#
#########
)")) return;
    Monster* c = w.monsterAt(1, 1);
    if (!c) {
        expect(false, "corridor map should have a centaur");
        return;
    }
    makeHunting(*c, w);

    w.settings.monstersBlockPaths = true;
    const MonsterIntent blocked = getMonsterIntent(*c, w);
    expect(blocked.pathFailed, "a monster in the corridor should block the path by default");
    expect(!blocked.newPath, "no path should be cached when blocked");

    w.settings.monstersBlockPaths = false;
    const MonsterIntent through = getMonsterIntent(*c, w);
    expect(!through.pathFailed, "path should go through monsters when they do not block");
    expect(through.newPath && through.newPath->waypoints.size() == 6, "path through the corridor should be six steps");
    expect(through.newPath && through.newPath->terminal() == w.player.pos, "path should end at the player");
    expect(through.kind == IntentKind::Move && through.target == Vec2i{2, 1}, "first step should follow the path");
}

void test_simple_monster_stalls_on_wall() {
    World w;
    if (!setupWorld(w, R"(
#########
#A.#..@.#
#########
)")) return;
    if (w.monsters.empty()) return;

    Monster& a = w.monsters[0];
    makeHunting(a, w);
    a.pos = {2, 1};

    const MonsterIntent in = getMonsterIntent(a, w);
    expect(in.kind == IntentKind::Wait, "simple monster should stall against a wall");
}

void test_greedy_monster_collects_gold() {
    World w;
    if (!setupWorld(w, R"(
########
#O..$..#
#......#
#.....@#
########
)")) return;
    if (w.monsters.empty()) return;

    Monster& o = w.monsters[0];
    expect(o.tag == BehaviorTag::Greedy, "orc should be greedy");
    makeHunting(o, w);

    for (int i = 0; i < 3; ++i) monsterAct(o, w);
    expect(o.pos == Vec2i{4, 1}, "greedy monster should head for the gold");
    expect(w.level.gold.empty(), "greedy monster should pick the gold up");
    expect(w.player.gold == 0, "player gold should be untouched");
}

void test_fleeing_moves_away() {
    World w;
    if (!setupWorld(w, R"(
###########
#.........#
#..@.A....#
#.........#
###########
)")) return;
    if (w.monsters.empty()) return;

    Monster& a = w.monsters[0];
    a.state = MonsterState::Fleeing;
    const MonsterIntent in = getMonsterIntent(a, w);
    expect(in.kind == IntentKind::Move, "fleeing monster should move");
    expect(chebyshev(in.target, w.player.pos) > chebyshev(a.pos, w.player.pos),
           "fleeing monster should increase its distance");

    World w2;
    if (!setupWorld(w2, R"(
###########
#.........#
#..@F.....#
#.........#
###########
)")) return;
    if (w2.monsters.empty()) return;

    Monster& f = w2.monsters[0];
    f.state = MonsterState::Fleeing;
    expect(getMonsterIntent(f, w2).kind == IntentKind::Attack, "cornered stationary monster should attack when adjacent");
    f.pos = {6, 2};
    expect(getMonsterIntent(f, w2).kind == IntentKind::Wait, "stationary monster should not move");
}

void test_intent_query_is_pure() {
    World w;
    if (!setupWorld(w, demoMapText(), 5u)) return;

    for (auto& m : w.monsters) makeHunting(m, w);
    const uint64_t before = stateHash(w);
    for (const auto& m : w.monsters) (void)getMonsterIntent(m, w);
    expect(stateHash(w) == before, "getMonsterIntent should not change the world");
}

void test_stale_monster_is_skipped() {
    const char* map = R"(
#######
#.@H..#
#.....#
#....A#
#######
)";

    World w;
    if (!setupWorld(w, map)) return;
    if (w.monsters.size() != 2) {
        expect(false, "stale-skip map should have two monsters");
        return;
    }
    const int victim = w.monsters[1].id;
    w.hooks.monsterAttack = [&w, victim](Monster&, Player&) {
        if (Monster* v = w.monsterById(victim)) v->hp = 0;
    };

    const TickReport r = advanceTick(w, {});
    expect(r.monsterActions == 1, "monster killed mid-phase should not act");
    expect(w.monsterById(victim) == nullptr, "dead monster should be removed at end of tick");
    expect(w.stats.invariantViolations == 0, "skipping a dead monster is not a violation");

    World w2;
    if (!setupWorld(w2, map)) return;
    if (w2.monsters.size() != 2) return;
    const int gone = w2.monsters[1].id;
    w2.hooks.monsterAttack = [&w2, gone](Monster&, Player&) {
        w2.monsters.erase(std::remove_if(w2.monsters.begin(), w2.monsters.end(),
                                         [gone](const Monster& m) { return m.id == gone; }),
                          w2.monsters.end());
    };

    const TickReport r2 = advanceTick(w2, {});
    expect(r2.monsterActions == 1, "monster removed mid-phase should be skipped");
    expect(w2.monsters.size() == 1, "removed monster should stay removed");
}

void test_processing_order_race() {
    const char* map = R"(
#####
#.@.#
##.##
#A.R#
#####
)";

    auto run = [&](bool swapOrder, Vec2i& firstPos, Vec2i& secondPos) {
        World w;
        if (!setupWorld(w, map)) return false;
        if (w.monsters.size() != 2) return false;
        for (auto& m : w.monsters) makeHunting(m, w);
        if (swapOrder) std::swap(w.monsters[0], w.monsters[1]);
        advanceTick(w, {});
        firstPos = w.monsters[0].pos;
        secondPos = w.monsters[1].pos;
        return true;
    };

    Vec2i a, b;
    expect(run(false, a, b), "race world should set up");
    expect(a == Vec2i{2, 2}, "first monster in order should win the contested tile");
    expect(b == Vec2i{3, 3}, "later monster should see the tile taken and stay put");

    expect(run(true, a, b), "swapped race world should set up");
    expect(a == Vec2i{2, 2}, "swapping the order should swap the winner");
    expect(b == Vec2i{1, 3}, "swapped loser should stay put");
}

void test_state_hash_determinism() {
    auto runHash = [](uint32_t seed) -> uint64_t {
        World w;
        if (!setupWorld(w, demoMapText(), seed)) return 0;
        w.settings.maxWanderers = 5;
        const PlayerPolicyFn policy = makePlayerPolicy(PlayerPolicyKind::Wander, seed);
        for (int i = 0; i < 300; ++i) advanceTick(w, policy);
        return stateHash(w);
    };

    const uint64_t a = runHash(42u);
    const uint64_t b = runHash(42u);
    const uint64_t c = runHash(43u);
    expect(a != 0 && a == b, "same seed should give the same state hash");
    expect(a != c, "different seeds should diverge");

    expect(hex64(0x1full) == "000000000000001f", "hex64 should zero-pad to 16 digits");
    uint64_t v = 0;
    expect(parseHex64("0x1F", v) && v == 31u, "parseHex64 should accept 0x and upper case");
    expect(!parseHex64("xyz", v), "parseHex64 should reject garbage");
}

void test_sim_runner() {
    World w;
    if (!setupWorld(w, demoMapText(), 7u)) return;

    SimRunOptions opt;
    opt.ticks = 500;
    opt.policy = PlayerPolicyKind::Run;
    opt.policySeed = 7u;
    opt.hashEvery = 100;

    SimRunStats st;
    std::string err;
    const bool ok = runSimulation(w, opt, &st, &err);
    expect(ok, "demo simulation should run cleanly: " + err);
    expect(st.ticks == 500, "runner should run every tick");
    expect(st.hashTrail.size() == 5, "runner should record a hash every 100 ticks");
    expect(!st.hashTrail.empty() && st.hashTrail.back() == st.finalHash, "last checkpoint should be the final hash");
    expect(st.scheduler.playerActions == 500, "player should act once per tick");

    PlayerPolicyKind k;
    expect(parsePlayerPolicy("run", k) && k == PlayerPolicyKind::Run, "parsePlayerPolicy run");
    expect(!parsePlayerPolicy("sprint", k), "parsePlayerPolicy should reject unknown names");
}

void test_level_ascii_parse() {
    Level lvl;
    LevelMarkers mk;
    std::string err;
    const bool ok = parseLevelAscii(R"(
; comment line
depth = 2
#####
#.$@#
#+=*#
#/<>#
#####
)", lvl, &mk, &err);
    expect(ok, "level should parse: " + err);
    if (!ok) return;

    expect(lvl.width == 5 && lvl.height == 5, "level size should match the rows");
    expect(lvl.depth == 2, "depth line should set depth");
    expect(mk.playerStart == Vec2i{3, 1}, "player start marker");
    expect(lvl.at(1, 2).type == TileType::DoorClosed, "'+' is a closed door");
    expect(lvl.at(2, 2).type == TileType::DoorLocked, "'=' is a locked door");
    expect(lvl.at(3, 2).type == TileType::DoorSecret, "'*' is a secret door");
    expect(lvl.at(1, 3).type == TileType::DoorBroken, "'/' is a broken door");
    expect(lvl.at(2, 3).type == TileType::StairsUp, "'<' is stairs up");
    expect(lvl.at(3, 3).type == TileType::StairsDown, "'>' is stairs down");
    expect(lvl.gold.size() == 1 && lvl.gold[0].amount == 18, "gold pile should hold 2 + depth*8");
    expect(lvl.rooms.size() == 1 && lvl.rooms[0].w == 3 && lvl.rooms[0].h == 1, "one room from the floor region");

    expect(!lvl.isWalkable(2, 2), "locked door should block movement");
    expect(lvl.isOpaque(3, 2), "secret door should block sight");
    expect(lvl.isWalkable(1, 3), "broken door should be walkable");
    expect(lvl.hasLineOfSight(1, 1, 3, 1), "open room should have line of sight");
    expect(!lvl.hasLineOfSight(1, 1, 1, 3), "closed door should block line of sight");

    Level bad;
    expect(!parseLevelAscii("###\n#?#\n###\n", bad, nullptr, &err), "unknown glyph should fail");
    expect(!parseLevelAscii("####\n#@@#\n####\n", bad, nullptr, &err), "two player starts should fail");

    Level demo;
    LevelMarkers dm;
    expect(parseLevelAscii(demoMapText(), demo, &dm, &err), "demo map should parse");
    expect(dm.monsters.size() == 4, "demo map should hold four monsters");
    expect(demo.rooms.size() == 3, "demo map should hold three rooms");
}

void test_profile_table_defaults() {
    const ProfileTable t = defaultProfileTable();
    std::string err;
    expect(validateProfileTable(t, &err), "default profile table should validate: " + err);

    for (int i = 0; i < MONSTER_KIND_COUNT; ++i) {
        const BehaviorProfile& p = t.profiles[static_cast<size_t>(i)];
        expect(p.letter == static_cast<char>('A' + i), "profile letters should run A..Z");
        expect(static_cast<int>(p.kind) == i, "profile kind should match its slot");
    }

    MonsterKind k;
    expect(monsterKindFromId("ice_monster", k) && k == MonsterKind::IceMonster, "id ice_monster");
    expect(monsterKindFromId("Venus Flytrap", k) && k == MonsterKind::VenusFlytrap, "id Venus Flytrap");
    expect(monsterKindFromId("ur-vile", k) && k == MonsterKind::UrVile, "id ur-vile");
    expect(monsterKindFromId("n", k) && k == MonsterKind::Nymph, "id by letter");
    expect(!monsterKindFromId("balrog", k), "unknown id should fail");

    BehaviorTag tag;
    bool coward = false;
    expect(parseBehaviorTags("simple+coward", tag, coward) && tag == BehaviorTag::Simple && coward,
           "simple+coward should parse");
    expect(parseBehaviorTags("coward", tag, coward) && tag == BehaviorTag::Smart && coward,
           "lone coward should mean smart + coward");
    expect(!parseBehaviorTags("smart,erratic", tag, coward), "two movement tags should fail");
    expect(!parseBehaviorTags("sneaky", tag, coward), "unknown tag should fail");

    RNG rng(77u);
    for (int i = 0; i < 200; ++i) {
        const MonsterKind pick = pickSpawnKind(t, 1, rng);
        expect(t.of(pick).minDepth <= 1, "depth 1 spawns should be shallow kinds");
    }
}

void test_spawn_depth_window() {
    const ProfileTable t = defaultProfileTable();
    RNG rng(31u);
    bool sawDeepest = false;
    for (int i = 0; i < 2000; ++i) {
        const int d = t.of(pickSpawnKind(t, 10, rng)).minDepth;
        if (d > 10 || d < 10 - SPAWN_DEPTH_WINDOW) {
            expect(false, "depth 10 spawn outside the depth window (minDepth " + std::to_string(d) + ")");
            break;
        }
        if (d == 10) sawDeepest = true;
    }
    expect(sawDeepest, "depth 10 should be able to spawn depth 10 kinds");

    // Nothing inside the window: fall back to every kind shallow enough.
    ProfileTable shallow = t;
    for (auto& p : shallow.profiles) p.minDepth = 1;
    expect(shallow.of(pickSpawnKind(shallow, 20, rng)).minDepth == 1, "deep levels should fall back to shallow kinds");

    // Nothing shallow enough at all: the shallowest kind.
    ProfileTable deep = t;
    for (auto& p : deep.profiles) p.minDepth = 5;
    deep.of(MonsterKind::Yeti).minDepth = 4;
    expect(pickSpawnKind(deep, 2, rng) == MonsterKind::Yeti, "too-shallow depth should pick the shallowest kind");
}

void test_profile_overrides() {
    ProfileOverrides po;
    std::string warns;
    std::string err;
    const bool ok = parseProfileOverridesIni(
        "# tuning\n"
        "monster.vampire.flee_threshold = 0.25\n"
        "monster.B.erratic_chance = 40%\n"
        "monster.orc.speed = 12\n"
        "monster.troll.behavior = smart+coward\n"
        "monster.nobody.speed = 3\n"
        "garbage line\n",
        po, &warns, &err);
    expect(ok, "override file should parse: " + err);
    expect(!warns.empty(), "unknown monster and bad line should warn");
    expect(po.sourceHash != 0, "override source hash should be set");

    ProfileTable t = defaultProfileTable();
    expect(applyProfileOverrides(po, t, &err), "overrides should apply: " + err);
    expect(t.of(MonsterKind::Vampire).fleePct == 25, "flee threshold 0.25 -> 25%");
    expect(t.of(MonsterKind::Bat).erraticPct == 40, "erratic 40% -> 40");
    expect(t.of(MonsterKind::Orc).speed == 12, "orc speed override");
    expect(t.of(MonsterKind::Troll).tag == BehaviorTag::Smart && t.of(MonsterKind::Troll).coward,
           "troll behavior override");

    ProfileOverrides fatalTag;
    expect(!parseProfileOverridesIni("monster.bat.behavior = sneaky\n", fatalTag, &warns, &err),
           "unknown behavior tag should be fatal");
    expect(err.find("Line 1") != std::string::npos, "fatal error should name the line");

    ProfileOverrides fatalFrac;
    expect(!parseProfileOverridesIni("monster.bat.flee_threshold = 1.5\n", fatalFrac, &warns, &err),
           "flee threshold above 1 should be fatal");

    ProfileOverrides zeroSpeed;
    expect(parseProfileOverridesIni("monster.bat.speed = 0\n", zeroSpeed, &warns, &err), "speed 0 parses");
    ProfileTable t2 = defaultProfileTable();
    expect(!applyProfileOverrides(zeroSpeed, t2, &err), "speed 0 should be rejected on apply");
    expect(t2.of(MonsterKind::Bat).speed == 15, "rejected overrides should leave the table unchanged");
}

void test_config_errors_are_fatal() {
    World w;
    Level lvl;
    LevelMarkers mk;
    std::string err;
    expect(parseLevelAscii(kSealedRooms, lvl, &mk, &err), "sealed map should parse");

    w.settings.playerSpeed = 0;
    expect(!initWorld(w, lvl, mk, 1u, &err), "player speed 0 should be rejected");

    World w2;
    w2.profiles.of(MonsterKind::Aquator).speed = 0;
    expect(!initWorld(w2, lvl, mk, 1u, &err), "monster speed 0 should be rejected");
    expect(err.find("aquator") != std::string::npos, "error should name the profile");

    LevelMarkers noStart = mk;
    noStart.playerStart = {-1, -1};
    World w3;
    expect(!initWorld(w3, lvl, noStart, 1u, &err), "missing player start should be rejected");
}

void test_sim_settings() {
    SimSettings s;
    std::string err;
    std::string warns;
    expect(parseSimSettings("running_aggro_pct = 200\nmax_wanderers = 3\n", s, &warns, &err), "settings should parse");
    expect(s.runningAggroPct == 200 && s.maxWanderers == 3, "settings values should apply");
    expect(warns.empty(), "clean settings should produce no warnings");

    expect(parseSimSettings("running_aggro_pct = 50\n", s, &warns, &err), "clamped settings should parse");
    expect(s.runningAggroPct == 100, "running aggro should clamp to 100");

    expect(!parseSimSettings("player_speed = 0\n", s, &warns, &err), "player_speed 0 should be fatal");

    // Bad lines are skipped, reported, and never fatal.
    const std::string messy =
        "track_turns = lots\n"
        "monsters_block_paths = maybe\n"
        "wander_speed = 3\n"
        "max_wanderers\n"
        "flee_calm_turns = 7\n";
    SimSettings m;
    expect(parseSimSettings(messy, m, &warns, &err), "unparsable values should not be fatal");
    expect(m.trackTurns == SimSettings{}.trackTurns, "unparsable track_turns should keep its default");
    expect(m.monstersBlockPaths, "unparsable boolean should keep its default");
    expect(m.fleeCalmTurns == 7, "valid lines after bad ones should still apply");
    expect(warns.find("Line 1:") != std::string::npos && warns.find("track_turns") != std::string::npos,
           "bad integer should be reported with its line");
    expect(warns.find("Line 2:") != std::string::npos, "bad boolean should be reported");
    expect(warns.find("unknown key 'wander_speed'") != std::string::npos, "unknown key should be reported");
    expect(warns.find("Line 4:") != std::string::npos, "line without '=' should be reported");
    expect(warns.find("Line 5:") == std::string::npos, "valid line should not be reported");

    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "delvecore_tests";
    std::error_code ec;
    fs::create_directories(dir, ec);

    const fs::path missing = dir / "does_not_exist.ini";
    fs::remove(missing, ec);
    SimSettings d;
    d.maxWanderers = 42;
    expect(loadSimSettings(missing.string(), d, &warns, &err), "missing settings file should load defaults");
    expect(d.maxWanderers == SimSettings{}.maxWanderers, "missing file should reset to defaults");

    const fs::path written = dir / "delvecore_settings.ini";
    expect(writeDefaultSimSettings(written.string()), "default settings should be written");
    SimSettings back;
    back.trackTurns = 1;
    expect(loadSimSettings(written.string(), back, &warns, &err), "written settings should load");
    expect(warns.empty(), "written defaults should load without warnings:\n" + warns);
    expect(back.trackTurns == SimSettings{}.trackTurns, "written defaults should round-trip");
    expect(back.wanderSpawnCapPctX100 == SimSettings{}.wanderSpawnCapPctX100, "written spawn cap should round-trip");
    fs::remove(written, ec);
}

void test_sim_log_coalesces() {
    SimLog log;
    log.push("THE BAT FLUTTERS.", MessageKind::Ai, 1);
    log.push("THE BAT FLUTTERS.", MessageKind::Ai, 2);
    expect(log.messages().size() == 1, "duplicate messages should coalesce");
    expect(log.messages().back().repeat == 2, "coalesced message should count repeats");
    expect(log.messages().back().tick == 2, "coalesced message should carry the latest tick");

    log.clear();
    for (size_t i = 0; i < SimLog::MAX_MESSAGES; ++i) log.push("msg " + std::to_string(i), MessageKind::Info, 0);
    log.push("one more", MessageKind::Warning, 0);
    expect(log.messages().size() == SimLog::MAX_MESSAGES - SimLog::TRIM_COUNT + 1, "full log should trim its oldest block");
    expect(log.count(MessageKind::Warning) == 1, "count() should filter by kind");
}

} // namespace

int main() {
    std::cout << "Running DelveCore tests...\n";

    test_rng_reproducible();

    test_scheduler_equal_speed_fairness();
    test_scheduler_double_speed();
    test_scheduler_haste_doubles_gain();
    test_scheduler_fast_monster_spends_all_energy();
    test_consume_energy_refuses_overdraw();
    test_scheduler_starvation_regression();

    test_astar_open_room_diagonal();
    test_astar_walled_off_goal();
    test_astar_no_corner_cutting();
    test_astar_expansion_cap();
    test_path_replan_policy();

    test_coward_flee_threshold();
    test_flee_hysteresis_recovery();
    test_monster_regeneration();
    test_flee_calms_down();
    test_hunting_loses_track();
    test_erratic_random_step_rate();
    test_aggro_distance();
    test_sleeping_monster_wakes_in_range();
    test_mean_monsters_start_awake();
    test_door_slam_wakes_connected_rooms();
    test_wandering_spawn_cap();
    test_thief_steals_and_flees();
    test_smart_monster_follows_cached_path();
    test_smart_monster_falls_back_to_greedy();
    test_paths_ignore_monsters_when_configured();
    test_simple_monster_stalls_on_wall();
    test_greedy_monster_collects_gold();
    test_fleeing_moves_away();
    test_intent_query_is_pure();
    test_stale_monster_is_skipped();
    test_processing_order_race();

    test_state_hash_determinism();
    test_sim_runner();

    test_level_ascii_parse();
    test_profile_table_defaults();
    test_spawn_depth_window();
    test_profile_overrides();
    test_config_errors_are_fatal();
    test_sim_settings();
    test_sim_log_coalesces();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
