#pragma once

#include "actor.hpp"
#include "pathfinding.hpp"
#include "world.hpp"

#include <optional>

enum class IntentKind : uint8_t {
    Wait = 0,
    Move,
    Attack,
    Steal,
};

const char* intentKindName(IntentKind k);

// A monster's decision for one action. Produced without touching the world;
// applyMonsterIntent() carries it out.
struct MonsterIntent {
    IntentKind kind = IntentKind::Wait;
    // Destination tile (Move) or the victim's tile (Attack/Steal).
    Vec2i target{-1, -1};

    // The erratic roll chose a random step over the directed one.
    bool randomStep = false;
    // The step is the next waypoint of the cached path.
    bool followsPath = false;

    // Path cache updates. newPath replaces the cache; dropPath clears it.
    std::optional<MonsterPath> newPath;
    bool dropPath = false;
    // A* gave up (unreachable or over the expansion cap); the step, if any,
    // is the greedy fallback.
    bool pathFailed = false;
};

// Perception and the state machine:
//   SLEEPING/WANDERING -> HUNTING   on aggro
//   HUNTING -> WANDERING            after trackTurns without sight
//   HUNTING -> FLEEING              coward below its flee threshold, or a thief
//                                   that has stolen
//   FLEEING -> HUNTING              coward recovered past threshold + hysteresis
//   FLEEING -> WANDERING            out of reach for fleeCalmTurns turns
// A thief that has stolen keeps fleeing.
void updateMonsterState(Monster& m, World& w);

// Decision query. Reads `w`, draws randomness from `rng` only.
MonsterIntent getMonsterIntent(const Monster& m, const World& w, RNG& rng);

// Same, on a copy of the world RNG; leaves the world untouched.
MonsterIntent getMonsterIntent(const Monster& m, const World& w);

void applyMonsterIntent(Monster& m, const MonsterIntent& intent, World& w);

// One full action: updateMonsterState, getMonsterIntent, applyMonsterIntent.
void monsterAct(Monster& m, World& w);

// Replan when there is no usable path, the goal drifted more than `tolerance`
// tiles (Chebyshev) from the terminal waypoint, or the next waypoint can no
// longer be stepped onto from `from`.
bool pathNeedsReplan(const std::optional<MonsterPath>& path, Vec2i from, Vec2i goal, int tolerance,
                     const Level& level, const OccupiedFn& occupied);

// hp/maxHp strictly below the monster's flee threshold.
bool belowFleeThreshold(const Monster& m);
// hp/maxHp at or above the flee threshold plus hysteresisPct.
bool recoveredFromFlee(const Monster& m, int hysteresisPct);

// Where a hunting monster is heading: its last confirmed sighting, or the
// player's tile if it has none.
Vec2i huntTarget(const Monster& m, const World& w);
