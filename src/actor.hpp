#pragma once

#include "behavior_profile.hpp"
#include "common.hpp"
#include "effects.hpp"
#include "rng.hpp"

#include <cstdint>
#include <optional>
#include <vector>

// Energy cost of one action. Grants never change it; haste doubles the grant.
constexpr int ACTION_COST = 100;

struct Actor {
    int id = 0;
    Vec2i pos{0, 0};

    int hp = 1;
    int hpMax = 1;

    // Turn scheduling (energy-based): each grant adds `speed`, each action
    // costs ACTION_COST.
    int speed = 10;
    int energy = 0;

    // Actions taken since creation (scheduler bookkeeping).
    uint32_t actionsTaken = 0;

    Effects effects;
};

// Narrow status query used by the scheduler.
inline bool hasStatus(const Actor& a, EffectKind k) {
    return a.effects.has(k);
}

struct Player : Actor {
    bool isRunning = false;
    int gold = 0;

    // Most recent positions, oldest first (at most PLAYER_HISTORY_LEN).
    std::vector<Vec2i> recentPositions;
};

constexpr size_t PLAYER_HISTORY_LEN = 3;

enum class MonsterState : uint8_t {
    Sleeping = 0,
    Wandering,
    Hunting,
    Fleeing,
};

const char* monsterStateName(MonsterState s);

// Cached A* route, owned by one monster. waypoints exclude the monster's own
// tile; cursor points at the next tile to step onto.
struct MonsterPath {
    std::vector<Vec2i> waypoints;
    size_t cursor = 0;

    bool exhausted() const { return cursor >= waypoints.size(); }
    size_t remaining() const { return exhausted() ? 0 : waypoints.size() - cursor; }
    Vec2i next() const { return waypoints[cursor]; }
    Vec2i terminal() const { return waypoints.back(); }
};

struct Monster : Actor {
    MonsterKind kind = MonsterKind::Aquator;

    // Copied from the profile at creation so later overrides never change a
    // live monster mid-level.
    BehaviorTag tag = BehaviorTag::Simple;
    bool coward = false;
    int aggroRange = 6;
    int fleePct = 0;
    int erraticPct = 0;
    int intelligence = 1;
    bool mean = false;
    int regenChancePct = 0;
    int regenAmount = 0;

    MonsterState state = MonsterState::Sleeping;

    // Perception: last confirmed player location and turns since.
    // "Turns" here and in calmTurns are the monster's own actions, so a slow
    // monster takes more ticks to forget or calm down than a fast one.
    Vec2i lastKnownPlayerPos{-1, -1};
    int turnsWithoutSight = 9999;

    // Consecutive turns a fleeing monster has been out of reach of the player.
    int calmTurns = 0;

    bool hasStolen = false;
    bool wanderer = false;      // injected by wanderingSpawnTick

    std::optional<MonsterPath> path;

    bool alive() const { return hp > 0; }
};

// Builds a monster from its profile: hp from hit dice, SLEEPING (HUNTING for
// mean kinds), no energy.
Monster createMonster(const ProfileTable& profiles, MonsterKind kind, Vec2i pos, int id, RNG& rng);

void invalidatePath(Monster& m);
