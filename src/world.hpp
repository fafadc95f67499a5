#pragma once

#include "actor.hpp"
#include "behavior_profile.hpp"
#include "level.hpp"
#include "rng.hpp"
#include "settings.hpp"
#include "sim_log.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

// Outcome resolvers owned by the combat/item systems. The core only reports
// who attacks or steals from whom.
//
// Hooks may kill, add or erase monsters. The Monster& they receive is not
// used by the core after the hook returns; it is looked up again by id.
struct SimHooks {
    std::function<void(Monster& attacker, Player& target)> monsterAttack;
    // Returns true if something was stolen. Unset means the steal succeeds.
    std::function<bool(Monster& thief, Player& target)> monsterSteal;
    // Player bumping into a monster.
    std::function<void(Player& attacker, Monster& target)> playerAttack;
};

struct SchedulerStats {
    uint64_t grantPhases = 0;
    uint64_t playerActions = 0;
    uint64_t monsterActions = 0;
    // consumeEnergy refused (energy < cost). Must stay 0.
    uint64_t invariantViolations = 0;

    uint64_t wakeups = 0;
    uint64_t fleeTransitions = 0;
    uint64_t calmDowns = 0;
    uint64_t lostTrack = 0;
    uint64_t attacks = 0;
    uint64_t steals = 0;
    uint64_t doorSlams = 0;
    uint64_t wanderSpawns = 0;
    uint64_t replans = 0;
    uint64_t pathFailures = 0;
};

// Everything one scheduling tick reads and writes. The scheduler is the only
// writer while a tick runs.
struct World {
    Level level;
    Player player;
    // Processing order within a tick is this vector's order.
    std::vector<Monster> monsters;

    RNG rng;
    uint32_t tick = 0;
    int nextActorId = 1;

    SimSettings settings;
    ProfileTable profiles = defaultProfileTable();
    VisibilityFn visibility = losVisibility();
    SimHooks hooks;

    SimLog log;
    SchedulerStats stats;

    Monster* monsterById(int id);
    const Monster* monsterById(int id) const;

    // Live monster at (x,y), or nullptr.
    Monster* monsterAt(int x, int y);
    const Monster* monsterAt(int x, int y) const;

    // True if the player or a live monster other than `ignoreId` stands at (x,y).
    bool isOccupied(int x, int y, int ignoreId = -1) const;

    void pushMsg(const std::string& text, MessageKind kind = MessageKind::Info);
};

// Sets up a world on a parsed level: player at the '@' marker, one monster per
// letter marker. Fails on a missing/blocked player start, an invalid profile
// table, or a non-positive player speed.
bool initWorld(World& w, const Level& level, const LevelMarkers& markers, uint32_t seed, std::string* err);

// Adds a monster built from its profile and returns its id.
int spawnMonster(World& w, MonsterKind kind, Vec2i pos);

// Drops dead monsters (and their cached paths) from the level.
void removeDeadMonsters(World& w);

std::string describeMonster(const Monster& m);
