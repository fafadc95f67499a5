#pragma once

#include "scheduler.hpp"
#include "world.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Headless simulation runner: drives advanceTick with a scripted player policy
// and collects statistics and state-hash checkpoints. Used by the
// delvecore_sim tool and by the determinism tests.

enum class PlayerPolicyKind : uint8_t {
    Wait = 0,
    Wander,
    Run,
};

const char* playerPolicyName(PlayerPolicyKind k);
bool parsePlayerPolicy(const std::string& s, PlayerPolicyKind& out);

// Scripted player. Uses its own RNG stream (derived from seed) so the world
// RNG sees only the simulation's own draws.
PlayerPolicyFn makePlayerPolicy(PlayerPolicyKind kind, uint32_t seed);

struct SimRunOptions {
    uint32_t ticks = 1000;
    PlayerPolicyKind policy = PlayerPolicyKind::Wander;
    uint32_t policySeed = 1;

    // Record a state hash every N ticks (0 = final hash only).
    uint32_t hashEvery = 0;
};

struct SimMonsterSummary {
    int id = 0;
    MonsterKind kind = MonsterKind::Aquator;
    MonsterState state = MonsterState::Sleeping;
    int hp = 0;
    uint32_t actions = 0;
    bool wanderer = false;
};

struct SimRunStats {
    uint32_t ticks = 0;
    SchedulerStats scheduler;
    // Monsters alive at the end of the run, in processing order.
    std::vector<SimMonsterSummary> monsters;
    std::vector<uint64_t> hashTrail;
    uint64_t finalHash = 0;
};

// Runs opt.ticks ticks. Returns false (with *err) if the scheduler recorded an
// invariant violation.
bool runSimulation(World& w, const SimRunOptions& opt, SimRunStats* outStats = nullptr, std::string* err = nullptr);

// Small two-room level with a corridor, doors, gold and a few monsters.
const char* demoMapText();
