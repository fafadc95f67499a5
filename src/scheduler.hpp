#pragma once

#include "actor.hpp"
#include "world.hpp"

#include <functional>

// Player input for one action. The host (UI, replay, scripted policy) picks
// it; the scheduler only moves the player and charges the energy.
enum class PlayerActionKind : uint8_t {
    Wait = 0,
    Move,
    Run,    // a move that marks the player as running (raises aggro range)
};

struct PlayerAction {
    PlayerActionKind kind = PlayerActionKind::Wait;
    Vec2i dir{0, 0};
    int cost = ACTION_COST;
};

using PlayerPolicyFn = std::function<PlayerAction(const World& w)>;

// speed, doubled while hasted.
int energyGain(const Actor& a);

// One fairness phase: every live actor (player and all monsters) gains
// energyGain() in the same call.
void grantEnergyToAllActors(World& w);

bool canAct(const Actor& a);

// Deducts cost. Returns false and leaves the actor untouched if energy < cost.
bool consumeEnergy(Actor& a, int cost = ACTION_COST);

// Moves the player (bumping a monster attacks it, bumping a closed door opens
// it), tracks position history and triggers door slams.
void applyPlayerAction(World& w, const PlayerAction& action);

// Passive regeneration for monsters whose profile has it.
void regenerateMonsters(World& w);

struct TickReport {
    int grantPhases = 0;
    bool playerActed = false;
    int monsterActions = 0;
    int spawnedId = 0;
};

// One scheduling tick:
//   1. grant phases until the player can act
//   2. the player acts (policy may be empty: the player waits)
//   3. monsters act in list order while they have energy
//   4. regeneration, wandering-spawn roll, dead monsters removed, tick++
TickReport advanceTick(World& w, const PlayerPolicyFn& choosePlayerAction);
