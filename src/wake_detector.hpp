#pragma once

#include "actor.hpp"
#include "level.hpp"
#include "world.hpp"

#include <vector>

// Aggro check: the player must be within the monster's effective range
// (Manhattan; aggroRange scaled by runningAggroPct while the player runs) and
// the visibility oracle must report line of sight from the monster.
bool checkAggro(const Monster& m, const Player& player, const Level& level,
                const VisibilityFn& visibility, bool isPlayerRunning, int runningAggroPct = 150);

// Effective aggro range in whole tiles (rounded down).
int effectiveAggroRange(const Monster& m, bool isPlayerRunning, int runningAggroPct);

// Door slam: the last three entries of `history` are door -> off-door -> door.
bool detectDoorSlam(const std::vector<Vec2i>& history, Vec2i doorPos);

// Wakes every SLEEPING monster whose room is reachable from doorPos without
// crossing another shut door. Returns how many woke.
int onDoorSlam(World& w, Vec2i doorPos);

// One wandering-spawn roll. Injects at most one WANDERING monster out of the
// player's room and sight, while fewer than maxWanderers injected monsters
// are alive. Returns the new monster id, or 0 if nothing spawned.
int wanderingSpawnTick(World& w);

// Live monsters injected by wanderingSpawnTick.
int countLiveWanderers(const World& w);
