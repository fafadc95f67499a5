#pragma once

#include <string>

// Simulation tuning file (INI-ish: key = value).
// Values out of range are clamped. Unknown keys and unparsable values are
// skipped and reported as warnings.
struct SimSettings {
    // Aggro range multiplier (percent) while the player is running.
    int runningAggroPct = 150;

    // Pathing
    // - pathGoalTolerance: how far (Chebyshev) the goal may drift from a cached
    //   path's terminal waypoint before the path is replanned.
    // - pathMaxExpansions: A* node expansion cap; hitting it means "unreachable".
    // - monstersBlockPaths: other monsters are treated as temporary walls.
    int pathGoalTolerance = 1;
    int pathMaxExpansions = 2000;
    bool monstersBlockPaths = true;

    // Fleeing
    int fleeHysteresisPct = 10; // must recover to fleePct + this to stop fleeing
    int fleeCalmTurns = 20;     // monster turns out of reach before a fleeing monster calms down

    // Turns a hunting monster keeps chasing a last-known position without sight.
    int trackTurns = 16;

    // Wandering monsters. Chances are in hundredths of a percent (50 = 0.5%).
    int wanderSpawnBasePctX100 = 50;
    int wanderSpawnRampPctX100 = 1;  // added per tick since the last spawn
    int wanderSpawnCapPctX100 = 500;
    int maxWanderers = 5;

    // Player view radius used to keep wandering spawns out of sight.
    int playerSightRadius = 9;

    // Per-tick chase probability for "mean" monsters.
    int meanChasePct = 67;

    int playerSpeed = 10;
};

// Loads settings from disk. A missing file yields defaults and returns true.
// Returns false (with *err) on a fatal value such as player_speed <= 0.
// Skipped lines are described in *outWarnings, one per line.
bool loadSimSettings(const std::string& path, SimSettings& out, std::string* outWarnings, std::string* err);

// Same, from text already in memory.
bool parseSimSettings(const std::string& text, SimSettings& out, std::string* outWarnings, std::string* err);

// Writes a commented default settings file. Returns true on success.
bool writeDefaultSimSettings(const std::string& path);
