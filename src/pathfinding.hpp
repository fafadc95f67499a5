#pragma once

#include "common.hpp"
#include "level.hpp"

#include <functional>
#include <optional>
#include <vector>

// Grid search helpers for 8-way movement.
//
// Conventions:
//   - passable(x,y) should return true if the tile can be entered.
//   - stepCost(x,y) is the cost to ENTER tile (x,y). Return <=0 to treat the
//     tile as blocked.
//   - diagonalOk(fromX,fromY,dx,dy) is called only for diagonal moves, where
//     (dx,dy) is one of (+/-1,+/-1). Return false to prevent corner-cutting.

using PassableFn  = std::function<bool(int x, int y)>;
using StepCostFn  = std::function<int(int x, int y)>;
using DiagonalOkFn = std::function<bool(int fromX, int fromY, int dx, int dy)>;

// Entity occupancy query. Return true if (x,y) holds something that blocks
// movement (another monster, typically).
using OccupiedFn = std::function<bool(int x, int y)>;

constexpr int DEFAULT_PATH_MAX_EXPANSIONS = 2000;

// A* over a uniform-cost 8-way grid with the Chebyshev heuristic.
//
// Returns the waypoints after `start`, ending at `goal` (empty when
// start == goal). std::nullopt when the goal is unreachable or the search
// expanded more than maxExpansions nodes.
//
// The goal tile itself is never tested with passable(); callers path toward
// an occupied tile (the player) and stop next to it.
//
// Ties on f are broken by discovery order, so equal inputs always produce the
// same path.
std::optional<std::vector<Vec2i>> astarPath(
    int width,
    int height,
    Vec2i start,
    Vec2i goal,
    const PassableFn& passable,
    const DiagonalOkFn& diagonalOk,
    int maxExpansions = DEFAULT_PATH_MAX_EXPANSIONS,
    int* outExpansions = nullptr);

// Level-aware wrapper: walls and shut doors block, corner-cutting is not
// allowed, and tiles for which `occupied` returns true are avoided.
std::optional<std::vector<Vec2i>> findPath(
    const Level& level,
    Vec2i start,
    Vec2i goal,
    const OccupiedFn& occupied = {},
    int maxExpansions = DEFAULT_PATH_MAX_EXPANSIONS);

// Builds a "cost-to-target" map, where cost[i] is the minimum cost to reach
// `target` from tile i (excluding the cost of the starting tile itself).
//
// Unreachable tiles are -1.
//
// If maxCost >= 0, the search is truncated (tiles with best cost > maxCost
// remain -1).
std::vector<int> dijkstraCostToTarget(
    int width,
    int height,
    Vec2i target,
    const PassableFn& passable,
    const StepCostFn& stepCost,
    const DiagonalOkFn& diagonalOk,
    int maxCost = -1);
