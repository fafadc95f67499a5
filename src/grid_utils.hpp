#pragma once

#include "common.hpp"
#include "level.hpp"

// Small grid helpers shared across the codebase.

inline bool diagonalPassable(const Level& lvl, const Vec2i& from, int dx, int dy) {
    // Prevent corner-cutting through two blocked orthogonal tiles.
    if (dx == 0 || dy == 0) return true;
    // Shut doors count as blocking here so you can't slip around them.
    const bool o1 = lvl.isWalkable(from.x + dx, from.y);
    const bool o2 = lvl.isWalkable(from.x, from.y + dy);
    return o1 || o2;
}

// One legal king-move step from `from` to `to` on terrain alone
// (adjacent, walkable destination, no corner-cutting).
inline bool isLegalStep(const Level& lvl, const Vec2i& from, const Vec2i& to) {
    if (!isAdjacent8(from, to)) return false;
    if (!lvl.isWalkable(to.x, to.y)) return false;
    return diagonalPassable(lvl, from, to.x - from.x, to.y - from.y);
}
