#include "pathfinding.hpp"

#include "grid_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <queue>
#include <tuple>

namespace {

inline bool inBounds(int w, int h, int x, int y) {
    return x >= 0 && y >= 0 && x < w && y < h;
}

inline int idxOf(int w, int x, int y) {
    return y * w + x;
}

using Node = std::pair<int, int>; // (cost, idx)

// (f, discovery sequence, idx). Lower f wins; on equal f the node pushed
// first wins.
using OpenNode = std::tuple<int, uint32_t, int>;

} // namespace

std::optional<std::vector<Vec2i>> astarPath(
    int width,
    int height,
    Vec2i start,
    Vec2i goal,
    const PassableFn& passable,
    const DiagonalOkFn& diagonalOk,
    int maxExpansions,
    int* outExpansions)
{
    if (outExpansions) *outExpansions = 0;
    if (width <= 0 || height <= 0) return std::nullopt;
    if (!inBounds(width, height, start.x, start.y)) return std::nullopt;
    if (!inBounds(width, height, goal.x, goal.y)) return std::nullopt;
    if (start == goal) return std::vector<Vec2i>{};

    const int startI = idxOf(width, start.x, start.y);
    const int goalI = idxOf(width, goal.x, goal.y);

    auto heuristic = [&](int x, int y) {
        return chebyshev({x, y}, goal);
    };

    const int INF = std::numeric_limits<int>::max() / 4;
    const size_t n = static_cast<size_t>(width * height);
    std::vector<int> gScore(n, INF);
    std::vector<int> prev(n, -1);
    std::vector<uint8_t> closed(n, uint8_t{0});

    std::priority_queue<OpenNode, std::vector<OpenNode>, std::greater<OpenNode>> open;
    uint32_t seq = 0;

    gScore[static_cast<size_t>(startI)] = 0;
    open.push({heuristic(start.x, start.y), seq++, startI});

    int expansions = 0;
    bool found = false;

    while (!open.empty()) {
        const int i = std::get<2>(open.top());
        open.pop();

        if (closed[static_cast<size_t>(i)]) continue;
        if (i == goalI) {
            found = true;
            break;
        }

        if (expansions >= maxExpansions) break;
        ++expansions;
        closed[static_cast<size_t>(i)] = 1;

        const int x = i % width;
        const int y = i / width;
        const int gHere = gScore[static_cast<size_t>(i)];

        for (const auto& dv : DIRS8) {
            const int nx = x + dv[0];
            const int ny = y + dv[1];
            if (!inBounds(width, height, nx, ny)) continue;

            const int ni = idxOf(width, nx, ny);
            if (closed[static_cast<size_t>(ni)]) continue;
            if (ni != goalI && !passable(nx, ny)) continue;

            if (dv[0] != 0 && dv[1] != 0) {
                if (diagonalOk && !diagonalOk(x, y, dv[0], dv[1])) continue;
            }

            const int ng = gHere + 1;
            if (ng < gScore[static_cast<size_t>(ni)]) {
                gScore[static_cast<size_t>(ni)] = ng;
                prev[static_cast<size_t>(ni)] = i;
                open.push({ng + heuristic(nx, ny), seq++, ni});
            }
        }
    }

    if (outExpansions) *outExpansions = expansions;
    if (!found) return std::nullopt;

    std::vector<Vec2i> path;
    int cur = goalI;
    while (cur != -1 && cur != startI) {
        path.push_back({cur % width, cur / width});
        cur = prev[static_cast<size_t>(cur)];
    }
    if (cur != startI) return std::nullopt;

    std::reverse(path.begin(), path.end());
    return path;
}

std::optional<std::vector<Vec2i>> findPath(
    const Level& level,
    Vec2i start,
    Vec2i goal,
    const OccupiedFn& occupied,
    int maxExpansions)
{
    if (!level.inBounds(goal.x, goal.y)) return std::nullopt;
    if (start != goal && !level.isWalkable(goal.x, goal.y)) return std::nullopt;

    auto passable = [&](int x, int y) -> bool {
        if (!level.isWalkable(x, y)) return false;
        if (occupied && occupied(x, y)) return false;
        return true;
    };
    auto diagOk = [&](int fromX, int fromY, int dx, int dy) -> bool {
        return diagonalPassable(level, {fromX, fromY}, dx, dy);
    };

    return astarPath(level.width, level.height, start, goal, passable, diagOk, maxExpansions);
}

std::vector<int> dijkstraCostToTarget(
    int width,
    int height,
    Vec2i target,
    const PassableFn& passable,
    const StepCostFn& stepCost,
    const DiagonalOkFn& diagonalOk,
    int maxCost)
{
    std::vector<int> dist(static_cast<size_t>(std::max(0, width) * std::max(0, height)), -1);
    if (width <= 0 || height <= 0) return dist;
    if (!inBounds(width, height, target.x, target.y)) return dist;
    if (!passable(target.x, target.y)) return dist;

    const int targetI = idxOf(width, target.x, target.y);
    dist[static_cast<size_t>(targetI)] = 0;

    std::priority_queue<Node, std::vector<Node>, std::greater<Node>> pq;
    pq.push({0, targetI});

    while (!pq.empty()) {
        const Node cur = pq.top();
        pq.pop();

        const int costHere = cur.first;
        const int i = cur.second;

        if (maxCost >= 0 && costHere > maxCost) continue;
        if (dist[static_cast<size_t>(i)] != costHere) continue;

        const int x = i % width;
        const int y = i / width;

        // Expanding outward from the target: a neighbor reaches the target
        // by stepping into (x,y) first, so charge (x,y)'s entry cost.
        const int enterCostHere = stepCost(x, y);
        if (enterCostHere <= 0) continue;

        for (const auto& dv : DIRS8) {
            const int nx = x + dv[0];
            const int ny = y + dv[1];
            if (!inBounds(width, height, nx, ny)) continue;
            if (!passable(nx, ny)) continue;

            if (dv[0] != 0 && dv[1] != 0) {
                // Reverse move: neighbor -> current, so flip the direction.
                if (diagonalOk && !diagonalOk(nx, ny, -dv[0], -dv[1])) continue;
            }

            const int ni = idxOf(width, nx, ny);
            const int ncost = costHere + enterCostHere;
            if (maxCost >= 0 && ncost > maxCost) continue;

            int& slot = dist[static_cast<size_t>(ni)];
            if (slot < 0 || ncost < slot) {
                slot = ncost;
                pq.push({ncost, ni});
            }
        }
    }

    return dist;
}
