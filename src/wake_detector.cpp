#include "wake_detector.hpp"

#include <algorithm>
#include <sstream>

int effectiveAggroRange(const Monster& m, bool isPlayerRunning, int runningAggroPct) {
    const int pct = isPlayerRunning ? std::max(100, runningAggroPct) : 100;
    return (m.aggroRange * pct) / 100;
}

bool checkAggro(const Monster& m, const Player& player, const Level& level,
                const VisibilityFn& visibility, bool isPlayerRunning, int runningAggroPct) {
    const int pct = isPlayerRunning ? std::max(100, runningAggroPct) : 100;
    const int dist = manhattan(m.pos, player.pos);

    // dist <= aggroRange * pct / 100, without losing the fraction.
    if (dist * 100 > m.aggroRange * pct) return false;

    const int radius = (m.aggroRange * pct + 99) / 100;
    return isVisibleFrom(visibility, level, m.pos, player.pos, radius);
}

bool detectDoorSlam(const std::vector<Vec2i>& history, Vec2i doorPos) {
    if (history.size() < 3) return false;
    const size_t n = history.size();
    return history[n - 3] == doorPos && history[n - 2] != doorPos && history[n - 1] == doorPos;
}

int onDoorSlam(World& w, Vec2i doorPos) {
    const Level& lvl = w.level;
    if (!lvl.inBounds(doorPos.x, doorPos.y)) return 0;

    // Flood fill from the door. Sound passes through anything walkable and
    // stops at walls and at any other shut door.
    std::vector<uint8_t> reached(static_cast<size_t>(lvl.width * lvl.height), uint8_t{0});
    std::vector<uint8_t> roomHit(lvl.rooms.size(), uint8_t{0});
    std::vector<Vec2i> stack;
    stack.push_back(doorPos);
    reached[static_cast<size_t>(doorPos.y * lvl.width + doorPos.x)] = 1;

    while (!stack.empty()) {
        const Vec2i p = stack.back();
        stack.pop_back();

        if (const Room* r = lvl.roomAt(p.x, p.y)) {
            roomHit[static_cast<size_t>(r->id)] = 1;
        }

        for (const auto& dv : DIRS8) {
            const int nx = p.x + dv[0];
            const int ny = p.y + dv[1];
            if (!lvl.inBounds(nx, ny)) continue;
            const size_t ni = static_cast<size_t>(ny * lvl.width + nx);
            if (reached[ni]) continue;
            if (!lvl.isWalkable(nx, ny)) continue;
            reached[ni] = 1;
            stack.push_back({nx, ny});
        }
    }

    int woken = 0;
    for (auto& m : w.monsters) {
        if (!m.alive() || m.state != MonsterState::Sleeping) continue;
        const Room* r = lvl.roomAt(m.pos.x, m.pos.y);
        if (!r || !roomHit[static_cast<size_t>(r->id)]) continue;

        m.state = MonsterState::Hunting;
        m.lastKnownPlayerPos = doorPos;
        m.turnsWithoutSight = 0;
        ++woken;
        ++w.stats.wakeups;
        w.pushMsg(describeMonster(m) + " IS WOKEN BY A SLAMMING DOOR.", MessageKind::Ai);
    }

    ++w.stats.doorSlams;
    return woken;
}

int countLiveWanderers(const World& w) {
    int n = 0;
    for (const auto& m : w.monsters) {
        if (m.wanderer && m.alive()) ++n;
    }
    return n;
}

int wanderingSpawnTick(World& w) {
    const SimSettings& s = w.settings;
    if (countLiveWanderers(w) >= s.maxWanderers) return 0;

    Level& lvl = w.level;
    const uint32_t since = (w.tick >= lvl.lastWanderSpawnTick) ? (w.tick - lvl.lastWanderSpawnTick) : 0u;
    const int64_t raw = static_cast<int64_t>(s.wanderSpawnBasePctX100) +
                        static_cast<int64_t>(s.wanderSpawnRampPctX100) * static_cast<int64_t>(since);
    const int chance = static_cast<int>(std::min<int64_t>(raw, s.wanderSpawnCapPctX100));
    if (w.rng.range(0, 9999) >= chance) return 0;

    std::vector<uint8_t> seen;
    if (w.visibility) w.visibility(lvl, w.player.pos, s.playerSightRadius, seen);
    else lvl.computeVisibleMask(w.player.pos, s.playerSightRadius, seen);

    const Room* playerRoom = lvl.roomAt(w.player.pos.x, w.player.pos.y);

    std::vector<Vec2i> candidates;
    for (int y = 0; y < lvl.height; ++y) {
        for (int x = 0; x < lvl.width; ++x) {
            if (!lvl.isWalkable(x, y)) continue;
            if (lvl.isDoor(x, y)) continue;
            if (playerRoom && playerRoom->contains(x, y)) continue;
            const size_t i = static_cast<size_t>(y * lvl.width + x);
            if (i < seen.size() && seen[i]) continue;
            if (w.isOccupied(x, y)) continue;
            candidates.push_back({x, y});
        }
    }
    if (candidates.empty()) return 0;

    const Vec2i pos = candidates[static_cast<size_t>(w.rng.range(0, static_cast<int>(candidates.size()) - 1))];
    const MonsterKind kind = pickSpawnKind(w.profiles, lvl.depth, w.rng);
    const int id = spawnMonster(w, kind, pos);

    Monster* m = w.monsterById(id);
    if (m) {
        m->state = MonsterState::Wandering;
        m->wanderer = true;
    }

    lvl.lastWanderSpawnTick = w.tick;
    ++lvl.wanderersSpawned;
    ++w.stats.wanderSpawns;

    std::ostringstream ss;
    ss << "A WANDERING " << toUpper(monsterKindName(kind)) << " APPEARS AT " << pos.x << "," << pos.y << ".";
    w.pushMsg(ss.str(), MessageKind::Spawn);
    return id;
}
