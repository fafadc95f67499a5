#include "world.hpp"

#include <algorithm>

Monster* World::monsterById(int id) {
    for (auto& m : monsters) if (m.id == id) return &m;
    return nullptr;
}

const Monster* World::monsterById(int id) const {
    for (const auto& m : monsters) if (m.id == id) return &m;
    return nullptr;
}

Monster* World::monsterAt(int x, int y) {
    for (auto& m : monsters) {
        if (m.alive() && m.pos.x == x && m.pos.y == y) return &m;
    }
    return nullptr;
}

const Monster* World::monsterAt(int x, int y) const {
    for (const auto& m : monsters) {
        if (m.alive() && m.pos.x == x && m.pos.y == y) return &m;
    }
    return nullptr;
}

bool World::isOccupied(int x, int y, int ignoreId) const {
    if (player.pos.x == x && player.pos.y == y && player.id != ignoreId) return true;
    for (const auto& m : monsters) {
        if (m.id == ignoreId || !m.alive()) continue;
        if (m.pos.x == x && m.pos.y == y) return true;
    }
    return false;
}

void World::pushMsg(const std::string& text, MessageKind kind) {
    log.push(text, kind, tick);
}

bool initWorld(World& w, const Level& level, const LevelMarkers& markers, uint32_t seed, std::string* err) {
    if (w.settings.playerSpeed <= 0) {
        if (err) *err = "player speed must be > 0";
        return false;
    }
    if (!validateProfileTable(w.profiles, err)) return false;

    if (!level.isWalkable(markers.playerStart.x, markers.playerStart.y)) {
        if (err) *err = "map has no walkable player start ('@')";
        return false;
    }

    w.level = level;
    w.rng = RNG(seed);
    w.tick = 0;
    w.nextActorId = 1;
    w.monsters.clear();
    w.log.clear();
    w.stats = SchedulerStats{};

    w.player = Player{};
    w.player.id = w.nextActorId++;
    w.player.pos = markers.playerStart;
    w.player.speed = w.settings.playerSpeed;
    w.player.hp = 12;
    w.player.hpMax = 12;
    w.player.recentPositions.push_back(w.player.pos);

    for (const auto& mark : markers.monsters) {
        MonsterKind k;
        if (!monsterKindFromLetter(mark.letter, k)) {
            if (err) *err = std::string("unknown monster letter '") + mark.letter + "'";
            return false;
        }
        spawnMonster(w, k, mark.pos);
    }

    // Mean monsters start the level already hunting toward the entry point.
    for (auto& m : w.monsters) {
        if (m.state == MonsterState::Hunting) {
            m.lastKnownPlayerPos = w.player.pos;
            m.turnsWithoutSight = 0;
        }
    }

    return true;
}

int spawnMonster(World& w, MonsterKind kind, Vec2i pos) {
    const int id = w.nextActorId++;
    w.monsters.push_back(createMonster(w.profiles, kind, pos, id, w.rng));
    return id;
}

void removeDeadMonsters(World& w) {
    for (auto& m : w.monsters) {
        if (!m.alive()) invalidatePath(m);
    }
    w.monsters.erase(std::remove_if(w.monsters.begin(), w.monsters.end(),
                                    [](const Monster& m) { return !m.alive(); }),
                     w.monsters.end());
}

std::string describeMonster(const Monster& m) {
    return toUpper(monsterKindName(m.kind)) + " #" + std::to_string(m.id);
}
