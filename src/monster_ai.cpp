#include "monster_ai.hpp"

#include "grid_utils.hpp"
#include "wake_detector.hpp"

#include <algorithm>
#include <limits>

namespace {

// Chance to take a random step while WANDERING (fliers twitch more).
constexpr int WANDER_STEP_PCT = 25;
constexpr int WANDER_STEP_PCT_ERRATIC = 65;

// How far the flee cost map is built around the player.
constexpr int FLEE_SCAN_COST = 24;

void setState(Monster& m, World& w, MonsterState next, const char* verb) {
    if (m.state == next) return;
    if (m.state == MonsterState::Hunting) invalidatePath(m);
    m.state = next;
    if (next == MonsterState::Fleeing) {
        m.calmTurns = 0;
        ++w.stats.fleeTransitions;
    }
    w.pushMsg(describeMonster(m) + " " + verb, MessageKind::Ai);
}

bool stepOpen(const Monster& m, const World& w, Vec2i to) {
    return isLegalStep(w.level, m.pos, to) && !w.isOccupied(to.x, to.y, m.id);
}

MonsterIntent moveTo(Vec2i to) {
    MonsterIntent out;
    out.kind = IntentKind::Move;
    out.target = to;
    return out;
}

// Uniformly random open neighbour, or Wait if boxed in.
MonsterIntent randomStep(const Monster& m, const World& w, RNG& rng) {
    Vec2i open[8];
    int n = 0;
    for (const auto& dv : DIRS8) {
        const Vec2i to{m.pos.x + dv[0], m.pos.y + dv[1]};
        if (stepOpen(m, w, to)) open[n++] = to;
    }
    MonsterIntent out;
    if (n > 0) out = moveTo(open[rng.range(0, n - 1)]);
    out.randomStep = true;
    return out;
}

// The straight king-move toward target. Stalls against anything in the way.
MonsterIntent greedyStep(const Monster& m, const World& w, Vec2i target) {
    const Vec2i to{m.pos.x + sign(target.x - m.pos.x), m.pos.y + sign(target.y - m.pos.y)};
    if (to == m.pos) return {};
    if (!stepOpen(m, w, to)) return {};
    return moveTo(to);
}

OccupiedFn pathBlockers(const Monster& m, const World& w) {
    if (!w.settings.monstersBlockPaths) {
        // The player still blocks; only the goal tile is exempt.
        return [&w](int x, int y) { return w.player.pos.x == x && w.player.pos.y == y; };
    }
    const int self = m.id;
    return [&w, self](int x, int y) { return w.isOccupied(x, y, self); };
}

MonsterIntent smartStep(const Monster& m, const World& w, Vec2i target) {
    const OccupiedFn occupied = pathBlockers(m, w);

    if (!pathNeedsReplan(m.path, m.pos, target, w.settings.pathGoalTolerance, w.level, occupied)) {
        MonsterIntent out = moveTo(m.path->next());
        out.followsPath = true;
        return out;
    }

    auto found = findPath(w.level, m.pos, target, occupied, w.settings.pathMaxExpansions);
    if (!found) {
        MonsterIntent out = greedyStep(m, w, target);
        out.pathFailed = true;
        out.dropPath = true;
        return out;
    }
    if (found->empty()) {
        MonsterIntent out;
        out.dropPath = true;
        return out;
    }

    MonsterPath p;
    p.waypoints = std::move(*found);
    p.cursor = 0;

    MonsterIntent out = moveTo(p.next());
    out.followsPath = true;
    out.newPath = std::move(p);
    return out;
}

// Nearest uncollected gold pile with a path to it.
bool findGoldTarget(const Monster& m, const World& w, Vec2i& out) {
    const OccupiedFn occupied = pathBlockers(m, w);
    std::vector<const GoldPile*> piles;
    for (const auto& g : w.level.gold) {
        if (g.amount > 0) piles.push_back(&g);
    }
    std::stable_sort(piles.begin(), piles.end(), [&](const GoldPile* a, const GoldPile* b) {
        return chebyshev(m.pos, a->pos) < chebyshev(m.pos, b->pos);
    });
    for (const GoldPile* g : piles) {
        if (g->pos == m.pos) continue;
        if (findPath(w.level, m.pos, g->pos, occupied, w.settings.pathMaxExpansions)) {
            out = g->pos;
            return true;
        }
    }
    return false;
}

MonsterIntent fleeStep(const Monster& m, const World& w) {
    const Level& lvl = w.level;
    const int W = lvl.width;

    auto passable = [&](int x, int y) { return lvl.isWalkable(x, y); };
    auto stepCost = [](int, int) { return 1; };
    auto diagOk = [&](int fromX, int fromY, int dx, int dy) {
        return diagonalPassable(lvl, {fromX, fromY}, dx, dy);
    };
    const int maxCost = std::max(FLEE_SCAN_COST, m.aggroRange * 2);
    const std::vector<int> costMap = dijkstraCostToTarget(lvl.width, lvl.height, w.player.pos, passable, stepCost, diagOk, maxCost);

    const int here = costMap[static_cast<size_t>(m.pos.y * W + m.pos.x)];
    if (here < 0) return {}; // out of reach already

    Vec2i best = m.pos;
    int bestD = here;
    for (const auto& dv : DIRS8) {
        const Vec2i to{m.pos.x + dv[0], m.pos.y + dv[1]};
        if (!stepOpen(m, w, to)) continue;
        const int d0 = costMap[static_cast<size_t>(to.y * W + to.x)];
        // Leaving the scanned area counts as the best escape.
        const int score = (d0 < 0) ? std::numeric_limits<int>::max() : d0;
        if (score > bestD) {
            bestD = score;
            best = to;
        }
    }
    if (best == m.pos) return {};
    return moveTo(best);
}

MonsterIntent huntIntent(const Monster& m, const World& w, RNG& rng) {
    const Player& p = w.player;

    if (isAdjacent8(m.pos, p.pos)) {
        MonsterIntent out;
        out.kind = (m.tag == BehaviorTag::Thief && !m.hasStolen) ? IntentKind::Steal : IntentKind::Attack;
        out.target = p.pos;
        return out;
    }

    if (m.tag == BehaviorTag::Stationary) return {};
    if (m.mean && !rng.chancePct(w.settings.meanChasePct)) return {};

    const Vec2i target = huntTarget(m, w);

    switch (m.tag) {
        case BehaviorTag::Smart:
        case BehaviorTag::Thief:
            return smartStep(m, w, target);
        case BehaviorTag::Simple:
            return greedyStep(m, w, target);
        case BehaviorTag::Greedy: {
            Vec2i gold;
            if (findGoldTarget(m, w, gold)) return greedyStep(m, w, gold);
            return greedyStep(m, w, target);
        }
        case BehaviorTag::Erratic:
            if (rng.chancePct(m.erraticPct)) return randomStep(m, w, rng);
            return greedyStep(m, w, target);
        case BehaviorTag::Stationary:
            return {};
    }
    return {};
}

void teleportAway(Monster& m, World& w) {
    std::vector<Vec2i> spots;
    for (int y = 0; y < w.level.height; ++y) {
        for (int x = 0; x < w.level.width; ++x) {
            if (!w.level.isWalkable(x, y)) continue;
            if (m.pos.x == x && m.pos.y == y) continue;
            if (w.isOccupied(x, y, m.id)) continue;
            spots.push_back({x, y});
        }
    }
    if (spots.empty()) return;
    m.pos = spots[static_cast<size_t>(w.rng.range(0, static_cast<int>(spots.size()) - 1))];
}

} // namespace

const char* intentKindName(IntentKind k) {
    switch (k) {
        case IntentKind::Wait: return "wait";
        case IntentKind::Move: return "move";
        case IntentKind::Attack: return "attack";
        case IntentKind::Steal: return "steal";
    }
    return "wait";
}

bool belowFleeThreshold(const Monster& m) {
    return m.hp * 100 < m.fleePct * m.hpMax;
}

bool recoveredFromFlee(const Monster& m, int hysteresisPct) {
    const int pct = std::min(100, m.fleePct + hysteresisPct);
    return m.hp * 100 >= pct * m.hpMax;
}

Vec2i huntTarget(const Monster& m, const World& w) {
    if (m.lastKnownPlayerPos.x >= 0) return m.lastKnownPlayerPos;
    return w.player.pos;
}

bool pathNeedsReplan(const std::optional<MonsterPath>& path, Vec2i from, Vec2i goal, int tolerance,
                     const Level& level, const OccupiedFn& occupied) {
    if (!path || path->exhausted()) return true;
    if (chebyshev(path->terminal(), goal) > tolerance) return true;

    const Vec2i next = path->next();
    if (!isLegalStep(level, from, next)) return true;
    if (occupied && next != goal && occupied(next.x, next.y)) return true;
    return false;
}

void updateMonsterState(Monster& m, World& w) {
    if (!m.alive()) return;

    const SimSettings& s = w.settings;
    const bool sees = checkAggro(m, w.player, w.level, w.visibility, w.player.isRunning, s.runningAggroPct);
    if (sees) {
        m.lastKnownPlayerPos = w.player.pos;
        m.turnsWithoutSight = 0;
    } else if (m.turnsWithoutSight < 9999) {
        ++m.turnsWithoutSight;
    }

    switch (m.state) {
        case MonsterState::Sleeping:
        case MonsterState::Wandering:
            if (sees) {
                ++w.stats.wakeups;
                setState(m, w, MonsterState::Hunting, "NOTICES YOU!");
            }
            break;
        case MonsterState::Hunting:
            if (!sees && m.turnsWithoutSight > s.trackTurns) {
                ++w.stats.lostTrack;
                setState(m, w, MonsterState::Wandering, "LOSES YOUR TRAIL.");
            }
            break;
        case MonsterState::Fleeing:
            if (m.tag == BehaviorTag::Thief && m.hasStolen) break;
            if (m.coward && recoveredFromFlee(m, s.fleeHysteresisPct)) {
                setState(m, w, MonsterState::Hunting, "TURNS TO FIGHT.");
                break;
            }
            m.calmTurns = sees ? 0 : m.calmTurns + 1;
            if (m.calmTurns >= s.fleeCalmTurns) {
                ++w.stats.calmDowns;
                setState(m, w, MonsterState::Wandering, "CALMS DOWN.");
            }
            break;
    }

    // Flee triggers apply to a monster that just woke up too.
    if (m.state == MonsterState::Hunting) {
        if (m.tag == BehaviorTag::Thief && m.hasStolen) {
            setState(m, w, MonsterState::Fleeing, "FLEES!");
        } else if (m.coward && belowFleeThreshold(m)) {
            setState(m, w, MonsterState::Fleeing, "FLEES IN TERROR!");
        }
    }
}

MonsterIntent getMonsterIntent(const Monster& m, const World& w, RNG& rng) {
    if (!m.alive()) return {};

    switch (m.state) {
        case MonsterState::Sleeping:
            return {};
        case MonsterState::Wandering: {
            if (m.tag == BehaviorTag::Stationary) return {};
            const int pct = (m.tag == BehaviorTag::Erratic) ? WANDER_STEP_PCT_ERRATIC : WANDER_STEP_PCT;
            if (!rng.chancePct(pct)) return {};
            MonsterIntent out = randomStep(m, w, rng);
            out.randomStep = false; // idle wander is not an erratic roll
            return out;
        }
        case MonsterState::Fleeing:
            if (m.tag == BehaviorTag::Stationary) {
                if (!isAdjacent8(m.pos, w.player.pos)) return {};
                MonsterIntent out;
                out.kind = IntentKind::Attack;
                out.target = w.player.pos;
                return out;
            }
            return fleeStep(m, w);
        case MonsterState::Hunting:
            return huntIntent(m, w, rng);
    }
    return {};
}

MonsterIntent getMonsterIntent(const Monster& m, const World& w) {
    RNG scratch = w.rng;
    return getMonsterIntent(m, w, scratch);
}

void applyMonsterIntent(Monster& m, const MonsterIntent& intent, World& w) {
    if (!m.alive()) return;

    if (intent.pathFailed) ++w.stats.pathFailures;
    if (intent.dropPath) invalidatePath(m);
    if (intent.newPath) {
        ++w.stats.replans;
        if (m.state == MonsterState::Hunting) m.path = intent.newPath;
    }

    switch (intent.kind) {
        case IntentKind::Wait:
            break;

        case IntentKind::Move: {
            const Vec2i to = intent.target;
            if (!isLegalStep(w.level, m.pos, to) || w.isOccupied(to.x, to.y, m.id)) {
                // Someone processed earlier this tick took the tile.
                if (intent.followsPath) invalidatePath(m);
                break;
            }
            m.pos = to;

            if (m.path) {
                if (!m.path->exhausted() && m.path->next() == to) ++m.path->cursor;
                else invalidatePath(m);
            }

            if (m.tag == BehaviorTag::Greedy) {
                const int amount = w.level.takeGoldAt(to.x, to.y);
                if (amount > 0) {
                    w.pushMsg(describeMonster(m) + " SCOOPS UP " + std::to_string(amount) + " GOLD.", MessageKind::Ai);
                }
            }
            break;
        }

        case IntentKind::Attack:
            ++w.stats.attacks;
            w.pushMsg(describeMonster(m) + " ATTACKS YOU.", MessageKind::Combat);
            if (w.hooks.monsterAttack) w.hooks.monsterAttack(m, w.player);
            break;

        case IntentKind::Steal: {
            const int thiefId = m.id;
            const bool stolen = w.hooks.monsterSteal ? w.hooks.monsterSteal(m, w.player) : true;
            // `m` may dangle if the hook changed the monster list.
            Monster* thief = w.monsterById(thiefId);
            if (!thief || !thief->alive()) break;
            if (!stolen) {
                w.pushMsg(describeMonster(*thief) + " FAILS TO STEAL ANYTHING.", MessageKind::Combat);
                break;
            }
            ++w.stats.steals;
            thief->hasStolen = true;
            w.pushMsg(describeMonster(*thief) + " STEALS FROM YOU AND VANISHES!", MessageKind::Combat);
            setState(*thief, w, MonsterState::Fleeing, "FLEES!");
            invalidatePath(*thief);
            teleportAway(*thief, w);
            break;
        }
    }
}

void monsterAct(Monster& m, World& w) {
    updateMonsterState(m, w);
    const MonsterIntent intent = getMonsterIntent(m, w, w.rng);
    applyMonsterIntent(m, intent, w);
}
