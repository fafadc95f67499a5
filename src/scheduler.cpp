#include "scheduler.hpp"

#include "grid_utils.hpp"
#include "monster_ai.hpp"
#include "wake_detector.hpp"

#include <algorithm>

namespace {

void reportViolation(World& w, const std::string& what) {
    ++w.stats.invariantViolations;
    w.pushMsg("SCHEDULER: " + what, MessageKind::System);
}

void recordPlayerPosition(Player& p) {
    p.recentPositions.push_back(p.pos);
    if (p.recentPositions.size() > PLAYER_HISTORY_LEN) {
        p.recentPositions.erase(p.recentPositions.begin());
    }
}

} // namespace

int energyGain(const Actor& a) {
    return hasStatus(a, EffectKind::Haste) ? a.speed * 2 : a.speed;
}

void grantEnergyToAllActors(World& w) {
    w.player.energy += energyGain(w.player);
    for (auto& m : w.monsters) {
        if (!m.alive()) continue;
        m.energy += energyGain(m);
    }
    ++w.stats.grantPhases;
}

bool canAct(const Actor& a) {
    return a.energy >= ACTION_COST;
}

bool consumeEnergy(Actor& a, int cost) {
    if (cost < 0 || a.energy < cost) return false;
    a.energy -= cost;
    return true;
}

void applyPlayerAction(World& w, const PlayerAction& action) {
    Player& p = w.player;

    if (action.kind == PlayerActionKind::Wait) {
        p.isRunning = false;
        return;
    }

    const Vec2i to{p.pos.x + clampi(action.dir.x, -1, 1), p.pos.y + clampi(action.dir.y, -1, 1)};
    if (to == p.pos) {
        p.isRunning = false;
        return;
    }

    if (Monster* m = w.monsterAt(to.x, to.y)) {
        p.isRunning = false;
        w.pushMsg("YOU ATTACK " + describeMonster(*m) + ".", MessageKind::Combat);
        if (w.hooks.playerAttack) w.hooks.playerAttack(p, *m);
        return;
    }

    if (w.level.inBounds(to.x, to.y) && w.level.at(to.x, to.y).type == TileType::DoorClosed) {
        p.isRunning = false;
        w.level.openDoor(to.x, to.y);
        return;
    }

    if (!isLegalStep(w.level, p.pos, to)) {
        p.isRunning = false;
        return;
    }

    p.pos = to;
    p.isRunning = (action.kind == PlayerActionKind::Run);
    recordPlayerPosition(p);

    const int gold = w.level.takeGoldAt(to.x, to.y);
    if (gold > 0) {
        p.gold += gold;
        w.pushMsg("YOU PICK UP " + std::to_string(gold) + " GOLD.", MessageKind::Info);
    }

    if (w.level.isDoor(to.x, to.y) && detectDoorSlam(p.recentPositions, to)) {
        w.pushMsg("THE DOOR SLAMS!", MessageKind::Info);
        onDoorSlam(w, to);
    }
}

void regenerateMonsters(World& w) {
    for (auto& m : w.monsters) {
        if (!m.alive()) continue;
        if (m.regenAmount <= 0 || m.regenChancePct <= 0) continue;
        if (m.hp >= m.hpMax) continue;
        if (w.rng.chancePct(m.regenChancePct)) {
            m.hp = std::min(m.hpMax, m.hp + m.regenAmount);
        }
    }
}

TickReport advanceTick(World& w, const PlayerPolicyFn& choosePlayerAction) {
    TickReport r;

    // Fairness phase. Everyone gains together until the player can act.
    while (!canAct(w.player)) {
        if (w.player.speed <= 0 || r.grantPhases >= ACTION_COST) {
            reportViolation(w, "player cannot accumulate energy");
            break;
        }
        grantEnergyToAllActors(w);
        ++r.grantPhases;
    }

    if (canAct(w.player)) {
        PlayerAction action = choosePlayerAction ? choosePlayerAction(w) : PlayerAction{};
        if (action.cost <= 0) action.cost = ACTION_COST;
        if (consumeEnergy(w.player, action.cost)) {
            ++w.player.actionsTaken;
            ++w.stats.playerActions;
            r.playerActed = true;
            applyPlayerAction(w, action);
        } else {
            reportViolation(w, "player action cost " + std::to_string(action.cost) +
                               " exceeds energy " + std::to_string(w.player.energy));
        }
    }

    // Monster phase, in list order. Ids are snapshotted so a monster removed
    // by another system mid-phase is skipped rather than dereferenced.
    std::vector<int> order;
    order.reserve(w.monsters.size());
    for (const auto& m : w.monsters) {
        if (m.alive()) order.push_back(m.id);
    }

    // A monster acts until its energy runs out; each action costs
    // ACTION_COST. Hooks may add or remove monsters, so the id is looked up
    // again before every action.
    for (int id : order) {
        for (;;) {
            Monster* m = w.monsterById(id);
            if (!m || !m->alive()) break;
            if (!canAct(*m)) break;
            if (!consumeEnergy(*m)) {
                reportViolation(w, describeMonster(*m) + " could not pay for its action");
                break;
            }
            ++m->actionsTaken;
            ++w.stats.monsterActions;
            ++r.monsterActions;
            monsterAct(*m, w);
        }
    }

    regenerateMonsters(w);
    r.spawnedId = wanderingSpawnTick(w);
    removeDeadMonsters(w);
    ++w.tick;
    return r;
}
