#include "actor.hpp"

const char* monsterStateName(MonsterState s) {
    switch (s) {
        case MonsterState::Sleeping: return "sleeping";
        case MonsterState::Wandering: return "wandering";
        case MonsterState::Hunting: return "hunting";
        case MonsterState::Fleeing: return "fleeing";
    }
    return "?";
}

Monster createMonster(const ProfileTable& profiles, MonsterKind kind, Vec2i pos, int id, RNG& rng) {
    const BehaviorProfile& p = profiles.of(kind);

    Monster m;
    m.id = id;
    m.kind = kind;
    m.pos = pos;

    int hp = 0;
    for (int i = 0; i < p.hitDice; ++i) hp += rng.range(1, 8);
    m.hp = hp;
    m.hpMax = hp;

    m.speed = p.speed;
    m.energy = 0;

    m.tag = p.tag;
    m.coward = p.coward;
    m.aggroRange = p.aggroRange;
    m.fleePct = p.fleePct;
    m.erraticPct = p.erraticPct;
    m.intelligence = p.intelligence;
    m.mean = p.mean;
    m.regenChancePct = p.regenChancePct;
    m.regenAmount = p.regenAmount;

    m.state = p.mean ? MonsterState::Hunting : MonsterState::Sleeping;
    return m;
}

void invalidatePath(Monster& m) {
    m.path.reset();
}
