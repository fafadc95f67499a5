#pragma once

#include "rng.hpp"

#include <array>
#include <cstdint>
#include <string>

enum class MonsterKind : uint8_t {
    Aquator = 0,
    Bat,
    Centaur,
    Dragon,
    Emu,
    VenusFlytrap,
    Griffin,
    Hobgoblin,
    IceMonster,
    Jabberwock,
    Kestrel,
    Leprechaun,
    Medusa,
    Nymph,
    Orc,
    Phantom,
    Quagga,
    Rattlesnake,
    Snake,
    Troll,
    UrVile,
    Vampire,
    Wraith,
    Xeroc,
    Yeti,
    Zombie,
};

constexpr int MONSTER_KIND_COUNT = static_cast<int>(MonsterKind::Zombie) + 1;

// Movement style while hunting. Cowardice is not a movement style; it is the
// `coward` modifier on the profile and overrides any of these while fleeing.
enum class BehaviorTag : uint8_t {
    Smart = 0,
    Simple,
    Greedy,
    Erratic,
    Thief,
    Stationary,
};

enum class Rarity : uint8_t {
    Common = 0,
    Uncommon,
    Rare,
};

// Static per-kind AI configuration. Fractions (flee threshold, erratic chance)
// are held as whole percents so threshold comparisons stay exact.
struct BehaviorProfile {
    MonsterKind kind = MonsterKind::Aquator;
    char letter = 'A';
    const char* name = "";

    int hitDice = 1;        // hp = hitDice d8
    int speed = 10;         // energy per grant; player speed is 10
    int aggroRange = 6;     // tiles (Manhattan)
    BehaviorTag tag = BehaviorTag::Simple;
    bool coward = false;
    int fleePct = 0;        // flee when hp/maxHp < fleePct/100 (coward only)
    int erraticPct = 0;     // chance of a random step instead of a directed one
    int intelligence = 1;   // 1..10
    int minDepth = 1;
    Rarity rarity = Rarity::Common;
    bool mean = false;      // spawns awake; chases with mean_chase_pct
    int regenChancePct = 0;
    int regenAmount = 0;
};

struct ProfileTable {
    std::array<BehaviorProfile, MONSTER_KIND_COUNT> profiles{};

    // FNV-1a 64 of the override file applied on top of the defaults (0 = none).
    uint64_t sourceHash = 0;

    const BehaviorProfile& of(MonsterKind k) const { return profiles[static_cast<size_t>(k)]; }
    BehaviorProfile& of(MonsterKind k) { return profiles[static_cast<size_t>(k)]; }
};

const char* monsterKindName(MonsterKind k);
const char* behaviorTagName(BehaviorTag t);
const char* rarityName(Rarity r);

int rarityWeight(Rarity r);

// Parses "smart", "simple+coward", "erratic, coward", ... A lone "coward"
// means Smart movement with the coward modifier. Returns false on an unknown
// tag or on two movement tags in one list.
bool parseBehaviorTags(const std::string& raw, BehaviorTag& outTag, bool& outCoward);

// Letter ('A'..'Z') to kind.
bool monsterKindFromLetter(char c, MonsterKind& out);

// Accepts a sanitized name ("ice_monster", "ur-vile", "Venus Flytrap") or a
// single letter.
bool monsterKindFromId(const std::string& raw, MonsterKind& out);

ProfileTable defaultProfileTable();

// Fatal configuration checks: speed <= 0, negative aggro range, fractions
// outside [0,1], and so on.
bool validateProfile(const BehaviorProfile& p, std::string* err);
bool validateProfileTable(const ProfileTable& table, std::string* err);

// Weighted pick among kinds with minDepth <= depth and at most
// SPAWN_DEPTH_WINDOW levels shallower.
constexpr int SPAWN_DEPTH_WINDOW = 6;
MonsterKind pickSpawnKind(const ProfileTable& table, int depth, RNG& rng);
