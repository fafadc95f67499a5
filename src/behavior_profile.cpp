#include "behavior_profile.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace {

// Hit dice, speed, aggro, tag, coward, flee%, erratic%, int, depth, rarity, mean, regen%, regen
const BehaviorProfile kDefaults[MONSTER_KIND_COUNT] = {
    {MonsterKind::Aquator,      'A', "aquator",       5, 10,  7, BehaviorTag::Simple,     false,   0,  0, 3,  5, Rarity::Uncommon, false,  0, 0},
    {MonsterKind::Bat,          'B', "bat",           1, 15,  8, BehaviorTag::Erratic,    false,   0, 50, 2,  1, Rarity::Common,   false,  0, 0},
    {MonsterKind::Centaur,      'C', "centaur",       4, 12, 10, BehaviorTag::Smart,      false,  20,  0, 6,  4, Rarity::Uncommon, false,  0, 0},
    {MonsterKind::Dragon,       'D', "dragon",       10, 18, 15, BehaviorTag::Smart,      false,  15,  0, 8, 10, Rarity::Rare,     true,   0, 0},
    {MonsterKind::Emu,          'E', "emu",           1, 10,  6, BehaviorTag::Simple,     false,   0,  0, 1,  1, Rarity::Common,   true,   0, 0},
    {MonsterKind::VenusFlytrap, 'F', "venus flytrap", 8, 10,  2, BehaviorTag::Stationary, false,   0,  0, 1,  6, Rarity::Uncommon, false,  0, 0},
    {MonsterKind::Griffin,      'G', "griffin",      13, 18, 12, BehaviorTag::Smart,      false,  10,  0, 7, 10, Rarity::Rare,     true,   0, 0},
    {MonsterKind::Hobgoblin,    'H', "hobgoblin",     1, 10,  7, BehaviorTag::Simple,     false,   0,  0, 2,  1, Rarity::Common,   true,   0, 0},
    {MonsterKind::IceMonster,   'I', "ice monster",   1, 10,  6, BehaviorTag::Simple,     false,   0,  0, 2,  5, Rarity::Uncommon, false,  0, 0},
    {MonsterKind::Jabberwock,   'J', "jabberwock",   15, 18, 12, BehaviorTag::Smart,      false,  10,  0, 7, 10, Rarity::Rare,     true,   0, 0},
    {MonsterKind::Kestrel,      'K', "kestrel",       1, 15,  8, BehaviorTag::Erratic,    false,   0, 50, 2,  2, Rarity::Common,   true,   0, 0},
    {MonsterKind::Leprechaun,   'L', "leprechaun",    3, 10, 10, BehaviorTag::Thief,      false, 100,  0, 6,  4, Rarity::Uncommon, false,  0, 0},
    {MonsterKind::Medusa,       'M', "medusa",        8, 12, 10, BehaviorTag::Smart,      false,  20,  0, 7,  8, Rarity::Rare,     false,  0, 0},
    {MonsterKind::Nymph,        'N', "nymph",         3, 10,  8, BehaviorTag::Thief,      false, 100,  0, 7,  6, Rarity::Uncommon, false,  0, 0},
    {MonsterKind::Orc,          'O', "orc",           1, 10,  8, BehaviorTag::Greedy,     false,  25,  0, 5,  2, Rarity::Uncommon, true,   0, 0},
    {MonsterKind::Phantom,      'P', "phantom",       8, 15, 10, BehaviorTag::Smart,      false,  20,  0, 7,  8, Rarity::Rare,     false,  0, 0},
    {MonsterKind::Quagga,       'Q', "quagga",        3, 10,  7, BehaviorTag::Simple,     false,   0,  0, 2,  3, Rarity::Common,   true,   0, 0},
    {MonsterKind::Rattlesnake,  'R', "rattlesnake",   2, 10,  6, BehaviorTag::Simple,     false,   0,  0, 2,  3, Rarity::Uncommon, false,  0, 0},
    {MonsterKind::Snake,        'S', "snake",         1, 10,  5, BehaviorTag::Simple,     false,   0,  0, 2,  1, Rarity::Common,   true,   0, 0},
    {MonsterKind::Troll,        'T', "troll",         6,  7,  8, BehaviorTag::Simple,     false,  20,  0, 4,  6, Rarity::Uncommon, true,  25, 1},
    {MonsterKind::UrVile,       'U', "ur-vile",       7, 15, 10, BehaviorTag::Smart,      false,  15,  0, 7,  9, Rarity::Rare,     true,   0, 0},
    {MonsterKind::Vampire,      'V', "vampire",       8, 15, 10, BehaviorTag::Smart,      true,   30,  0, 7,  8, Rarity::Rare,     false, 25, 1},
    {MonsterKind::Wraith,       'W', "wraith",        5, 12,  9, BehaviorTag::Smart,      false,  25,  0, 6,  7, Rarity::Rare,     false,  0, 0},
    {MonsterKind::Xeroc,        'X', "xeroc",         7, 10,  7, BehaviorTag::Simple,     false,  20,  0, 3,  7, Rarity::Uncommon, false,  0, 0},
    {MonsterKind::Yeti,         'Y', "yeti",          4, 10,  7, BehaviorTag::Simple,     false,  15,  0, 3,  4, Rarity::Uncommon, false,  0, 0},
    {MonsterKind::Zombie,       'Z', "zombie",        2,  5,  6, BehaviorTag::Simple,     false,   0,  0, 1,  2, Rarity::Uncommon, true,   0, 0},
};

std::string sanitizeId(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());

    auto pushUnderscore = [&]() {
        if (!out.empty() && out.back() != '_') out.push_back('_');
    };

    for (unsigned char c : raw) {
        if (std::isalnum(c)) {
            out.push_back(static_cast<char>(std::tolower(c)));
        } else if (c == ' ' || c == '_' || c == '-') {
            pushUnderscore();
        }
    }

    while (!out.empty() && out.front() == '_') out.erase(out.begin());
    while (!out.empty() && out.back() == '_') out.pop_back();
    return out;
}

bool parseSingleTag(const std::string& v, BehaviorTag& out) {
    if (v == "smart") { out = BehaviorTag::Smart; return true; }
    if (v == "simple") { out = BehaviorTag::Simple; return true; }
    if (v == "greedy") { out = BehaviorTag::Greedy; return true; }
    if (v == "erratic") { out = BehaviorTag::Erratic; return true; }
    if (v == "thief") { out = BehaviorTag::Thief; return true; }
    if (v == "stationary") { out = BehaviorTag::Stationary; return true; }
    return false;
}

} // namespace

const char* monsterKindName(MonsterKind k) {
    const int i = static_cast<int>(k);
    if (i < 0 || i >= MONSTER_KIND_COUNT) return "thing";
    return kDefaults[i].name;
}

const char* behaviorTagName(BehaviorTag t) {
    switch (t) {
        case BehaviorTag::Smart: return "smart";
        case BehaviorTag::Simple: return "simple";
        case BehaviorTag::Greedy: return "greedy";
        case BehaviorTag::Erratic: return "erratic";
        case BehaviorTag::Thief: return "thief";
        case BehaviorTag::Stationary: return "stationary";
    }
    return "simple";
}

const char* rarityName(Rarity r) {
    switch (r) {
        case Rarity::Common: return "common";
        case Rarity::Uncommon: return "uncommon";
        case Rarity::Rare: return "rare";
    }
    return "common";
}

int rarityWeight(Rarity r) {
    switch (r) {
        case Rarity::Common: return 5;
        case Rarity::Uncommon: return 3;
        case Rarity::Rare: return 2;
    }
    return 1;
}

bool parseBehaviorTags(const std::string& raw, BehaviorTag& outTag, bool& outCoward) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : raw) {
        if (c == '+' || c == ',' || c == '|') {
            parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    parts.push_back(cur);

    bool haveMove = false;
    bool coward = false;
    BehaviorTag tag = BehaviorTag::Smart;

    for (const std::string& p : parts) {
        const std::string v = sanitizeId(p);
        if (v.empty()) return false;
        if (v == "coward") {
            coward = true;
            continue;
        }
        BehaviorTag t;
        if (!parseSingleTag(v, t)) return false;
        if (haveMove && t != tag) return false;
        tag = t;
        haveMove = true;
    }

    outTag = haveMove ? tag : BehaviorTag::Smart;
    outCoward = coward;
    return true;
}

bool monsterKindFromLetter(char c, MonsterKind& out) {
    if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    if (c < 'A' || c > 'Z') return false;
    out = static_cast<MonsterKind>(c - 'A');
    return true;
}

bool monsterKindFromId(const std::string& raw, MonsterKind& out) {
    const std::string v = sanitizeId(raw);
    if (v.size() == 1) return monsterKindFromLetter(v[0], out);

    for (int i = 0; i < MONSTER_KIND_COUNT; ++i) {
        if (sanitizeId(kDefaults[i].name) == v) {
            out = static_cast<MonsterKind>(i);
            return true;
        }
    }
    // Friendly aliases.
    if (v == "flytrap") { out = MonsterKind::VenusFlytrap; return true; }
    if (v == "urvile") { out = MonsterKind::UrVile; return true; }
    if (v == "icemonster") { out = MonsterKind::IceMonster; return true; }
    return false;
}

ProfileTable defaultProfileTable() {
    ProfileTable t;
    for (int i = 0; i < MONSTER_KIND_COUNT; ++i) t.profiles[static_cast<size_t>(i)] = kDefaults[i];
    return t;
}

bool validateProfile(const BehaviorProfile& p, std::string* err) {
    auto fail = [&](const std::string& what) {
        if (err) *err = std::string(p.name) + ": " + what;
        return false;
    };

    if (p.speed <= 0) return fail("speed must be > 0 (got " + std::to_string(p.speed) + ")");
    if (p.aggroRange < 0) return fail("aggro range must be >= 0");
    if (p.hitDice < 1) return fail("hit dice must be >= 1");
    if (p.fleePct < 0 || p.fleePct > 100) return fail("flee threshold must be within [0,1]");
    if (p.erraticPct < 0 || p.erraticPct > 100) return fail("erratic chance must be within [0,1]");
    if (p.intelligence < 1 || p.intelligence > 10) return fail("intelligence must be within [1,10]");
    if (p.minDepth < 1) return fail("min depth must be >= 1");
    if (p.regenChancePct < 0 || p.regenChancePct > 100) return fail("regen chance must be within [0,100]");
    if (p.regenAmount < 0) return fail("regen amount must be >= 0");
    return true;
}

bool validateProfileTable(const ProfileTable& table, std::string* err) {
    for (const BehaviorProfile& p : table.profiles) {
        if (!validateProfile(p, err)) return false;
    }
    return true;
}

MonsterKind pickSpawnKind(const ProfileTable& table, int depth, RNG& rng) {
    std::vector<std::pair<MonsterKind, int>> pool;
    pool.reserve(MONSTER_KIND_COUNT);

    auto build = [&](bool windowed) {
        pool.clear();
        for (const BehaviorProfile& p : table.profiles) {
            if (p.minDepth > depth) continue;
            if (windowed && p.minDepth < depth - SPAWN_DEPTH_WINDOW) continue;
            pool.push_back({p.kind, rarityWeight(p.rarity)});
        }
    };

    build(true);
    if (pool.empty()) build(false);
    if (pool.empty()) {
        // Nothing is shallow enough: use the shallowest kind.
        const auto it = std::min_element(table.profiles.begin(), table.profiles.end(),
            [](const BehaviorProfile& a, const BehaviorProfile& b) { return a.minDepth < b.minDepth; });
        return it->kind;
    }

    int total = 0;
    for (const auto& e : pool) total += e.second;

    int roll = rng.range(0, total - 1);
    for (const auto& e : pool) {
        if (roll < e.second) return e.first;
        roll -= e.second;
    }
    return pool.back().first;
}
