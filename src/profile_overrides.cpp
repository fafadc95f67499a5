#include "profile_overrides.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <cmath>
#include <fstream>
#include <sstream>
#include <vector>

namespace {

std::string ltrim(std::string s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}

std::string rtrim(std::string s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(), s.end());
    return s;
}

std::string trim(std::string s) {
    return rtrim(ltrim(std::move(s)));
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void stripUtf8Bom(std::string& s) {
    if (s.size() >= 3 && static_cast<unsigned char>(s[0]) == 0xEF && static_cast<unsigned char>(s[1]) == 0xBB && static_cast<unsigned char>(s[2]) == 0xBF) {
        s.erase(0, 3);
    }
}

bool parseInt(const std::string& raw, int& out) {
    try {
        size_t idx = 0;
        const std::string t = trim(raw);
        const int v = std::stoi(t, &idx, 0);
        if (idx != t.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseBool(const std::string& raw, bool& out) {
    const std::string v = toLower(trim(raw));
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        out = true;
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        out = false;
        return true;
    }
    return false;
}

// "0.25" or "25%". Result is a whole percent, possibly out of range; the
// caller decides whether that is fatal.
bool parseFractionPct(const std::string& raw, int& outPct) {
    std::string t = trim(raw);
    bool percent = false;
    if (!t.empty() && t.back() == '%') {
        percent = true;
        t = trim(t.substr(0, t.size() - 1));
    }
    try {
        size_t idx = 0;
        const double v = std::stod(t, &idx);
        if (idx != t.size() || !std::isfinite(v)) return false;
        outPct = static_cast<int>(std::lround(percent ? v : v * 100.0));
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseRarity(const std::string& raw, Rarity& out) {
    const std::string v = toLower(trim(raw));
    if (v == "common") { out = Rarity::Common; return true; }
    if (v == "uncommon") { out = Rarity::Uncommon; return true; }
    if (v == "rare") { out = Rarity::Rare; return true; }
    return false;
}

std::vector<std::string> splitDot(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == '.') {
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

std::string joinTokensUnderscore(const std::vector<std::string>& toks, size_t start) {
    std::string out;
    for (size_t i = start; i < toks.size(); ++i) {
        if (!out.empty()) out.push_back('_');
        out += toks[i];
    }
    return out;
}

void appendWarning(std::string& w, int lineNo, const std::string& msg, int& warnCount, int warnLimit = 30) {
    if (warnCount < warnLimit) {
        w += "Line " + std::to_string(lineNo) + ": " + msg + "\n";
    } else if (warnCount == warnLimit) {
        w += "(more warnings omitted...)\n";
    }
    ++warnCount;
}

} // namespace

bool parseProfileOverridesIni(const std::string& text, ProfileOverrides& out, std::string* outWarnings, std::string* err) {
    out = ProfileOverrides{};
    out.sourceHash = fnv1a64(text.data(), text.size());

    std::istringstream iss(text);
    std::string line;

    std::string warnings;
    int warnCount = 0;

    auto fatal = [&](int lineNo, const std::string& msg) {
        if (err) *err = "Line " + std::to_string(lineNo) + ": " + msg;
        if (outWarnings) *outWarnings = warnings;
        return false;
    };

    for (int lineNo = 1; std::getline(iss, line); ++lineNo) {
        if (lineNo == 1) stripUtf8Bom(line);

        // Strip comments (# or ;) but do not attempt to handle quoted strings.
        size_t commentPos = std::string::npos;
        size_t pHash = line.find('#');
        size_t pSemi = line.find(';');
        if (pHash != std::string::npos) commentPos = pHash;
        if (pSemi != std::string::npos) commentPos = std::min(commentPos, pSemi);
        if (commentPos != std::string::npos) line = line.substr(0, commentPos);

        line = trim(std::move(line));
        if (line.empty()) continue;

        const size_t eq = line.find('=');
        if (eq == std::string::npos) {
            appendWarning(warnings, lineNo, "Expected key=value", warnCount);
            continue;
        }

        std::string key = toLower(trim(line.substr(0, eq)));
        std::string val = trim(line.substr(eq + 1));

        if (key.empty()) {
            appendWarning(warnings, lineNo, "Empty key", warnCount);
            continue;
        }

        std::vector<std::string> toks = splitDot(key);
        if (toks.empty()) continue;

        if (toks[0] != "monster") {
            appendWarning(warnings, lineNo, "Unknown section: " + toks[0], warnCount);
            continue;
        }
        if (toks.size() < 3) {
            appendWarning(warnings, lineNo, "Monster key should be monster.<id>.<field>", warnCount);
            continue;
        }

        MonsterKind mk;
        if (!monsterKindFromId(toks[1], mk)) {
            appendWarning(warnings, lineNo, "Unknown monster id: " + toks[1], warnCount);
            continue;
        }

        const std::string field = joinTokensUnderscore(toks, 2);
        BehaviorProfileOverride& ov = out.monsters[mk];

        int iv = 0;
        bool bv = false;

        auto intField = [&](std::optional<int>& slot, const char* name) {
            if (!parseInt(val, iv)) {
                appendWarning(warnings, lineNo, std::string("Invalid int for ") + name, warnCount);
                return;
            }
            slot = iv;
        };

        if (field == "hit_dice" || field == "hd") {
            intField(ov.hitDice, "hit_dice");
        } else if (field == "speed") {
            intField(ov.speed, "speed");
        } else if (field == "aggro_range" || field == "aggro") {
            intField(ov.aggroRange, "aggro_range");
        } else if (field == "behavior" || field == "tag" || field == "tags") {
            BehaviorTag tag;
            bool coward = false;
            if (!parseBehaviorTags(val, tag, coward)) {
                return fatal(lineNo, "Unknown behavior tag: " + val);
            }
            ov.tag = tag;
            ov.coward = coward;
        } else if (field == "coward") {
            if (!parseBool(val, bv)) {
                appendWarning(warnings, lineNo, "Invalid bool for coward", warnCount);
                continue;
            }
            ov.coward = bv;
        } else if (field == "flee_threshold" || field == "flee") {
            if (!parseFractionPct(val, iv)) {
                appendWarning(warnings, lineNo, "Invalid number for flee_threshold", warnCount);
                continue;
            }
            if (iv < 0 || iv > 100) return fatal(lineNo, "flee_threshold must be within [0,1]");
            ov.fleePct = iv;
        } else if (field == "erratic_chance" || field == "erratic") {
            if (!parseFractionPct(val, iv)) {
                appendWarning(warnings, lineNo, "Invalid number for erratic_chance", warnCount);
                continue;
            }
            if (iv < 0 || iv > 100) return fatal(lineNo, "erratic_chance must be within [0,1]");
            ov.erraticPct = iv;
        } else if (field == "intelligence" || field == "int") {
            intField(ov.intelligence, "intelligence");
        } else if (field == "min_depth" || field == "level") {
            intField(ov.minDepth, "min_depth");
        } else if (field == "rarity") {
            Rarity r;
            if (!parseRarity(val, r)) {
                appendWarning(warnings, lineNo, "Invalid rarity (common/uncommon/rare)", warnCount);
                continue;
            }
            ov.rarity = r;
        } else if (field == "mean") {
            if (!parseBool(val, bv)) {
                appendWarning(warnings, lineNo, "Invalid bool for mean", warnCount);
                continue;
            }
            ov.mean = bv;
        } else if (field == "regen_chance" || field == "regen_chance_pct") {
            intField(ov.regenChancePct, "regen_chance_pct");
        } else if (field == "regen_amount" || field == "regen") {
            intField(ov.regenAmount, "regen_amount");
        } else {
            appendWarning(warnings, lineNo, "Unknown monster field: " + field, warnCount);
        }
    }

    if (outWarnings) *outWarnings = warnings;
    return true;
}

bool loadProfileOverridesIni(const std::string& path, ProfileOverrides& out, std::string* outWarnings, std::string* err) {
    out = ProfileOverrides{};

    std::ifstream f(path, std::ios::binary);
    if (!f) {
        if (err) *err = "Could not open profile file: " + path;
        return false;
    }

    std::ostringstream oss;
    oss << f.rdbuf();
    return parseProfileOverridesIni(oss.str(), out, outWarnings, err);
}

bool applyProfileOverrides(const ProfileOverrides& overrides, ProfileTable& table, std::string* err) {
    ProfileTable next = table;

    for (const auto& kv : overrides.monsters) {
        BehaviorProfile& p = next.of(kv.first);
        const BehaviorProfileOverride& ov = kv.second;

        if (ov.hitDice) p.hitDice = *ov.hitDice;
        if (ov.speed) p.speed = *ov.speed;
        if (ov.aggroRange) p.aggroRange = *ov.aggroRange;
        if (ov.tag) p.tag = *ov.tag;
        if (ov.coward) p.coward = *ov.coward;
        if (ov.fleePct) p.fleePct = *ov.fleePct;
        if (ov.erraticPct) p.erraticPct = *ov.erraticPct;
        if (ov.intelligence) p.intelligence = *ov.intelligence;
        if (ov.minDepth) p.minDepth = *ov.minDepth;
        if (ov.rarity) p.rarity = *ov.rarity;
        if (ov.mean) p.mean = *ov.mean;
        if (ov.regenChancePct) p.regenChancePct = *ov.regenChancePct;
        if (ov.regenAmount) p.regenAmount = *ov.regenAmount;

        if (!validateProfile(p, err)) return false;
    }

    next.sourceHash = overrides.sourceHash;
    table = next;
    return true;
}
