#pragma once

#include "behavior_profile.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

// Hash helper for enum class keys in unordered_map.
struct EnumClassHash {
    template <typename T>
    std::size_t operator()(T t) const noexcept {
        return static_cast<std::size_t>(t);
    }
};

struct BehaviorProfileOverride {
    std::optional<int> hitDice;
    std::optional<int> speed;
    std::optional<int> aggroRange;
    std::optional<BehaviorTag> tag;
    std::optional<bool> coward;
    std::optional<int> fleePct;
    std::optional<int> erraticPct;
    std::optional<int> intelligence;
    std::optional<int> minDepth;
    std::optional<Rarity> rarity;
    std::optional<bool> mean;
    std::optional<int> regenChancePct;
    std::optional<int> regenAmount;
};

struct ProfileOverrides {
    // Parsed from an INI-ish override file:
    //   monster.<id>.<field> = value
    std::unordered_map<MonsterKind, BehaviorProfileOverride, EnumClassHash> monsters;

    // Hash of the source text (FNV-1a 64-bit) for reproducibility.
    uint64_t sourceHash = 0;
};

// Parses override text. Unknown ids/fields and unparsable values are skipped
// and reported in outWarnings. Returns false (with *err) on a fatal problem:
// an unknown behavior tag, or a fraction outside [0,1].
bool parseProfileOverridesIni(const std::string& text, ProfileOverrides& out, std::string* outWarnings, std::string* err);

// File wrapper. Also returns false if the file could not be read.
bool loadProfileOverridesIni(const std::string& path, ProfileOverrides& out, std::string* outWarnings, std::string* err);

// Applies overrides on top of `table` and re-validates every touched profile.
// On failure `table` is left unchanged.
bool applyProfileOverrides(const ProfileOverrides& overrides, ProfileTable& table, std::string* err);
