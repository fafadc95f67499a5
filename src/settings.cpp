#include "settings.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::string ltrim(std::string s) {
    s.erase(s.begin(),
        std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}

std::string rtrim(std::string s) {
    s.erase(
        std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(),
        s.end());
    return s;
}

std::string trim(std::string s) {
    return rtrim(ltrim(std::move(s)));
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parseBool(const std::string& v, bool& out) {
    const std::string s = toLower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseInt(const std::string& v, int& out) {
    try {
        out = std::stoi(trim(v));
        return true;
    } catch (const std::exception&) {
        return false;
    }
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

bool parseSimSettings(const std::string& text, SimSettings& out, std::string* outWarnings, std::string* err) {
    SimSettings s;

    std::string warnings;
    int warnCount = 0;

    std::istringstream in(text);
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;

        // Strip comments (# or ;)
        auto hash = line.find('#');
        auto semi = line.find(';');
        size_t cut = std::min(hash == std::string::npos ? line.size() : hash,
                              semi == std::string::npos ? line.size() : semi);
        line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            appendWarning(warnings, lineNo, "expected key = value", warnCount);
            continue;
        }

        std::string key = toLower(trim(line.substr(0, eq)));
        std::string val = trim(line.substr(eq + 1));

        int v = 0;
        bool b = false;

        // Unparsable values keep the default and are reported.
        auto intKey = [&](int& dst, int lo, int hi) {
            if (parseInt(val, v)) dst = std::clamp(v, lo, hi);
            else appendWarning(warnings, lineNo, "invalid integer for " + key + ": '" + val + "'", warnCount);
        };

        if (key == "running_aggro_pct") {
            intKey(s.runningAggroPct, 100, 400);
        } else if (key == "path_goal_tolerance") {
            intKey(s.pathGoalTolerance, 0, 10);
        } else if (key == "path_max_expansions") {
            intKey(s.pathMaxExpansions, 16, 200000);
        } else if (key == "monsters_block_paths") {
            if (parseBool(val, b)) s.monstersBlockPaths = b;
            else appendWarning(warnings, lineNo, "invalid boolean for " + key + ": '" + val + "'", warnCount);
        } else if (key == "flee_hysteresis_pct") {
            intKey(s.fleeHysteresisPct, 0, 100);
        } else if (key == "flee_calm_turns") {
            intKey(s.fleeCalmTurns, 1, 1000);
        } else if (key == "track_turns") {
            intKey(s.trackTurns, 0, 1000);
        } else if (key == "wander_spawn_base_pct_x100") {
            intKey(s.wanderSpawnBasePctX100, 0, 10000);
        } else if (key == "wander_spawn_ramp_pct_x100") {
            intKey(s.wanderSpawnRampPctX100, 0, 10000);
        } else if (key == "wander_spawn_cap_pct_x100") {
            intKey(s.wanderSpawnCapPctX100, 0, 10000);
        } else if (key == "max_wanderers") {
            intKey(s.maxWanderers, 0, 100);
        } else if (key == "player_sight_radius") {
            intKey(s.playerSightRadius, 1, 64);
        } else if (key == "mean_chase_pct") {
            intKey(s.meanChasePct, 0, 100);
        } else if (key == "player_speed") {
            if (!parseInt(val, v)) {
                appendWarning(warnings, lineNo, "invalid integer for " + key + ": '" + val + "'", warnCount);
                continue;
            }
            // A non-positive speed would never act; refuse it outright.
            if (v <= 0) {
                if (err) *err = "Line " + std::to_string(lineNo) + ": player_speed must be > 0";
                if (outWarnings) *outWarnings = warnings;
                return false;
            }
            s.playerSpeed = std::min(v, 1000);
        } else {
            appendWarning(warnings, lineNo, "unknown key '" + key + "'", warnCount);
        }
    }

    out = s;
    if (outWarnings) *outWarnings = warnings;
    return true;
}

bool loadSimSettings(const std::string& path, SimSettings& out, std::string* outWarnings, std::string* err) {
    if (outWarnings) outWarnings->clear();
    std::ifstream f(path);
    if (!f) {
        out = SimSettings{};
        return true;
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return parseSimSettings(ss.str(), out, outWarnings, err);
}

bool writeDefaultSimSettings(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# DelveCore simulation settings
#
# Lines are: key = value
# Comments start with # or ;

# Aggro
# running_aggro_pct: aggro range multiplier (percent) while the player runs. 100..400
running_aggro_pct = 150

# Pathing
# path_goal_tolerance: tiles the goal may move before a cached path is replanned. 0..10
path_goal_tolerance = 1
# path_max_expansions: A* expansion cap. 16..200000
path_max_expansions = 2000
# monsters_block_paths: true/false  (other monsters are temporary walls for A*)
monsters_block_paths = true

# Fleeing
# flee_hysteresis_pct: extra hp percent above the flee threshold needed to stop fleeing.
flee_hysteresis_pct = 10
# flee_calm_turns: the monster's own turns out of the player's reach before it calms down.
flee_calm_turns = 20

# Tracking
# track_turns: the monster's own turns it follows a last-known position without sight.
track_turns = 16

# Wandering monsters (chances in hundredths of a percent: 50 = 0.5%)
wander_spawn_base_pct_x100 = 50
wander_spawn_ramp_pct_x100 = 1
wander_spawn_cap_pct_x100 = 500
max_wanderers = 5
# player_sight_radius: wandering monsters never appear inside this view radius.
player_sight_radius = 9

# mean_chase_pct: per-tick chance that a "mean" monster presses the chase.
mean_chase_pct = 67

# player_speed: energy per grant (10 = normal). Must be > 0.
player_speed = 10
)INI";

    return static_cast<bool>(f);
}
