#include "level.hpp"
#include "profile_overrides.hpp"
#include "settings.hpp"
#include "sim_runner.hpp"
#include "state_hash.hpp"
#include "version.hpp"
#include "world.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

static void printUsage(const char* argv0) {
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " [options]\n\n"
        << "Options:\n"
        << "  --map <path>             ASCII level to simulate (default: built-in demo level).\n"
        << "  --settings <path>        Simulation settings INI (missing file = defaults).\n"
        << "  --profiles <path>        Monster profile override INI.\n"
        << "  --seed <n>               World seed. Default: 1.\n"
        << "  --ticks <n>              Number of ticks to simulate. Default: 1000.\n"
        << "  --player <policy>        Scripted player: wait, wander, run. Default: wander.\n"
        << "  --hash-every <n>         Record a state hash every n ticks (0 = off).\n"
        << "  --expect-hash <hex>      Fail (exit 3) if the final state hash differs.\n"
        << "  --json-report <path>     Write a JSON summary report (useful for CI).\n"
        << "  --log                    Print the message log after the run.\n"
        << "  --list-profiles          Print the monster profile table (after --profiles) and exit.\n"
        << "  --write-default-settings <path>  Write a settings file with all defaults and exit.\n"
        << "  --version                Print version.\n"
        << "  --help                   Show this help.\n";
}

static bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

static bool parseU32(const std::string& s, uint32_t& out) {
    if (s.empty()) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
        if (v > 0xFFFFFFFFull) return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

static std::string jsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out += hex[(c >> 4) & 0xF];
                    out += hex[c & 0xF];
                } else {
                    out.push_back(static_cast<char>(c));
                }
                break;
        }
    }
    return out;
}

static void printStats(std::ostream& os, const SimRunStats& st) {
    const SchedulerStats& s = st.scheduler;
    os << "ticks:            " << st.ticks << "\n";
    os << "grant phases:     " << s.grantPhases << "\n";
    os << "player actions:   " << s.playerActions << "\n";
    os << "monster actions:  " << s.monsterActions << "\n";
    os << "wakeups:          " << s.wakeups << "\n";
    os << "flee transitions: " << s.fleeTransitions << "\n";
    os << "calm downs:       " << s.calmDowns << "\n";
    os << "lost track:       " << s.lostTrack << "\n";
    os << "attacks:          " << s.attacks << "\n";
    os << "steals:           " << s.steals << "\n";
    os << "door slams:       " << s.doorSlams << "\n";
    os << "wander spawns:    " << s.wanderSpawns << "\n";
    os << "replans:          " << s.replans << "\n";
    os << "path failures:    " << s.pathFailures << "\n";
    os << "violations:       " << s.invariantViolations << "\n";
    os << "final hash:       " << hex64(st.finalHash) << "\n";

    if (!st.monsters.empty()) os << "monsters:\n";
    for (const SimMonsterSummary& m : st.monsters) {
        os << "  #" << m.id << " " << monsterKindName(m.kind) << " (" << monsterStateName(m.state)
           << (m.wanderer ? ", wanderer" : "") << ") hp " << m.hp << ", " << m.actions << " actions\n";
    }
}

static void printProfiles(std::ostream& os, const ProfileTable& t) {
    os << std::left
       << std::setw(4) << "ch" << std::setw(16) << "name" << std::setw(5) << "hd" << std::setw(5) << "spd"
       << std::setw(7) << "aggro" << std::setw(18) << "behavior" << std::setw(6) << "flee"
       << std::setw(9) << "erratic" << std::setw(7) << "depth" << "rarity\n";
    for (const BehaviorProfile& p : t.profiles) {
        std::string behavior = behaviorTagName(p.tag);
        if (p.coward) behavior += "+coward";
        os << std::setw(4) << p.letter << std::setw(16) << p.name << std::setw(5) << p.hitDice
           << std::setw(5) << p.speed << std::setw(7) << p.aggroRange << std::setw(18) << behavior
           << std::setw(6) << (std::to_string(p.fleePct) + "%") << std::setw(9) << (std::to_string(p.erraticPct) + "%")
           << std::setw(7) << p.minDepth << rarityName(p.rarity);
        if (p.mean) os << " (mean)";
        os << "\n";
    }
    os << std::right;
}

static bool writeJsonReport(const std::filesystem::path& path,
                            const SimRunStats& st,
                            const SimRunOptions& opt,
                            uint32_t seed,
                            const std::string& mapName,
                            bool ok,
                            const std::string& error,
                            std::string* err) {
    std::ofstream f(path);
    if (!f) {
        if (err) *err = "Failed to open JSON report for writing: " + path.generic_string();
        return false;
    }

    const SchedulerStats& s = st.scheduler;

    f << "{\n";
    f << "  \"tool\": \"DelveCoreSim\",\n";
    f << "  \"version\": \"" << jsonEscape(DELVECORE_VERSION) << "\",\n";
    f << "  \"options\": {\n";
    f << "    \"map\": \"" << jsonEscape(mapName) << "\",\n";
    f << "    \"seed\": " << seed << ",\n";
    f << "    \"ticks\": " << opt.ticks << ",\n";
    f << "    \"player\": \"" << playerPolicyName(opt.policy) << "\",\n";
    f << "    \"hashEvery\": " << opt.hashEvery << "\n";
    f << "  },\n";
    f << "  \"ok\": " << (ok ? "true" : "false") << ",\n";
    if (!ok) f << "  \"error\": \"" << jsonEscape(error) << "\",\n";
    f << "  \"stats\": {\n";
    f << "    \"ticks\": " << st.ticks << ",\n";
    f << "    \"grantPhases\": " << s.grantPhases << ",\n";
    f << "    \"playerActions\": " << s.playerActions << ",\n";
    f << "    \"monsterActions\": " << s.monsterActions << ",\n";
    f << "    \"invariantViolations\": " << s.invariantViolations << ",\n";
    f << "    \"wakeups\": " << s.wakeups << ",\n";
    f << "    \"fleeTransitions\": " << s.fleeTransitions << ",\n";
    f << "    \"calmDowns\": " << s.calmDowns << ",\n";
    f << "    \"lostTrack\": " << s.lostTrack << ",\n";
    f << "    \"attacks\": " << s.attacks << ",\n";
    f << "    \"steals\": " << s.steals << ",\n";
    f << "    \"doorSlams\": " << s.doorSlams << ",\n";
    f << "    \"wanderSpawns\": " << s.wanderSpawns << ",\n";
    f << "    \"replans\": " << s.replans << ",\n";
    f << "    \"pathFailures\": " << s.pathFailures << "\n";
    f << "  },\n";
    f << "  \"monsters\": [";
    for (size_t i = 0; i < st.monsters.size(); ++i) {
        const SimMonsterSummary& m = st.monsters[i];
        if (i) f << ",";
        f << "\n    { \"id\": " << m.id
          << ", \"kind\": \"" << jsonEscape(monsterKindName(m.kind)) << "\""
          << ", \"state\": \"" << monsterStateName(m.state) << "\""
          << ", \"hp\": " << m.hp
          << ", \"actions\": " << m.actions
          << ", \"wanderer\": " << (m.wanderer ? "true" : "false") << " }";
    }
    f << (st.monsters.empty() ? "],\n" : "\n  ],\n");
    f << "  \"hashTrail\": [";
    for (size_t i = 0; i < st.hashTrail.size(); ++i) {
        if (i) f << ", ";
        f << "\"" << hex64(st.hashTrail[i]) << "\"";
    }
    f << "],\n";
    f << "  \"finalHash\": \"" << hex64(st.finalHash) << "\"\n";
    f << "}\n";
    return true;
}

} // namespace

int main(int argc, char** argv) {
    std::filesystem::path mapPath;
    std::filesystem::path settingsPath;
    std::filesystem::path profilesPath;
    std::filesystem::path jsonReport;
    uint32_t seed = 1;
    bool printLog = false;
    bool listProfiles = false;
    bool haveExpectedHash = false;
    uint64_t expectedHash = 0;
    SimRunOptions opt;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (a == "--version" || a == "-v") {
            std::cout << DELVECORE_APPNAME << " " << DELVECORE_VERSION << "\n";
            return 0;
        } else if (a == "--write-default-settings") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--write-default-settings requires a path\n";
                return 2;
            }
            if (!writeDefaultSimSettings(v)) {
                std::cerr << "Failed to write settings: " << v << "\n";
                return 1;
            }
            std::cout << "Wrote " << v << "\n";
            return 0;
        } else if (a == "--map" || a == "--settings" || a == "--profiles" || a == "--json-report") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << a << " requires a path\n";
                return 2;
            }
            if (a == "--map") mapPath = v;
            else if (a == "--settings") settingsPath = v;
            else if (a == "--profiles") profilesPath = v;
            else jsonReport = v;
        } else if (a == "--seed" || a == "--ticks" || a == "--hash-every") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << a << " requires a value\n";
                return 2;
            }
            uint32_t n = 0;
            if (!parseU32(v, n)) {
                std::cerr << "Invalid " << a << ": " << v << "\n";
                return 2;
            }
            if (a == "--seed") seed = n;
            else if (a == "--ticks") opt.ticks = n;
            else opt.hashEvery = n;
        } else if (a == "--player") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--player requires a policy\n";
                return 2;
            }
            if (!parsePlayerPolicy(v, opt.policy)) {
                std::cerr << "Unknown --player policy: " << v << " (expected wait, wander or run)\n";
                return 2;
            }
        } else if (a == "--expect-hash") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--expect-hash requires a value\n";
                return 2;
            }
            if (!parseHex64(v, expectedHash)) {
                std::cerr << "Invalid --expect-hash: " << v << "\n";
                return 2;
            }
            haveExpectedHash = true;
        } else if (a == "--log") {
            printLog = true;
        } else if (a == "--list-profiles") {
            listProfiles = true;
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    opt.policySeed = seed;

    Level level;
    LevelMarkers markers;
    std::string err;
    if (!mapPath.empty()) {
        if (!loadLevelAscii(mapPath.string(), level, &markers, &err)) {
            std::cerr << "Failed to load map: " << err << "\n";
            return 1;
        }
    } else if (!parseLevelAscii(demoMapText(), level, &markers, &err)) {
        std::cerr << "Built-in map is invalid: " << err << "\n";
        return 1;
    }

    World w;
    if (!settingsPath.empty()) {
        std::string warns;
        if (!loadSimSettings(settingsPath.string(), w.settings, &warns, &err)) {
            std::cerr << "Failed to load settings: " << err << "\n";
            if (!warns.empty()) std::cerr << warns;
            return 1;
        }
        if (!warns.empty()) std::cerr << "Warnings in " << settingsPath.string() << ":\n" << warns;
    }

    if (!profilesPath.empty()) {
        ProfileOverrides po;
        std::string warns;
        if (!loadProfileOverridesIni(profilesPath.string(), po, &warns, &err)) {
            std::cerr << "Failed to load monster profiles: " << err << "\n";
            if (!warns.empty()) std::cerr << warns;
            return 1;
        }
        if (!warns.empty()) std::cerr << "Warnings in " << profilesPath.string() << ":\n" << warns;
        if (!applyProfileOverrides(po, w.profiles, &err)) {
            std::cerr << "Invalid monster profiles: " << err << "\n";
            return 1;
        }
    }

    if (listProfiles) {
        printProfiles(std::cout, w.profiles);
        return 0;
    }

    if (!initWorld(w, level, markers, seed, &err)) {
        std::cerr << "Failed to set up world: " << err << "\n";
        return 1;
    }

    SimRunStats st;
    std::string runErr;
    const bool ok = runSimulation(w, opt, &st, &runErr);

    printStats(std::cout, st);

    if (printLog) {
        for (const auto& m : w.log.messages()) {
            std::cout << "[" << m.tick << "] " << messageKindName(m.kind) << ": " << m.text;
            if (m.repeat > 1) std::cout << " (x" << m.repeat << ")";
            std::cout << "\n";
        }
    }

    if (!jsonReport.empty()) {
        std::string jerr;
        const std::string mapName = mapPath.empty() ? std::string("<demo>") : mapPath.generic_string();
        if (!writeJsonReport(jsonReport, st, opt, seed, mapName, ok, runErr, &jerr)) {
            std::cerr << jerr << "\n";
            return 1;
        }
    }

    if (!ok) {
        std::cerr << "FAIL: " << runErr << "\n";
        return 1;
    }

    if (haveExpectedHash && expectedHash != st.finalHash) {
        std::cerr << "FAIL: final hash " << hex64(st.finalHash)
                  << " != expected " << hex64(expectedHash) << "\n";
        return 3;
    }

    return 0;
}
