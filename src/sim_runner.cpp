#include "sim_runner.hpp"

#include "grid_utils.hpp"
#include "rng.hpp"
#include "state_hash.hpp"

#include <utility>

const char* playerPolicyName(PlayerPolicyKind k) {
    switch (k) {
        case PlayerPolicyKind::Wait: return "wait";
        case PlayerPolicyKind::Wander: return "wander";
        case PlayerPolicyKind::Run: return "run";
    }
    return "wait";
}

bool parsePlayerPolicy(const std::string& s, PlayerPolicyKind& out) {
    if (s == "wait") { out = PlayerPolicyKind::Wait; return true; }
    if (s == "wander") { out = PlayerPolicyKind::Wander; return true; }
    if (s == "run") { out = PlayerPolicyKind::Run; return true; }
    return false;
}

PlayerPolicyFn makePlayerPolicy(PlayerPolicyKind kind, uint32_t seed) {
    RNG rng(hashCombine(seed, tag32("PLAYER")));

    switch (kind) {
        case PlayerPolicyKind::Wait:
            return [](const World&) { return PlayerAction{}; };

        case PlayerPolicyKind::Wander:
            return [rng](const World& w) mutable {
                const int d = rng.range(0, 7);
                PlayerAction a;
                a.kind = PlayerActionKind::Move;
                a.dir = {DIRS8[d][0], DIRS8[d][1]};
                const Vec2i to{w.player.pos.x + a.dir.x, w.player.pos.y + a.dir.y};
                if (!w.monsterAt(to.x, to.y) && !isLegalStep(w.level, w.player.pos, to) &&
                    !w.level.isDoorShut(to.x, to.y)) {
                    return PlayerAction{};
                }
                return a;
            };

        case PlayerPolicyKind::Run: {
            // Keep heading one way until blocked, then pick a new heading.
            int heading = 0;
            return [rng, heading](const World& w) mutable {
                for (int tries = 0; tries < 8; ++tries) {
                    const Vec2i to{w.player.pos.x + DIRS8[heading][0], w.player.pos.y + DIRS8[heading][1]};
                    if (isLegalStep(w.level, w.player.pos, to) && !w.isOccupied(to.x, to.y)) {
                        PlayerAction a;
                        a.kind = PlayerActionKind::Run;
                        a.dir = {DIRS8[heading][0], DIRS8[heading][1]};
                        return a;
                    }
                    heading = rng.range(0, 7);
                }
                return PlayerAction{};
            };
        }
    }
    return {};
}

bool runSimulation(World& w, const SimRunOptions& opt, SimRunStats* outStats, std::string* err) {
    const PlayerPolicyFn policy = makePlayerPolicy(opt.policy, opt.policySeed);
    SimRunStats st;

    for (uint32_t i = 0; i < opt.ticks; ++i) {
        advanceTick(w, policy);
        ++st.ticks;
        if (opt.hashEvery > 0 && (st.ticks % opt.hashEvery) == 0) {
            st.hashTrail.push_back(stateHash(w));
        }
    }

    st.scheduler = w.stats;
    for (const auto& m : w.monsters) {
        SimMonsterSummary s;
        s.id = m.id;
        s.kind = m.kind;
        s.state = m.state;
        s.hp = m.hp;
        s.actions = m.actionsTaken;
        s.wanderer = m.wanderer;
        st.monsters.push_back(s);
    }
    st.finalHash = stateHash(w);

    const bool ok = (w.stats.invariantViolations == 0);
    if (!ok && err) {
        *err = std::to_string(w.stats.invariantViolations) + " scheduler invariant violation(s)";
    }
    if (outStats) *outStats = std::move(st);
    return ok;
}

const char* demoMapText() {
    return R"MAP(; DelveCore demo level
depth = 3
##################################
#........#          #...........$#
#..@.....#          #............#
#........',,,,,,,,,,+......O.....#
#...$....#     ,    #............#
#........#     ,    ######'#######
######+###     ,          ,
      ,        ,          ,
      ,,,,,,,,,,,,,,,,,,,,,
               ,
   ############'#####
   #....B...........#
   #..........L.....#
   #..S.............#
   ##################
)MAP";
}
