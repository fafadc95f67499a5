#pragma once

#include <cstdint>

// Timed status effects, as seen by the scheduler.
//
// The status system that applies and ticks these lives outside the core; the
// scheduler only asks whether an effect is active.

enum class EffectKind : uint8_t {
    Haste = 0,
};

struct Effects {
    int hasteTurns = 0;     // doubles energy gain while >0

    bool has(EffectKind k) const { return get(k) > 0; }

    int get(EffectKind k) const {
        switch (k) {
            case EffectKind::Haste: return hasteTurns;
        }
        return 0;
    }
};
