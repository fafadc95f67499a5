#include "state_hash.hpp"

#include "rng.hpp"

namespace {

struct Hasher {
    uint64_t h = 14695981039346656037ull;

    void u32(uint32_t v) {
        uint8_t b[4] = {
            static_cast<uint8_t>(v & 0xFF),
            static_cast<uint8_t>((v >> 8) & 0xFF),
            static_cast<uint8_t>((v >> 16) & 0xFF),
            static_cast<uint8_t>((v >> 24) & 0xFF),
        };
        h = fnv1a64(b, sizeof(b), h);
    }

    void i32(int v) { u32(static_cast<uint32_t>(v)); }
    void vec(const Vec2i& p) { i32(p.x); i32(p.y); }
};

} // namespace

uint64_t stateHash(const World& w) {
    Hasher hs;
    hs.u32(w.tick);
    hs.u32(w.rng.state);

    const Player& p = w.player;
    hs.i32(p.id);
    hs.vec(p.pos);
    hs.i32(p.hp);
    hs.i32(p.energy);
    hs.i32(p.gold);

    hs.u32(static_cast<uint32_t>(w.monsters.size()));
    for (const Monster& m : w.monsters) {
        hs.i32(m.id);
        hs.i32(static_cast<int>(m.kind));
        hs.vec(m.pos);
        hs.i32(m.hp);
        hs.i32(m.energy);
        hs.i32(static_cast<int>(m.state));
        hs.i32(m.path ? static_cast<int>(m.path->remaining()) : -1);
    }

    hs.u32(static_cast<uint32_t>(w.level.gold.size()));
    return hs.h;
}

std::string hex64(uint64_t v) {
    static const char* hex = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<size_t>(i)] = hex[v & 0xF];
        v >>= 4;
    }
    return out;
}

bool parseHex64(const std::string& s, uint64_t& out) {
    std::string t = s;
    if (t.size() > 2 && t[0] == '0' && (t[1] == 'x' || t[1] == 'X')) t = t.substr(2);
    if (t.empty() || t.size() > 16) return false;
    uint64_t v = 0;
    for (char c : t) {
        int d = -1;
        if (c >= '0' && c <= '9') d = c - '0';
        else if (c >= 'a' && c <= 'f') d = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') d = c - 'A' + 10;
        if (d < 0) return false;
        v = (v << 4) | static_cast<uint64_t>(d);
    }
    out = v;
    return true;
}
