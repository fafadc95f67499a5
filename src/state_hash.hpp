#pragma once

#include "world.hpp"

#include <cstdint>
#include <string>

// Deterministic 64-bit fingerprint of the simulation state: tick, RNG state,
// player, and every monster (position, hp, energy, state, cached path length).
// Same seed + same inputs => same hash sequence.
uint64_t stateHash(const World& w);

std::string hex64(uint64_t v);
bool parseHex64(const std::string& s, uint64_t& out);
