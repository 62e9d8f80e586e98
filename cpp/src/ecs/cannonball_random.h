#ifndef CANNONBALL_RANDOM_H
#define CANNONBALL_RANDOM_H

#include "cannonball_components.h"
#include <cstdint>

namespace cannonball {

// ═════════════════════════════════════════════════════════════
// Seeded hash RNG (splitmix64 stepping + murmur3 fmix64 finalizer).
// Deterministic across platforms, no <random> header needed.
// Every draw advances MatchRng::state, so the same seed and the same
// sequence of ticks reproduce the same match.
// ═════════════════════════════════════════════════════════════
inline uint64_t rng_next(MatchRng &rng) {
  rng.state += 0x9e3779b97f4a7c15ULL;
  uint64_t z = rng.state;
  z ^= z >> 33;
  z *= 0xff51afd7ed558ccdULL;
  z ^= z >> 33;
  z *= 0xc4ceb9fe1a85ec53ULL;
  z ^= z >> 33;
  return z;
}

// Uniform in [lo, hi]
inline float rng_uniform(MatchRng &rng, float lo, float hi) {
  float unit = (float)(rng_next(rng) >> 40) / (float)((1ULL << 24) - 1);
  return lo + (hi - lo) * unit;
}

// Uniform integer in [lo, hi] (inclusive)
inline int rng_int(MatchRng &rng, int lo, int hi) {
  if (hi <= lo)
    return lo;
  uint64_t span = (uint64_t)(hi - lo) + 1;
  return lo + (int)(rng_next(rng) % span);
}

} // namespace cannonball

#endif // CANNONBALL_RANDOM_H
