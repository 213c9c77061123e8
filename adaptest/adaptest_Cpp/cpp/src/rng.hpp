#pragma once

#include <cstdint>

namespace cat {

// xorshift64; the state lives in the session so random selection replays deterministically.
inline std::uint64_t advance_rng(std::uint64_t& state) {
  if (state == 0) {
    state = 0x2545F4914F6CDD1DULL;
  }
  std::uint64_t x = state;
  x ^= x << 13;
  x ^= x >> 7;
  x ^= x << 17;
  state = x;
  return x;
}

// Uniform in [0, 1).
inline double rand_unit(std::uint64_t& state) {
  return static_cast<double>(advance_rng(state) >> 11) * (1.0 / 9007199254740992.0);
}

} // namespace cat
