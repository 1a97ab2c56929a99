/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RANDOM_HPP
#define RANDOM_HPP

#include <random>

namespace Stormfire::Random {

// Non-seeded per-thread engine; effects are not meant to be replayable
inline std::mt19937 &engine() {
  static thread_local std::mt19937 rng{std::random_device{}()};
  return rng;
}

// Uniform float in [lo, hi)
inline float range(float lo, float hi) {
  if (!(lo < hi)) {
    return lo;
  }
  std::uniform_real_distribution<float> dist(lo, hi);
  return dist(engine());
}

// Uniform int in [lo, hi]
inline int rangeInt(int lo, int hi) {
  if (hi <= lo) {
    return lo;
  }
  std::uniform_int_distribution<int> dist(lo, hi);
  return dist(engine());
}

} // namespace Stormfire::Random

#endif // RANDOM_HPP
