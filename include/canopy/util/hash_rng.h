#pragma once

#include <cstdint>
#include <utility>

namespace canopy::util {

// splitmix64: fast deterministic mixing / RNG step.
//
// Used to scatter attractor clouds reproducibly from a simulation seed.
// IMPORTANT: This is *not* a cryptographically secure RNG.
inline std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

// Convert a 64-bit word into a double in [0,1) using the top 53 bits.
inline double u01_from_u64(std::uint64_t x) {
  const std::uint64_t v = x >> 11;
  return static_cast<double>(v) * (1.0 / 9007199254740992.0); // 2^53
}

class HashRng {
 public:
  explicit HashRng(std::uint64_t seed = 1) : s_(seed) {}

  std::uint64_t state() const { return s_; }

  std::uint64_t next_u64() {
    s_ = splitmix64(s_);
    return s_;
  }

  double next_u01() { return u01_from_u64(next_u64()); }

  // Uniform float in [lo, hi). Swapped bounds are tolerated.
  float range(float lo, float hi) {
    if (hi < lo) std::swap(lo, hi);
    return lo + static_cast<float>((static_cast<double>(hi) - lo) * next_u01());
  }

 private:
  std::uint64_t s_{1};
};

} // namespace canopy::util
