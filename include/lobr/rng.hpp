#pragma once
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace lobr {

// SplitMix64 output function; also the checkpoint checksum's mixer.
inline uint64_t splitmix_finalize(uint64_t z) {
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
  return z ^ (z >> 31);
}

constexpr uint64_t kGoldenGamma = 0x9E3779B97F4A7C15ull;

// Source of randomness for synthetic streams and delivery faults.
// xoroshiro128+ seeded through SplitMix64, so a seed gives the same stream
// on every platform (std::mt19937 with the standard distributions does not).
class StreamRng {
 public:
  explicit StreamRng(uint64_t seed = 1) {
    uint64_t x = seed;
    s0_ = splitmix_finalize(x += kGoldenGamma);
    s1_ = splitmix_finalize(x += kGoldenGamma);
  }

  uint64_t next() {
    const uint64_t r = s0_ + s1_;
    const uint64_t t = s1_ ^ s0_;
    s0_ = rotl(s0_, 55) ^ t ^ (t << 14);
    s1_ = rotl(t, 36);
    return r;
  }

  // [0,1) with a 53-bit mantissa.
  double uniform() { return (next() >> 11) * (1.0 / 9007199254740992.0); }

  bool chance(double p) { return uniform() < p; }
  bool coin() { return chance(0.5); }

  // Inclusive on both ends.
  int64_t between(int64_t lo, int64_t hi) {
    return lo + static_cast<int64_t>((hi - lo + 1) * uniform());
  }

  std::size_t pick(std::size_t n) {
    return static_cast<std::size_t>(uniform() * n);
  }

  // Marsaglia polar form of Box-Muller; the second deviate is kept for the
  // next call.
  double gaussian(double mean, double sigma) {
    if (spare_ready_) {
      spare_ready_ = false;
      return mean + sigma * spare_;
    }
    double u, v, s;
    do {
      u = 2.0 * uniform() - 1.0;
      v = 2.0 * uniform() - 1.0;
      s = u * u + v * v;
    } while (s == 0.0 || s >= 1.0);
    const double m = std::sqrt(-2.0 * std::log(s) / s);
    spare_ = v * m;
    spare_ready_ = true;
    return mean + sigma * u * m;
  }

 private:
  static uint64_t rotl(uint64_t x, int k) { return (x << k) | (x >> (64 - k)); }

  uint64_t s0_;
  uint64_t s1_;
  double spare_ = 0.0;
  bool spare_ready_ = false;
};

}  // namespace lobr
