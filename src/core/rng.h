#ifndef STRATA_CORE_RNG_H_
#define STRATA_CORE_RNG_H_

#include <cstdint>

#include "core/constants.h"

namespace strata {

// 64-bit mixing function for RNG seeding (splitmix64). Advances *state and returns
// the scrambled value, so successive calls give decorrelated words from one seed.
inline uint64_t SplitMix64(uint64_t* state) {
    uint64_t z = (*state += 0x9e3779b97f4a7c15ULL);
    z = (z ^ (z >> 30U)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27U)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31U);
}

// xoshiro256+ generator: 256 bits of state, fast and good enough for sampling.
// Not thread safe. Every render worker owns its own instance.
class RNG {
  public:
    explicit RNG(uint64_t seed) {
        for (uint64_t& word : state_) {
            word = SplitMix64(&seed);
        }
    }

    // Returns the next raw 64-bit output
    uint64_t NextUInt64() {
        const uint64_t result = state_[0] + state_[3];
        const uint64_t t = state_[1] << 17U;

        state_[2] ^= state_[0];
        state_[3] ^= state_[1];
        state_[1] ^= state_[2];
        state_[0] ^= state_[3];

        state_[2] ^= t;
        state_[3] = RotateLeft(state_[3], 45);

        return result;
    }

    // Returns an integer in [0, bound) without modulo bias (Lemire's method).
    // The low half of the 128-bit product decides whether the draw is rejected.
    uint64_t UniformUInt64(uint64_t bound) {
        unsigned __int128 m = static_cast<unsigned __int128>(NextUInt64()) * bound;
        auto low = static_cast<uint64_t>(m);

        if (low < bound) {
            const uint64_t threshold = (0 - bound) % bound;
            while (low < threshold) {
                m = static_cast<unsigned __int128>(NextUInt64()) * bound;
                low = static_cast<uint64_t>(m);
            }
        }

        return static_cast<uint64_t>(m >> 64U);
    }

    // Returns double in [0, 1)
    Float UniformDouble() {
        return static_cast<Float>(UniformUInt64(kMantissaLimit - 1)) /
               static_cast<Float>(kMantissaLimit);
    }

    // Returns double in [min, max)
    Float UniformDouble(Float min, Float max) { return min + (max - min) * UniformDouble(); }

  private:
    static constexpr uint64_t kMantissaLimit = (1ULL << 53U) - 1;

    static uint64_t RotateLeft(uint64_t x, int k) { return (x << k) | (x >> (64 - k)); }

    uint64_t state_[4];
};

}  // namespace strata

#endif  // STRATA_CORE_RNG_H_
