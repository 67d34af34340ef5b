#ifndef STRATA_CORE_CONSTANTS_H_
#define STRATA_CORE_CONSTANTS_H_

#include <cstdint>
#include <limits>

namespace strata {

using Float = double;  // Global precision switch

constexpr Float kInfinity = std::numeric_limits<Float>::infinity();
constexpr Float kPi = 3.1415926535897932385;
static constexpr Float kStraightAngle = 180.0;

constexpr uint64_t kGoldenRatio = 0x9E3779B97F4A7C15ULL;

// Components below this magnitude count as zero (degenerate scatter directions)
constexpr Float kNearZero = 1e-8;

// Minimum hit distance for secondary rays. Keeps a scattered ray from re-hitting
// the surface it left because of floating point error (shadow acne).
constexpr Float kShadowEpsilon = 0.001;

inline Float DegreesToRadians(Float degrees) { return degrees * kPi / kStraightAngle; }

}  // namespace strata

#endif  // STRATA_CORE_CONSTANTS_H_
