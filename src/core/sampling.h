#ifndef STRATA_CORE_SAMPLING_H_
#define STRATA_CORE_SAMPLING_H_

#include <cmath>

#include "core/constants.h"
#include "core/rng.h"
#include "core/vec3.h"

namespace strata {

// Components are drawn x, y, z in that order. Argument evaluation order is
// unspecified, so the draws are sequenced through locals to keep streams portable.
inline Vec3 RandomVec3(RNG& rng, Float min, Float max) {
    Float x = rng.UniformDouble(min, max);
    Float y = rng.UniformDouble(min, max);
    Float z = rng.UniformDouble(min, max);
    return Vec3(x, y, z);
}

// Rejection method for a random direction on the unit sphere.
// The lower bound keeps tiny vectors from blowing up when normalized.
inline Vec3 RandomUnitVector(RNG& rng) {
    while (true) {
        Vec3 p = RandomVec3(rng, -1, 1);
        Float lensq = p.LengthSquared();
        if (1e-160 < lensq && lensq <= 1) {
            return p / std::sqrt(lensq);
        }
    }
}

// Defocus disk
inline Vec3 RandomInUnitDisk(RNG& rng) {
    while (true) {
        Float x = rng.UniformDouble(-1, 1);
        Float y = rng.UniformDouble(-1, 1);
        auto p = Vec3(x, y, 0);
        if (p.LengthSquared() < 1) return p;
    }
}

// Returns the vector to a random point in the [-0.5,-0.5]-[+0.5,+0.5] unit square
inline Vec3 SampleSquare(RNG& rng) {
    Float x = rng.UniformDouble() - 0.5;
    Float y = rng.UniformDouble() - 0.5;
    return Vec3(x, y, 0);
}

}  // namespace strata

#endif  // STRATA_CORE_SAMPLING_H_
