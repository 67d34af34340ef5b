#ifndef STRATA_GEOMETRY_SPHERE_H_
#define STRATA_GEOMETRY_SPHERE_H_

#include <cstdint>

#include "core/vec3.h"

namespace strata {

// Material is referenced by index into the owning Scene's material arena
struct Sphere {
    Point3 center;
    Float radius;
    uint32_t material_id;
};

}  // namespace strata

#endif  // STRATA_GEOMETRY_SPHERE_H_
