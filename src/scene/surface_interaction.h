#ifndef STRATA_SCENE_SURFACE_INTERACTION_H_
#define STRATA_SCENE_SURFACE_INTERACTION_H_

#include <cstdint>

#include "core/ray.h"
#include "core/vec3.h"

namespace strata {

// The hit record. Filled by an intersection query and consumed right away by the
// integrator; never stored.
struct SurfaceInteraction {
    Point3 p;         // Exact point of intersection
    Vec3 n;           // Unit normal, always facing against the incoming ray
    Float t;          // Distance along the ray
    bool front_face;  // Did the ray hit the outside of the surface?
    uint32_t material_id;

    // outward_normal must be unit length
    inline void SetFaceNormal(const Ray& r, const Vec3& outward_normal) {
        front_face = Dot(r.direction(), outward_normal) < 0;
        n = front_face ? outward_normal : -outward_normal;
    }
};

}  // namespace strata

#endif  // STRATA_SCENE_SURFACE_INTERACTION_H_
