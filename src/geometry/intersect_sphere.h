#ifndef STRATA_GEOMETRY_INTERSECT_SPHERE_H_
#define STRATA_GEOMETRY_INTERSECT_SPHERE_H_

#include <cmath>

#include "core/ray.h"
#include "core/vec3.h"
#include "geometry/sphere.h"
#include "scene/surface_interaction.h"

namespace strata {

// Solves |O + tD - C|^2 = r^2 in the reduced form (b = -2h).
// Accepts the nearest root strictly inside (t_min, t_max); si is untouched on a miss.
inline bool IntersectSphere(const Ray& r, const Sphere& s, Float t_min, Float t_max,
                            SurfaceInteraction* si) {
    Vec3 oc = s.center - r.origin();
    Float a = r.direction().LengthSquared();
    Float h = Dot(r.direction(), oc);
    Float c = oc.LengthSquared() - s.radius * s.radius;

    Float discriminant = h * h - a * c;
    if (discriminant < 0) return false;

    Float sqrtd = std::sqrt(discriminant);
    Float root = (h - sqrtd) / a;
    if (root <= t_min || root >= t_max) {
        root = (h + sqrtd) / a;
        if (root <= t_min || root >= t_max) return false;
    }

    si->t = root;
    si->p = r.at(root);
    si->SetFaceNormal(r, (si->p - s.center) / s.radius);
    si->material_id = s.material_id;
    return true;
}

}  // namespace strata

#endif  // STRATA_GEOMETRY_INTERSECT_SPHERE_H_
