#include "integrators/path_trace.h"

#include "core/constants.h"
#include "core/vec3.h"
#include "materials/scatter.h"
#include "scene/surface_interaction.h"

namespace strata {

RGB Background(const Ray& r) {
    Vec3 unit_direction = Normalize(r.direction());
    Float a = 0.5 * (unit_direction.y() + 1.0);
    return (1.0 - a) * RGB(1.0, 1.0, 1.0) + a * RGB(0.5, 0.7, 1.0);
}

RGB RayColor(RNG& rng, int depth, const Ray& r, const Scene& scene) {
    // Bounce budget exhausted
    if (depth <= 0) return RGB(0.0);

    SurfaceInteraction si;
    if (scene.Intersect(r, kShadowEpsilon, kInfinity, &si)) {
        ScatterRecord srec;
        if (Scatter(scene.GetMaterial(si.material_id), r, si, rng, &srec)) {
            return srec.attenuation * RayColor(rng, depth - 1, srec.scattered, scene);
        }
        return RGB(0.0);  // Absorbed
    }

    return Background(r);
}

}  // namespace strata
