#include "integrators/normals.h"

#include "core/constants.h"
#include "core/vec3.h"
#include "scene/surface_interaction.h"

namespace strata {

RGB Normals::Li(const Ray& ray, const Scene& scene, RNG& /*rng*/) const {
    SurfaceInteraction si;
    if (scene.Intersect(ray, kShadowEpsilon, kInfinity, &si)) {
        // Normals range from -1.0 to 1.0; map them to 0.0 to 1.0 for display
        return 0.5 * RGB(si.n.x() + 1.0, si.n.y() + 1.0, si.n.z() + 1.0);
    }
    return Background(ray);
}

}  // namespace strata
