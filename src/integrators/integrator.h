#ifndef STRATA_INTEGRATORS_INTEGRATOR_H_
#define STRATA_INTEGRATORS_INTEGRATOR_H_

#include "core/color.h"
#include "core/ray.h"
#include "core/rng.h"
#include "scene/scene.h"

namespace strata {

// Computes the radiance carried back along one camera ray.
// Implementations are stateless, so one instance is shared by every worker.
class Integrator {
  public:
    virtual ~Integrator() = default;

    virtual RGB Li(const Ray& ray, const Scene& scene, RNG& rng) const = 0;
};

// Sky gradient seen by rays that leave the scene: white at the bottom, blue on top
RGB Background(const Ray& r);

}  // namespace strata

#endif  // STRATA_INTEGRATORS_INTEGRATOR_H_
