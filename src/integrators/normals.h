#ifndef STRATA_INTEGRATORS_NORMALS_H_
#define STRATA_INTEGRATORS_NORMALS_H_

#include "integrators/integrator.h"

namespace strata {

// Debug view: shades each hit by its normal, misses by the sky gradient.
// Noise free apart from the anti-aliasing jitter, so it converges in one pass.
class Normals : public Integrator {
  public:
    RGB Li(const Ray& ray, const Scene& scene, RNG& rng) const override;
};

}  // namespace strata

#endif  // STRATA_INTEGRATORS_NORMALS_H_
