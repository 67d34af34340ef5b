#ifndef STRATA_INTEGRATORS_PATH_TRACE_H_
#define STRATA_INTEGRATORS_PATH_TRACE_H_

#include "core/color.h"
#include "core/ray.h"
#include "core/rng.h"
#include "integrators/integrator.h"
#include "scene/scene.h"

namespace strata {

/**
 * Recursive path tracing, RTIOW style:
 *          Color = Attenuation x RayColor(scattered, depth - 1)
 * depth is the remaining bounce budget. At 0 the path contributes black.
 */
RGB RayColor(RNG& rng, int depth, const Ray& r, const Scene& scene);

class PathTrace : public Integrator {
  public:
    explicit PathTrace(int max_depth) : max_depth_(max_depth) {}

    RGB Li(const Ray& ray, const Scene& scene, RNG& rng) const override {
        return RayColor(rng, max_depth_, ray, scene);
    }

    int max_depth() const { return max_depth_; }

  private:
    int max_depth_;
};

}  // namespace strata

#endif  // STRATA_INTEGRATORS_PATH_TRACE_H_
