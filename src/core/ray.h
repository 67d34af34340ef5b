#ifndef STRATA_CORE_RAY_H_
#define STRATA_CORE_RAY_H_

#include "core/vec3.h"

namespace strata {

class Ray {
  public:
    Ray() {}

    Ray(const Point3& origin, const Vec3& direction) : orig_(origin), dir_(direction) {}

    const Point3& origin() const { return orig_; }
    const Vec3& direction() const { return dir_; }

    // 3D pos (P) on Ray is function of P(t) = A + tb, A = origin, b = Ray direction
    Point3 at(Float t) const { return orig_ + t * dir_; }

  private:
    Point3 orig_;
    Vec3 dir_;
};

}  // namespace strata

#endif  // STRATA_CORE_RAY_H_
