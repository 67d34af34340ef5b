#ifndef STRATA_SCENE_SCENE_H_
#define STRATA_SCENE_SCENE_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/constants.h"
#include "geometry/sphere.h"
#include "materials/material.h"

namespace strata {

class Ray;
struct SurfaceInteraction;

/**
 * The "World": an append-only list of spheres plus the material arena they index.
 *
 * Built once on one thread, then handed to RenderSession as
 * std::shared_ptr<const Scene>. Every worker reads it concurrently through the
 * const interface only.
 */
class Scene {
  public:
    Scene() = default;

    // Returns the material id used by AddSphere
    uint32_t AddMaterial(const Material& m);

    // Returns the index of the added sphere. Throws std::out_of_range for an
    // unknown material id.
    uint32_t AddSphere(const Sphere& s);

    const Material& GetMaterial(uint32_t id) const { return materials_[id]; }
    const Sphere& GetSphere(uint32_t index) const { return spheres_[index]; }

    size_t NumSpheres() const { return spheres_.size(); }
    size_t NumMaterials() const { return materials_.size(); }

    // Nearest hit strictly inside (t_min, t_max). Linear scan over all spheres:
    // each hit shrinks the search range to the closest t found so far.
    bool Intersect(const Ray& r, Float t_min, Float t_max, SurfaceInteraction* si) const;

  private:
    std::vector<Sphere> spheres_;
    std::vector<Material> materials_;
};

}  // namespace strata

#endif  // STRATA_SCENE_SCENE_H_
