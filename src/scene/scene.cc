#include "scene/scene.h"

#include <cstdint>
#include <stdexcept>
#include <string>

#include "core/constants.h"
#include "core/ray.h"
#include "geometry/intersect_sphere.h"
#include "geometry/sphere.h"
#include "materials/material.h"
#include "scene/surface_interaction.h"

namespace strata {

uint32_t Scene::AddMaterial(const Material& m) {
    materials_.push_back(m);
    return static_cast<uint32_t>(materials_.size() - 1);
}

uint32_t Scene::AddSphere(const Sphere& s) {
    if (s.material_id >= materials_.size()) {
        throw std::out_of_range("Sphere references unknown material id " +
                                std::to_string(s.material_id));
    }
    spheres_.push_back(s);
    return static_cast<uint32_t>(spheres_.size() - 1);
}

bool Scene::Intersect(const Ray& r, Float t_min, Float t_max, SurfaceInteraction* si) const {
    bool hit_anything = false;
    Float closest_t = t_max;

    for (const auto& sphere : spheres_) {
        // Pass closest_t as the new max distance to prune objects behind the hit
        if (IntersectSphere(r, sphere, t_min, closest_t, si)) {
            hit_anything = true;
            closest_t = si->t;
        }
    }

    return hit_anything;
}

}  // namespace strata
