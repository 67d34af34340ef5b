#ifndef STRATA_MATERIALS_SCATTER_H_
#define STRATA_MATERIALS_SCATTER_H_

#include <cmath>

#include "core/color.h"
#include "core/constants.h"
#include "core/ray.h"
#include "core/rng.h"
#include "core/sampling.h"
#include "core/vec3.h"
#include "materials/material.h"
#include "scene/surface_interaction.h"

namespace strata {

struct ScatterRecord {
    RGB attenuation;  // How much of the light from the next bounce survives
    Ray scattered;    // Where the path goes next
};

inline Float Reflectance(Float cosine, Float refraction_ratio) {
    // Use Schlick's approximation for reflectance.
    Float r0 = (1 - refraction_ratio) / (1 + refraction_ratio);
    r0 = r0 * r0;
    return r0 + (1 - r0) * std::pow((1 - cosine), 5);
}

/**
 * Takes the incoming ray and the hit and fills srec with:
 * - Attenuation: how much light was absorbed (the color).
 * - Scattered Ray: the new direction the path travels, starting at the hit point.
 * Returns false if the ray is absorbed. srec is only meaningful on true.
 */
inline bool Scatter(const Material& mat, const Ray& r_in, const SurfaceInteraction& si, RNG& rng,
                    ScatterRecord* srec) {
    switch (mat.type) {
        //------------------------------------------------------------------------------
        // Lambertian (diffuse) material
        //------------------------------------------------------------------------------
        case MaterialType::Lambertian: {
            Vec3 scatter_direction = si.n + RandomUnitVector(rng);
            // degenerate scatter direction case (random vector opposite of normal)
            if (scatter_direction.NearZero()) scatter_direction = si.n;

            srec->attenuation = mat.albedo;
            srec->scattered = Ray(si.p, scatter_direction);
            return true;
        }
        //------------------------------------------------------------------------------
        // Metal (reflective) material
        //------------------------------------------------------------------------------
        case MaterialType::Metal: {
            Vec3 reflected = Reflect(r_in.direction(), si.n);
            // Fuzziness: push the tip of the unit reflection onto a random sphere
            reflected = Normalize(reflected) + (mat.fuzz * RandomUnitVector(rng));

            srec->attenuation = mat.albedo;
            srec->scattered = Ray(si.p, reflected);
            // Fuzz can push the direction below the surface: absorb it
            return Dot(reflected, si.n) > 0;
        }
        //------------------------------------------------------------------------------
        // Dielectric (glass/transparent) material
        //------------------------------------------------------------------------------
        case MaterialType::Dielectric: {
            // Entering the surface uses 1/ior, leaving it uses ior
            Float refraction_ratio = si.front_face ? (1.0 / mat.ior) : mat.ior;

            Vec3 unit_direction = Normalize(r_in.direction());
            Float cos_theta = std::fmin(Dot(-unit_direction, si.n), 1.0);
            Float sin_theta = std::sqrt(1.0 - cos_theta * cos_theta);

            // Total internal reflection
            bool cannot_refract = refraction_ratio * sin_theta > 1.0;

            // Schlick's approx for fresnel: glass reflects more when seen edge-on
            Vec3 direction;
            if (cannot_refract || Reflectance(cos_theta, refraction_ratio) > rng.UniformDouble())
                direction = Reflect(unit_direction, si.n);
            else
                direction = Refract(unit_direction, si.n, refraction_ratio);

            srec->attenuation = RGB(1.0);  // Glass doesn't absorb
            srec->scattered = Ray(si.p, direction);
            return true;
        }
    }
    return false;
}

}  // namespace strata

#endif  // STRATA_MATERIALS_SCATTER_H_
