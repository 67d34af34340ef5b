#ifndef STRATA_MATERIALS_MATERIAL_H_
#define STRATA_MATERIALS_MATERIAL_H_

#include <algorithm>
#include <cstdint>

#include "core/color.h"
#include "core/constants.h"

namespace strata {

enum class MaterialType : uint8_t { Lambertian, Metal, Dielectric };

// Closed set of surface types, dispatched with a switch in Scatter().
// Plain immutable data: the scene owns them and every worker reads them.
struct Material {
    MaterialType type = MaterialType::Lambertian;
    RGB albedo = RGB(1.0);  // Lambertian and Metal tint
    Float fuzz = 0;         // Metal only, in [0, 1]. 0 = perfect mirror
    Float ior = 1;          // Dielectric only, index of refraction

    static Material MakeLambertian(const RGB& albedo) {
        Material m;
        m.type = MaterialType::Lambertian;
        m.albedo = albedo;
        return m;
    }

    static Material MakeMetal(const RGB& albedo, Float fuzz) {
        Material m;
        m.type = MaterialType::Metal;
        m.albedo = albedo;
        m.fuzz = std::clamp(fuzz, 0.0, 1.0);
        return m;
    }

    static Material MakeDielectric(Float ior) {
        Material m;
        m.type = MaterialType::Dielectric;
        m.ior = ior;
        return m;
    }
};

inline const char* MaterialTypeName(MaterialType type) {
    switch (type) {
        case MaterialType::Lambertian:
            return "lambertian";
        case MaterialType::Metal:
            return "metal";
        case MaterialType::Dielectric:
            return "dielectric";
    }
    return "unknown";
}

}  // namespace strata

#endif  // STRATA_MATERIALS_MATERIAL_H_
