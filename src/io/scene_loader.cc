#include "io/scene_loader.h"

#include <cstdint>
#include <fstream>
#include <map>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <string>

#include "core/color.h"
#include "core/log.h"
#include "core/vec3.h"
#include "geometry/sphere.h"
#include "materials/material.h"

using json = nlohmann::json;

namespace strata {

//------------------------------------------------------------------------------
// Helpers
//------------------------------------------------------------------------------

static Vec3 ParseVec3(const json& j, const std::string& what) {
    if (!j.is_array() || j.size() != 3) {
        throw std::runtime_error("Expected array of 3 numbers for '" + what + "'");
    }
    return Vec3(j[0].get<double>(), j[1].get<double>(), j[2].get<double>());
}

static RGB ParseRGB(const json& j, const std::string& what) {
    Vec3 v = ParseVec3(j, what);
    return RGB(v.x(), v.y(), v.z());
}

template <typename T>
static T GetOr(const json& j, const std::string& key, const T& default_value) {
    if (j.contains(key)) {
        return j[key].get<T>();
    }
    return default_value;
}

static Vec3 GetVec3Or(const json& j, const std::string& key, const Vec3& default_value) {
    if (j.contains(key)) {
        return ParseVec3(j[key], key);
    }
    return default_value;
}

static RGB GetRGBOr(const json& j, const std::string& key, const RGB& default_value) {
    if (j.contains(key)) {
        return ParseRGB(j[key], key);
    }
    return default_value;
}

//------------------------------------------------------------------------------
// Material Parsing
//------------------------------------------------------------------------------

using MaterialMap = std::map<std::string, uint32_t>;

static MaterialMap ParseMaterials(const json& j, Scene& scene) {
    MaterialMap mat_map;

    if (!j.contains("materials")) {
        return mat_map;
    }

    const auto& mats = j["materials"];
    if (!mats.is_object()) {
        throw std::runtime_error("'materials' must be an object of name -> material");
    }

    for (auto it = mats.begin(); it != mats.end(); ++it) {
        const std::string& name = it.key();
        const json& m = it.value();

        if (!m.contains("type")) {
            throw std::runtime_error("Material '" + name + "' missing 'type' field");
        }
        std::string type = m["type"].get<std::string>();

        Material mat;
        if (type == "lambertian") {
            mat = Material::MakeLambertian(GetRGBOr(m, "albedo", RGB(0.5)));
        } else if (type == "metal") {
            mat = Material::MakeMetal(GetRGBOr(m, "albedo", RGB(0.8)), GetOr(m, "fuzz", 0.0));
        } else if (type == "dielectric") {
            if (!m.contains("ior")) {
                throw std::runtime_error("Dielectric material '" + name + "' missing 'ior'");
            }
            mat = Material::MakeDielectric(m["ior"].get<double>());
        } else {
            throw std::runtime_error("Unknown material type: " + type + " (material '" + name +
                                     "')");
        }

        uint32_t id = scene.AddMaterial(mat);
        mat_map[name] = id;

        LogVerbose("Scene", "Material '" + name + "' -> " + type + " (id=" + std::to_string(id) +
                                ")");
    }

    return mat_map;
}

//------------------------------------------------------------------------------
// Sphere Parsing
//------------------------------------------------------------------------------

static uint32_t LookupMaterial(const json& obj, const MaterialMap& mat_map, int index) {
    if (!obj.contains("material")) {
        throw std::runtime_error("Sphere at index " + std::to_string(index) +
                                 " missing 'material' field");
    }

    std::string mat_name = obj["material"].get<std::string>();
    auto it = mat_map.find(mat_name);
    if (it == mat_map.end()) {
        throw std::runtime_error("Sphere at index " + std::to_string(index) +
                                 ": unknown material '" + mat_name + "'");
    }
    return it->second;
}

static void ParseSpheres(const json& j, const MaterialMap& mat_map, Scene& scene) {
    if (!j.contains("spheres")) {
        return;
    }

    const auto& spheres = j["spheres"];
    if (!spheres.is_array()) {
        throw std::runtime_error("'spheres' must be an array");
    }

    for (int i = 0; i < static_cast<int>(spheres.size()); i++) {
        const auto& obj = spheres[i];
        uint32_t mat_id = LookupMaterial(obj, mat_map, i);

        if (!obj.contains("center") || !obj.contains("radius")) {
            throw std::runtime_error("Sphere at index " + std::to_string(i) +
                                     " needs 'center' and 'radius'");
        }
        Point3 center = ParseVec3(obj["center"], "center");
        Float radius = obj["radius"].get<double>();

        scene.AddSphere(Sphere{center, radius, mat_id});

        std::ostringstream oss;
        oss << "Sphere at (" << center << "), r=" << radius;
        LogVerbose("Scene", oss.str());
    }
}

//------------------------------------------------------------------------------
// Camera & Render Config Parsing
//------------------------------------------------------------------------------

static void ParseConfig(const json& j, RenderOptions& opts) {
    if (j.contains("image")) {
        const auto& img = j["image"];
        ImageConfig& ic = opts.image_config;
        ic.width = GetOr(img, "width", ic.width);
        ic.aspect_ratio = GetOr(img, "aspect_ratio", ic.aspect_ratio);
        ic.outfile = GetOr(img, "outfile", ic.outfile);
        ic.exrfile = GetOr(img, "exrfile", ic.exrfile);
    }

    if (j.contains("camera")) {
        const auto& cam = j["camera"];
        CameraConfig& cc = opts.camera_config;
        cc.look_from = GetVec3Or(cam, "look_from", cc.look_from);
        cc.look_at = GetVec3Or(cam, "look_at", cc.look_at);
        cc.vup = GetVec3Or(cam, "vup", cc.vup);
        cc.vfov = GetOr(cam, "vfov", cc.vfov);
        cc.defocus_angle = GetOr(cam, "defocus_angle", cc.defocus_angle);
        cc.focus_dist = GetOr(cam, "focus_dist", cc.focus_dist);
    }

    if (j.contains("render")) {
        const auto& r = j["render"];
        IntegratorConfig& integ = opts.integrator_config;
        SessionConfig& sess = opts.session_config;

        std::string integrator_str =
            GetOr<std::string>(r, "integrator", IntegratorTypeName(integ.integrator_type));
        if (integrator_str == "path") {
            integ.integrator_type = IntegratorType::PathTrace;
        } else if (integrator_str == "normals") {
            integ.integrator_type = IntegratorType::Normals;
        } else {
            throw std::runtime_error("Unknown integrator type: " + integrator_str);
        }

        integ.max_depth = GetOr(r, "max_depth", integ.max_depth);
        integ.num_workers = GetOr(r, "workers", integ.num_workers);
        integ.seed = GetOr(r, "seed", integ.seed);

        sess.frame_ms = GetOr(r, "frame_ms", sess.frame_ms);
        sess.target_passes = GetOr(r, "target_passes", sess.target_passes);
        sess.max_ticks = GetOr(r, "max_ticks", sess.max_ticks);
    }
}

static SceneFile BuildSceneFile(const json& j, const RenderOptions& defaults) {
    if (!j.is_object()) {
        throw std::runtime_error("Scene document must be a JSON object");
    }

    SceneFile result;
    result.scene = std::make_shared<Scene>();
    result.options = defaults;

    try {
        // 1. Materials first (spheres reference them by name)
        MaterialMap mat_map = ParseMaterials(j, *result.scene);

        // 2. Geometry
        ParseSpheres(j, mat_map, *result.scene);

        // 3. Camera and render config
        ParseConfig(j, result.options);
    } catch (const json::exception& e) {
        // Type mismatches surface from get<T>()
        throw std::runtime_error(std::string("Invalid scene value: ") + e.what());
    }

    Log("Scene", std::to_string(result.scene->NumSpheres()) + " spheres, " +
                     std::to_string(result.scene->NumMaterials()) + " materials");
    return result;
}

//------------------------------------------------------------------------------
// Entry Points
//------------------------------------------------------------------------------

SceneFile ParseSceneJson(const std::string& text, const RenderOptions& defaults) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("JSON parse error: " + std::string(e.what()));
    }
    return BuildSceneFile(j, defaults);
}

SceneFile LoadSceneFile(const std::string& filepath, const RenderOptions& defaults) {
    Log("Scene", "Loading scene file: " + filepath);

    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open scene file: " + filepath);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("JSON parse error in '" + filepath +
                                 "': " + std::string(e.what()));
    }

    return BuildSceneFile(j, defaults);
}

}  // namespace strata
