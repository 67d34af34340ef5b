#ifndef STRATA_IO_SCENE_LOADER_H_
#define STRATA_IO_SCENE_LOADER_H_

#include <memory>
#include <string>

#include "scene/scene.h"
#include "session/render_options.h"

namespace strata {

// A parsed scene file: the world plus render options merged over the defaults
struct SceneFile {
    std::shared_ptr<Scene> scene;
    RenderOptions options;
};

/**
 * Loads a JSON scene file:
 *
 *   {
 *     "image":     { "width": 400, "aspect_ratio": 1.777, "outfile": "a.ppm", "exrfile": "a.exr" },
 *     "camera":    { "look_from": [..], "look_at": [..], "vup": [..], "vfov": 20,
 *                    "defocus_angle": 0, "focus_dist": 1 },
 *     "render":    { "max_depth": 50, "workers": 0, "seed": 0, "integrator": "path",
 *                    "frame_ms": 16, "target_passes": 0, "max_ticks": 600 },
 *     "materials": { "name": { "type": "lambertian|metal|dielectric",
 *                              "albedo": [..], "fuzz": 0, "ior": 1.5 } },
 *     "spheres":   [ { "center": [..], "radius": 0.5, "material": "name" } ]
 *   }
 *
 * Every block is optional; missing keys keep the value from |defaults|.
 * Throws std::runtime_error naming the offending element on any problem.
 */
SceneFile LoadSceneFile(const std::string& filepath, const RenderOptions& defaults);

// Same as LoadSceneFile but parses an in-memory JSON document
SceneFile ParseSceneJson(const std::string& text, const RenderOptions& defaults);

}  // namespace strata

#endif  // STRATA_IO_SCENE_LOADER_H_
