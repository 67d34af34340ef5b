#ifndef STRATA_SESSION_RENDER_OPTIONS_H_
#define STRATA_SESSION_RENDER_OPTIONS_H_

#include <cstdint>
#include <string>

#include "core/constants.h"
#include "core/vec3.h"

namespace strata {

enum class IntegratorType {
    PathTrace,
    Normals,
};

struct ImageConfig {
    int width = 400;
    Float aspect_ratio = 16.0 / 9.0;
    std::string outfile = "strata.ppm";
    std::string exrfile;  // empty = no EXR

    // Derived from width and aspect ratio, at least 1
    int height() const {
        int h = static_cast<int>(width / aspect_ratio);
        return h < 1 ? 1 : h;
    }
};

struct CameraConfig {
    Float vfov = 90;                      // Vertical view angle (degrees)
    Point3 look_from = Point3(0, 0, 0);   // Point camera is looking from
    Point3 look_at = Point3(0, 0, -1);    // Point camera is looking at
    Vec3 vup = Vec3(0, 1, 0);             // Camera-relative "up" direction
    Float defocus_angle = 0;              // Variation angle of rays through each pixel
    Float focus_dist = 1;                 // Distance to the plane of perfect focus
};

struct IntegratorConfig {
    int max_depth = 50;
    int num_workers = 1;  // One strip per worker, in [1, image width]
    uint64_t seed = 0;
    IntegratorType integrator_type = IntegratorType::PathTrace;
};

// Host loop settings, used by the CLI
struct SessionConfig {
    int frame_ms = 16;      // Time budget per Render() tick
    int target_passes = 0;  // Stop once every strip reached this many passes. 0 = no target
    int max_ticks = 600;
};

struct RenderOptions {
    ImageConfig image_config;
    CameraConfig camera_config;
    IntegratorConfig integrator_config;
    SessionConfig session_config;
};

// Throws std::invalid_argument describing the first bad setting
void ValidateOptions(const RenderOptions& options);

// Host-side helper: a requested count of 0 means one worker per hardware thread.
// The result is clamped to image_width. RenderSession itself never accepts 0.
int ResolveWorkerCount(int requested, int image_width);

const char* IntegratorTypeName(IntegratorType type);

}  // namespace strata

#endif  // STRATA_SESSION_RENDER_OPTIONS_H_
