#include "session/render_options.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <thread>

namespace strata {

void ValidateOptions(const RenderOptions& options) {
    const ImageConfig& image = options.image_config;
    const CameraConfig& cam = options.camera_config;
    const IntegratorConfig& integrator = options.integrator_config;

    if (image.width < 1) {
        throw std::invalid_argument("Image width must be at least 1, got " +
                                    std::to_string(image.width));
    }
    if (!(image.aspect_ratio > 0)) {
        throw std::invalid_argument("Aspect ratio must be positive");
    }
    if (integrator.max_depth < 1) {
        throw std::invalid_argument("Max depth must be at least 1, got " +
                                    std::to_string(integrator.max_depth));
    }
    if (integrator.num_workers < 1 || integrator.num_workers > image.width) {
        throw std::invalid_argument("Worker count must be in [1, " + std::to_string(image.width) +
                                    "], got " +
                                    std::to_string(integrator.num_workers));
    }
    if (!(cam.vfov > 0 && cam.vfov < kStraightAngle)) {
        throw std::invalid_argument("Vertical field of view must be in (0, 180) degrees");
    }
    if (!(cam.focus_dist > 0)) {
        throw std::invalid_argument("Focus distance must be positive");
    }
    if (cam.defocus_angle < 0) {
        throw std::invalid_argument("Defocus angle must not be negative");
    }
    if ((cam.look_from - cam.look_at).NearZero()) {
        throw std::invalid_argument("look_from and look_at must differ");
    }
    if (Cross(cam.vup, cam.look_from - cam.look_at).NearZero()) {
        throw std::invalid_argument("vup must not be parallel to the view direction");
    }
}

int ResolveWorkerCount(int requested, int image_width) {
    int count = requested;
    if (count == 0) {
        count = static_cast<int>(std::thread::hardware_concurrency());
        if (count == 0) count = 4;  // Fallback
        count = std::max(1, std::min(count, image_width));
    }
    return count;
}

const char* IntegratorTypeName(IntegratorType type) {
    switch (type) {
        case IntegratorType::PathTrace:
            return "path";
        case IntegratorType::Normals:
            return "normals";
    }
    return "unknown";
}

}  // namespace strata
