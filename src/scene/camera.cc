#include "scene/camera.h"

#include <cmath>

#include "core/constants.h"
#include "core/sampling.h"

namespace strata {

Camera::Camera(const ImageConfig& image, const CameraConfig& config)
    : image_width_(image.width),
      image_height_(image.height()),
      defocus_angle_(config.defocus_angle) {
    center_ = config.look_from;

    // Viewport is placed on the focus plane, so its size scales with focus_dist
    Float theta = DegreesToRadians(config.vfov);
    Float h = std::tan(theta / 2);
    Float viewport_height = 2 * h * config.focus_dist;
    Float viewport_width = viewport_height * (Float(image_width_) / image_height_);

    // Calculate basis vecs
    w_ = Normalize(config.look_from - config.look_at);  // inverse forward (points backwards)
    u_ = Normalize(Cross(config.vup, w_));              // right
    v_ = Cross(w_, u_);                                 // up

    // Horizontal/Vertical viewport edge vectors. Vertical is flipped so rows go down.
    Vec3 viewport_u = viewport_width * u_;
    Vec3 viewport_v = viewport_height * -v_;

    pixel_delta_u_ = viewport_u / image_width_;
    pixel_delta_v_ = viewport_v / image_height_;

    Point3 viewport_upper_left =
        center_ - (config.focus_dist * w_) - viewport_u / 2 - viewport_v / 2;
    pixel00_loc_ = viewport_upper_left + 0.5 * (pixel_delta_u_ + pixel_delta_v_);

    defocus_radius_ = config.focus_dist * std::tan(DegreesToRadians(config.defocus_angle / 2));
    defocus_disk_u_ = u_ * defocus_radius_;
    defocus_disk_v_ = v_ * defocus_radius_;
}

Ray Camera::GetRay(int i, int j, RNG& rng) const {
    // Box filter: uniform offset inside the pixel footprint
    Vec3 offset = SampleSquare(rng);
    Point3 pixel_sample = pixel00_loc_ + ((i + offset.x()) * pixel_delta_u_) +
                          ((j + offset.y()) * pixel_delta_v_);

    Point3 ray_origin = (defocus_angle_ <= 0) ? center_ : DefocusDiskSample(rng);
    return Ray(ray_origin, pixel_sample - ray_origin);
}

Point3 Camera::DefocusDiskSample(RNG& rng) const {
    Vec3 p = RandomInUnitDisk(rng);
    return center_ + (p[0] * defocus_disk_u_) + (p[1] * defocus_disk_v_);
}

}  // namespace strata
