#ifndef STRATA_SCENE_CAMERA_H_
#define STRATA_SCENE_CAMERA_H_

#include "core/ray.h"
#include "core/rng.h"
#include "core/vec3.h"
#include "session/render_options.h"

namespace strata {

// LookAt thin-lens camera. Pixel (0, 0) is the top-left corner of the image;
// i grows to the right and j grows downwards.
class Camera {
  public:
    Camera(const ImageConfig& image, const CameraConfig& config);

    // Ray through a jittered point of pixel (i, j) in full-image coordinates.
    // Starts on the defocus disk when defocus_angle > 0, at the camera center
    // otherwise.
    Ray GetRay(int i, int j, RNG& rng) const;

    int image_width() const { return image_width_; }
    int image_height() const { return image_height_; }

    const Point3& center() const { return center_; }
    const Point3& pixel00() const { return pixel00_loc_; }
    const Vec3& pixel_delta_u() const { return pixel_delta_u_; }
    const Vec3& pixel_delta_v() const { return pixel_delta_v_; }
    Float defocus_radius() const { return defocus_radius_; }

  private:
    Point3 DefocusDiskSample(RNG& rng) const;

    int image_width_;
    int image_height_;
    Float defocus_angle_;
    Float defocus_radius_;
    Point3 center_;         // Camera center
    Point3 pixel00_loc_;    // Location of pixel 0, 0
    Vec3 pixel_delta_u_;    // Offset to pixel to the right
    Vec3 pixel_delta_v_;    // Offset to pixel below
    Vec3 u_, v_, w_;        // Camera frame basis vectors
    Vec3 defocus_disk_u_;   // Defocus disk horizontal radius
    Vec3 defocus_disk_v_;   // Defocus disk vertical radius
};

}  // namespace strata

#endif  // STRATA_SCENE_CAMERA_H_
