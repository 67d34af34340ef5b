#ifndef STRATA_FILM_IMAGE_BUFFER_H_
#define STRATA_FILM_IMAGE_BUFFER_H_

#include <vector>

#include "core/color.h"

namespace strata {

// Full-image linear color, assembled from the strips for export
class ImageBuffer {
  public:
    ImageBuffer(int width, int height);

    // Set a pixel's color (0,0 is top-left). Out of bounds writes are ignored.
    void SetPixel(int x, int y, const RGB& color);

    // Throws std::out_of_range outside the image
    const RGB& GetPixel(int x, int y) const;

    int GetWidth() const { return width_; }
    int GetHeight() const { return height_; }

  private:
    int width_;
    int height_;
    std::vector<RGB> pixels_;
};

}  // namespace strata

#endif  // STRATA_FILM_IMAGE_BUFFER_H_
