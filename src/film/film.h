#ifndef STRATA_FILM_FILM_H_
#define STRATA_FILM_FILM_H_

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

#include "core/color.h"

namespace strata {

// Horizontal extent of one vertical strip, in full-image pixel columns
struct StripBounds {
    int x_offset;
    int width;
};

// Splits [0, image_width) into count contiguous strips. Strip i covers
// [i*W/n, (i+1)*W/n) with integer division, so widths differ by at most one.
// Throws std::invalid_argument if count is not in [1, image_width].
std::vector<StripBounds> PartitionStrips(int image_width, int count);

/**
 * The canvas of one strip.
 *
 * accum_ holds the running sum of every sample per pixel. It is written only by
 * the strip's worker and read by others only while that worker is parked.
 * pixels_ is the RGBA8 display copy shared with the presentation layer; a whole
 * row is published under one hold of pixels_mutex_, so readers never see a pixel
 * with channels from different passes.
 */
class Film {
  public:
    // Scoped read access to the display bytes. Holds the strip lock while alive,
    // keep it short.
    class PixelLock {
      public:
        const uint8_t* data() const { return pixels_->data(); }
        size_t size() const { return pixels_->size(); }
        int width() const { return width_; }
        int height() const { return height_; }

        // RGBA of local pixel (x, y)
        const uint8_t* at(int x, int y) const {
            return pixels_->data() + 4 * (static_cast<size_t>(y) * width_ + x);
        }

      private:
        friend class Film;
        PixelLock(std::mutex& mutex, const std::vector<uint8_t>& pixels, int width, int height)
            : lock_(mutex), pixels_(&pixels), width_(width), height_(height) {}

        std::unique_lock<std::mutex> lock_;
        const std::vector<uint8_t>* pixels_;
        int width_;
        int height_;
    };

    Film(const StripBounds& bounds, int height);

    // Adds one sample to local pixel (x, y)
    void AddSample(int x, int y, const RGB& L);

    // Converts row y of the accumulator to display bytes (divide by passes,
    // gamma 2, scale to [0, 255], alpha 255) and publishes it
    void ResolveRow(int y, int passes);

    PixelLock LockPixels() const;

    // Linear mean color of local pixel (x, y) after passes samples
    RGB Average(int x, int y, int passes) const;

    const StripBounds& bounds() const { return bounds_; }
    int width() const { return bounds_.width; }
    int height() const { return height_; }

  private:
    StripBounds bounds_;
    int height_;
    std::vector<RGB> accum_;           // row-major running sums
    std::vector<uint8_t> row_bytes_;   // staging for one resolved row
    mutable std::mutex pixels_mutex_;
    std::vector<uint8_t> pixels_;      // RGBA8, row-major
};

}  // namespace strata

#endif  // STRATA_FILM_FILM_H_
