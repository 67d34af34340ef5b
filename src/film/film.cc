#include "film/film.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace strata {

std::vector<StripBounds> PartitionStrips(int image_width, int count) {
    if (count < 1 || count > image_width) {
        throw std::invalid_argument("Cannot split " + std::to_string(image_width) +
                                    " columns into " + std::to_string(count) + " strips");
    }

    std::vector<StripBounds> strips;
    strips.reserve(count);
    for (int i = 0; i < count; ++i) {
        // 64-bit products so very wide images cannot overflow
        int begin = static_cast<int>(static_cast<int64_t>(i) * image_width / count);
        int end = static_cast<int>(static_cast<int64_t>(i + 1) * image_width / count);
        strips.push_back(StripBounds{begin, end - begin});
    }
    return strips;
}

Film::Film(const StripBounds& bounds, int height)
    : bounds_(bounds),
      height_(height),
      accum_(static_cast<size_t>(bounds.width) * height),
      row_bytes_(static_cast<size_t>(bounds.width) * 4),
      pixels_(static_cast<size_t>(bounds.width) * height * 4, 0) {}

void Film::AddSample(int x, int y, const RGB& L) {
    accum_[static_cast<size_t>(y) * bounds_.width + x] += L;
}

void Film::ResolveRow(int y, int passes) {
    const Float scale = 1.0 / passes;
    const size_t row_start = static_cast<size_t>(y) * bounds_.width;

    for (int x = 0; x < bounds_.width; ++x) {
        RGB c = accum_[row_start + x] * scale;
        uint8_t* p = &row_bytes_[4 * static_cast<size_t>(x)];
        p[0] = ToDisplayByte(c.r());
        p[1] = ToDisplayByte(c.g());
        p[2] = ToDisplayByte(c.b());
        p[3] = 255;
    }

    std::lock_guard<std::mutex> lock(pixels_mutex_);
    std::copy(row_bytes_.begin(), row_bytes_.end(), pixels_.begin() + 4 * row_start);
}

Film::PixelLock Film::LockPixels() const {
    return PixelLock(pixels_mutex_, pixels_, bounds_.width, height_);
}

RGB Film::Average(int x, int y, int passes) const {
    if (passes <= 0) return RGB(0.0);
    return accum_[static_cast<size_t>(y) * bounds_.width + x] / passes;
}

}  // namespace strata
