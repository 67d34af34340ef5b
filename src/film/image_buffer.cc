#include "film/image_buffer.h"

#include <stdexcept>
#include <string>

namespace strata {

ImageBuffer::ImageBuffer(int width, int height) : width_(width), height_(height) {
    pixels_.resize(static_cast<size_t>(width) * height);
}

void ImageBuffer::SetPixel(int x, int y, const RGB& color) {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) return;
    pixels_[static_cast<size_t>(y) * width_ + x] = color;
}

const RGB& ImageBuffer::GetPixel(int x, int y) const {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        throw std::out_of_range("Pixel (" + std::to_string(x) + ", " + std::to_string(y) +
                                ") outside " + std::to_string(width_) + "x" +
                                std::to_string(height_) + " image");
    }
    return pixels_[static_cast<size_t>(y) * width_ + x];
}

}  // namespace strata
