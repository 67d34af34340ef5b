#ifndef STRATA_IO_IMAGE_IO_H_
#define STRATA_IO_IMAGE_IO_H_

#include <cstdint>
#include <string>
#include <vector>

#include "film/image_buffer.h"

namespace strata {

// 8-bit RGB image as read back from a PPM file
struct PPMImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> rgb;
};

// All functions throw std::runtime_error when the file cannot be written or read
class ImageIO {
  public:
    // Writes display bytes (RGBA8, row-major) as an ASCII PPM, alpha dropped
    static void SavePPM(int width, int height, const std::vector<uint8_t>& rgba,
                        const std::string& filename);

    // Writes linear color as a half float RGBA OpenEXR with alpha 1
    static void SaveEXR(const ImageBuffer& buf, const std::string& filename);

    static PPMImage LoadPPM(const std::string& filename);

    static ImageBuffer LoadEXR(const std::string& filename);
};

}  // namespace strata

#endif  // STRATA_IO_IMAGE_IO_H_
