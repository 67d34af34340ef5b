#include "io/image_io.h"

#include <ImathBox.h>
#include <ImfArray.h>
#include <ImfRgba.h>
#include <ImfRgbaFile.h>

#include <cstddef>
#include <exception>
#include <fstream>
#include <stdexcept>

#include "core/log.h"

namespace strata {

void ImageIO::SavePPM(int width, int height, const std::vector<uint8_t>& rgba,
                      const std::string& filename) {
    if (rgba.size() != static_cast<size_t>(width) * height * 4) {
        throw std::runtime_error("SavePPM: buffer size does not match " + std::to_string(width) +
                                 "x" + std::to_string(height));
    }

    std::ofstream out(filename);
    if (!out) {
        throw std::runtime_error("Could not open " + filename + " for writing");
    }

    // PPM Header: P3 = ASCII RGB, then width, height, max_val
    out << "P3\n" << width << " " << height << "\n255\n";
    for (size_t i = 0; i < rgba.size(); i += 4) {
        out << int(rgba[i]) << " " << int(rgba[i + 1]) << " " << int(rgba[i + 2]) << "\n";
    }

    if (!out) {
        throw std::runtime_error("Failed while writing " + filename);
    }
    Log("ImageIO", "Wrote " + filename);
}

PPMImage ImageIO::LoadPPM(const std::string& filename) {
    std::ifstream in(filename);
    if (!in) {
        throw std::runtime_error("Could not open " + filename);
    }

    std::string magic;
    int max_val = 0;
    PPMImage img;
    in >> magic >> img.width >> img.height >> max_val;
    if (!in || magic != "P3" || img.width <= 0 || img.height <= 0 || max_val != 255) {
        throw std::runtime_error(filename + " is not an 8-bit ASCII PPM");
    }

    img.rgb.resize(static_cast<size_t>(img.width) * img.height * 3);
    for (auto& channel : img.rgb) {
        int v = 0;
        if (!(in >> v) || v < 0 || v > max_val) {
            throw std::runtime_error(filename + ": truncated or invalid pixel data");
        }
        channel = static_cast<uint8_t>(v);
    }
    return img;
}

void ImageIO::SaveEXR(const ImageBuffer& buf, const std::string& filename) {
    const int width = buf.GetWidth();
    const int height = buf.GetHeight();

    Imf::Array2D<Imf::Rgba> pixels(height, width);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const RGB& c = buf.GetPixel(x, y);
            pixels[y][x] = Imf::Rgba(static_cast<float>(c.r()), static_cast<float>(c.g()),
                                     static_cast<float>(c.b()), 1.0f);
        }
    }

    try {
        Imf::RgbaOutputFile file(filename.c_str(), width, height, Imf::WRITE_RGBA);
        file.setFrameBuffer(&pixels[0][0], 1, width);
        file.writePixels(height);
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to write EXR " + filename + ": " + e.what());
    }
    Log("ImageIO", "Wrote " + filename);
}

ImageBuffer ImageIO::LoadEXR(const std::string& filename) {
    try {
        Imf::RgbaInputFile file(filename.c_str());
        const Imath::Box2i dw = file.dataWindow();
        const int width = dw.max.x - dw.min.x + 1;
        const int height = dw.max.y - dw.min.y + 1;

        Imf::Array2D<Imf::Rgba> pixels(height, width);
        // Frame buffer base is addressed in data window coordinates
        file.setFrameBuffer(&pixels[0][0] - dw.min.x - static_cast<ptrdiff_t>(dw.min.y) * width,
                            1, width);
        file.readPixels(dw.min.y, dw.max.y);

        ImageBuffer buf(width, height);
        for (int y = 0; y < height; ++y) {
            for (int x = 0; x < width; ++x) {
                const Imf::Rgba& p = pixels[y][x];
                buf.SetPixel(x, y, RGB(float(p.r), float(p.g), float(p.b)));
            }
        }
        return buf;
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to read EXR " + filename + ": " + e.what());
    }
}

}  // namespace strata
