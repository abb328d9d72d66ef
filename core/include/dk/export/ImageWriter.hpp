#pragma once
#include "dk/core/Status.hpp"
#include "dk/raster/Image.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace dk {

enum class ImageFormat : std::uint8_t { Png, Ppm, Jpeg, Bmp };

// Case-insensitive: .png, .ppm, .jpg/.jpeg, .bmp. A path without an
// extension is PNG. Any other extension returns false.
bool formatForPath(const std::string& path, ImageFormat& out);

// PNG bytes (8-bit RGBA). Self-contained encoder using stored deflate
// blocks, so no zlib/libpng dependency.
std::vector<std::uint8_t> encodePNG(const Image& img);

bool writePNG(const std::string& path, const Image& img);

// Binary PPM (RGB; alpha is dropped).
bool writePPM(const std::string& path, const Image& img);

// JPEG has no alpha: pixels are composited over white first.
bool writeJPEG(const std::string& path, const Image& img, int quality = 90);

bool writeBMP(const std::string& path, const Image& img);

// Write by extension. UNSUPPORTED_FORMAT for an unknown extension,
// WRITE_FAILED when the file cannot be written; both are IoErrors.
Status saveImage(const std::string& path, const Image& img);

} // namespace dk
