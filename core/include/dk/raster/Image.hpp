#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace dk {

// 8-bit RGBA raster, straight alpha, row-major, top-down.
struct Image {
  int width{0};
  int height{0};
  std::vector<std::uint8_t> pixels;

  Image() = default;
  Image(int w, int h) : width(w), height(h),
    pixels(static_cast<std::size_t>(w) * static_cast<std::size_t>(h) * 4, 0) {}

  bool empty() const { return width <= 0 || height <= 0; }

  std::size_t offset(int x, int y) const {
    return (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
            static_cast<std::size_t>(x)) * 4;
  }
  std::uint8_t* at(int x, int y) { return &pixels[offset(x, y)]; }
  const std::uint8_t* at(int x, int y) const { return &pixels[offset(x, y)]; }
};

// 8-bit coverage bitmap (rasterized text).
struct AlphaMask {
  int width{0};
  int height{0};
  std::vector<std::uint8_t> alpha;

  AlphaMask() = default;
  AlphaMask(int w, int h) : width(w), height(h),
    alpha(static_cast<std::size_t>(w) * static_cast<std::size_t>(h), 0) {}

  bool empty() const { return width <= 0 || height <= 0; }
  std::uint8_t& at(int x, int y) {
    return alpha[static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
                 static_cast<std::size_t>(x)];
  }
  std::uint8_t at(int x, int y) const {
    return alpha[static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
                 static_cast<std::size_t>(x)];
  }
};

} // namespace dk
