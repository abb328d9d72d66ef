#include "dk/raster/ImageOps.hpp"
#include "dk/math/ClockMath.hpp"

#include <algorithm>
#include <cmath>

namespace dk {

namespace {

std::uint8_t toByte(double v) {
  if (v <= 0.0) return 0;
  if (v >= 255.0) return 255;
  return static_cast<std::uint8_t>(v + 0.5);
}

void storeRgba(std::uint8_t* px, const Rgba& c) {
  px[0] = toByte(c.r * 255.0);
  px[1] = toByte(c.g * 255.0);
  px[2] = toByte(c.b * 255.0);
  px[3] = toByte(c.a * 255.0);
}

} // anonymous namespace

Rgba sampleBilinear(const Image& img, double fx, double fy, bool clampEdges) {
  if (img.empty()) return {0, 0, 0, 0};
  double sx = fx - 0.5;
  double sy = fy - 0.5;
  int x0 = static_cast<int>(std::floor(sx));
  int y0 = static_cast<int>(std::floor(sy));
  double tx = sx - x0;
  double ty = sy - y0;

  double acc[4] = {0, 0, 0, 0};
  for (int j = 0; j < 2; j++) {
    for (int i = 0; i < 2; i++) {
      int x = x0 + i;
      int y = y0 + j;
      if (clampEdges) {
        x = std::min(std::max(x, 0), img.width - 1);
        y = std::min(std::max(y, 0), img.height - 1);
      } else if (x < 0 || y < 0 || x >= img.width || y >= img.height) {
        continue;
      }
      double w = (i ? tx : 1.0 - tx) * (j ? ty : 1.0 - ty);
      const std::uint8_t* p = img.at(x, y);
      double a = p[3] / 255.0;
      acc[0] += w * a * p[0] / 255.0;
      acc[1] += w * a * p[1] / 255.0;
      acc[2] += w * a * p[2] / 255.0;
      acc[3] += w * a;
    }
  }
  if (acc[3] <= 0.0) return {0, 0, 0, 0};
  return {static_cast<float>(acc[0] / acc[3]), static_cast<float>(acc[1] / acc[3]),
          static_cast<float>(acc[2] / acc[3]), static_cast<float>(acc[3])};
}

Image downsampleBox(const Image& src, int factor) {
  if (factor <= 1) return src;
  const int w = src.width / factor;
  const int h = src.height / factor;
  Image out(w, h);
  const double n = static_cast<double>(factor) * factor;

  for (int y = 0; y < h; y++) {
    for (int x = 0; x < w; x++) {
      double r = 0, g = 0, b = 0, a = 0;
      for (int sy = 0; sy < factor; sy++) {
        for (int sx = 0; sx < factor; sx++) {
          const std::uint8_t* p = src.at(x * factor + sx, y * factor + sy);
          double pa = p[3];
          r += p[0] * pa;
          g += p[1] * pa;
          b += p[2] * pa;
          a += pa;
        }
      }
      std::uint8_t* d = out.at(x, y);
      if (a > 0) {
        d[0] = toByte(r / a);
        d[1] = toByte(g / a);
        d[2] = toByte(b / a);
      }
      d[3] = toByte(a / n);
    }
  }
  return out;
}

Image flipHorizontal(const Image& src) {
  Image out(src.width, src.height);
  for (int y = 0; y < src.height; y++) {
    for (int x = 0; x < src.width; x++) {
      std::copy_n(src.at(src.width - 1 - x, y), 4, out.at(x, y));
    }
  }
  return out;
}

Image transposeImage(const Image& src) {
  Image out(src.height, src.width);
  for (int y = 0; y < out.height; y++) {
    for (int x = 0; x < out.width; x++) {
      std::copy_n(src.at(y, x), 4, out.at(x, y));
    }
  }
  return out;
}

Image rotateImage(const Image& src, double angleDeg) {
  double norm = std::fmod(angleDeg, 360.0);
  if (norm < 0) norm += 360.0;

  if (norm == 0.0) return src;

  if (norm == 90.0 || norm == 270.0) {
    Image out(src.height, src.width);
    for (int y = 0; y < src.height; y++) {
      for (int x = 0; x < src.width; x++) {
        int dx = (norm == 90.0) ? src.height - 1 - y : y;
        int dy = (norm == 90.0) ? x : src.width - 1 - x;
        std::copy_n(src.at(x, y), 4, out.at(dx, dy));
      }
    }
    return out;
  }

  if (norm == 180.0) {
    Image out(src.width, src.height);
    for (int y = 0; y < src.height; y++) {
      for (int x = 0; x < src.width; x++) {
        std::copy_n(src.at(x, y), 4, out.at(src.width - 1 - x, src.height - 1 - y));
      }
    }
    return out;
  }

  double rad = degToRad(norm);
  double c = std::fabs(std::cos(rad));
  double s = std::fabs(std::sin(rad));
  int w = static_cast<int>(std::ceil(src.width * c + src.height * s - 1e-9));
  int h = static_cast<int>(std::ceil(src.width * s + src.height * c - 1e-9));
  Image out(w, h);

  Point srcCenter{src.width * 0.5, src.height * 0.5};
  Point dstCenter{w * 0.5, h * 0.5};
  for (int y = 0; y < h; y++) {
    for (int x = 0; x < w; x++) {
      Point d{x + 0.5 - dstCenter.x + srcCenter.x, y + 0.5 - dstCenter.y + srcCenter.y};
      Point p = rotatePoint(d, srcCenter, -norm);
      storeRgba(out.at(x, y), sampleBilinear(src, p.x, p.y, false));
    }
  }
  return out;
}

} // namespace dk
