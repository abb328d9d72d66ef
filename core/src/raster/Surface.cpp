#include "dk/raster/Surface.hpp"
#include "dk/raster/ImageOps.hpp"

#include <algorithm>
#include <cmath>

namespace dk {

namespace {

std::uint8_t toByte(float v) {
  if (v <= 0.0f) return 0;
  if (v >= 1.0f) return 255;
  return static_cast<std::uint8_t>(v * 255.0f + 0.5f);
}

bool insideRoundedRect(double px, double py, double x0, double y0, double x1, double y1,
                       double r) {
  if (px < x0 || px > x1 || py < y0 || py > y1) return false;
  r = std::min(r, std::min(x1 - x0, y1 - y0) * 0.5);
  if (r <= 0) return true;
  double qx = std::min(std::max(px, x0 + r), x1 - r);
  double qy = std::min(std::max(py, y0 + r), y1 - r);
  double dx = px - qx;
  double dy = py - qy;
  return dx * dx + dy * dy <= r * r;
}

} // anonymous namespace

Surface::Surface(int width, int height) : image_(width, height) {}

void Surface::clampSpan(double x0, double y0, double x1, double y1,
                        int& ix0, int& iy0, int& ix1, int& iy1) const {
  ix0 = std::max(0, static_cast<int>(std::floor(x0)));
  iy0 = std::max(0, static_cast<int>(std::floor(y0)));
  ix1 = std::min(image_.width - 1, static_cast<int>(std::ceil(x1)));
  iy1 = std::min(image_.height - 1, static_cast<int>(std::ceil(y1)));
}

void Surface::clear(const Fill& fill) {
  for (int y = 0; y < image_.height; y++) {
    for (int x = 0; x < image_.width; x++) {
      Rgba c = fill.colorAt(x + 0.5, y + 0.5);
      std::uint8_t* p = image_.at(x, y);
      p[0] = toByte(c.r);
      p[1] = toByte(c.g);
      p[2] = toByte(c.b);
      p[3] = toByte(c.a);
    }
  }
}

void Surface::blendPixel(int x, int y, const Rgba& c, float coverage) {
  if (x < 0 || y < 0 || x >= image_.width || y >= image_.height) return;
  float sa = c.a * coverage;
  if (sa <= 0.0f) return;

  std::uint8_t* p = image_.at(x, y);
  if (sa >= 1.0f) {
    p[0] = toByte(c.r);
    p[1] = toByte(c.g);
    p[2] = toByte(c.b);
    p[3] = 255;
    return;
  }

  float da = p[3] / 255.0f;
  float outA = sa + da * (1.0f - sa);
  float dr = p[0] / 255.0f, dg = p[1] / 255.0f, db = p[2] / 255.0f;
  p[0] = toByte((c.r * sa + dr * da * (1.0f - sa)) / outA);
  p[1] = toByte((c.g * sa + dg * da * (1.0f - sa)) / outA);
  p[2] = toByte((c.b * sa + db * da * (1.0f - sa)) / outA);
  p[3] = toByte(outA);
}

void Surface::fillRect(double x0, double y0, double x1, double y1, const Fill& fill) {
  fillRoundedRect(x0, y0, x1, y1, 0.0, fill);
}

void Surface::strokeRect(double x0, double y0, double x1, double y1, double lineWidth,
                         const Fill& fill) {
  strokeRoundedRect(x0, y0, x1, y1, 0.0, lineWidth, fill);
}

void Surface::fillRoundedRect(double x0, double y0, double x1, double y1, double cornerRadius,
                              const Fill& fill) {
  int ix0, iy0, ix1, iy1;
  clampSpan(x0, y0, x1, y1, ix0, iy0, ix1, iy1);
  for (int y = iy0; y <= iy1; y++) {
    double py = y + 0.5;
    for (int x = ix0; x <= ix1; x++) {
      double px = x + 0.5;
      if (!insideRoundedRect(px, py, x0, y0, x1, y1, cornerRadius)) continue;
      blendPixel(x, y, fill.colorAt(px, py));
    }
  }
}

void Surface::strokeRoundedRect(double x0, double y0, double x1, double y1, double cornerRadius,
                                double lineWidth, const Fill& fill) {
  if (lineWidth <= 0) return;
  double innerR = std::max(0.0, cornerRadius - lineWidth);
  int ix0, iy0, ix1, iy1;
  clampSpan(x0, y0, x1, y1, ix0, iy0, ix1, iy1);
  for (int y = iy0; y <= iy1; y++) {
    double py = y + 0.5;
    for (int x = ix0; x <= ix1; x++) {
      double px = x + 0.5;
      if (!insideRoundedRect(px, py, x0, y0, x1, y1, cornerRadius)) continue;
      if (insideRoundedRect(px, py, x0 + lineWidth, y0 + lineWidth,
                            x1 - lineWidth, y1 - lineWidth, innerR)) continue;
      blendPixel(x, y, fill.colorAt(px, py));
    }
  }
}

void Surface::fillCircle(const Point& center, double radius, const Fill& fill) {
  if (radius <= 0) return;
  int ix0, iy0, ix1, iy1;
  clampSpan(center.x - radius, center.y - radius, center.x + radius, center.y + radius,
            ix0, iy0, ix1, iy1);
  double r2 = radius * radius;
  for (int y = iy0; y <= iy1; y++) {
    double py = y + 0.5;
    double dy = py - center.y;
    for (int x = ix0; x <= ix1; x++) {
      double px = x + 0.5;
      double dx = px - center.x;
      if (dx * dx + dy * dy > r2) continue;
      blendPixel(x, y, fill.colorAt(px, py));
    }
  }
}

void Surface::strokeCircle(const Point& center, double radius, double lineWidth,
                           const Fill& fill) {
  if (lineWidth <= 0 || radius <= 0) return;
  double outer = radius + lineWidth * 0.5;
  double inner = std::max(0.0, radius - lineWidth * 0.5);
  int ix0, iy0, ix1, iy1;
  clampSpan(center.x - outer, center.y - outer, center.x + outer, center.y + outer,
            ix0, iy0, ix1, iy1);
  double o2 = outer * outer;
  double i2 = inner * inner;
  for (int y = iy0; y <= iy1; y++) {
    double py = y + 0.5;
    double dy = py - center.y;
    for (int x = ix0; x <= ix1; x++) {
      double px = x + 0.5;
      double dx = px - center.x;
      double d2 = dx * dx + dy * dy;
      if (d2 > o2 || d2 < i2) continue;
      blendPixel(x, y, fill.colorAt(px, py));
    }
  }
}

void Surface::drawLine(const Point& a, const Point& b, double lineWidth, const Fill& fill) {
  double dx = b.x - a.x;
  double dy = b.y - a.y;
  double len = std::sqrt(dx * dx + dy * dy);
  if (len < 1e-6 || lineWidth <= 0) return;

  double hw = lineWidth * 0.5;
  double ux = dx / len;
  double uy = dy / len;

  int ix0, iy0, ix1, iy1;
  clampSpan(std::min(a.x, b.x) - hw, std::min(a.y, b.y) - hw,
            std::max(a.x, b.x) + hw, std::max(a.y, b.y) + hw,
            ix0, iy0, ix1, iy1);
  for (int y = iy0; y <= iy1; y++) {
    double py = y + 0.5;
    for (int x = ix0; x <= ix1; x++) {
      double px = x + 0.5;
      double rx = px - a.x;
      double ry = py - a.y;
      double along = rx * ux + ry * uy;
      if (along < 0 || along > len) continue;
      double perp = std::fabs(rx * uy - ry * ux);
      if (perp > hw) continue;
      blendPixel(x, y, fill.colorAt(px, py));
    }
  }
}

void Surface::fillPolygon(const std::vector<Point>& pts, const Fill& fill) {
  if (pts.size() < 3) return;

  double minY = pts[0].y, maxY = pts[0].y;
  for (const auto& p : pts) {
    minY = std::min(minY, p.y);
    maxY = std::max(maxY, p.y);
  }
  int y0 = std::max(0, static_cast<int>(std::floor(minY)));
  int y1 = std::min(image_.height - 1, static_cast<int>(std::ceil(maxY)));

  std::vector<double> xs;
  const std::size_t n = pts.size();
  for (int y = y0; y <= y1; y++) {
    double py = y + 0.5;
    xs.clear();
    for (std::size_t i = 0; i < n; i++) {
      const Point& p = pts[i];
      const Point& q = pts[(i + 1) % n];
      // Half-open rule so shared vertices count once.
      if ((p.y <= py && q.y > py) || (q.y <= py && p.y > py)) {
        double t = (py - p.y) / (q.y - p.y);
        xs.push_back(p.x + t * (q.x - p.x));
      }
    }
    std::sort(xs.begin(), xs.end());
    for (std::size_t i = 0; i + 1 < xs.size(); i += 2) {
      int xa = std::max(0, static_cast<int>(std::ceil(xs[i] - 0.5)));
      int xb = std::min(image_.width - 1, static_cast<int>(std::ceil(xs[i + 1] - 0.5)) - 1);
      for (int x = xa; x <= xb; x++) {
        blendPixel(x, y, fill.colorAt(x + 0.5, py));
      }
    }
  }
}

void Surface::drawMask(const AlphaMask& mask, const Point& center, double angleDeg,
                       bool mirrorX, bool mirrorY, const Rgba& color) {
  if (mask.empty()) return;
  const double halfW = mask.width * 0.5;
  const double halfH = mask.height * 0.5;
  const double reach = std::sqrt(halfW * halfW + halfH * halfH) + 1.0;

  int ix0, iy0, ix1, iy1;
  clampSpan(center.x - reach, center.y - reach, center.x + reach, center.y + reach,
            ix0, iy0, ix1, iy1);

  const double rad = degToRad(-angleDeg);
  const double c = std::cos(rad);
  const double s = std::sin(rad);

  for (int y = iy0; y <= iy1; y++) {
    for (int x = ix0; x <= ix1; x++) {
      // Destination pixel back into the mask frame.
      double dx = x + 0.5 - center.x;
      double dy = y + 0.5 - center.y;
      double lx = dx * c - dy * s;
      double ly = dx * s + dy * c;
      if (mirrorX) lx = -lx;
      if (mirrorY) ly = -ly;
      double mx = lx + halfW - 0.5;
      double my = ly + halfH - 0.5;

      int mx0 = static_cast<int>(std::floor(mx));
      int my0 = static_cast<int>(std::floor(my));
      double tx = mx - mx0;
      double ty = my - my0;
      double cov = 0.0;
      for (int j = 0; j < 2; j++) {
        for (int i = 0; i < 2; i++) {
          int sx = mx0 + i;
          int sy = my0 + j;
          if (sx < 0 || sy < 0 || sx >= mask.width || sy >= mask.height) continue;
          double w = (i ? tx : 1.0 - tx) * (j ? ty : 1.0 - ty);
          cov += w * mask.at(sx, sy);
        }
      }
      if (cov <= 0.0) continue;
      blendPixel(x, y, color, static_cast<float>(cov / 255.0));
    }
  }
}

void Surface::drawImage(const Image& src, const FillBounds& bounds) {
  if (src.empty() || bounds.width() <= 0 || bounds.height() <= 0) return;
  int ix0, iy0, ix1, iy1;
  clampSpan(bounds.x0, bounds.y0, bounds.x1, bounds.y1, ix0, iy0, ix1, iy1);

  const bool circular = bounds.shape == FillBounds::Shape::Circle;
  const double cx = (bounds.x0 + bounds.x1) * 0.5;
  const double cy = (bounds.y0 + bounds.y1) * 0.5;
  const double r = bounds.width() * 0.5;
  const double sx = src.width / bounds.width();
  const double sy = src.height / bounds.height();

  for (int y = iy0; y <= iy1; y++) {
    double py = y + 0.5;
    if (py < bounds.y0 || py > bounds.y1) continue;
    for (int x = ix0; x <= ix1; x++) {
      double px = x + 0.5;
      if (px < bounds.x0 || px > bounds.x1) continue;
      if (circular) {
        double dx = px - cx;
        double dy = py - cy;
        if (dx * dx + dy * dy > r * r) continue;
      }
      blendPixel(x, y, sampleBilinear(src, (px - bounds.x0) * sx, (py - bounds.y0) * sy, true));
    }
  }
}

} // namespace dk
