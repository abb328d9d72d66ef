#pragma once
#include "dk/math/ClockMath.hpp"
#include "dk/raster/Image.hpp"
#include "dk/style/Gradient.hpp"

#include <utility>
#include <vector>

namespace dk {

// CPU drawing target for one render. Shapes are sampled once at each pixel
// center; edge smoothing comes from supersampling in the compositor.
class Surface {
public:
  Surface(int width, int height);

  int width() const { return image_.width; }
  int height() const { return image_.height; }

  const Image& image() const { return image_; }
  Image release() { return std::move(image_); }

  // Overwrite every pixel (no blending).
  void clear(const Fill& fill);

  // Source-over blend of `c` scaled by `coverage`.
  void blendPixel(int x, int y, const Rgba& c, float coverage = 1.0f);

  void fillRect(double x0, double y0, double x1, double y1, const Fill& fill);
  void strokeRect(double x0, double y0, double x1, double y1, double lineWidth,
                  const Fill& fill);
  void fillRoundedRect(double x0, double y0, double x1, double y1, double cornerRadius,
                       const Fill& fill);
  void strokeRoundedRect(double x0, double y0, double x1, double y1, double cornerRadius,
                         double lineWidth, const Fill& fill);

  void fillCircle(const Point& center, double radius, const Fill& fill);
  // Annulus between radius - width/2 and radius + width/2.
  void strokeCircle(const Point& center, double radius, double lineWidth, const Fill& fill);

  // Thick segment with butt caps.
  void drawLine(const Point& a, const Point& b, double lineWidth, const Fill& fill);

  // Even-odd scanline fill.
  void fillPolygon(const std::vector<Point>& pts, const Fill& fill);

  // Composite a coverage mask centered on `center`, rotated clockwise by
  // `angleDeg`, optionally mirrored in its own frame before rotation.
  void drawMask(const AlphaMask& mask, const Point& center, double angleDeg,
                bool mirrorX, bool mirrorY, const Rgba& color);

  // Scale `src` into `bounds`; circular bounds clip to the inscribed circle.
  void drawImage(const Image& src, const FillBounds& bounds);

private:
  Image image_;

  void clampSpan(double x0, double y0, double x1, double y1,
                 int& ix0, int& iy0, int& ix1, int& iy1) const;
};

} // namespace dk
