#pragma once
#include "dk/math/ClockMath.hpp"
#include "dk/style/Color.hpp"

#include <vector>

namespace dk {

// Shape a gradient is resolved against.
struct FillBounds {
  enum class Shape : std::uint8_t { Rect, Circle };

  Shape shape{Shape::Rect};
  double x0{0}, y0{0}, x1{0}, y1{0};  // bounding box

  static FillBounds rect(double x0, double y0, double x1, double y1);
  static FillBounds circle(const Point& center, double radius);

  double width() const { return x1 - x0; }
  double height() const { return y1 - y0; }
};

// Linear interpolation across sorted stops; t is clamped to [0,1].
Rgba sampleStops(const std::vector<ColorStop>& stops, double t);

// A ColorSpec bound to a shape, evaluable at any pixel.
class Fill {
public:
  Fill() = default;
  Fill(const ColorSpec& spec, const FillBounds& bounds);

  bool isSolid() const { return spec_.kind == PaintKind::Solid; }

  // Ramp position in [0,1] for gradient fills (0 for solids).
  double rampAt(double x, double y) const;

  Rgba colorAt(double x, double y) const;

private:
  ColorSpec spec_{};
  FillBounds bounds_{};

  // Linear
  double dirX_{0}, dirY_{-1};
  double projMin_{0}, projMax_{1};

  // Radial
  Point center_{};

  double radialEdgeDistance(double dx, double dy) const;
};

inline Fill resolveFill(const ColorSpec& spec, const FillBounds& bounds) {
  return Fill(spec, bounds);
}

} // namespace dk
