#include "dk/style/Gradient.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace dk {

FillBounds FillBounds::rect(double x0, double y0, double x1, double y1) {
  FillBounds b;
  b.shape = Shape::Rect;
  b.x0 = x0; b.y0 = y0; b.x1 = x1; b.y1 = y1;
  return b;
}

FillBounds FillBounds::circle(const Point& center, double radius) {
  FillBounds b;
  b.shape = Shape::Circle;
  b.x0 = center.x - radius; b.y0 = center.y - radius;
  b.x1 = center.x + radius; b.y1 = center.y + radius;
  return b;
}

Rgba sampleStops(const std::vector<ColorStop>& stops, double t) {
  if (stops.empty()) return {};
  t = std::min(1.0, std::max(0.0, t));
  if (t <= stops.front().pos) return stops.front().color;
  if (t >= stops.back().pos) return stops.back().color;

  for (std::size_t i = 1; i < stops.size(); i++) {
    const ColorStop& a = stops[i - 1];
    const ColorStop& b = stops[i];
    if (t > b.pos) continue;
    double span = b.pos - a.pos;
    float f = span > 0 ? static_cast<float>((t - a.pos) / span) : 1.0f;
    return {a.color.r + (b.color.r - a.color.r) * f,
            a.color.g + (b.color.g - a.color.g) * f,
            a.color.b + (b.color.b - a.color.b) * f,
            a.color.a + (b.color.a - a.color.a) * f};
  }
  return stops.back().color;
}

Fill::Fill(const ColorSpec& spec, const FillBounds& bounds)
  : spec_(spec), bounds_(bounds) {
  if (spec_.kind == PaintKind::Linear) {
    double rad = degToRad(spec_.angleDeg);
    dirX_ = std::sin(rad);
    dirY_ = -std::cos(rad);
    // Extremes of the bounding box along the gradient axis.
    const double xs[2] = {bounds_.x0, bounds_.x1};
    const double ys[2] = {bounds_.y0, bounds_.y1};
    projMin_ = std::numeric_limits<double>::max();
    projMax_ = std::numeric_limits<double>::lowest();
    for (double x : xs) {
      for (double y : ys) {
        double p = x * dirX_ + y * dirY_;
        projMin_ = std::min(projMin_, p);
        projMax_ = std::max(projMax_, p);
      }
    }
  } else if (spec_.kind == PaintKind::Radial) {
    center_.x = bounds_.x0 + spec_.centerX * bounds_.width();
    center_.y = bounds_.y0 + spec_.centerY * bounds_.height();
  }
}

double Fill::radialEdgeDistance(double dx, double dy) const {
  // (dx, dy) is a unit direction from center_; returns the distance along it
  // to where the ray leaves the bounding shape.
  if (bounds_.shape == FillBounds::Shape::Circle) {
    double r = bounds_.width() * 0.5;
    double ox = center_.x - (bounds_.x0 + r);
    double oy = center_.y - (bounds_.y0 + r);
    double b = dx * ox + dy * oy;
    double c = ox * ox + oy * oy - r * r;
    double disc = b * b - c;
    if (disc < 0) return 0;
    return -b + std::sqrt(disc);
  }

  double t = std::numeric_limits<double>::max();
  if (dx > 0) t = std::min(t, (bounds_.x1 - center_.x) / dx);
  if (dx < 0) t = std::min(t, (bounds_.x0 - center_.x) / dx);
  if (dy > 0) t = std::min(t, (bounds_.y1 - center_.y) / dy);
  if (dy < 0) t = std::min(t, (bounds_.y0 - center_.y) / dy);
  return t == std::numeric_limits<double>::max() ? 0 : t;
}

double Fill::rampAt(double x, double y) const {
  switch (spec_.kind) {
    case PaintKind::Solid:
      return 0.0;
    case PaintKind::Linear: {
      double span = projMax_ - projMin_;
      if (span <= 0) return 0.0;
      return ((x * dirX_ + y * dirY_) - projMin_) / span;
    }
    case PaintKind::Radial: {
      double dx = x - center_.x;
      double dy = y - center_.y;
      double dist = std::sqrt(dx * dx + dy * dy);
      if (dist <= 0) return 0.0;
      double edge = radialEdgeDistance(dx / dist, dy / dist);
      if (edge <= 0) return 1.0;
      return std::min(1.0, dist / edge);
    }
  }
  return 0.0;
}

Rgba Fill::colorAt(double x, double y) const {
  if (spec_.kind == PaintKind::Solid) return spec_.solid;
  return sampleStops(spec_.stops, rampAt(x, y));
}

} // namespace dk
