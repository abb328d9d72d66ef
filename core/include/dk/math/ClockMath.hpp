#pragma once
#include "dk/core/Status.hpp"

#include <string>

namespace dk {

// Screen-space point (pixels, Y down).
struct Point {
  double x{0};
  double y{0};
};

constexpr double kPi = 3.14159265358979323846;

inline double degToRad(double deg) { return deg * kPi / 180.0; }

// Clock angles are measured in degrees clockwise from 12 o'clock (negative Y).
Point pointOnCircle(const Point& center, double radius, double angleDeg);

// Clockwise rotation of `p` around `pivot` (screen space, Y down).
Point rotatePoint(const Point& p, const Point& pivot, double angleDeg);

inline double fractionToAngle(double fraction) { return fraction * 360.0; }

// index * 360/divisions + rotation. divisions must be >= 1.
inline double divisionAngle(double index, int divisions, double rotationDeg = 0.0) {
  return index * 360.0 / static_cast<double>(divisions) + rotationDeg;
}

struct TimeValue {
  int hours{12};
  int minutes{0};
  double seconds{0};
};

// Parse "H:MM:SS" / "HH:MM:SS" with optional fractional seconds.
Status parseTimeString(const std::string& text, TimeValue& out);

struct HandAngles {
  double hour{0};
  double minute{0};
  double second{0};
};

// Continuous hand angles: every hand includes the contribution of the
// smaller units (the hour hand moves with minutes and seconds).
HandAngles computeHandAngles(const TimeValue& t, bool mode24h);

} // namespace dk
