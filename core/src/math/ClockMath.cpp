#include "dk/math/ClockMath.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>

namespace dk {

Point pointOnCircle(const Point& center, double radius, double angleDeg) {
  double rad = degToRad(angleDeg - 90.0);
  return {center.x + radius * std::cos(rad), center.y + radius * std::sin(rad)};
}

Point rotatePoint(const Point& p, const Point& pivot, double angleDeg) {
  double rad = degToRad(angleDeg);
  double c = std::cos(rad);
  double s = std::sin(rad);
  double dx = p.x - pivot.x;
  double dy = p.y - pivot.y;
  // Y points down, so this standard rotation reads clockwise on screen.
  return {pivot.x + dx * c - dy * s, pivot.y + dx * s + dy * c};
}

namespace {

bool parseIntField(const std::string& s, int maxDigits, int& out) {
  if (s.empty() || static_cast<int>(s.size()) > maxDigits) return false;
  int v = 0;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    v = v * 10 + (c - '0');
  }
  out = v;
  return true;
}

bool parseSecondsField(const std::string& s, double& out) {
  auto dot = s.find('.');
  int whole = 0;
  if (!parseIntField(s.substr(0, dot), 2, whole)) return false;
  double frac = 0.0;
  if (dot != std::string::npos) {
    std::string fs = s.substr(dot + 1);
    if (fs.empty()) return false;
    double scale = 0.1;
    for (char c : fs) {
      if (!std::isdigit(static_cast<unsigned char>(c))) return false;
      frac += (c - '0') * scale;
      scale *= 0.1;
    }
  }
  out = whole + frac;
  return true;
}

} // anonymous namespace

Status parseTimeString(const std::string& text, TimeValue& out) {
  auto bad = [&](const char* why) {
    return configError("BAD_TIME",
                       std::string("Invalid time '") + text + "': " + why +
                       " (expected H:MM:SS)",
                       "{\"time\":" + jsonQuote(text) + "}");
  };

  auto c1 = text.find(':');
  if (c1 == std::string::npos) return bad("missing ':'");
  auto c2 = text.find(':', c1 + 1);
  if (c2 == std::string::npos) return bad("missing seconds");
  if (text.find(':', c2 + 1) != std::string::npos) return bad("too many fields");

  TimeValue t;
  if (!parseIntField(text.substr(0, c1), 2, t.hours)) return bad("bad hours");
  if (!parseIntField(text.substr(c1 + 1, c2 - c1 - 1), 2, t.minutes)) return bad("bad minutes");
  if (!parseSecondsField(text.substr(c2 + 1), t.seconds)) return bad("bad seconds");

  if (t.hours > 23) return bad("hours out of range 0-23");
  if (t.minutes > 59) return bad("minutes out of range 0-59");
  if (t.seconds >= 60.0) return bad("seconds out of range 0-59");

  out = t;
  return {};
}

HandAngles computeHandAngles(const TimeValue& t, bool mode24h) {
  HandAngles a;
  double s = t.seconds;
  double m = static_cast<double>(t.minutes);
  a.second = s * 6.0;
  a.minute = m * 6.0 + s * 0.1;
  if (mode24h) {
    a.hour = t.hours * 15.0 + m * 0.25 + s * (0.25 / 60.0);
  } else {
    a.hour = (t.hours % 12) * 30.0 + m * 0.5 + s * (0.5 / 60.0);
  }
  return a;
}

} // namespace dk
