#pragma once
#include "dk/core/Status.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include <rapidjson/document.h>

namespace dk {

// Straight (non-premultiplied) color, channels in [0,1].
struct Rgba {
  float r{0}, g{0}, b{0}, a{1};
};

inline bool operator==(const Rgba& x, const Rgba& y) {
  return x.r == y.r && x.g == y.g && x.b == y.b && x.a == y.a;
}

enum class PaintKind : std::uint8_t { Solid, Linear, Radial };

const char* toString(PaintKind k);

struct ColorStop {
  float pos{0};
  Rgba color{};
};

// A solid color or a gradient description, resolved per shape by resolveFill().
struct ColorSpec {
  PaintKind kind{PaintKind::Solid};
  Rgba solid{};
  std::vector<ColorStop> stops;  // gradients only, sorted by pos
  double angleDeg{0};            // linear: 0 = bottom to top, 90 = left to right
  double centerX{0.5};           // radial: normalized within the bounds
  double centerY{0.5};

  bool isGradient() const { return kind != PaintKind::Solid; }

  // Representative single color (solid, or the first gradient stop).
  Rgba primary() const { return stops.empty() ? solid : stops.front().color; }
};

ColorSpec solidColor(const Rgba& c);
ColorSpec solidColor(float r, float g, float b, float a = 1.0f);

// Named color (CSS table + "transparent"), #rgb, #rgba, #rrggbb, #rrggbbaa,
// rgb(r,g,b), rgba(r,g,b,a).
Status parseColorToken(const std::string& text, Rgba& out);

// String token, [r,g,b(,a)] array with 0-255 channels, or gradient object.
Status parseColorSpec(const rapidjson::Value& v, ColorSpec& out);

// "#rrggbbaa" for a single color.
std::string formatColorHex(const Rgba& c);

// JSON text that parseColorSpec() reads back to the same spec.
std::string colorSpecToJson(const ColorSpec& spec);

// CSS named color lookup; name must be lower case. rgb is 0xRRGGBB.
bool lookupNamedColor(const std::string& name, std::uint32_t& rgb);

} // namespace dk
