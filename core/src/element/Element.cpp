#include "dk/element/Element.hpp"

#include <algorithm>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace dk {

const char* toString(ElementKind k) {
  switch (k) {
    case ElementKind::Face:     return "Face";
    case ElementKind::Ticks:    return "Ticks";
    case ElementKind::Numerals: return "Numerals";
    case ElementKind::Hands:    return "Hands";
    case ElementKind::Overlay:  return "Overlay";
  }
  return "Unknown";
}

bool parseElementKind(const std::string& tag, ElementKind& out) {
  static const ElementKind kAll[] = {ElementKind::Face, ElementKind::Ticks,
                                     ElementKind::Numerals, ElementKind::Hands,
                                     ElementKind::Overlay};
  for (ElementKind k : kAll) {
    if (tag == toString(k)) {
      out = k;
      return true;
    }
  }
  return false;
}

int zOrderFor(ElementKind k) {
  switch (k) {
    case ElementKind::Face:     return 0;
    case ElementKind::Ticks:    return 1;
    case ElementKind::Numerals: return 2;
    case ElementKind::Overlay:  return 3;
    case ElementKind::Hands:    return 4;
  }
  return 0;
}

DialFrame Placement::resolve(const DrawContext& ctx) const {
  DialFrame f;
  f.scale = ctx.scale;
  f.canvasWidth = ctx.surface.width();
  f.canvasHeight = ctx.surface.height();
  f.center = hasCenter ? Point{center.x * ctx.scale, center.y * ctx.scale}
                       : ctx.canvasCenter;
  f.radius = hasRadius ? radius * ctx.scale : ctx.canvasRadius;
  return f;
}

Status readPlacement(const PropertyReader& reader, Placement& out) {
  Placement p;
  if (reader.has("center")) {
    Status st = reader.readPoint("center", p.center);
    if (!st.ok) return st;
    p.hasCenter = true;
  }
  if (reader.has("radius")) {
    Status st = reader.readPositive("radius", p.radius);
    if (!st.ok) return st;
    p.hasRadius = true;
  }
  out = p;
  return {};
}

std::string toJsonText(const rapidjson::Value& v) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  v.Accept(writer);
  return sb.GetString();
}

} // namespace dk
