#include "dk/style/Color.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace dk {

const char* toString(PaintKind k) {
  switch (k) {
    case PaintKind::Solid:  return "solid";
    case PaintKind::Linear: return "linear";
    case PaintKind::Radial: return "radial";
  }
  return "unknown";
}

ColorSpec solidColor(const Rgba& c) {
  ColorSpec s;
  s.kind = PaintKind::Solid;
  s.solid = c;
  return s;
}

ColorSpec solidColor(float r, float g, float b, float a) {
  return solidColor(Rgba{r, g, b, a});
}

namespace {

Status badColor(const std::string& text, const char* why) {
  return configError("BAD_COLOR",
                     std::string("Invalid color '") + text + "': " + why,
                     "{\"color\":" + jsonQuote(text) + "}");
}

int hexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

std::string trim(const std::string& s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
  return s.substr(b, e - b);
}

bool parseHex(const std::string& hex, Rgba& out) {
  const std::size_t n = hex.size();
  if (n != 3 && n != 4 && n != 6 && n != 8) return false;
  int ch[4] = {255, 255, 255, 255};
  if (n == 3 || n == 4) {
    for (std::size_t i = 0; i < n; i++) {
      int d = hexDigit(hex[i]);
      if (d < 0) return false;
      ch[i] = d * 17;
    }
  } else {
    for (std::size_t i = 0; i < n / 2; i++) {
      int hi = hexDigit(hex[i * 2]);
      int lo = hexDigit(hex[i * 2 + 1]);
      if (hi < 0 || lo < 0) return false;
      ch[i] = hi * 16 + lo;
    }
  }
  out = {ch[0] / 255.0f, ch[1] / 255.0f, ch[2] / 255.0f, ch[3] / 255.0f};
  return true;
}

// "rgb(r,g,b)" / "rgba(r,g,b,a)": r,g,b in 0-255, a in 0-1.
bool parseFunctional(const std::string& s, Rgba& out) {
  bool hasAlpha = s.compare(0, 5, "rgba(") == 0;
  std::size_t open = hasAlpha ? 4 : 3;
  if (!hasAlpha && s.compare(0, 4, "rgb(") != 0) return false;
  if (s.back() != ')') return false;

  std::string body = s.substr(open + 1, s.size() - open - 2);
  double vals[4] = {0, 0, 0, 1};
  int count = 0;
  std::size_t pos = 0;
  while (pos <= body.size() && count < 4) {
    std::size_t comma = body.find(',', pos);
    std::string part = trim(body.substr(pos, comma == std::string::npos
                                                ? std::string::npos : comma - pos));
    if (part.empty()) return false;
    char* end = nullptr;
    vals[count] = std::strtod(part.c_str(), &end);
    if (!end || *end != '\0') return false;
    count++;
    if (comma == std::string::npos) break;
    pos = comma + 1;
  }
  if (count != (hasAlpha ? 4 : 3)) return false;
  for (int i = 0; i < 3; i++) {
    if (vals[i] < 0 || vals[i] > 255) return false;
  }
  if (vals[3] < 0 || vals[3] > 1) return false;
  out = {static_cast<float>(vals[0] / 255.0), static_cast<float>(vals[1] / 255.0),
         static_cast<float>(vals[2] / 255.0), static_cast<float>(vals[3])};
  return true;
}

Status parseChannelArray(const rapidjson::Value& arr, Rgba& out) {
  if (arr.Size() != 3 && arr.Size() != 4) {
    return configError("BAD_COLOR", "Color array must have 3 or 4 channels");
  }
  float ch[4] = {0, 0, 0, 255};
  for (rapidjson::SizeType i = 0; i < arr.Size(); i++) {
    if (!arr[i].IsNumber()) return configError("BAD_COLOR", "Color channel must be a number");
    double v = arr[i].GetDouble();
    if (v < 0 || v > 255) return configError("BAD_COLOR", "Color channel out of range 0-255");
    ch[i] = static_cast<float>(v);
  }
  out = {ch[0] / 255.0f, ch[1] / 255.0f, ch[2] / 255.0f, ch[3] / 255.0f};
  return {};
}

Status parseStopColor(const rapidjson::Value& v, Rgba& out) {
  if (v.IsString()) return parseColorToken(v.GetString(), out);
  if (v.IsArray()) return parseChannelArray(v, out);
  return configError("BAD_COLOR", "Gradient color must be a string or channel array");
}

Status parseGradient(const rapidjson::Value& obj, ColorSpec& out) {
  auto typeIt = obj.FindMember("type");
  if (typeIt == obj.MemberEnd() || !typeIt->value.IsString()) {
    return configError("BAD_GRADIENT", "Gradient object requires a string 'type'");
  }
  std::string type = typeIt->value.GetString();

  ColorSpec spec;
  if (type == "linear" || type == "linear_gradient") {
    spec.kind = PaintKind::Linear;
  } else if (type == "radial" || type == "radial_gradient") {
    spec.kind = PaintKind::Radial;
  } else {
    return configError("BAD_GRADIENT", "Unknown gradient type: " + type,
                       "{\"type\":" + jsonQuote(type) + "}");
  }

  auto colorsIt = obj.FindMember("colors");
  if (colorsIt == obj.MemberEnd() || !colorsIt->value.IsArray()) {
    return configError("BAD_GRADIENT", "Gradient requires a 'colors' list");
  }
  const auto& colors = colorsIt->value;
  if (colors.Size() < 2) {
    return configError("BAD_GRADIENT", "Gradient needs at least 2 color stops",
                       "{\"stops\":" + std::to_string(colors.Size()) + "}");
  }

  std::vector<float> positions;
  auto stopsIt = obj.FindMember("stops");
  if (stopsIt != obj.MemberEnd()) {
    const auto& stops = stopsIt->value;
    if (!stops.IsArray() || stops.Size() != colors.Size()) {
      return configError("BAD_GRADIENT", "'stops' must be a list matching 'colors' in length");
    }
    float prev = 0.0f;
    for (rapidjson::SizeType i = 0; i < stops.Size(); i++) {
      if (!stops[i].IsNumber()) return configError("BAD_GRADIENT", "Stop position must be a number");
      float p = static_cast<float>(stops[i].GetDouble());
      if (p < 0.0f || p > 1.0f || p < prev) {
        return configError("BAD_GRADIENT", "Stop positions must be non-decreasing within [0,1]");
      }
      positions.push_back(p);
      prev = p;
    }
  } else {
    for (rapidjson::SizeType i = 0; i < colors.Size(); i++) {
      positions.push_back(static_cast<float>(i) / static_cast<float>(colors.Size() - 1));
    }
  }

  for (rapidjson::SizeType i = 0; i < colors.Size(); i++) {
    ColorStop stop;
    stop.pos = positions[i];
    Status st = parseStopColor(colors[i], stop.color);
    if (!st.ok) return st;
    spec.stops.push_back(stop);
  }

  auto angleIt = obj.FindMember("angle");
  if (angleIt != obj.MemberEnd()) {
    if (!angleIt->value.IsNumber()) return configError("BAD_GRADIENT", "'angle' must be a number");
    spec.angleDeg = angleIt->value.GetDouble();
  }

  auto centerIt = obj.FindMember("center");
  if (centerIt != obj.MemberEnd()) {
    const auto& c = centerIt->value;
    if (!c.IsArray() || c.Size() != 2 || !c[0].IsNumber() || !c[1].IsNumber()) {
      return configError("BAD_GRADIENT", "'center' must be [x, y]");
    }
    spec.centerX = c[0].GetDouble();
    spec.centerY = c[1].GetDouble();
  }

  spec.solid = spec.stops.front().color;
  out = std::move(spec);
  return {};
}

} // anonymous namespace

Status parseColorToken(const std::string& text, Rgba& out) {
  std::string s = trim(text);
  if (s.empty()) return badColor(text, "empty");

  if (s[0] == '#') {
    if (!parseHex(s.substr(1), out)) return badColor(text, "bad hex notation");
    return {};
  }

  std::string lower(s);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  lower.erase(std::remove(lower.begin(), lower.end(), ' '), lower.end());

  if (lower.compare(0, 3, "rgb") == 0) {
    if (!parseFunctional(lower, out)) return badColor(text, "bad rgb()/rgba() notation");
    return {};
  }

  if (lower == "transparent") {
    out = {0, 0, 0, 0};
    return {};
  }

  std::uint32_t rgb = 0;
  if (!lookupNamedColor(lower, rgb)) return badColor(text, "unknown color name");
  out = {((rgb >> 16) & 0xFF) / 255.0f, ((rgb >> 8) & 0xFF) / 255.0f,
         (rgb & 0xFF) / 255.0f, 1.0f};
  return {};
}

Status parseColorSpec(const rapidjson::Value& v, ColorSpec& out) {
  if (v.IsString()) {
    Rgba c;
    Status st = parseColorToken(v.GetString(), c);
    if (!st.ok) return st;
    out = solidColor(c);
    return {};
  }
  if (v.IsArray()) {
    Rgba c;
    Status st = parseChannelArray(v, c);
    if (!st.ok) return st;
    out = solidColor(c);
    return {};
  }
  if (v.IsObject()) return parseGradient(v, out);
  return configError("BAD_COLOR", "Color must be a string, channel array, or gradient object");
}

std::string formatColorHex(const Rgba& c) {
  auto byte = [](float v) {
    return static_cast<unsigned>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
  };
  char buf[10];
  std::snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x", byte(c.r), byte(c.g), byte(c.b), byte(c.a));
  return buf;
}

std::string colorSpecToJson(const ColorSpec& spec) {
  if (!spec.isGradient()) return "\"" + formatColorHex(spec.solid) + "\"";

  std::string colors, stops;
  for (std::size_t i = 0; i < spec.stops.size(); i++) {
    if (i > 0) { colors += ","; stops += ","; }
    colors += "\"" + formatColorHex(spec.stops[i].color) + "\"";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6g", static_cast<double>(spec.stops[i].pos));
    stops += buf;
  }

  char extra[96];
  if (spec.kind == PaintKind::Linear) {
    std::snprintf(extra, sizeof(extra), "\"angle\":%.10g", spec.angleDeg);
  } else {
    std::snprintf(extra, sizeof(extra), "\"center\":[%.10g,%.10g]", spec.centerX, spec.centerY);
  }
  return std::string("{\"type\":\"") + toString(spec.kind) + "\",\"colors\":[" + colors +
         "],\"stops\":[" + stops + "]," + extra + "}";
}

} // namespace dk
