#include "dk/style/Presets.hpp"
#include "dk/element/Element.hpp"
#include "dk/math/ClockMath.hpp"

namespace dk {

// -------------------- Built-in presets --------------------

Preset classicPreset() {
  Preset p;
  p.name = "classic";
  p.background = "white";
  p.faceJson = R"({"shape":"circle","color":"white","border_color":"black","border_width":3})";
  p.ticksJson =
    R"({"hour_spec":{"shape":"line","color":"black","length":0.08,"width":3},)"
    R"("minute_spec":{"shape":"line","color":"black","length":0.04,"width":1}})";
  p.numeralsJson = R"({"system":"arabic","color":"black","font_size":28})";
  p.handsJson =
    R"({"hour_spec":{"shape":"line","color":"black","length":0.5,"width":6},)"
    R"("minute_spec":{"shape":"line","color":"black","length":0.8,"width":4},)"
    R"("second_spec":{"shape":"line","color":"red","length":0.9,"width":2},)"
    R"("pivot_spec":{"shape":"circle","color":"black","radius":5}})";
  return p;
}

Preset modernPreset() {
  Preset p;
  p.name = "modern";
  p.background = "white";
  p.faceJson = R"({"shape":"circle","color":"#2c3e50","border_color":"#34495e","border_width":2})";
  p.ticksJson =
    R"({"hour_spec":{"shape":"line","color":"#ecf0f1","length":0.06,"width":4},)"
    R"("minute_spec":{"shape":"line","color":"#bdc3c7","length":0.03,"width":1}})";
  p.numeralsJson =
    R"({"system":"arabic","visible":[12,3,6,9],"color":"#ecf0f1","font_size":32})";
  p.handsJson =
    R"({"hour_spec":{"shape":"line","color":"#ecf0f1","length":0.45,"width":8},)"
    R"("minute_spec":{"shape":"line","color":"#ecf0f1","length":0.75,"width":6},)"
    R"("second_spec":{"shape":"line","color":"#e74c3c","length":0.85,"width":2},)"
    R"("pivot_spec":{"shape":"circle","color":"#ecf0f1","radius":8}})";
  return p;
}

Preset minimalPreset() {
  Preset p;
  p.name = "minimal";
  p.background = "white";
  p.faceJson = R"({"shape":"circle","color":"white","border_color":"#bdc3c7","border_width":1})";
  p.ticksJson = R"({"hour_spec":{"shape":"line","color":"#34495e","length":0.05,"width":2}})";
  p.numeralsJson =
    R"({"system":"arabic","visible":[12,3,6,9],"color":"#34495e","font_size":24})";
  p.handsJson =
    R"({"hour_spec":{"shape":"line","color":"#34495e","length":0.4,"width":4},)"
    R"("minute_spec":{"shape":"line","color":"#34495e","length":0.7,"width":3},)"
    R"("pivot_spec":{"shape":"circle","color":"#34495e","radius":4}})";
  return p;
}

// -------------------- Lookup --------------------

namespace {

const std::vector<Preset>& builtinPresets() {
  static const std::vector<Preset> presets = {classicPreset(), modernPreset(), minimalPreset()};
  return presets;
}

} // anonymous namespace

const std::vector<std::string>& presetNames() {
  static const std::vector<std::string> names = [] {
    std::vector<std::string> v;
    for (const auto& p : builtinPresets()) v.push_back(p.name);
    return v;
  }();
  return names;
}

const Preset* findPreset(const std::string& name) {
  for (const auto& p : builtinPresets()) {
    if (p.name == name) return &p;
  }
  return nullptr;
}

// -------------------- Config generation --------------------

Status buildPresetConfig(const std::string& time, const std::string& style,
                         const PresetOverrides& overrides, ClockConfig& out) {
  const Preset* preset = findPreset(style);
  if (!preset) {
    std::string available;
    for (const auto& n : presetNames()) {
      if (!available.empty()) available += ", ";
      available += n;
    }
    return configError("UNKNOWN_STYLE",
                       "Style '" + style + "' not recognized. Available styles: " + available,
                       "{\"style\":" + jsonQuote(style) + "}");
  }

  TimeValue tv;
  Status st = parseTimeString(time, tv);
  if (!st.ok) return st;

  if (overrides.width < 1 || overrides.height < 1) {
    return configError("BAD_CANVAS", "Canvas dimensions must be positive");
  }
  if (overrides.scaleFactor < 1) {
    return configError("OUT_OF_RANGE", "scale_factor must be at least 1",
                       "{\"scale_factor\":" + std::to_string(overrides.scaleFactor) + "}");
  }

  ClockConfig cfg;
  cfg.canvas.width = overrides.width;
  cfg.canvas.height = overrides.height;
  cfg.canvas.scaleFactor = overrides.scaleFactor;
  cfg.canvas.antialias = overrides.antialias;
  cfg.hasScaleFactor = true;
  cfg.hasAntialias = true;

  Rgba bg;
  st = parseColorToken(preset->background, bg);
  if (!st.ok) return st;
  cfg.canvas.background = solidColor(bg);
  cfg.backgroundJson = "\"" + preset->background + "\"";
  cfg.hasBackground = true;

  // Splice the time into the hands layer.
  rapidjson::Document hands;
  hands.Parse(preset->handsJson.c_str());
  if (hands.HasParseError() || !hands.IsObject()) {
    return configError("BAD_PRESET", "Preset hands layer is not a JSON object",
                       "{\"style\":" + jsonQuote(style) + "}");
  }
  hands.AddMember("time", rapidjson::Value(time.c_str(), hands.GetAllocator()),
                  hands.GetAllocator());

  cfg.hasElements = true;
  cfg.elements.push_back({toString(ElementKind::Face), preset->faceJson});
  cfg.elements.push_back({toString(ElementKind::Ticks), preset->ticksJson});
  cfg.elements.push_back({toString(ElementKind::Numerals), preset->numeralsJson});
  cfg.elements.push_back({toString(ElementKind::Hands), toJsonText(hands)});

  out = std::move(cfg);
  return {};
}

} // namespace dk
