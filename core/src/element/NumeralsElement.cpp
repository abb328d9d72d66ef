#include "dk/element/NumeralsElement.hpp"
#include "dk/math/RomanNumerals.hpp"
#include "dk/text/TextLayout.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace dk {

NumeralsElement::NumeralsElement(ElementSpec spec, const Placement& placement,
                                 const NumeralsConfig& config)
  : Element(std::move(spec), placement), config_(config) {}

Status NumeralsElement::parseConfig(const rapidjson::Value& props, NumeralsConfig& out,
                                    Placement& placement) {
  PropertyReader r(props, "Numerals");
  NumeralsConfig cfg;

  Status st = readPlacement(r, placement);
  if (st.ok) st = r.readEnum<NumeralSystem>("system", {{"arabic", NumeralSystem::Arabic},
                                                       {"roman", NumeralSystem::Roman},
                                                       {"custom", NumeralSystem::Custom},
                                                       {"none", NumeralSystem::None}},
                                            cfg.system);
  if (st.ok) st = r.readIntList("values", cfg.values);
  if (st.ok && r.has("visible")) {
    st = r.readIntList("visible", cfg.visible);
    cfg.hasVisible = true;
  }
  if (st.ok) st = r.readStringList("custom_list", cfg.customList);
  if (st.ok) st = r.readNumberList("positions", cfg.positions);
  if (st.ok && r.has("divisions")) {
    st = r.readPositiveInt("divisions", cfg.divisions);
    cfg.hasDivisions = true;
  }
  if (st.ok) st = r.readPositive("font_size", cfg.fontSize);
  if (st.ok) st = r.readString("font_path", cfg.fontPath);
  if (st.ok) st = r.readColor("color", cfg.color);
  if (st.ok) st = r.readEnum<NumeralOrientation>("orientation",
                                                 {{"upright", NumeralOrientation::Upright},
                                                  {"radial", NumeralOrientation::Radial},
                                                  {"tangent", NumeralOrientation::Tangent}},
                                                 cfg.orientation);
  if (st.ok) st = r.readEnum<NumeralFlip>("flip", {{"none", NumeralFlip::None},
                                                   {"horizontal", NumeralFlip::Horizontal},
                                                   {"vertical", NumeralFlip::Vertical},
                                                   {"both", NumeralFlip::Both}},
                                          cfg.flip);
  if (st.ok) st = r.readNumber("rotation", cfg.rotation);
  if (st.ok) st = r.readNumber("radius_offset", cfg.radiusOffset);
  if (!st.ok) return st;

  if (const rapidjson::Value* map = r.get("custom_map")) {
    if (!map->IsObject()) return r.wrongType("custom_map", "object of value -> text");
    for (auto it = map->MemberBegin(); it != map->MemberEnd(); ++it) {
      char* end = nullptr;
      long key = std::strtol(it->name.GetString(), &end, 10);
      if (!end || *end != '\0' || end == it->name.GetString()) {
        return r.wrongType("custom_map", "integer keys");
      }
      if (!it->value.IsString()) return r.wrongType("custom_map", "string labels");
      cfg.customMap[static_cast<int>(key)] = it->value.GetString();
    }
  }

  if (cfg.system == NumeralSystem::Custom && cfg.customList.size() < cfg.values.size()) {
    return r.outOfRange("custom_list", "needs one label per value for the custom system");
  }
  if (cfg.system == NumeralSystem::Roman) {
    for (int v : cfg.values) {
      if (v < kRomanMin || v > kRomanMax) {
        return r.outOfRange("values", "roman numerals support 1..3999, got " +
                                      std::to_string(v));
      }
    }
  }

  out = std::move(cfg);
  return {};
}

Status NumeralsElement::create(const rapidjson::Value& props, std::unique_ptr<Element>& out) {
  NumeralsConfig cfg;
  Placement placement;
  Status st = parseConfig(props, cfg, placement);
  if (!st.ok) return st;
  out = std::make_unique<NumeralsElement>(
      ElementSpec{ElementKind::Numerals, toJsonText(props)}, placement, cfg);
  return {};
}

double NumeralsElement::positionAngle(std::size_t idx) const {
  if (idx < config_.positions.size()) return config_.positions[idx];
  const std::size_t n = config_.values.size();
  if (!config_.hasDivisions && n > 12) {
    return divisionAngle(static_cast<double>(idx), static_cast<int>(n));
  }
  int div = config_.divisions;
  int v = config_.values[idx] % div;
  if (v < 0) v += div;
  return divisionAngle(v, div);
}

std::string NumeralsElement::labelText(std::size_t idx) const {
  int value = config_.values[idx];
  auto it = config_.customMap.find(value);
  if (it != config_.customMap.end()) return it->second;

  switch (config_.system) {
    case NumeralSystem::Arabic: return std::to_string(value);
    case NumeralSystem::Roman:  return toRoman(value);
    case NumeralSystem::Custom: return config_.customList[idx];
    case NumeralSystem::None:   break;
  }
  return {};
}

std::vector<NumeralLabel> NumeralsElement::computeLabels(const DialFrame& frame) const {
  std::vector<NumeralLabel> labels;
  const double textRadius = frame.radius * (0.8 + config_.radiusOffset);
  const auto px = static_cast<std::uint32_t>(
      std::max(1.0, std::round(config_.fontSize * frame.scale)));

  for (std::size_t i = 0; i < config_.values.size(); i++) {
    int value = config_.values[i];
    if (config_.hasVisible &&
        std::find(config_.visible.begin(), config_.visible.end(), value) == config_.visible.end()) {
      continue;
    }
    std::string text = labelText(i);
    if (text.empty()) continue;

    NumeralLabel l;
    l.value = value;
    l.text = std::move(text);
    l.angle = positionAngle(i) + config_.rotation;
    l.position = pointOnCircle(frame.center, textRadius, l.angle);
    switch (config_.orientation) {
      case NumeralOrientation::Upright: l.glyphRotation = 0; break;
      case NumeralOrientation::Radial:  l.glyphRotation = l.angle; break;
      case NumeralOrientation::Tangent: l.glyphRotation = l.angle + 90.0; break;
    }
    l.mirrorX = config_.flip == NumeralFlip::Horizontal || config_.flip == NumeralFlip::Both;
    l.mirrorY = config_.flip == NumeralFlip::Vertical || config_.flip == NumeralFlip::Both;
    l.fontPx = px;
    labels.push_back(std::move(l));
  }
  return labels;
}

Status NumeralsElement::draw(DrawContext& ctx) const {
  DialFrame frame = placement_.resolve(ctx);
  std::vector<NumeralLabel> labels = computeLabels(frame);
  if (labels.empty()) return {};

  GlyphCache* font = nullptr;
  Status st = ctx.fonts.acquire(config_.fontPath, font);
  if (!st.ok) return st;

  const Rgba color = config_.color.primary();
  for (const NumeralLabel& l : labels) {
    AlphaMask mask = rasterizeText(*font, l.text, l.fontPx);
    ctx.surface.drawMask(mask, l.position, l.glyphRotation, l.mirrorX, l.mirrorY, color);
  }
  return {};
}

} // namespace dk
