#include "dk/element/TicksElement.hpp"

#include <algorithm>
#include <set>
#include <string>

namespace dk {

namespace {

Status readTickSpec(const rapidjson::Value& obj, const std::string& scope, TickSpec& out) {
  PropertyReader r(obj, scope);
  TickSpec spec = out;
  Status st = r.readEnum<TickShape>("shape", {{"line", TickShape::Line},
                                              {"circle", TickShape::Circle}},
                                    spec.shape);
  if (st.ok) st = r.readColor("color", spec.color);
  if (st.ok) st = r.readPositive("length", spec.length);
  if (st.ok) st = r.readPositive("width", spec.width);
  if (!st.ok) return st;
  out = spec;
  return {};
}

Status readIndexedSpecs(const PropertyReader& r, std::vector<IndexedTickSpec>& out) {
  const rapidjson::Value* list = r.get("tick_spec");
  if (!list) return {};
  if (!list->IsArray()) return r.wrongType("tick_spec", "list of tick specs");

  std::vector<IndexedTickSpec> specs;
  for (rapidjson::SizeType i = 0; i < list->Size(); i++) {
    const rapidjson::Value& obj = (*list)[i];
    std::string scope = "Ticks.tick_spec[" + std::to_string(i) + "]";
    if (!obj.IsObject()) {
      return configError("BAD_PROPERTY", scope + ": expected object");
    }
    IndexedTickSpec entry;
    Status st = readTickSpec(obj, scope, entry.spec);
    if (!st.ok) return st;

    PropertyReader er(obj, scope);
    const rapidjson::Value* idx = er.get("indices");
    if (idx && idx->IsString()) {
      std::string mode = idx->GetString();
      if (mode == "all") {
        entry.all = true;
      } else if (mode == "all_others") {
        entry.allOthers = true;
      } else {
        return configError("BAD_ENUM", scope + ".indices: expected a list, 'all' or 'all_others'");
      }
    } else {
      st = er.readIntList("indices", entry.indices);
      if (!st.ok) return st;
    }
    specs.push_back(std::move(entry));
  }
  out = std::move(specs);
  return {};
}

int wrapIndex(int i, int n) {
  int m = i % n;
  return m < 0 ? m + n : m;
}

} // anonymous namespace

TicksElement::TicksElement(ElementSpec spec, const Placement& placement,
                           const TicksConfig& config)
  : Element(std::move(spec), placement), config_(config) {}

Status TicksElement::parseConfig(const rapidjson::Value& props, TicksConfig& out,
                                 Placement& placement) {
  PropertyReader r(props, "Ticks");
  TicksConfig cfg;

  std::string mode = "12h";
  Status st = readPlacement(r, placement);
  if (st.ok) st = r.readEnum<std::string>("mode", {{"12h", "12h"}, {"24h", "24h"}}, mode);
  if (mode == "24h") cfg.divisions = 24;
  if (st.ok) st = r.readPositiveInt("divisions", cfg.divisions);
  if (st.ok) st = r.readPositiveInt("minute_divisions", cfg.minuteDivisions);
  if (st.ok) st = r.readNumber("rotation", cfg.rotation);
  if (!st.ok) return st;

  const rapidjson::Value* hour = nullptr;
  const rapidjson::Value* minute = nullptr;
  st = r.readObject("hour_spec", hour);
  if (st.ok) st = r.readObject("minute_spec", minute);
  if (st.ok && hour) {
    st = readTickSpec(*hour, "Ticks.hour_spec", cfg.hourSpec);
    cfg.hasHourSpec = true;
  }
  if (st.ok && minute) {
    st = readTickSpec(*minute, "Ticks.minute_spec", cfg.minuteSpec);
    cfg.hasMinuteSpec = true;
  }
  if (!st.ok) return st;

  if (cfg.hasMinuteSpec && cfg.minuteDivisions % cfg.divisions != 0) {
    return r.outOfRange("minute_divisions", "must be a multiple of divisions");
  }

  if (r.has("visible_hours")) {
    st = r.readIntList("visible_hours", cfg.visibleHours);
    cfg.hasVisibleHours = true;
  }
  if (st.ok && r.has("visible_minutes")) {
    st = r.readIntList("visible_minutes", cfg.visibleMinutes);
    cfg.hasVisibleMinutes = true;
  }
  if (st.ok) st = readIndexedSpecs(r, cfg.tickSpecs);
  if (!st.ok) return st;

  out = std::move(cfg);
  return {};
}

Status TicksElement::create(const rapidjson::Value& props, std::unique_ptr<Element>& out) {
  TicksConfig cfg;
  Placement placement;
  Status st = parseConfig(props, cfg, placement);
  if (!st.ok) return st;
  out = std::make_unique<TicksElement>(ElementSpec{ElementKind::Ticks, toJsonText(props)},
                                       placement, cfg);
  return {};
}

TickMark TicksElement::makeMark(const DialFrame& frame, int index, double angle,
                                const TickSpec& spec) const {
  TickMark m;
  m.index = index;
  m.angle = angle;
  m.shape = spec.shape;
  m.width = spec.width * frame.scale;
  m.color = spec.color;
  double len = spec.length * frame.radius;
  if (spec.shape == TickShape::Line) {
    m.outer = pointOnCircle(frame.center, frame.radius * 0.95, angle);
    m.inner = pointOnCircle(frame.center, frame.radius * 0.95 - len, angle);
  } else {
    m.center = pointOnCircle(frame.center, frame.radius * 0.9, angle);
    m.diameter = len;
    m.filled = m.width >= m.diameter;
  }
  return m;
}

std::vector<TickMark> TicksElement::computeTicks(const DialFrame& frame) const {
  std::vector<TickMark> marks;
  const int div = config_.divisions;

  if (!config_.tickSpecs.empty()) {
    std::set<int> claimed;
    for (const auto& e : config_.tickSpecs) {
      if (e.all) {
        for (int i = 0; i < div; i++) claimed.insert(i);
      }
      for (int i : e.indices) claimed.insert(wrapIndex(i, div));
    }
    for (const auto& e : config_.tickSpecs) {
      std::vector<int> indices;
      if (e.all) {
        for (int i = 0; i < div; i++) indices.push_back(i);
      } else if (e.allOthers) {
        for (int i = 0; i < div; i++) {
          if (!claimed.count(i)) indices.push_back(i);
        }
      } else {
        indices = e.indices;
      }
      for (int i : indices) {
        TickMark m = makeMark(frame, i, divisionAngle(i, div, config_.rotation), e.spec);
        m.isHour = true;
        marks.push_back(m);
      }
    }
    return marks;
  }

  if (!config_.hasHourSpec && !config_.hasMinuteSpec) return marks;

  const int total = config_.hasMinuteSpec ? config_.minuteDivisions : div;
  const int perHour = total / div;

  std::vector<bool> hourVisible(static_cast<std::size_t>(div), !config_.hasVisibleHours);
  for (int h : config_.visibleHours) hourVisible[static_cast<std::size_t>(wrapIndex(h, div))] = true;

  std::vector<bool> minuteVisible(static_cast<std::size_t>(total), !config_.hasVisibleMinutes);
  for (int m : config_.visibleMinutes) {
    if (m >= 0 && m < total) minuteVisible[static_cast<std::size_t>(m)] = true;
  }

  for (int k = 0; k < total; k++) {
    double angle = divisionAngle(k, total, config_.rotation);
    bool onHour = (k % perHour) == 0;
    if (onHour && config_.hasHourSpec && hourVisible[static_cast<std::size_t>(k / perHour)]) {
      TickMark m = makeMark(frame, k, angle, config_.hourSpec);
      m.isHour = true;
      marks.push_back(m);
    } else if (config_.hasMinuteSpec && minuteVisible[static_cast<std::size_t>(k)]) {
      marks.push_back(makeMark(frame, k, angle, config_.minuteSpec));
    }
  }
  return marks;
}

Status TicksElement::draw(DrawContext& ctx) const {
  DialFrame frame = placement_.resolve(ctx);
  FillBounds dial = FillBounds::circle(frame.center, frame.radius);
  for (const TickMark& m : computeTicks(frame)) {
    Fill fill(m.color, dial);
    if (m.shape == TickShape::Line) {
      ctx.surface.drawLine(m.inner, m.outer, m.width, fill);
    } else if (m.filled) {
      ctx.surface.fillCircle(m.center, m.diameter * 0.5, fill);
    } else {
      // Outline inside the nominal diameter.
      ctx.surface.strokeCircle(m.center, m.diameter * 0.5 - m.width * 0.5, m.width, fill);
    }
  }
  return {};
}

} // namespace dk
