#include "dk/element/HandsElement.hpp"

#include <string>

namespace dk {

const char* toString(HandKind k) {
  switch (k) {
    case HandKind::Hour:   return "hour";
    case HandKind::Minute: return "minute";
    case HandKind::Second: return "second";
  }
  return "unknown";
}

namespace {

Status readHandSpec(const rapidjson::Value& obj, const std::string& scope, HandSpec& out) {
  PropertyReader r(obj, scope);
  HandSpec spec = out;
  Status st = r.readEnum<HandShape>("shape", {{"line", HandShape::Line},
                                              {"triangle", HandShape::Triangle},
                                              {"custom_polygon", HandShape::CustomPolygon}},
                                    spec.shape);
  if (st.ok) st = r.readColor("color", spec.color);
  if (st.ok) st = r.readFraction("length", spec.length);
  if (st.ok) st = r.readPositive("width", spec.width);
  if (!st.ok) return st;

  if (spec.shape == HandShape::CustomPolygon) {
    const rapidjson::Value* pts = r.get("custom_polygon");
    if (!pts || !pts->IsArray() || pts->Size() < 3) {
      return configError("BAD_PROPERTY",
                         scope + ".custom_polygon: needs a list of at least 3 [x, y] points");
    }
    spec.polygon.clear();
    for (const auto& p : pts->GetArray()) {
      if (!p.IsArray() || p.Size() != 2 || !p[0].IsNumber() || !p[1].IsNumber()) {
        return configError("BAD_PROPERTY", scope + ".custom_polygon: points must be [x, y]");
      }
      spec.polygon.push_back({p[0].GetDouble(), p[1].GetDouble()});
    }
  }
  out = std::move(spec);
  return {};
}

HandSpec defaultHand(HandKind kind, double length, double width, const Rgba& color) {
  HandSpec h;
  h.kind = kind;
  h.length = length;
  h.width = width;
  h.color = solidColor(color);
  return h;
}

} // anonymous namespace

HandsElement::HandsElement(ElementSpec spec, const Placement& placement,
                           const HandsConfig& config)
  : Element(std::move(spec), placement), config_(config) {}

Status HandsElement::parseConfig(const rapidjson::Value& props, HandsConfig& out,
                                 Placement& placement) {
  PropertyReader r(props, "Hands");
  HandsConfig cfg;

  std::string mode = "12h";
  Status st = readPlacement(r, placement);
  if (st.ok) st = r.readString("time", cfg.timeText);
  if (st.ok) st = parseTimeString(cfg.timeText, cfg.time);
  if (st.ok) st = r.readEnum<std::string>("mode", {{"12h", "12h"}, {"24h", "24h"}}, mode);
  if (!st.ok) return st;
  cfg.mode24h = mode == "24h";

  if (const rapidjson::Value* list = r.get("hands")) {
    if (!list->IsArray()) return r.wrongType("hands", "list of hand specs");
    for (rapidjson::SizeType i = 0; i < list->Size(); i++) {
      const rapidjson::Value& obj = (*list)[i];
      std::string scope = "Hands.hands[" + std::to_string(i) + "]";
      if (!obj.IsObject()) return configError("BAD_PROPERTY", scope + ": expected object");
      HandSpec h;
      PropertyReader hr(obj, scope);
      st = hr.readEnum<HandKind>("type", {{"hour", HandKind::Hour},
                                         {"minute", HandKind::Minute},
                                         {"second", HandKind::Second}},
                                 h.kind);
      if (st.ok) st = readHandSpec(obj, scope, h);
      if (!st.ok) return st;
      cfg.hands.push_back(std::move(h));
    }
  } else {
    static const struct { const char* key; HandKind kind; } kSpecs[] = {
      {"hour_spec", HandKind::Hour},
      {"minute_spec", HandKind::Minute},
      {"second_spec", HandKind::Second},
    };
    bool any = false;
    for (const auto& s : kSpecs) {
      const rapidjson::Value* obj = nullptr;
      st = r.readObject(s.key, obj);
      if (!st.ok) return st;
      if (!obj) continue;
      any = true;
      HandSpec h;
      h.kind = s.kind;
      st = readHandSpec(*obj, std::string("Hands.") + s.key, h);
      if (!st.ok) return st;
      cfg.hands.push_back(std::move(h));
    }
    if (!any) {
      cfg.hands.push_back(defaultHand(HandKind::Hour, 0.5, 6, {0, 0, 0, 1}));
      cfg.hands.push_back(defaultHand(HandKind::Minute, 0.8, 4, {0, 0, 0, 1}));
      cfg.hands.push_back(defaultHand(HandKind::Second, 0.9, 2, {1, 0, 0, 1}));
    }
  }

  const rapidjson::Value* pivot = nullptr;
  st = r.readObject("pivot_spec", pivot);
  if (st.ok && pivot) {
    PropertyReader pr(*pivot, "Hands.pivot_spec");
    int shapeTag = 0;
    st = pr.readEnum<int>("shape", {{"circle", 0}}, shapeTag);
    if (st.ok) st = pr.readColor("color", cfg.pivot.color);
    if (st.ok) st = pr.readPositive("radius", cfg.pivot.radius);
    cfg.hasPivot = true;
  }
  if (!st.ok) return st;

  out = std::move(cfg);
  return {};
}

Status HandsElement::create(const rapidjson::Value& props, std::unique_ptr<Element>& out) {
  HandsConfig cfg;
  Placement placement;
  Status st = parseConfig(props, cfg, placement);
  if (!st.ok) return st;
  out = std::make_unique<HandsElement>(ElementSpec{ElementKind::Hands, toJsonText(props)},
                                       placement, cfg);
  return {};
}

std::vector<HandGeometry> HandsElement::computeHands(const DialFrame& frame) const {
  const HandAngles a = angles();
  std::vector<HandGeometry> out;
  out.reserve(config_.hands.size());

  for (const HandSpec& spec : config_.hands) {
    HandGeometry g;
    g.kind = spec.kind;
    g.shape = spec.shape;
    g.angle = spec.kind == HandKind::Hour   ? a.hour
            : spec.kind == HandKind::Minute ? a.minute
                                            : a.second;
    g.pivot = frame.center;
    g.width = spec.width * frame.scale;
    g.color = spec.color;
    double len = spec.length * frame.radius;
    g.tip = pointOnCircle(frame.center, len, g.angle);

    if (spec.shape == HandShape::Triangle) {
      g.polygon = {g.tip,
                   pointOnCircle(frame.center, g.width * 0.5, g.angle - 90.0),
                   pointOnCircle(frame.center, g.width * 0.5, g.angle + 90.0)};
    } else if (spec.shape == HandShape::CustomPolygon) {
      // Local +x maps onto the hand direction.
      Point origin{frame.center.x, frame.center.y};
      for (const Point& p : spec.polygon) {
        Point local{origin.x + p.x * len, origin.y + p.y * len};
        g.polygon.push_back(rotatePoint(local, origin, g.angle - 90.0));
      }
    }
    out.push_back(std::move(g));
  }
  return out;
}

Status HandsElement::draw(DrawContext& ctx) const {
  DialFrame frame = placement_.resolve(ctx);
  FillBounds dial = FillBounds::circle(frame.center, frame.radius);

  for (const HandGeometry& g : computeHands(frame)) {
    Fill fill(g.color, dial);
    if (g.shape == HandShape::Line) {
      ctx.surface.drawLine(g.pivot, g.tip, g.width, fill);
    } else {
      ctx.surface.fillPolygon(g.polygon, fill);
    }
  }

  if (config_.hasPivot) {
    double r = config_.pivot.radius * frame.scale;
    ctx.surface.fillCircle(frame.center, r,
                           Fill(config_.pivot.color, FillBounds::circle(frame.center, r)));
  }
  return {};
}

} // namespace dk
