#include "dk/element/OverlayElement.hpp"
#include "dk/text/TextLayout.hpp"

#include <algorithm>
#include <cmath>

namespace dk {

OverlayElement::OverlayElement(ElementSpec spec, const Placement& placement,
                               const OverlayConfig& config)
  : Element(std::move(spec), placement), config_(config) {}

Status OverlayElement::parseConfig(const rapidjson::Value& props, OverlayConfig& out,
                                   Placement& placement) {
  PropertyReader r(props, "Overlay");
  OverlayConfig cfg;

  if (!r.has("type")) {
    return configError("BAD_PROPERTY", "Overlay.type is required (date_window|text)");
  }
  Status st = readPlacement(r, placement);
  if (st.ok) st = r.readEnum<OverlayType>("type", {{"date_window", OverlayType::DateWindow},
                                                  {"text", OverlayType::Text}},
                                          cfg.type);
  if (st.ok && r.has("position")) {
    st = r.readPoint("position", cfg.position);
    cfg.hasPosition = true;
  }
  if (st.ok && r.has("date")) {
    std::string dateText;
    st = r.readString("date", dateText);
    if (st.ok) st = parseIsoDate(dateText, cfg.date);
    cfg.hasDate = true;
  }
  if (st.ok) st = r.readString("date_format", cfg.dateFormat);
  if (st.ok) st = r.readString("text", cfg.text);
  if (st.ok) st = r.readPositive("font_size", cfg.fontSize);
  if (st.ok) st = r.readString("font_path", cfg.fontPath);
  if (st.ok) st = r.readColor("text_color", cfg.textColor);
  if (st.ok && r.has("background_color")) {
    st = r.readColor("background_color", cfg.backgroundColor);
    cfg.hasBackground = true;
  }
  if (st.ok && r.has("border_color")) {
    st = r.readColor("border_color", cfg.borderColor);
    cfg.hasBorder = true;
  }
  if (st.ok) st = r.readNonNegative("border_width", cfg.borderWidth);
  if (st.ok) st = r.readNonNegative("corner_radius", cfg.cornerRadius);
  if (st.ok) st = r.readNonNegative("padding", cfg.padding);
  if (!st.ok) return st;

  if (cfg.type == OverlayType::Text && !r.has("text")) {
    return configError("BAD_PROPERTY", "Overlay.text is required for type 'text'");
  }

  out = std::move(cfg);
  return {};
}

Status OverlayElement::create(const rapidjson::Value& props, std::unique_ptr<Element>& out) {
  OverlayConfig cfg;
  Placement placement;
  Status st = parseConfig(props, cfg, placement);
  if (!st.ok) return st;
  out = std::make_unique<OverlayElement>(
      ElementSpec{ElementKind::Overlay, toJsonText(props)}, placement, cfg);
  return {};
}

std::string OverlayElement::displayText() const {
  if (config_.type == OverlayType::Text) return config_.text;
  CalendarDate d = config_.hasDate ? config_.date : todayLocal();
  return formatDate(d, config_.dateFormat);
}

OverlayWindow OverlayElement::computeWindow(const DialFrame& frame, double textWidth,
                                            double textHeight) const {
  OverlayWindow w;
  w.center = config_.hasPosition
                 ? Point{config_.position.x * frame.scale, config_.position.y * frame.scale}
                 : Point{frame.canvasWidth * 0.5, frame.canvasHeight * 0.5};
  double pad = config_.padding * frame.scale;
  double halfW = textWidth * 0.5 + pad;
  double halfH = textHeight * 0.5 + pad;
  w.x0 = w.center.x - halfW;
  w.y0 = w.center.y - halfH;
  w.x1 = w.center.x + halfW;
  w.y1 = w.center.y + halfH;
  return w;
}

Status OverlayElement::draw(DrawContext& ctx) const {
  DialFrame frame = placement_.resolve(ctx);

  GlyphCache* font = nullptr;
  Status st = ctx.fonts.acquire(config_.fontPath, font);
  if (!st.ok) return st;

  const auto px = static_cast<std::uint32_t>(
      std::max(1.0, std::round(config_.fontSize * frame.scale)));
  AlphaMask mask = rasterizeText(*font, displayText(), px);
  OverlayWindow w = computeWindow(frame, mask.width, mask.height);

  FillBounds box = FillBounds::rect(w.x0, w.y0, w.x1, w.y1);
  double corner = config_.cornerRadius * frame.scale;
  if (config_.hasBackground) {
    ctx.surface.fillRoundedRect(w.x0, w.y0, w.x1, w.y1, corner,
                                Fill(config_.backgroundColor, box));
  }
  if (config_.hasBorder && config_.borderWidth > 0) {
    double bw = std::max(1.0, config_.borderWidth * frame.scale);
    ctx.surface.strokeRoundedRect(w.x0, w.y0, w.x1, w.y1, corner, bw,
                                  Fill(config_.borderColor, box));
  }
  ctx.surface.drawMask(mask, w.center, 0.0, false, false, config_.textColor.primary());
  return {};
}

} // namespace dk
