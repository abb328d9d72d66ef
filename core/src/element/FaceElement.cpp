#include "dk/element/FaceElement.hpp"
#include "dk/raster/ImageLoader.hpp"

namespace dk {

FaceElement::FaceElement(ElementSpec spec, const Placement& placement,
                         const FaceConfig& config)
  : Element(std::move(spec), placement), config_(config) {}

Status FaceElement::parseConfig(const rapidjson::Value& props, FaceConfig& out,
                                Placement& placement) {
  PropertyReader r(props, "Face");
  FaceConfig cfg;
  Status st = readPlacement(r, placement);
  if (st.ok) st = r.readEnum<FaceShape>("shape", {{"circle", FaceShape::Circle},
                                                  {"square", FaceShape::Square},
                                                  {"rectangle", FaceShape::Rectangle}},
                                        cfg.shape);
  if (st.ok) st = r.readColor("color", cfg.color);
  if (st.ok) st = r.readNonNegative("border_width", cfg.borderWidth);
  if (st.ok && r.has("border_color")) {
    st = r.readColor("border_color", cfg.borderColor);
    cfg.hasBorder = true;
  }
  if (st.ok) st = r.readString("image_path", cfg.imagePath);
  if (!st.ok) return st;
  out = cfg;
  return {};
}

Status FaceElement::create(const rapidjson::Value& props, std::unique_ptr<Element>& out) {
  FaceConfig cfg;
  Placement placement;
  Status st = parseConfig(props, cfg, placement);
  if (!st.ok) return st;
  out = std::make_unique<FaceElement>(ElementSpec{ElementKind::Face, toJsonText(props)},
                                      placement, cfg);
  return {};
}

FillBounds FaceElement::computeBounds(const DialFrame& frame) const {
  switch (config_.shape) {
    case FaceShape::Circle:
      return FillBounds::circle(frame.center, frame.radius);
    case FaceShape::Square:
      return FillBounds::rect(frame.center.x - frame.radius, frame.center.y - frame.radius,
                              frame.center.x + frame.radius, frame.center.y + frame.radius);
    case FaceShape::Rectangle:
      break;
  }
  return FillBounds::rect(0, 0, frame.canvasWidth, frame.canvasHeight);
}

Status FaceElement::draw(DrawContext& ctx) const {
  DialFrame frame = placement_.resolve(ctx);
  FillBounds bounds = computeBounds(frame);
  Surface& s = ctx.surface;

  if (!config_.imagePath.empty()) {
    Image background;
    Status st = loadImageFile(config_.imagePath, background);
    if (!st.ok) return st;
    s.drawImage(background, bounds);
  } else {
    Fill fill(config_.color, bounds);
    if (bounds.shape == FillBounds::Shape::Circle) {
      s.fillCircle(frame.center, frame.radius, fill);
    } else {
      s.fillRect(bounds.x0, bounds.y0, bounds.x1, bounds.y1, fill);
    }
  }

  if (config_.hasBorder && config_.borderWidth > 0) {
    double w = config_.borderWidth * frame.scale;
    Fill border(config_.borderColor, bounds);
    if (bounds.shape == FillBounds::Shape::Circle) {
      // Stroke lies inside the face edge.
      s.strokeCircle(frame.center, frame.radius - w * 0.5, w, border);
    } else {
      s.strokeRect(bounds.x0, bounds.y0, bounds.x1, bounds.y1, w, border);
    }
  }
  return {};
}

} // namespace dk
