#include "dk/clock/Clock.hpp"
#include "dk/element/ElementFactory.hpp"
#include "dk/export/ImageWriter.hpp"
#include "dk/raster/ImageOps.hpp"
#include "dk/raster/Surface.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <numeric>

namespace dk {

Clock::Clock(const CanvasSpec& canvas) {
  config_.canvas = canvas;
}

Status Clock::applyConfig(const ClockConfig& cfg) {
  std::vector<std::unique_ptr<Element>> built;
  built.reserve(cfg.elements.size());
  for (std::size_t i = 0; i < cfg.elements.size(); i++) {
    const ElementEntry& entry = cfg.elements[i];
    std::unique_ptr<Element> el;
    Status st = createElementFromJson(entry.type, entry.propertiesJson, el);
    if (!st.ok) {
      std::fprintf(stderr, "Clock: element %zu (%s) rejected: %s\n",
                   i, entry.type.c_str(), st.err.message.c_str());
      return st;
    }
    el->setHasProperties(entry.hasProperties);
    built.push_back(std::move(el));
  }

  config_ = cfg;
  config_.elements.clear();
  elements_ = std::move(built);
  dirty_ = true;
  return {};
}

Status Clock::fromConfig(const ClockConfig& cfg, std::unique_ptr<Clock>& out) {
  auto clock = std::make_unique<Clock>(cfg.canvas);
  Status st = clock->applyConfig(cfg);
  if (!st.ok) return st;
  out = std::move(clock);
  return {};
}

void Clock::setCanvas(const CanvasSpec& canvas) {
  config_.canvas = canvas;
  config_.hasAntialias = true;
  config_.hasScaleFactor = true;
  config_.hasBackground = true;
  config_.backgroundJson = colorSpecToJson(canvas.background);
  dirty_ = true;
}

void Clock::setPostProcessing(const PostProcessing& post) {
  config_.post = post;
  config_.hasPostProcessing = true;
  dirty_ = true;
}

void Clock::addElement(std::unique_ptr<Element> element) {
  if (!element) return;
  elements_.push_back(std::move(element));
  dirty_ = true;
}

Status Clock::addElement(const std::string& typeTag, const std::string& propsJson) {
  std::unique_ptr<Element> el;
  Status st = createElementFromJson(typeTag, propsJson, el);
  if (!st.ok) return st;
  addElement(std::move(el));
  return {};
}

Status Clock::replaceElement(std::size_t index, std::unique_ptr<Element> element) {
  if (index >= elements_.size()) {
    return configError("BAD_INDEX", "Element index out of range",
                       "{\"index\":" + std::to_string(index) +
                       ",\"count\":" + std::to_string(elements_.size()) + "}");
  }
  if (!element) return configError("BAD_ELEMENT", "Replacement element is null");
  elements_[index] = std::move(element);
  dirty_ = true;
  return {};
}

void Clock::clearElements() {
  elements_.clear();
  dirty_ = true;
}

std::vector<std::size_t> Clock::drawOrder() const {
  std::vector<std::size_t> order(elements_.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(), [this](std::size_t a, std::size_t b) {
    return elements_[a]->zOrder() < elements_[b]->zOrder();
  });
  return order;
}

Status Clock::render(Image& out) {
  if (!dirty_) {
    out = cached_;
    return {};
  }
  Image img;
  Status st = renderFresh(img);
  if (!st.ok) return st;
  cached_ = img;
  dirty_ = false;
  out = std::move(img);
  return {};
}

Status Clock::renderFresh(Image& out) {
  const CanvasSpec& cs = config_.canvas;
  if (cs.width < 1 || cs.height < 1) {
    return configError("BAD_CANVAS", "Canvas dimensions must be positive",
                       "{\"width\":" + std::to_string(cs.width) +
                       ",\"height\":" + std::to_string(cs.height) + "}");
  }
  if (cs.scaleFactor < 1) {
    return configError("OUT_OF_RANGE", "scale_factor must be at least 1",
                       "{\"scale_factor\":" + std::to_string(cs.scaleFactor) + "}");
  }

  const int factor = cs.effectiveScale();
  const int workW = cs.width * factor;
  const int workH = cs.height * factor;

  Surface surface(workW, workH);
  surface.clear(resolveFill(cs.background, FillBounds::rect(0, 0, workW, workH)));

  DrawContext ctx{surface,
                  Point{workW / 2.0, workH / 2.0},
                  std::min(workW, workH) / 2.0,
                  static_cast<double>(factor),
                  fonts_};

  for (std::size_t idx : drawOrder()) {
    const Element& el = *elements_[idx];
    Status st = el.draw(ctx);
    if (!st.ok) {
      std::fprintf(stderr, "Clock: element %zu (%s) failed: %s\n",
                   idx, toString(el.kind()), st.err.message.c_str());
      return st;
    }
  }

  Image img = surface.release();
  if (factor > 1) img = downsampleBox(img, factor);

  const PostProcessing& pp = config_.post;
  if (pp.flipHorizontal) img = flipHorizontal(img);
  if (pp.rotate != 0.0 && std::fmod(pp.rotate, 360.0) != 0.0) img = rotateImage(img, pp.rotate);
  if (pp.transpose) img = transposeImage(img);

  out = std::move(img);
  return {};
}

Status Clock::save(const std::string& path) {
  Image img;
  Status st = render(img);
  if (!st.ok) return st;
  return saveImage(path, img);
}

ClockConfig Clock::toConfig() const {
  ClockConfig cfg = config_;
  cfg.elements.clear();
  for (const auto& el : elements_) {
    ElementEntry entry;
    entry.type = toString(el->kind());
    entry.propertiesJson = el->spec().propertiesJson;
    entry.hasProperties = el->spec().hasProperties;
    cfg.elements.push_back(std::move(entry));
  }
  // An element list that started empty is still written back as empty.
  cfg.hasElements = config_.hasElements || !elements_.empty();
  return cfg;
}

} // namespace dk
