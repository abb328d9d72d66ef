#pragma once
#include "dk/clock/ClockConfig.hpp"
#include "dk/element/Element.hpp"
#include "dk/raster/Image.hpp"
#include "dk/text/FontLibrary.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace dk {

// Owns an ordered list of elements and composites them into one image:
// supersampled draw in z-order, box downsample, then post-processing.
class Clock {
public:
  explicit Clock(const CanvasSpec& canvas = CanvasSpec{});

  // Build every element of `cfg`; on error the clock is left unchanged.
  Status applyConfig(const ClockConfig& cfg);
  static Status fromConfig(const ClockConfig& cfg, std::unique_ptr<Clock>& out);

  const CanvasSpec& canvas() const { return config_.canvas; }
  void setCanvas(const CanvasSpec& canvas);

  const PostProcessing& postProcessing() const { return config_.post; }
  void setPostProcessing(const PostProcessing& post);

  void addElement(std::unique_ptr<Element> element);
  // Type tag plus property JSON, validated through the element factory.
  Status addElement(const std::string& typeTag, const std::string& propsJson);
  Status replaceElement(std::size_t index, std::unique_ptr<Element> element);
  void clearElements();

  std::size_t elementCount() const { return elements_.size(); }
  const Element& element(std::size_t i) const { return *elements_[i]; }

  // Element indices in draw order (stable by z-order).
  std::vector<std::size_t> drawOrder() const;

  // Render, or return the cached image when nothing changed since the last render.
  Status render(Image& out);
  // Render if needed and write by file extension.
  Status save(const std::string& path);

  bool hasCachedImage() const { return !dirty_; }

  ClockConfig toConfig() const;

  FontLibrary& fonts() { return fonts_; }

private:
  ClockConfig config_;  // canvas and post-processing; elements live below
  std::vector<std::unique_ptr<Element>> elements_;
  FontLibrary fonts_;
  Image cached_;
  bool dirty_{true};

  Status renderFresh(Image& out);
};

} // namespace dk
