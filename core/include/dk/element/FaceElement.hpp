#pragma once
#include "dk/element/Element.hpp"

#include <memory>
#include <string>

namespace dk {

enum class FaceShape : std::uint8_t { Circle, Square, Rectangle };

struct FaceConfig {
  FaceShape shape{FaceShape::Circle};
  ColorSpec color{solidColor(1.0f, 1.0f, 1.0f)};
  bool hasBorder{false};          // border_color given
  ColorSpec borderColor{solidColor(0.0f, 0.0f, 0.0f)};
  double borderWidth{0};          // target pixels
  std::string imagePath;          // replaces the fill when set
};

// Dial background: filled shape, optional image, optional inner border.
class FaceElement : public Element {
public:
  FaceElement(ElementSpec spec, const Placement& placement, const FaceConfig& config);

  static Status parseConfig(const rapidjson::Value& props, FaceConfig& out,
                            Placement& placement);
  static Status create(const rapidjson::Value& props, std::unique_ptr<Element>& out);

  const FaceConfig& config() const { return config_; }

  // Shape bounds in working pixels (rectangle spans the whole canvas).
  FillBounds computeBounds(const DialFrame& frame) const;

  Status draw(DrawContext& ctx) const override;

private:
  FaceConfig config_;
};

} // namespace dk
