#pragma once
#include "dk/element/Element.hpp"
#include "dk/math/DateFormat.hpp"

#include <memory>
#include <string>

namespace dk {

enum class OverlayType : std::uint8_t { DateWindow, Text };

struct OverlayConfig {
  OverlayType type{OverlayType::DateWindow};
  bool hasPosition{false};
  Point position{};               // target pixels; default canvas center
  bool hasDate{false};
  CalendarDate date{};            // default today
  std::string dateFormat;         // strftime; empty = day of month
  std::string text;               // OverlayType::Text
  double fontSize{14};            // target pixels
  std::string fontPath;
  ColorSpec textColor{solidColor(0.0f, 0.0f, 0.0f)};
  bool hasBackground{false};
  ColorSpec backgroundColor{};
  bool hasBorder{false};
  ColorSpec borderColor{};
  double borderWidth{1};          // target pixels
  double cornerRadius{0};         // target pixels
  double padding{4};              // target pixels
};

struct OverlayWindow {
  Point center{};
  double x0{0}, y0{0}, x1{0}, y1{0};
};

// Complication box with centered text, e.g. a date window.
class OverlayElement : public Element {
public:
  OverlayElement(ElementSpec spec, const Placement& placement, const OverlayConfig& config);

  static Status parseConfig(const rapidjson::Value& props, OverlayConfig& out,
                            Placement& placement);
  static Status create(const rapidjson::Value& props, std::unique_ptr<Element>& out);

  const OverlayConfig& config() const { return config_; }

  std::string displayText() const;

  // Box around text of the given size (working pixels), padding included.
  OverlayWindow computeWindow(const DialFrame& frame, double textWidth, double textHeight) const;

  Status draw(DrawContext& ctx) const override;

private:
  OverlayConfig config_;
};

} // namespace dk
