#pragma once
#include "dk/element/Element.hpp"

#include <memory>
#include <vector>

namespace dk {

enum class TickShape : std::uint8_t { Line, Circle };

struct TickSpec {
  TickShape shape{TickShape::Line};
  ColorSpec color{solidColor(0.0f, 0.0f, 0.0f)};
  double length{0.1};  // fraction of the dial radius
  double width{2};     // target pixels
};

// One entry of the per-index "tick_spec" list.
struct IndexedTickSpec {
  TickSpec spec;
  bool all{false};
  bool allOthers{false};
  std::vector<int> indices;
};

struct TicksConfig {
  int divisions{12};          // hour divisions (24 in 24h mode)
  int minuteDivisions{60};    // total ticks when minute ticks are drawn
  double rotation{0};         // degrees
  bool hasHourSpec{false};
  TickSpec hourSpec{};
  bool hasMinuteSpec{false};
  TickSpec minuteSpec{TickShape::Line, solidColor(0.0f, 0.0f, 0.0f), 0.05, 1};
  bool hasVisibleHours{false};
  std::vector<int> visibleHours;
  bool hasVisibleMinutes{false};
  std::vector<int> visibleMinutes;
  std::vector<IndexedTickSpec> tickSpecs;  // overrides hour/minute specs when set
};

// Resolved tick in working pixels.
struct TickMark {
  int index{0};
  bool isHour{false};
  double angle{0};
  TickShape shape{TickShape::Line};
  Point inner{}, outer{};   // line
  Point center{};           // circle
  double diameter{0};       // circle
  bool filled{false};       // circle
  double width{0};
  ColorSpec color{};
};

// Dial graduations: hour and minute marks, or per-index specs.
class TicksElement : public Element {
public:
  TicksElement(ElementSpec spec, const Placement& placement, const TicksConfig& config);

  static Status parseConfig(const rapidjson::Value& props, TicksConfig& out,
                            Placement& placement);
  static Status create(const rapidjson::Value& props, std::unique_ptr<Element>& out);

  const TicksConfig& config() const { return config_; }

  std::vector<TickMark> computeTicks(const DialFrame& frame) const;

  Status draw(DrawContext& ctx) const override;

private:
  TicksConfig config_;

  TickMark makeMark(const DialFrame& frame, int index, double angle,
                    const TickSpec& spec) const;
};

} // namespace dk
