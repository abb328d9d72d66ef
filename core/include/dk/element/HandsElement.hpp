#pragma once
#include "dk/element/Element.hpp"

#include <memory>
#include <string>
#include <vector>

namespace dk {

enum class HandKind : std::uint8_t { Hour, Minute, Second };
enum class HandShape : std::uint8_t { Line, Triangle, CustomPolygon };

const char* toString(HandKind k);

struct HandSpec {
  HandKind kind{HandKind::Hour};
  HandShape shape{HandShape::Line};
  ColorSpec color{solidColor(0.0f, 0.0f, 0.0f)};
  double length{0.6};         // fraction of the dial radius, (0, 1]
  double width{2};            // target pixels
  std::vector<Point> polygon; // local frame: +x toward the tip, units of length
};

struct PivotSpec {
  ColorSpec color{solidColor(0.0f, 0.0f, 0.0f)};
  double radius{5};           // target pixels
};

struct HandsConfig {
  std::string timeText{"12:00:00"};
  TimeValue time{};
  bool mode24h{false};
  std::vector<HandSpec> hands;  // draw order
  bool hasPivot{false};
  PivotSpec pivot{};
};

// Resolved hand in working pixels.
struct HandGeometry {
  HandKind kind{HandKind::Hour};
  HandShape shape{HandShape::Line};
  double angle{0};
  Point pivot{};
  Point tip{};
  double width{0};
  std::vector<Point> polygon;  // triangle / custom polygon outline
  ColorSpec color{};
};

// Hour/minute/second hands for one time value, plus the pivot cap.
class HandsElement : public Element {
public:
  HandsElement(ElementSpec spec, const Placement& placement, const HandsConfig& config);

  static Status parseConfig(const rapidjson::Value& props, HandsConfig& out,
                            Placement& placement);
  static Status create(const rapidjson::Value& props, std::unique_ptr<Element>& out);

  const HandsConfig& config() const { return config_; }

  HandAngles angles() const { return computeHandAngles(config_.time, config_.mode24h); }

  std::vector<HandGeometry> computeHands(const DialFrame& frame) const;

  Status draw(DrawContext& ctx) const override;

private:
  HandsConfig config_;
};

} // namespace dk
