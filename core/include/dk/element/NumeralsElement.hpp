#pragma once
#include "dk/element/Element.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace dk {

enum class NumeralSystem : std::uint8_t { Arabic, Roman, Custom, None };
enum class NumeralOrientation : std::uint8_t { Upright, Radial, Tangent };
enum class NumeralFlip : std::uint8_t { None, Horizontal, Vertical, Both };

struct NumeralsConfig {
  NumeralSystem system{NumeralSystem::Arabic};
  std::vector<int> values{1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12};
  bool hasVisible{false};
  std::vector<int> visible;
  std::vector<std::string> customList;     // system == Custom, one per value
  std::map<int, std::string> customMap;    // per-value text override
  std::vector<double> positions;           // explicit angles, by value index
  bool hasDivisions{false};
  int divisions{12};
  double fontSize{12};                     // target pixels
  std::string fontPath;                    // empty = default font
  ColorSpec color{solidColor(0.0f, 0.0f, 0.0f)};
  NumeralOrientation orientation{NumeralOrientation::Upright};
  NumeralFlip flip{NumeralFlip::None};
  double rotation{0};
  double radiusOffset{0};                  // added to the 0.8 placement ratio
};

// Resolved label in working pixels.
struct NumeralLabel {
  int value{0};
  std::string text;
  double angle{0};          // position angle, rotation included
  Point position{};
  double glyphRotation{0};  // clockwise degrees applied to the text
  bool mirrorX{false};
  bool mirrorY{false};
  std::uint32_t fontPx{0};
};

// Hour labels placed around the dial.
class NumeralsElement : public Element {
public:
  NumeralsElement(ElementSpec spec, const Placement& placement, const NumeralsConfig& config);

  static Status parseConfig(const rapidjson::Value& props, NumeralsConfig& out,
                            Placement& placement);
  static Status create(const rapidjson::Value& props, std::unique_ptr<Element>& out);

  const NumeralsConfig& config() const { return config_; }

  // Position angle for the value at `idx`, before `rotation`.
  double positionAngle(std::size_t idx) const;
  std::string labelText(std::size_t idx) const;

  std::vector<NumeralLabel> computeLabels(const DialFrame& frame) const;

  Status draw(DrawContext& ctx) const override;

private:
  NumeralsConfig config_;
};

} // namespace dk
