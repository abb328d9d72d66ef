#pragma once
#include "dk/core/Status.hpp"
#include "dk/math/ClockMath.hpp"
#include "dk/raster/Surface.hpp"
#include "dk/style/PropertyReader.hpp"
#include "dk/text/FontLibrary.hpp"

#include <cstdint>
#include <string>
#include <utility>

#include <rapidjson/document.h>

namespace dk {

enum class ElementKind : std::uint8_t { Face, Ticks, Numerals, Hands, Overlay };

// Type tag as written in configurations ("Face", "Ticks", ...).
const char* toString(ElementKind k);
bool parseElementKind(const std::string& tag, ElementKind& out);

// Fixed draw order: Face=0, Ticks=1, Numerals=2, Overlay=3, Hands=4.
int zOrderFor(ElementKind k);

// What an element was built from; kept so a clock can be written back out.
struct ElementSpec {
  ElementKind kind{ElementKind::Face};
  std::string propertiesJson{"{}"};
  bool hasProperties{true};
};

// Per-render state handed to every element.
struct DrawContext {
  Surface& surface;
  Point canvasCenter;   // working pixels
  double canvasRadius;  // working pixels
  double scale;         // supersampling factor
  FontLibrary& fonts;
};

// The dial an element draws on, in working pixels.
struct DialFrame {
  Point center{};
  double radius{0};
  double scale{1};
  int canvasWidth{0};
  int canvasHeight{0};
};

// Optional center/radius overrides, in target-canvas pixels.
struct Placement {
  bool hasCenter{false};
  Point center{};
  bool hasRadius{false};
  double radius{0};

  DialFrame resolve(const DrawContext& ctx) const;
};

Status readPlacement(const PropertyReader& reader, Placement& out);

// Base class for the drawable layers of a clock. Properties are validated
// once when the element is created; draw() only rasterizes.
class Element {
public:
  virtual ~Element() = default;

  ElementKind kind() const { return spec_.kind; }
  int zOrder() const { return zOrderFor(spec_.kind); }
  const ElementSpec& spec() const { return spec_; }
  const Placement& placement() const { return placement_; }
  // Cleared when the entry this element came from had no properties key.
  void setHasProperties(bool v) { spec_.hasProperties = v; }

  virtual Status draw(DrawContext& ctx) const = 0;

protected:
  Element(ElementSpec spec, const Placement& placement)
    : spec_(std::move(spec)), placement_(placement) {}

  ElementSpec spec_;
  Placement placement_;
};

// Serialize a property object to compact JSON text.
std::string toJsonText(const rapidjson::Value& v);

} // namespace dk
