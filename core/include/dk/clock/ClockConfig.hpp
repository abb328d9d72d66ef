#pragma once
#include "dk/core/Status.hpp"
#include "dk/style/Color.hpp"

#include <string>
#include <vector>

#include <rapidjson/document.h>

namespace dk {

struct CanvasSpec {
  int width{400};
  int height{400};
  int scaleFactor{2};       // supersampling factor
  bool antialias{true};     // false renders at factor 1
  ColorSpec background{solidColor(1.0f, 1.0f, 1.0f, 1.0f)};

  int effectiveScale() const { return antialias ? scaleFactor : 1; }
};

// Applied after downsampling: flip, then rotate, then transpose.
struct PostProcessing {
  bool hasFlipHorizontal{false};
  bool flipHorizontal{false};
  bool hasRotate{false};
  double rotate{0};         // degrees, clockwise
  bool hasTranspose{false};
  bool transpose{false};
};

struct ElementEntry {
  std::string type;                     // "Face", "Ticks", ...
  std::string propertiesJson{"{}"};
  bool hasProperties{true};             // false when the key was absent
};

// A clock description as read from JSON. The has* flags record which
// optional keys were written so serialization does not add defaults.
struct ClockConfig {
  CanvasSpec canvas{};
  bool hasAntialias{false};
  bool hasScaleFactor{false};
  bool hasBackground{false};
  std::string backgroundJson;           // verbatim background_color value
  bool hasElements{false};
  std::vector<ElementEntry> elements;
  bool hasPostProcessing{false};
  PostProcessing post{};
};

Status parseClockConfig(const rapidjson::Value& doc, ClockConfig& out);
Status loadClockConfigText(const std::string& json, ClockConfig& out);
// Missing/unreadable file is a ResourceError.
Status loadClockConfigFile(const std::string& path, ClockConfig& out);

std::string serializeClockConfig(const ClockConfig& cfg);

} // namespace dk
