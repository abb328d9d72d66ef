#pragma once
#include "dk/clock/ClockConfig.hpp"

#include <string>
#include <vector>

namespace dk {

// A named look for the one-call clock builder. Each layer is the property
// JSON of one element; the hands layer gets the time added at build time.
struct Preset {
  std::string name;
  std::string background;    // canvas background color token
  std::string faceJson;
  std::string ticksJson;
  std::string numeralsJson;
  std::string handsJson;
};

// Built-in presets
Preset classicPreset();
Preset modernPreset();
Preset minimalPreset();

// "classic", "modern", "minimal".
const std::vector<std::string>& presetNames();

// nullptr when unknown.
const Preset* findPreset(const std::string& name);

struct PresetOverrides {
  int width{400};
  int height{400};
  int scaleFactor{2};
  bool antialias{true};
};

// Face, Ticks, Numerals and Hands for `style` showing `time`. Unknown style
// and bad time are ConfigErrors.
Status buildPresetConfig(const std::string& time, const std::string& style,
                         const PresetOverrides& overrides, ClockConfig& out);

} // namespace dk
