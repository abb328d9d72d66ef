// D6.2 — Preset styles and the one-call clock builder

#include "dk/clock/Clock.hpp"
#include "dk/style/Presets.hpp"
#include "dk/text/FontLibrary.hpp"

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

#include <rapidjson/document.h>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  // ---- Test 1: built-in names and lookup ----
  {
    const auto& names = dk::presetNames();
    requireTrue(names.size() == 3, "three presets");
    requireTrue(names[0] == "classic" && names[1] == "modern" && names[2] == "minimal",
                "preset order");
    requireTrue(dk::findPreset("modern") != nullptr, "modern found");
    requireTrue(dk::findPreset("Modern") == nullptr, "lookup is case-sensitive");
    requireTrue(dk::findPreset("baroque") == nullptr, "unknown preset");
    std::printf("  Test 1 (names): PASS\n");
  }

  // ---- Test 2: generated configuration ----
  {
    dk::PresetOverrides ov;
    ov.width = 300;
    ov.height = 200;
    ov.scaleFactor = 3;
    dk::ClockConfig cfg;
    dk::Status st = dk::buildPresetConfig("10:10:30", "classic", ov, cfg);
    requireTrue(st.ok, "classic builds");
    requireTrue(cfg.canvas.width == 300 && cfg.canvas.height == 200, "override size");
    requireTrue(cfg.canvas.scaleFactor == 3 && cfg.canvas.antialias, "override quality");
    requireTrue(cfg.canvas.background.solid.a == 1.0f, "opaque white background");
    requireTrue(cfg.elements.size() == 4, "face, ticks, numerals, hands");
    requireTrue(cfg.elements[0].type == "Face" && cfg.elements[3].type == "Hands", "layer types");

    rapidjson::Document hands;
    hands.Parse(cfg.elements[3].propertiesJson.c_str());
    requireTrue(hands.IsObject() && hands.HasMember("time"), "time spliced into hands");
    requireTrue(std::string(hands["time"].GetString()) == "10:10:30", "time value");
    requireTrue(hands.HasMember("second_spec"), "classic has a second hand");

    requireTrue(dk::buildPresetConfig("10:10:30", "minimal", ov, cfg).ok, "minimal builds");
    hands.Parse(cfg.elements[3].propertiesJson.c_str());
    requireTrue(!hands.HasMember("second_spec"), "minimal has no second hand");

    std::unique_ptr<dk::Clock> clock;
    for (const auto& name : dk::presetNames()) {
      requireTrue(dk::buildPresetConfig("6:30:45", name, dk::PresetOverrides{}, cfg).ok, name.c_str());
      requireTrue(dk::Clock::fromConfig(cfg, clock).ok, "every preset builds a clock");
      requireTrue(clock->elementCount() == 4, "four elements");
    }
    std::printf("  Test 2 (config): PASS\n");
  }

  // ---- Test 3: bad inputs ----
  {
    dk::ClockConfig cfg;
    dk::Status st = dk::buildPresetConfig("12:00:00", "baroque", dk::PresetOverrides{}, cfg);
    requireTrue(!st.ok && st.err.code == "UNKNOWN_STYLE", "unknown style");
    requireTrue(st.err.message.find("classic") != std::string::npos &&
                st.err.message.find("minimal") != std::string::npos,
                "message lists the available styles");

    st = dk::buildPresetConfig("12:60:00", "classic", dk::PresetOverrides{}, cfg);
    requireTrue(!st.ok && st.err.code == "BAD_TIME", "bad time");

    dk::PresetOverrides ov;
    ov.width = 0;
    st = dk::buildPresetConfig("12:00:00", "classic", ov, cfg);
    requireTrue(!st.ok && st.err.code == "BAD_CANVAS", "bad size");
    std::printf("  Test 3 (errors): PASS\n");
  }

  // ---- Test 4: presets render (needs a system font for the numerals) ----
  {
    std::string fontPath;
    if (!dk::FontLibrary::findDefaultFont(fontPath).ok) {
      std::printf("  Test 4 (render): SKIPPED (no default font)\n");
    } else {
      dk::ClockConfig cfg;
      dk::PresetOverrides ov;
      ov.width = 240;
      ov.height = 240;
      requireTrue(dk::buildPresetConfig("3:00:00", "modern", ov, cfg).ok, "modern");
      std::unique_ptr<dk::Clock> clock;
      requireTrue(dk::Clock::fromConfig(cfg, clock).ok, "clock");
      dk::Image img;
      dk::Status st = clock->render(img);
      requireTrue(st.ok, "modern renders");
      requireTrue(img.width == 240 && img.height == 240, "size");
      const std::uint8_t* corner = img.at(0, 0);
      requireTrue(corner[0] == 255 && corner[3] == 255, "white canvas background");
      const std::uint8_t* face = img.at(60, 170);
      requireTrue(face[0] == 0x2c && face[1] == 0x3e && face[2] == 0x50, "dark face");
      std::printf("  Test 4 (render): PASS\n");
    }
  }

  std::printf("D6.2 presets: ALL PASS\n");
  return 0;
}
