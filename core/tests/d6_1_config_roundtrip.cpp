// D6.1 — Clock configuration: load, validate, round-trip through a Clock

#include "dk/clock/Clock.hpp"
#include "dk/clock/ClockConfig.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <string>

#include <rapidjson/document.h>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static bool sameJson(const std::string& a, const std::string& b) {
  rapidjson::Document da, db;
  da.Parse(a.c_str());
  db.Parse(b.c_str());
  if (da.HasParseError() || db.HasParseError()) return false;
  return da == db;
}

static void requireError(const char* json, dk::ErrorKind kind, const char* code, const char* msg) {
  dk::ClockConfig cfg;
  dk::Status st = dk::loadClockConfigText(json, cfg);
  if (st.ok || st.err.kind != kind || st.err.code != code) {
    std::fprintf(stderr, "ASSERT FAIL: %s (code=%s)\n", msg, st.err.code.c_str());
    std::exit(1);
  }
}

static const char* kFull = R"({
  "width": 320, "height": 240, "antialias": true, "scale_factor": 3,
  "background_color": {"type": "radial", "colors": ["white", "#cccccc"]},
  "elements": [
    {"type": "Face", "properties": {"color": "ivory", "border_color": "black", "border_width": 4}},
    {"type": "Ticks", "properties": {"hour_spec": {"length": 0.12}, "minute_spec": {}}},
    {"type": "Hands", "properties": {"time": "10:08:42", "pivot_spec": {"radius": 6}}},
    {"type": "Face", "properties": {"center": [160, 180], "radius": 30, "color": [20, 20, 20]}}
  ],
  "post_processing": {"flip_horizontal": false, "rotate": 90, "transpose": false}
})";

int main() {
  // ---- Test 1: full configuration parses ----
  {
    dk::ClockConfig cfg;
    dk::Status st = dk::loadClockConfigText(kFull, cfg);
    requireTrue(st.ok, "full config loads");
    requireTrue(cfg.canvas.width == 320 && cfg.canvas.height == 240, "dimensions");
    requireTrue(cfg.canvas.scaleFactor == 3 && cfg.hasScaleFactor, "scale factor");
    requireTrue(cfg.canvas.background.kind == dk::PaintKind::Radial, "radial background");
    requireTrue(cfg.elements.size() == 4, "four element entries");
    requireTrue(cfg.elements[2].type == "Hands", "entry type");
    requireTrue(cfg.hasPostProcessing && cfg.post.hasRotate && cfg.post.rotate == 90.0, "post");
    std::printf("  Test 1 (parse): PASS\n");
  }

  // ---- Test 2: defaults fill in, but are not written back ----
  {
    dk::ClockConfig cfg;
    requireTrue(dk::loadClockConfigText(R"({"width":100,"height":50})", cfg).ok, "minimal");
    requireTrue(cfg.canvas.scaleFactor == 2 && cfg.canvas.antialias, "canvas defaults");
    const dk::Rgba& bg = cfg.canvas.background.solid;
    requireTrue(cfg.canvas.background.kind == dk::PaintKind::Solid &&
                bg.r == 1.0f && bg.g == 1.0f && bg.b == 1.0f && bg.a == 1.0f,
                "opaque white background by default");
    requireTrue(!cfg.hasElements && cfg.elements.empty(), "no elements");
    requireTrue(sameJson(dk::serializeClockConfig(cfg), R"({"width":100,"height":50})"),
                "serialization adds no defaults");

    dk::ClockConfig noProps;
    requireTrue(dk::loadClockConfigText(R"({"width":10,"height":10,
        "elements":[{"type":"Face"}]})", noProps).ok, "properties optional");
    requireTrue(noProps.elements[0].propertiesJson == "{}", "missing properties read as {}");
    requireTrue(!noProps.elements[0].hasProperties, "missing properties remembered");
    const char* bare = R"({"width":10,"height":10,"elements":[{"type":"Face"}]})";
    requireTrue(sameJson(dk::serializeClockConfig(noProps), bare),
                "entry without properties is written back without them");

    std::unique_ptr<dk::Clock> bareClock;
    requireTrue(dk::Clock::fromConfig(noProps, bareClock).ok, "build bare clock");
    requireTrue(sameJson(dk::serializeClockConfig(bareClock->toConfig()), bare),
                "clock export keeps the entry without properties");

    dk::ClockConfig emptyProps;
    requireTrue(dk::loadClockConfigText(R"({"width":10,"height":10,
        "elements":[{"type":"Face","properties":{}}]})", emptyProps).ok, "empty properties");
    requireTrue(sameJson(dk::serializeClockConfig(emptyProps),
                         R"({"width":10,"height":10,"elements":[{"type":"Face","properties":{}}]})"),
                "explicit empty properties are kept");
    std::printf("  Test 2 (defaults): PASS\n");
  }

  // ---- Test 3: structural errors ----
  {
    requireError("{\"width\":10,", dk::ErrorKind::Config, "PARSE_ERROR", "truncated JSON");
    requireError("[1,2,3]", dk::ErrorKind::Config, "BAD_CONFIG", "top level must be an object");
    requireError(R"({"height":10})", dk::ErrorKind::Config, "MISSING_FIELD", "width required");
    requireError(R"({"width":10})", dk::ErrorKind::Config, "MISSING_FIELD", "height required");
    requireError(R"({"width":0,"height":10})", dk::ErrorKind::Config, "BAD_FIELD", "zero width");
    requireError(R"({"width":"10","height":10})", dk::ErrorKind::Config, "BAD_FIELD",
                 "string width");
    requireError(R"({"width":10,"height":10,"scale_factor":0})", dk::ErrorKind::Config,
                 "OUT_OF_RANGE", "scale factor below 1");
    requireError(R"({"width":10,"height":10,"background_color":"nope"})", dk::ErrorKind::Config,
                 "BAD_COLOR", "bad background");
    requireError(R"({"width":10,"height":10,"elements":{}})", dk::ErrorKind::Config,
                 "BAD_FIELD", "elements must be a list");
    requireError(R"({"width":10,"height":10,"elements":[{"properties":{}}]})",
                 dk::ErrorKind::Config, "BAD_ELEMENT", "entry without type");
    requireError(R"({"width":10,"height":10,"elements":[{"type":"Face","properties":[]}]})",
                 dk::ErrorKind::Config, "BAD_ELEMENT", "properties must be an object");
    requireError(R"({"width":10,"height":10,"post_processing":{"rotate":"left"}})",
                 dk::ErrorKind::Config, "BAD_PROPERTY", "rotate must be a number");

    dk::ClockConfig cfg;
    dk::Status st = dk::loadClockConfigFile("no_such_config.json", cfg);
    requireTrue(!st.ok && st.err.kind == dk::ErrorKind::Resource &&
                st.err.code == "CONFIG_NOT_FOUND", "missing file is a ResourceError");
    std::printf("  Test 3 (errors): PASS\n");
  }

  // ---- Test 4: load -> Clock -> export -> reload is structurally equal ----
  {
    const std::string path = "d6_1_config.json";
    {
      std::ofstream f(path);
      f << kFull;
    }
    dk::ClockConfig cfg;
    requireTrue(dk::loadClockConfigFile(path, cfg).ok, "load from file");
    std::remove(path.c_str());

    std::unique_ptr<dk::Clock> clock;
    requireTrue(dk::Clock::fromConfig(cfg, clock).ok, "build clock");
    requireTrue(clock->elementCount() == 4, "elements built");

    std::string exported = dk::serializeClockConfig(clock->toConfig());
    requireTrue(sameJson(exported, kFull), "export matches the source document");

    dk::ClockConfig again;
    requireTrue(dk::loadClockConfigText(exported, again).ok, "export reloads");
    requireTrue(sameJson(dk::serializeClockConfig(again), exported), "second trip stable");
    std::printf("  Test 4 (round-trip): PASS\n");
  }

  // ---- Test 5: programmatic edits show up in the export ----
  {
    dk::Clock clock;
    dk::CanvasSpec cs;
    cs.width = 200;
    cs.height = 100;
    cs.background = dk::solidColor(1.0f, 0.0f, 0.0f, 1.0f);
    clock.setCanvas(cs);
    requireTrue(clock.addElement("Hands", R"({"time":"1:02:03"})").ok, "add hands");

    dk::ClockConfig out = clock.toConfig();
    requireTrue(out.hasElements && out.elements.size() == 1, "element exported");
    requireTrue(sameJson(out.elements[0].propertiesJson, R"({"time":"1:02:03"})"),
                "properties exported verbatim");

    dk::ClockConfig back;
    requireTrue(dk::loadClockConfigText(dk::serializeClockConfig(out), back).ok, "reload");
    requireTrue(back.canvas.width == 200 && back.canvas.height == 100, "canvas exported");
    requireTrue(back.canvas.background.solid.r == 1.0f && back.canvas.background.solid.g == 0.0f,
                "background exported");
    std::printf("  Test 5 (programmatic export): PASS\n");
  }

  std::printf("D6.1 config_roundtrip: ALL PASS\n");
  return 0;
}
