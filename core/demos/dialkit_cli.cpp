// dialkit — command-line front end
// Renders preset clocks, JSON-configured clocks, and the example set.
//
//   dialkit create <time> <out> [--style S] [--width W] [--height H]
//                  [--quality Q] [--no-antialias]
//   dialkit styles
//   dialkit example [dir]
//   dialkit config <file> <out>
//   dialkit dump <file>

#include "dk/clock/Clock.hpp"
#include "dk/clock/ClockConfig.hpp"
#include "dk/style/Presets.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <rapidjson/document.h>

static void usage() {
  std::fprintf(stderr,
    "usage: dialkit <command> [args]\n"
    "  create <time> <out> [--style S] [--width W] [--height H] [--quality Q] [--no-antialias]\n"
    "  styles\n"
    "  example [dir]\n"
    "  config <file> <out>\n"
    "  dump <file>\n");
}

static int reportError(const dk::Status& st) {
  std::fprintf(stderr, "Error: %s [%s/%s]\n", st.err.message.c_str(),
               dk::toString(st.err.kind), st.err.code.c_str());
  return 1;
}

static bool parseIntArg(const char* text, int& out) {
  char* end = nullptr;
  long v = std::strtol(text, &end, 10);
  if (end == text || *end != '\0') return false;
  out = static_cast<int>(v);
  return true;
}

static int renderConfig(const dk::ClockConfig& cfg, const std::string& out) {
  std::unique_ptr<dk::Clock> clock;
  dk::Status st = dk::Clock::fromConfig(cfg, clock);
  if (!st.ok) return reportError(st);
  st = clock->save(out);
  if (!st.ok) return reportError(st);
  return 0;
}

static int cmdCreate(int argc, char* argv[]) {
  if (argc < 4) {
    usage();
    return 1;
  }
  std::string time = argv[2];
  std::string out = argv[3];
  std::string style = "classic";
  dk::PresetOverrides ov;

  for (int i = 4; i < argc; i++) {
    std::string a = argv[i];
    bool hasValue = i + 1 < argc;
    if ((a == "--style" || a == "-s") && hasValue) {
      style = argv[++i];
    } else if ((a == "--width" || a == "-w") && hasValue) {
      if (!parseIntArg(argv[++i], ov.width)) { usage(); return 1; }
    } else if ((a == "--height" || a == "-h") && hasValue) {
      if (!parseIntArg(argv[++i], ov.height)) { usage(); return 1; }
    } else if ((a == "--quality" || a == "-q") && hasValue) {
      if (!parseIntArg(argv[++i], ov.scaleFactor)) { usage(); return 1; }
    } else if (a == "--no-antialias") {
      ov.antialias = false;
    } else if (a == "--antialias") {
      ov.antialias = true;
    } else {
      std::fprintf(stderr, "Unknown option: %s\n", a.c_str());
      usage();
      return 1;
    }
  }

  dk::ClockConfig cfg;
  dk::Status st = dk::buildPresetConfig(time, style, ov, cfg);
  if (!st.ok) return reportError(st);
  int rc = renderConfig(cfg, out);
  if (rc == 0) std::printf("Clock saved to %s\n", out.c_str());
  return rc;
}

static int cmdStyles() {
  std::printf("Available preset styles:\n");
  for (const auto& name : dk::presetNames()) {
    const dk::Preset* p = dk::findPreset(name);
    std::printf("  %s\n", name.c_str());

    rapidjson::Document face;
    face.Parse(p->faceJson.c_str());
    if (!face.HasParseError() && face.HasMember("color") && face["color"].IsString()) {
      std::printf("    * Face: %s\n", face["color"].GetString());
    }

    rapidjson::Document num;
    num.Parse(p->numeralsJson.c_str());
    if (num.HasParseError()) continue;
    const char* system = num.HasMember("system") && num["system"].IsString()
                           ? num["system"].GetString() : "arabic";
    if (num.HasMember("visible") && num["visible"].IsArray()) {
      std::string list;
      for (const auto& v : num["visible"].GetArray()) {
        if (!v.IsInt()) continue;
        if (!list.empty()) list += ", ";
        list += std::to_string(v.GetInt());
      }
      std::printf("    * Numerals: %s (%s)\n", system, list.c_str());
    } else {
      std::printf("    * Numerals: %s (all)\n", system);
    }
  }
  return 0;
}

static int cmdExample(int argc, char* argv[]) {
  std::string dir = argc >= 3 ? argv[2] : "examples";
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    std::fprintf(stderr, "Error: cannot create directory %s: %s\n",
                 dir.c_str(), ec.message().c_str());
    return 1;
  }

  static const char* kTimes[] = {"12:00:00", "3:15:30", "6:30:45", "9:45:15"};
  dk::PresetOverrides ov;
  ov.width = 300;
  ov.height = 300;

  std::printf("Generating examples in %s\n", dir.c_str());
  int count = 0;
  for (const auto& style : dk::presetNames()) {
    for (const char* t : kTimes) {
      std::string stamp;
      for (const char* c = t; *c; c++) {
        if (*c != ':') stamp += *c;
      }
      std::string path = dir + "/" + style + "_" + stamp + ".png";

      dk::ClockConfig cfg;
      dk::Status st = dk::buildPresetConfig(t, style, ov, cfg);
      if (!st.ok) return reportError(st);
      int rc = renderConfig(cfg, path);
      if (rc != 0) return rc;
      count++;
      std::printf("  [%d] %s\n", count, path.c_str());
    }
  }
  std::printf("Generated %d example clocks\n", count);
  return 0;
}

static int cmdConfig(int argc, char* argv[]) {
  if (argc < 4) {
    usage();
    return 1;
  }
  dk::ClockConfig cfg;
  dk::Status st = dk::loadClockConfigFile(argv[2], cfg);
  if (!st.ok) return reportError(st);
  int rc = renderConfig(cfg, argv[3]);
  if (rc == 0) std::printf("Clock created from %s and saved to %s\n", argv[2], argv[3]);
  return rc;
}

static int cmdDump(int argc, char* argv[]) {
  if (argc < 3) {
    usage();
    return 1;
  }
  dk::ClockConfig cfg;
  dk::Status st = dk::loadClockConfigFile(argv[2], cfg);
  if (!st.ok) return reportError(st);

  std::unique_ptr<dk::Clock> clock;
  st = dk::Clock::fromConfig(cfg, clock);
  if (!st.ok) return reportError(st);
  std::printf("%s\n", dk::serializeClockConfig(clock->toConfig()).c_str());
  return 0;
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    usage();
    return 1;
  }
  std::string cmd = argv[1];
  if (cmd == "create")  return cmdCreate(argc, argv);
  if (cmd == "styles")  return cmdStyles();
  if (cmd == "example") return cmdExample(argc, argv);
  if (cmd == "config")  return cmdConfig(argc, argv);
  if (cmd == "dump")    return cmdDump(argc, argv);

  std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
  usage();
  return 1;
}
