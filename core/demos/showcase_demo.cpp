// Showcase gallery
// Renders a set of configured clocks: chronograph sub-dials, 24-hour dial,
// radial gradient with Roman numerals and a date window, dual numeral ring,
// and a mirrored face. Writes PNGs into the given directory (default: gallery).

#include "dk/clock/Clock.hpp"
#include "dk/clock/ClockConfig.hpp"

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>

struct GalleryItem {
  const char* file;
  const char* json;
};

static const GalleryItem kGallery[] = {
  {"gallery_chronograph.png", R"({
    "width": 600, "height": 600, "antialias": true, "scale_factor": 3,
    "elements": [
      {"type": "Face", "properties": {"shape": "circle",
        "color": {"type": "radial", "colors": ["#ffffff", "#e8e8e8"], "center": [0.5, 0.5]},
        "border_color": "#333", "border_width": 4}},
      {"type": "Ticks", "properties": {
        "hour_spec": {"shape": "line", "color": "black", "length": 0.08, "width": 3}}},
      {"type": "Numerals", "properties": {"system": "arabic", "color": "black",
        "font_size": 48, "visible": [12, 3, 6, 9]}},

      {"type": "Face", "properties": {"center": [300, 150], "radius": 60, "shape": "circle",
        "color": "#f0f0f0", "border_color": "#666", "border_width": 2}},
      {"type": "Ticks", "properties": {"center": [300, 150], "radius": 60, "divisions": 60,
        "hour_spec": {"shape": "line", "color": "#666", "length": 0.1, "width": 1}}},
      {"type": "Hands", "properties": {"center": [300, 150], "radius": 60, "time": "0:00:30",
        "second_spec": {"color": "#666", "length": 0.8, "width": 2}}},

      {"type": "Face", "properties": {"center": [180, 300], "radius": 60, "shape": "circle",
        "color": "#f0f0f0", "border_color": "#666", "border_width": 2}},
      {"type": "Numerals", "properties": {"center": [180, 300], "radius": 60,
        "values": [15, 30, 45, 60], "divisions": 60, "color": "#666", "font_size": 24}},
      {"type": "Hands", "properties": {"center": [180, 300], "radius": 60, "time": "0:15:00",
        "minute_spec": {"color": "#666", "length": 0.7, "width": 2}}},

      {"type": "Face", "properties": {"center": [420, 300], "radius": 60, "shape": "circle",
        "color": "#f0f0f0", "border_color": "#666", "border_width": 2}},
      {"type": "Numerals", "properties": {"center": [420, 300], "radius": 60,
        "values": [3, 6, 9, 12], "color": "#666", "font_size": 24}},
      {"type": "Hands", "properties": {"center": [420, 300], "radius": 60, "time": "3:00:00",
        "hour_spec": {"color": "#666", "length": 0.6, "width": 2}}},

      {"type": "Hands", "properties": {"time": "10:10:30",
        "hour_spec": {"color": "black", "length": 0.5, "width": 8},
        "minute_spec": {"color": "black", "length": 0.75, "width": 6},
        "second_spec": {"color": "#c41e3a", "length": 0.85, "width": 2},
        "pivot_spec": {"shape": "circle", "color": "black", "radius": 8}}}
    ]})"},

  {"gallery_24hour.png", R"({
    "width": 600, "height": 600, "scale_factor": 3,
    "elements": [
      {"type": "Face", "properties": {"shape": "circle", "color": "#1a1a1a",
        "border_color": "#4a4a4a", "border_width": 3}},
      {"type": "Ticks", "properties": {"divisions": 24,
        "hour_spec": {"shape": "line", "color": "#888", "length": 0.06, "width": 2}}},
      {"type": "Numerals", "properties": {"values": [1,2,3,4,5,6,7,8,9,10,11,12],
        "color": "#e0e0e0", "font_size": 42}},
      {"type": "Numerals", "properties": {"values": [13,14,15,16,17,18,19,20,21,22,23,24],
        "radius_offset": -0.25, "color": "#00ff00", "font_size": 32}},
      {"type": "Hands", "properties": {"time": "18:30:00", "mode": "24h",
        "hour_spec": {"color": "#00ff00", "length": 0.5, "width": 6},
        "minute_spec": {"color": "#e0e0e0", "length": 0.75, "width": 4},
        "second_spec": {"color": "#ff0000", "length": 0.85, "width": 2},
        "pivot_spec": {"shape": "circle", "color": "#00ff00", "radius": 8}}}
    ]})"},

  {"gallery_gradient.png", R"({
    "width": 600, "height": 600, "scale_factor": 3,
    "elements": [
      {"type": "Face", "properties": {"shape": "circle",
        "color": {"type": "radial", "colors": ["#FFB6C1", "#9370DB", "#4169E1", "#191970"],
                  "center": [0.5, 0.4]},
        "border_color": "#191970", "border_width": 4}},
      {"type": "Ticks", "properties": {
        "hour_spec": {"shape": "line", "color": "white", "length": 0.08, "width": 3},
        "minute_spec": {"shape": "line", "color": "#e0e0e0", "length": 0.04, "width": 1}}},
      {"type": "Numerals", "properties": {"system": "roman", "color": "white", "font_size": 52}},
      {"type": "Overlay", "properties": {"type": "date_window", "position": [300, 420],
        "date": "2025-10-18", "font_size": 32, "text_color": "#191970",
        "background_color": "white", "border_color": "#191970", "padding": 8}},
      {"type": "Hands", "properties": {"time": "10:10:00",
        "hour_spec": {"color": "#FFD700", "length": 0.5, "width": 8},
        "minute_spec": {"color": "#FFD700", "length": 0.75, "width": 6},
        "second_spec": {"color": "white", "length": 0.85, "width": 2},
        "pivot_spec": {"shape": "circle", "color": "#FFD700", "radius": 10}}}
    ]})"},

  {"gallery_dual_ring.png", R"({
    "width": 600, "height": 600, "scale_factor": 3,
    "elements": [
      {"type": "Face", "properties": {"shape": "circle", "color": "white",
        "border_color": "#333", "border_width": 3}},
      {"type": "Ticks", "properties": {
        "hour_spec": {"shape": "line", "color": "black", "length": 0.08, "width": 3}}},
      {"type": "Ticks", "properties": {"divisions": 60,
        "hour_spec": {"shape": "line", "color": "#ccc", "length": 0.04, "width": 1}}},
      {"type": "Numerals", "properties": {"values": [1,2,3,4,5,6,7,8,9,10,11,12],
        "color": "black", "font_size": 48}},
      {"type": "Numerals", "properties": {"values": [5,10,15,20,25,30,35,40,45,50,55,60],
        "divisions": 60, "radius_offset": -0.3, "color": "#666", "font_size": 32}},
      {"type": "Hands", "properties": {"time": "3:15:45",
        "hour_spec": {"color": "#0066cc", "length": 0.5, "width": 8},
        "minute_spec": {"color": "#0066cc", "length": 0.7, "width": 6},
        "second_spec": {"color": "#cc0000", "length": 0.85, "width": 2},
        "pivot_spec": {"shape": "circle", "color": "#0066cc", "radius": 8}}}
    ]})"},

  {"gallery_mirrored.png", R"({
    "width": 500, "height": 500, "scale_factor": 3,
    "post_processing": {"flip_horizontal": true},
    "elements": [
      {"type": "Face", "properties": {"shape": "circle",
        "color": {"type": "radial", "colors": ["#40E0D0", "#20B2AA", "#008B8B", "#003333"]},
        "border_color": "#003333", "border_width": 3}},
      {"type": "Ticks", "properties": {
        "hour_spec": {"shape": "line", "color": "white", "length": 0.08, "width": 3}}},
      {"type": "Numerals", "properties": {"color": "white", "font_size": 52,
        "visible": [12, 3, 6, 9]}},
      {"type": "Hands", "properties": {"time": "9:15:00",
        "hour_spec": {"color": "white", "length": 0.5, "width": 8},
        "minute_spec": {"color": "white", "length": 0.75, "width": 6},
        "second_spec": {"color": "#FFD700", "length": 0.85, "width": 2},
        "pivot_spec": {"shape": "circle", "color": "white", "radius": 8}}}
    ]})"},
};

int main(int argc, char* argv[]) {
  std::string dir = argc >= 2 ? argv[1] : "gallery";
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    std::fprintf(stderr, "Cannot create %s: %s\n", dir.c_str(), ec.message().c_str());
    return 1;
  }

  int failures = 0;
  for (const auto& item : kGallery) {
    dk::ClockConfig cfg;
    dk::Status st = dk::loadClockConfigText(item.json, cfg);
    std::unique_ptr<dk::Clock> clock;
    if (st.ok) st = dk::Clock::fromConfig(cfg, clock);
    std::string path = dir + "/" + item.file;
    if (st.ok) st = clock->save(path);
    if (!st.ok) {
      std::fprintf(stderr, "FAIL %s: [%s] %s\n", item.file, st.err.code.c_str(),
                   st.err.message.c_str());
      failures++;
      continue;
    }
    std::printf("Saved %s\n", path.c_str());
  }
  return failures == 0 ? 0 : 1;
}
