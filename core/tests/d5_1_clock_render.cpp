// D5.1 — Clock compositing: z-order, supersampled render, post-processing,
// render cache and error propagation

#include "dk/clock/Clock.hpp"
#include "dk/element/ElementFactory.hpp"
#include "dk/raster/ImageLoader.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireOk(const dk::Status& st, const char* msg) {
  if (!st.ok) {
    std::fprintf(stderr, "ASSERT FAIL: %s: [%s] %s\n", msg, st.err.code.c_str(),
                 st.err.message.c_str());
    std::exit(1);
  }
}

static bool pixelIs(const dk::Image& img, int x, int y, int r, int g, int b, int a, int tol = 2) {
  const std::uint8_t* p = img.at(x, y);
  return std::abs(p[0] - r) <= tol && std::abs(p[1] - g) <= tol &&
         std::abs(p[2] - b) <= tol && std::abs(p[3] - a) <= tol;
}

static dk::CanvasSpec canvas(int w, int h) {
  dk::CanvasSpec cs;
  cs.width = w;
  cs.height = h;
  return cs;
}

// Centroid of dark ink inside [x0,x1]x[y0,y1], weighted by 255 - max channel
// so the white face and the red second hand do not count.
static bool darkCentroid(const dk::Image& img, int x0, int y0, int x1, int y1,
                         double& cx, double& cy) {
  double sum = 0, sx = 0, sy = 0;
  for (int y = y0; y <= y1; y++) {
    for (int x = x0; x <= x1; x++) {
      const std::uint8_t* p = img.at(x, y);
      int hi = std::max(p[0], std::max(p[1], p[2]));
      double w = 255.0 - hi;
      sum += w;
      sx += w * (x + 0.5);
      sy += w * (y + 0.5);
    }
  }
  if (sum < 255.0) return false;
  cx = sx / sum;
  cy = sy / sum;
  return true;
}

int main() {
  // ---- Test 1: draw order is stable by z-order ----
  {
    dk::Clock clock;
    requireOk(clock.addElement("Hands", "{}"), "hands");
    requireOk(clock.addElement("Face", R"({"color":"black"})"), "face a");
    requireOk(clock.addElement("Ticks", "{}"), "ticks");
    requireOk(clock.addElement("Face", R"({"color":"white","radius":50})"), "face b");
    requireOk(clock.addElement("Overlay", R"({"type":"text","text":"X"})"), "overlay");

    auto order = clock.drawOrder();
    requireTrue(order.size() == 5, "five elements");
    requireTrue(order[0] == 1 && order[1] == 3, "faces first, insertion order kept");
    requireTrue(order[2] == 2, "ticks next");
    requireTrue(order[3] == 4, "overlay before hands");
    requireTrue(order[4] == 0, "hands last");
    std::printf("  Test 1 (draw order): PASS\n");
  }

  // ---- Test 2: face + hands at 3:15:30 ----
  {
    dk::Clock clock(canvas(400, 400));
    requireOk(clock.addElement("Face", R"({"color":"white"})"), "face");

    dk::Image img;
    requireOk(clock.render(img), "render face");
    requireTrue(img.width == 400 && img.height == 400, "output at target size");
    requireTrue(pixelIs(img, 200, 200, 255, 255, 255, 255), "face center white");
    requireTrue(pixelIs(img, 200, 5, 255, 255, 255, 255), "face reaches the rim");
    requireTrue(pixelIs(img, 0, 0, 255, 255, 255, 255), "corner shows the white canvas");

    requireOk(clock.addElement("Hands", R"({"time":"3:15:30"})"), "hands");
    requireTrue(!clock.hasCachedImage(), "adding an element invalidates the cache");
    requireOk(clock.render(img), "render hands");
    requireTrue(pixelIs(img, 249, 206, 0, 0, 0, 255, 40), "hour hand toward 3");
    requireTrue(pixelIs(img, 200, 350, 255, 0, 0, 255, 40), "second hand straight down");
    requireTrue(pixelIs(img, 100, 200, 255, 255, 255, 255), "opposite side untouched");
    std::printf("  Test 2 (face + hands): PASS\n");
  }

  // ---- Test 3: antialias off renders at factor 1 with identical layout ----
  {
    dk::CanvasSpec cs = canvas(200, 200);
    cs.antialias = false;
    cs.scaleFactor = 4;
    requireTrue(cs.effectiveScale() == 1, "antialias off disables supersampling");
    dk::Clock clock(cs);
    requireOk(clock.addElement("Face", R"({"color":"navy"})"), "face");
    dk::Image img;
    requireOk(clock.render(img), "render");
    requireTrue(img.width == 200, "size unchanged");
    requireTrue(pixelIs(img, 100, 100, 0, 0, 128, 255), "navy center");
    std::printf("  Test 3 (no antialias): PASS\n");
  }

  // ---- Test 4: sub-dials keep their target-pixel geometry on any canvas ----
  {
    for (int side : {300, 600}) {
      dk::CanvasSpec cs = canvas(side, side);
      cs.background = dk::solidColor(0.0f, 0.0f, 0.0f, 0.0f);
      dk::Clock clock(cs);
      requireOk(clock.addElement("Face", R"({"color":"black","center":[100,100],"radius":50})"),
                "sub-dial");
      dk::Image img;
      requireOk(clock.render(img), "render");
      requireTrue(pixelIs(img, 100, 130, 0, 0, 0, 255), "inside the sub-dial");
      requireTrue(img.at(100, 160)[3] == 0, "outside the sub-dial");
      requireTrue(img.at(side / 2 + 60, side / 2 + 60)[3] == 0, "main dial untouched");
    }
    std::printf("  Test 4 (sub-dial independence): PASS\n");
  }

  // ---- Test 5: post-processing order and dimensions ----
  {
    dk::Clock clock(canvas(300, 200));
    requireOk(clock.addElement("Face", R"({"color":"black","center":[40,40],"radius":30})"),
              "marker");

    dk::PostProcessing pp;
    pp.hasRotate = true;
    pp.rotate = 90;
    clock.setPostProcessing(pp);
    dk::Image img;
    requireOk(clock.render(img), "rotate 90");
    requireTrue(img.width == 200 && img.height == 300, "rotate 90 swaps dimensions");
    requireTrue(pixelIs(img, 159, 40, 0, 0, 0, 255), "marker rotated clockwise to the top right");

    pp.hasFlipHorizontal = true;
    pp.flipHorizontal = true;
    clock.setPostProcessing(pp);
    requireOk(clock.render(img), "flip then rotate");
    requireTrue(pixelIs(img, 159, 259, 0, 0, 0, 255), "flip applies before rotate");

    pp = dk::PostProcessing{};
    pp.hasTranspose = true;
    pp.transpose = true;
    clock.setPostProcessing(pp);
    requireOk(clock.render(img), "transpose");
    requireTrue(img.width == 200 && img.height == 300, "transpose swaps dimensions");
    requireTrue(pixelIs(img, 40, 40, 0, 0, 0, 255), "marker stays on the diagonal");

    pp = dk::PostProcessing{};
    pp.hasRotate = true;
    pp.rotate = 360;
    clock.setPostProcessing(pp);
    requireOk(clock.render(img), "rotate 360");
    requireTrue(img.width == 300 && img.height == 200, "full turn is a no-op");

    pp.rotate = 45;
    clock.setPostProcessing(pp);
    requireOk(clock.render(img), "rotate 45");
    requireTrue(img.width > 300 && img.height > 200, "arbitrary rotation expands the canvas");
    std::printf("  Test 5 (post-processing): PASS\n");
  }

  // ---- Test 6: render cache ----
  {
    dk::Clock clock(canvas(100, 100));
    requireOk(clock.addElement("Face", "{}"), "face");
    requireTrue(!clock.hasCachedImage(), "dirty before first render");
    dk::Image a, b;
    requireOk(clock.render(a), "first");
    requireTrue(clock.hasCachedImage(), "cached after render");
    requireOk(clock.render(b), "second");
    requireTrue(a.pixels == b.pixels, "cached image returned");

    clock.setCanvas(canvas(120, 100));
    requireTrue(!clock.hasCachedImage(), "canvas change invalidates");
    requireOk(clock.render(b), "third");
    requireTrue(b.width == 120, "new canvas used");

    std::unique_ptr<dk::Element> el;
    requireOk(dk::createElementFromJson("Face", R"({"color":"red"})", el), "replacement");
    requireOk(clock.replaceElement(0, std::move(el)), "replace");
    requireTrue(!clock.hasCachedImage(), "replace invalidates");
    requireOk(clock.render(b), "fourth");
    requireTrue(pixelIs(b, 60, 50, 255, 0, 0, 255), "replacement drawn");

    dk::Status st = clock.replaceElement(7, nullptr);
    requireTrue(!st.ok && st.err.code == "BAD_INDEX", "replace out of range");
    std::printf("  Test 6 (cache): PASS\n");
  }

  // ---- Test 7: errors propagate and leave the clock usable ----
  {
    dk::Clock clock(canvas(100, 100));
    requireOk(clock.addElement("Face", R"({"image_path":"no/such/dial.png"})"), "lazy image");
    dk::Image img;
    dk::Status st = clock.render(img);
    requireTrue(!st.ok && st.err.kind == dk::ErrorKind::Resource, "missing image is a ResourceError");
    requireTrue(!clock.hasCachedImage(), "failed render caches nothing");

    dk::ClockConfig cfg;
    cfg.canvas = canvas(100, 100);
    cfg.hasElements = true;
    cfg.elements.push_back({"Face", "{}"});
    cfg.elements.push_back({"Bezel", "{}"});
    st = clock.applyConfig(cfg);
    requireTrue(!st.ok && st.err.code == "UNKNOWN_ELEMENT_TYPE", "unknown type rejected");
    requireTrue(clock.elementCount() == 1, "failed apply leaves the clock unchanged");

    std::unique_ptr<dk::Clock> built;
    st = dk::Clock::fromConfig(cfg, built);
    requireTrue(!st.ok && !built, "fromConfig reports the same error");

    dk::Clock bad(canvas(0, 100));
    st = bad.render(img);
    requireTrue(!st.ok && st.err.code == "BAD_CANVAS", "zero width rejected");

    dk::CanvasSpec cs = canvas(50, 50);
    cs.scaleFactor = 0;
    dk::Clock zero(cs);
    st = zero.render(img);
    requireTrue(!st.ok && st.err.code == "OUT_OF_RANGE", "scale factor below 1 rejected");
    std::printf("  Test 7 (errors): PASS\n");
  }

  // ---- Test 8: save by extension ----
  {
    dk::Clock clock(canvas(64, 48));
    requireOk(clock.addElement("Face", R"({"shape":"rectangle","color":"#336699"})"), "face");
    const std::string path = "d5_1_clock.png";
    requireOk(clock.save(path), "save png");
    dk::Image back;
    requireOk(dk::loadImageFile(path, back), "reload");
    requireTrue(back.width == 64 && back.height == 48, "saved dimensions");
    requireTrue(pixelIs(back, 10, 10, 0x33, 0x66, 0x99, 255, 1), "saved pixels");
    std::remove(path.c_str());

    dk::Status st = clock.save("no_such_dir/d5_1_clock.png");
    requireTrue(!st.ok && st.err.kind == dk::ErrorKind::Io, "unwritable path is an IoError");
    std::printf("  Test 8 (save): PASS\n");
  }

  // ---- Test 9: ticks and hands land on the same target pixels at any scale ----
  {
    double tickX[3], tickY[3], handX[3], handY[3];
    const int factors[3] = {1, 2, 4};
    for (int i = 0; i < 3; i++) {
      dk::CanvasSpec cs = canvas(200, 200);
      cs.scaleFactor = factors[i];
      dk::Clock clock(cs);
      requireOk(clock.addElement("Face", R"({"color":"white"})"), "face");
      requireOk(clock.addElement("Ticks", R"({"hour_spec":{"width":4,"length":0.1}})"), "ticks");
      requireOk(clock.addElement("Hands", R"({"time":"1:50:40"})"), "hands");
      dk::Image img;
      requireOk(clock.render(img), "render");
      requireTrue(img.width == 200 && img.height == 200, "target size at every factor");
      // 12 o'clock tick spans y 5..15 on x = 100; the hour hand points at 55 degrees.
      requireTrue(darkCentroid(img, 88, 0, 112, 24, tickX[i], tickY[i]), "tick ink found");
      requireTrue(darkCentroid(img, 116, 74, 134, 92, handX[i], handY[i]), "hour hand ink found");
    }
    requireTrue(std::fabs(tickX[0] - 100.0) <= 1.0 && std::fabs(tickY[0] - 10.0) <= 1.0,
                "tick centered where the dial geometry puts it");
    for (int i = 1; i < 3; i++) {
      requireTrue(std::fabs(tickX[i] - tickX[0]) <= 1.0 && std::fabs(tickY[i] - tickY[0]) <= 1.0,
                  "tick position independent of scale factor");
      requireTrue(std::fabs(handX[i] - handX[0]) <= 1.0 && std::fabs(handY[i] - handY[0]) <= 1.0,
                  "hand position independent of scale factor");
    }
    std::printf("  Test 9 (scale invariance): PASS\n");
  }

  std::printf("D5.1 clock_render: ALL PASS\n");
  return 0;
}
