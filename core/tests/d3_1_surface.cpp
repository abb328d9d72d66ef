// D3.1 — Surface rasterization and image operations

#include "dk/raster/ImageOps.hpp"
#include "dk/raster/Surface.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static dk::Fill solid(float r, float g, float b, float a = 1.0f) {
  return dk::Fill(dk::solidColor(r, g, b, a), dk::FillBounds::rect(0, 0, 1, 1));
}

static void setPx(dk::Image& img, int x, int y, std::uint8_t r, std::uint8_t g,
                  std::uint8_t b, std::uint8_t a = 255) {
  std::uint8_t* p = img.at(x, y);
  p[0] = r; p[1] = g; p[2] = b; p[3] = a;
}

static bool samePixels(const dk::Image& a, const dk::Image& b) {
  return a.width == b.width && a.height == b.height && a.pixels == b.pixels;
}

int main() {
  // ---- Test 1: clear and source-over blend ----
  {
    dk::Surface s(4, 4);
    requireTrue(s.image().at(0, 0)[3] == 0, "new surface is transparent");
    s.clear(solid(1, 1, 1));
    requireTrue(s.image().at(3, 3)[0] == 255 && s.image().at(3, 3)[3] == 255, "clear to white");

    s.blendPixel(1, 1, {0, 0, 0, 1}, 0.5f);
    const std::uint8_t* p = s.image().at(1, 1);
    requireTrue(p[0] >= 126 && p[0] <= 129, "half black over white is mid gray");
    requireTrue(p[3] == 255, "opaque destination stays opaque");

    s.blendPixel(-1, 0, {0, 0, 0, 1});
    s.blendPixel(0, 99, {0, 0, 0, 1});
    std::printf("  Test 1 (clear/blend): PASS\n");
  }

  // ---- Test 2: circle coverage at pixel centers ----
  {
    dk::Surface s(20, 20);
    s.fillCircle({10, 10}, 5, solid(1, 0, 0));
    requireTrue(s.image().at(10, 10)[0] == 255, "center covered");
    requireTrue(s.image().at(0, 0)[3] == 0, "corner not covered");
    requireTrue(s.image().at(14, 9)[3] == 255, "inside radius covered");
    requireTrue(s.image().at(16, 10)[3] == 0, "outside radius untouched");

    dk::Surface ring(20, 20);
    ring.strokeCircle({10, 10}, 6, 2, solid(0, 0, 1));
    requireTrue(ring.image().at(10, 10)[3] == 0, "annulus leaves the middle empty");
    requireTrue(ring.image().at(15, 9)[3] == 255, "annulus covers the ring");
    std::printf("  Test 2 (circles): PASS\n");
  }

  // ---- Test 3: thick lines have butt caps ----
  {
    dk::Surface s(20, 20);
    s.drawLine({2, 10}, {18, 10}, 4, solid(0, 1, 0));
    requireTrue(s.image().at(10, 9)[1] == 255 && s.image().at(10, 10)[1] == 255, "line body");
    requireTrue(s.image().at(10, 7)[3] == 0, "outside half-width");
    requireTrue(s.image().at(1, 10)[3] == 0, "no cap past the start");
    requireTrue(s.image().at(18, 10)[3] == 0, "no cap past the end");
    std::printf("  Test 3 (lines): PASS\n");
  }

  // ---- Test 4: polygon and rounded rect ----
  {
    dk::Surface s(20, 20);
    s.fillPolygon({{2, 2}, {18, 2}, {2, 18}}, solid(1, 1, 0));
    requireTrue(s.image().at(4, 4)[3] == 255, "inside triangle");
    requireTrue(s.image().at(16, 16)[3] == 0, "outside hypotenuse");

    dk::Surface r(20, 20);
    r.fillRoundedRect(0, 0, 20, 20, 6, solid(1, 0, 1));
    requireTrue(r.image().at(10, 10)[3] == 255, "rounded rect body");
    requireTrue(r.image().at(0, 0)[3] == 0, "rounded corner cut");

    dk::Surface frame(20, 20);
    frame.strokeRect(0, 0, 20, 20, 3, solid(0, 0, 0));
    requireTrue(frame.image().at(1, 10)[3] == 255, "stroke inside the edge");
    requireTrue(frame.image().at(10, 10)[3] == 0, "stroke leaves the interior");
    std::printf("  Test 4 (polygon/rect): PASS\n");
  }

  // ---- Test 5: masks rotate and mirror about their center ----
  {
    // 3x1 mask lit on the right only.
    dk::AlphaMask m(3, 1);
    m.at(2, 0) = 255;

    dk::Surface s(11, 11);
    s.drawMask(m, {5.5, 5.5}, 0, false, false, {1, 1, 1, 1});
    requireTrue(s.image().at(6, 5)[3] == 255, "unrotated: right pixel lit");
    requireTrue(s.image().at(4, 5)[3] == 0, "unrotated: left pixel dark");

    dk::Surface mir(11, 11);
    mir.drawMask(m, {5.5, 5.5}, 0, true, false, {1, 1, 1, 1});
    requireTrue(mir.image().at(4, 5)[3] == 255, "mirrorX moves the lit pixel left");

    dk::Surface rot(11, 11);
    rot.drawMask(m, {5.5, 5.5}, 90, false, false, {1, 1, 1, 1});
    requireTrue(rot.image().at(5, 6)[3] == 255, "rotated 90 clockwise: lit pixel below");
    std::printf("  Test 5 (masks): PASS\n");
  }

  // ---- Test 6: box downsample averages in premultiplied space ----
  {
    dk::Image src(2, 2);
    setPx(src, 0, 0, 255, 0, 0);
    setPx(src, 1, 0, 255, 0, 0);
    setPx(src, 0, 1, 0, 0, 0, 0);
    setPx(src, 1, 1, 0, 0, 0, 0);
    dk::Image out = dk::downsampleBox(src, 2);
    requireTrue(out.width == 1 && out.height == 1, "2x2 -> 1x1");
    requireTrue(out.at(0, 0)[0] == 255, "transparent pixels do not darken the color");
    requireTrue(out.at(0, 0)[3] >= 127 && out.at(0, 0)[3] <= 128, "alpha is the average");

    dk::Image same = dk::downsampleBox(src, 1);
    requireTrue(samePixels(same, src), "factor 1 passes through");
    std::printf("  Test 6 (downsample): PASS\n");
  }

  // ---- Test 7: flip / rotate / transpose ----
  {
    // 2x1: A (red) then B (blue).
    dk::Image row(2, 1);
    setPx(row, 0, 0, 255, 0, 0);
    setPx(row, 1, 0, 0, 0, 255);

    dk::Image f = dk::flipHorizontal(row);
    requireTrue(f.at(0, 0)[2] == 255 && f.at(1, 0)[0] == 255, "flip swaps columns");

    dk::Image r90 = dk::rotateImage(row, 90);
    requireTrue(r90.width == 1 && r90.height == 2, "90 swaps dimensions");
    requireTrue(r90.at(0, 0)[0] == 255 && r90.at(0, 1)[2] == 255, "clockwise: left goes to top");

    dk::Image r270 = dk::rotateImage(row, -90);
    requireTrue(r270.at(0, 0)[2] == 255, "-90 is counter-clockwise");

    dk::Image r180 = dk::rotateImage(row, 180);
    requireTrue(samePixels(r180, f), "180 on a single row equals a flip");

    dk::Image full = dk::rotateImage(row, 360);
    requireTrue(samePixels(full, row), "360 is identity");

    dk::Image t = dk::transposeImage(row);
    requireTrue(t.width == 1 && t.height == 2, "transpose swaps dimensions");
    requireTrue(t.at(0, 0)[0] == 255 && t.at(0, 1)[2] == 255, "out(x,y) = in(y,x)");

    // Four quarter turns restore the original exactly.
    dk::Image sq(3, 2);
    setPx(sq, 0, 0, 10, 20, 30);
    setPx(sq, 2, 1, 40, 50, 60, 128);
    dk::Image turned = sq;
    for (int i = 0; i < 4; i++) turned = dk::rotateImage(turned, 90);
    requireTrue(samePixels(turned, sq), "four 90 turns are lossless");

    dk::Image r45 = dk::rotateImage(sq, 45);
    requireTrue(r45.width > sq.width && r45.height > sq.height, "45 expands the canvas");
    std::printf("  Test 7 (flip/rotate/transpose): PASS\n");
  }

  // ---- Test 8: transforms do not commute ----
  {
    dk::Image img(3, 2);
    setPx(img, 0, 0, 255, 0, 0);

    dk::Image flipThenRotate = dk::rotateImage(dk::flipHorizontal(img), 90);
    dk::Image rotateThenFlip = dk::flipHorizontal(dk::rotateImage(img, 90));
    requireTrue(!samePixels(flipThenRotate, rotateThenFlip), "flip/rotate order matters");
    std::printf("  Test 8 (order sensitivity): PASS\n");
  }

  std::printf("D3.1 surface: ALL PASS\n");
  return 0;
}
