// D7.1 — UTF-8 decoding, font lookup, glyph cache, text layout and labels on a dial

#include "dk/clock/Clock.hpp"
#include "dk/text/FontLibrary.hpp"
#include "dk/text/GlyphCache.hpp"
#include "dk/text/TextLayout.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static int inkPixels(const dk::Image& img, int x0, int y0, int x1, int y1) {
  int n = 0;
  for (int y = y0; y < y1; y++) {
    for (int x = x0; x < x1; x++) {
      if (img.at(x, y)[3] > 0) n++;
    }
  }
  return n;
}

int main() {
  // ---- Test 1: UTF-8 decoding ----
  {
    auto cps = dk::decodeUtf8("XII");
    requireTrue(cps.size() == 3 && cps[0] == 'X', "ascii");
    cps = dk::decodeUtf8("\xC3\xA9\xE2\x82\xAC");
    requireTrue(cps.size() == 2 && cps[0] == 0xE9 && cps[1] == 0x20AC, "two- and three-byte");
    cps = dk::decodeUtf8("\xF0\x9F\x95\x92");
    requireTrue(cps.size() == 1 && cps[0] == 0x1F552, "four-byte");
    cps = dk::decodeUtf8("a\xFF" "b");
    requireTrue(cps.size() == 3 && cps[1] == 0xFFFD && cps[2] == 'b', "invalid lead byte");
    cps = dk::decodeUtf8("\xC3");
    requireTrue(cps.size() == 1 && cps[0] == 0xFFFD, "truncated sequence");
    std::printf("  Test 1 (utf8): PASS\n");
  }

  // ---- Test 2: font lookup errors ----
  {
    dk::FontLibrary fonts;
    dk::GlyphCache* cache = nullptr;
    dk::Status st = fonts.acquire("no/such/font.ttf", cache);
    requireTrue(!st.ok && st.err.kind == dk::ErrorKind::Resource, "missing font is a ResourceError");
    requireTrue(st.err.code == "FONT_LOAD_FAILED", "font code");
    requireTrue(st.err.message.find("no/such/font.ttf") != std::string::npos, "path in message");
    requireTrue(fonts.loadedCount() == 0, "nothing cached on failure");

    dk::GlyphCache empty;
    requireTrue(!empty.isLoaded(), "fresh cache has no font");
    requireTrue(empty.getGlyph('A', 16) == nullptr, "no glyphs without a font");
    requireTrue(dk::rasterizeText(empty, "12", 16).width == 0, "empty mask without a font");
    requireTrue(!dk::FontLibrary::defaultFontCandidates().empty(), "candidate list");
    std::printf("  Test 2 (font errors): PASS\n");
  }

  std::string fontPath;
  if (!dk::FontLibrary::findDefaultFont(fontPath).ok) {
    std::printf("  Tests 3-5: SKIPPED (no default font)\n");
    std::printf("D7.1 text: ALL PASS\n");
    return 0;
  }

  // ---- Test 3: glyph cache ----
  {
    dk::FontLibrary fonts;
    dk::GlyphCache* cache = nullptr;
    requireTrue(fonts.acquire("", cache).ok && cache, "default font");
    dk::GlyphCache* again = nullptr;
    requireTrue(fonts.acquire(fontPath, again).ok && again == cache, "fonts shared by path");
    requireTrue(fonts.loadedCount() == 1, "one font loaded");

    const dk::GlyphInfo* a = cache->getGlyph('A', 32);
    requireTrue(a && a->w > 0 && a->h > 0, "A has a bitmap");
    requireTrue(a->bitmap.size() == static_cast<std::size_t>(a->w * a->h), "bitmap size");
    requireTrue(a->advance > 0, "A advances");
    std::size_t count = cache->cachedGlyphCount();
    requireTrue(cache->getGlyph('A', 32) == a, "same glyph on second lookup");
    requireTrue(cache->cachedGlyphCount() == count, "no re-rasterization");
    const dk::GlyphInfo* big = cache->getGlyph('A', 64);
    requireTrue(big && big->h > a->h, "sizes cached separately");

    const dk::GlyphInfo* space = cache->getGlyph(' ', 32);
    requireTrue(space && space->advance > 0 && space->bitmap.empty(), "space has no ink");

    dk::FontMetrics m = cache->metrics(32);
    requireTrue(m.ascent > 0 && m.descent < 0, "metrics signs");
    std::printf("  Test 3 (glyph cache): PASS\n");
  }

  // ---- Test 4: layout and rasterization ----
  {
    dk::FontLibrary fonts;
    dk::GlyphCache* cache = nullptr;
    requireTrue(fonts.acquire(fontPath, cache).ok, "font");

    dk::TextLayoutResult one = dk::layoutText(*cache, "1", 24);
    dk::TextLayoutResult two = dk::layoutText(*cache, "12", 24);
    requireTrue(one.glyphCount == 1 && two.glyphCount == 2, "glyph counts");
    requireTrue(two.advanceWidth > one.advanceWidth, "longer text advances further");
    requireTrue(two.inkY0 < 0, "ink rises above the baseline");

    dk::TextLayoutResult spaced = dk::layoutText(*cache, "1 2", 24);
    requireTrue(spaced.glyphCount == 2, "spaces are not placed");
    requireTrue(spaced.advanceWidth > two.advanceWidth, "but they advance the pen");

    dk::AlphaMask mask = dk::rasterizeText(*cache, "12", 24);
    requireTrue(mask.width == two.inkX1 - two.inkX0, "mask cropped to ink width");
    requireTrue(mask.height == two.inkY1 - two.inkY0, "mask cropped to ink height");
    int lit = 0;
    for (std::uint8_t v : mask.alpha) lit += v > 128 ? 1 : 0;
    requireTrue(lit > 10, "mask has coverage");
    requireTrue(dk::rasterizeText(*cache, "   ", 24).width == 0, "blank text has no mask");
    std::printf("  Test 4 (layout): PASS\n");
  }

  // ---- Test 5: numerals and overlays draw where they are placed ----
  {
    dk::CanvasSpec cs;
    cs.width = 200;
    cs.height = 200;
    cs.background = dk::solidColor(0.0f, 0.0f, 0.0f, 0.0f);  // ink is counted by alpha
    dk::Clock clock(cs);
    requireTrue(clock.addElement("Numerals", R"({"values":[3],"font_size":24})").ok, "numerals");
    requireTrue(clock.addElement("Overlay", R"({"type":"text","text":"AUTO",
        "position":[100,150],"font_size":16,"background_color":"yellow"})").ok, "overlay");
    dk::Image img;
    dk::Status st = clock.render(img);
    requireTrue(st.ok, "render with text");
    requireTrue(inkPixels(img, 165, 85, 195, 115) > 10, "3 drawn at 0.8r on the right");
    requireTrue(inkPixels(img, 5, 85, 35, 115) == 0, "nothing on the left");
    const std::uint8_t* box = img.at(100, 150);
    requireTrue(box[3] == 255, "overlay box drawn around its position");
    std::printf("  Test 5 (text on dial): PASS\n");
  }

  std::printf("D7.1 text: ALL PASS\n");
  return 0;
}
