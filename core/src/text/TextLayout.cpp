#include "dk/text/TextLayout.hpp"

#include <algorithm>
#include <cmath>

namespace dk {

std::vector<std::uint32_t> decodeUtf8(const std::string& text) {
  std::vector<std::uint32_t> out;
  const auto* s = reinterpret_cast<const unsigned char*>(text.data());
  const std::size_t n = text.size();
  std::size_t i = 0;
  while (i < n) {
    unsigned char c = s[i];
    std::uint32_t cp = 0xFFFD;
    int extra = 0;
    if (c < 0x80) { cp = c; }
    else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; extra = 1; }
    else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; extra = 2; }
    else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; extra = 3; }
    else { out.push_back(0xFFFD); i++; continue; }

    if (i + static_cast<std::size_t>(extra) >= n) {
      out.push_back(0xFFFD);
      break;
    }
    bool ok = true;
    for (int k = 1; k <= extra; k++) {
      unsigned char cc = s[i + static_cast<std::size_t>(k)];
      if ((cc & 0xC0) != 0x80) { ok = false; break; }
      cp = (cp << 6) | (cc & 0x3F);
    }
    if (!ok) {
      out.push_back(0xFFFD);
      i++;
      continue;
    }
    out.push_back(cp);
    i += 1 + static_cast<std::size_t>(extra);
  }
  return out;
}

TextLayoutResult layoutText(GlyphCache& cache, const std::string& text, std::uint32_t px) {
  TextLayoutResult r;
  std::vector<std::uint32_t> cps = decodeUtf8(text);
  float cursorX = 0.0f;
  bool first = true;

  for (std::size_t i = 0; i < cps.size(); i++) {
    const GlyphInfo* g = cache.getGlyph(cps[i], px);
    if (!g) continue;
    if (i > 0) cursorX += cache.kerning(cps[i - 1], cps[i], px);
    if (g->w <= 0 || g->h <= 0) {
      cursorX += g->advance;
      continue;
    }
    PlacedGlyph pg;
    pg.glyph = g;
    pg.x = static_cast<int>(std::lround(cursorX)) + g->bearingX;
    pg.y = -g->bearingY;
    r.glyphs.push_back(pg);
    r.glyphCount++;

    if (first) {
      r.inkX0 = pg.x; r.inkY0 = pg.y;
      r.inkX1 = pg.x + g->w; r.inkY1 = pg.y + g->h;
      first = false;
    } else {
      r.inkX0 = std::min(r.inkX0, pg.x);
      r.inkY0 = std::min(r.inkY0, pg.y);
      r.inkX1 = std::max(r.inkX1, pg.x + g->w);
      r.inkY1 = std::max(r.inkY1, pg.y + g->h);
    }
    cursorX += g->advance;
  }
  r.advanceWidth = cursorX;
  return r;
}

AlphaMask rasterizeText(GlyphCache& cache, const std::string& text, std::uint32_t px) {
  TextLayoutResult layout = layoutText(cache, text, px);
  if (layout.glyphCount == 0) return {};

  AlphaMask mask(layout.inkX1 - layout.inkX0, layout.inkY1 - layout.inkY0);
  for (const auto& pg : layout.glyphs) {
    const GlyphInfo& g = *pg.glyph;
    int ox = pg.x - layout.inkX0;
    int oy = pg.y - layout.inkY0;
    for (int y = 0; y < g.h; y++) {
      for (int x = 0; x < g.w; x++) {
        std::uint8_t a = g.bitmap[static_cast<std::size_t>(y) * static_cast<std::size_t>(g.w) +
                                  static_cast<std::size_t>(x)];
        std::uint8_t& dst = mask.at(ox + x, oy + y);
        dst = std::max(dst, a);
      }
    }
  }
  return mask;
}

} // namespace dk
