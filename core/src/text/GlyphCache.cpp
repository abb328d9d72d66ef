#include "dk/text/GlyphCache.hpp"

#include <cstdio>
#include <fstream>

#define STB_TRUETYPE_IMPLEMENTATION
#include "stb_truetype.h"

namespace dk {

bool GlyphCache::loadFont(const std::uint8_t* data, std::uint32_t len) {
  fontData_.assign(data, data + len);
  stbtt_fontinfo font;
  if (!stbtt_InitFont(&font, fontData_.data(), 0)) {
    std::fprintf(stderr, "GlyphCache: stbtt_InitFont failed\n");
    fontData_.clear();
    fontLoaded_ = false;
    return false;
  }
  glyphs_.clear();
  fontLoaded_ = true;
  return true;
}

bool GlyphCache::loadFontFile(const std::string& path) {
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  if (!f) return false;
  auto sz = f.tellg();
  if (sz <= 0) return false;
  std::vector<std::uint8_t> bytes(static_cast<std::size_t>(sz));
  f.seekg(0);
  f.read(reinterpret_cast<char*>(bytes.data()), sz);
  if (!f) return false;
  if (!loadFont(bytes.data(), static_cast<std::uint32_t>(bytes.size()))) return false;
  path_ = path;
  return true;
}

const GlyphInfo* GlyphCache::getGlyph(std::uint32_t codepoint, std::uint32_t px) {
  auto it = glyphs_.find(key(codepoint, px));
  if (it != glyphs_.end()) return &it->second;
  if (!fontLoaded_ || px == 0) return nullptr;

  stbtt_fontinfo font;
  if (!stbtt_InitFont(&font, fontData_.data(), 0)) {
    std::fprintf(stderr, "GlyphCache: stbtt_InitFont failed\n");
    return nullptr;
  }

  float scale = stbtt_ScaleForMappingEmToPixels(&font, static_cast<float>(px));
  int glyphIdx = stbtt_FindGlyphIndex(&font, static_cast<int>(codepoint));

  int advW = 0, lsb = 0;
  stbtt_GetGlyphHMetrics(&font, glyphIdx, &advW, &lsb);

  int ix0, iy0, ix1, iy1;
  stbtt_GetGlyphBitmapBox(&font, glyphIdx, scale, scale, &ix0, &iy0, &ix1, &iy1);

  GlyphInfo info;
  info.codepoint = codepoint;
  info.advance = static_cast<float>(advW) * scale;
  info.bearingX = ix0;
  info.bearingY = -iy0;

  int gw = ix1 - ix0;
  int gh = iy1 - iy0;
  if (gw > 0 && gh > 0) {
    info.w = gw;
    info.h = gh;
    info.bitmap.assign(static_cast<std::size_t>(gw) * static_cast<std::size_t>(gh), 0);
    stbtt_MakeGlyphBitmap(&font, info.bitmap.data(), gw, gh, gw, scale, scale, glyphIdx);
  }
  // Whitespace glyphs keep w = h = 0: metrics only.

  auto res = glyphs_.emplace(key(codepoint, px), std::move(info));
  return &res.first->second;
}

FontMetrics GlyphCache::metrics(std::uint32_t px) const {
  FontMetrics m;
  if (!fontLoaded_) return m;
  stbtt_fontinfo font;
  if (!stbtt_InitFont(&font, fontData_.data(), 0)) return m;
  float scale = stbtt_ScaleForMappingEmToPixels(&font, static_cast<float>(px));
  int ascent = 0, descent = 0, lineGap = 0;
  stbtt_GetFontVMetrics(&font, &ascent, &descent, &lineGap);
  m.ascent = ascent * scale;
  m.descent = descent * scale;
  m.lineGap = lineGap * scale;
  return m;
}

float GlyphCache::kerning(std::uint32_t left, std::uint32_t right, std::uint32_t px) const {
  if (!fontLoaded_) return 0.0f;
  stbtt_fontinfo font;
  if (!stbtt_InitFont(&font, fontData_.data(), 0)) return 0.0f;
  float scale = stbtt_ScaleForMappingEmToPixels(&font, static_cast<float>(px));
  return stbtt_GetCodepointKernAdvance(&font, static_cast<int>(left),
                                       static_cast<int>(right)) * scale;
}

} // namespace dk
