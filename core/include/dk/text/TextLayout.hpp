#pragma once
#include "dk/raster/Image.hpp"
#include "dk/text/GlyphCache.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace dk {

// Decode UTF-8; malformed bytes map to U+FFFD.
std::vector<std::uint32_t> decodeUtf8(const std::string& text);

struct PlacedGlyph {
  const GlyphInfo* glyph{nullptr};
  int x{0};  // bitmap top-left relative to the pen origin / baseline
  int y{0};
};

struct TextLayoutResult {
  std::vector<PlacedGlyph> glyphs;  // only glyphs with a bitmap
  int glyphCount{0};
  float advanceWidth{0};
  // Ink bounds relative to the pen origin (baseline at y = 0)
  int inkX0{0}, inkY0{0}, inkX1{0}, inkY1{0};
};

// Single-line layout starting at the pen origin, with kerning.
TextLayoutResult layoutText(GlyphCache& cache, const std::string& text, std::uint32_t px);

// Rasterize a line into a mask cropped to its ink bounds.
AlphaMask rasterizeText(GlyphCache& cache, const std::string& text, std::uint32_t px);

} // namespace dk
