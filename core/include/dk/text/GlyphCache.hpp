#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace dk {

struct GlyphInfo {
  std::uint32_t codepoint{0};
  // Metrics in pixels at the rasterized size
  float advance{0};
  int bearingX{0};  // left edge relative to the pen
  int bearingY{0};  // top edge above the baseline
  int w{0}, h{0};
  std::vector<std::uint8_t> bitmap;  // w*h coverage, row-major
};

struct FontMetrics {
  float ascent{0};   // above baseline, positive
  float descent{0};  // below baseline, negative
  float lineGap{0};
};

// Rasterized glyph coverage bitmaps for one font, cached per pixel size.
class GlyphCache {
public:
  GlyphCache() = default;

  // Load a TTF/OTF from memory.
  bool loadFont(const std::uint8_t* data, std::uint32_t len);

  // Load a TTF/OTF from file.
  bool loadFontFile(const std::string& path);

  bool isLoaded() const { return fontLoaded_; }
  const std::string& path() const { return path_; }

  // Rasterize on first use. Returns nullptr if the font is unusable.
  // `px` is the em size in pixels.
  const GlyphInfo* getGlyph(std::uint32_t codepoint, std::uint32_t px);

  FontMetrics metrics(std::uint32_t px) const;
  float kerning(std::uint32_t left, std::uint32_t right, std::uint32_t px) const;

  std::size_t cachedGlyphCount() const { return glyphs_.size(); }

private:
  std::vector<std::uint8_t> fontData_; // retained font file bytes
  std::string path_;
  bool fontLoaded_{false};

  std::unordered_map<std::uint64_t, GlyphInfo> glyphs_;

  static std::uint64_t key(std::uint32_t cp, std::uint32_t px) {
    return (static_cast<std::uint64_t>(px) << 32) | cp;
  }
};

} // namespace dk
