#include "dk/text/FontLibrary.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>

namespace dk {

std::vector<std::string> FontLibrary::defaultFontCandidates() {
  std::vector<std::string> c;
  if (const char* env = std::getenv("DIALKIT_FONT")) {
    if (*env) c.emplace_back(env);
  }
  c.emplace_back("/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf");
  c.emplace_back("/usr/share/fonts/TTF/DejaVuSans.ttf");
  c.emplace_back("/usr/share/fonts/dejavu/DejaVuSans.ttf");
  c.emplace_back("/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf");
  c.emplace_back("/usr/share/fonts/liberation/LiberationSans-Regular.ttf");
  c.emplace_back("/System/Library/Fonts/Helvetica.ttc");
  c.emplace_back("/System/Library/Fonts/Arial.ttf");
  c.emplace_back("/Library/Fonts/Arial.ttf");
  c.emplace_back("C:/Windows/Fonts/arial.ttf");
  return c;
}

Status FontLibrary::findDefaultFont(std::string& out) {
  for (const auto& path : defaultFontCandidates()) {
    std::ifstream f(path, std::ios::binary);
    if (f.good()) {
      out = path;
      return {};
    }
  }
  return resourceError("FONT_NOT_FOUND",
                       "No default font found; set DIALKIT_FONT or give font_path");
}

Status FontLibrary::acquire(const std::string& path, GlyphCache*& out) {
  std::string resolved = path;
  if (resolved.empty()) {
    Status st = findDefaultFont(resolved);
    if (!st.ok) return st;
  }

  auto it = fonts_.find(resolved);
  if (it != fonts_.end()) {
    out = it->second.get();
    return {};
  }

  auto cache = std::make_unique<GlyphCache>();
  if (!cache->loadFontFile(resolved)) {
    std::fprintf(stderr, "FontLibrary: cannot load font '%s'\n", resolved.c_str());
    return resourceError("FONT_LOAD_FAILED", "Cannot load font: " + resolved,
                         "{\"path\":" + jsonQuote(resolved) + "}");
  }
  out = cache.get();
  fonts_.emplace(resolved, std::move(cache));
  return {};
}

} // namespace dk
