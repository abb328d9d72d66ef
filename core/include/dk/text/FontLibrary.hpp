#pragma once
#include "dk/core/Status.hpp"
#include "dk/text/GlyphCache.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace dk {

// Fonts opened during one clock's renders, keyed by file path.
class FontLibrary {
public:
  // Open `path`, or the default font when `path` is empty. A missing or
  // unparseable file is a ResourceError; nothing is substituted.
  Status acquire(const std::string& path, GlyphCache*& out);

  std::size_t loadedCount() const { return fonts_.size(); }

  // DIALKIT_FONT (when set) followed by common system locations.
  static std::vector<std::string> defaultFontCandidates();

  // First existing candidate.
  static Status findDefaultFont(std::string& out);

private:
  std::unordered_map<std::string, std::unique_ptr<GlyphCache>> fonts_;
};

} // namespace dk
