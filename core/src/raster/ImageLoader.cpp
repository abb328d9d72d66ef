#include "dk/raster/ImageLoader.hpp"

#include <cstdio>
#include <cstring>

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

namespace dk {

Status loadImageFile(const std::string& path, Image& out) {
  int w = 0, h = 0, channels = 0;
  unsigned char* decoded = stbi_load(path.c_str(), &w, &h, &channels, 4);
  if (!decoded) {
    const char* reason = stbi_failure_reason();
    std::fprintf(stderr, "ImageLoader: cannot load '%s' (%s)\n",
                 path.c_str(), reason ? reason : "unknown");
    return resourceError("IMAGE_LOAD_FAILED",
                         "Cannot load image: " + path,
                         "{\"path\":" + jsonQuote(path) + "}");
  }

  Image img(w, h);
  std::memcpy(img.pixels.data(), decoded, img.pixels.size());
  stbi_image_free(decoded);
  out = std::move(img);
  return {};
}

} // namespace dk
