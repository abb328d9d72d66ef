#pragma once
#include "dk/core/Status.hpp"
#include "dk/raster/Image.hpp"

#include <string>

namespace dk {

// Decode PNG/JPEG/BMP/GIF/TGA into RGBA. Fails with a ResourceError that
// carries the path.
Status loadImageFile(const std::string& path, Image& out);

} // namespace dk
