#pragma once
#include "dk/raster/Image.hpp"
#include "dk/style/Color.hpp"

namespace dk {

// Bilinear sample at continuous pixel coordinates (pixel centers at +0.5),
// filtered in premultiplied space. Outside the image: transparent, or the
// nearest edge pixel when clampEdges is set.
Rgba sampleBilinear(const Image& img, double fx, double fy, bool clampEdges);

// Area-average each factor x factor block (premultiplied alpha).
Image downsampleBox(const Image& src, int factor);

Image flipHorizontal(const Image& src);

// Clockwise rotation; the canvas expands to the rotated bounds and new
// area is transparent. Multiples of 90 degrees are exact permutations.
Image rotateImage(const Image& src, double angleDeg);

// Mirror across the main diagonal: out(x, y) = in(y, x).
Image transposeImage(const Image& src);

} // namespace dk
