#pragma once

#include "core/rgba_image.h"

namespace pix::raster
{
// Resizes `src` to new_width x new_height with a separable triangle (tent) filter.
// Filtering happens in premultiplied-alpha space so transparent pixels do not bleed
// colour into their neighbours. The filter support widens when minifying.
// Returns an empty image when either target dimension is not positive.
RgbaImage ResampleTriangle(const RgbaImage& src, int new_width, int new_height);

// Rotates `src` by `radians` (counter-clockwise in image space, y down) about its
// centre. The result is sized to the rotated bounding box; every output pixel is
// inverse-rotated and sampled bilinearly, samples falling outside the source are
// transparent.
RgbaImage RotateImage(const RgbaImage& src, float radians);
} // namespace pix::raster
