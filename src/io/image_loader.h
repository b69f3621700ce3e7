#pragma once

#include "core/rgba_image.h"

#include <cstdint>
#include <string>
#include <vector>

namespace pix::image_loader
{
// Decodes a PNG/JPEG/BMP/TGA/GIF (first frame) file into a straight-alpha RGBA8 image.
bool LoadImageAsRgba32(const std::string& path, RgbaImage& out, std::string& err);

// Same as above for an in-memory encoded file.
bool LoadImageFromMemoryAsRgba32(const std::vector<std::uint8_t>& bytes, RgbaImage& out, std::string& err);
} // namespace pix::image_loader
