#pragma once

#include "core/image_format.h"

#include <cstdint>
#include <string>
#include <vector>

namespace pix::image_writer
{
// Encodes a row-major RGBA8 buffer as `format` (PNG, JPEG, BMP or TGA).
// JPEG drops alpha and uses `jpeg_quality` (clamped to 1..100). TIFF is recognised
// but not supported by the encoder; it fails with an error.
// Returns false on error and sets `err`.
bool WriteImageFromRgba32(const std::string& path,
                          int width,
                          int height,
                          const std::vector<std::uint8_t>& rgba,
                          ImageFormat format,
                          int jpeg_quality,
                          std::string& err);
} // namespace pix::image_writer
