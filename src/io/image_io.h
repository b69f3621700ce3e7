#pragma once

#include "core/editor_image.h"
#include "core/image_format.h"

#include <string>

namespace pix::image_io
{
// Loads `path` as a single-layer canvas. The format tag comes from the extension
// (PNG when unknown); the canvas remembers `path`.
bool LoadEditorImage(const std::string& path, EditorImage& out, std::string& err);

// Flattens the visible layers and writes them to `path` using `format`.
bool SaveEditorImage(const EditorImage& image, const std::string& path, const ImageFormatInfo& format, std::string& err);

// Same, with the format taken from the extension of `path`, falling back to the
// canvas's own format tag.
bool SaveEditorImage(const EditorImage& image, const std::string& path, std::string& err);
} // namespace pix::image_io
