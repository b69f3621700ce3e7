#pragma once

#include "core/color.h"
#include "core/image_format.h"

#include <cstddef>
#include <string>

namespace pix
{
// Editor configuration (settings.json, schema_version 1).
// Keys missing from the document keep the defaults below.
struct EditorSettings
{
    std::size_t undo_limit = 256; // 0 = unlimited
    int         default_width = 640;
    int         default_height = 480;
    Color       default_background{255, 255, 255, 255};
    Color       primary_color{0, 0, 0, 255};
    Color       secondary_color{255, 255, 255, 255};
    int         pencil_half_width = 0;
    bool        anti_aliasing = true;
    float       bucket_tolerance = 0.0f; // [0,1]
    int         jpeg_quality = kDefaultJpegQuality;

    bool operator==(const EditorSettings& o) const = default;
};

bool LoadSettingsFromJson(const std::string& text, EditorSettings& out, std::string& err);
bool LoadSettingsFromFile(const std::string& path, EditorSettings& out, std::string& err);

std::string SettingsToJson(const EditorSettings& s);
bool        SaveSettingsToFile(const std::string& path, const EditorSettings& s, std::string& err);
} // namespace pix
