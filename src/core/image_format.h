// Image file format tags shared by the canvas model and the codec boundary.
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>

namespace pix
{
enum class ImageFormat : std::uint8_t
{
    Png = 0,
    Jpeg,
    Bmp,
    Tga,
    Tiff,
};

inline constexpr int kDefaultJpegQuality = 90;

inline constexpr const char* ImageFormatToString(ImageFormat f)
{
    switch (f)
    {
        case ImageFormat::Png:  return "png";
        case ImageFormat::Jpeg: return "jpeg";
        case ImageFormat::Bmp:  return "bmp";
        case ImageFormat::Tga:  return "tga";
        case ImageFormat::Tiff: return "tiff";
    }
    return "png";
}

inline bool ImageFormatFromString(std::string_view s, ImageFormat& out)
{
    if (s == "png") { out = ImageFormat::Png; return true; }
    if (s == "jpeg" || s == "jpg") { out = ImageFormat::Jpeg; return true; }
    if (s == "bmp") { out = ImageFormat::Bmp; return true; }
    if (s == "tga") { out = ImageFormat::Tga; return true; }
    if (s == "tiff" || s == "tif") { out = ImageFormat::Tiff; return true; }
    return false;
}

// Picks a format from a path's extension (case-insensitive).
inline bool ImageFormatFromPath(std::string_view path, ImageFormat& out)
{
    const std::size_t dot = path.find_last_of('.');
    if (dot == std::string_view::npos || dot + 1 >= path.size())
        return false;
    const std::size_t slash = path.find_last_of("/\\");
    if (slash != std::string_view::npos && slash > dot)
        return false;

    std::string ext(path.substr(dot + 1));
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return ImageFormatFromString(ext, out);
}

// Format tag carried by a canvas; quality only matters for JPEG.
struct ImageFormatInfo
{
    ImageFormat format = ImageFormat::Png;
    int         jpeg_quality = kDefaultJpegQuality;

    bool operator==(const ImageFormatInfo& o) const = default;
};
} // namespace pix
