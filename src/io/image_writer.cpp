#include "io/image_writer.h"

#include <algorithm>

// stb_image_write implementation must live in exactly one translation unit.
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image_write.h>

namespace pix::image_writer
{
namespace
{
static bool WriteJpg(const std::string& path,
                     int width,
                     int height,
                     const std::vector<std::uint8_t>& rgba,
                     int quality,
                     std::string& err)
{
    quality = std::clamp(quality, 1, 100);

    // stb writes JPEG from RGB; drop alpha.
    std::vector<std::uint8_t> rgb((std::size_t)width * (std::size_t)height * 3u);
    for (std::size_t i = 0, n = (std::size_t)width * (std::size_t)height; i < n; ++i)
    {
        rgb[i * 3u + 0] = rgba[i * 4u + 0];
        rgb[i * 3u + 1] = rgba[i * 4u + 1];
        rgb[i * 3u + 2] = rgba[i * 4u + 2];
    }

    if (!stbi_write_jpg(path.c_str(), width, height, 3, rgb.data(), quality))
    {
        err = "stbi_write_jpg() failed.";
        return false;
    }
    return true;
}
} // namespace

bool WriteImageFromRgba32(const std::string& path,
                          int width,
                          int height,
                          const std::vector<std::uint8_t>& rgba,
                          ImageFormat format,
                          int jpeg_quality,
                          std::string& err)
{
    err.clear();
    if (width <= 0 || height <= 0)
    {
        err = "Invalid image dimensions.";
        return false;
    }
    const std::size_t need = (std::size_t)width * (std::size_t)height * 4u;
    if (rgba.size() < need)
    {
        err = "Invalid RGBA buffer size.";
        return false;
    }

    int ok = 0;
    switch (format)
    {
        case ImageFormat::Png:
            ok = stbi_write_png(path.c_str(), width, height, 4, rgba.data(), width * 4);
            break;
        case ImageFormat::Jpeg:
            return WriteJpg(path, width, height, rgba, jpeg_quality, err);
        case ImageFormat::Bmp:
            ok = stbi_write_bmp(path.c_str(), width, height, 4, rgba.data());
            break;
        case ImageFormat::Tga:
            ok = stbi_write_tga(path.c_str(), width, height, 4, rgba.data());
            break;
        case ImageFormat::Tiff:
            err = "TIFF output is not supported.";
            return false;
    }

    if (!ok)
    {
        err = std::string("Failed to write ") + ImageFormatToString(format) + " image '" + path + "'.";
        return false;
    }
    return true;
}
} // namespace pix::image_writer
