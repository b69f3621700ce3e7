#include "io/image_loader.h"

#include <climits>
#include <cstring>
#include <utility>

// stb_image implementation must live in exactly one translation unit.
#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>

namespace pix::image_loader
{
namespace
{
// Takes ownership of an stbi buffer (always 4 channels).
static bool AdoptStbPixels(unsigned char* data, int w, int h, RgbaImage& out, std::string& err)
{
    if (!data)
    {
        err = std::string("Failed to load image: ") + (stbi_failure_reason() ? stbi_failure_reason() : "unknown error");
        return false;
    }
    if (w <= 0 || h <= 0)
    {
        stbi_image_free(data);
        err = "Invalid image dimensions.";
        return false;
    }

    const std::size_t pixel_bytes = (std::size_t)w * (std::size_t)h * 4u;
    std::vector<std::uint8_t> pixels(pixel_bytes);
    std::memcpy(pixels.data(), data, pixel_bytes);
    stbi_image_free(data);

    out = RgbaImage(w, h, std::move(pixels));
    return true;
}
} // namespace

bool LoadImageAsRgba32(const std::string& path, RgbaImage& out, std::string& err)
{
    err.clear();
    out = RgbaImage{};

    int w = 0;
    int h = 0;
    int channels_in_file = 0;
    // Force 4 channels so we always get RGBA8.
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &channels_in_file, 4);
    if (!AdoptStbPixels(data, w, h, out, err))
    {
        err = path + ": " + err;
        return false;
    }
    return true;
}

bool LoadImageFromMemoryAsRgba32(const std::vector<std::uint8_t>& bytes, RgbaImage& out, std::string& err)
{
    err.clear();
    out = RgbaImage{};
    if (bytes.empty())
    {
        err = "Empty image buffer.";
        return false;
    }
    if (bytes.size() > (std::size_t)INT_MAX)
    {
        err = "Image buffer too large.";
        return false;
    }

    int w = 0;
    int h = 0;
    int channels_in_file = 0;
    unsigned char* data = stbi_load_from_memory(bytes.data(), (int)bytes.size(), &w, &h, &channels_in_file, 4);
    return AdoptStbPixels(data, w, h, out, err);
}
} // namespace pix::image_loader
