#include "core/rgba_image.h"

#include <algorithm>
#include <cstring>
#include <utility>

namespace pix
{
RgbaImage::RgbaImage(int width, int height)
    : m_width(std::max(0, width))
    , m_height(std::max(0, height))
{
    m_pixels.assign((std::size_t)m_width * (std::size_t)m_height * 4u, 0);
}

RgbaImage::RgbaImage(int width, int height, std::vector<std::uint8_t> rgba)
    : m_width(std::max(0, width))
    , m_height(std::max(0, height))
    , m_pixels(std::move(rgba))
{
    m_pixels.resize((std::size_t)m_width * (std::size_t)m_height * 4u, 0);
}

void RgbaImage::Fill(const Color& c)
{
    for (std::size_t i = 0; i + 3 < m_pixels.size(); i += 4)
    {
        m_pixels[i + 0] = c.r;
        m_pixels[i + 1] = c.g;
        m_pixels[i + 2] = c.b;
        m_pixels[i + 3] = c.a;
    }
}

RgbaImage RgbaImage::SubImage(const Rect& rect) const
{
    const Rect clip = rect.Intersect(Bounds());
    if (clip.IsEmpty())
        return RgbaImage{};

    RgbaImage out(clip.w, clip.h);
    const std::size_t row_bytes = (std::size_t)clip.w * 4u;
    for (int y = 0; y < clip.h; ++y)
    {
        const std::size_t src = Index(clip.x, clip.y + y);
        const std::size_t dst = (std::size_t)y * row_bytes;
        std::memcpy(out.m_pixels.data() + dst, m_pixels.data() + src, row_bytes);
    }
    return out;
}
} // namespace pix
