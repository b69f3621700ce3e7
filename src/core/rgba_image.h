#pragma once

#include "core/color.h"
#include "core/rect.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pix
{
// Row-major RGBA8 pixel buffer (width * height * 4 bytes).
// Pixel accessors assume in-bounds coordinates; callers clip first.
class RgbaImage
{
public:
    RgbaImage() = default;
    // Fully transparent buffer.
    RgbaImage(int width, int height);
    // Adopts `rgba`; it is resized (zero-filled) when shorter than width * height * 4.
    RgbaImage(int width, int height, std::vector<std::uint8_t> rgba);

    bool operator==(const RgbaImage& o) const = default;

    int  Width() const { return m_width; }
    int  Height() const { return m_height; }
    bool IsEmpty() const { return m_width <= 0 || m_height <= 0; }
    bool InBounds(int x, int y) const { return x >= 0 && y >= 0 && x < m_width && y < m_height; }
    Rect Bounds() const { return Rect{0, 0, m_width, m_height}; }

    Color GetPixel(int x, int y) const
    {
        const std::size_t i = Index(x, y);
        return Color{m_pixels[i + 0], m_pixels[i + 1], m_pixels[i + 2], m_pixels[i + 3]};
    }

    void PutPixel(int x, int y, const Color& c)
    {
        const std::size_t i = Index(x, y);
        m_pixels[i + 0] = c.r;
        m_pixels[i + 1] = c.g;
        m_pixels[i + 2] = c.b;
        m_pixels[i + 3] = c.a;
    }

    void Fill(const Color& c);

    // Copies the part of `rect` that lies inside this image; the result is clipped.
    RgbaImage SubImage(const Rect& rect) const;

    const std::vector<std::uint8_t>& Bytes() const { return m_pixels; }
    std::vector<std::uint8_t>&       MutableBytes() { return m_pixels; }

private:
    std::size_t Index(int x, int y) const
    {
        return ((std::size_t)y * (std::size_t)m_width + (std::size_t)x) * 4u;
    }

    int m_width = 0;
    int m_height = 0;
    std::vector<std::uint8_t> m_pixels;
};
} // namespace pix
