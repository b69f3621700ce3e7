// Abstract pixel read/write capability consumed by the raster algorithms and
// the operation algebra. Nothing here knows about displays or textures: the
// owner of a surface calls Commit() once after a batch of writes and forwards
// the returned dirty rectangle to whatever presents the pixels.
#pragma once

#include "core/color.h"
#include "core/rect.h"
#include "core/rgba_image.h"

#include <cstdint>

namespace pix
{
class PixelSurface
{
public:
    virtual ~PixelSurface() = default;

    virtual int   Width() const = 0;
    virtual int   Height() const = 0;
    virtual Color GetPixel(int x, int y) const = 0;
    virtual void  PutPixel(int x, int y, const Color& c) = 0;

    // Alpha-blended write (source-over).
    virtual void BlendPixel(int x, int y, const Color& c)
    {
        if (!InBounds(x, y))
            return;
        PutPixel(x, y, color::BlendOver(GetPixel(x, y), c));
    }

    // True if a write at (x, y) is permitted. Raster algorithms consult this
    // before reading a pixel's undo value and before writing.
    virtual bool CanWrite(int x, int y) const { return InBounds(x, y); }

    bool InBounds(int x, int y) const
    {
        return x >= 0 && y >= 0 && x < Width() && y < Height();
    }
};

// Surface over an owned RgbaImage. Tracks the rectangle touched since the last Commit().
class ImageSurface final : public PixelSurface
{
public:
    explicit ImageSurface(RgbaImage& image) : m_image(image) {}

    int   Width() const override { return m_image.Width(); }
    int   Height() const override { return m_image.Height(); }
    Color GetPixel(int x, int y) const override { return m_image.GetPixel(x, y); }

    void PutPixel(int x, int y, const Color& c) override
    {
        if (!InBounds(x, y))
            return;
        m_image.PutPixel(x, y, c);
        m_dirty = m_dirty.Union(Rect{x, y, 1, 1});
    }

    bool HasPendingWrites() const { return !m_dirty.IsEmpty(); }

    // Returns the dirty rectangle accumulated since the previous commit and resets it.
    Rect Commit()
    {
        const Rect r = m_dirty;
        m_dirty = Rect{};
        return r;
    }

private:
    RgbaImage& m_image;
    Rect       m_dirty;
};

// Decorator restricting writes to a rectangular valid region (selection-bounded editing).
// Reads pass through unchanged; the region itself is never modified.
class RegionMaskedSurface final : public PixelSurface
{
public:
    RegionMaskedSurface(PixelSurface& inner, const Rect& region) : m_inner(inner), m_region(region) {}

    int   Width() const override { return m_inner.Width(); }
    int   Height() const override { return m_inner.Height(); }
    Color GetPixel(int x, int y) const override { return m_inner.GetPixel(x, y); }

    void PutPixel(int x, int y, const Color& c) override
    {
        if (m_region.Contains(x, y))
            m_inner.PutPixel(x, y, c);
    }

    void BlendPixel(int x, int y, const Color& c) override
    {
        if (m_region.Contains(x, y))
            m_inner.BlendPixel(x, y, c);
    }

    bool CanWrite(int x, int y) const override
    {
        return m_region.Contains(x, y) && m_inner.CanWrite(x, y);
    }

    const Rect& Region() const { return m_region; }

private:
    PixelSurface& m_inner;
    Rect          m_region;
};
} // namespace pix
