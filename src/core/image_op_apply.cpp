#include "core/image_op.h"

#include "core/raster/flood_fill.h"
#include "core/raster/raster_circle.h"
#include "core/raster/raster_line.h"
#include "core/raster/resample.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <unordered_map>
#include <utility>

namespace pix
{
namespace
{
using OptOp = std::optional<ImageOp>;

// Write path for sparse operations. Every first touch of a pixel records its
// pre-operation colour. A pixel is composited at most once per apply: a later write
// only takes effect when it covers the pixel more than the earlier one did, and it is
// then composited again from the recorded colour instead of on top of the first write.
class SparseRecorder
{
public:
    SparseRecorder(PixelSurface& surface, bool record) : m_surface(surface), m_record(record) {}

    void Put(int x, int y, const Color& c) { Cover(x, y, c, 1.0f, false); }

    void Write(int x, int y, const Color& c, bool blend) { Cover(x, y, c, 1.0f, blend); }

    // Partial coverage always blends.
    void Cover(int x, int y, const Color& c, float coverage, bool blend)
    {
        if (coverage <= 0.0f || !m_surface.CanWrite(x, y))
            return;
        coverage = std::min(coverage, 1.0f);

        auto [it, first] = m_coverage.emplace(Key(x, y), coverage);
        if (first)
        {
            m_before.Insert(x, y, m_surface.GetPixel(x, y));
        }
        else
        {
            if (coverage <= it->second)
                return;
            it->second = coverage;
            m_surface.PutPixel(x, y, *m_before.Get(x, y));
        }

        if (coverage < 1.0f)
            m_surface.BlendPixel(x, y, color::WithCoverage(c, coverage));
        else if (blend)
            m_surface.BlendPixel(x, y, c);
        else
            m_surface.PutPixel(x, y, c);
    }

    OptOp Finish()
    {
        if (!m_record || m_before.Empty())
            return std::nullopt;
        return ImageOp(op::SetSparseImage{std::move(m_before)});
    }

private:
    static std::uint64_t Key(int x, int y)
    {
        return ((std::uint64_t)(std::uint32_t)x << 32) | (std::uint64_t)(std::uint32_t)y;
    }

    PixelSurface&                            m_surface;
    bool                                     m_record = false;
    SparseImage                              m_before;
    std::unordered_map<std::uint64_t, float> m_coverage;
};

// Region write: the inverse is the pre-image of `target` clipped to the surface.
template <typename WriteFn>
static OptOp ApplyRegion(PixelSurface& surface, const Rect& target, bool compute_inverse, WriteFn&& write)
{
    const Rect clip = target.Intersect(Rect{0, 0, surface.Width(), surface.Height()});
    if (clip.IsEmpty())
        return std::nullopt;

    RgbaImage before;
    if (compute_inverse)
    {
        before = RgbaImage(clip.w, clip.h);
        for (int y = 0; y < clip.h; ++y)
            for (int x = 0; x < clip.w; ++x)
                before.PutPixel(x, y, surface.GetPixel(clip.x + x, clip.y + y));
    }

    bool wrote = false;
    for (int y = clip.y; y < clip.Bottom(); ++y)
    {
        for (int x = clip.x; x < clip.Right(); ++x)
        {
            if (!surface.CanWrite(x, y))
                continue;
            write(x, y);
            wrote = true;
        }
    }

    if (!compute_inverse || !wrote)
        return std::nullopt;
    return ImageOp(op::SetImage{clip.x, clip.y, std::move(before), false});
}

static void StampBlock(SparseRecorder& rec, int cx, int cy, int half_width, const Color& c)
{
    half_width = std::max(0, half_width);
    for (int y = cy - half_width; y <= cy + half_width; ++y)
        for (int x = cx - half_width; x <= cx + half_width; ++x)
            rec.Put(x, y, c);
}

static void StampDisc(SparseRecorder& rec, int cx, int cy, int radius, const Color& c, bool blend)
{
    raster::FilledCircle(cx, cy, std::max(0, radius), [&](int x0, int x1, int y) {
        for (int x = x0; x <= x1; ++x)
            rec.Write(x, y, c, blend);
    });
}

// Anti-aliased thick line: inner offsets write the full colour, the two outermost
// offsets blend with Wu coverage.
static void ThickWuLine(SparseRecorder& rec, int x0, int y0, int x1, int y1, int half_width,
                        const Color& c, bool blend)
{
    raster::ThickLineOffsets(x0, y0, x1, y1, half_width,
                             [&](float fx0, float fy0, float fx1, float fy1, bool outermost) {
        raster::WuLine(fx0, fy0, fx1, fy1, [&](int x, int y, float coverage) {
            if (outermost)
                rec.Cover(x, y, c, coverage, true);
            else
                rec.Write(x, y, c, blend);
        });
    });
}

static OptOp ApplySetImage(const op::SetImage& o, PixelSurface& surface, bool compute_inverse)
{
    const Rect target{o.start_x, o.start_y, o.image.Width(), o.image.Height()};
    return ApplyRegion(surface, target, compute_inverse, [&](int x, int y) {
        const Color c = o.image.GetPixel(x - o.start_x, y - o.start_y);
        if (o.blend)
            surface.BlendPixel(x, y, c);
        else
            surface.PutPixel(x, y, c);
    });
}

static OptOp ApplySequential(const op::Sequential& o, PixelSurface& surface, bool compute_inverse)
{
    std::vector<ImageOp> inverses;
    for (const ImageOp& child : o.ops)
    {
        if (auto inv = child.Apply(surface, compute_inverse))
            inverses.push_back(std::move(*inv));
    }
    if (inverses.empty())
        return std::nullopt;
    std::reverse(inverses.begin(), inverses.end());
    return ImageOp(op::Sequential{o.label, std::move(inverses)});
}

static OptOp ApplyLine(const op::Line& o, PixelSurface& surface, bool compute_inverse)
{
    SparseRecorder rec(surface, compute_inverse);
    if (o.anti_aliased)
    {
        ThickWuLine(rec, o.start_x, o.start_y, o.end_x, o.end_y, o.side_half_width, o.color, false);
    }
    else
    {
        raster::BresenhamLine(o.start_x, o.start_y, o.end_x, o.end_y, [&](int x, int y) {
            StampBlock(rec, x, y, o.side_half_width, o.color);
        });
    }
    return rec.Finish();
}

static OptOp ApplyPencilStroke(const op::PencilStroke& o, PixelSurface& surface, bool compute_inverse)
{
    SparseRecorder rec(surface, compute_inverse);
    const int hw = std::max(0, o.side_half_width);

    // Round join with the previous segment.
    if (o.prev_start)
        StampDisc(rec, o.start_x, o.start_y, hw, o.color, o.blend);

    if (o.anti_aliased)
    {
        ThickWuLine(rec, o.start_x, o.start_y, o.end_x, o.end_y, hw, o.color, o.blend);
    }
    else
    {
        raster::BresenhamLine(o.start_x, o.start_y, o.end_x, o.end_y, [&](int x, int y) {
            if (hw == 0)
                rec.Write(x, y, o.color, o.blend);
            else
                StampDisc(rec, x, y, hw, o.color, o.blend);
        });
    }
    return rec.Finish();
}

static OptOp ApplyRectangle(const op::Rectangle& o, PixelSurface& surface, bool compute_inverse)
{
    SparseRecorder rec(surface, compute_inverse);
    const int x0 = std::min(o.start_x, o.end_x);
    const int y0 = std::min(o.start_y, o.end_y);
    const int x1 = std::max(o.start_x, o.end_x);
    const int y1 = std::max(o.start_y, o.end_y);

    auto stamp = [&](int x, int y) { StampBlock(rec, x, y, o.border_half_width, o.color); };
    raster::BresenhamLine(x0, y0, x1, y0, stamp);
    raster::BresenhamLine(x1, y0, x1, y1, stamp);
    raster::BresenhamLine(x1, y1, x0, y1, stamp);
    raster::BresenhamLine(x0, y1, x0, y0, stamp);
    return rec.Finish();
}

static OptOp ApplyCircle(const op::Circle& o, PixelSurface& surface, bool compute_inverse)
{
    SparseRecorder rec(surface, compute_inverse);
    const int hw = std::max(0, o.border_half_width);

    for (int offset = -hw; offset <= hw; ++offset)
    {
        const int r = o.radius + offset;
        if (r < 0)
            continue;
        const bool outermost = std::abs(offset) == hw;

        if (o.anti_aliased)
        {
            raster::WuCircle(o.center_x, o.center_y, r, [&](int x, int y, float coverage) {
                if (outermost)
                    rec.Cover(x, y, o.color, coverage, true);
                else
                    rec.Write(x, y, o.color, o.blend);
            });
        }
        else
        {
            raster::MidpointCircle(o.center_x, o.center_y, r, [&](int x, int y) {
                rec.Write(x, y, o.color, o.blend);
            });
        }
    }
    return rec.Finish();
}

static OptOp ApplyBucketFill(const op::BucketFill& o, PixelSurface& surface, bool compute_inverse)
{
    if (!surface.CanWrite(o.start_x, o.start_y))
        return std::nullopt;

    OptionalImage before = compute_inverse ? OptionalImage(surface.Width(), surface.Height()) : OptionalImage{};
    const int filled = raster::FloodFill(surface, o.start_x, o.start_y, o.tolerance, [&](int x, int y) {
        if (compute_inverse)
            before.SetIfAbsent(x, y, surface.GetPixel(x, y));
        surface.PutPixel(x, y, o.fill_color);
    });

    if (!compute_inverse || filled == 0)
        return std::nullopt;
    return ImageOp(op::SetOptionalImage{0, 0, std::move(before)});
}

static OptOp ApplySetSparseImage(const op::SetSparseImage& o, PixelSurface& surface, bool compute_inverse)
{
    SparseImage before;
    bool wrote = false;
    o.image.ForEach([&](int x, int y, const Color& c) {
        if (!surface.CanWrite(x, y))
            return;
        if (compute_inverse)
            before.Insert(x, y, surface.GetPixel(x, y));
        surface.PutPixel(x, y, c);
        wrote = true;
    });
    if (!compute_inverse || !wrote)
        return std::nullopt;
    return ImageOp(op::SetSparseImage{std::move(before)});
}

static OptOp ApplySetOptionalImage(const op::SetOptionalImage& o, PixelSurface& surface, bool compute_inverse)
{
    OptionalImage before = compute_inverse ? OptionalImage(o.image.Width(), o.image.Height()) : OptionalImage{};
    bool wrote = false;
    for (int y = 0; y < o.image.Height(); ++y)
    {
        for (int x = 0; x < o.image.Width(); ++x)
        {
            const auto c = o.image.Get(x, y);
            if (!c)
                continue;
            const int sx = o.start_x + x;
            const int sy = o.start_y + y;
            if (!surface.CanWrite(sx, sy))
                continue;
            if (compute_inverse)
                before.SetIfAbsent(x, y, surface.GetPixel(sx, sy));
            surface.PutPixel(sx, sy, *c);
            wrote = true;
        }
    }
    if (!compute_inverse || !wrote)
        return std::nullopt;
    return ImageOp(op::SetOptionalImage{o.start_x, o.start_y, std::move(before)});
}
} // namespace

std::optional<ImageOp> ImageOp::Apply(PixelSurface& surface, bool compute_inverse) const
{
    switch (GetKind())
    {
        case Kind::Empty:
        case Kind::Marker:
            return std::nullopt;

        case Kind::Sequential:
            return ApplySequential(std::get<op::Sequential>(m_payload), surface, compute_inverse);

        case Kind::SetImage:
            return ApplySetImage(std::get<op::SetImage>(m_payload), surface, compute_inverse);

        case Kind::SetScaledImage:
        {
            const auto& o = std::get<op::SetScaledImage>(m_payload);
            if (o.image.IsEmpty() || !(o.scale_x > 0.0f) || !(o.scale_y > 0.0f))
                return std::nullopt;
            const int w = std::max(1, (int)std::lround((float)o.image.Width() * o.scale_x));
            const int h = std::max(1, (int)std::lround((float)o.image.Height() * o.scale_y));
            const op::SetImage placed{o.start_x, o.start_y, raster::ResampleTriangle(o.image, w, h), o.blend};
            return ApplySetImage(placed, surface, compute_inverse);
        }

        case Kind::SetRotatedImage:
        {
            const auto& o = std::get<op::SetRotatedImage>(m_payload);
            if (o.image.IsEmpty())
                return std::nullopt;
            RgbaImage rotated = raster::RotateImage(o.image, o.rotation);
            const int sx = o.center_x - rotated.Width() / 2;
            const int sy = o.center_y - rotated.Height() / 2;
            const op::SetImage placed{sx, sy, std::move(rotated), o.blend};
            return ApplySetImage(placed, surface, compute_inverse);
        }

        case Kind::FillRectangle:
        {
            const auto& o = std::get<op::FillRectangle>(m_payload);
            const Rect target = Rect::FromCorners(o.start_x, o.start_y, o.end_x, o.end_y);
            return ApplyRegion(surface, target, compute_inverse, [&](int x, int y) {
                if (o.blend)
                    surface.BlendPixel(x, y, o.color);
                else
                    surface.PutPixel(x, y, o.color);
            });
        }

        case Kind::ColorGradient:
        {
            const auto& o = std::get<op::ColorGradient>(m_payload);
            const Rect target{0, 0, surface.Width(), surface.Height()};
            return ApplyRegion(surface, target, compute_inverse, [&](int x, int y) {
                surface.PutPixel(x, y, raster::GradientColor(o.type, o.start_x, o.start_y, o.end_x, o.end_y,
                                                             o.first_color, o.second_color, x, y));
            });
        }

        case Kind::Block:
        {
            const auto& o = std::get<op::Block>(m_payload);
            SparseRecorder rec(surface, compute_inverse);
            StampBlock(rec, o.x, o.y, o.side_half_width, o.color);
            return rec.Finish();
        }

        case Kind::Line:
            return ApplyLine(std::get<op::Line>(m_payload), surface, compute_inverse);

        case Kind::PencilStroke:
            return ApplyPencilStroke(std::get<op::PencilStroke>(m_payload), surface, compute_inverse);

        case Kind::Rectangle:
            return ApplyRectangle(std::get<op::Rectangle>(m_payload), surface, compute_inverse);

        case Kind::Circle:
            return ApplyCircle(std::get<op::Circle>(m_payload), surface, compute_inverse);

        case Kind::FillCircle:
        {
            const auto& o = std::get<op::FillCircle>(m_payload);
            SparseRecorder rec(surface, compute_inverse);
            StampDisc(rec, o.center_x, o.center_y, o.radius, o.color, o.blend);
            if (o.anti_aliased && o.radius > 0)
            {
                raster::WuCircle(o.center_x, o.center_y, o.radius, [&](int x, int y, float coverage) {
                    rec.Cover(x, y, o.color, coverage, true);
                });
            }
            return rec.Finish();
        }

        case Kind::BucketFill:
            return ApplyBucketFill(std::get<op::BucketFill>(m_payload), surface, compute_inverse);

        case Kind::SetSparseImage:
            return ApplySetSparseImage(std::get<op::SetSparseImage>(m_payload), surface, compute_inverse);

        case Kind::SetOptionalImage:
            return ApplySetOptionalImage(std::get<op::SetOptionalImage>(m_payload), surface, compute_inverse);
    }
    return std::nullopt;
}
} // namespace pix
