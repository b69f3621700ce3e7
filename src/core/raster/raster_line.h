// Line rasterizers. Each one reports pixels through a caller-supplied callback
// and never touches a surface itself, so the same walk serves drawing, undo
// capture and previews.
#pragma once

#include <cmath>
#include <cstdlib>
#include <utility>

namespace pix::raster
{
// Bresenham line between two inclusive endpoints. `plot(x, y)`.
//
// The walk always starts at the endpoint with the lower coordinate on the
// dominant axis, so line(a, b) and line(b, a) visit the same pixel set.
template <typename Plot>
void BresenhamLine(int x1, int y1, int x2, int y2, Plot&& plot)
{
    const int dx = x2 - x1;
    const int dy = y2 - y1;
    const int dx1 = std::abs(dx);
    const int dy1 = std::abs(dy);
    // Minor axis moves with the major axis when both deltas share a sign.
    const bool same_sign = (dx < 0 && dy < 0) || (dx > 0 && dy > 0);

    int px = 2 * dy1 - dx1;
    int py = 2 * dx1 - dy1;

    if (dy1 <= dx1)
    {
        int x, y, end_x;
        if (dx >= 0)
        {
            x = x1;
            y = y1;
            end_x = x2;
        }
        else
        {
            x = x2;
            y = y2;
            end_x = x1;
        }
        plot(x, y);

        while (x < end_x)
        {
            ++x;
            if (px < 0)
            {
                px += 2 * dy1;
            }
            else
            {
                y += same_sign ? 1 : -1;
                px += 2 * (dy1 - dx1);
            }
            plot(x, y);
        }
    }
    else
    {
        int x, y, end_y;
        if (dy >= 0)
        {
            x = x1;
            y = y1;
            end_y = y2;
        }
        else
        {
            x = x2;
            y = y2;
            end_y = y1;
        }
        plot(x, y);

        while (y < end_y)
        {
            ++y;
            if (py <= 0)
            {
                py += 2 * dx1;
            }
            else
            {
                x += same_sign ? 1 : -1;
                py += 2 * (dx1 - dy1);
            }
            plot(x, y);
        }
    }
}

namespace detail
{
inline float FPart(float v) { return v - std::floor(v); }
inline float RFPart(float v) { return 1.0f - FPart(v); }
} // namespace detail

// Xiaolin Wu anti-aliased line. `plot(x, y, coverage)` with coverage in [0,1].
// Pixels whose coverage rounds to nothing are not reported.
template <typename Plot>
void WuLine(float x0, float y0, float x1, float y1, Plot&& plot)
{
    using detail::FPart;
    using detail::RFPart;

    const bool steep = std::fabs(y1 - y0) > std::fabs(x1 - x0);
    if (steep)
    {
        std::swap(x0, y0);
        std::swap(x1, y1);
    }
    if (x0 > x1)
    {
        std::swap(x0, x1);
        std::swap(y0, y1);
    }

    auto emit = [&](int major, int minor, float coverage) {
        if (coverage <= 0.0f)
            return;
        if (steep)
            plot(minor, major, coverage);
        else
            plot(major, minor, coverage);
    };

    const float dx = x1 - x0;
    const float dy = y1 - y0;
    const float gradient = (dx == 0.0f) ? 1.0f : dy / dx;

    // First endpoint.
    float x_end = std::round(x0);
    float y_end = y0 + gradient * (x_end - x0);
    float x_gap = RFPart(x0 + 0.5f);
    const int x_px1 = (int)x_end;
    const int y_px1 = (int)std::floor(y_end);
    emit(x_px1, y_px1, RFPart(y_end) * x_gap);
    emit(x_px1, y_px1 + 1, FPart(y_end) * x_gap);
    float inter_y = y_end + gradient;

    // Second endpoint.
    x_end = std::round(x1);
    y_end = y1 + gradient * (x_end - x1);
    x_gap = FPart(x1 + 0.5f);
    const int x_px2 = (int)x_end;
    const int y_px2 = (int)std::floor(y_end);
    if (x_px2 != x_px1)
    {
        emit(x_px2, y_px2, RFPart(y_end) * x_gap);
        emit(x_px2, y_px2 + 1, FPart(y_end) * x_gap);
    }

    for (int x = x_px1 + 1; x < x_px2; ++x)
    {
        const int y = (int)std::floor(inter_y);
        emit(x, y, RFPart(inter_y));
        emit(x, y + 1, FPart(inter_y));
        inter_y += gradient;
    }
}

// Sweeps offsets 0..half_width along the perpendicular of (x0,y0)-(x1,y1) on both
// sides. `pass(ox0, oy0, ox1, oy1, outermost)` is called once per offset line;
// `outermost` is true only for the two offsets at +-half_width.
template <typename Pass>
void ThickLineOffsets(int x0, int y0, int x1, int y1, int half_width, Pass&& pass)
{
    const float dx = (float)(x1 - x0);
    const float dy = (float)(y1 - y0);
    const float len = std::sqrt(dx * dx + dy * dy);
    float nx = 0.0f;
    float ny = 1.0f;
    if (len > 0.0f)
    {
        nx = -dy / len;
        ny = dx / len;
    }

    if (half_width < 0)
        half_width = 0;
    for (int offset = 0; offset <= half_width; ++offset)
    {
        const bool outermost = (offset == half_width);
        const float ox = nx * (float)offset;
        const float oy = ny * (float)offset;
        pass((float)x0 + ox, (float)y0 + oy, (float)x1 + ox, (float)y1 + oy, outermost);
        if (offset != 0)
            pass((float)x0 - ox, (float)y0 - oy, (float)x1 - ox, (float)y1 - oy, outermost);
    }
}
} // namespace pix::raster
