#pragma once

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <vector>

namespace pix::raster
{
// Midpoint circle outline. `plot(x, y)` is called once per distinct pixel.
template <typename Plot>
void MidpointCircle(int cx, int cy, int radius, Plot&& plot)
{
    if (radius < 0)
        return;
    if (radius == 0)
    {
        plot(cx, cy);
        return;
    }

    // Emits the eight symmetric points, skipping those that coincide on the axes
    // or the diagonal.
    auto plot8 = [&](int x, int y) {
        const int pts[8][2] = {{x, y}, {-x, y}, {x, -y}, {-x, -y}, {y, x}, {-y, x}, {y, -x}, {-y, -x}};
        for (int k = 0; k < 8; ++k)
        {
            bool seen = false;
            for (int m = 0; m < k && !seen; ++m)
                seen = pts[m][0] == pts[k][0] && pts[m][1] == pts[k][1];
            if (!seen)
                plot(cx + pts[k][0], cy + pts[k][1]);
        }
    };

    int x = 0;
    int y = radius;
    int d = 3 - 2 * radius;
    while (x <= y)
    {
        plot8(x, y);

        if (d > 0)
        {
            d += 4 * (x - y) + 10;
            --y;
        }
        else
        {
            d += 4 * x + 6;
        }
        ++x;
    }
}

// Filled midpoint circle. `span(x0, x1, y)` covers the inclusive range [x0, x1] and is
// emitted exactly once per scanline, so blended fills never double-apply.
template <typename Span>
void FilledCircle(int cx, int cy, int radius, Span&& span)
{
    if (radius < 0)
        return;

    std::vector<int> half(2 * (std::size_t)radius + 1, -1);
    MidpointCircle(0, 0, radius, [&](int x, int y) {
        const std::size_t row = (std::size_t)(y + radius);
        half[row] = std::max(half[row], std::abs(x));
    });

    for (int row = 0; row < (int)half.size(); ++row)
    {
        if (half[row] < 0)
            continue;
        span(cx - half[row], cx + half[row], cy + row - radius);
    }
}

// Wu anti-aliased circle. `plot(x, y, coverage)`; every octant step plots the outer
// pixel with 1 - fade and the pixel one step inside with the fade, giving a
// two-pixel-wide seamless ring.
template <typename Plot>
void WuCircle(int cx, int cy, int radius, Plot&& plot)
{
    if (radius <= 0)
    {
        if (radius == 0)
            plot(cx, cy, 1.0f);
        return;
    }

    auto plot8 = [&](int i, int j, float coverage) {
        if (coverage <= 0.0f)
            return;
        plot(cx + i, cy + j, coverage);
        plot(cx - i, cy + j, coverage);
        plot(cx + i, cy - j, coverage);
        plot(cx - i, cy - j, coverage);
        if (i != j)
        {
            plot(cx + j, cy + i, coverage);
            plot(cx - j, cy + i, coverage);
            plot(cx + j, cy - i, coverage);
            plot(cx - j, cy - i, coverage);
        }
    };

    // Axis-aligned extremes are exact.
    plot(cx + radius, cy, 1.0f);
    plot(cx - radius, cy, 1.0f);
    plot(cx, cy + radius, 1.0f);
    plot(cx, cy - radius, 1.0f);

    const double r2 = (double)radius * (double)radius;
    int i = radius;
    double prev_fade = 0.0;
    for (int j = 1; i > j; ++j)
    {
        const double exact = std::sqrt(r2 - (double)j * (double)j);
        const double fade = std::ceil(exact) - exact;
        if (fade < prev_fade)
            --i;
        plot8(i, j, (float)(1.0 - fade));
        plot8(i - 1, j, (float)fade);
        prev_fade = fade;
    }
}
} // namespace pix::raster
