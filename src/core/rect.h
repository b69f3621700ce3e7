#pragma once

#include <algorithm>

namespace pix
{
// Half-open integer rectangle: [x, x + w) x [y, y + h).
struct Rect
{
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    bool operator==(const Rect& o) const = default;

    bool IsEmpty() const { return w <= 0 || h <= 0; }
    int  Right() const { return x + w; }
    int  Bottom() const { return y + h; }

    bool Contains(int px, int py) const
    {
        return px >= x && py >= y && px < x + w && py < y + h;
    }

    // Builds a rectangle from two inclusive corners given in any order.
    static Rect FromCorners(int x0, int y0, int x1, int y1)
    {
        const int min_x = std::min(x0, x1);
        const int min_y = std::min(y0, y1);
        const int max_x = std::max(x0, x1);
        const int max_y = std::max(y0, y1);
        return Rect{min_x, min_y, max_x - min_x + 1, max_y - min_y + 1};
    }

    Rect Intersect(const Rect& o) const
    {
        const int x0 = std::max(x, o.x);
        const int y0 = std::max(y, o.y);
        const int x1 = std::min(Right(), o.Right());
        const int y1 = std::min(Bottom(), o.Bottom());
        if (x1 <= x0 || y1 <= y0)
            return Rect{x0, y0, 0, 0};
        return Rect{x0, y0, x1 - x0, y1 - y0};
    }

    // Smallest rectangle covering both; an empty side is ignored.
    Rect Union(const Rect& o) const
    {
        if (IsEmpty())
            return o;
        if (o.IsEmpty())
            return *this;
        const int x0 = std::min(x, o.x);
        const int y0 = std::min(y, o.y);
        const int x1 = std::max(Right(), o.Right());
        const int y1 = std::max(Bottom(), o.Bottom());
        return Rect{x0, y0, x1 - x0, y1 - y0};
    }
};
} // namespace pix
