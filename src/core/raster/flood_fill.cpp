#include "core/raster/flood_fill.h"

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace pix::raster
{
int FloodFill(const PixelSurface& surface,
              int seed_x,
              int seed_y,
              float tolerance,
              const std::function<void(int, int)>& visit)
{
    if (!surface.CanWrite(seed_x, seed_y))
        return 0;

    const int w = surface.Width();
    const int h = surface.Height();
    const Color reference = surface.GetPixel(seed_x, seed_y);

    auto fillable = [&](int x, int y) -> bool {
        if (!surface.CanWrite(x, y))
            return false;
        const Color c = surface.GetPixel(x, y);
        return c.a == 0 || color::Distance(c, reference) <= tolerance;
    };

    std::vector<std::uint8_t> visited((std::size_t)w * (std::size_t)h, 0);
    auto mark = [&](int x, int y) -> bool {
        std::uint8_t& v = visited[(std::size_t)y * (std::size_t)w + (std::size_t)x];
        if (v)
            return false;
        v = 1;
        return true;
    };

    std::vector<std::pair<int, int>> stack;
    stack.reserve(256);
    stack.emplace_back(seed_x, seed_y);
    mark(seed_x, seed_y);

    int count = 0;
    while (!stack.empty())
    {
        const auto [x, y] = stack.back();
        stack.pop_back();

        visit(x, y);
        ++count;

        for (int dy = -1; dy <= 1; ++dy)
        {
            for (int dx = -1; dx <= 1; ++dx)
            {
                if (dx == 0 && dy == 0)
                    continue;
                const int nx = x + dx;
                const int ny = y + dy;
                if (nx < 0 || ny < 0 || nx >= w || ny >= h)
                    continue;
                if (visited[(std::size_t)ny * (std::size_t)w + (std::size_t)nx])
                    continue;
                if (!fillable(nx, ny))
                    continue;
                mark(nx, ny);
                stack.emplace_back(nx, ny);
            }
        }
    }
    return count;
}
} // namespace pix::raster
