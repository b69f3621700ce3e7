#pragma once

#include "core/pixel_surface.h"

#include <functional>

namespace pix::raster
{
// 8-connected flood fill from (seed_x, seed_y).
//
// The reference colour is sampled once at the seed. A neighbour joins the fill
// when its colour is within `tolerance` of the reference (color::Distance) or
// when it is fully transparent. Pixels the surface refuses (CanWrite == false)
// act as a boundary. `visit(x, y)` runs exactly once per filled pixel, before
// its neighbours are explored; the fill itself never writes to the surface.
//
// Returns the number of pixels visited.
int FloodFill(const PixelSurface& surface,
              int seed_x,
              int seed_y,
              float tolerance,
              const std::function<void(int, int)>& visit);
} // namespace pix::raster
