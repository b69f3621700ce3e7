#pragma once

#include "core/color.h"

#include <string_view>

namespace pix::raster
{
enum class GradientType
{
    Linear = 0,
    Radial,
};

const char* ToString(GradientType t);
bool        FromString(std::string_view s, GradientType& out);

// Interpolation parameter in [0,1] for pixel (x, y) along the axis start -> end.
// Linear: projection onto the axis. Radial: distance from start over the axis length.
// A degenerate axis (start == end) yields 0.
float GradientParameter(GradientType type, int start_x, int start_y, int end_x, int end_y, int x, int y);

Color GradientColor(GradientType type,
                    int start_x, int start_y,
                    int end_x, int end_y,
                    const Color& first, const Color& second,
                    int x, int y);
} // namespace pix::raster
