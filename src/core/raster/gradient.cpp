#include "core/raster/gradient.h"

#include <algorithm>
#include <cmath>

namespace pix::raster
{
const char* ToString(GradientType t)
{
    switch (t)
    {
        case GradientType::Linear: return "linear";
        case GradientType::Radial: return "radial";
    }
    return "linear";
}

bool FromString(std::string_view s, GradientType& out)
{
    if (s == "linear") { out = GradientType::Linear; return true; }
    if (s == "radial") { out = GradientType::Radial; return true; }
    return false;
}

float GradientParameter(GradientType type, int start_x, int start_y, int end_x, int end_y, int x, int y)
{
    const float ax = (float)(end_x - start_x);
    const float ay = (float)(end_y - start_y);
    const float len2 = ax * ax + ay * ay;
    if (len2 <= 0.0f)
        return 0.0f;

    const float px = (float)(x - start_x);
    const float py = (float)(y - start_y);

    float t = 0.0f;
    switch (type)
    {
        case GradientType::Linear:
            t = (px * ax + py * ay) / len2;
            break;
        case GradientType::Radial:
            t = std::sqrt(px * px + py * py) / std::sqrt(len2);
            break;
    }
    return std::clamp(t, 0.0f, 1.0f);
}

Color GradientColor(GradientType type,
                    int start_x, int start_y,
                    int end_x, int end_y,
                    const Color& first, const Color& second,
                    int x, int y)
{
    return color::Lerp(first, second, GradientParameter(type, start_x, start_y, end_x, end_y, x, y));
}
} // namespace pix::raster
