#include "core/raster/resample.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace pix::raster
{
namespace
{
struct RgbaF
{
    float r = 0, g = 0, b = 0, a = 0;
};

struct Tap
{
    int   index = 0;
    float weight = 0.0f;
};

// Per-output-sample filter taps for one axis.
static std::vector<std::vector<Tap>> BuildTriangleTaps(int src_len, int dst_len)
{
    std::vector<std::vector<Tap>> taps((std::size_t)dst_len);
    const float scale = (float)src_len / (float)dst_len;
    const float support = std::max(1.0f, scale);

    for (int i = 0; i < dst_len; ++i)
    {
        const float center = ((float)i + 0.5f) * scale - 0.5f;
        const int   j0 = (int)std::floor(center - support);
        const int   j1 = (int)std::ceil(center + support);

        float total = 0.0f;
        std::vector<Tap>& out = taps[(std::size_t)i];
        for (int j = j0; j <= j1; ++j)
        {
            const float w = 1.0f - std::fabs((float)j - center) / support;
            if (w <= 0.0f)
                continue;
            out.push_back(Tap{std::clamp(j, 0, src_len - 1), w});
            total += w;
        }
        if (total > 0.0f)
        {
            for (Tap& t : out)
                t.weight /= total;
        }
    }
    return taps;
}

static inline RgbaF LoadPremultiplied(const RgbaImage& img, int x, int y)
{
    const Color c = img.GetPixel(x, y);
    const float a = (float)c.a / 255.0f;
    return RgbaF{(float)c.r / 255.0f * a, (float)c.g / 255.0f * a, (float)c.b / 255.0f * a, a};
}

static inline Color StoreUnpremultiplied(const RgbaF& c)
{
    auto to_u8 = [](float v) -> std::uint8_t {
        const int i = (int)std::lround((double)std::clamp(v, 0.0f, 1.0f) * 255.0);
        return (std::uint8_t)std::clamp(i, 0, 255);
    };
    if (c.a <= 0.0f)
        return kTransparent;
    return Color{to_u8(c.r / c.a), to_u8(c.g / c.a), to_u8(c.b / c.a), to_u8(c.a)};
}
} // namespace

RgbaImage ResampleTriangle(const RgbaImage& src, int new_width, int new_height)
{
    if (new_width <= 0 || new_height <= 0)
        return RgbaImage{};
    if (src.IsEmpty())
        return RgbaImage(new_width, new_height);
    if (new_width == src.Width() && new_height == src.Height())
        return src;

    const int sw = src.Width();
    const int sh = src.Height();
    const auto taps_x = BuildTriangleTaps(sw, new_width);
    const auto taps_y = BuildTriangleTaps(sh, new_height);

    // Horizontal pass: sw x sh -> new_width x sh.
    std::vector<RgbaF> tmp((std::size_t)new_width * (std::size_t)sh);
    for (int y = 0; y < sh; ++y)
    {
        for (int x = 0; x < new_width; ++x)
        {
            RgbaF acc;
            for (const Tap& t : taps_x[(std::size_t)x])
            {
                const RgbaF s = LoadPremultiplied(src, t.index, y);
                acc.r += s.r * t.weight;
                acc.g += s.g * t.weight;
                acc.b += s.b * t.weight;
                acc.a += s.a * t.weight;
            }
            tmp[(std::size_t)y * (std::size_t)new_width + (std::size_t)x] = acc;
        }
    }

    // Vertical pass.
    RgbaImage out(new_width, new_height);
    for (int y = 0; y < new_height; ++y)
    {
        for (int x = 0; x < new_width; ++x)
        {
            RgbaF acc;
            for (const Tap& t : taps_y[(std::size_t)y])
            {
                const RgbaF& s = tmp[(std::size_t)t.index * (std::size_t)new_width + (std::size_t)x];
                acc.r += s.r * t.weight;
                acc.g += s.g * t.weight;
                acc.b += s.b * t.weight;
                acc.a += s.a * t.weight;
            }
            out.PutPixel(x, y, StoreUnpremultiplied(acc));
        }
    }
    return out;
}

RgbaImage RotateImage(const RgbaImage& src, float radians)
{
    if (src.IsEmpty())
        return RgbaImage{};

    const float sw = (float)src.Width();
    const float sh = (float)src.Height();
    const float c = std::cos(radians);
    const float s = std::sin(radians);

    // Tolerate float noise so quarter turns keep exact dimensions.
    const int out_w = std::max(1, (int)std::ceil(std::fabs(sw * c) + std::fabs(sh * s) - 1e-3f));
    const int out_h = std::max(1, (int)std::ceil(std::fabs(sw * s) + std::fabs(sh * c) - 1e-3f));

    auto sample = [&](int ix, int iy) -> RgbaF {
        if (!src.InBounds(ix, iy))
            return RgbaF{};
        return LoadPremultiplied(src, ix, iy);
    };

    RgbaImage out(out_w, out_h);
    for (int oy = 0; oy < out_h; ++oy)
    {
        for (int ox = 0; ox < out_w; ++ox)
        {
            const float dx = (float)ox + 0.5f - (float)out_w * 0.5f;
            const float dy = (float)oy + 0.5f - (float)out_h * 0.5f;
            const float sx = c * dx + s * dy + sw * 0.5f - 0.5f;
            const float sy = -s * dx + c * dy + sh * 0.5f - 0.5f;
            if (sx <= -1.0f || sy <= -1.0f || sx >= sw || sy >= sh)
                continue;

            const int   x0 = (int)std::floor(sx);
            const int   y0 = (int)std::floor(sy);
            const float fx = sx - (float)x0;
            const float fy = sy - (float)y0;

            const RgbaF c00 = sample(x0, y0);
            const RgbaF c10 = sample(x0 + 1, y0);
            const RgbaF c01 = sample(x0, y0 + 1);
            const RgbaF c11 = sample(x0 + 1, y0 + 1);

            auto lerp = [](float a, float b, float t) { return a + (b - a) * t; };
            const RgbaF top{lerp(c00.r, c10.r, fx), lerp(c00.g, c10.g, fx), lerp(c00.b, c10.b, fx), lerp(c00.a, c10.a, fx)};
            const RgbaF bot{lerp(c01.r, c11.r, fx), lerp(c01.g, c11.g, fx), lerp(c01.b, c11.b, fx), lerp(c01.a, c11.a, fx)};
            out.PutPixel(ox, oy, StoreUnpremultiplied(RgbaF{lerp(top.r, bot.r, fy), lerp(top.g, bot.g, fy),
                                                             lerp(top.b, bot.b, fy), lerp(top.a, bot.a, fy)}));
        }
    }
    return out;
}
} // namespace pix::raster
