#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

namespace pix
{
// 4-channel 8-bit colour with straight (non-premultiplied) alpha.
struct Color
{
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 0;

    bool operator==(const Color& o) const = default;
};

inline constexpr Color kTransparent{0, 0, 0, 0};

namespace color
{
// Deterministic integer blend helpers (round-to-nearest in 8-bit space).
static inline std::uint8_t LerpU8(std::uint8_t a, std::uint8_t b, std::uint8_t t)
{
    const std::uint32_t v =
        (std::uint32_t)a * (255u - (std::uint32_t)t) +
        (std::uint32_t)b * (std::uint32_t)t;
    return (std::uint8_t)((v + 127u) / 255u);
}

static inline std::uint8_t Mul255(std::uint32_t x, std::uint32_t y)
{
    return (std::uint8_t)((x * y + 127u) / 255u);
}

static inline std::uint32_t DivRound(std::uint32_t num, std::uint32_t den)
{
    if (den == 0)
        return 0;
    return (num + (den / 2u)) / den;
}

// Source-over compositing of `src` onto `dst`.
static inline Color BlendOver(const Color& dst, const Color& src)
{
    if (src.a == 255)
        return src;
    if (src.a == 0)
        return dst;

    const std::uint32_t sa = src.a;
    const std::uint32_t da = Mul255(dst.a, 255u - sa);
    const std::uint32_t oa = sa + da;
    if (oa == 0)
        return kTransparent;

    auto channel = [&](std::uint8_t s, std::uint8_t d) -> std::uint8_t {
        return (std::uint8_t)std::min<std::uint32_t>(255u, DivRound((std::uint32_t)s * sa + (std::uint32_t)d * da, oa));
    };
    return Color{channel(src.r, dst.r), channel(src.g, dst.g), channel(src.b, dst.b), (std::uint8_t)oa};
}

// Scales the alpha channel by a coverage factor in [0,1].
static inline Color WithCoverage(Color c, float coverage)
{
    coverage = std::clamp(coverage, 0.0f, 1.0f);
    c.a = (std::uint8_t)std::lround((float)c.a * coverage);
    return c;
}

// Per-channel interpolation; t is clamped to [0,1].
static inline Color Lerp(const Color& from, const Color& to, float t)
{
    t = std::clamp(t, 0.0f, 1.0f);
    auto ch = [t](std::uint8_t a, std::uint8_t b) -> std::uint8_t {
        return (std::uint8_t)std::lround((float)a + ((float)b - (float)a) * t);
    };
    return Color{ch(from.r, to.r), ch(from.g, to.g), ch(from.b, to.b), ch(from.a, to.a)};
}

// Mean absolute per-channel difference normalized to [0,1].
static inline float Distance(const Color& x, const Color& y)
{
    const int sum = std::abs((int)x.r - (int)y.r) +
                    std::abs((int)x.g - (int)y.g) +
                    std::abs((int)x.b - (int)y.b) +
                    std::abs((int)x.a - (int)y.a);
    return (float)sum / (4.0f * 255.0f);
}

// Parses "#RRGGBB" or "#RRGGBBAA" (leading '#' optional). RRGGBB yields opaque alpha.
bool ParseHex(std::string_view s, Color& out);

// Formats as "#RRGGBBAA".
std::string ToHex(const Color& c);
} // namespace color
} // namespace pix
