#include "core/pixel_surface.h"
#include "core/raster/flood_fill.h"
#include "core/raster/gradient.h"
#include "core/raster/raster_circle.h"
#include "core/raster/raster_line.h"

#include <gtest/gtest.h>

#include <cmath>
#include <map>
#include <set>
#include <utility>
#include <vector>

using namespace pix;

namespace
{
using PixelSet = std::set<std::pair<int, int>>;

PixelSet LinePixels(int x0, int y0, int x1, int y1)
{
    PixelSet out;
    raster::BresenhamLine(x0, y0, x1, y1, [&](int x, int y) { out.emplace(x, y); });
    return out;
}
} // namespace

TEST(BresenhamLine, IncludesBothEndpoints)
{
    const PixelSet px = LinePixels(0, 0, 5, 2);
    EXPECT_EQ(px.size(), 6u);
    EXPECT_TRUE(px.count({0, 0}));
    EXPECT_TRUE(px.count({5, 2}));
}

TEST(BresenhamLine, SinglePoint)
{
    const PixelSet px = LinePixels(3, 4, 3, 4);
    ASSERT_EQ(px.size(), 1u);
    EXPECT_EQ(*px.begin(), std::make_pair(3, 4));
}

TEST(BresenhamLine, DirectionDoesNotChangePixels)
{
    const int cases[][4] = {
        {0, 0, 7, 3}, {0, 0, 3, 7}, {5, 1, -4, 6}, {2, 9, 8, -1}, {-3, -3, 4, 4}, {0, 5, 9, 5}, {4, 0, 4, 9}, {1, 1, 6, 2},
    };
    for (const auto& c : cases)
    {
        EXPECT_EQ(LinePixels(c[0], c[1], c[2], c[3]), LinePixels(c[2], c[3], c[0], c[1]))
            << c[0] << "," << c[1] << " -> " << c[2] << "," << c[3];
    }
}

TEST(BresenhamLine, OnePixelPerMajorStep)
{
    std::vector<std::pair<int, int>> visited;
    raster::BresenhamLine(0, 0, 3, 9, [&](int x, int y) { visited.emplace_back(x, y); });
    ASSERT_EQ(visited.size(), 10u);
    for (std::size_t i = 0; i < visited.size(); ++i)
        EXPECT_EQ(visited[i].second, (int)i);
}

TEST(WuLine, HorizontalInteriorIsFullCoverage)
{
    std::map<std::pair<int, int>, float> cov;
    raster::WuLine(0.0f, 0.0f, 4.0f, 0.0f, [&](int x, int y, float c) { cov[{x, y}] = c; });

    for (const auto& [p, c] : cov)
    {
        EXPECT_EQ(p.second, 0);
        EXPECT_GT(c, 0.0f);
        EXPECT_LE(c, 1.0f);
    }
    for (int x = 1; x <= 3; ++x)
    {
        ASSERT_TRUE(cov.count({x, 0}));
        EXPECT_FLOAT_EQ((cov[{x, 0}]), 1.0f);
    }
}

TEST(WuLine, DiagonalCoverageStaysInRange)
{
    int n = 0;
    raster::WuLine(0.0f, 0.0f, 9.0f, 4.0f, [&](int, int, float c) {
        EXPECT_GT(c, 0.0f);
        EXPECT_LE(c, 1.0f);
        ++n;
    });
    EXPECT_GT(n, 9);
}

TEST(ThickLineOffsets, PassCountAndOutermostFlag)
{
    int passes = 0;
    int outer = 0;
    raster::ThickLineOffsets(0, 0, 10, 0, 2, [&](float, float fy0, float, float fy1, bool outermost) {
        EXPECT_FLOAT_EQ(fy0, fy1);
        ++passes;
        if (outermost)
        {
            ++outer;
            EXPECT_FLOAT_EQ(std::fabs(fy0), 2.0f);
        }
    });
    EXPECT_EQ(passes, 5);
    EXPECT_EQ(outer, 2);
}

TEST(MidpointCircle, ZeroRadiusIsCenter)
{
    std::vector<std::pair<int, int>> px;
    raster::MidpointCircle(4, 5, 0, [&](int x, int y) { px.emplace_back(x, y); });
    ASSERT_EQ(px.size(), 1u);
    EXPECT_EQ(px[0], std::make_pair(4, 5));
}

TEST(MidpointCircle, DistinctPointsNearRadius)
{
    for (int r : {1, 2, 5, 9, 16})
    {
        std::vector<std::pair<int, int>> px;
        raster::MidpointCircle(0, 0, r, [&](int x, int y) { px.emplace_back(x, y); });
        const PixelSet unique(px.begin(), px.end());
        EXPECT_EQ(unique.size(), px.size()) << "radius " << r;

        EXPECT_TRUE(unique.count({r, 0}));
        EXPECT_TRUE(unique.count({-r, 0}));
        EXPECT_TRUE(unique.count({0, r}));
        EXPECT_TRUE(unique.count({0, -r}));
        for (const auto& [x, y] : px)
            EXPECT_LT(std::fabs(std::sqrt((double)(x * x + y * y)) - (double)r), 1.0) << x << "," << y;
    }
}

TEST(FilledCircle, OneSpanPerRow)
{
    const int r = 6;
    std::map<int, int> spans_per_row;
    std::map<int, std::pair<int, int>> extent;
    raster::FilledCircle(10, 20, r, [&](int x0, int x1, int y) {
        EXPECT_LE(x0, x1);
        ++spans_per_row[y];
        extent[y] = {x0, x1};
    });

    EXPECT_EQ(spans_per_row.size(), (std::size_t)(2 * r + 1));
    for (const auto& [y, n] : spans_per_row)
        EXPECT_EQ(n, 1) << "row " << y;
    EXPECT_EQ(extent[20], std::make_pair(10 - r, 10 + r));
    for (const auto& [y, e] : extent)
        EXPECT_EQ(e.first + e.second, 20) << "row " << y;
}

TEST(WuCircle, AxisPointsAreExact)
{
    std::map<std::pair<int, int>, float> cov;
    raster::WuCircle(0, 0, 7, [&](int x, int y, float c) {
        EXPECT_GT(c, 0.0f);
        EXPECT_LE(c, 1.0f);
        cov[{x, y}] = c;
    });
    EXPECT_FLOAT_EQ((cov[{7, 0}]), 1.0f);
    EXPECT_FLOAT_EQ((cov[{0, -7}]), 1.0f);
    EXPECT_FALSE(cov.count({0, 0}));
}

namespace
{
RgbaImage Solid(int w, int h, const Color& c)
{
    RgbaImage img(w, h);
    img.Fill(c);
    return img;
}
} // namespace

TEST(FloodFill, StopsAtBoundaryAndVisitsOnce)
{
    const Color white{255, 255, 255, 255};
    const Color black{0, 0, 0, 255};
    RgbaImage img = Solid(5, 5, white);
    for (int y = 0; y < 5; ++y)
        img.PutPixel(2, y, black);
    ImageSurface surface(img);

    std::vector<std::pair<int, int>> visits;
    const int n = raster::FloodFill(surface, 0, 0, 0.0f, [&](int x, int y) { visits.emplace_back(x, y); });

    EXPECT_EQ(n, 10);
    EXPECT_EQ(visits.size(), 10u);
    const PixelSet unique(visits.begin(), visits.end());
    EXPECT_EQ(unique.size(), visits.size());
    for (const auto& [x, y] : visits)
        EXPECT_LT(x, 2);
}

TEST(FloodFill, EightConnectedCrossesDiagonalGaps)
{
    const Color white{255, 255, 255, 255};
    const Color black{0, 0, 0, 255};
    RgbaImage img = Solid(2, 2, white);
    img.PutPixel(1, 0, black);
    img.PutPixel(0, 1, black);
    ImageSurface surface(img);

    PixelSet visits;
    EXPECT_EQ(raster::FloodFill(surface, 0, 0, 0.0f, [&](int x, int y) { visits.emplace(x, y); }), 2);
    EXPECT_TRUE(visits.count({1, 1}));
}

TEST(FloodFill, ToleranceWidensMatch)
{
    RgbaImage img = Solid(2, 1, Color{255, 255, 255, 255});
    img.PutPixel(1, 0, Color{250, 250, 250, 255});
    ImageSurface surface(img);

    auto noop = [](int, int) {};
    EXPECT_EQ(raster::FloodFill(surface, 0, 0, 0.0f, noop), 1);
    EXPECT_EQ(raster::FloodFill(surface, 0, 0, 0.02f, noop), 2);
}

TEST(FloodFill, TransparentPixelsAlwaysJoin)
{
    RgbaImage img = Solid(3, 1, Color{255, 0, 0, 255});
    img.PutPixel(1, 0, Color{0, 255, 0, 0});
    ImageSurface surface(img);
    EXPECT_EQ(raster::FloodFill(surface, 0, 0, 0.0f, [](int, int) {}), 3);
}

TEST(FloodFill, RespectsWritableRegion)
{
    RgbaImage img = Solid(5, 5, Color{255, 255, 255, 255});
    ImageSurface surface(img);
    RegionMaskedSurface masked(surface, Rect{0, 0, 2, 5});

    EXPECT_EQ(raster::FloodFill(masked, 0, 0, 0.0f, [](int, int) {}), 10);
    EXPECT_EQ(raster::FloodFill(masked, 4, 4, 0.0f, [](int, int) {}), 0);
}

TEST(Gradient, LinearParameter)
{
    using raster::GradientType;
    EXPECT_FLOAT_EQ(raster::GradientParameter(GradientType::Linear, 0, 0, 10, 0, 0, 0), 0.0f);
    EXPECT_FLOAT_EQ(raster::GradientParameter(GradientType::Linear, 0, 0, 10, 0, 10, 7), 1.0f);
    EXPECT_FLOAT_EQ(raster::GradientParameter(GradientType::Linear, 0, 0, 10, 0, 5, 3), 0.5f);
    EXPECT_FLOAT_EQ(raster::GradientParameter(GradientType::Linear, 0, 0, 10, 0, 25, 0), 1.0f);
    EXPECT_FLOAT_EQ(raster::GradientParameter(GradientType::Linear, 0, 0, 10, 0, -5, 0), 0.0f);
}

TEST(Gradient, RadialParameter)
{
    using raster::GradientType;
    EXPECT_FLOAT_EQ(raster::GradientParameter(GradientType::Radial, 0, 0, 10, 0, 0, 5), 0.5f);
    EXPECT_FLOAT_EQ(raster::GradientParameter(GradientType::Radial, 0, 0, 10, 0, -10, 0), 1.0f);
}

TEST(Gradient, DegenerateAxisIsFirstColour)
{
    const Color a{10, 20, 30, 255};
    const Color b{200, 200, 200, 255};
    EXPECT_EQ(raster::GradientColor(raster::GradientType::Linear, 3, 3, 3, 3, a, b, 9, 9), a);
    EXPECT_EQ(raster::GradientColor(raster::GradientType::Linear, 0, 0, 4, 0, a, b, 4, 0), b);
}

TEST(Gradient, TypeNames)
{
    raster::GradientType t = raster::GradientType::Linear;
    EXPECT_TRUE(raster::FromString("radial", t));
    EXPECT_EQ(t, raster::GradientType::Radial);
    EXPECT_STREQ(raster::ToString(t), "radial");
    EXPECT_FALSE(raster::FromString("conic", t));
}
