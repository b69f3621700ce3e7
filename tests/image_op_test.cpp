#include "core/image_op.h"
#include "core/pixel_surface.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

using namespace pix;

namespace
{
const Color kRed{255, 0, 0, 255};
const Color kBlue{0, 0, 255, 255};
const Color kWhite{255, 255, 255, 255};

RgbaImage Solid(int w, int h, const Color& c)
{
    RgbaImage img(w, h);
    img.Fill(c);
    return img;
}

// Distinct, partly transparent content so a wrong restore is visible.
RgbaImage Pattern(int w, int h)
{
    RgbaImage img(w, h);
    for (int y = 0; y < h; ++y)
        for (int x = 0; x < w; ++x)
            img.PutPixel(x, y, Color{(std::uint8_t)(x * 17), (std::uint8_t)(y * 23), (std::uint8_t)((x + y) * 5),
                                     (std::uint8_t)(((x * 7 + y * 3) % 4) * 85)});
    return img;
}

int MaxAlpha(const RgbaImage& img)
{
    int a = 0;
    for (int y = 0; y < img.Height(); ++y)
        for (int x = 0; x < img.Width(); ++x)
            a = std::max(a, (int)img.GetPixel(x, y).a);
    return a;
}

int CountPixels(const RgbaImage& img, const Color& c)
{
    int n = 0;
    for (int y = 0; y < img.Height(); ++y)
        for (int x = 0; x < img.Width(); ++x)
            n += img.GetPixel(x, y) == c ? 1 : 0;
    return n;
}
} // namespace

TEST(ImageOp, FillRectangleThenInverseRestores)
{
    RgbaImage img(4, 4);
    const RgbaImage original = img;
    ImageSurface surface(img);

    auto inverse = ImageOp(op::FillRectangle{0, 0, 3, 3, kRed, false}).Apply(surface, true);
    ASSERT_TRUE(inverse);
    EXPECT_EQ(inverse->GetKind(), ImageOp::Kind::SetImage);
    EXPECT_EQ(CountPixels(img, kRed), 16);

    inverse->Apply(surface, false);
    EXPECT_EQ(img, original);
}

TEST(ImageOp, BucketFillOnUniformCanvasFillsEverything)
{
    RgbaImage img = Solid(3, 3, kWhite);
    ImageSurface surface(img);

    auto inverse = ImageOp(op::BucketFill{1, 1, kBlue, 0.0f}).Apply(surface, true);
    ASSERT_TRUE(inverse);
    EXPECT_EQ(CountPixels(img, kBlue), 9);

    const auto* opt = inverse->As<op::SetOptionalImage>();
    ASSERT_NE(opt, nullptr);
    EXPECT_EQ(opt->image.Count(), 9u);

    inverse->Apply(surface, false);
    EXPECT_EQ(CountPixels(img, kWhite), 9);
}

TEST(ImageOp, SinglePixelBlockRecordsOnlyThatPixel)
{
    RgbaImage img(5, 5);
    ImageSurface surface(img);

    auto inverse = ImageOp(op::Block{2, 2, 0, kRed}).Apply(surface, true);
    ASSERT_TRUE(inverse);
    const auto* sparse = inverse->As<op::SetSparseImage>();
    ASSERT_NE(sparse, nullptr);
    EXPECT_EQ(sparse->image.Size(), 1u);
    ASSERT_TRUE(sparse->image.Get(2, 2));
    EXPECT_EQ(*sparse->image.Get(2, 2), kTransparent);
    EXPECT_EQ(img.GetPixel(2, 2), kRed);
    EXPECT_EQ(CountPixels(img, kRed), 1);
}

TEST(ImageOp, EveryVariantIsReversible)
{
    RgbaImage stamp(3, 2);
    stamp.Fill(Color{0, 200, 0, 180});

    op::PencilStroke joined;
    joined.start_x = 4;
    joined.start_y = 4;
    joined.end_x = 10;
    joined.end_y = 7;
    joined.prev_start = std::make_pair(1, 1);
    joined.color = Color{0, 0, 0, 140};
    joined.side_half_width = 2;
    joined.anti_aliased = true;

    const std::vector<ImageOp> ops = {
        op::SetImage{2, 3, stamp, false},
        op::SetImage{-1, -1, stamp, true},
        op::SetScaledImage{stamp, 1, 1, 2.0f, 1.5f, true},
        op::SetRotatedImage{stamp, 6, 6, 0.7f, true},
        op::FillRectangle{1, 1, 5, 4, Color{9, 9, 9, 100}, true},
        op::FillRectangle{10, 10, 2, 2, kRed, false},
        op::ColorGradient{0, 0, 11, 11, kRed, kBlue, raster::GradientType::Radial},
        op::Block{0, 0, 2, kRed},
        op::Line{0, 11, 11, 0, kBlue, 1, false},
        op::Line{1, 2, 9, 10, Color{40, 50, 60, 200}, 2, true},
        joined,
        op::Rectangle{2, 2, 9, 8, kRed, 1},
        op::Circle{6, 6, 4, 1, Color{10, 10, 10, 128}, true, true},
        op::Circle{6, 6, 5, 0, kRed, false, false},
        op::FillCircle{5, 5, 3, Color{0, 0, 0, 99}, true},
        op::BucketFill{0, 0, kRed, 0.3f},
        ImageOp::Seq({op::Block{3, 3, 1, kRed}, ImageOp::BeginDraw("x"), op::FillRectangle{0, 0, 11, 2, kBlue, false}}),
    };

    for (const ImageOp& o : ops)
    {
        RgbaImage img = Pattern(12, 12);
        const RgbaImage original = img;
        ImageSurface surface(img);

        auto inverse = o.Apply(surface, true);
        ASSERT_TRUE(inverse) << o.KindName();
        EXPECT_NE(img, original) << o.KindName();

        inverse->Apply(surface, false);
        EXPECT_EQ(img, original) << o.KindName();
    }
}

TEST(ImageOp, InverseOfInverseRedoes)
{
    RgbaImage img = Pattern(8, 8);
    ImageSurface surface(img);

    auto undo = ImageOp(op::Line{0, 0, 7, 5, kRed, 1, false}).Apply(surface, true);
    ASSERT_TRUE(undo);
    const RgbaImage edited = img;

    auto redo = undo->Apply(surface, true);
    ASSERT_TRUE(redo);
    redo->Apply(surface, false);
    EXPECT_EQ(img, edited);
}

TEST(ImageOp, NothingWrittenYieldsNoInverse)
{
    RgbaImage img(4, 4);
    ImageSurface surface(img);

    EXPECT_FALSE(ImageOp(op::FillRectangle{100, 100, 120, 120, kRed, false}).Apply(surface, true));
    EXPECT_FALSE(ImageOp(op::Block{-10, -10, 1, kRed}).Apply(surface, true));
    EXPECT_FALSE(ImageOp().Apply(surface, true));
    EXPECT_FALSE(ImageOp::BeginDraw("Pencil").Apply(surface, true));
    EXPECT_FALSE(surface.HasPendingWrites());
}

TEST(ImageOp, RegionMaskConfinesWritesAndInverse)
{
    RgbaImage img(4, 4);
    const RgbaImage original = img;
    ImageSurface surface(img);
    RegionMaskedSurface masked(surface, Rect{1, 1, 2, 2});

    auto inverse = ImageOp(op::FillRectangle{0, 0, 3, 3, kRed, false}).Apply(masked, true);
    ASSERT_TRUE(inverse);
    EXPECT_EQ(CountPixels(img, kRed), 4);
    EXPECT_EQ(img.GetPixel(1, 1), kRed);
    EXPECT_EQ(img.GetPixel(0, 0), kTransparent);

    inverse->Apply(masked, false);
    EXPECT_EQ(img, original);
}

TEST(ImageOp, ThickBlendedStrokeBlendsEachPixelOnce)
{
    RgbaImage img(16, 16);
    ImageSurface surface(img);

    op::PencilStroke s;
    s.start_x = 3;
    s.start_y = 3;
    s.end_x = 12;
    s.end_y = 9;
    s.prev_start = std::make_pair(0, 0);
    s.color = Color{255, 0, 0, 128};
    s.side_half_width = 2;
    s.blend = true;
    s.anti_aliased = false;
    ASSERT_TRUE(ImageOp(s).Apply(surface, true));

    int touched = 0;
    for (int y = 0; y < 16; ++y)
    {
        for (int x = 0; x < 16; ++x)
        {
            const Color c = img.GetPixel(x, y);
            if (c.a == 0)
                continue;
            ++touched;
            EXPECT_EQ(c, (Color{255, 0, 0, 128})) << x << "," << y;
        }
    }
    EXPECT_GT(touched, 30);
}

TEST(ImageOp, AntiAliasedStrokeNeverExceedsStrokeAlpha)
{
    const Color half_red{255, 0, 0, 128};
    for (bool joined : {false, true})
    {
        for (int half_width : {0, 2})
        {
            RgbaImage img(32, 32);
            ImageSurface surface(img);

            op::PencilStroke s;
            s.start_x = 3;
            s.start_y = 5;
            s.end_x = 27;
            s.end_y = 19;
            if (joined)
                s.prev_start = std::make_pair(0, 2);
            s.color = half_red;
            s.side_half_width = half_width;
            s.blend = true;
            s.anti_aliased = true;
            ASSERT_TRUE(ImageOp(s).Apply(surface, true));

            const int max_alpha = MaxAlpha(img);
            EXPECT_GT(max_alpha, 0);
            EXPECT_LE(max_alpha, 128) << "joined " << joined << " half width " << half_width;
            if (half_width > 0)
                EXPECT_EQ(img.GetPixel(15, 12), half_red) << joined;
            if (joined)
                EXPECT_EQ(img.GetPixel(3, 5), half_red) << half_width;
        }
    }
}

TEST(ImageOp, AntiAliasedCircleBorderNeverExceedsStrokeAlpha)
{
    RgbaImage img(32, 32);
    ImageSurface surface(img);
    ImageOp(op::Circle{16, 16, 9, 2, Color{0, 0, 255, 100}, true, true}).Apply(surface, false);
    EXPECT_EQ(MaxAlpha(img), 100);
    EXPECT_EQ(img.GetPixel(16, 7), (Color{0, 0, 255, 100}));
}

TEST(ImageOp, AntiAliasedDiscSoftensRimInOnePass)
{
    RgbaImage img(20, 20);
    ImageSurface surface(img);
    auto inverse = ImageOp(op::FillCircle{10, 10, 5, Color{0, 255, 0, 128}, true, true}).Apply(surface, true);
    ASSERT_TRUE(inverse);
    EXPECT_EQ(MaxAlpha(img), 128);
    EXPECT_EQ(img.GetPixel(10, 10), (Color{0, 255, 0, 128}));

    inverse->Apply(surface, false);
    EXPECT_EQ(MaxAlpha(img), 0);
}

TEST(ImageOp, ShapeGeometry)
{
    RgbaImage img(10, 10);
    ImageSurface surface(img);

    ImageOp(op::Rectangle{1, 1, 4, 3, kRed, 0}).Apply(surface, false);
    EXPECT_EQ(img.GetPixel(1, 1), kRed);
    EXPECT_EQ(img.GetPixel(4, 3), kRed);
    EXPECT_EQ(img.GetPixel(2, 1), kRed);
    EXPECT_EQ(img.GetPixel(2, 2), kTransparent);

    RgbaImage disc(9, 9);
    ImageSurface disc_surface(disc);
    ImageOp(op::FillCircle{4, 4, 2, kBlue, false}).Apply(disc_surface, false);
    EXPECT_EQ(disc.GetPixel(4, 4), kBlue);
    EXPECT_EQ(disc.GetPixel(6, 4), kBlue);
    EXPECT_EQ(disc.GetPixel(7, 4), kTransparent);

    RgbaImage ring(9, 9);
    ImageSurface ring_surface(ring);
    ImageOp(op::Circle{4, 4, 3, 0, kBlue, false, false}).Apply(ring_surface, false);
    EXPECT_EQ(ring.GetPixel(7, 4), kBlue);
    EXPECT_EQ(ring.GetPixel(4, 1), kBlue);
    EXPECT_EQ(ring.GetPixel(4, 4), kTransparent);
}

TEST(ImageOp, GradientSpansTheAxis)
{
    RgbaImage img(5, 1);
    ImageSurface surface(img);
    const Color black{0, 0, 0, 255};
    ImageOp(op::ColorGradient{0, 0, 4, 0, black, kWhite, raster::GradientType::Linear}).Apply(surface, false);
    EXPECT_EQ(img.GetPixel(0, 0), black);
    EXPECT_EQ(img.GetPixel(4, 0), kWhite);
    EXPECT_EQ(img.GetPixel(2, 0), (Color{128, 128, 128, 255}));
}

TEST(ImageOp, ScaledAndRotatedPlacement)
{
    RgbaImage img(4, 4);
    ImageSurface surface(img);
    ImageOp(op::SetScaledImage{Solid(2, 2, kRed), 0, 0, 2.0f, 2.0f, true}).Apply(surface, false);
    EXPECT_EQ(CountPixels(img, kRed), 16);

    RgbaImage canvas(5, 5);
    ImageSurface canvas_surface(canvas);
    ImageOp(op::SetRotatedImage{Solid(2, 2, kBlue), 2, 2, 0.0f, true}).Apply(canvas_surface, false);
    EXPECT_EQ(CountPixels(canvas, kBlue), 4);
    EXPECT_EQ(canvas.GetPixel(1, 1), kBlue);
    EXPECT_EQ(canvas.GetPixel(2, 2), kBlue);
    EXPECT_EQ(canvas.GetPixel(3, 3), kTransparent);
}

TEST(ImageOp, SequentialInverseKeepsLabelAndReversesOrder)
{
    RgbaImage img(4, 4);
    const RgbaImage original = img;
    ImageSurface surface(img);

    const ImageOp seq = ImageOp::Seq({op::Block{1, 1, 0, kRed}, op::Block{1, 1, 0, kBlue}}, std::string("Two"));
    auto inverse = seq.Apply(surface, true);
    ASSERT_TRUE(inverse);
    EXPECT_EQ(img.GetPixel(1, 1), kBlue);
    EXPECT_EQ(inverse->Label(), std::optional<std::string>("Two"));

    inverse->Apply(surface, false);
    EXPECT_EQ(img, original);
}

TEST(ImageOp, MarkersAndLabels)
{
    const ImageOp stroke = ImageOp::Seq({ImageOp::BeginDraw("Pencil"), op::Block{0, 0, 0, kRed}});
    EXPECT_TRUE(stroke.IsMarker(MarkerKind::BeginDraw));
    EXPECT_FALSE(stroke.IsMarker(MarkerKind::EndDraw));
    EXPECT_EQ(stroke.Label(), std::optional<std::string>("Pencil"));

    const ImageOp stripped = stroke.RemoveMarkers();
    EXPECT_FALSE(stripped.IsMarker(MarkerKind::BeginDraw));
    ASSERT_NE(stripped.As<op::Sequential>(), nullptr);
    ASSERT_EQ(stripped.As<op::Sequential>()->ops.size(), 1u);
    EXPECT_EQ(stripped.As<op::Sequential>()->ops[0].GetKind(), ImageOp::Kind::Block);

    EXPECT_TRUE(ImageOp::EndDraw().RemoveMarkers().IsEmpty());
    EXPECT_STREQ(ImageOp(op::Line{}).KindName(), "line");
}

TEST(ImageOp, SurfaceCommitReportsDirtyRect)
{
    RgbaImage img(8, 8);
    ImageSurface surface(img);
    ImageOp(op::FillRectangle{2, 3, 4, 5, kRed, false}).Apply(surface, false);
    EXPECT_TRUE(surface.HasPendingWrites());
    EXPECT_EQ(surface.Commit(), (Rect{2, 3, 3, 3}));
    EXPECT_FALSE(surface.HasPendingWrites());
}
