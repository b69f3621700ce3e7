#include "app/tools.h"
#include "core/editor.h"
#include "core/pixel_surface.h"

#include <gtest/gtest.h>

#include <string>

using namespace pix;

namespace
{
const Color kRed{255, 0, 0, 255};
const Color kBlue{0, 0, 255, 255};
constexpr float kHalfPi = 1.57079632679f;

Color PixelAt(const Editor& editor, int x, int y)
{
    return editor.Image().GetLayer(editor.ActiveLayer())->image.GetPixel(x, y);
}

// 8x8 transparent canvas with a red block covering [x0, x1] x [y0, y1].
Editor WithRedBlock(int x0, int y0, int x1, int y1)
{
    Editor editor(EditorImage(8, 8));
    editor.ApplyImageOp(op::FillRectangle{x0, y0, x1, y1, kRed, false});
    return editor;
}
} // namespace

TEST(StrokeTool, PressMoveReleaseCycle)
{
    PencilTool pencil(2, true);
    EXPECT_FALSE(pencil.Move(Point{1, 1}));
    EXPECT_FALSE(pencil.Release());

    const ImageOp press = pencil.Press(Point{1, 1}, kRed);
    EXPECT_TRUE(press.IsMarker(MarkerKind::BeginDraw));
    EXPECT_EQ(press.Label(), std::optional<std::string>("Pencil"));
    EXPECT_TRUE(pencil.IsPressed());

    EXPECT_FALSE(pencil.Move(Point{1, 1}));

    auto first = pencil.Move(Point{4, 2});
    ASSERT_TRUE(first);
    const auto* s1 = first->As<op::PencilStroke>();
    ASSERT_NE(s1, nullptr);
    EXPECT_EQ(s1->start_x, 1);
    EXPECT_EQ(s1->end_x, 4);
    EXPECT_FALSE(s1->prev_start);
    EXPECT_EQ(s1->color, kRed);
    EXPECT_EQ(s1->side_half_width, 2);
    EXPECT_TRUE(s1->anti_aliased);

    auto second = pencil.Move(Point{6, 6});
    ASSERT_TRUE(second);
    const auto* s2 = second->As<op::PencilStroke>();
    ASSERT_NE(s2, nullptr);
    ASSERT_TRUE(s2->prev_start);
    EXPECT_EQ(*s2->prev_start, std::make_pair(1, 1));
    EXPECT_EQ(s2->start_x, 4);
    EXPECT_EQ(s2->start_y, 2);

    auto end = pencil.Release();
    ASSERT_TRUE(end);
    EXPECT_TRUE(end->IsMarker(MarkerKind::EndDraw));
    EXPECT_FALSE(pencil.IsPressed());
    EXPECT_FALSE(pencil.Release());
}

TEST(StrokeTool, PencilDabIsOneDisc)
{
    PencilTool smooth(3, true);
    const ImageOp a = smooth.Press(Point{0, 0}, kRed);
    const auto* seq = a.As<op::Sequential>();
    ASSERT_NE(seq, nullptr);
    ASSERT_EQ(seq->ops.size(), 2u);
    const auto* dab = seq->ops[1].As<op::FillCircle>();
    ASSERT_NE(dab, nullptr);
    EXPECT_EQ(dab->radius, 3);
    EXPECT_TRUE(dab->blend);
    EXPECT_TRUE(dab->anti_aliased);

    PencilTool hard(3, false);
    const ImageOp b = hard.Press(Point{0, 0}, kRed);
    EXPECT_FALSE(b.As<op::Sequential>()->ops[1].As<op::FillCircle>()->anti_aliased);
}

TEST(StrokeTool, TranslucentDabCompositesEachPixelOnce)
{
    RgbaImage img(16, 16);
    ImageSurface surface(img);
    PencilTool pencil(3, true);
    pencil.Press(Point{8, 8}, Color{255, 0, 0, 128}).Apply(surface, false);

    int full = 0;
    for (int y = 0; y < 16; ++y)
    {
        for (int x = 0; x < 16; ++x)
        {
            const Color c = img.GetPixel(x, y);
            EXPECT_LE(c.a, 128) << x << "," << y;
            full += c.a == 128 ? 1 : 0;
        }
    }
    EXPECT_GT(full, 20);
}

TEST(StrokeTool, EraserWritesTransparentSquares)
{
    EraserTool eraser(1);
    const ImageOp press = eraser.Press(Point{2, 2}, kRed);
    const auto* block = press.As<op::Sequential>()->ops[1].As<op::Block>();
    ASSERT_NE(block, nullptr);
    EXPECT_EQ(block->color, kTransparent);
    EXPECT_EQ(block->side_half_width, 1);

    auto seg = eraser.Move(Point{5, 2});
    ASSERT_TRUE(seg);
    const auto* line = seg->As<op::Line>();
    ASSERT_NE(line, nullptr);
    EXPECT_EQ(line->color, kTransparent);
    EXPECT_FALSE(line->anti_aliased);
}

TEST(StrokeTool, BlockPencilUsesStrokeColour)
{
    BlockPencilTool tool(0);
    tool.Press(Point{0, 0}, kBlue);
    auto seg = tool.Move(Point{3, 3});
    ASSERT_TRUE(seg);
    EXPECT_EQ(seg->As<op::Line>()->color, kBlue);
    EXPECT_EQ(tool.Press(Point{1, 1}, kBlue).Label(), std::optional<std::string>("Block Pencil"));
}

TEST(ShapeBuilders, CircleRadiusFromEdgePoint)
{
    const ImageOp circle = tools::MakeCircle(Point{0, 0}, Point{3, 4}, kBlue, kRed, 1, true);
    EXPECT_EQ(circle.Label(), std::optional<std::string>("Circle"));
    const auto* seq = circle.As<op::Sequential>();
    ASSERT_NE(seq, nullptr);
    ASSERT_EQ(seq->ops.size(), 2u);
    EXPECT_EQ(seq->ops[0].As<op::FillCircle>()->radius, 5);
    const auto* ring = seq->ops[1].As<op::Circle>();
    ASSERT_NE(ring, nullptr);
    EXPECT_EQ(ring->radius, 5);
    EXPECT_EQ(ring->color, kRed);
    EXPECT_TRUE(ring->anti_aliased);
}

TEST(ShapeBuilders, RectangleFillAndBorderAreOptional)
{
    EXPECT_EQ(tools::MakeRectangle(Point{0, 0}, Point{4, 4}, kRed, kBlue, 0).As<op::Sequential>()->ops.size(), 2u);

    const ImageOp border_only = tools::MakeRectangle(Point{0, 0}, Point{4, 4}, std::nullopt, kBlue, 2);
    const auto* seq = border_only.As<op::Sequential>();
    ASSERT_EQ(seq->ops.size(), 1u);
    EXPECT_EQ(seq->ops[0].As<op::Rectangle>()->border_half_width, 2);
}

TEST(ShapeBuilders, LabelledSingleOps)
{
    EXPECT_EQ(tools::MakeLine(Point{0, 0}, Point{1, 1}, kRed, 0, false).Label(), std::optional<std::string>("Line"));
    EXPECT_EQ(tools::MakeBucketFill(Point{0, 0}, kRed, 0.1f).Label(), std::optional<std::string>("Bucket Fill"));
    const ImageOp g = tools::MakeGradient(Point{0, 0}, Point{9, 0}, kRed, kBlue, raster::GradientType::Radial);
    EXPECT_EQ(g.As<op::Sequential>()->ops[0].As<op::ColorGradient>()->type, raster::GradientType::Radial);
}

TEST(PickColor, LayerAndMerged)
{
    EditorImage image(2, 2, kRed);
    const std::size_t top = image.AddLayer();
    image.GetLayer(top)->image.PutPixel(1, 1, kBlue);

    EXPECT_EQ(tools::PickColor(image, 0, Point{1, 1}, false), std::optional<Color>(kRed));
    EXPECT_EQ(tools::PickColor(image, top, Point{0, 0}, false), std::optional<Color>(kTransparent));
    EXPECT_EQ(tools::PickColor(image, top, Point{0, 0}, true), std::optional<Color>(kRed));
    EXPECT_EQ(tools::PickColor(image, top, Point{1, 1}, true), std::optional<Color>(kBlue));
    EXPECT_FALSE(tools::PickColor(image, 0, Point{2, 0}, false));
    EXPECT_FALSE(tools::PickColor(image, 5, Point{0, 0}, false));
}

TEST(ToolKindNames, RoundTrip)
{
    for (ToolKind t : {ToolKind::Pencil, ToolKind::Eraser, ToolKind::BlockPencil, ToolKind::Line, ToolKind::Rectangle,
                       ToolKind::Circle, ToolKind::ColorGradient, ToolKind::BucketFill, ToolKind::ColorPicker,
                       ToolKind::Selection})
    {
        ToolKind parsed = ToolKind::Pencil;
        ASSERT_TRUE(ToolKindFromString(ToolKindToString(t), parsed));
        EXPECT_EQ(parsed, t);
    }
    ToolKind t = ToolKind::Line;
    EXPECT_FALSE(ToolKindFromString("lasso", t));
    EXPECT_EQ(t, ToolKind::Line);
}

TEST(SelectionBuilders, CopyIsClippedToTheCanvas)
{
    const Editor editor = WithRedBlock(6, 6, 7, 7);
    const RgbaImage pixels = tools::CopySelection(editor.Image(), 0, Rect{6, 6, 5, 5});
    EXPECT_EQ(pixels.Width(), 2);
    EXPECT_EQ(pixels.Height(), 2);
    EXPECT_EQ(pixels.GetPixel(1, 1), kRed);
    EXPECT_TRUE(tools::CopySelection(editor.Image(), 3, Rect{0, 0, 2, 2}).IsEmpty());
    EXPECT_TRUE(tools::MakeDeleteSelection(Rect{}).IsEmpty());
}

TEST(SelectionBuilders, DeleteIsUndoable)
{
    Editor editor = WithRedBlock(1, 1, 2, 2);
    const EditorImage before = editor.Image();
    ASSERT_TRUE(editor.ApplyImageOp(tools::MakeDeleteSelection(Rect{1, 1, 2, 2})));
    EXPECT_EQ(PixelAt(editor, 2, 2), kTransparent);
    EXPECT_EQ(editor.UndoLabel(), std::optional<std::string>("Delete Selection"));

    ASSERT_TRUE(editor.Undo());
    EXPECT_EQ(editor.Image(), before);
    ASSERT_TRUE(editor.Redo());
    EXPECT_EQ(PixelAt(editor, 1, 1), kTransparent);
}

TEST(SelectionBuilders, MoveClearsSourceAndPlacesPixels)
{
    Editor editor = WithRedBlock(1, 1, 2, 2);
    const EditorImage before = editor.Image();
    const Rect from{1, 1, 2, 2};
    const RgbaImage pixels = tools::CopySelection(editor.Image(), 0, from);

    ASSERT_TRUE(editor.ApplyImageOp(tools::MakeMoveSelection(from, pixels, Point{5, 4})));
    EXPECT_EQ(PixelAt(editor, 1, 1), kTransparent);
    EXPECT_EQ(PixelAt(editor, 5, 4), kRed);
    EXPECT_EQ(PixelAt(editor, 6, 5), kRed);
    EXPECT_EQ(editor.UndoLabel(), std::optional<std::string>("Move Selection"));
    const EditorImage moved = editor.Image();

    ASSERT_TRUE(editor.Undo());
    EXPECT_EQ(editor.Image(), before);
    ASSERT_TRUE(editor.Redo());
    EXPECT_EQ(editor.Image(), moved);
}

TEST(SelectionBuilders, ScaleFillsTheTargetRectangle)
{
    Editor editor = WithRedBlock(1, 1, 2, 2);
    const EditorImage before = editor.Image();
    const Rect from{1, 1, 2, 2};
    const ImageOp scale = tools::MakeScaleSelection(from, tools::CopySelection(editor.Image(), 0, from),
                                                    Rect{4, 4, 4, 4});
    const auto* scaled = scale.As<op::Sequential>()->ops[1].As<op::SetScaledImage>();
    ASSERT_NE(scaled, nullptr);
    EXPECT_FLOAT_EQ(scaled->scale_x, 2.0f);

    ASSERT_TRUE(editor.ApplyImageOp(scale));
    EXPECT_EQ(PixelAt(editor, 1, 1), kTransparent);
    EXPECT_EQ(PixelAt(editor, 4, 4), kRed);
    EXPECT_EQ(PixelAt(editor, 7, 7), kRed);
    const EditorImage after = editor.Image();

    ASSERT_TRUE(editor.Undo());
    EXPECT_EQ(editor.Image(), before);
    ASSERT_TRUE(editor.Redo());
    EXPECT_EQ(editor.Image(), after);
}

TEST(SelectionBuilders, RotateTurnsAboutTheSelectionCentre)
{
    Editor editor = WithRedBlock(0, 2, 3, 3);
    const EditorImage before = editor.Image();
    const Rect from{0, 2, 4, 2};
    ASSERT_TRUE(editor.ApplyImageOp(
        tools::MakeRotateSelection(from, tools::CopySelection(editor.Image(), 0, from), kHalfPi)));

    // A 4x2 block turned a quarter is 2x4 around (2, 3): columns 1-2, rows 1-4.
    EXPECT_EQ(PixelAt(editor, 1, 2), kRed);
    EXPECT_EQ(PixelAt(editor, 2, 3), kRed);
    EXPECT_EQ(PixelAt(editor, 3, 2), kTransparent);
    EXPECT_EQ(PixelAt(editor, 0, 3), kTransparent);
    EXPECT_EQ(editor.UndoLabel(), std::optional<std::string>("Rotate Selection"));
    const EditorImage after = editor.Image();

    ASSERT_TRUE(editor.Undo());
    EXPECT_EQ(editor.Image(), before);
    ASSERT_TRUE(editor.Redo());
    EXPECT_EQ(editor.Image(), after);
}

TEST(SelectionBuilders, PasteWritesVerbatim)
{
    Editor editor(EditorImage(8, 8, kBlue));
    const EditorImage before = editor.Image();
    RgbaImage clip(2, 2);
    clip.PutPixel(0, 0, kRed);

    ASSERT_TRUE(editor.ApplyImageOp(tools::MakePaste(Point{6, 6}, clip)));
    EXPECT_EQ(PixelAt(editor, 6, 6), kRed);
    EXPECT_EQ(PixelAt(editor, 7, 7), kTransparent);
    EXPECT_EQ(editor.UndoLabel(), std::optional<std::string>("Paste"));

    ASSERT_TRUE(editor.Undo());
    EXPECT_EQ(editor.Image(), before);
    EXPECT_TRUE(tools::MakePaste(Point{0, 0}, RgbaImage{}).IsEmpty());
}
