#include "app/tools.h"

#include <cmath>
#include <utility>
#include <vector>

namespace pix
{
bool ToolKindFromString(std::string_view s, ToolKind& out)
{
    if (s == "pencil") { out = ToolKind::Pencil; return true; }
    if (s == "eraser") { out = ToolKind::Eraser; return true; }
    if (s == "block_pencil") { out = ToolKind::BlockPencil; return true; }
    if (s == "line") { out = ToolKind::Line; return true; }
    if (s == "rectangle" || s == "rect") { out = ToolKind::Rectangle; return true; }
    if (s == "circle") { out = ToolKind::Circle; return true; }
    if (s == "color_gradient" || s == "gradient") { out = ToolKind::ColorGradient; return true; }
    if (s == "bucket_fill" || s == "bucket") { out = ToolKind::BucketFill; return true; }
    if (s == "color_picker" || s == "picker") { out = ToolKind::ColorPicker; return true; }
    if (s == "selection" || s == "select") { out = ToolKind::Selection; return true; }
    return false;
}

// ---------------------------------------------------------------------------
// Stroke tools
// ---------------------------------------------------------------------------

ImageOp StrokeTool::Press(Point p, const Color& c)
{
    m_pressed = true;
    m_color = c;
    m_last = p;
    m_prev_start.reset();
    return ImageOp::Seq({ImageOp::BeginDraw(std::string(Label())), Dab(p)});
}

std::optional<ImageOp> StrokeTool::Move(Point p)
{
    if (!m_pressed || p == m_last)
        return std::nullopt;
    ImageOp op = Segment(m_last, p, m_prev_start);
    m_prev_start = m_last;
    m_last = p;
    return op;
}

std::optional<ImageOp> StrokeTool::Release()
{
    if (!m_pressed)
        return std::nullopt;
    m_pressed = false;
    m_prev_start.reset();
    return ImageOp::EndDraw();
}

ImageOp PencilTool::Dab(Point p) const
{
    return op::FillCircle{p.x, p.y, HalfWidth(), StrokeColor(), true, m_anti_aliased};
}

ImageOp PencilTool::Segment(Point from, Point to, std::optional<Point> prev) const
{
    op::PencilStroke s;
    s.start_x = from.x;
    s.start_y = from.y;
    s.end_x = to.x;
    s.end_y = to.y;
    if (prev)
        s.prev_start = std::make_pair(prev->x, prev->y);
    s.color = StrokeColor();
    s.side_half_width = HalfWidth();
    s.blend = true;
    s.anti_aliased = m_anti_aliased;
    return ImageOp(std::move(s));
}

ImageOp EraserTool::Dab(Point p) const
{
    return op::Block{p.x, p.y, HalfWidth(), kTransparent};
}

ImageOp EraserTool::Segment(Point from, Point to, std::optional<Point>) const
{
    return op::Line{from.x, from.y, to.x, to.y, kTransparent, HalfWidth(), false};
}

ImageOp BlockPencilTool::Dab(Point p) const
{
    return op::Block{p.x, p.y, HalfWidth(), StrokeColor()};
}

ImageOp BlockPencilTool::Segment(Point from, Point to, std::optional<Point>) const
{
    return op::Line{from.x, from.y, to.x, to.y, StrokeColor(), HalfWidth(), false};
}

// ---------------------------------------------------------------------------
// Shape builders
// ---------------------------------------------------------------------------

namespace tools
{
ImageOp MakeLine(Point a, Point b, const Color& c, int half_width, bool anti_aliased)
{
    return ImageOp::Seq({op::Line{a.x, a.y, b.x, b.y, c, half_width, anti_aliased}}, std::string("Line"));
}

ImageOp MakeRectangle(Point a, Point b, std::optional<Color> fill, std::optional<Color> border, int border_half_width)
{
    std::vector<ImageOp> ops;
    if (fill)
        ops.push_back(op::FillRectangle{a.x, a.y, b.x, b.y, *fill, true});
    if (border)
        ops.push_back(op::Rectangle{a.x, a.y, b.x, b.y, *border, border_half_width});
    return ImageOp::Seq(std::move(ops), std::string("Rectangle"));
}

ImageOp MakeCircle(Point center, Point edge, std::optional<Color> fill, std::optional<Color> border,
                   int border_half_width, bool anti_aliased)
{
    const double dx = (double)(edge.x - center.x);
    const double dy = (double)(edge.y - center.y);
    const int radius = (int)std::lround(std::sqrt(dx * dx + dy * dy));

    std::vector<ImageOp> ops;
    if (fill)
        ops.push_back(op::FillCircle{center.x, center.y, radius, *fill, true});
    if (border)
        ops.push_back(op::Circle{center.x, center.y, radius, border_half_width, *border, false, anti_aliased});
    return ImageOp::Seq(std::move(ops), std::string("Circle"));
}

ImageOp MakeGradient(Point a, Point b, const Color& first, const Color& second, raster::GradientType type)
{
    return ImageOp::Seq({op::ColorGradient{a.x, a.y, b.x, b.y, first, second, type}}, std::string("Gradient"));
}

ImageOp MakeBucketFill(Point p, const Color& c, float tolerance)
{
    return ImageOp::Seq({op::BucketFill{p.x, p.y, c, tolerance}}, std::string("Bucket Fill"));
}

ImageOp MakeDeleteSelection(const Rect& from, const char* label)
{
    if (from.IsEmpty())
        return ImageOp{};
    return ImageOp::Seq({op::FillRectangle{from.x, from.y, from.Right() - 1, from.Bottom() - 1, kTransparent, false}},
                        std::string(label));
}

ImageOp MakeMoveSelection(const Rect& from, const RgbaImage& pixels, Point to)
{
    if (from.IsEmpty() || pixels.IsEmpty())
        return ImageOp{};
    return ImageOp::Seq({op::FillRectangle{from.x, from.y, from.Right() - 1, from.Bottom() - 1, kTransparent, false},
                         op::SetImage{to.x, to.y, pixels, true}},
                        std::string("Move Selection"));
}

ImageOp MakeScaleSelection(const Rect& from, const RgbaImage& pixels, const Rect& to)
{
    if (from.IsEmpty() || pixels.IsEmpty() || to.IsEmpty())
        return ImageOp{};
    op::SetScaledImage scaled;
    scaled.image = pixels;
    scaled.start_x = to.x;
    scaled.start_y = to.y;
    scaled.scale_x = (float)to.w / (float)pixels.Width();
    scaled.scale_y = (float)to.h / (float)pixels.Height();
    return ImageOp::Seq({op::FillRectangle{from.x, from.y, from.Right() - 1, from.Bottom() - 1, kTransparent, false},
                         std::move(scaled)},
                        std::string("Scale Selection"));
}

ImageOp MakeRotateSelection(const Rect& from, const RgbaImage& pixels, float radians)
{
    if (from.IsEmpty() || pixels.IsEmpty())
        return ImageOp{};
    op::SetRotatedImage rotated;
    rotated.image = pixels;
    rotated.center_x = from.x + from.w / 2;
    rotated.center_y = from.y + from.h / 2;
    rotated.rotation = radians;
    return ImageOp::Seq({op::FillRectangle{from.x, from.y, from.Right() - 1, from.Bottom() - 1, kTransparent, false},
                         std::move(rotated)},
                        std::string("Rotate Selection"));
}

ImageOp MakePaste(Point at, const RgbaImage& pixels)
{
    if (pixels.IsEmpty())
        return ImageOp{};
    return ImageOp::Seq({op::SetImage{at.x, at.y, pixels, false}}, std::string("Paste"));
}

RgbaImage CopySelection(const EditorImage& image, std::size_t layer, const Rect& selection)
{
    const Layer* l = image.GetLayer(layer);
    if (!l || !l->IsLive())
        return RgbaImage{};
    return l->image.SubImage(selection);
}

std::optional<Color> PickColor(const EditorImage& image, std::size_t layer, Point p, bool merged)
{
    if (p.x < 0 || p.y < 0 || p.x >= image.Width() || p.y >= image.Height())
        return std::nullopt;
    if (merged)
        return image.Flatten().GetPixel(p.x, p.y);
    const Layer* l = image.GetLayer(layer);
    if (!l || !l->image.InBounds(p.x, p.y))
        return std::nullopt;
    return l->image.GetPixel(p.x, p.y);
}
} // namespace tools
} // namespace pix
