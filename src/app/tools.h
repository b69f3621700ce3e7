// Drawing tools. Tools never touch the canvas: they translate pointer positions in
// image coordinates into ImageOp values that the caller queues for the editor.
#pragma once

#include "core/color.h"
#include "core/editor_image.h"
#include "core/image_op.h"
#include "core/raster/gradient.h"
#include "core/rect.h"
#include "core/rgba_image.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace pix
{
enum class ToolKind : std::uint8_t
{
    Pencil = 0,
    Eraser,
    BlockPencil,
    Line,
    Rectangle,
    Circle,
    ColorGradient,
    BucketFill,
    ColorPicker,
    Selection,
};

inline constexpr const char* ToolKindToString(ToolKind t)
{
    switch (t)
    {
        case ToolKind::Pencil:        return "pencil";
        case ToolKind::Eraser:        return "eraser";
        case ToolKind::BlockPencil:   return "block_pencil";
        case ToolKind::Line:          return "line";
        case ToolKind::Rectangle:     return "rectangle";
        case ToolKind::Circle:        return "circle";
        case ToolKind::ColorGradient: return "color_gradient";
        case ToolKind::BucketFill:    return "bucket_fill";
        case ToolKind::ColorPicker:   return "color_picker";
        case ToolKind::Selection:     return "selection";
    }
    return "pencil";
}

bool ToolKindFromString(std::string_view s, ToolKind& out);

struct Point
{
    int x = 0;
    int y = 0;

    bool operator==(const Point& o) const = default;
};

// Press/Move/Release state machine shared by the freehand tools.
// Press() opens a stroke (BeginDraw + first dab), Move() yields one segment per new
// position while pressed and Release() closes the stroke (EndDraw).
class StrokeTool
{
public:
    explicit StrokeTool(int half_width) : m_half_width(half_width < 0 ? 0 : half_width) {}
    virtual ~StrokeTool() = default;

    ImageOp                Press(Point p, const Color& c);
    std::optional<ImageOp> Move(Point p);
    std::optional<ImageOp> Release();

    bool IsPressed() const { return m_pressed; }
    int  HalfWidth() const { return m_half_width; }
    void SetHalfWidth(int half_width) { m_half_width = half_width < 0 ? 0 : half_width; }

protected:
    virtual const char* Label() const = 0;
    virtual ImageOp     Dab(Point p) const = 0;
    // `prev` is the start of the previous segment, if any.
    virtual ImageOp Segment(Point from, Point to, std::optional<Point> prev) const = 0;

    const Color& StrokeColor() const { return m_color; }

private:
    bool                 m_pressed = false;
    Point                m_last;
    std::optional<Point> m_prev_start;
    Color                m_color;
    int                  m_half_width = 0;
};

// Round, optionally anti-aliased brush.
class PencilTool final : public StrokeTool
{
public:
    PencilTool(int half_width, bool anti_aliased) : StrokeTool(half_width), m_anti_aliased(anti_aliased) {}

    void SetAntiAliased(bool v) { m_anti_aliased = v; }

protected:
    const char* Label() const override { return "Pencil"; }
    ImageOp     Dab(Point p) const override;
    ImageOp     Segment(Point from, Point to, std::optional<Point> prev) const override;

private:
    bool m_anti_aliased = true;
};

// Square brush that writes transparent pixels.
class EraserTool final : public StrokeTool
{
public:
    explicit EraserTool(int half_width) : StrokeTool(half_width) {}

protected:
    const char* Label() const override { return "Eraser"; }
    ImageOp     Dab(Point p) const override;
    ImageOp     Segment(Point from, Point to, std::optional<Point> prev) const override;
};

// Square, hard-edged brush.
class BlockPencilTool final : public StrokeTool
{
public:
    explicit BlockPencilTool(int half_width) : StrokeTool(half_width) {}

protected:
    const char* Label() const override { return "Block Pencil"; }
    ImageOp     Dab(Point p) const override;
    ImageOp     Segment(Point from, Point to, std::optional<Point> prev) const override;
};

namespace tools
{
ImageOp MakeLine(Point a, Point b, const Color& c, int half_width, bool anti_aliased);

// Filled and/or bordered rectangle spanning the two corners (inclusive).
ImageOp MakeRectangle(Point a, Point b, std::optional<Color> fill, std::optional<Color> border, int border_half_width);

// Circle centred on `center` passing through `edge`.
ImageOp MakeCircle(Point center, Point edge, std::optional<Color> fill, std::optional<Color> border,
                   int border_half_width, bool anti_aliased);

ImageOp MakeGradient(Point a, Point b, const Color& first, const Color& second, raster::GradientType type);

ImageOp MakeBucketFill(Point p, const Color& c, float tolerance);

// Selection editing. `from` is the selected rectangle (already clipped to the canvas)
// and `pixels` its content; every transform clears `from` to transparent, then places
// the pixels again, so one undo restores both.
ImageOp MakeDeleteSelection(const Rect& from, const char* label = "Delete Selection");
// `to` is the new top-left corner.
ImageOp MakeMoveSelection(const Rect& from, const RgbaImage& pixels, Point to);
// Resamples the pixels to fill `to`.
ImageOp MakeScaleSelection(const Rect& from, const RgbaImage& pixels, const Rect& to);
// Rotates the pixels about the centre of `from`.
ImageOp MakeRotateSelection(const Rect& from, const RgbaImage& pixels, float radians);
// Writes `pixels` verbatim with their top-left corner at `at`.
ImageOp MakePaste(Point at, const RgbaImage& pixels);

// Pixels of `selection` on `layer`, clipped to the canvas. Empty for a missing layer.
RgbaImage CopySelection(const EditorImage& image, std::size_t layer, const Rect& selection);

// Colour under `p` on `layer`, or on the flattened canvas when `merged` is true.
// nullopt outside the canvas or for a missing layer.
std::optional<Color> PickColor(const EditorImage& image, std::size_t layer, Point p, bool merged);
} // namespace tools
} // namespace pix
