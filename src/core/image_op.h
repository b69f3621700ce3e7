// Closed set of reversible pixel edits.
//
// An ImageOp is plain data. Apply() executes it against a PixelSurface and, when
// asked, returns the operation that restores every pixel it changed. Undo payloads
// (SetSparseImage, SetOptionalImage, non-blending SetImage) are ordinary operations
// too, so applying an inverse can itself produce an inverse for redo.
#pragma once

#include "core/color.h"
#include "core/pixel_surface.h"
#include "core/raster/gradient.h"
#include "core/rgba_image.h"
#include "core/sparse_image.h"

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace pix
{
enum class MarkerKind : std::uint8_t
{
    BeginDraw = 0,
    EndDraw,
};

class ImageOp;

namespace op
{
struct Empty
{
};

// Stroke delimiter; never touches pixels.
struct Marker
{
    MarkerKind                 kind = MarkerKind::BeginDraw;
    std::optional<std::string> label;
};

struct Sequential
{
    std::optional<std::string> label;
    std::vector<ImageOp>       ops;
};

// Copies `image` with its top-left corner at (start_x, start_y).
struct SetImage
{
    int       start_x = 0;
    int       start_y = 0;
    RgbaImage image;
    bool      blend = false;
};

// `image` resampled by (scale_x, scale_y) with a triangle filter, then placed like SetImage.
struct SetScaledImage
{
    RgbaImage image;
    int       start_x = 0;
    int       start_y = 0;
    float     scale_x = 1.0f;
    float     scale_y = 1.0f;
    bool      blend = true;
};

// `image` rotated by `rotation` radians and centred on (center_x, center_y).
struct SetRotatedImage
{
    RgbaImage image;
    int       center_x = 0;
    int       center_y = 0;
    float     rotation = 0.0f;
    bool      blend = true;
};

// Inclusive corners, any order.
struct FillRectangle
{
    int   start_x = 0;
    int   start_y = 0;
    int   end_x = 0;
    int   end_y = 0;
    Color color;
    bool  blend = false;
};

// Covers the whole surface.
struct ColorGradient
{
    int                  start_x = 0;
    int                  start_y = 0;
    int                  end_x = 0;
    int                  end_y = 0;
    Color                first_color;
    Color                second_color;
    raster::GradientType type = raster::GradientType::Linear;
};

// (2h+1)^2 square centred on (x, y); overwrites.
struct Block
{
    int   x = 0;
    int   y = 0;
    int   side_half_width = 0;
    Color color;
};

struct Line
{
    int   start_x = 0;
    int   start_y = 0;
    int   end_x = 0;
    int   end_y = 0;
    Color color;
    int   side_half_width = 0;
    bool  anti_aliased = false;
};

// One segment of a freehand stroke. When `prev_start` is set the segment continues an
// earlier one and a round join is stamped at `start`.
struct PencilStroke
{
    int                                start_x = 0;
    int                                start_y = 0;
    int                                end_x = 0;
    int                                end_y = 0;
    std::optional<std::pair<int, int>> prev_start;
    Color                              color;
    int                                side_half_width = 0;
    bool                               blend = true;
    bool                               anti_aliased = false;
};

// Rectangle border, inclusive corners in any order.
struct Rectangle
{
    int   start_x = 0;
    int   start_y = 0;
    int   end_x = 0;
    int   end_y = 0;
    Color color;
    int   border_half_width = 0;
};

// Circle border.
struct Circle
{
    int   center_x = 0;
    int   center_y = 0;
    int   radius = 0;
    int   border_half_width = 0;
    Color color;
    bool  blend = false;
    bool  anti_aliased = false;
};

// Filled disc. With `anti_aliased` the rim is softened with Wu coverage in the same
// pass, so no pixel is composited twice.
struct FillCircle
{
    int   center_x = 0;
    int   center_y = 0;
    int   radius = 0;
    Color color;
    bool  blend = false;
    bool  anti_aliased = false;
};

struct BucketFill
{
    int   start_x = 0;
    int   start_y = 0;
    Color fill_color;
    float tolerance = 0.0f;
};

// Writes every recorded pixel verbatim.
struct SetSparseImage
{
    SparseImage image;
};

// Writes every present cell verbatim, offset by (start_x, start_y).
struct SetOptionalImage
{
    int           start_x = 0;
    int           start_y = 0;
    OptionalImage image;
};
} // namespace op

class ImageOp
{
public:
    // Same order as Payload's alternatives.
    enum class Kind : std::uint8_t
    {
        Empty = 0,
        Marker,
        Sequential,
        SetImage,
        SetScaledImage,
        SetRotatedImage,
        FillRectangle,
        ColorGradient,
        Block,
        Line,
        PencilStroke,
        Rectangle,
        Circle,
        FillCircle,
        BucketFill,
        SetSparseImage,
        SetOptionalImage,
    };

    using Payload = std::variant<op::Empty,
                                 op::Marker,
                                 op::Sequential,
                                 op::SetImage,
                                 op::SetScaledImage,
                                 op::SetRotatedImage,
                                 op::FillRectangle,
                                 op::ColorGradient,
                                 op::Block,
                                 op::Line,
                                 op::PencilStroke,
                                 op::Rectangle,
                                 op::Circle,
                                 op::FillCircle,
                                 op::BucketFill,
                                 op::SetSparseImage,
                                 op::SetOptionalImage>;

    ImageOp() = default;

    template <typename T,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, ImageOp> &&
                                          std::is_constructible_v<Payload, T>>>
    ImageOp(T&& payload) : m_payload(std::forward<T>(payload))
    {
    }

    static ImageOp BeginDraw(std::optional<std::string> label = std::nullopt)
    {
        return ImageOp(op::Marker{MarkerKind::BeginDraw, std::move(label)});
    }
    static ImageOp EndDraw() { return ImageOp(op::Marker{MarkerKind::EndDraw, std::nullopt}); }
    static ImageOp Seq(std::vector<ImageOp> ops, std::optional<std::string> label = std::nullopt)
    {
        return ImageOp(op::Sequential{std::move(label), std::move(ops)});
    }

    Kind GetKind() const { return (Kind)m_payload.index(); }
    bool IsEmpty() const { return GetKind() == Kind::Empty; }

    template <typename T>
    const T* As() const { return std::get_if<T>(&m_payload); }
    template <typename T>
    T* As() { return std::get_if<T>(&m_payload); }

    const Payload& GetPayload() const { return m_payload; }

    // Executes the operation against `surface`. When `compute_inverse` is true and at
    // least one pixel was written, returns the operation that restores them.
    std::optional<ImageOp> Apply(PixelSurface& surface, bool compute_inverse) const;

    // True if this op is, or (recursively) contains, a marker of `kind`.
    bool IsMarker(MarkerKind kind) const;

    // Copy with every marker removed from Sequential children. A bare marker becomes Empty.
    ImageOp RemoveMarkers() const;

    // First label found on a Marker or Sequential, depth first.
    std::optional<std::string> Label() const;

    const char* KindName() const;

private:
    Payload m_payload;
};

const char* ToString(ImageOp::Kind k);
} // namespace pix
