#include "core/image_op.h"

namespace pix
{
const char* ToString(ImageOp::Kind k)
{
    switch (k)
    {
        case ImageOp::Kind::Empty:            return "empty";
        case ImageOp::Kind::Marker:           return "marker";
        case ImageOp::Kind::Sequential:       return "sequential";
        case ImageOp::Kind::SetImage:         return "set_image";
        case ImageOp::Kind::SetScaledImage:   return "set_scaled_image";
        case ImageOp::Kind::SetRotatedImage:  return "set_rotated_image";
        case ImageOp::Kind::FillRectangle:    return "fill_rectangle";
        case ImageOp::Kind::ColorGradient:    return "color_gradient";
        case ImageOp::Kind::Block:            return "block";
        case ImageOp::Kind::Line:             return "line";
        case ImageOp::Kind::PencilStroke:     return "pencil_stroke";
        case ImageOp::Kind::Rectangle:        return "rectangle";
        case ImageOp::Kind::Circle:           return "circle";
        case ImageOp::Kind::FillCircle:       return "fill_circle";
        case ImageOp::Kind::BucketFill:       return "bucket_fill";
        case ImageOp::Kind::SetSparseImage:   return "set_sparse_image";
        case ImageOp::Kind::SetOptionalImage: return "set_optional_image";
    }
    return "unknown";
}

const char* ImageOp::KindName() const
{
    return ToString(GetKind());
}

bool ImageOp::IsMarker(MarkerKind kind) const
{
    if (const auto* m = As<op::Marker>())
        return m->kind == kind;
    if (const auto* seq = As<op::Sequential>())
    {
        for (const ImageOp& child : seq->ops)
        {
            if (child.IsMarker(kind))
                return true;
        }
    }
    return false;
}

ImageOp ImageOp::RemoveMarkers() const
{
    if (GetKind() == Kind::Marker)
        return ImageOp{};

    if (const auto* seq = As<op::Sequential>())
    {
        op::Sequential out;
        out.label = seq->label;
        out.ops.reserve(seq->ops.size());
        for (const ImageOp& child : seq->ops)
        {
            if (child.GetKind() == Kind::Marker)
                continue;
            out.ops.push_back(child.RemoveMarkers());
        }
        return ImageOp(std::move(out));
    }
    return *this;
}

std::optional<std::string> ImageOp::Label() const
{
    if (const auto* m = As<op::Marker>())
        return m->label;
    if (const auto* seq = As<op::Sequential>())
    {
        if (seq->label)
            return seq->label;
        for (const ImageOp& child : seq->ops)
        {
            if (auto l = child.Label())
                return l;
        }
    }
    return std::nullopt;
}
} // namespace pix
