#include "core/editor_op.h"

namespace pix
{
const char* EditorOp::KindName() const
{
    switch (GetKind())
    {
        case Kind::LayerImageOp:   return "layer_image_op";
        case Kind::SetLayerState:  return "set_layer_state";
        case Kind::SetActiveLayer: return "set_active_layer";
        case Kind::AddLayer:       return "add_layer";
        case Kind::DuplicateLayer: return "duplicate_layer";
        case Kind::SetImage:       return "set_image";
        case Kind::Sequential:     return "sequential";
    }
    return "unknown";
}

bool EditorOp::IsMarker(MarkerKind kind) const
{
    if (const auto* l = As<editor_op::LayerImageOp>())
        return l->op.IsMarker(kind);
    if (const auto* seq = As<editor_op::Sequential>())
    {
        for (const EditorOp& child : seq->ops)
        {
            if (child.IsMarker(kind))
                return true;
        }
    }
    return false;
}

std::optional<std::string> EditorOp::Label() const
{
    switch (GetKind())
    {
        case Kind::LayerImageOp:
        {
            const auto& l = std::get<editor_op::LayerImageOp>(m_payload);
            if (auto label = l.op.Label())
                return label;
            return std::string(l.op.KindName());
        }
        case Kind::SetLayerState:
        {
            const auto& s = std::get<editor_op::SetLayerState>(m_payload);
            switch (s.state)
            {
                case LayerState::Visible: return std::string("Show Layer");
                case LayerState::Hidden:  return std::string("Hide Layer");
                case LayerState::Deleted: return std::string("Delete Layer");
            }
            return std::nullopt;
        }
        case Kind::SetActiveLayer: return std::string("Select Layer");
        case Kind::AddLayer:       return std::string("New Layer");
        case Kind::DuplicateLayer: return std::string("Duplicate Layer");
        case Kind::SetImage:       return std::string("Replace Image");
        case Kind::Sequential:
        {
            const auto& seq = std::get<editor_op::Sequential>(m_payload);
            if (seq.label)
                return seq.label;
            for (const EditorOp& child : seq.ops)
            {
                if (auto label = child.Label())
                    return label;
            }
            return std::nullopt;
        }
    }
    return std::nullopt;
}
} // namespace pix
