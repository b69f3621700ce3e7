#include "app/command_queue.h"

#include <utility>

namespace pix
{
const char* ToString(Command::Kind k)
{
    switch (k)
    {
        case Command::Kind::SelectTool:        return "select_tool";
        case Command::Kind::SetPrimaryColor:   return "set_primary_color";
        case Command::Kind::SetSecondaryColor: return "set_secondary_color";
        case Command::Kind::ApplyImageOp:      return "apply_image_op";
        case Command::Kind::UndoImageOp:       return "undo";
        case Command::Kind::RedoImageOp:       return "redo";
        case Command::Kind::NewImage:          return "new_image";
        case Command::Kind::SwitchImage:       return "switch_image";
        case Command::Kind::ResizeImage:       return "resize_image";
        case Command::Kind::ResizeCanvas:      return "resize_canvas";
        case Command::Kind::SetSelection:      return "set_selection";
        case Command::Kind::NewLayer:          return "new_layer";
        case Command::Kind::DuplicateLayer:    return "duplicate_layer";
        case Command::Kind::DeleteLayer:       return "delete_layer";
        case Command::Kind::SetActiveLayer:    return "set_active_layer";
        case Command::Kind::SetLayerVisible:   return "set_layer_visible";
        case Command::Kind::CopySelection:     return "copy_selection";
        case Command::Kind::CutSelection:      return "cut_selection";
        case Command::Kind::DeleteSelection:   return "delete_selection";
        case Command::Kind::Paste:             return "paste";
        case Command::Kind::MoveSelection:     return "move_selection";
        case Command::Kind::ScaleSelection:    return "scale_selection";
        case Command::Kind::RotateSelection:   return "rotate_selection";
    }
    return "unknown";
}

Command Command::SelectTool(ToolKind t)
{
    Command c;
    c.kind = Kind::SelectTool;
    c.tool = t;
    return c;
}

Command Command::SetPrimaryColor(const Color& col)
{
    Command c;
    c.kind = Kind::SetPrimaryColor;
    c.color = col;
    return c;
}

Command Command::SetSecondaryColor(const Color& col)
{
    Command c;
    c.kind = Kind::SetSecondaryColor;
    c.color = col;
    return c;
}

Command Command::ApplyImageOp(ImageOp op)
{
    Command c;
    c.kind = Kind::ApplyImageOp;
    c.op = std::move(op);
    return c;
}

Command Command::Undo()
{
    Command c;
    c.kind = Kind::UndoImageOp;
    return c;
}

Command Command::Redo()
{
    Command c;
    c.kind = Kind::RedoImageOp;
    return c;
}

Command Command::NewImage(int width, int height, std::optional<Color> background)
{
    Command c;
    c.kind = Kind::NewImage;
    c.width = width;
    c.height = height;
    c.color = background.value_or(kTransparent);
    return c;
}

Command Command::SwitchImage(std::string path, RgbaImage image)
{
    Command c;
    c.kind = Kind::SwitchImage;
    c.path = std::move(path);
    c.image = std::move(image);
    return c;
}

Command Command::ResizeImage(int width, int height)
{
    Command c;
    c.kind = Kind::ResizeImage;
    c.width = width;
    c.height = height;
    return c;
}

Command Command::ResizeCanvas(int width, int height)
{
    Command c;
    c.kind = Kind::ResizeCanvas;
    c.width = width;
    c.height = height;
    return c;
}

Command Command::SetSelection(std::optional<Rect> selection)
{
    Command c;
    c.kind = Kind::SetSelection;
    c.selection = selection;
    return c;
}

Command Command::NewLayer()
{
    Command c;
    c.kind = Kind::NewLayer;
    return c;
}

Command Command::DuplicateLayer()
{
    Command c;
    c.kind = Kind::DuplicateLayer;
    return c;
}

Command Command::DeleteLayer()
{
    Command c;
    c.kind = Kind::DeleteLayer;
    return c;
}

Command Command::SetActiveLayer(std::size_t layer)
{
    Command c;
    c.kind = Kind::SetActiveLayer;
    c.layer = layer;
    return c;
}

Command Command::SetLayerVisible(std::size_t layer, bool visible)
{
    Command c;
    c.kind = Kind::SetLayerVisible;
    c.layer = layer;
    c.visible = visible;
    return c;
}

Command Command::CopySelection()
{
    Command c;
    c.kind = Kind::CopySelection;
    return c;
}

Command Command::CutSelection()
{
    Command c;
    c.kind = Kind::CutSelection;
    return c;
}

Command Command::DeleteSelection()
{
    Command c;
    c.kind = Kind::DeleteSelection;
    return c;
}

Command Command::Paste(Point at)
{
    Command c;
    c.kind = Kind::Paste;
    c.point = at;
    return c;
}

Command Command::MoveSelection(Point to)
{
    Command c;
    c.kind = Kind::MoveSelection;
    c.point = to;
    return c;
}

Command Command::ScaleSelection(const Rect& to)
{
    Command c;
    c.kind = Kind::ScaleSelection;
    c.selection = to;
    return c;
}

Command Command::RotateSelection(float radians)
{
    Command c;
    c.kind = Kind::RotateSelection;
    c.angle = radians;
    return c;
}
} // namespace pix
