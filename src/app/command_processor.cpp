#include "app/command_processor.h"

#include <cstdio>
#include <utility>

namespace pix
{
CommandProcessor::CommandProcessor(const EditorSettings& settings)
    : m_editor(EditorImage(settings.default_width, settings.default_height, settings.default_background))
    , m_settings(settings)
    , m_primary(settings.primary_color)
    , m_secondary(settings.secondary_color)
    , m_pencil(settings.pencil_half_width, settings.anti_aliasing)
    , m_eraser(settings.pencil_half_width)
    , m_block_pencil(settings.pencil_half_width)
{
    m_editor.SetUndoLimit(settings.undo_limit);
}

StrokeTool* CommandProcessor::ActiveStrokeTool()
{
    switch (m_tool)
    {
        case ToolKind::Pencil:      return &m_pencil;
        case ToolKind::Eraser:      return &m_eraser;
        case ToolKind::BlockPencil: return &m_block_pencil;
        default:                    return nullptr;
    }
}

void CommandProcessor::SelectTool(ToolKind tool)
{
    if (tool == m_tool)
        return;
    // Close a stroke that is still open on the outgoing tool.
    if (StrokeTool* t = ActiveStrokeTool())
    {
        if (auto end = t->Release())
            m_editor.ApplyImageOp(std::move(*end));
    }
    m_anchor.reset();
    m_moving_selection = false;
    m_tool = tool;
}

bool CommandProcessor::Execute(Command& c)
{
    switch (c.kind)
    {
        case Command::Kind::SelectTool:
            SelectTool(c.tool);
            return true;
        case Command::Kind::SetPrimaryColor:
            m_primary = c.color;
            return true;
        case Command::Kind::SetSecondaryColor:
            m_secondary = c.color;
            return true;
        case Command::Kind::ApplyImageOp:
            return m_editor.ApplyImageOp(std::move(c.op));
        case Command::Kind::UndoImageOp:
            return m_editor.Undo();
        case Command::Kind::RedoImageOp:
            return m_editor.Redo();
        case Command::Kind::NewImage:
            if (c.width <= 0 || c.height <= 0)
            {
                std::fprintf(stderr, "[session] invalid new image size %dx%d\n", c.width, c.height);
                return false;
            }
            return m_editor.ReplaceImage(EditorImage(c.width, c.height, c.color));
        case Command::Kind::SwitchImage:
            if (c.image.IsEmpty())
            {
                std::fprintf(stderr, "[session] '%s' has no pixels\n", c.path.c_str());
                return false;
            }
            return m_editor.ReplaceImage(EditorImage::FromRgba(std::move(c.path), std::move(c.image)));
        case Command::Kind::ResizeImage:
            return m_editor.ResizeImage(c.width, c.height);
        case Command::Kind::ResizeCanvas:
            return m_editor.ResizeCanvas(c.width, c.height);
        case Command::Kind::SetSelection:
            m_editor.SetValidRegion(c.selection);
            return true;
        case Command::Kind::NewLayer:
            return m_editor.AddLayer();
        case Command::Kind::DuplicateLayer:
            return m_editor.DuplicateActiveLayer();
        case Command::Kind::DeleteLayer:
            return m_editor.DeleteLayer(m_editor.ActiveLayer());
        case Command::Kind::SetActiveLayer:
            return m_editor.SetActiveLayer(c.layer);
        case Command::Kind::SetLayerVisible:
            return m_editor.SetLayerVisible(c.layer, c.visible);
        case Command::Kind::CopySelection:
        case Command::Kind::CutSelection:
        case Command::Kind::DeleteSelection:
        case Command::Kind::Paste:
        case Command::Kind::MoveSelection:
        case Command::Kind::ScaleSelection:
        case Command::Kind::RotateSelection:
            return EditSelection(c);
    }
    return false;
}

bool CommandProcessor::ApplyUnmasked(ImageOp op, std::optional<Rect> selection_after)
{
    const std::optional<Rect> before = m_editor.ValidRegion();
    m_editor.SetValidRegion(std::nullopt);
    const bool ok = m_editor.ApplyImageOp(std::move(op));
    m_editor.SetValidRegion(ok ? selection_after : before);
    return ok;
}

bool CommandProcessor::EditSelection(const Command& c)
{
    if (c.kind == Command::Kind::Paste)
    {
        if (m_clipboard.IsEmpty())
        {
            std::fprintf(stderr, "[session] nothing to paste\n");
            return false;
        }
        const Rect pasted{c.point.x, c.point.y, m_clipboard.Width(), m_clipboard.Height()};
        return ApplyUnmasked(tools::MakePaste(c.point, m_clipboard), pasted);
    }

    const EditorImage& image = m_editor.Image();
    const std::optional<Rect> selection = m_editor.ValidRegion();
    const Rect from = selection ? selection->Intersect(Rect{0, 0, image.Width(), image.Height()}) : Rect{};
    if (from.IsEmpty())
    {
        std::fprintf(stderr, "[session] %s needs a selection on the canvas\n", ToString(c.kind));
        return false;
    }
    RgbaImage pixels = tools::CopySelection(image, m_editor.ActiveLayer(), from);
    if (pixels.IsEmpty())
        return false;

    switch (c.kind)
    {
        case Command::Kind::CopySelection:
            m_clipboard = std::move(pixels);
            return true;
        case Command::Kind::CutSelection:
            m_clipboard = std::move(pixels);
            return ApplyUnmasked(tools::MakeDeleteSelection(from, "Cut Selection"), std::nullopt);
        case Command::Kind::DeleteSelection:
            return ApplyUnmasked(tools::MakeDeleteSelection(from), std::nullopt);
        case Command::Kind::MoveSelection:
            return ApplyUnmasked(tools::MakeMoveSelection(from, pixels, c.point),
                                 Rect{c.point.x, c.point.y, from.w, from.h});
        case Command::Kind::ScaleSelection:
            if (!c.selection || c.selection->IsEmpty())
            {
                std::fprintf(stderr, "[session] scale selection needs a non-empty target\n");
                return false;
            }
            return ApplyUnmasked(tools::MakeScaleSelection(from, pixels, *c.selection), *c.selection);
        case Command::Kind::RotateSelection:
            return ApplyUnmasked(tools::MakeRotateSelection(from, pixels, c.angle), from);
        default:
            return false;
    }
}

std::size_t CommandProcessor::Drain(CommandQueue& queue)
{
    std::size_t n = 0;
    Command c;
    while (queue.Poll(c))
    {
        if (!Execute(c))
            std::fprintf(stderr, "[session] command '%s' was not applied\n", ToString(c.kind));
        ++n;
    }
    return n;
}

void CommandProcessor::PointerDown(Point p, bool secondary, CommandQueue& out)
{
    const Color c = secondary ? m_secondary : m_primary;

    if (StrokeTool* t = ActiveStrokeTool())
    {
        out.Push(Command::ApplyImageOp(t->Press(p, c)));
        return;
    }

    switch (m_tool)
    {
        case ToolKind::BucketFill:
            out.Push(Command::ApplyImageOp(tools::MakeBucketFill(p, c, m_settings.bucket_tolerance)));
            break;
        case ToolKind::ColorPicker:
            if (auto picked = tools::PickColor(m_editor.Image(), m_editor.ActiveLayer(), p, false))
                out.Push(secondary ? Command::SetSecondaryColor(*picked) : Command::SetPrimaryColor(*picked));
            break;
        case ToolKind::Selection:
            m_anchor = p;
            m_moving_selection = m_editor.ValidRegion() && m_editor.ValidRegion()->Contains(p.x, p.y);
            break;
        default:
            m_anchor = p;
            m_shape_color = c;
            break;
    }
}

void CommandProcessor::PointerMove(Point p, CommandQueue& out)
{
    if (StrokeTool* t = ActiveStrokeTool())
    {
        if (auto op = t->Move(p))
            out.Push(Command::ApplyImageOp(std::move(*op)));
    }
}

void CommandProcessor::PointerUp(Point p, CommandQueue& out)
{
    if (StrokeTool* t = ActiveStrokeTool())
    {
        if (auto op = t->Move(p))
            out.Push(Command::ApplyImageOp(std::move(*op)));
        if (auto end = t->Release())
            out.Push(Command::ApplyImageOp(std::move(*end)));
        return;
    }

    if (!m_anchor)
        return;
    const Point a = *m_anchor;
    m_anchor.reset();

    const int hw = m_settings.pencil_half_width;
    const bool aa = m_settings.anti_aliasing;
    switch (m_tool)
    {
        case ToolKind::Line:
            out.Push(Command::ApplyImageOp(tools::MakeLine(a, p, m_shape_color, hw, aa)));
            break;
        case ToolKind::Rectangle:
            out.Push(Command::ApplyImageOp(tools::MakeRectangle(a, p, std::nullopt, m_shape_color, hw)));
            break;
        case ToolKind::Circle:
            out.Push(Command::ApplyImageOp(tools::MakeCircle(a, p, std::nullopt, m_shape_color, hw, aa)));
            break;
        case ToolKind::ColorGradient:
            out.Push(Command::ApplyImageOp(
                tools::MakeGradient(a, p, m_primary, m_secondary, raster::GradientType::Linear)));
            break;
        case ToolKind::Selection:
            if (m_moving_selection && m_editor.ValidRegion())
            {
                const Rect sel = *m_editor.ValidRegion();
                if (p != a)
                    out.Push(Command::MoveSelection(Point{sel.x + p.x - a.x, sel.y + p.y - a.y}));
            }
            else
            {
                out.Push(Command::SetSelection(Rect::FromCorners(a.x, a.y, p.x, p.y)));
            }
            m_moving_selection = false;
            break;
        default:
            break;
    }
}
} // namespace pix
