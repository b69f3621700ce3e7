#pragma once

#include "app/command_queue.h"
#include "app/tools.h"
#include "core/editor.h"
#include "core/settings.h"

#include <cstddef>
#include <optional>

namespace pix
{
// Session state plus the per-frame command pump. Pointer handlers translate
// image-space input into commands; Drain() feeds queued commands to the editor.
class CommandProcessor
{
public:
    explicit CommandProcessor(const EditorSettings& settings = {});

    // Processes every queued command in FIFO order; returns the number processed.
    std::size_t Drain(CommandQueue& queue);

    // Runs one command. False when the editor refused it.
    bool Execute(Command& c);

    void PointerDown(Point p, bool secondary, CommandQueue& out);
    void PointerMove(Point p, CommandQueue& out);
    void PointerUp(Point p, CommandQueue& out);

    Editor&               GetEditor() { return m_editor; }
    const Editor&         GetEditor() const { return m_editor; }
    const EditorSettings& Settings() const { return m_settings; }
    ToolKind              ActiveTool() const { return m_tool; }
    const Color&          PrimaryColor() const { return m_primary; }
    const Color&          SecondaryColor() const { return m_secondary; }
    const RgbaImage&      Clipboard() const { return m_clipboard; }

private:
    StrokeTool* ActiveStrokeTool();
    void        SelectTool(ToolKind tool);
    bool        EditSelection(const Command& c);
    // Applies `op` with the valid region lifted, then selects `selection_after`.
    bool        ApplyUnmasked(ImageOp op, std::optional<Rect> selection_after);

    Editor         m_editor;
    EditorSettings m_settings;
    ToolKind       m_tool = ToolKind::Pencil;
    Color          m_primary;
    Color          m_secondary;

    PencilTool      m_pencil;
    EraserTool      m_eraser;
    BlockPencilTool m_block_pencil;

    // Anchor of a shape drag (line, rectangle, circle, gradient).
    std::optional<Point> m_anchor;
    Color                m_shape_color;
    // Selection tool drag started inside the current selection.
    bool                 m_moving_selection = false;

    RgbaImage m_clipboard;
};
} // namespace pix
