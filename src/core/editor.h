// Undo/redo engine.
//
// The Editor owns the canvas and a linear history of (applied, inverse) pairs. Every
// edit goes through ApplyEditorOp(); undo applies the stored inverse, redo re-runs
// the normal apply path and records a fresh inverse. Freehand strokes bracketed by
// BeginDraw/EndDraw markers are coalesced into a single history entry.
#pragma once

#include "core/editor_image.h"
#include "core/editor_op.h"
#include "core/image_op.h"
#include "core/rect.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pix
{
struct HistoryEntry
{
    EditorOp applied;
    EditorOp inverse;
};

class Editor
{
public:
    Editor();
    explicit Editor(EditorImage image);

    const EditorImage& Image() const { return m_image; }
    std::size_t        ActiveLayer() const { return m_active_layer; }

    // Applies `op`, records its inverse and clears the redo stack. Layer edits that
    // carry no valid region are stamped with the current one. Returns false (and logs)
    // when the op names an invalid layer; the canvas is left unchanged in that case.
    bool ApplyEditorOp(EditorOp op);
    // ApplyEditorOp() on the active layer.
    bool ApplyImageOp(ImageOp op);

    bool Undo();
    bool Redo();

    // Layer commands. Each one is a single undoable history entry.
    bool AddLayer();
    bool DuplicateActiveLayer();
    bool DeleteLayer(std::size_t layer);
    bool SetActiveLayer(std::size_t layer);
    bool SetLayerVisible(std::size_t layer, bool visible);

    // Whole-canvas commands (undoable).
    bool ResizeImage(int width, int height);
    bool ResizeCanvas(int width, int height);
    bool ReplaceImage(EditorImage image);

    // Starts over with `image`; history is discarded.
    void Reset(EditorImage image);

    // Writes of subsequent edits are confined to `region` (nullopt = whole layer).
    void                       SetValidRegion(std::optional<Rect> region) { m_valid_region = region; }
    const std::optional<Rect>& ValidRegion() const { return m_valid_region; }

    bool                       CanUndo() const { return !m_undo_stack.empty(); }
    bool                       CanRedo() const { return !m_redo_stack.empty(); }
    std::size_t                UndoCount() const { return m_undo_stack.size(); }
    std::size_t                RedoCount() const { return m_redo_stack.size(); }
    std::optional<std::string> UndoLabel() const;
    std::optional<std::string> RedoLabel() const;

    const std::vector<HistoryEntry>& UndoStack() const { return m_undo_stack; }

    // 0 = unlimited. The oldest entries are trimmed, never while a stroke is open.
    std::size_t GetUndoLimit() const { return m_undo_limit; }
    void        SetUndoLimit(std::size_t limit);

    bool IsStrokeOpen() const { return m_stroke_open; }

    // Incremented whenever canvas content or layer structure changes.
    std::uint64_t ContentRevision() const { return m_revision; }
    // Union of pixel rectangles written since the last call; resets it.
    Rect TakeDirtyRect();

private:
    // Executes `op` against the canvas. With `compute_inverse` the inverse is stored in
    // `inverse` (if anything changed) and a failed Sequential rolls back the children it
    // already applied.
    bool Execute(const EditorOp& op, std::optional<EditorOp>& inverse, bool compute_inverse = true);
    bool ExecuteLayerImageOp(const editor_op::LayerImageOp& op, std::optional<EditorOp>& inverse,
                             bool compute_inverse);

    // Leaves `op` untouched when it is refused.
    bool InternalApply(EditorOp&& op);
    void MergeDrawOperations();
    void TrimUndoStack();
    void StampValidRegion(EditorOp& op) const;
    void Touch(const Rect& dirty);

    EditorImage               m_image;
    std::size_t               m_active_layer = 0;
    std::vector<HistoryEntry> m_undo_stack;
    std::vector<EditorOp>     m_redo_stack;
    std::size_t               m_undo_limit = 0;
    std::optional<Rect>       m_valid_region;
    bool                      m_stroke_open = false;
    std::uint64_t             m_revision = 0;
    Rect                      m_dirty;
};
} // namespace pix
