#include "core/editor.h"

#include "core/pixel_surface.h"

#include <algorithm>
#include <cstdio>
#include <iterator>
#include <utility>

namespace pix
{
namespace
{
static std::optional<std::size_t> FirstLayerOf(const EditorOp& op)
{
    if (const auto* l = op.As<editor_op::LayerImageOp>())
        return l->layer;
    if (const auto* seq = op.As<editor_op::Sequential>())
    {
        for (const EditorOp& child : seq->ops)
        {
            if (auto layer = FirstLayerOf(child))
                return layer;
        }
    }
    return std::nullopt;
}
} // namespace

Editor::Editor()
    : Editor(EditorImage(1, 1))
{
}

Editor::Editor(EditorImage image)
{
    Reset(std::move(image));
}

void Editor::Reset(EditorImage image)
{
    m_image = std::move(image);
    if (m_image.LiveLayerCount() == 0)
        m_image.AddLayer();
    m_active_layer = m_image.FirstLiveLayer().value_or(0);
    m_undo_stack.clear();
    m_redo_stack.clear();
    m_stroke_open = false;
    m_valid_region.reset();
    Touch(Rect{0, 0, m_image.Width(), m_image.Height()});
}

void Editor::Touch(const Rect& dirty)
{
    ++m_revision;
    m_dirty = m_dirty.Union(dirty);
}

Rect Editor::TakeDirtyRect()
{
    const Rect r = m_dirty;
    m_dirty = Rect{};
    return r;
}

void Editor::SetUndoLimit(std::size_t limit)
{
    m_undo_limit = limit;
    TrimUndoStack();
}

void Editor::TrimUndoStack()
{
    if (m_undo_limit == 0 || m_stroke_open)
        return;
    if (m_undo_stack.size() > m_undo_limit)
        m_undo_stack.erase(m_undo_stack.begin(),
                           m_undo_stack.begin() + (std::ptrdiff_t)(m_undo_stack.size() - m_undo_limit));
}

std::optional<std::string> Editor::UndoLabel() const
{
    if (m_undo_stack.empty())
        return std::nullopt;
    return m_undo_stack.back().applied.Label();
}

std::optional<std::string> Editor::RedoLabel() const
{
    if (m_redo_stack.empty())
        return std::nullopt;
    return m_redo_stack.back().Label();
}

void Editor::StampValidRegion(EditorOp& op) const
{
    if (auto* l = op.As<editor_op::LayerImageOp>())
    {
        if (!l->valid_region)
            l->valid_region = m_valid_region;
        return;
    }
    if (auto* seq = op.As<editor_op::Sequential>())
    {
        for (EditorOp& child : seq->ops)
            StampValidRegion(child);
    }
}

// ---------------------------------------------------------------------------
// Execution
// ---------------------------------------------------------------------------

bool Editor::ExecuteLayerImageOp(const editor_op::LayerImageOp& op, std::optional<EditorOp>& inverse,
                                 bool compute_inverse)
{
    Layer* layer = m_image.GetLayer(op.layer);
    if (!layer)
    {
        std::fprintf(stderr, "[editor] image op targets missing layer %zu (layer count %zu)\n",
                     op.layer, m_image.LayerCount());
        return false;
    }

    ImageSurface surface(layer->image);
    std::optional<ImageOp> image_inverse;
    if (op.valid_region)
    {
        RegionMaskedSurface masked(surface, *op.valid_region);
        image_inverse = op.op.Apply(masked, compute_inverse);
    }
    else
    {
        image_inverse = op.op.Apply(surface, compute_inverse);
    }

    if (surface.HasPendingWrites())
        Touch(surface.Commit());

    if (image_inverse)
        inverse = EditorOp(editor_op::LayerImageOp{op.layer, std::move(*image_inverse), op.valid_region});
    return true;
}

bool Editor::Execute(const EditorOp& op, std::optional<EditorOp>& inverse, bool compute_inverse)
{
    inverse.reset();
    const Rect all{0, 0, m_image.Width(), m_image.Height()};

    switch (op.GetKind())
    {
        case EditorOp::Kind::LayerImageOp:
            return ExecuteLayerImageOp(std::get<editor_op::LayerImageOp>(op.GetPayload()), inverse, compute_inverse);

        case EditorOp::Kind::SetLayerState:
        {
            const auto& o = std::get<editor_op::SetLayerState>(op.GetPayload());
            const Layer* layer = m_image.GetLayer(o.layer);
            if (!layer)
            {
                std::fprintf(stderr, "[editor] set layer %s: invalid layer %zu\n",
                             LayerStateToString(o.state), o.layer);
                return false;
            }
            if (o.state == LayerState::Deleted && layer->IsLive())
            {
                if (o.layer == m_active_layer)
                {
                    std::fprintf(stderr, "[editor] refusing to delete the active layer %zu\n", o.layer);
                    return false;
                }
                if (m_image.LiveLayerCount() <= 1)
                {
                    std::fprintf(stderr, "[editor] refusing to delete the last layer\n");
                    return false;
                }
            }
            const LayerState old = layer->state;
            if (old == o.state)
                return true;
            m_image.SetLayerState(o.layer, o.state);
            Touch(all);
            if (compute_inverse)
                inverse = EditorOp(editor_op::SetLayerState{o.layer, old});
            return true;
        }

        case EditorOp::Kind::SetActiveLayer:
        {
            const auto& o = std::get<editor_op::SetActiveLayer>(op.GetPayload());
            const Layer* layer = m_image.GetLayer(o.layer);
            if (!layer || !layer->IsLive())
            {
                std::fprintf(stderr, "[editor] cannot activate layer %zu\n", o.layer);
                return false;
            }
            if (o.layer == m_active_layer)
                return true;
            const std::size_t old = m_active_layer;
            m_active_layer = o.layer;
            ++m_revision;
            if (compute_inverse)
                inverse = EditorOp(editor_op::SetActiveLayer{old});
            return true;
        }

        case EditorOp::Kind::AddLayer:
        case EditorOp::Kind::DuplicateLayer:
        {
            const bool duplicate = op.GetKind() == EditorOp::Kind::DuplicateLayer;
            std::size_t index = 0;
            std::size_t source = 0;
            if (duplicate)
            {
                const auto& o = std::get<editor_op::DuplicateLayer>(op.GetPayload());
                index = o.layer;
                source = o.source;
            }
            else
            {
                index = std::get<editor_op::AddLayer>(op.GetPayload()).layer;
            }

            if (index == m_image.LayerCount())
            {
                if (duplicate)
                {
                    if (!m_image.DuplicateLayer(source))
                    {
                        std::fprintf(stderr, "[editor] cannot duplicate layer %zu\n", source);
                        return false;
                    }
                }
                else
                {
                    m_image.AddLayer();
                }
            }
            else if (index < m_image.LayerCount() && m_image.GetLayer(index)->state == LayerState::Deleted)
            {
                // Redo of an undone add: revive the soft-deleted layer.
                m_image.SetLayerState(index, LayerState::Visible);
            }
            else
            {
                std::fprintf(stderr, "[editor] cannot create layer at index %zu (layer count %zu)\n",
                             index, m_image.LayerCount());
                return false;
            }
            Touch(all);
            if (compute_inverse)
                inverse = EditorOp(editor_op::SetLayerState{index, LayerState::Deleted});
            return true;
        }

        case EditorOp::Kind::SetImage:
        {
            const auto& o = std::get<editor_op::SetImage>(op.GetPayload());
            if (o.image.LiveLayerCount() == 0)
            {
                std::fprintf(stderr, "[editor] replacement image has no layers\n");
                return false;
            }
            std::size_t active = o.active_layer.value_or(m_active_layer);
            const Layer* layer = o.image.GetLayer(active);
            if (!layer || !layer->IsLive())
                active = *o.image.FirstLiveLayer();

            if (compute_inverse)
                inverse = EditorOp(editor_op::SetImage{m_image, m_active_layer});
            const Rect old_bounds = all;
            m_image = o.image;
            m_active_layer = active;
            Touch(old_bounds.Union(Rect{0, 0, m_image.Width(), m_image.Height()}));
            return true;
        }

        case EditorOp::Kind::Sequential:
        {
            const auto& o = std::get<editor_op::Sequential>(op.GetPayload());
            std::vector<EditorOp> inverses;
            for (const EditorOp& child : o.ops)
            {
                std::optional<EditorOp> child_inverse;
                if (!Execute(child, child_inverse, compute_inverse))
                {
                    if (!compute_inverse)
                    {
                        std::fprintf(stderr, "[editor] %s failed part way through\n", op.KindName());
                        return false;
                    }
                    // Roll back what already ran.
                    for (auto it = inverses.rbegin(); it != inverses.rend(); ++it)
                    {
                        std::optional<EditorOp> ignored;
                        if (!Execute(*it, ignored, false))
                            std::fprintf(stderr, "[editor] rollback of %s failed\n", it->KindName());
                    }
                    return false;
                }
                if (child_inverse)
                    inverses.push_back(std::move(*child_inverse));
            }
            if (!inverses.empty())
            {
                std::reverse(inverses.begin(), inverses.end());
                inverse = EditorOp(editor_op::Sequential{std::move(inverses), o.label});
            }
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// History
// ---------------------------------------------------------------------------

bool Editor::ApplyEditorOp(EditorOp op)
{
    StampValidRegion(op);
    const bool ok = InternalApply(std::move(op));
    if (!ok)
        return false;
    m_redo_stack.clear();
    TrimUndoStack();
    return true;
}

bool Editor::ApplyImageOp(ImageOp op)
{
    return ApplyEditorOp(EditorOp::ForLayer(m_active_layer, std::move(op)));
}

bool Editor::InternalApply(EditorOp&& op)
{
    const bool begin_draw = op.IsMarker(MarkerKind::BeginDraw);
    const bool end_draw = op.IsMarker(MarkerKind::EndDraw);

    std::optional<EditorOp> inverse;
    if (!Execute(op, inverse))
        return false;

    if (inverse)
    {
        m_undo_stack.push_back(HistoryEntry{std::move(op), std::move(*inverse)});
    }
    else if (begin_draw)
    {
        // Keep an anchor for strokes whose first dab landed outside the writable area.
        const std::size_t layer = FirstLayerOf(op).value_or(m_active_layer);
        const auto* l = op.As<editor_op::LayerImageOp>();
        const std::optional<Rect> region = l ? l->valid_region : m_valid_region;
        m_undo_stack.push_back(HistoryEntry{std::move(op), EditorOp(editor_op::LayerImageOp{layer, ImageOp{}, region})});
    }

    if (begin_draw)
        m_stroke_open = true;
    if (end_draw)
    {
        MergeDrawOperations();
        m_stroke_open = false;
    }
    return true;
}

void Editor::MergeDrawOperations()
{
    // Locate the newest entry that opened a stroke.
    std::optional<std::size_t> begin;
    for (std::size_t i = m_undo_stack.size(); i-- > 0;)
    {
        const auto* l = m_undo_stack[i].applied.As<editor_op::LayerImageOp>();
        if (l && l->op.IsMarker(MarkerKind::BeginDraw))
        {
            begin = i;
            break;
        }
    }
    if (!begin)
        return;

    // Drain the contiguous run of edits on the same layer.
    const std::size_t layer = m_undo_stack[*begin].applied.As<editor_op::LayerImageOp>()->layer;
    std::size_t end = *begin + 1;
    while (end < m_undo_stack.size())
    {
        const auto* l = m_undo_stack[end].applied.As<editor_op::LayerImageOp>();
        if (!l || l->layer != layer)
            break;
        ++end;
    }

    std::vector<HistoryEntry> run(std::make_move_iterator(m_undo_stack.begin() + (std::ptrdiff_t)*begin),
                                  std::make_move_iterator(m_undo_stack.begin() + (std::ptrdiff_t)end));
    m_undo_stack.erase(m_undo_stack.begin() + (std::ptrdiff_t)*begin, m_undo_stack.begin() + (std::ptrdiff_t)end);

    // Reinsert one pair.
    const std::optional<std::string> label = run.front().applied.As<editor_op::LayerImageOp>()->op.Label();
    const std::optional<Rect> region = run.front().applied.As<editor_op::LayerImageOp>()->valid_region;
    bool same_region = true;
    bool changed = false;
    for (const HistoryEntry& e : run)
    {
        const auto* fwd = e.applied.As<editor_op::LayerImageOp>();
        const auto* inv = e.inverse.As<editor_op::LayerImageOp>();
        same_region = same_region && fwd->valid_region == region;
        changed = changed || (inv && !inv->op.IsEmpty());
    }
    if (!changed)
        return;

    if (same_region)
    {
        std::vector<ImageOp> forwards;
        std::vector<ImageOp> inverses;
        for (HistoryEntry& e : run)
        {
            ImageOp fwd = e.applied.As<editor_op::LayerImageOp>()->op.RemoveMarkers();
            if (!fwd.IsEmpty())
                forwards.push_back(std::move(fwd));
            auto* inv = e.inverse.As<editor_op::LayerImageOp>();
            if (inv && !inv->op.IsEmpty())
                inverses.push_back(std::move(inv->op));
        }
        std::reverse(inverses.begin(), inverses.end());

        HistoryEntry merged{
            EditorOp(editor_op::LayerImageOp{layer, ImageOp::Seq(std::move(forwards), label), region}),
            EditorOp(editor_op::LayerImageOp{layer, ImageOp::Seq(std::move(inverses), label), region}),
        };
        m_undo_stack.insert(m_undo_stack.begin() + (std::ptrdiff_t)*begin, std::move(merged));
        return;
    }

    // The valid region changed mid-stroke: keep each edit under its own region.
    std::vector<EditorOp> forwards;
    std::vector<EditorOp> inverses;
    for (HistoryEntry& e : run)
    {
        auto* fwd = e.applied.As<editor_op::LayerImageOp>();
        ImageOp stripped = fwd->op.RemoveMarkers();
        if (!stripped.IsEmpty())
            forwards.push_back(EditorOp(editor_op::LayerImageOp{layer, std::move(stripped), fwd->valid_region}));
        auto* inv = e.inverse.As<editor_op::LayerImageOp>();
        if (inv && !inv->op.IsEmpty())
            inverses.push_back(std::move(e.inverse));
    }
    std::reverse(inverses.begin(), inverses.end());
    m_undo_stack.insert(m_undo_stack.begin() + (std::ptrdiff_t)*begin,
                        HistoryEntry{EditorOp::Seq(std::move(forwards), label), EditorOp::Seq(std::move(inverses), label)});
}

bool Editor::Undo()
{
    if (m_undo_stack.empty())
        return false;

    HistoryEntry entry = std::move(m_undo_stack.back());
    m_undo_stack.pop_back();

    std::optional<EditorOp> ignored;
    if (!Execute(entry.inverse, ignored, false))
    {
        std::fprintf(stderr, "[editor] undo of %s failed\n", entry.applied.KindName());
        m_undo_stack.push_back(std::move(entry));
        return false;
    }
    m_redo_stack.push_back(std::move(entry.applied));
    return true;
}

bool Editor::Redo()
{
    if (m_redo_stack.empty())
        return false;

    if (!InternalApply(std::move(m_redo_stack.back())))
    {
        std::fprintf(stderr, "[editor] redo failed\n");
        return false;
    }
    m_redo_stack.pop_back();
    TrimUndoStack();
    return true;
}

// ---------------------------------------------------------------------------
// Layer and canvas commands
// ---------------------------------------------------------------------------

bool Editor::AddLayer()
{
    const std::size_t index = m_image.LayerCount();
    return ApplyEditorOp(EditorOp::Seq({editor_op::AddLayer{index}, editor_op::SetActiveLayer{index}}, "New Layer"));
}

bool Editor::DuplicateActiveLayer()
{
    const Layer* layer = m_image.GetLayer(m_active_layer);
    if (!layer || layer->state != LayerState::Visible)
    {
        std::fprintf(stderr, "[editor] only visible layers can be duplicated\n");
        return false;
    }
    const std::size_t index = m_image.LayerCount();
    return ApplyEditorOp(EditorOp::Seq({editor_op::DuplicateLayer{m_active_layer, index},
                                        editor_op::SetActiveLayer{index}},
                                       "Duplicate Layer"));
}

bool Editor::DeleteLayer(std::size_t layer)
{
    const Layer* l = m_image.GetLayer(layer);
    if (!l || !l->IsLive())
    {
        std::fprintf(stderr, "[editor] delete: invalid layer %zu\n", layer);
        return false;
    }
    const std::optional<std::size_t> other = m_image.FirstLiveLayer(layer);
    if (!other)
    {
        std::fprintf(stderr, "[editor] refusing to delete the last layer\n");
        return false;
    }

    std::vector<EditorOp> ops;
    if (layer == m_active_layer)
        ops.push_back(editor_op::SetActiveLayer{*other});
    ops.push_back(editor_op::SetLayerState{layer, LayerState::Deleted});
    return ApplyEditorOp(EditorOp::Seq(std::move(ops), "Delete Layer"));
}

bool Editor::SetActiveLayer(std::size_t layer)
{
    if (layer == m_active_layer)
        return true;
    return ApplyEditorOp(editor_op::SetActiveLayer{layer});
}

bool Editor::SetLayerVisible(std::size_t layer, bool visible)
{
    const Layer* l = m_image.GetLayer(layer);
    if (!l || !l->IsLive())
    {
        std::fprintf(stderr, "[editor] visibility: invalid layer %zu\n", layer);
        return false;
    }
    const LayerState state = visible ? LayerState::Visible : LayerState::Hidden;
    if (l->state == state)
        return true;
    return ApplyEditorOp(editor_op::SetLayerState{layer, state});
}

bool Editor::ResizeImage(int width, int height)
{
    EditorImage next = m_image;
    if (!next.Resize(width, height))
    {
        std::fprintf(stderr, "[editor] invalid image size %dx%d\n", width, height);
        return false;
    }
    return ReplaceImage(std::move(next));
}

bool Editor::ResizeCanvas(int width, int height)
{
    EditorImage next = m_image;
    if (!next.ResizeCanvas(width, height))
    {
        std::fprintf(stderr, "[editor] invalid canvas size %dx%d\n", width, height);
        return false;
    }
    return ReplaceImage(std::move(next));
}

bool Editor::ReplaceImage(EditorImage image)
{
    return ApplyEditorOp(editor_op::SetImage{std::move(image), m_active_layer});
}
} // namespace pix
