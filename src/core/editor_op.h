// Canvas-level edits recorded in the editor history. Pixel edits are wrapped in a
// LayerImageOp that names the target layer and the valid region in force when the
// edit was first applied.
#pragma once

#include "core/editor_image.h"
#include "core/image_op.h"
#include "core/rect.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace pix
{
class EditorOp;

namespace editor_op
{
struct LayerImageOp
{
    std::size_t         layer = 0;
    ImageOp             op;
    std::optional<Rect> valid_region;
};

struct SetLayerState
{
    std::size_t layer = 0;
    LayerState  state = LayerState::Visible;
};

struct SetActiveLayer
{
    std::size_t layer = 0;
};

// `layer` == LayerCount() appends a new layer; an existing Deleted layer at `layer`
// is revived instead (redo of an undone add).
struct AddLayer
{
    std::size_t layer = 0;
};

// Same index rule as AddLayer; a new layer is a copy of `source`.
struct DuplicateLayer
{
    std::size_t source = 0;
    std::size_t layer = 0;
};

// Replaces the whole canvas (new image, resize, canvas resize).
struct SetImage
{
    EditorImage                image;
    std::optional<std::size_t> active_layer;
};

struct Sequential
{
    std::vector<EditorOp>      ops;
    std::optional<std::string> label;
};
} // namespace editor_op

class EditorOp
{
public:
    enum class Kind : std::uint8_t
    {
        LayerImageOp = 0,
        SetLayerState,
        SetActiveLayer,
        AddLayer,
        DuplicateLayer,
        SetImage,
        Sequential,
    };

    using Payload = std::variant<editor_op::LayerImageOp,
                                 editor_op::SetLayerState,
                                 editor_op::SetActiveLayer,
                                 editor_op::AddLayer,
                                 editor_op::DuplicateLayer,
                                 editor_op::SetImage,
                                 editor_op::Sequential>;

    EditorOp() = default;

    template <typename T,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, EditorOp> &&
                                          std::is_constructible_v<Payload, T>>>
    EditorOp(T&& payload) : m_payload(std::forward<T>(payload))
    {
    }

    static EditorOp ForLayer(std::size_t layer, ImageOp op)
    {
        return EditorOp(editor_op::LayerImageOp{layer, std::move(op), std::nullopt});
    }
    static EditorOp Seq(std::vector<EditorOp> ops, std::optional<std::string> label = std::nullopt)
    {
        return EditorOp(editor_op::Sequential{std::move(ops), std::move(label)});
    }

    Kind GetKind() const { return (Kind)m_payload.index(); }

    template <typename T>
    const T* As() const { return std::get_if<T>(&m_payload); }
    template <typename T>
    T* As() { return std::get_if<T>(&m_payload); }

    const Payload& GetPayload() const { return m_payload; }

    // True if this is (or contains) a layer edit holding a marker of `kind`.
    bool IsMarker(MarkerKind kind) const;

    // Layer edits: the wrapped image op's label. Otherwise the Sequential label or a
    // fixed description of the edit.
    std::optional<std::string> Label() const;

    const char* KindName() const;

private:
    Payload m_payload;
};
} // namespace pix
