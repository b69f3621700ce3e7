#pragma once

#include "core/color.h"
#include "core/image_format.h"
#include "core/rgba_image.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pix
{
// Layers are never physically removed, only marked Deleted, so layer indices stored in
// history stay valid for the lifetime of the canvas.
enum class LayerState : std::uint8_t
{
    Visible = 0,
    Hidden,
    Deleted,
};

inline constexpr const char* LayerStateToString(LayerState s)
{
    switch (s)
    {
        case LayerState::Visible: return "visible";
        case LayerState::Hidden:  return "hidden";
        case LayerState::Deleted: return "deleted";
    }
    return "visible";
}

struct Layer
{
    LayerState state = LayerState::Visible;
    RgbaImage  image;

    bool IsLive() const { return state != LayerState::Deleted; }
    bool operator==(const Layer& o) const = default;
};

// Multi-layer canvas. All layers share the canvas dimensions.
class EditorImage
{
public:
    EditorImage() = default;
    // Single layer filled with `background`.
    EditorImage(int width, int height, const Color& background = kTransparent);

    // Canvas whose only layer is `image` (e.g. a freshly loaded file).
    static EditorImage FromRgba(std::string path, RgbaImage image, ImageFormatInfo format = {});

    bool operator==(const EditorImage& o) const = default;

    int  Width() const { return m_width; }
    int  Height() const { return m_height; }
    bool IsEmpty() const { return m_width <= 0 || m_height <= 0; }

    const std::vector<Layer>& Layers() const { return m_layers; }
    std::size_t               LayerCount() const { return m_layers.size(); }

    // nullptr when out of range.
    Layer*       GetLayer(std::size_t index);
    const Layer* GetLayer(std::size_t index) const;

    // Appends a transparent canvas-sized layer; returns its index.
    std::size_t AddLayer();
    // Appends a copy of a Visible layer; nullopt if `source` is missing or not Visible.
    std::optional<std::size_t> DuplicateLayer(std::size_t source);

    bool SetLayerState(std::size_t index, LayerState state);

    // Lowest-index non-Deleted layer, optionally skipping `except`.
    std::optional<std::size_t> FirstLiveLayer(std::optional<std::size_t> except = std::nullopt) const;
    std::size_t                LiveLayerCount() const;
    std::size_t                VisibleLayerCount() const;

    // Composites Visible layers bottom to top onto a transparent buffer.
    RgbaImage Flatten() const;

    // Resamples every layer to the new size (triangle filter).
    bool Resize(int width, int height);
    // Crops or pads every layer; the overlap (anchored top-left) is kept verbatim and
    // exposed area is transparent.
    bool ResizeCanvas(int width, int height);

    const std::string&     Path() const { return m_path; }
    void                   SetPath(std::string path) { m_path = std::move(path); }
    const ImageFormatInfo& Format() const { return m_format; }
    void                   SetFormat(const ImageFormatInfo& f) { m_format = f; }

private:
    int                m_width = 0;
    int                m_height = 0;
    std::vector<Layer> m_layers;
    std::string        m_path;
    ImageFormatInfo    m_format;
};
} // namespace pix
