#include "core/editor_image.h"

#include "core/raster/resample.h"

#include <algorithm>
#include <cstring>
#include <utility>

namespace pix
{
EditorImage::EditorImage(int width, int height, const Color& background)
    : m_width(std::max(0, width))
    , m_height(std::max(0, height))
{
    Layer layer;
    layer.image = RgbaImage(m_width, m_height);
    if (background != kTransparent)
        layer.image.Fill(background);
    m_layers.push_back(std::move(layer));
}

EditorImage EditorImage::FromRgba(std::string path, RgbaImage image, ImageFormatInfo format)
{
    EditorImage out;
    out.m_width = image.Width();
    out.m_height = image.Height();
    out.m_path = std::move(path);
    out.m_format = format;
    Layer layer;
    layer.image = std::move(image);
    out.m_layers.push_back(std::move(layer));
    return out;
}

Layer* EditorImage::GetLayer(std::size_t index)
{
    return index < m_layers.size() ? &m_layers[index] : nullptr;
}

const Layer* EditorImage::GetLayer(std::size_t index) const
{
    return index < m_layers.size() ? &m_layers[index] : nullptr;
}

std::size_t EditorImage::AddLayer()
{
    Layer layer;
    layer.image = RgbaImage(m_width, m_height);
    m_layers.push_back(std::move(layer));
    return m_layers.size() - 1;
}

std::optional<std::size_t> EditorImage::DuplicateLayer(std::size_t source)
{
    if (source >= m_layers.size() || m_layers[source].state != LayerState::Visible)
        return std::nullopt;
    Layer copy = m_layers[source];
    m_layers.push_back(std::move(copy));
    return m_layers.size() - 1;
}

bool EditorImage::SetLayerState(std::size_t index, LayerState state)
{
    if (index >= m_layers.size())
        return false;
    m_layers[index].state = state;
    return true;
}

std::optional<std::size_t> EditorImage::FirstLiveLayer(std::optional<std::size_t> except) const
{
    for (std::size_t i = 0; i < m_layers.size(); ++i)
    {
        if (except && *except == i)
            continue;
        if (m_layers[i].IsLive())
            return i;
    }
    return std::nullopt;
}

std::size_t EditorImage::LiveLayerCount() const
{
    return (std::size_t)std::count_if(m_layers.begin(), m_layers.end(), [](const Layer& l) { return l.IsLive(); });
}

std::size_t EditorImage::VisibleLayerCount() const
{
    return (std::size_t)std::count_if(m_layers.begin(), m_layers.end(),
                                      [](const Layer& l) { return l.state == LayerState::Visible; });
}

RgbaImage EditorImage::Flatten() const
{
    RgbaImage out(m_width, m_height);
    for (const Layer& layer : m_layers)
    {
        if (layer.state != LayerState::Visible)
            continue;
        const int w = std::min(m_width, layer.image.Width());
        const int h = std::min(m_height, layer.image.Height());
        for (int y = 0; y < h; ++y)
        {
            for (int x = 0; x < w; ++x)
            {
                const Color src = layer.image.GetPixel(x, y);
                if (src.a == 0)
                    continue;
                out.PutPixel(x, y, color::BlendOver(out.GetPixel(x, y), src));
            }
        }
    }
    return out;
}

bool EditorImage::Resize(int width, int height)
{
    if (width <= 0 || height <= 0)
        return false;
    for (Layer& layer : m_layers)
        layer.image = raster::ResampleTriangle(layer.image, width, height);
    m_width = width;
    m_height = height;
    return true;
}

bool EditorImage::ResizeCanvas(int width, int height)
{
    if (width <= 0 || height <= 0)
        return false;

    const int copy_w = std::min(width, m_width);
    const int copy_h = std::min(height, m_height);
    for (Layer& layer : m_layers)
    {
        RgbaImage next(width, height);
        if (copy_w > 0 && copy_h > 0 && !layer.image.IsEmpty())
        {
            const auto& src = layer.image.Bytes();
            auto&       dst = next.MutableBytes();
            for (int y = 0; y < copy_h; ++y)
            {
                std::memcpy(dst.data() + (std::size_t)y * (std::size_t)width * 4u,
                            src.data() + (std::size_t)y * (std::size_t)layer.image.Width() * 4u,
                            (std::size_t)copy_w * 4u);
            }
        }
        layer.image = std::move(next);
    }
    m_width = width;
    m_height = height;
    return true;
}
} // namespace pix
