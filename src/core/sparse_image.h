#pragma once

#include "core/color.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace pix
{
// Map from touched pixel coordinate to a colour. Used as the undo payload of sparse
// drawing operations: the first colour inserted for a coordinate wins.
class SparseImage
{
public:
    // Records `c` at (x, y) unless the coordinate is already present.
    // Returns true if the pixel was newly recorded.
    bool Insert(int x, int y, const Color& c)
    {
        return m_pixels.emplace(Key(x, y), c).second;
    }

    bool Contains(int x, int y) const { return m_pixels.find(Key(x, y)) != m_pixels.end(); }

    std::optional<Color> Get(int x, int y) const
    {
        auto it = m_pixels.find(Key(x, y));
        if (it == m_pixels.end())
            return std::nullopt;
        return it->second;
    }

    std::size_t Size() const { return m_pixels.size(); }
    bool        Empty() const { return m_pixels.empty(); }

    // fn(x, y, color) for every recorded pixel, in unspecified order.
    template <typename Fn>
    void ForEach(Fn&& fn) const
    {
        for (const auto& [key, c] : m_pixels)
            fn((int)(std::int32_t)(key >> 32), (int)(std::int32_t)(key & 0xffffffffu), c);
    }

private:
    static std::uint64_t Key(int x, int y)
    {
        return ((std::uint64_t)(std::uint32_t)x << 32) | (std::uint64_t)(std::uint32_t)y;
    }

    std::unordered_map<std::uint64_t, Color> m_pixels;
};

// Dense width x height grid of optional colours anchored at an origin chosen by the
// owning operation. Used as the undo payload of flood fills.
class OptionalImage
{
public:
    OptionalImage() = default;
    OptionalImage(int width, int height)
        : m_width(width > 0 ? width : 0)
        , m_height(height > 0 ? height : 0)
        , m_colors((std::size_t)m_width * (std::size_t)m_height)
        , m_present((std::size_t)m_width * (std::size_t)m_height, 0)
    {
    }

    int Width() const { return m_width; }
    int Height() const { return m_height; }

    // First write wins; later writes to the same cell are ignored.
    bool SetIfAbsent(int x, int y, const Color& c)
    {
        if (x < 0 || y < 0 || x >= m_width || y >= m_height)
            return false;
        const std::size_t i = (std::size_t)y * (std::size_t)m_width + (std::size_t)x;
        if (m_present[i])
            return false;
        m_present[i] = 1;
        m_colors[i] = c;
        ++m_count;
        return true;
    }

    std::optional<Color> Get(int x, int y) const
    {
        if (x < 0 || y < 0 || x >= m_width || y >= m_height)
            return std::nullopt;
        const std::size_t i = (std::size_t)y * (std::size_t)m_width + (std::size_t)x;
        if (!m_present[i])
            return std::nullopt;
        return m_colors[i];
    }

    std::size_t Count() const { return m_count; }

private:
    int                       m_width = 0;
    int                       m_height = 0;
    std::vector<Color>        m_colors;
    std::vector<std::uint8_t> m_present;
    std::size_t               m_count = 0;
};
} // namespace pix
