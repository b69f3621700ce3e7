#include "core/color.h"

namespace pix::color
{
bool ParseHex(std::string_view s, Color& out)
{
    if (!s.empty() && s[0] == '#')
        s.remove_prefix(1);
    if (s.size() != 6 && s.size() != 8)
        return false;

    auto nyb = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
        if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
        return -1;
    };
    auto byte_at = [&](size_t i) -> int {
        const int hi = nyb(s[i + 0]);
        const int lo = nyb(s[i + 1]);
        if (hi < 0 || lo < 0)
            return -1;
        return (hi << 4) | lo;
    };

    const int r = byte_at(0);
    const int g = byte_at(2);
    const int b = byte_at(4);
    const int a = (s.size() == 8) ? byte_at(6) : 255;
    if (r < 0 || g < 0 || b < 0 || a < 0)
        return false;

    out = Color{(std::uint8_t)r, (std::uint8_t)g, (std::uint8_t)b, (std::uint8_t)a};
    return true;
}

std::string ToHex(const Color& c)
{
    static const char* k = "0123456789ABCDEF";
    std::string s = "#";
    for (std::uint8_t v : {c.r, c.g, c.b, c.a})
    {
        s.push_back(k[(v >> 4) & 0xFu]);
        s.push_back(k[v & 0xFu]);
    }
    return s;
}
} // namespace pix::color
