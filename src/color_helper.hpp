#pragma once
#include <imgui.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>

namespace color
{
    enum class Color : uint8_t {
        Default = 0,
        Red, Green, Blue, Yellow, Cyan, Magenta, Orange, Slate, Gray, White
    };

    inline const char* color_to_hex(Color c)
    {
        switch (c)
        {
            case Color::White:   return "#F1F0F2";
            case Color::Red:     return "#D53E3E";
            case Color::Green:   return "#16A34A";
            case Color::Blue:    return "#0EA5E9";
            case Color::Yellow:  return "#FACC15";
            case Color::Cyan:    return "#06B6D4";
            case Color::Magenta: return "#C026D3";
            case Color::Orange:  return "#EA580C";
            case Color::Slate:   return "#64748B";
            case Color::Gray:    return "#9CA3AF";
            default:             return "#AAAAAA";
        }
    }

    // "#RRGGBB" or "#RRGGBBAA"
    static inline bool parseHexRGB(std::string_view s, uint8_t& R, uint8_t& G, uint8_t& B, uint8_t& A)
    {
        if ((s.size() != 7 && s.size() != 9) || s[0] != '#') return false;
        auto hex = [](char c) -> int {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        };
        auto rd2 = [&](size_t i) -> int { int a = hex(s[i]), b = hex(s[i + 1]); return (a < 0 || b < 0) ? -1 : ((a << 4) | b); };
        const int r = rd2(1), g = rd2(3), b = rd2(5);
        if (r < 0 || g < 0 || b < 0) return false;
        int a = 255;
        if (s.size() == 9 && (a = rd2(7)) < 0) return false;
        R = uint8_t(r); G = uint8_t(g); B = uint8_t(b); A = uint8_t(a);
        return true;
    }

    static inline ImU32 getColorU32(Color co)
    {
        uint8_t r, g, b, a;
        if (parseHexRGB(color_to_hex(co), r, g, b, a))
            return IM_COL32(r, g, b, a);
        return IM_COL32(170, 170, 170, 255);
    }

    static inline ImU32 AlphaMul(ImU32 c, float a)
    {
        const int A = std::clamp(int(((c >> 24) & 255) * a), 0, 255);
        return (c & 0x00FFFFFFu) | (ImU32(A) << 24);
    }

    static inline ImU32 Lighten(ImU32 c, int delta = 40)
    {
        const int r = std::min(255, int((c >> 0) & 255) + delta);
        const int g = std::min(255, int((c >> 8) & 255) + delta);
        const int b = std::min(255, int((c >> 16) & 255) + delta);
        return IM_COL32(r, g, b, (c >> 24) & 255);
    }

    // Severity text to its color. Matches on the first letter so "WARNING",
    // "warn" and "W" agree.
    static inline Color levelColor(std::string_view level)
    {
        if (level.empty()) return Color::Default;
        switch (level[0])
        {
            case 'f': case 'F':
            case 'c': case 'C': return Color::Magenta;
            case 'e': case 'E': return Color::Red;
            case 'w': case 'W': return Color::Yellow;
            case 'i': case 'I': return Color::Green;
            case 'd': case 'D': return Color::Blue;
            case 't': case 'T': return Color::Gray;
            default:            return Color::Default;
        }
    }

    static inline Color signalColor(int signalIndex)
    {
        static constexpr Color kSignals[] = { Color::Cyan, Color::Orange, Color::Magenta };
        return kSignals[std::clamp(signalIndex, 0, 2)];
    }
}
