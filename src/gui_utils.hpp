#pragma once
#include <imgui.h>

#include <algorithm>
#include <string>

inline std::string elideToWidth(const std::string& s, float maxPx)
{
    if (maxPx <= 0.f || s.empty()) return {};
    if (ImGui::CalcTextSize(s.c_str()).x <= maxPx) return s;
    static constexpr const char* dots = "...";
    const float wd = ImGui::CalcTextSize(dots).x;
    if (wd >= maxPx) return {};
    int lo = 0, hi = int(s.size());
    while (lo < hi)
    {
        const int mid = (lo + hi + 1) / 2;
        const std::string st = s.substr(0, mid) + dots;
        if (ImGui::CalcTextSize(st.c_str()).x <= maxPx) lo = mid; else hi = mid - 1;
    }
    // do not cut inside a UTF-8 sequence
    while (lo > 0 && (static_cast<unsigned char>(s[lo]) & 0xC0) == 0x80) --lo;
    return s.substr(0, lo) + dots;
}

// first line only, tabs flattened: table cells are single line
inline std::string oneLine(const std::string& s)
{
    std::string out = s.substr(0, s.find('\n'));
    for (char& c : out)
        if (c == '\t' || c == '\r') c = ' ';
    return out;
}

// Text lines in the current font: columns and rows for the core's wrap width.
inline void textGridSize(const ImVec2& px, int& columns, int& rows)
{
    const float cw = std::max(1.0f, ImGui::CalcTextSize("M").x);
    const float lh = std::max(1.0f, ImGui::GetTextLineHeightWithSpacing());
    columns = int(px.x / cw);
    rows = int(px.y / lh);
}
