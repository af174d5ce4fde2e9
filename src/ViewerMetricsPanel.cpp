#include "ViewerMetricsPanel.hpp"
#include "color_helper.hpp"
#include "format.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace
{
    constexpr float kPtR = 1.25f;
    constexpr float kThick = 1.5f;
    constexpr ImU32 kGridCol = IM_COL32(130, 140, 150, 60);
    constexpr ImU32 kBoxCol = IM_COL32(20, 32, 38, 190);
    constexpr ImU32 kTextCol = IM_COL32(200, 200, 200, 220);
}

void drawMetricSparkline(ImDrawList* dl, const AggregatedMetric& m, const ImVec2& pMin, const ImVec2& pMax, ImU32 lineColor, bool interactive)
{
    dl->AddRectFilled(pMin, pMax, kBoxCol, 4.f);
    const float w = pMax.x - pMin.x;
    const float h = pMax.y - pMin.y;
    if (w < 8.f || h < 8.f) return;

    // horizontal quarters
    for (int q = 1; q < 4; ++q)
    {
        const float yy = pMin.y + h * float(q) / 4.f;
        dl->AddLine(ImVec2(pMin.x, yy), ImVec2(pMax.x, yy), kGridCol);
    }

    const auto& b = m.buckets;
    if (b.empty())
    {
        const char* none = "no data";
        const ImVec2 tsz = ImGui::CalcTextSize(none);
        dl->AddText(ImVec2(pMin.x + (w - tsz.x) * 0.5f, pMin.y + (h - tsz.y) * 0.5f), kTextCol, none);
        return;
    }

    double lo = b.front().value, hi = b.front().value;
    for (const auto& k : b)
    {
        lo = std::min(lo, k.value);
        hi = std::max(hi, k.value);
    }
    if (hi - lo < 1e-12)
    {
        // flat series sits in the middle
        lo -= 1.0;
        hi += 1.0;
    }

    const double t0 = double(b.front().timestamp.time_since_epoch().count());
    const double t1 = double(b.back().timestamp.time_since_epoch().count());
    const double span = std::max(1.0, t1 - t0);

    auto xx = [&](size_t i) -> float {
        if (b.size() == 1) return pMin.x + w * 0.5f;
        const double t = double(b[i].timestamp.time_since_epoch().count());
        return pMin.x + 4.f + float((t - t0) / span) * (w - 8.f);
    };
    auto yy = [&](double v) -> float {
        return pMin.y + 3.f + (1.f - float((v - lo) / (hi - lo))) * (h - 6.f);
    };

    ImVec2 last(-1, -1);
    for (size_t i = 0; i < b.size(); ++i)
    {
        const ImVec2 cur(xx(i), yy(b[i].value));
        if (last.x >= 0) dl->AddLine(last, cur, lineColor, kThick);
        dl->AddCircleFilled(cur, kPtR, lineColor);
        last = cur;
    }

    // extremes on the left edge
    dl->AddText(ImVec2(pMin.x + 4.f, pMin.y + 1.f), color::AlphaMul(kTextCol, 0.7f), fmtCompact(hi).c_str());
    const std::string minLabel = fmtCompact(lo);
    dl->AddText(ImVec2(pMin.x + 4.f, pMax.y - ImGui::GetFontSize() - 1.f), color::AlphaMul(kTextCol, 0.7f), minLabel.c_str());

    if (!interactive) return;
    const ImGuiIO& io = ImGui::GetIO();
    if (io.MousePos.x < pMin.x || io.MousePos.x > pMax.x || io.MousePos.y < pMin.y || io.MousePos.y > pMax.y)
        return;

    size_t best = 0;
    float bestD = 1e30f;
    for (size_t i = 0; i < b.size(); ++i)
    {
        const float d = std::abs(xx(i) - io.MousePos.x);
        if (d < bestD) { bestD = d; best = i; }
    }
    dl->AddLine(ImVec2(xx(best), pMin.y), ImVec2(xx(best), pMax.y), IM_COL32(255, 255, 255, 60), 1.0f);
    ImGui::BeginTooltip();
    ImGui::Text("%s", m.shortName.c_str());
    ImGui::Separator();
    ImGui::Text("at:      %s", fmtIso(b[best].timestamp).c_str());
    ImGui::Text("avg:     %.4g", b[best].value);
    ImGui::Text("samples: %lld", (long long)b[best].count);
    ImGui::EndTooltip();
}
