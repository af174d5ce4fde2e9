#include "ViewerTracePanel.hpp"
#include "color_helper.hpp"
#include "format.hpp"
#include "gui_utils.hpp"

#include <algorithm>
#include <cstdio>
#include <unordered_map>

/*static*/ void ViewerTracePanel::drawBar(float fraction01, const char* rightLabel, float width, float height, ImU32 fill)
{
    fraction01 = std::clamp(fraction01, 0.0f, 1.0f);
    ImDrawList* dl = ImGui::GetWindowDrawList();
    ImVec2 p1 = ImGui::GetCursorScreenPos();
    ImVec2 p2 = ImVec2(p1.x + width, p1.y + height);

    dl->AddRectFilled(p1, p2, IM_COL32(35, 40, 45, 255), 3.0f);
    const float w = width * fraction01;
    if (w > 1.0f)
        dl->AddRectFilled(p1, ImVec2(p1.x + w, p2.y), fill ? fill : IM_COL32(255, 156, 74, 220), 3.0f);
    dl->AddRect(p1, p2, IM_COL32(0, 0, 0, 140), 3.0f, 0, 1.0f);

    ImGui::SetCursorScreenPos(ImVec2(p2.x + 8, p1.y - 2));
    ImGui::TextUnformatted(rightLabel);
    ImGui::SetCursorScreenPos(ImVec2(p1.x, p2.y + 6));
}

/*static*/ void ViewerTracePanel::drawSpanBar(float start01, float end01, float width, float height, ImU32 fill, bool selected)
{
    start01 = std::clamp(start01, 0.0f, 1.0f);
    end01 = std::clamp(end01, start01, 1.0f);
    ImDrawList* dl = ImGui::GetWindowDrawList();
    const ImVec2 origin = ImGui::GetCursorScreenPos();

    dl->AddRectFilled(origin, ImVec2(origin.x + width, origin.y + height), IM_COL32(25, 30, 35, 255), 2.0f);
    // at least 2px so instant spans stay visible
    const float x1 = origin.x + width * start01;
    const float x2 = std::max(x1 + 2.0f, origin.x + width * end01);
    dl->AddRectFilled(ImVec2(x1, origin.y), ImVec2(x2, origin.y + height), selected ? color::Lighten(fill, 50) : fill, 2.0f);
    if (selected)
        dl->AddRect(ImVec2(x1, origin.y), ImVec2(x2, origin.y + height), IM_COL32(255, 255, 255, 200), 2.0f, 0, 1.0f);
    ImGui::Dummy(ImVec2(width, height));
}

void ViewerTracePanel::draw(const std::vector<LogEntry>& spans, const std::string& traceId, const std::string& selectedSpanId, bool loading, const ImVec2& size)
{
    if (!ImGui::BeginChild("trace_panel", size, true))
    {
        ImGui::EndChild();
        return;
    }

    ImGui::TextDisabled("Trace %s", traceId.empty() ? "-" : traceId.c_str());
    if (loading)
    {
        ImGui::SameLine();
        ImGui::TextDisabled("(loading)");
    }
    if (spans.empty())
    {
        ImGui::TextDisabled(loading ? "Loading spans..." : "No spans for this trace.");
        ImGui::EndChild();
        return;
    }

    // time window of the trace, in microseconds from the first event
    const SysTime t0 = std::min_element(spans.begin(), spans.end(), [](const LogEntry& a, const LogEntry& b) { return a.timestamp < b.timestamp; })->timestamp;
    double totalUs = 1.0;
    for (const LogEntry& s : spans)
    {
        const double startUs = double(std::chrono::duration_cast<std::chrono::microseconds>(s.timestamp - t0).count());
        totalUs = std::max(totalUs, startUs + double(s.durationNs) / 1e3);
    }

    std::unordered_map<std::string, Row> byName;
    double sumAll = 0.0;

    const float labelW = std::min(260.0f, ImGui::GetContentRegionAvail().x * 0.35f);
    const float laneW = std::max(40.0f, ImGui::GetContentRegionAvail().x - labelW - 100.0f);
    const float laneH = ImGui::GetTextLineHeight() * 0.8f;

    if (ImGui::CollapsingHeader("Waterfall", ImGuiTreeNodeFlags_DefaultOpen))
    {
        for (const LogEntry& s : spans)
        {
            const double startUs = double(std::chrono::duration_cast<std::chrono::microseconds>(s.timestamp - t0).count());
            const double durUs = double(s.durationNs) / 1e3;
            const bool selected = !selectedSpanId.empty() && s.spanId == selectedSpanId;
            const bool isTx = s.processorEvent == "transaction";

            const std::string label = (isTx ? "[tx] " : "") + (s.name.empty() ? s.transactionName : s.name);
            ImGui::TextUnformatted(elideToWidth(label, labelW).c_str());
            ImGui::SameLine(labelW + 12.0f);

            const ImU32 fill = s.isError() ? color::getColorU32(color::Color::Red)
                : color::AlphaMul(color::getColorU32(isTx ? color::Color::Orange : color::Color::Blue), 0.85f);
            drawSpanBar(float(startUs / totalUs), float((startUs + durUs) / totalUs), laneW, laneH, fill, selected);
            ImGui::SameLine();
            ImGui::TextDisabled("%s", fmtDuration(durUs).c_str());

            auto& row = byName[label];
            row.key = label;
            row.count += 1;
            row.sum_us += durUs;
            row.min_us = std::min(row.min_us, durUs);
            row.max_us = std::max(row.max_us, durUs);
            row.error = row.error || s.isError();
            sumAll += durUs;
        }
    }

    ImGui::Spacing();
    if (ImGui::CollapsingHeader("Time by name"))
    {
        std::vector<Row> rows;
        rows.reserve(byName.size());
        for (const auto& kv : byName)
            rows.push_back(kv.second);
        std::stable_sort(rows.begin(), rows.end(), [](const Row& a, const Row& b) {
            if (a.sum_us != b.sum_us) return a.sum_us > b.sum_us;
            return a.key < b.key;
        });

        for (const Row& r : rows)
        {
            const float fract = sumAll > 0.0 ? float(r.sum_us / sumAll) : 0.0f;
            char right[160];
            std::snprintf(right, sizeof(right), "%s  x%llu  %.1f%%  avg %s  max %s",
                elideToWidth(r.key, 220.0f).c_str(), (unsigned long long)r.count, 100.0 * double(fract),
                fmtDuration(r.sum_us / double(r.count)).c_str(), fmtDuration(r.max_us).c_str());
            drawBar(fract, right, 160.0f, 8.0f, r.error ? color::getColorU32(color::Color::Red) : 0);
        }
    }

    ImGui::EndChild();
}
