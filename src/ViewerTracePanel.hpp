#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <imgui.h>

#include "model.hpp"

/// @brief Waterfall of the events of one trace, with per-name totals.
/// Drawn under the entry table while a trace or its transactions are listed.
class ViewerTracePanel
{
public:
    // `selectedSpanId` is highlighted; `loading` greys the panel while spans are fetched.
    void draw(const std::vector<LogEntry>& spans, const std::string& traceId, const std::string& selectedSpanId, bool loading, const ImVec2& size);

private:
    struct Row
    {
        std::string key;
        uint64_t count;
        double sum_us;
        double min_us;
        double max_us;
        bool error;

        Row()
            : key{ }
            , count{ 0 }
            , sum_us{ 0 }
            , min_us{ 1e300 }
            , max_us{ 0 }
            , error{ false }
        {

        }
    };

    // Bar of `fraction01` of `width` with a label to its right.
    static void drawBar(float fraction01, const char* rightLabel, float width = 260.f, float height = 10.f, ImU32 fill = 0);
    // Bar placed at [start01, end01] of a lane.
    static void drawSpanBar(float start01, float end01, float width, float height, ImU32 fill, bool selected);
};
