#pragma once
#include <imgui.h>

#include "model.hpp"

// Line chart of a metric's bucketed averages.
// Grid, min/max labels and a hover tooltip with the nearest bucket.
void drawMetricSparkline(ImDrawList* dl, const AggregatedMetric& m, const ImVec2& pMin, const ImVec2& pMax, ImU32 lineColor, bool interactive);
