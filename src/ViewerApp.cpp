#include "ViewerApp.hpp"
#include "ViewerMetricsPanel.hpp"
#include "color_helper.hpp"
#include "format.hpp"
#include "gui_utils.hpp"
#include "keymap.hpp"
#include "parser.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>

namespace
{
    struct KeyName
    {
        ImGuiKey key;
        const char* name;
    };

    const KeyName kNamedKeys[] = {
        { ImGuiKey_UpArrow, "up" },
        { ImGuiKey_DownArrow, "down" },
        { ImGuiKey_LeftArrow, "left" },
        { ImGuiKey_RightArrow, "right" },
        { ImGuiKey_PageUp, "pgup" },
        { ImGuiKey_PageDown, "pgdown" },
        { ImGuiKey_Home, "home" },
        { ImGuiKey_End, "end" },
        { ImGuiKey_Enter, "enter" },
        { ImGuiKey_KeypadEnter, "enter" },
        { ImGuiKey_Escape, "esc" },
        { ImGuiKey_Backspace, "backspace" },
        { ImGuiKey_Tab, "tab" },
    };

    std::string utf8(unsigned int cp)
    {
        std::string out;
        if (cp < 0x80)
            out += char(cp);
        else if (cp < 0x800)
        {
            out += char(0xC0 | (cp >> 6));
            out += char(0x80 | (cp & 0x3F));
        }
        else if (cp < 0x10000)
        {
            out += char(0xE0 | (cp >> 12));
            out += char(0x80 | ((cp >> 6) & 0x3F));
            out += char(0x80 | (cp & 0x3F));
        }
        else
        {
            out += char(0xF0 | (cp >> 18));
            out += char(0x80 | ((cp >> 12) & 0x3F));
            out += char(0x80 | ((cp >> 6) & 0x3F));
            out += char(0x80 | (cp & 0x3F));
        }
        return out;
    }

    constexpr ImU32 kDimCol = IM_COL32(200, 200, 200, 140);
    constexpr ImU32 kAccentCol = IM_COL32(70, 205, 255, 255);

    ImVec4 toVec4(ImU32 c) { return ImGui::ColorConvertU32ToFloat4(c); }

    const char* spinner()
    {
        static const char* kFrames[] = { "|", "/", "-", "\\" };
        return kFrames[int(ImGui::GetTime() * 8.0) % 4];
    }

    std::string filterLabel(const std::string& value, bool negate)
    {
        return (negate ? "!" : "") + value;
    }
}

ViewerApp::ViewerApp(const Orchestrator& core, std::string endpoint, Emit emit)
    : _core{ core }
    , _endpoint{ std::move(endpoint) }
    , _emit{ std::move(emit) }
    , _tracePanel{}
    , _cols{ 0 }
    , _rows{ 0 }
    , _lastSelected{ -1 }
    , _lastMode{ ViewMode::Entries }
{
}
ViewerApp::~ViewerApp() {}

// ---------- input ----------
void ViewerApp::pollInput()
{
    ImGuiIO& io = ImGui::GetIO();

    if (io.KeyCtrl)
    {
        if (ImGui::IsKeyPressed(ImGuiKey_C, false)) _emit(KeyEvent{ "ctrl+c" });
        if (ImGui::IsKeyPressed(ImGuiKey_U, false)) _emit(KeyEvent{ "ctrl+u" });
    }
    for (const KeyName& k : kNamedKeys)
    {
        if (ImGui::IsKeyPressed(k.key, true))
            _emit(KeyEvent{ k.name });
    }
    if (!io.KeyCtrl)
    {
        for (ImWchar c : io.InputQueueCharacters)
        {
            if (c == ' ')
                _emit(KeyEvent{ "space" });
            else if (c >= 0x20 && c != 0x7F)
                _emit(KeyEvent{ utf8(c) });
        }
    }
    io.InputQueueCharacters.resize(0);

    if (io.MouseWheel > 0.f)
        _emit(MouseEvent{ MouseEvent::Kind::WheelUp, {} });
    else if (io.MouseWheel < 0.f)
        _emit(MouseEvent{ MouseEvent::Kind::WheelDown, {} });
}

void ViewerApp::reportSize(const ImVec2& body)
{
    int cols = 0, rows = 0;
    textGridSize(body, cols, rows);
    if (cols == _cols && rows == _rows)
        return;
    _cols = cols;
    _rows = rows;
    _emit(ResizeEvent{ cols, rows });
}

ViewMode ViewerApp::backgroundView() const
{
    const auto& frames = _core.model().views.frames();
    for (auto it = frames.rbegin(); it != frames.rend(); ++it)
    {
        if (!isOverlayView(*it))
            return *it;
    }
    return ViewMode::Entries;
}

// ---------- frame ----------
void ViewerApp::drawUI()
{
    const AppModel& m = _core.model();
    const ViewMode mode = m.views.current();

    ImGuiViewport* vp = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(vp->WorkPos, ImGuiCond_Always);
    ImGui::SetNextWindowSize(vp->WorkSize, ImGuiCond_Always);
    const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration
        | ImGuiWindowFlags_NoMove
        | ImGuiWindowFlags_NoSavedSettings
        | ImGuiWindowFlags_NoBringToFrontOnFocus
        | ImGuiWindowFlags_NoScrollWithMouse;
    ImGui::Begin("lookout", nullptr, flags);

    drawStatusBar();
    ImGui::Separator();

    const float footerH = ImGui::GetFrameHeightWithSpacing();
    ImVec2 body = ImGui::GetContentRegionAvail();
    body.y = std::max(1.0f, body.y - footerH);
    reportSize(body);

    ImGui::BeginChild("body", body, false, ImGuiWindowFlags_NoScrollWithMouse);
    drawView(isOverlayView(mode) ? backgroundView() : mode);
    ImGui::EndChild();

    drawFooter();

    if (isOverlayView(mode))
    {
        // dim what sits below the overlay
        ImDrawList* dl = ImGui::GetWindowDrawList();
        dl->AddRectFilled(vp->WorkPos, ImVec2(vp->WorkPos.x + vp->WorkSize.x, vp->WorkPos.y + vp->WorkSize.y), IM_COL32(0, 0, 0, 110));
    }
    ImGui::End();

    if (isOverlayView(mode))
        drawOverlay(mode);

    _lastMode = mode;
}

void ViewerApp::drawView(ViewMode mode)
{
    switch (mode)
    {
        case ViewMode::Entries:           drawEntries(ImGui::GetContentRegionAvail()); break;
        case ViewMode::Detail:            drawDetail(false); break;
        case ViewMode::DetailRaw:         drawDetail(true); break;
        case ViewMode::Query:             drawQuery(); break;
        case ViewMode::Fields:            drawFields(); break;
        case ViewMode::MetricsDashboard:  drawMetricsDashboard(); break;
        case ViewMode::MetricDetail:      drawMetricDetail(); break;
        case ViewMode::TransactionNames:  drawTransactionNames(); break;
        case ViewMode::PerspectiveList:   drawPerspectives(); break;
        case ViewMode::Chat:              drawChat(ImGui::GetContentRegionAvail()); break;
        default:                          drawEntries(ImGui::GetContentRegionAvail()); break;
    }
}

// ---------- status bar ----------
void ViewerApp::drawStatusBar()
{
    const AppModel& m = _core.model();

    ImGui::PushStyleColor(ImGuiCol_Text, color::getColorU32(color::signalColor(int(m.signal))));
    ImGui::Text("[%s]", signalName(m.signal));
    ImGui::PopStyleColor();
    ImGui::SameLine();
    ImGui::TextUnformatted(m.index.c_str());
    ImGui::SameLine();
    ImGui::TextDisabled("| %s |", lookbackName(m.lookback));
    ImGui::SameLine();

    // clicking the sort label flips the order
    const char* sortLabel = m.sortAscending ? "oldest first" : "newest first";
    ImGui::PushStyleColor(ImGuiCol_Text, kAccentCol);
    if (ImGui::Selectable(sortLabel, false, 0, ImGui::CalcTextSize(sortLabel)))
        _emit(MouseEvent{ MouseEvent::Kind::Click, "sort" });
    ImGui::PopStyleColor();

    if (!m.levelFilter.empty())
    {
        ImGui::SameLine();
        ImGui::PushStyleColor(ImGuiCol_Text, color::getColorU32(color::levelColor(m.levelFilter)));
        ImGui::Text("level:%s", m.levelFilter.c_str());
        ImGui::PopStyleColor();
    }
    if (!m.serviceFilter.empty())
    {
        ImGui::SameLine();
        ImGui::Text("service:%s", filterLabel(m.serviceFilter, m.negateService).c_str());
    }
    if (!m.resourceFilter.empty())
    {
        ImGui::SameLine();
        ImGui::Text("resource:%s", filterLabel(m.resourceFilter, m.negateResource).c_str());
    }
    if (!m.searchQuery.empty())
    {
        ImGui::SameLine();
        ImGui::Text("search:\"%s\"", m.searchQuery.c_str());
    }
    if (m.signal == SignalType::Traces && !m.selectedTxName.empty())
    {
        ImGui::SameLine();
        ImGui::Text("tx:%s", m.selectedTxName.c_str());
    }

    const bool busy = m.loading || m.metricsLoading || m.tracesLoading || m.spansLoading
        || m.perspectiveLoading || m.fieldsLoading || m.metricDocsLoading || m.chatLoading;

    char right[256];
    std::snprintf(right, sizeof(right), "%s%s  %zu/%lld  %s",
        busy ? spinner() : " ",
        m.autoRefresh ? "  auto" : "",
        m.entries.size(), (long long)m.total, _endpoint.c_str());
    const float rw = ImGui::CalcTextSize(right).x;
    ImGui::SameLine(0.0f, 12.0f);
    const float avail = ImGui::GetContentRegionAvail().x;
    if (avail > rw)
        ImGui::SetCursorPosX(ImGui::GetCursorPosX() + avail - rw);
    ImGui::TextDisabled("%s", right);
}

void ViewerApp::drawFooter()
{
    const AppModel& m = _core.model();
    const std::string status = _core.activeStatus();
    if (!status.empty())
    {
        ImGui::PushStyleColor(ImGuiCol_Text, kAccentCol);
        ImGui::TextUnformatted(status.c_str());
        ImGui::PopStyleColor();
        return;
    }

    const char* hints = "? help  / search  enter open  r refresh  l lookback  m signal  p services  f fields  q quit";
    switch (m.views.current())
    {
        case ViewMode::Detail:
        case ViewMode::DetailRaw:        hints = "esc back  left/right prev/next  J raw  y copy  K browser"; break;
        case ViewMode::Query:            hints = "esc back  k ES|QL  c curl  y copy"; break;
        case ViewMode::Fields:           hints = "space toggle  / search  r reset  esc back"; break;
        case ViewMode::MetricsDashboard: hints = "enter detail  d documents  r refresh  l lookback  m signal  q quit"; break;
        case ViewMode::MetricDetail:     hints = "left/right metric  a/d document  J raw  esc back"; break;
        case ViewMode::TransactionNames: hints = "enter transactions  r refresh  l lookback  m signal  q quit"; break;
        case ViewMode::PerspectiveList:  hints = "enter include/exclude/clear  p switch  esc back"; break;
        case ViewMode::Chat:             hints = m.chatInputFocused ? "enter send  esc stop typing" : "i type  up/down scroll  esc back"; break;
        default: break;
    }
    if (m.signal == SignalType::Traces && m.views.current() == ViewMode::Entries && m.traceLevel != TraceLevel::Names)
        hints = "esc up  S trace  enter open  r refresh  / search  q quit";
    ImGui::TextDisabled("%s", hints);
}

// ---------- shared widgets ----------
void ViewerApp::drawScrolledLines(const std::vector<std::string>& lines, int offset)
{
    const int visible = std::max(1, _rows);
    const int first = std::clamp(offset, 0, std::max(0, int(lines.size()) - 1));
    const int last = std::min(int(lines.size()), first + visible);
    for (int i = first; i < last; ++i)
        ImGui::TextUnformatted(lines[size_t(i)].c_str());
    if (last < int(lines.size()))
        ImGui::TextDisabled("-- %d more lines --", int(lines.size()) - last);
}

bool ViewerApp::cursorRow(int index, int cursor, const char* label)
{
    const bool selected = index == cursor;
    const bool clicked = ImGui::Selectable(label, selected, ImGuiSelectableFlags_SpanAllColumns);
    if (selected && (cursor != _lastSelected || _core.model().views.current() != _lastMode))
    {
        ImGui::SetScrollHereY(0.5f);
        _lastSelected = cursor;
    }
    return clicked;
}

// ---------- entries ----------
void ViewerApp::drawEntries(const ImVec2& size)
{
    const AppModel& m = _core.model();
    const auto now = std::chrono::system_clock::now();

    std::vector<const DisplayField*> cols;
    for (const auto& f : m.fields)
    {
        if (f.selected) cols.push_back(&f);
    }
    if (cols.empty())
    {
        ImGui::TextDisabled("No columns selected (f to pick fields)");
        return;
    }

    const bool showTrace = m.signal == SignalType::Traces && m.traceLevel == TraceLevel::Transactions
        && (!m.spans.empty() || m.spansLoading);
    ImVec2 tableSize = size;
    if (showTrace)
        tableSize.y = std::max(80.0f, size.y * 0.55f);

    if (m.entries.empty())
    {
        ImGui::TextDisabled(m.loading ? "Loading..." : "No entries in %s", lookbackName(m.lookback));
        return;
    }

    const float charW = ImGui::CalcTextSize("M").x;
    const ImGuiTableFlags tflags = ImGuiTableFlags_RowBg
        | ImGuiTableFlags_ScrollY
        | ImGuiTableFlags_SizingFixedFit
        | ImGuiTableFlags_BordersInnerV;
    if (ImGui::BeginTable("entries", int(cols.size()), tflags, tableSize))
    {
        ImGui::TableSetupScrollFreeze(0, 1);
        for (const DisplayField* f : cols)
        {
            if (f->width > 0)
                ImGui::TableSetupColumn(f->label.c_str(), ImGuiTableColumnFlags_WidthFixed, charW * float(f->width));
            else
                ImGui::TableSetupColumn(f->label.c_str(), ImGuiTableColumnFlags_WidthStretch);
        }
        ImGui::TableHeadersRow();

        const int selectedIdx = m.selection.selectedIndex();
        for (size_t i = 0; i < m.entries.size(); ++i)
        {
            const LogEntry& e = m.entries[i];
            ImGui::TableNextRow();
            ImGui::PushID(int(i));
            for (size_t c = 0; c < cols.size(); ++c)
            {
                ImGui::TableSetColumnIndex(int(c));
                const std::string text = oneLine(fieldValue(e, *cols[c], m.timeMode, now));
                if (c == 0)
                {
                    // the first cell carries the full-row selectable
                    if (cursorRow(int(i), selectedIdx, "##row"))
                        _emit(MouseEvent{ MouseEvent::Kind::Click, "row:" + std::to_string(i) });
                    ImGui::SameLine(0.0f, 0.0f);
                }

                const bool isLevel = cols[c]->name == "severity_text";
                const bool isStatus = cols[c]->name == "status.code" && e.isError();
                if (isLevel || isStatus)
                    ImGui::PushStyleColor(ImGuiCol_Text, color::getColorU32(isStatus ? color::Color::Red : color::levelColor(e.displayLevel())));
                const float cellW = ImGui::GetContentRegionAvail().x;
                ImGui::TextUnformatted(elideToWidth(text, cellW).c_str());
                if (isLevel || isStatus)
                    ImGui::PopStyleColor();
            }
            ImGui::PopID();
        }

        // tail marker
        if (!m.selection.userHasScrolled())
        {
            ImGui::TableNextRow();
            ImGui::TableSetColumnIndex(0);
            ImGui::TextDisabled(m.sortAscending ? "-- following newest --" : "-- following newest (top) --");
        }
        ImGui::EndTable();
    }

    if (showTrace)
    {
        const LogEntry* sel = nullptr;
        const int idx = m.selection.selectedIndex();
        if (idx >= 0 && size_t(idx) < m.entries.size())
            sel = &m.entries[size_t(idx)];
        _tracePanel.draw(m.spans, m.lastFetchedTraceId, sel ? sel->spanId : std::string(), m.spansLoading, ImGui::GetContentRegionAvail());
    }
}

// ---------- detail ----------
void ViewerApp::drawDetail(bool raw)
{
    const AppModel& m = _core.model();
    const bool metricDoc = m.detailSource == DetailSource::MetricDocs;
    const auto& list = metricDoc ? m.metricDocs : m.entries;
    const int idx = metricDoc ? m.metricDocCursor : m.selection.selectedIndex();

    ImGui::PushStyleColor(ImGuiCol_Text, kAccentCol);
    ImGui::Text("%s  %d/%zu", raw ? "Raw document" : "Detail", list.empty() ? 0 : idx + 1, list.size());
    ImGui::PopStyleColor();
    if (idx >= 0 && size_t(idx) < list.size() && !raw)
    {
        const LogEntry& e = list[size_t(idx)];
        ImGui::SameLine();
        ImGui::PushStyleColor(ImGuiCol_Text, color::getColorU32(color::levelColor(e.displayLevel())));
        ImGui::TextUnformatted(e.displayLevel().c_str());
        ImGui::PopStyleColor();
    }
    ImGui::Separator();
    drawScrolledLines(m.detailLines, m.detailScroll);
}

void ViewerApp::drawQuery()
{
    const AppModel& m = _core.model();
    ImGui::PushStyleColor(ImGuiCol_Text, kAccentCol);
    ImGui::Text("Query (%s)", queryFormatName(m.queryFormat));
    ImGui::PopStyleColor();
    ImGui::Separator();
    ImGui::PushTextWrapPos(0.0f);
    ImGui::TextUnformatted(_core.queryOverlayText().c_str());
    ImGui::PopTextWrapPos();
}

// ---------- field picker ----------
void ViewerApp::drawFields()
{
    const AppModel& m = _core.model();
    const auto fields = _core.sortedFieldList();

    ImGui::PushStyleColor(ImGuiCol_Text, kAccentCol);
    ImGui::Text("Fields (%zu)", fields.size());
    ImGui::PopStyleColor();
    if (m.fieldsSearchMode || !m.fieldsSearch.empty())
    {
        ImGui::SameLine();
        ImGui::Text("/ %s%s", m.fieldsSearch.text.c_str(), m.fieldsSearchMode ? "_" : "");
    }
    if (m.fieldsLoading)
    {
        ImGui::SameLine();
        ImGui::TextDisabled("%s loading", spinner());
    }
    ImGui::Separator();

    if (ImGui::BeginTable("fields", 4, ImGuiTableFlags_RowBg | ImGuiTableFlags_ScrollY | ImGuiTableFlags_SizingFixedFit))
    {
        ImGui::TableSetupColumn("", ImGuiTableColumnFlags_WidthFixed, ImGui::CalcTextSize("[x]").x);
        ImGui::TableSetupColumn("Field", ImGuiTableColumnFlags_WidthStretch);
        ImGui::TableSetupColumn("Type", ImGuiTableColumnFlags_WidthFixed, ImGui::CalcTextSize("M").x * 10);
        ImGui::TableSetupColumn("Docs", ImGuiTableColumnFlags_WidthFixed, ImGui::CalcTextSize("M").x * 8);
        ImGui::TableHeadersRow();
        for (size_t i = 0; i < fields.size(); ++i)
        {
            const FieldInfo& f = fields[i];
            ImGui::TableNextRow();
            ImGui::TableSetColumnIndex(0);
            ImGui::PushID(int(i));
            cursorRow(int(i), m.fieldsCursor, _core.isFieldDisplayed(f.name) ? "[x]" : "[ ]");
            ImGui::PopID();
            ImGui::TableSetColumnIndex(1);
            ImGui::TextUnformatted(f.name.c_str());
            ImGui::TableSetColumnIndex(2);
            ImGui::TextDisabled("%s", f.type.c_str());
            ImGui::TableSetColumnIndex(3);
            ImGui::TextDisabled("%s", fmtCompact(double(f.docCount)).c_str());
        }
        ImGui::EndTable();
    }
}

// ---------- metrics ----------
void ViewerApp::drawMetricsDashboard()
{
    const AppModel& m = _core.model();
    const auto& metrics = m.metrics.metrics;

    ImGui::PushStyleColor(ImGuiCol_Text, kAccentCol);
    ImGui::Text("Metrics  (%zu, bucket %s)", metrics.size(), m.metrics.bucketSize.c_str());
    ImGui::PopStyleColor();
    ImGui::Separator();
    if (metrics.empty())
    {
        ImGui::TextDisabled(m.metricsLoading ? "Loading..." : "No metrics in %s", lookbackName(m.lookback));
        return;
    }

    const float lineH = ImGui::GetTextLineHeightWithSpacing();
    const float sparkW = std::max(120.0f, ImGui::GetContentRegionAvail().x * 0.35f);
    if (ImGui::BeginTable("metrics", 6, ImGuiTableFlags_RowBg | ImGuiTableFlags_ScrollY | ImGuiTableFlags_SizingFixedFit))
    {
        const float numW = ImGui::CalcTextSize("M").x * 9;
        ImGui::TableSetupScrollFreeze(0, 1);
        ImGui::TableSetupColumn("Metric", ImGuiTableColumnFlags_WidthStretch);
        ImGui::TableSetupColumn("Latest", ImGuiTableColumnFlags_WidthFixed, numW);
        ImGui::TableSetupColumn("Avg", ImGuiTableColumnFlags_WidthFixed, numW);
        ImGui::TableSetupColumn("Min", ImGuiTableColumnFlags_WidthFixed, numW);
        ImGui::TableSetupColumn("Max", ImGuiTableColumnFlags_WidthFixed, numW);
        ImGui::TableSetupColumn("Trend", ImGuiTableColumnFlags_WidthFixed, sparkW);
        ImGui::TableHeadersRow();

        for (size_t i = 0; i < metrics.size(); ++i)
        {
            const AggregatedMetric& am = metrics[i];
            ImGui::TableNextRow(0, lineH * 1.6f);
            ImGui::TableSetColumnIndex(0);
            ImGui::PushID(int(i));
            cursorRow(int(i), m.metricsCursor, am.shortName.c_str());
            ImGui::PopID();
            ImGui::TableSetColumnIndex(1);
            ImGui::TextUnformatted(fmtCompact(am.latest).c_str());
            ImGui::TableSetColumnIndex(2);
            ImGui::TextUnformatted(fmtCompact(am.avg).c_str());
            ImGui::TableSetColumnIndex(3);
            ImGui::TextDisabled("%s", fmtCompact(am.min).c_str());
            ImGui::TableSetColumnIndex(4);
            ImGui::TextDisabled("%s", fmtCompact(am.max).c_str());
            ImGui::TableSetColumnIndex(5);
            const ImVec2 p = ImGui::GetCursorScreenPos();
            drawMetricSparkline(ImGui::GetWindowDrawList(), am, p, ImVec2(p.x + sparkW, p.y + lineH * 1.4f), kAccentCol, false);
            ImGui::Dummy(ImVec2(sparkW, lineH * 1.4f));
        }
        ImGui::EndTable();
    }
}

void ViewerApp::drawMetricDetail()
{
    const AppModel& m = _core.model();
    const auto& metrics = m.metrics.metrics;
    if (m.metricsCursor < 0 || size_t(m.metricsCursor) >= metrics.size())
    {
        ImGui::TextDisabled("No metric selected");
        return;
    }
    const AggregatedMetric& am = metrics[size_t(m.metricsCursor)];

    ImGui::PushStyleColor(ImGuiCol_Text, kAccentCol);
    ImGui::Text("%s", am.name.c_str());
    ImGui::PopStyleColor();
    ImGui::SameLine();
    ImGui::TextDisabled("(%s)  %d/%zu", am.type.c_str(), m.metricsCursor + 1, metrics.size());
    ImGui::Text("latest %s   avg %s   min %s   max %s",
        fmtCompact(am.latest).c_str(), fmtCompact(am.avg).c_str(), fmtCompact(am.min).c_str(), fmtCompact(am.max).c_str());

    const ImVec2 p = ImGui::GetCursorScreenPos();
    const float w = ImGui::GetContentRegionAvail().x;
    const float h = std::max(80.0f, ImGui::GetContentRegionAvail().y * 0.40f);
    drawMetricSparkline(ImGui::GetWindowDrawList(), am, p, ImVec2(p.x + w, p.y + h), kAccentCol, true);
    ImGui::Dummy(ImVec2(w, h));

    ImGui::SeparatorText("Latest documents");
    if (m.metricDocs.empty())
    {
        ImGui::TextDisabled(m.metricDocsLoading ? "Loading..." : "No documents");
        return;
    }
    const auto now = std::chrono::system_clock::now();
    for (size_t i = 0; i < m.metricDocs.size(); ++i)
    {
        const LogEntry& d = m.metricDocs[i];
        const nlohmann::json* v = lookup_path(d.raw, am.name);
        char label[256];
        std::snprintf(label, sizeof(label), "%s  %s  %s",
            fmtTimestamp(d.timestamp, m.timeMode, now).c_str(),
            v ? scalar_string(*v).c_str() : "-",
            d.serviceName.c_str());
        ImGui::PushID(int(i));
        cursorRow(int(i), m.metricDocCursor, label);
        ImGui::PopID();
    }
}

// ---------- traces ----------
void ViewerApp::drawTransactionNames()
{
    const AppModel& m = _core.model();
    const auto& names = m.transactionNames;

    ImGui::PushStyleColor(ImGuiCol_Text, kAccentCol);
    ImGui::Text("Transactions (%zu)", names.size());
    ImGui::PopStyleColor();
    ImGui::Separator();
    if (names.empty())
    {
        ImGui::TextDisabled(m.tracesLoading ? "Loading..." : "No transactions in %s", lookbackName(m.lookback));
        return;
    }

    const auto now = std::chrono::system_clock::now();
    const float numW = ImGui::CalcTextSize("M").x * 9;
    if (ImGui::BeginTable("txnames", 8, ImGuiTableFlags_RowBg | ImGuiTableFlags_ScrollY | ImGuiTableFlags_SizingFixedFit))
    {
        ImGui::TableSetupScrollFreeze(0, 1);
        ImGui::TableSetupColumn("Name", ImGuiTableColumnFlags_WidthStretch);
        ImGui::TableSetupColumn("Count", ImGuiTableColumnFlags_WidthFixed, numW);
        ImGui::TableSetupColumn("Avg", ImGuiTableColumnFlags_WidthFixed, numW);
        ImGui::TableSetupColumn("Min", ImGuiTableColumnFlags_WidthFixed, numW);
        ImGui::TableSetupColumn("Max", ImGuiTableColumnFlags_WidthFixed, numW);
        ImGui::TableSetupColumn("Spans", ImGuiTableColumnFlags_WidthFixed, numW);
        ImGui::TableSetupColumn("Errors", ImGuiTableColumnFlags_WidthFixed, numW);
        ImGui::TableSetupColumn("Last", ImGuiTableColumnFlags_WidthFixed, numW * 1.4f);
        ImGui::TableHeadersRow();

        for (size_t i = 0; i < names.size(); ++i)
        {
            const TransactionNameAgg& t = names[i];
            ImGui::TableNextRow();
            ImGui::TableSetColumnIndex(0);
            ImGui::PushID(int(i));
            cursorRow(int(i), m.traceNamesCursor, t.name.c_str());
            ImGui::PopID();
            ImGui::TableSetColumnIndex(1);
            ImGui::TextUnformatted(fmtCompact(double(t.count)).c_str());
            ImGui::TableSetColumnIndex(2);
            ImGui::TextUnformatted(fmtDuration(t.avgDurationMs * 1e3).c_str());
            ImGui::TableSetColumnIndex(3);
            ImGui::TextDisabled("%s", fmtDuration(t.minDurationMs * 1e3).c_str());
            ImGui::TableSetColumnIndex(4);
            ImGui::TextDisabled("%s", fmtDuration(t.maxDurationMs * 1e3).c_str());
            ImGui::TableSetColumnIndex(5);
            ImGui::Text("%.1f", t.avgSpans);
            ImGui::TableSetColumnIndex(6);
            if (t.errorRate > 0.0)
                ImGui::TextColored(toVec4(color::getColorU32(color::Color::Red)), "%.1f%%", t.errorRate * 100.0);
            else
                ImGui::TextDisabled("0%%");
            ImGui::TableSetColumnIndex(7);
            ImGui::TextDisabled("%s", fmtTimestamp(t.lastSeen, TimeDisplayMode::Relative, now).c_str());
        }
        ImGui::EndTable();
    }
}

// ---------- perspectives ----------
void ViewerApp::drawPerspectives()
{
    const AppModel& m = _core.model();
    const bool byService = m.perspective == PerspectiveType::Services;
    const std::string& active = byService ? m.serviceFilter : m.resourceFilter;
    const bool negate = byService ? m.negateService : m.negateResource;

    ImGui::PushStyleColor(ImGuiCol_Text, kAccentCol);
    ImGui::Text("%s (%zu)", perspectiveName(m.perspective), m.perspectiveItems.size());
    ImGui::PopStyleColor();
    ImGui::Separator();
    if (m.perspectiveItems.empty())
    {
        ImGui::TextDisabled(m.perspectiveLoading ? "Loading..." : "Nothing found in %s", lookbackName(m.lookback));
        return;
    }

    const float numW = ImGui::CalcTextSize("M").x * 9;
    if (ImGui::BeginTable("perspective", 5, ImGuiTableFlags_RowBg | ImGuiTableFlags_ScrollY | ImGuiTableFlags_SizingFixedFit))
    {
        ImGui::TableSetupScrollFreeze(0, 1);
        ImGui::TableSetupColumn("", ImGuiTableColumnFlags_WidthFixed, ImGui::CalcTextSize("[-]").x);
        ImGui::TableSetupColumn("Name", ImGuiTableColumnFlags_WidthStretch);
        ImGui::TableSetupColumn("Logs", ImGuiTableColumnFlags_WidthFixed, numW);
        ImGui::TableSetupColumn("Traces", ImGuiTableColumnFlags_WidthFixed, numW);
        ImGui::TableSetupColumn("Metrics", ImGuiTableColumnFlags_WidthFixed, numW);
        ImGui::TableHeadersRow();
        for (size_t i = 0; i < m.perspectiveItems.size(); ++i)
        {
            const PerspectiveItem& p = m.perspectiveItems[i];
            const bool isActive = p.name == active;
            ImGui::TableNextRow();
            ImGui::TableSetColumnIndex(0);
            ImGui::PushID(int(i));
            cursorRow(int(i), m.perspectiveCursor, isActive ? (negate ? "[-]" : "[+]") : "   ");
            ImGui::PopID();
            ImGui::TableSetColumnIndex(1);
            ImGui::TextUnformatted(p.name.c_str());
            ImGui::TableSetColumnIndex(2);
            ImGui::TextUnformatted(fmtCompact(double(p.logCount)).c_str());
            ImGui::TableSetColumnIndex(3);
            ImGui::TextUnformatted(fmtCompact(double(p.traceCount)).c_str());
            ImGui::TableSetColumnIndex(4);
            ImGui::TextUnformatted(fmtCompact(double(p.metricCount)).c_str());
        }
        ImGui::EndTable();
    }
}

// ---------- chat ----------
void ViewerApp::drawChat(const ImVec2& size)
{
    const AppModel& m = _core.model();
    const float inputH = ImGui::GetFrameHeightWithSpacing() * 1.5f;

    ImGui::BeginChild("chat_log", ImVec2(size.x, std::max(20.0f, size.y - inputH)), true, ImGuiWindowFlags_NoScrollWithMouse);
    if (m.chatMessages.empty())
        ImGui::TextDisabled("Ask about what you are looking at. The current view is sent along.");
    for (const ChatMessage& msg : m.chatMessages)
    {
        const bool user = msg.role == "user";
        const ImU32 col = msg.error ? color::getColorU32(color::Color::Red)
            : color::getColorU32(user ? color::Color::Cyan : color::Color::Green);
        ImGui::TextColored(toVec4(col), "%s", user ? "you" : "assistant");
        ImGui::PushTextWrapPos(0.0f);
        ImGui::TextUnformatted(msg.content.c_str());
        ImGui::PopTextWrapPos();
        ImGui::Spacing();
    }
    if (m.chatLoading)
        ImGui::TextDisabled("%s thinking", spinner());
    // chatScroll counts lines up from the newest message
    const float maxY = ImGui::GetScrollMaxY();
    ImGui::SetScrollY(std::max(0.0f, maxY - float(m.chatScroll) * ImGui::GetTextLineHeightWithSpacing()));
    ImGui::EndChild();

    ImGui::PushStyleColor(ImGuiCol_Text, m.chatInputFocused ? kAccentCol : kDimCol);
    ImGui::Text("> %s%s", m.chatInput.text.c_str(), m.chatInputFocused ? "_" : "");
    ImGui::PopStyleColor();
}

// ---------- overlays ----------
bool ViewerApp::beginModal(const char* title, const ImVec2& size)
{
    ImGuiViewport* vp = ImGui::GetMainViewport();
    const ImVec2 sz(std::min(size.x, vp->WorkSize.x - 40.0f), std::min(size.y, vp->WorkSize.y - 40.0f));
    ImGui::SetNextWindowPos(ImVec2(vp->WorkPos.x + vp->WorkSize.x * 0.5f, vp->WorkPos.y + vp->WorkSize.y * 0.5f), ImGuiCond_Always, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(sz, ImGuiCond_Always);
    ImGui::SetNextWindowFocus();
    const ImGuiWindowFlags flags = ImGuiWindowFlags_NoCollapse
        | ImGuiWindowFlags_NoResize
        | ImGuiWindowFlags_NoMove
        | ImGuiWindowFlags_NoSavedSettings
        | ImGuiWindowFlags_NoScrollWithMouse;
    return ImGui::Begin(title, nullptr, flags);
}

void ViewerApp::endModal()
{
    ImGui::End();
}

void ViewerApp::drawOverlay(ViewMode mode)
{
    const AppModel& m = _core.model();
    switch (mode)
    {
        case ViewMode::Search:
            drawInputLine("Search", m.searchInput.text, "enter apply  esc cancel  /regex/ for patterns");
            break;
        case ViewMode::IndexPicker:
            drawInputLine("Index pattern", m.indexInput.text, "comma separated globs, e.g. logs-*,traces-*");
            break;
        case ViewMode::ErrorModal:                 drawErrorModal(); break;
        case ViewMode::QuitConfirm:                drawQuitConfirm(); break;
        case ViewMode::Help:                       drawHelp(); break;
        case ViewMode::Credentials:                drawCredentials(); break;
        case ViewMode::CollectorConfigExplain:     drawConfigExplain(); break;
        case ViewMode::CollectorConfigWatch:       drawConfigWatch(); break;
        case ViewMode::CollectorConfigUnavailable: drawConfigUnavailable(); break;
        default: break;
    }
}

void ViewerApp::drawInputLine(const char* prompt, const std::string& text, const char* hint)
{
    if (beginModal(prompt, ImVec2(640, ImGui::GetTextLineHeightWithSpacing() * 4 + 24)))
    {
        ImGui::PushStyleColor(ImGuiCol_Text, kAccentCol);
        ImGui::Text("> %s_", text.c_str());
        ImGui::PopStyleColor();
        ImGui::Separator();
        ImGui::TextDisabled("%s", hint);
    }
    endModal();
}

void ViewerApp::drawHelp()
{
    const AppModel& m = _core.model();
    std::vector<std::string> lines;
    for (const KeyHintGroup& g : helpGroups())
    {
        lines.push_back(g.title);
        for (const KeyHint& h : g.hints)
        {
            char buf[128];
            std::snprintf(buf, sizeof(buf), "  %-16s %s", h.keys.c_str(), h.label.c_str());
            lines.push_back(buf);
        }
        lines.emplace_back();
    }

    if (beginModal("Help", ImVec2(520, 560)))
    {
        const int first = std::clamp(m.helpScroll, 0, std::max(0, int(lines.size()) - 1));
        for (size_t i = size_t(first); i < lines.size(); ++i)
        {
            if (!lines[i].empty() && lines[i][0] != ' ')
                ImGui::TextColored(toVec4(kAccentCol), "%s", lines[i].c_str());
            else
                ImGui::TextUnformatted(lines[i].c_str());
        }
    }
    endModal();
}

void ViewerApp::drawErrorModal()
{
    const AppModel& m = _core.model();
    if (beginModal("Error", ImVec2(640, 320)))
    {
        const float wrapCols = std::max(20.0f, ImGui::GetContentRegionAvail().x / std::max(1.0f, ImGui::CalcTextSize("M").x));
        const auto lines = wrapLines(m.err, int(wrapCols));
        ImGui::PushStyleColor(ImGuiCol_Text, color::getColorU32(color::Color::Red));
        const int first = std::clamp(m.errorScroll, 0, std::max(0, int(lines.size()) - 1));
        for (size_t i = size_t(first); i < lines.size(); ++i)
            ImGui::TextUnformatted(lines[i].c_str());
        ImGui::PopStyleColor();
        ImGui::Separator();
        ImGui::TextDisabled("y copy  esc close");
    }
    endModal();
}

void ViewerApp::drawQuitConfirm()
{
    if (beginModal("Quit", ImVec2(320, ImGui::GetTextLineHeightWithSpacing() * 4 + 24)))
    {
        ImGui::TextUnformatted("Quit lookout?");
        ImGui::Separator();
        ImGui::TextDisabled("y yes  n no");
    }
    endModal();
}

void ViewerApp::drawCredentials()
{
    const AppModel& m = _core.model();
    const OrchestratorSettings& s = _core.settings();
    if (beginModal("Open in browser", ImVec2(640, 260)))
    {
        ImGui::TextUnformatted("Sign in with:");
        ImGui::Text("  user      %s", s.webUser.empty() ? "-" : s.webUser.c_str());
        ImGui::Text("  password  %s", s.webPassword.empty() ? "-" : s.webPassword.c_str());
        ImGui::Spacing();
        ImGui::PushTextWrapPos(0.0f);
        ImGui::TextDisabled("%s", m.lastWebUrl.c_str());
        ImGui::PopTextWrapPos();
        ImGui::Separator();
        ImGui::TextDisabled("enter open  y copy URL  p copy password  n don't show again  esc back");
    }
    endModal();
}

void ViewerApp::drawConfigExplain()
{
    if (beginModal("Configuration", ImVec2(600, 240)))
    {
        ImGui::PushTextWrapPos(0.0f);
        ImGui::TextUnformatted("The configuration file will open in your editor. Every change is "
                               "validated on the next refresh tick and applied when valid.");
        ImGui::PopTextWrapPos();
        ImGui::Separator();
        ImGui::TextDisabled("enter open and watch  esc cancel");
    }
    endModal();
}

void ViewerApp::drawConfigWatch()
{
    const AppModel& m = _core.model();
    if (beginModal("Watching configuration", ImVec2(640, 260)))
    {
        ImGui::Text("File: %s", m.configPath.c_str());
        ImGui::Text("Reloads: %d", m.configReloads);
        ImGui::Spacing();
        ImGui::PushStyleColor(ImGuiCol_Text, color::getColorU32(m.configValid ? color::Color::Green : color::Color::Red));
        ImGui::PushTextWrapPos(0.0f);
        ImGui::TextUnformatted(m.configStatus.c_str());
        ImGui::PopTextWrapPos();
        ImGui::PopStyleColor();
        ImGui::Separator();
        ImGui::TextDisabled("y copy path  Y copy error  esc stop watching");
    }
    endModal();
}

void ViewerApp::drawConfigUnavailable()
{
    if (beginModal("Configuration", ImVec2(520, 180)))
    {
        ImGui::PushTextWrapPos(0.0f);
        ImGui::TextUnformatted("No configuration file is in use. Start with --config <file> to edit it live.");
        ImGui::PopTextWrapPos();
        ImGui::Separator();
        ImGui::TextDisabled("esc close");
    }
    endModal();
}
