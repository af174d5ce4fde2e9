#pragma once
#include "Orchestrator.hpp"
#include "ViewerTracePanel.hpp"
#include "events.hpp"

#include <functional>
#include <string>

#include <imgui.h>

/// @brief Desktop front-end of the Orchestrator.
/// Translates ImGui input into core events and draws the AppModel every frame.
/// It never mutates the model: everything it wants goes through `emit`.
class ViewerApp
{
public:
    using Emit = std::function<void(Event)>;

    ViewerApp(const Orchestrator& core, std::string endpoint, Emit emit);
    ~ViewerApp();

    // Keys, characters and wheel of the current frame.
    void pollInput();
    void drawUI();

private:
    // base views
    void drawView(ViewMode mode);
    void drawStatusBar();
    void drawFooter();
    void drawEntries(const ImVec2& size);
    void drawDetail(bool raw);
    void drawQuery();
    void drawFields();
    void drawMetricsDashboard();
    void drawMetricDetail();
    void drawTransactionNames();
    void drawPerspectives();
    void drawChat(const ImVec2& size);

    // overlays, drawn over the view below them
    void drawOverlay(ViewMode mode);
    bool beginModal(const char* title, const ImVec2& size);
    void endModal();
    void drawInputLine(const char* prompt, const std::string& text, const char* hint);
    void drawHelp();
    void drawErrorModal();
    void drawQuitConfirm();
    void drawCredentials();
    void drawConfigExplain();
    void drawConfigWatch();
    void drawConfigUnavailable();

    // shared widgets
    void drawScrolledLines(const std::vector<std::string>& lines, int offset);
    bool cursorRow(int index, int cursor, const char* label);
    void reportSize(const ImVec2& body);
    ViewMode backgroundView() const;

private:
    const Orchestrator& _core;
    std::string _endpoint;
    Emit _emit;

    ViewerTracePanel _tracePanel;

    // last size reported to the core, in text cells
    int _cols;
    int _rows;
    // selection seen at the previous frame, to scroll a moved cursor into view
    int _lastSelected;
    ViewMode _lastMode;
};
