#pragma once
#include <cstddef>
#include <vector>

enum class ViewMode
{
    Entries,
    Search,
    Detail,
    DetailRaw,
    IndexPicker,
    Query,
    Fields,
    MetricsDashboard,
    MetricDetail,
    TransactionNames,
    PerspectiveList,
    ErrorModal,
    QuitConfirm,
    Help,
    Chat,
    Credentials,
    CollectorConfigExplain,
    CollectorConfigWatch,
    CollectorConfigUnavailable,
};

const char* viewModeName(ViewMode mode);

// Entry list, dashboard, transaction names and chat sit at the bottom of a path.
bool isBaseView(ViewMode mode);
// Drawn over peek()'s view instead of replacing it.
bool isOverlayView(ViewMode mode);
// Views that own a text field; global hotkeys are off while they are active.
bool isTextInputView(ViewMode mode);

/// @brief Active view plus the stack of its ancestors.
class ViewStack
{
public:
    explicit ViewStack(ViewMode base = ViewMode::Entries);

    ViewMode current() const { return _current; }

    void pushView(ViewMode mode);
    bool popView();
    // top frame, or current() when empty
    ViewMode peek() const;
    void clear();

    // Lateral move between base views; drops the history.
    void setBase(ViewMode mode);

    size_t depth() const { return _frames.size(); }
    const std::vector<ViewMode>& frames() const { return _frames; }

private:
    ViewMode _current;
    std::vector<ViewMode> _frames;
};
