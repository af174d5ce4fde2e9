#include "Orchestrator.hpp"
#include "format.hpp"
#include "keymap.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace
{
    // Scroll keys of text viewports. False for anything else.
    bool viewportScroll(int& offset, size_t lines, const std::string& key)
    {
        const int last = lines == 0 ? 0 : int(lines) - 1;
        switch (getAction(key))
        {
            case Action::ScrollUp:   offset -= 1; break;
            case Action::ScrollDown: offset += 1; break;
            case Action::PageUp:     offset -= 10; break;
            case Action::PageDown:   offset += 10; break;
            case Action::GoTop:      offset = 0; break;
            case Action::GoBottom:   offset = last; break;
            default: return false;
        }
        offset = std::clamp(offset, 0, last);
        return true;
    }
}

bool Orchestrator::isTypingActive() const
{
    const ViewMode mode = _m.views.current();
    if (isTextInputView(mode))
        return true;
    if (mode == ViewMode::Fields && _m.fieldsSearchMode)
        return true;
    return mode == ViewMode::Chat && _m.chatInputFocused;
}

void Orchestrator::onKey(const KeyEvent& ev)
{
    const std::string& key = ev.key;
    if (key == "ctrl+c")
    {
        _m.quit = true;
        return;
    }

    const ViewMode mode = _m.views.current();
    if (getAction(key) == Action::Help && !isTypingActive()
        && mode != ViewMode::Help && mode != ViewMode::ErrorModal && mode != ViewMode::QuitConfirm)
    {
        _m.helpScroll = 0;
        _m.views.pushView(ViewMode::Help);
        return;
    }

    switch (mode)
    {
        case ViewMode::Entries:                    handleEntriesKey(key); break;
        case ViewMode::Search:                     handleSearchKey(key); break;
        case ViewMode::Detail:
        case ViewMode::DetailRaw:                  handleDetailKey(key); break;
        case ViewMode::IndexPicker:                handleIndexKey(key); break;
        case ViewMode::Query:                      handleQueryKey(key); break;
        case ViewMode::Fields:                     handleFieldsKey(key); break;
        case ViewMode::MetricsDashboard:           handleMetricsDashboardKey(key); break;
        case ViewMode::MetricDetail:               handleMetricDetailKey(key); break;
        case ViewMode::TransactionNames:           handleTraceNamesKey(key); break;
        case ViewMode::PerspectiveList:            handlePerspectiveKey(key); break;
        case ViewMode::ErrorModal:                 handleErrorModalKey(key); break;
        case ViewMode::QuitConfirm:                handleQuitConfirmKey(key); break;
        case ViewMode::Help:                       handleHelpKey(key); break;
        case ViewMode::Chat:                       handleChatKey(key); break;
        case ViewMode::Credentials:                handleCredentialsKey(key); break;
        case ViewMode::CollectorConfigExplain:     handleConfigExplainKey(key); break;
        case ViewMode::CollectorConfigWatch:       handleConfigWatchKey(key); break;
        case ViewMode::CollectorConfigUnavailable: handleConfigUnavailableKey(key); break;
    }
}

// ---------- entry list ----------
void Orchestrator::handleEntriesKey(const std::string& key)
{
    const Action action = getAction(key);
    const int last = _m.entries.empty() ? 0 : int(_m.entries.size()) - 1;

    switch (action)
    {
        case Action::Back:
            // walk up the trace hierarchy
            if (_m.signal == SignalType::Traces)
            {
                if (_m.traceLevel == TraceLevel::Spans)
                {
                    _m.traceLevel = TraceLevel::Transactions;
                    _m.selectedTraceId.clear();
                    _m.selection.reset(_m.entries.size());
                    fetchEntries();
                    return;
                }
                if (_m.traceLevel == TraceLevel::Transactions)
                {
                    _m.traceLevel = TraceLevel::Names;
                    _m.selectedTxName.clear();
                    _m.views.setBase(ViewMode::TransactionNames);
                    fetchTransactionNames();
                    return;
                }
            }
            if (_m.signal == SignalType::Metrics && _m.metricsViewMode == MetricsViewMode::Documents)
            {
                _m.metricsViewMode = MetricsViewMode::Aggregated;
                _m.views.setBase(ViewMode::MetricsDashboard);
                fetchMetricsAggregate();
            }
            return;
        case Action::ScrollUp:
            if (_m.selection.moveSelection(-1)) maybeFetchSpansForSelection();
            return;
        case Action::ScrollDown:
            if (_m.selection.moveSelection(1)) maybeFetchSpansForSelection();
            return;
        case Action::GoTop:
            if (_m.selection.setSelectedIndex(0)) maybeFetchSpansForSelection();
            return;
        case Action::GoBottom:
            if (_m.selection.setSelectedIndex(last)) maybeFetchSpansForSelection();
            return;
        case Action::PageUp:
            if (_m.selection.moveSelection(-10)) maybeFetchSpansForSelection();
            return;
        case Action::PageDown:
            if (_m.selection.moveSelection(10)) maybeFetchSpansForSelection();
            return;
        case Action::Search:
            enterSearch();
            return;
        case Action::Select:
            if (!_m.entries.empty())
                openDetail(DetailSource::Entries);
            return;
        case Action::Refresh:
            fetchEntries();
            return;
        case Action::AutoRefresh:
            _m.autoRefresh = !_m.autoRefresh;
            setStatus(_m.autoRefresh ? "Auto-refresh on" : "Auto-refresh off");
            return;
        case Action::Query:
            _m.queryFormat = QueryFormat::Esql;
            _m.views.pushView(ViewMode::Query);
            return;
        case Action::Fields:
            _m.fieldsCursor = 0;
            _m.fieldsSearch.clear();
            _m.fieldsSearchMode = false;
            _m.views.pushView(ViewMode::Fields);
            fetchFieldCaps();
            return;
        case Action::Sort:
            _m.sortAscending = !_m.sortAscending;
            fetchEntries();
            return;
        case Action::CycleLookback:
            cycleLookback();
            fetchEntries();
            return;
        case Action::CycleSignal:
            cycleSignalType();
            return;
        case Action::Perspective:
            cyclePerspective();
            return;
        case Action::OpenBrowser:
            if (prepareWebUrl())
                showCredentials();
            return;
        case Action::Credentials:
            if (prepareWebUrl())
                _m.views.pushView(ViewMode::Credentials);
            return;
        case Action::CollectorConfig:
            _m.views.pushView(ViewMode::CollectorConfigExplain);
            return;
        case Action::Chat:
            enterChat();
            return;
        case Action::Spans:
        {
            const int idx = _m.selection.selectedIndex();
            if (_m.signal == SignalType::Traces && idx >= 0 && size_t(idx) < _m.entries.size() && !_m.entries[size_t(idx)].traceId.empty())
                drillIntoTrace(_m.entries[size_t(idx)].traceId);
            return;
        }
        case Action::Quit:
            _m.views.pushView(ViewMode::QuitConfirm);
            return;
        default:
            break;
    }

    if (key == "1") setLevelFilter("ERROR");
    else if (key == "2") setLevelFilter("WARN");
    else if (key == "3") setLevelFilter("INFO");
    else if (key == "4") setLevelFilter("DEBUG");
    else if (key == "0") setLevelFilter("");
    else if (key == "i")
    {
        _m.indexInput.set(_m.index);
        _m.views.pushView(ViewMode::IndexPicker);
    }
    else if (key == "t")
    {
        _m.timeMode = nextTimeDisplay(_m.timeMode);
    }
    else if (key == "d" && _m.signal == SignalType::Metrics)
    {
        // documents back to the dashboard
        _m.metricsViewMode = MetricsViewMode::Aggregated;
        _m.views.setBase(ViewMode::MetricsDashboard);
        fetchMetricsAggregate();
    }
}

// ---------- text inputs ----------
void Orchestrator::handleSearchKey(const std::string& key)
{
    if (key == "esc")
    {
        _m.views.popView();
        return;
    }
    if (key == "enter")
    {
        _m.searchQuery = _m.searchInput.text;
        _m.selection.resetScroll();
        _m.views.popView();
        refreshCurrentView();
        return;
    }
    _m.searchInput.handleKey(key);
}

void Orchestrator::handleIndexKey(const std::string& key)
{
    if (key == "esc")
    {
        _m.views.popView();
        return;
    }
    if (key == "enter")
    {
        if (!_m.indexInput.empty())
            _m.index = _m.indexInput.text;
        _m.views.popView();
        refreshCurrentView();
        return;
    }
    _m.indexInput.handleKey(key);
}

// ---------- detail ----------
void Orchestrator::handleDetailKey(const std::string& key)
{
    const ViewMode mode = _m.views.current();
    const auto& list = detailList();
    const int idx = detailIndex();
    const bool hasEntry = idx >= 0 && size_t(idx) < list.size();

    if (key == "esc" || key == "q" || key == "backspace")
    {
        _m.views.popView();
        return;
    }
    if (key == "left" || key == "right")
    {
        const int delta = key == "left" ? -1 : 1;
        if (_m.detailSource == DetailSource::Entries)
        {
            if (_m.selection.moveSelection(delta))
            {
                updateDetailContent();
                maybeFetchSpansForSelection();
            }
        }
        else
        {
            const int next = std::clamp(_m.metricDocCursor + delta, 0, std::max(0, int(_m.metricDocs.size()) - 1));
            if (next != _m.metricDocCursor)
            {
                _m.metricDocCursor = next;
                updateDetailContent();
            }
        }
        return;
    }
    if (key == "enter" || key == "J")
    {
        // swap detail and raw without growing the stack
        _m.views.popView();
        _m.views.pushView(mode == ViewMode::Detail ? ViewMode::DetailRaw : ViewMode::Detail);
        updateDetailContent();
        return;
    }
    if (key == "y")
    {
        if (hasEntry)
            copyToClipboard(prettyJson(list[size_t(idx)].raw), "Copied JSON to clipboard!");
        return;
    }
    if (key == "s" || key == "S")
    {
        if (_m.signal == SignalType::Traces && _m.detailSource == DetailSource::Entries && hasEntry && !list[size_t(idx)].traceId.empty())
            drillIntoTrace(list[size_t(idx)].traceId);
        return;
    }
    viewportScroll(_m.detailScroll, _m.detailLines.size(), key);
}

// ---------- query overlay ----------
void Orchestrator::handleQueryKey(const std::string& key)
{
    if (key == "esc" || key == "q" || key == "Q")
        _m.views.popView();
    else if (key == "k")
        _m.queryFormat = QueryFormat::Esql;
    else if (key == "c")
        _m.queryFormat = QueryFormat::Curl;
    else if (key == "y")
        copyToClipboard(queryOverlayText(), "Query copied to clipboard!");
}

// ---------- field picker ----------
void Orchestrator::handleFieldsKey(const std::string& key)
{
    if (_m.fieldsSearchMode)
    {
        if (key == "esc")
        {
            _m.fieldsSearchMode = false;
            _m.fieldsSearch.clear();
        }
        else if (key == "enter")
        {
            _m.fieldsSearchMode = false;
        }
        else
        {
            _m.fieldsSearch.handleKey(key);
        }
        _m.fieldsCursor = 0;
        return;
    }

    const auto rows = sortedFieldList();
    if (isNavKey(key))
    {
        _m.fieldsCursor = std::max(0, listNav(_m.fieldsCursor, int(rows.size()), key));
        return;
    }

    if (key == "esc" || key == "q")
    {
        _m.views.popView();
    }
    else if (key == "space" || key == "enter")
    {
        if (_m.fieldsCursor < 0 || size_t(_m.fieldsCursor) >= rows.size())
            return;
        const std::string& name = rows[size_t(_m.fieldsCursor)].name;
        auto it = std::find_if(_m.fields.begin(), _m.fields.end(), [&](const DisplayField& f) { return f.name == name; });
        if (it != _m.fields.end())
            _m.fields.erase(it);
        else
            _m.fields.push_back(makeCustomField(name));
    }
    else if (key == "/")
    {
        _m.fieldsSearchMode = true;
        _m.fieldsSearch.clear();
    }
    else if (key == "r")
    {
        _m.fields = defaultFields(_m.signal);
        setStatus("Fields reset to defaults");
    }
}

// ---------- metrics ----------
void Orchestrator::handleMetricsDashboardKey(const std::string& key)
{
    if (isNavKey(key))
    {
        _m.metricsCursor = std::max(0, listNav(_m.metricsCursor, int(_m.metrics.metrics.size()), key));
        return;
    }

    switch (getAction(key))
    {
        case Action::Select:
            if (_m.metricsCursor >= 0 && size_t(_m.metricsCursor) < _m.metrics.metrics.size())
            {
                _m.metricDocCursor = 0;
                _m.metricDocs.clear();
                _m.views.pushView(ViewMode::MetricDetail);
                fetchMetricDocs();
            }
            return;
        case Action::Refresh:
            fetchMetricsAggregate();
            return;
        case Action::Perspective:
            cyclePerspective();
            return;
        case Action::CycleLookback:
            cycleLookback();
            fetchMetricsAggregate();
            return;
        case Action::CycleSignal:
            cycleSignalType();
            return;
        case Action::Search:
            enterSearch();
            return;
        case Action::Query:
            _m.queryFormat = QueryFormat::Esql;
            _m.views.pushView(ViewMode::Query);
            return;
        case Action::OpenBrowser:
            if (prepareWebUrl())
                showCredentials();
            return;
        case Action::CollectorConfig:
            _m.views.pushView(ViewMode::CollectorConfigExplain);
            return;
        case Action::Chat:
            enterChat();
            return;
        case Action::Quit:
            _m.views.pushView(ViewMode::QuitConfirm);
            return;
        default:
            break;
    }

    if (key == "d")
    {
        _m.metricsViewMode = MetricsViewMode::Documents;
        _m.views.setBase(ViewMode::Entries);
        _m.selection.reset(_m.entries.size());
        fetchEntries();
    }
    else if (key == "i")
    {
        _m.indexInput.set(_m.index);
        _m.views.pushView(ViewMode::IndexPicker);
    }
}

void Orchestrator::handleMetricDetailKey(const std::string& key)
{
    const int metricCount = int(_m.metrics.metrics.size());
    const int docCount = int(_m.metricDocs.size());
    const bool hasDoc = _m.metricDocCursor >= 0 && _m.metricDocCursor < docCount;

    if (key == "esc" || key == "backspace" || key == "q")
    {
        _m.views.popView();
    }
    else if (key == "left" || key == "right")
    {
        const int next = _m.metricsCursor + (key == "left" ? -1 : 1);
        if (next < 0 || next >= metricCount)
            return;
        _m.metricsCursor = next;
        _m.metricDocCursor = 0;
        _m.metricDocs.clear();
        fetchMetricDocs();
    }
    else if (key == "a" || key == "N")
    {
        if (_m.metricDocCursor > 0)
            --_m.metricDocCursor;
    }
    else if (key == "d" || key == "n")
    {
        if (_m.metricDocCursor < docCount - 1)
            ++_m.metricDocCursor;
    }
    else if (key == "j" || key == "J")
    {
        if (hasDoc)
            openDetail(DetailSource::MetricDocs);
    }
    else if (key == "y")
    {
        if (hasDoc)
            copyToClipboard(prettyJson(_m.metricDocs[size_t(_m.metricDocCursor)].raw), "Copied JSON to clipboard!");
    }
    else if (key == "r")
    {
        fetchMetricsAggregate();
        fetchMetricDocs();
    }
    else if (key == "K")
    {
        if (prepareWebUrl())
            showCredentials();
    }
}

// ---------- traces ----------
void Orchestrator::handleTraceNamesKey(const std::string& key)
{
    if (isNavKey(key))
    {
        _m.traceNamesCursor = std::max(0, listNav(_m.traceNamesCursor, int(_m.transactionNames.size()), key));
        return;
    }

    switch (getAction(key))
    {
        case Action::Select:
            if (_m.traceNamesCursor >= 0 && size_t(_m.traceNamesCursor) < _m.transactionNames.size())
            {
                _m.selectedTxName = _m.transactionNames[size_t(_m.traceNamesCursor)].name;
                _m.traceLevel = TraceLevel::Transactions;
                _m.views.setBase(ViewMode::Entries);
                _m.selection.reset(_m.entries.size());
                fetchEntries();
            }
            return;
        case Action::Refresh:
            fetchTransactionNames();
            return;
        case Action::Perspective:
            cyclePerspective();
            return;
        case Action::CycleLookback:
            cycleLookback();
            fetchTransactionNames();
            return;
        case Action::CycleSignal:
            cycleSignalType();
            return;
        case Action::Search:
            enterSearch();
            return;
        case Action::OpenBrowser:
            if (prepareWebUrl())
                showCredentials();
            return;
        case Action::CollectorConfig:
            _m.views.pushView(ViewMode::CollectorConfigExplain);
            return;
        case Action::Chat:
            enterChat();
            return;
        case Action::Quit:
            _m.views.pushView(ViewMode::QuitConfirm);
            return;
        default:
            break;
    }
    if (key == "i")
    {
        _m.indexInput.set(_m.index);
        _m.views.pushView(ViewMode::IndexPicker);
    }
}

// ---------- perspectives ----------
void Orchestrator::handlePerspectiveKey(const std::string& key)
{
    if (isNavKey(key))
    {
        _m.perspectiveCursor = std::max(0, listNav(_m.perspectiveCursor, int(_m.perspectiveItems.size()), key));
        return;
    }

    if (key == "enter")
    {
        if (_m.perspectiveCursor < 0 || size_t(_m.perspectiveCursor) >= _m.perspectiveItems.size())
            return;
        const std::string& name = _m.perspectiveItems[size_t(_m.perspectiveCursor)].name;
        const bool services = _m.perspective == PerspectiveType::Services;
        std::string& filter = services ? _m.serviceFilter : _m.resourceFilter;
        bool& negate = services ? _m.negateService : _m.negateResource;
        const std::string what = services ? "service" : "resource";

        // include -> exclude -> cleared
        if (filter != name)
        {
            filter = name;
            negate = false;
            setStatus("Filtered to " + what + ": " + name);
        }
        else if (!negate)
        {
            negate = true;
            setStatus("Excluding " + what + ": " + name);
        }
        else
        {
            filter.clear();
            negate = false;
            setStatus("Cleared " + what + " filter: " + name);
        }
        _m.selection.resetScroll();
    }
    else if (key == "p")
    {
        cyclePerspective();
    }
    else if (key == "l")
    {
        cycleLookback();
        fetchPerspective();
    }
    else if (key == "r")
    {
        fetchPerspective();
    }
    else if (key == "/")
    {
        enterSearch();
    }
    else if (key == "esc" || key == "q" || key == "backspace")
    {
        _m.views.popView();
        // filters may have changed while the list was open
        refreshCurrentView();
    }
}

// ---------- modals ----------
void Orchestrator::handleErrorModalKey(const std::string& key)
{
    if (key == "y")
    {
        copyToClipboard(_m.err, "Error copied to clipboard!");
        return;
    }
    if (key == "esc" || key == "q")
    {
        _m.views.popView();
        _m.err.clear();
        return;
    }
    const auto lines = wrapLines(_m.err, _m.width > 8 ? std::min(_m.width - 8, 72) : 0);
    viewportScroll(_m.errorScroll, lines.size(), key);
}

void Orchestrator::handleQuitConfirmKey(const std::string& key)
{
    if (key == "y" || key == "Y")
        _m.quit = true;
    else if (key == "n" || key == "N" || key == "esc")
        _m.views.popView();
}

void Orchestrator::handleHelpKey(const std::string& key)
{
    if (key == "esc" || key == "q" || getAction(key) == Action::Help)
    {
        _m.views.popView();
        return;
    }
    size_t lines = 0;
    for (const auto& g : helpGroups())
        lines += g.hints.size() + 2;
    viewportScroll(_m.helpScroll, lines, key);
}

void Orchestrator::handleChatKey(const std::string& key)
{
    if (!_m.chatInputFocused)
    {
        switch (getAction(key))
        {
            case Action::ScrollUp:   _m.chatScroll += 1; return;
            case Action::ScrollDown: _m.chatScroll = std::max(0, _m.chatScroll - 1); return;
            case Action::PageUp:     _m.chatScroll += 10; return;
            case Action::PageDown:   _m.chatScroll = std::max(0, _m.chatScroll - 10); return;
            case Action::GoBottom:   _m.chatScroll = 0; return;
            default: break;
        }
        if (key == "i" || key == "enter" || key == "/")
            _m.chatInputFocused = true;
        else if (key == "esc")
            _m.views.popView();
        else if (key == "q")
            _m.views.pushView(ViewMode::QuitConfirm);
        return;
    }

    if (key == "enter")
    {
        submitChat();
        return;
    }
    if (key == "esc")
    {
        _m.chatInputFocused = false;
        return;
    }
    _m.chatInput.handleKey(key);
}

void Orchestrator::handleCredentialsKey(const std::string& key)
{
    switch (getAction(key))
    {
        case Action::Back:
            _m.lastWebUrl.clear();
            _m.views.popView();
            return;
        case Action::Select:
            // modal stays open
            openWebUrl();
            return;
        case Action::Copy:
            if (!_m.lastWebUrl.empty())
                copyToClipboard(_m.lastWebUrl, "URL copied to clipboard!");
            return;
        default:
            break;
    }

    if (key == "n")
    {
        _m.hideCredentials = true;
        _m.lastWebUrl.clear();
        _m.views.popView();
        setStatus("Credentials hidden for this session");
    }
    else if (key == "p")
    {
        if (!_settings.webPassword.empty())
            copyToClipboard(_settings.webPassword, "Password copied to clipboard!");
    }
}

void Orchestrator::handleConfigExplainKey(const std::string& key)
{
    if (key == "enter" || key == "o" || key == "O")
    {
        _m.views.popView();
        startConfigWatch();
    }
    else if (key == "esc")
    {
        _m.views.popView();
    }
}

void Orchestrator::handleConfigWatchKey(const std::string& key)
{
    if (key == "y")
    {
        copyToClipboard(_settings.configPath, "Path copied to clipboard!");
    }
    else if (key == "Y")
    {
        if (!_m.configValid && !_m.configStatus.empty())
            copyToClipboard(_m.configStatus, "Error copied to clipboard!");
    }
    else if (key == "esc")
    {
        _m.views.popView();
        _m.watchingConfig = false;
        spdlog::info("stopped watching {}", _settings.configPath);
    }
}

void Orchestrator::handleConfigUnavailableKey(const std::string& key)
{
    if (key == "esc" || key == "enter" || key == "o" || key == "O")
        _m.views.popView();
}
