#include "Orchestrator.hpp"
#include "JsonStore.hpp"
#include "format.hpp"
#include "keymap.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>

namespace
{
    std::string lowered(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return char(std::tolower(c)); });
        return s;
    }

    int clampCursor(int cursor, size_t len)
    {
        if (len == 0 || cursor < 0) return 0;
        return std::min(cursor, int(len) - 1);
    }
}

Orchestrator::Orchestrator(FetchPipeline& pipeline, RequestTracker& tracker, Integrations integrations, OrchestratorSettings settings, WallFn wall, SteadyFn steady)
    : _m{}
    , _pipeline{ pipeline }
    , _tracker{ tracker }
    , _io{ std::move(integrations) }
    , _settings{ std::move(settings) }
    , _wall{ wall ? std::move(wall) : WallFn([] { return std::chrono::system_clock::now(); }) }
    , _steady{ steady ? std::move(steady) : SteadyFn([] { return Clock::now(); }) }
    , _nextTick{}
    , _configWatch{}
{
    _m.configPath = _settings.configPath;
}

void Orchestrator::start(SignalType signal, Lookback lookback, const std::string& index)
{
    _m.signal = signal;
    _m.lookback = lookback;
    _m.index = index.empty() ? signalIndexPattern(signal) : index;
    _m.fields = defaultFields(signal);
    _nextTick = _steady() + _settings.tickInterval;
    setStatus("Auto-detecting time range...");
    spdlog::info("starting on {} ({})", signalName(signal), _m.index);
    enterSignalView();
}

void Orchestrator::setTickInterval(std::chrono::milliseconds interval)
{
    _settings.tickInterval = interval;
    _nextTick = _steady() + interval;
}

void Orchestrator::handle(const Event& ev)
{
    std::visit([this](const auto& e)
    {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, KeyEvent>) onKey(e);
        else if constexpr (std::is_same_v<T, MouseEvent>) onMouse(e);
        else if constexpr (std::is_same_v<T, ResizeEvent>) onResize(e);
        else if constexpr (std::is_same_v<T, TickEvent>) onTick(e);
        else if constexpr (std::is_same_v<T, ErrorEvent>) onError(e);
        else onResult(e);
    }, ev);
}

// ---------- async classification ----------
bool Orchestrator::isStale(RequestKind kind, uint64_t id) const
{
    if (_tracker.isLatest(kind, id))
        return false;
    spdlog::debug("discarding superseded {} result #{}", requestKindName(kind), id);
    return true;
}

bool Orchestrator::handleAsyncError(const std::optional<FetchError>& err)
{
    if (!err)
        return false;
    if (err->isContextError())
    {
        spdlog::debug("request ended silently: {}", err->message);
        return true;
    }
    spdlog::warn("request failed: {}", err->message);
    _m.err = err->message;
    showErrorModal();
    return true;
}

void Orchestrator::showErrorModal()
{
    _m.errorScroll = 0;
    // a second error replaces the text of the open modal
    if (_m.views.current() != ViewMode::ErrorModal)
        _m.views.pushView(ViewMode::ErrorModal);
}

void Orchestrator::onError(const ErrorEvent& ev)
{
    spdlog::warn("error: {}", ev.message);
    _m.err = ev.message;
    showErrorModal();
}

// ---------- results ----------
void Orchestrator::onResult(const EntriesResult& r)
{
    if (isStale(RequestKind::Entries, r.requestId))
        return;
    _m.loading = false;
    _m.lastRefresh = _wall();
    if (handleAsyncError(r.error))
        return;

    _m.entries = r.entries;
    _m.total = r.total;
    _m.err.clear();
    _m.lastQuery = r.query;
    _m.lastQueryIndex = r.index;
    _m.selection.refresh(_m.entries.size(), _m.sortAscending);

    if (_m.signal != SignalType::Traces)
        _m.lastFetchedTraceId.clear();
    else
        maybeFetchSpansForSelection();
}

void Orchestrator::onResult(const FieldCapsResult& r)
{
    if (isStale(RequestKind::FieldMetadata, r.requestId))
        return;
    _m.fieldsLoading = false;
    if (handleAsyncError(r.error))
        return;
    _m.availableFields = r.fields;
    _m.fieldsCursor = clampCursor(_m.fieldsCursor, sortedFieldList().size());
}

void Orchestrator::onResult(const AutoDetectResult& r)
{
    if (isStale(RequestKind::AutoDetectRange, r.requestId))
        return;
    if (r.error)
    {
        // keep the current lookback; superseded probes never get here
        if (r.error->isContextError())
            spdlog::debug("auto-detect {}", r.error->message);
        else
            spdlog::warn("auto-detect failed: {}", r.error->message);
        startInitialFetch();
        return;
    }

    _m.lookback = r.lookback;
    setStatus("Found " + std::to_string(r.total) + " entries in " + lookbackName(r.lookback));
    startInitialFetch();
}

void Orchestrator::onResult(const MetricsAggregateResult& r)
{
    if (isStale(RequestKind::MetricsAggregate, r.requestId))
        return;
    _m.metricsLoading = false;
    if (handleAsyncError(r.error))
        return;
    _m.metrics = r.result;
    _m.err.clear();
    _m.metricsCursor = clampCursor(_m.metricsCursor, _m.metrics.metrics.size());
}

void Orchestrator::onResult(const MetricDetailDocsResult& r)
{
    if (isStale(RequestKind::MetricDetailDocuments, r.requestId))
        return;
    _m.metricDocsLoading = false;
    if (handleAsyncError(r.error))
        return;
    _m.metricDocs = r.docs;
    _m.metricDocCursor = clampCursor(_m.metricDocCursor, _m.metricDocs.size());
}

void Orchestrator::onResult(const TransactionNamesResult& r)
{
    if (isStale(RequestKind::TransactionNames, r.requestId))
        return;
    _m.tracesLoading = false;
    if (handleAsyncError(r.error))
        return;
    _m.transactionNames = r.names;
    _m.err.clear();
    _m.traceNamesCursor = clampCursor(_m.traceNamesCursor, _m.transactionNames.size());
}

void Orchestrator::onResult(const SpansResult& r)
{
    if (isStale(RequestKind::Spans, r.requestId))
        return;
    _m.spansLoading = false;
    if (handleAsyncError(r.error))
        return;
    if (r.traceId == _m.lastFetchedTraceId)
        _m.spans = r.spans;
}

void Orchestrator::onResult(const PerspectiveResult& r)
{
    if (isStale(RequestKind::PerspectiveRollup, r.requestId))
        return;
    _m.perspectiveLoading = false;
    if (handleAsyncError(r.error))
        return;
    _m.perspectiveItems = r.items;
    _m.perspectiveCursor = clampCursor(_m.perspectiveCursor, _m.perspectiveItems.size());
    setStatus("Loaded " + std::to_string(r.items.size()) + " " + lowered(perspectiveName(r.type)));
}

void Orchestrator::onResult(const ChatResult& r)
{
    if (isStale(RequestKind::Chat, r.requestId))
        return;
    _m.chatLoading = false;
    if (r.error)
    {
        if (r.error->isContextError())
            return;
        // chat failures stay in the conversation
        spdlog::warn("chat failed: {}", r.error->message);
        ChatMessage msg;
        msg.role = "assistant";
        msg.content = "Error: " + r.error->message;
        msg.timestamp = _wall();
        msg.error = true;
        _m.chatMessages.push_back(std::move(msg));
        return;
    }
    if (!r.conversationId.empty())
        _m.conversationId = r.conversationId;
    ChatMessage msg = r.message;
    if (msg.role.empty()) msg.role = "assistant";
    if (msg.timestamp == SysTime{}) msg.timestamp = _wall();
    _m.chatMessages.push_back(std::move(msg));
}

// ---------- input ----------
void Orchestrator::onMouse(const MouseEvent& ev)
{
    const ViewMode mode = _m.views.current();
    if (ev.kind == MouseEvent::Kind::Click)
    {
        if (ev.target == "sort" && mode == ViewMode::Entries)
        {
            _m.sortAscending = !_m.sortAscending;
            fetchEntries();
        }
        else if (ev.target.rfind("row:", 0) == 0 && mode == ViewMode::Entries)
        {
            const char* digits = ev.target.c_str() + 4;
            char* end = nullptr;
            errno = 0;
            const long row = std::strtol(digits, &end, 10);
            if (end == digits || *end != '\0' || errno != 0 || row < 0 || row > 2147483647L)
                return;
            if (_m.selection.setSelectedIndex(int(row)))
                maybeFetchSpansForSelection();
        }
        return;
    }

    const int dir = ev.kind == MouseEvent::Kind::WheelUp ? -1 : 1;
    auto wheel = [dir](int& cursor, size_t len)
    {
        cursor = clampCursor(cursor + 2 * dir, len);
    };
    switch (mode)
    {
        case ViewMode::Entries:
            if (_m.selection.moveSelection(2 * dir))
                maybeFetchSpansForSelection();
            break;
        case ViewMode::Detail:
        case ViewMode::DetailRaw:
            scrollDetail(3 * dir);
            break;
        case ViewMode::Fields:
            wheel(_m.fieldsCursor, sortedFieldList().size());
            break;
        case ViewMode::MetricsDashboard:
            wheel(_m.metricsCursor, _m.metrics.metrics.size());
            break;
        case ViewMode::TransactionNames:
            wheel(_m.traceNamesCursor, _m.transactionNames.size());
            break;
        case ViewMode::PerspectiveList:
            wheel(_m.perspectiveCursor, _m.perspectiveItems.size());
            break;
        case ViewMode::ErrorModal:
            _m.errorScroll = std::max(0, _m.errorScroll + 3 * dir);
            break;
        case ViewMode::Help:
            _m.helpScroll = std::max(0, _m.helpScroll + 3 * dir);
            break;
        case ViewMode::Chat:
            // counted from the newest message
            _m.chatScroll = std::max(0, _m.chatScroll - 3 * dir);
            break;
        default:
            break;
    }
}

void Orchestrator::onResize(const ResizeEvent& ev)
{
    _m.width = ev.width;
    _m.height = ev.height;
    const ViewMode mode = _m.views.current();
    if (mode == ViewMode::Detail || mode == ViewMode::DetailRaw)
        rewrapDetail();
}

void Orchestrator::onTick(const TickEvent& ev)
{
    _nextTick = ev.now + _settings.tickInterval;
    if (!_m.statusMessage.empty() && ev.now >= _m.statusUntil)
        _m.statusMessage.clear();
    checkConfigWatch();
    if (_m.autoRefresh && _m.views.current() == ViewMode::Entries)
        fetchEntries();
}

// ---------- fetches ----------
QueryFilters Orchestrator::baseFilters() const
{
    QueryFilters f;
    f.index = _m.index;
    f.lookback = _m.lookback;
    f.service = _m.serviceFilter;
    f.negateService = _m.negateService;
    f.resource = _m.resourceFilter;
    f.negateResource = _m.negateResource;
    return f;
}

SearchOptions Orchestrator::entriesOptions() const
{
    SearchOptions o;
    static_cast<QueryFilters&>(o) = baseFilters();
    o.level = _m.levelFilter;
    o.size = kEntriesSize;
    o.sortAscending = _m.sortAscending;
    o.searchFields = collectSearchFields(_m.fields);
    if (_m.signal == SignalType::Traces)
    {
        switch (_m.traceLevel)
        {
            case TraceLevel::Transactions:
                o.processorEvent = "transaction";
                o.transactionName = _m.selectedTxName;
                break;
            case TraceLevel::Spans:
                // every event of the trace
                o.traceId = _m.selectedTraceId;
                break;
            default:
                o.processorEvent = "transaction";
                break;
        }
    }
    return o;
}

void Orchestrator::fetchEntries()
{
    _m.loading = true;
    _pipeline.fetchEntries(entriesOptions(), _m.searchQuery, _pipeline.timeouts().logs);
}

void Orchestrator::fetchMetricsAggregate()
{
    _m.metricsLoading = true;
    _pipeline.fetchMetricsAggregate(baseFilters());
}

void Orchestrator::fetchMetricDocs()
{
    if (_m.metricsCursor < 0 || size_t(_m.metricsCursor) >= _m.metrics.metrics.size())
        return;
    _m.metricDocsLoading = true;
    _pipeline.fetchMetricDetailDocs(baseFilters(), _m.metrics.metrics[size_t(_m.metricsCursor)].name);
}

void Orchestrator::fetchTransactionNames()
{
    _m.tracesLoading = true;
    QueryFilters f = baseFilters();
    f.processorEvent = "transaction";
    _pipeline.fetchTransactionNames(f);
}

void Orchestrator::fetchPerspective()
{
    _m.perspectiveLoading = true;
    _pipeline.fetchPerspective(_m.perspective, _m.lookback);
}

void Orchestrator::fetchFieldCaps()
{
    _m.fieldsLoading = true;
    _pipeline.fetchFieldCaps(_m.index);
}

void Orchestrator::autoDetect()
{
    QueryFilters f = baseFilters();
    if (_m.signal == SignalType::Traces)
        f.processorEvent = "transaction";
    _pipeline.autoDetectLookback(f);
}

bool Orchestrator::needsSpanFetch(const std::string& traceId) const
{
    if (traceId.empty())
        return false;
    if (traceId == _m.lastFetchedTraceId && (_m.spansLoading || !_m.spans.empty()))
        return false;
    return true;
}

void Orchestrator::maybeFetchSpansForSelection()
{
    if (_m.signal != SignalType::Traces)
        return;
    const int idx = _m.selection.selectedIndex();
    if (_m.entries.empty() || idx < 0 || size_t(idx) >= _m.entries.size())
    {
        _m.lastFetchedTraceId.clear();
        return;
    }

    const std::string& traceId = _m.entries[size_t(idx)].traceId;
    if (traceId.empty())
    {
        _m.lastFetchedTraceId.clear();
        return;
    }
    if (!needsSpanFetch(traceId))
        return;

    _m.spansLoading = true;
    _m.lastFetchedTraceId = traceId;
    _m.spans.clear();
    QueryFilters f;
    f.index = _m.index;
    f.lookback = _m.lookback;
    _pipeline.fetchSpans(f, traceId);
}

void Orchestrator::startInitialFetch()
{
    if (_m.signal == SignalType::Metrics && _m.metricsViewMode == MetricsViewMode::Aggregated)
    {
        fetchMetricsAggregate();
        return;
    }
    if (_m.signal == SignalType::Traces && _m.traceLevel == TraceLevel::Names)
    {
        fetchTransactionNames();
        return;
    }
    fetchEntries();
}

void Orchestrator::refreshCurrentView()
{
    switch (_m.views.current())
    {
        case ViewMode::Entries:          fetchEntries(); break;
        case ViewMode::MetricsDashboard: fetchMetricsAggregate(); break;
        case ViewMode::MetricDetail:     fetchMetricDocs(); break;
        case ViewMode::TransactionNames: fetchTransactionNames(); break;
        case ViewMode::PerspectiveList:  fetchPerspective(); break;
        default: break;
    }
}

// ---------- navigation ----------
void Orchestrator::cycleSignalType()
{
    switch (_m.signal)
    {
        case SignalType::Logs:    _m.signal = SignalType::Traces; break;
        case SignalType::Traces:  _m.signal = SignalType::Metrics; break;
        case SignalType::Metrics: _m.signal = SignalType::Logs; break;
    }
    spdlog::info("signal switched to {}", signalName(_m.signal));

    _m.views.clear();
    _m.index = signalIndexPattern(_m.signal);
    _m.fields = defaultFields(_m.signal);
    _m.entries.clear();
    _m.total = 0;
    _m.selection.reset();
    _m.lastFetchedTraceId.clear();
    _m.spans.clear();
    setStatus("Auto-detecting time range...");
    enterSignalView();
}

void Orchestrator::enterSignalView()
{
    switch (_m.signal)
    {
        case SignalType::Metrics:
            _m.views.setBase(ViewMode::MetricsDashboard);
            _m.metricsViewMode = MetricsViewMode::Aggregated;
            _m.metricsCursor = 0;
            _m.loading = false;
            autoDetect();
            fetchMetricsAggregate();
            break;
        case SignalType::Traces:
            _m.views.setBase(ViewMode::TransactionNames);
            _m.traceLevel = TraceLevel::Names;
            _m.traceNamesCursor = 0;
            _m.selectedTxName.clear();
            _m.selectedTraceId.clear();
            _m.loading = false;
            autoDetect();
            fetchTransactionNames();
            break;
        case SignalType::Logs:
            _m.views.setBase(ViewMode::Entries);
            _m.loading = true;
            autoDetect();
            break;
    }
}

void Orchestrator::cyclePerspective()
{
    _m.perspective = _m.perspective == PerspectiveType::Services ? PerspectiveType::Resources : PerspectiveType::Services;
    enterPerspectiveView();
}

void Orchestrator::enterPerspectiveView()
{
    if (_m.views.current() != ViewMode::PerspectiveList)
        _m.views.pushView(ViewMode::PerspectiveList);
    _m.perspectiveCursor = 0;
    _m.perspectiveItems.clear();
    setStatus(std::string("Loading ") + perspectiveName(_m.perspective) + "...");
    fetchPerspective();
}

void Orchestrator::cycleLookback()
{
    _m.lookback = nextLookback(_m.lookback);
}

void Orchestrator::enterSearch()
{
    _m.searchInput.set(_m.searchQuery);
    _m.views.pushView(ViewMode::Search);
}

void Orchestrator::enterChat()
{
    if (!_pipeline.hasChat())
    {
        setStatus("No chat backend configured");
        return;
    }
    if (_m.views.current() != ViewMode::Chat)
        _m.views.pushView(ViewMode::Chat);
    _m.chatInputFocused = true;
}

void Orchestrator::openDetail(DetailSource source)
{
    _m.detailSource = source;
    _m.views.pushView(source == DetailSource::MetricDocs ? ViewMode::DetailRaw : ViewMode::Detail);
    updateDetailContent();
}

void Orchestrator::setLevelFilter(const std::string& level)
{
    _m.levelFilter = level;
    _m.selection.resetScroll();
    fetchEntries();
}

void Orchestrator::drillIntoTrace(const std::string& traceId)
{
    _m.selectedTraceId = traceId;
    _m.traceLevel = TraceLevel::Spans;
    _m.views.setBase(ViewMode::Entries);
    _m.selection.reset(_m.entries.size());
    fetchEntries();
}

// ---------- detail ----------
const std::vector<LogEntry>& Orchestrator::detailList() const
{
    return _m.detailSource == DetailSource::MetricDocs ? _m.metricDocs : _m.entries;
}

int Orchestrator::detailIndex() const
{
    return _m.detailSource == DetailSource::MetricDocs ? _m.metricDocCursor : _m.selection.selectedIndex();
}

void Orchestrator::updateDetailContent()
{
    const auto& list = detailList();
    const int idx = detailIndex();
    if (list.empty() || idx < 0 || size_t(idx) >= list.size())
        return;
    const LogEntry& e = list[size_t(idx)];
    _m.detailText = _m.views.current() == ViewMode::DetailRaw ? prettyJson(e.raw) : renderEntryDetail(e, _m.signal);
    _m.detailScroll = 0;
    rewrapDetail();
}

void Orchestrator::rewrapDetail()
{
    const int columns = _m.width > 4 ? _m.width - 4 : 0;
    _m.detailLines = wrapLines(_m.detailText, columns);
    _m.detailScroll = clampCursor(_m.detailScroll, _m.detailLines.size());
}

void Orchestrator::scrollDetail(int delta)
{
    _m.detailScroll = clampCursor(_m.detailScroll + delta, _m.detailLines.size());
}

// ---------- side effects ----------
void Orchestrator::setStatus(std::string msg)
{
    _m.statusMessage = std::move(msg);
    _m.statusUntil = _steady() + _settings.statusDuration;
}

std::string Orchestrator::activeStatus() const
{
    if (_m.statusMessage.empty() || _steady() >= _m.statusUntil)
        return {};
    return _m.statusMessage;
}

void Orchestrator::copyToClipboard(const std::string& text, const std::string& successMsg)
{
    if (_io.copyText && _io.copyText(text))
        setStatus(successMsg);
    else
        setStatus("Clipboard unavailable");
}

bool Orchestrator::prepareWebUrl()
{
    if (_settings.webUrl.empty())
    {
        setStatus("No web UI configured (ui.web_url)");
        return false;
    }

    const ViewMode mode = _m.views.current();
    std::string query = (mode == ViewMode::MetricsDashboard || mode == ViewMode::MetricDetail) ? _m.metrics.query : _m.lastQuery;
    if (query.empty())
        query = JsonStore::esqlFor(entriesOptions());

    std::string base = _settings.webUrl;
    while (!base.empty() && base.back() == '/')
        base.pop_back();
    _m.lastWebUrl = base + "/app/discover#/?_a=(query:(esql:'" + urlEncode(query) + "'))";
    return true;
}

void Orchestrator::showCredentials()
{
    if (_m.hideCredentials)
    {
        openWebUrl();
        return;
    }
    if (_m.views.current() != ViewMode::Credentials)
        _m.views.pushView(ViewMode::Credentials);
}

void Orchestrator::openWebUrl()
{
    if (_m.lastWebUrl.empty())
        return;
    if (_io.openUrl && _io.openUrl(_m.lastWebUrl))
        setStatus("Opened in browser");
    else
        setStatus("Could not open browser");
}

void Orchestrator::submitChat()
{
    if (_m.chatInput.empty() || _m.chatLoading)
        return;

    ChatMessage msg;
    msg.role = "user";
    msg.content = _m.chatInput.text;
    msg.timestamp = _wall();
    _m.chatMessages.push_back(std::move(msg));
    _m.chatInput.clear();

    std::vector<ChatMessage> history = _m.chatMessages;
    // the view summary rides on the first user message
    if (!history.empty() && history.front().role == "user")
        history.front().content = chatContext() + "\n\n" + history.front().content;

    _m.chatLoading = true;
    _m.chatScroll = 0;
    _pipeline.sendChat(_m.conversationId, history);
}

void Orchestrator::startConfigWatch()
{
    if (_settings.configPath.empty() || !FileWatch(_settings.configPath).exists())
    {
        _m.views.pushView(ViewMode::CollectorConfigUnavailable);
        return;
    }

    _configWatch.reset(_settings.configPath);
    _configWatch.changed();
    _m.watchingConfig = true;
    _m.configValid = true;
    _m.configStatus = "Watching for changes";
    _m.views.pushView(ViewMode::CollectorConfigWatch);
    spdlog::info("watching {}", _settings.configPath);

    if (_io.openUrl && !_io.openUrl("file://" + _settings.configPath))
        setStatus("Could not open an editor, edit the file manually");
}

void Orchestrator::checkConfigWatch()
{
    if (!_m.watchingConfig || !_configWatch.changed())
        return;

    std::string message;
    const bool ok = _settings.reloadConfig && _settings.reloadConfig(&message);
    _m.configValid = ok;
    if (ok)
    {
        ++_m.configReloads;
        _m.configStatus = "Configuration reloaded";
        spdlog::info("configuration reloaded from {}", _settings.configPath);
    }
    else
    {
        _m.configStatus = message.empty() ? std::string("Configuration rejected") : message;
        spdlog::error("configuration rejected: {}", _m.configStatus);
    }
}

// ---------- views ----------
bool Orchestrator::isFieldDisplayed(const std::string& name) const
{
    return std::any_of(_m.fields.begin(), _m.fields.end(), [&](const DisplayField& f) { return f.name == name; });
}

std::vector<FieldInfo> Orchestrator::sortedFieldList() const
{
    const std::string needle = lowered(_m.fieldsSearch.text);
    auto matches = [&](const std::string& name) { return needle.empty() || lowered(name).find(needle) != std::string::npos; };

    std::unordered_map<std::string, const FieldInfo*> byName;
    for (const auto& f : _m.availableFields)
        byName[f.name] = &f;

    std::vector<FieldInfo> out;
    std::unordered_set<std::string> displayed;
    for (const auto& df : _m.fields)
    {
        displayed.insert(df.name);
        if (!matches(df.name))
            continue;
        auto it = byName.find(df.name);
        if (it != byName.end())
        {
            out.push_back(*it->second);
            continue;
        }
        // virtual column: count taken from its best backing field
        FieldInfo fi;
        fi.name = df.name;
        fi.type = "display";
        fi.searchable = df.searchFields.has_value();
        if (df.searchFields)
            for (const auto& sf : *df.searchFields)
                if (auto jt = byName.find(sf); jt != byName.end())
                    fi.docCount = std::max(fi.docCount, jt->second->docCount);
        out.push_back(std::move(fi));
    }

    std::vector<FieldInfo> rest;
    for (const auto& f : _m.availableFields)
        if (!displayed.count(f.name) && matches(f.name))
            rest.push_back(f);
    std::stable_sort(rest.begin(), rest.end(), [](const FieldInfo& a, const FieldInfo& b) { return a.docCount > b.docCount; });
    out.insert(out.end(), rest.begin(), rest.end());
    return out;
}

std::string Orchestrator::chatContext() const
{
    std::string s = "Context: viewing ";
    s += lowered(signalName(_m.signal));
    s += " in " + _m.index + " over the last " + lookbackName(_m.lookback) + ".";

    std::vector<std::string> filters;
    if (!_m.serviceFilter.empty())
        filters.push_back((_m.negateService ? "service (excluded)=" : "service=") + _m.serviceFilter);
    if (!_m.resourceFilter.empty())
        filters.push_back((_m.negateResource ? "resource (excluded)=" : "resource=") + _m.resourceFilter);
    if (!_m.levelFilter.empty())
        filters.push_back("level=" + _m.levelFilter);
    if (!_m.searchQuery.empty())
        filters.push_back("search=" + _m.searchQuery);
    if (!filters.empty())
    {
        s += " Filters:";
        for (const auto& f : filters) s += " " + f;
        s += ".";
    }

    const int idx = _m.selection.selectedIndex();
    if (_m.signal == SignalType::Logs && idx >= 0 && size_t(idx) < _m.entries.size())
    {
        const auto& e = _m.entries[size_t(idx)];
        s += " Selected log: " + e.displayLevel() + " - " + e.displayMessage();
    }
    else if (_m.signal == SignalType::Traces && !_m.selectedTxName.empty())
    {
        s += " Selected transaction: " + _m.selectedTxName;
    }
    else if (_m.signal == SignalType::Metrics && _m.metricsCursor >= 0 && size_t(_m.metricsCursor) < _m.metrics.metrics.size())
    {
        s += " Selected metric: " + _m.metrics.metrics[size_t(_m.metricsCursor)].name;
    }
    return s;
}

std::string Orchestrator::queryOverlayText() const
{
    const bool metricsView = _m.signal == SignalType::Metrics && _m.metricsViewMode == MetricsViewMode::Aggregated;
    const std::string& q = metricsView ? _m.metrics.query : _m.lastQuery;
    const std::string& idx = _m.lastQueryIndex.empty() ? _m.index : _m.lastQueryIndex;
    return queryText(q, _m.queryFormat, idx);
}
