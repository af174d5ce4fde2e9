#pragma once
#include "AppModel.hpp"
#include "FetchPipeline.hpp"
#include "FileWatch.hpp"
#include "RequestTracker.hpp"
#include "events.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

// Outbound side effects. A missing callable reports failure in the status bar.
struct Integrations
{
    std::function<bool(const std::string&)> copyText;
    std::function<bool(const std::string&)> openUrl;
};

struct OrchestratorSettings
{
    std::chrono::milliseconds tickInterval{ 2000 };
    std::chrono::milliseconds statusDuration{ 2000 };
    // browser deep link base and the credentials shown before opening it
    std::string webUrl;
    std::string webUser;
    std::string webPassword;
    // configuration file watched from the collector config view
    std::string configPath;
    // Re-reads and applies the configuration file. False and a message when invalid.
    std::function<bool(std::string* outMessage)> reloadConfig;
};

/// @brief The event loop's state machine.
/// Consumes input and result events, owns the AppModel and decides which
/// fetch to (re)start. Every member runs on the loop thread.
class Orchestrator
{
public:
    using Clock = std::chrono::steady_clock;
    using WallFn = std::function<SysTime()>;
    using SteadyFn = std::function<Clock::time_point()>;

    static constexpr size_t kEntriesSize = 100;

    Orchestrator(FetchPipeline& pipeline, RequestTracker& tracker, Integrations integrations, OrchestratorSettings settings,
                 WallFn wall = nullptr, SteadyFn steady = nullptr);

    // Enters the view of `signal` and probes the lookback. An empty index uses the signal's pattern.
    void start(SignalType signal, Lookback lookback, const std::string& index = {});
    void handle(const Event& ev);

    const AppModel& model() const { return _m; }
    const OrchestratorSettings& settings() const { return _settings; }
    bool quitRequested() const { return _m.quit; }

    Clock::time_point nextTick() const { return _nextTick; }
    void setTickInterval(std::chrono::milliseconds interval);
    std::chrono::milliseconds tickInterval() const { return _settings.tickInterval; }

    bool needsSpanFetch(const std::string& traceId) const;

    // Field picker rows: displayed fields first, then the rest by document count.
    std::vector<FieldInfo> sortedFieldList() const;
    bool isFieldDisplayed(const std::string& name) const;
    // Summary of the current view sent along with the first chat message.
    std::string chatContext() const;
    // Text of the query overlay.
    std::string queryOverlayText() const;
    // Status line text while it is fresh, empty otherwise.
    std::string activeStatus() const;

private:
    // ---- events ----
    void onKey(const KeyEvent& ev);
    void onMouse(const MouseEvent& ev);
    void onResize(const ResizeEvent& ev);
    void onTick(const TickEvent& ev);
    void onResult(const EntriesResult& r);
    void onResult(const FieldCapsResult& r);
    void onResult(const AutoDetectResult& r);
    void onResult(const MetricsAggregateResult& r);
    void onResult(const MetricDetailDocsResult& r);
    void onResult(const TransactionNamesResult& r);
    void onResult(const SpansResult& r);
    void onResult(const PerspectiveResult& r);
    void onResult(const ChatResult& r);
    void onError(const ErrorEvent& ev);

    // true when the error was consumed (context error swallowed, others shown)
    bool handleAsyncError(const std::optional<FetchError>& err);
    void showErrorModal();
    bool isStale(RequestKind kind, uint64_t id) const;

    // ---- keys, one handler per view ----
    void handleEntriesKey(const std::string& key);
    void handleSearchKey(const std::string& key);
    void handleDetailKey(const std::string& key);
    void handleIndexKey(const std::string& key);
    void handleQueryKey(const std::string& key);
    void handleFieldsKey(const std::string& key);
    void handleMetricsDashboardKey(const std::string& key);
    void handleMetricDetailKey(const std::string& key);
    void handleTraceNamesKey(const std::string& key);
    void handlePerspectiveKey(const std::string& key);
    void handleErrorModalKey(const std::string& key);
    void handleQuitConfirmKey(const std::string& key);
    void handleHelpKey(const std::string& key);
    void handleChatKey(const std::string& key);
    void handleCredentialsKey(const std::string& key);
    void handleConfigExplainKey(const std::string& key);
    void handleConfigWatchKey(const std::string& key);
    void handleConfigUnavailableKey(const std::string& key);
    bool isTypingActive() const;

    // ---- fetches ----
    QueryFilters baseFilters() const;
    SearchOptions entriesOptions() const;
    void fetchEntries();
    void fetchMetricsAggregate();
    void fetchMetricDocs();
    void fetchTransactionNames();
    void fetchPerspective();
    void fetchFieldCaps();
    void autoDetect();
    void maybeFetchSpansForSelection();
    void startInitialFetch();
    // data of the view now on screen, after a filter change
    void refreshCurrentView();

    // ---- navigation ----
    void cycleSignalType();
    void enterSignalView();
    void cyclePerspective();
    void enterPerspectiveView();
    void cycleLookback();
    void enterSearch();
    void enterChat();
    void openDetail(DetailSource source);
    void setLevelFilter(const std::string& level);
    void drillIntoTrace(const std::string& traceId);

    // ---- detail viewport ----
    const std::vector<LogEntry>& detailList() const;
    int detailIndex() const;
    void updateDetailContent();
    void rewrapDetail();
    void scrollDetail(int delta);

    // ---- side effects ----
    void setStatus(std::string msg);
    void copyToClipboard(const std::string& text, const std::string& successMsg);
    bool prepareWebUrl();
    void showCredentials();
    void openWebUrl();
    void submitChat();
    void startConfigWatch();
    void checkConfigWatch();

private:
    AppModel _m;
    FetchPipeline& _pipeline;
    RequestTracker& _tracker;
    Integrations _io;
    OrchestratorSettings _settings;
    WallFn _wall;
    SteadyFn _steady;
    Clock::time_point _nextTick;
    FileWatch _configWatch;
};
