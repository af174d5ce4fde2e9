#pragma once
#include "SelectionModel.hpp"
#include "TextInput.hpp"
#include "ViewStack.hpp"
#include "model.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// which list the detail view walks
enum class DetailSource { Entries, MetricDocs };

/// @brief Everything the renderer reads. Owned by the Orchestrator and only
/// mutated on the event loop thread.
struct AppModel
{
    using SteadyTime = std::chrono::steady_clock::time_point;

    ViewStack views;

    // ---- query state ----
    SignalType signal = SignalType::Logs;
    std::string index = "logs-*";
    Lookback lookback = Lookback::OneDay;
    std::string searchQuery;
    std::string levelFilter;
    std::string serviceFilter;
    bool negateService = false;
    std::string resourceFilter;
    bool negateResource = false;
    bool sortAscending = false;
    bool autoRefresh = true;
    TimeDisplayMode timeMode = TimeDisplayMode::Clock;
    std::vector<DisplayField> fields = defaultFields(SignalType::Logs);

    // ---- entry list ----
    std::vector<LogEntry> entries;
    int64_t total = 0;
    SelectionModel selection;
    bool loading = false;
    SysTime lastRefresh{};
    std::string lastQuery;
    std::string lastQueryIndex;

    // ---- detail ----
    DetailSource detailSource = DetailSource::Entries;
    std::string detailText;
    std::vector<std::string> detailLines;
    int detailScroll = 0;

    // ---- errors and status ----
    std::string err;
    int errorScroll = 0;
    std::string statusMessage;
    SteadyTime statusUntil{};

    // ---- field picker ----
    std::vector<FieldInfo> availableFields;
    bool fieldsLoading = false;
    int fieldsCursor = 0;
    bool fieldsSearchMode = false;
    TextInput fieldsSearch;

    // ---- metrics ----
    MetricsViewMode metricsViewMode = MetricsViewMode::Aggregated;
    MetricsAggregation metrics;
    bool metricsLoading = false;
    int metricsCursor = 0;
    std::vector<LogEntry> metricDocs;
    bool metricDocsLoading = false;
    int metricDocCursor = 0;

    // ---- traces ----
    TraceLevel traceLevel = TraceLevel::Names;
    std::vector<TransactionNameAgg> transactionNames;
    bool tracesLoading = false;
    int traceNamesCursor = 0;
    std::string selectedTxName;
    std::string selectedTraceId;
    std::vector<LogEntry> spans;
    bool spansLoading = false;
    std::string lastFetchedTraceId;

    // ---- perspectives ----
    PerspectiveType perspective = PerspectiveType::Services;
    std::vector<PerspectiveItem> perspectiveItems;
    bool perspectiveLoading = false;
    int perspectiveCursor = 0;

    // ---- inputs and overlays ----
    TextInput searchInput;
    TextInput indexInput;
    QueryFormat queryFormat = QueryFormat::Esql;
    int helpScroll = 0;

    // ---- chat ----
    std::vector<ChatMessage> chatMessages;
    TextInput chatInput;
    bool chatInputFocused = true;
    bool chatLoading = false;
    std::string conversationId;
    int chatScroll = 0;

    // ---- browser link ----
    std::string lastWebUrl;
    bool hideCredentials = false;

    // ---- config watch ----
    bool watchingConfig = false;
    std::string configPath;
    bool configValid = true;
    std::string configStatus;
    int configReloads = 0;

    // ---- window ----
    int width = 0;   // columns
    int height = 0;  // rows
    bool quit = false;
};
