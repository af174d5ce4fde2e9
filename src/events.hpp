#pragma once
#include "FetchError.hpp"
#include "model.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// =============== Input ===============
struct KeyEvent
{
    std::string key;
};

struct MouseEvent
{
    enum class Kind { WheelUp, WheelDown, Click };
    Kind kind = Kind::WheelDown;
    // what a click landed on, as reported by the renderer ("sort", ...)
    std::string target;
};

struct ResizeEvent
{
    int width = 0;
    int height = 0;
};

struct TickEvent
{
    std::chrono::steady_clock::time_point now{};
};

// =============== Fetch results ===============
// Every result carries the id handed out by RequestTracker for its kind.
struct EntriesResult
{
    uint64_t requestId = 0;
    std::optional<FetchError> error;
    std::vector<LogEntry> entries;
    int64_t total = 0;
    std::string query;
    std::string index;
};

struct FieldCapsResult
{
    uint64_t requestId = 0;
    std::optional<FetchError> error;
    std::vector<FieldInfo> fields;
};

struct AutoDetectResult
{
    uint64_t requestId = 0;
    std::optional<FetchError> error;
    Lookback lookback = Lookback::FiveMinutes;
    int64_t total = 0;
};

struct MetricsAggregateResult
{
    uint64_t requestId = 0;
    std::optional<FetchError> error;
    MetricsAggregation result;
};

struct MetricDetailDocsResult
{
    uint64_t requestId = 0;
    std::optional<FetchError> error;
    std::vector<LogEntry> docs;
};

struct TransactionNamesResult
{
    uint64_t requestId = 0;
    std::optional<FetchError> error;
    std::vector<TransactionNameAgg> names;
};

struct SpansResult
{
    uint64_t requestId = 0;
    std::optional<FetchError> error;
    std::string traceId;
    std::vector<LogEntry> spans;
};

struct PerspectiveResult
{
    uint64_t requestId = 0;
    std::optional<FetchError> error;
    PerspectiveType type = PerspectiveType::Services;
    std::vector<PerspectiveItem> items;
};

struct ChatResult
{
    uint64_t requestId = 0;
    std::optional<FetchError> error;
    std::string conversationId;
    ChatMessage message;
};

// Failure outside of any tracked request.
struct ErrorEvent
{
    std::string message;
};

using Event = std::variant<
    KeyEvent, MouseEvent, ResizeEvent, TickEvent,
    EntriesResult, FieldCapsResult, AutoDetectResult, MetricsAggregateResult,
    MetricDetailDocsResult, TransactionNamesResult, SpansResult, PerspectiveResult,
    ChatResult, ErrorEvent>;
