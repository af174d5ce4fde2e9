#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using SysTime = std::chrono::system_clock::time_point;

// =============== Enums ===============
enum class SignalType { Logs, Traces, Metrics };

const char* signalName(SignalType s);
// default index pattern of a signal
const char* signalIndexPattern(SignalType s);
bool parseSignal(const std::string& s, SignalType& out);

enum class Lookback { FiveMinutes, OneHour, OneDay, OneWeek, All };

inline constexpr std::array<Lookback, 5> kLookbacks = {
    Lookback::FiveMinutes, Lookback::OneHour, Lookback::OneDay, Lookback::OneWeek, Lookback::All
};

const char* lookbackName(Lookback l);
// 0 for All (no time filter)
std::chrono::seconds lookbackDuration(Lookback l);
// aims for 20..60 buckets over the window; All assumes 30 days
std::chrono::seconds lookbackBucket(Lookback l);
const char* lookbackBucketName(Lookback l);
Lookback nextLookback(Lookback l);

enum class TimeDisplayMode { Clock, Relative, Full };
enum class PerspectiveType { Services, Resources };
const char* perspectiveName(PerspectiveType p);

// traces drill-down
enum class TraceLevel { Names, Transactions, Spans };
enum class MetricsViewMode { Aggregated, Documents };
enum class QueryFormat { Esql, Curl };

// =============== Documents ===============
// One stored document seen as a log line, a span/transaction or a metric point.
struct LogEntry
{
    SysTime     timestamp{};
    std::string body;
    std::string message;
    std::string eventName;
    std::string level;
    std::string serviceName;
    std::string resource;        // first meaningful resource attribute
    std::string containerId;
    std::string traceId;
    std::string spanId;
    std::string name;
    std::string kind;
    std::string statusCode;
    std::string processorEvent;  // "transaction" / "span"
    std::string transactionName;
    int64_t     durationNs = 0;
    std::string scopeName;
    nlohmann::json attributes;
    nlohmann::json metrics;
    nlohmann::json raw;

    const std::string& displayMessage() const;
    std::string displayLevel() const { return level.empty() ? "INFO" : level; }
    bool isError() const;
};

// =============== Aggregates ===============
struct FieldInfo
{
    std::string name;
    std::string type;
    bool searchable = false;
    bool aggregatable = false;
    int64_t docCount = 0;
};

struct MetricBucket
{
    SysTime timestamp{};
    double  value = 0.0;
    int64_t count = 0;
};

struct AggregatedMetric
{
    std::string name;       // "metrics.system.cpu.utilization"
    std::string shortName;  // "system.cpu.utilization"
    std::string type;       // gauge / counter / histogram
    double min = 0.0;
    double max = 0.0;
    double avg = 0.0;
    double latest = 0.0;
    std::vector<MetricBucket> buckets;
};

struct MetricsAggregation
{
    std::vector<AggregatedMetric> metrics;
    std::string bucketSize;
    std::string query;
};

struct TransactionNameAgg
{
    std::string name;
    int64_t count = 0;
    double avgDurationMs = 0.0;
    double minDurationMs = 0.0;
    double maxDurationMs = 0.0;
    int64_t traceCount = 0;
    double avgSpans = 0.0;
    double errorRate = 0.0;  // 0..1
    SysTime lastSeen{};
};

struct PerspectiveItem
{
    std::string name;
    int64_t logCount = 0;
    int64_t traceCount = 0;
    int64_t metricCount = 0;
};

struct ChatMessage
{
    std::string role;  // "user" / "assistant"
    std::string content;
    SysTime timestamp{};
    bool error = false;
};

// =============== Columns ===============
struct DisplayField
{
    std::string name;
    std::string label;
    int width = 0;  // 0 = takes the remaining width
    bool selected = true;
    // nullopt: not searchable; empty: search `name` itself
    std::optional<std::vector<std::string>> searchFields;
};

std::vector<DisplayField> defaultFields(SignalType s);
// unique search fields of all display fields, in order
std::vector<std::string> collectSearchFields(const std::vector<DisplayField>& fields);
// column for a field picked in the field picker
DisplayField makeCustomField(const std::string& name);
