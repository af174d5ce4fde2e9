#pragma once
#include "FetchError.hpp"
#include "RequestContext.hpp"
#include "model.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Filters shared by every query. `index` is a comma separated list of globs.
struct QueryFilters
{
    std::string index;
    Lookback lookback = Lookback::OneDay;
    std::string service;
    bool negateService = false;
    std::string resource;
    bool negateResource = false;
    std::string level;
    std::string processorEvent;
    std::string transactionName;
    std::string traceId;
    // only documents carrying this metric
    std::string metricField;
};

struct TailOptions : QueryFilters
{
    size_t size = 100;
    bool sortAscending = false;
};

struct SearchOptions : TailOptions
{
    std::vector<std::string> searchFields;
};

struct SearchResult
{
    std::vector<LogEntry> entries;
    int64_t total = 0;
    std::string query;
};

/// @brief Backend query layer seen by the fetch pipeline.
/// Every call polls `ctx` and fails with a context error once it is done.
/// Calls return false and fill `outError` on failure.
class DataSource
{
public:
    virtual ~DataSource() = default;

    virtual bool tail(const RequestContext& ctx, const TailOptions& opts, SearchResult& out, FetchError* outError) = 0;
    virtual bool search(const RequestContext& ctx, const std::string& query, const SearchOptions& opts, SearchResult& out, FetchError* outError) = 0;
    virtual bool count(const RequestContext& ctx, const QueryFilters& filters, int64_t& outTotal, FetchError* outError) = 0;
    virtual bool aggregateMetrics(const RequestContext& ctx, const QueryFilters& filters, MetricsAggregation& out, FetchError* outError) = 0;
    virtual bool transactionNames(const RequestContext& ctx, const QueryFilters& filters, std::vector<TransactionNameAgg>& out, FetchError* outError) = 0;
    virtual bool services(const RequestContext& ctx, Lookback lookback, std::vector<PerspectiveItem>& out, FetchError* outError) = 0;
    virtual bool resources(const RequestContext& ctx, Lookback lookback, std::vector<PerspectiveItem>& out, FetchError* outError) = 0;
    virtual bool fieldCaps(const RequestContext& ctx, const std::string& index, std::vector<FieldInfo>& out, FetchError* outError) = 0;

    // Shown in the status bar and the query overlay.
    virtual std::string endpoint() const = 0;
};
