#pragma once
#include "DataSource.hpp"
#include "FileWatch.hpp"
#include "model.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/// @brief DataSource over JSON document files, one dataset per file.
/// Datasets are named like data streams ("logs-default") so index patterns
/// select them. With auto reload on, a file whose mtime moved is parsed again
/// before the next query; queries run on an immutable snapshot.
class JsonStore : public DataSource
{
public:
    struct DatasetSource
    {
        std::string name;
        std::string path;
    };
    using NowFn = std::function<SysTime()>;

    JsonStore(std::vector<DatasetSource> sources, bool autoReload, NowFn now = nullptr);

    // Parses every dataset once. Datasets that fail keep an empty snapshot.
    bool load(std::string* outError = nullptr);
    // Replaces a dataset's documents in place (tests, live feeds).
    void setDocuments(const std::string& name, std::vector<LogEntry> docs);
    std::vector<std::string> datasetNames() const;

    bool tail(const RequestContext& ctx, const TailOptions& opts, SearchResult& out, FetchError* outError) override;
    bool search(const RequestContext& ctx, const std::string& query, const SearchOptions& opts, SearchResult& out, FetchError* outError) override;
    bool count(const RequestContext& ctx, const QueryFilters& filters, int64_t& outTotal, FetchError* outError) override;
    bool aggregateMetrics(const RequestContext& ctx, const QueryFilters& filters, MetricsAggregation& out, FetchError* outError) override;
    bool transactionNames(const RequestContext& ctx, const QueryFilters& filters, std::vector<TransactionNameAgg>& out, FetchError* outError) override;
    bool services(const RequestContext& ctx, Lookback lookback, std::vector<PerspectiveItem>& out, FetchError* outError) override;
    bool resources(const RequestContext& ctx, Lookback lookback, std::vector<PerspectiveItem>& out, FetchError* outError) override;
    bool fieldCaps(const RequestContext& ctx, const std::string& index, std::vector<FieldInfo>& out, FetchError* outError) override;
    std::string endpoint() const override;

    // ES|QL rendering of a query, shown in the query overlay.
    static std::string esqlFor(const TailOptions& opts, const std::string& searchQuery = {}, const std::vector<std::string>& searchFields = {});

private:
    struct Dataset
    {
        std::string name;
        std::vector<LogEntry> entries;
    };
    using DatasetPtr = std::shared_ptr<const Dataset>;

    struct Slot
    {
        DatasetSource source;
        FileWatch watch;
        DatasetPtr snapshot;
    };

    bool reload(Slot& slot, std::string* outError);
    void refreshIfChanged();
    bool select(const std::string& index, std::vector<DatasetPtr>& out, FetchError* outError);
    std::vector<DatasetPtr> all();
    bool passes(const LogEntry& e, const QueryFilters& f, SysTime now) const;
    bool collect(const RequestContext& ctx, const std::vector<DatasetPtr>& sets, const QueryFilters& f,
                 const std::function<bool(const LogEntry&)>& extra, std::vector<const LogEntry*>& out, FetchError* outError);
    bool perspective(const RequestContext& ctx, Lookback lookback, bool byService, std::vector<PerspectiveItem>& out, FetchError* outError);
    bool rows(const RequestContext& ctx, const TailOptions& opts, const std::function<bool(const LogEntry&)>& extra, SearchResult& out, FetchError* outError);

private:
    mutable std::mutex _mtx;
    std::vector<Slot> _slots;
    bool _autoReload;
    NowFn _now;
};
