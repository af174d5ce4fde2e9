#pragma once
#include "ChatClient.hpp"
#include "DataSource.hpp"
#include "EventQueue.hpp"
#include "RequestTracker.hpp"
#include "WorkerPool.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

struct FetchTimeouts
{
    std::chrono::milliseconds logs{ 10000 };
    std::chrono::milliseconds metrics{ 30000 };
    std::chrono::milliseconds traces{ 30000 };
    std::chrono::milliseconds fieldCaps{ 10000 };
    std::chrono::milliseconds autoDetect{ 30000 };
    std::chrono::milliseconds chat{ 60000 };
};

/// @brief One asynchronous operation per data domain.
/// Each call registers a request with the tracker on the calling thread,
/// runs the backend call on the executor and pushes exactly one result event.
/// Returns the request id the result will carry.
///
/// The executor must be drained before the pipeline, the data source or the
/// queue go away.
class FetchPipeline
{
public:
    FetchPipeline(DataSource& source, RequestTracker& tracker, Executor& executor, EventQueue& queue, FetchTimeouts timeouts = {});

    void setChatClient(ChatClient* chat) { _chat = chat; }
    bool hasChat() const { return _chat != nullptr; }
    void setTimeouts(const FetchTimeouts& t) { _timeouts = t; }
    const FetchTimeouts& timeouts() const { return _timeouts; }
    const DataSource& source() const { return _source; }

    // tail when `query` is empty, search otherwise
    uint64_t fetchEntries(const SearchOptions& opts, const std::string& query, std::chrono::milliseconds timeout);
    uint64_t fetchFieldCaps(const std::string& index);
    // Probes lookbacks from the shortest up and picks the first one holding
    // enough documents, or the fullest one.
    uint64_t autoDetectLookback(const QueryFilters& filters);
    uint64_t fetchMetricsAggregate(const QueryFilters& filters);
    uint64_t fetchMetricDetailDocs(const QueryFilters& filters, const std::string& metricField);
    uint64_t fetchTransactionNames(const QueryFilters& filters);
    uint64_t fetchSpans(const QueryFilters& filters, const std::string& traceId);
    uint64_t fetchPerspective(PerspectiveType type, Lookback lookback);
    // 0 when no chat client is configured
    uint64_t sendChat(const std::string& conversationId, const std::vector<ChatMessage>& history);

    // documents that make a lookback good enough
    static constexpr int64_t kAutoDetectTarget = 10000;
    static constexpr size_t kSpansSize = 1000;
    static constexpr size_t kMetricDocsSize = 10;

private:
    template <class Result, class Fn>
    uint64_t run(RequestKind kind, std::chrono::milliseconds timeout, Fn fn);

private:
    DataSource& _source;
    RequestTracker& _tracker;
    Executor& _executor;
    EventQueue& _queue;
    ChatClient* _chat;
    FetchTimeouts _timeouts;
};
