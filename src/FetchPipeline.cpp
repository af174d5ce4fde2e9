#include "FetchPipeline.hpp"

#include <spdlog/spdlog.h>

#include <exception>

FetchPipeline::FetchPipeline(DataSource& source, RequestTracker& tracker, Executor& executor, EventQueue& queue, FetchTimeouts timeouts)
    : _source{ source }
    , _tracker{ tracker }
    , _executor{ executor }
    , _queue{ queue }
    , _chat{ nullptr }
    , _timeouts{ timeouts }
{
}

template <class Result, class Fn>
uint64_t FetchPipeline::run(RequestKind kind, std::chrono::milliseconds timeout, Fn fn)
{
    RequestTracker::Request req = _tracker.startRequest(kind, timeout);
    EventQueue* queue = &_queue;
    _executor.submit([req, kind, queue, fn = std::move(fn)]()
    {
        // released however the call ends
        struct Release
        {
            const std::function<void()>& done;
            ~Release() { done(); }
        } release{ req.done };

        Result res;
        res.requestId = req.id;
        FetchError err;
        bool ok = false;
        try
        {
            ok = fn(*req.context, res, &err);
        }
        catch (const std::exception& e)
        {
            spdlog::warn("request {} #{} threw: {}", requestKindName(kind), req.id, e.what());
            err = FetchError::backend(e.what());
        }
        catch (...)
        {
            spdlog::warn("request {} #{} threw a non-standard exception", requestKindName(kind), req.id);
            err = FetchError::backend("unknown error");
        }

        if (!ok)
        {
            // a superseded or expired call reports that, whatever the backend said
            if (const ContextError ce = req.context->err(); ce != ContextError::None)
                err = FetchError::fromContext(ce);
            res.error = std::move(err);
        }
        queue->push(Event{ std::move(res) });
    });
    return req.id;
}

uint64_t FetchPipeline::fetchEntries(const SearchOptions& opts, const std::string& query, std::chrono::milliseconds timeout)
{
    DataSource* src = &_source;
    return run<EntriesResult>(RequestKind::Entries, timeout, [src, opts, query](const RequestContext& ctx, EntriesResult& res, FetchError* err)
    {
        SearchResult sr;
        const bool ok = query.empty() ? src->tail(ctx, opts, sr, err) : src->search(ctx, query, opts, sr, err);
        if (!ok)
            return false;
        res.entries = std::move(sr.entries);
        res.total = sr.total;
        res.query = std::move(sr.query);
        res.index = opts.index;
        return true;
    });
}

uint64_t FetchPipeline::fetchFieldCaps(const std::string& index)
{
    DataSource* src = &_source;
    return run<FieldCapsResult>(RequestKind::FieldMetadata, _timeouts.fieldCaps, [src, index](const RequestContext& ctx, FieldCapsResult& res, FetchError* err)
    {
        return src->fieldCaps(ctx, index, res.fields, err);
    });
}

uint64_t FetchPipeline::autoDetectLookback(const QueryFilters& filters)
{
    DataSource* src = &_source;
    return run<AutoDetectResult>(RequestKind::AutoDetectRange, _timeouts.autoDetect, [src, filters](const RequestContext& ctx, AutoDetectResult& res, FetchError* err)
    {
        res.lookback = Lookback::FiveMinutes;
        res.total = 0;
        bool anyProbe = false;
        FetchError lastErr;
        for (Lookback lb : kLookbacks)
        {
            if (const ContextError ce = ctx.err(); ce != ContextError::None)
            {
                *err = FetchError::fromContext(ce);
                return false;
            }

            QueryFilters f = filters;
            f.lookback = lb;
            int64_t total = 0;
            FetchError probeErr;
            if (!src->count(ctx, f, total, &probeErr))
            {
                if (probeErr.isContextError())
                {
                    *err = probeErr;
                    return false;
                }
                spdlog::debug("auto-detect probe {} failed: {}", lookbackName(lb), probeErr.message);
                lastErr = probeErr;
                continue;
            }
            anyProbe = true;

            if (total > res.total)
            {
                res.lookback = lb;
                res.total = total;
            }
            if (total >= kAutoDetectTarget)
                break;
        }
        if (!anyProbe)
        {
            *err = lastErr;
            return false;
        }
        return true;
    });
}

uint64_t FetchPipeline::fetchMetricsAggregate(const QueryFilters& filters)
{
    DataSource* src = &_source;
    return run<MetricsAggregateResult>(RequestKind::MetricsAggregate, _timeouts.metrics, [src, filters](const RequestContext& ctx, MetricsAggregateResult& res, FetchError* err)
    {
        return src->aggregateMetrics(ctx, filters, res.result, err);
    });
}

uint64_t FetchPipeline::fetchMetricDetailDocs(const QueryFilters& filters, const std::string& metricField)
{
    TailOptions opts;
    static_cast<QueryFilters&>(opts) = filters;
    opts.metricField = metricField;
    opts.size = kMetricDocsSize;
    opts.sortAscending = false;

    DataSource* src = &_source;
    return run<MetricDetailDocsResult>(RequestKind::MetricDetailDocuments, _timeouts.metrics, [src, opts](const RequestContext& ctx, MetricDetailDocsResult& res, FetchError* err)
    {
        SearchResult sr;
        if (!src->tail(ctx, opts, sr, err))
            return false;
        res.docs = std::move(sr.entries);
        return true;
    });
}

uint64_t FetchPipeline::fetchTransactionNames(const QueryFilters& filters)
{
    DataSource* src = &_source;
    return run<TransactionNamesResult>(RequestKind::TransactionNames, _timeouts.traces, [src, filters](const RequestContext& ctx, TransactionNamesResult& res, FetchError* err)
    {
        return src->transactionNames(ctx, filters, res.names, err);
    });
}

uint64_t FetchPipeline::fetchSpans(const QueryFilters& filters, const std::string& traceId)
{
    TailOptions opts;
    static_cast<QueryFilters&>(opts) = filters;
    opts.traceId = traceId;
    opts.processorEvent = "span";
    opts.transactionName.clear();
    opts.size = kSpansSize;
    opts.sortAscending = true;

    DataSource* src = &_source;
    return run<SpansResult>(RequestKind::Spans, _timeouts.traces, [src, opts](const RequestContext& ctx, SpansResult& res, FetchError* err)
    {
        res.traceId = opts.traceId;
        SearchResult sr;
        if (!src->tail(ctx, opts, sr, err))
            return false;
        res.spans = std::move(sr.entries);
        return true;
    });
}

uint64_t FetchPipeline::fetchPerspective(PerspectiveType type, Lookback lookback)
{
    DataSource* src = &_source;
    return run<PerspectiveResult>(RequestKind::PerspectiveRollup, _timeouts.logs, [src, type, lookback](const RequestContext& ctx, PerspectiveResult& res, FetchError* err)
    {
        res.type = type;
        return type == PerspectiveType::Services ? src->services(ctx, lookback, res.items, err) : src->resources(ctx, lookback, res.items, err);
    });
}

uint64_t FetchPipeline::sendChat(const std::string& conversationId, const std::vector<ChatMessage>& history)
{
    if (!_chat)
        return 0;
    ChatClient* chat = _chat;
    return run<ChatResult>(RequestKind::Chat, _timeouts.chat, [chat, conversationId, history](const RequestContext& ctx, ChatResult& res, FetchError* err)
    {
        ChatReply reply;
        if (!chat->converse(ctx, conversationId, history, reply, err))
            return false;
        res.conversationId = std::move(reply.conversationId);
        res.message = std::move(reply.message);
        return true;
    });
}
