#include "RequestTracker.hpp"

#include <spdlog/spdlog.h>

const char* requestKindName(RequestKind kind)
{
    switch (kind)
    {
        case RequestKind::Entries:               return "entries";
        case RequestKind::FieldMetadata:         return "field-metadata";
        case RequestKind::AutoDetectRange:       return "auto-detect-range";
        case RequestKind::MetricsAggregate:      return "metrics-aggregate";
        case RequestKind::MetricDetailDocuments: return "metric-detail-documents";
        case RequestKind::TransactionNames:      return "transaction-names";
        case RequestKind::Spans:                 return "spans";
        case RequestKind::PerspectiveRollup:     return "perspective-rollup";
        case RequestKind::Chat:                  return "chat";
    }
    return "unknown";
}

RequestTracker::RequestTracker()
    : _state{ std::make_shared<State>() }
{
}

RequestTracker::Request RequestTracker::startRequest(RequestKind kind, std::chrono::milliseconds timeout)
{
    auto state = _state;
    Request req;
    {
        std::lock_guard<std::mutex> lk(state->mtx);
        auto it = state->inflight.find(kind);
        if (it != state->inflight.end())
        {
            spdlog::debug("request {} #{} superseded", requestKindName(kind), it->second.id);
            it->second.context->cancel();
            state->inflight.erase(it);
        }

        req.id = ++state->seq;
        req.context = RequestContext::withTimeout(timeout);
        state->inflight[kind] = Slot{ req.context, req.id };
        state->latest[kind] = req.id;
    }
    spdlog::debug("request {} #{} started (timeout {} ms)", requestKindName(kind), req.id, timeout.count());

    const uint64_t id = req.id;
    std::weak_ptr<RequestContext> weakCtx = req.context;
    req.done = [state, kind, id, weakCtx]()
    {
        {
            std::lock_guard<std::mutex> lk(state->mtx);
            auto it = state->inflight.find(kind);
            if (it != state->inflight.end() && it->second.id == id)
                state->inflight.erase(it);
        }
        // release: nobody waits on a finished request
        if (auto ctx = weakCtx.lock())
            ctx->cancel();
    };
    return req;
}

uint64_t RequestTracker::currentId(RequestKind kind) const
{
    std::lock_guard<std::mutex> lk(_state->mtx);
    auto it = _state->inflight.find(kind);
    return it == _state->inflight.end() ? 0 : it->second.id;
}

size_t RequestTracker::inFlightCount() const
{
    std::lock_guard<std::mutex> lk(_state->mtx);
    return _state->inflight.size();
}

bool RequestTracker::isLatest(RequestKind kind, uint64_t id) const
{
    std::lock_guard<std::mutex> lk(_state->mtx);
    auto it = _state->latest.find(kind);
    return it != _state->latest.end() && it->second == id;
}

void RequestTracker::cancelAll()
{
    std::lock_guard<std::mutex> lk(_state->mtx);
    for (auto& [kind, slot] : _state->inflight)
        slot.context->cancel();
    _state->inflight.clear();
}
