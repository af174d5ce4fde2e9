#pragma once
#include "RequestContext.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

enum class RequestKind
{
    Entries,
    FieldMetadata,
    AutoDetectRange,
    MetricsAggregate,
    MetricDetailDocuments,
    TransactionNames,
    Spans,
    PerspectiveRollup,
    Chat,
};

const char* requestKindName(RequestKind kind);

/// @brief Keeps at most one current request per kind.
/// Starting a request cancels the previous one of the same kind. A request's
/// done() only clears the slot while that slot still holds the same id.
class RequestTracker
{
public:
    struct Request
    {
        std::shared_ptr<RequestContext> context;
        uint64_t id = 0;
        // idempotent, safe from any thread
        std::function<void()> done;
    };

    RequestTracker();

    Request startRequest(RequestKind kind, std::chrono::milliseconds timeout);

    // Id of the in-flight request of this kind, 0 when none.
    uint64_t currentId(RequestKind kind) const;
    bool inFlight(RequestKind kind) const { return currentId(kind) != 0; }
    size_t inFlightCount() const;

    // True when `id` is the most recently started request of this kind,
    // whether or not it already completed.
    bool isLatest(RequestKind kind, uint64_t id) const;

    void cancelAll();

private:
    struct Slot
    {
        std::shared_ptr<RequestContext> context;
        uint64_t id = 0;
    };

    // outlives the tracker while workers still hold done()
    struct State
    {
        std::mutex mtx;
        std::unordered_map<RequestKind, Slot> inflight;
        std::unordered_map<RequestKind, uint64_t> latest;
        uint64_t seq = 0;
    };

    std::shared_ptr<State> _state;
};
