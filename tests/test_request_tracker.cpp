#include <gtest/gtest.h>

#include "RequestContext.hpp"
#include "RequestTracker.hpp"

#include <chrono>
#include <thread>

using namespace std::chrono_literals;

TEST(RequestContext, CancelIsTerminal)
{
    auto ctx = RequestContext::withTimeout(10s);
    EXPECT_FALSE(ctx->done());
    ctx->cancel();
    EXPECT_EQ(ctx->err(), ContextError::Canceled);
    ctx->cancel();
    EXPECT_EQ(ctx->err(), ContextError::Canceled);
}

TEST(RequestContext, DeadlineExpires)
{
    auto ctx = RequestContext::withTimeout(1ms);
    EXPECT_EQ(ctx->waitFor(2s), ContextError::DeadlineExceeded);
    // cancelling afterwards keeps the first terminal state
    ctx->cancel();
    EXPECT_EQ(ctx->err(), ContextError::DeadlineExceeded);
}

TEST(RequestContext, BackgroundHasNoDeadline)
{
    auto ctx = RequestContext::background();
    EXPECT_FALSE(ctx->hasDeadline());
    EXPECT_EQ(ctx->waitFor(1ms), ContextError::None);
}

TEST(RequestContext, ErrorNames)
{
    EXPECT_STREQ(contextErrorName(ContextError::Canceled), "context canceled");
    EXPECT_STREQ(contextErrorName(ContextError::DeadlineExceeded), "context deadline exceeded");
}

TEST(RequestTracker, StartingAgainCancelsThePreviousRequestOfTheSameKind)
{
    RequestTracker tracker;
    auto first = tracker.startRequest(RequestKind::Entries, 10s);
    auto second = tracker.startRequest(RequestKind::Entries, 10s);

    EXPECT_NE(first.id, second.id);
    EXPECT_EQ(first.context->err(), ContextError::Canceled);
    EXPECT_EQ(second.context->err(), ContextError::None);
    EXPECT_EQ(tracker.currentId(RequestKind::Entries), second.id);
    EXPECT_FALSE(tracker.isLatest(RequestKind::Entries, first.id));
    EXPECT_TRUE(tracker.isLatest(RequestKind::Entries, second.id));
}

TEST(RequestTracker, KindsAreIndependent)
{
    RequestTracker tracker;
    auto entries = tracker.startRequest(RequestKind::Entries, 10s);
    auto spans = tracker.startRequest(RequestKind::Spans, 10s);

    EXPECT_EQ(entries.context->err(), ContextError::None);
    EXPECT_EQ(spans.context->err(), ContextError::None);
    EXPECT_EQ(tracker.inFlightCount(), 2u);
}

TEST(RequestTracker, IdsGrowAcrossKinds)
{
    RequestTracker tracker;
    auto a = tracker.startRequest(RequestKind::Entries, 10s);
    auto b = tracker.startRequest(RequestKind::MetricsAggregate, 10s);
    auto c = tracker.startRequest(RequestKind::Entries, 10s);
    EXPECT_LT(a.id, b.id);
    EXPECT_LT(b.id, c.id);
}

TEST(RequestTracker, StaleDoneLeavesTheNewerRequestAlone)
{
    RequestTracker tracker;
    auto first = tracker.startRequest(RequestKind::Entries, 10s);
    auto second = tracker.startRequest(RequestKind::Entries, 10s);

    first.done();
    EXPECT_EQ(tracker.currentId(RequestKind::Entries), second.id);
    EXPECT_EQ(second.context->err(), ContextError::None);

    second.done();
    EXPECT_FALSE(tracker.inFlight(RequestKind::Entries));
    // done releases the context
    EXPECT_TRUE(second.context->done());
    // still the latest once completed
    EXPECT_TRUE(tracker.isLatest(RequestKind::Entries, second.id));
}

TEST(RequestTracker, DoneIsIdempotent)
{
    RequestTracker tracker;
    auto req = tracker.startRequest(RequestKind::Chat, 10s);
    req.done();
    req.done();
    EXPECT_EQ(tracker.inFlightCount(), 0u);
}

TEST(RequestTracker, DoneAfterTrackerIsGone)
{
    RequestTracker::Request req;
    {
        RequestTracker tracker;
        req = tracker.startRequest(RequestKind::Spans, 10s);
    }
    req.done();
    EXPECT_TRUE(req.context->done());
}

TEST(RequestTracker, CancelAll)
{
    RequestTracker tracker;
    auto a = tracker.startRequest(RequestKind::Entries, 10s);
    auto b = tracker.startRequest(RequestKind::FieldMetadata, 10s);
    tracker.cancelAll();

    EXPECT_EQ(a.context->err(), ContextError::Canceled);
    EXPECT_EQ(b.context->err(), ContextError::Canceled);
    EXPECT_EQ(tracker.inFlightCount(), 0u);
}

TEST(RequestTracker, DoneFromAnotherThread)
{
    RequestTracker tracker;
    auto req = tracker.startRequest(RequestKind::Entries, 10s);
    std::thread worker([done = req.done] { done(); });
    worker.join();
    EXPECT_FALSE(tracker.inFlight(RequestKind::Entries));
}

TEST(RequestTracker, TimeoutReachesTheContext)
{
    RequestTracker tracker;
    auto req = tracker.startRequest(RequestKind::Entries, 1ms);
    EXPECT_TRUE(req.context->hasDeadline());
    EXPECT_EQ(req.context->waitFor(2s), ContextError::DeadlineExceeded);
}
