#include <gtest/gtest.h>

#include "FetchPipeline.hpp"
#include "fakes.hpp"

#include <atomic>
#include <chrono>
#include <variant>

using namespace std::chrono_literals;

namespace
{
    class FetchPipelineTest : public ::testing::Test
    {
    protected:
        FetchPipelineTest()
            : pipeline(source, tracker, executor, queue)
        {
        }

        template <class T>
        T next()
        {
            auto ev = queue.pop();
            EXPECT_TRUE(ev.has_value());
            if (!ev) return T{};
            EXPECT_TRUE(std::holds_alternative<T>(*ev));
            return std::holds_alternative<T>(*ev) ? std::get<T>(*ev) : T{};
        }

        FakeSource source;
        RequestTracker tracker;
        ManualExecutor executor;
        EventQueue queue;
        FetchPipeline pipeline;
    };
}

TEST_F(FetchPipelineTest, EntriesResultCarriesTheRequestId)
{
    source.entries = { makeEntry("a"), makeEntry("b") };
    SearchOptions opts;
    opts.index = "logs-*";
    const uint64_t id = pipeline.fetchEntries(opts, "", 1s);
    EXPECT_TRUE(tracker.inFlight(RequestKind::Entries));

    executor.runAll();
    const auto res = next<EntriesResult>();
    EXPECT_EQ(res.requestId, id);
    EXPECT_FALSE(res.error);
    EXPECT_EQ(res.entries.size(), 2u);
    EXPECT_EQ(res.total, 2);
    EXPECT_EQ(res.index, "logs-*");
    EXPECT_EQ(res.query, "FROM logs-*");
    // the slot is released once the result is out
    EXPECT_FALSE(tracker.inFlight(RequestKind::Entries));
}

TEST_F(FetchPipelineTest, QuerySelectsSearch)
{
    SearchOptions opts;
    opts.index = "logs-*";
    pipeline.fetchEntries(opts, "timeout", 1s);
    executor.runAll();
    ASSERT_EQ(source.searches.size(), 1u);
    EXPECT_EQ(source.searches[0], "timeout");
}

TEST_F(FetchPipelineTest, BackendErrorIsReported)
{
    source.failWith = "index_not_found_exception";
    pipeline.fetchEntries(SearchOptions{}, "", 1s);
    executor.runAll();
    const auto res = next<EntriesResult>();
    ASSERT_TRUE(res.error);
    EXPECT_EQ(res.error->kind, FetchError::Kind::Backend);
    EXPECT_EQ(res.error->message, "index_not_found_exception");
}

TEST_F(FetchPipelineTest, ThrowingBackendBecomesAnError)
{
    source.throwOnTail = true;
    pipeline.fetchEntries(SearchOptions{}, "", 1s);
    executor.runAll();
    const auto res = next<EntriesResult>();
    ASSERT_TRUE(res.error);
    EXPECT_EQ(res.error->kind, FetchError::Kind::Backend);
    EXPECT_EQ(res.error->message, "connection reset");
    EXPECT_FALSE(tracker.inFlight(RequestKind::Entries));
}

TEST_F(FetchPipelineTest, NonStandardThrowBecomesAnError)
{
    source.throwCodeOnTail = true;
    pipeline.fetchEntries(SearchOptions{}, "", 1s);
    executor.runAll();
    const auto res = next<EntriesResult>();
    ASSERT_TRUE(res.error);
    EXPECT_EQ(res.error->kind, FetchError::Kind::Backend);
    EXPECT_EQ(res.error->message, "unknown error");
    EXPECT_FALSE(tracker.inFlight(RequestKind::Entries));
}

TEST_F(FetchPipelineTest, SupersededRequestReportsCancellation)
{
    const uint64_t first = pipeline.fetchEntries(SearchOptions{}, "", 1s);
    const uint64_t second = pipeline.fetchEntries(SearchOptions{}, "", 1s);
    executor.runAll();

    const auto a = next<EntriesResult>();
    const auto b = next<EntriesResult>();
    EXPECT_EQ(a.requestId, first);
    ASSERT_TRUE(a.error);
    EXPECT_EQ(a.error->kind, FetchError::Kind::Canceled);
    EXPECT_TRUE(a.error->isContextError());

    EXPECT_EQ(b.requestId, second);
    EXPECT_FALSE(b.error);
    EXPECT_TRUE(tracker.isLatest(RequestKind::Entries, second));
}

TEST_F(FetchPipelineTest, ExpiredRequestReportsDeadline)
{
    // the backend outlives the request's timeout
    source.onCall = [](const RequestContext& ctx) { ctx.waitFor(2s); };
    pipeline.fetchEntries(SearchOptions{}, "", 1ms);
    executor.runAll();
    const auto res = next<EntriesResult>();
    ASSERT_TRUE(res.error);
    EXPECT_EQ(res.error->kind, FetchError::Kind::DeadlineExceeded);
}

TEST_F(FetchPipelineTest, AutoDetectStopsAtTheFirstFullLookback)
{
    source.counts = { { Lookback::FiveMinutes, 12 }, { Lookback::OneHour, 15000 }, { Lookback::OneDay, 90000 } };
    pipeline.autoDetectLookback(QueryFilters{});
    executor.runAll();

    const auto res = next<AutoDetectResult>();
    EXPECT_FALSE(res.error);
    EXPECT_EQ(res.lookback, Lookback::OneHour);
    EXPECT_EQ(res.total, 15000);
    EXPECT_EQ(source.probes, (std::vector<Lookback>{ Lookback::FiveMinutes, Lookback::OneHour }));
}

TEST_F(FetchPipelineTest, AutoDetectKeepsTheFullestLookback)
{
    source.counts = { { Lookback::OneHour, 40 }, { Lookback::OneDay, 40 }, { Lookback::All, 300 } };
    source.countErrors = { { Lookback::OneWeek, "too many buckets" } };
    pipeline.autoDetectLookback(QueryFilters{});
    executor.runAll();

    const auto res = next<AutoDetectResult>();
    EXPECT_FALSE(res.error);
    EXPECT_EQ(res.lookback, Lookback::All);
    EXPECT_EQ(res.total, 300);
    EXPECT_EQ(source.probes.size(), kLookbacks.size());
}

TEST_F(FetchPipelineTest, AutoDetectOnEmptyDataDefaultsToFiveMinutes)
{
    pipeline.autoDetectLookback(QueryFilters{});
    executor.runAll();
    const auto res = next<AutoDetectResult>();
    EXPECT_FALSE(res.error);
    EXPECT_EQ(res.lookback, Lookback::FiveMinutes);
    EXPECT_EQ(res.total, 0);
}

TEST_F(FetchPipelineTest, AutoDetectFailsWhenEveryProbeFails)
{
    for (Lookback lb : kLookbacks)
        source.countErrors[lb] = "shard failure";
    pipeline.autoDetectLookback(QueryFilters{});
    executor.runAll();
    const auto res = next<AutoDetectResult>();
    ASSERT_TRUE(res.error);
    EXPECT_EQ(res.error->kind, FetchError::Kind::Backend);
    EXPECT_EQ(res.error->message, "shard failure");
    EXPECT_EQ(source.probes.size(), kLookbacks.size());
}

TEST_F(FetchPipelineTest, AutoDetectCanceledMidway)
{
    pipeline.autoDetectLookback(QueryFilters{});
    tracker.cancelAll();
    executor.runAll();
    const auto res = next<AutoDetectResult>();
    ASSERT_TRUE(res.error);
    EXPECT_TRUE(res.error->isContextError());
    EXPECT_TRUE(source.probes.empty());
}

TEST_F(FetchPipelineTest, SpansAreAscendingSpanDocuments)
{
    QueryFilters f;
    f.index = "traces-*";
    f.transactionName = "GET /cart";
    pipeline.fetchSpans(f, "trace-1");
    executor.runAll();

    ASSERT_EQ(source.tails.size(), 1u);
    const TailOptions& opts = source.tails[0];
    EXPECT_EQ(opts.traceId, "trace-1");
    EXPECT_EQ(opts.processorEvent, "span");
    EXPECT_TRUE(opts.transactionName.empty());
    EXPECT_EQ(opts.size, FetchPipeline::kSpansSize);
    EXPECT_TRUE(opts.sortAscending);

    const auto res = next<SpansResult>();
    EXPECT_EQ(res.traceId, "trace-1");
}

TEST_F(FetchPipelineTest, MetricDocsAreTheNewestCarryingTheField)
{
    pipeline.fetchMetricDetailDocs(QueryFilters{}, "metrics.system.cpu.utilization");
    executor.runAll();
    ASSERT_EQ(source.tails.size(), 1u);
    EXPECT_EQ(source.tails[0].metricField, "metrics.system.cpu.utilization");
    EXPECT_EQ(source.tails[0].size, FetchPipeline::kMetricDocsSize);
    EXPECT_FALSE(source.tails[0].sortAscending);
    next<MetricDetailDocsResult>();
}

TEST_F(FetchPipelineTest, PerspectiveOfEachType)
{
    source.serviceItems = { { "cart", 3, 0, 0 } };
    source.resourceItems = { { "prod", 1, 1, 1 }, { "dev", 1, 0, 0 } };

    pipeline.fetchPerspective(PerspectiveType::Services, Lookback::OneDay);
    executor.runAll();
    auto res = next<PerspectiveResult>();
    EXPECT_EQ(res.type, PerspectiveType::Services);
    EXPECT_EQ(res.items.size(), 1u);

    pipeline.fetchPerspective(PerspectiveType::Resources, Lookback::OneDay);
    executor.runAll();
    res = next<PerspectiveResult>();
    EXPECT_EQ(res.type, PerspectiveType::Resources);
    EXPECT_EQ(res.items.size(), 2u);
}

TEST_F(FetchPipelineTest, ChatWithoutClientDoesNothing)
{
    EXPECT_FALSE(pipeline.hasChat());
    EXPECT_EQ(pipeline.sendChat("", {}), 0u);
    EXPECT_EQ(executor.pending(), 0u);
}

TEST_F(FetchPipelineTest, ChatRoundTrip)
{
    FakeChat chat;
    pipeline.setChatClient(&chat);
    ChatMessage question;
    question.role = "user";
    question.content = "why is checkout slow?";
    const uint64_t id = pipeline.sendChat("", { question });
    EXPECT_NE(id, 0u);
    executor.runAll();

    const auto res = next<ChatResult>();
    EXPECT_FALSE(res.error);
    EXPECT_EQ(res.conversationId, "conv-1");
    EXPECT_EQ(res.message.content, "Looks healthy.");
    ASSERT_EQ(chat.histories.size(), 1u);
    EXPECT_EQ(chat.histories[0].size(), 1u);
}

TEST(WorkerPool, RunsEveryQueuedTaskBeforeShutdown)
{
    WorkerPool pool(3);
    EXPECT_EQ(pool.size(), 3u);
    std::atomic<int> ran{ 0 };
    for (int i = 0; i < 50; ++i)
        pool.submit([&ran] { ++ran; });
    pool.shutdown();
    EXPECT_EQ(ran.load(), 50);
}

TEST(WorkerPool, ResultsReachTheQueue)
{
    FakeSource source;
    source.entries = { makeEntry("x") };
    RequestTracker tracker;
    EventQueue queue;
    WorkerPool pool(2);
    FetchPipeline pipeline(source, tracker, pool, queue);

    const uint64_t id = pipeline.fetchEntries(SearchOptions{}, "", 5s);
    auto ev = queue.popFor(5s);
    ASSERT_TRUE(ev.has_value());
    ASSERT_TRUE(std::holds_alternative<EntriesResult>(*ev));
    EXPECT_EQ(std::get<EntriesResult>(*ev).requestId, id);
    pool.shutdown();
}
