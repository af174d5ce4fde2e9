#include <gtest/gtest.h>

#include "Orchestrator.hpp"
#include "fakes.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace
{
    class OrchestratorTest : public ::testing::Test
    {
    protected:
        OrchestratorTest()
            : pipeline(source, tracker, executor, queue)
            , core(pipeline, tracker, integrations(), settings(),
                   [this] { return wall; }, [this] { return steady; })
        {
        }

        Integrations integrations()
        {
            Integrations io;
            io.copyText = [this](const std::string& text) { copied.push_back(text); return true; };
            io.openUrl = [this](const std::string& url) { opened.push_back(url); return true; };
            return io;
        }

        OrchestratorSettings settings()
        {
            OrchestratorSettings s;
            s.tickInterval = 2s;
            s.statusDuration = 2s;
            s.webUrl = "http://kibana:5601/";
            s.webUser = "elastic";
            s.webPassword = "changeme";
            return s;
        }

        // Runs queued backend calls and feeds their results to the core
        // until nothing is left in flight.
        void settle()
        {
            for (;;)
            {
                executor.runAll();
                bool any = false;
                while (auto ev = queue.pop())
                {
                    core.handle(*ev);
                    any = true;
                }
                if (!any && executor.pending() == 0)
                    return;
            }
        }

        void key(const std::string& k) { core.handle(KeyEvent{ k }); }
        void keys(std::initializer_list<const char*> ks)
        {
            for (const char* k : ks)
                key(k);
        }
        void tick() { core.handle(TickEvent{ steady }); }

        void startLogs(size_t n = 5)
        {
            for (size_t i = 0; i < n; ++i)
                source.entries.push_back(makeEntry("line " + std::to_string(i)));
            core.start(SignalType::Logs, Lookback::OneDay);
            settle();
        }

        size_t spanFetches() const
        {
            size_t n = 0;
            for (const auto& t : source.tails)
                if (t.processorEvent == "span") ++n;
            return n;
        }

        const AppModel& m() const { return core.model(); }

        FakeSource source;
        RequestTracker tracker;
        ManualExecutor executor;
        EventQueue queue;
        FetchPipeline pipeline;

        std::vector<std::string> copied;
        std::vector<std::string> opened;
        SysTime wall = SysTime(std::chrono::hours(24 * 365 * 54));
        Orchestrator::Clock::time_point steady = Orchestrator::Clock::time_point(1h);

        Orchestrator core;
    };
}

// ---------- startup ----------
TEST_F(OrchestratorTest, StartProbesTheLookbackBeforeFetching)
{
    source.counts = { { Lookback::OneHour, 20000 } };
    core.start(SignalType::Logs, Lookback::OneDay);

    EXPECT_EQ(m().views.current(), ViewMode::Entries);
    EXPECT_TRUE(m().loading);
    EXPECT_EQ(m().index, "logs-*");
    EXPECT_EQ(core.activeStatus(), "Auto-detecting time range...");
    EXPECT_TRUE(tracker.inFlight(RequestKind::AutoDetectRange));
    EXPECT_FALSE(tracker.inFlight(RequestKind::Entries));

    executor.runAll();
    core.handle(*queue.pop());
    EXPECT_EQ(m().lookback, Lookback::OneHour);
    EXPECT_EQ(core.activeStatus(), "Found 20000 entries in 1h");
    EXPECT_TRUE(tracker.inFlight(RequestKind::Entries));

    settle();
    EXPECT_FALSE(m().loading);
}

TEST_F(OrchestratorTest, FailedAutoDetectStillFetches)
{
    for (Lookback lb : kLookbacks)
        source.countErrors[lb] = "boom";
    source.entries = { makeEntry("only") };
    core.start(SignalType::Logs, Lookback::OneDay);
    settle();
    EXPECT_EQ(m().lookback, Lookback::OneDay);
    EXPECT_EQ(m().entries.size(), 1u);
    EXPECT_FALSE(m().loading);
    EXPECT_NE(m().views.current(), ViewMode::ErrorModal);
    ASSERT_FALSE(source.tails.empty());
    EXPECT_EQ(source.tails.back().lookback, Lookback::OneDay);
}

TEST_F(OrchestratorTest, TimedOutAutoDetectStillFetches)
{
    FetchTimeouts t;
    t.autoDetect = 1ms;
    pipeline.setTimeouts(t);
    source.entries = { makeEntry("only") };
    core.start(SignalType::Logs, Lookback::OneDay);
    std::this_thread::sleep_for(5ms);
    settle();
    EXPECT_EQ(m().lookback, Lookback::OneDay);
    EXPECT_EQ(m().entries.size(), 1u);
    EXPECT_FALSE(m().loading);
    EXPECT_EQ(source.tails.size(), 1u);
    EXPECT_NE(m().views.current(), ViewMode::ErrorModal);
}

TEST_F(OrchestratorTest, StartOnTracesOpensTransactionNames)
{
    source.names = { { "GET /cart", 4 } };
    core.start(SignalType::Traces, Lookback::OneDay);
    EXPECT_EQ(m().views.current(), ViewMode::TransactionNames);
    EXPECT_EQ(m().index, "traces-*");
    settle();
    ASSERT_EQ(m().transactionNames.size(), 1u);
    EXPECT_FALSE(m().tracesLoading);
}

TEST_F(OrchestratorTest, StartOnMetricsOpensTheDashboard)
{
    AggregatedMetric cpu;
    cpu.name = "metrics.system.cpu.utilization";
    source.metrics.metrics = { cpu };
    core.start(SignalType::Metrics, Lookback::OneDay);
    EXPECT_EQ(m().views.current(), ViewMode::MetricsDashboard);
    settle();
    EXPECT_EQ(m().metrics.metrics.size(), 1u);
    EXPECT_FALSE(m().metricsLoading);
}

// ---------- selection ----------
TEST_F(OrchestratorTest, FilterChangeFollowsTheNewestEntryAgain)
{
    startLogs(5);
    ASSERT_EQ(m().entries.size(), 5u);
    EXPECT_EQ(m().selection.selectedIndex(), 0);

    keys({ "down", "down", "down" });
    EXPECT_EQ(m().selection.selectedIndex(), 3);
    EXPECT_TRUE(m().selection.userHasScrolled());

    // refresh keeps the user's position
    key("r");
    settle();
    EXPECT_EQ(m().selection.selectedIndex(), 3);

    key("1");
    EXPECT_EQ(m().levelFilter, "ERROR");
    settle();
    EXPECT_EQ(m().selection.selectedIndex(), 0);
    EXPECT_FALSE(m().selection.userHasScrolled());
}

TEST_F(OrchestratorTest, AscendingSortTailsTheBottom)
{
    startLogs(5);
    key("s");
    EXPECT_TRUE(m().sortAscending);
    settle();
    EXPECT_EQ(m().selection.selectedIndex(), 4);
    ASSERT_FALSE(source.tails.empty());
    EXPECT_TRUE(source.tails.back().sortAscending);
}

TEST_F(OrchestratorTest, NavigationKeysAreClamped)
{
    startLogs(5);
    key("up");
    EXPECT_EQ(m().selection.selectedIndex(), 0);
    EXPECT_FALSE(m().selection.userHasScrolled());
    key("G");
    EXPECT_EQ(m().selection.selectedIndex(), 4);
    key("pgdown");
    EXPECT_EQ(m().selection.selectedIndex(), 4);
    key("g");
    EXPECT_EQ(m().selection.selectedIndex(), 0);
}

TEST_F(OrchestratorTest, MouseRowClickSelects)
{
    startLogs(5);
    core.handle(MouseEvent{ MouseEvent::Kind::Click, "row:2" });
    EXPECT_EQ(m().selection.selectedIndex(), 2);
    core.handle(MouseEvent{ MouseEvent::Kind::WheelDown, {} });
    EXPECT_EQ(m().selection.selectedIndex(), 4);
}

TEST_F(OrchestratorTest, MalformedRowClickIsIgnored)
{
    startLogs(5);
    key("j");
    key("j");
    ASSERT_EQ(m().selection.selectedIndex(), 2);
    core.handle(MouseEvent{ MouseEvent::Kind::Click, "row:" });
    core.handle(MouseEvent{ MouseEvent::Kind::Click, "row:x1" });
    core.handle(MouseEvent{ MouseEvent::Kind::Click, "row:3x" });
    core.handle(MouseEvent{ MouseEvent::Kind::Click, "row:-1" });
    EXPECT_EQ(m().selection.selectedIndex(), 2);
    core.handle(MouseEvent{ MouseEvent::Kind::Click, "row:4" });
    EXPECT_EQ(m().selection.selectedIndex(), 4);
}

TEST_F(OrchestratorTest, MouseSortClickTogglesSort)
{
    startLogs(3);
    const size_t before = source.tails.size();
    core.handle(MouseEvent{ MouseEvent::Kind::Click, "sort" });
    EXPECT_TRUE(m().sortAscending);
    settle();
    EXPECT_EQ(source.tails.size(), before + 1);
}

// ---------- stale and failed results ----------
TEST_F(OrchestratorTest, SupersededResultIsDiscarded)
{
    startLogs(5);
    key("r");
    const uint64_t first = tracker.currentId(RequestKind::Entries);
    key("r");
    const uint64_t second = tracker.currentId(RequestKind::Entries);
    ASSERT_NE(first, second);

    EntriesResult stale;
    stale.requestId = first;
    stale.entries = { makeEntry("old") };
    core.handle(stale);
    EXPECT_EQ(m().entries.size(), 5u);
    EXPECT_TRUE(m().loading);

    EntriesResult staleError;
    staleError.requestId = first;
    staleError.error = FetchError::backend("late failure");
    core.handle(staleError);
    EXPECT_EQ(m().views.current(), ViewMode::Entries);
    EXPECT_TRUE(m().err.empty());

    EntriesResult fresh;
    fresh.requestId = second;
    fresh.entries = { makeEntry("a"), makeEntry("b") };
    core.handle(fresh);
    EXPECT_EQ(m().entries.size(), 2u);
    EXPECT_FALSE(m().loading);
}

TEST_F(OrchestratorTest, OutOfOrderCompletionKeepsTheNewestResult)
{
    startLogs(5);
    key("r");
    key("r");
    ASSERT_EQ(executor.pending(), 2u);

    // newer call answers first, the superseded one reports cancellation
    source.entries = { makeEntry("new") };
    executor.runLast();
    executor.runOne();
    while (auto ev = queue.pop())
        core.handle(*ev);

    ASSERT_EQ(m().entries.size(), 1u);
    EXPECT_EQ(m().entries[0].body, "new");
    EXPECT_FALSE(m().loading);
    EXPECT_EQ(m().views.current(), ViewMode::Entries);
}

TEST_F(OrchestratorTest, TimedOutFetchEndsSilently)
{
    startLogs(5);
    FetchTimeouts t = pipeline.timeouts();
    t.logs = 1ms;
    pipeline.setTimeouts(t);
    source.onCall = [](const RequestContext& ctx) { ctx.waitFor(2s); };

    key("r");
    settle();
    EXPECT_FALSE(m().loading);
    EXPECT_EQ(m().entries.size(), 5u);
    EXPECT_TRUE(m().err.empty());
    EXPECT_EQ(m().views.current(), ViewMode::Entries);
}

TEST_F(OrchestratorTest, BackendErrorOpensTheModalOnce)
{
    startLogs(5);
    source.failWith = "search_phase_execution_exception";
    key("r");
    settle();
    EXPECT_EQ(m().views.current(), ViewMode::ErrorModal);
    EXPECT_EQ(m().err, "search_phase_execution_exception");
    EXPECT_FALSE(m().loading);
    const size_t depth = m().views.depth();

    core.handle(ErrorEvent{ "second failure" });
    EXPECT_EQ(m().views.depth(), depth);
    EXPECT_EQ(m().err, "second failure");

    key("y");
    ASSERT_EQ(copied.size(), 1u);
    EXPECT_EQ(copied[0], "second failure");

    key("esc");
    EXPECT_EQ(m().views.current(), ViewMode::Entries);
    EXPECT_TRUE(m().err.empty());
}

TEST_F(OrchestratorTest, ErrorModalBlocksHelp)
{
    startLogs(1);
    core.handle(ErrorEvent{ "no such index [logs-*]" });
    key("?");
    EXPECT_EQ(m().views.current(), ViewMode::ErrorModal);
    key("q");
    EXPECT_EQ(m().views.current(), ViewMode::Entries);
}

// ---------- ticks ----------
TEST_F(OrchestratorTest, TickRefreshesTheEntryList)
{
    startLogs(5);
    const size_t before = source.tails.size();

    tick();
    EXPECT_EQ(core.nextTick(), steady + 2s);
    EXPECT_TRUE(m().loading);
    settle();
    EXPECT_EQ(source.tails.size(), before + 1);
}

TEST_F(OrchestratorTest, TickDoesNotRefreshUnderAnOverlayOrWhenPaused)
{
    startLogs(5);
    const size_t before = source.tails.size();

    key("?");
    tick();
    settle();
    EXPECT_EQ(source.tails.size(), before);
    key("esc");

    key("a");
    EXPECT_FALSE(m().autoRefresh);
    EXPECT_EQ(core.activeStatus(), "Auto-refresh off");
    tick();
    settle();
    EXPECT_EQ(source.tails.size(), before);
}

TEST_F(OrchestratorTest, StatusExpires)
{
    startLogs(1);
    key("a");
    ASSERT_FALSE(m().statusMessage.empty());
    steady += 1s;
    EXPECT_EQ(core.activeStatus(), "Auto-refresh off");
    steady += 2s;
    EXPECT_TRUE(core.activeStatus().empty());
    tick();
    EXPECT_TRUE(m().statusMessage.empty());
}

TEST_F(OrchestratorTest, TickIntervalChangeReschedules)
{
    startLogs(1);
    core.setTickInterval(500ms);
    EXPECT_EQ(core.tickInterval(), 500ms);
    EXPECT_EQ(core.nextTick(), steady + 500ms);
}

// ---------- overlays ----------
TEST_F(OrchestratorTest, QuitNeedsConfirmation)
{
    startLogs(1);
    key("q");
    EXPECT_EQ(m().views.current(), ViewMode::QuitConfirm);
    key("n");
    EXPECT_EQ(m().views.current(), ViewMode::Entries);
    EXPECT_FALSE(core.quitRequested());

    keys({ "q", "y" });
    EXPECT_TRUE(core.quitRequested());
}

TEST_F(OrchestratorTest, CtrlCQuitsFromAnywhere)
{
    startLogs(1);
    key("/");
    key("ctrl+c");
    EXPECT_TRUE(core.quitRequested());
}

TEST_F(OrchestratorTest, HelpToggles)
{
    startLogs(1);
    key("?");
    EXPECT_EQ(m().views.current(), ViewMode::Help);
    key("?");
    EXPECT_EQ(m().views.current(), ViewMode::Entries);
    key("h");
    EXPECT_EQ(m().views.current(), ViewMode::Help);
    key("esc");
    EXPECT_EQ(m().views.current(), ViewMode::Entries);
}

TEST_F(OrchestratorTest, SearchAppliesOnEnter)
{
    startLogs(3);
    key("/");
    EXPECT_EQ(m().views.current(), ViewMode::Search);
    // help key is plain text while typing
    keys({ "h", "t", "t", "p", "space", "5", "0", "3" });
    EXPECT_EQ(m().searchInput.text, "http 503");
    EXPECT_EQ(m().views.current(), ViewMode::Search);

    key("enter");
    EXPECT_EQ(m().views.current(), ViewMode::Entries);
    EXPECT_EQ(m().searchQuery, "http 503");
    settle();
    ASSERT_EQ(source.searches.size(), 1u);
    EXPECT_EQ(source.searches[0], "http 503");
}

TEST_F(OrchestratorTest, SearchEscapeKeepsTheQuery)
{
    startLogs(3);
    keys({ "/", "x", "esc" });
    EXPECT_EQ(m().views.current(), ViewMode::Entries);
    EXPECT_TRUE(m().searchQuery.empty());
}

TEST_F(OrchestratorTest, IndexPicker)
{
    startLogs(1);
    key("i");
    EXPECT_EQ(m().views.current(), ViewMode::IndexPicker);
    EXPECT_EQ(m().indexInput.text, "logs-*");
    keys({ "ctrl+u", "a", "p", "p", "-", "*", "enter" });
    EXPECT_EQ(m().index, "app-*");
    settle();
    EXPECT_EQ(source.tails.back().index, "app-*");
}

// ---------- detail ----------
TEST_F(OrchestratorTest, DetailWalksTheList)
{
    startLogs(3);
    key("enter");
    EXPECT_EQ(m().views.current(), ViewMode::Detail);
    EXPECT_NE(m().detailText.find("line 0"), std::string::npos);

    key("right");
    EXPECT_EQ(m().selection.selectedIndex(), 1);
    EXPECT_NE(m().detailText.find("line 1"), std::string::npos);

    key("J");
    EXPECT_EQ(m().views.current(), ViewMode::DetailRaw);
    EXPECT_EQ(m().views.depth(), 1u);

    key("esc");
    EXPECT_EQ(m().views.current(), ViewMode::Entries);
}

TEST_F(OrchestratorTest, QueryOverlay)
{
    startLogs(1);
    key("Q");
    EXPECT_EQ(m().views.current(), ViewMode::Query);
    EXPECT_EQ(core.queryOverlayText(), "FROM logs-*");
    key("y");
    ASSERT_EQ(copied.size(), 1u);
    key("esc");
    EXPECT_EQ(m().views.current(), ViewMode::Entries);
}

// ---------- traces ----------
TEST_F(OrchestratorTest, SpansAreFetchedOncePerTrace)
{
    source.names = { { "GET /cart", 3 } };
    core.start(SignalType::Traces, Lookback::OneDay);
    settle();

    source.entries = { makeEntry("tx a", "t1"), makeEntry("tx b", "t1"), makeEntry("tx c", "t2") };
    key("enter");
    EXPECT_EQ(m().traceLevel, TraceLevel::Transactions);
    EXPECT_EQ(m().selectedTxName, "GET /cart");
    EXPECT_EQ(m().views.current(), ViewMode::Entries);
    settle();

    EXPECT_EQ(spanFetches(), 1u);
    EXPECT_EQ(m().lastFetchedTraceId, "t1");
    EXPECT_FALSE(m().spans.empty());
    EXPECT_FALSE(core.needsSpanFetch("t1"));
    EXPECT_TRUE(core.needsSpanFetch("t2"));
    EXPECT_FALSE(core.needsSpanFetch(""));

    // same trace on the next row
    key("down");
    settle();
    EXPECT_EQ(spanFetches(), 1u);

    key("down");
    EXPECT_TRUE(m().spansLoading);
    EXPECT_EQ(m().lastFetchedTraceId, "t2");
    settle();
    EXPECT_EQ(spanFetches(), 2u);
    EXPECT_FALSE(m().spansLoading);
}

TEST_F(OrchestratorTest, SpansInFlightAreNotRequestedAgain)
{
    source.names = { { "GET /cart", 1 } };
    core.start(SignalType::Traces, Lookback::OneDay);
    settle();

    source.entries = { makeEntry("tx", "t1") };
    key("enter");
    executor.runOne();
    core.handle(*queue.pop());
    ASSERT_TRUE(m().spansLoading);
    ASSERT_EQ(executor.pending(), 1u);

    // an auto refresh delivers the same trace while its spans are loading
    tick();
    executor.runLast();
    core.handle(*queue.pop());
    EXPECT_EQ(executor.pending(), 1u);
    EXPECT_TRUE(m().spansLoading);

    settle();
    EXPECT_EQ(spanFetches(), 1u);
    EXPECT_FALSE(m().spansLoading);
}

TEST_F(OrchestratorTest, TraceDrillDownAndBack)
{
    source.names = { { "GET /cart", 1 } };
    core.start(SignalType::Traces, Lookback::OneDay);
    settle();
    source.entries = { makeEntry("tx", "t1") };
    key("enter");
    settle();

    key("S");
    EXPECT_EQ(m().traceLevel, TraceLevel::Spans);
    EXPECT_EQ(m().selectedTraceId, "t1");
    settle();
    EXPECT_EQ(source.tails.back().traceId, "t1");

    key("esc");
    EXPECT_EQ(m().traceLevel, TraceLevel::Transactions);
    settle();
    key("esc");
    EXPECT_EQ(m().traceLevel, TraceLevel::Names);
    EXPECT_EQ(m().views.current(), ViewMode::TransactionNames);
}

TEST_F(OrchestratorTest, OtherSignalsForgetTheFetchedTrace)
{
    startLogs(2);
    EXPECT_TRUE(m().lastFetchedTraceId.empty());
    EXPECT_EQ(spanFetches(), 0u);
}

// ---------- signals and perspectives ----------
TEST_F(OrchestratorTest, CycleSignal)
{
    startLogs(2);
    keys({ "down" });
    key("m");
    EXPECT_EQ(m().signal, SignalType::Traces);
    EXPECT_EQ(m().views.current(), ViewMode::TransactionNames);
    EXPECT_EQ(m().index, "traces-*");
    EXPECT_TRUE(m().entries.empty());
    EXPECT_EQ(m().selection.selectedIndex(), 0);
    settle();

    key("m");
    EXPECT_EQ(m().signal, SignalType::Metrics);
    EXPECT_EQ(m().views.current(), ViewMode::MetricsDashboard);
    settle();
    key("m");
    EXPECT_EQ(m().signal, SignalType::Logs);
    EXPECT_EQ(m().views.current(), ViewMode::Entries);
}

TEST_F(OrchestratorTest, PerspectiveFilterCycles)
{
    startLogs(2);
    source.serviceItems = { { "checkout", 10, 2, 0 } };
    source.resourceItems = { { "prod", 5, 0, 0 } };

    key("p");
    EXPECT_EQ(m().views.current(), ViewMode::PerspectiveList);
    EXPECT_EQ(m().perspective, PerspectiveType::Resources);
    key("p");
    EXPECT_EQ(m().perspective, PerspectiveType::Services);
    EXPECT_EQ(m().views.depth(), 1u);
    settle();
    ASSERT_EQ(m().perspectiveItems.size(), 1u);

    key("enter");
    EXPECT_EQ(m().serviceFilter, "checkout");
    EXPECT_FALSE(m().negateService);
    key("enter");
    EXPECT_TRUE(m().negateService);
    key("enter");
    EXPECT_TRUE(m().serviceFilter.empty());

    key("enter");
    const size_t before = source.tails.size();
    key("esc");
    EXPECT_EQ(m().views.current(), ViewMode::Entries);
    settle();
    ASSERT_EQ(source.tails.size(), before + 1);
    EXPECT_EQ(source.tails.back().service, "checkout");
}

TEST_F(OrchestratorTest, LookbackCycles)
{
    startLogs(1);
    const Lookback before = m().lookback;
    key("l");
    EXPECT_EQ(m().lookback, nextLookback(before));
    settle();
    EXPECT_EQ(source.tails.back().lookback, m().lookback);
}

// ---------- fields ----------
TEST_F(OrchestratorTest, FieldPickerTogglesColumns)
{
    startLogs(1);
    source.fieldInfos = { { "http.status", "long", false, true, 40 } };
    key("f");
    EXPECT_EQ(m().views.current(), ViewMode::Fields);
    settle();

    const auto rows = core.sortedFieldList();
    auto it = std::find_if(rows.begin(), rows.end(), [](const FieldInfo& f) { return f.name == "http.status"; });
    ASSERT_NE(it, rows.end());
    key("G");
    EXPECT_EQ(m().fieldsCursor, int(rows.size()) - 1);
    ASSERT_EQ(rows.back().name, "http.status");
    key("space");
    EXPECT_TRUE(core.isFieldDisplayed("http.status"));
    key("space");
    EXPECT_FALSE(core.isFieldDisplayed("http.status"));
    key("esc");
    EXPECT_EQ(m().views.current(), ViewMode::Entries);
}

// ---------- chat ----------
TEST_F(OrchestratorTest, ChatWithoutBackend)
{
    startLogs(1);
    key("c");
    EXPECT_EQ(m().views.current(), ViewMode::Entries);
    EXPECT_EQ(core.activeStatus(), "No chat backend configured");
}

TEST_F(OrchestratorTest, ChatConversation)
{
    FakeChat chat;
    pipeline.setChatClient(&chat);
    startLogs(1);

    key("c");
    EXPECT_EQ(m().views.current(), ViewMode::Chat);
    keys({ "h", "i" });
    EXPECT_EQ(m().chatInput.text, "hi");
    key("enter");
    EXPECT_TRUE(m().chatLoading);
    settle();

    ASSERT_EQ(m().chatMessages.size(), 2u);
    EXPECT_EQ(m().chatMessages[0].content, "hi");
    EXPECT_EQ(m().chatMessages[1].content, "Looks healthy.");
    EXPECT_EQ(m().conversationId, "conv-1");
    ASSERT_EQ(chat.histories.size(), 1u);
    EXPECT_EQ(chat.histories[0][0].content.rfind("Context: viewing logs", 0), 0u);

    chat.failWith = "rate limited";
    keys({ "o", "k", "enter" });
    settle();
    ASSERT_EQ(m().chatMessages.size(), 4u);
    EXPECT_TRUE(m().chatMessages.back().error);
    EXPECT_EQ(m().views.current(), ViewMode::Chat);

    keys({ "esc", "esc" });
    EXPECT_EQ(m().views.current(), ViewMode::Entries);
}

// ---------- browser ----------
TEST_F(OrchestratorTest, BrowserLinkShowsCredentialsFirst)
{
    startLogs(1);
    key("K");
    EXPECT_EQ(m().views.current(), ViewMode::Credentials);
    EXPECT_EQ(m().lastWebUrl.rfind("http://kibana:5601/app/discover#/", 0), 0u);

    key("enter");
    ASSERT_EQ(opened.size(), 1u);
    EXPECT_EQ(opened[0], m().lastWebUrl);
    EXPECT_EQ(m().views.current(), ViewMode::Credentials);

    key("n");
    EXPECT_EQ(m().views.current(), ViewMode::Entries);
    EXPECT_TRUE(m().hideCredentials);
    key("K");
    EXPECT_EQ(m().views.current(), ViewMode::Entries);
    EXPECT_EQ(opened.size(), 2u);
}

// ---------- config watch ----------
TEST_F(OrchestratorTest, ConfigWatchWithoutFile)
{
    startLogs(1);
    keys({ "O", "enter" });
    EXPECT_EQ(m().views.current(), ViewMode::CollectorConfigUnavailable);
    key("esc");
    EXPECT_EQ(m().views.current(), ViewMode::Entries);
}

TEST(OrchestratorConfig, ReloadsWhenTheFileChanges)
{
    namespace fs = std::filesystem;
    const fs::path file = fs::temp_directory_path() / "lookout_watch_test.json";
    std::ofstream(file) << R"({"data": {"logs": "logs.json"}})";

    FakeSource source;
    RequestTracker tracker;
    ManualExecutor executor;
    EventQueue queue;
    FetchPipeline pipeline(source, tracker, executor, queue);

    int reloads = 0;
    bool reject = false;
    OrchestratorSettings settings;
    settings.configPath = file.string();
    settings.reloadConfig = [&](std::string* outMessage) {
        ++reloads;
        if (reject) *outMessage = "tui.workers must be at least 1";
        return !reject;
    };
    std::vector<std::string> opened;
    Integrations io;
    io.openUrl = [&](const std::string& url) { opened.push_back(url); return true; };

    Orchestrator core(pipeline, tracker, io, settings);
    core.start(SignalType::Logs, Lookback::OneDay);

    core.handle(KeyEvent{ "O" });
    EXPECT_EQ(core.model().views.current(), ViewMode::CollectorConfigExplain);
    core.handle(KeyEvent{ "enter" });
    EXPECT_EQ(core.model().views.current(), ViewMode::CollectorConfigWatch);
    EXPECT_TRUE(core.model().watchingConfig);
    ASSERT_EQ(opened.size(), 1u);
    EXPECT_EQ(opened[0], "file://" + file.string());

    // untouched file: nothing to do
    core.handle(TickEvent{ std::chrono::steady_clock::now() });
    EXPECT_EQ(reloads, 0);

    fs::last_write_time(file, fs::last_write_time(file) + 5s);
    core.handle(TickEvent{ std::chrono::steady_clock::now() });
    EXPECT_EQ(reloads, 1);
    EXPECT_EQ(core.model().configReloads, 1);
    EXPECT_TRUE(core.model().configValid);

    reject = true;
    fs::last_write_time(file, fs::last_write_time(file) + 5s);
    core.handle(TickEvent{ std::chrono::steady_clock::now() });
    EXPECT_EQ(reloads, 2);
    EXPECT_FALSE(core.model().configValid);
    EXPECT_EQ(core.model().configStatus, "tui.workers must be at least 1");

    core.handle(KeyEvent{ "esc" });
    EXPECT_FALSE(core.model().watchingConfig);
    fs::remove(file);
}
