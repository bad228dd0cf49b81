#include <gtest/gtest.h>

#include <mutex>

#include "Database/Configuration.h"
#include "Extract/SnapshotExtractor.h"
#include "Persist/ISnapshotSink.h"
#include "Scheduler/PollScheduler.h"
#include "Standings/StandingsSnapshot.h"
#include "Utility/Errors.h"
#include "FakeStandingsView.h"
#include "TestSupport.h"

using testsupport::FakeStandingsView;
using testsupport::makeTeams;
using testsupport::waitUntil;

namespace {

class RecordingSink : public ISnapshotSink {
public:
    std::string persist(const StandingsSnapshot& snapshot, std::chrono::system_clock::time_point) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshots_.push_back(snapshot);
        return "memory://" + std::to_string(snapshot.timeIndex());
    }

    std::vector<StandingsSnapshot> snapshots() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshots_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<StandingsSnapshot> snapshots_;
};

class PollSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        config.targetFile = dir.file("contests.txt");
        config.authFile = dir.file("auth_state.json");
        config.homeUrl = "https://example.test/";
        config.pollInterval = std::chrono::milliseconds(10);
        config.refreshSettle = std::chrono::milliseconds(5);
        config.backoff = std::chrono::milliseconds(10);
        config.tick = std::chrono::milliseconds(5);
        config.pageSettle = std::chrono::milliseconds(0);
        config.readyTimeout = std::chrono::milliseconds(10);
        config.collector.settleDelay = std::chrono::milliseconds(0);

        testsupport::writeFile(config.targetFile, "  https://example.test/contest/1#/  \nignored\n");
        testsupport::writeFile(config.authFile, "{\"version\":1,\"cookies\":[{\"name\":\"sid\",\"value\":\"x\"}]}");
    }

    // Builds a scheduler around a fresh fake view and keeps a handle to the view.
    std::unique_ptr<PollScheduler> makeScheduler(int teams = 9)
    {
        auto session = std::make_unique<FakeStandingsView>(makeTeams(teams), 4);
        view = session.get();
        auto scheduler = std::make_unique<PollScheduler>(std::move(session), extractor, sink, config);
        scheduler->setLoginPrompt([this](IBrowserSession&, const std::string&) { loginPrompts++; });
        return scheduler;
    }

    testsupport::TempDir dir;
    SchedulerConfig config;
    SnapshotExtractor extractor;
    RecordingSink sink;
    FakeStandingsView* view = nullptr;
    std::atomic<int> loginPrompts{ 0 };
};

}

TEST_F(PollSchedulerTest, ReadsFirstLineOfTargetFileTrimmed)
{
    EXPECT_EQ("https://example.test/contest/1#/", PollScheduler::readTarget(config.targetFile));

    testsupport::writeFile(dir.file("blank.txt"), "   \nhttps://example.test/second\n");
    EXPECT_THROW(PollScheduler::readTarget(dir.file("blank.txt")), ConfigError);
    EXPECT_THROW(PollScheduler::readTarget(dir.file("absent.txt")), ConfigError);
}

TEST_F(PollSchedulerTest, MissingTargetClosesWithoutPolling)
{
    config.targetFile = dir.file("absent.txt");
    std::unique_ptr<PollScheduler> scheduler = makeScheduler();

    scheduler->run();

    SchedulerStatus status = scheduler->status();
    EXPECT_EQ(SchedulerState::CLOSED, status.state);
    EXPECT_FALSE(status.lastError.empty());
    EXPECT_EQ(0, status.totalPolls);
    EXPECT_EQ(0, view->openCalls.load());
    EXPECT_EQ(0, view->markupCalls.load());
    EXPECT_TRUE(sink.snapshots().empty());
}

TEST_F(PollSchedulerTest, SingleRunReusesSavedLogin)
{
    std::unique_ptr<PollScheduler> scheduler = makeScheduler(9);

    ASSERT_TRUE(scheduler->runOnce());

    EXPECT_EQ(0, loginPrompts.load());
    EXPECT_NE(std::string::npos, view->importedAuth().find("\"sid\""));

    std::vector<std::string> navigations = view->navigations();
    ASSERT_FALSE(navigations.empty());
    EXPECT_EQ("https://example.test/contest/1#/", navigations.back());

    std::vector<StandingsSnapshot> snapshots = sink.snapshots();
    ASSERT_EQ(1u, snapshots.size());
    EXPECT_EQ(9u, snapshots[0].size());

    SchedulerStatus status = scheduler->status();
    EXPECT_EQ(SchedulerState::CLOSED, status.state);
    EXPECT_EQ(1, status.totalPolls);
    EXPECT_EQ(snapshots[0].timeIndex(), status.lastTimeIndex);
    EXPECT_TRUE(status.lastSuccessfulPoll.has_value());
    EXPECT_EQ(1, view->closeCalls.load());
}

TEST_F(PollSchedulerTest, FirstRunLogsInInteractivelyAndSavesLogin)
{
    std::filesystem::remove(config.authFile);
    std::unique_ptr<PollScheduler> scheduler = makeScheduler();
    view->exportedAuth = "{\"version\":1,\"cookies\":[{\"name\":\"fresh\"}]}";

    ASSERT_TRUE(scheduler->runOnce());

    EXPECT_EQ(1, loginPrompts.load());
    EXPECT_EQ(view->exportedAuth, testsupport::readFile(config.authFile));
    EXPECT_FALSE(std::filesystem::exists(config.authFile + ".tmp"));
}

TEST_F(PollSchedulerTest, TransientFailureBacksOffAndRetries)
{
    std::unique_ptr<PollScheduler> scheduler = makeScheduler();
    view->transientMarkupFailures = 2;

    scheduler->start();
    ASSERT_TRUE(waitUntil([&]() { return scheduler->status().totalPolls >= 1; }));
    scheduler->stop();

    SchedulerStatus status = scheduler->status();
    EXPECT_EQ(SchedulerState::CLOSED, status.state);
    EXPECT_EQ(0, status.consecutiveFailures);
    EXPECT_NE(std::string::npos, status.lastError.find("timed out"));
    EXPECT_EQ(1, view->openCalls.load());
    EXPECT_EQ(1, view->closeCalls.load());
}

TEST_F(PollSchedulerTest, PollsRepeatWithIncreasingTimeIndex)
{
    std::unique_ptr<PollScheduler> scheduler = makeScheduler();

    scheduler->start();
    ASSERT_TRUE(waitUntil([&]() { return scheduler->status().totalPolls >= 3; }));
    scheduler->stop();

    std::vector<StandingsSnapshot> snapshots = sink.snapshots();
    ASSERT_GE(snapshots.size(), 3u);
    for (size_t i = 1; i < snapshots.size(); ++i) {
        EXPECT_GT(snapshots[i].timeIndex(), snapshots[i - 1].timeIndex());
    }
    EXPECT_GE(view->reloadCalls.load(), 2);
}

TEST_F(PollSchedulerTest, SessionLossEndsLoopInClosed)
{
    std::unique_ptr<PollScheduler> scheduler = makeScheduler();
    view->fatalOnReload = true;

    scheduler->start();
    ASSERT_TRUE(waitUntil([&]() { return scheduler->status().state == SchedulerState::CLOSED; }));

    SchedulerStatus status = scheduler->status();
    EXPECT_EQ(1, status.totalPolls);
    EXPECT_NE(std::string::npos, status.lastError.find("invalid session id"));
    EXPECT_EQ(1, view->reloadCalls.load());

    scheduler->close();
    scheduler->stop();
    EXPECT_EQ(1, view->closeCalls.load());
}

TEST_F(PollSchedulerTest, UnreachableDriverAtStartupIsFatal)
{
    std::unique_ptr<PollScheduler> scheduler = makeScheduler();
    view->fatalOnOpen = true;

    scheduler->run();

    EXPECT_EQ(SchedulerState::CLOSED, scheduler->status().state);
    EXPECT_EQ(0, view->markupCalls.load());
    EXPECT_TRUE(sink.snapshots().empty());
}

TEST_F(PollSchedulerTest, StopDuringLongSleepReturnsWithinATick)
{
    config.pollInterval = std::chrono::milliseconds(60000);
    config.tick = std::chrono::milliseconds(1000);
    std::unique_ptr<PollScheduler> scheduler = makeScheduler();

    scheduler->start();
    ASSERT_TRUE(waitUntil([&]() { return scheduler->status().totalPolls >= 1; }));

    auto before = std::chrono::steady_clock::now();
    scheduler->stop();
    auto elapsed = std::chrono::steady_clock::now() - before;

    EXPECT_LE(elapsed, std::chrono::milliseconds(1000));
    EXPECT_EQ(SchedulerState::CLOSED, scheduler->status().state);
}

TEST_F(PollSchedulerTest, StopDuringCollectorSettleAbandonsTheSnapshot)
{
    config.collector.settleDelay = std::chrono::milliseconds(500);
    config.collector.maxIterations = 20;
    config.tick = std::chrono::milliseconds(100);
    std::unique_ptr<PollScheduler> scheduler = makeScheduler();
    view->endless = true;

    scheduler->start();
    ASSERT_TRUE(waitUntil([&]() { return view->markupCalls.load() >= 2; }));

    auto before = std::chrono::steady_clock::now();
    scheduler->stop();
    auto elapsed = std::chrono::steady_clock::now() - before;

    EXPECT_LE(elapsed, std::chrono::milliseconds(1000));
    EXPECT_LT(view->markupCalls.load(), 20);
    EXPECT_TRUE(sink.snapshots().empty());
    EXPECT_EQ(0, scheduler->status().totalPolls);
    EXPECT_EQ(SchedulerState::CLOSED, scheduler->status().state);
}

TEST_F(PollSchedulerTest, StopDuringBackoffReturnsWithinATick)
{
    config.backoff = std::chrono::milliseconds(60000);
    config.tick = std::chrono::milliseconds(100);
    std::unique_ptr<PollScheduler> scheduler = makeScheduler();
    view->transientMarkupFailures = 1;

    scheduler->start();
    ASSERT_TRUE(waitUntil([&]() { return scheduler->status().state == SchedulerState::RETRY_BACKOFF; }));

    auto before = std::chrono::steady_clock::now();
    scheduler->stop();
    auto elapsed = std::chrono::steady_clock::now() - before;

    EXPECT_LE(elapsed, std::chrono::milliseconds(1000));
    EXPECT_EQ(1, scheduler->status().consecutiveFailures);
    EXPECT_TRUE(sink.snapshots().empty());
    EXPECT_EQ(SchedulerState::CLOSED, scheduler->status().state);
}

TEST_F(PollSchedulerTest, CloseReleasesSessionOnce)
{
    std::unique_ptr<PollScheduler> scheduler = makeScheduler();
    scheduler->close();
    scheduler->close();
    EXPECT_EQ(1, view->closeCalls.load());
    EXPECT_EQ(SchedulerState::CLOSED, scheduler->status().state);
}

TEST(SchedulerConfigTest, IntervalsComeFromConfiguration)
{
    Configuration config;
    config.importText("",
        "scheduler.poll_interval_seconds = 30\n"
        "scheduler.refresh_settle_seconds = 2.5\n"
        "scheduler.backoff_seconds = 5\n"
        "scheduler.tick_ms = 250\n"
        "target.file = /tmp/contest.txt\n");

    SchedulerConfig loaded = SchedulerConfig::LoadFrom(config);
    EXPECT_EQ(30000, loaded.pollInterval.count());
    EXPECT_EQ(2500, loaded.refreshSettle.count());
    EXPECT_EQ(5000, loaded.backoff.count());
    EXPECT_EQ(250, loaded.tick.count());
    EXPECT_EQ(10000, loaded.pageSettle.count());
    EXPECT_EQ("/tmp/contest.txt", loaded.targetFile);
}

TEST(SchedulerStateTest, NamesEveryState)
{
    EXPECT_EQ("RETRY_BACKOFF", PollScheduler::stateToString(SchedulerState::RETRY_BACKOFF));
    EXPECT_EQ("CLOSED", PollScheduler::stateToString(SchedulerState::CLOSED));
}
