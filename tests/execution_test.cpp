#include "execution.hpp"

#include <thread>

#include <gtest/gtest.h>

#include "test_support.hpp"

using namespace std::chrono_literals;
using testing_support::TempDir;

namespace {

Execution freshExecution(const std::string& id = "exec-1") {
    Execution execution;
    execution.id = id;
    execution.path = "backups/shop.sql.gz";
    execution.startedAt = isoTimestamp();
    return execution;
}

/// Manually advanced clock for throttle tests.
struct ManualClock {
    std::chrono::steady_clock::time_point now{};
    FlushThrottle::Clock function() {
        return [this] { return now; };
    }
};

} // namespace

TEST(FlushThrottleTest, AllowsOneFlushPerInterval) {
    ManualClock clock;
    FlushThrottle throttle(1000ms, clock.function());

    EXPECT_TRUE(throttle.shouldFlush());
    clock.now += 400ms;
    EXPECT_FALSE(throttle.shouldFlush());
    clock.now += 600ms;
    EXPECT_TRUE(throttle.shouldFlush());
    EXPECT_FALSE(throttle.shouldFlush());
}

TEST(FlushThrottleTest, ForcedFlushAlwaysPassesAndRestartsTheInterval) {
    ManualClock clock;
    FlushThrottle throttle(1000ms, clock.function());

    EXPECT_TRUE(throttle.shouldFlush());
    clock.now += 100ms;
    EXPECT_TRUE(throttle.shouldFlush(true));
    clock.now += 950ms;
    EXPECT_FALSE(throttle.shouldFlush());
}

TEST(ClassifyLogLineTest, MatchesSubstringsCaseInsensitively) {
    EXPECT_EQ(classifyLogLine("ERROR 1049 (42000): Unknown database"), LogLevel::Error);
    EXPECT_EQ(classifyLogLine("pg_restore: connection failed"), LogLevel::Error);
    EXPECT_EQ(classifyLogLine("FATAL: role does not exist"), LogLevel::Error);
    EXPECT_EQ(classifyLogLine("mysql: [Warning] Using a password"), LogLevel::Warning);
    EXPECT_EQ(classifyLogLine("SET"), LogLevel::Info);
}

TEST(ExecutionJsonTest, PersistsStageAndProgressUnderMetadata) {
    Execution execution = freshExecution();
    execution.stage = RestoreStage::RestoringDatabase;
    execution.progress = 42;
    execution.logs.push_back(LogEntry{"2024-01-01T00:00:00.000Z", "mysql: done", LogLevel::Warning,
                                      LogType::Command, "Restoring Database", std::string("details")});

    Json::Value json = execution.toJson();
    EXPECT_EQ(json["type"].asString(), "Restore");
    EXPECT_EQ(json["status"].asString(), "Running");
    EXPECT_EQ(json["metadata"]["stage"].asString(), "Restoring Database");
    EXPECT_EQ(json["metadata"]["progress"].asInt(), 42);
    EXPECT_FALSE(json.isMember("endedAt"));

    Execution parsed = Execution::fromJson(json);
    EXPECT_EQ(parsed.stage, RestoreStage::RestoringDatabase);
    EXPECT_EQ(parsed.progress, 42);
    ASSERT_EQ(parsed.logs.size(), 1u);
    EXPECT_EQ(parsed.logs[0].level, LogLevel::Warning);
    EXPECT_EQ(parsed.logs[0].type, LogType::Command);
    EXPECT_EQ(parsed.logs[0].details, "details");
}

TEST(JsonFileExecutionStoreTest, SavesAndLoadsRecords) {
    TempDir dir;
    JsonFileExecutionStore store(dir.file("executions"));

    Execution execution = freshExecution("abc");
    execution.status = ExecutionStatus::Failed;
    execution.endedAt = isoTimestamp();
    ASSERT_TRUE(store.save(execution).has_value());

    EXPECT_TRUE(std::filesystem::exists(dir.file("executions/abc.json")));
    EXPECT_FALSE(std::filesystem::exists(dir.file("executions/abc.json.tmp")));

    auto loaded = store.load("abc");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->status, ExecutionStatus::Failed);
    EXPECT_EQ(loaded->endedAt, execution.endedAt);
    EXPECT_FALSE(store.load("missing").has_value());
}

class ExecutionTrackerTest : public ::testing::Test {
protected:
    FlushThrottle throttle() { return FlushThrottle(1000ms, clock_.function()); }

    ManualClock clock_;
    MemoryExecutionStore store_;
};

TEST_F(ExecutionTrackerTest, PersistsTheInitialRecord) {
    ExecutionTracker tracker(freshExecution(), store_, nullptr, throttle());
    auto stored = store_.load("exec-1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, ExecutionStatus::Running);
    EXPECT_EQ(stored->stage, RestoreStage::Initializing);
}

TEST_F(ExecutionTrackerTest, ThrottlesInfoLinesButFlushesErrors) {
    ExecutionTracker tracker(freshExecution(), store_, nullptr, throttle());
    std::size_t initial = store_.saveCount();

    tracker.log("first");
    tracker.log("second");
    tracker.setProgress(30);
    EXPECT_EQ(store_.saveCount(), initial);

    tracker.log("mysql: ERROR 1045", LogLevel::Error, LogType::Command);
    EXPECT_EQ(store_.saveCount(), initial + 1);
    EXPECT_EQ(store_.load("exec-1")->logs.size(), 3u);

    clock_.now += 1500ms;
    tracker.log("later");
    EXPECT_EQ(store_.saveCount(), initial + 2);
}

TEST_F(ExecutionTrackerTest, TagsLogsWithTheCurrentStage) {
    ExecutionTracker tracker(freshExecution(), store_, nullptr, throttle());
    tracker.setStage(RestoreStage::Downloading);
    tracker.log("Downloading backups/shop.sql.gz", LogLevel::Info, LogType::Storage);
    tracker.setStage(RestoreStage::Decompressing);
    tracker.log("Decompressing");

    Execution snapshot = tracker.snapshot();
    ASSERT_EQ(snapshot.logs.size(), 2u);
    EXPECT_EQ(snapshot.logs[0].stage, "Downloading");
    EXPECT_EQ(snapshot.logs[1].stage, "Decompressing");
    EXPECT_EQ(store_.load("exec-1")->stage, RestoreStage::Decompressing);
}

TEST_F(ExecutionTrackerTest, ClampsProgress) {
    ExecutionTracker tracker(freshExecution(), store_, nullptr, throttle());
    tracker.setProgress(150);
    EXPECT_EQ(tracker.snapshot().progress, 100);
    tracker.setProgress(-5);
    EXPECT_EQ(tracker.snapshot().progress, 0);
}

TEST_F(ExecutionTrackerTest, CompletesOnceAndFreezes) {
    ExecutionTracker tracker(freshExecution(), store_, nullptr, throttle());
    tracker.log("working");

    EXPECT_TRUE(tracker.complete("Restore completed successfully"));
    EXPECT_TRUE(tracker.isTerminal());
    EXPECT_FALSE(tracker.fail("too late"));
    tracker.log("ignored");
    tracker.setStage(RestoreStage::Downloading);

    auto stored = store_.load("exec-1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, ExecutionStatus::Success);
    EXPECT_EQ(stored->stage, RestoreStage::Completed);
    EXPECT_EQ(stored->progress, 100);
    ASSERT_TRUE(stored->endedAt.has_value());
    ASSERT_EQ(stored->logs.size(), 2u);
    EXPECT_EQ(stored->logs.back().level, LogLevel::Success);
}

TEST_F(ExecutionTrackerTest, FailureAppendsTheErrorAndKeepsProgress) {
    ExecutionTracker tracker(freshExecution(), store_, nullptr, throttle());
    tracker.setProgress(40);
    EXPECT_TRUE(tracker.fail("Failed to download file from storage: timeout"));

    auto stored = store_.load("exec-1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, ExecutionStatus::Failed);
    EXPECT_EQ(stored->stage, RestoreStage::Failed);
    EXPECT_EQ(stored->progress, 40);
    EXPECT_EQ(stored->logs.back().message, "Failed to download file from storage: timeout");
    EXPECT_EQ(stored->logs.back().level, LogLevel::Error);
}

TEST_F(ExecutionTrackerTest, HeldBackUpdateIsPersistedOnDestruction) {
    {
        ExecutionTracker tracker(freshExecution(), store_, nullptr, throttle());
        tracker.setProgress(30);
        EXPECT_EQ(store_.load("exec-1")->progress, 0);
    }
    EXPECT_EQ(store_.load("exec-1")->progress, 30);
}

TEST(ExecutionTrackerFlushTest, HeldBackUpdateIsPersistedWithoutFurtherCalls) {
    MemoryExecutionStore store;
    ExecutionTracker tracker(freshExecution(), store, nullptr, FlushThrottle(50ms));
    tracker.setStage(RestoreStage::RestoringDatabase);
    tracker.setProgress(50);

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (store.load("exec-1")->progress != 50 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(store.load("exec-1")->progress, 50);
    EXPECT_EQ(store.load("exec-1")->stage, RestoreStage::RestoringDatabase);
}
