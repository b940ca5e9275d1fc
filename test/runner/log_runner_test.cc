#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/runner/log_runner.h"
#include "../logs/log_line_builder.h"
#include "../logs/mock_collaborators.h"
#include <deque>
#include <thread>

using namespace Collector;
using namespace Collector::test_util;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::DoAll;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SetArgReferee;

namespace {

// Hands out queued batches, one per poll
class FakeLogSource : public ILogSource {
public:
    void Push(std::vector<LogLine> batch) { batches_.push_back(std::move(batch)); }

    std::vector<LogLine> Poll() override {
        if (batches_.empty()) return {};
        std::vector<LogLine> batch = std::move(batches_.front());
        batches_.pop_front();
        return batch;
    }

private:
    std::deque<std::vector<LogLine>> batches_;
};

} // namespace

class LogRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_.config.section_name = "db1";
        server_.config.tmp_dir = ::testing::TempDir();
    }

    // Long past the readiness window
    LogLine Old(const std::string& content, int32_t pid = 1) {
        return MakeLogLine(content, LogLevel::LOG, pid, Clock::now() - 1h);
    }

    // Observed "later" than any tick in the test
    LogLine Future(const std::string& content, int32_t pid = 1) {
        return MakeLogLine(content, LogLevel::LOG, pid, Clock::now() + 1h);
    }

    LogRunner MakeRunner() {
        return LogRunner(server_, source_, dispatcher_, opts_, 5ms);
    }

    Server server_;
    CollectionOpts opts_;
    FakeLogSource source_;
    NiceMock<MockGrantClient> grant_client_;
    NiceMock<MockLogUploader> uploader_;
    PostgresLogAnalyzer analyzer_;
    TestSucceededSignal signal_;
    LogDispatcher dispatcher_{grant_client_, uploader_, analyzer_, &signal_};
};

TEST_F(LogRunnerTest, FreshLinesStayInBacklog) {
    source_.Push({Future("a"), Future("b")});
    LogRunner runner = MakeRunner();

    EXPECT_EQ(runner.Tick(), DispatchOutcome::kNothingReady);
    EXPECT_EQ(runner.backlog_size(), 2u);

    source_.Push({Future("c")});
    runner.Tick();
    EXPECT_EQ(runner.backlog_size(), 3u);
}

TEST_F(LogRunnerTest, FailedDispatchKeepsEverythingForRetry) {
    EXPECT_CALL(grant_client_, GetLogsGrant(_, _, _, _))
        .WillOnce(Return(false))
        .WillOnce(DoAll(SetArgReferee<2>(ValidGrant()), Return(true)));
    EXPECT_CALL(uploader_, UploadAndSendLogs(_, _, _, _, _)).WillOnce(Return(true));

    source_.Push({Old("statement: SELECT 1"), Future("later")});
    LogRunner runner = MakeRunner();

    EXPECT_EQ(runner.Tick(), DispatchOutcome::kGrantFailed);
    EXPECT_EQ(runner.backlog_size(), 2u);

    EXPECT_EQ(runner.Tick(), DispatchOutcome::kSent);
    EXPECT_EQ(runner.backlog_size(), 1u);
}

TEST_F(LogRunnerTest, NewLinesJoinBacklog) {
    EXPECT_CALL(grant_client_, GetLogsGrant(_, _, _, _)).WillRepeatedly(Return(false));

    source_.Push({Old("one")});
    source_.Push({Old("two", 2)});
    LogRunner runner = MakeRunner();

    runner.Tick();
    EXPECT_EQ(runner.backlog_size(), 1u);
    runner.Tick();
    EXPECT_EQ(runner.backlog_size(), 2u);
}

TEST_F(LogRunnerTest, RunTestSucceedsOnIdentifyMarker) {
    opts_.test_run = true;
    source_.Push({Old("statement: SELECT 'collector-identify: db1'")});
    LogRunner runner = MakeRunner();

    EXPECT_TRUE(runner.RunTest(signal_, 2s));
}

TEST_F(LogRunnerTest, RunTestTimesOutWithoutMarker) {
    opts_.test_run = true;
    source_.Push({Old("statement: SELECT 'collector-identify: other'")});
    LogRunner runner = MakeRunner();

    EXPECT_FALSE(runner.RunTest(signal_, 50ms));
}

TEST_F(LogRunnerTest, RunStopsWhenRequested) {
    LogRunner runner = MakeRunner();
    std::atomic<bool> stop{false};

    std::thread stopper([&stop]() {
        std::this_thread::sleep_for(30ms);
        stop.store(true);
    });
    runner.Run(stop);
    stopper.join();
    SUCCEED();
}

TEST_F(LogRunnerTest, RunKeepsUndeliveredBacklogWhileConfigChanges) {
    source_.Push({Future("a"), Future("b")});
    LogRunner runner = MakeRunner();
    std::atomic<bool> stop{false};

    // Snapshots rewrite the shared context under its lock while the runner ticks
    std::thread writer([this, &stop]() {
        for (int i = 0; i < 20; i++) {
            {
                absl::MutexLock lock(server_.state_mutex.get());
                server_.config.section_name = "db" + std::to_string(i);
            }
            std::this_thread::sleep_for(2ms);
        }
        stop.store(true);
    });
    runner.Run(stop);
    writer.join();

    EXPECT_EQ(runner.backlog_size(), 2u);
}
