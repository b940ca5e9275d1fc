#include <gtest/gtest.h>
#include "../../src/runner/log_source.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace Collector;

namespace fs = std::filesystem;

TEST(ParseLogLineTest, PrefixedLine) {
    auto t = Clock::now();
    LogLine log_line = ParseLogLine(
        "2024-01-01 10:00:00.123 UTC [4711] ERROR:  relation \"x\" does not exist", t);
    EXPECT_EQ(log_line.backend_pid, 4711);
    EXPECT_EQ(log_line.log_level, LogLevel::ERROR);
    EXPECT_EQ(log_line.content, "relation \"x\" does not exist");
    EXPECT_EQ(log_line.collected_at, t);
    EXPECT_FALSE(log_line.IsFragment());
}

TEST(ParseLogLineTest, MinimalPrefix) {
    LogLine log_line = ParseLogLine("[12] LOG:  checkpoint starting: time", Clock::now());
    EXPECT_EQ(log_line.backend_pid, 12);
    EXPECT_EQ(log_line.log_level, LogLevel::LOG);
    EXPECT_EQ(log_line.content, "checkpoint starting: time");
}

TEST(ParseLogLineTest, NumberedDebugLevels) {
    LogLine log_line = ParseLogLine("[12] DEBUG2:  autovacuum: processing database", Clock::now());
    EXPECT_EQ(log_line.log_level, LogLevel::DEBUG);
}

TEST(ParseLogLineTest, FollowOnLevels) {
    EXPECT_EQ(ParseLogLine("[7] DETAIL:  Key (id)=(1) already exists.", Clock::now()).log_level,
            LogLevel::DETAIL);
    EXPECT_EQ(ParseLogLine("[7] STATEMENT:  INSERT INTO t VALUES (1)", Clock::now()).log_level,
            LogLevel::STATEMENT);
}

TEST(ParseLogLineTest, UnprefixedLineIsFragment) {
    LogLine log_line = ParseLogLine("\t\tFROM accounts WHERE id = 1", Clock::now());
    EXPECT_TRUE(log_line.IsFragment());
    EXPECT_EQ(log_line.content, "FROM accounts WHERE id = 1");
}

TEST(ParseLogLineTest, MegabyteMessage) {
    std::string values(1 << 20, 'x');
    LogLine log_line = ParseLogLine(
        "2024-01-01 10:00:00 UTC [42] LOG:  statement: INSERT INTO t VALUES ('" + values + "')", Clock::now());
    EXPECT_EQ(log_line.backend_pid, 42);
    EXPECT_EQ(log_line.log_level, LogLevel::LOG);
    EXPECT_EQ(log_line.content.size(), values.size() + 36);
}

TEST(ParseLogLineTest, PidOutOfRangeIsFragment) {
    LogLine log_line;
    EXPECT_NO_THROW(log_line = ParseLogLine("note [99999999999999999999] ERROR:  x", Clock::now()));
    EXPECT_TRUE(log_line.IsFragment());
    EXPECT_EQ(log_line.content, "note [99999999999999999999] ERROR:  x");

    EXPECT_NO_THROW(log_line = ParseLogLine("[2147483648] ERROR:  x", Clock::now()));
    EXPECT_TRUE(log_line.IsFragment());
}

TEST(ParseLogLineTest, LaterBracketCanCarryThePid) {
    LogLine log_line = ParseLogLine("[app] 10:00:00 [31] WARNING:  careful", Clock::now());
    EXPECT_EQ(log_line.backend_pid, 31);
    EXPECT_EQ(log_line.log_level, LogLevel::WARNING);
    EXPECT_EQ(log_line.content, "careful");
}

class FileLogSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/file_log_source_test_XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        dir_ = tmpl;
        path_ = dir_ + "/postgresql.log";
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    void Append(const std::string& data) {
        std::ofstream out(path_, std::ios::app | std::ios::binary);
        out << data;
    }

    void Overwrite(const std::string& data) {
        std::ofstream out(path_, std::ios::trunc | std::ios::binary);
        out << data;
    }

    std::string dir_;
    std::string path_;
};

TEST_F(FileLogSourceTest, ReadsCompleteLinesFromStart) {
    Append("[1] LOG:  first\n[2] ERROR:  second\n");
    FileLogSource source(path_, true);

    auto lines = source.Poll();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].content, "first");
    EXPECT_EQ(lines[1].backend_pid, 2);
    EXPECT_TRUE(source.Poll().empty());
}

TEST_F(FileLogSourceTest, FollowsFromEndByDefault) {
    Append("[1] LOG:  before start\n");
    FileLogSource source(path_);
    EXPECT_TRUE(source.Poll().empty());

    Append("[1] LOG:  after start\n");
    auto lines = source.Poll();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].content, "after start");
}

TEST_F(FileLogSourceTest, HoldsBackPartialLine) {
    Append("[3] LOG:  statement: SELECT");
    FileLogSource source(path_, true);
    EXPECT_TRUE(source.Poll().empty());

    Append(" 1\n");
    auto lines = source.Poll();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].content, "statement: SELECT 1");
}

TEST_F(FileLogSourceTest, RereadsTruncatedFile) {
    Append("[1] LOG:  a rather long line before rotation\n");
    FileLogSource source(path_, true);
    ASSERT_EQ(source.Poll().size(), 1u);

    Overwrite("[2] LOG:  new\n");
    auto lines = source.Poll();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].backend_pid, 2);
    EXPECT_EQ(lines[0].content, "new");
}

TEST_F(FileLogSourceTest, MissingFileAppearsLater) {
    FileLogSource source(path_);
    EXPECT_TRUE(source.Poll().empty());

    Append("[5] LOG:  hello\n");
    auto lines = source.Poll();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].content, "hello");
}
