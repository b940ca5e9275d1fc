#include <gtest/gtest.h>
#include "../../src/logs/analyzer.h"
#include "log_line_builder.h"

using namespace Collector;
using Collector::test_util::MakeLogLine;

class PostgresLogAnalyzerTest : public ::testing::Test {
protected:
    AnalyzeResult Analyze(const std::string& content, LogLevel level = LogLevel::LOG) {
        return analyzer_.AnalyzeBackendLogLines({MakeLogLine(content, level, 42)});
    }

    PostgresLogAnalyzer analyzer_;
};

TEST_F(PostgresLogAnalyzerTest, IdentifyMarkerInStatement) {
    auto result = Analyze("statement: SELECT 'collector-identify: db1'");
    ASSERT_EQ(result.log_lines.size(), 1u);
    EXPECT_EQ(result.log_lines[0].classification, LogClassification::COLLECTOR_IDENTIFY);
    EXPECT_EQ(result.log_lines[0].details.at(kDetailConfigSection), "db1");
    EXPECT_TRUE(result.query_samples.empty());
}

TEST_F(PostgresLogAnalyzerTest, IdentifyMarkerInError) {
    auto result = Analyze("column \"collector-identify: reporting\" does not exist", LogLevel::ERROR);
    ASSERT_EQ(result.log_lines.size(), 1u);
    EXPECT_EQ(result.log_lines[0].classification, LogClassification::COLLECTOR_IDENTIFY);
    EXPECT_EQ(result.log_lines[0].details.at(kDetailConfigSection), "reporting");
}

TEST_F(PostgresLogAnalyzerTest, IdentifyMarkerWithoutSectionIsIgnored) {
    auto result = Analyze("statement: SELECT 'collector-identify: '");
    ASSERT_EQ(result.log_lines.size(), 1u);
    EXPECT_NE(result.log_lines[0].classification, LogClassification::COLLECTOR_IDENTIFY);
}

TEST_F(PostgresLogAnalyzerTest, DurationWithStatementYieldsSample) {
    auto result = Analyze("duration: 12.5 ms  statement: SELECT * FROM accounts");
    ASSERT_EQ(result.log_lines.size(), 1u);
    EXPECT_EQ(result.log_lines[0].classification, LogClassification::STATEMENT_DURATION);
    EXPECT_EQ(result.log_lines[0].details.at("duration_ms"), "12.5");

    ASSERT_EQ(result.query_samples.size(), 1u);
    EXPECT_DOUBLE_EQ(result.query_samples[0].runtime_ms, 12.5);
    EXPECT_EQ(result.query_samples[0].query, "SELECT * FROM accounts");
}

TEST_F(PostgresLogAnalyzerTest, DurationOfExecute) {
    auto result = Analyze("duration: 3.000 ms  execute <unnamed>: SELECT $1");
    ASSERT_EQ(result.query_samples.size(), 1u);
    EXPECT_EQ(result.query_samples[0].query, "SELECT $1");
}

TEST_F(PostgresLogAnalyzerTest, DurationWithoutStatement) {
    auto result = Analyze("duration: 0.250 ms");
    ASSERT_EQ(result.log_lines.size(), 1u);
    EXPECT_EQ(result.log_lines[0].classification, LogClassification::STATEMENT_DURATION);
    EXPECT_TRUE(result.query_samples.empty());
}

TEST_F(PostgresLogAnalyzerTest, StatementLog) {
    auto result = Analyze("statement: UPDATE t SET x = 1");
    ASSERT_EQ(result.log_lines.size(), 1u);
    EXPECT_EQ(result.log_lines[0].classification, LogClassification::STATEMENT_LOG);
    EXPECT_EQ(result.log_lines[0].details.at("query"), "UPDATE t SET x = 1");
}

TEST_F(PostgresLogAnalyzerTest, OtherLinesPassThrough) {
    LogLine in = MakeLogLine("checkpoint starting: time", LogLevel::LOG, 42);
    in.byte_start = 5;
    in.byte_content_start = 5;
    in.byte_end = 29;

    auto result = analyzer_.AnalyzeBackendLogLines({in});
    ASSERT_EQ(result.log_lines.size(), 1u);
    EXPECT_EQ(result.log_lines[0], in);
}

TEST_F(PostgresLogAnalyzerTest, KeepsLineOrder) {
    std::vector<LogLine> in = {
        MakeLogLine("statement: SELECT 1", LogLevel::LOG, 1),
        MakeLogLine("something else", LogLevel::LOG, 1),
        MakeLogLine("duration: 1 ms", LogLevel::LOG, 1),
    };
    auto result = analyzer_.AnalyzeBackendLogLines(in);
    ASSERT_EQ(result.log_lines.size(), 3u);
    EXPECT_EQ(result.log_lines[0].content, in[0].content);
    EXPECT_EQ(result.log_lines[1].content, in[1].content);
    EXPECT_EQ(result.log_lines[2].content, in[2].content);
}

TEST_F(PostgresLogAnalyzerTest, MegabyteStatement) {
    std::string values(1 << 20, 'a');
    auto result = Analyze("statement: INSERT INTO t VALUES ('" + values + "')");
    ASSERT_EQ(result.log_lines.size(), 1u);
    EXPECT_EQ(result.log_lines[0].classification, LogClassification::STATEMENT_LOG);
    EXPECT_EQ(result.log_lines[0].details.at("query").size(), values.size() + 25);
}

TEST_F(PostgresLogAnalyzerTest, MegabyteStatementWithDuration) {
    std::string values(1 << 20, 'b');
    auto result = Analyze("duration: 8.5 ms  statement: INSERT INTO t VALUES ('" + values + "')");
    ASSERT_EQ(result.query_samples.size(), 1u);
    EXPECT_DOUBLE_EQ(result.query_samples[0].runtime_ms, 8.5);
    EXPECT_EQ(result.query_samples[0].query.size(), values.size() + 25);
}

TEST_F(PostgresLogAnalyzerTest, OverlongDurationIsNotASample) {
    std::string digits(400, '9');
    AnalyzeResult result;
    EXPECT_NO_THROW(result = Analyze("duration: " + digits + " ms  statement: SELECT 1"));
    ASSERT_EQ(result.log_lines.size(), 1u);
    EXPECT_EQ(result.log_lines[0].classification, LogClassification::UNKNOWN);
    EXPECT_TRUE(result.query_samples.empty());
}

TEST_F(PostgresLogAnalyzerTest, DurationNeedsUnit) {
    auto result = Analyze("duration: 12.5  statement: SELECT 1");
    EXPECT_EQ(result.log_lines[0].classification, LogClassification::UNKNOWN);
    EXPECT_TRUE(result.query_samples.empty());
}
