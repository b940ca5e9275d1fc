#ifndef COLLECTOR_STATE_LOG_LINE_H_
#define COLLECTOR_STATE_LOG_LINE_H_

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace Collector {

using Clock = std::chrono::system_clock;

/**
 * Severity of a Postgres log line. UNKNOWN means the prefix could not be parsed,
 * which is what marks a line as a fragment or a continuation.
 */
enum class LogLevel : int32_t {
	UNKNOWN = 0,
	DEBUG,
	INFO,
	NOTICE,
	WARNING,
	ERROR,
	LOG,
	FATAL,
	PANIC,
	// Follow-on lines attached to a preceding message
	DETAIL,
	HINT,
	CONTEXT,
	STATEMENT,
	QUERY,
};

/**
 * Classification assigned by the analyzer
 */
enum class LogClassification : int32_t {
	UNKNOWN = 0,
	COLLECTOR_IDENTIFY,
	STATEMENT_DURATION,
	STATEMENT_LOG,
};

const char* LogLevelName(LogLevel level);
LogLevel ParseLogLevel(const std::string& name);
const char* LogClassificationName(LogClassification classification);

/**
 * Detail key the analyzer sets on COLLECTOR_IDENTIFY lines
 */
inline constexpr const char* kDetailConfigSection = "config_section";

/**
 * One log record as observed from the database server.
 *
 * Byte offsets are only meaningful once the line was written into a LogFile:
 * byte_end = byte_start + content.size() - 1.
 */
struct LogLine {
	std::string content;
	LogLevel log_level = LogLevel::UNKNOWN;
	int32_t backend_pid = 0;
	Clock::time_point collected_at{};

	int64_t byte_start = 0;
	int64_t byte_content_start = 0;
	int64_t byte_end = 0;

	LogClassification classification = LogClassification::UNKNOWN;
	// Open set of keys, owned by the analyzer
	std::map<std::string, std::string> details;

	// No parseable origin at all: continuation text the source failed to tag
	bool IsFragment() const {
		return log_level == LogLevel::UNKNOWN && backend_pid == 0;
	}
};

bool operator==(const LogLine& a, const LogLine& b);

} // namespace Collector

#endif // COLLECTOR_STATE_LOG_LINE_H_
