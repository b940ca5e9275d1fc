#ifndef COLLECTOR_RUNNER_LOG_SOURCE_H_
#define COLLECTOR_RUNNER_LOG_SOURCE_H_

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include "state/log_line.h"

namespace Collector {

/**
 * Interface for raw log line acquisition
 */
class ILogSource {
public:
	virtual ~ILogSource() = default;

	// Lines observed since the last call, collected_at set to the observation time
	virtual std::vector<LogLine> Poll() = 0;
};

/**
 * Parses one line of Postgres stderr output written with a log_line_prefix
 * containing "[%p]", e.g. "2024-01-01 10:00:00 UTC [4711] ERROR:  message".
 * Lines without that shape come back as fragments (UNKNOWN level, pid 0)
 * holding the whole text.
 */
LogLine ParseLogLine(const std::string& raw, Clock::time_point collected_at);

/**
 * Follows a log file from its end at construction time. A partially written
 * last line is held back until its newline arrives; a truncated file is
 * re-read from the start.
 */
class FileLogSource : public ILogSource {
public:
	explicit FileLogSource(std::string path, bool from_start = false);

	std::vector<LogLine> Poll() override;

private:
	bool Open(bool from_start);

	std::string path_;
	std::ifstream in_;
	std::streamoff offset_ = 0;
	std::string partial_;
};

} // namespace Collector

#endif // COLLECTOR_RUNNER_LOG_SOURCE_H_
