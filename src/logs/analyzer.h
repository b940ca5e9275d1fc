#ifndef COLLECTOR_LOGS_ANALYZER_H_
#define COLLECTOR_LOGS_ANALYZER_H_

#include <string>
#include <vector>

#include "state/state.h"

namespace Collector {

// Prefix of the marker a test run expects to find in the server log
inline constexpr const char* kCollectorIdentifyMarker = "collector-identify: ";

struct AnalyzeResult {
	std::vector<LogLine> log_lines;
	std::vector<QuerySample> query_samples;
};

/**
 * Interface for per-backend log analysis
 */
class ILogAnalyzer {
public:
	virtual ~ILogAnalyzer() = default;

	/**
	 * Classifies the joined lines of one backend
	 * @param log_lines All lines of one backend pid, continuations already joined
	 * @return Lines to ship (with classification and details) and extracted samples
	 */
	virtual AnalyzeResult AnalyzeBackendLogLines(const std::vector<LogLine>& log_lines) = 0;
};

/**
 * Recognizes the collector-identify marker and statement duration/log lines.
 * Everything else passes through with classification UNKNOWN.
 */
class PostgresLogAnalyzer : public ILogAnalyzer {
public:
	AnalyzeResult AnalyzeBackendLogLines(const std::vector<LogLine>& log_lines) override;
};

} // namespace Collector

#endif // COLLECTOR_LOGS_ANALYZER_H_
