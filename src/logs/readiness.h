#ifndef COLLECTOR_LOGS_READINESS_H_
#define COLLECTOR_LOGS_READINESS_H_

#include <chrono>
#include <vector>

#include "state/log_line.h"

namespace Collector {

// Quiescence window: how long a line waits for follow-on lines (DETAIL, HINT, STATEMENT)
inline constexpr std::chrono::milliseconds kDefaultReadinessWindow{3000};

struct ReadinessSplit {
	std::vector<LogLine> ready;
	// Returned to the caller untouched, resubmitted with the next tick
	std::vector<LogLine> too_fresh;
};

/**
 * Partitions lines by age. A line is ready once now - collected_at is strictly
 * greater than window. Order is preserved within both halves.
 */
ReadinessSplit SplitByReadiness(const std::vector<LogLine>& log_lines,
		Clock::time_point now,
		std::chrono::milliseconds window = kDefaultReadinessWindow);

} // namespace Collector

#endif // COLLECTOR_LOGS_READINESS_H_
