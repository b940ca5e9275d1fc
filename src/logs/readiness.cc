#include "logs/readiness.h"

namespace Collector {

ReadinessSplit SplitByReadiness(const std::vector<LogLine>& log_lines,
		Clock::time_point now,
		std::chrono::milliseconds window) {
	ReadinessSplit split;
	for (const auto& log_line : log_lines) {
		// TODO: follow-on lines that arrive after their parent was judged ready
		// are never attached; this needs a lookahead into the next tick's lines.
		if (now - log_line.collected_at > window) {
			split.ready.push_back(log_line);
		} else {
			split.too_fresh.push_back(log_line);
		}
	}
	return split;
}

} // namespace Collector
