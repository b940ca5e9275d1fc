#include "logs/backend_joiner.h"

#include <glog/logging.h>

namespace Collector {

BackendLogLines GroupByBackend(const std::vector<LogLine>& log_lines) {
	BackendLogLines groups;
	for (const auto& log_line : log_lines) {
		groups[log_line.backend_pid].push_back(log_line);
	}
	return groups;
}

std::vector<LogLine> JoinContinuationLines(const std::vector<LogLine>& backend_lines) {
	std::vector<LogLine> joined;
	joined.reserve(backend_lines.size());

	for (const auto& log_line : backend_lines) {
		if (log_line.log_level != LogLevel::UNKNOWN) {
			joined.push_back(log_line);
		} else if (!joined.empty()) {
			LogLine& parent = joined.back();
			parent.content += log_line.content;
			parent.byte_end += static_cast<int64_t>(log_line.content.size());
		} else {
			VLOG(3) << "[JoinContinuationLines] No parent for continuation of pid "
			        << log_line.backend_pid << ", skipping";
		}
	}
	return joined;
}

} // namespace Collector
