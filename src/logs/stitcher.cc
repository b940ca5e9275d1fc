#include "logs/stitcher.h"

#include <glog/logging.h>

namespace Collector {

std::vector<LogLine> StitchLogLines(const std::vector<LogLine>& log_lines) {
	std::vector<LogLine> stitched;
	stitched.reserve(log_lines.size());

	size_t dropped = 0;
	for (const auto& log_line : log_lines) {
		if (!log_line.IsFragment()) {
			stitched.push_back(log_line);
		} else if (!stitched.empty()) {
			stitched.back().content += " " + log_line.content;
		} else {
			dropped++;
		}
	}

	if (dropped > 0) {
		VLOG(2) << "[StitchLogLines] Dropped " << dropped << " leading fragment(s) with no parent line";
	}
	return stitched;
}

} // namespace Collector
