#include "logs/packager.h"

#include <glog/logging.h>

namespace Collector {

PackageResult PackageLogLines(std::vector<LogLine>& log_lines, const LogWriteFn& write) {
	PackageResult result;
	int64_t current_byte_start = 0;

	for (auto& log_line : log_lines) {
		std::string error;
		if (!write(log_line.content, error)) {
			result.error = ERR_PARTIAL_WRITE;
			result.error_message = error;
			break;
		}
		int64_t len = static_cast<int64_t>(log_line.content.size());
		log_line.byte_start = current_byte_start;
		log_line.byte_content_start = current_byte_start;
		log_line.byte_end = current_byte_start + len - 1;
		current_byte_start += len;
		result.lines_written++;
	}

	result.bytes_written = current_byte_start;
	if (result.error != ERR_NO_ERROR) {
		// Unwritten lines still travel on with stale offsets
		LOG(ERROR) << "[PackageLogLines] " << CollectorErrorName(result.error) << " after "
		           << result.lines_written << "/" << log_lines.size() << " lines: "
		           << result.error_message;
	}
	return result;
}

PackageResult PackageLogLines(std::vector<LogLine>& log_lines, ScopedTmpFile& tmp_file) {
	return PackageLogLines(log_lines, [&tmp_file](const std::string& data, std::string& error) {
		return tmp_file.Write(data, error);
	});
}

} // namespace Collector
