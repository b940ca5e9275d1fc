#include "logs/debug_print.h"

#include <iomanip>

namespace Collector {

void PrintDebugInfo(const std::string& content,
		const std::vector<LogLine>& log_lines,
		const std::vector<QuerySample>& query_samples,
		std::ostream& out) {
	const int64_t size = static_cast<int64_t>(content.size());

	for (const auto& log_line : log_lines) {
		out << "[" << log_line.byte_start << "-" << log_line.byte_end << "]"
		    << " pid=" << log_line.backend_pid
		    << " level=" << LogLevelName(log_line.log_level)
		    << " classification=" << LogClassificationName(log_line.classification);
		for (const auto& [key, value] : log_line.details) {
			out << " " << key << "=" << std::quoted(value);
		}
		out << "\n";

		if (log_line.byte_content_start < 0 || log_line.byte_end < log_line.byte_content_start ||
				log_line.byte_end >= size) {
			out << "  <range not in packaged content>\n";
			continue;
		}
		out << "  " << content.substr(static_cast<size_t>(log_line.byte_content_start),
				static_cast<size_t>(log_line.byte_end - log_line.byte_content_start + 1)) << "\n";
	}

	if (!query_samples.empty()) {
		out << "Query samples:\n";
		const std::ios_base::fmtflags flags = out.flags();
		const std::streamsize precision = out.precision();
		for (const auto& sample : query_samples) {
			out << "  runtime=" << std::fixed << std::setprecision(3) << sample.runtime_ms
			    << "ms query=" << std::quoted(sample.query) << "\n";
		}
		out.flags(flags);
		out.precision(precision);
	}
	out.flush();
}

} // namespace Collector
