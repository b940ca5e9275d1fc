#ifndef COLLECTOR_LOGS_DEBUG_PRINT_H_
#define COLLECTOR_LOGS_DEBUG_PRINT_H_

#include <ostream>
#include <string>
#include <vector>

#include "state/state.h"

namespace Collector {

/**
 * Prints what would have been sent: each line's metadata followed by the slice
 * of the packaged content its byte range points at, then the query samples.
 * Ranges outside the content (lines that were never written) are reported as such.
 */
void PrintDebugInfo(const std::string& content,
		const std::vector<LogLine>& log_lines,
		const std::vector<QuerySample>& query_samples,
		std::ostream& out);

} // namespace Collector

#endif // COLLECTOR_LOGS_DEBUG_PRINT_H_
