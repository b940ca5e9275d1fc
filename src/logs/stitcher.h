#ifndef COLLECTOR_LOGS_STITCHER_H_
#define COLLECTOR_LOGS_STITCHER_H_

#include <vector>

#include "state/log_line.h"

namespace Collector {

/**
 * Merges fragments (no level and no backend pid, as written by the Postgres
 * logging collector for wrapped output) into the preceding non-fragment line,
 * separated by a single space.
 *
 * Only the given batch is inspected. A fragment with no preceding non-fragment
 * line in the batch is dropped, including one whose parent was already
 * dispatched in an earlier tick.
 */
std::vector<LogLine> StitchLogLines(const std::vector<LogLine>& log_lines);

} // namespace Collector

#endif // COLLECTOR_LOGS_STITCHER_H_
