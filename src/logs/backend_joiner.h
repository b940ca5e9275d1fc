#ifndef COLLECTOR_LOGS_BACKEND_JOINER_H_
#define COLLECTOR_LOGS_BACKEND_JOINER_H_

#include <cstdint>
#include <vector>

#include "absl/container/btree_map.h"
#include "state/log_line.h"

namespace Collector {

// Lines of one backend process, in arrival order. Keyed by pid so groups are
// visited in a stable order.
using BackendLogLines = absl::btree_map<int32_t, std::vector<LogLine>>;

/**
 * Splits lines by backend pid. Concurrent sessions interleave in the raw log,
 * so messages are only ever reassembled within one backend's group.
 */
BackendLogLines GroupByBackend(const std::vector<LogLine>& log_lines);

/**
 * Re-assembles messages that were split over several physical lines of the same
 * backend: an UNKNOWN-level line is appended (no separator) to the nearest
 * preceding classified line and extends its byte_end by its length.
 * UNKNOWN-level lines leading the group have nothing to join and are dropped.
 *
 * Offsets were assigned in file order before grouping, so the extended range of
 * a joined line also covers any other backend's lines written in between.
 */
std::vector<LogLine> JoinContinuationLines(const std::vector<LogLine>& backend_lines);

} // namespace Collector

#endif // COLLECTOR_LOGS_BACKEND_JOINER_H_
