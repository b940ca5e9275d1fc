#ifndef COLLECTOR_OUTPUT_SNAPSHOT_H_
#define COLLECTOR_OUTPUT_SNAPSHOT_H_

#include <cstdint>

#include <collector.pb.h>

#include "state/state.h"

namespace Collector {

int64_t ToUnixMillis(Clock::time_point t);

/**
 * Converts a log state into the wire snapshot: one file reference per log
 * file, one line information per line (log_file_idx points at its file),
 * and the query samples.
 */
collector_proto::LogSnapshot BuildLogSnapshot(const Server& server, const LogState& log_state);

} // namespace Collector

#endif // COLLECTOR_OUTPUT_SNAPSHOT_H_
