#ifndef COLLECTOR_LOGS_PACKAGER_H_
#define COLLECTOR_LOGS_PACKAGER_H_

#include <functional>
#include <string>
#include <vector>

#include "common/errors.h"
#include "common/scoped_tmp_file.h"
#include "state/log_line.h"

namespace Collector {

// Appends data to the artifact store; returns false and sets error on failure
using LogWriteFn = std::function<bool(const std::string& data, std::string& error)>;

struct PackageResult {
	size_t lines_written = 0;
	int64_t bytes_written = 0;
	CollectorError error = ERR_NO_ERROR;
	std::string error_message;
};

/**
 * Writes the content of every line, in order, into one shared store and records
 * the byte range of each line: byte_start = byte_content_start = sum of the
 * lengths before it, byte_end = byte_start + length - 1.
 *
 * The first failed write stops packaging (ERR_PARTIAL_WRITE). Lines already
 * written keep valid offsets, the rest keep whatever offsets they had.
 */
PackageResult PackageLogLines(std::vector<LogLine>& log_lines, const LogWriteFn& write);

// Same, writing into tmp_file
PackageResult PackageLogLines(std::vector<LogLine>& log_lines, ScopedTmpFile& tmp_file);

} // namespace Collector

#endif // COLLECTOR_LOGS_PACKAGER_H_
