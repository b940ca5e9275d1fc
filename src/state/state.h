#ifndef COLLECTOR_STATE_STATE_H_
#define COLLECTOR_STATE_STATE_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "common/scoped_tmp_file.h"
#include "state/grant.h"
#include "state/log_line.h"

namespace Collector {

/**
 * Statement execution facts extracted from log content
 */
struct QuerySample {
	Clock::time_point occurred_at{};
	double runtime_ms = 0;
	std::string query;
	std::vector<std::string> parameters;
	std::string database;
	std::string username;
	std::string application;
};

/**
 * Packaged artifact: one tmp file plus the lines whose byte ranges index into it.
 * Owns the tmp file exclusively; move-only.
 */
struct LogFile {
	std::string uuid;
	ScopedTmpFile tmp_file;
	std::vector<LogLine> log_lines;

	LogFile() = default;
	LogFile(LogFile&&) = default;
	LogFile& operator=(LogFile&&) = default;
	LogFile(const LogFile&) = delete;
	LogFile& operator=(const LogFile&) = delete;

	void Cleanup() { tmp_file.Release(); }
};

/**
 * Envelope of exactly one dispatch attempt. Created per call, never reused.
 */
struct LogState {
	Clock::time_point collected_at{};
	std::vector<LogFile> log_files;
	std::vector<QuerySample> query_samples;

	// Deletes the backing store of every file. Idempotent.
	void Cleanup();
};

/**
 * Run-mode switches handed in by the surrounding process
 */
struct CollectionOpts {
	bool collect_logs = true;

	std::string collector_application_name = "collector";

	bool submit_collected_data = true;
	bool test_run = false;
	bool debug_logs = false;
	bool force_empty_grant = false;
};

struct ServerConfig {
	// Identity matched against the collector-identify marker in test runs
	std::string section_name;
	std::string api_key;
	std::string api_base_url;
	std::string system_id;
	std::string log_location;
	std::string tmp_dir;
};

/**
 * Long-lived per-server context. Other subsystems (full snapshots) update
 * grant under state_mutex; the log pipeline only reads config.
 */
struct Server {
	ServerConfig config;
	Grant grant;
	std::shared_ptr<absl::Mutex> state_mutex = std::make_shared<absl::Mutex>();
};

/**
 * Random RFC 4122 version 4 identifier
 */
std::string GenerateUuid();

} // namespace Collector

#endif // COLLECTOR_STATE_STATE_H_
