#ifndef COLLECTOR_STATE_GRANT_H_
#define COLLECTOR_STATE_GRANT_H_

#include <cstdint>
#include <map>
#include <string>

namespace Collector {

struct GrantFeatures {
	bool logs = false;
	bool explain = false;

	int statement_reset_frequency = 0;
	// Statement timeout for all SQL statements sent to the database (defaults to 30s)
	int32_t statement_timeout_ms = 30000;
};

struct GrantConfig {
	std::string server_id;
	std::string sentry_dsn;

	GrantFeatures features;
};

/**
 * Authorization issued by the control plane for a single dispatch attempt.
 * Never cached across batches: the server may change its policy at any time.
 */
struct Grant {
	bool valid = false;
	GrantConfig config;
	std::string s3_url;
	std::map<std::string, std::string> s3_fields;
	// Set for offline and test runs, replaces the object-store target
	std::string local_dir;

	bool HasLocalDir() const { return !local_dir.empty(); }
};

} // namespace Collector

#endif // COLLECTOR_STATE_GRANT_H_
