#ifndef COLLECTOR_OUTPUT_UPLOADERS_H_
#define COLLECTOR_OUTPUT_UPLOADERS_H_

#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include <collector.grpc.pb.h>

#include "absl/container/flat_hash_map.h"
#include "output/log_uploader.h"

namespace Collector {

/**
 * Offline/test target: writes <uuid>.log (artifact bytes) and <uuid>.snapshot
 * (serialized LogSnapshot) per log file into grant.local_dir.
 */
class LocalDirUploader : public ILogUploader {
public:
	bool UploadAndSendLogs(const Server& server, const Grant& grant,
			const CollectionOpts& opts, const LogState& log_state, std::string& error) override;
};

/**
 * Sends each log file with its snapshot to CollectorApi.UploadLogs at
 * grant.s3_url, passing the grant's per-request upload fields along.
 */
class GrpcLogUploader : public ILogUploader {
public:
	explicit GrpcLogUploader(std::chrono::milliseconds timeout = std::chrono::seconds(60))
		: timeout_(timeout) {}

	bool UploadAndSendLogs(const Server& server, const Grant& grant,
			const CollectionOpts& opts, const LogState& log_state, std::string& error) override;

private:
	collector_proto::CollectorApi::StubInterface* StubFor(const std::string& target);

	std::chrono::milliseconds timeout_;
	// One channel per upload target, grants may point at different endpoints
	absl::flat_hash_map<std::string, std::unique_ptr<collector_proto::CollectorApi::StubInterface>> stubs_;
};

/**
 * Routes an upload by grant target: local_dir wins over the remote endpoint.
 * With submit_collected_data off nothing is sent and the upload counts as done.
 */
class GrantUploader : public ILogUploader {
public:
	GrantUploader(std::unique_ptr<ILogUploader> local, std::unique_ptr<ILogUploader> remote)
		: local_(std::move(local)), remote_(std::move(remote)) {}

	bool UploadAndSendLogs(const Server& server, const Grant& grant,
			const CollectionOpts& opts, const LogState& log_state, std::string& error) override;

private:
	std::unique_ptr<ILogUploader> local_;
	std::unique_ptr<ILogUploader> remote_;
};

} // namespace Collector

#endif // COLLECTOR_OUTPUT_UPLOADERS_H_
