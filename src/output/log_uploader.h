#ifndef COLLECTOR_OUTPUT_LOG_UPLOADER_H_
#define COLLECTOR_OUTPUT_LOG_UPLOADER_H_

#include <string>

#include "state/state.h"

namespace Collector {

/**
 * Interface for shipping one packaged log state to the grant's target.
 * Implementations never retry; the dispatcher owns retry policy.
 */
class ILogUploader {
public:
	virtual ~ILogUploader() = default;

	/**
	 * @param error Set on failure
	 * @return true once the artifact, its line metadata and samples were delivered
	 */
	virtual bool UploadAndSendLogs(const Server& server, const Grant& grant,
			const CollectionOpts& opts, const LogState& log_state, std::string& error) = 0;
};

} // namespace Collector

#endif // COLLECTOR_OUTPUT_LOG_UPLOADER_H_
