#ifndef COLLECTOR_GRANT_GRANT_CLIENT_H_
#define COLLECTOR_GRANT_GRANT_CLIENT_H_

#include <string>

#include "state/state.h"

namespace Collector {

/**
 * Interface for fetching a log grant
 */
class IGrantClient {
public:
	virtual ~IGrantClient() = default;

	/**
	 * Requests authorization for one log dispatch attempt
	 * @param grant Filled in on success; grant.valid may still be false (server opt-out)
	 * @param error Set when the request itself failed
	 * @return false if no grant could be obtained
	 */
	virtual bool GetLogsGrant(const Server& server, const CollectionOpts& opts,
			Grant& grant, std::string& error) = 0;
};

// Grant handed out for force_empty_grant runs: valid, logs enabled, no upload target
Grant EmptyGrant();

} // namespace Collector

#endif // COLLECTOR_GRANT_GRANT_CLIENT_H_
