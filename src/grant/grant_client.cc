#include "grant/grant_client.h"

namespace Collector {

Grant EmptyGrant() {
	Grant grant;
	grant.valid = true;
	grant.config.features.logs = true;
	return grant;
}

} // namespace Collector
