#ifndef COLLECTOR_COMMON_ERRORS_H_
#define COLLECTOR_COMMON_ERRORS_H_

#include <cstdint>

namespace Collector {

// Failure kinds of a log dispatch tick. None of them is fatal to the process.
enum CollectorError : uint32_t
{
	ERR_NO_ERROR,
	// Could not create the packaging tmp file, the whole input is retried
	ERR_RESOURCE_ALLOCATION,
	// Packaging write failed mid-batch, later lines stay unwritten
	ERR_PARTIAL_WRITE,
	// Grant request failed, the whole input is retried
	ERR_AUTHORIZATION_REQUEST,
	// Server-side opt-out, ready lines are dropped
	ERR_AUTHORIZATION_DENIED,
	// Upload failed, the whole input is retried
	ERR_UPLOAD,
};

inline const char* CollectorErrorName(CollectorError err) {
	switch (err) {
		case ERR_NO_ERROR: return "NoError";
		case ERR_RESOURCE_ALLOCATION: return "ResourceAllocationError";
		case ERR_PARTIAL_WRITE: return "PartialWriteError";
		case ERR_AUTHORIZATION_REQUEST: return "AuthorizationRequestError";
		case ERR_AUTHORIZATION_DENIED: return "AuthorizationDenied";
		case ERR_UPLOAD: return "UploadError";
	}
	return "Unknown";
}

} // namespace Collector

#endif // COLLECTOR_COMMON_ERRORS_H_
