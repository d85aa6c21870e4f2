// Error taxonomy for remote page access.

#pragma once

#include "duckdb/common/exception.hpp"
#include "remote_pager_common.hpp"

namespace remote_pager {

enum class RemotePageErrorType {
	// Transport failure, like connection refused, DNS failure or timeout.
	kUnreachable,
	// Server replied 5xx.
	kServerError,
	// Server ignored the byte range and replied with full content.
	kRangeUnsupported,
	// Requested range lies outside of the file, or the response doesn't cover the requested span.
	kRangeUnsatisfiable,
	// Logical key is not present in the routing index.
	kUnknownEntity,
	// Remote file changed under an open handle, and the change persisted after one reload.
	kStaleFile,
	// Routing index file cannot be parsed.
	kInvalidIndex,
};

// Get human-readable name for the error type.
const char *RemotePageErrorTypeToString(RemotePageErrorType error_type);

class RemotePageException : public IOException {
public:
	// Transient-ness is derived from error type: only unreachable and server error are worth retrying.
	RemotePageException(RemotePageErrorType error_type_p, const string &msg);
	RemotePageException(RemotePageErrorType error_type_p, const string &msg, bool transient_p);

	RemotePageErrorType GetErrorType() const {
		return error_type;
	}
	// Whether a retry of the same request could succeed.
	bool IsTransient() const {
		return transient;
	}

private:
	RemotePageErrorType error_type;
	bool transient;
};

} // namespace remote_pager
