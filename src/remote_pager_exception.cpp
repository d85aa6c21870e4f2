#include "remote_pager_exception.hpp"

#include "duckdb/common/string_util.hpp"

namespace remote_pager {

namespace {

bool IsTransientErrorType(RemotePageErrorType error_type) {
	return error_type == RemotePageErrorType::kUnreachable || error_type == RemotePageErrorType::kServerError;
}

} // namespace

const char *RemotePageErrorTypeToString(RemotePageErrorType error_type) {
	switch (error_type) {
	case RemotePageErrorType::kUnreachable:
		return "unreachable";
	case RemotePageErrorType::kServerError:
		return "server error";
	case RemotePageErrorType::kRangeUnsupported:
		return "range unsupported";
	case RemotePageErrorType::kRangeUnsatisfiable:
		return "range unsatisfiable";
	case RemotePageErrorType::kUnknownEntity:
		return "unknown entity";
	case RemotePageErrorType::kStaleFile:
		return "stale file";
	case RemotePageErrorType::kInvalidIndex:
		return "invalid index";
	}
	throw InternalException("Unknown remote page error type %d", static_cast<int>(error_type));
}

RemotePageException::RemotePageException(RemotePageErrorType error_type_p, const string &msg)
    : RemotePageException(error_type_p, msg, IsTransientErrorType(error_type_p)) {
}

RemotePageException::RemotePageException(RemotePageErrorType error_type_p, const string &msg, bool transient_p)
    : IOException(StringUtil::Format("[%s] %s", RemotePageErrorTypeToString(error_type_p), msg)),
      error_type(error_type_p), transient(transient_p) {
}

} // namespace remote_pager
