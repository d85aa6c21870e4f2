#include "remote_pager_config.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/helper.hpp"

namespace remote_pager {

const char *const REMOTE_PAGER_PATH_PREFIX = "remote_pager://";

const idx_t DEFAULT_PAGE_SIZE = 4096;
const idx_t DEFAULT_MAX_CACHE_BYTES = 256ULL * 1024 * 1024;
const idx_t DEFAULT_MAX_FETCH_ATTEMPTS = 3;
const idx_t DEFAULT_INITIAL_BACKOFF_MILLISEC = 100;
const idx_t DEFAULT_MAX_BACKOFF_MILLISEC = 2000;
const idx_t DEFAULT_REQUEST_TIMEOUT_MILLISEC = 30000;
const idx_t DEFAULT_REVALIDATE_INTERVAL_MILLISEC = 0;
const uint64_t DEFAULT_MAX_SUBREQUEST_COUNT = 0;

void RemotePagerConfig::Validate() const {
	if (page_size == 0) {
		throw InvalidInputException("remote_pager page size must be greater than 0");
	}
	if (max_cache_bytes == 0) {
		throw InvalidInputException("remote_pager max cache bytes must be greater than 0");
	}
	if (max_fetch_attempts == 0) {
		throw InvalidInputException("remote_pager max fetch attempts must be greater than 0");
	}
	if (request_timeout_millisec == 0) {
		throw InvalidInputException("remote_pager request timeout must be greater than 0");
	}
	if (max_backoff_millisec < initial_backoff_millisec) {
		throw InvalidInputException("remote_pager max backoff %llu is smaller than initial backoff %llu",
		                            max_backoff_millisec, initial_backoff_millisec);
	}
}

uint64_t GetThreadCountForSubrequests(uint64_t io_request_count, uint64_t max_subrequest_count) {
	if (max_subrequest_count == 0) {
		// Different platforms have different limits on the number of threads, use 1024 as the hard cap, above which
		// also increases context switch overhead.
		static constexpr uint64_t MAX_THREAD_COUNT = 1024;
		return MinValue<uint64_t>(io_request_count, MAX_THREAD_COUNT);
	}
	return MinValue<uint64_t>(io_request_count, max_subrequest_count);
}

} // namespace remote_pager
