#pragma once

#include <cstdint>

#include "remote_pager_common.hpp"

namespace remote_pager {

//===--------------------------------------------------------------------===//
// Config constant
//===--------------------------------------------------------------------===//

// Path prefix handled by the remote page filesystem, followed by the logical entity key.
extern const char *const REMOTE_PAGER_PATH_PREFIX;

//===--------------------------------------------------------------------===//
// Default configuration
//===--------------------------------------------------------------------===//

// Page size used by the database files served, which is also the unit of range fetch and cache.
extern const idx_t DEFAULT_PAGE_SIZE;

// Byte budget of the page cache, which caps the overall memory consumption for cached pages.
extern const idx_t DEFAULT_MAX_CACHE_BYTES;

// Number of attempts for a single fetch, including the first one.
extern const idx_t DEFAULT_MAX_FETCH_ATTEMPTS;

// Backoff before the first retry, doubled for each further retry.
extern const idx_t DEFAULT_INITIAL_BACKOFF_MILLISEC;

// Upper bound for retry backoff.
extern const idx_t DEFAULT_MAX_BACKOFF_MILLISEC;

// Timeout for a single fetch attempt.
extern const idx_t DEFAULT_REQUEST_TIMEOUT_MILLISEC;

// Interval after which a file is revalidated when a new session opens it; 0 means only explicit revalidation.
extern const idx_t DEFAULT_REVALIDATE_INTERVAL_MILLISEC;

// Default max number of parallel page fetches for a single filesystem read request. 0 means no limit.
extern const uint64_t DEFAULT_MAX_SUBREQUEST_COUNT;

//===--------------------------------------------------------------------===//
// Configuration for one remote pager setup
//===--------------------------------------------------------------------===//
struct RemotePagerConfig {
	// URL of the routing index, empty if only direct URL access is used.
	string index_url;
	idx_t page_size = DEFAULT_PAGE_SIZE;
	idx_t max_cache_bytes = DEFAULT_MAX_CACHE_BYTES;
	idx_t max_fetch_attempts = DEFAULT_MAX_FETCH_ATTEMPTS;
	idx_t initial_backoff_millisec = DEFAULT_INITIAL_BACKOFF_MILLISEC;
	idx_t max_backoff_millisec = DEFAULT_MAX_BACKOFF_MILLISEC;
	idx_t request_timeout_millisec = DEFAULT_REQUEST_TIMEOUT_MILLISEC;
	idx_t revalidate_interval_millisec = DEFAULT_REVALIDATE_INTERVAL_MILLISEC;
	uint64_t max_subrequest_count = DEFAULT_MAX_SUBREQUEST_COUNT;

	// Throw [InvalidInputException] if any value is unusable.
	void Validate() const;
};

//===--------------------------------------------------------------------===//
// Util function for configurations.
//===--------------------------------------------------------------------===//

// Get concurrent IO sub-request count.
// If max_subrequest_count is 0, uses a default cap of 1024.
uint64_t GetThreadCountForSubrequests(uint64_t io_request_count, uint64_t max_subrequest_count);

} // namespace remote_pager
