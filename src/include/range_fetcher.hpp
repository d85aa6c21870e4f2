// Range fetcher is the only component which talks to the remote host: it turns a byte span into exactly one request
// per attempt, and classifies failures into [RemotePageErrorType].

#pragma once

#include <atomic>

#include "duckdb/common/optional_idx.hpp"
#include "duckdb/common/optional_ptr.hpp"
#include "remote_pager_common.hpp"
#include "remote_pager_config.hpp"

namespace duckdb {
class DatabaseInstance;
} // namespace duckdb

namespace remote_pager {

struct RangeRequest {
	string url;
	// Both offsets are inclusive, which matches HTTP range semantics.
	idx_t start_offset = 0;
	idx_t end_offset = 0;
	// Change token to send as `If-Range`, empty means unconditional fetch.
	string if_range;

	idx_t GetLength() const {
		return end_offset - start_offset + 1;
	}
};

// File-level metadata revealed by a response.
struct RemoteFileMetadata {
	// Total file length, unset if the server doesn't expose it.
	optional_idx file_size;
	// Entity tag, empty if not provided.
	string version_tag;
	// Last modification timestamp in HTTP date format, empty if not provided.
	string last_modified;
};

struct RangeFetchResult {
	string data;
	RemoteFileMetadata metadata;
};

struct FetchRetryPolicy {
	idx_t max_attempts = DEFAULT_MAX_FETCH_ATTEMPTS;
	idx_t initial_backoff_millisec = DEFAULT_INITIAL_BACKOFF_MILLISEC;
	idx_t max_backoff_millisec = DEFAULT_MAX_BACKOFF_MILLISEC;
};

// Get retry policy from the given config.
FetchRetryPolicy GetFetchRetryPolicy(const RemotePagerConfig &config);

class BaseRangeFetcher {
public:
	explicit BaseRangeFetcher(FetchRetryPolicy retry_policy_p, optional_ptr<DatabaseInstance> instance_p = nullptr);
	virtual ~BaseRangeFetcher() = default;

	// Fetch bytes [start_offset, end_offset] of the remote file. The returned data exactly covers the requested span,
	// clipped at end of file.
	// Transient failures are retried with exponential backoff; all other failures propagate at once.
	RangeFetchResult FetchRange(const RangeRequest &request);

	// Fetch the whole remote file, used for small files and hosts which don't honor range requests.
	RangeFetchResult FetchAll(const string &url);

	// Fetch metadata for the remote file without downloading its content.
	RemoteFileMetadata FetchMetadata(const string &url);

	virtual string GetName() const = 0;

	// Number of attempts issued so far, retries included.
	uint64_t GetRequestCount() const {
		return request_count.load();
	}

protected:
	// Single attempt of the requests above, throw [RemotePageException] on failure.
	virtual RangeFetchResult FetchRangeOnce(const RangeRequest &request) = 0;
	virtual RangeFetchResult FetchAllOnce(const string &url) = 0;
	virtual RemoteFileMetadata FetchMetadataOnce(const string &url) = 0;

	// Block the current thread before the next retry.
	virtual void SleepForBackoff(idx_t backoff_millisec);

	optional_ptr<DatabaseInstance> instance;

private:
	template <typename Fn>
	auto RunWithRetry(const string &url, Fn &&fn) -> decltype(fn());

	FetchRetryPolicy retry_policy;
	std::atomic<uint64_t> request_count {0};
};

} // namespace remote_pager
