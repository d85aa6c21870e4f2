// A handle to one remote database file, which owns the file identity and mediates all page access to it.

#pragma once

#include <chrono>
#include <mutex>

#include "duckdb/common/optional_ptr.hpp"
#include "page_cache.hpp"
#include "range_fetcher.hpp"
#include "remote_pager_common.hpp"

namespace remote_pager {

// How pages of a file are served, decided by the capability probe.
enum class RangeCapability {
	// Each page is fetched with a byte-range request.
	kRangeCapable,
	// Host doesn't honor ranges, the whole file is downloaded once and pages are sliced locally.
	kFullDownloadOnly,
};

const char *RangeCapabilityToString(RangeCapability capability);

// Whether [version_tag] is a weak entity tag (`W/"..."`), which HTTP never matches in `If-Range`.
bool IsWeakVersionTag(const string &version_tag);

struct RemoteFileIdentity {
	string url;
	idx_t file_size = 0;
	// Change token (ETag), empty if the host doesn't provide one.
	string version_tag;
	string last_modified;
	idx_t page_size = 0;
};

class RemoteFileHandle {
public:
	// [fetcher] and [page_cache] must outlive the handle.
	RemoteFileHandle(string url_p, idx_t page_size_p, BaseRangeFetcher &fetcher_p, PageCache &page_cache_p,
	                 optional_ptr<DatabaseInstance> instance_p = nullptr);

	RemoteFileHandle(const RemoteFileHandle &) = delete;
	RemoteFileHandle &operator=(const RemoteFileHandle &) = delete;

	// Perform the capability probe if not done yet. Thread-safe; a failed probe is retried on next call.
	void Initialize();

	// Get content for the given page. Page length is page size, except for the last page.
	// Throw [RemotePageException] with [kRangeUnsatisfiable] if the page lies beyond end of file.
	PageCache::Page ReadPage(idx_t page_index);

	// Check whether the remote file changed since initialization. On change cached pages are dropped and the handle is
	// re-initialized; if the file changed again meanwhile, [kStaleFile] is thrown.
	// Return whether a change has been detected.
	bool Revalidate();

	// Whether the last successful validation (probe or revalidation) is older than [interval_millisec].
	bool IsValidationDue(idx_t interval_millisec) const;

	// Whether the capability probe has completed.
	bool IsInitialized() const;

	// Accessors below initialize the handle if necessary.
	RemoteFileIdentity GetIdentity();
	RangeCapability GetCapability();
	idx_t GetFileSize();
	idx_t GetPageCount();

	const string &GetUrl() const {
		return url;
	}
	idx_t GetPageSize() const {
		return page_size;
	}
	// Key under which pages of the file are cached, shared by all URLs which only differ in query or fragment.
	const string &GetCacheKey() const {
		return cache_key;
	}

private:
	struct StateSnapshot {
		RangeCapability capability;
		idx_t file_size;
		shared_ptr<const string> full_content;
	};

	StateSnapshot GetInitializedSnapshot();
	// Probe the remote file and reset state; requires [init_mu].
	void ProbeLocked();
	// Download the whole file and serve pages from it from now on; requires [init_mu].
	void SwitchToFullDownloadLocked();
	// Whether the remote file differs from the recorded identity; requires [init_mu].
	bool HasRemoteChangedLocked();
	// Drop cached state, so next access probes again.
	void MarkStale();
	PageCache::Page SlicePage(const string &content, idx_t page_index, idx_t file_size) const;

	const string url;
	const string cache_key;
	const idx_t page_size;
	BaseRangeFetcher &fetcher;
	PageCache &page_cache;
	optional_ptr<DatabaseInstance> instance;

	// Serializes probe, revalidation and capability switch.
	std::mutex init_mu;

	// Fields below are guarded by [mu].
	mutable std::mutex mu;
	bool initialized = false;
	RangeCapability capability = RangeCapability::kRangeCapable;
	idx_t file_size = 0;
	string version_tag;
	string last_modified;
	// Only set for [kFullDownloadOnly].
	shared_ptr<const string> full_content;
	std::chrono::steady_clock::time_point last_validation;
};

} // namespace remote_pager
