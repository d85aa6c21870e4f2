// Page cache shared by all remote files: LRU eviction within a byte budget, and coalescing of concurrent misses on the
// same page into one fetch.

#pragma once

#include <functional>
#include <future>
#include <list>
#include <mutex>

#include "duckdb/common/unordered_map.hpp"
#include "remote_pager_common.hpp"

namespace remote_pager {

struct PageKey {
	// Identity of the remote file, see [RemoteFileHandle::GetCacheKey].
	string file_key;
	idx_t page_index = 0;
};

struct PageKeyHash {
	std::size_t operator()(const PageKey &key) const;
};

struct PageKeyEqual {
	bool operator()(const PageKey &lhs, const PageKey &rhs) const {
		return lhs.page_index == rhs.page_index && lhs.file_key == rhs.file_key;
	}
};

// Entry information for a resident page.
struct PageCacheEntryInfo {
	string remote_filename;
	idx_t page_index = 0;
	idx_t page_bytes = 0;
};

bool operator<(const PageCacheEntryInfo &lhs, const PageCacheEntryInfo &rhs);

struct PageCacheStats {
	uint64_t hit_count = 0;
	uint64_t miss_count = 0;
	// Number of lookups which waited for a fetch issued by another caller.
	uint64_t coalesced_count = 0;
	uint64_t eviction_count = 0;
	uint64_t fetch_failure_count = 0;
	idx_t cached_page_count = 0;
	idx_t cached_bytes = 0;
};

class PageCache {
public:
	using Page = shared_ptr<const string>;
	using PageLoader = std::function<string()>;

	explicit PageCache(idx_t max_cache_bytes_p);

	PageCache(const PageCache &) = delete;
	PageCache &operator=(const PageCache &) = delete;

	// Get the page for [key]. On miss [loader] is invoked on the current thread, unless a fetch for the same key is
	// already in flight, in which case the current thread waits for that fetch and shares its result or exception.
	Page GetPage(const PageKey &key, const PageLoader &loader);

	// Insert a page fetched outside of [GetPage], for example by a capability probe.
	void PutPage(const PageKey &key, string page);

	// Drop all resident pages for the given file. Fetches in flight for the file are not cached on completion.
	void Invalidate(const string &file_key);

	// Drop all resident pages.
	void Clear();

	vector<PageCacheEntryInfo> GetCacheEntriesInfo() const;
	PageCacheStats GetStats() const;

	idx_t GetMaxCacheBytes() const {
		return max_cache_bytes;
	}

private:
	struct CacheEntry {
		Page page;
		std::list<PageKey>::iterator lru_iter;
	};
	struct InflightFetch {
		std::shared_future<Page> future;
		// Generation of the file when the fetch started.
		uint64_t generation = 0;
	};

	uint64_t GetGenerationLocked(const string &file_key) const;
	void InsertLocked(const PageKey &key, Page page);
	// Drop the in-flight entry for [key], if it still belongs to the fetch started at [generation].
	void EraseInflightLocked(const PageKey &key, uint64_t generation);
	void EraseLocked(unordered_map<PageKey, CacheEntry, PageKeyHash, PageKeyEqual>::iterator iter);

	const idx_t max_cache_bytes;

	// All fields below are guarded by [mu].
	mutable std::mutex mu;
	// Most recently used page at the front.
	std::list<PageKey> lru_list;
	unordered_map<PageKey, CacheEntry, PageKeyHash, PageKeyEqual> entries;
	unordered_map<PageKey, InflightFetch, PageKeyHash, PageKeyEqual> inflight_fetches;
	// Bumped on invalidation, so fetches started before it won't populate the cache.
	unordered_map<string, uint64_t> file_generations;
	uint64_t global_generation = 0;
	idx_t cached_bytes = 0;
	PageCacheStats stats;
};

} // namespace remote_pager
