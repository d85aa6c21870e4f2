// Resolves a logical entity key into the remote file which stores it, and the routing metadata needed to locate its
// rows inside of the file.

#pragma once

#include <mutex>

#include "chunk_index.hpp"
#include "duckdb/common/optional_ptr.hpp"
#include "duckdb/common/unordered_map.hpp"
#include "page_cache.hpp"
#include "range_fetcher.hpp"
#include "remote_file_handle.hpp"
#include "remote_pager_common.hpp"

namespace remote_pager {

// Owns remote file handles, deduplicated by file identity, so all keys sharing a shard share one handle and one page
// cache key space.
class RemoteFileRegistry {
public:
	RemoteFileRegistry(BaseRangeFetcher &fetcher_p, PageCache &page_cache_p, idx_t page_size_p,
	                   optional_ptr<DatabaseInstance> instance_p = nullptr);

	// Get the handle for [url], create one if absent. Handle is not initialized by this call.
	shared_ptr<RemoteFileHandle> GetOrCreate(const string &url);

	vector<shared_ptr<RemoteFileHandle>> GetAllHandles() const;

	idx_t GetPageSize() const {
		return page_size;
	}

private:
	BaseRangeFetcher &fetcher;
	PageCache &page_cache;
	const idx_t page_size;
	optional_ptr<DatabaseInstance> instance;

	mutable std::mutex mu;
	// Keyed by [RemoteFileHandle::GetCacheKey].
	unordered_map<string, shared_ptr<RemoteFileHandle>> handles;
};

struct ResolvedEntity {
	shared_ptr<RemoteFileHandle> handle;
	ChunkIndexEntry entry;
};

class ChunkRouter {
public:
	ChunkRouter(string index_url_p, BaseRangeFetcher &fetcher_p, RemoteFileRegistry &registry_p,
	            optional_ptr<DatabaseInstance> instance_p = nullptr);

	// Resolve [key] to its file handle and routing entry. The index is downloaded on first use and kept afterwards.
	// Throw [RemotePageException] with [kUnknownEntity] if the key is not in the index.
	ResolvedEntity Resolve(const string &key);

	// Whether [key] is present in the routing index.
	bool Contains(const string &key);

	// All index entries sorted by key.
	vector<ChunkIndexEntry> ListEntries();

	// Drop the loaded index, so the next access downloads it again.
	void Reload();

	const string &GetIndexUrl() const {
		return index_url;
	}

private:
	shared_ptr<const ChunkIndex> GetOrLoadIndex();

	const string index_url;
	BaseRangeFetcher &fetcher;
	RemoteFileRegistry &registry;
	optional_ptr<DatabaseInstance> instance;

	// Held while loading, so concurrent first lookups share one download.
	std::mutex mu;
	// Published only after complete parse.
	shared_ptr<const ChunkIndex> index;
};

} // namespace remote_pager
