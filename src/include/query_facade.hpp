// Entry point for page-pulling engines: open a logical entity, then pull pages through a callback.

#pragma once

#include <functional>

#include "chunk_router.hpp"
#include "duckdb/common/optional_ptr.hpp"
#include "page_cache.hpp"
#include "page_read_pool.hpp"
#include "range_fetcher.hpp"
#include "remote_file_handle.hpp"
#include "remote_pager_common.hpp"
#include "remote_pager_config.hpp"

namespace remote_pager {

// Page-read callback handed to an engine as its storage backend.
using PageReadCallback = std::function<string(idx_t page_index)>;

// One open database session on a remote file.
class RemoteSession {
public:
	RemoteSession(shared_ptr<RemoteFileHandle> handle_p, ChunkIndexEntry entry_p);

	// Get content of the given page.
	string ReadPage(idx_t page_index);

	// Same as [ReadPage], but shares the cached buffer without copy.
	PageCache::Page ReadSharedPage(idx_t page_index);

	// Get a callback bound to the file handle, which stays valid after the session is destructed.
	PageReadCallback GetPageReadCallback() const;

	// Explicit freshness check, see [RemoteFileHandle::Revalidate].
	bool Refresh();

	idx_t GetPageSize() const;
	idx_t GetPageCount();
	idx_t GetFileSize();

	// Routing entry of the session; for direct URL access key and file are the URL itself.
	const ChunkIndexEntry &GetEntry() const {
		return entry;
	}
	RemoteFileHandle &GetHandle() {
		return *handle;
	}

private:
	shared_ptr<RemoteFileHandle> handle;
	ChunkIndexEntry entry;
};

class QueryFacade {
public:
	// Build with libcurl as transport.
	explicit QueryFacade(RemotePagerConfig config_p, optional_ptr<DatabaseInstance> instance_p = nullptr);
	QueryFacade(RemotePagerConfig config_p, unique_ptr<BaseRangeFetcher> fetcher_p,
	            optional_ptr<DatabaseInstance> instance_p = nullptr);

	QueryFacade(const QueryFacade &) = delete;
	QueryFacade &operator=(const QueryFacade &) = delete;

	// Resolve [key] through the routing index and open a session on its file.
	unique_ptr<RemoteSession> Open(const string &key);

	// Open a session on a file addressed directly, bypassing the routing index.
	unique_ptr<RemoteSession> OpenUrl(const string &url);

	// Explicit freshness check for the file which stores [key]. Return whether the file changed.
	bool Revalidate(const string &key);

	const RemotePagerConfig &GetConfig() const {
		return config;
	}
	BaseRangeFetcher &GetFetcher() {
		return *fetcher;
	}
	PageCache &GetPageCache() {
		return *page_cache;
	}
	RemoteFileRegistry &GetRegistry() {
		return *registry;
	}
	ChunkRouter &GetRouter() {
		return *router;
	}
	PageReadPool &GetPageReadPool() {
		return *page_read_pool;
	}

private:
	unique_ptr<RemoteSession> OpenResolved(shared_ptr<RemoteFileHandle> handle, ChunkIndexEntry entry);

	const RemotePagerConfig config;
	optional_ptr<DatabaseInstance> instance;
	unique_ptr<BaseRangeFetcher> fetcher;
	unique_ptr<PageCache> page_cache;
	unique_ptr<RemoteFileRegistry> registry;
	unique_ptr<ChunkRouter> router;
	// Destructed first, so no worker outlives the page cache.
	unique_ptr<PageReadPool> page_read_pool;
};

} // namespace remote_pager
