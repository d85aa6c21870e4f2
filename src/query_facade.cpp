#include "query_facade.hpp"

#include <utility>

#include "curl_range_fetcher.hpp"
#include "duckdb/common/limits.hpp"
#include "duckdb/common/string_util.hpp"
#include "remote_pager_logger.hpp"

namespace remote_pager {

//===--------------------------------------------------------------------===//
// RemoteSession
//===--------------------------------------------------------------------===//

RemoteSession::RemoteSession(shared_ptr<RemoteFileHandle> handle_p, ChunkIndexEntry entry_p)
    : handle(std::move(handle_p)), entry(std::move(entry_p)) {
	D_ASSERT(handle != nullptr);
}

string RemoteSession::ReadPage(idx_t page_index) {
	return *handle->ReadPage(page_index);
}

PageCache::Page RemoteSession::ReadSharedPage(idx_t page_index) {
	return handle->ReadPage(page_index);
}

PageReadCallback RemoteSession::GetPageReadCallback() const {
	return [handle = handle](idx_t page_index) -> string { return *handle->ReadPage(page_index); };
}

bool RemoteSession::Refresh() {
	return handle->Revalidate();
}

idx_t RemoteSession::GetPageSize() const {
	return handle->GetPageSize();
}

idx_t RemoteSession::GetPageCount() {
	return handle->GetPageCount();
}

idx_t RemoteSession::GetFileSize() {
	return handle->GetFileSize();
}

//===--------------------------------------------------------------------===//
// QueryFacade
//===--------------------------------------------------------------------===//

QueryFacade::QueryFacade(RemotePagerConfig config_p, optional_ptr<DatabaseInstance> instance_p)
    : QueryFacade(config_p,
                  make_uniq<CurlRangeFetcher>(GetFetchRetryPolicy(config_p), config_p.request_timeout_millisec,
                                              instance_p),
                  instance_p) {
}

QueryFacade::QueryFacade(RemotePagerConfig config_p, unique_ptr<BaseRangeFetcher> fetcher_p,
                         optional_ptr<DatabaseInstance> instance_p)
    : config(std::move(config_p)), instance(instance_p), fetcher(std::move(fetcher_p)) {
	config.Validate();
	page_cache = make_uniq<PageCache>(config.max_cache_bytes);
	registry = make_uniq<RemoteFileRegistry>(*fetcher, *page_cache, config.page_size, instance);
	router = make_uniq<ChunkRouter>(config.index_url, *fetcher, *registry, instance);
	page_read_pool = make_uniq<PageReadPool>(
	    GetThreadCountForSubrequests(NumericLimits<uint64_t>::Maximum(), config.max_subrequest_count));
}

unique_ptr<RemoteSession> QueryFacade::OpenResolved(shared_ptr<RemoteFileHandle> handle, ChunkIndexEntry entry) {
	handle->Initialize();
	// A new session is the point where a long-lived process notices updated data.
	if (config.revalidate_interval_millisec > 0 && handle->IsValidationDue(config.revalidate_interval_millisec)) {
		const bool changed = handle->Revalidate();
		REMOTE_PAGER_LOG_DEBUG(instance, StringUtil::Format("Revalidated %s on session open, changed: %s",
		                                                    handle->GetUrl(), changed ? "true" : "false"));
	}
	return make_uniq<RemoteSession>(std::move(handle), std::move(entry));
}

unique_ptr<RemoteSession> QueryFacade::Open(const string &key) {
	auto resolved = router->Resolve(key);
	return OpenResolved(std::move(resolved.handle), std::move(resolved.entry));
}

unique_ptr<RemoteSession> QueryFacade::OpenUrl(const string &url) {
	ChunkIndexEntry entry;
	entry.key = url;
	entry.file = url;
	entry.url = url;
	return OpenResolved(registry->GetOrCreate(url), std::move(entry));
}

bool QueryFacade::Revalidate(const string &key) {
	auto resolved = router->Resolve(key);
	return resolved.handle->Revalidate();
}

} // namespace remote_pager
