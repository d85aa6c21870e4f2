#include "chunk_router.hpp"

#include <utility>

#include "duckdb/common/string_util.hpp"
#include "remote_pager_exception.hpp"
#include "remote_pager_logger.hpp"
#include "url_utils.hpp"

namespace remote_pager {

//===--------------------------------------------------------------------===//
// RemoteFileRegistry
//===--------------------------------------------------------------------===//

RemoteFileRegistry::RemoteFileRegistry(BaseRangeFetcher &fetcher_p, PageCache &page_cache_p, idx_t page_size_p,
                                       optional_ptr<DatabaseInstance> instance_p)
    : fetcher(fetcher_p), page_cache(page_cache_p), page_size(page_size_p), instance(instance_p) {
}

shared_ptr<RemoteFileHandle> RemoteFileRegistry::GetOrCreate(const string &url) {
	const auto cache_key = URLUtils::StripQueryAndFragment(url);
	const std::lock_guard<std::mutex> lck(mu);
	auto iter = handles.find(cache_key);
	if (iter != handles.end()) {
		return iter->second;
	}
	auto handle = make_shared_ptr<RemoteFileHandle>(url, page_size, fetcher, page_cache, instance);
	handles.emplace(cache_key, handle);
	return handle;
}

vector<shared_ptr<RemoteFileHandle>> RemoteFileRegistry::GetAllHandles() const {
	const std::lock_guard<std::mutex> lck(mu);
	vector<shared_ptr<RemoteFileHandle>> result;
	result.reserve(handles.size());
	for (const auto &[cache_key, handle] : handles) {
		result.emplace_back(handle);
	}
	return result;
}

//===--------------------------------------------------------------------===//
// ChunkRouter
//===--------------------------------------------------------------------===//

ChunkRouter::ChunkRouter(string index_url_p, BaseRangeFetcher &fetcher_p, RemoteFileRegistry &registry_p,
                         optional_ptr<DatabaseInstance> instance_p)
    : index_url(std::move(index_url_p)), fetcher(fetcher_p), registry(registry_p), instance(instance_p) {
}

shared_ptr<const ChunkIndex> ChunkRouter::GetOrLoadIndex() {
	const std::lock_guard<std::mutex> lck(mu);
	if (index != nullptr) {
		return index;
	}
	if (index_url.empty()) {
		throw InvalidInputException("No routing index configured, set remote_pager_index_url first");
	}

	// On failure nothing is published, and the next lookup retries the download.
	auto fetch_result = fetcher.FetchAll(index_url);
	auto new_index = make_shared_ptr<const ChunkIndex>(ChunkIndex::Parse(fetch_result.data, index_url));
	REMOTE_PAGER_LOG_DEBUG(instance, StringUtil::Format("Loaded routing index %s with %llu entries over %llu files",
	                                                    index_url, new_index->GetEntryCount(),
	                                                    new_index->GetFileCount()));
	index = std::move(new_index);
	return index;
}

ResolvedEntity ChunkRouter::Resolve(const string &key) {
	auto cur_index = GetOrLoadIndex();
	auto entry = cur_index->Find(key);
	if (!entry) {
		throw RemotePageException(RemotePageErrorType::kUnknownEntity,
		                          StringUtil::Format("Key '%s' is not present in routing index %s", key, index_url));
	}
	return ResolvedEntity {
	    .handle = registry.GetOrCreate(entry->url),
	    .entry = *entry,
	};
}

bool ChunkRouter::Contains(const string &key) {
	auto cur_index = GetOrLoadIndex();
	return cur_index->Find(key).get() != nullptr;
}

vector<ChunkIndexEntry> ChunkRouter::ListEntries() {
	return GetOrLoadIndex()->ListEntries();
}

void ChunkRouter::Reload() {
	const std::lock_guard<std::mutex> lck(mu);
	index = nullptr;
}

} // namespace remote_pager
