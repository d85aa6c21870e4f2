#include "remote_file_handle.hpp"

#include <exception>
#include <utility>

#include "duckdb/common/string_util.hpp"
#include "page_utils.hpp"
#include "remote_pager_exception.hpp"
#include "remote_pager_logger.hpp"
#include "url_utils.hpp"

namespace remote_pager {

bool IsWeakVersionTag(const string &version_tag) {
	return StringUtil::StartsWith(version_tag, "W/");
}

const char *RangeCapabilityToString(RangeCapability capability) {
	switch (capability) {
	case RangeCapability::kRangeCapable:
		return "range_capable";
	case RangeCapability::kFullDownloadOnly:
		return "full_download_only";
	}
	throw InternalException("Unknown range capability %d", static_cast<int>(capability));
}

RemoteFileHandle::RemoteFileHandle(string url_p, idx_t page_size_p, BaseRangeFetcher &fetcher_p,
                                   PageCache &page_cache_p, optional_ptr<DatabaseInstance> instance_p)
    : url(std::move(url_p)), cache_key(URLUtils::StripQueryAndFragment(url)), page_size(page_size_p),
      fetcher(fetcher_p), page_cache(page_cache_p), instance(instance_p) {
	if (page_size == 0) {
		throw InvalidInputException("Page size for %s must be greater than 0", url);
	}
}

void RemoteFileHandle::Initialize() {
	{
		const std::lock_guard<std::mutex> lck(mu);
		if (initialized) {
			return;
		}
	}
	const std::lock_guard<std::mutex> init_lck(init_mu);
	{
		const std::lock_guard<std::mutex> lck(mu);
		if (initialized) {
			return;
		}
	}
	ProbeLocked();
}

void RemoteFileHandle::ProbeLocked() {
	RangeFetchResult probe_result;
	bool range_supported = true;
	// Set when the probe reply doesn't satisfy the request, which is either an empty file or a malformed reply.
	std::exception_ptr unsatisfiable_error;
	try {
		probe_result = fetcher.FetchRange(RangeRequest {.url = url, .start_offset = 0, .end_offset = page_size - 1});
	} catch (RemotePageException &ex) {
		if (ex.GetErrorType() == RemotePageErrorType::kRangeUnsupported) {
			range_supported = false;
		} else if (ex.GetErrorType() == RemotePageErrorType::kRangeUnsatisfiable) {
			unsatisfiable_error = std::current_exception();
		} else {
			throw;
		}
	}

	if (!range_supported) {
		SwitchToFullDownloadLocked();
		return;
	}

	RemoteFileMetadata metadata = std::move(probe_result.metadata);
	if (unsatisfiable_error) {
		// Only the length reported by the host tells an empty file apart from a bad reply.
		metadata = fetcher.FetchMetadata(url);
		if (!metadata.file_size.IsValid()) {
			std::rethrow_exception(unsatisfiable_error);
		}
		if (metadata.file_size.GetIndex() > 0) {
			REMOTE_PAGER_LOG_WARN(instance, StringUtil::Format("Probe reply of %s doesn't match the request, use "
			                                                   "length %llu from metadata",
			                                                   url, metadata.file_size.GetIndex()));
		}
	} else if (!metadata.file_size.IsValid()) {
		// Partial response without total length, ask for it separately.
		auto head_metadata = fetcher.FetchMetadata(url);
		metadata.file_size = head_metadata.file_size;
		if (!metadata.file_size.IsValid()) {
			REMOTE_PAGER_LOG_WARN(instance,
			                      StringUtil::Format("%s exposes no file length, fall back to full download", url));
			SwitchToFullDownloadLocked();
			return;
		}
	}

	const idx_t new_file_size = metadata.file_size.GetIndex();
	REMOTE_PAGER_LOG_DEBUG(instance, StringUtil::Format("Probed %s: %llu bytes, range capable, version tag '%s'", url,
	                                                    new_file_size, metadata.version_tag));
	{
		const std::lock_guard<std::mutex> lck(mu);
		capability = RangeCapability::kRangeCapable;
		file_size = new_file_size;
		version_tag = std::move(metadata.version_tag);
		last_modified = std::move(metadata.last_modified);
		full_content = nullptr;
		initialized = true;
		last_validation = std::chrono::steady_clock::now();
	}

	// Probed bytes are the first page, keep them to save a round trip.
	if (new_file_size > 0 && probe_result.data.length() == GetPageSpan(0, page_size, new_file_size).GetLength()) {
		page_cache.PutPage(PageKey {.file_key = cache_key, .page_index = 0}, std::move(probe_result.data));
	}
}

void RemoteFileHandle::SwitchToFullDownloadLocked() {
	{
		const std::lock_guard<std::mutex> lck(mu);
		if (initialized && capability == RangeCapability::kFullDownloadOnly) {
			return;
		}
	}

	REMOTE_PAGER_LOG_WARN(instance,
	                      StringUtil::Format("%s doesn't honor range requests, download the whole file instead", url));
	auto result = fetcher.FetchAll(url);
	auto content = make_shared_ptr<const string>(std::move(result.data));
	{
		const std::lock_guard<std::mutex> lck(mu);
		capability = RangeCapability::kFullDownloadOnly;
		file_size = content->length();
		version_tag = std::move(result.metadata.version_tag);
		last_modified = std::move(result.metadata.last_modified);
		full_content = std::move(content);
		initialized = true;
		last_validation = std::chrono::steady_clock::now();
	}
	// Pages served from the local buffer from now on.
	page_cache.Invalidate(cache_key);
}

RemoteFileHandle::StateSnapshot RemoteFileHandle::GetInitializedSnapshot() {
	Initialize();
	const std::lock_guard<std::mutex> lck(mu);
	return StateSnapshot {
	    .capability = capability,
	    .file_size = file_size,
	    .full_content = full_content,
	};
}

PageCache::Page RemoteFileHandle::SlicePage(const string &content, idx_t page_index, idx_t cur_file_size) const {
	const auto span = GetPageSpan(page_index, page_size, cur_file_size);
	return make_shared_ptr<const string>(content.substr(span.start_offset, span.GetLength()));
}

void RemoteFileHandle::MarkStale() {
	{
		const std::lock_guard<std::mutex> lck(mu);
		initialized = false;
		full_content = nullptr;
	}
	page_cache.Invalidate(cache_key);
}

PageCache::Page RemoteFileHandle::ReadPage(idx_t page_index) {
	auto snapshot = GetInitializedSnapshot();
	const idx_t page_count = remote_pager::GetPageCount(snapshot.file_size, page_size);
	if (page_index >= page_count) {
		throw RemotePageException(RemotePageErrorType::kRangeUnsatisfiable,
		                          StringUtil::Format("Page %llu is beyond end of %s, which has %llu pages", page_index,
		                                             url, page_count));
	}

	if (snapshot.capability == RangeCapability::kFullDownloadOnly) {
		D_ASSERT(snapshot.full_content != nullptr);
		return SlicePage(*snapshot.full_content, page_index, snapshot.file_size);
	}

	// File is treated as immutable until the next explicit revalidation, so reads are unconditional.
	const auto span = GetPageSpan(page_index, page_size, snapshot.file_size);
	RangeRequest request {
	    .url = url,
	    .start_offset = span.start_offset,
	    .end_offset = span.end_offset,
	};
	try {
		return page_cache.GetPage(PageKey {.file_key = cache_key, .page_index = page_index},
		                          [this, &request]() { return fetcher.FetchRange(request).data; });
	} catch (RemotePageException &ex) {
		switch (ex.GetErrorType()) {
		case RemotePageErrorType::kRangeUnsupported: {
			// Host stopped honoring ranges in the middle of a session.
			{
				const std::lock_guard<std::mutex> init_lck(init_mu);
				SwitchToFullDownloadLocked();
			}
			auto full_snapshot = GetInitializedSnapshot();
			if (full_snapshot.full_content == nullptr ||
			    page_index >= remote_pager::GetPageCount(full_snapshot.file_size, page_size)) {
				throw RemotePageException(RemotePageErrorType::kStaleFile,
				                          StringUtil::Format("%s changed while switching to full download", url));
			}
			return SlicePage(*full_snapshot.full_content, page_index, full_snapshot.file_size);
		}
		case RemotePageErrorType::kRangeUnsatisfiable:
			throw RemotePageException(
			    RemotePageErrorType::kRangeUnsatisfiable,
			    StringUtil::Format("Consistency error reading page %llu of %s, file length no longer matches %llu: %s",
			                       page_index, url, snapshot.file_size, ex.what()));
		default:
			throw;
		}
	}
}

bool RemoteFileHandle::HasRemoteChangedLocked() {
	RemoteFileIdentity recorded;
	RangeCapability cur_capability;
	{
		const std::lock_guard<std::mutex> lck(mu);
		recorded.file_size = file_size;
		recorded.version_tag = version_tag;
		recorded.last_modified = last_modified;
		cur_capability = capability;
	}

	// Conditional single-byte probe, which replies full content (reported as stale) if the tag doesn't match.
	// Weak tags never match in `If-Range`, those files are compared by metadata below.
	if (cur_capability == RangeCapability::kRangeCapable && !recorded.version_tag.empty() &&
	    !IsWeakVersionTag(recorded.version_tag) && recorded.file_size > 0) {
		try {
			auto result = fetcher.FetchRange(
			    RangeRequest {.url = url, .start_offset = 0, .end_offset = 0, .if_range = recorded.version_tag});
			if (result.metadata.file_size.IsValid() && result.metadata.file_size.GetIndex() != recorded.file_size) {
				return true;
			}
			// Hosts which ignore `If-Range` reply partial content anyway, their tag still tells.
			return !result.metadata.version_tag.empty() && result.metadata.version_tag != recorded.version_tag;
		} catch (RemotePageException &ex) {
			if (ex.GetErrorType() == RemotePageErrorType::kStaleFile ||
			    ex.GetErrorType() == RemotePageErrorType::kRangeUnsatisfiable) {
				return true;
			}
			throw;
		}
	}

	const auto metadata = fetcher.FetchMetadata(url);
	if (metadata.file_size.IsValid() && metadata.file_size.GetIndex() != recorded.file_size) {
		return true;
	}
	if (!metadata.version_tag.empty() && metadata.version_tag != recorded.version_tag) {
		return true;
	}
	if (!metadata.last_modified.empty() && metadata.last_modified != recorded.last_modified) {
		return true;
	}
	return false;
}

bool RemoteFileHandle::Revalidate() {
	const std::lock_guard<std::mutex> init_lck(init_mu);
	bool cur_initialized = false;
	{
		const std::lock_guard<std::mutex> lck(mu);
		cur_initialized = initialized;
	}
	// Nothing recorded yet, the probe observes the current version.
	if (!cur_initialized) {
		ProbeLocked();
		return false;
	}

	if (!HasRemoteChangedLocked()) {
		const std::lock_guard<std::mutex> lck(mu);
		last_validation = std::chrono::steady_clock::now();
		return false;
	}

	REMOTE_PAGER_LOG_DEBUG(instance, StringUtil::Format("%s changed remotely, drop cached pages and reload", url));
	MarkStale();
	ProbeLocked();
	if (HasRemoteChangedLocked()) {
		MarkStale();
		throw RemotePageException(RemotePageErrorType::kStaleFile,
		                          StringUtil::Format("%s keeps changing, it changed again right after reload", url));
	}
	return true;
}

bool RemoteFileHandle::IsValidationDue(idx_t interval_millisec) const {
	const std::lock_guard<std::mutex> lck(mu);
	if (!initialized) {
		return false;
	}
	const auto elapsed = std::chrono::steady_clock::now() - last_validation;
	return elapsed >= std::chrono::milliseconds(interval_millisec);
}

bool RemoteFileHandle::IsInitialized() const {
	const std::lock_guard<std::mutex> lck(mu);
	return initialized;
}

RemoteFileIdentity RemoteFileHandle::GetIdentity() {
	Initialize();
	const std::lock_guard<std::mutex> lck(mu);
	return RemoteFileIdentity {
	    .url = url,
	    .file_size = file_size,
	    .version_tag = version_tag,
	    .last_modified = last_modified,
	    .page_size = page_size,
	};
}

RangeCapability RemoteFileHandle::GetCapability() {
	return GetInitializedSnapshot().capability;
}

idx_t RemoteFileHandle::GetFileSize() {
	return GetInitializedSnapshot().file_size;
}

idx_t RemoteFileHandle::GetPageCount() {
	return remote_pager::GetPageCount(GetFileSize(), page_size);
}

} // namespace remote_pager
