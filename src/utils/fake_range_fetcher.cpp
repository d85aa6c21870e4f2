#include "fake_range_fetcher.hpp"

#include <utility>

#include "duckdb/common/string_util.hpp"

namespace remote_pager {

namespace {

RemoteFileMetadata GetMetadata(const FakeRangeFetcher::FakeFile &file) {
	RemoteFileMetadata metadata;
	if (file.expose_file_size) {
		metadata.file_size = file.content.length();
	}
	metadata.version_tag = file.version_tag;
	metadata.last_modified = file.last_modified;
	return metadata;
}

} // namespace

FakeRangeFetcher::FakeRangeFetcher(FetchRetryPolicy retry_policy_p) : BaseRangeFetcher(retry_policy_p) {
}

void FakeRangeFetcher::SetFile(const string &url, string content, string version_tag) {
	FakeFile file;
	file.content = std::move(content);
	file.version_tag = std::move(version_tag);
	SetFile(url, std::move(file));
}

void FakeRangeFetcher::SetFile(const string &url, FakeFile file) {
	const std::lock_guard<std::mutex> lck(mtx);
	files[url] = std::move(file);
}

void FakeRangeFetcher::RemoveFile(const string &url) {
	const std::lock_guard<std::mutex> lck(mtx);
	files.erase(url);
}

void FakeRangeFetcher::InjectFailures(idx_t count, RemotePageErrorType error_type) {
	const std::lock_guard<std::mutex> lck(mtx);
	failures_to_inject = count;
	injected_error_type = error_type;
}

void FakeRangeFetcher::BlockRangeFetches() {
	const std::lock_guard<std::mutex> lck(mtx);
	block_range_fetches = true;
}

void FakeRangeFetcher::ReleaseRangeFetches() {
	{
		const std::lock_guard<std::mutex> lck(mtx);
		block_range_fetches = false;
	}
	cv.notify_all();
}

void FakeRangeFetcher::WaitForBlockedRangeFetches(idx_t count) {
	std::unique_lock<std::mutex> lck(mtx);
	cv.wait(lck, [this, count]() { return blocked_range_fetches >= count; });
}

void FakeRangeFetcher::SetFetchHook(std::function<void(const FetchOper &)> hook) {
	const std::lock_guard<std::mutex> lck(mtx);
	fetch_hook = std::move(hook);
}

vector<FakeRangeFetcher::FetchOper> FakeRangeFetcher::GetFetchOpers() const {
	const std::lock_guard<std::mutex> lck(mtx);
	return fetch_opers;
}

idx_t FakeRangeFetcher::GetFetchCount(FetchKind kind) const {
	const std::lock_guard<std::mutex> lck(mtx);
	idx_t count = 0;
	for (const auto &cur_oper : fetch_opers) {
		if (cur_oper.kind == kind) {
			++count;
		}
	}
	return count;
}

void FakeRangeFetcher::ClearFetchOpers() {
	const std::lock_guard<std::mutex> lck(mtx);
	fetch_opers.clear();
}

vector<idx_t> FakeRangeFetcher::GetBackoffHistory() const {
	const std::lock_guard<std::mutex> lck(mtx);
	return backoff_history;
}

void FakeRangeFetcher::SleepForBackoff(idx_t backoff_millisec) {
	const std::lock_guard<std::mutex> lck(mtx);
	backoff_history.emplace_back(backoff_millisec);
}

FakeRangeFetcher::FakeFile FakeRangeFetcher::BeginFetch(FetchOper oper) {
	std::function<void(const FetchOper &)> hook;
	FakeFile file;
	bool found = false;
	{
		std::unique_lock<std::mutex> lck(mtx);
		fetch_opers.emplace_back(oper);
		hook = fetch_hook;

		if (oper.kind == FetchKind::kRange && block_range_fetches) {
			++blocked_range_fetches;
			cv.notify_all();
			cv.wait(lck, [this]() { return !block_range_fetches; });
			--blocked_range_fetches;
		}

		if (failures_to_inject > 0) {
			--failures_to_inject;
			throw RemotePageException(injected_error_type,
			                          StringUtil::Format("Injected failure for %s", oper.url));
		}

		auto iter = files.find(oper.url);
		if (iter != files.end()) {
			file = iter->second;
			found = true;
		}
	}

	if (hook) {
		hook(oper);
	}
	if (!found) {
		throw RemotePageException(RemotePageErrorType::kUnreachable,
		                          StringUtil::Format("Request to %s failed with HTTP status 404", oper.url),
		                          /*transient_p=*/false);
	}
	return file;
}

RangeFetchResult FakeRangeFetcher::FetchRangeOnce(const RangeRequest &request) {
	const auto file = BeginFetch(FetchOper {
	    .kind = FetchKind::kRange,
	    .url = request.url,
	    .start_offset = request.start_offset,
	    .end_offset = request.end_offset,
	    .if_range = request.if_range,
	});

	// A full response to a conditional range request means the token is outdated. Weak tags never match.
	const bool if_range_matches =
	    !StringUtil::StartsWith(request.if_range, "W/") && request.if_range == file.version_tag;
	if (!request.if_range.empty() && !file.ignore_if_range && !if_range_matches) {
		throw RemotePageException(RemotePageErrorType::kStaleFile,
		                          StringUtil::Format("%s no longer matches version %s", request.url, request.if_range));
	}
	if (!file.supports_range) {
		throw RemotePageException(RemotePageErrorType::kRangeUnsupported,
		                          StringUtil::Format("%s replied full content to range request", request.url));
	}
	if (request.start_offset >= file.content.length()) {
		throw RemotePageException(RemotePageErrorType::kRangeUnsatisfiable,
		                          StringUtil::Format("Request to %s got HTTP status 416", request.url));
	}

	const idx_t end_offset = MinValue<idx_t>(request.end_offset, file.content.length() - 1);
	RangeFetchResult result;
	result.data = file.content.substr(request.start_offset, end_offset - request.start_offset + 1);
	result.metadata = GetMetadata(file);
	return result;
}

RangeFetchResult FakeRangeFetcher::FetchAllOnce(const string &url) {
	const auto file = BeginFetch(FetchOper {.kind = FetchKind::kAll, .url = url});
	RangeFetchResult result;
	result.data = file.content;
	result.metadata = GetMetadata(file);
	result.metadata.file_size = file.content.length();
	return result;
}

RemoteFileMetadata FakeRangeFetcher::FetchMetadataOnce(const string &url) {
	const auto file = BeginFetch(FetchOper {.kind = FetchKind::kMetadata, .url = url});
	return GetMetadata(file);
}

} // namespace remote_pager
