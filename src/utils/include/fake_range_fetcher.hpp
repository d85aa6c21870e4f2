// This file defines fake range fetcher, which serves in-memory files and is used for testing.
// It checks a few things:
// 1. Which requests are issued, and how many (whether pages are cached and misses are coalesced).
// 2. How failures (transient errors, hosts without range support, changed files) are handled.

#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>

#include "duckdb/common/unordered_map.hpp"
#include "duckdb/common/vector.hpp"
#include "range_fetcher.hpp"
#include "remote_pager_common.hpp"
#include "remote_pager_exception.hpp"

namespace remote_pager {

class FakeRangeFetcher final : public BaseRangeFetcher {
public:
	struct FakeFile {
		string content;
		string version_tag;
		string last_modified;
		// Whether range requests get partial content; otherwise full content is replied.
		bool supports_range = true;
		// Whether responses carry total file length.
		bool expose_file_size = true;
		// Whether `If-Range` is disregarded, so range requests always get partial content.
		bool ignore_if_range = false;
	};

	enum class FetchKind {
		kRange,
		kAll,
		kMetadata,
	};

	struct FetchOper {
		FetchKind kind = FetchKind::kRange;
		string url;
		idx_t start_offset = 0;
		idx_t end_offset = 0;
		string if_range;
	};

	explicit FakeRangeFetcher(FetchRetryPolicy retry_policy_p = FetchRetryPolicy {});
	~FakeRangeFetcher() override = default;

	string GetName() const override {
		return "fake_range_fetcher";
	}

	// Add or replace the file served at [url].
	void SetFile(const string &url, string content, string version_tag = "");
	void SetFile(const string &url, FakeFile file);
	void RemoveFile(const string &url);

	// Fail the next [count] attempts, of any kind, with [error_type].
	void InjectFailures(idx_t count, RemotePageErrorType error_type);

	// Hold all range fetches until [ReleaseRangeFetches] is called.
	void BlockRangeFetches();
	void ReleaseRangeFetches();
	// Block until at least [count] range fetches are held.
	void WaitForBlockedRangeFetches(idx_t count);

	// Invoked after each attempt is recorded, outside of internal lock.
	void SetFetchHook(std::function<void(const FetchOper &)> hook);

	vector<FetchOper> GetFetchOpers() const;
	idx_t GetFetchCount(FetchKind kind) const;
	void ClearFetchOpers();
	// Backoff requested before each retry.
	vector<idx_t> GetBackoffHistory() const;

protected:
	RangeFetchResult FetchRangeOnce(const RangeRequest &request) override;
	RangeFetchResult FetchAllOnce(const string &url) override;
	RemoteFileMetadata FetchMetadataOnce(const string &url) override;
	// Record and return at once.
	void SleepForBackoff(idx_t backoff_millisec) override;

private:
	// Record the attempt, consume an injected failure if any, and get a copy of the served file.
	FakeFile BeginFetch(FetchOper oper);

	mutable std::mutex mtx;
	std::condition_variable cv;
	unordered_map<string, FakeFile> files;
	vector<FetchOper> fetch_opers;
	vector<idx_t> backoff_history;
	idx_t failures_to_inject = 0;
	RemotePageErrorType injected_error_type = RemotePageErrorType::kServerError;
	bool block_range_fetches = false;
	idx_t blocked_range_fetches = 0;
	std::function<void(const FetchOper &)> fetch_hook;
};

} // namespace remote_pager
