// Unit test for remote file handle: page reads, capability fallback and revalidation.

#define CATCH_CONFIG_RUNNER
#include "catch.hpp"

#include <future>
#include <thread>

#include "duckdb/common/string_util.hpp"
#include "fake_range_fetcher.hpp"
#include "page_cache.hpp"
#include "page_utils.hpp"
#include "remote_file_handle.hpp"
#include "remote_pager_exception.hpp"

using namespace remote_pager; // NOLINT

namespace {

using FetchKind = FakeRangeFetcher::FetchKind;

constexpr idx_t TEST_PAGE_SIZE = 4096;
constexpr idx_t TEST_FILE_SIZE = 10000;
constexpr idx_t TEST_CACHE_BYTES = 1024 * 1024;
const string TEST_URL = "https://cdn.example.com/editions/chunk_2.db";

string GetTestContent(idx_t length, char seed = 'a') {
	string content(length, '\0');
	for (idx_t idx = 0; idx < length; ++idx) {
		content[idx] = static_cast<char>(seed + idx % 23);
	}
	return content;
}

FetchRetryPolicy GetTestRetryPolicy() {
	return FetchRetryPolicy {
	    .max_attempts = 3,
	    .initial_backoff_millisec = 1,
	    .max_backoff_millisec = 1,
	};
}

// Get the error type thrown by [fn], fails the test if nothing is thrown.
template <typename Fn>
RemotePageErrorType GetErrorType(Fn &&fn) {
	try {
		fn();
	} catch (const RemotePageException &ex) {
		return ex.GetErrorType();
	}
	FAIL("Operation is expected to fail");
	return RemotePageErrorType::kUnreachable;
}

} // namespace

TEST_CASE("Test page reads match direct range fetch", "[remote file handle test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	const auto content = GetTestContent(TEST_FILE_SIZE);
	fetcher.SetFile(TEST_URL, content, "\"v1\"");
	PageCache page_cache {TEST_CACHE_BYTES};
	RemoteFileHandle handle {TEST_URL, TEST_PAGE_SIZE, fetcher, page_cache};

	REQUIRE(handle.GetFileSize() == TEST_FILE_SIZE);
	REQUIRE(handle.GetPageCount() == 3);
	REQUIRE(handle.GetCapability() == RangeCapability::kRangeCapable);
	REQUIRE(handle.GetIdentity().version_tag == "\"v1\"");

	for (idx_t page_index = 0; page_index < handle.GetPageCount(); ++page_index) {
		const auto span = GetPageSpan(page_index, TEST_PAGE_SIZE, TEST_FILE_SIZE);
		const auto direct = fetcher.FetchRange(
		    RangeRequest {.url = TEST_URL, .start_offset = span.start_offset, .end_offset = span.end_offset});
		REQUIRE(*handle.ReadPage(page_index) == direct.data);
	}
}

TEST_CASE("Test short final page and page beyond end of file", "[remote file handle test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	const auto content = GetTestContent(TEST_FILE_SIZE);
	fetcher.SetFile(TEST_URL, content);
	PageCache page_cache {TEST_CACHE_BYTES};
	RemoteFileHandle handle {TEST_URL, TEST_PAGE_SIZE, fetcher, page_cache};

	REQUIRE(handle.ReadPage(0)->length() == 4096);
	REQUIRE(handle.ReadPage(1)->length() == 4096);
	const auto last_page = handle.ReadPage(2);
	REQUIRE(last_page->length() == 1808);
	REQUIRE(*last_page == content.substr(8192));

	REQUIRE(GetErrorType([&]() { handle.ReadPage(3); }) == RemotePageErrorType::kRangeUnsatisfiable);
}

TEST_CASE("Test probe seeds first page and reads hit cache", "[remote file handle test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	fetcher.SetFile(TEST_URL, GetTestContent(TEST_FILE_SIZE));
	PageCache page_cache {TEST_CACHE_BYTES};
	RemoteFileHandle handle {TEST_URL, TEST_PAGE_SIZE, fetcher, page_cache};

	handle.Initialize();
	REQUIRE(fetcher.GetFetchCount(FetchKind::kRange) == 1);

	// First page comes from the probe.
	handle.ReadPage(0);
	REQUIRE(fetcher.GetFetchCount(FetchKind::kRange) == 1);

	handle.ReadPage(1);
	handle.ReadPage(1);
	REQUIRE(fetcher.GetFetchCount(FetchKind::kRange) == 2);
}

TEST_CASE("Test file smaller than one page", "[remote file handle test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	const auto content = GetTestContent(100);
	fetcher.SetFile(TEST_URL, content);
	PageCache page_cache {TEST_CACHE_BYTES};
	RemoteFileHandle handle {TEST_URL, TEST_PAGE_SIZE, fetcher, page_cache};

	REQUIRE(handle.GetFileSize() == 100);
	REQUIRE(handle.GetPageCount() == 1);
	REQUIRE(*handle.ReadPage(0) == content);
	REQUIRE(fetcher.GetFetchCount(FetchKind::kRange) == 1);
}

TEST_CASE("Test empty file", "[remote file handle test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	fetcher.SetFile(TEST_URL, string {});
	PageCache page_cache {TEST_CACHE_BYTES};
	RemoteFileHandle handle {TEST_URL, TEST_PAGE_SIZE, fetcher, page_cache};

	REQUIRE(handle.GetFileSize() == 0);
	REQUIRE(handle.GetPageCount() == 0);
	REQUIRE(GetErrorType([&]() { handle.ReadPage(0); }) == RemotePageErrorType::kRangeUnsatisfiable);
}

TEST_CASE("Test fallback to full download when range is not honored", "[remote file handle test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	const auto content = GetTestContent(TEST_FILE_SIZE);
	FakeRangeFetcher::FakeFile file;
	file.content = content;
	file.supports_range = false;
	fetcher.SetFile(TEST_URL, std::move(file));
	PageCache page_cache {TEST_CACHE_BYTES};
	RemoteFileHandle handle {TEST_URL, TEST_PAGE_SIZE, fetcher, page_cache};

	REQUIRE(handle.GetCapability() == RangeCapability::kFullDownloadOnly);
	REQUIRE(handle.GetFileSize() == TEST_FILE_SIZE);
	REQUIRE(fetcher.GetFetchCount(FetchKind::kAll) == 1);

	for (idx_t page_index = 0; page_index < 3; ++page_index) {
		const auto span = GetPageSpan(page_index, TEST_PAGE_SIZE, TEST_FILE_SIZE);
		REQUIRE(*handle.ReadPage(page_index) == content.substr(span.start_offset, span.GetLength()));
	}
	// No further request after the one-time download.
	REQUIRE(fetcher.GetFetchCount(FetchKind::kAll) == 1);
	REQUIRE(fetcher.GetFetchCount(FetchKind::kRange) == 1);
	REQUIRE(GetErrorType([&]() { handle.ReadPage(3); }) == RemotePageErrorType::kRangeUnsatisfiable);
}

TEST_CASE("Test fallback when host stops honoring range", "[remote file handle test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	const auto content = GetTestContent(TEST_FILE_SIZE);
	fetcher.SetFile(TEST_URL, content);
	PageCache page_cache {TEST_CACHE_BYTES};
	RemoteFileHandle handle {TEST_URL, TEST_PAGE_SIZE, fetcher, page_cache};
	handle.Initialize();
	REQUIRE(handle.GetCapability() == RangeCapability::kRangeCapable);

	FakeRangeFetcher::FakeFile file;
	file.content = content;
	file.supports_range = false;
	fetcher.SetFile(TEST_URL, std::move(file));

	REQUIRE(*handle.ReadPage(2) == content.substr(8192));
	REQUIRE(handle.GetCapability() == RangeCapability::kFullDownloadOnly);
}

TEST_CASE("Test fallback when file length is not exposed", "[remote file handle test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	const auto content = GetTestContent(TEST_FILE_SIZE);
	FakeRangeFetcher::FakeFile file;
	file.content = content;
	file.expose_file_size = false;
	fetcher.SetFile(TEST_URL, std::move(file));
	PageCache page_cache {TEST_CACHE_BYTES};
	RemoteFileHandle handle {TEST_URL, TEST_PAGE_SIZE, fetcher, page_cache};

	REQUIRE(handle.GetCapability() == RangeCapability::kFullDownloadOnly);
	REQUIRE(handle.GetFileSize() == TEST_FILE_SIZE);
	REQUIRE(fetcher.GetFetchCount(FetchKind::kMetadata) == 1);
	REQUIRE(*handle.ReadPage(1) == content.substr(4096, 4096));
}

TEST_CASE("Test transient probe failure is retried", "[remote file handle test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	fetcher.SetFile(TEST_URL, GetTestContent(TEST_FILE_SIZE));
	PageCache page_cache {TEST_CACHE_BYTES};
	RemoteFileHandle handle {TEST_URL, TEST_PAGE_SIZE, fetcher, page_cache};

	// Failures beyond retry budget surface, and the handle stays uninitialized.
	fetcher.InjectFailures(/*count=*/3, RemotePageErrorType::kServerError);
	REQUIRE(GetErrorType([&]() { handle.Initialize(); }) == RemotePageErrorType::kServerError);
	REQUIRE_FALSE(handle.IsInitialized());

	// Next access probes again.
	REQUIRE(handle.GetFileSize() == TEST_FILE_SIZE);
	REQUIRE(handle.IsInitialized());
}

TEST_CASE("Test revalidation of unchanged file", "[remote file handle test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	fetcher.SetFile(TEST_URL, GetTestContent(TEST_FILE_SIZE), "\"v1\"");
	PageCache page_cache {TEST_CACHE_BYTES};
	RemoteFileHandle handle {TEST_URL, TEST_PAGE_SIZE, fetcher, page_cache};
	handle.ReadPage(1);
	fetcher.ClearFetchOpers();

	REQUIRE_FALSE(handle.Revalidate());
	// A single conditional probe.
	const auto opers = fetcher.GetFetchOpers();
	REQUIRE(opers.size() == 1);
	REQUIRE(opers[0].if_range == "\"v1\"");

	// Cached pages survive.
	handle.ReadPage(1);
	REQUIRE(fetcher.GetFetchOpers().size() == 1);
}

TEST_CASE("Test revalidation detects changed file", "[remote file handle test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	fetcher.SetFile(TEST_URL, GetTestContent(TEST_FILE_SIZE, 'a'), "\"v1\"");
	PageCache page_cache {TEST_CACHE_BYTES};
	RemoteFileHandle handle {TEST_URL, TEST_PAGE_SIZE, fetcher, page_cache};
	handle.ReadPage(1);

	// Pages keep being served from cache until explicit revalidation.
	const auto new_content = GetTestContent(TEST_FILE_SIZE + 100, 'A');
	fetcher.SetFile(TEST_URL, new_content, "\"v2\"");
	REQUIRE(*handle.ReadPage(1) == GetTestContent(TEST_FILE_SIZE, 'a').substr(4096, 4096));

	REQUIRE(handle.Revalidate());
	REQUIRE(handle.GetIdentity().version_tag == "\"v2\"");
	REQUIRE(handle.GetFileSize() == TEST_FILE_SIZE + 100);
	REQUIRE(*handle.ReadPage(1) == new_content.substr(4096, 4096));
}

TEST_CASE("Test revalidation without version tag", "[remote file handle test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	fetcher.SetFile(TEST_URL, GetTestContent(TEST_FILE_SIZE));
	PageCache page_cache {TEST_CACHE_BYTES};
	RemoteFileHandle handle {TEST_URL, TEST_PAGE_SIZE, fetcher, page_cache};
	handle.Initialize();

	fetcher.ClearFetchOpers();
	REQUIRE_FALSE(handle.Revalidate());
	REQUIRE(fetcher.GetFetchCount(FetchKind::kMetadata) == 1);

	// Length change is noticed from metadata.
	fetcher.SetFile(TEST_URL, GetTestContent(TEST_FILE_SIZE - 1));
	REQUIRE(handle.Revalidate());
	REQUIRE(handle.GetFileSize() == TEST_FILE_SIZE - 1);
}

TEST_CASE("Test file which keeps changing surfaces stale error", "[remote file handle test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	fetcher.SetFile(TEST_URL, GetTestContent(TEST_FILE_SIZE), "\"v1\"");
	PageCache page_cache {TEST_CACHE_BYTES};
	RemoteFileHandle handle {TEST_URL, TEST_PAGE_SIZE, fetcher, page_cache};
	handle.Initialize();

	// Publish a new version on every unconditional probe, so the file changes right after each reload.
	int version = 1;
	fetcher.SetFetchHook([&fetcher, &version](const FakeRangeFetcher::FetchOper &oper) {
		if (oper.kind == FakeRangeFetcher::FetchKind::kRange && oper.if_range.empty()) {
			++version;
			fetcher.SetFile(TEST_URL, GetTestContent(TEST_FILE_SIZE), StringUtil::Format("\"v%d\"", version));
		}
	});
	fetcher.SetFile(TEST_URL, GetTestContent(TEST_FILE_SIZE), "\"v0\"");

	REQUIRE(GetErrorType([&]() { handle.Revalidate(); }) == RemotePageErrorType::kStaleFile);
	// Stale handle doesn't serve pages from its previous state.
	REQUIRE_FALSE(handle.IsInitialized());
	REQUIRE(page_cache.GetStats().cached_page_count == 0);
}

TEST_CASE("Test concurrent reads of one page issue one fetch", "[remote file handle test]") {
	constexpr idx_t READER_COUNT = 8;
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	const auto content = GetTestContent(TEST_FILE_SIZE);
	fetcher.SetFile(TEST_URL, content);
	PageCache page_cache {TEST_CACHE_BYTES};
	RemoteFileHandle handle {TEST_URL, TEST_PAGE_SIZE, fetcher, page_cache};
	handle.Initialize();
	const idx_t range_fetch_count = fetcher.GetFetchCount(FetchKind::kRange);

	fetcher.BlockRangeFetches();
	vector<std::future<PageCache::Page>> reads;
	for (idx_t idx = 0; idx < READER_COUNT; ++idx) {
		reads.emplace_back(std::async(std::launch::async, [&handle]() { return handle.ReadPage(2); }));
	}
	fetcher.WaitForBlockedRangeFetches(1);
	while (page_cache.GetStats().coalesced_count < READER_COUNT - 1) {
		std::this_thread::yield();
	}
	fetcher.ReleaseRangeFetches();

	for (auto &cur_read : reads) {
		REQUIRE(*cur_read.get() == content.substr(8192));
	}
	REQUIRE(fetcher.GetFetchCount(FetchKind::kRange) == range_fetch_count + 1);
	REQUIRE(page_cache.GetStats().miss_count == 1);
}

TEST_CASE("Test malformed probe reply doesn't turn file empty", "[remote file handle test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	const auto content = GetTestContent(TEST_FILE_SIZE);
	fetcher.SetFile(TEST_URL, content);
	PageCache page_cache {TEST_CACHE_BYTES};
	RemoteFileHandle handle {TEST_URL, TEST_PAGE_SIZE, fetcher, page_cache};

	fetcher.InjectFailures(/*count=*/1, RemotePageErrorType::kRangeUnsatisfiable);
	handle.Initialize();
	REQUIRE(handle.GetFileSize() == TEST_FILE_SIZE);
	REQUIRE(handle.GetPageCount() == 3);
	REQUIRE(handle.GetCapability() == RangeCapability::kRangeCapable);
	REQUIRE(*handle.ReadPage(0) == content.substr(0, 4096));
}

TEST_CASE("Test malformed probe reply without known length fails", "[remote file handle test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	FakeRangeFetcher::FakeFile file;
	file.content = GetTestContent(TEST_FILE_SIZE);
	file.expose_file_size = false;
	fetcher.SetFile(TEST_URL, std::move(file));
	PageCache page_cache {TEST_CACHE_BYTES};
	RemoteFileHandle handle {TEST_URL, TEST_PAGE_SIZE, fetcher, page_cache};

	fetcher.InjectFailures(/*count=*/1, RemotePageErrorType::kRangeUnsatisfiable);
	REQUIRE(GetErrorType([&]() { handle.Initialize(); }) == RemotePageErrorType::kRangeUnsatisfiable);
	REQUIRE_FALSE(handle.IsInitialized());
}

TEST_CASE("Test revalidation of unchanged file with weak version tag", "[remote file handle test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	fetcher.SetFile(TEST_URL, GetTestContent(TEST_FILE_SIZE), "W/\"v1\"");
	PageCache page_cache {TEST_CACHE_BYTES};
	RemoteFileHandle handle {TEST_URL, TEST_PAGE_SIZE, fetcher, page_cache};
	handle.ReadPage(1);
	fetcher.ClearFetchOpers();

	REQUIRE_FALSE(handle.Revalidate());
	REQUIRE_FALSE(handle.Revalidate());
	// Compared by metadata, no conditional range request.
	REQUIRE(fetcher.GetFetchCount(FetchKind::kMetadata) == 2);
	REQUIRE(fetcher.GetFetchCount(FetchKind::kRange) == 0);
	REQUIRE(page_cache.GetStats().cached_page_count == 2);

	// Weak tag change is still noticed.
	const auto new_content = GetTestContent(TEST_FILE_SIZE, 'A');
	fetcher.SetFile(TEST_URL, new_content, "W/\"v2\"");
	REQUIRE(handle.Revalidate());
	REQUIRE(*handle.ReadPage(1) == new_content.substr(4096, 4096));
}

TEST_CASE("Test revalidation when host ignores If-Range", "[remote file handle test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	FakeRangeFetcher::FakeFile file;
	file.content = GetTestContent(TEST_FILE_SIZE, 'a');
	file.version_tag = "\"v1\"";
	file.ignore_if_range = true;
	fetcher.SetFile(TEST_URL, file);
	PageCache page_cache {TEST_CACHE_BYTES};
	RemoteFileHandle handle {TEST_URL, TEST_PAGE_SIZE, fetcher, page_cache};
	handle.ReadPage(1);
	REQUIRE_FALSE(handle.Revalidate());

	// Same length, different content and tag.
	file.content = GetTestContent(TEST_FILE_SIZE, 'A');
	file.version_tag = "\"v2\"";
	fetcher.SetFile(TEST_URL, file);
	REQUIRE(handle.Revalidate());
	REQUIRE(handle.GetIdentity().version_tag == "\"v2\"");
	REQUIRE(*handle.ReadPage(1) == file.content.substr(4096, 4096));
}

TEST_CASE("Test query and fragment share cache key", "[remote file handle test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	PageCache page_cache {TEST_CACHE_BYTES};
	RemoteFileHandle handle {TEST_URL + "?token=abc", TEST_PAGE_SIZE, fetcher, page_cache};
	REQUIRE(handle.GetCacheKey() == TEST_URL);
	REQUIRE(handle.GetUrl() == TEST_URL + "?token=abc");
}

int main(int argc, char **argv) {
	return Catch::Session().run(argc, argv);
}
