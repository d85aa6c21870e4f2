// Unit test for range fetch contract and retry policy.

#define CATCH_CONFIG_RUNNER
#include "catch.hpp"

#include "fake_range_fetcher.hpp"
#include "remote_pager_exception.hpp"

using namespace remote_pager; // NOLINT

namespace {

const string TEST_URL = "https://cdn.example.com/chunk_1.db";

FetchRetryPolicy GetTestRetryPolicy() {
	return FetchRetryPolicy {
	    .max_attempts = 4,
	    .initial_backoff_millisec = 100,
	    .max_backoff_millisec = 250,
	};
}

string GetTestContent(idx_t length) {
	string content(length, '\0');
	for (idx_t idx = 0; idx < length; ++idx) {
		content[idx] = static_cast<char>('a' + idx % 26);
	}
	return content;
}

RangeRequest GetRangeRequest(idx_t start_offset, idx_t end_offset) {
	return RangeRequest {.url = TEST_URL, .start_offset = start_offset, .end_offset = end_offset};
}

// Get the error type thrown by [fn], fails the test if nothing is thrown.
template <typename Fn>
RemotePageErrorType GetErrorType(Fn &&fn) {
	try {
		fn();
	} catch (const RemotePageException &ex) {
		return ex.GetErrorType();
	}
	FAIL("Fetch is expected to fail");
	return RemotePageErrorType::kUnreachable;
}

} // namespace

TEST_CASE("Test fetch exact range", "[range fetcher test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	const auto content = GetTestContent(100);
	fetcher.SetFile(TEST_URL, content, "\"v1\"");

	auto result = fetcher.FetchRange(GetRangeRequest(10, 19));
	REQUIRE(result.data == content.substr(10, 10));
	REQUIRE(result.metadata.file_size.GetIndex() == 100);
	REQUIRE(result.metadata.version_tag == "\"v1\"");
	REQUIRE(fetcher.GetRequestCount() == 1);
}

TEST_CASE("Test range clipped at end of file", "[range fetcher test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	const auto content = GetTestContent(100);
	fetcher.SetFile(TEST_URL, content);

	auto result = fetcher.FetchRange(GetRangeRequest(90, 149));
	REQUIRE(result.data == content.substr(90));

	// Range starting beyond end of file.
	REQUIRE(GetErrorType([&]() { fetcher.FetchRange(GetRangeRequest(100, 199)); }) ==
	        RemotePageErrorType::kRangeUnsatisfiable);
}

TEST_CASE("Test transient failures are retried with backoff", "[range fetcher test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	const auto content = GetTestContent(100);
	fetcher.SetFile(TEST_URL, content);

	fetcher.InjectFailures(/*count=*/3, RemotePageErrorType::kServerError);
	auto result = fetcher.FetchRange(GetRangeRequest(0, 9));
	REQUIRE(result.data == content.substr(0, 10));
	REQUIRE(fetcher.GetRequestCount() == 4);
	// Backoff doubles and is capped.
	REQUIRE(fetcher.GetBackoffHistory() == vector<idx_t> {100, 200, 250});
}

TEST_CASE("Test retries exhausted", "[range fetcher test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	fetcher.SetFile(TEST_URL, GetTestContent(100));

	fetcher.InjectFailures(/*count=*/10, RemotePageErrorType::kUnreachable);
	REQUIRE(GetErrorType([&]() { fetcher.FetchRange(GetRangeRequest(0, 9)); }) == RemotePageErrorType::kUnreachable);
	REQUIRE(fetcher.GetRequestCount() == 4);
	REQUIRE(fetcher.GetBackoffHistory().size() == 3);
}

TEST_CASE("Test non-transient failures are not retried", "[range fetcher test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};

	SECTION("missing file") {
		REQUIRE(GetErrorType([&]() { fetcher.FetchRange(GetRangeRequest(0, 9)); }) ==
		        RemotePageErrorType::kUnreachable);
		REQUIRE(fetcher.GetRequestCount() == 1);
	}

	SECTION("range unsupported") {
		FakeRangeFetcher::FakeFile file;
		file.content = GetTestContent(100);
		file.supports_range = false;
		fetcher.SetFile(TEST_URL, std::move(file));
		REQUIRE(GetErrorType([&]() { fetcher.FetchRange(GetRangeRequest(0, 9)); }) ==
		        RemotePageErrorType::kRangeUnsupported);
		REQUIRE(fetcher.GetRequestCount() == 1);
		REQUIRE(fetcher.GetBackoffHistory().empty());
	}
}

TEST_CASE("Test fetch whole file and metadata", "[range fetcher test]") {
	FakeRangeFetcher fetcher {GetTestRetryPolicy()};
	const auto content = GetTestContent(100);
	fetcher.SetFile(TEST_URL, content, "\"v2\"");

	fetcher.InjectFailures(/*count=*/1, RemotePageErrorType::kServerError);
	auto result = fetcher.FetchAll(TEST_URL);
	REQUIRE(result.data == content);
	REQUIRE(result.metadata.file_size.GetIndex() == 100);

	const auto metadata = fetcher.FetchMetadata(TEST_URL);
	REQUIRE(metadata.file_size.GetIndex() == 100);
	REQUIRE(metadata.version_tag == "\"v2\"");
	REQUIRE(fetcher.GetRequestCount() == 3);
}

TEST_CASE("Test invalid retry policy", "[range fetcher test]") {
	FetchRetryPolicy retry_policy;
	retry_policy.max_attempts = 0;
	REQUIRE_THROWS_AS(FakeRangeFetcher {retry_policy}, InvalidInputException);
}

TEST_CASE("Test retry policy from config", "[range fetcher test]") {
	RemotePagerConfig config;
	config.max_fetch_attempts = 5;
	config.initial_backoff_millisec = 10;
	config.max_backoff_millisec = 40;
	const auto retry_policy = GetFetchRetryPolicy(config);
	REQUIRE(retry_policy.max_attempts == 5);
	REQUIRE(retry_policy.initial_backoff_millisec == 10);
	REQUIRE(retry_policy.max_backoff_millisec == 40);
}

int main(int argc, char **argv) {
	return Catch::Session().run(argc, argv);
}
