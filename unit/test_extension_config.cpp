// Unit test for extension settings, scalar functions and status table functions.

#define CATCH_CONFIG_RUNNER
#include "catch.hpp"

#include "duckdb/common/string_util.hpp"
#include "duckdb/main/connection.hpp"
#include "duckdb/main/database.hpp"
#include "fake_range_fetcher.hpp"
#include "remote_pager_extension.hpp"
#include "remote_pager_instance_state.hpp"

using namespace remote_pager; // NOLINT

namespace {

constexpr idx_t TEST_FILE_SIZE = 10000;
const string TEST_INDEX_URL = "https://cdn.example.com/quran/index.csv";
const string TEST_SHARD_URL = "https://cdn.example.com/quran/editions/chunk_2.db";

string GetTestContent() {
	string content(TEST_FILE_SIZE, '\0');
	for (idx_t idx = 0; idx < TEST_FILE_SIZE; ++idx) {
		content[idx] = static_cast<char>('a' + idx % 26);
	}
	return content;
}

// Load the extension, and route all remote access of the database to an in-memory fake.
void LoadWithFakeFetcher(DuckDB &db) {
	db.LoadStaticExtension<RemotePagerExtension>();
	auto inst_state = GetInstanceStateShared(*db.instance);
	REQUIRE(inst_state != nullptr);
	inst_state->SetRangeFetcherFactory([](const RemotePagerConfig &config) -> unique_ptr<BaseRangeFetcher> {
		auto fake_fetcher = make_uniq<FakeRangeFetcher>(GetFetchRetryPolicy(config));
		fake_fetcher->SetFile(TEST_INDEX_URL, "key,file,partition_id,language\n"
		                                      "eng-sahih,editions/chunk_2.db,75,English\n"
		                                      "ara-quran,editions/chunk_2.db,1,Arabic\n");
		fake_fetcher->SetFile(TEST_SHARD_URL, GetTestContent(), "\"v1\"");
		return std::move(fake_fetcher);
	});
}

} // namespace

TEST_CASE("Test on incorrect config", "[extension config test]") {
	DuckDB db(nullptr);
	db.LoadStaticExtension<RemotePagerExtension>();
	Connection con(db);

	// Set non-existent config parameter.
	auto result = con.Query("SET remote_pager_wrong_page_size=4096");
	REQUIRE(result->HasError());

	// Set existent config parameter to incorrect type.
	result = con.Query("SET remote_pager_page_size='hello'");
	REQUIRE(result->HasError());

	// Zero is not a usable value.
	for (const auto *cur_setting : {"remote_pager_page_size", "remote_pager_max_cache_bytes",
	                                "remote_pager_max_fetch_attempts", "remote_pager_request_timeout_millisec"}) {
		result = con.Query(StringUtil::Format("SET %s=0", cur_setting));
		REQUIRE(result->HasError());
	}

	// Backoff cap below initial backoff.
	result = con.Query("SET remote_pager_max_backoff_millisec=1");
	REQUIRE(result->HasError());

	// Rejected values leave config unchanged.
	auto config = GetInstanceStateOrThrow(*db.instance).GetConfig();
	REQUIRE(config.page_size == DEFAULT_PAGE_SIZE);
	REQUIRE(config.max_backoff_millisec == DEFAULT_MAX_BACKOFF_MILLISEC);
}

TEST_CASE("Test on correct config", "[extension config test]") {
	DuckDB db(nullptr);
	db.LoadStaticExtension<RemotePagerExtension>();
	Connection con(db);

	REQUIRE(!con.Query(StringUtil::Format("SET remote_pager_index_url='%s'", TEST_INDEX_URL))->HasError());
	REQUIRE(!con.Query("SET remote_pager_page_size=65536")->HasError());
	REQUIRE(!con.Query("SET remote_pager_max_cache_bytes=1048576")->HasError());
	REQUIRE(!con.Query("SET remote_pager_max_fetch_attempts=5")->HasError());
	REQUIRE(!con.Query("SET remote_pager_revalidate_interval_millisec=60000")->HasError());
	REQUIRE(!con.Query("SET remote_pager_max_fanout_subrequest=4")->HasError());

	auto result = con.Query("SELECT * FROM remote_pager_config()");
	REQUIRE(!result->HasError());
	REQUIRE(result->RowCount() == 1);
	REQUIRE(result->GetValue(/*col_idx=*/0, /*index=*/0).ToString() == TEST_INDEX_URL);
	REQUIRE(result->GetValue(/*col_idx=*/1, /*index=*/0).GetValue<uint64_t>() == 65536);
	REQUIRE(result->GetValue(/*col_idx=*/2, /*index=*/0).GetValue<uint64_t>() == 1048576);
	REQUIRE(result->GetValue(/*col_idx=*/3, /*index=*/0).GetValue<uint64_t>() == 5);
	REQUIRE(result->GetValue(/*col_idx=*/7, /*index=*/0).GetValue<uint64_t>() == 60000);
	REQUIRE(result->GetValue(/*col_idx=*/8, /*index=*/0).GetValue<uint64_t>() == 4);
}

TEST_CASE("Test read remote file through sql", "[extension config test]") {
	DuckDB db(nullptr);
	LoadWithFakeFetcher(db);
	Connection con(db);
	REQUIRE(!con.Query(StringUtil::Format("SET remote_pager_index_url='%s'", TEST_INDEX_URL))->HasError());

	auto result = con.Query("SELECT size, content FROM read_blob('remote_pager://eng-sahih')");
	REQUIRE(!result->HasError());
	REQUIRE(result->RowCount() == 1);
	REQUIRE(result->GetValue(/*col_idx=*/0, /*index=*/0).GetValue<int64_t>() == TEST_FILE_SIZE);
	REQUIRE(result->GetValue(/*col_idx=*/1, /*index=*/0).ToString() == GetTestContent());

	// Three pages of the file are resident.
	result = con.Query("SELECT page_index, start_offset, end_offset, page_bytes FROM remote_pager_cache_status()");
	REQUIRE(!result->HasError());
	REQUIRE(result->RowCount() == 3);
	REQUIRE(result->GetValue(/*col_idx=*/0, /*index=*/2).GetValue<uint64_t>() == 2);
	REQUIRE(result->GetValue(/*col_idx=*/1, /*index=*/2).GetValue<uint64_t>() == 8192);
	REQUIRE(result->GetValue(/*col_idx=*/2, /*index=*/2).GetValue<uint64_t>() == 10000);
	REQUIRE(result->GetValue(/*col_idx=*/3, /*index=*/2).GetValue<uint64_t>() == 1808);

	result = con.Query("SELECT cached_page_count, cached_bytes FROM remote_pager_cache_access_info()");
	REQUIRE(!result->HasError());
	REQUIRE(result->GetValue(/*col_idx=*/0, /*index=*/0).GetValue<uint64_t>() == 3);
	REQUIRE(result->GetValue(/*col_idx=*/1, /*index=*/0).GetValue<uint64_t>() == TEST_FILE_SIZE);

	result = con.Query("SELECT url, capability, file_size, page_count, version_tag FROM remote_pager_file_status()");
	REQUIRE(!result->HasError());
	REQUIRE(result->RowCount() == 1);
	REQUIRE(result->GetValue(/*col_idx=*/0, /*index=*/0).ToString() == TEST_SHARD_URL);
	REQUIRE(result->GetValue(/*col_idx=*/1, /*index=*/0).ToString() == "range_capable");
	REQUIRE(result->GetValue(/*col_idx=*/2, /*index=*/0).GetValue<uint64_t>() == TEST_FILE_SIZE);
	REQUIRE(result->GetValue(/*col_idx=*/3, /*index=*/0).GetValue<uint64_t>() == 3);
	REQUIRE(result->GetValue(/*col_idx=*/4, /*index=*/0).ToString() == "\"v1\"");

	// Clear cache.
	result = con.Query("SELECT remote_pager_clear_cache()");
	REQUIRE(!result->HasError());
	result = con.Query("SELECT COUNT(*) FROM remote_pager_cache_status()");
	REQUIRE(result->GetValue(/*col_idx=*/0, /*index=*/0).GetValue<int64_t>() == 0);
}

TEST_CASE("Test list entities and revalidate through sql", "[extension config test]") {
	DuckDB db(nullptr);
	LoadWithFakeFetcher(db);
	Connection con(db);
	REQUIRE(!con.Query(StringUtil::Format("SET remote_pager_index_url='%s'", TEST_INDEX_URL))->HasError());

	auto result = con.Query("SELECT key, file, partition_id, url, metadata['language'] FROM "
	                        "remote_pager_list_entities() ORDER BY key");
	REQUIRE(!result->HasError());
	REQUIRE(result->RowCount() == 2);
	REQUIRE(result->GetValue(/*col_idx=*/0, /*index=*/1).ToString() == "eng-sahih");
	REQUIRE(result->GetValue(/*col_idx=*/1, /*index=*/1).ToString() == "editions/chunk_2.db");
	REQUIRE(result->GetValue(/*col_idx=*/2, /*index=*/1).GetValue<uint64_t>() == 75);
	REQUIRE(result->GetValue(/*col_idx=*/3, /*index=*/1).ToString() == TEST_SHARD_URL);
	REQUIRE(result->GetValue(/*col_idx=*/4, /*index=*/1).ToString() == "English");

	result = con.Query("SELECT remote_pager_revalidate('eng-sahih')");
	REQUIRE(!result->HasError());
	REQUIRE(result->GetValue(/*col_idx=*/0, /*index=*/0).GetValue<bool>() == false);

	result = con.Query("SELECT remote_pager_revalidate('fra-hamidullah')");
	REQUIRE(result->HasError());

	// Every row is revalidated on its own key, NULL key gives NULL.
	result = con.Query("SELECT remote_pager_revalidate(k) FROM (VALUES ('eng-sahih'), (NULL), ('ara-quran')) t(k)");
	REQUIRE(!result->HasError());
	REQUIRE(result->RowCount() == 3);
	REQUIRE(result->GetValue(/*col_idx=*/0, /*index=*/0).GetValue<bool>() == false);
	REQUIRE(result->GetValue(/*col_idx=*/0, /*index=*/1).IsNull());
	REQUIRE(result->GetValue(/*col_idx=*/0, /*index=*/2).GetValue<bool>() == false);

	// Unknown key in a later row still fails the query.
	result = con.Query("SELECT remote_pager_revalidate(k) FROM (VALUES ('eng-sahih'), ('fra-hamidullah')) t(k)");
	REQUIRE(result->HasError());

	result = con.Query("SELECT remote_pager_reload_index()");
	REQUIRE(!result->HasError());
}

TEST_CASE("Test remote file without index url", "[extension config test]") {
	DuckDB db(nullptr);
	LoadWithFakeFetcher(db);
	Connection con(db);

	auto result = con.Query("SELECT size FROM read_blob('remote_pager://eng-sahih')");
	REQUIRE(result->HasError());

	// Direct url access doesn't need routing index.
	result = con.Query(StringUtil::Format("SELECT size FROM read_blob('remote_pager://%s')", TEST_SHARD_URL));
	REQUIRE(!result->HasError());
	REQUIRE(result->GetValue(/*col_idx=*/0, /*index=*/0).GetValue<int64_t>() == TEST_FILE_SIZE);
}

int main(int argc, char **argv) {
	return Catch::Session().run(argc, argv);
}
