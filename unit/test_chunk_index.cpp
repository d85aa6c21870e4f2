#define CATCH_CONFIG_RUNNER
#include "catch.hpp"

#include "chunk_index.hpp"
#include "remote_pager_exception.hpp"

using namespace remote_pager; // NOLINT

namespace {

const string TEST_INDEX_URL = "https://cdn.example.com/quran/index.csv";

// Get the error type thrown by parsing [content], fails the test if nothing is thrown.
RemotePageErrorType GetParseErrorType(const string &content) {
	try {
		ChunkIndex::Parse(content, TEST_INDEX_URL);
	} catch (const RemotePageException &ex) {
		return ex.GetErrorType();
	}
	FAIL("Index parse is expected to fail");
	return RemotePageErrorType::kUnreachable;
}

} // namespace

TEST_CASE("Test parse comma separated index", "[chunk index test]") {
	const string content = "# routing index\n"
	                       "key,file,partition_id,language\n"
	                       "\n"
	                       "eng-sahih,editions/chunk_2.db,75,English\n"
	                       "ara-quran,editions/chunk_2.db,1,Arabic\r\n"
	                       "en-tafsir-ibn-kathir,tafsirs/en-tafsir-ibn-kathir.db,,English\n";
	const auto index = ChunkIndex::Parse(content, TEST_INDEX_URL);
	REQUIRE(index.GetEntryCount() == 3);
	REQUIRE(index.GetFileCount() == 2);

	const auto entry = index.Find("eng-sahih");
	REQUIRE(entry);
	REQUIRE(entry->file == "editions/chunk_2.db");
	REQUIRE(entry->url == "https://cdn.example.com/quran/editions/chunk_2.db");
	REQUIRE(entry->partition_id.IsValid());
	REQUIRE(entry->partition_id.GetIndex() == 75);
	REQUIRE(entry->metadata.at("language") == "English");

	// Carriage return is not part of the value.
	const auto arabic_entry = index.Find("ara-quran");
	REQUIRE(arabic_entry);
	REQUIRE(arabic_entry->metadata.at("language") == "Arabic");

	// Entity which owns its file has no partition.
	const auto tafsir_entry = index.Find("en-tafsir-ibn-kathir");
	REQUIRE(tafsir_entry);
	REQUIRE_FALSE(tafsir_entry->partition_id.IsValid());

	REQUIRE_FALSE(index.Find("unknown-key"));
}

TEST_CASE("Test parse tab separated index", "[chunk index test]") {
	const string content = "file\tkey\n"
	                       "https://mirror.example.com/a.db\tkey-a\n"
	                       "/root/b.db\tkey-b\n";
	const auto index = ChunkIndex::Parse(content, TEST_INDEX_URL);
	REQUIRE(index.GetEntryCount() == 2);
	REQUIRE(index.Find("key-a")->url == "https://mirror.example.com/a.db");
	REQUIRE(index.Find("key-b")->url == "https://cdn.example.com/root/b.db");
	REQUIRE(index.Find("key-b")->metadata.empty());
}

TEST_CASE("Test file references with dot segments", "[chunk index test]") {
	const string content = "key,file,partition_id\n"
	                       "eng-sahih,editions/chunk_2.db,75\n"
	                       "ara-quran,./editions/old/../chunk_2.db,1\n"
	                       "en-tafsir-ibn-kathir,../tafsirs/en-tafsir-ibn-kathir.db,\n";
	const auto index = ChunkIndex::Parse(content, TEST_INDEX_URL);
	REQUIRE(index.Find("ara-quran")->url == "https://cdn.example.com/quran/editions/chunk_2.db");
	REQUIRE(index.Find("en-tafsir-ibn-kathir")->url == "https://cdn.example.com/tafsirs/en-tafsir-ibn-kathir.db");
	// Both editions resolve to one shard.
	REQUIRE(index.GetFileCount() == 2);
}

TEST_CASE("Test list entries sorted by key", "[chunk index test]") {
	const string content = "key,file\n"
	                       "zeta,z.db\n"
	                       "alpha,a.db\n"
	                       "mid,a.db\n";
	const auto entries = ChunkIndex::Parse(content, TEST_INDEX_URL).ListEntries();
	REQUIRE(entries.size() == 3);
	REQUIRE(entries[0].key == "alpha");
	REQUIRE(entries[1].key == "mid");
	REQUIRE(entries[2].key == "zeta");
}

TEST_CASE("Test invalid index", "[chunk index test]") {
	SECTION("no header") {
		REQUIRE(GetParseErrorType("# only comments\n\n") == RemotePageErrorType::kInvalidIndex);
	}
	SECTION("header without file column") {
		REQUIRE(GetParseErrorType("key,partition_id\na,1\n") == RemotePageErrorType::kInvalidIndex);
	}
	SECTION("too many fields") {
		REQUIRE(GetParseErrorType("key,file\na,a.db,extra\n") == RemotePageErrorType::kInvalidIndex);
	}
	SECTION("empty key") {
		REQUIRE(GetParseErrorType("key,file\n,a.db\n") == RemotePageErrorType::kInvalidIndex);
	}
	SECTION("duplicate key") {
		REQUIRE(GetParseErrorType("key,file\na,a.db\na,b.db\n") == RemotePageErrorType::kInvalidIndex);
	}
	SECTION("invalid partition id") {
		REQUIRE(GetParseErrorType("key,file,partition_id\na,a.db,seventy\n") == RemotePageErrorType::kInvalidIndex);
		REQUIRE(GetParseErrorType("key,file,partition_id\na,a.db,-1\n") == RemotePageErrorType::kInvalidIndex);
	}
}

int main(int argc, char **argv) {
	return Catch::Session().run(argc, argv);
}
