// Routing index which maps logical entity keys (edition or tafsir slugs) to the shard file containing their rows.
//
// Index file is small delimited text, downloaded whole:
//
//   # comments and blank lines are skipped
//   key,file,partition_id,language
//   eng-sahih,editions/chunk_2.db,75,English
//   en-tafsir-ibn-kathir,tafsirs/en-tafsir-ibn-kathir.db,,English
//
// The header names columns; [key] and [file] are required, [partition_id] is optional and all other columns are kept
// as metadata. Delimiter is tab if the header contains one, otherwise comma. Relative file references resolve against
// the directory of the index file.
//
// The data preparation scripts keep their catalogs in SQLite (`editions/index.db`, `tafsirs/db/index.db`); those are
// exported into this text form before deployment, one row per edition with the edition id as [partition_id].

#pragma once

#include "duckdb/common/map.hpp"
#include "duckdb/common/optional_idx.hpp"
#include "duckdb/common/optional_ptr.hpp"
#include "duckdb/common/unordered_map.hpp"
#include "remote_pager_common.hpp"

namespace remote_pager {

struct ChunkIndexEntry {
	string key;
	// File reference as written in the index.
	string file;
	// Absolute URL of the file.
	string url;
	// Partition of the entity inside of a shared shard, unset for files holding a single entity.
	optional_idx partition_id;
	// Remaining columns, keyed by column name.
	map<string, string> metadata;
};

class ChunkIndex {
public:
	// Parse index content, throw [RemotePageException] with [kInvalidIndex] on malformed input.
	static ChunkIndex Parse(const string &content, const string &index_url);

	optional_ptr<const ChunkIndexEntry> Find(const string &key) const;

	// All entries sorted by key.
	vector<ChunkIndexEntry> ListEntries() const;

	idx_t GetEntryCount() const {
		return entries.size();
	}

	// Number of distinct files referenced by the index.
	idx_t GetFileCount() const;

private:
	unordered_map<string, ChunkIndexEntry> entries;
};

} // namespace remote_pager
