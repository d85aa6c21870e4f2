#include "chunk_index.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>

#include "duckdb/common/string_util.hpp"
#include "duckdb/common/unordered_set.hpp"
#include "remote_pager_exception.hpp"
#include "url_utils.hpp"

namespace remote_pager {

namespace {

constexpr const char *KEY_COLUMN = "key";
constexpr const char *FILE_COLUMN = "file";
constexpr const char *PARTITION_COLUMN = "partition_id";

[[noreturn]] void ThrowInvalidIndex(const string &index_url, idx_t line_number, const string &reason) {
	throw RemotePageException(RemotePageErrorType::kInvalidIndex,
	                          StringUtil::Format("Index %s line %llu: %s", index_url, line_number, reason));
}

vector<string> SplitFields(const string &line, char delimiter) {
	// Split on every delimiter, so empty fields keep their position.
	vector<string> fields;
	idx_t field_start = 0;
	for (;;) {
		const auto delimiter_pos = line.find(delimiter, field_start);
		string field = line.substr(field_start, delimiter_pos == string::npos ? string::npos : delimiter_pos - field_start);
		StringUtil::Trim(field);
		fields.emplace_back(std::move(field));
		if (delimiter_pos == string::npos) {
			break;
		}
		field_start = delimiter_pos + 1;
	}
	return fields;
}

optional_idx ParsePartitionId(const string &value, const string &index_url, idx_t line_number) {
	if (value.empty()) {
		return optional_idx {};
	}
	char *end = nullptr;
	errno = 0;
	const unsigned long long partition_id = std::strtoull(value.c_str(), &end, /*base=*/10);
	if (errno != 0 || end == value.c_str() || *end != '\0' || value[0] == '-') {
		ThrowInvalidIndex(index_url, line_number, StringUtil::Format("invalid partition id '%s'", value));
	}
	return optional_idx {static_cast<idx_t>(partition_id)};
}

} // namespace

ChunkIndex ChunkIndex::Parse(const string &content, const string &index_url) {
	ChunkIndex index;

	vector<string> columns;
	char delimiter = ',';
	idx_t key_col = 0;
	idx_t file_col = 0;
	optional_idx partition_col;

	const auto lines = StringUtil::Split(content, '\n');
	for (idx_t line_idx = 0; line_idx < lines.size(); ++line_idx) {
		const idx_t line_number = line_idx + 1;
		string line = lines[line_idx];
		if (!line.empty() && line.back() == '\r') {
			line.pop_back();
		}
		string trimmed = line;
		StringUtil::Trim(trimmed);
		if (trimmed.empty() || trimmed[0] == '#') {
			continue;
		}

		// First meaningful line is the header.
		if (columns.empty()) {
			delimiter = trimmed.find('\t') != string::npos ? '\t' : ',';
			columns = SplitFields(trimmed, delimiter);
			auto find_column = [&columns](const char *name) -> optional_idx {
				auto iter = std::find(columns.begin(), columns.end(), name);
				if (iter == columns.end()) {
					return optional_idx {};
				}
				return optional_idx {static_cast<idx_t>(iter - columns.begin())};
			};
			const auto key_col_opt = find_column(KEY_COLUMN);
			const auto file_col_opt = find_column(FILE_COLUMN);
			if (!key_col_opt.IsValid() || !file_col_opt.IsValid()) {
				ThrowInvalidIndex(index_url, line_number,
				                  StringUtil::Format("header must name columns '%s' and '%s', got '%s'", KEY_COLUMN,
				                                     FILE_COLUMN, trimmed));
			}
			key_col = key_col_opt.GetIndex();
			file_col = file_col_opt.GetIndex();
			partition_col = find_column(PARTITION_COLUMN);
			continue;
		}

		auto fields = SplitFields(line, delimiter);
		if (fields.size() > columns.size()) {
			ThrowInvalidIndex(index_url, line_number,
			                  StringUtil::Format("expect at most %llu fields, got %llu", columns.size(), fields.size()));
		}
		// Trailing optional fields may be omitted.
		fields.resize(columns.size());

		ChunkIndexEntry entry;
		entry.key = fields[key_col];
		entry.file = fields[file_col];
		if (entry.key.empty() || entry.file.empty()) {
			ThrowInvalidIndex(index_url, line_number, "key and file must not be empty");
		}
		entry.url = URLUtils::ResolveReference(index_url, entry.file);
		if (partition_col.IsValid()) {
			entry.partition_id = ParsePartitionId(fields[partition_col.GetIndex()], index_url, line_number);
		}
		for (idx_t col_idx = 0; col_idx < columns.size(); ++col_idx) {
			if (col_idx == key_col || col_idx == file_col ||
			    (partition_col.IsValid() && col_idx == partition_col.GetIndex())) {
				continue;
			}
			entry.metadata[columns[col_idx]] = std::move(fields[col_idx]);
		}

		const string key = entry.key;
		const bool inserted = index.entries.emplace(key, std::move(entry)).second;
		if (!inserted) {
			ThrowInvalidIndex(index_url, line_number, StringUtil::Format("duplicate key '%s'", key));
		}
	}

	if (columns.empty()) {
		throw RemotePageException(RemotePageErrorType::kInvalidIndex,
		                          StringUtil::Format("Index %s has no header line", index_url));
	}
	return index;
}

optional_ptr<const ChunkIndexEntry> ChunkIndex::Find(const string &key) const {
	auto iter = entries.find(key);
	if (iter == entries.end()) {
		return nullptr;
	}
	return &iter->second;
}

vector<ChunkIndexEntry> ChunkIndex::ListEntries() const {
	vector<ChunkIndexEntry> result;
	result.reserve(entries.size());
	for (const auto &[key, entry] : entries) {
		result.emplace_back(entry);
	}
	std::sort(result.begin(), result.end(),
	          [](const ChunkIndexEntry &lhs, const ChunkIndexEntry &rhs) { return lhs.key < rhs.key; });
	return result;
}

idx_t ChunkIndex::GetFileCount() const {
	unordered_set<string> urls;
	for (const auto &[key, entry] : entries) {
		urls.insert(URLUtils::StripQueryAndFragment(entry.url));
	}
	return urls.size();
}

} // namespace remote_pager
