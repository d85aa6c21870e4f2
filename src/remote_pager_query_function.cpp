#include "remote_pager_query_function.hpp"

#include <algorithm>

#include "duckdb/common/helper.hpp"
#include "duckdb/common/numeric_utils.hpp"
#include "duckdb/common/unique_ptr.hpp"
#include "duckdb/common/vector.hpp"
#include "duckdb/main/client_context.hpp"
#include "page_utils.hpp"
#include "remote_pager_instance_state.hpp"

namespace remote_pager {

namespace {

//===--------------------------------------------------------------------===//
// Page cache status query function
//===--------------------------------------------------------------------===//

struct CacheStatusData : public GlobalTableFunctionState {
	vector<PageCacheEntryInfo> cache_entries_info;
	idx_t page_size = 0;

	// Used to record the progress of emission.
	uint64_t offset = 0;
};

unique_ptr<FunctionData> CacheStatusQueryFuncBind(ClientContext &context, TableFunctionBindInput &input,
                                                  vector<LogicalType> &return_types, vector<string> &names) {
	D_ASSERT(return_types.empty());
	D_ASSERT(names.empty());

	return_types.reserve(5);
	names.reserve(5);

	// Remote object name.
	return_types.emplace_back(LogicalType {LogicalTypeId::VARCHAR});
	names.emplace_back("remote_filename");

	// Page index inside of the remote file.
	return_types.emplace_back(LogicalType {LogicalTypeId::UBIGINT});
	names.emplace_back("page_index");

	// Start offset for the page.
	return_types.emplace_back(LogicalType {LogicalTypeId::UBIGINT});
	names.emplace_back("start_offset");

	// End offset for the page, exclusive.
	return_types.emplace_back(LogicalType {LogicalTypeId::UBIGINT});
	names.emplace_back("end_offset");

	// Number of bytes held by the page.
	return_types.emplace_back(LogicalType {LogicalTypeId::UBIGINT});
	names.emplace_back("page_bytes");

	return nullptr;
}

unique_ptr<GlobalTableFunctionState> CacheStatusQueryFuncInit(ClientContext &context, TableFunctionInitInput &input) {
	auto result = make_uniq<CacheStatusData>();

	// Pages only exist once a facade has been built, don't build one just to report emptiness.
	auto inst_state = GetInstanceStateShared(*context.db);
	if (inst_state) {
		auto facade = inst_state->GetFacadeIfExists();
		if (facade != nullptr) {
			result->cache_entries_info = facade->GetPageCache().GetCacheEntriesInfo();
			result->page_size = facade->GetConfig().page_size;
		}
	}

	// Sort the cache entries info for better visibility.
	std::sort(result->cache_entries_info.begin(), result->cache_entries_info.end());
	return std::move(result);
}

void CacheStatusQueryTableFunc(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &data = data_p.global_state->Cast<CacheStatusData>();

	// All entries have been emitted.
	if (data.offset >= data.cache_entries_info.size()) {
		return;
	}

	// Start filling in the result buffer.
	idx_t count = 0;
	while (data.offset < data.cache_entries_info.size() && count < STANDARD_VECTOR_SIZE) {
		auto &entry = data.cache_entries_info[data.offset++];
		const idx_t start_offset = entry.page_index * data.page_size;
		idx_t col = 0;

		output.SetValue(col++, count, entry.remote_filename);
		output.SetValue(col++, count, Value::UBIGINT(NumericCast<uint64_t>(entry.page_index)));
		output.SetValue(col++, count, Value::UBIGINT(NumericCast<uint64_t>(start_offset)));
		output.SetValue(col++, count, Value::UBIGINT(NumericCast<uint64_t>(start_offset + entry.page_bytes)));
		output.SetValue(col++, count, Value::UBIGINT(NumericCast<uint64_t>(entry.page_bytes)));

		count++;
	}
	output.SetCardinality(count);
}

//===--------------------------------------------------------------------===//
// Page cache access information query function
//===--------------------------------------------------------------------===//

struct CacheAccessInfoData : public GlobalTableFunctionState {
	PageCacheStats stats;
	idx_t max_cache_bytes = 0;
	uint64_t request_count = 0;

	// Stats are emitted as a single row.
	bool emitted = false;
};

unique_ptr<FunctionData> CacheAccessInfoQueryFuncBind(ClientContext &context, TableFunctionBindInput &input,
                                                      vector<LogicalType> &return_types, vector<string> &names) {
	D_ASSERT(return_types.empty());
	D_ASSERT(names.empty());

	const vector<string> column_names {
	    "cache_hit_count",     "cache_miss_count",  "coalesced_count", "eviction_count",
	    "fetch_failure_count", "cached_page_count", "cached_bytes", "max_cache_bytes", "remote_request_count",
	};
	return_types.reserve(column_names.size());
	names.reserve(column_names.size());
	for (const auto &cur_name : column_names) {
		return_types.emplace_back(LogicalType {LogicalTypeId::UBIGINT});
		names.emplace_back(cur_name);
	}
	return nullptr;
}

unique_ptr<GlobalTableFunctionState> CacheAccessInfoQueryFuncInit(ClientContext &context,
                                                                  TableFunctionInitInput &input) {
	auto result = make_uniq<CacheAccessInfoData>();
	auto inst_state = GetInstanceStateShared(*context.db);
	if (inst_state) {
		result->max_cache_bytes = inst_state->GetConfig().max_cache_bytes;
		auto facade = inst_state->GetFacadeIfExists();
		if (facade != nullptr) {
			result->stats = facade->GetPageCache().GetStats();
			result->max_cache_bytes = facade->GetPageCache().GetMaxCacheBytes();
			result->request_count = facade->GetFetcher().GetRequestCount();
		}
	}
	return std::move(result);
}

void CacheAccessInfoQueryTableFunc(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &data = data_p.global_state->Cast<CacheAccessInfoData>();

	// Stats have already been emitted.
	if (data.emitted) {
		return;
	}
	data.emitted = true;

	const auto &stats = data.stats;
	idx_t col = 0;
	output.SetValue(col++, /*index=*/0, Value::UBIGINT(stats.hit_count));
	output.SetValue(col++, /*index=*/0, Value::UBIGINT(stats.miss_count));
	output.SetValue(col++, /*index=*/0, Value::UBIGINT(stats.coalesced_count));
	output.SetValue(col++, /*index=*/0, Value::UBIGINT(stats.eviction_count));
	output.SetValue(col++, /*index=*/0, Value::UBIGINT(stats.fetch_failure_count));
	output.SetValue(col++, /*index=*/0, Value::UBIGINT(NumericCast<uint64_t>(stats.cached_page_count)));
	output.SetValue(col++, /*index=*/0, Value::UBIGINT(NumericCast<uint64_t>(stats.cached_bytes)));
	output.SetValue(col++, /*index=*/0, Value::UBIGINT(NumericCast<uint64_t>(data.max_cache_bytes)));
	output.SetValue(col++, /*index=*/0, Value::UBIGINT(data.request_count));
	output.SetCardinality(/*count=*/1);
}

//===--------------------------------------------------------------------===//
// Routing index entries query function
//===--------------------------------------------------------------------===//

struct ListEntitiesData : public GlobalTableFunctionState {
	vector<ChunkIndexEntry> entries;

	// Used to record the progress of emission.
	uint64_t offset = 0;
};

unique_ptr<FunctionData> ListEntitiesQueryFuncBind(ClientContext &context, TableFunctionBindInput &input,
                                                   vector<LogicalType> &return_types, vector<string> &names) {
	D_ASSERT(return_types.empty());
	D_ASSERT(names.empty());

	return_types.emplace_back(LogicalType {LogicalTypeId::VARCHAR});
	names.emplace_back("key");

	return_types.emplace_back(LogicalType {LogicalTypeId::VARCHAR});
	names.emplace_back("file");

	// NULL for files holding a single entity.
	return_types.emplace_back(LogicalType {LogicalTypeId::UBIGINT});
	names.emplace_back("partition_id");

	return_types.emplace_back(LogicalType {LogicalTypeId::VARCHAR});
	names.emplace_back("url");

	// Extra index columns.
	return_types.emplace_back(
	    LogicalType::MAP(LogicalType {LogicalTypeId::VARCHAR}, LogicalType {LogicalTypeId::VARCHAR}));
	names.emplace_back("metadata");

	return nullptr;
}

unique_ptr<GlobalTableFunctionState> ListEntitiesQueryFuncInit(ClientContext &context, TableFunctionInitInput &input) {
	auto result = make_uniq<ListEntitiesData>();
	auto &inst_state = GetInstanceStateOrThrow(context);
	// Listing needs the routing index, which downloads it if not loaded yet.
	result->entries = inst_state.GetOrCreateFacade()->GetRouter().ListEntries();
	return std::move(result);
}

Value GetMetadataValue(const ChunkIndexEntry &entry) {
	vector<Value> keys;
	vector<Value> values;
	keys.reserve(entry.metadata.size());
	values.reserve(entry.metadata.size());
	for (const auto &[name, value] : entry.metadata) {
		keys.emplace_back(Value {name});
		values.emplace_back(Value {value});
	}
	return Value::MAP(LogicalType {LogicalTypeId::VARCHAR}, LogicalType {LogicalTypeId::VARCHAR}, std::move(keys),
	                  std::move(values));
}

void ListEntitiesQueryTableFunc(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &data = data_p.global_state->Cast<ListEntitiesData>();

	// All entries have been emitted.
	if (data.offset >= data.entries.size()) {
		return;
	}

	idx_t count = 0;
	while (data.offset < data.entries.size() && count < STANDARD_VECTOR_SIZE) {
		auto &entry = data.entries[data.offset++];
		idx_t col = 0;

		output.SetValue(col++, count, entry.key);
		output.SetValue(col++, count, entry.file);
		output.SetValue(col++, count,
		                entry.partition_id.IsValid() ? Value::UBIGINT(entry.partition_id.GetIndex())
		                                             : Value(LogicalType {LogicalTypeId::UBIGINT}));
		output.SetValue(col++, count, entry.url);
		output.SetValue(col++, count, GetMetadataValue(entry));

		count++;
	}
	output.SetCardinality(count);
}

//===--------------------------------------------------------------------===//
// Remote file status query function
//===--------------------------------------------------------------------===//

struct FileStatusData : public GlobalTableFunctionState {
	vector<RemoteFileIdentity> identities;
	vector<RangeCapability> capabilities;

	// Used to record the progress of emission.
	uint64_t offset = 0;
};

unique_ptr<FunctionData> FileStatusQueryFuncBind(ClientContext &context, TableFunctionBindInput &input,
                                                 vector<LogicalType> &return_types, vector<string> &names) {
	D_ASSERT(return_types.empty());
	D_ASSERT(names.empty());

	return_types.emplace_back(LogicalType {LogicalTypeId::VARCHAR});
	names.emplace_back("url");

	return_types.emplace_back(LogicalType {LogicalTypeId::VARCHAR});
	names.emplace_back("capability");

	return_types.emplace_back(LogicalType {LogicalTypeId::UBIGINT});
	names.emplace_back("file_size");

	return_types.emplace_back(LogicalType {LogicalTypeId::UBIGINT});
	names.emplace_back("page_count");

	return_types.emplace_back(LogicalType {LogicalTypeId::VARCHAR});
	names.emplace_back("version_tag");

	return_types.emplace_back(LogicalType {LogicalTypeId::VARCHAR});
	names.emplace_back("last_modified");

	return nullptr;
}

unique_ptr<GlobalTableFunctionState> FileStatusQueryFuncInit(ClientContext &context, TableFunctionInitInput &input) {
	auto result = make_uniq<FileStatusData>();
	auto inst_state = GetInstanceStateShared(*context.db);
	if (!inst_state) {
		return std::move(result);
	}
	auto facade = inst_state->GetFacadeIfExists();
	if (facade == nullptr) {
		return std::move(result);
	}

	// Only report files already probed, so the query itself issues no request.
	for (auto &cur_handle : facade->GetRegistry().GetAllHandles()) {
		if (!cur_handle->IsInitialized()) {
			continue;
		}
		result->capabilities.emplace_back(cur_handle->GetCapability());
		result->identities.emplace_back(cur_handle->GetIdentity());
	}
	return std::move(result);
}

void FileStatusQueryTableFunc(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &data = data_p.global_state->Cast<FileStatusData>();

	// All entries have been emitted.
	if (data.offset >= data.identities.size()) {
		return;
	}

	idx_t count = 0;
	while (data.offset < data.identities.size() && count < STANDARD_VECTOR_SIZE) {
		const auto &identity = data.identities[data.offset];
		const auto capability = data.capabilities[data.offset];
		++data.offset;
		idx_t col = 0;

		output.SetValue(col++, count, identity.url);
		output.SetValue(col++, count, RangeCapabilityToString(capability));
		output.SetValue(col++, count, Value::UBIGINT(NumericCast<uint64_t>(identity.file_size)));
		output.SetValue(col++, count,
		                Value::UBIGINT(NumericCast<uint64_t>(GetPageCount(identity.file_size, identity.page_size))));
		output.SetValue(col++, count, identity.version_tag);
		output.SetValue(col++, count, identity.last_modified);

		count++;
	}
	output.SetCardinality(count);
}

//===--------------------------------------------------------------------===//
// Config query function
//===--------------------------------------------------------------------===//

struct ConfigData : public GlobalTableFunctionState {
	RemotePagerConfig config;

	// Config should be emitted only once.
	bool emitted = false;
};

unique_ptr<FunctionData> ConfigQueryFuncBind(ClientContext &context, TableFunctionBindInput &input,
                                             vector<LogicalType> &return_types, vector<string> &names) {
	D_ASSERT(return_types.empty());
	D_ASSERT(names.empty());

	return_types.emplace_back(LogicalType {LogicalTypeId::VARCHAR});
	names.emplace_back("index_url");

	const vector<string> numeric_columns {
	    "page_size",
	    "max_cache_bytes",
	    "max_fetch_attempts",
	    "initial_backoff_millisec",
	    "max_backoff_millisec",
	    "request_timeout_millisec",
	    "revalidate_interval_millisec",
	    "max_fanout_subrequest",
	};
	for (const auto &cur_name : numeric_columns) {
		return_types.emplace_back(LogicalType {LogicalTypeId::UBIGINT});
		names.emplace_back(cur_name);
	}
	return nullptr;
}

unique_ptr<GlobalTableFunctionState> ConfigQueryFuncInit(ClientContext &context, TableFunctionInitInput &input) {
	auto result = make_uniq<ConfigData>();
	// Fall back to defaults if instance state not found.
	auto inst_state = GetInstanceStateShared(*context.db);
	if (inst_state) {
		result->config = inst_state->GetConfig();
	}
	return std::move(result);
}

void ConfigQueryTableFunc(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &data = data_p.global_state->Cast<ConfigData>();

	// Config has already been emitted.
	if (data.emitted) {
		return;
	}
	data.emitted = true;

	const auto &config = data.config;
	idx_t col = 0;
	output.SetValue(col++, /*index=*/0, config.index_url);
	output.SetValue(col++, /*index=*/0, Value::UBIGINT(config.page_size));
	output.SetValue(col++, /*index=*/0, Value::UBIGINT(config.max_cache_bytes));
	output.SetValue(col++, /*index=*/0, Value::UBIGINT(config.max_fetch_attempts));
	output.SetValue(col++, /*index=*/0, Value::UBIGINT(config.initial_backoff_millisec));
	output.SetValue(col++, /*index=*/0, Value::UBIGINT(config.max_backoff_millisec));
	output.SetValue(col++, /*index=*/0, Value::UBIGINT(config.request_timeout_millisec));
	output.SetValue(col++, /*index=*/0, Value::UBIGINT(config.revalidate_interval_millisec));
	output.SetValue(col++, /*index=*/0, Value::UBIGINT(config.max_subrequest_count));
	output.SetCardinality(/*count=*/1);
}

} // namespace

TableFunction GetCacheStatusQueryFunc() {
	TableFunction cache_status_query_func {/*name=*/"remote_pager_cache_status",
	                                       /*arguments=*/ {},
	                                       /*function=*/CacheStatusQueryTableFunc,
	                                       /*bind=*/CacheStatusQueryFuncBind,
	                                       /*init_global=*/CacheStatusQueryFuncInit};
	return cache_status_query_func;
}

TableFunction GetCacheAccessInfoQueryFunc() {
	TableFunction cache_access_info_query_func {/*name=*/"remote_pager_cache_access_info",
	                                            /*arguments=*/ {},
	                                            /*function=*/CacheAccessInfoQueryTableFunc,
	                                            /*bind=*/CacheAccessInfoQueryFuncBind,
	                                            /*init_global=*/CacheAccessInfoQueryFuncInit};
	return cache_access_info_query_func;
}

TableFunction GetListEntitiesQueryFunc() {
	TableFunction list_entities_query_func {/*name=*/"remote_pager_list_entities",
	                                        /*arguments=*/ {},
	                                        /*function=*/ListEntitiesQueryTableFunc,
	                                        /*bind=*/ListEntitiesQueryFuncBind,
	                                        /*init_global=*/ListEntitiesQueryFuncInit};
	return list_entities_query_func;
}

TableFunction GetFileStatusQueryFunc() {
	TableFunction file_status_query_func {/*name=*/"remote_pager_file_status",
	                                      /*arguments=*/ {},
	                                      /*function=*/FileStatusQueryTableFunc,
	                                      /*bind=*/FileStatusQueryFuncBind,
	                                      /*init_global=*/FileStatusQueryFuncInit};
	return file_status_query_func;
}

TableFunction GetConfigQueryFunc() {
	TableFunction config_query_func {/*name=*/"remote_pager_config",
	                                 /*arguments=*/ {},
	                                 /*function=*/ConfigQueryTableFunc,
	                                 /*bind=*/ConfigQueryFuncBind,
	                                 /*init_global=*/ConfigQueryFuncInit};
	return config_query_func;
}

} // namespace remote_pager
