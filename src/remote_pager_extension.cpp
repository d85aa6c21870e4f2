#define DUCKDB_EXTENSION_MAIN

#include "remote_pager_extension.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/opener_file_system.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "duckdb/execution/expression_executor.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/main/client_context.hpp"
#include "duckdb/main/config.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include "remote_page_filesystem.hpp"
#include "remote_pager_config.hpp"
#include "remote_pager_instance_state.hpp"
#include "remote_pager_logger.hpp"
#include "remote_pager_query_function.hpp"

namespace remote_pager {

namespace {

// Get database instance from expression state.
// Returned instance ownership lies in the given [`state`].
DatabaseInstance &GetDatabaseInstance(ExpressionState &state) {
	auto *executor = state.root.executor;
	auto &client_context = executor->GetContext();
	return *client_context.db.get();
}

// Drop all cached pages.
void ClearAllCache(const DataChunk &args, ExpressionState &state, Vector &result) {
	auto &instance = GetDatabaseInstance(state);
	auto &inst_state = GetInstanceStateOrThrow(instance);

	auto facade = inst_state.GetFacadeIfExists();
	if (facade != nullptr) {
		facade->GetPageCache().Clear();
	}
	DUCKDB_LOG_DEBUG(instance, "Cleared remote pager page cache.");

	constexpr bool SUCCESS = true;
	result.Reference(Value(SUCCESS));
}

// Explicit freshness check for the file holding each given key; return whether it changed, NULL for NULL key.
void RevalidateEntity(DataChunk &args, ExpressionState &state, Vector &result) {
	D_ASSERT(args.ColumnCount() == 1);
	auto &instance = GetDatabaseInstance(state);
	auto &inst_state = GetInstanceStateOrThrow(instance);
	auto facade = inst_state.GetOrCreateFacade();
	UnaryExecutor::Execute<string_t, bool>(args.data[0], result, args.size(),
	                                       [&facade](string_t key) { return facade->Revalidate(key.GetString()); });
}

// Drop the loaded routing index, so it's downloaded again on next lookup.
void ReloadIndex(const DataChunk &args, ExpressionState &state, Vector &result) {
	auto &instance = GetDatabaseInstance(state);
	auto &inst_state = GetInstanceStateOrThrow(instance);

	auto facade = inst_state.GetFacadeIfExists();
	if (facade != nullptr) {
		facade->GetRouter().Reload();
	}

	constexpr bool SUCCESS = true;
	result.Reference(Value(SUCCESS));
}

//===--------------------------------------------------------------------===//
// Extension option callbacks - update instance state config when settings change
//===--------------------------------------------------------------------===//

void UpdateIndexUrl(ClientContext &context, SetScope scope, Value &parameter) {
	auto &inst_state = GetInstanceStateOrThrow(context);
	auto index_url = parameter.ToString();
	inst_state.UpdateConfig([&index_url](RemotePagerConfig &config) { config.index_url = std::move(index_url); });
}

void UpdatePageSize(ClientContext &context, SetScope scope, Value &parameter) {
	auto &inst_state = GetInstanceStateOrThrow(context);
	const auto page_size = parameter.GetValue<uint64_t>();
	if (page_size == 0) {
		throw InvalidInputException("remote_pager_page_size must be greater than 0");
	}
	inst_state.UpdateConfig([page_size](RemotePagerConfig &config) { config.page_size = page_size; });
}

void UpdateMaxCacheBytes(ClientContext &context, SetScope scope, Value &parameter) {
	auto &inst_state = GetInstanceStateOrThrow(context);
	const auto max_cache_bytes = parameter.GetValue<uint64_t>();
	if (max_cache_bytes == 0) {
		throw InvalidInputException("remote_pager_max_cache_bytes must be greater than 0");
	}
	inst_state.UpdateConfig([max_cache_bytes](RemotePagerConfig &config) { config.max_cache_bytes = max_cache_bytes; });
}

void UpdateMaxFetchAttempts(ClientContext &context, SetScope scope, Value &parameter) {
	auto &inst_state = GetInstanceStateOrThrow(context);
	const auto max_fetch_attempts = parameter.GetValue<uint64_t>();
	if (max_fetch_attempts == 0) {
		throw InvalidInputException("remote_pager_max_fetch_attempts must be greater than 0");
	}
	inst_state.UpdateConfig(
	    [max_fetch_attempts](RemotePagerConfig &config) { config.max_fetch_attempts = max_fetch_attempts; });
}

void UpdateInitialBackoff(ClientContext &context, SetScope scope, Value &parameter) {
	auto &inst_state = GetInstanceStateOrThrow(context);
	const auto backoff = parameter.GetValue<uint64_t>();
	inst_state.UpdateConfig([backoff](RemotePagerConfig &config) { config.initial_backoff_millisec = backoff; });
}

void UpdateMaxBackoff(ClientContext &context, SetScope scope, Value &parameter) {
	auto &inst_state = GetInstanceStateOrThrow(context);
	const auto backoff = parameter.GetValue<uint64_t>();
	inst_state.UpdateConfig([backoff](RemotePagerConfig &config) { config.max_backoff_millisec = backoff; });
}

void UpdateRequestTimeout(ClientContext &context, SetScope scope, Value &parameter) {
	auto &inst_state = GetInstanceStateOrThrow(context);
	const auto timeout = parameter.GetValue<uint64_t>();
	if (timeout == 0) {
		throw InvalidInputException("remote_pager_request_timeout_millisec must be greater than 0");
	}
	inst_state.UpdateConfig([timeout](RemotePagerConfig &config) { config.request_timeout_millisec = timeout; });
}

void UpdateRevalidateInterval(ClientContext &context, SetScope scope, Value &parameter) {
	auto &inst_state = GetInstanceStateOrThrow(context);
	const auto interval = parameter.GetValue<uint64_t>();
	inst_state.UpdateConfig([interval](RemotePagerConfig &config) { config.revalidate_interval_millisec = interval; });
}

void UpdateMaxFanoutSubrequest(ClientContext &context, SetScope scope, Value &parameter) {
	auto &inst_state = GetInstanceStateOrThrow(context);
	const auto max_subrequest_count = parameter.GetValue<uint64_t>();
	inst_state.UpdateConfig(
	    [max_subrequest_count](RemotePagerConfig &config) { config.max_subrequest_count = max_subrequest_count; });
}

void LoadInternal(ExtensionLoader &loader) {
	auto &instance = loader.GetDatabaseInstance();

	// Create per-instance state for this extension
	auto state = make_shared_ptr<RemotePagerInstanceState>(&instance);
	SetInstanceState(instance, state);

	// Register filesystem instance to instance.
	auto &opener_filesystem = instance.GetFileSystem().Cast<OpenerFileSystem>();
	auto &vfs = opener_filesystem.GetFileSystem();
	vfs.RegisterSubSystem(make_uniq<RemotePageFileSystem>(state));
	DUCKDB_LOG_DEBUG(instance, StringUtil::Format("Register remote page filesystem for prefix %s.",
	                                              REMOTE_PAGER_PATH_PREFIX));

	// Register extension configuration.
	auto &config = DBConfig::GetConfig(instance);
	config.AddExtensionOption("remote_pager_index_url",
	                          "URL of the routing index, which maps entity keys to the remote database files holding "
	                          "them. Relative file references resolve against the directory of the index.",
	                          LogicalType {LogicalTypeId::VARCHAR}, string {}, UpdateIndexUrl);
	config.AddExtensionOption("remote_pager_page_size",
	                          "Page size of the remote database files, which is also the unit of range request and "
	                          "page cache. Cached pages are dropped after update.",
	                          LogicalType {LogicalTypeId::UBIGINT}, Value::UBIGINT(DEFAULT_PAGE_SIZE), UpdatePageSize);
	config.AddExtensionOption("remote_pager_max_cache_bytes",
	                          "Byte budget for the page cache, least recently used pages are evicted beyond it.",
	                          LogicalType {LogicalTypeId::UBIGINT}, Value::UBIGINT(DEFAULT_MAX_CACHE_BYTES),
	                          UpdateMaxCacheBytes);
	config.AddExtensionOption("remote_pager_max_fetch_attempts",
	                          "Max number of attempts for a single remote fetch, including the first one. Only "
	                          "transient failures (network error, 5xx, 429) are retried.",
	                          LogicalType {LogicalTypeId::UBIGINT}, Value::UBIGINT(DEFAULT_MAX_FETCH_ATTEMPTS),
	                          UpdateMaxFetchAttempts);
	config.AddExtensionOption("remote_pager_initial_backoff_millisec",
	                          "Backoff in milliseconds before the first retry, doubled for each further retry.",
	                          LogicalType {LogicalTypeId::UBIGINT}, Value::UBIGINT(DEFAULT_INITIAL_BACKOFF_MILLISEC),
	                          UpdateInitialBackoff);
	config.AddExtensionOption("remote_pager_max_backoff_millisec", "Upper bound in milliseconds for retry backoff.",
	                          LogicalType {LogicalTypeId::UBIGINT}, Value::UBIGINT(DEFAULT_MAX_BACKOFF_MILLISEC),
	                          UpdateMaxBackoff);
	config.AddExtensionOption("remote_pager_request_timeout_millisec",
	                          "Timeout in milliseconds for a single remote fetch attempt.",
	                          LogicalType {LogicalTypeId::UBIGINT}, Value::UBIGINT(DEFAULT_REQUEST_TIMEOUT_MILLISEC),
	                          UpdateRequestTimeout);
	config.AddExtensionOption(
	    "remote_pager_revalidate_interval_millisec",
	    "When positive, a remote file is checked for changes on session open if its last validation is older than the "
	    "interval. 0 means files are only revalidated explicitly with `remote_pager_revalidate`.",
	    LogicalType {LogicalTypeId::UBIGINT}, Value::UBIGINT(DEFAULT_REVALIDATE_INTERVAL_MILLISEC),
	    UpdateRevalidateInterval);
	config.AddExtensionOption(
	    "remote_pager_max_fanout_subrequest",
	    "Reads spanning multiple pages fetch the pages in parallel on a shared worker pool. The setting limits the "
	    "number of workers, and thus parallel page fetches across concurrent reads. 0 means a cap of 1024.",
	    LogicalType {LogicalTypeId::UBIGINT}, Value::UBIGINT(DEFAULT_MAX_SUBREQUEST_COUNT), UpdateMaxFanoutSubrequest);

	// Register page cache cleanup function.
	ScalarFunction clear_cache_function("remote_pager_clear_cache", /*arguments=*/ {},
	                                    /*return_type=*/LogicalType {LogicalTypeId::BOOLEAN}, ClearAllCache);
	loader.RegisterFunction(clear_cache_function);

	// Register explicit revalidation for the file holding the given key.
	ScalarFunction revalidate_function("remote_pager_revalidate",
	                                   /*arguments=*/ {LogicalType {LogicalTypeId::VARCHAR}},
	                                   /*return_type=*/LogicalType {LogicalTypeId::BOOLEAN}, RevalidateEntity);
	loader.RegisterFunction(revalidate_function);

	// Register routing index reload.
	ScalarFunction reload_index_function("remote_pager_reload_index", /*arguments=*/ {},
	                                     /*return_type=*/LogicalType {LogicalTypeId::BOOLEAN}, ReloadIndex);
	loader.RegisterFunction(reload_index_function);

	// Register status table functions.
	loader.RegisterFunction(GetCacheStatusQueryFunc());
	loader.RegisterFunction(GetCacheAccessInfoQueryFunc());
	loader.RegisterFunction(GetListEntitiesQueryFunc());
	loader.RegisterFunction(GetFileStatusQueryFunc());
	loader.RegisterFunction(GetConfigQueryFunc());

	// Fill in extension load information.
	string description = StringUtil::Format(
	    "Serves remote database files page by page over HTTP range requests, with a shared page cache and key-based "
	    "routing to sharded files.");
	loader.SetDescription(description);
}

} // namespace

} // namespace remote_pager

namespace duckdb {

void RemotePagerExtension::Load(ExtensionLoader &loader) {
	remote_pager::LoadInternal(loader);
}
string RemotePagerExtension::Name() {
	return "remote_pager";
}

string RemotePagerExtension::Version() const {
#ifdef EXT_VERSION_REMOTE_PAGER
	return EXT_VERSION_REMOTE_PAGER;
#else
	return "";
#endif
}

} // namespace duckdb

extern "C" {
DUCKDB_CPP_EXTENSION_ENTRY(remote_pager, loader) {
	duckdb::RemotePagerExtension().Load(loader);
}
}

#ifndef DUCKDB_EXTENSION_MAIN
#error DUCKDB_EXTENSION_MAIN not defined
#endif
