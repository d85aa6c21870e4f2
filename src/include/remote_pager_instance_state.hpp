// Per-instance state for remote_pager extension.
// State is stored in DuckDB's ObjectCache for automatic cleanup when DatabaseInstance is destroyed.

#pragma once

#include <functional>
#include <mutex>

#include "duckdb/common/optional_ptr.hpp"
#include "duckdb/common/shared_ptr.hpp"
#include "duckdb/storage/object_cache.hpp"
#include "query_facade.hpp"
#include "remote_pager_common.hpp"
#include "remote_pager_config.hpp"

namespace duckdb {
// Forward declarations
class ClientContext;
class DatabaseInstance;
} // namespace duckdb

namespace remote_pager {

//===--------------------------------------------------------------------===//
// Main per-instance state container
// Inherits from ObjectCacheEntry for automatic cleanup when DatabaseInstance is destroyed
//===--------------------------------------------------------------------===//
struct RemotePagerInstanceState : public ObjectCacheEntry {
	// Builds the transport for a new facade.
	using RangeFetcherFactory = std::function<unique_ptr<BaseRangeFetcher>(const RemotePagerConfig &)>;

	static constexpr const char *OBJECT_TYPE = "RemotePagerInstanceState";
	static constexpr const char *CACHE_KEY = "remote_pager_instance_state";

	explicit RemotePagerInstanceState(optional_ptr<DatabaseInstance> instance_p = nullptr);

	// ObjectCacheEntry interface
	string GetObjectType() override {
		return OBJECT_TYPE;
	}

	static string ObjectType() {
		return OBJECT_TYPE;
	}

	optional_idx GetEstimatedCacheMemory() const override {
		return optional_idx {};
	}

	RemotePagerConfig GetConfig() const;

	// Apply [update] on a copy of the current config and validate it; on success it becomes the live config, and the
	// facade is rebuilt on next access. On failure the live config is left unchanged.
	void UpdateConfig(const std::function<void(RemotePagerConfig &)> &update);

	// Get the facade for the live config, build one if absent.
	// Sessions opened on a replaced facade keep it alive until they're closed.
	shared_ptr<QueryFacade> GetOrCreateFacade();

	// Get the facade if it has already been built, otherwise nullptr.
	shared_ptr<QueryFacade> GetFacadeIfExists() const;

	// Replace libcurl transport for facades built afterwards, used for testing.
	void SetRangeFetcherFactory(RangeFetcherFactory factory);

private:
	optional_ptr<DatabaseInstance> instance;

	mutable std::mutex mu;
	RemotePagerConfig config;
	shared_ptr<QueryFacade> facade;
	// Unset means libcurl.
	RangeFetcherFactory fetcher_factory;
};

//===--------------------------------------------------------------------===//
// Helper functions to access instance state
//===--------------------------------------------------------------------===//

// Store instance state in DatabaseInstance
void SetInstanceState(DatabaseInstance &instance, shared_ptr<RemotePagerInstanceState> state);

// Get instance state as shared_ptr from DatabaseInstance (returns nullptr if not set)
shared_ptr<RemotePagerInstanceState> GetInstanceStateShared(DatabaseInstance &instance);

// Get instance state, throwing if not found
RemotePagerInstanceState &GetInstanceStateOrThrow(DatabaseInstance &instance);

// Get instance state from ClientContext, throwing if not found
RemotePagerInstanceState &GetInstanceStateOrThrow(ClientContext &context);

} // namespace remote_pager
