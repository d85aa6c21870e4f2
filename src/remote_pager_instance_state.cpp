#include "remote_pager_instance_state.hpp"

#include "duckdb/main/client_context.hpp"
#include "duckdb/main/database.hpp"
#include "remote_pager_logger.hpp"

namespace remote_pager {

RemotePagerInstanceState::RemotePagerInstanceState(optional_ptr<DatabaseInstance> instance_p) : instance(instance_p) {
}

RemotePagerConfig RemotePagerInstanceState::GetConfig() const {
	const std::lock_guard<std::mutex> lck(mu);
	return config;
}

void RemotePagerInstanceState::UpdateConfig(const std::function<void(RemotePagerConfig &)> &update) {
	const std::lock_guard<std::mutex> lck(mu);
	auto new_config = config;
	update(new_config);
	new_config.Validate();
	config = std::move(new_config);
	if (facade != nullptr) {
		REMOTE_PAGER_LOG_DEBUG(instance, "Remote pager config updated, drop current facade and its page cache.");
	}
	facade = nullptr;
}

shared_ptr<QueryFacade> RemotePagerInstanceState::GetOrCreateFacade() {
	const std::lock_guard<std::mutex> lck(mu);
	if (facade != nullptr) {
		return facade;
	}
	if (fetcher_factory) {
		facade = make_shared_ptr<QueryFacade>(config, fetcher_factory(config), instance);
	} else {
		facade = make_shared_ptr<QueryFacade>(config, instance);
	}
	return facade;
}

shared_ptr<QueryFacade> RemotePagerInstanceState::GetFacadeIfExists() const {
	const std::lock_guard<std::mutex> lck(mu);
	return facade;
}

void RemotePagerInstanceState::SetRangeFetcherFactory(RangeFetcherFactory factory) {
	const std::lock_guard<std::mutex> lck(mu);
	fetcher_factory = std::move(factory);
	facade = nullptr;
}

//===--------------------------------------------------------------------===//
// Instance state access helpers
//===--------------------------------------------------------------------===//

void SetInstanceState(DatabaseInstance &instance, shared_ptr<RemotePagerInstanceState> state) {
	instance.GetObjectCache().Put(RemotePagerInstanceState::CACHE_KEY, std::move(state));
}

shared_ptr<RemotePagerInstanceState> GetInstanceStateShared(DatabaseInstance &instance) {
	return instance.GetObjectCache().Get<RemotePagerInstanceState>(RemotePagerInstanceState::CACHE_KEY);
}

RemotePagerInstanceState &GetInstanceStateOrThrow(DatabaseInstance &instance) {
	auto state = GetInstanceStateShared(instance);
	if (state == nullptr) {
		throw InternalException("remote_pager instance state not found - extension not properly loaded");
	}
	// Object cache holds the state for the lifetime of database instance.
	return *state;
}

RemotePagerInstanceState &GetInstanceStateOrThrow(ClientContext &context) {
	return GetInstanceStateOrThrow(*context.db);
}

} // namespace remote_pager
