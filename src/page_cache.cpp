#include "page_cache.hpp"

#include <tuple>
#include <utility>

#include "duckdb/common/exception.hpp"
#include "duckdb/common/helper.hpp"
#include "duckdb/common/types/hash.hpp"

namespace remote_pager {

std::size_t PageKeyHash::operator()(const PageKey &key) const {
	return CombineHash(Hash(key.file_key.data(), key.file_key.length()), Hash(key.page_index));
}

bool operator<(const PageCacheEntryInfo &lhs, const PageCacheEntryInfo &rhs) {
	return std::tie(lhs.remote_filename, lhs.page_index) < std::tie(rhs.remote_filename, rhs.page_index);
}

PageCache::PageCache(idx_t max_cache_bytes_p) : max_cache_bytes(max_cache_bytes_p) {
	if (max_cache_bytes == 0) {
		throw InvalidInputException("Page cache requires a positive byte budget");
	}
}

uint64_t PageCache::GetGenerationLocked(const string &file_key) const {
	// Both counters only grow, so their sum changes whenever either of them changes.
	auto iter = file_generations.find(file_key);
	const uint64_t file_generation = iter == file_generations.end() ? 0 : iter->second;
	return global_generation + file_generation;
}

void PageCache::EraseLocked(unordered_map<PageKey, CacheEntry, PageKeyHash, PageKeyEqual>::iterator iter) {
	cached_bytes -= iter->second.page->length();
	lru_list.erase(iter->second.lru_iter);
	entries.erase(iter);
}

void PageCache::EraseInflightLocked(const PageKey &key, uint64_t generation) {
	// A newer fetch may have taken over the slot after invalidation, leave it alone.
	auto iter = inflight_fetches.find(key);
	if (iter != inflight_fetches.end() && iter->second.generation == generation) {
		inflight_fetches.erase(iter);
	}
}

void PageCache::InsertLocked(const PageKey &key, Page page) {
	auto existing = entries.find(key);
	if (existing != entries.end()) {
		EraseLocked(existing);
	}
	// Oversized page is still handed to caller, but never retained.
	if (page->length() > max_cache_bytes) {
		return;
	}

	lru_list.emplace_front(key);
	cached_bytes += page->length();
	entries.emplace(key, CacheEntry {.page = std::move(page), .lru_iter = lru_list.begin()});

	while (cached_bytes > max_cache_bytes) {
		D_ASSERT(!lru_list.empty());
		auto victim = entries.find(lru_list.back());
		D_ASSERT(victim != entries.end());
		EraseLocked(victim);
		++stats.eviction_count;
	}
}

PageCache::Page PageCache::GetPage(const PageKey &key, const PageLoader &loader) {
	std::promise<Page> promise;
	uint64_t generation = 0;
	{
		std::unique_lock<std::mutex> lck(mu);
		auto entry_iter = entries.find(key);
		if (entry_iter != entries.end()) {
			++stats.hit_count;
			lru_list.splice(lru_list.begin(), lru_list, entry_iter->second.lru_iter);
			return entry_iter->second.page;
		}

		generation = GetGenerationLocked(key.file_key);
		auto inflight_iter = inflight_fetches.find(key);
		// A fetch started before the last invalidation may return outdated bytes, only join a current one.
		if (inflight_iter != inflight_fetches.end() && inflight_iter->second.generation == generation) {
			++stats.coalesced_count;
			auto future = inflight_iter->second.future;
			lck.unlock();
			return future.get();
		}

		++stats.miss_count;
		inflight_fetches[key] = InflightFetch {.future = promise.get_future().share(), .generation = generation};
	}

	// Fetch out of critical section, so fetches for other pages proceed in parallel.
	Page page;
	try {
		page = make_shared_ptr<const string>(loader());
	} catch (...) {
		auto exception = std::current_exception();
		{
			const std::lock_guard<std::mutex> lck(mu);
			EraseInflightLocked(key, generation);
			++stats.fetch_failure_count;
		}
		// Waiters observe the same failure, later lookups issue a new fetch.
		promise.set_exception(exception);
		throw;
	}

	{
		const std::lock_guard<std::mutex> lck(mu);
		if (GetGenerationLocked(key.file_key) == generation) {
			InsertLocked(key, page);
		}
		EraseInflightLocked(key, generation);
	}
	promise.set_value(page);
	return page;
}

void PageCache::PutPage(const PageKey &key, string page) {
	auto shared_page = make_shared_ptr<const string>(std::move(page));
	const std::lock_guard<std::mutex> lck(mu);
	InsertLocked(key, std::move(shared_page));
}

void PageCache::Invalidate(const string &file_key) {
	const std::lock_guard<std::mutex> lck(mu);
	++file_generations[file_key];
	for (auto iter = entries.begin(); iter != entries.end();) {
		if (iter->first.file_key != file_key) {
			++iter;
			continue;
		}
		auto cur_iter = iter++;
		EraseLocked(cur_iter);
	}
}

void PageCache::Clear() {
	const std::lock_guard<std::mutex> lck(mu);
	++global_generation;
	entries.clear();
	lru_list.clear();
	cached_bytes = 0;
}

vector<PageCacheEntryInfo> PageCache::GetCacheEntriesInfo() const {
	const std::lock_guard<std::mutex> lck(mu);
	vector<PageCacheEntryInfo> entries_info;
	entries_info.reserve(entries.size());
	for (const auto &[key, entry] : entries) {
		entries_info.emplace_back(PageCacheEntryInfo {
		    .remote_filename = key.file_key,
		    .page_index = key.page_index,
		    .page_bytes = entry.page->length(),
		});
	}
	return entries_info;
}

PageCacheStats PageCache::GetStats() const {
	const std::lock_guard<std::mutex> lck(mu);
	auto cur_stats = stats;
	cur_stats.cached_page_count = entries.size();
	cur_stats.cached_bytes = cached_bytes;
	return cur_stats;
}

} // namespace remote_pager
