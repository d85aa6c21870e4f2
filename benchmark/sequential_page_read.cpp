// Benchmark sequential read of a remote database file through the page cache, first uncached then cached.
//
// Usage: sequential_page_read <url> [page-size]

#include <chrono>
#include <csignal>
#include <iostream>

#include "query_facade.hpp"
#include "remote_pager_config.hpp"

namespace remote_pager {

namespace {

void TestSequentialRead(QueryFacade &facade, const string &url) {
	auto session = facade.OpenUrl(url);
	const idx_t page_count = session->GetPageCount();

	auto read_sequential = [&]() {
		idx_t bytes_read = 0;
		const auto now = std::chrono::steady_clock::now();
		for (idx_t page_index = 0; page_index < page_count; ++page_index) {
			bytes_read += session->ReadSharedPage(page_index)->length();
		}
		const auto end = std::chrono::steady_clock::now();
		const auto duration_sec = std::chrono::duration_cast<std::chrono::duration<double>>(end - now).count();
		std::cout << "Sequential read of " << bytes_read << " bytes in " << session->GetPageSize()
		          << "-byte pages takes " << duration_sec << " seconds" << std::endl;
	};

	std::cout << "--------------------- Performing uncached read ---------------------" << std::endl;
	read_sequential();
	std::cout << "--------------------- Performing cached read ---------------------" << std::endl;
	read_sequential();

	const auto stats = facade.GetPageCache().GetStats();
	std::cout << "Cache hit " << stats.hit_count << ", miss " << stats.miss_count << ", eviction "
	          << stats.eviction_count << ", remote requests " << facade.GetFetcher().GetRequestCount() << std::endl;
}

} // namespace

} // namespace remote_pager

int main(int argc, char **argv) {
	std::signal(SIGPIPE, SIG_IGN);
	if (argc < 2) {
		std::cerr << "Usage: " << argv[0] << " <url> [page-size]" << std::endl;
		return 1;
	}

	remote_pager::RemotePagerConfig config;
	if (argc >= 3) {
		config.page_size = std::stoull(argv[2]);
	}
	// Keep the whole file resident, so the second pass is served from memory.
	config.max_cache_bytes = 4ULL * 1024 * 1024 * 1024;

	try {
		remote_pager::QueryFacade facade {config};
		remote_pager::TestSequentialRead(facade, argv[1]);
	} catch (const std::exception &ex) {
		std::cerr << "Benchmark failed: " << ex.what() << std::endl;
		return 1;
	}
	return 0;
}
