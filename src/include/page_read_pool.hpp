// Worker pool which serves engine reads spanning multiple pages, shared by all reads going through one facade.

#pragma once

#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>

#include "page_utils.hpp"
#include "remote_pager_common.hpp"

namespace remote_pager {

class RemoteSession;

class PageReadPool {
public:
	// Workers are spawned on demand, at most [max_worker_count_p] of them.
	explicit PageReadPool(idx_t max_worker_count_p);

	PageReadPool(const PageReadPool &) = delete;
	PageReadPool &operator=(const PageReadPool &) = delete;

	// Join all workers; pending page reads are served before exit.
	~PageReadPool() noexcept;

	// Read every page in [chunks] from [session] and copy it into the caller's buffer.
	// Block until all page reads settle, then rethrow the first failure if any.
	void ReadPages(RemoteSession &session, const vector<PageReadChunk> &chunks);

	// Number of workers spawned so far.
	idx_t GetWorkerCount() const;

	idx_t GetMaxWorkerCount() const {
		return max_worker_count;
	}

private:
	// Completion state of one [ReadPages] call, lives on the caller's stack.
	struct ReadBatch {
		std::mutex mu;
		std::condition_variable done_cv;
		idx_t pending_count = 0;
		std::exception_ptr first_error;
	};

	struct PageReadJob {
		RemoteSession *session = nullptr;
		PageReadChunk chunk;
		ReadBatch *batch = nullptr;
	};

	void WorkerLoop();
	static void RunJob(const PageReadJob &job);

	const idx_t max_worker_count;

	mutable std::mutex mu;
	std::condition_variable new_job_cv;
	std::deque<PageReadJob> jobs;
	vector<std::thread> workers;
	idx_t idle_worker_count = 0;
	bool stopped = false;
};

} // namespace remote_pager
