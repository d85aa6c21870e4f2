#include "page_read_pool.hpp"

#include <utility>

#include "duckdb/common/assert.hpp"
#include "query_facade.hpp"
#include "thread_utils.hpp"

namespace remote_pager {

PageReadPool::PageReadPool(idx_t max_worker_count_p) : max_worker_count(max_worker_count_p) {
	D_ASSERT(max_worker_count > 0);
}

PageReadPool::~PageReadPool() noexcept {
	{
		const std::lock_guard<std::mutex> lck(mu);
		stopped = true;
	}
	new_job_cv.notify_all();
	for (auto &cur_worker : workers) {
		D_ASSERT(cur_worker.joinable());
		cur_worker.join();
	}
}

idx_t PageReadPool::GetWorkerCount() const {
	const std::lock_guard<std::mutex> lck(mu);
	return workers.size();
}

void PageReadPool::ReadPages(RemoteSession &session, const vector<PageReadChunk> &chunks) {
	if (chunks.empty()) {
		return;
	}

	ReadBatch batch;
	batch.pending_count = chunks.size();
	{
		const std::lock_guard<std::mutex> lck(mu);
		for (const auto &cur_chunk : chunks) {
			jobs.emplace_back(PageReadJob {.session = &session, .chunk = cur_chunk, .batch = &batch});
		}
		// Only spawn for jobs which idle workers can't pick up.
		const idx_t uncovered_job_count = jobs.size() > idle_worker_count ? jobs.size() - idle_worker_count : 0;
		const idx_t target_worker_count = MinValue<idx_t>(max_worker_count, workers.size() + uncovered_job_count);
		while (workers.size() < target_worker_count) {
			workers.emplace_back([this]() { WorkerLoop(); });
		}
	}
	new_job_cv.notify_all();

	// Jobs reference [batch] and the caller's buffer, so wait for all of them even on failure.
	std::unique_lock<std::mutex> batch_lck(batch.mu);
	batch.done_cv.wait(batch_lck, [&batch]() { return batch.pending_count == 0; });
	if (batch.first_error) {
		std::rethrow_exception(batch.first_error);
	}
}

void PageReadPool::WorkerLoop() {
	SetThreadName("RmtPgRdThd");
	for (;;) {
		PageReadJob cur_job;
		{
			std::unique_lock<std::mutex> lck(mu);
			++idle_worker_count;
			new_job_cv.wait(lck, [this]() { return !jobs.empty() || stopped; });
			--idle_worker_count;
			if (jobs.empty()) {
				return;
			}
			cur_job = std::move(jobs.front());
			jobs.pop_front();
		}

		// Execute job out of critical section.
		RunJob(cur_job);
	}
}

void PageReadPool::RunJob(const PageReadJob &job) {
	std::exception_ptr error;
	try {
		const auto page = job.session->ReadSharedPage(job.chunk.page_index);
		job.chunk.CopyPageToRequestedMemory(*page);
	} catch (...) {
		error = std::current_exception();
	}

	// Notify under lock, the waiter destroys [batch] as soon as it observes completion.
	auto &batch = *job.batch;
	const std::lock_guard<std::mutex> lck(batch.mu);
	if (error != nullptr && batch.first_error == nullptr) {
		batch.first_error = std::move(error);
	}
	D_ASSERT(batch.pending_count > 0);
	if (--batch.pending_count == 0) {
		batch.done_cv.notify_all();
	}
}

} // namespace remote_pager
