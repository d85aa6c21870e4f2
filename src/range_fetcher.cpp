#include "range_fetcher.hpp"

#include <chrono>
#include <thread>

#include "remote_pager_exception.hpp"
#include "remote_pager_logger.hpp"

namespace remote_pager {

FetchRetryPolicy GetFetchRetryPolicy(const RemotePagerConfig &config) {
	return FetchRetryPolicy {
	    .max_attempts = config.max_fetch_attempts,
	    .initial_backoff_millisec = config.initial_backoff_millisec,
	    .max_backoff_millisec = config.max_backoff_millisec,
	};
}

BaseRangeFetcher::BaseRangeFetcher(FetchRetryPolicy retry_policy_p, optional_ptr<DatabaseInstance> instance_p)
    : instance(instance_p), retry_policy(retry_policy_p) {
	if (retry_policy.max_attempts == 0) {
		throw InvalidInputException("Range fetcher requires at least one attempt");
	}
}

void BaseRangeFetcher::SleepForBackoff(idx_t backoff_millisec) {
	std::this_thread::sleep_for(std::chrono::milliseconds(backoff_millisec));
}

template <typename Fn>
auto BaseRangeFetcher::RunWithRetry(const string &url, Fn &&fn) -> decltype(fn()) {
	idx_t backoff_millisec = retry_policy.initial_backoff_millisec;
	for (idx_t attempt = 1;; ++attempt) {
		++request_count;
		try {
			return fn();
		} catch (RemotePageException &ex) {
			if (!ex.IsTransient() || attempt >= retry_policy.max_attempts) {
				throw;
			}
			REMOTE_PAGER_LOG_WARN(instance, StringUtil::Format("Attempt %llu/%llu for %s failed, retry in %llu ms: %s",
			                                                   attempt, retry_policy.max_attempts, url,
			                                                   backoff_millisec, ex.what()));
		}
		SleepForBackoff(backoff_millisec);
		backoff_millisec = MinValue<idx_t>(backoff_millisec * 2, retry_policy.max_backoff_millisec);
	}
}

RangeFetchResult BaseRangeFetcher::FetchRange(const RangeRequest &request) {
	if (request.end_offset < request.start_offset) {
		throw InternalException("Invalid range [%llu, %llu] for %s", request.start_offset, request.end_offset,
		                        request.url);
	}
	auto result = RunWithRetry(request.url, [this, &request]() { return FetchRangeOnce(request); });

	// Servers clip ranges which go beyond end of file.
	idx_t expected_length = request.GetLength();
	const auto &file_size = result.metadata.file_size;
	if (file_size.IsValid() && request.end_offset >= file_size.GetIndex() &&
	    request.start_offset < file_size.GetIndex()) {
		expected_length = file_size.GetIndex() - request.start_offset;
	}
	if (result.data.length() != expected_length) {
		throw RemotePageException(RemotePageErrorType::kRangeUnsatisfiable,
		                          StringUtil::Format("Requested %llu bytes at offset %llu from %s, but got %llu bytes",
		                                             expected_length, request.start_offset, request.url,
		                                             result.data.length()));
	}
	return result;
}

RangeFetchResult BaseRangeFetcher::FetchAll(const string &url) {
	return RunWithRetry(url, [this, &url]() { return FetchAllOnce(url); });
}

RemoteFileMetadata BaseRangeFetcher::FetchMetadata(const string &url) {
	return RunWithRetry(url, [this, &url]() { return FetchMetadataOnce(url); });
}

} // namespace remote_pager
