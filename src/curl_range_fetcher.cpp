#include "curl_range_fetcher.hpp"

#include <curl/curl.h>

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <mutex>

#include "duckdb/common/string_util.hpp"
#include "remote_pager_exception.hpp"
#include "remote_pager_logger.hpp"

namespace remote_pager {

namespace {

constexpr long HTTP_OK = 200;
constexpr long HTTP_PARTIAL_CONTENT = 206;
constexpr long HTTP_RANGE_NOT_SATISFIABLE = 416;
constexpr long HTTP_TOO_MANY_REQUESTS = 429;

std::once_flag curl_global_init_flag;

struct CurlEasyDeleter {
	void operator()(CURL *curl) const {
		curl_easy_cleanup(curl);
	}
};
struct CurlSlistDeleter {
	void operator()(curl_slist *list) const {
		curl_slist_free_all(list);
	}
};
using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

// State shared with curl callbacks for one transfer.
struct TransferState {
	CURL *curl = nullptr;
	string body;
	// Whether the transfer expects a 206; body of a full response is not downloaded then.
	bool expect_partial_content = false;
	// Set when write callback aborts the transfer because of an unexpected status.
	bool aborted_on_status = false;
	long status_code = 0;
};

size_t WriteCallback(char *ptr, size_t size, size_t nmemb, void *userdata) {
	auto *state = static_cast<TransferState *>(userdata);
	const size_t bytes = size * nmemb;
	if (state->expect_partial_content) {
		long status_code = 0;
		curl_easy_getinfo(state->curl, CURLINFO_RESPONSE_CODE, &status_code);
		// Server ignores range header and starts to send the whole file; abort instead of downloading it all.
		if (status_code != HTTP_PARTIAL_CONTENT) {
			state->aborted_on_status = true;
			state->status_code = status_code;
			return 0;
		}
	}
	state->body.append(ptr, bytes);
	return bytes;
}

void EnsureCurlGlobalInit() {
	std::call_once(curl_global_init_flag, []() {
		const CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
		if (res != CURLE_OK) {
			throw IOException("Failed to initialize libcurl: %s", curl_easy_strerror(res));
		}
	});
}

// Get the last value of the given response header, or empty string if absent.
string GetResponseHeader(CURL *curl, const char *name) {
	struct curl_header *header = nullptr;
	// Use -1 to select the last request, which is the one after redirects.
	if (curl_easy_header(curl, name, /*index=*/0, CURLH_HEADER, /*request=*/-1, &header) != CURLHE_OK ||
	    header == nullptr || header->value == nullptr) {
		return "";
	}
	return header->value;
}

// Span and total length carried by `Content-Range: bytes <start>-<end>/<total>`.
struct ContentRange {
	idx_t start_offset = 0;
	idx_t end_offset = 0;
	optional_idx file_size;
};

bool ParseContentRange(const string &header_value, ContentRange &content_range) {
	unsigned long long start = 0;
	unsigned long long end = 0;
	char total_str[32] = {0};
	if (std::sscanf(header_value.c_str(), "bytes %llu-%llu/%31s", &start, &end, total_str) != 3) {
		return false;
	}
	content_range.start_offset = start;
	content_range.end_offset = end;
	// Total size could be "*" when unknown.
	if (total_str[0] == '*') {
		return true;
	}
	char *total_end = nullptr;
	const unsigned long long total = std::strtoull(total_str, &total_end, /*base=*/10);
	if (total_end == total_str || *total_end != '\0') {
		return false;
	}
	content_range.file_size = static_cast<idx_t>(total);
	return true;
}

RemoteFileMetadata GetResponseMetadata(CURL *curl) {
	RemoteFileMetadata metadata;
	metadata.version_tag = GetResponseHeader(curl, "ETag");
	metadata.last_modified = GetResponseHeader(curl, "Last-Modified");
	return metadata;
}

// Throw for failed transfers and non-success status, which are common to all request kinds.
void CheckTransferResult(CURLcode res, long status_code, const string &url, const char *error_buffer) {
	if (res != CURLE_OK) {
		const string reason = error_buffer[0] != '\0' ? string(error_buffer) : string(curl_easy_strerror(res));
		throw RemotePageException(RemotePageErrorType::kUnreachable,
		                          StringUtil::Format("Request to %s failed: %s", url, reason));
	}
	if (status_code >= 500 || status_code == HTTP_TOO_MANY_REQUESTS) {
		throw RemotePageException(RemotePageErrorType::kServerError,
		                          StringUtil::Format("Request to %s failed with HTTP status %d", url, status_code));
	}
	if (status_code == HTTP_RANGE_NOT_SATISFIABLE) {
		throw RemotePageException(RemotePageErrorType::kRangeUnsatisfiable,
		                          StringUtil::Format("Request to %s got HTTP status 416", url));
	}
	// Resource is not there (or forbidden), which doesn't get better with retry.
	if (status_code >= 400) {
		throw RemotePageException(RemotePageErrorType::kUnreachable,
		                          StringUtil::Format("Request to %s failed with HTTP status %d", url, status_code),
		                          /*transient_p=*/false);
	}
}

// Create an easy handle with options shared by all requests.
CurlEasyPtr CreateEasyHandle(const string &url, idx_t request_timeout_millisec, char *error_buffer) {
	CurlEasyPtr curl {curl_easy_init()};
	if (curl == nullptr) {
		throw RemotePageException(RemotePageErrorType::kUnreachable,
		                          StringUtil::Format("Failed to create curl handle for %s", url));
	}
	error_buffer[0] = '\0';
	curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request_timeout_millisec));
	curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
	return curl;
}

} // namespace

CurlRangeFetcher::CurlRangeFetcher(FetchRetryPolicy retry_policy_p, idx_t request_timeout_millisec_p,
                                   optional_ptr<DatabaseInstance> instance_p)
    : BaseRangeFetcher(retry_policy_p, instance_p), request_timeout_millisec(request_timeout_millisec_p) {
	EnsureCurlGlobalInit();
}

RangeFetchResult CurlRangeFetcher::FetchRangeOnce(const RangeRequest &request) {
	char error_buffer[CURL_ERROR_SIZE];
	auto curl = CreateEasyHandle(request.url, request_timeout_millisec, error_buffer);

	const string range = StringUtil::Format("%llu-%llu", request.start_offset, request.end_offset);
	curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());

	CurlSlistPtr headers;
	if (!request.if_range.empty()) {
		const string if_range_header = StringUtil::Format("If-Range: %s", request.if_range);
		headers.reset(curl_slist_append(nullptr, if_range_header.c_str()));
		curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
	}

	TransferState state;
	state.curl = curl.get();
	state.expect_partial_content = true;
	curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
	curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &state);

	const CURLcode res = curl_easy_perform(curl.get());
	if (state.aborted_on_status) {
		if (state.status_code == HTTP_OK) {
			// With `If-Range`, a full response means the token doesn't match current file.
			if (!request.if_range.empty()) {
				throw RemotePageException(RemotePageErrorType::kStaleFile,
				                          StringUtil::Format("%s no longer matches version %s", request.url,
				                                             request.if_range));
			}
			throw RemotePageException(RemotePageErrorType::kRangeUnsupported,
			                          StringUtil::Format("%s replied full content to range request", request.url));
		}
		CheckTransferResult(CURLE_OK, state.status_code, request.url, error_buffer);
		throw RemotePageException(
		    RemotePageErrorType::kUnreachable,
		    StringUtil::Format("Range request to %s got unexpected HTTP status %d", request.url, state.status_code),
		    /*transient_p=*/false);
	}

	long status_code = 0;
	curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status_code);
	CheckTransferResult(res, status_code, request.url, error_buffer);
	// Empty 200 body never reaches write callback.
	if (status_code != HTTP_PARTIAL_CONTENT) {
		throw RemotePageException(RemotePageErrorType::kRangeUnsupported,
		                          StringUtil::Format("%s replied HTTP status %d to range request", request.url,
		                                             status_code));
	}

	RangeFetchResult result;
	result.metadata = GetResponseMetadata(curl.get());
	ContentRange content_range;
	if (!ParseContentRange(GetResponseHeader(curl.get(), "Content-Range"), content_range) ||
	    content_range.start_offset != request.start_offset) {
		throw RemotePageException(RemotePageErrorType::kRangeUnsatisfiable,
		                          StringUtil::Format("%s replied partial content not matching range %s", request.url,
		                                             range));
	}
	result.metadata.file_size = content_range.file_size;
	result.data = std::move(state.body);
	return result;
}

RangeFetchResult CurlRangeFetcher::FetchAllOnce(const string &url) {
	char error_buffer[CURL_ERROR_SIZE];
	auto curl = CreateEasyHandle(url, request_timeout_millisec, error_buffer);

	TransferState state;
	state.curl = curl.get();
	curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
	curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &state);

	const CURLcode res = curl_easy_perform(curl.get());
	long status_code = 0;
	curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status_code);
	CheckTransferResult(res, status_code, url, error_buffer);

	RangeFetchResult result;
	result.metadata = GetResponseMetadata(curl.get());
	result.metadata.file_size = state.body.length();
	result.data = std::move(state.body);
	REMOTE_PAGER_LOG_DEBUG(instance,
	                       StringUtil::Format("Downloaded %llu bytes from %s in full", result.data.length(), url));
	return result;
}

RemoteFileMetadata CurlRangeFetcher::FetchMetadataOnce(const string &url) {
	char error_buffer[CURL_ERROR_SIZE];
	auto curl = CreateEasyHandle(url, request_timeout_millisec, error_buffer);
	curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);

	const CURLcode res = curl_easy_perform(curl.get());
	long status_code = 0;
	curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status_code);
	CheckTransferResult(res, status_code, url, error_buffer);

	auto metadata = GetResponseMetadata(curl.get());
	curl_off_t content_length = -1;
	if (curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &content_length) == CURLE_OK &&
	    content_length >= 0) {
		metadata.file_size = static_cast<idx_t>(content_length);
	}
	return metadata;
}

} // namespace remote_pager
