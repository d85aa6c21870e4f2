// Range fetcher backed by libcurl, which speaks plain HTTP(S) to static hosts.

#pragma once

#include "range_fetcher.hpp"

namespace remote_pager {

class CurlRangeFetcher final : public BaseRangeFetcher {
public:
	CurlRangeFetcher(FetchRetryPolicy retry_policy_p, idx_t request_timeout_millisec_p,
	                 optional_ptr<DatabaseInstance> instance_p = nullptr);
	~CurlRangeFetcher() override = default;

	string GetName() const override {
		return "curl_range_fetcher";
	}

protected:
	RangeFetchResult FetchRangeOnce(const RangeRequest &request) override;
	RangeFetchResult FetchAllOnce(const string &url) override;
	RemoteFileMetadata FetchMetadataOnce(const string &url) override;

private:
	idx_t request_timeout_millisec;
};

} // namespace remote_pager
