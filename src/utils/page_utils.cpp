#include "page_utils.hpp"

#include <cstring>

#include "duckdb/common/exception.hpp"
#include "duckdb/common/helper.hpp"

namespace remote_pager {

PageAlignmentInfo CalculatePageAlignment(const ReadRequestParams &params) {
	D_ASSERT(params.requested_bytes_to_read > 0);
	const idx_t first_page_index = params.requested_start_offset / params.page_size;
	const idx_t last_page_index = (params.requested_start_offset + params.requested_bytes_to_read - 1) / params.page_size;
	return PageAlignmentInfo {
	    .first_page_index = first_page_index,
	    .last_page_index = last_page_index,
	    .page_count = last_page_index - first_page_index + 1,
	};
}

idx_t GetPageCount(idx_t file_size, idx_t page_size) {
	return (file_size + page_size - 1) / page_size;
}

PageSpan GetPageSpan(idx_t page_index, idx_t page_size, idx_t file_size) {
	const idx_t start_offset = page_index * page_size;
	D_ASSERT(start_offset < file_size);
	const idx_t end_offset = MinValue<idx_t>(start_offset + page_size, file_size) - 1;
	return PageSpan {
	    .start_offset = start_offset,
	    .end_offset = end_offset,
	};
}

void PageReadChunk::CopyPageToRequestedMemory(const string &page) const {
	if (offset_in_page + bytes_to_copy > page.length()) {
		throw InternalException("Page %llu holds %llu bytes, cannot copy %llu bytes from offset %llu", page_index,
		                        page.length(), bytes_to_copy, offset_in_page);
	}
	std::memcpy(requested_start_addr, page.data() + offset_in_page, bytes_to_copy);
}

} // namespace remote_pager
