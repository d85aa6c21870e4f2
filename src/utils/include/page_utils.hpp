// Utility functions for splitting byte-range reads into page reads.

#pragma once

#include "remote_pager_common.hpp"

namespace remote_pager {

// Parameters for a read request.
struct ReadRequestParams {
	// The start offset of the read request.
	idx_t requested_start_offset;
	// The number of bytes to read, should be positive.
	idx_t requested_bytes_to_read;
	// Page size of the file.
	idx_t page_size;
};

// Page alignment information for a read request.
struct PageAlignmentInfo {
	// Index of the first page which contains requested data.
	idx_t first_page_index;
	// Index of the last page which contains requested data.
	idx_t last_page_index;
	// Number of pages needed to fulfill the request.
	idx_t page_count;
};

// Calculate page alignment information for a read request.
PageAlignmentInfo CalculatePageAlignment(const ReadRequestParams &params);

// Get the number of pages for a file of [file_size] bytes.
idx_t GetPageCount(idx_t file_size, idx_t page_size);

// Byte span covered by a page, [start_offset, end_offset] both inclusive.
struct PageSpan {
	idx_t start_offset;
	idx_t end_offset;

	idx_t GetLength() const {
		return end_offset - start_offset + 1;
	}
};

// Get the byte span of the given page; caller guarantees [page_index] is within the file.
PageSpan GetPageSpan(idx_t page_index, idx_t page_size, idx_t file_size);

// All read requests are split into page reads, and executed in parallel.
// A [PageReadChunk] represents one page read and the part of the page which goes into the caller's buffer.
struct PageReadChunk {
	idx_t page_index = 0;
	// Memory address to copy to.
	char *requested_start_addr = nullptr;
	// Offset inside of the page where copy starts.
	idx_t offset_in_page = 0;
	// Number of bytes to copy from the page to [requested_start_addr].
	idx_t bytes_to_copy = 0;

	// Copy from [page] to application-provided buffer.
	void CopyPageToRequestedMemory(const string &page) const;
};

} // namespace remote_pager
