#include "remote_page_filesystem.hpp"

#include <ctime>

#include "duckdb/common/string_util.hpp"
#include "duckdb/common/types/timestamp.hpp"
#include "page_utils.hpp"
#include "remote_pager_config.hpp"
#include "remote_pager_exception.hpp"
#include "remote_pager_instance_state.hpp"
#include "url_utils.hpp"

namespace remote_pager {

namespace {

// Parse an HTTP date like `Sun, 06 Nov 1994 08:49:37 GMT`; return epoch when unparseable.
timestamp_t ParseHttpDate(const string &http_date) {
	if (http_date.empty()) {
		return Timestamp::FromEpochSeconds(0);
	}
	std::tm tm = {};
	if (strptime(http_date.c_str(), "%a, %d %b %Y %H:%M:%S", &tm) == nullptr) {
		return Timestamp::FromEpochSeconds(0);
	}
	return Timestamp::FromEpochSeconds(static_cast<int64_t>(timegm(&tm)));
}

// Split the requested byte range into per-page copy instructions.
vector<PageReadChunk> SplitIntoPageReads(char *buffer, idx_t location, idx_t bytes_to_read, idx_t page_size) {
	const ReadRequestParams read_params {
	    .requested_start_offset = location,
	    .requested_bytes_to_read = bytes_to_read,
	    .page_size = page_size,
	};
	const auto alignment_info = CalculatePageAlignment(read_params);

	vector<PageReadChunk> chunks;
	chunks.reserve(alignment_info.page_count);
	const idx_t request_end = location + bytes_to_read;
	for (idx_t page_index = alignment_info.first_page_index; page_index <= alignment_info.last_page_index;
	     ++page_index) {
		const idx_t page_start = page_index * page_size;
		const idx_t copy_start = MaxValue<idx_t>(location, page_start);
		const idx_t copy_end = MinValue<idx_t>(request_end, page_start + page_size);

		PageReadChunk chunk;
		chunk.page_index = page_index;
		chunk.requested_start_addr = buffer + (copy_start - location);
		chunk.offset_in_page = copy_start - page_start;
		chunk.bytes_to_copy = copy_end - copy_start;
		chunks.emplace_back(chunk);
	}
	return chunks;
}

} // namespace

RemotePageFileHandle::RemotePageFileHandle(FileSystem &fs, const string &path, FileOpenFlags flags,
                                           shared_ptr<QueryFacade> facade_p, unique_ptr<RemoteSession> session_p)
    : FileHandle(fs, path, flags), facade(std::move(facade_p)), session(std::move(session_p)) {
}

string RemotePageFileSystem::GetTarget(const string &path) {
	const string prefix = REMOTE_PAGER_PATH_PREFIX;
	if (!StringUtil::StartsWith(path, prefix)) {
		throw InvalidInputException("Path %s is not served by remote pager, which expects prefix %s", path, prefix);
	}
	return path.substr(prefix.length());
}

shared_ptr<QueryFacade> RemotePageFileSystem::GetFacade() {
	auto state = instance_state.lock();
	if (state == nullptr) {
		throw InternalException("Remote pager instance state is no longer valid");
	}
	return state->GetOrCreateFacade();
}

unique_ptr<FileHandle> RemotePageFileSystem::OpenFile(const string &path, FileOpenFlags flags,
                                                      optional_ptr<FileOpener> opener) {
	if (flags.OpenForWriting()) {
		throw PermissionException("Remote pager file %s is read-only", path);
	}

	const string target = GetTarget(path);
	auto facade = GetFacade();
	// A target with scheme addresses a file directly, otherwise it's a key inside of routing index.
	auto session = URLUtils::HasScheme(target) ? facade->OpenUrl(target) : facade->Open(target);
	return make_uniq<RemotePageFileHandle>(*this, path, flags, std::move(facade), std::move(session));
}

void RemotePageFileSystem::Read(FileHandle &handle, void *buffer, int64_t nr_bytes, idx_t location) {
	ReadImpl(handle, buffer, nr_bytes, location);
}

int64_t RemotePageFileSystem::Read(FileHandle &handle, void *buffer, int64_t nr_bytes) {
	const idx_t offset = SeekPosition(handle);
	const int64_t bytes_read = ReadImpl(handle, buffer, nr_bytes, offset);
	Seek(handle, offset + bytes_read);
	return bytes_read;
}

int64_t RemotePageFileSystem::ReadImpl(FileHandle &handle, void *buffer, int64_t nr_bytes, idx_t location) {
	auto &remote_handle = handle.Cast<RemotePageFileHandle>();
	auto &session = remote_handle.GetSession();
	const idx_t file_size = session.GetFileSize();

	// No more bytes to read.
	if (nr_bytes <= 0 || location >= file_size) {
		return 0;
	}

	const idx_t bytes_to_read = MinValue<idx_t>(static_cast<idx_t>(nr_bytes), file_size - location);
	auto chunks = SplitIntoPageReads(static_cast<char *>(buffer), location, bytes_to_read, session.GetPageSize());

	// Single page read happens on the calling thread.
	if (chunks.size() == 1) {
		const auto page = session.ReadSharedPage(chunks[0].page_index);
		chunks[0].CopyPageToRequestedMemory(*page);
		return static_cast<int64_t>(bytes_to_read);
	}

	remote_handle.GetFacade().GetPageReadPool().ReadPages(session, chunks);
	return static_cast<int64_t>(bytes_to_read);
}

int64_t RemotePageFileSystem::GetFileSize(FileHandle &handle) {
	auto &remote_handle = handle.Cast<RemotePageFileHandle>();
	return static_cast<int64_t>(remote_handle.GetSession().GetFileSize());
}

timestamp_t RemotePageFileSystem::GetLastModifiedTime(FileHandle &handle) {
	auto &remote_handle = handle.Cast<RemotePageFileHandle>();
	return ParseHttpDate(remote_handle.GetSession().GetHandle().GetIdentity().last_modified);
}

string RemotePageFileSystem::GetVersionTag(FileHandle &handle) {
	auto &remote_handle = handle.Cast<RemotePageFileHandle>();
	return remote_handle.GetSession().GetHandle().GetIdentity().version_tag;
}

bool RemotePageFileSystem::FileExists(const string &filename, optional_ptr<FileOpener> opener) {
	const string target = GetTarget(filename);
	// Direct URL access is only checked at open time.
	if (URLUtils::HasScheme(target)) {
		return true;
	}
	auto facade = GetFacade();
	return facade->GetRouter().Contains(target);
}

vector<OpenFileInfo> RemotePageFileSystem::Glob(const string &path, FileOpener *opener) {
	if (FileSystem::HasGlob(path)) {
		throw NotImplementedException("Glob pattern is not supported for remote pager path %s", path);
	}
	vector<OpenFileInfo> open_file_info;
	open_file_info.emplace_back(path);
	return open_file_info;
}

bool RemotePageFileSystem::CanHandleFile(const string &fpath) {
	return StringUtil::StartsWith(fpath, REMOTE_PAGER_PATH_PREFIX);
}

void RemotePageFileSystem::Seek(FileHandle &handle, idx_t location) {
	auto &remote_handle = handle.Cast<RemotePageFileHandle>();
	remote_handle.file_offset = location;
}

idx_t RemotePageFileSystem::SeekPosition(FileHandle &handle) {
	auto &remote_handle = handle.Cast<RemotePageFileHandle>();
	return remote_handle.file_offset;
}

} // namespace remote_pager
