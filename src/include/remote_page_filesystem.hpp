// A read-only duckdb filesystem serving remote database files page by page.
//
// Paths look like `remote_pager://<key>`, where key is looked up in the routing index; `remote_pager://<url>` opens
// a file by its URL directly. Engine reads of arbitrary byte ranges are split into pages, which are fetched in
// parallel through the page cache.

#pragma once

#include "duckdb/common/file_system.hpp"
#include "duckdb/common/open_file_info.hpp"
#include "duckdb/common/optional_ptr.hpp"
#include "duckdb/common/shared_ptr.hpp"
#include "duckdb/common/unique_ptr.hpp"
#include "query_facade.hpp"
#include "remote_pager_common.hpp"

namespace remote_pager {

// Forward declaration.
struct RemotePagerInstanceState;

class RemotePageFileHandle : public FileHandle {
public:
	RemotePageFileHandle(FileSystem &fs, const string &path, FileOpenFlags flags, shared_ptr<QueryFacade> facade_p,
	                     unique_ptr<RemoteSession> session_p);
	~RemotePageFileHandle() override = default;

	// Nothing to release, remote files hold no per-handle resource.
	void Close() override {
	}

	RemoteSession &GetSession() {
		return *session;
	}
	QueryFacade &GetFacade() {
		return *facade;
	}

	// Offset for sequential reads.
	idx_t file_offset = 0;

private:
	// Keeps fetcher and page cache alive for the session, even if the facade is rebuilt by a setting update.
	shared_ptr<QueryFacade> facade;
	unique_ptr<RemoteSession> session;
};

class RemotePageFileSystem : public FileSystem {
public:
	explicit RemotePageFileSystem(weak_ptr<RemotePagerInstanceState> instance_state_p)
	    : instance_state(std::move(instance_state_p)) {
	}
	~RemotePageFileSystem() override = default;

	unique_ptr<FileHandle> OpenFile(const string &path, FileOpenFlags flags,
	                                optional_ptr<FileOpener> opener = nullptr) override;
	// Doesn't update file offset (which acts as `PRead` semantics).
	void Read(FileHandle &handle, void *buffer, int64_t nr_bytes, idx_t location) override;
	// Does update file offset (which acts as `Read` semantics).
	int64_t Read(FileHandle &handle, void *buffer, int64_t nr_bytes) override;
	int64_t GetFileSize(FileHandle &handle) override;
	timestamp_t GetLastModifiedTime(FileHandle &handle) override;
	string GetVersionTag(FileHandle &handle) override;
	bool FileExists(const string &filename, optional_ptr<FileOpener> opener = nullptr) override;
	vector<OpenFileInfo> Glob(const string &path, FileOpener *opener = nullptr) override;
	bool CanHandleFile(const string &fpath) override;
	void Seek(FileHandle &handle, idx_t location) override;
	idx_t SeekPosition(FileHandle &handle) override;
	bool CanSeek() override {
		return true;
	}
	bool OnDiskFile(FileHandle &handle) override {
		return false;
	}
	std::string GetName() const override {
		return "RemotePageFileSystem";
	}

	// Get the entity key or URL addressed by [path], with path prefix stripped.
	static string GetTarget(const string &path);

private:
	// Read from [location] on [nr_bytes] for the given [handle] into [buffer].
	// Return the actual number of bytes to read, which is clipped at end of file.
	int64_t ReadImpl(FileHandle &handle, void *buffer, int64_t nr_bytes, idx_t location);

	shared_ptr<QueryFacade> GetFacade();

	weak_ptr<RemotePagerInstanceState> instance_state;
};

} // namespace remote_pager
