#pragma once

#include "cacheworker/worker/FileSystem.h"
#include "cacheworker/worker/LoadService.h"
#include "cacheworker/worker/PagedService.h"

#include <algorithm>
#include <cstring>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// In-memory collaborators for handler tests.
namespace fakes {

using namespace cacheworker::worker;

class MemoryFileSystem : public FileSystem {
public:
    void AddFile(const std::string& path, const std::string& data, std::int64_t mtimeMs = 1000) {
        std::lock_guard<std::mutex> lock(mutex_);
        FileStatus st;
        st.isFolder = false;
        st.name = path.substr(path.find_last_of('/') + 1);
        st.path = path;
        st.ufsPath = "mem://" + path;
        st.lastModificationTimeMs = mtimeMs;
        st.length = static_cast<std::int64_t>(data.size());
        entries_[path] = st;
        data_[path] = data;
    }

    void AddDirectory(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        FileStatus st;
        st.isFolder = true;
        st.name = path.substr(path.find_last_of('/') + 1);
        st.path = path;
        st.ufsPath = "mem://" + path;
        entries_[path] = st;
    }

    // Every call touching path throws FileSystemError(message).
    void FailPath(const std::string& path, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[path] = message;
    }

    std::string Contents(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_[path];
    }

    void WriteAt(const std::string& path, std::int64_t offset, const std::string& bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string& data = data_[path];
        if (data.size() < static_cast<size_t>(offset) + bytes.size()) {
            data.resize(static_cast<size_t>(offset) + bytes.size());
        }
        data.replace(static_cast<size_t>(offset), bytes.size(), bytes);
        FileStatus& st = entries_[path];
        st.path = path;
        st.name = path.substr(path.find_last_of('/') + 1);
        st.ufsPath = "mem://" + path;
        st.length = static_cast<std::int64_t>(data.size());
    }

    std::vector<FileStatus> ListStatus(const std::string& path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const FileStatus& self = LookupLocked(path);
        if (!self.isFolder) {
            return {self};
        }
        std::vector<FileStatus> children;
        const std::string prefix = path == "/" ? "/" : path + "/";
        for (const auto& entry : entries_) {
            const std::string& p = entry.first;
            if (p.size() > prefix.size() && p.compare(0, prefix.size(), prefix) == 0 &&
                p.find('/', prefix.size()) == std::string::npos) {
                children.push_back(entry.second);
            }
        }
        return children;
    }

    FileStatus GetStatus(const std::string& path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return LookupLocked(path);
    }

    std::unique_ptr<PositionReader> OpenPositionRead(const std::string& path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        LookupLocked(path);
        return std::unique_ptr<PositionReader>(new Reader(this, path));
    }

private:
    class Reader : public PositionReader {
    public:
        Reader(MemoryFileSystem* fs, std::string path) : fs_(fs), path_(std::move(path)) {}
        std::int64_t Read(std::int64_t position, char* dst, std::int64_t length) override {
            std::lock_guard<std::mutex> lock(fs_->mutex_);
            const std::string& data = fs_->data_[path_];
            if (position >= static_cast<std::int64_t>(data.size())) {
                return length == 0 ? 0 : -1;
            }
            std::int64_t n = std::min<std::int64_t>(length, static_cast<std::int64_t>(data.size()) - position);
            std::memcpy(dst, data.data() + position, static_cast<size_t>(n));
            return n;
        }
    private:
        MemoryFileSystem* fs_;
        std::string path_;
    };

    const FileStatus& LookupLocked(const std::string& path) {
        auto f = failures_.find(path);
        if (f != failures_.end()) {
            throw FileSystemError(f->second);
        }
        auto it = entries_.find(path);
        if (it == entries_.end()) {
            throw FileNotFoundError(path);
        }
        return it->second;
    }

    std::mutex mutex_;
    std::map<std::string, FileStatus> entries_;
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string> failures_;
};

// Pages live in MemoryFileSystem files named /cache/<fileId>.
class MemoryPageStore : public PagedService {
public:
    enum class WriteMode { kStore, kDecline, kThrow };

    MemoryPageStore(MemoryFileSystem& fs, std::int64_t pageSize) : fs_(fs), pageSize_(pageSize) {}

    std::int64_t PageSize() const override { return pageSize_; }

    bool WritePage(const std::string& fileId, std::int64_t pageIndex, const std::string& data) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++writes_;
        if (mode_ == WriteMode::kDecline) return false;
        if (mode_ == WriteMode::kThrow) throw PageStoreError("store is read-only");
        fs_.WriteAt(BackingPath(fileId), pageIndex * pageSize_, data);
        pages_[std::make_pair(fileId, pageIndex)] = data;
        return true;
    }

    std::optional<PageLocation> LocatePage(const std::string& fileId, std::int64_t pageIndex) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pages_.count(std::make_pair(fileId, pageIndex)) == 0) {
            return std::nullopt;
        }
        return PageLocation{BackingPath(fileId), pageIndex * pageSize_};
    }

    std::optional<std::string> Page(const std::string& fileId, std::int64_t pageIndex) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pages_.find(std::make_pair(fileId, pageIndex));
        if (it == pages_.end()) return std::nullopt;
        return it->second;
    }

    size_t pageCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pages_.size();
    }

    int writes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_;
    }

    void setWriteMode(WriteMode mode) {
        std::lock_guard<std::mutex> lock(mutex_);
        mode_ = mode;
    }

    static std::string BackingPath(const std::string& fileId) { return "/cache/" + fileId; }

private:
    MemoryFileSystem& fs_;
    const std::int64_t pageSize_;
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::int64_t>, std::string> pages_;
    WriteMode mode_{WriteMode::kStore};
    int writes_{0};
};

class RecordingLoadService : public LoadService {
public:
    std::string Load(const std::string& path, const LoadOptions& options) override {
        if (fail) {
            throw FileSystemError("backend unreachable");
        }
        calls.emplace_back(path, options);
        return reply;
    }

    std::vector<std::pair<std::string, LoadOptions>> calls;
    std::string reply{"Load '/tmp/data' is successfully submitted."};
    bool fail{false};
};

} // namespace fakes
