#include "cacheworker/worker/LocalFileSystem.h"
#include "cacheworker/common/Logger.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace cacheworker {
namespace worker {

namespace {

std::string ErrnoMessage(const std::string& what, const std::string& path, int err) {
    return what + " " + path + ": " + std::strerror(err);
}

FileStatus MakeStatus(const std::string& logicalPath, const std::string& localPath, const struct stat& st) {
    FileStatus status;
    status.isFolder = S_ISDIR(st.st_mode);
    size_t slash = logicalPath.find_last_of('/');
    status.name = slash == std::string::npos ? logicalPath : logicalPath.substr(slash + 1);
    status.path = logicalPath;
    status.ufsPath = localPath;
    status.lastModificationTimeMs = static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1000 +
                                    st.st_mtim.tv_nsec / 1000000;
    status.length = status.isFolder ? 0 : static_cast<std::int64_t>(st.st_size);
    return status;
}

struct stat StatOrThrow(const std::string& logicalPath, const std::string& localPath) {
    struct stat st;
    if (::stat(localPath.c_str(), &st) != 0) {
        int err = errno;
        if (err == ENOENT || err == ENOTDIR) {
            throw FileNotFoundError(logicalPath);
        }
        throw FileSystemError(ErrnoMessage("stat", logicalPath, err));
    }
    return st;
}

class LocalPositionReader : public PositionReader {
public:
    LocalPositionReader(int fd, std::string path)
        : fd_(fd), path_(std::move(path)) {}

    ~LocalPositionReader() override {
        ::close(fd_);
    }

    std::int64_t Read(std::int64_t position, char* dst, std::int64_t length) override {
        if (position < 0 || length < 0) {
            throw FileSystemError("Invalid read range on " + path_);
        }
        if (length == 0) {
            return 0;
        }
        std::int64_t total = 0;
        while (total < length) {
            ssize_t n = ::pread(fd_, dst + total, static_cast<size_t>(length - total),
                                static_cast<off_t>(position + total));
            if (n < 0) {
                if (errno == EINTR) continue;
                throw FileSystemError(ErrnoMessage("pread", path_, errno));
            }
            if (n == 0) {
                break;
            }
            total += n;
        }
        return total == 0 ? -1 : total;
    }

private:
    int fd_;
    std::string path_;
};

} // namespace

LocalFileSystem::LocalFileSystem(const std::string& root)
    : root_(root) {
    while (root_.size() > 1 && root_.back() == '/') {
        root_.pop_back();
    }
    if (root_ == "/") {
        root_.clear();
    }
}

std::string LocalFileSystem::Normalize(const std::string& path) {
    std::string out;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string::npos) slash = path.size();
        std::string segment = path.substr(pos, slash - pos);
        if (segment == "..") {
            throw FileSystemError("Invalid path (contains ..): " + path);
        }
        if (!segment.empty() && segment != ".") {
            out += "/" + segment;
        }
        pos = slash + 1;
    }
    return out.empty() ? "/" : out;
}

std::string LocalFileSystem::Resolve(const std::string& path) const {
    std::string normalized = Normalize(path);
    if (normalized == "/") {
        return root_.empty() ? "/" : root_;
    }
    return root_ + normalized;
}

std::vector<FileStatus> LocalFileSystem::ListStatus(const std::string& path) {
    const std::string logical = Normalize(path);
    const std::string local = Resolve(path);
    struct stat st = StatOrThrow(logical, local);

    std::vector<FileStatus> result;
    if (!S_ISDIR(st.st_mode)) {
        result.push_back(MakeStatus(logical, local, st));
        return result;
    }

    DIR* dir = ::opendir(local.c_str());
    if (dir == nullptr) {
        throw FileSystemError(ErrnoMessage("opendir", logical, errno));
    }
    while (struct dirent* ent = ::readdir(dir)) {
        std::string name = ent->d_name;
        if (name == "." || name == "..") {
            continue;
        }
        std::string childLogical = (logical == "/" ? "" : logical) + "/" + name;
        std::string childLocal = (local == "/" ? "" : local) + "/" + name;
        struct stat childSt;
        if (::lstat(childLocal.c_str(), &childSt) != 0) {
            LOG_DEBUG << "LocalFileSystem: skipping " << childLocal << " errno=" << errno;
            continue;
        }
        if (S_ISLNK(childSt.st_mode) && ::stat(childLocal.c_str(), &childSt) != 0) {
            continue;
        }
        result.push_back(MakeStatus(childLogical, childLocal, childSt));
    }
    ::closedir(dir);

    std::sort(result.begin(), result.end(), [](const FileStatus& a, const FileStatus& b) {
        return a.name < b.name;
    });
    return result;
}

FileStatus LocalFileSystem::GetStatus(const std::string& path) {
    const std::string logical = Normalize(path);
    const std::string local = Resolve(path);
    return MakeStatus(logical, local, StatOrThrow(logical, local));
}

std::unique_ptr<PositionReader> LocalFileSystem::OpenPositionRead(const std::string& path) {
    const std::string logical = Normalize(path);
    const std::string local = Resolve(path);
    int fd = ::open(local.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        if (err == ENOENT || err == ENOTDIR) {
            throw FileNotFoundError(logical);
        }
        throw FileSystemError(ErrnoMessage("open", logical, err));
    }
    return std::unique_ptr<PositionReader>(new LocalPositionReader(fd, logical));
}

} // namespace worker
} // namespace cacheworker
