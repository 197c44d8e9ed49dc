#include "cacheworker/worker/LocalPageStore.h"
#include "cacheworker/common/Logger.h"
#include "cacheworker/worker/LocalFileSystem.h"

#include <cerrno>
#include <cstring>
#include <limits>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace cacheworker {
namespace worker {

namespace {

// mkdir -p
bool MakeDirs(const std::string& path) {
    std::string partial;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string::npos) slash = path.size();
        partial = path.substr(0, slash);
        if (!partial.empty() && ::mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
            return false;
        }
        pos = slash + 1;
    }
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

} // namespace

LocalPageStore::LocalPageStore(const std::string& root, std::int64_t pageSize)
    : root_(root),
      pageSize_(pageSize) {
    while (root_.size() > 1 && root_.back() == '/') {
        root_.pop_back();
    }
    if (pageSize_ <= 0) {
        throw PageStoreError("page size must be positive, got " + std::to_string(pageSize_));
    }
    if (!MakeDirs(root_)) {
        throw PageStoreError("cannot create page store root " + root_ + ": " + std::strerror(errno));
    }
    files_ = std::make_shared<LocalFileSystem>(root_);
    LOG_INFO << "LocalPageStore: root=" << root_ << " page_size=" << pageSize_;
}

bool LocalPageStore::IsValidFileId(const std::string& fileId) {
    return !fileId.empty() &&
           fileId != "." &&
           fileId.find('/') == std::string::npos &&
           fileId.find("..") == std::string::npos;
}

std::int64_t LocalPageStore::PageBase(std::int64_t pageIndex) const {
    if (pageIndex < 0 || pageIndex > std::numeric_limits<std::int64_t>::max() / pageSize_) {
        return -1;
    }
    return pageIndex * pageSize_;
}

bool LocalPageStore::WritePage(const std::string& fileId, std::int64_t pageIndex, const std::string& data) {
    if (!IsValidFileId(fileId)) {
        throw PageStoreError("invalid file id '" + fileId + "'");
    }
    if (pageIndex < 0) {
        throw PageStoreError("negative page index " + std::to_string(pageIndex));
    }
    if (static_cast<std::int64_t>(data.size()) > pageSize_) {
        throw PageStoreError("page of " + std::to_string(data.size()) + " bytes exceeds page size " +
                             std::to_string(pageSize_));
    }
    const std::int64_t base = PageBase(pageIndex);
    if (base < 0 || static_cast<std::int64_t>(data.size()) > std::numeric_limits<std::int64_t>::max() - base) {
        throw PageStoreError("page index " + std::to_string(pageIndex) + " is out of range");
    }

    const std::string path = PathFor(fileId);
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        LOG_ERROR << "LocalPageStore: open " << path << " failed: " << std::strerror(errno);
        return false;
    }
    size_t written = 0;
    bool ok = true;
    while (written < data.size()) {
        ssize_t n = ::pwrite(fd, data.data() + written, data.size() - written,
                             static_cast<off_t>(base) + static_cast<off_t>(written));
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR << "LocalPageStore: pwrite " << path << " failed: " << std::strerror(errno);
            ok = false;
            break;
        }
        written += static_cast<size_t>(n);
    }
    ::close(fd);
    return ok;
}

std::optional<PageLocation> LocalPageStore::LocatePage(const std::string& fileId, std::int64_t pageIndex) const {
    const std::int64_t base = PageBase(pageIndex);
    if (!IsValidFileId(fileId) || base < 0) {
        return std::nullopt;
    }
    struct stat st;
    if (::stat(PathFor(fileId).c_str(), &st) != 0) {
        return std::nullopt;
    }
    if (static_cast<std::int64_t>(st.st_size) <= base) {
        return std::nullopt;
    }
    return PageLocation{"/" + fileId, base, files_};
}

} // namespace worker
} // namespace cacheworker
