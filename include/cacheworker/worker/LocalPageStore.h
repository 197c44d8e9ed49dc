#pragma once

#include "cacheworker/worker/PagedService.h"

#include <memory>
#include <string>

namespace cacheworker {
namespace worker {

// One file per file id under root; page i occupies [i * pageSize, (i + 1) * pageSize).
// Located pages name "/<fileId>" in a LocalFileSystem rooted at root.
class LocalPageStore : public PagedService {
public:
    // Creates root if needed; throws PageStoreError when it cannot.
    LocalPageStore(const std::string& root, std::int64_t pageSize);

    std::int64_t PageSize() const override { return pageSize_; }
    bool WritePage(const std::string& fileId, std::int64_t pageIndex, const std::string& data) override;
    std::optional<PageLocation> LocatePage(const std::string& fileId, std::int64_t pageIndex) const override;

    const std::string& root() const { return root_; }

    static bool IsValidFileId(const std::string& fileId);

private:
    std::string PathFor(const std::string& fileId) const { return root_ + "/" + fileId; }
    // Byte offset of a page, or -1 when it is not addressable.
    std::int64_t PageBase(std::int64_t pageIndex) const;

    std::string root_;
    std::int64_t pageSize_;
    std::shared_ptr<FileSystem> files_;
};

} // namespace worker
} // namespace cacheworker
