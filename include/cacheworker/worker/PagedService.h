#pragma once

#include "cacheworker/worker/FileSystem.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace cacheworker {
namespace worker {

class PageStoreError : public std::runtime_error {
public:
    explicit PageStoreError(const std::string& message)
        : std::runtime_error(message) {}
};

// Where a cached page lives: byte baseOffset of backingPath in source, or in
// the worker's FileSystem when source is null.
struct PageLocation {
    std::string backingPath;
    std::int64_t baseOffset{0};
    std::shared_ptr<FileSystem> source;
};

// Paged cache engine. Implementations must be thread safe.
class PagedService {
public:
    virtual ~PagedService() = default;

    virtual std::int64_t PageSize() const = 0;

    // false when the store declined or failed the write; PageStoreError for
    // an invalid page address or oversized page.
    virtual bool WritePage(const std::string& fileId, std::int64_t pageIndex, const std::string& data) = 0;

    // nullopt when the page is not cached.
    virtual std::optional<PageLocation> LocatePage(const std::string& fileId, std::int64_t pageIndex) const = 0;
};

} // namespace worker
} // namespace cacheworker
