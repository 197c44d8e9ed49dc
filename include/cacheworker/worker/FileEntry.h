#pragma once

#include "cacheworker/worker/FileSystem.h"

#include <cstdint>
#include <string>
#include <vector>

namespace cacheworker {
namespace worker {

// One element of the /files and /info JSON arrays.
struct FileEntry {
    std::string type; // "file" or "directory"
    std::string name;
    std::string logicalPath;
    std::string backingPath;
    std::int64_t lastModifiedMillis{0};
    std::int64_t lengthBytes{0};

    static FileEntry FromStatus(const FileStatus& status);

    std::string ToJson() const;
    static std::string ToJsonArray(const std::vector<FileEntry>& entries);
};

} // namespace worker
} // namespace cacheworker
