#include "cacheworker/worker/FileEntry.h"
#include "cacheworker/common/Json.h"

#include <sstream>

namespace cacheworker {
namespace worker {

FileEntry FileEntry::FromStatus(const FileStatus& status) {
    FileEntry entry;
    entry.type = status.isFolder ? "directory" : "file";
    entry.name = status.name;
    entry.logicalPath = status.path;
    entry.backingPath = status.ufsPath;
    entry.lastModifiedMillis = status.lastModificationTimeMs;
    entry.lengthBytes = status.length;
    return entry;
}

std::string FileEntry::ToJson() const {
    using common::JsonString;
    std::ostringstream ss;
    ss << "{\"type\":" << JsonString(type)
       << ",\"name\":" << JsonString(name)
       << ",\"logicalPath\":" << JsonString(logicalPath)
       << ",\"backingPath\":" << JsonString(backingPath)
       << ",\"lastModifiedMillis\":" << lastModifiedMillis
       << ",\"lengthBytes\":" << lengthBytes
       << "}";
    return ss.str();
}

std::string FileEntry::ToJsonArray(const std::vector<FileEntry>& entries) {
    std::string out = "[";
    for (size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) out += ",";
        out += entries[i].ToJson();
    }
    out += "]";
    return out;
}

} // namespace worker
} // namespace cacheworker
