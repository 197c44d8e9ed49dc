#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace cacheworker {
namespace worker {

class FileSystemError : public std::runtime_error {
public:
    explicit FileSystemError(const std::string& message)
        : std::runtime_error(message) {}
};

class FileNotFoundError : public FileSystemError {
public:
    explicit FileNotFoundError(const std::string& path)
        : FileSystemError("Path does not exist: " + path) {}
};

struct FileStatus {
    bool isFolder{false};
    std::string name;
    // Path in the worker's logical namespace.
    std::string path;
    // Location in the backing store.
    std::string ufsPath;
    std::int64_t lastModificationTimeMs{0};
    std::int64_t length{0};
};

class PositionReader {
public:
    virtual ~PositionReader() = default;

    // Reads up to length bytes at position into dst. Returns the number of
    // bytes read, or -1 when nothing is available at position.
    // Throws FileSystemError on I/O failure.
    virtual std::int64_t Read(std::int64_t position, char* dst, std::int64_t length) = 0;
};

// File system client used by the worker. Implementations must be thread safe.
// Every operation throws FileNotFoundError for a missing path and
// FileSystemError for anything else that goes wrong.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    // Children of a directory; a regular file lists as itself.
    virtual std::vector<FileStatus> ListStatus(const std::string& path) = 0;
    virtual FileStatus GetStatus(const std::string& path) = 0;
    virtual std::unique_ptr<PositionReader> OpenPositionRead(const std::string& path) = 0;
};

} // namespace worker
} // namespace cacheworker
