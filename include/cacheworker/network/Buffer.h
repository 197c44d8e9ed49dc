#pragma once

#include <sys/types.h>

#include <cstddef>
#include <string>
#include <vector>

namespace cacheworker {
namespace network {

// Byte queue for socket and HTTP framing I/O. Bytes are appended at the back
// and consumed from the front; consumed space is reclaimed lazily when an
// append would otherwise grow the storage.
class Buffer {
public:
    static constexpr size_t kInitialSize = 1024;
    // Stack spill area for ReadFd, so one read can take more than the free space.
    static constexpr size_t kReadSpill = 64 * 1024;

    explicit Buffer(size_t initialSize = kInitialSize);

    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;
    Buffer(Buffer&&) noexcept = default;
    Buffer& operator=(Buffer&&) noexcept = default;

    size_t ReadableBytes() const { return end_ - begin_; }
    size_t Capacity() const { return storage_.size(); }
    const char* Peek() const { return storage_.data() + begin_; }

    // First "\r\n" among the readable bytes, or nullptr.
    const char* FindCRLF() const;

    void Retrieve(size_t len);
    void RetrieveUntil(const char* end) { Retrieve(static_cast<size_t>(end - Peek())); }
    void RetrieveAll() { begin_ = end_ = 0; }
    std::string RetrieveAsString(size_t len);
    std::string RetrieveAllAsString() { return RetrieveAsString(ReadableBytes()); }

    void Append(const char* data, size_t len);
    void Append(const std::string& data) { Append(data.data(), data.size()); }

    // One readv(2) into the free space and the spill area. Returns its result;
    // on failure errno is stored in *savedErrno.
    ssize_t ReadFd(int fd, int* savedErrno);

private:
    size_t FreeTail() const { return storage_.size() - end_; }
    void Reserve(size_t len);

    std::vector<char> storage_;
    size_t begin_;
    size_t end_;
};

} // namespace network
} // namespace cacheworker
