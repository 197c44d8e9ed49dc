#include "cacheworker/network/Buffer.h"

#include <sys/uio.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace cacheworker {
namespace network {

Buffer::Buffer(size_t initialSize)
    : storage_(initialSize),
      begin_(0),
      end_(0) {
}

const char* Buffer::FindCRLF() const {
    const char* first = Peek();
    const char* last = first + ReadableBytes();
    static const char kCRLF[] = "\r\n";
    const char* hit = std::search(first, last, kCRLF, kCRLF + 2);
    return hit == last ? nullptr : hit;
}

void Buffer::Retrieve(size_t len) {
    if (len >= ReadableBytes()) {
        RetrieveAll();
    } else {
        begin_ += len;
    }
}

std::string Buffer::RetrieveAsString(size_t len) {
    len = std::min(len, ReadableBytes());
    std::string out(Peek(), len);
    Retrieve(len);
    return out;
}

void Buffer::Append(const char* data, size_t len) {
    Reserve(len);
    std::memcpy(storage_.data() + end_, data, len);
    end_ += len;
}

void Buffer::Reserve(size_t len) {
    if (FreeTail() >= len) {
        return;
    }
    size_t readable = ReadableBytes();
    // Slide the unread bytes to the front when that makes enough room.
    if (begin_ + FreeTail() >= len) {
        std::memmove(storage_.data(), Peek(), readable);
        begin_ = 0;
        end_ = readable;
        return;
    }
    storage_.resize(std::max(storage_.size() * 2, end_ + len));
}

ssize_t Buffer::ReadFd(int fd, int* savedErrno) {
    char spill[kReadSpill];
    const size_t room = FreeTail();
    struct iovec vec[2];
    vec[0].iov_base = storage_.data() + end_;
    vec[0].iov_len = room;
    vec[1].iov_base = spill;
    vec[1].iov_len = sizeof spill;
    const ssize_t n = ::readv(fd, vec, room < sizeof spill ? 2 : 1);
    if (n < 0) {
        *savedErrno = errno;
        return n;
    }
    if (static_cast<size_t>(n) <= room) {
        end_ += static_cast<size_t>(n);
    } else {
        end_ = storage_.size();
        Append(spill, static_cast<size_t>(n) - room);
    }
    return n;
}

} // namespace network
} // namespace cacheworker
