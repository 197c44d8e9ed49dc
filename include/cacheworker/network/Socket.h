#pragma once

#include "cacheworker/common/noncopyable.h"

namespace cacheworker {
namespace network {

class InetAddress;

// Owns a TCP socket fd and closes it on destruction.
class Socket : common::noncopyable {
public:
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket();

    // Nonblocking close-on-exec IPv4 stream socket. Throws std::system_error.
    static int CreateNonblocking();

    int fd() const { return fd_; }

    // Both throw std::system_error.
    void Bind(const InetAddress& addr);
    void Listen();

    // Returns the accepted fd, or -1 with errno set.
    int Accept(InetAddress* peer);

    void ShutdownWrite();

    void SetTcpNoDelay(bool on);
    void SetReuseAddr(bool on);
    void SetReusePort(bool on);
    void SetKeepAlive(bool on);

    static InetAddress LocalAddress(int fd);
    // Pending SO_ERROR, or the getsockopt errno if that call itself fails.
    static int TakeError(int fd);

private:
    void SetFlag(int level, int option, bool on, const char* name);

    const int fd_;
};

} // namespace network
} // namespace cacheworker
