#include "cacheworker/network/Socket.h"
#include "cacheworker/common/Logger.h"
#include "cacheworker/network/InetAddress.h"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

namespace cacheworker {
namespace network {

Socket::~Socket() {
    if (::close(fd_) < 0) {
        LOG_WARN << "close fd " << fd_ << ": " << std::strerror(errno);
    }
}

int Socket::CreateNonblocking() {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "socket");
    }
    return fd;
}

void Socket::Bind(const InetAddress& addr) {
    if (::bind(fd_, addr.rawAddr(), sizeof(struct sockaddr_in)) < 0) {
        throw std::system_error(errno, std::generic_category(), "bind " + addr.toIpPort());
    }
}

void Socket::Listen() {
    if (::listen(fd_, SOMAXCONN) < 0) {
        throw std::system_error(errno, std::generic_category(), "listen");
    }
}

int Socket::Accept(InetAddress* peer) {
    struct sockaddr_in addr;
    socklen_t len = sizeof addr;
    std::memset(&addr, 0, sizeof addr);
    int fd = ::accept4(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd >= 0) {
        *peer = InetAddress(addr);
    }
    return fd;
}

void Socket::ShutdownWrite() {
    if (::shutdown(fd_, SHUT_WR) < 0) {
        LOG_WARN << "shutdown(SHUT_WR) fd " << fd_ << ": " << std::strerror(errno);
    }
}

void Socket::SetFlag(int level, int option, bool on, const char* name) {
    int value = on ? 1 : 0;
    if (::setsockopt(fd_, level, option, &value, sizeof value) < 0) {
        LOG_WARN << "setsockopt " << name << "=" << value << " fd " << fd_ << ": " << std::strerror(errno);
    }
}

void Socket::SetTcpNoDelay(bool on) { SetFlag(IPPROTO_TCP, TCP_NODELAY, on, "TCP_NODELAY"); }
void Socket::SetReuseAddr(bool on) { SetFlag(SOL_SOCKET, SO_REUSEADDR, on, "SO_REUSEADDR"); }
void Socket::SetReusePort(bool on) { SetFlag(SOL_SOCKET, SO_REUSEPORT, on, "SO_REUSEPORT"); }
void Socket::SetKeepAlive(bool on) { SetFlag(SOL_SOCKET, SO_KEEPALIVE, on, "SO_KEEPALIVE"); }

InetAddress Socket::LocalAddress(int fd) {
    struct sockaddr_in addr;
    socklen_t len = sizeof addr;
    std::memset(&addr, 0, sizeof addr);
    if (::getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
        LOG_ERROR << "getsockname fd " << fd << ": " << std::strerror(errno);
    }
    return InetAddress(addr);
}

int Socket::TakeError(int fd) {
    int err = 0;
    socklen_t len = sizeof err;
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        return errno;
    }
    return err;
}

} // namespace network
} // namespace cacheworker
