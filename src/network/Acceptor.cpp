#include "cacheworker/network/Acceptor.h"
#include "cacheworker/common/Logger.h"
#include "cacheworker/network/EventLoop.h"

#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace cacheworker {
namespace network {

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reusePort)
    : loop_(loop),
      socket_(Socket::CreateNonblocking()),
      channel_(loop, socket_.fd()),
      listening_(false),
      spareFd_(::open("/dev/null", O_RDONLY | O_CLOEXEC)) {
    socket_.SetReuseAddr(true);
    socket_.SetReusePort(reusePort);
    socket_.Bind(listenAddr);
    channel_.SetReadCallback([this] { HandleAccept(); });
}

Acceptor::~Acceptor() {
    if (listening_) {
        channel_.DisableAll();
        channel_.Remove();
    }
    if (spareFd_ >= 0) {
        ::close(spareFd_);
    }
}

void Acceptor::Listen() {
    loop_->AssertInLoopThread();
    socket_.Listen();
    listening_ = true;
    channel_.EnableReading();
}

void Acceptor::HandleAccept() {
    InetAddress peer;
    int fd = socket_.Accept(&peer);
    if (fd >= 0) {
        if (onNewConnection_) {
            onNewConnection_(fd, peer);
        } else {
            ::close(fd);
        }
        return;
    }
    int err = errno;
    if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR || err == ECONNABORTED) {
        return;
    }
    LOG_ERROR << "accept on " << localAddress().toIpPort() << " failed: " << std::strerror(err);
    if (err == EMFILE || err == ENFILE) {
        ShedOneConnection();
    }
}

void Acceptor::ShedOneConnection() {
    // Level-triggered: leaving the peer in the backlog would spin the loop.
    if (spareFd_ < 0) {
        return;
    }
    ::close(spareFd_);
    int fd = ::accept(socket_.fd(), nullptr, nullptr);
    if (fd >= 0) {
        ::close(fd);
    }
    spareFd_ = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
}

} // namespace network
} // namespace cacheworker
