#include "cacheworker/network/TcpConnection.h"
#include "cacheworker/common/Logger.h"
#include "cacheworker/network/Channel.h"
#include "cacheworker/network/EventLoop.h"
#include "cacheworker/network/Socket.h"

#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace cacheworker {
namespace network {

namespace {

bool IsPeerGone(int err) {
    return err == EPIPE || err == ECONNRESET;
}

} // namespace

TcpConnection::TcpConnection(EventLoop* loop,
                             std::string name,
                             int fd,
                             const InetAddress& localAddr,
                             const InetAddress& peerAddr)
    : loop_(loop),
      name_(std::move(name)),
      state_(State::kConnecting),
      reading_(true),
      socket_(new Socket(fd)),
      channel_(new Channel(loop, fd)),
      localAddr_(localAddr),
      peerAddr_(peerAddr),
      created_(std::chrono::steady_clock::now()),
      bytesRead_(0),
      bytesWritten_(0) {
    channel_->SetReadCallback([this] { HandleRead(); });
    channel_->SetWriteCallback([this] { HandleWrite(); });
    channel_->SetCloseCallback([this] { HandleClose(); });
    channel_->SetErrorCallback([this] { HandleError(); });

    socket_->SetKeepAlive(true);
    // Headers and payload leave in separate writes; Nagle would hold the second.
    socket_->SetTcpNoDelay(true);
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "TcpConnection " << name_ << " fd=" << channel_->fd()
              << " released in state " << StateName(state_);
}

const char* TcpConnection::StateName(State s) {
    switch (s) {
        case State::kConnecting: return "connecting";
        case State::kConnected: return "connected";
        case State::kDisconnecting: return "disconnecting";
        case State::kDisconnected: return "disconnected";
    }
    return "?";
}

void TcpConnection::ConnectEstablished() {
    loop_->AssertInLoopThread();
    state_ = State::kConnected;
    channel_->Tie(shared_from_this());
    channel_->EnableReading();
    if (connectionCallback_) {
        connectionCallback_(shared_from_this());
    }
}

void TcpConnection::ConnectDestroyed() {
    loop_->AssertInLoopThread();
    // Server teardown can get here without HandleClose having run.
    if (state_ == State::kConnected || state_ == State::kDisconnecting) {
        state_ = State::kDisconnected;
        channel_->DisableAll();
        if (connectionCallback_) {
            connectionCallback_(shared_from_this());
        }
    }
    channel_->Remove();
}

void TcpConnection::HandleRead() {
    int savedErrno = 0;
    ssize_t n = input_.ReadFd(channel_->fd(), &savedErrno);
    if (n > 0) {
        bytesRead_.fetch_add(static_cast<uint64_t>(n), std::memory_order_relaxed);
        if (messageCallback_) {
            messageCallback_(shared_from_this(), &input_);
        }
        return;
    }
    if (n == 0) {
        HandleClose();
        return;
    }
    if (savedErrno == EAGAIN || savedErrno == EWOULDBLOCK || savedErrno == EINTR) {
        return;
    }
    LOG_WARN << "TcpConnection " << name_ << " read failed: " << std::strerror(savedErrno);
    HandleClose();
}

void TcpConnection::HandleWrite() {
    if (!channel_->IsWriting()) {
        LOG_DEBUG << "TcpConnection " << name_ << " writable but nothing queued";
        return;
    }
    ssize_t n = ::write(channel_->fd(), output_.Peek(), output_.ReadableBytes());
    if (n < 0) {
        int err = errno;
        if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) {
            return;
        }
        LOG_WARN << "TcpConnection " << name_ << " write failed: " << std::strerror(err);
        if (IsPeerGone(err)) {
            HandleClose();
        }
        return;
    }
    output_.Retrieve(static_cast<size_t>(n));
    bytesWritten_.fetch_add(static_cast<uint64_t>(n), std::memory_order_relaxed);
    if (output_.ReadableBytes() == 0) {
        channel_->DisableWriting();
        if (state_ == State::kDisconnecting) {
            ShutdownInLoop();
        }
    }
}

void TcpConnection::HandleClose() {
    loop_->AssertInLoopThread();
    if (state_ == State::kDisconnected) {
        return;
    }
    state_ = State::kDisconnected;
    channel_->DisableAll();

    auto lived = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - created_).count();
    LOG_DEBUG << "TcpConnection " << name_ << " closed after " << lived << "ms, in="
              << bytesRead() << " out=" << bytesWritten() << " unsent=" << output_.ReadableBytes();

    TcpConnectionPtr self(shared_from_this());
    if (connectionCallback_) {
        connectionCallback_(self);
    }
    if (closeCallback_) {
        closeCallback_(self);
    }
}

void TcpConnection::HandleError() {
    int err = Socket::TakeError(channel_->fd());
    LOG_WARN << "TcpConnection " << name_ << " socket error: " << std::strerror(err);
}

void TcpConnection::Send(std::string data) {
    if (state_ != State::kConnected) {
        return;
    }
    if (loop_->IsInLoopThread()) {
        SendInLoop(data.data(), data.size());
        return;
    }
    loop_->RunInLoop([self = shared_from_this(), data = std::move(data)]() {
        self->SendInLoop(data.data(), data.size());
    });
}

void TcpConnection::SendInLoop(const char* data, size_t len) {
    if (state_ == State::kDisconnected) {
        LOG_DEBUG << "TcpConnection " << name_ << " dropped " << len << " bytes after close";
        return;
    }
    size_t written = 0;
    // Nothing queued: try the socket first and buffer only the tail.
    if (!channel_->IsWriting() && output_.ReadableBytes() == 0) {
        ssize_t n = ::write(channel_->fd(), data, len);
        if (n >= 0) {
            written = static_cast<size_t>(n);
            bytesWritten_.fetch_add(written, std::memory_order_relaxed);
        } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
            int err = errno;
            LOG_WARN << "TcpConnection " << name_ << " send failed: " << std::strerror(err);
            if (IsPeerGone(err)) {
                return;
            }
        }
    }
    if (written < len) {
        output_.Append(data + written, len - written);
        if (!channel_->IsWriting()) {
            channel_->EnableWriting();
        }
    }
}

void TcpConnection::Shutdown() {
    State expected = State::kConnected;
    if (state_.compare_exchange_strong(expected, State::kDisconnecting)) {
        loop_->RunInLoop([self = shared_from_this()]() { self->ShutdownInLoop(); });
    }
}

void TcpConnection::ShutdownInLoop() {
    // Still draining; HandleWrite finishes the job.
    if (!channel_->IsWriting()) {
        socket_->ShutdownWrite();
    }
}

void TcpConnection::ForceClose() {
    if (state_ == State::kDisconnected) {
        return;
    }
    loop_->RunInLoop([self = shared_from_this()]() { self->HandleClose(); });
}

void TcpConnection::PauseReading() {
    loop_->RunInLoop([self = shared_from_this()]() { self->SetReadingInLoop(false); });
}

void TcpConnection::ResumeReading() {
    loop_->RunInLoop([self = shared_from_this()]() { self->SetReadingInLoop(true); });
}

void TcpConnection::SetReadingInLoop(bool on) {
    if (reading_ == on || state_ == State::kDisconnected) {
        return;
    }
    reading_ = on;
    if (on) {
        channel_->EnableReading();
    } else {
        channel_->DisableReading();
    }
}

} // namespace network
} // namespace cacheworker
