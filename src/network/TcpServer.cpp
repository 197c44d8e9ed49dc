#include "cacheworker/network/TcpServer.h"
#include "cacheworker/common/Logger.h"
#include "cacheworker/network/Acceptor.h"
#include "cacheworker/network/EventLoop.h"
#include "cacheworker/network/Socket.h"

namespace cacheworker {
namespace network {

TcpServer::TcpServer(EventLoop* loop,
                     const InetAddress& listenAddr,
                     std::string name,
                     Option option)
    : loop_(loop),
      name_(std::move(name)),
      acceptor_(new Acceptor(loop, listenAddr, option == kReusePort)),
      ioLoops_(new EventLoopThreadPool(loop, name_ + "-io")),
      started_(false),
      nextConnId_(1),
      connectionCount_(0),
      acceptedCount_(0) {
    acceptor_->SetNewConnectionCallback(
        [this](int fd, const InetAddress& peer) { OnAccepted(fd, peer); });
}

TcpServer::~TcpServer() {
    LOG_DEBUG << "TcpServer " << name_ << " shutting down with " << connections_.size() << " connections";
    for (auto& entry : connections_) {
        TcpConnectionPtr conn = std::move(entry.second);
        conn->getLoop()->RunInLoop([conn]() { conn->ConnectDestroyed(); });
    }
    connections_.clear();
}

InetAddress TcpServer::listenAddress() const {
    return acceptor_->localAddress();
}

void TcpServer::SetThreadNum(int numThreads) {
    ioLoops_->SetThreadNum(numThreads);
}

void TcpServer::Start() {
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true)) {
        return;
    }
    ioLoops_->Start();
    loop_->RunInLoop([this]() { acceptor_->Listen(); });
}

void TcpServer::OnAccepted(int fd, const InetAddress& peer) {
    loop_->AssertInLoopThread();
    std::string connName = name_ + "#" + std::to_string(nextConnId_++) + "-" + peer.toIpPort();
    EventLoop* ioLoop = ioLoops_->GetNextLoop();

    auto conn = std::make_shared<TcpConnection>(ioLoop, connName, fd, Socket::LocalAddress(fd), peer);
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetCloseCallback([this](const TcpConnectionPtr& c) { RemoveConnection(c); });
    connections_[connName] = conn;
    connectionCount_.store(connections_.size(), std::memory_order_relaxed);
    acceptedCount_.fetch_add(1, std::memory_order_relaxed);

    LOG_DEBUG << "TcpServer " << name_ << " accepted " << connName;
    ioLoop->RunInLoop([conn]() { conn->ConnectEstablished(); });
}

void TcpServer::RemoveConnection(const TcpConnectionPtr& conn) {
    // Runs on the connection's IO loop; the map lives on the base loop.
    loop_->RunInLoop([this, conn]() {
        connections_.erase(conn->name());
        connectionCount_.store(connections_.size(), std::memory_order_relaxed);
        // Queued so the channel is not removed inside its own callback.
        conn->getLoop()->QueueInLoop([conn]() { conn->ConnectDestroyed(); });
    });
}

} // namespace network
} // namespace cacheworker
