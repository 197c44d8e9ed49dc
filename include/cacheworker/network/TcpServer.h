#pragma once

#include "cacheworker/common/noncopyable.h"
#include "cacheworker/network/Callbacks.h"
#include "cacheworker/network/EventLoopThreadPool.h"
#include "cacheworker/network/InetAddress.h"
#include "cacheworker/network/TcpConnection.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace cacheworker {
namespace network {

class Acceptor;
class EventLoop;

// Accepts on the base loop and spreads connections round-robin over the IO loops.
class TcpServer : common::noncopyable {
public:
    enum Option {
        kNoReusePort,
        kReusePort,
    };

    // Binds immediately; throws std::system_error on failure.
    TcpServer(EventLoop* loop,
              const InetAddress& listenAddr,
              std::string name,
              Option option = kNoReusePort);
    ~TcpServer();

    const std::string& name() const { return name_; }
    EventLoop* getLoop() const { return loop_; }
    InetAddress listenAddress() const;

    // 0 keeps every connection on the base loop. Call before Start().
    void SetThreadNum(int numThreads);
    void Start();

    void SetConnectionCallback(ConnectionCallback cb) { connectionCallback_ = std::move(cb); }
    void SetMessageCallback(MessageCallback cb) { messageCallback_ = std::move(cb); }

    // Readable from any thread.
    size_t connectionCount() const { return connectionCount_.load(std::memory_order_relaxed); }
    uint64_t acceptedCount() const { return acceptedCount_.load(std::memory_order_relaxed); }

private:
    void OnAccepted(int fd, const InetAddress& peer);
    void RemoveConnection(const TcpConnectionPtr& conn);

    EventLoop* loop_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;
    std::unique_ptr<EventLoopThreadPool> ioLoops_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;

    std::atomic<bool> started_;
    uint64_t nextConnId_;
    // Base loop only.
    std::unordered_map<std::string, TcpConnectionPtr> connections_;
    std::atomic<size_t> connectionCount_;
    std::atomic<uint64_t> acceptedCount_;
};

} // namespace network
} // namespace cacheworker
