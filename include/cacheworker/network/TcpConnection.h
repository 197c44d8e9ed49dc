#pragma once

#include "cacheworker/common/noncopyable.h"
#include "cacheworker/network/Buffer.h"
#include "cacheworker/network/Callbacks.h"
#include "cacheworker/network/InetAddress.h"

#include <any>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace cacheworker {
namespace network {

class Channel;
class EventLoop;
class Socket;

// One accepted socket, driven by a single IO loop. Public calls may come from
// any thread; they are marshalled onto the owning loop.
class TcpConnection : common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    TcpConnection(EventLoop* loop,
                  std::string name,
                  int fd,
                  const InetAddress& localAddr,
                  const InetAddress& peerAddr);
    ~TcpConnection();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& localAddress() const { return localAddr_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    bool connected() const { return state_ == State::kConnected; }

    uint64_t bytesRead() const { return bytesRead_.load(std::memory_order_relaxed); }
    uint64_t bytesWritten() const { return bytesWritten_.load(std::memory_order_relaxed); }

    // Per-connection protocol state, only touched on the IO loop.
    void SetContext(std::any context) { context_ = std::move(context); }
    std::any* GetMutableContext() { return &context_; }

    // Dropped unless connected.
    void Send(std::string data);
    // Half-closes once everything queued has been written.
    void Shutdown();
    // Closes now, discarding unsent output.
    void ForceClose();
    // Stops and restarts delivering input; bytes wait in the kernel meanwhile.
    void PauseReading();
    void ResumeReading();

    void SetConnectionCallback(ConnectionCallback cb) { connectionCallback_ = std::move(cb); }
    void SetMessageCallback(MessageCallback cb) { messageCallback_ = std::move(cb); }
    void SetCloseCallback(CloseCallback cb) { closeCallback_ = std::move(cb); }

    // Run by TcpServer on the IO loop once after accept, and once after removal.
    void ConnectEstablished();
    void ConnectDestroyed();

private:
    enum class State { kConnecting, kConnected, kDisconnecting, kDisconnected };

    void HandleRead();
    void HandleWrite();
    void HandleClose();
    void HandleError();

    void SendInLoop(const char* data, size_t len);
    void ShutdownInLoop();
    void SetReadingInLoop(bool on);

    static const char* StateName(State s);

    EventLoop* loop_;
    const std::string name_;
    std::atomic<State> state_;
    bool reading_;

    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;
    const InetAddress localAddr_;
    const InetAddress peerAddr_;
    const std::chrono::steady_clock::time_point created_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    CloseCallback closeCallback_;

    Buffer input_;
    Buffer output_;
    std::atomic<uint64_t> bytesRead_;
    std::atomic<uint64_t> bytesWritten_;

    std::any context_;
};

} // namespace network
} // namespace cacheworker
