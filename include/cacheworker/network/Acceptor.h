#pragma once

#include "cacheworker/common/noncopyable.h"
#include "cacheworker/network/Channel.h"
#include "cacheworker/network/InetAddress.h"
#include "cacheworker/network/Socket.h"

#include <functional>

namespace cacheworker {
namespace network {

class EventLoop;

// Listening socket on the base loop. Binds in the constructor so the bound
// address is known before Listen().
class Acceptor : common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int fd, const InetAddress& peer)>;

    // Throws std::system_error if the socket cannot be created or bound.
    Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reusePort);
    ~Acceptor();

    void SetNewConnectionCallback(NewConnectionCallback cb) { onNewConnection_ = std::move(cb); }

    void Listen();

    InetAddress localAddress() const { return Socket::LocalAddress(socket_.fd()); }

private:
    void HandleAccept();
    void ShedOneConnection();

    EventLoop* loop_;
    Socket socket_;
    Channel channel_;
    NewConnectionCallback onNewConnection_;
    bool listening_;
    // Held open so one pending connection can be accepted and closed when out of fds.
    int spareFd_;
};

} // namespace network
} // namespace cacheworker
