#pragma once

#include "cacheworker/common/noncopyable.h"

#include <sys/epoll.h>

#include <unordered_map>
#include <vector>

namespace cacheworker {
namespace network {

class Channel;
class EventLoop;

// Level-triggered epoll set owned by one EventLoop. Only touched from that loop's thread.
class EpollPoller : common::noncopyable {
public:
    using ChannelList = std::vector<Channel*>;

    // Throws std::system_error when the epoll instance cannot be created.
    explicit EpollPoller(EventLoop* loop);
    ~EpollPoller();

    // Blocks up to timeoutMs and appends every ready channel to active.
    void Poll(int timeoutMs, ChannelList* active);

    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);

private:
    static constexpr size_t kInitialEventSlots = 32;

    void Control(int op, Channel* channel);

    EventLoop* ownerLoop_;
    int epollFd_;
    std::vector<struct epoll_event> ready_;
    std::unordered_map<int, Channel*> channels_;
};

} // namespace network
} // namespace cacheworker
