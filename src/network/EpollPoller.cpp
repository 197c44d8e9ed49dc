#include "cacheworker/network/EpollPoller.h"
#include "cacheworker/common/Logger.h"
#include "cacheworker/network/Channel.h"
#include "cacheworker/network/EventLoop.h"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

namespace cacheworker {
namespace network {

namespace {

const char* OperationName(int op) {
    switch (op) {
        case EPOLL_CTL_ADD: return "ADD";
        case EPOLL_CTL_MOD: return "MOD";
        case EPOLL_CTL_DEL: return "DEL";
    }
    return "?";
}

} // namespace

EpollPoller::EpollPoller(EventLoop* loop)
    : ownerLoop_(loop),
      epollFd_(::epoll_create1(EPOLL_CLOEXEC)),
      ready_(kInitialEventSlots) {
    if (epollFd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "epoll_create1");
    }
}

EpollPoller::~EpollPoller() {
    if (!channels_.empty()) {
        LOG_WARN << "EpollPoller closing with " << channels_.size() << " channels still registered";
    }
    ::close(epollFd_);
}

void EpollPoller::Poll(int timeoutMs, ChannelList* active) {
    int n = ::epoll_wait(epollFd_, ready_.data(), static_cast<int>(ready_.size()), timeoutMs);
    if (n < 0) {
        if (errno != EINTR) {
            LOG_ERROR << "epoll_wait failed: " << std::strerror(errno);
        }
        return;
    }
    for (int i = 0; i < n; ++i) {
        Channel* channel = static_cast<Channel*>(ready_[i].data.ptr);
        channel->SetReady(ready_[i].events);
        active->push_back(channel);
    }
    // Every slot filled; give the next round more room.
    if (static_cast<size_t>(n) == ready_.size()) {
        ready_.resize(ready_.size() * 2);
    }
}

void EpollPoller::UpdateChannel(Channel* channel) {
    ownerLoop_->AssertInLoopThread();
    switch (channel->registration()) {
        case Channel::Registration::kNew:
            channels_[channel->fd()] = channel;
            [[fallthrough]];
        case Channel::Registration::kDetached:
            if (channel->HasNoInterest()) return;
            Control(EPOLL_CTL_ADD, channel);
            channel->SetRegistration(Channel::Registration::kAdded);
            break;
        case Channel::Registration::kAdded:
            if (channel->HasNoInterest()) {
                Control(EPOLL_CTL_DEL, channel);
                channel->SetRegistration(Channel::Registration::kDetached);
            } else {
                Control(EPOLL_CTL_MOD, channel);
            }
            break;
    }
}

void EpollPoller::RemoveChannel(Channel* channel) {
    ownerLoop_->AssertInLoopThread();
    channels_.erase(channel->fd());
    if (channel->registration() == Channel::Registration::kAdded) {
        Control(EPOLL_CTL_DEL, channel);
    }
    channel->SetRegistration(Channel::Registration::kNew);
}

void EpollPoller::Control(int op, Channel* channel) {
    struct epoll_event event;
    std::memset(&event, 0, sizeof event);
    event.events = channel->interest();
    event.data.ptr = channel;
    if (::epoll_ctl(epollFd_, op, channel->fd(), &event) == 0) {
        return;
    }
    int err = errno;
    // The fd may already be gone on teardown.
    if (op == EPOLL_CTL_DEL) {
        LOG_WARN << "epoll_ctl DEL fd=" << channel->fd() << ": " << std::strerror(err);
        return;
    }
    throw std::system_error(err, std::generic_category(),
                            std::string("epoll_ctl ") + OperationName(op) + " fd=" + std::to_string(channel->fd()));
}

} // namespace network
} // namespace cacheworker
