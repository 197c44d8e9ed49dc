#include "cacheworker/network/Channel.h"
#include "cacheworker/common/Logger.h"
#include "cacheworker/network/EventLoop.h"

namespace cacheworker {
namespace network {

Channel::Channel(EventLoop* loop, int fd)
    : loop_(loop),
      fd_(fd),
      interest_(0),
      ready_(0),
      registration_(Registration::kNew),
      tied_(false),
      dispatching_(false) {
}

Channel::~Channel() {
    if (dispatching_) {
        LOG_ERROR << "Channel for fd " << fd_ << " destroyed inside its own callback";
    }
}

void Channel::Tie(const std::shared_ptr<void>& owner) {
    owner_ = owner;
    tied_ = true;
}

void Channel::SetInterest(uint32_t interest) {
    interest_ = interest;
    loop_->UpdateChannel(this);
}

void Channel::Remove() {
    loop_->RemoveChannel(this);
}

void Channel::HandleEvent() {
    if (!tied_) {
        Dispatch();
        return;
    }
    std::shared_ptr<void> guard = owner_.lock();
    if (guard) {
        Dispatch();
    }
}

void Channel::Dispatch() {
    dispatching_ = true;
    LOG_DEBUG << "fd " << fd_ << " ready: " << EventsToString(ready_);

    // Peer hung up with nothing left to read.
    if ((ready_ & EPOLLHUP) && !(ready_ & EPOLLIN)) {
        if (onHangup_) onHangup_();
        dispatching_ = false;
        return;
    }
    if ((ready_ & EPOLLERR) && onError_) {
        onError_();
    }
    if ((ready_ & (kReadable | EPOLLRDHUP)) && onReadable_) {
        onReadable_();
    }
    if ((ready_ & kWritable) && onWritable_) {
        onWritable_();
    }
    dispatching_ = false;
}

std::string Channel::EventsToString(uint32_t events) {
    std::string out;
    auto add = [&out](const char* name) {
        if (!out.empty()) out.push_back('|');
        out.append(name);
    };
    if (events & EPOLLIN) add("IN");
    if (events & EPOLLPRI) add("PRI");
    if (events & EPOLLOUT) add("OUT");
    if (events & EPOLLHUP) add("HUP");
    if (events & EPOLLRDHUP) add("RDHUP");
    if (events & EPOLLERR) add("ERR");
    if (out.empty()) out = "NONE";
    return out;
}

} // namespace network
} // namespace cacheworker
