#include "cacheworker/network/EventLoop.h"
#include "cacheworker/common/Logger.h"

#include <sys/eventfd.h>
#include <unistd.h>

#include <cerrno>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace cacheworker {
namespace network {

namespace {

thread_local EventLoop* t_loopInThisThread = nullptr;

int CreateWakeupFd() {
    int fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "eventfd");
    }
    return fd;
}

std::string ThreadIdString(std::thread::id id) {
    std::ostringstream out;
    out << id;
    return out.str();
}

} // namespace

EventLoop::EventLoop()
    : threadId_(std::this_thread::get_id()),
      quit_(false),
      runningFunctors_(false),
      iterations_(0) {
    if (t_loopInThisThread != nullptr) {
        throw std::logic_error("thread " + ThreadIdString(threadId_) + " already runs an EventLoop");
    }
    poller_.reset(new EpollPoller(this));
    wakeupFd_ = CreateWakeupFd();
    t_loopInThisThread = this;

    wakeupChannel_.reset(new Channel(this, wakeupFd_));
    wakeupChannel_->SetReadCallback([this] { DrainWakeup(); });
    wakeupChannel_->EnableReading();
    LOG_DEBUG << "EventLoop " << this << " created in thread " << threadId_;
}

EventLoop::~EventLoop() {
    wakeupChannel_->DisableAll();
    wakeupChannel_->Remove();
    ::close(wakeupFd_);
    t_loopInThisThread = nullptr;
}

void EventLoop::AssertInLoopThread() const {
    if (!IsInLoopThread()) {
        std::ostringstream msg;
        msg << "EventLoop " << this << " of thread " << threadId_
            << " used from thread " << std::this_thread::get_id();
        LOG_ERROR << msg.str();
        throw std::logic_error(msg.str());
    }
}

void EventLoop::Loop() {
    AssertInLoopThread();
    LOG_DEBUG << "EventLoop " << this << " running";
    while (!quit_) {
        active_.clear();
        poller_->Poll(kPollTimeoutMs, &active_);
        for (Channel* channel : active_) {
            channel->HandleEvent();
        }
        RunPendingFunctors();
        iterations_.fetch_add(1, std::memory_order_relaxed);
    }
    LOG_DEBUG << "EventLoop " << this << " stopped after " << iterations() << " rounds";
}

void EventLoop::Quit() {
    quit_ = true;
    if (!IsInLoopThread()) {
        WakeUp();
    }
}

void EventLoop::RunInLoop(Functor cb) {
    if (IsInLoopThread()) {
        cb();
        return;
    }
    QueueInLoop(std::move(cb));
}

void EventLoop::QueueInLoop(Functor cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back(std::move(cb));
    }
    // A functor queued by a functor would otherwise wait out a full poll timeout.
    if (!IsInLoopThread() || runningFunctors_) {
        WakeUp();
    }
}

void EventLoop::UpdateChannel(Channel* channel) {
    poller_->UpdateChannel(channel);
}

void EventLoop::RemoveChannel(Channel* channel) {
    poller_->RemoveChannel(channel);
}

void EventLoop::WakeUp() {
    uint64_t one = 1;
    if (::write(wakeupFd_, &one, sizeof one) != static_cast<ssize_t>(sizeof one)) {
        LOG_ERROR << "EventLoop " << this << " wakeup write failed errno=" << errno;
    }
}

void EventLoop::DrainWakeup() {
    uint64_t count = 0;
    if (::read(wakeupFd_, &count, sizeof count) != static_cast<ssize_t>(sizeof count)) {
        LOG_ERROR << "EventLoop " << this << " wakeup read failed errno=" << errno;
    }
}

void EventLoop::RunPendingFunctors() {
    std::vector<Functor> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(pending_);
    }
    runningFunctors_ = true;
    for (auto& functor : batch) {
        functor();
    }
    runningFunctors_ = false;
}

} // namespace network
} // namespace cacheworker
