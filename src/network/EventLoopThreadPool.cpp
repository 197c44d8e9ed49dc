#include "cacheworker/network/EventLoopThreadPool.h"
#include "cacheworker/common/Logger.h"
#include "cacheworker/network/EventLoop.h"
#include "cacheworker/network/EventLoopThread.h"

namespace cacheworker {
namespace network {

EventLoopThreadPool::EventLoopThreadPool(EventLoop* baseLoop, std::string name)
    : baseLoop_(baseLoop),
      name_(std::move(name)),
      numThreads_(0),
      next_(0) {
}

// Threads quit and join in reverse start order.
EventLoopThreadPool::~EventLoopThreadPool() {
    while (!threads_.empty()) {
        threads_.pop_back();
    }
}

void EventLoopThreadPool::Start() {
    for (int i = 0; i < numThreads_; ++i) {
        threads_.emplace_back(new EventLoopThread(name_ + "-" + std::to_string(i)));
        loops_.push_back(threads_.back()->StartLoop());
    }
    LOG_DEBUG << "pool " << name_ << " started " << loops_.size() << " loop threads";
}

EventLoop* EventLoopThreadPool::GetNextLoop() {
    if (loops_.empty()) {
        return baseLoop_;
    }
    return loops_[next_.fetch_add(1, std::memory_order_relaxed) % loops_.size()];
}

} // namespace network
} // namespace cacheworker
