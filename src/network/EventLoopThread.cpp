#include "cacheworker/network/EventLoopThread.h"
#include "cacheworker/common/Logger.h"
#include "cacheworker/network/EventLoop.h"

#include <pthread.h>

namespace cacheworker {
namespace network {

EventLoopThread::EventLoopThread(std::string name)
    : name_(std::move(name)),
      loop_(nullptr) {
}

EventLoopThread::~EventLoopThread() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (loop_ != nullptr) {
            loop_->Quit();
        }
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

EventLoop* EventLoopThread::StartLoop() {
    thread_ = std::thread([this] { Run(); });
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait(lock, [this] { return loop_ != nullptr; });
    return loop_;
}

void EventLoopThread::Run() {
    // Linux caps thread names at 15 characters.
    ::pthread_setname_np(::pthread_self(), name_.substr(0, 15).c_str());

    EventLoop loop;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop_ = &loop;
    }
    ready_.notify_one();
    LOG_DEBUG << "thread " << name_ << " running loop " << &loop;

    loop.Loop();

    std::lock_guard<std::mutex> lock(mutex_);
    loop_ = nullptr;
}

} // namespace network
} // namespace cacheworker
