#pragma once

#include "cacheworker/common/noncopyable.h"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace cacheworker {
namespace network {

class EventLoop;
class EventLoopThread;

// Fixed set of loop threads handed out round-robin. With no threads every
// caller gets the base loop.
class EventLoopThreadPool : common::noncopyable {
public:
    EventLoopThreadPool(EventLoop* baseLoop, std::string name);
    ~EventLoopThreadPool();

    // Call before Start().
    void SetThreadNum(int numThreads) { numThreads_ = numThreads; }
    void Start();

    // Safe from any thread once started.
    EventLoop* GetNextLoop();

private:
    EventLoop* baseLoop_;
    const std::string name_;
    int numThreads_;
    std::atomic<size_t> next_;
    std::vector<std::unique_ptr<EventLoopThread>> threads_;
    std::vector<EventLoop*> loops_;
};

} // namespace network
} // namespace cacheworker
