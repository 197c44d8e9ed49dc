#pragma once

#include "cacheworker/common/noncopyable.h"

#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace cacheworker {
namespace network {

class EventLoop;

// A thread that owns and runs one EventLoop. Destruction quits the loop and joins.
class EventLoopThread : common::noncopyable {
public:
    explicit EventLoopThread(std::string name);
    ~EventLoopThread();

    // Spawns the thread and blocks until its loop exists.
    EventLoop* StartLoop();

private:
    void Run();

    const std::string name_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable ready_;
    EventLoop* loop_;
};

} // namespace network
} // namespace cacheworker
