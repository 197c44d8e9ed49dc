#pragma once

#include "cacheworker/common/noncopyable.h"
#include "cacheworker/network/Channel.h"
#include "cacheworker/network/EpollPoller.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace cacheworker {
namespace network {

// Reactor for a single thread. Channels are only touched from that thread;
// other threads hand work over with RunInLoop/QueueInLoop.
class EventLoop : common::noncopyable {
public:
    using Functor = std::function<void()>;

    // Throws std::logic_error if the calling thread already runs a loop.
    EventLoop();
    ~EventLoop();

    // Runs until Quit(). Must be called from the constructing thread.
    void Loop();
    // Safe from any thread.
    void Quit();

    // Runs cb now when called on the loop thread, else queues it.
    void RunInLoop(Functor cb);
    // Always deferred to the end of the current poll round.
    void QueueInLoop(Functor cb);

    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);

    bool IsInLoopThread() const { return threadId_ == std::this_thread::get_id(); }
    // Throws std::logic_error from any other thread.
    void AssertInLoopThread() const;

    // Completed poll rounds; read from other threads for diagnostics.
    uint64_t iterations() const { return iterations_.load(std::memory_order_relaxed); }

private:
    static constexpr int kPollTimeoutMs = 10000;

    void WakeUp();
    void DrainWakeup();
    void RunPendingFunctors();

    const std::thread::id threadId_;
    std::atomic<bool> quit_;
    std::atomic<bool> runningFunctors_;
    std::atomic<uint64_t> iterations_;

    std::unique_ptr<EpollPoller> poller_;
    int wakeupFd_;
    std::unique_ptr<Channel> wakeupChannel_;
    EpollPoller::ChannelList active_;

    std::mutex mutex_;
    std::vector<Functor> pending_;
};

} // namespace network
} // namespace cacheworker
