#pragma once

#include "cacheworker/common/noncopyable.h"

#include <sys/epoll.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace cacheworker {
namespace network {

class EventLoop;

// One fd's epoll interest plus the callbacks its ready events map to.
// The fd belongs to whoever created the channel.
class Channel : common::noncopyable {
public:
    using EventCallback = std::function<void()>;

    // Where the fd stands with the loop's epoll set.
    enum class Registration { kNew, kAdded, kDetached };

    Channel(EventLoop* loop, int fd);
    ~Channel();

    // Called by the loop with the events epoll reported.
    void HandleEvent();

    void SetReadCallback(EventCallback cb) { onReadable_ = std::move(cb); }
    void SetWriteCallback(EventCallback cb) { onWritable_ = std::move(cb); }
    void SetCloseCallback(EventCallback cb) { onHangup_ = std::move(cb); }
    void SetErrorCallback(EventCallback cb) { onError_ = std::move(cb); }

    // Events are dropped once owner has been destroyed.
    void Tie(const std::shared_ptr<void>& owner);

    int fd() const { return fd_; }
    uint32_t interest() const { return interest_; }
    void SetReady(uint32_t ready) { ready_ = ready; }
    bool HasNoInterest() const { return interest_ == 0; }

    void EnableReading() { SetInterest(interest_ | kReadable); }
    void DisableReading() { SetInterest(interest_ & ~kReadable); }
    void EnableWriting() { SetInterest(interest_ | kWritable); }
    void DisableWriting() { SetInterest(interest_ & ~kWritable); }
    void DisableAll() { SetInterest(0); }

    bool IsReading() const { return (interest_ & kReadable) != 0; }
    bool IsWriting() const { return (interest_ & kWritable) != 0; }

    Registration registration() const { return registration_; }
    void SetRegistration(Registration r) { registration_ = r; }

    EventLoop* ownerLoop() const { return loop_; }
    // Drops the fd from the poller. Interest must already be empty.
    void Remove();

    static std::string EventsToString(uint32_t events);

private:
    static constexpr uint32_t kReadable = EPOLLIN | EPOLLPRI;
    static constexpr uint32_t kWritable = EPOLLOUT;

    void SetInterest(uint32_t interest);
    void Dispatch();

    EventLoop* loop_;
    const int fd_;
    uint32_t interest_;
    uint32_t ready_;
    Registration registration_;

    std::weak_ptr<void> owner_;
    bool tied_;
    bool dispatching_;

    EventCallback onReadable_;
    EventCallback onWritable_;
    EventCallback onHangup_;
    EventCallback onError_;
};

} // namespace network
} // namespace cacheworker
