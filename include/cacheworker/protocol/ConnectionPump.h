#pragma once

#include "cacheworker/common/noncopyable.h"
#include "cacheworker/network/Buffer.h"
#include "cacheworker/protocol/HttpContext.h"
#include "cacheworker/protocol/HttpRequest.h"
#include "cacheworker/protocol/HttpResponse.h"

#include <functional>
#include <memory>
#include <string>

namespace cacheworker {
namespace protocol {

// Byte sink under a ConnectionPump. TcpConnection in production, a recorder in tests.
class Transport {
public:
    virtual ~Transport() = default;

    virtual void Send(const std::string& data) = 0;
    // Closes the write side once everything queued has been flushed.
    virtual void Shutdown() = 0;
    virtual void ForceClose() = 0;
    virtual void PauseReading() = 0;
    virtual void ResumeReading() = 0;
    virtual std::string name() const = 0;
};

// Per-connection request/response state machine:
//
//   kAwaitingRequest -> kRequestReceived -> kDispatched -> kResponseWritten
//        ^                                                      |
//        +------------------- keep-alive ------------------------+--> kClosed
//
// One request is in flight at a time. Reading is paused while dispatched and
// bytes that arrive meanwhile stay buffered until the response is written.
// Not thread safe: every call must come from the connection's I/O loop.
class ConnectionPump : common::noncopyable,
                       public std::enable_shared_from_this<ConnectionPump> {
public:
    enum State {
        kAwaitingRequest,
        kRequestReceived,
        kDispatched,
        kResponseWritten,
        kClosed,
    };

    using RequestPtr = std::shared_ptr<const HttpRequest>;
    // Must eventually answer with exactly one OnResponse or OnFault.
    using Dispatcher = std::function<void(const std::shared_ptr<ConnectionPump>&, const RequestPtr&)>;

    ConnectionPump(std::unique_ptr<Transport> transport, Dispatcher dispatcher);
    ~ConnectionPump();

    // Bytes read from the peer.
    void OnData(const char* data, size_t len);
    void OnData(network::Buffer* buf);

    // Completion of the dispatched request. Ignored unless kDispatched.
    void OnResponse(HttpResponse response);

    // The dispatched request failed outside the documented error taxonomy.
    void OnFault(const std::string& error);

    // Peer went away or the transport was torn down.
    void OnDisconnected();

    State state() const { return state_; }
    const std::string& name() const { return name_; }
    size_t requestsServed() const { return requestsServed_; }

    static const char* StateToString(State s);

private:
    void Advance();
    void WriteResponse(HttpResponse& response, bool keepAlive);
    void RejectMalformed(const std::string& reason);
    void Close(bool graceful);

    std::unique_ptr<Transport> transport_;
    Dispatcher dispatcher_;
    const std::string name_;

    State state_;
    HttpContext context_;
    network::Buffer input_;
    RequestPtr current_;
    bool advancing_;
    size_t requestsServed_;
};

} // namespace protocol
} // namespace cacheworker
