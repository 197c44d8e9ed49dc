#pragma once

#include <functional>
#include <memory>

namespace cacheworker {
namespace network {

class Buffer;
class TcpConnection;

using TcpConnectionPtr = std::shared_ptr<TcpConnection>;

// Fired on establish and again on teardown; check connected() to tell which.
using ConnectionCallback = std::function<void(const TcpConnectionPtr&)>;
using CloseCallback = std::function<void(const TcpConnectionPtr&)>;
// The buffer holds every unconsumed inbound byte; the callee retrieves what it parses.
using MessageCallback = std::function<void(const TcpConnectionPtr&, Buffer*)>;

} // namespace network
} // namespace cacheworker
