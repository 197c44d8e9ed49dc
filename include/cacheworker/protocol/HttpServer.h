#pragma once

#include "cacheworker/common/noncopyable.h"
#include "cacheworker/network/EventLoopThreadPool.h"
#include "cacheworker/network/TcpServer.h"
#include "cacheworker/protocol/ConnectionPump.h"
#include "cacheworker/protocol/Router.h"

#include <cstdint>
#include <memory>
#include <string>

namespace cacheworker {
namespace protocol {

// HTTP/1.x front-end: TcpServer I/O loops feed one ConnectionPump per
// connection; requests are routed on a separate worker pool and the response
// is posted back to the connection's I/O loop.
class HttpServer : common::noncopyable {
public:
    HttpServer(network::EventLoop* loop,
               const network::InetAddress& listenAddr,
               const std::string& name,
               network::TcpServer::Option option = network::TcpServer::kNoReusePort);
    ~HttpServer();

    network::EventLoop* getLoop() const { return server_.getLoop(); }
    const std::string& name() const { return server_.name(); }
    network::InetAddress listenAddress() const { return server_.listenAddress(); }

    Router& router() { return router_; }

    size_t connectionCount() const { return server_.connectionCount(); }
    uint64_t acceptedCount() const { return server_.acceptedCount(); }

    void SetThreadNum(int numThreads) { server_.SetThreadNum(numThreads); }
    // 0 runs handlers directly on the I/O loop.
    void SetWorkerThreadNum(int numThreads) { workerThreads_ = numThreads; }

    void Start();

private:
    void OnConnection(const network::TcpConnectionPtr& conn);
    void OnMessage(const network::TcpConnectionPtr& conn, network::Buffer* buf);
    void OnRequest(const std::shared_ptr<ConnectionPump>& pump,
                   const ConnectionPump::RequestPtr& request,
                   network::EventLoop* ioLoop);

    network::TcpServer server_;
    Router router_;
    int workerThreads_;
    std::unique_ptr<network::EventLoopThreadPool> workers_;
};

} // namespace protocol
} // namespace cacheworker
