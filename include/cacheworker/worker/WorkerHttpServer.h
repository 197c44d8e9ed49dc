#pragma once

#include "cacheworker/common/Config.h"
#include "cacheworker/common/noncopyable.h"
#include "cacheworker/protocol/HttpServer.h"
#include "cacheworker/worker/WorkerRoutes.h"

#include <cstdint>
#include <string>

namespace cacheworker {
namespace worker {

struct WorkerServerOptions {
    std::string listenIp{"0.0.0.0"};
    uint16_t listenPort{28080};
    int ioThreads{2};
    int workerThreads{4};
    bool reusePort{false};

    // Reads the [global] section.
    static WorkerServerOptions FromConfig(const common::Config& config);
};

class WorkerHttpServer : common::noncopyable {
public:
    WorkerHttpServer(network::EventLoop* loop,
                     const WorkerServerOptions& options,
                     PagedService& pages,
                     FileSystem& fs,
                     LoadService& loader,
                     monitor::Metrics& metrics);
    ~WorkerHttpServer();

    void Start();

    network::InetAddress listenAddress() const { return server_.listenAddress(); }

private:
    monitor::Metrics& metrics_;
    WorkerRoutes routes_;
    protocol::HttpServer server_;
};

} // namespace worker
} // namespace cacheworker
