#include "cacheworker/worker/WorkerHttpServer.h"
#include "cacheworker/common/Logger.h"
#include "cacheworker/worker/WorkerMetrics.h"

namespace cacheworker {
namespace worker {

WorkerServerOptions WorkerServerOptions::FromConfig(const common::Config& config) {
    WorkerServerOptions options;
    options.listenIp = config.GetString("global", "listen_ip", options.listenIp);
    int port = config.GetInt("global", "listen_port", options.listenPort);
    if (port < 0 || port > 65535) {
        LOG_WARN << "Config: listen_port " << port << " out of range, using " << options.listenPort;
    } else {
        options.listenPort = static_cast<uint16_t>(port);
    }
    options.ioThreads = config.GetInt("global", "io_threads", options.ioThreads);
    options.workerThreads = config.GetInt("global", "worker_threads", options.workerThreads);
    options.reusePort = config.GetBool("global", "reuse_port", false);
    if (options.ioThreads < 0) options.ioThreads = 0;
    if (options.workerThreads < 0) options.workerThreads = 0;
    return options;
}

WorkerHttpServer::WorkerHttpServer(network::EventLoop* loop,
                                   const WorkerServerOptions& options,
                                   PagedService& pages,
                                   FileSystem& fs,
                                   LoadService& loader,
                                   monitor::Metrics& metrics)
    : metrics_(metrics),
      routes_(pages, fs, loader, metrics),
      server_(loop,
              network::InetAddress(options.listenIp, options.listenPort),
              "http",
              options.reusePort ? network::TcpServer::kReusePort : network::TcpServer::kNoReusePort) {
    server_.SetThreadNum(options.ioThreads);
    server_.SetWorkerThreadNum(options.workerThreads);
    routes_.Install(server_.router());
    if (!metrics_.RegisterGaugeIfAbsent(kMetricActiveConnections, [this]() {
            return static_cast<double>(server_.connectionCount());
        })) {
        LOG_WARN << kMetricActiveConnections << " already registered by another server";
    }
}

WorkerHttpServer::~WorkerHttpServer() {
    LOG_INFO << "WorkerHttpServer on " << listenAddress().toIpPort() << " accepted "
             << server_.acceptedCount() << " connections";
    metrics_.RemoveGauge(kMetricActiveConnections);
}

void WorkerHttpServer::Start() {
    server_.Start();
}

} // namespace worker
} // namespace cacheworker
