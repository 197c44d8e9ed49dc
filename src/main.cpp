#include "cacheworker/common/Config.h"
#include "cacheworker/common/Logger.h"
#include "cacheworker/monitor/Metrics.h"
#include "cacheworker/network/EventLoop.h"
#include "cacheworker/worker/LocalFileSystem.h"
#include "cacheworker/worker/LocalLoadService.h"
#include "cacheworker/worker/LocalPageStore.h"
#include "cacheworker/worker/WorkerHttpServer.h"
#include "cacheworker/worker/WorkerMetrics.h"

#include <getopt.h>
#include <signal.h>
#include <unistd.h>

#include <cstdio>
#include <exception>

namespace {

// Returns an empty string when the loaded configuration is usable.
std::string CheckConfig(const cacheworker::common::Config& conf) {
    int port = conf.GetInt("global", "listen_port", 28080);
    if (port < 0 || port > 65535) return "global.listen_port out of range";
    if (conf.GetInt("global", "io_threads", 2) < 0) return "global.io_threads must be >= 0";
    if (conf.GetInt("global", "worker_threads", 4) < 0) return "global.worker_threads must be >= 0";
    if (conf.GetInt64("page_store", "page_size", 1048576) <= 0) return "page_store.page_size must be > 0";
    if (conf.GetInt("load", "max_tracked_jobs", 128) <= 0) return "load.max_tracked_jobs must be > 0";
    return "";
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace cacheworker;

    std::string configFile = "../config/worker.conf";
    bool checkOnly = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:hC")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'h':
            default:
                printf("Usage: %s [-c config_file] [-C]\n", argv[0]);
                printf("  -C  check config and exit\n");
                return 0;
        }
    }

    auto& conf = common::Config::Instance();
    if (!conf.Load(configFile)) {
        LOG_ERROR << "Failed to load config " << configFile << ", using defaults.";
    }

    const std::string problem = CheckConfig(conf);
    if (checkOnly) {
        if (!problem.empty()) {
            printf("INVALID: %s\n", problem.c_str());
            return 1;
        }
        printf("OK\n");
        return 0;
    }
    if (!problem.empty()) {
        LOG_ERROR << "Invalid config: " << problem;
        return 1;
    }

    common::Logger::Instance().SetLevel(common::Logger::ParseLevel(conf.GetString("global", "log_level", "INFO")));
    ::signal(SIGPIPE, SIG_IGN);

    try {
        worker::LocalFileSystem fs(conf.GetString("filesystem", "root", "/"));
        worker::LocalPageStore pages(conf.GetString("page_store", "root", "/tmp/cacheworker/pages"),
                                     conf.GetInt64("page_store", "page_size", 1048576));
        worker::LocalLoadService loader(fs, pages,
                                        static_cast<size_t>(conf.GetInt("load", "max_tracked_jobs", 128)));

        auto& metrics = monitor::Metrics::Instance();
        worker::RegisterHttpMetrics(metrics);

        network::EventLoop loop;
        worker::WorkerHttpServer server(&loop, worker::WorkerServerOptions::FromConfig(conf),
                                        pages, fs, loader, metrics);
        server.Start();
        LOG_INFO << "cacheworker serving on " << server.listenAddress().toIpPort()
                 << " pages=" << pages.root() << " page_size=" << pages.PageSize();

        loop.Loop();
    } catch (const std::exception& e) {
        LOG_FATAL << "cacheworker failed to start: " << e.what();
        return 1;
    }
    return 0;
}
