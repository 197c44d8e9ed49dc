#include "cacheworker/common/Config.h"
#include "cacheworker/common/Logger.h"
#include "cacheworker/worker/WorkerHttpServer.h"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace cacheworker;
using namespace cacheworker::common;

void testParseSections() {
    Config conf;
    conf.LoadFromString(
        "# comment\n"
        "listen_port = 9000\n"
        "\n"
        "[page_store]\n"
        "; another comment\n"
        "root = /var/cache/pages  \n"
        "page_size=4096\n"
        "[load]\n"
        "max_tracked_jobs = 7\n"
        "this line has no equals sign\n");
    // Keys before any section header land in global.
    assert(conf.GetInt("global", "listen_port", 0) == 9000);
    assert(conf.GetString("page_store", "root") == "/var/cache/pages");
    assert(conf.GetInt64("page_store", "page_size", 0) == 4096);
    assert(conf.GetInt("load", "max_tracked_jobs", 128) == 7);
    assert(!conf.LoadedFilename());
    assert(conf.Has("load", "max_tracked_jobs"));
    assert(!conf.Has("load", "this line has no equals sign"));
    LOG_INFO << "Parse sections PASS";
}

void testDefaultsAndBadNumbers() {
    Config conf;
    conf.LoadFromString("[global]\nio_threads = many\nratio = 0.25\n");
    assert(conf.GetInt("global", "io_threads", 2) == 2);
    assert(conf.GetInt("global", "missing", 5) == 5);
    assert(conf.GetString("nosuch", "key", "dflt") == "dflt");
    assert(conf.GetDouble("global", "ratio", 0.0) == 0.25);
    conf.SetString("global", "io_threads", "3");
    assert(conf.GetInt("global", "io_threads", 2) == 3);
    conf.SetString("global", "io_threads", "99999999999");
    assert(conf.GetInt("global", "io_threads", 2) == 2);

    conf.SetString("global", "reuse_port", "Yes");
    assert(conf.GetBool("global", "reuse_port", false));
    conf.SetString("global", "reuse_port", "off");
    assert(!conf.GetBool("global", "reuse_port", true));
    conf.SetString("global", "reuse_port", "maybe");
    assert(conf.GetBool("global", "reuse_port", true));
    LOG_INFO << "Defaults/bad numbers PASS";
}

void testLoadFile() {
    char path[] = "/tmp/cacheworker_conf_XXXXXX";
    int fd = ::mkstemp(path);
    assert(fd >= 0);
    ::close(fd);
    {
        std::ofstream out(path);
        out << "[global]\nlisten_ip = 127.0.0.1\nlisten_port = 0\nio_threads = 1\nworker_threads = 0\nreuse_port = 1\n";
    }
    Config conf;
    assert(conf.Load(path));
    assert(conf.LoadedFilename() && *conf.LoadedFilename() == path);

    worker::WorkerServerOptions options = worker::WorkerServerOptions::FromConfig(conf);
    assert(options.listenIp == "127.0.0.1");
    assert(options.listenPort == 0);
    assert(options.ioThreads == 1);
    assert(options.workerThreads == 0);
    assert(options.reusePort);
    std::remove(path);

    Config missing;
    assert(!missing.Load("/nonexistent/cacheworker.conf"));
    worker::WorkerServerOptions defaults = worker::WorkerServerOptions::FromConfig(missing);
    assert(defaults.listenPort == 28080);
    assert(defaults.listenIp == "0.0.0.0");
    assert(defaults.ioThreads == 2);
    assert(defaults.workerThreads == 4);
    assert(!defaults.reusePort);
    LOG_INFO << "Load file PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);
    testParseSections();
    testDefaultsAndBadNumbers();
    testLoadFile();
    return 0;
}
