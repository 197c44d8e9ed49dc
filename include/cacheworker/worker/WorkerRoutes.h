#pragma once

#include "cacheworker/monitor/Metrics.h"
#include "cacheworker/protocol/Router.h"
#include "cacheworker/worker/FileInfoHandlers.h"
#include "cacheworker/worker/LoadHandler.h"
#include "cacheworker/worker/PageHandlers.h"

namespace cacheworker {
namespace worker {

extern const char kHealthMessage[];

// Owns the operation handlers and installs the worker's route table:
//
//   GET      /file/{id}/page/{index}   page read
//   POST|PUT /file/{id}/page/{index}   page write
//   GET      /files?path=              list directory
//   GET      /info?path=               file status
//   GET      /load?path=&...           trigger load
//   GET      /health                   liveness
//   GET      /metrics                  metrics JSON
//
// Must outlive every Router it was installed into.
class WorkerRoutes {
public:
    WorkerRoutes(PagedService& pages, FileSystem& fs, LoadService& loader, monitor::Metrics& metrics);

    void Install(protocol::Router& router);

    static protocol::HttpResponse Health();

private:
    PageHandler pageHandler_;
    FileInfoHandler fileInfoHandler_;
    LoadHandler loadHandler_;
    monitor::Metrics& metrics_;
};

} // namespace worker
} // namespace cacheworker
