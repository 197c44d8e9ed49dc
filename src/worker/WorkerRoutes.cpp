#include "cacheworker/worker/WorkerRoutes.h"
#include "cacheworker/common/Logger.h"

namespace cacheworker {
namespace worker {

using protocol::HttpRequest;
using protocol::HttpResponse;
using protocol::RequestUri;

const char kHealthMessage[] = "worker is active";

WorkerRoutes::WorkerRoutes(PagedService& pages, FileSystem& fs, LoadService& loader, monitor::Metrics& metrics)
    : pageHandler_(pages, fs, metrics),
      fileInfoHandler_(fs),
      loadHandler_(loader),
      metrics_(metrics) {
}

HttpResponse WorkerRoutes::Health() {
    return HttpResponse::PlainText(HttpResponse::k200Ok, kHealthMessage);
}

void WorkerRoutes::Install(protocol::Router& router) {
    auto pageRead = [this](const HttpRequest& req, const RequestUri& uri) {
        return pageHandler_.Read(req, uri);
    };
    auto pageWrite = [this](const HttpRequest& req, const RequestUri& uri) {
        return pageHandler_.Write(req, uri);
    };

    router.Add(HttpRequest::kGet, "file", pageRead);
    router.Add(HttpRequest::kPost, "file", pageWrite);
    router.Add(HttpRequest::kPut, "file", pageWrite);
    router.Add(HttpRequest::kGet, "files", [this](const HttpRequest& req, const RequestUri& uri) {
        return fileInfoHandler_.List(req, uri);
    });
    router.Add(HttpRequest::kGet, "info", [this](const HttpRequest& req, const RequestUri& uri) {
        return fileInfoHandler_.Status(req, uri);
    });
    router.Add(HttpRequest::kGet, "load", [this](const HttpRequest& req, const RequestUri& uri) {
        return loadHandler_.Handle(req, uri);
    });
    router.Add(HttpRequest::kGet, "health", [](const HttpRequest&, const RequestUri&) {
        return Health();
    });
    router.Add(HttpRequest::kGet, "metrics", [this](const HttpRequest&, const RequestUri&) {
        return HttpResponse::Json(HttpResponse::k200Ok, metrics_.ToJson());
    });

    LOG_INFO << "WorkerRoutes: installed " << router.size() << " routes";
}

} // namespace worker
} // namespace cacheworker
