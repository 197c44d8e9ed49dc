#pragma once

#include "cacheworker/monitor/Metrics.h"
#include "cacheworker/protocol/HttpRequest.h"
#include "cacheworker/protocol/HttpResponse.h"
#include "cacheworker/protocol/RequestUri.h"
#include "cacheworker/worker/FileSystem.h"
#include "cacheworker/worker/PagedService.h"

#include <cstdint>
#include <string>

namespace cacheworker {
namespace worker {

// Result of a page write, returned as the JSON body of a 200 response.
struct WriteOutcome {
    bool success{false};
    std::string message;

    static WriteOutcome MissingBody();

    std::string ToJson() const;
};

// GET and POST/PUT on /file/{id}/page/{index}.
class PageHandler {
public:
    PageHandler(PagedService& pages, FileSystem& fs, monitor::Metrics& metrics);

    // Streams [offset, offset + length) of the page. Throws
    // MalformedRequestError for a bad address or range and PageNotFoundError
    // when the page is not available.
    protocol::HttpResponse Read(const protocol::HttpRequest& request, const protocol::RequestUri& uri);

    // Never throws for store failures; they are reported in the body.
    protocol::HttpResponse Write(const protocol::HttpRequest& request, const protocol::RequestUri& uri);

private:
    struct PageAddress {
        std::string fileId;
        std::int64_t pageIndex{0};
    };

    static PageAddress ParseAddress(const protocol::RequestUri& uri);

    PagedService& pages_;
    FileSystem& fs_;
    monitor::Counter& bytesRequested_;
    monitor::Counter& bytesServed_;
};

} // namespace worker
} // namespace cacheworker
