#include "cacheworker/worker/PageHandlers.h"
#include "cacheworker/common/Json.h"
#include "cacheworker/common/Logger.h"
#include "cacheworker/protocol/HttpError.h"
#include "cacheworker/worker/WorkerMetrics.h"

namespace cacheworker {
namespace worker {

using protocol::HttpRequest;
using protocol::HttpResponse;
using protocol::RequestUri;

WriteOutcome WriteOutcome::MissingBody() {
    return WriteOutcome{false, "The HTTP request doesn't have body content"};
}

std::string WriteOutcome::ToJson() const {
    return std::string("{\"success\":") + (success ? "true" : "false") +
           ",\"message\":" + common::JsonString(message) + "}";
}

PageHandler::PageHandler(PagedService& pages, FileSystem& fs, monitor::Metrics& metrics)
    : pages_(pages),
      fs_(fs),
      bytesRequested_(metrics.GetCounter(kMetricBytesRequested)),
      bytesServed_(metrics.GetCounter(kMetricBytesReadCache)) {
}

PageHandler::PageAddress PageHandler::ParseAddress(const RequestUri& uri) {
    const auto& segments = uri.remainingSegments();
    if (segments.size() < 3 || segments[1] != "page") {
        throw protocol::MalformedRequestError("Expected /file/{id}/page/{index}");
    }
    PageAddress address;
    address.fileId = segments[0];
    address.pageIndex = protocol::ParseInt64(segments[2], "page index");
    if (address.pageIndex < 0) {
        throw protocol::MalformedRequestError("Negative page index " + segments[2]);
    }
    return address;
}

HttpResponse PageHandler::Read(const HttpRequest& request, const RequestUri& uri) {
    (void)request;
    PageAddress address = ParseAddress(uri);
    const std::int64_t pageSize = pages_.PageSize();

    std::int64_t offset = 0;
    std::int64_t length = pageSize;
    auto offsetParam = uri.getInt64Parameter("offset");
    auto lengthParam = uri.getInt64Parameter("length");
    if (offsetParam) {
        offset = *offsetParam;
        if (offset < 0 || offset > pageSize) {
            throw protocol::MalformedRequestError("Offset " + std::to_string(offset) +
                                                  " outside page of " + std::to_string(pageSize) + " bytes");
        }
        length = pageSize - offset;
    }
    if (lengthParam) {
        length = *lengthParam;
        if (length < 0 || length > pageSize) {
            throw protocol::MalformedRequestError("Invalid length " + std::to_string(length));
        }
    }
    // A page never extends past its own end.
    if (offset + length > pageSize) {
        length = pageSize - offset;
    }

    bytesRequested_.Inc(length);

    auto location = pages_.LocatePage(address.fileId, address.pageIndex);
    if (!location) {
        throw protocol::PageNotFoundError("Page " + std::to_string(address.pageIndex) +
                                          " of " + address.fileId + " is not cached");
    }

    std::string data(static_cast<size_t>(length), '\0');
    std::int64_t bytesRead = 0;
    try {
        FileSystem& source = location->source ? *location->source : fs_;
        std::unique_ptr<PositionReader> reader = source.OpenPositionRead(location->backingPath);
        bytesRead = reader->Read(location->baseOffset + offset, &data[0], length);
    } catch (const FileNotFoundError& e) {
        throw protocol::PageNotFoundError(e.what());
    } catch (const FileSystemError& e) {
        LOG_ERROR << "PageHandler: reading " << location->backingPath << " failed: " << e.what();
        throw protocol::BackendIOError(std::string("Failed to read page: ") + e.what());
    }
    if (bytesRead < 0) {
        throw protocol::PageNotFoundError("Page " + std::to_string(address.pageIndex) + " of " +
                                          address.fileId + " has no data at offset " + std::to_string(offset));
    }
    data.resize(static_cast<size_t>(bytesRead));

    bytesServed_.Inc(length);

    HttpResponse response(HttpResponse::k200Ok);
    response.setContentType("text/plain");
    response.setPayload(std::move(data));
    return response;
}

HttpResponse PageHandler::Write(const HttpRequest& request, const RequestUri& uri) {
    WriteOutcome outcome;
    if (request.body().empty()) {
        outcome = WriteOutcome::MissingBody();
    } else {
        try {
            PageAddress address = ParseAddress(uri);
            if (pages_.WritePage(address.fileId, address.pageIndex, request.body())) {
                outcome = WriteOutcome{true, "Page written successfully"};
            } else {
                outcome = WriteOutcome{false, "Failed to write page"};
            }
        } catch (const protocol::MalformedRequestError& e) {
            outcome = WriteOutcome{false, std::string("Failed to write page: ") + e.what()};
        } catch (const std::exception& e) {
            LOG_ERROR << "PageHandler: write " << request.target() << " failed: " << e.what();
            outcome = WriteOutcome{false, std::string("Failed to write page: ") + e.what()};
        }
    }
    return HttpResponse::Json(HttpResponse::k200Ok, outcome.ToJson());
}

} // namespace worker
} // namespace cacheworker
