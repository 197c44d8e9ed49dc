#include "cacheworker/worker/FileInfoHandlers.h"
#include "cacheworker/common/Logger.h"
#include "cacheworker/protocol/HttpError.h"
#include "cacheworker/worker/FileEntry.h"

namespace cacheworker {
namespace worker {

using protocol::HttpRequest;
using protocol::HttpResponse;
using protocol::RequestUri;

namespace {

std::string RequiredPath(const RequestUri& uri) {
    auto path = uri.getParameter("path");
    if (!path || path->empty()) {
        throw protocol::MalformedRequestError("Missing 'path' parameter");
    }
    return protocol::DecodeReservedCharacters(*path);
}

} // namespace

FileInfoHandler::FileInfoHandler(FileSystem& fs)
    : fs_(fs) {
}

HttpResponse FileInfoHandler::List(const HttpRequest& request, const RequestUri& uri) {
    (void)request;
    const std::string path = RequiredPath(uri);
    std::vector<FileEntry> entries;
    try {
        for (const FileStatus& status : fs_.ListStatus(path)) {
            entries.push_back(FileEntry::FromStatus(status));
        }
    } catch (const FileSystemError& e) {
        LOG_ERROR << "FileInfoHandler: list " << path << " failed: " << e.what();
        throw protocol::BackendIOError("Failed to list " + path + ": " + e.what());
    }
    return HttpResponse::Json(HttpResponse::k200Ok, FileEntry::ToJsonArray(entries));
}

HttpResponse FileInfoHandler::Status(const HttpRequest& request, const RequestUri& uri) {
    (void)request;
    const std::string path = RequiredPath(uri);
    std::vector<FileEntry> entries;
    try {
        entries.push_back(FileEntry::FromStatus(fs_.GetStatus(path)));
    } catch (const FileSystemError& e) {
        LOG_ERROR << "FileInfoHandler: status " << path << " failed: " << e.what();
        throw protocol::BackendIOError("Failed to get status of " + path + ": " + e.what());
    }
    return HttpResponse::Json(HttpResponse::k200Ok, FileEntry::ToJsonArray(entries));
}

} // namespace worker
} // namespace cacheworker
