#pragma once

#include "cacheworker/protocol/HttpRequest.h"
#include "cacheworker/protocol/HttpResponse.h"
#include "cacheworker/protocol/RequestUri.h"
#include "cacheworker/worker/FileSystem.h"

namespace cacheworker {
namespace worker {

// GET /files and GET /info. Both answer with a JSON array of FileEntry;
// file system failures become BackendIOError.
class FileInfoHandler {
public:
    explicit FileInfoHandler(FileSystem& fs);

    protocol::HttpResponse List(const protocol::HttpRequest& request, const protocol::RequestUri& uri);
    protocol::HttpResponse Status(const protocol::HttpRequest& request, const protocol::RequestUri& uri);

private:
    FileSystem& fs_;
};

} // namespace worker
} // namespace cacheworker
