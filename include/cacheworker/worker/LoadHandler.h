#pragma once

#include "cacheworker/protocol/HttpRequest.h"
#include "cacheworker/protocol/HttpResponse.h"
#include "cacheworker/protocol/RequestUri.h"
#include "cacheworker/worker/LoadOptions.h"
#include "cacheworker/worker/LoadService.h"

namespace cacheworker {
namespace worker {

// GET /load: hands path and options to the LoadService and returns its
// status string verbatim as text/plain.
class LoadHandler {
public:
    explicit LoadHandler(LoadService& loader);

    protocol::HttpResponse Handle(const protocol::HttpRequest& request, const protocol::RequestUri& uri);

    // Options from whichever query parameters are present. Throws
    // MalformedRequestError for an unknown opType, progressFormat or a bad bandwidth.
    static LoadOptions BuildOptions(const protocol::RequestUri& uri);

private:
    LoadService& loader_;
};

} // namespace worker
} // namespace cacheworker
