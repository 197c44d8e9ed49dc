#include "FakeBackends.h"

#include "cacheworker/common/Logger.h"
#include "cacheworker/protocol/HttpError.h"
#include "cacheworker/worker/LoadHandler.h"

#include <cassert>
#include <string>

using namespace cacheworker::protocol;
using namespace cacheworker::worker;
using namespace cacheworker::common;

static HttpResponse Call(LoadHandler& handler, const std::string& target) {
    HttpRequest req;
    req.setMethod(HttpRequest::kGet);
    return handler.Handle(req, RequestUri::Parse(target));
}

template <typename E>
static bool Throws(LoadHandler& handler, const std::string& target) {
    try {
        Call(handler, target);
    } catch (const E&) {
        return true;
    }
    return false;
}

void testSubmit() {
    fakes::RecordingLoadService loader;
    LoadHandler handler(loader);

    HttpResponse resp = Call(handler, "/load?path=%2Ftmp%2Fdata&verify=true&bandwidth=1000");
    assert(resp.statusCode() == HttpResponse::k200Ok);
    assert(resp.getHeader("Content-Type") == "text/plain");
    assert(resp.body() == "Load '/tmp/data' is successfully submitted.");

    assert(loader.calls.size() == 1);
    const std::string& path = loader.calls[0].first;
    const LoadOptions& options = loader.calls[0].second;
    assert(path == "/tmp/data");
    assert(options.verify());
    assert(options.bandwidth() && *options.bandwidth() == 1000);
    assert(!options.opType());
    assert(!options.partialListing());
    assert(!options.verbose());
    assert(!options.loadMetadataOnly());
    assert(!options.skipIfExists());
    assert(!options.fileFilterPattern());
    assert(options.progressFormat() == LoadOptions::kDefaultProgressFormat);
    LOG_INFO << "Submit PASS";
}

void testAllOptions() {
    RequestUri uri = RequestUri::Parse(
        "/load?path=%2Fx&opType=progress&partialListing=TRUE&verbose=true&loadMetadataOnly=true"
        "&skipIfExists=true&fileFilterRegx=.*%5C.parquet&progressFormat=json&verify=no");
    LoadOptions options = LoadHandler::BuildOptions(uri);
    assert(options.opType() && *options.opType() == OpType::PROGRESS);
    assert(options.partialListing());
    assert(options.verbose());
    assert(options.loadMetadataOnly());
    assert(options.skipIfExists());
    assert(!options.verify());
    assert(*options.fileFilterPattern() == ".*%5C.parquet");
    assert(options.progressFormat() == "json");
    assert(!options.bandwidth());

    std::string text = options.ToString();
    assert(text.find("PROGRESS") != std::string::npos);

    assert(*ParseOpType("submit") == OpType::SUBMIT);
    assert(*ParseOpType("Stop") == OpType::STOP);
    assert(!ParseOpType("restart"));
    assert(std::string(OpTypeName(OpType::STOP)) == "STOP");
    LOG_INFO << "All options PASS";
}

void testRejected() {
    fakes::RecordingLoadService loader;
    LoadHandler handler(loader);
    assert(Throws<MalformedRequestError>(handler, "/load"));
    assert(Throws<MalformedRequestError>(handler, "/load?path="));
    assert(Throws<MalformedRequestError>(handler, "/load?path=%2Fx&opType=restart"));
    assert(Throws<MalformedRequestError>(handler, "/load?path=%2Fx&bandwidth=fast"));
    assert(Throws<MalformedRequestError>(handler, "/load?path=%2Fx&bandwidth=0"));
    assert(Throws<MalformedRequestError>(handler, "/load?path=%2Fx&progressFormat=xml"));
    assert(loader.calls.empty());

    loader.fail = true;
    assert(Throws<BackendIOError>(handler, "/load?path=%2Fx"));
    LOG_INFO << "Rejected PASS";
}

void testStatusPassedThrough() {
    fakes::RecordingLoadService loader;
    loader.reply = "Load for path '/x' cannot be found.";
    LoadHandler handler(loader);
    HttpResponse resp = Call(handler, "/load?path=%2Fx&opType=PROGRESS");
    assert(resp.statusCode() == HttpResponse::k200Ok);
    assert(resp.body() == loader.reply);
    assert(*loader.calls[0].second.opType() == OpType::PROGRESS);
    LOG_INFO << "Status passed through PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::FATAL);
    testSubmit();
    testAllOptions();
    testRejected();
    testStatusPassedThrough();
    return 0;
}
