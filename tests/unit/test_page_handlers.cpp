#include "FakeBackends.h"

#include "cacheworker/common/Logger.h"
#include "cacheworker/monitor/Metrics.h"
#include "cacheworker/protocol/HttpError.h"
#include "cacheworker/worker/PageHandlers.h"
#include "cacheworker/worker/WorkerMetrics.h"

#include <cassert>
#include <string>

using namespace cacheworker;
using namespace cacheworker::protocol;
using namespace cacheworker::worker;
using namespace cacheworker::common;

static const std::string kPage = "abcdefghijklmnopqrst"; // 20 bytes

struct Fixture {
    fakes::MemoryFileSystem fs;
    fakes::MemoryPageStore pages{fs, 20};
    monitor::Metrics metrics;
    PageHandler handler{pages, fs, metrics};

    Fixture() {
        RegisterHttpMetrics(metrics);
        pages.WritePage("abc", 0, kPage);
        pages.WritePage("abc", 1, "tail");
    }

    std::int64_t requested() { return *metrics.CounterValue(kMetricBytesRequested); }
    std::int64_t served() { return *metrics.CounterValue(kMetricBytesReadCache); }
};

static HttpRequest Get(const std::string& target) {
    HttpRequest req;
    req.setMethod(HttpRequest::kGet);
    req.setVersion(HttpRequest::kHttp11);
    size_t q = target.find('?');
    req.setPath(target.substr(0, q));
    if (q != std::string::npos) req.setQuery(target.substr(q));
    return req;
}

static HttpResponse Read(Fixture& f, const std::string& target) {
    HttpRequest req = Get(target);
    return f.handler.Read(req, RequestUri::Parse(target));
}

template <typename E>
static bool ReadThrows(Fixture& f, const std::string& target) {
    try {
        Read(f, target);
    } catch (const E&) {
        return true;
    }
    return false;
}

void testReadRange() {
    Fixture f;
    HttpResponse resp = Read(f, "/file/abc/page/0?offset=10&length=5");
    assert(resp.statusCode() == HttpResponse::k200Ok);
    assert(!resp.isFullyBuffered());
    assert(*resp.payload() == "klmno");
    assert(resp.getHeader("Content-Type") == "text/plain");
    assert(resp.getHeader("Content-Length") == "5");
    assert(f.requested() == 5);
    assert(f.served() == 5);
    LOG_INFO << "Read range PASS";
}

void testReadDefaults() {
    Fixture f;
    assert(*Read(f, "/file/abc/page/0").payload() == kPage);
    // Offset alone reads to the end of the page.
    assert(*Read(f, "/file/abc/page/0?offset=15").payload() == "pqrst");
    // Length alone starts at 0.
    assert(*Read(f, "/file/abc/page/0?length=3").payload() == "abc");
    // A range running past the page end is cut at the end.
    assert(*Read(f, "/file/abc/page/0?offset=18&length=10").payload() == "st");
    assert(*Read(f, "/file/abc/page/0?offset=20").payload() == "");
    // Short last page.
    assert(*Read(f, "/file/abc/page/1").payload() == "tail");
    assert(f.requested() == 20 + 5 + 3 + 2 + 0 + 20);
    LOG_INFO << "Read defaults PASS";
}

void testReadBadAddress() {
    Fixture f;
    assert(ReadThrows<MalformedRequestError>(f, "/file/abc"));
    assert(ReadThrows<MalformedRequestError>(f, "/file/abc/pages/0"));
    assert(ReadThrows<MalformedRequestError>(f, "/file/abc/page/zero"));
    assert(ReadThrows<MalformedRequestError>(f, "/file/abc/page/-1"));
    assert(ReadThrows<MalformedRequestError>(f, "/file/abc/page/0?offset=-1"));
    assert(ReadThrows<MalformedRequestError>(f, "/file/abc/page/0?offset=21"));
    assert(ReadThrows<MalformedRequestError>(f, "/file/abc/page/0?length=-5"));
    assert(ReadThrows<MalformedRequestError>(f, "/file/abc/page/0?length=21"));
    assert(ReadThrows<MalformedRequestError>(f, "/file/abc/page/0?offset=ten"));
    assert(f.requested() == 0);
    LOG_INFO << "Read bad address PASS";
}

void testReadNotFound() {
    Fixture f;
    assert(ReadThrows<PageNotFoundError>(f, "/file/abc/page/7"));
    assert(ReadThrows<PageNotFoundError>(f, "/file/nope/page/0"));
    // Requested bytes are counted even when the page is missing.
    assert(f.requested() == 40);
    assert(f.served() == 0);
    assert(*f.metrics.GaugeValue(kMetricCacheHitRate) == 0.0);
    LOG_INFO << "Read not found PASS";
}

void testReadBackendFailure() {
    Fixture f;
    f.fs.FailPath(fakes::MemoryPageStore::BackingPath("abc"), "EIO");
    bool threw = false;
    try {
        Read(f, "/file/abc/page/0");
    } catch (const BackendIOError& e) {
        threw = true;
        assert(e.status() == HttpResponse::k500InternalServerError);
        assert(std::string(e.what()).find("EIO") != std::string::npos);
    }
    assert(threw);
    LOG_INFO << "Read backend failure PASS";
}

void testHitRate() {
    Fixture f;
    Read(f, "/file/abc/page/0?length=10");
    assert(ReadThrows<PageNotFoundError>(f, "/file/abc/page/9?length=10"));
    assert(*f.metrics.GaugeValue(kMetricCacheHitRate) == 0.5);
    LOG_INFO << "Hit rate PASS";
}

static HttpResponse Write(Fixture& f, const std::string& target, const std::string& body) {
    HttpRequest req = Get(target);
    req.setMethod(HttpRequest::kPost);
    req.setBody(body);
    return f.handler.Write(req, RequestUri::Parse(target));
}

void testWrite() {
    Fixture f;
    HttpResponse ok = Write(f, "/file/xyz/page/2", "payload");
    assert(ok.statusCode() == HttpResponse::k200Ok);
    assert(ok.getHeader("Content-Type") == "application/json");
    assert(ok.body() == "{\"success\":true,\"message\":\"Page written successfully\"}");
    assert(*f.pages.Page("xyz", 2) == "payload");

    HttpResponse missing = Write(f, "/file/xyz/page/3", "");
    assert(missing.statusCode() == HttpResponse::k200Ok);
    assert(missing.body() == "{\"success\":false,\"message\":\"The HTTP request doesn't have body content\"}");
    assert(!f.pages.Page("xyz", 3));

    f.pages.setWriteMode(fakes::MemoryPageStore::WriteMode::kDecline);
    HttpResponse declined = Write(f, "/file/xyz/page/4", "data");
    assert(declined.statusCode() == HttpResponse::k200Ok);
    assert(declined.body() == "{\"success\":false,\"message\":\"Failed to write page\"}");

    f.pages.setWriteMode(fakes::MemoryPageStore::WriteMode::kThrow);
    HttpResponse failed = Write(f, "/file/xyz/page/5", "data");
    assert(failed.statusCode() == HttpResponse::k200Ok);
    assert(failed.body() == "{\"success\":false,\"message\":\"Failed to write page: store is read-only\"}");

    // Address errors are reported in the body as well.
    f.pages.setWriteMode(fakes::MemoryPageStore::WriteMode::kStore);
    HttpResponse badIndex = Write(f, "/file/xyz/page/x", "data");
    assert(badIndex.statusCode() == HttpResponse::k200Ok);
    assert(badIndex.body().find("\"success\":false") != std::string::npos);
    LOG_INFO << "Write PASS";
}

void testWriteThenRead() {
    Fixture f;
    Write(f, "/file/fresh/page/0", "hello page");
    HttpResponse resp = Read(f, "/file/fresh/page/0?offset=6");
    assert(*resp.payload() == "page");
    LOG_INFO << "Write then read PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::FATAL);
    testReadRange();
    testReadDefaults();
    testReadBadAddress();
    testReadNotFound();
    testReadBackendFailure();
    testHitRate();
    testWrite();
    testWriteThenRead();
    return 0;
}
