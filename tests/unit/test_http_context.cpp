#include "cacheworker/protocol/HttpContext.h"
#include "cacheworker/network/Buffer.h"
#include "cacheworker/common/Logger.h"

#include <cassert>
#include <string>

using namespace cacheworker::protocol;
using namespace cacheworker::network;
using namespace cacheworker::common;

using Status = HttpContext::Status;

static Status Feed(HttpContext& context, Buffer& buf, const std::string& bytes) {
    buf.Append(bytes);
    return context.Feed(&buf);
}

void testRequestArrivingInPieces() {
    HttpContext context;
    Buffer buf;

    assert(Feed(context, buf, "GET /file/abc/page/0?offset=10 HT") == Status::kNeedMore);
    assert(Feed(context, buf, "TP/1.1\r\nHost: ") == Status::kNeedMore);
    assert(Feed(context, buf, "localhost\r\nUser-Agent:   curl/7.68.0  \r\n\r\n") == Status::kComplete);

    HttpRequest req = context.TakeRequest();
    assert(req.getMethod() == HttpRequest::kGet);
    assert(req.methodString() == "GET");
    assert(req.path() == "/file/abc/page/0");
    assert(req.query() == "?offset=10");
    assert(req.target() == "/file/abc/page/0?offset=10");
    assert(req.getVersion() == HttpRequest::kHttp11);
    assert(req.getHeader("host") == "localhost");
    assert(req.getHeader("USER-AGENT") == "curl/7.68.0");
    assert(req.body().empty());
    // Taken requests leave a fresh decoder behind.
    assert(context.request().path().empty());
    LOG_INFO << "Request in pieces PASS";
}

void testFixedBodyAndPipelining() {
    HttpContext context;
    Buffer buf;
    assert(Feed(context, buf,
        "POST /file/abc/page/1 HTTP/1.1\r\n"
        "Content-Length: 10\r\n"
        "\r\n"
        "hello") == Status::kNeedMore);
    assert(Feed(context, buf, "worldGET /health HTTP/1.1\r\n\r\n") == Status::kComplete);
    HttpRequest post = context.TakeRequest();
    assert(post.getMethod() == HttpRequest::kPost);
    assert(post.body() == "helloworld");
    // The pipelined request is still buffered.
    assert(buf.ReadableBytes() == std::string("GET /health HTTP/1.1\r\n\r\n").size());

    assert(context.Feed(&buf) == Status::kComplete);
    assert(context.TakeRequest().path() == "/health");
    assert(buf.ReadableBytes() == 0);
    assert(context.Feed(&buf) == Status::kNeedMore);
    LOG_INFO << "Fixed body/pipelining PASS";
}

void testChunkedBody() {
    HttpContext context;
    Buffer buf;
    assert(Feed(context, buf,
        "PUT /file/abc/page/0 HTTP/1.1\r\n"
        "Transfer-Encoding: Chunked\r\n"
        "\r\n"
        "5\r\nhello\r\n"
        "6;ext=1\r\n wor") == Status::kNeedMore);
    assert(Feed(context, buf, "ld\r\n0\r\nX-Trailer: t\r\n") == Status::kNeedMore);
    assert(Feed(context, buf, "\r\n") == Status::kComplete);
    HttpRequest put = context.TakeRequest();
    assert(put.getMethod() == HttpRequest::kPut);
    assert(put.body() == "hello world");
    // Trailer fields are not merged into the headers.
    assert(!put.hasHeader("X-Trailer"));
    assert(buf.ReadableBytes() == 0);
    LOG_INFO << "Chunked body PASS";
}

void testOtherMethodsAndVersions() {
    HttpContext context;
    Buffer buf;
    assert(Feed(context, buf, "PATCH /health HTTP/1.0\r\n\r\n") == Status::kComplete);
    const HttpRequest& req = context.request();
    assert(req.getMethod() == HttpRequest::kOther);
    assert(req.methodString() == "PATCH");
    assert(req.getVersion() == HttpRequest::kHttp10);
    assert(!req.keepAlive());
    LOG_INFO << "Other methods/versions PASS";
}

void testKeepAlive() {
    HttpRequest req;
    req.setVersion(HttpRequest::kHttp11);
    assert(req.keepAlive());
    req.setHeader("Connection", "Close");
    assert(!req.keepAlive());

    HttpRequest old;
    old.setVersion(HttpRequest::kHttp10);
    assert(!old.keepAlive());
    old.setHeader("connection", "Keep-Alive");
    assert(old.keepAlive());
    LOG_INFO << "Keep-Alive PASS";
}

void testMalformed() {
    const char* bad[] = {
        "GARBAGE\r\n\r\n",
        "get / HTTP/1.1\r\n\r\n",
        "GET / HTTP/2.0\r\n\r\n",
        "GET  HTTP/1.1\r\n\r\n",
        "GET / HTTP/1.1\r\nNoColonHere\r\n\r\n",
        "GET / HTTP/1.1\r\n: empty-name\r\n\r\n",
        "POST / HTTP/1.1\r\nContent-Length: abc\r\n\r\n",
        "POST / HTTP/1.1\r\nContent-Length: -1\r\n\r\n",
        "POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n",
        "POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabcXY",
    };
    for (const char* input : bad) {
        HttpContext context;
        Buffer buf;
        assert(Feed(context, buf, input) == Status::kError);
        assert(!context.error().empty());
        // The decoder stays failed until reset.
        assert(context.Feed(&buf) == Status::kError);
    }

    HttpContext context;
    Buffer buf;
    assert(Feed(context, buf, "GET / HTTP/3\r\n\r\n") == Status::kError);
    assert(context.error().find("HTTP/3") != std::string::npos);
    context.Reset();
    buf.RetrieveAll();
    assert(Feed(context, buf, "GET / HTTP/1.1\r\n\r\n") == Status::kComplete);
    LOG_INFO << "Malformed requests PASS";
}

void testHeaderLimit() {
    HttpContext context(64);
    Buffer buf;
    assert(Feed(context, buf, "GET / HTTP/1.1\r\nX-Pad: " + std::string(30, 'a') + "\r\n") == Status::kNeedMore);
    assert(Feed(context, buf, "X-More: " + std::string(30, 'b') + "\r\n\r\n") == Status::kError);
    assert(context.error().find("exceeds 64") != std::string::npos);

    // An unterminated line may not grow past the limit either.
    HttpContext endless(64);
    Buffer pending;
    assert(Feed(endless, pending, "GET /" + std::string(100, 'x')) == Status::kError);

    // The body does not count against the header limit.
    HttpContext bodyOk(64);
    Buffer big;
    assert(Feed(bodyOk, big, "POST / HTTP/1.1\r\nContent-Length: 200\r\n\r\n" + std::string(200, 'z')) ==
           Status::kComplete);
    assert(bodyOk.request().body().size() == 200);
    LOG_INFO << "Header limit PASS";
}

void testOversizedChunk() {
    const std::string head = "POST /file/abc/page/0 HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n";

    HttpContext context;
    Buffer buf;
    assert(Feed(context, buf, head + "fffffffffffffffe\r\nX") == Status::kError);
    assert(context.error().find("chunk too large") != std::string::npos);
    assert(context.request().body().empty());

    // Largest accepted size just waits for the payload.
    HttpContext waiting;
    Buffer partial;
    assert(Feed(waiting, partial, head + "fffffffffffffffd\r\n") == Status::kNeedMore);
    assert(Feed(waiting, partial, "X") == Status::kNeedMore);
    assert(Feed(waiting, partial, "Y") == Status::kNeedMore);
    assert(waiting.request().body().empty());
    assert(partial.ReadableBytes() == 2);

    HttpContext overflow;
    Buffer more;
    assert(Feed(overflow, more, head + "10000000000000000\r\n") == Status::kError);
    LOG_INFO << "Oversized chunk PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);
    testRequestArrivingInPieces();
    testFixedBodyAndPipelining();
    testChunkedBody();
    testOtherMethodsAndVersions();
    testKeepAlive();
    testMalformed();
    testHeaderLimit();
    testOversizedChunk();
    return 0;
}
