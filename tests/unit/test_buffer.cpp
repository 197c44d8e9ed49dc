#include "cacheworker/network/Buffer.h"
#include "cacheworker/common/Logger.h"

#include <cassert>
#include <string>
#include <unistd.h>

using namespace cacheworker::network;
using namespace cacheworker::common;

void testAppendRetrieve() {
    Buffer buf;
    assert(buf.ReadableBytes() == 0);
    assert(buf.Capacity() == Buffer::kInitialSize);

    buf.Append("hello world");
    assert(buf.ReadableBytes() == 11);
    assert(buf.RetrieveAsString(5) == "hello");
    assert(buf.ReadableBytes() == 6);
    assert(buf.RetrieveAllAsString() == " world");
    assert(buf.ReadableBytes() == 0);
    // Over-long retrieves just empty the buffer.
    buf.Append("ab");
    assert(buf.RetrieveAsString(10) == "ab");
    assert(buf.ReadableBytes() == 0);
    LOG_INFO << "Append/Retrieve PASS";
}

void testFindCRLF() {
    Buffer buf;
    buf.Append("GET / HTTP/1.1\r\nHost: x\r\n");
    const char* crlf = buf.FindCRLF();
    assert(crlf != nullptr);
    assert(std::string(buf.Peek(), crlf) == "GET / HTTP/1.1");
    buf.RetrieveUntil(crlf + 2);
    crlf = buf.FindCRLF();
    assert(std::string(buf.Peek(), crlf) == "Host: x");
    buf.RetrieveUntil(crlf + 2);
    assert(buf.FindCRLF() == nullptr);

    buf.Append("partial\r");
    assert(buf.FindCRLF() == nullptr);
    LOG_INFO << "FindCRLF PASS";
}

void testGrowAndCompact() {
    Buffer buf(16);
    std::string big(4000, 'x');
    buf.Append(big);
    assert(buf.ReadableBytes() == 4000);
    const size_t grown = buf.Capacity();
    assert(grown >= 4000);
    buf.Retrieve(3990);
    // Space at the front is reused rather than growing again.
    buf.Append(std::string(grown - 4000 + 100, 'y'));
    assert(buf.Capacity() == grown);
    assert(buf.ReadableBytes() == 10 + grown - 4000 + 100);
    std::string out = buf.RetrieveAllAsString();
    assert(out == std::string(10, 'x') + std::string(grown - 4000 + 100, 'y'));
    LOG_INFO << "Grow/Compact PASS";
}

void testReadFd() {
    int fds[2];
    assert(::pipe(fds) == 0);
    std::string payload(70000, 'z');
    size_t written = 0;
    // Pipe capacity is 64KiB; write what fits, read it back in one ReadFd.
    ssize_t n = ::write(fds[1], payload.data(), 60000);
    assert(n > 0);
    written = static_cast<size_t>(n);

    Buffer buf;
    int savedErrno = 0;
    ssize_t r = buf.ReadFd(fds[0], &savedErrno);
    assert(r == static_cast<ssize_t>(written));
    assert(buf.ReadableBytes() == written);
    assert(buf.RetrieveAllAsString() == payload.substr(0, written));
    ::close(fds[0]);
    ::close(fds[1]);
    LOG_INFO << "ReadFd PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testAppendRetrieve();
    testFindCRLF();
    testGrowAndCompact();
    testReadFd();
    return 0;
}
