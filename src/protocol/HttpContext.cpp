#include "cacheworker/protocol/HttpContext.h"
#include "cacheworker/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>

namespace cacheworker {
namespace protocol {

namespace {

std::string Trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// Unsigned number filling the whole string; rejects signs, junk and overflow.
bool ParseCount(const std::string& s, int base, size_t* out) {
    if (s.empty() || !std::isxdigit(static_cast<unsigned char>(s[0]))) return false;
    errno = 0;
    char* endp = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &endp, base);
    if (errno == ERANGE || *endp != '\0') return false;
    *out = static_cast<size_t>(v);
    return true;
}

bool ContainsToken(const std::string& value, const std::string& token) {
    std::string lower;
    for (char c : value) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return lower.find(token) != std::string::npos;
}

// Leaves room for the CRLF after the payload.
constexpr size_t kMaxChunkSize = std::numeric_limits<size_t>::max() - 2;

} // namespace

HttpContext::HttpContext(size_t maxHeaderBytes)
    : maxHeaderBytes_(maxHeaderBytes),
      stage_(Stage::kRequestLine),
      headerBytes_(0),
      bodyRemaining_(0) {
}

void HttpContext::Reset() {
    HttpRequest fresh;
    request_.swap(fresh);
    stage_ = Stage::kRequestLine;
    headerBytes_ = 0;
    bodyRemaining_ = 0;
    error_.clear();
}

HttpRequest HttpContext::TakeRequest() {
    HttpRequest done;
    done.swap(request_);
    Reset();
    return done;
}

bool HttpContext::Fail(const std::string& why) {
    error_ = why;
    LOG_DEBUG << "HttpContext: " << why;
    return false;
}

bool HttpContext::TakeHeaderLine(network::Buffer* buf, std::string* line, bool* complete) {
    const char* crlf = buf->FindCRLF();
    size_t used = crlf != nullptr ? static_cast<size_t>(crlf - buf->Peek()) + 2 : buf->ReadableBytes();
    if (headerBytes_ + used > maxHeaderBytes_) {
        return Fail("header section exceeds " + std::to_string(maxHeaderBytes_) + " bytes");
    }
    *complete = crlf != nullptr;
    if (*complete) {
        line->assign(buf->Peek(), crlf);
        buf->RetrieveUntil(crlf + 2);
        headerBytes_ += used;
    }
    return true;
}

// METHOD SP target SP HTTP/1.x
bool HttpContext::OnRequestLine(const std::string& line) {
    size_t sp1 = line.find(' ');
    if (sp1 == std::string::npos || !request_.setMethod(line.substr(0, sp1))) {
        return Fail("bad method in request line");
    }
    size_t sp2 = line.find(' ', sp1 + 1);
    if (sp2 == std::string::npos || sp2 == sp1 + 1) {
        return Fail("missing request target");
    }
    request_.setTarget(line.substr(sp1 + 1, sp2 - sp1 - 1));

    const std::string version = line.substr(sp2 + 1);
    if (version == "HTTP/1.1") {
        request_.setVersion(HttpRequest::kHttp11);
    } else if (version == "HTTP/1.0") {
        request_.setVersion(HttpRequest::kHttp10);
    } else {
        return Fail("unsupported protocol version '" + version + "'");
    }
    stage_ = Stage::kHeaders;
    return true;
}

bool HttpContext::OnHeaderLine(const std::string& line) {
    size_t colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
        return Fail("header line without field name");
    }
    request_.setHeader(line.substr(0, colon), Trim(line.substr(colon + 1)));
    return true;
}

bool HttpContext::OnHeadersDone() {
    if (ContainsToken(request_.getHeader("Transfer-Encoding"), "chunked")) {
        stage_ = Stage::kChunkSize;
        return true;
    }
    bodyRemaining_ = 0;
    if (request_.hasHeader("Content-Length") &&
        !ParseCount(Trim(request_.getHeader("Content-Length")), 10, &bodyRemaining_)) {
        return Fail("bad Content-Length '" + request_.getHeader("Content-Length") + "'");
    }
    stage_ = bodyRemaining_ > 0 ? Stage::kFixedBody : Stage::kDone;
    return true;
}

bool HttpContext::OnChunkSize(const std::string& line) {
    // Chunk extensions are ignored.
    std::string size = Trim(line.substr(0, line.find(';')));
    if (!ParseCount(size, 16, &bodyRemaining_)) {
        return Fail("bad chunk size '" + line + "'");
    }
    if (bodyRemaining_ > kMaxChunkSize) {
        return Fail("chunk too large '" + size + "'");
    }
    stage_ = bodyRemaining_ == 0 ? Stage::kTrailers : Stage::kChunkData;
    return true;
}

HttpContext::Status HttpContext::Feed(network::Buffer* buf) {
    if (!error_.empty()) {
        return Status::kError;
    }
    std::string line;
    bool complete = false;
    while (stage_ != Stage::kDone) {
        switch (stage_) {
            case Stage::kRequestLine:
            case Stage::kHeaders:
            case Stage::kTrailers:
                if (!TakeHeaderLine(buf, &line, &complete)) return Status::kError;
                if (!complete) return Status::kNeedMore;
                if (stage_ == Stage::kRequestLine) {
                    if (!OnRequestLine(line)) return Status::kError;
                } else if (!line.empty()) {
                    // Trailer fields are read and dropped.
                    if (stage_ == Stage::kHeaders && !OnHeaderLine(line)) return Status::kError;
                } else if (stage_ == Stage::kHeaders) {
                    if (!OnHeadersDone()) return Status::kError;
                } else {
                    stage_ = Stage::kDone;
                }
                break;

            case Stage::kChunkSize: {
                const char* crlf = buf->FindCRLF();
                if (crlf == nullptr) return Status::kNeedMore;
                line.assign(buf->Peek(), crlf);
                buf->RetrieveUntil(crlf + 2);
                if (!OnChunkSize(line)) return Status::kError;
                break;
            }

            case Stage::kChunkData: {
                // Chunk payload plus its trailing CRLF.
                if (buf->ReadableBytes() < 2 || buf->ReadableBytes() - 2 < bodyRemaining_) {
                    return Status::kNeedMore;
                }
                const char* tail = buf->Peek() + bodyRemaining_;
                if (tail[0] != '\r' || tail[1] != '\n') {
                    Fail("chunk not terminated by CRLF");
                    return Status::kError;
                }
                request_.appendBody(buf->Peek(), bodyRemaining_);
                buf->Retrieve(bodyRemaining_ + 2);
                bodyRemaining_ = 0;
                stage_ = Stage::kChunkSize;
                break;
            }

            case Stage::kFixedBody: {
                size_t n = std::min(bodyRemaining_, buf->ReadableBytes());
                request_.appendBody(buf->Peek(), n);
                buf->Retrieve(n);
                bodyRemaining_ -= n;
                if (bodyRemaining_ > 0) return Status::kNeedMore;
                stage_ = Stage::kDone;
                break;
            }

            case Stage::kDone:
                break;
        }
    }
    return Status::kComplete;
}

} // namespace protocol
} // namespace cacheworker
