#pragma once

#include "cacheworker/network/Buffer.h"
#include "cacheworker/protocol/HttpRequest.h"

#include <cstddef>
#include <string>

namespace cacheworker {
namespace protocol {

// Incremental HTTP/1.x request decoder. Each Feed consumes only bytes that
// belong to the current request; pipelined followers stay in the buffer.
class HttpContext {
public:
    enum class Status { kNeedMore, kComplete, kError };

    static constexpr size_t kDefaultMaxHeaderBytes = 64 * 1024;

    explicit HttpContext(size_t maxHeaderBytes = kDefaultMaxHeaderBytes);

    Status Feed(network::Buffer* buf);

    // Reason for the last kError.
    const std::string& error() const { return error_; }

    const HttpRequest& request() const { return request_; }
    // Hands over the completed request and readies the decoder for the next one.
    HttpRequest TakeRequest();
    void Reset();

private:
    enum class Stage {
        kRequestLine,
        kHeaders,
        kFixedBody,
        kChunkSize,
        kChunkData,
        kTrailers,
        kDone,
    };

    // Each returns false on a protocol error, with error_ set.
    bool OnRequestLine(const std::string& line);
    bool OnHeaderLine(const std::string& line);
    bool OnHeadersDone();
    bool OnChunkSize(const std::string& line);

    // Pops one CRLF-terminated line from the header section, counting it against the limit.
    bool TakeHeaderLine(network::Buffer* buf, std::string* line, bool* complete);
    bool Fail(const std::string& why);

    const size_t maxHeaderBytes_;
    Stage stage_;
    HttpRequest request_;
    size_t headerBytes_;
    size_t bodyRemaining_;
    std::string error_;
};

} // namespace protocol
} // namespace cacheworker
