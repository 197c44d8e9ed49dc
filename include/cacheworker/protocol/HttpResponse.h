#pragma once

#include "cacheworker/network/Buffer.h"
#include "cacheworker/protocol/HttpRequest.h"

#include <map>
#include <optional>
#include <string>

namespace cacheworker {
namespace protocol {

// Status line, headers and either a fully buffered body or a payload that is
// streamed right after the headers. One per request.
class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k200Ok = 200,
        k400BadRequest = 400,
        k404NotFound = 404,
        k405MethodNotAllowed = 405,
        k500InternalServerError = 500,
    };

    HttpResponse()
        : statusCode_(kUnknown),
          version_(HttpRequest::kHttp11),
          closeConnection_(false) {}

    explicit HttpResponse(HttpStatusCode code)
        : HttpResponse() {
        setStatusCode(code);
    }

    // Also resets the reason phrase to the standard one for code.
    void setStatusCode(HttpStatusCode code) {
        statusCode_ = code;
        statusMessage_ = ReasonPhrase(code);
    }
    HttpStatusCode statusCode() const { return statusCode_; }

    void setStatusMessage(const std::string& message) { statusMessage_ = message; }
    const std::string& statusMessage() const { return statusMessage_; }

    void setVersion(HttpRequest::Version v) { version_ = v; }
    HttpRequest::Version version() const { return version_; }

    void setCloseConnection(bool on) { closeConnection_ = on; }
    bool closeConnection() const { return closeConnection_; }

    void setContentType(const std::string& contentType) { addHeader("Content-Type", contentType); }

    void addHeader(const std::string& key, const std::string& value) {
        headers_[key] = value;
    }
    std::string getHeader(const std::string& key) const {
        auto it = headers_.find(key);
        return it == headers_.end() ? std::string() : it->second;
    }
    const std::map<std::string, std::string>& headers() const { return headers_; }

    // Fully buffered body.
    void setBody(std::string body);
    const std::string& body() const { return body_; }

    // Body streamed after the headers; Content-Length is the payload size.
    void setPayload(std::string payload);
    const std::optional<std::string>& payload() const { return payload_; }

    bool isFullyBuffered() const { return !payload_.has_value(); }

    size_t contentLength() const { return payload_ ? payload_->size() : body_.size(); }

    // Status line, headers (Connection always explicit) and the blank line.
    void appendHeadersToBuffer(network::Buffer* output) const;

    // Entire response including a streamed payload, if any.
    void appendToBuffer(network::Buffer* output) const;

    static const char* ReasonPhrase(HttpStatusCode code);

    static HttpResponse PlainText(HttpStatusCode code, const std::string& text);
    static HttpResponse Json(HttpStatusCode code, const std::string& json);

private:
    HttpStatusCode statusCode_;
    std::string statusMessage_;
    HttpRequest::Version version_;
    bool closeConnection_;
    std::map<std::string, std::string> headers_;
    std::string body_;
    std::optional<std::string> payload_;
};

} // namespace protocol
} // namespace cacheworker
