#include "cacheworker/protocol/HttpResponse.h"

#include <cstdio>
#include <cstring>

namespace cacheworker {
namespace protocol {

const char* HttpResponse::ReasonPhrase(HttpStatusCode code) {
    switch (code) {
        case k200Ok: return "OK";
        case k400BadRequest: return "Bad Request";
        case k404NotFound: return "Not Found";
        case k405MethodNotAllowed: return "Method Not Allowed";
        case k500InternalServerError: return "Internal Server Error";
        default: return "Unknown";
    }
}

HttpResponse HttpResponse::PlainText(HttpStatusCode code, const std::string& text) {
    HttpResponse response(code);
    response.setContentType("text/plain");
    response.setBody(text);
    return response;
}

HttpResponse HttpResponse::Json(HttpStatusCode code, const std::string& json) {
    HttpResponse response(code);
    response.setContentType("application/json");
    response.setBody(json);
    return response;
}

void HttpResponse::setBody(std::string body) {
    body_ = std::move(body);
    payload_.reset();
    addHeader("Content-Length", std::to_string(body_.size()));
}

void HttpResponse::setPayload(std::string payload) {
    body_.clear();
    payload_ = std::move(payload);
    addHeader("Content-Length", std::to_string(payload_->size()));
}

void HttpResponse::appendHeadersToBuffer(network::Buffer* output) const {
    char buf[64];
    std::snprintf(buf, sizeof buf, "HTTP/1.%d %d ",
                  version_ == HttpRequest::kHttp10 ? 0 : 1, static_cast<int>(statusCode_));
    output->Append(buf, std::strlen(buf));
    output->Append(statusMessage_);
    output->Append("\r\n");

    for (const auto& header : headers_) {
        if (IEquals(header.first, "Connection")) {
            continue;
        }
        output->Append(header.first);
        output->Append(": ");
        output->Append(header.second);
        output->Append("\r\n");
    }
    if (headers_.find("Content-Type") == headers_.end()) {
        output->Append("Content-Type: text/plain\r\n");
    }
    if (headers_.find("Content-Length") == headers_.end()) {
        std::snprintf(buf, sizeof buf, "Content-Length: %zu\r\n", contentLength());
        output->Append(buf, std::strlen(buf));
    }
    output->Append(closeConnection_ ? "Connection: close\r\n" : "Connection: keep-alive\r\n");
    output->Append("\r\n");
}

void HttpResponse::appendToBuffer(network::Buffer* output) const {
    appendHeadersToBuffer(output);
    if (payload_) {
        output->Append(*payload_);
    } else {
        output->Append(body_);
    }
}

} // namespace protocol
} // namespace cacheworker
