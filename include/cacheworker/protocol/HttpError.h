#pragma once

#include "cacheworker/protocol/HttpResponse.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace cacheworker {
namespace protocol {

// Failures that map onto a client-visible HTTP status. The router turns them
// into text/plain error responses; they never close the connection.
class HttpError : public std::runtime_error {
public:
    HttpError(HttpResponse::HttpStatusCode status, const std::string& message)
        : std::runtime_error(message), status_(status) {}

    HttpResponse::HttpStatusCode status() const { return status_; }

private:
    HttpResponse::HttpStatusCode status_;
};

class MalformedRequestError : public HttpError {
public:
    explicit MalformedRequestError(const std::string& message)
        : HttpError(HttpResponse::k400BadRequest, message) {}
};

// 404 when no route uses the mapping path at all, 405 when it exists under
// other methods (those are reported in allowedMethods()).
class UnmatchedRouteError : public HttpError {
public:
    UnmatchedRouteError(const std::string& method, const std::string& mappingPath)
        : HttpError(HttpResponse::k404NotFound,
                    "No handler for " + method + " /" + mappingPath) {}

    UnmatchedRouteError(const std::string& method,
                        const std::string& mappingPath,
                        std::vector<std::string> allowedMethods)
        : HttpError(HttpResponse::k405MethodNotAllowed,
                    "Method " + method + " is not allowed for /" + mappingPath),
          allowedMethods_(std::move(allowedMethods)) {}

    const std::vector<std::string>& allowedMethods() const { return allowedMethods_; }

private:
    std::vector<std::string> allowedMethods_;
};

class PageNotFoundError : public HttpError {
public:
    explicit PageNotFoundError(const std::string& message)
        : HttpError(HttpResponse::k404NotFound, message) {}
};

class BackendIOError : public HttpError {
public:
    explicit BackendIOError(const std::string& message)
        : HttpError(HttpResponse::k500InternalServerError, message) {}
};

} // namespace protocol
} // namespace cacheworker
