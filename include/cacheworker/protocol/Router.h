#pragma once

#include "cacheworker/protocol/HttpError.h"
#include "cacheworker/protocol/HttpRequest.h"
#include "cacheworker/protocol/HttpResponse.h"
#include "cacheworker/protocol/RequestUri.h"

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace cacheworker {
namespace protocol {

// Fixed (method, mapping path) -> handler table, filled once at startup.
class Router {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&, const RequestUri&)>;

    // Throws std::invalid_argument on a duplicate route or an empty mapping path.
    void Add(HttpRequest::Method method, const std::string& mappingPath, Handler handler);

    // Throws UnmatchedRouteError.
    const Handler& Match(const HttpRequest& request, const std::string& mappingPath) const;

    // Parses the target, runs the matched handler and converts every HttpError
    // into an error response. Any other exception propagates to the caller.
    HttpResponse Dispatch(const HttpRequest& request) const;

    size_t size() const { return routes_.size(); }

    std::vector<std::string> AllowedMethods(const std::string& mappingPath) const;

    static HttpResponse ErrorResponse(const HttpError& error);

private:
    using RouteKey = std::pair<std::string, std::string>;

    std::map<RouteKey, Handler> routes_;
};

} // namespace protocol
} // namespace cacheworker
