#include "cacheworker/protocol/Router.h"
#include "cacheworker/common/Logger.h"

#include <stdexcept>

namespace cacheworker {
namespace protocol {

void Router::Add(HttpRequest::Method method, const std::string& mappingPath, Handler handler) {
    if (mappingPath.empty()) {
        throw std::invalid_argument("route mapping path must not be empty");
    }
    RouteKey key(HttpRequest::MethodName(method), mappingPath);
    if (routes_.count(key) != 0) {
        throw std::invalid_argument("duplicate route " + key.first + " /" + mappingPath);
    }
    routes_.emplace(std::move(key), std::move(handler));
    LOG_DEBUG << "Router: added route " << HttpRequest::MethodName(method) << " /" << mappingPath;
}

std::vector<std::string> Router::AllowedMethods(const std::string& mappingPath) const {
    std::vector<std::string> methods;
    for (const auto& route : routes_) {
        if (route.first.second == mappingPath) {
            methods.push_back(route.first.first);
        }
    }
    return methods;
}

const Router::Handler& Router::Match(const HttpRequest& request, const std::string& mappingPath) const {
    auto it = routes_.find(RouteKey(request.methodString(), mappingPath));
    if (it != routes_.end()) {
        return it->second;
    }
    std::vector<std::string> allowed = AllowedMethods(mappingPath);
    if (allowed.empty()) {
        throw UnmatchedRouteError(request.methodString(), mappingPath);
    }
    throw UnmatchedRouteError(request.methodString(), mappingPath, std::move(allowed));
}

HttpResponse Router::Dispatch(const HttpRequest& request) const {
    try {
        RequestUri uri = RequestUri::Parse(request.target());
        const Handler& handler = Match(request, uri.mappingPath());
        return handler(request, uri);
    } catch (const HttpError& e) {
        LOG_WARN << "Router: " << request.methodString() << " " << request.target()
                 << " -> " << static_cast<int>(e.status()) << " " << e.what();
        return ErrorResponse(e);
    }
}

HttpResponse Router::ErrorResponse(const HttpError& error) {
    HttpResponse response = HttpResponse::PlainText(error.status(), error.what());
    const auto* unmatched = dynamic_cast<const UnmatchedRouteError*>(&error);
    if (unmatched != nullptr && !unmatched->allowedMethods().empty()) {
        std::string allow;
        for (const auto& m : unmatched->allowedMethods()) {
            if (!allow.empty()) allow += ", ";
            allow += m;
        }
        response.addHeader("Allow", allow);
    }
    return response;
}

} // namespace protocol
} // namespace cacheworker
