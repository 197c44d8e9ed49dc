#include "cacheworker/protocol/RequestUri.h"
#include "cacheworker/protocol/HttpError.h"
#include "cacheworker/protocol/HttpRequest.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace cacheworker {
namespace protocol {

namespace {

// "http://host:port/a/b" -> "/a/b"; origin-form targets pass through.
std::string StripAuthority(const std::string& target) {
    size_t scheme = target.find("://");
    if (scheme == std::string::npos || target.find_first_of("/?") < scheme) {
        return target;
    }
    size_t pathStart = target.find_first_of("/?", scheme + 3);
    if (pathStart == std::string::npos) {
        return std::string();
    }
    return target.substr(pathStart);
}

} // namespace

RequestUri RequestUri::Parse(const std::string& target) {
    const std::string stripped = StripAuthority(target);
    size_t question = stripped.find('?');
    std::string path = stripped.substr(0, question);
    std::string query = question == std::string::npos ? std::string() : stripped.substr(question + 1);

    if (path.empty() || path[0] != '/') {
        throw MalformedRequestError("Request target has no path: '" + target + "'");
    }

    RequestUri uri;
    size_t pos = 1;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string::npos) slash = path.size();
        if (slash > pos) {
            std::string segment = path.substr(pos, slash - pos);
            if (uri.mappingPath_.empty()) {
                uri.mappingPath_ = std::move(segment);
            } else {
                uri.remainingSegments_.push_back(std::move(segment));
            }
        }
        pos = slash + 1;
    }

    if (uri.mappingPath_.empty()) {
        throw MalformedRequestError("Request target has an empty mapping path: '" + target + "'");
    }

    ParseQuery(query, &uri.parameters_);
    return uri;
}

void RequestUri::ParseQuery(const std::string& query, std::map<std::string, std::string>* out) {
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        std::string pair = query.substr(pos, amp - pos);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            std::string key = pair.substr(0, eq);
            std::string value = eq == std::string::npos ? std::string() : pair.substr(eq + 1);
            if (!key.empty()) {
                (*out)[key] = value;
            }
        }
        pos = amp + 1;
    }
}

std::optional<std::string> RequestUri::getParameter(const std::string& key) const {
    auto it = parameters_.find(key);
    if (it == parameters_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::int64_t> RequestUri::getInt64Parameter(const std::string& key) const {
    auto value = getParameter(key);
    if (!value) {
        return std::nullopt;
    }
    return ParseInt64(*value, key);
}

std::optional<bool> RequestUri::getBoolParameter(const std::string& key) const {
    auto value = getParameter(key);
    if (!value) {
        return std::nullopt;
    }
    return IEquals(*value, "true");
}

std::int64_t ParseInt64(const std::string& text, const std::string& what) {
    if (text.empty() || std::isspace(static_cast<unsigned char>(text[0]))) {
        throw MalformedRequestError("Invalid number for " + what + ": '" + text + "'");
    }
    errno = 0;
    char* endp = nullptr;
    long long v = std::strtoll(text.c_str(), &endp, 10);
    if (errno == ERANGE || endp != text.c_str() + text.size()) {
        throw MalformedRequestError("Invalid number for " + what + ": '" + text + "'");
    }
    return static_cast<std::int64_t>(v);
}

std::string DecodeReservedCharacters(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            char hi = s[i + 1];
            char lo = s[i + 2];
            char decoded = 0;
            if (hi == '2' && (lo == 'F' || lo == 'f')) {
                decoded = '/';
            } else if (hi == '3' && (lo == 'A' || lo == 'a')) {
                decoded = ':';
            } else if (hi == '3' && (lo == 'F' || lo == 'f')) {
                decoded = '?';
            }
            if (decoded != 0) {
                out.push_back(decoded);
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

} // namespace protocol
} // namespace cacheworker
