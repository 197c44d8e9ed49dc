#include "cacheworker/protocol/HttpRequest.h"

#include <cctype>
#include <utility>

namespace cacheworker {
namespace protocol {

namespace {

int Fold(char c) {
    return std::tolower(static_cast<unsigned char>(c));
}

} // namespace

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    size_t n = a.size() < b.size() ? a.size() : b.size();
    for (size_t i = 0; i < n; ++i) {
        int ca = Fold(a[i]);
        int cb = Fold(b[i]);
        if (ca != cb) return ca < cb;
    }
    return a.size() < b.size();
}

bool IEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (Fold(a[i]) != Fold(b[i])) return false;
    }
    return true;
}

bool HttpRequest::setMethod(const std::string& token) {
    methodString_ = token;
    method_ = kInvalid;
    if (token.empty()) return false;
    for (char c : token) {
        if (c < 'A' || c > 'Z') return false;
    }
    static const Method known[] = {kGet, kPost, kHead, kPut, kDelete};
    method_ = kOther;
    for (Method m : known) {
        if (token == MethodName(m)) {
            method_ = m;
            break;
        }
    }
    return true;
}

const char* HttpRequest::MethodName(Method m) {
    switch (m) {
        case kGet: return "GET";
        case kPost: return "POST";
        case kHead: return "HEAD";
        case kPut: return "PUT";
        case kDelete: return "DELETE";
        case kInvalid:
        case kOther:
            break;
    }
    return "UNKNOWN";
}

void HttpRequest::setTarget(const std::string& target) {
    size_t question = target.find('?');
    if (question == std::string::npos) {
        path_ = target;
        query_.clear();
    } else {
        path_ = target.substr(0, question);
        query_ = target.substr(question);
    }
}

std::string HttpRequest::getHeader(const std::string& field) const {
    auto it = headers_.find(field);
    return it == headers_.end() ? std::string() : it->second;
}

bool HttpRequest::keepAlive() const {
    const std::string connection = getHeader("Connection");
    if (version_ == kHttp11) {
        return !IEquals(connection, "close");
    }
    return IEquals(connection, "keep-alive");
}

void HttpRequest::swap(HttpRequest& that) {
    std::swap(method_, that.method_);
    std::swap(version_, that.version_);
    methodString_.swap(that.methodString_);
    path_.swap(that.path_);
    query_.swap(that.query_);
    headers_.swap(that.headers_);
    body_.swap(that.body_);
}

} // namespace protocol
} // namespace cacheworker
