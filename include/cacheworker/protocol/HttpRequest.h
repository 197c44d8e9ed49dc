#pragma once

#include <cstddef>
#include <map>
#include <string>

namespace cacheworker {
namespace protocol {

// ASCII case-insensitive ordering for header names.
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

bool IEquals(const std::string& a, const std::string& b);

// One decoded HTTP/1.x request. The target is kept split at the first '?'.
class HttpRequest {
public:
    enum Method {
        kInvalid, kGet, kPost, kHead, kPut, kDelete, kOther
    };

    enum Version {
        kUnknown, kHttp10, kHttp11
    };

    using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

    HttpRequest() : method_(kInvalid), version_(kUnknown) {}

    // Any all-uppercase token is accepted; ones without their own enumerator
    // become kOther so routing can still answer 405.
    bool setMethod(const std::string& token);
    void setMethod(Method m) {
        method_ = m;
        methodString_ = MethodName(m);
    }
    Method getMethod() const { return method_; }
    const std::string& methodString() const { return methodString_; }
    static const char* MethodName(Method m);

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }

    // Splits at the first '?'; the query keeps it.
    void setTarget(const std::string& target);
    void setPath(const std::string& path) { path_ = path; }
    void setQuery(const std::string& query) { query_ = query; }
    const std::string& path() const { return path_; }
    const std::string& query() const { return query_; }
    std::string target() const { return path_ + query_; }

    // A repeated field keeps the last value.
    void setHeader(const std::string& field, const std::string& value) { headers_[field] = value; }
    std::string getHeader(const std::string& field) const;
    bool hasHeader(const std::string& field) const { return headers_.count(field) != 0; }
    const HeaderMap& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    void appendBody(const char* data, size_t len) { body_.append(data, len); }
    const std::string& body() const { return body_; }

    // HTTP/1.1 persists unless "Connection: close"; 1.0 only with "Connection: keep-alive".
    bool keepAlive() const;

    void swap(HttpRequest& that);

private:
    Method method_;
    Version version_;
    std::string methodString_;
    std::string path_;
    std::string query_;
    HeaderMap headers_;
    std::string body_;
};

} // namespace protocol
} // namespace cacheworker
