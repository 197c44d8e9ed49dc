#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cacheworker {
namespace protocol {

// Structured view of a request target: "/file/abc/page/0?offset=10" becomes
// mappingPath "file", remainingSegments {"abc", "page", "0"} and
// parameters {offset: "10"}. Values are kept percent-encoded.
class RequestUri {
public:
    // Throws MalformedRequestError when the target has no leading path or an
    // empty mapping path. Absolute-form targets ("http://host/x") are accepted.
    static RequestUri Parse(const std::string& target);

    const std::string& mappingPath() const { return mappingPath_; }
    const std::vector<std::string>& remainingSegments() const { return remainingSegments_; }
    const std::map<std::string, std::string>& parameters() const { return parameters_; }

    std::optional<std::string> getParameter(const std::string& key) const;
    bool hasParameter(const std::string& key) const { return parameters_.count(key) != 0; }

    // Decimal int64 value of key, nullopt when absent. Throws MalformedRequestError
    // when present but not a number.
    std::optional<std::int64_t> getInt64Parameter(const std::string& key) const;
    // "true" in any case is true, every other value false; nullopt when absent.
    std::optional<bool> getBoolParameter(const std::string& key) const;

private:
    RequestUri() = default;

    static void ParseQuery(const std::string& query, std::map<std::string, std::string>* out);

    std::string mappingPath_;
    std::vector<std::string> remainingSegments_;
    std::map<std::string, std::string> parameters_;
};

// Whole-string decimal parse. Throws MalformedRequestError naming what.
std::int64_t ParseInt64(const std::string& text, const std::string& what);

// Unescapes the reserved characters that clients send encoded inside path
// parameters: %2F -> '/', %3A -> ':', %3F -> '?' (either hex case). Decoding
// an already decoded string leaves it unchanged.
std::string DecodeReservedCharacters(const std::string& s);

} // namespace protocol
} // namespace cacheworker
