#pragma once

#include <string>

namespace cacheworker {
namespace common {

// Escapes a string for embedding between double quotes in a JSON document.
std::string JsonEscape(const std::string& s);

// Returns "\"<escaped>\"".
inline std::string JsonString(const std::string& s) {
    return "\"" + JsonEscape(s) + "\"";
}

} // namespace common
} // namespace cacheworker
