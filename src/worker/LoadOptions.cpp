#include "cacheworker/worker/LoadOptions.h"

#include <cctype>
#include <sstream>

namespace cacheworker {
namespace worker {

const char* const LoadOptions::kDefaultProgressFormat = "TEXT";

std::optional<OpType> ParseOpType(const std::string& name) {
    std::string upper;
    upper.reserve(name.size());
    for (unsigned char c : name) upper.push_back(static_cast<char>(std::toupper(c)));
    if (upper == "SUBMIT") return OpType::SUBMIT;
    if (upper == "STOP") return OpType::STOP;
    if (upper == "PROGRESS") return OpType::PROGRESS;
    return std::nullopt;
}

const char* OpTypeName(OpType type) {
    switch (type) {
        case OpType::SUBMIT: return "SUBMIT";
        case OpType::STOP: return "STOP";
        case OpType::PROGRESS: return "PROGRESS";
        default: return "UNKNOWN";
    }
}

std::string LoadOptions::ToString() const {
    std::ostringstream ss;
    ss << "LoadOptions{opType=" << (opType_ ? OpTypeName(*opType_) : "unset")
       << ", partialListing=" << partialListing_
       << ", verify=" << verify_
       << ", bandwidth=";
    if (bandwidth_) {
        ss << *bandwidth_;
    } else {
        ss << "unlimited";
    }
    ss << ", verbose=" << verbose_
       << ", loadMetadataOnly=" << loadMetadataOnly_
       << ", skipIfExists=" << skipIfExists_
       << ", fileFilterPattern=" << (fileFilterPattern_ ? *fileFilterPattern_ : "")
       << ", progressFormat=" << progressFormat_ << "}";
    return ss.str();
}

} // namespace worker
} // namespace cacheworker
