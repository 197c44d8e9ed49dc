#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace cacheworker {
namespace worker {

enum class OpType {
    SUBMIT,
    STOP,
    PROGRESS,
};

// Case-insensitive; nullopt for an unknown name.
std::optional<OpType> ParseOpType(const std::string& name);
const char* OpTypeName(OpType type);

// Options for one load request. Immutable once built.
class LoadOptions {
public:
    static const char* const kDefaultProgressFormat;

    class Builder;

    const std::optional<OpType>& opType() const { return opType_; }
    bool partialListing() const { return partialListing_; }
    bool verify() const { return verify_; }
    // Bytes per second; nullopt means unlimited.
    const std::optional<std::int64_t>& bandwidth() const { return bandwidth_; }
    bool verbose() const { return verbose_; }
    bool loadMetadataOnly() const { return loadMetadataOnly_; }
    bool skipIfExists() const { return skipIfExists_; }
    const std::optional<std::string>& fileFilterPattern() const { return fileFilterPattern_; }
    const std::string& progressFormat() const { return progressFormat_; }

    std::string ToString() const;

private:
    LoadOptions() = default;

    std::optional<OpType> opType_;
    bool partialListing_{false};
    bool verify_{false};
    std::optional<std::int64_t> bandwidth_;
    bool verbose_{false};
    bool loadMetadataOnly_{false};
    bool skipIfExists_{false};
    std::optional<std::string> fileFilterPattern_;
    std::string progressFormat_{kDefaultProgressFormat};
};

class LoadOptions::Builder {
public:
    Builder& setOpType(OpType type) { options_.opType_ = type; return *this; }
    Builder& setPartialListing(bool on) { options_.partialListing_ = on; return *this; }
    Builder& setVerify(bool on) { options_.verify_ = on; return *this; }
    Builder& setBandwidth(std::int64_t bytesPerSecond) { options_.bandwidth_ = bytesPerSecond; return *this; }
    Builder& setVerbose(bool on) { options_.verbose_ = on; return *this; }
    Builder& setLoadMetadataOnly(bool on) { options_.loadMetadataOnly_ = on; return *this; }
    Builder& setSkipIfExists(bool on) { options_.skipIfExists_ = on; return *this; }
    Builder& setFileFilterPattern(const std::string& regex) { options_.fileFilterPattern_ = regex; return *this; }
    Builder& setProgressFormat(const std::string& format) { options_.progressFormat_ = format; return *this; }

    LoadOptions Build() const { return options_; }

private:
    LoadOptions options_;
};

} // namespace worker
} // namespace cacheworker
