#pragma once

#include "cacheworker/common/noncopyable.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace cacheworker {
namespace common {

// Settings from an INI file: "[section]" headers, "key = value" lines and
// '#' or ';' comment lines. Keys before the first header belong to "global".
// Getters fall back to the supplied default when a key is missing or does not
// parse as the requested type.
class Config : noncopyable {
public:
    using Section = std::map<std::string, std::string>;

    static Config& Instance();

    Config() = default;

    // Replaces every setting. Returns false if the file cannot be read.
    bool Load(const std::string& path);
    // Same as Load for in-memory text; the loaded filename is left alone.
    void LoadFromString(const std::string& text);

    void SetString(const std::string& section, const std::string& key, const std::string& value);

    std::optional<std::string> LoadedFilename() const;
    bool Has(const std::string& section, const std::string& key) const;

    std::string GetString(const std::string& section, const std::string& key,
                          const std::string& defaultVal = "") const;
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0) const;
    std::int64_t GetInt64(const std::string& section, const std::string& key, std::int64_t defaultVal = 0) const;
    double GetDouble(const std::string& section, const std::string& key, double defaultVal = 0.0) const;
    // Accepts 1/0, true/false, yes/no and on/off in any case.
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

private:
    std::optional<std::string> Lookup(const std::string& section, const std::string& key) const;

    mutable std::mutex mutex_;
    std::map<std::string, Section> sections_;
    std::string path_;
};

} // namespace common
} // namespace cacheworker
