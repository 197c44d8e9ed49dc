#include "cacheworker/common/Config.h"
#include "cacheworker/common/Logger.h"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace cacheworker {
namespace common {

namespace {

std::string Strip(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::map<std::string, Config::Section> ParseIni(std::istream& in) {
    std::map<std::string, Config::Section> sections;
    std::string section = "global";
    std::string raw;
    int lineNo = 0;
    while (std::getline(in, raw)) {
        ++lineNo;
        const std::string line = Strip(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;
        if (line.front() == '[' && line.back() == ']') {
            section = Strip(line.substr(1, line.size() - 2));
            continue;
        }
        size_t eq = line.find('=');
        std::string key = eq == std::string::npos ? std::string() : Strip(line.substr(0, eq));
        if (key.empty()) {
            LOG_WARN << "Config: ignoring line " << lineNo << " '" << line << "'";
            continue;
        }
        sections[section][key] = Strip(line.substr(eq + 1));
    }
    return sections;
}

std::string Lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

} // namespace

Config& Config::Instance() {
    static Config instance;
    return instance;
}

bool Config::Load(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        LOG_ERROR << "Config: cannot open " << path;
        return false;
    }
    auto parsed = ParseIni(file);
    std::lock_guard<std::mutex> lock(mutex_);
    sections_ = std::move(parsed);
    path_ = path;
    LOG_INFO << "Config: loaded " << path << " (" << sections_.size() << " sections)";
    return true;
}

void Config::LoadFromString(const std::string& text) {
    std::istringstream in(text);
    auto parsed = ParseIni(in);
    std::lock_guard<std::mutex> lock(mutex_);
    sections_ = std::move(parsed);
}

void Config::SetString(const std::string& section, const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section][key] = value;
}

std::optional<std::string> Config::LoadedFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (path_.empty()) return std::nullopt;
    return path_;
}

bool Config::Has(const std::string& section, const std::string& key) const {
    return Lookup(section, key).has_value();
}

std::optional<std::string> Config::Lookup(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sit = sections_.find(section);
    if (sit == sections_.end()) return std::nullopt;
    auto kit = sit->second.find(key);
    if (kit == sit->second.end()) return std::nullopt;
    return kit->second;
}

std::string Config::GetString(const std::string& section, const std::string& key,
                              const std::string& defaultVal) const {
    return Lookup(section, key).value_or(defaultVal);
}

int Config::GetInt(const std::string& section, const std::string& key, int defaultVal) const {
    std::int64_t v = GetInt64(section, key, defaultVal);
    if (v < INT_MIN || v > INT_MAX) {
        LOG_WARN << "Config: [" << section << "] " << key << " out of int range, using " << defaultVal;
        return defaultVal;
    }
    return static_cast<int>(v);
}

std::int64_t Config::GetInt64(const std::string& section, const std::string& key, std::int64_t defaultVal) const {
    auto text = Lookup(section, key);
    if (!text || text->empty()) return defaultVal;
    errno = 0;
    char* endp = nullptr;
    long long v = std::strtoll(text->c_str(), &endp, 10);
    if (errno == ERANGE || *endp != '\0') {
        LOG_WARN << "Config: [" << section << "] " << key << "=" << *text << " is not an integer, using " << defaultVal;
        return defaultVal;
    }
    return static_cast<std::int64_t>(v);
}

double Config::GetDouble(const std::string& section, const std::string& key, double defaultVal) const {
    auto text = Lookup(section, key);
    if (!text || text->empty()) return defaultVal;
    char* endp = nullptr;
    double v = std::strtod(text->c_str(), &endp);
    if (*endp != '\0') {
        LOG_WARN << "Config: [" << section << "] " << key << "=" << *text << " is not a number, using " << defaultVal;
        return defaultVal;
    }
    return v;
}

bool Config::GetBool(const std::string& section, const std::string& key, bool defaultVal) const {
    auto text = Lookup(section, key);
    if (!text || text->empty()) return defaultVal;
    const std::string v = Lower(*text);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    LOG_WARN << "Config: [" << section << "] " << key << "=" << *text << " is not a boolean, using "
             << (defaultVal ? "true" : "false");
    return defaultVal;
}

} // namespace common
} // namespace cacheworker
