#pragma once

#include "cacheworker/worker/FileSystem.h"

#include <string>

namespace cacheworker {
namespace worker {

// FileSystem over a local directory. Logical "/a/b" is <root>/a/b;
// paths containing ".." segments are rejected.
class LocalFileSystem : public FileSystem {
public:
    explicit LocalFileSystem(const std::string& root);

    std::vector<FileStatus> ListStatus(const std::string& path) override;
    FileStatus GetStatus(const std::string& path) override;
    std::unique_ptr<PositionReader> OpenPositionRead(const std::string& path) override;

    const std::string& root() const { return root_; }

private:
    std::string Resolve(const std::string& path) const;
    static std::string Normalize(const std::string& path);

    std::string root_;
};

} // namespace worker
} // namespace cacheworker
