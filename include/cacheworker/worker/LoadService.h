#pragma once

#include "cacheworker/worker/LoadOptions.h"

#include <string>

namespace cacheworker {
namespace worker {

// Load/import subsystem. Load() returns at once with a human-readable status;
// the work itself runs in the background. Thread safe.
class LoadService {
public:
    virtual ~LoadService() = default;

    virtual std::string Load(const std::string& path, const LoadOptions& options) = 0;
};

} // namespace worker
} // namespace cacheworker
