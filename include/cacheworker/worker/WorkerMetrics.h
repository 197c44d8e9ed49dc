#pragma once

#include "cacheworker/monitor/Metrics.h"

namespace cacheworker {
namespace worker {

extern const char kMetricBytesRequested[];
extern const char kMetricBytesReadCache[];
extern const char kMetricCacheHitRate[];
extern const char kMetricActiveConnections[];

// Creates the HTTP byte counters and the hit-rate gauge
// (bytes served / bytes requested, 0 before any request). Idempotent.
void RegisterHttpMetrics(monitor::Metrics& metrics);

} // namespace worker
} // namespace cacheworker
