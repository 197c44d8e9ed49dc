#include "cacheworker/worker/WorkerMetrics.h"

namespace cacheworker {
namespace worker {

const char kMetricBytesRequested[] = "Worker.HttpBytesRequested";
const char kMetricBytesReadCache[] = "Worker.HttpBytesReadCache";
const char kMetricCacheHitRate[] = "Worker.HttpCacheHitRate";
const char kMetricActiveConnections[] = "Worker.HttpActiveConnections";

void RegisterHttpMetrics(monitor::Metrics& metrics) {
    monitor::Counter& requested = metrics.GetCounter(kMetricBytesRequested);
    monitor::Counter& served = metrics.GetCounter(kMetricBytesReadCache);
    metrics.RegisterGaugeIfAbsent(kMetricCacheHitRate, [&requested, &served]() {
        std::int64_t total = requested.Count();
        if (total == 0) {
            return 0.0;
        }
        return static_cast<double>(served.Count()) / static_cast<double>(total);
    });
}

} // namespace worker
} // namespace cacheworker
