#pragma once

#include "cacheworker/common/noncopyable.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace cacheworker {
namespace monitor {

class Counter {
public:
    void Inc(std::int64_t n = 1) { count_.fetch_add(n, std::memory_order_relaxed); }
    std::int64_t Count() const { return count_.load(std::memory_order_relaxed); }
    void Reset() { count_.store(0, std::memory_order_relaxed); }

private:
    std::atomic<std::int64_t> count_{0};
};

// Named counters and derived gauges. Counter references stay valid for the
// registry's lifetime. The process-wide registry is Instance(); anything that
// records metrics takes a Metrics& so tests can hand in their own.
class Metrics : common::noncopyable {
public:
    using Gauge = std::function<double()>;

    static Metrics& Instance();

    Metrics();

    Counter& GetCounter(const std::string& name);
    std::optional<std::int64_t> CounterValue(const std::string& name) const;

    // Returns false if a gauge with that name already exists.
    bool RegisterGaugeIfAbsent(const std::string& name, Gauge gauge);
    std::optional<double> GaugeValue(const std::string& name) const;
    // For gauges that read an object about to be destroyed.
    void RemoveGauge(const std::string& name);

    // Zeroes every counter; gauges stay registered.
    void ResetAll();

    std::string ToJson() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Counter>> counters_;
    std::map<std::string, Gauge> gauges_;
    std::chrono::steady_clock::time_point startTime_;
};

} // namespace monitor
} // namespace cacheworker
