#include "cacheworker/monitor/Metrics.h"
#include "cacheworker/common/Json.h"

#include <iomanip>
#include <sstream>

namespace cacheworker {
namespace monitor {

Metrics& Metrics::Instance() {
    static Metrics instance;
    return instance;
}

Metrics::Metrics()
    : startTime_(std::chrono::steady_clock::now()) {
}

Counter& Metrics::GetCounter(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = counters_[name];
    if (!slot) {
        slot.reset(new Counter());
    }
    return *slot;
}

std::optional<std::int64_t> Metrics::CounterValue(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    if (it == counters_.end()) {
        return std::nullopt;
    }
    return it->second->Count();
}

bool Metrics::RegisterGaugeIfAbsent(const std::string& name, Gauge gauge) {
    std::lock_guard<std::mutex> lock(mutex_);
    return gauges_.emplace(name, std::move(gauge)).second;
}

std::optional<double> Metrics::GaugeValue(const std::string& name) const {
    Gauge gauge;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = gauges_.find(name);
        if (it == gauges_.end()) {
            return std::nullopt;
        }
        gauge = it->second;
    }
    // Gauges usually read counters from this registry; call without the lock.
    return gauge();
}

void Metrics::RemoveGauge(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_.erase(name);
}

void Metrics::ResetAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : counters_) {
        entry.second->Reset();
    }
}

std::string Metrics::ToJson() const {
    std::map<std::string, std::int64_t> counters;
    std::map<std::string, Gauge> gauges;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : counters_) {
            counters[entry.first] = entry.second->Count();
        }
        gauges = gauges_;
    }

    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - startTime_).count();

    std::stringstream ss;
    ss << "{\n";
    ss << "  \"uptime_sec\": " << uptime << ",\n";
    ss << "  \"counters\": {";
    bool first = true;
    for (const auto& entry : counters) {
        ss << (first ? "\n" : ",\n");
        ss << "    " << common::JsonString(entry.first) << ": " << entry.second;
        first = false;
    }
    ss << (first ? "},\n" : "\n  },\n");
    ss << "  \"gauges\": {";
    first = true;
    for (const auto& entry : gauges) {
        ss << (first ? "\n" : ",\n");
        ss << "    " << common::JsonString(entry.first) << ": "
           << std::fixed << std::setprecision(6) << entry.second();
        first = false;
    }
    ss << (first ? "}\n" : "\n  }\n");
    ss << "}";
    return ss.str();
}

} // namespace monitor
} // namespace cacheworker
