#include "common/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <memory>
#include <sstream>
#include <utility>

namespace eod::common::metrics {
namespace {

double computeQuantile(const std::vector<double>& sortedValues, double quantile) {
    if (sortedValues.empty()) {
        return 0.0;
    }
    if (sortedValues.size() == 1U) {
        return sortedValues.front();
    }

    const double clampedQuantile = std::clamp(quantile, 0.0, 1.0);
    const double position = clampedQuantile * static_cast<double>(sortedValues.size() - 1U);
    const auto lowerIndex = static_cast<std::size_t>(std::floor(position));
    const auto upperIndex = static_cast<std::size_t>(std::ceil(position));

    if (lowerIndex == upperIndex) {
        return sortedValues[lowerIndex];
    }

    const double weight = position - static_cast<double>(lowerIndex);
    return sortedValues[lowerIndex]
        + weight * (sortedValues[upperIndex] - sortedValues[lowerIndex]);
}

}  // namespace

Registry::Registry()
    : startTime_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry instance;
    return instance;
}

Registry::ScopedTimer::ScopedTimer(std::string timerKey)
    : impl_(std::make_unique<ScopedTimerImpl>(Registry::instance(), std::move(timerKey))) {}

Registry::ScopedTimer::~ScopedTimer() = default;

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey] += value;
}

std::uint64_t Registry::counter(const std::string& counterKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(counterKey);
    return it == counters_.end() ? 0U : it->second;
}

void Registry::setGauge(const std::string& gaugeKey, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_[gaugeKey] = value;
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.startTime = startTime_;
    snapshot.capturedAt = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [timerKey, metricsPtr] : timerMetrics_) {
        TimerSnapshot timerSnapshot;
        timerSnapshot.samples = metricsPtr->samples.load(std::memory_order_relaxed);

        auto latencies = metricsPtr->copyLatencies();
        if (!latencies.empty()) {
            std::sort(latencies.begin(), latencies.end());
            timerSnapshot.p95Ms = computeQuantile(latencies, 0.95);
            timerSnapshot.p99Ms = computeQuantile(latencies, 0.99);
        }

        snapshot.timers.emplace(timerKey, std::move(timerSnapshot));
    }

    for (const auto& [key, value] : counters_) {
        snapshot.counters.emplace(key, value);
    }
    for (const auto& [key, value] : gauges_) {
        snapshot.gauges.emplace(key, value);
    }

    return snapshot;
}

void Registry::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    // Live ScopedTimers hold raw pointers into timerMetrics_, so entries stay and only their samples go.
    for (auto& entry : timerMetrics_) {
        auto& metrics = *entry.second;
        metrics.samples.store(0);
        std::lock_guard<std::mutex> latenciesLock(metrics.latenciesMutex);
        metrics.latenciesMs.clear();
    }
    counters_.clear();
    gauges_.clear();
}

std::string Registry::describe(const Snapshot& snapshot) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1);
    const char* separator = "";
    for (const auto& [key, value] : snapshot.counters) {
        out << separator << key << '=' << value;
        separator = " ";
    }
    for (const auto& [key, value] : snapshot.gauges) {
        out << separator << key << '=' << value;
        separator = " ";
    }
    for (const auto& [key, timer] : snapshot.timers) {
        out << separator << key << ".samples=" << timer.samples;
        separator = " ";
        if (timer.p95Ms) {
            out << ' ' << key << ".p95_ms=" << *timer.p95Ms;
        }
        if (timer.p99Ms) {
            out << ' ' << key << ".p99_ms=" << *timer.p99Ms;
        }
    }
    return out.str();
}

void Registry::TimerMetrics::addLatency(double latencyMs) {
    std::lock_guard<std::mutex> lock(latenciesMutex);
    latenciesMs.push_back(latencyMs);
}

std::vector<double> Registry::TimerMetrics::copyLatencies() const {
    std::lock_guard<std::mutex> lock(latenciesMutex);
    return latenciesMs;
}

Registry::TimerMetrics& Registry::ensureTimerMetrics(const std::string& timerKey) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = timerMetrics_.try_emplace(timerKey, nullptr);
    if (inserted) {
        it->second = std::make_unique<TimerMetrics>();
    }
    return *it->second;
}

Registry::ScopedTimerImpl::ScopedTimerImpl(Registry& registry, std::string timerKey)
    : metrics_(&registry.ensureTimerMetrics(timerKey)),
      start_(std::chrono::steady_clock::now()) {}

Registry::ScopedTimerImpl::~ScopedTimerImpl() {
    if (metrics_ == nullptr) {
        return;
    }

    const auto end = std::chrono::steady_clock::now();
    const auto duration = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(end - start_);
    metrics_->samples.fetch_add(1U, std::memory_order_relaxed);
    metrics_->addLatency(duration.count());
}

}  // namespace eod::common::metrics
