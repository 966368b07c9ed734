#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace eod::common::metrics {

namespace keys {
inline constexpr const char* kFetchAttempts = "fetch.attempts";
inline constexpr const char* kFetchFailures = "fetch.failures";
inline constexpr const char* kFetchThrottled = "fetch.throttled";
inline constexpr const char* kTickersSkipped = "tickers.skipped";
inline constexpr const char* kRowsNormalized = "rows.normalized";
inline constexpr const char* kRowsUpserted = "rows.upserted";
inline constexpr const char* kRunBatches = "run.batches";
inline constexpr const char* kFetchTimer = "fetch";
inline constexpr const char* kUpsertTimer = "upsert";
}  // namespace keys

class Registry {
private:
    class ScopedTimerImpl;

public:
    struct TimerSnapshot {
        std::uint64_t samples{0};
        std::optional<double> p95Ms{};
        std::optional<double> p99Ms{};
    };

    struct Snapshot {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point capturedAt;
        std::map<std::string, TimerSnapshot> timers;
        std::map<std::string, std::uint64_t> counters;
        std::map<std::string, double> gauges;
    };

    // Records the lifetime of the enclosing scope under the given timer key.
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string timerKey);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;
        ScopedTimer(ScopedTimer&&) = delete;
        ScopedTimer& operator=(ScopedTimer&&) = delete;

    private:
        std::unique_ptr<ScopedTimerImpl> impl_;
    };

    static Registry& instance();

    void incrementCounter(const std::string& counterKey,
                          std::uint64_t value = 1U);
    std::uint64_t counter(const std::string& counterKey) const;
    void setGauge(const std::string& gaugeKey, double value);
    Snapshot snapshot() const;
    // Clears recorded values; timer keys stay registered for timers still in scope.
    void reset();

    static std::string describe(const Snapshot& snapshot);

private:
    struct TimerMetrics {
        std::atomic<std::uint64_t> samples{0};
        mutable std::mutex latenciesMutex;
        std::vector<double> latenciesMs;

        void addLatency(double latencyMs);
        std::vector<double> copyLatencies() const;
    };

    class ScopedTimerImpl {
    public:
        ScopedTimerImpl(Registry& registry, std::string timerKey);
        ~ScopedTimerImpl();

    private:
        TimerMetrics* metrics_{nullptr};
        std::chrono::steady_clock::time_point start_;
    };

    Registry();

    TimerMetrics& ensureTimerMetrics(const std::string& timerKey);

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<TimerMetrics>> timerMetrics_;
    std::unordered_map<std::string, std::uint64_t> counters_;
    std::unordered_map<std::string, double> gauges_;
};

}  // namespace eod::common::metrics
