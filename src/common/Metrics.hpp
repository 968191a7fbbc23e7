#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lnt::common::metrics {

class Registry {
private:
    class ScopedTimerImpl;

public:
    struct TimerSnapshot {
        std::uint64_t samples{0};
        std::optional<double> p50Ms{};
        std::optional<double> p95Ms{};
        std::optional<double> maxMs{};
    };

    struct CounterSnapshot {
        std::uint64_t value{0};
    };

    struct GaugeSnapshot {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
    };

    struct Snapshot {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point capturedAt;
        std::unordered_map<std::string, TimerSnapshot> timers;
        std::unordered_map<std::string, CounterSnapshot> counters;
        std::unordered_map<std::string, GaugeSnapshot> gauges;
    };

    // Records the lifetime of the object as one latency sample of `timerKey`.
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
    void setGauge(const std::string& gaugeKey, double value);
    std::uint64_t counter(const std::string& counterKey) const;
    Snapshot snapshot() const;

private:
    struct TimerMetrics {
        mutable std::mutex samplesMutex;
        std::vector<double> samplesMs;

        void addSample(double latencyMs);
        std::vector<double> copySamples() const;
    };

    struct CounterMetrics {
        std::uint64_t value{0};
    };

    struct GaugeMetrics {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
    };

    class ScopedTimerImpl {
    public:
        ScopedTimerImpl(Registry& registry, const std::string& timerKey);
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
    std::unordered_map<std::string, CounterMetrics> counters_;
    std::unordered_map<std::string, GaugeMetrics> gauges_;
};

}  // namespace lnt::common::metrics
