#include "common/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <utility>

namespace lnt::common::metrics {
namespace {

// Keeps memory bounded for long running trackers; oldest half is dropped.
constexpr std::size_t kMaxSamplesPerTimer = 4096;

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
    : impl_(std::make_unique<ScopedTimerImpl>(Registry::instance(), timerKey)) {}

Registry::ScopedTimer::~ScopedTimer() = default;

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey].value += value;
}

void Registry::setGauge(const std::string& gaugeKey, double value) {
    const auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& gauge = gauges_[gaugeKey];
    gauge.value = value;
    gauge.updatedAt = now;
}

std::uint64_t Registry::counter(const std::string& counterKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(counterKey);
    return it == counters_.end() ? 0U : it->second.value;
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.startTime = startTime_;
    snapshot.capturedAt = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.timers.reserve(timerMetrics_.size());
    for (const auto& [timerKey, metricsPtr] : timerMetrics_) {
        TimerSnapshot timerSnapshot;
        auto samples = metricsPtr->copySamples();
        timerSnapshot.samples = samples.size();
        if (!samples.empty()) {
            std::sort(samples.begin(), samples.end());
            timerSnapshot.p50Ms = computeQuantile(samples, 0.50);
            timerSnapshot.p95Ms = computeQuantile(samples, 0.95);
            timerSnapshot.maxMs = samples.back();
        }

        snapshot.timers.emplace(timerKey, std::move(timerSnapshot));
    }

    snapshot.counters.reserve(counters_.size());
    for (const auto& [key, counter] : counters_) {
        snapshot.counters.emplace(key, CounterSnapshot{counter.value});
    }

    snapshot.gauges.reserve(gauges_.size());
    for (const auto& [key, gauge] : gauges_) {
        snapshot.gauges.emplace(key, GaugeSnapshot{gauge.value, gauge.updatedAt});
    }

    return snapshot;
}

void Registry::TimerMetrics::addSample(double latencyMs) {
    std::lock_guard<std::mutex> lock(samplesMutex);
    if (samplesMs.size() >= kMaxSamplesPerTimer) {
        samplesMs.erase(samplesMs.begin(),
                        samplesMs.begin() + static_cast<std::ptrdiff_t>(kMaxSamplesPerTimer / 2));
    }
    samplesMs.push_back(latencyMs);
}

std::vector<double> Registry::TimerMetrics::copySamples() const {
    std::lock_guard<std::mutex> lock(samplesMutex);
    return samplesMs;
}

Registry::TimerMetrics& Registry::ensureTimerMetrics(const std::string& timerKey) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = timerMetrics_.try_emplace(timerKey, nullptr);
    if (inserted) {
        it->second = std::make_unique<TimerMetrics>();
    }
    return *it->second;
}

Registry::ScopedTimerImpl::ScopedTimerImpl(Registry& registry, const std::string& timerKey)
    : metrics_(&registry.ensureTimerMetrics(timerKey)),
      start_(std::chrono::steady_clock::now()) {}

Registry::ScopedTimerImpl::~ScopedTimerImpl() {
    if (metrics_ == nullptr) {
        return;
    }

    const auto end = std::chrono::steady_clock::now();
    const auto duration = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(end - start_);
    metrics_->addSample(duration.count());
}

}  // namespace lnt::common::metrics
