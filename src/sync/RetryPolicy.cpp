#include "sync/RetryPolicy.hpp"

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace lnt::sync {

RetryPolicy::RetryPolicy(const CancellationToken& token,
                         const ErrorClassifier& classifier,
                         Options options,
                         Clock clock)
    : token_(token), classifier_(classifier), options_(options), clock_(std::move(clock)) {}

std::chrono::steady_clock::time_point RetryPolicy::now_() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

RetryPolicy::Decision RetryPolicy::on_failure_(const std::string& name,
                                               const std::exception& error,
                                               std::chrono::steady_clock::time_point attemptStart,
                                               std::size_t& retriesLeft) const {
    const auto kind = classifier_.classify(error);
    if (kind != ErrorKind::Transient) {
        LOG_DEBUG(name << ": " << toString(kind) << " error, not retrying: " << error.what());
        return Decision::Rethrow;
    }

    if (options_.toleranceWindow && now_() - attemptStart > *options_.toleranceWindow) {
        if (retriesLeft != options_.maxRetries) {
            LOG_INFO(name << ": attempt ran longer than the tolerance window, retry budget refilled");
        }
        retriesLeft = options_.maxRetries;
    }

    if (retriesLeft == 0U) {
        LOG_ERR(name << ": retry budget of " << options_.maxRetries << " exhausted: " << error.what());
        return Decision::Rethrow;
    }
    --retriesLeft;

    lnt::common::metrics::Registry::instance().incrementCounter("retry_attempts_total");
    LOG_WARN(name << " failed (" << retriesLeft << " retries left), retrying in " << options_.delay.count()
                  << " ms: " << error.what());

    if (token_.wait(options_.delay)) {
        LOG_INFO(name << ": cancelled while waiting for the next attempt");
        return Decision::Cancelled;
    }
    return Decision::Retry;
}

}  // namespace lnt::sync
