#include "app/TrackerOptions.hpp"

#include "common/Config.hpp"

namespace app {

TrackerOptions TrackerOptions::fromConfig(const lnt::common::Config& config) {
    TrackerOptions options;
    options.pageSize = config.pageSize;
    options.batchSize = config.batchSize;
    options.reconWindow = std::chrono::seconds(config.reconWindowSec);
    options.gracePeriod = std::chrono::milliseconds(config.gracePeriodMs);
    options.queuePollTimeout = std::chrono::milliseconds(config.queuePollTimeoutMs);
    options.tailPollInterval = std::chrono::milliseconds(config.tailPollIntervalMs);

    options.retry.maxRetries = config.retryMaxRetries;
    options.retry.delay = std::chrono::milliseconds(config.retryDelayMs);
    if (config.retryToleranceWindowMs > 0U) {
        options.retry.toleranceWindow = std::chrono::milliseconds(config.retryToleranceWindowMs);
    } else {
        options.retry.toleranceWindow.reset();
    }
    return options;
}

}  // namespace app
