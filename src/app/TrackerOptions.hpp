#pragma once

#include <chrono>
#include <cstddef>

#include "sync/RetryPolicy.hpp"
#include "sync/StreamDispatcher.hpp"

namespace lnt::common {
struct Config;
}

namespace app {

// Engine knobs shared by every tracker and dispatcher.
struct TrackerOptions {
    std::size_t pageSize = 1000;
    std::size_t batchSize = 1000;
    std::chrono::seconds reconWindow{30 * 24 * 3600};
    std::chrono::milliseconds gracePeriod{2000};
    std::chrono::milliseconds queuePollTimeout{15000};
    std::chrono::milliseconds tailPollInterval{60000};
    lnt::sync::RetryPolicy::Options retry{};

    lnt::sync::DispatcherOptions dispatcherOptions() const {
        return lnt::sync::DispatcherOptions{gracePeriod, queuePollTimeout};
    }

    static TrackerOptions fromConfig(const lnt::common::Config& config);
};

}  // namespace app
