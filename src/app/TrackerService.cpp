#include "app/TrackerService.hpp"

#include <exception>
#include <utility>

#include "common/Log.hpp"

namespace app {

TrackerService::TrackerService(lnt::sync::CancellationToken& token) : token_(token) {}

TrackerService::~TrackerService() {
    stop();
}

ITracker& TrackerService::add_tracker(std::unique_ptr<ITracker> tracker) {
    auto& ref = *tracker;
    trackers_.push_back(std::move(tracker));
    return ref;
}

void TrackerService::start() {
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true)) {
        LOG_WARN("TrackerService::start() called twice");
        return;
    }

    std::lock_guard<std::mutex> lock(threadsMutex_);
    for (auto& dispatcher : dispatchers_) {
        auto* raw = dispatcher.get();
        threads_.emplace_back([this, raw] { run_dispatcher_(*raw); });
    }
    runningTrackers_.store(trackers_.size());
    for (auto& tracker : trackers_) {
        auto* raw = tracker.get();
        threads_.emplace_back([this, raw] { run_tracker_(*raw); });
    }
    LOG_INFO("TrackerService started " << trackers_.size() << " trackers and " << dispatchers_.size()
                                       << " dispatchers");
}

void TrackerService::stop() {
    token_.set();
    for (auto& dispatcher : dispatchers_) {
        dispatcher->stop();
    }
    for (auto& tracker : trackers_) {
        tracker->pre_sync_stop();
    }

    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(threadsMutex_);
        threads.swap(threads_);
    }
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    if (!threads.empty()) {
        LOG_INFO("TrackerService stopped");
    }
}

void TrackerService::run_tracker_(ITracker& tracker) {
    try {
        tracker.pre_sync_start();
        if (!token_.is_set()) {
            tracker.start();
        }
    } catch (const std::exception& ex) {
        LOG_ERR("Tracker " << tracker.name() << " stopped: " << ex.what());
    }
    runningTrackers_.fetch_sub(1);
}

void TrackerService::run_dispatcher_(lnt::sync::DispatcherBase& dispatcher) {
    try {
        dispatcher.start();
    } catch (const std::exception& ex) {
        LOG_ERR("Dispatcher " << dispatcher.name() << " stopped: " << ex.what());
    }
}

}  // namespace app
