#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "app/Tracker.hpp"
#include "sync/CancellationToken.hpp"
#include "sync/StreamDispatcher.hpp"

namespace app {

// Owns the dispatchers and trackers of one node and the threads that run
// them. A failing tracker stops alone; the others keep running.
class TrackerService {
public:
    explicit TrackerService(lnt::sync::CancellationToken& token);
    ~TrackerService();

    TrackerService(const TrackerService&) = delete;
    TrackerService& operator=(const TrackerService&) = delete;

    template <typename T>
    lnt::sync::StreamDispatcher<T>& add_dispatcher(std::unique_ptr<lnt::sync::StreamDispatcher<T>> dispatcher) {
        auto& ref = *dispatcher;
        dispatchers_.push_back(std::move(dispatcher));
        return ref;
    }

    ITracker& add_tracker(std::unique_ptr<ITracker> tracker);

    void start();

    // Cancels the token, stops everything and joins. Safe to call twice.
    void stop();

    std::size_t running_trackers() const noexcept { return runningTrackers_.load(); }
    std::size_t tracker_count() const noexcept { return trackers_.size(); }

private:
    void run_tracker_(ITracker& tracker);
    void run_dispatcher_(lnt::sync::DispatcherBase& dispatcher);

    lnt::sync::CancellationToken& token_;
    // Dispatchers outlive the trackers subscribed to them.
    std::vector<std::unique_ptr<lnt::sync::DispatcherBase>> dispatchers_;
    std::vector<std::unique_ptr<ITracker>> trackers_;

    std::mutex threadsMutex_;
    std::vector<std::thread> threads_;
    std::atomic<std::size_t> runningTrackers_{0};
    std::atomic<bool> started_{false};
};

}  // namespace app
