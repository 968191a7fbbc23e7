#include "app/ForwardTracker.hpp"

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "app/LightningPaginators.hpp"

namespace app {

ForwardTracker::ForwardTracker(std::string nodeId,
                               lnt::sync::CancellationToken& token,
                               domain::IEventSink<domain::ForwardingEvent>& sink,
                               const lnt::sync::ErrorClassifier& classifier,
                               TrackerOptions options,
                               domain::ILightningHistory& history,
                               lnt::sync::RetryPolicy::Clock clock)
    : Tracker(domain::ForwardingEvent::kCategory,
              std::move(nodeId),
              token,
              sink,
              classifier,
              std::move(options),
              std::move(clock)),
      history_(history) {}

lnt::sync::ItemSourcePtr<domain::ForwardingEvent> ForwardTracker::pre_sync_source() {
    return open_(false);
}

ForwardTracker::StreamFactory ForwardTracker::new_stream_factory() {
    return [this] { return open_(true); };
}

lnt::sync::ItemSourcePtr<domain::ForwardingEvent> ForwardTracker::open_(bool blocking) {
    // Re-read on every open so a retried stream resumes after the last stored event.
    const auto offset = sink().get_checkpoint(domain::ForwardingEvent::kCategory, node_id());
    LOG_DEBUG(name() << (blocking ? ": tailing" : ": pre-sync") << " from offset " << offset);

    std::optional<std::chrono::milliseconds> pollInterval;
    if (blocking) {
        pollInterval = options().tailPollInterval;
    }
    auto paginator = makeForwardsPaginator(token(), history_, options().pageSize);
    return std::make_unique<lnt::sync::ConvertingSource<domain::ForwardingEvent, domain::ForwardingEvent>>(
        paginator.request(std::nullopt, pollInterval, offset),
        [this](const domain::ForwardingEvent& event) {
            domain::ForwardingEvent row = event;
            row.nodeId = node_id();
            return std::vector<domain::ForwardingEvent>{std::move(row)};
        },
        name() + (blocking ? ".tail" : ".pre_sync"));
}

}  // namespace app
