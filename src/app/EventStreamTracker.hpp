#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "app/Tracker.hpp"
#include "sync/StreamDispatcher.hpp"

namespace app {

// Categories that only exist as a live subscription (HTLC, channel, peer,
// on-chain transaction and graph events). There is no history to pre-sync nor to reconcile against, so
// items missed while disconnected are lost.
template <typename Row>
class EventStreamTracker : public Tracker<Row> {
public:
    using Filter = std::function<bool(const Row&)>;

    EventStreamTracker(std::string nodeId,
                       lnt::sync::CancellationToken& token,
                       domain::IEventSink<Row>& sink,
                       const lnt::sync::ErrorClassifier& classifier,
                       TrackerOptions options,
                       lnt::sync::StreamDispatcher<Row>& dispatcher,
                       Filter filter = {},
                       lnt::sync::RetryPolicy::Clock clock = {})
        : Tracker<Row>(Row::kCategory,
                       std::move(nodeId),
                       token,
                       sink,
                       classifier,
                       std::move(options),
                       std::move(clock)),
          dispatcher_(dispatcher),
          filter_(std::move(filter)) {}

protected:
    using typename Tracker<Row>::StreamFactory;

    lnt::sync::ItemSourcePtr<Row> pre_sync_source() override { return nullptr; }

    StreamFactory new_stream_factory() override {
        return this->subscribe_to(
            dispatcher_,
            [this](const Row& item, bool) {
                std::vector<Row> rows;
                if (filter_ && !filter_(item)) {
                    return rows;
                }
                rows.push_back(item);
                rows.back().nodeId = this->node_id();
                return rows;
            },
            nullptr);
    }

private:
    lnt::sync::StreamDispatcher<Row>& dispatcher_;
    Filter filter_;
};

}  // namespace app
