#pragma once

#include <string>

#include "app/Tracker.hpp"
#include "domain/lightning/ILightningNode.hpp"

namespace app {

// Forwarding history has no subscription on the node, so the live path tails
// the history with a blocking paginator from the stored checkpoint.
class ForwardTracker : public Tracker<domain::ForwardingEvent> {
public:
    ForwardTracker(std::string nodeId,
                   lnt::sync::CancellationToken& token,
                   domain::IEventSink<domain::ForwardingEvent>& sink,
                   const lnt::sync::ErrorClassifier& classifier,
                   TrackerOptions options,
                   domain::ILightningHistory& history,
                   lnt::sync::RetryPolicy::Clock clock = {});

protected:
    lnt::sync::ItemSourcePtr<domain::ForwardingEvent> pre_sync_source() override;
    StreamFactory new_stream_factory() override;

private:
    lnt::sync::ItemSourcePtr<domain::ForwardingEvent> open_(bool blocking);

    domain::ILightningHistory& history_;
};

}  // namespace app
