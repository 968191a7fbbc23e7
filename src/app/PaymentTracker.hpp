#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "app/Tracker.hpp"
#include "domain/lightning/ILightningNode.hpp"
#include "sync/StreamDispatcher.hpp"

namespace app {

// Resolved outgoing payments. Live updates come from the TrackPayments
// dispatcher, gaps are closed by reconciling the trailing recon window.
class PaymentTracker : public Tracker<domain::Payment> {
public:
    PaymentTracker(std::string nodeId,
                   lnt::sync::CancellationToken& token,
                   domain::IEventSink<domain::Payment>& sink,
                   const lnt::sync::ErrorClassifier& classifier,
                   TrackerOptions options,
                   domain::ILightningHistory& history,
                   lnt::sync::StreamDispatcher<domain::Payment>& dispatcher,
                   lnt::sync::RetryPolicy::Clock clock = {});

    // First payment index the next reconciliation asks for.
    std::uint64_t next_recon_index() const noexcept { return nextReconIndex_.load(); }

protected:
    lnt::sync::ItemSourcePtr<domain::Payment> pre_sync_source() override;
    StreamFactory new_stream_factory() override;
    void delete_orphaned_data() override;
    void reset_state() override;

private:
    std::vector<domain::Payment> process_(const domain::Payment& payment) const;
    lnt::sync::ItemSourcePtr<domain::Payment> new_recon_source_();

    domain::ILightningHistory& history_;
    lnt::sync::StreamDispatcher<domain::Payment>& dispatcher_;
    std::atomic<std::uint64_t> nextReconIndex_{0};
};

}  // namespace app
