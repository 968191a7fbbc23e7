#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "app/Tracker.hpp"
#include "domain/lightning/ILightningNode.hpp"
#include "sync/StreamDispatcher.hpp"

namespace app {

// Settled invoices, keyed by add index.
class InvoiceTracker : public Tracker<domain::Invoice> {
public:
    InvoiceTracker(std::string nodeId,
                   lnt::sync::CancellationToken& token,
                   domain::IEventSink<domain::Invoice>& sink,
                   const lnt::sync::ErrorClassifier& classifier,
                   TrackerOptions options,
                   domain::ILightningHistory& history,
                   lnt::sync::StreamDispatcher<domain::Invoice>& dispatcher,
                   lnt::sync::RetryPolicy::Clock clock = {});

    std::uint64_t next_recon_index() const noexcept { return nextReconIndex_.load(); }

protected:
    lnt::sync::ItemSourcePtr<domain::Invoice> pre_sync_source() override;
    StreamFactory new_stream_factory() override;
    void reset_state() override;

private:
    std::vector<domain::Invoice> process_(const domain::Invoice& invoice) const;
    lnt::sync::ItemSourcePtr<domain::Invoice> new_recon_source_();

    domain::ILightningHistory& history_;
    lnt::sync::StreamDispatcher<domain::Invoice>& dispatcher_;
    std::atomic<std::uint64_t> nextReconIndex_{0};
};

}  // namespace app
