#include "app/PaymentTracker.hpp"

#include <chrono>
#include <memory>
#include <utility>

#include "app/LightningPaginators.hpp"

namespace app {

namespace {

std::int64_t reconStartSec(std::chrono::seconds window) {
    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch());
    return (now - window).count();
}

}  // namespace

PaymentTracker::PaymentTracker(std::string nodeId,
                               lnt::sync::CancellationToken& token,
                               domain::IEventSink<domain::Payment>& sink,
                               const lnt::sync::ErrorClassifier& classifier,
                               TrackerOptions options,
                               domain::ILightningHistory& history,
                               lnt::sync::StreamDispatcher<domain::Payment>& dispatcher,
                               lnt::sync::RetryPolicy::Clock clock)
    : Tracker(domain::Payment::kCategory,
              std::move(nodeId),
              token,
              sink,
              classifier,
              std::move(options),
              std::move(clock)),
      history_(history),
      dispatcher_(dispatcher) {}

lnt::sync::ItemSourcePtr<domain::Payment> PaymentTracker::pre_sync_source() {
    const auto offset = sink().get_checkpoint(domain::Payment::kCategory, node_id());
    LOG_DEBUG(name() << ": pre-sync from index " << offset);

    domain::PaymentsQuery base;
    base.include_incomplete = true;
    auto paginator = makePaymentsPaginator(token(), history_, options().pageSize, base);
    return std::make_unique<lnt::sync::ConvertingSource<domain::Payment, domain::Payment>>(
        paginator.request(std::nullopt, std::nullopt, offset),
        [this](const domain::Payment& payment) { return process_(payment); },
        name() + ".pre_sync");
}

PaymentTracker::StreamFactory PaymentTracker::new_stream_factory() {
    return subscribe_to(
        dispatcher_,
        [this](const domain::Payment& payment, bool) { return process_(payment); },
        [this] { return new_recon_source_(); });
}

void PaymentTracker::delete_orphaned_data() {
    const auto removed = sink().delete_orphaned(domain::Payment::kCategory, node_id());
    if (removed > 0U) {
        LOG_INFO(name() << ": removed " << removed << " orphaned payments");
    }
}

void PaymentTracker::reset_state() {
    nextReconIndex_.store(0);
}

std::vector<domain::Payment> PaymentTracker::process_(const domain::Payment& payment) const {
    // Payments without attempts carry nothing worth storing.
    if (!payment.resolved() || payment.htlcCount == 0U) {
        return {};
    }
    domain::Payment row = payment;
    row.nodeId = node_id();
    return {std::move(row)};
}

lnt::sync::ItemSourcePtr<domain::Payment> PaymentTracker::new_recon_source_() {
    LOG_DEBUG(name() << ": reconciliation from index " << nextReconIndex_.load());

    domain::PaymentsQuery base;
    base.include_incomplete = true;
    base.creation_date_start = reconStartSec(options().reconWindow);
    auto paginator = makePaymentsPaginator(token(), history_, options().pageSize, base);

    auto unresolvedFound = std::make_shared<bool>(false);
    return std::make_unique<lnt::sync::ConvertingSource<domain::Payment, domain::Payment>>(
        paginator.request(std::nullopt, std::nullopt, nextReconIndex_.load()),
        [this, unresolvedFound](const domain::Payment& payment) {
            if (!*unresolvedFound) {
                if (payment.resolved()) {
                    nextReconIndex_.store(payment.paymentIndex);
                } else {
                    *unresolvedFound = true;
                    LOG_DEBUG(name() << ": first unresolved payment " << payment.paymentIndex
                                     << ", next reconciliation starts at " << nextReconIndex_.load());
                }
            }
            return process_(payment);
        },
        name() + ".recon");
}

}  // namespace app
