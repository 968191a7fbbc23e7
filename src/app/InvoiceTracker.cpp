#include "app/InvoiceTracker.hpp"

#include <chrono>
#include <memory>
#include <utility>

#include "app/LightningPaginators.hpp"

namespace app {

InvoiceTracker::InvoiceTracker(std::string nodeId,
                               lnt::sync::CancellationToken& token,
                               domain::IEventSink<domain::Invoice>& sink,
                               const lnt::sync::ErrorClassifier& classifier,
                               TrackerOptions options,
                               domain::ILightningHistory& history,
                               lnt::sync::StreamDispatcher<domain::Invoice>& dispatcher,
                               lnt::sync::RetryPolicy::Clock clock)
    : Tracker(domain::Invoice::kCategory,
              std::move(nodeId),
              token,
              sink,
              classifier,
              std::move(options),
              std::move(clock)),
      history_(history),
      dispatcher_(dispatcher) {}

lnt::sync::ItemSourcePtr<domain::Invoice> InvoiceTracker::pre_sync_source() {
    const auto offset = sink().get_checkpoint(domain::Invoice::kCategory, node_id());
    LOG_DEBUG(name() << ": pre-sync from add index " << offset);

    auto paginator = makeInvoicesPaginator(token(), history_, options().pageSize);
    return std::make_unique<lnt::sync::ConvertingSource<domain::Invoice, domain::Invoice>>(
        paginator.request(std::nullopt, std::nullopt, offset),
        [this](const domain::Invoice& invoice) { return process_(invoice); },
        name() + ".pre_sync");
}

InvoiceTracker::StreamFactory InvoiceTracker::new_stream_factory() {
    return subscribe_to(
        dispatcher_,
        [this](const domain::Invoice& invoice, bool) { return process_(invoice); },
        [this] { return new_recon_source_(); });
}

void InvoiceTracker::reset_state() {
    nextReconIndex_.store(0);
}

std::vector<domain::Invoice> InvoiceTracker::process_(const domain::Invoice& invoice) const {
    if (!invoice.settled()) {
        return {};
    }
    domain::Invoice row = invoice;
    row.nodeId = node_id();
    return {std::move(row)};
}

lnt::sync::ItemSourcePtr<domain::Invoice> InvoiceTracker::new_recon_source_() {
    LOG_DEBUG(name() << ": reconciliation from add index " << nextReconIndex_.load());

    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch());
    domain::InvoicesQuery base;
    base.creation_date_start = (now - options().reconWindow).count();
    auto paginator = makeInvoicesPaginator(token(), history_, options().pageSize, base);

    auto unsettledFound = std::make_shared<bool>(false);
    return std::make_unique<lnt::sync::ConvertingSource<domain::Invoice, domain::Invoice>>(
        paginator.request(std::nullopt, std::nullopt, nextReconIndex_.load()),
        [this, unsettledFound](const domain::Invoice& invoice) {
            if (!*unsettledFound) {
                if (invoice.settled()) {
                    nextReconIndex_.store(invoice.addIndex);
                } else {
                    *unsettledFound = true;
                    LOG_DEBUG(name() << ": first unsettled invoice " << invoice.addIndex);
                }
            }
            return process_(invoice);
        },
        name() + ".recon");
}

}  // namespace app
