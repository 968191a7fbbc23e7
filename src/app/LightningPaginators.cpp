#include "app/LightningPaginators.hpp"

#include <utility>

namespace app {

PaymentsPaginator makePaymentsPaginator(const lnt::sync::CancellationToken& token,
                                        domain::ILightningHistory& history,
                                        std::size_t pageSize,
                                        domain::PaymentsQuery baseQuery) {
    return PaymentsPaginator(
        token,
        [&history](const domain::PaymentsQuery& query) { return history.list_payments(query); },
        [](const domain::PaymentsPage& page) {
            return PaymentsPaginator::Page{page.payments, page.last_index_offset, page.received};
        },
        [](domain::PaymentsQuery& query, std::uint64_t offset, std::size_t size) {
            query.index_offset = offset;
            query.max_payments = size;
        },
        pageSize,
        std::move(baseQuery));
}

InvoicesPaginator makeInvoicesPaginator(const lnt::sync::CancellationToken& token,
                                        domain::ILightningHistory& history,
                                        std::size_t pageSize,
                                        domain::InvoicesQuery baseQuery) {
    return InvoicesPaginator(
        token,
        [&history](const domain::InvoicesQuery& query) { return history.list_invoices(query); },
        [](const domain::InvoicesPage& page) {
            return InvoicesPaginator::Page{page.invoices, page.last_index_offset, page.received};
        },
        [](domain::InvoicesQuery& query, std::uint64_t offset, std::size_t size) {
            query.index_offset = offset;
            query.num_max_invoices = size;
        },
        pageSize,
        std::move(baseQuery));
}

ForwardsPaginator makeForwardsPaginator(const lnt::sync::CancellationToken& token,
                                        domain::ILightningHistory& history,
                                        std::size_t pageSize,
                                        domain::ForwardsQuery baseQuery) {
    return ForwardsPaginator(
        token,
        [&history](const domain::ForwardsQuery& query) { return history.forwarding_history(query); },
        [](const domain::ForwardsPage& page) {
            return ForwardsPaginator::Page{page.events, page.last_offset_index, page.received};
        },
        [](domain::ForwardsQuery& query, std::uint64_t offset, std::size_t size) {
            query.index_offset = offset;
            query.num_max_events = size;
        },
        pageSize,
        std::move(baseQuery));
}

}  // namespace app
