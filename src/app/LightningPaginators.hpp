#pragma once

#include <cstddef>

#include "domain/lightning/ILightningNode.hpp"
#include "sync/CancellationToken.hpp"
#include "sync/Paginator.hpp"

namespace app {

using PaymentsPaginator = lnt::sync::Paginator<domain::PaymentsQuery, domain::PaymentsPage, domain::Payment>;
using InvoicesPaginator = lnt::sync::Paginator<domain::InvoicesQuery, domain::InvoicesPage, domain::Invoice>;
using ForwardsPaginator =
    lnt::sync::Paginator<domain::ForwardsQuery, domain::ForwardsPage, domain::ForwardingEvent>;

// Offsets are exclusive: a page starting at offset N holds items with an
// index greater than N.
PaymentsPaginator makePaymentsPaginator(const lnt::sync::CancellationToken& token,
                                        domain::ILightningHistory& history,
                                        std::size_t pageSize,
                                        domain::PaymentsQuery baseQuery = {});

InvoicesPaginator makeInvoicesPaginator(const lnt::sync::CancellationToken& token,
                                        domain::ILightningHistory& history,
                                        std::size_t pageSize,
                                        domain::InvoicesQuery baseQuery = {});

ForwardsPaginator makeForwardsPaginator(const lnt::sync::CancellationToken& token,
                                        domain::ILightningHistory& history,
                                        std::size_t pageSize,
                                        domain::ForwardsQuery baseQuery = {});

}  // namespace app
