#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "domain/Models.hpp"
#include "sync/UpstreamStream.hpp"

namespace domain {

struct PaymentsQuery {
  std::uint64_t index_offset{0};
  std::size_t max_payments{100};
  bool include_incomplete{true};
  std::int64_t creation_date_start{0};
};

struct PaymentsPage {
  std::vector<Payment> payments;
  std::uint64_t first_index_offset{0};
  std::uint64_t last_index_offset{0};
  // Entries the node returned, including ones that failed to parse.
  std::size_t received{0};
};

struct InvoicesQuery {
  std::uint64_t index_offset{0};
  std::size_t num_max_invoices{100};
  std::int64_t creation_date_start{0};
};

struct InvoicesPage {
  std::vector<Invoice> invoices;
  std::uint64_t first_index_offset{0};
  std::uint64_t last_index_offset{0};
  std::size_t received{0};
};

struct ForwardsQuery {
  std::uint64_t index_offset{0};
  std::size_t num_max_events{100};
  std::int64_t start_time{0};
};

struct ForwardsPage {
  std::vector<ForwardingEvent> events;
  std::uint64_t last_offset_index{0};
  std::size_t received{0};
};

// Paged history of a lightning node. Implementations throw
// lnt::sync::TransportError on failure.
class ILightningHistory {
 public:
  virtual ~ILightningHistory() = default;
  virtual NodeInfo get_info() = 0;
  virtual PaymentsPage list_payments(const PaymentsQuery& query) = 0;
  virtual InvoicesPage list_invoices(const InvoicesQuery& query) = 0;
  virtual ForwardsPage forwarding_history(const ForwardsQuery& query) = 0;
};

// Live subscriptions of a lightning node. Each call opens a new server side
// stream.
class ILightningStreams {
 public:
  virtual ~ILightningStreams() = default;
  virtual std::unique_ptr<lnt::sync::UpstreamStream<Payment>> track_payments() = 0;
  virtual std::unique_ptr<lnt::sync::UpstreamStream<Invoice>> subscribe_invoices() = 0;
  virtual std::unique_ptr<lnt::sync::UpstreamStream<HtlcEvent>> subscribe_htlc_events() = 0;
  virtual std::unique_ptr<lnt::sync::UpstreamStream<ChannelEvent>> subscribe_channel_events() = 0;
  virtual std::unique_ptr<lnt::sync::UpstreamStream<PeerEvent>> subscribe_peer_events() = 0;
  virtual std::unique_ptr<lnt::sync::UpstreamStream<OnchainTransaction>> subscribe_transactions() = 0;
  virtual std::unique_ptr<lnt::sync::UpstreamStream<GraphUpdate>> subscribe_channel_graph() = 0;
};

}  // namespace domain
