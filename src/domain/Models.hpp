#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace domain {

enum class PaymentStatus {
    Unknown,
    InFlight,
    Succeeded,
    Failed,
    Initiated,
};

enum class InvoiceState {
    Open,
    Settled,
    Canceled,
    Accepted,
};

const char* toString(PaymentStatus status) noexcept;
PaymentStatus paymentStatusFromString(const std::string& text);
const char* toString(InvoiceState state) noexcept;
InvoiceState invoiceStateFromString(const std::string& text);

struct NodeInfo {
    std::string pubkey;
    std::string alias;
    std::uint32_t blockHeight{0};
};

struct Payment {
    static constexpr const char* kCategory = "payments";

    std::string nodeId;
    std::uint64_t paymentIndex{0};
    std::string paymentHash;
    std::int64_t valueMsat{0};
    std::int64_t feeMsat{0};
    std::int64_t creationTimeNs{0};
    PaymentStatus status{PaymentStatus::Unknown};
    std::string failureReason;
    std::uint32_t htlcCount{0};

    bool resolved() const noexcept {
        return status == PaymentStatus::Succeeded || status == PaymentStatus::Failed;
    }
};

struct Invoice {
    static constexpr const char* kCategory = "invoices";

    std::string nodeId;
    std::uint64_t addIndex{0};
    std::uint64_t settleIndex{0};
    std::string rHash;
    std::string memo;
    std::int64_t valueMsat{0};
    std::int64_t amtPaidMsat{0};
    std::int64_t creationDate{0};
    std::int64_t settleDate{0};
    InvoiceState state{InvoiceState::Open};

    bool settled() const noexcept { return state == InvoiceState::Settled; }
};

struct ForwardingEvent {
    static constexpr const char* kCategory = "forwards";

    std::string nodeId;
    // Position in the node's forwarding log, 1-based.
    std::uint64_t offsetIndex{0};
    std::int64_t timestampNs{0};
    std::uint64_t chanIdIn{0};
    std::uint64_t chanIdOut{0};
    std::int64_t amtInMsat{0};
    std::int64_t amtOutMsat{0};
    std::int64_t feeMsat{0};
};

struct HtlcEvent {
    static constexpr const char* kCategory = "htlc_events";

    std::string nodeId;
    std::uint64_t incomingChannelId{0};
    std::uint64_t outgoingChannelId{0};
    std::uint64_t incomingHtlcId{0};
    std::uint64_t outgoingHtlcId{0};
    std::int64_t timestampNs{0};
    std::string eventType;  // SEND, RECEIVE, FORWARD, UNKNOWN
    std::string kind;       // forward_event, settle_event, link_fail_event, ...
    std::string detail;
};

struct ChannelEvent {
    static constexpr const char* kCategory = "channel_events";

    std::string nodeId;
    std::int64_t receivedAtMs{0};
    std::string type;
    std::string channelPoint;
    std::uint64_t chanId{0};
};

struct PeerEvent {
    static constexpr const char* kCategory = "peer_events";

    std::string nodeId;
    std::int64_t receivedAtMs{0};
    std::string pubKey;
    std::string type;  // PEER_ONLINE, PEER_OFFLINE
};

struct OnchainTransaction {
    static constexpr const char* kCategory = "transactions";

    std::string nodeId;
    std::int64_t receivedAtMs{0};
    std::string txHash;
    std::int64_t amountSat{0};
    std::int64_t totalFeesSat{0};
    std::int32_t numConfirmations{0};
    std::int32_t blockHeight{0};  // 0 while unconfirmed
    std::int64_t timeStamp{0};
    std::string label;
};

// One topology notification. The update lists are kept verbatim in `payload`.
struct GraphUpdate {
    static constexpr const char* kCategory = "graph_updates";

    std::string nodeId;
    std::int64_t receivedAtMs{0};
    std::size_t nodeUpdates{0};
    std::size_t channelUpdates{0};
    std::size_t closedChannels{0};
    std::string payload;
};

}  // namespace domain
