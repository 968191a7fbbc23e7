#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <boost/json.hpp>

#include "domain/Models.hpp"
#include "domain/lightning/ILightningNode.hpp"

namespace adapters::lnd {

// Error object of the REST gateway, either a response body or a stream frame.
struct GatewayError {
    int code{0};
    std::string message;
};

// Throws std::runtime_error naming `what` when the body is not JSON.
boost::json::value parseBody(const std::string& body, const char* what);

std::optional<GatewayError> gatewayError(const boost::json::value& body);

// Standard base64 as used for proto `bytes` fields, returned as lowercase hex.
std::string base64ToHex(std::string_view base64);

domain::NodeInfo nodeInfoFromJson(const boost::json::value& json);

domain::Payment paymentFromJson(const boost::json::value& json);
domain::PaymentsPage paymentsPageFromJson(const boost::json::value& json);

domain::Invoice invoiceFromJson(const boost::json::value& json);
domain::InvoicesPage invoicesPageFromJson(const boost::json::value& json);

// The gateway does not number forwarding events; they get requestOffset + 1,
// requestOffset + 2, ... in response order.
domain::ForwardsPage forwardsPageFromJson(const boost::json::value& json, std::uint64_t requestOffset);
std::string forwardsRequestJson(const domain::ForwardsQuery& query);

domain::HtlcEvent htlcEventFromJson(const boost::json::value& json);
domain::ChannelEvent channelEventFromJson(const boost::json::value& json, std::int64_t receivedAtMs);
// PeerEvent.type is omitted for PEER_ONLINE, the enum's zero value.
domain::PeerEvent peerEventFromJson(const boost::json::value& json, std::int64_t receivedAtMs);
domain::OnchainTransaction transactionFromJson(const boost::json::value& json, std::int64_t receivedAtMs);
domain::GraphUpdate graphUpdateFromJson(const boost::json::value& json, std::int64_t receivedAtMs);

}  // namespace adapters::lnd
