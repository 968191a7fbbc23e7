#include "adapters/lnd/LndJson.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/evp.h>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace adapters::lnd {
namespace {

const boost::json::object& asObject(const boost::json::value& json, const char* what) {
    if (!json.is_object()) {
        throw std::runtime_error(std::string{"Unexpected LND JSON for "} + what + " (expected object)");
    }
    return json.as_object();
}

const boost::json::value* find(const boost::json::object& object, const char* key) {
    return object.if_contains(key);
}

std::int64_t json_to_int64(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stoll(str);
        } catch (const std::exception& ex) {
            throw std::runtime_error("Failed to parse integer value: " + str + ", error: " + ex.what());
        }
    }
    throw std::runtime_error("Unsupported JSON type for integer conversion");
}

std::uint64_t json_to_uint64(const boost::json::value& value) {
    if (value.is_uint64()) {
        return value.as_uint64();
    }
    if (value.is_int64()) {
        const auto signedValue = value.as_int64();
        if (signedValue < 0) {
            throw std::runtime_error("Negative value for unsigned field: " + std::to_string(signedValue));
        }
        return static_cast<std::uint64_t>(signedValue);
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stoull(str);
        } catch (const std::exception& ex) {
            throw std::runtime_error("Failed to parse unsigned value: " + str + ", error: " + ex.what());
        }
    }
    throw std::runtime_error("Unsupported JSON type for unsigned conversion");
}

// Proto3 JSON omits fields holding their default value.
std::int64_t int64Or(const boost::json::object& object, const char* key, std::int64_t fallback = 0) {
    const auto* value = find(object, key);
    return value == nullptr || value->is_null() ? fallback : json_to_int64(*value);
}

std::uint64_t uint64Or(const boost::json::object& object, const char* key, std::uint64_t fallback = 0) {
    const auto* value = find(object, key);
    return value == nullptr || value->is_null() ? fallback : json_to_uint64(*value);
}

std::string stringOr(const boost::json::object& object, const char* key, const std::string& fallback = {}) {
    const auto* value = find(object, key);
    if (value == nullptr || !value->is_string()) {
        return fallback;
    }
    return std::string{value->as_string().c_str()};
}

std::string toHex(const unsigned char* data, std::size_t size) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < size; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(data[i]);
    }
    return oss.str();
}

std::vector<unsigned char> decodeBase64(std::string_view base64) {
    if (base64.empty()) {
        return {};
    }
    if (base64.size() % 4U != 0U) {
        throw std::runtime_error("Invalid base64 length: " + std::to_string(base64.size()));
    }
    std::vector<unsigned char> out(base64.size() / 4U * 3U);
    const int written = ::EVP_DecodeBlock(out.data(),
                                          reinterpret_cast<const unsigned char*>(base64.data()),
                                          static_cast<int>(base64.size()));
    if (written < 0) {
        throw std::runtime_error("Invalid base64 payload");
    }
    // EVP_DecodeBlock keeps the zero bytes produced by padding.
    std::size_t size = static_cast<std::size_t>(written);
    if (base64.back() == '=') {
        --size;
        if (base64[base64.size() - 2U] == '=') {
            --size;
        }
    }
    out.resize(size);
    return out;
}

// lnrpc.ChannelPoint: the txid travels as reversed raw bytes.
std::string channelPointFromJson(const boost::json::object& point) {
    std::string txid = stringOr(point, "funding_txid_str");
    if (txid.empty()) {
        auto bytes = decodeBase64(stringOr(point, "funding_txid_bytes"));
        std::reverse(bytes.begin(), bytes.end());
        txid = toHex(bytes.data(), bytes.size());
    }
    return txid + ":" + std::to_string(uint64Or(point, "output_index"));
}

template <typename Row, typename Parse>
std::vector<Row> parseItems(const boost::json::object& page, const char* key, Parse parse, std::size_t& received) {
    std::vector<Row> rows;
    received = 0;
    const auto* items = find(page, key);
    if (items == nullptr || items->is_null()) {
        return rows;
    }
    if (!items->is_array()) {
        throw std::runtime_error(std::string{"Unexpected LND JSON field '"} + key + "' (expected array)");
    }
    received = items->as_array().size();
    rows.reserve(received);
    for (const auto& item : items->as_array()) {
        try {
            rows.push_back(parse(item));
        } catch (const std::exception& ex) {
            lnt::common::metrics::Registry::instance().incrementCounter("conversion_errors_total");
            LOG_WARN("Skipping malformed LND " << key << " entry: " << ex.what());
        }
    }
    return rows;
}

}  // namespace

boost::json::value parseBody(const std::string& body, const char* what) {
    try {
        return boost::json::parse(body);
    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string{"Failed to parse LND response for "} + what + ": " + ex.what());
    }
}

std::optional<GatewayError> gatewayError(const boost::json::value& body) {
    if (!body.is_object()) {
        return std::nullopt;
    }
    const auto& object = body.as_object();
    const boost::json::object* error = &object;
    if (const auto* nested = find(object, "error"); nested != nullptr && nested->is_object()) {
        error = &nested->as_object();
    } else if (find(object, "message") == nullptr) {
        return std::nullopt;
    }

    GatewayError result;
    if (find(*error, "grpc_code") != nullptr) {
        result.code = static_cast<int>(int64Or(*error, "grpc_code"));
    } else {
        result.code = static_cast<int>(int64Or(*error, "code"));
    }
    result.message = stringOr(*error, "message");
    return result;
}

std::string base64ToHex(std::string_view base64) {
    const auto bytes = decodeBase64(base64);
    return toHex(bytes.data(), bytes.size());
}

domain::NodeInfo nodeInfoFromJson(const boost::json::value& json) {
    const auto& object = asObject(json, "GetInfo");
    domain::NodeInfo info;
    info.pubkey = stringOr(object, "identity_pubkey");
    info.alias = stringOr(object, "alias");
    info.blockHeight = static_cast<std::uint32_t>(uint64Or(object, "block_height"));
    if (info.pubkey.empty()) {
        throw std::runtime_error("LND GetInfo response without identity_pubkey");
    }
    return info;
}

domain::Payment paymentFromJson(const boost::json::value& json) {
    const auto& object = asObject(json, "Payment");
    domain::Payment payment;
    payment.paymentIndex = uint64Or(object, "payment_index");
    payment.paymentHash = stringOr(object, "payment_hash");
    payment.valueMsat = int64Or(object, "value_msat");
    payment.feeMsat = int64Or(object, "fee_msat");
    payment.creationTimeNs = int64Or(object, "creation_time_ns");
    payment.status = domain::paymentStatusFromString(stringOr(object, "status"));
    payment.failureReason = stringOr(object, "failure_reason");
    if (const auto* htlcs = find(object, "htlcs"); htlcs != nullptr && htlcs->is_array()) {
        payment.htlcCount = static_cast<std::uint32_t>(htlcs->as_array().size());
    }
    if (payment.paymentIndex == 0U) {
        throw std::runtime_error("LND payment without payment_index");
    }
    return payment;
}

domain::PaymentsPage paymentsPageFromJson(const boost::json::value& json) {
    const auto& object = asObject(json, "ListPayments");
    domain::PaymentsPage page;
    page.payments = parseItems<domain::Payment>(object, "payments", paymentFromJson, page.received);
    page.first_index_offset = uint64Or(object, "first_index_offset");
    page.last_index_offset = uint64Or(object, "last_index_offset");
    return page;
}

domain::Invoice invoiceFromJson(const boost::json::value& json) {
    const auto& object = asObject(json, "Invoice");
    domain::Invoice invoice;
    invoice.addIndex = uint64Or(object, "add_index");
    invoice.settleIndex = uint64Or(object, "settle_index");
    invoice.rHash = base64ToHex(stringOr(object, "r_hash"));
    invoice.memo = stringOr(object, "memo");
    invoice.valueMsat = int64Or(object, "value_msat");
    invoice.amtPaidMsat = int64Or(object, "amt_paid_msat");
    invoice.creationDate = int64Or(object, "creation_date");
    invoice.settleDate = int64Or(object, "settle_date");
    invoice.state = domain::invoiceStateFromString(stringOr(object, "state", "OPEN"));
    if (invoice.addIndex == 0U) {
        throw std::runtime_error("LND invoice without add_index");
    }
    return invoice;
}

domain::InvoicesPage invoicesPageFromJson(const boost::json::value& json) {
    const auto& object = asObject(json, "ListInvoices");
    domain::InvoicesPage page;
    page.invoices = parseItems<domain::Invoice>(object, "invoices", invoiceFromJson, page.received);
    page.first_index_offset = uint64Or(object, "first_index_offset");
    page.last_index_offset = uint64Or(object, "last_index_offset");
    return page;
}

domain::ForwardsPage forwardsPageFromJson(const boost::json::value& json, std::uint64_t requestOffset) {
    const auto& object = asObject(json, "ForwardingHistory");
    domain::ForwardsPage page;
    page.last_offset_index = uint64Or(object, "last_offset_index");

    std::uint64_t position = requestOffset;
    page.events = parseItems<domain::ForwardingEvent>(
        object, "forwarding_events", [&position](const boost::json::value& item) {
            ++position;
            const auto& event = asObject(item, "ForwardingEvent");
            domain::ForwardingEvent row;
            row.offsetIndex = position;
            row.timestampNs = int64Or(event, "timestamp_ns", int64Or(event, "timestamp") * 1000000000LL);
            row.chanIdIn = uint64Or(event, "chan_id_in");
            row.chanIdOut = uint64Or(event, "chan_id_out");
            row.amtInMsat = int64Or(event, "amt_in_msat", int64Or(event, "amt_in") * 1000);
            row.amtOutMsat = int64Or(event, "amt_out_msat", int64Or(event, "amt_out") * 1000);
            row.feeMsat = int64Or(event, "fee_msat", int64Or(event, "fee") * 1000);
            return row;
        },
        page.received);
    return page;
}

std::string forwardsRequestJson(const domain::ForwardsQuery& query) {
    boost::json::object body;
    body["index_offset"] = query.index_offset;
    body["num_max_events"] = query.num_max_events;
    // Without start_time the gateway only returns the last 24 hours.
    body["start_time"] = std::to_string(query.start_time);
    return boost::json::serialize(body);
}

domain::HtlcEvent htlcEventFromJson(const boost::json::value& json) {
    static const char* const kKinds[] = {
        "forward_event",
        "forward_fail_event",
        "settle_event",
        "link_fail_event",
        "final_htlc_event",
        "subscribed_event",
    };

    const auto& object = asObject(json, "HtlcEvent");
    domain::HtlcEvent event;
    event.incomingChannelId = uint64Or(object, "incoming_channel_id");
    event.outgoingChannelId = uint64Or(object, "outgoing_channel_id");
    event.incomingHtlcId = uint64Or(object, "incoming_htlc_id");
    event.outgoingHtlcId = uint64Or(object, "outgoing_htlc_id");
    event.timestampNs = int64Or(object, "timestamp_ns");
    event.eventType = stringOr(object, "event_type", "UNKNOWN");

    for (const char* kind : kKinds) {
        const auto* payload = find(object, kind);
        if (payload == nullptr) {
            continue;
        }
        event.kind = kind;
        if (payload->is_object()) {
            const auto& details = payload->as_object();
            if (event.kind == "link_fail_event") {
                event.detail = stringOr(details, "failure_string", stringOr(details, "failure_detail"));
            } else if (event.kind == "final_htlc_event") {
                const auto* settled = find(details, "settled");
                event.detail = settled != nullptr && settled->is_bool() && settled->as_bool() ? "settled" : "failed";
            }
        }
        break;
    }
    if (event.kind.empty()) {
        throw std::runtime_error("LND HTLC event without a known event payload");
    }
    return event;
}

domain::ChannelEvent channelEventFromJson(const boost::json::value& json, std::int64_t receivedAtMs) {
    const auto& object = asObject(json, "ChannelEventUpdate");
    domain::ChannelEvent event;
    event.receivedAtMs = receivedAtMs;
    event.type = stringOr(object, "type");
    if (event.type.empty()) {
        throw std::runtime_error("LND channel event without type");
    }

    if (const auto* channel = find(object, "open_channel"); channel != nullptr && channel->is_object()) {
        event.channelPoint = stringOr(channel->as_object(), "channel_point");
        event.chanId = uint64Or(channel->as_object(), "chan_id");
    } else if (const auto* closed = find(object, "closed_channel"); closed != nullptr && closed->is_object()) {
        event.channelPoint = stringOr(closed->as_object(), "channel_point");
        event.chanId = uint64Or(closed->as_object(), "chan_id");
    } else if (const auto* pending = find(object, "pending_open_channel");
               pending != nullptr && pending->is_object()) {
        auto bytes = decodeBase64(stringOr(pending->as_object(), "txid"));
        std::reverse(bytes.begin(), bytes.end());
        event.channelPoint = toHex(bytes.data(), bytes.size()) + ":" +
                             std::to_string(uint64Or(pending->as_object(), "output_index"));
    } else {
        for (const char* key : {"active_channel", "inactive_channel", "fully_resolved_channel"}) {
            const auto* point = find(object, key);
            if (point != nullptr && point->is_object()) {
                event.channelPoint = channelPointFromJson(point->as_object());
                break;
            }
        }
    }
    return event;
}

domain::PeerEvent peerEventFromJson(const boost::json::value& json, std::int64_t receivedAtMs) {
    const auto& object = asObject(json, "PeerEvent");
    domain::PeerEvent event;
    event.receivedAtMs = receivedAtMs;
    event.pubKey = stringOr(object, "pub_key");
    if (event.pubKey.empty()) {
        throw std::runtime_error("LND peer event without pub_key");
    }
    event.type = stringOr(object, "type", "PEER_ONLINE");
    return event;
}

domain::OnchainTransaction transactionFromJson(const boost::json::value& json, std::int64_t receivedAtMs) {
    const auto& object = asObject(json, "Transaction");
    domain::OnchainTransaction tx;
    tx.receivedAtMs = receivedAtMs;
    tx.txHash = stringOr(object, "tx_hash");
    if (tx.txHash.empty()) {
        throw std::runtime_error("LND transaction without tx_hash");
    }
    tx.amountSat = int64Or(object, "amount");
    tx.totalFeesSat = int64Or(object, "total_fees");
    tx.numConfirmations = static_cast<std::int32_t>(int64Or(object, "num_confirmations"));
    tx.blockHeight = static_cast<std::int32_t>(int64Or(object, "block_height"));
    tx.timeStamp = int64Or(object, "time_stamp");
    tx.label = stringOr(object, "label");
    return tx;
}

domain::GraphUpdate graphUpdateFromJson(const boost::json::value& json, std::int64_t receivedAtMs) {
    const auto& object = asObject(json, "GraphTopologyUpdate");
    const auto countOf = [&object](const char* key) -> std::size_t {
        const auto* list = find(object, key);
        return list != nullptr && list->is_array() ? list->as_array().size() : 0U;
    };
    domain::GraphUpdate update;
    update.receivedAtMs = receivedAtMs;
    update.nodeUpdates = countOf("node_updates");
    update.channelUpdates = countOf("channel_updates");
    update.closedChannels = countOf("closed_chans");
    update.payload = boost::json::serialize(json);
    return update;
}

}  // namespace adapters::lnd
