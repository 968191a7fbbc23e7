#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#include <boost/json.hpp>

#include "adapters/lnd/LndErrorClassifier.hpp"
#include "adapters/lnd/LndJson.hpp"
#include "sync/Errors.hpp"

using namespace adapters::lnd;
using lnt::sync::ErrorKind;

namespace {

template <typename Expected>
bool rethrowsAs(const std::exception_ptr& error) {
    if (!error) {
        return false;
    }
    try {
        std::rethrow_exception(error);
    } catch (const Expected&) {
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

}  // namespace

int main() {
    {
        const auto page = paymentsPageFromJson(boost::json::parse(R"({
            "payments": [
                {"payment_index": "7", "payment_hash": "ab", "value_msat": "5000", "fee_msat": "12",
                 "creation_time_ns": "1700000000000000000", "status": "SUCCEEDED",
                 "failure_reason": "FAILURE_REASON_NONE", "htlcs": [{}, {}]},
                {"payment_hash": "no-index", "status": "FAILED"},
                {"payment_index": "9", "status": "IN_FLIGHT", "htlcs": []}
            ],
            "first_index_offset": "7",
            "last_index_offset": "9"
        })"));
        if (page.payments.size() != 2 || page.received != 3 || page.last_index_offset != 9 ||
            page.first_index_offset != 7) {
            std::cerr << "Payments page should skip the malformed entry\n";
            return 1;
        }
        const auto& payment = page.payments.front();
        if (payment.paymentIndex != 7 || payment.valueMsat != 5000 || payment.feeMsat != 12 ||
            payment.status != domain::PaymentStatus::Succeeded || payment.htlcCount != 2 ||
            payment.creationTimeNs != 1700000000000000000LL) {
            std::cerr << "Payment fields were not parsed\n";
            return 1;
        }
        if (page.payments.back().status != domain::PaymentStatus::InFlight || page.payments.back().resolved()) {
            std::cerr << "In-flight payment status was not parsed\n";
            return 1;
        }
    }

    {
        const auto invoice = invoiceFromJson(boost::json::parse(R"({
            "add_index": "3", "settle_index": "1", "r_hash": "AAEC", "memo": "coffee",
            "value_msat": "21000", "amt_paid_msat": "21000", "creation_date": "1700000000",
            "settle_date": "1700000100", "state": "SETTLED"
        })"));
        if (invoice.addIndex != 3 || invoice.rHash != "000102" || !invoice.settled() || invoice.memo != "coffee") {
            std::cerr << "Invoice fields were not parsed (r_hash=" << invoice.rHash << ")\n";
            return 1;
        }
        if (base64ToHex("/w==") != "ff" || !base64ToHex("").empty()) {
            std::cerr << "base64ToHex mishandled padding\n";
            return 1;
        }
    }

    {
        const auto page = forwardsPageFromJson(boost::json::parse(R"({
            "forwarding_events": [
                {"timestamp_ns": "1000", "chan_id_in": "11", "chan_id_out": "22",
                 "amt_in_msat": "2000", "amt_out_msat": "1990", "fee_msat": "10"},
                {"timestamp": "2", "amt_in": "3", "amt_out": "2", "fee": "1"}
            ],
            "last_offset_index": "42"
        })"),
                                               40);
        if (page.events.size() != 2 || page.received != 2 || page.last_offset_index != 42) {
            std::cerr << "Forwarding page was not parsed\n";
            return 1;
        }
        if (page.events[0].offsetIndex != 41 || page.events[1].offsetIndex != 42) {
            std::cerr << "Forwarding events should be numbered from the request offset\n";
            return 1;
        }
        if (page.events[1].feeMsat != 1000 || page.events[1].timestampNs != 2000000000LL ||
            page.events[0].chanIdOut != 22) {
            std::cerr << "Forwarding sat fallbacks were not applied\n";
            return 1;
        }

        domain::ForwardsQuery query;
        query.index_offset = 40;
        query.num_max_events = 100;
        const auto body = boost::json::parse(forwardsRequestJson(query)).as_object();
        if (body.at("index_offset").as_int64() != 40 || body.at("start_time").as_string() != "0") {
            std::cerr << "Unexpected forwarding history request: " << forwardsRequestJson(query) << "\n";
            return 1;
        }
    }

    {
        const auto failure = htlcEventFromJson(boost::json::parse(R"({
            "incoming_channel_id": "5", "outgoing_channel_id": "6", "incoming_htlc_id": "1",
            "outgoing_htlc_id": "2", "timestamp_ns": "99", "event_type": "FORWARD",
            "link_fail_event": {"failure_string": "insufficient balance"}
        })"));
        if (failure.kind != "link_fail_event" || failure.detail != "insufficient balance" ||
            failure.eventType != "FORWARD" || failure.incomingChannelId != 5) {
            std::cerr << "HTLC link failure was not parsed\n";
            return 1;
        }
        const auto settled = htlcEventFromJson(boost::json::parse(R"({"final_htlc_event": {"settled": true}})"));
        if (settled.kind != "final_htlc_event" || settled.detail != "settled" || settled.eventType != "UNKNOWN") {
            std::cerr << "Final HTLC event was not parsed\n";
            return 1;
        }
        try {
            htlcEventFromJson(boost::json::parse(R"({"event_type": "SEND"})"));
            std::cerr << "HTLC event without payload should be rejected\n";
            return 1;
        } catch (const std::runtime_error&) {
        }
    }

    {
        const auto active = channelEventFromJson(boost::json::parse(R"({
            "type": "ACTIVE_CHANNEL",
            "active_channel": {"funding_txid_bytes": "AAEC", "output_index": 1}
        })"),
                                                 1234);
        if (active.type != "ACTIVE_CHANNEL" || active.channelPoint != "020100:1" || active.receivedAtMs != 1234) {
            std::cerr << "Active channel event was not parsed (" << active.channelPoint << ")\n";
            return 1;
        }
        const auto opened = channelEventFromJson(boost::json::parse(R"({
            "type": "OPEN_CHANNEL",
            "open_channel": {"channel_point": "abcd:0", "chan_id": "777"}
        })"),
                                                 1);
        if (opened.channelPoint != "abcd:0" || opened.chanId != 777) {
            std::cerr << "Open channel event was not parsed\n";
            return 1;
        }
    }

    {
        const auto online = peerEventFromJson(boost::json::parse(R"({"pub_key": "03peer"})"), 10);
        const auto offline =
            peerEventFromJson(boost::json::parse(R"({"pub_key": "03peer", "type": "PEER_OFFLINE"})"), 11);
        if (online.type != "PEER_ONLINE" || online.pubKey != "03peer" || offline.type != "PEER_OFFLINE" ||
            offline.receivedAtMs != 11) {
            std::cerr << "Peer events were not parsed (" << online.type << ")\n";
            return 1;
        }
        try {
            peerEventFromJson(boost::json::parse(R"({"type": "PEER_OFFLINE"})"), 1);
            std::cerr << "Peer event without pub_key should be rejected\n";
            return 1;
        } catch (const std::runtime_error&) {
        }
    }

    {
        const auto tx = transactionFromJson(boost::json::parse(R"({
            "tx_hash": "ff00", "amount": "-25000", "num_confirmations": 3, "block_height": 800001,
            "time_stamp": "1700000000", "total_fees": "210", "label": "sweep"
        })"),
                                            42);
        if (tx.txHash != "ff00" || tx.amountSat != -25000 || tx.numConfirmations != 3 || tx.blockHeight != 800001 ||
            tx.timeStamp != 1700000000 || tx.totalFeesSat != 210 || tx.label != "sweep" || tx.receivedAtMs != 42) {
            std::cerr << "Transaction was not parsed\n";
            return 1;
        }
        const auto unconfirmed = transactionFromJson(boost::json::parse(R"({"tx_hash": "ee11", "amount": "500"})"), 1);
        if (unconfirmed.blockHeight != 0 || unconfirmed.numConfirmations != 0) {
            std::cerr << "Unconfirmed transaction should default to height 0\n";
            return 1;
        }
    }

    {
        const auto update = graphUpdateFromJson(boost::json::parse(R"({
            "node_updates": [{"identity_key": "02aa"}, {"identity_key": "02bb"}],
            "channel_updates": [{"chan_id": "1"}],
            "closed_chans": []
        })"),
                                                 7);
        if (update.nodeUpdates != 2 || update.channelUpdates != 1 || update.closedChannels != 0 ||
            update.receivedAtMs != 7 || update.payload.find("\"02bb\"") == std::string::npos) {
            std::cerr << "Graph update was not parsed\n";
            return 1;
        }
        const auto empty = graphUpdateFromJson(boost::json::parse("{}"), 8);
        if (empty.nodeUpdates != 0 || empty.payload != "{}") {
            std::cerr << "Empty graph update should parse to zero counts\n";
            return 1;
        }
    }

    {
        const auto info = nodeInfoFromJson(boost::json::parse(
            R"({"identity_pubkey": "02abc", "alias": "satoshi", "block_height": 800000})"));
        if (info.pubkey != "02abc" || info.alias != "satoshi" || info.blockHeight != 800000) {
            std::cerr << "GetInfo was not parsed\n";
            return 1;
        }
        try {
            nodeInfoFromJson(boost::json::parse(R"({"alias": "nobody"})"));
            std::cerr << "GetInfo without pubkey should be rejected\n";
            return 1;
        } catch (const std::runtime_error&) {
        }
    }

    {
        const auto nested = gatewayError(boost::json::parse(R"({"error": {"grpc_code": 14, "message": "EOF"}})"));
        const auto flat = gatewayError(boost::json::parse(R"({"code": 2, "message": "edge not found"})"));
        const auto result = gatewayError(boost::json::parse(R"({"result": {}})"));
        if (!nested || nested->code != 14 || nested->message != "EOF" || !flat || flat->code != 2 || result) {
            std::cerr << "Gateway error detection failed\n";
            return 1;
        }
        try {
            parseBody("not json", "test");
            std::cerr << "Invalid body should be rejected\n";
            return 1;
        } catch (const std::runtime_error&) {
        }
    }

    {
        const LndErrorClassifier classifier;
        if (classifier.classify(lnt::sync::TransportError(14, "unavailable")) != ErrorKind::Transient ||
            classifier.classify(lnt::sync::TransportError(4, "deadline")) != ErrorKind::Transient ||
            classifier.classify(lnt::sync::TransportError(1, "cancelled")) != ErrorKind::UserCancelled ||
            classifier.classify(lnt::sync::TransportError(16, "bad macaroon")) != ErrorKind::Fatal ||
            classifier.classify(lnt::sync::TransportError(3, "invalid")) != ErrorKind::Fatal) {
            std::cerr << "gRPC status codes were misclassified\n";
            return 1;
        }
        if (!rethrowsAs<lnt::sync::PeerAlreadyConnectedError>(
                classifier.typed_error(lnt::sync::TransportError(2, "already connected to peer: 02ab"))) ||
            !rethrowsAs<lnt::sync::EdgeNotFoundError>(
                classifier.typed_error(lnt::sync::TransportError(2, "edge not found"))) ||
            classifier.typed_error(lnt::sync::TransportError(2, "boom")) != nullptr) {
            std::cerr << "Typed LND errors were not recognised\n";
            return 1;
        }
    }

    return 0;
}
