#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "adapters/duckdb/DuckEventRepo.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "domain/Models.hpp"

using adapters::duckdb::DuckEventRepo;
using adapters::duckdb::DuckStore;

namespace {

domain::Payment payment(std::uint64_t index, domain::PaymentStatus status, const std::string& nodeId = "02aa") {
    domain::Payment row;
    row.nodeId = nodeId;
    row.paymentIndex = index;
    row.paymentHash = "hash" + std::to_string(index);
    row.valueMsat = 1000;
    row.status = status;
    row.htlcCount = 1;
    return row;
}

}  // namespace

int main() {
    try {
        DuckStore store(":memory:");
        store.migrate();
        store.migrate();
        DuckEventRepo repo(store);

        const std::vector<domain::Payment> batch{payment(1, domain::PaymentStatus::Succeeded),
                                                 payment(2, domain::PaymentStatus::Failed),
                                                 payment(3, domain::PaymentStatus::Succeeded)};
        repo.add_batch(batch);
        repo.add_batch(batch);
        repo.add_one(payment(2, domain::PaymentStatus::Failed));
        if (repo.count(domain::Payment::kCategory, "02aa") != 3) {
            std::cerr << "Payment inserts are not idempotent\n";
            return 1;
        }
        if (repo.get_checkpoint(domain::Payment::kCategory, "02aa") != 3 ||
            repo.get_checkpoint(domain::Payment::kCategory, "02bb") != 0) {
            std::cerr << "Payment checkpoint should be per node\n";
            return 1;
        }

        repo.add_one(payment(4, domain::PaymentStatus::InFlight));
        repo.add_one(payment(9, domain::PaymentStatus::InFlight, "02bb"));
        const auto removed = repo.delete_orphaned(domain::Payment::kCategory, "02aa");
        if (removed != 1 || repo.count(domain::Payment::kCategory, "02aa") != 3 ||
            repo.count(domain::Payment::kCategory, "02bb") != 1) {
            std::cerr << "delete_orphaned removed " << removed << " rows\n";
            return 1;
        }
        if (repo.delete_orphaned(domain::Invoice::kCategory, "02aa") != 0) {
            std::cerr << "Only payments have orphans\n";
            return 1;
        }

        domain::Invoice invoice;
        invoice.nodeId = "02aa";
        invoice.addIndex = 12;
        invoice.rHash = "00ff";
        invoice.state = domain::InvoiceState::Settled;
        repo.add_one(invoice);
        if (repo.get_checkpoint(domain::Invoice::kCategory, "02aa") != 12) {
            std::cerr << "Invoice checkpoint should follow add_index\n";
            return 1;
        }

        std::vector<domain::ForwardingEvent> forwards(2);
        forwards[0].nodeId = "02aa";
        forwards[0].offsetIndex = 1;
        forwards[1].nodeId = "02aa";
        forwards[1].offsetIndex = 2;
        repo.add_batch(forwards);
        if (repo.get_checkpoint(domain::ForwardingEvent::kCategory, "02aa") != 2) {
            std::cerr << "Forward checkpoint should follow offset_index\n";
            return 1;
        }

        domain::HtlcEvent htlc;
        htlc.nodeId = "02aa";
        htlc.timestampNs = 5;
        htlc.kind = "settle_event";
        repo.add_one(htlc);
        repo.add_one(htlc);
        domain::ChannelEvent channel;
        channel.nodeId = "02aa";
        channel.receivedAtMs = 10;
        channel.type = "ACTIVE_CHANNEL";
        channel.channelPoint = "abcd:0";
        repo.add_batch({channel, channel});
        if (repo.count(domain::HtlcEvent::kCategory, "02aa") != 1 ||
            repo.count(domain::ChannelEvent::kCategory, "02aa") != 1) {
            std::cerr << "Event inserts are not idempotent\n";
            return 1;
        }
        if (repo.get_checkpoint(domain::HtlcEvent::kCategory, "02aa") != 0 ||
            repo.get_checkpoint(domain::ChannelEvent::kCategory, "02aa") != 0) {
            std::cerr << "Stream-only categories have no checkpoint\n";
            return 1;
        }

        domain::PeerEvent peer;
        peer.nodeId = "02aa";
        peer.receivedAtMs = 11;
        peer.pubKey = "03peer";
        peer.type = "PEER_OFFLINE";
        repo.add_batch({peer, peer});

        domain::OnchainTransaction tx;
        tx.nodeId = "02aa";
        tx.txHash = "ff00";
        tx.amountSat = -25000;
        tx.receivedAtMs = 12;
        repo.add_one(tx);
        tx.receivedAtMs = 13;
        repo.add_one(tx);
        tx.blockHeight = 800001;
        tx.numConfirmations = 1;
        repo.add_one(tx);

        domain::GraphUpdate graph;
        graph.nodeId = "02aa";
        graph.receivedAtMs = 14;
        graph.nodeUpdates = 1;
        graph.payload = R"({"node_updates":[{"identity_key":"02bb"}]})";
        repo.add_batch({graph, graph});

        if (repo.count(domain::PeerEvent::kCategory, "02aa") != 1 ||
            repo.count(domain::GraphUpdate::kCategory, "02aa") != 1) {
            std::cerr << "Peer and graph inserts are not idempotent\n";
            return 1;
        }
        if (repo.count(domain::OnchainTransaction::kCategory, "02aa") != 2) {
            std::cerr << "A transaction should be stored once unconfirmed and once confirmed\n";
            return 1;
        }

        try {
            repo.count("peers", "02aa");
            std::cerr << "Unknown category should be rejected\n";
            return 1;
        } catch (const std::invalid_argument&) {
        }
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << "\n";
        return 1;
    }

    {
        const auto dir = std::filesystem::temp_directory_path() / "lntrack-duck-test";
        std::filesystem::remove_all(dir);
        const auto path = (dir / "nested" / "events.duckdb").string();
        try {
            {
                DuckStore store(path);
                store.migrate();
                DuckEventRepo repo(store);
                repo.add_one(payment(5, domain::PaymentStatus::Succeeded));
            }
            DuckStore reopened(path);
            reopened.migrate();
            DuckEventRepo repo(reopened);
            if (repo.get_checkpoint(domain::Payment::kCategory, "02aa") != 5) {
                std::cerr << "Checkpoint did not survive a reopen\n";
                return 1;
            }
        } catch (const std::exception& ex) {
            std::cerr << "Exception: " << ex.what() << "\n";
            return 1;
        }
        std::filesystem::remove_all(dir);
    }

    return 0;
}
