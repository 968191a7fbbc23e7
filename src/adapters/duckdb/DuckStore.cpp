#include "adapters/duckdb/DuckStore.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <duckdb.hpp>

#include "common/Log.hpp"

namespace fs = std::filesystem;

namespace adapters::duckdb {
namespace {

constexpr const char* kMigrations[] = {
    R"SQL(
        CREATE TABLE IF NOT EXISTS payments (
            node_id TEXT,
            payment_index BIGINT,
            payment_hash TEXT,
            value_msat BIGINT,
            fee_msat BIGINT,
            creation_time_ns BIGINT,
            status TEXT,
            failure_reason TEXT,
            htlc_count INTEGER,
            PRIMARY KEY(node_id, payment_index)
        )
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS invoices (
            node_id TEXT,
            add_index BIGINT,
            settle_index BIGINT,
            r_hash TEXT,
            memo TEXT,
            value_msat BIGINT,
            amt_paid_msat BIGINT,
            creation_date BIGINT,
            settle_date BIGINT,
            state TEXT,
            PRIMARY KEY(node_id, add_index)
        )
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS forwards (
            node_id TEXT,
            offset_index BIGINT,
            timestamp_ns BIGINT,
            chan_id_in BIGINT,
            chan_id_out BIGINT,
            amt_in_msat BIGINT,
            amt_out_msat BIGINT,
            fee_msat BIGINT,
            PRIMARY KEY(node_id, offset_index)
        )
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS htlc_events (
            node_id TEXT,
            timestamp_ns BIGINT,
            incoming_channel_id BIGINT,
            outgoing_channel_id BIGINT,
            incoming_htlc_id BIGINT,
            outgoing_htlc_id BIGINT,
            event_type TEXT,
            kind TEXT,
            detail TEXT,
            PRIMARY KEY(node_id, timestamp_ns, incoming_channel_id, incoming_htlc_id,
                        outgoing_channel_id, outgoing_htlc_id, kind)
        )
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS channel_events (
            node_id TEXT,
            received_at_ms BIGINT,
            type TEXT,
            channel_point TEXT,
            chan_id BIGINT,
            PRIMARY KEY(node_id, received_at_ms, type, channel_point)
        )
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS peer_events (
            node_id TEXT,
            received_at_ms BIGINT,
            pub_key TEXT,
            type TEXT,
            PRIMARY KEY(node_id, received_at_ms, pub_key, type)
        )
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS transactions (
            node_id TEXT,
            tx_hash TEXT,
            block_height INTEGER,
            received_at_ms BIGINT,
            amount_sat BIGINT,
            total_fees_sat BIGINT,
            num_confirmations INTEGER,
            time_stamp BIGINT,
            label TEXT,
            PRIMARY KEY(node_id, tx_hash, block_height)
        )
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS graph_updates (
            node_id TEXT,
            received_at_ms BIGINT,
            node_updates INTEGER,
            channel_updates INTEGER,
            closed_channels INTEGER,
            payload TEXT,
            PRIMARY KEY(node_id, received_at_ms, payload)
        )
    )SQL",
};

}  // namespace

DuckStore::DuckStore(std::string dbPath) : dbPath_(std::move(dbPath)) {
    const fs::path path{dbPath_};
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("DuckStore: unable to create directory '" + path.parent_path().string() +
                                     "': " + ec.message());
        }
    }
    // ":memory:" and an empty path both give an in-memory database.
    if (dbPath_.empty() || dbPath_ == ":memory:") {
        db_ = std::make_unique<::duckdb::DuckDB>(nullptr);
    } else {
        db_ = std::make_unique<::duckdb::DuckDB>(dbPath_);
    }
}

DuckStore::~DuckStore() = default;

void DuckStore::migrate() {
    ::duckdb::Connection connection(*db_);
    for (const char* statement : kMigrations) {
        auto result = connection.Query(statement);
        if (!result || result->HasError()) {
            const std::string errorMessage = result ? result->GetError() : std::string("unknown error");
            throw std::runtime_error("DuckStore: migration failed: " + errorMessage);
        }
    }
    LOG_INFO("DuckStore migration finished for " << (dbPath_.empty() ? std::string{":memory:"} : dbPath_));
}

}  // namespace adapters::duckdb
