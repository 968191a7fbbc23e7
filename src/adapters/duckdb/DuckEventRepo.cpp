#include "adapters/duckdb/DuckEventRepo.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <duckdb.hpp>

#include "adapters/duckdb/DuckStore.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace adapters::duckdb {
namespace {

// DuckDB exposes its own vector alias; using it keeps Execute(values) on the
// non-variadic overload.
using DuckdbValueVector = ::duckdb::vector<::duckdb::Value>;

struct TableInfo {
    const char* table;
    // Empty when the category has no monotonic index.
    const char* indexColumn;
};

TableInfo tableFor(const std::string& category) {
    if (category == domain::Payment::kCategory) {
        return {"payments", "payment_index"};
    }
    if (category == domain::Invoice::kCategory) {
        return {"invoices", "add_index"};
    }
    if (category == domain::ForwardingEvent::kCategory) {
        return {"forwards", "offset_index"};
    }
    if (category == domain::HtlcEvent::kCategory) {
        return {"htlc_events", ""};
    }
    if (category == domain::ChannelEvent::kCategory) {
        return {"channel_events", ""};
    }
    if (category == domain::PeerEvent::kCategory) {
        return {"peer_events", ""};
    }
    if (category == domain::OnchainTransaction::kCategory) {
        return {"transactions", ""};
    }
    if (category == domain::GraphUpdate::kCategory) {
        return {"graph_updates", ""};
    }
    throw std::invalid_argument("DuckEventRepo: unknown category '" + category + "'");
}

::duckdb::Value bigint(std::uint64_t value) {
    return ::duckdb::Value::BIGINT(static_cast<std::int64_t>(value));
}

template <typename Row>
struct RowBinding;

template <>
struct RowBinding<domain::Payment> {
    static constexpr const char* kInsert =
        "INSERT OR IGNORE INTO payments (node_id, payment_index, payment_hash, value_msat, fee_msat, "
        "creation_time_ns, status, failure_reason, htlc_count) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";

    static void bind(const domain::Payment& row, DuckdbValueVector& parameters) {
        parameters.emplace_back(row.nodeId);
        parameters.emplace_back(bigint(row.paymentIndex));
        parameters.emplace_back(row.paymentHash);
        parameters.emplace_back(::duckdb::Value::BIGINT(row.valueMsat));
        parameters.emplace_back(::duckdb::Value::BIGINT(row.feeMsat));
        parameters.emplace_back(::duckdb::Value::BIGINT(row.creationTimeNs));
        parameters.emplace_back(std::string{domain::toString(row.status)});
        parameters.emplace_back(row.failureReason);
        parameters.emplace_back(::duckdb::Value::INTEGER(static_cast<std::int32_t>(row.htlcCount)));
    }
};

template <>
struct RowBinding<domain::Invoice> {
    static constexpr const char* kInsert =
        "INSERT OR IGNORE INTO invoices (node_id, add_index, settle_index, r_hash, memo, value_msat, "
        "amt_paid_msat, creation_date, settle_date, state) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    static void bind(const domain::Invoice& row, DuckdbValueVector& parameters) {
        parameters.emplace_back(row.nodeId);
        parameters.emplace_back(bigint(row.addIndex));
        parameters.emplace_back(bigint(row.settleIndex));
        parameters.emplace_back(row.rHash);
        parameters.emplace_back(row.memo);
        parameters.emplace_back(::duckdb::Value::BIGINT(row.valueMsat));
        parameters.emplace_back(::duckdb::Value::BIGINT(row.amtPaidMsat));
        parameters.emplace_back(::duckdb::Value::BIGINT(row.creationDate));
        parameters.emplace_back(::duckdb::Value::BIGINT(row.settleDate));
        parameters.emplace_back(std::string{domain::toString(row.state)});
    }
};

template <>
struct RowBinding<domain::ForwardingEvent> {
    static constexpr const char* kInsert =
        "INSERT OR IGNORE INTO forwards (node_id, offset_index, timestamp_ns, chan_id_in, chan_id_out, "
        "amt_in_msat, amt_out_msat, fee_msat) VALUES (?, ?, ?, ?, ?, ?, ?, ?)";

    static void bind(const domain::ForwardingEvent& row, DuckdbValueVector& parameters) {
        parameters.emplace_back(row.nodeId);
        parameters.emplace_back(bigint(row.offsetIndex));
        parameters.emplace_back(::duckdb::Value::BIGINT(row.timestampNs));
        parameters.emplace_back(bigint(row.chanIdIn));
        parameters.emplace_back(bigint(row.chanIdOut));
        parameters.emplace_back(::duckdb::Value::BIGINT(row.amtInMsat));
        parameters.emplace_back(::duckdb::Value::BIGINT(row.amtOutMsat));
        parameters.emplace_back(::duckdb::Value::BIGINT(row.feeMsat));
    }
};

template <>
struct RowBinding<domain::HtlcEvent> {
    static constexpr const char* kInsert =
        "INSERT OR IGNORE INTO htlc_events (node_id, timestamp_ns, incoming_channel_id, outgoing_channel_id, "
        "incoming_htlc_id, outgoing_htlc_id, event_type, kind, detail) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";

    static void bind(const domain::HtlcEvent& row, DuckdbValueVector& parameters) {
        parameters.emplace_back(row.nodeId);
        parameters.emplace_back(::duckdb::Value::BIGINT(row.timestampNs));
        parameters.emplace_back(bigint(row.incomingChannelId));
        parameters.emplace_back(bigint(row.outgoingChannelId));
        parameters.emplace_back(bigint(row.incomingHtlcId));
        parameters.emplace_back(bigint(row.outgoingHtlcId));
        parameters.emplace_back(row.eventType);
        parameters.emplace_back(row.kind);
        parameters.emplace_back(row.detail);
    }
};

template <>
struct RowBinding<domain::ChannelEvent> {
    static constexpr const char* kInsert =
        "INSERT OR IGNORE INTO channel_events (node_id, received_at_ms, type, channel_point, chan_id) "
        "VALUES (?, ?, ?, ?, ?)";

    static void bind(const domain::ChannelEvent& row, DuckdbValueVector& parameters) {
        parameters.emplace_back(row.nodeId);
        parameters.emplace_back(::duckdb::Value::BIGINT(row.receivedAtMs));
        parameters.emplace_back(row.type);
        parameters.emplace_back(row.channelPoint);
        parameters.emplace_back(bigint(row.chanId));
    }
};

template <>
struct RowBinding<domain::PeerEvent> {
    static constexpr const char* kInsert =
        "INSERT OR IGNORE INTO peer_events (node_id, received_at_ms, pub_key, type) VALUES (?, ?, ?, ?)";

    static void bind(const domain::PeerEvent& row, DuckdbValueVector& parameters) {
        parameters.emplace_back(row.nodeId);
        parameters.emplace_back(::duckdb::Value::BIGINT(row.receivedAtMs));
        parameters.emplace_back(row.pubKey);
        parameters.emplace_back(row.type);
    }
};

template <>
struct RowBinding<domain::OnchainTransaction> {
    static constexpr const char* kInsert =
        "INSERT OR IGNORE INTO transactions (node_id, tx_hash, block_height, received_at_ms, amount_sat, "
        "total_fees_sat, num_confirmations, time_stamp, label) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";

    static void bind(const domain::OnchainTransaction& row, DuckdbValueVector& parameters) {
        parameters.emplace_back(row.nodeId);
        parameters.emplace_back(row.txHash);
        parameters.emplace_back(::duckdb::Value::INTEGER(row.blockHeight));
        parameters.emplace_back(::duckdb::Value::BIGINT(row.receivedAtMs));
        parameters.emplace_back(::duckdb::Value::BIGINT(row.amountSat));
        parameters.emplace_back(::duckdb::Value::BIGINT(row.totalFeesSat));
        parameters.emplace_back(::duckdb::Value::INTEGER(row.numConfirmations));
        parameters.emplace_back(::duckdb::Value::BIGINT(row.timeStamp));
        parameters.emplace_back(row.label);
    }
};

template <>
struct RowBinding<domain::GraphUpdate> {
    static constexpr const char* kInsert =
        "INSERT OR IGNORE INTO graph_updates (node_id, received_at_ms, node_updates, channel_updates, "
        "closed_channels, payload) VALUES (?, ?, ?, ?, ?, ?)";

    static void bind(const domain::GraphUpdate& row, DuckdbValueVector& parameters) {
        parameters.emplace_back(row.nodeId);
        parameters.emplace_back(::duckdb::Value::BIGINT(row.receivedAtMs));
        parameters.emplace_back(::duckdb::Value::INTEGER(static_cast<std::int32_t>(row.nodeUpdates)));
        parameters.emplace_back(::duckdb::Value::INTEGER(static_cast<std::int32_t>(row.channelUpdates)));
        parameters.emplace_back(::duckdb::Value::INTEGER(static_cast<std::int32_t>(row.closedChannels)));
        parameters.emplace_back(row.payload);
    }
};

std::unique_ptr<::duckdb::QueryResult> execute(::duckdb::Connection& connection,
                                               const std::string& sql,
                                               DuckdbValueVector& parameters) {
    auto statement = connection.Prepare(sql);
    if (!statement || statement->HasError()) {
        const std::string errorMessage = statement ? statement->GetError() : std::string{"failed to prepare statement"};
        throw std::runtime_error("DuckEventRepo prepare failed: " + errorMessage);
    }
    auto result = statement->Execute(parameters);
    if (!result || result->HasError()) {
        const std::string errorMessage = result ? result->GetError() : std::string{"failed to execute statement"};
        throw std::runtime_error("DuckEventRepo query failed: " + errorMessage);
    }
    return result;
}

std::int64_t scalar(::duckdb::QueryResult& result) {
    if (auto chunk = result.Fetch()) {
        if (chunk->size() > 0) {
            const auto value = chunk->GetValue(0, 0);
            if (!value.IsNull()) {
                return value.GetValue<std::int64_t>();
            }
        }
    }
    return 0;
}

}  // namespace

DuckEventRepo::DuckEventRepo(DuckStore& store)
    : connection_(std::make_unique<::duckdb::Connection>(store.database())) {}

DuckEventRepo::~DuckEventRepo() = default;

std::uint64_t DuckEventRepo::get_checkpoint(const std::string& category, const std::string& nodeId) {
    const auto info = tableFor(category);
    if (std::string{info.indexColumn}.empty()) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    DuckdbValueVector parameters;
    parameters.emplace_back(nodeId);
    auto result = execute(*connection_,
                          std::string{"SELECT MAX("} + info.indexColumn + ") FROM " + info.table + " WHERE node_id = ?",
                          parameters);
    const auto checkpoint = scalar(*result);
    return checkpoint > 0 ? static_cast<std::uint64_t>(checkpoint) : 0U;
}

std::size_t DuckEventRepo::delete_orphaned(const std::string& category, const std::string& nodeId) {
    if (category != domain::Payment::kCategory) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    DuckdbValueVector parameters;
    parameters.emplace_back(nodeId);
    auto result = execute(*connection_,
                          "DELETE FROM payments WHERE node_id = ? AND status NOT IN ('SUCCEEDED', 'FAILED')",
                          parameters);
    const auto removed = scalar(*result);
    return removed > 0 ? static_cast<std::size_t>(removed) : 0U;
}

std::uint64_t DuckEventRepo::count(const std::string& category, const std::string& nodeId) {
    const auto info = tableFor(category);

    std::lock_guard<std::mutex> lock(mutex_);
    DuckdbValueVector parameters;
    parameters.emplace_back(nodeId);
    auto result =
        execute(*connection_, std::string{"SELECT COUNT(*) FROM "} + info.table + " WHERE node_id = ?", parameters);
    return static_cast<std::uint64_t>(scalar(*result));
}

template <typename Row>
void DuckEventRepo::insert_(const std::vector<Row>& rows) {
    if (rows.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    lnt::common::metrics::Registry::ScopedTimer timer(std::string{"duckdb.insert."} + Row::kCategory);

    auto& connection = *connection_;
    connection.BeginTransaction();
    try {
        auto statement = connection.Prepare(RowBinding<Row>::kInsert);
        if (!statement || statement->HasError()) {
            const std::string errorMessage =
                statement ? statement->GetError() : std::string{"failed to prepare statement"};
            throw std::runtime_error("DuckEventRepo prepare failed: " + errorMessage);
        }

        DuckdbValueVector parameters;
        for (const auto& row : rows) {
            parameters.clear();
            RowBinding<Row>::bind(row, parameters);
            auto result = statement->Execute(parameters);
            if (!result || result->HasError()) {
                const std::string errorMessage =
                    result ? result->GetError() : std::string{"failed to execute statement"};
                throw std::runtime_error(std::string{"DuckEventRepo insert into "} + Row::kCategory +
                                         " failed: " + errorMessage);
            }
        }
        connection.Commit();
    } catch (const std::exception& ex) {
        try {
            connection.Rollback();
        } catch (const std::exception& rollbackError) {
            LOG_WARN("DuckEventRepo rollback failed: " << rollbackError.what());
        }
        LOG_WARN("DuckEventRepo dropped a batch of " << rows.size() << ' ' << Row::kCategory << ": " << ex.what());
        throw;
    }
}

void DuckEventRepo::add_batch(const std::vector<domain::Payment>& rows) {
    insert_(rows);
}

void DuckEventRepo::add_one(const domain::Payment& row) {
    insert_(std::vector<domain::Payment>{row});
}

void DuckEventRepo::add_batch(const std::vector<domain::Invoice>& rows) {
    insert_(rows);
}

void DuckEventRepo::add_one(const domain::Invoice& row) {
    insert_(std::vector<domain::Invoice>{row});
}

void DuckEventRepo::add_batch(const std::vector<domain::ForwardingEvent>& rows) {
    insert_(rows);
}

void DuckEventRepo::add_one(const domain::ForwardingEvent& row) {
    insert_(std::vector<domain::ForwardingEvent>{row});
}

void DuckEventRepo::add_batch(const std::vector<domain::HtlcEvent>& rows) {
    insert_(rows);
}

void DuckEventRepo::add_one(const domain::HtlcEvent& row) {
    insert_(std::vector<domain::HtlcEvent>{row});
}

void DuckEventRepo::add_batch(const std::vector<domain::ChannelEvent>& rows) {
    insert_(rows);
}

void DuckEventRepo::add_one(const domain::ChannelEvent& row) {
    insert_(std::vector<domain::ChannelEvent>{row});
}

void DuckEventRepo::add_batch(const std::vector<domain::PeerEvent>& rows) {
    insert_(rows);
}

void DuckEventRepo::add_one(const domain::PeerEvent& row) {
    insert_(std::vector<domain::PeerEvent>{row});
}

void DuckEventRepo::add_batch(const std::vector<domain::OnchainTransaction>& rows) {
    insert_(rows);
}

void DuckEventRepo::add_one(const domain::OnchainTransaction& row) {
    insert_(std::vector<domain::OnchainTransaction>{row});
}

void DuckEventRepo::add_batch(const std::vector<domain::GraphUpdate>& rows) {
    insert_(rows);
}

void DuckEventRepo::add_one(const domain::GraphUpdate& row) {
    insert_(std::vector<domain::GraphUpdate>{row});
}

}  // namespace adapters::duckdb
