#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "domain/Models.hpp"
#include "domain/Ports.hpp"

namespace duckdb {
class Connection;
}  // namespace duckdb

namespace adapters::duckdb {

class DuckStore;

// Event sink for every tracked category. Inserts are INSERT OR IGNORE on the
// table's primary key, so replays are harmless. Writes are serialized on one
// connection; every failure throws std::runtime_error.
class DuckEventRepo : public domain::IEventSink<domain::Payment>,
                      public domain::IEventSink<domain::Invoice>,
                      public domain::IEventSink<domain::ForwardingEvent>,
                      public domain::IEventSink<domain::HtlcEvent>,
                      public domain::IEventSink<domain::ChannelEvent>,
                      public domain::IEventSink<domain::PeerEvent>,
                      public domain::IEventSink<domain::OnchainTransaction>,
                      public domain::IEventSink<domain::GraphUpdate> {
public:
    explicit DuckEventRepo(DuckStore& store);
    ~DuckEventRepo() override;

    // MAX of the category's index column; 0 for categories without one.
    std::uint64_t get_checkpoint(const std::string& category, const std::string& nodeId) override;

    // Drops unresolved payments so the pre-sync fetches them again.
    std::size_t delete_orphaned(const std::string& category, const std::string& nodeId) override;

    void add_batch(const std::vector<domain::Payment>& rows) override;
    void add_one(const domain::Payment& row) override;
    void add_batch(const std::vector<domain::Invoice>& rows) override;
    void add_one(const domain::Invoice& row) override;
    void add_batch(const std::vector<domain::ForwardingEvent>& rows) override;
    void add_one(const domain::ForwardingEvent& row) override;
    void add_batch(const std::vector<domain::HtlcEvent>& rows) override;
    void add_one(const domain::HtlcEvent& row) override;
    void add_batch(const std::vector<domain::ChannelEvent>& rows) override;
    void add_one(const domain::ChannelEvent& row) override;
    void add_batch(const std::vector<domain::PeerEvent>& rows) override;
    void add_one(const domain::PeerEvent& row) override;
    void add_batch(const std::vector<domain::OnchainTransaction>& rows) override;
    void add_one(const domain::OnchainTransaction& row) override;
    void add_batch(const std::vector<domain::GraphUpdate>& rows) override;
    void add_one(const domain::GraphUpdate& row) override;

    std::uint64_t count(const std::string& category, const std::string& nodeId);

private:
    template <typename Row>
    void insert_(const std::vector<Row>& rows);

    std::mutex mutex_;
    std::unique_ptr<::duckdb::Connection> connection_;
};

}  // namespace adapters::duckdb
