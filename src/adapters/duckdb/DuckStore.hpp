#pragma once

#include <memory>
#include <string>

namespace duckdb {
class DuckDB;
class Connection;
}  // namespace duckdb

namespace adapters::duckdb {

// Owns the database instance of one file. Connections are opened from it by
// the repositories.
class DuckStore {
public:
    explicit DuckStore(std::string dbPath = "data/lntrack.duckdb");
    ~DuckStore();

    DuckStore(const DuckStore&) = delete;
    DuckStore& operator=(const DuckStore&) = delete;

    // Creates the event tables when missing. Throws std::runtime_error.
    void migrate();

    ::duckdb::DuckDB& database() noexcept { return *db_; }
    const std::string& path() const noexcept { return dbPath_; }

private:
    std::string dbPath_;
    std::unique_ptr<::duckdb::DuckDB> db_;
};

}  // namespace adapters::duckdb
