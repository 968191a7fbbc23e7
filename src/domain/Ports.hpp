#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "domain/Models.hpp"

namespace domain {

// Persistence collaborator for one row type. Inserts must be idempotent:
// re-adding a row that is already stored is silently ignored. Failures throw.
template <typename Row>
class IEventSink {
public:
    virtual ~IEventSink() = default;

    // Highest durably stored index for the category and node, 0 when empty.
    virtual std::uint64_t get_checkpoint(const std::string& category, const std::string& nodeId) = 0;

    virtual void add_batch(const std::vector<Row>& rows) = 0;
    virtual void add_one(const Row& row) = 0;

    // Removes rows a previous run left behind in an unusable state so the
    // pre-sync reads them again. Returns the number of removed rows.
    virtual std::size_t delete_orphaned(const std::string& category, const std::string& nodeId) {
        (void)category;
        (void)nodeId;
        return 0;
    }
};

}  // namespace domain
