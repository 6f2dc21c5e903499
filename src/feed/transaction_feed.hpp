#pragma once

#include "core/records.hpp"
#include "core/status.hpp"
#include "storage/risk_store.hpp"
#include <cstddef>
#include <vector>

namespace riskwatch {

/// One poll's worth of validated transactions
struct FeedBatch {
    std::vector<Transaction> transactions;  // in (timestamp, id) order
    std::size_t rejected{0};                // malformed rows skipped
    FeedMarker next_marker;                 // position after the last row read
    bool full{false};                       // the read hit the batch limit
};

/// Pulls transactions from the store past a marker and validates them
class TransactionFeed {
public:
    /// @param store Store to read from (must outlive the feed)
    /// @param batch_size Maximum rows read per poll
    TransactionFeed(storage::RiskStore& store, std::size_t batch_size);

    /// Read the rows after since and convert them
    /// Rejected rows are skipped and the marker still moves past them.
    /// On a store error the caller keeps its marker.
    [[nodiscard]] Result<FeedBatch> poll(const FeedMarker& since);

    /// Convert a raw row, failing with DataIntegrity on malformed fields
    [[nodiscard]] static Result<Transaction> decode(const TransactionRecord& record);

    [[nodiscard]] std::size_t batch_size() const noexcept {
        return batch_size_;
    }

    [[nodiscard]] std::size_t total_rejected() const noexcept {
        return total_rejected_;
    }

private:
    storage::RiskStore& store_;
    std::size_t batch_size_;
    std::size_t total_rejected_{0};
};

}  // namespace riskwatch
