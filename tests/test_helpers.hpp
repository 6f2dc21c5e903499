#pragma once

#include "core/records.hpp"
#include <chrono>
#include <string>

namespace riskwatch::test {

/// Fixed epoch for deterministic timestamps
inline const WallTime kEpoch{std::chrono::seconds{1'700'000'000}};

inline WallTime at_seconds(std::int64_t offset) {
    return kEpoch + std::chrono::seconds{offset};
}

inline Transaction make_transaction(TransactionId id,
                                    std::int64_t offset_seconds,
                                    const std::string& client,
                                    const std::string& symbol,
                                    std::int64_t quantity,
                                    double price,
                                    Side side = Side::Buy) {
    Transaction txn;
    txn.id = id;
    txn.timestamp = at_seconds(offset_seconds);
    txn.client_id = client;
    txn.symbol = symbol;
    txn.side = side;
    txn.quantity = quantity;
    txn.price = price;
    txn.total_value = static_cast<double>(quantity) * price;
    txn.broker_id = "BROKER_01";
    txn.market = "NASDAQ";
    return txn;
}

inline TransactionRecord make_record(TransactionId id,
                                     std::int64_t offset_seconds,
                                     const std::string& client,
                                     const std::string& symbol,
                                     std::int64_t quantity,
                                     double price,
                                     const std::string& side = "BUY") {
    TransactionRecord record;
    record.id = id;
    record.timestamp_ms = convert::to_epoch_ms(at_seconds(offset_seconds));
    record.client_id = client;
    record.symbol = symbol;
    record.side = side;
    record.quantity = quantity;
    record.price = price;
    record.total_value = static_cast<double>(quantity) * price;
    record.broker_id = "BROKER_01";
    record.market = "NASDAQ";
    return record;
}

}  // namespace riskwatch::test
