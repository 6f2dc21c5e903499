#include "feed/transaction_feed.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <cstdint>
#include <string_view>

namespace riskwatch {

namespace {

constexpr double kValueTolerance = 0.01;

// Ids end up in JSON and e-mail bodies, which both require UTF-8
bool is_valid_utf8(std::string_view text) {
    std::size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        std::size_t length;
        std::uint32_t code;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code = lead & 0x07;
        } else {
            return false;
        }

        if (i + length > text.size()) {
            return false;
        }
        for (std::size_t k = 1; k < length; ++k) {
            auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code = (code << 6) | (next & 0x3F);
        }

        // Overlong forms, surrogates and values past U+10FFFF
        static constexpr std::uint32_t kMinimum[] = {0, 0, 0x80, 0x800, 0x10000};
        if (code < kMinimum[length] || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
            return false;
        }
        i += length;
    }
    return true;
}

}  // namespace

TransactionFeed::TransactionFeed(storage::RiskStore& store, std::size_t batch_size)
    : store_(store)
    , batch_size_(batch_size)
{}

Result<FeedBatch> TransactionFeed::poll(const FeedMarker& since) {
    auto rows = store_.read_transactions_since(since, batch_size_);
    if (rows.is_err()) {
        return Result<FeedBatch>::Err(rows.error());
    }

    const auto& records = rows.value();

    FeedBatch batch;
    batch.next_marker = since;
    batch.full = records.size() >= batch_size_;
    batch.transactions.reserve(records.size());

    for (const auto& record : records) {
        batch.next_marker = FeedMarker{record.timestamp_ms, record.id};

        auto decoded = decode(record);
        if (decoded.is_err()) {
            ++batch.rejected;
            spdlog::warn("Skipping transaction {} (client '{}', symbol '{}'): {}",
                         record.id, record.client_id, record.symbol,
                         decoded.error().describe());
            continue;
        }
        batch.transactions.push_back(std::move(decoded).take_value());
    }

    total_rejected_ += batch.rejected;
    return Result<FeedBatch>::Ok(std::move(batch));
}

Result<Transaction> TransactionFeed::decode(const TransactionRecord& record) {
    using R = Result<Transaction>;

    if (record.client_id.empty()) {
        return R::Err(Error::data_integrity("empty client_id"));
    }
    if (record.symbol.empty()) {
        return R::Err(Error::data_integrity("empty symbol"));
    }
    if (!is_valid_utf8(record.client_id)) {
        return R::Err(Error::data_integrity("client_id is not valid UTF-8"));
    }
    if (!is_valid_utf8(record.symbol)) {
        return R::Err(Error::data_integrity("symbol is not valid UTF-8"));
    }

    auto side = parse_side(record.side);
    if (!side) {
        return R::Err(Error::data_integrity("unknown side '" + record.side + "'"));
    }
    if (record.quantity <= 0) {
        return R::Err(Error::data_integrity("non-positive quantity " + std::to_string(record.quantity)));
    }
    if (!(record.price > 0.0) || !std::isfinite(record.price)) {
        return R::Err(Error::data_integrity("non-positive price " + std::to_string(record.price)));
    }

    double expected = static_cast<double>(record.quantity) * record.price;
    if (!std::isfinite(record.total_value) || std::abs(record.total_value - expected) > kValueTolerance) {
        return R::Err(Error::data_integrity(
            "total_value " + std::to_string(record.total_value) +
            " does not match quantity * price " + std::to_string(expected)));
    }

    Transaction txn;
    txn.id = record.id;
    txn.timestamp = convert::from_epoch_ms(record.timestamp_ms);
    txn.client_id = record.client_id;
    txn.symbol = record.symbol;
    txn.side = *side;
    txn.quantity = record.quantity;
    txn.price = record.price;
    txn.total_value = record.total_value;
    txn.broker_id = record.broker_id;
    txn.market = record.market;
    return R::Ok(std::move(txn));
}

}  // namespace riskwatch
