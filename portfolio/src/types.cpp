#include "types.hpp"

std::string to_string(TransactionType type) {
    switch (type) {
        case TransactionType::BUY: return "BUY";
        case TransactionType::SELL: return "SELL";
        default: return "UNKNOWN";
    }
}

std::optional<TransactionType> parse_transaction_type(const std::string& text) {
    if (text == "BUY" || text == "buy") return TransactionType::BUY;
    if (text == "SELL" || text == "sell") return TransactionType::SELL;
    return std::nullopt;
}

Decimal Transaction::effective_total_cost() const {
    if (total_cost.has_value()) {
        return *total_cost;
    }
    return quantity * price_per_share;
}

bool ledger_order(const Transaction& a, const Transaction& b) {
    if (a.transaction_date != b.transaction_date) return a.transaction_date < b.transaction_date;
    if (a.created_at != b.created_at) return a.created_at < b.created_at;
    return a.id < b.id;
}

std::string to_string(SnapshotSource source) {
    switch (source) {
        case SnapshotSource::COMPUTED: return "COMPUTED";
        case SnapshotSource::BACKFILLED: return "BACKFILLED";
        default: return "UNKNOWN";
    }
}

std::optional<SnapshotSource> parse_snapshot_source(const std::string& text) {
    if (text == "COMPUTED") return SnapshotSource::COMPUTED;
    if (text == "BACKFILLED") return SnapshotSource::BACKFILLED;
    return std::nullopt;
}
