#pragma once

#include "decimal.hpp"
#include "date.hpp"
#include <string>
#include <optional>
#include <chrono>
#include <cstdint>

enum class TransactionType {
    BUY,
    SELL
};

std::string to_string(TransactionType type);
std::optional<TransactionType> parse_transaction_type(const std::string& text);

struct Transaction {
    int64_t id = 0;
    int64_t user_id = 0;
    std::optional<int64_t> account_id;
    std::string symbol;
    TransactionType type = TransactionType::BUY;
    Decimal quantity;
    Decimal price_per_share;
    std::optional<Decimal> total_cost;
    Date transaction_date;
    std::chrono::system_clock::time_point created_at;
    std::string notes;

    // Explicit total cost, or quantity * price when absent.
    Decimal effective_total_cost() const;
};

// Ledger replay order: (transaction_date, created_at, id).
bool ledger_order(const Transaction& a, const Transaction& b);

// Fields an administrative correction may change; unset fields are kept.
struct TransactionPatch {
    std::optional<std::optional<int64_t>> account_id;
    std::optional<std::string> symbol;
    std::optional<TransactionType> type;
    std::optional<Decimal> quantity;
    std::optional<Decimal> price_per_share;
    std::optional<std::optional<Decimal>> total_cost;
    std::optional<Date> transaction_date;
    std::optional<std::string> notes;
};

struct Holding {
    int64_t user_id = 0;
    std::string symbol;
    Decimal quantity;
    Decimal average_cost_basis;
    Decimal realized_gain;
    std::chrono::system_clock::time_point last_recalculated_at;

    Decimal cost_basis() const { return quantity * average_cost_basis; }
};

struct PriceCacheEntry {
    std::string symbol;
    Decimal price;
    Decimal daily_change;
    Decimal daily_change_percent;
    std::string company_name;
    std::chrono::system_clock::time_point fetched_at;
    bool market_open_when_fetched = false;
    // Last refresh failed or timed out; value is the last known one.
    bool stale = false;
};

enum class SnapshotSource {
    COMPUTED,
    BACKFILLED
};

std::string to_string(SnapshotSource source);
std::optional<SnapshotSource> parse_snapshot_source(const std::string& text);

// Balance history is kept per user within an account, so users sharing the
// default account id never see each other's balances.
struct AccountKey {
    int64_t user_id = 0;
    int64_t account_id = 0;
};

inline bool operator<(const AccountKey& a, const AccountKey& b) {
    if (a.user_id != b.user_id) return a.user_id < b.user_id;
    return a.account_id < b.account_id;
}

inline bool operator==(const AccountKey& a, const AccountKey& b) {
    return a.user_id == b.user_id && a.account_id == b.account_id;
}

struct BalanceHistoryRecord {
    int64_t user_id = 0;
    int64_t account_id = 0;
    Date date;
    Decimal computed_balance;
    SnapshotSource source = SnapshotSource::COMPUTED;
    bool price_substituted = false;
    std::chrono::system_clock::time_point recorded_at;
};
