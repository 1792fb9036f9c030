#pragma once

#include "types.hpp"
#include <optional>
#include <set>
#include <vector>

// Persistence collaborators. PostgresStore is the production implementation,
// InMemoryStore backs tests and store-less runs.

class TransactionStore {
public:
    virtual ~TransactionStore() = default;

    // Assigns and returns the new id.
    virtual int64_t insert_transaction(const Transaction& txn) = 0;
    virtual bool update_transaction(const Transaction& txn) = 0;
    virtual bool delete_transaction(int64_t id) = 0;
    virtual std::optional<Transaction> find_transaction(int64_t id) = 0;

    // Both ordered by (transaction_date, created_at, id).
    virtual std::vector<Transaction> transactions_for_user(int64_t user_id) = 0;
    virtual std::vector<Transaction> all_transactions() = 0;

    // True when a user other than user_id has transactions in the account.
    virtual bool account_used_by_other_user(int64_t account_id, int64_t user_id) = 0;
};

class HoldingStore {
public:
    virtual ~HoldingStore() = default;

    // Atomically replaces every holding of the user.
    virtual void replace_holdings(int64_t user_id, const std::vector<Holding>& holdings) = 0;
    // nullopt when never computed or invalidated since.
    virtual std::optional<std::vector<Holding>> holdings_for(int64_t user_id) = 0;
    virtual void invalidate_holdings(int64_t user_id) = 0;
};

class BalanceHistoryStore {
public:
    virtual ~BalanceHistoryStore() = default;

    // All records of one date in one atomic write. Existing rows are kept
    // unless overwrite is set. Returns the number of rows written.
    virtual int write_day(const Date& date, const std::vector<BalanceHistoryRecord>& records,
                          bool overwrite) = 0;
    // Every account of the user, ordered by (date, account_id).
    virtual std::vector<BalanceHistoryRecord> records_between(int64_t user_id,
                                                              const Date& start, const Date& end) = 0;
    virtual std::set<Date> recorded_dates(const AccountKey& account, const Date& start, const Date& end) = 0;
    // Removes rows dated on or after from. Returns the number removed.
    virtual int delete_from(const AccountKey& account, const Date& from) = 0;
};

// Optional durable copy of the current-price cache.
class PriceMirror {
public:
    virtual ~PriceMirror() = default;

    virtual void save_price(const PriceCacheEntry& entry) = 0;
    virtual std::vector<PriceCacheEntry> load_prices() = 0;
};
