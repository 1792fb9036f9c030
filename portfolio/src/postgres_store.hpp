#pragma once

#include "store.hpp"
#include <string>
#include <vector>
#include <pqxx/pqxx>
#include <memory>

class PostgresStore : public TransactionStore,
                      public HoldingStore,
                      public BalanceHistoryStore,
                      public PriceMirror {
public:
    explicit PostgresStore(const std::string& dsn);

    void init_schema();

    int64_t insert_transaction(const Transaction& txn) override;
    bool update_transaction(const Transaction& txn) override;
    bool delete_transaction(int64_t id) override;
    std::optional<Transaction> find_transaction(int64_t id) override;
    std::vector<Transaction> transactions_for_user(int64_t user_id) override;
    std::vector<Transaction> all_transactions() override;
    bool account_used_by_other_user(int64_t account_id, int64_t user_id) override;

    void replace_holdings(int64_t user_id, const std::vector<Holding>& holdings) override;
    std::optional<std::vector<Holding>> holdings_for(int64_t user_id) override;
    void invalidate_holdings(int64_t user_id) override;

    int write_day(const Date& date, const std::vector<BalanceHistoryRecord>& records,
                  bool overwrite) override;
    std::vector<BalanceHistoryRecord> records_between(int64_t user_id,
                                                      const Date& start, const Date& end) override;
    std::set<Date> recorded_dates(const AccountKey& account, const Date& start, const Date& end) override;
    int delete_from(const AccountKey& account, const Date& from) override;

    void save_price(const PriceCacheEntry& entry) override;
    std::vector<PriceCacheEntry> load_prices() override;

    bool ping();

private:
    std::string dsn_;

    pqxx::connection make_connection();
    std::vector<Transaction> query_transactions(const std::string& where, const std::vector<int64_t>& params);
};
