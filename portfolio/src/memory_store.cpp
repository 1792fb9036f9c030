#include "memory_store.hpp"
#include <algorithm>

void InMemoryStore::sort_ledger(std::vector<Transaction>& txns) {
    std::sort(txns.begin(), txns.end(), ledger_order);
}

int64_t InMemoryStore::insert_transaction(const Transaction& txn) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction stored = txn;
    stored.id = next_id_++;
    transactions_[stored.id] = stored;
    return stored.id;
}

bool InMemoryStore::update_transaction(const Transaction& txn) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transactions_.find(txn.id);
    if (it == transactions_.end()) return false;
    it->second = txn;
    return true;
}

bool InMemoryStore::delete_transaction(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return transactions_.erase(id) > 0;
}

std::optional<Transaction> InMemoryStore::find_transaction(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transactions_.find(id);
    if (it == transactions_.end()) return std::nullopt;
    return it->second;
}

std::vector<Transaction> InMemoryStore::transactions_for_user(int64_t user_id) {
    std::vector<Transaction> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, txn] : transactions_) {
            if (txn.user_id == user_id) result.push_back(txn);
        }
    }
    sort_ledger(result);
    return result;
}

std::vector<Transaction> InMemoryStore::all_transactions() {
    std::vector<Transaction> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, txn] : transactions_) {
            result.push_back(txn);
        }
    }
    sort_ledger(result);
    return result;
}

bool InMemoryStore::account_used_by_other_user(int64_t account_id, int64_t user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, txn] : transactions_) {
        if (txn.account_id == account_id && txn.user_id != user_id) return true;
    }
    return false;
}

void InMemoryStore::replace_holdings(int64_t user_id, const std::vector<Holding>& holdings) {
    std::lock_guard<std::mutex> lock(mutex_);
    holdings_[user_id] = holdings;
}

std::optional<std::vector<Holding>> InMemoryStore::holdings_for(int64_t user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = holdings_.find(user_id);
    if (it == holdings_.end()) return std::nullopt;
    return it->second;
}

void InMemoryStore::invalidate_holdings(int64_t user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    holdings_.erase(user_id);
}

int InMemoryStore::write_day(const Date& date, const std::vector<BalanceHistoryRecord>& records,
                             bool overwrite) {
    std::lock_guard<std::mutex> lock(mutex_);
    int written = 0;
    for (const auto& rec : records) {
        HistoryKey key{rec.user_id, rec.account_id, date.days()};
        auto it = history_.find(key);
        if (it != history_.end() && !overwrite) continue;
        BalanceHistoryRecord stored = rec;
        stored.date = date;
        history_[key] = stored;
        written++;
    }
    return written;
}

std::vector<BalanceHistoryRecord> InMemoryStore::records_between(int64_t user_id,
                                                                 const Date& start, const Date& end) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BalanceHistoryRecord> result;
    for (const auto& [key, rec] : history_) {
        if (std::get<0>(key) != user_id) continue;
        if (rec.date < start || rec.date > end) continue;
        result.push_back(rec);
    }
    std::sort(result.begin(), result.end(), [](const BalanceHistoryRecord& a, const BalanceHistoryRecord& b) {
        if (a.date != b.date) return a.date < b.date;
        return a.account_id < b.account_id;
    });
    return result;
}

std::set<Date> InMemoryStore::recorded_dates(const AccountKey& account, const Date& start, const Date& end) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<Date> dates;
    auto it = history_.lower_bound(HistoryKey{account.user_id, account.account_id, start.days()});
    for (; it != history_.end(); ++it) {
        const auto& [user, acct, day] = it->first;
        if (user != account.user_id || acct != account.account_id || day > end.days()) break;
        dates.insert(it->second.date);
    }
    return dates;
}

int InMemoryStore::delete_from(const AccountKey& account, const Date& from) {
    std::lock_guard<std::mutex> lock(mutex_);
    int removed = 0;
    auto it = history_.lower_bound(HistoryKey{account.user_id, account.account_id, from.days()});
    while (it != history_.end() && std::get<0>(it->first) == account.user_id &&
           std::get<1>(it->first) == account.account_id) {
        it = history_.erase(it);
        removed++;
    }
    return removed;
}

void InMemoryStore::save_price(const PriceCacheEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    prices_[entry.symbol] = entry;
}

std::vector<PriceCacheEntry> InMemoryStore::load_prices() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PriceCacheEntry> result;
    for (const auto& [symbol, entry] : prices_) {
        result.push_back(entry);
    }
    return result;
}

size_t InMemoryStore::history_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.size();
}

std::optional<BalanceHistoryRecord> InMemoryStore::record(const AccountKey& account, const Date& date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = history_.find(HistoryKey{account.user_id, account.account_id, date.days()});
    if (it == history_.end()) return std::nullopt;
    return it->second;
}
