#pragma once

#include "store.hpp"
#include "clock.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Called after a committed mutation with the earliest date whose derived
// state (holdings, balance history) is no longer valid for that account.
using LedgerListener = std::function<void(int64_t user_id, int64_t account_id, const Date& from)>;

// The whole ledger together with the version of every user in it. Versions
// are read before the transactions, so a mutation racing the read always
// shows up as a version change.
struct LedgerSnapshot {
    std::vector<Transaction> transactions;
    std::map<int64_t, uint64_t> versions;
};

// Append-only BUY/SELL ledger. Every mutation is validated and replayed
// before it is written, invalidates derived state first, then bumps the
// user's version so in-flight recomputations can detect it.
class TransactionLedger {
public:
    TransactionLedger(std::shared_ptr<TransactionStore> transactions,
                      std::shared_ptr<HoldingStore> holdings,
                      std::shared_ptr<BalanceHistoryStore> history,
                      std::shared_ptr<Clock> clock,
                      int64_t default_account_id);

    Transaction append(Transaction txn);
    std::vector<Transaction> list(int64_t user_id,
                                  const std::optional<std::string>& symbol = std::nullopt);
    std::optional<Transaction> find(int64_t id);
    Transaction remove(int64_t id);
    Transaction update(int64_t id, const TransactionPatch& patch);

    std::vector<Transaction> all();
    LedgerSnapshot snapshot();
    uint64_t version(int64_t user_id) const;

    int64_t account_of(const Transaction& txn) const;
    int64_t default_account_id() const { return default_account_id_; }

    void add_listener(LedgerListener listener);

    // Runs fn under the user's mutation lock if the ledger version still
    // equals expected. Returns false without running fn otherwise.
    bool commit_if_unchanged(int64_t user_id, uint64_t expected, const std::function<void()>& fn);
    // Same for several users at once; locks are taken in user id order.
    bool commit_if_unchanged(const std::map<int64_t, uint64_t>& expected, const std::function<void()>& fn);

    // Upper-cases and trims the symbol, then throws ValidationError on any
    // malformed field. Exposed for the command layer's early checks.
    static void normalize_and_validate(Transaction& txn);

private:
    std::shared_ptr<TransactionStore> transactions_;
    std::shared_ptr<HoldingStore> holdings_;
    std::shared_ptr<BalanceHistoryStore> history_;
    std::shared_ptr<Clock> clock_;
    int64_t default_account_id_;

    mutable std::mutex state_mutex_;
    std::unordered_map<int64_t, std::shared_ptr<std::mutex>> user_locks_;
    std::unordered_map<int64_t, uint64_t> versions_;

    // Held while an explicit account is checked and claimed by a user.
    std::mutex account_claim_mutex_;

    std::mutex listeners_mutex_;
    std::vector<LedgerListener> listeners_;

    std::shared_ptr<std::mutex> user_lock(int64_t user_id);
    void check_replay(const std::vector<Transaction>& candidate,
                      const std::vector<int64_t>& affected_accounts) const;
    void invalidate(int64_t user_id, const std::map<int64_t, Date>& from_by_account);
    void bump_version(int64_t user_id);
    void notify(int64_t user_id, const std::map<int64_t, Date>& from_by_account);
    void check_not_future(const Transaction& txn) const;
    bool claims_account(const Transaction& txn) const;
    void check_account_owner(const Transaction& txn);
};
