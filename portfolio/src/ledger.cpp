#include "ledger.hpp"
#include "holdings.hpp"
#include "errors.hpp"
#include "market_hours.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>

namespace {

constexpr size_t kMaxSymbolLength = 15;
constexpr size_t kMaxNotesLength = 500;

bool is_symbol_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '.' || c == '-';
}

} // namespace

TransactionLedger::TransactionLedger(std::shared_ptr<TransactionStore> transactions,
                                     std::shared_ptr<HoldingStore> holdings,
                                     std::shared_ptr<BalanceHistoryStore> history,
                                     std::shared_ptr<Clock> clock,
                                     int64_t default_account_id)
    : transactions_(std::move(transactions))
    , holdings_(std::move(holdings))
    , history_(std::move(history))
    , clock_(std::move(clock))
    , default_account_id_(default_account_id)
{}

void TransactionLedger::normalize_and_validate(Transaction& txn) {
    txn.symbol = util::to_upper(util::trim(txn.symbol));

    if (txn.user_id <= 0) {
        throw ValidationError("User id must be positive");
    }
    if (txn.symbol.empty()) {
        throw ValidationError("Symbol is required");
    }
    if (txn.symbol.size() > kMaxSymbolLength ||
        !std::all_of(txn.symbol.begin(), txn.symbol.end(), is_symbol_char)) {
        throw ValidationError("Invalid symbol: " + txn.symbol);
    }
    if (!txn.quantity.is_positive()) {
        throw ValidationError("Quantity must be greater than 0");
    }
    if (!txn.price_per_share.is_positive()) {
        throw ValidationError("Price per share must be greater than 0");
    }
    if (txn.total_cost.has_value() && !txn.total_cost->is_positive()) {
        throw ValidationError("Total cost must be greater than 0");
    }
    if (txn.account_id.has_value() && *txn.account_id <= 0) {
        throw ValidationError("Account id must be positive");
    }
    if (txn.notes.size() > kMaxNotesLength) {
        throw ValidationError("Notes cannot exceed 500 characters");
    }
}

void TransactionLedger::check_not_future(const Transaction& txn) const {
    auto now = clock_->now();
    Date today = Date::from_time_point(now, MarketCalendar::eastern_offset_minutes(now));
    if (txn.transaction_date > today) {
        throw ValidationError("Transaction date " + txn.transaction_date.to_string() +
                              " is in the future");
    }
}

int64_t TransactionLedger::account_of(const Transaction& txn) const {
    return txn.account_id.value_or(default_account_id_);
}

bool TransactionLedger::claims_account(const Transaction& txn) const {
    return txn.account_id.has_value() && *txn.account_id != default_account_id_;
}

// Explicit accounts belong to the first user who records into them. The
// default account id is shared, its balances are kept apart per user.
void TransactionLedger::check_account_owner(const Transaction& txn) {
    bool taken = false;
    try {
        taken = transactions_->account_used_by_other_user(*txn.account_id, txn.user_id);
    } catch (const std::exception& e) {
        spdlog::error("Failed to check owner of account {}: {}", *txn.account_id, e.what());
        throw;
    }
    if (taken) {
        throw ValidationError("Account " + std::to_string(*txn.account_id) +
                              " belongs to another user");
    }
}

std::shared_ptr<std::mutex> TransactionLedger::user_lock(int64_t user_id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto& slot = user_locks_[user_id];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

void TransactionLedger::bump_version(int64_t user_id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    versions_[user_id]++;
}

uint64_t TransactionLedger::version(int64_t user_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = versions_.find(user_id);
    return it == versions_.end() ? 0 : it->second;
}

void TransactionLedger::add_listener(LedgerListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
}

void TransactionLedger::check_replay(const std::vector<Transaction>& candidate,
                                     const std::vector<int64_t>& affected_accounts) const {
    compute_holdings(candidate);

    for (int64_t account : affected_accounts) {
        std::vector<Transaction> scoped;
        for (const auto& txn : candidate) {
            if (account_of(txn) == account) scoped.push_back(txn);
        }
        compute_holdings(scoped);
    }
}

void TransactionLedger::invalidate(int64_t user_id, const std::map<int64_t, Date>& from_by_account) {
    try {
        holdings_->invalidate_holdings(user_id);
        for (const auto& [account, from] : from_by_account) {
            int removed = history_->delete_from(AccountKey{user_id, account}, from);
            if (removed > 0) {
                spdlog::info("Invalidated {} balance rows for account {} of user {} from {}",
                             removed, account, user_id, from.to_string());
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to invalidate derived state for user {}: {}", user_id, e.what());
        throw;
    }
}

void TransactionLedger::notify(int64_t user_id, const std::map<int64_t, Date>& from_by_account) {
    std::vector<LedgerListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }
    for (const auto& [account, from] : from_by_account) {
        for (const auto& listener : listeners) {
            try {
                listener(user_id, account, from);
            } catch (const std::exception& e) {
                spdlog::error("Ledger listener failed for user {}: {}", user_id, e.what());
            }
        }
    }
}

Transaction TransactionLedger::append(Transaction txn) {
    normalize_and_validate(txn);
    check_not_future(txn);
    txn.created_at = clock_->now();

    auto lock_ptr = user_lock(txn.user_id);
    std::unique_lock<std::mutex> lock(*lock_ptr);

    auto candidate = transactions_->transactions_for_user(txn.user_id);
    Transaction pending = txn;
    pending.id = std::numeric_limits<int64_t>::max();
    candidate.push_back(pending);
    std::sort(candidate.begin(), candidate.end(), ledger_order);
    check_replay(candidate, {account_of(txn)});

    std::unique_lock<std::mutex> claim(account_claim_mutex_, std::defer_lock);
    if (claims_account(txn)) {
        claim.lock();
        check_account_owner(txn);
    }

    std::map<int64_t, Date> from_by_account{{account_of(txn), txn.transaction_date}};
    invalidate(txn.user_id, from_by_account);

    try {
        txn.id = transactions_->insert_transaction(txn);
    } catch (const std::exception& e) {
        spdlog::error("Failed to insert transaction: {}", e.what());
        throw;
    }
    bump_version(txn.user_id);
    if (claim.owns_lock()) claim.unlock();
    lock.unlock();

    spdlog::info("Recorded {} {} {} @ {} for user {} (id {})",
                 to_string(txn.type), txn.quantity.to_string(), txn.symbol,
                 txn.price_per_share.to_string(), txn.user_id, txn.id);

    notify(txn.user_id, from_by_account);
    return txn;
}

std::vector<Transaction> TransactionLedger::list(int64_t user_id,
                                                 const std::optional<std::string>& symbol) {
    auto txns = transactions_->transactions_for_user(user_id);
    if (!symbol.has_value()) return txns;

    std::string wanted = util::to_upper(util::trim(*symbol));
    std::vector<Transaction> filtered;
    for (const auto& txn : txns) {
        if (txn.symbol == wanted) filtered.push_back(txn);
    }
    return filtered;
}

std::optional<Transaction> TransactionLedger::find(int64_t id) {
    return transactions_->find_transaction(id);
}

std::vector<Transaction> TransactionLedger::all() {
    return transactions_->all_transactions();
}

LedgerSnapshot TransactionLedger::snapshot() {
    std::unordered_map<int64_t, uint64_t> seen;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        seen = versions_;
    }

    LedgerSnapshot snap;
    snap.transactions = transactions_->all_transactions();
    for (const auto& txn : snap.transactions) {
        auto it = seen.find(txn.user_id);
        snap.versions.emplace(txn.user_id, it == seen.end() ? 0 : it->second);
    }
    return snap;
}

Transaction TransactionLedger::remove(int64_t id) {
    auto existing = transactions_->find_transaction(id);
    if (!existing) {
        throw NotFoundError("Transaction " + std::to_string(id) + " not found");
    }

    auto lock_ptr = user_lock(existing->user_id);
    std::unique_lock<std::mutex> lock(*lock_ptr);

    // Re-read under the lock; a concurrent mutation may have removed it.
    existing = transactions_->find_transaction(id);
    if (!existing) {
        throw NotFoundError("Transaction " + std::to_string(id) + " not found");
    }

    auto candidate = transactions_->transactions_for_user(existing->user_id);
    candidate.erase(std::remove_if(candidate.begin(), candidate.end(),
                                   [id](const Transaction& t) { return t.id == id; }),
                    candidate.end());
    check_replay(candidate, {account_of(*existing)});

    std::map<int64_t, Date> from_by_account{{account_of(*existing), existing->transaction_date}};
    invalidate(existing->user_id, from_by_account);

    bool removed = false;
    try {
        removed = transactions_->delete_transaction(id);
    } catch (const std::exception& e) {
        spdlog::error("Failed to delete transaction {}: {}", id, e.what());
        throw;
    }
    if (!removed) {
        throw NotFoundError("Transaction " + std::to_string(id) + " not found");
    }
    bump_version(existing->user_id);
    lock.unlock();

    spdlog::info("Removed transaction {} ({} {}) for user {}",
                 id, to_string(existing->type), existing->symbol, existing->user_id);

    notify(existing->user_id, from_by_account);
    return *existing;
}

Transaction TransactionLedger::update(int64_t id, const TransactionPatch& patch) {
    auto existing = transactions_->find_transaction(id);
    if (!existing) {
        throw NotFoundError("Transaction " + std::to_string(id) + " not found");
    }

    auto lock_ptr = user_lock(existing->user_id);
    std::unique_lock<std::mutex> lock(*lock_ptr);

    existing = transactions_->find_transaction(id);
    if (!existing) {
        throw NotFoundError("Transaction " + std::to_string(id) + " not found");
    }

    Transaction updated = *existing;
    if (patch.account_id) updated.account_id = *patch.account_id;
    if (patch.symbol) updated.symbol = *patch.symbol;
    if (patch.type) updated.type = *patch.type;
    if (patch.quantity) updated.quantity = *patch.quantity;
    if (patch.price_per_share) updated.price_per_share = *patch.price_per_share;
    if (patch.total_cost) updated.total_cost = *patch.total_cost;
    if (patch.transaction_date) updated.transaction_date = *patch.transaction_date;
    if (patch.notes) updated.notes = *patch.notes;

    normalize_and_validate(updated);
    check_not_future(updated);

    auto candidate = transactions_->transactions_for_user(existing->user_id);
    for (auto& txn : candidate) {
        if (txn.id == id) txn = updated;
    }
    std::sort(candidate.begin(), candidate.end(), ledger_order);

    int64_t old_account = account_of(*existing);
    int64_t new_account = account_of(updated);
    Date from = std::min(existing->transaction_date, updated.transaction_date);

    std::vector<int64_t> affected{old_account};
    if (new_account != old_account) affected.push_back(new_account);
    check_replay(candidate, affected);

    std::unique_lock<std::mutex> claim(account_claim_mutex_, std::defer_lock);
    if (new_account != old_account && claims_account(updated)) {
        claim.lock();
        check_account_owner(updated);
    }

    std::map<int64_t, Date> from_by_account;
    for (int64_t account : affected) {
        from_by_account.emplace(account, from);
    }
    invalidate(existing->user_id, from_by_account);

    bool written = false;
    try {
        written = transactions_->update_transaction(updated);
    } catch (const std::exception& e) {
        spdlog::error("Failed to update transaction {}: {}", id, e.what());
        throw;
    }
    if (!written) {
        throw NotFoundError("Transaction " + std::to_string(id) + " not found");
    }
    bump_version(existing->user_id);
    if (claim.owns_lock()) claim.unlock();
    lock.unlock();

    spdlog::info("Updated transaction {} for user {}", id, existing->user_id);

    notify(existing->user_id, from_by_account);
    return updated;
}

bool TransactionLedger::commit_if_unchanged(int64_t user_id, uint64_t expected,
                                            const std::function<void()>& fn) {
    auto lock_ptr = user_lock(user_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);
    if (version(user_id) != expected) {
        return false;
    }
    fn();
    return true;
}

bool TransactionLedger::commit_if_unchanged(const std::map<int64_t, uint64_t>& expected,
                                            const std::function<void()>& fn) {
    std::vector<std::unique_lock<std::mutex>> locks;
    locks.reserve(expected.size());
    for (const auto& [user_id, version_seen] : expected) {
        locks.emplace_back(*user_lock(user_id));
        if (version(user_id) != version_seen) {
            return false;
        }
    }
    fn();
    return true;
}
