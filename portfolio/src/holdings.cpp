#include "holdings.hpp"
#include "ledger.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

std::map<std::string, Holding> compute_holdings(const std::vector<Transaction>& txns,
                                                const std::optional<Date>& as_of) {
    std::map<std::string, Holding> positions;

    for (const auto& txn : txns) {
        if (as_of.has_value() && txn.transaction_date > *as_of) continue;

        auto& pos = positions[txn.symbol];
        pos.user_id = txn.user_id;
        pos.symbol = txn.symbol;

        if (txn.type == TransactionType::BUY) {
            Decimal new_qty = pos.quantity + txn.quantity;
            Decimal cost = pos.quantity * pos.average_cost_basis + txn.quantity * txn.price_per_share;
            pos.average_cost_basis = cost / new_qty;
            pos.quantity = new_qty;
        } else {
            if (txn.quantity > pos.quantity) {
                throw InsufficientHoldingsError(txn.symbol, pos.quantity.to_string(),
                                                txn.quantity.to_string());
            }
            pos.realized_gain += txn.quantity * (txn.price_per_share - pos.average_cost_basis);
            pos.quantity -= txn.quantity;
            if (pos.quantity.is_zero()) {
                pos.average_cost_basis = Decimal();
            }
        }
    }

    for (auto it = positions.begin(); it != positions.end();) {
        if (it->second.quantity.is_zero()) {
            it = positions.erase(it);
        } else {
            ++it;
        }
    }
    return positions;
}

HoldingsCalculator::HoldingsCalculator(std::shared_ptr<TransactionLedger> ledger,
                                       std::shared_ptr<HoldingStore> store,
                                       std::shared_ptr<Clock> clock,
                                       int max_attempts)
    : ledger_(std::move(ledger))
    , store_(std::move(store))
    , clock_(std::move(clock))
    , max_attempts_(max_attempts)
{}

std::shared_ptr<std::mutex> HoldingsCalculator::user_lock(int64_t user_id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& slot = user_locks_[user_id];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

std::map<std::string, Holding> HoldingsCalculator::recalculate(int64_t user_id) {
    auto lock_ptr = user_lock(user_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);

    for (int attempt = 1; attempt <= max_attempts_; attempt++) {
        uint64_t version = ledger_->version(user_id);
        auto positions = compute_holdings(ledger_->list(user_id));

        auto now = clock_->now();
        std::vector<Holding> rows;
        rows.reserve(positions.size());
        for (auto& [symbol, holding] : positions) {
            holding.last_recalculated_at = now;
            rows.push_back(holding);
        }

        bool committed = ledger_->commit_if_unchanged(user_id, version, [&]() {
            store_->replace_holdings(user_id, rows);
        });
        if (committed) {
            spdlog::debug("Recalculated {} holdings for user {}", rows.size(), user_id);
            return positions;
        }

        spdlog::warn("Ledger for user {} changed during recalculation, retrying ({}/{})",
                     user_id, attempt, max_attempts_);
    }

    throw RecomputationConflictError("Holdings for user " + std::to_string(user_id) +
                                     " kept changing during recalculation");
}

std::vector<Holding> HoldingsCalculator::current(int64_t user_id) {
    auto stored = store_->holdings_for(user_id);
    if (stored.has_value()) {
        return *stored;
    }

    std::vector<Holding> rows;
    for (const auto& [symbol, holding] : recalculate(user_id)) {
        rows.push_back(holding);
    }
    return rows;
}
