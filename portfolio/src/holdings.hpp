#pragma once

#include "types.hpp"
#include "store.hpp"
#include "clock.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

class TransactionLedger;

// Replays transactions (already in ledger order) into positions. Only
// transactions dated on or before as_of are applied when it is set.
// Positions sold to zero are dropped from the result. Throws
// InsufficientHoldingsError on an oversell.
std::map<std::string, Holding> compute_holdings(const std::vector<Transaction>& txns,
                                                const std::optional<Date>& as_of = std::nullopt);

class HoldingsCalculator {
public:
    HoldingsCalculator(std::shared_ptr<TransactionLedger> ledger,
                       std::shared_ptr<HoldingStore> store,
                       std::shared_ptr<Clock> clock,
                       int max_attempts);

    // Full replay of the user's ledger; replaces the stored holding set.
    std::map<std::string, Holding> recalculate(int64_t user_id);

    // Stored holdings, recalculating first when invalidated or never computed.
    std::vector<Holding> current(int64_t user_id);

private:
    std::shared_ptr<TransactionLedger> ledger_;
    std::shared_ptr<HoldingStore> store_;
    std::shared_ptr<Clock> clock_;
    int max_attempts_;

    std::mutex locks_mutex_;
    std::unordered_map<int64_t, std::shared_ptr<std::mutex>> user_locks_;

    std::shared_ptr<std::mutex> user_lock(int64_t user_id);
};
