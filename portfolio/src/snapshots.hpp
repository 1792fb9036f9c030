#pragma once

#include "types.hpp"
#include "store.hpp"
#include "clock.hpp"
#include "market_hours.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

class TransactionLedger;
struct LedgerSnapshot;
class PriceCache;
class ClosePriceCache;

struct BackfillResult {
    int dates_processed = 0;
    int dates_skipped = 0;
    int records_written = 0;
    // Account rows left out because a held symbol had no price; a later
    // fill_missing picks them up.
    int records_deferred = 0;
    bool cancelled = false;
};

// Rebuilds daily account balances from the ledger and daily closes.
// Accounts are the (user, effective account id) pairs in the ledger.
class SnapshotReconstructor {
public:
    SnapshotReconstructor(std::shared_ptr<TransactionLedger> ledger,
                          std::shared_ptr<BalanceHistoryStore> history,
                          std::shared_ptr<PriceCache> prices,
                          std::shared_ptr<ClosePriceCache> closes,
                          std::shared_ptr<MarketCalendar> calendar,
                          std::shared_ptr<Clock> clock,
                          std::optional<Date> history_start = std::nullopt);

    std::vector<AccountKey> accounts();
    std::vector<int64_t> accounts_for_user(int64_t user_id);

    // Today's rows are replaced; rows of past dates are never touched.
    int create_for_date(const Date& date, SnapshotSource source = SnapshotSource::COMPUTED);

    BackfillResult backfill(const Date& start, const Date& end,
                            const std::atomic<bool>* cancel = nullptr);
    BackfillResult fill_missing(const std::atomic<bool>* cancel = nullptr);

    Date today() const;

private:
    struct DateWrite {
        int written = 0;
        int deferred = 0;
        // A user's ledger moved after the snapshot was read; nothing was written.
        bool stale = false;
    };

    std::shared_ptr<TransactionLedger> ledger_;
    std::shared_ptr<BalanceHistoryStore> history_;
    std::shared_ptr<PriceCache> prices_;
    std::shared_ptr<ClosePriceCache> closes_;
    std::shared_ptr<MarketCalendar> calendar_;
    std::shared_ptr<Clock> clock_;
    std::optional<Date> history_start_;

    // Serializes writers of the same date.
    std::mutex write_mutex_;

    DateWrite write_date(const LedgerSnapshot& ledger, const Date& date, SnapshotSource source,
                         const std::optional<std::set<AccountKey>>& only_accounts);
    // Re-reads the ledger and retries while write_date reports it stale.
    DateWrite write_date_current(LedgerSnapshot& ledger, const Date& date, SnapshotSource source,
                                 const std::optional<std::set<AccountKey>>& only_accounts);
    BackfillResult fill_dates(LedgerSnapshot& ledger,
                              const std::map<Date, std::set<AccountKey>>& missing,
                              SnapshotSource source, const std::atomic<bool>* cancel);
    void prefetch_closes(const std::vector<Transaction>& ledger, const Date& from, const Date& to);
    std::map<AccountKey, Date> first_dates(const std::vector<Transaction>& ledger) const;
};
