#include "snapshots.hpp"
#include "ledger.hpp"
#include "holdings.hpp"
#include "price_cache.hpp"
#include "close_price_cache.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {

constexpr int kMaxStaleRetries = 3;

} // namespace

SnapshotReconstructor::SnapshotReconstructor(std::shared_ptr<TransactionLedger> ledger,
                                             std::shared_ptr<BalanceHistoryStore> history,
                                             std::shared_ptr<PriceCache> prices,
                                             std::shared_ptr<ClosePriceCache> closes,
                                             std::shared_ptr<MarketCalendar> calendar,
                                             std::shared_ptr<Clock> clock,
                                             std::optional<Date> history_start)
    : ledger_(std::move(ledger))
    , history_(std::move(history))
    , prices_(std::move(prices))
    , closes_(std::move(closes))
    , calendar_(std::move(calendar))
    , clock_(std::move(clock))
    , history_start_(history_start)
{}

Date SnapshotReconstructor::today() const {
    return calendar_->trading_date(clock_->now());
}

std::vector<AccountKey> SnapshotReconstructor::accounts() {
    std::set<AccountKey> keys;
    for (const auto& txn : ledger_->all()) {
        keys.insert(AccountKey{txn.user_id, ledger_->account_of(txn)});
    }
    return std::vector<AccountKey>(keys.begin(), keys.end());
}

std::vector<int64_t> SnapshotReconstructor::accounts_for_user(int64_t user_id) {
    std::set<int64_t> ids;
    for (const auto& txn : ledger_->list(user_id)) {
        ids.insert(ledger_->account_of(txn));
    }
    return std::vector<int64_t>(ids.begin(), ids.end());
}

std::map<AccountKey, Date> SnapshotReconstructor::first_dates(const std::vector<Transaction>& ledger) const {
    std::map<AccountKey, Date> first;
    for (const auto& txn : ledger) {
        AccountKey key{txn.user_id, ledger_->account_of(txn)};
        auto it = first.find(key);
        if (it == first.end() || txn.transaction_date < it->second) {
            first[key] = txn.transaction_date;
        }
    }
    return first;
}

SnapshotReconstructor::DateWrite SnapshotReconstructor::write_date(
        const LedgerSnapshot& ledger, const Date& date, SnapshotSource source,
        const std::optional<std::set<AccountKey>>& only_accounts) {
    DateWrite outcome;
    bool is_today = date == today();

    std::map<AccountKey, std::vector<Transaction>> by_account;
    for (const auto& txn : ledger.transactions) {
        if (txn.transaction_date > date) continue;
        AccountKey key{txn.user_id, ledger_->account_of(txn)};
        if (only_accounts && only_accounts->count(key) == 0) continue;
        by_account[key].push_back(txn);
    }
    if (by_account.empty()) {
        return outcome;
    }

    std::map<AccountKey, std::map<std::string, Holding>> positions;
    std::set<std::string> symbols;
    for (const auto& [key, txns] : by_account) {
        try {
            positions[key] = compute_holdings(txns, date);
        } catch (const InsufficientHoldingsError& e) {
            spdlog::error("Ledger of account {} (user {}) does not replay on {}: {}",
                          key.account_id, key.user_id, date.to_string(), e.what());
            continue;
        }
        for (const auto& [symbol, holding] : positions[key]) {
            symbols.insert(symbol);
        }
    }

    std::map<std::string, PriceCacheEntry> live;
    if (is_today && !symbols.empty()) {
        try {
            live = prices_->get_prices(std::vector<std::string>(symbols.begin(), symbols.end()));
        } catch (const std::exception& e) {
            spdlog::warn("Live prices unavailable for {}, using closes: {}", date.to_string(), e.what());
        }
    }

    // Resolve each symbol's price for the date once. A symbol without one
    // holds back the rows of every account holding it.
    std::map<std::string, std::pair<Decimal, bool>> resolved;
    std::set<std::string> unpriced;
    for (const auto& symbol : symbols) {
        auto it = live.find(symbol);
        if (it != live.end()) {
            resolved[symbol] = {it->second.price, false};
            continue;
        }

        std::optional<ClosePrice> close;
        try {
            close = closes_->close_on_or_before(symbol, date);
        } catch (const std::exception& e) {
            spdlog::error("Close lookup for {} on {} failed: {}", symbol, date.to_string(), e.what());
            unpriced.insert(symbol);
            continue;
        }
        if (close) {
            resolved[symbol] = {close->price, close->substituted};
        } else {
            spdlog::error("No close for {} within {} days of {}", symbol,
                          closes_->carry_forward_max_days(), date.to_string());
            unpriced.insert(symbol);
        }
    }

    auto now = clock_->now();
    std::vector<BalanceHistoryRecord> records;
    std::map<int64_t, uint64_t> expected;
    for (const auto& [key, holdings] : positions) {
        auto missing = std::find_if(holdings.begin(), holdings.end(),
                                    [&unpriced](const auto& h) { return unpriced.count(h.first) > 0; });
        if (missing != holdings.end()) {
            spdlog::warn("Deferring {} balance of account {} (user {}): no price for {}",
                         date.to_string(), key.account_id, key.user_id, missing->first);
            outcome.deferred++;
            continue;
        }

        BalanceHistoryRecord record;
        record.user_id = key.user_id;
        record.account_id = key.account_id;
        record.date = date;
        record.source = source;
        record.recorded_at = now;
        for (const auto& [symbol, holding] : holdings) {
            const auto& [price, substituted] = resolved[symbol];
            record.computed_balance += holding.quantity * price;
            record.price_substituted = record.price_substituted || substituted;
        }
        records.push_back(record);
        expected[key.user_id] = ledger.versions.at(key.user_id);
    }
    if (records.empty()) {
        return outcome;
    }

    // The write only stands if no involved user's ledger moved since it was
    // read; a mutation in between has already invalidated these rows.
    bool committed = ledger_->commit_if_unchanged(expected, [&]() {
        std::lock_guard<std::mutex> lock(write_mutex_);
        outcome.written = history_->write_day(date, records, is_today);
    });
    if (!committed) {
        spdlog::info("Ledger changed while computing balances for {}, recomputing", date.to_string());
        outcome.stale = true;
        outcome.deferred = 0;
        return outcome;
    }

    spdlog::debug("Wrote {}/{} balance rows for {}", outcome.written, records.size(), date.to_string());
    return outcome;
}

SnapshotReconstructor::DateWrite SnapshotReconstructor::write_date_current(
        LedgerSnapshot& ledger, const Date& date, SnapshotSource source,
        const std::optional<std::set<AccountKey>>& only_accounts) {
    for (int attempt = 1; ; attempt++) {
        auto outcome = write_date(ledger, date, source, only_accounts);
        if (!outcome.stale) {
            return outcome;
        }
        ledger = ledger_->snapshot();
        if (attempt >= kMaxStaleRetries) {
            // Mutations keep racing this date; their listeners rebuild it.
            spdlog::warn("Giving up on balances for {} after {} attempts", date.to_string(), attempt);
            return outcome;
        }
    }
}

int SnapshotReconstructor::create_for_date(const Date& date, SnapshotSource source) {
    if (date > today()) {
        throw ValidationError("Cannot snapshot future date " + date.to_string());
    }

    spdlog::info("Creating account snapshots for {}", date.to_string());
    auto ledger = ledger_->snapshot();
    auto outcome = write_date_current(ledger, date, source, std::nullopt);
    spdlog::info("Created {} snapshots for {} ({} deferred)", outcome.written, date.to_string(),
                 outcome.deferred);
    return outcome.written;
}

void SnapshotReconstructor::prefetch_closes(const std::vector<Transaction>& ledger,
                                            const Date& from, const Date& to) {
    std::set<std::string> symbols;
    for (const auto& txn : ledger) {
        if (txn.transaction_date <= to) symbols.insert(txn.symbol);
    }
    for (const auto& symbol : symbols) {
        closes_->prefetch(symbol, from, to);
    }
}

BackfillResult SnapshotReconstructor::fill_dates(LedgerSnapshot& ledger,
                                                 const std::map<Date, std::set<AccountKey>>& missing,
                                                 SnapshotSource source,
                                                 const std::atomic<bool>* cancel) {
    BackfillResult result;
    for (const auto& [date, accounts] : missing) {
        if (cancel && cancel->load()) {
            result.cancelled = true;
            spdlog::info("Backfill cancelled before {}", date.to_string());
            break;
        }
        if (accounts.empty()) {
            result.dates_skipped++;
            continue;
        }
        auto outcome = write_date_current(ledger, date, source, accounts);
        result.records_written += outcome.written;
        result.records_deferred += outcome.deferred;
        result.dates_processed++;
    }
    return result;
}

BackfillResult SnapshotReconstructor::backfill(const Date& start, const Date& end,
                                               const std::atomic<bool>* cancel) {
    if (start > end) {
        throw ValidationError("Backfill start " + start.to_string() + " is after end " + end.to_string());
    }
    Date last = std::min(end, today());
    if (start > last) {
        throw ValidationError("Backfill start " + start.to_string() + " is in the future");
    }

    spdlog::info("Backfilling account snapshots from {} to {}", start.to_string(), last.to_string());

    auto ledger = ledger_->snapshot();
    auto first_date = first_dates(ledger.transactions);

    std::map<AccountKey, std::set<Date>> existing;
    for (const auto& [key, first] : first_date) {
        existing[key] = history_->recorded_dates(key, start, last);
    }

    std::map<Date, std::set<AccountKey>> missing;
    for (Date d = start; d <= last; ++d) {
        auto& accounts = missing[d];
        for (const auto& [key, first] : first_date) {
            if (first <= d && existing[key].count(d) == 0) {
                accounts.insert(key);
            }
        }
    }

    prefetch_closes(ledger.transactions, start, last);
    auto result = fill_dates(ledger, missing, SnapshotSource::BACKFILLED, cancel);

    spdlog::info("Backfill complete: {} dates processed, {} skipped, {} rows written, {} deferred{}",
                 result.dates_processed, result.dates_skipped, result.records_written,
                 result.records_deferred, result.cancelled ? " (cancelled)" : "");
    return result;
}

BackfillResult SnapshotReconstructor::fill_missing(const std::atomic<bool>* cancel) {
    auto ledger = ledger_->snapshot();
    Date end = today();

    std::map<Date, std::set<AccountKey>> missing;
    for (const auto& [key, first] : first_dates(ledger.transactions)) {
        Date start = first;
        if (history_start_ && *history_start_ > start) start = *history_start_;
        if (start > end) continue;

        auto existing = history_->recorded_dates(key, start, end);
        int count = 0;
        for (Date d = start; d <= end; ++d) {
            if (existing.count(d) == 0) {
                missing[d].insert(key);
                count++;
            }
        }
        if (count > 0) {
            spdlog::info("Found {} missing dates for account {} of user {}", count, key.account_id, key.user_id);
        }
    }

    if (missing.empty()) {
        spdlog::debug("No missing snapshots");
        return BackfillResult{};
    }

    prefetch_closes(ledger.transactions, missing.begin()->first, end);
    auto result = fill_dates(ledger, missing, SnapshotSource::BACKFILLED, cancel);

    spdlog::info("Filled {} missing snapshots over {} dates, {} deferred{}", result.records_written,
                 result.dates_processed, result.records_deferred, result.cancelled ? " (cancelled)" : "");
    return result;
}
