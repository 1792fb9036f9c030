#pragma once

#include "types.hpp"
#include "clock.hpp"
#include "market_hours.hpp"
#include "store.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

class TransactionLedger;
class HoldingsCalculator;
class PriceCache;
class SnapshotReconstructor;

struct PositionValuation {
    std::string symbol;
    std::string company_name;
    Decimal quantity;
    Decimal average_cost_basis;
    Decimal cost_basis;
    Decimal realized_gain;
    std::optional<Decimal> price;
    std::optional<Decimal> market_value;
    std::optional<Decimal> unrealized_gain;
    std::optional<Decimal> unrealized_gain_percent;
    std::optional<Decimal> daily_change;
    std::optional<Decimal> daily_change_percent;
    std::optional<Decimal> weight_percent;
    bool stale = false;
};

struct PortfolioSummary {
    int64_t user_id = 0;
    Decimal total_cost_basis;
    Decimal total_market_value;
    Decimal total_unrealized_gain;
    std::optional<Decimal> total_gain_percent;
    Decimal realized_gain;
    Decimal daily_change;
    std::optional<Decimal> daily_change_percent;
    int total_positions = 0;
    int priced_positions = 0;
    bool stale = false;
    bool market_open = false;
    std::chrono::system_clock::time_point as_of;
    // Filled by detailed_summary only.
    std::vector<PositionValuation> positions;
};

struct PerformanceReport {
    std::string period;
    Date start_date;
    Date end_date;
    int points = 0;
    std::optional<Date> first_date;
    std::optional<Date> last_date;
    Decimal start_value;
    Decimal end_value;
    Decimal change;
    std::optional<Decimal> change_percent;
    Decimal net_flow;
    Decimal adjusted_gain;
    std::optional<Decimal> adjusted_percent;
    bool price_substituted = false;
    bool backfilled_start = false;
};

struct HistoryPoint {
    Date date;
    Decimal value;
    bool price_substituted = false;
};

// Start of a reporting period ending today. ALL starts at earliest, or
// today when there is no history. Throws ValidationError on unknown periods.
Date period_start(const std::string& period, const Date& today, const std::optional<Date>& earliest);

// (part / whole) * 100 to 4 places, nullopt when whole is not positive.
std::optional<Decimal> percent_of(const Decimal& part, const Decimal& whole);

class ValuationFacade {
public:
    ValuationFacade(std::shared_ptr<TransactionLedger> ledger,
                    std::shared_ptr<HoldingsCalculator> holdings,
                    std::shared_ptr<PriceCache> prices,
                    std::shared_ptr<SnapshotReconstructor> snapshots,
                    std::shared_ptr<BalanceHistoryStore> history,
                    std::shared_ptr<MarketCalendar> calendar,
                    std::shared_ptr<Clock> clock);

    PortfolioSummary summary(int64_t user_id);
    PortfolioSummary detailed_summary(int64_t user_id);
    PerformanceReport performance(int64_t user_id, const std::string& period);
    std::vector<HistoryPoint> history(int64_t user_id, const std::string& period);

private:
    std::shared_ptr<TransactionLedger> ledger_;
    std::shared_ptr<HoldingsCalculator> holdings_;
    std::shared_ptr<PriceCache> prices_;
    std::shared_ptr<SnapshotReconstructor> snapshots_;
    std::shared_ptr<BalanceHistoryStore> history_;
    std::shared_ptr<MarketCalendar> calendar_;
    std::shared_ptr<Clock> clock_;

    PortfolioSummary value_portfolio(int64_t user_id, bool detailed);
    Date resolve_start(int64_t user_id, const std::string& period, const Date& today);
    std::vector<HistoryPoint> totals_by_date(int64_t user_id, const Date& start, const Date& end);
};
