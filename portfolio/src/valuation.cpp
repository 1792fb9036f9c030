#include "valuation.hpp"
#include "ledger.hpp"
#include "holdings.hpp"
#include "price_cache.hpp"
#include "snapshots.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <map>

Date period_start(const std::string& period, const Date& today, const std::optional<Date>& earliest) {
    std::string p = util::to_upper(util::trim(period));

    if (p == "1D") return today.add_days(-1);
    if (p == "3D") return today.add_days(-3);
    if (p == "5D") return today.add_days(-5);
    if (p == "1W") return today.add_days(-7);
    if (p == "1M") return today.add_months(-1);
    if (p == "3M") return today.add_months(-3);
    if (p == "6M") return today.add_months(-6);
    if (p == "YTD") return Date(today.year(), 1, 1);
    if (p == "1Y") return today.add_years(-1);
    if (p == "3Y") return today.add_years(-3);
    if (p == "5Y") return today.add_years(-5);
    if (p == "ALL") return earliest.has_value() && *earliest < today ? *earliest : today;

    throw ValidationError("Unknown period: " + period);
}

std::optional<Decimal> percent_of(const Decimal& part, const Decimal& whole) {
    if (!whole.is_positive()) return std::nullopt;
    return (part * Decimal(100) / whole).round(4);
}

ValuationFacade::ValuationFacade(std::shared_ptr<TransactionLedger> ledger,
                                 std::shared_ptr<HoldingsCalculator> holdings,
                                 std::shared_ptr<PriceCache> prices,
                                 std::shared_ptr<SnapshotReconstructor> snapshots,
                                 std::shared_ptr<BalanceHistoryStore> history,
                                 std::shared_ptr<MarketCalendar> calendar,
                                 std::shared_ptr<Clock> clock)
    : ledger_(std::move(ledger))
    , holdings_(std::move(holdings))
    , prices_(std::move(prices))
    , snapshots_(std::move(snapshots))
    , history_(std::move(history))
    , calendar_(std::move(calendar))
    , clock_(std::move(clock))
{}

PortfolioSummary ValuationFacade::value_portfolio(int64_t user_id, bool detailed) {
    PortfolioSummary summary;
    summary.user_id = user_id;
    summary.as_of = clock_->now();
    summary.market_open = calendar_->is_open(summary.as_of);

    auto holdings = holdings_->current(user_id);
    summary.total_positions = static_cast<int>(holdings.size());

    std::vector<std::string> symbols;
    for (const auto& h : holdings) {
        symbols.push_back(h.symbol);
    }
    auto prices = prices_->get_prices(symbols);

    Decimal priced_cost_basis;
    std::vector<PositionValuation> positions;

    for (const auto& h : holdings) {
        PositionValuation pv;
        pv.symbol = h.symbol;
        pv.quantity = h.quantity;
        pv.average_cost_basis = h.average_cost_basis;
        pv.cost_basis = h.cost_basis();
        pv.realized_gain = h.realized_gain;

        summary.total_cost_basis += pv.cost_basis;
        summary.realized_gain += pv.realized_gain;

        auto it = prices.find(h.symbol);
        if (it != prices.end()) {
            const auto& entry = it->second;
            pv.company_name = entry.company_name;
            pv.price = entry.price;
            pv.market_value = h.quantity * entry.price;
            pv.unrealized_gain = *pv.market_value - pv.cost_basis;
            pv.unrealized_gain_percent = percent_of(*pv.unrealized_gain, pv.cost_basis);
            pv.daily_change = h.quantity * entry.daily_change;
            pv.daily_change_percent = entry.daily_change_percent;
            pv.stale = entry.stale;

            summary.total_market_value += *pv.market_value;
            summary.total_unrealized_gain += *pv.unrealized_gain;
            summary.daily_change += *pv.daily_change;
            summary.priced_positions++;
            priced_cost_basis += pv.cost_basis;
            if (entry.stale) summary.stale = true;
        }

        positions.push_back(pv);
    }

    summary.total_gain_percent = percent_of(summary.total_unrealized_gain, priced_cost_basis);
    summary.daily_change_percent = percent_of(summary.daily_change,
                                              summary.total_market_value - summary.daily_change);

    if (detailed) {
        for (auto& pv : positions) {
            if (pv.market_value) {
                pv.weight_percent = percent_of(*pv.market_value, summary.total_market_value);
            }
        }

        // Sort positions by market value descending, unpriced last
        std::sort(positions.begin(), positions.end(),
                  [](const PositionValuation& a, const PositionValuation& b) {
                      if (!a.market_value.has_value()) return false;
                      if (!b.market_value.has_value()) return true;
                      return *a.market_value > *b.market_value;
                  });
        summary.positions = std::move(positions);
    }

    spdlog::info("Portfolio summary for user {}: {} positions ({} priced), value {}",
                 user_id, summary.total_positions, summary.priced_positions,
                 summary.total_market_value.to_string(2));
    return summary;
}

PortfolioSummary ValuationFacade::summary(int64_t user_id) {
    return value_portfolio(user_id, false);
}

PortfolioSummary ValuationFacade::detailed_summary(int64_t user_id) {
    return value_portfolio(user_id, true);
}

Date ValuationFacade::resolve_start(int64_t user_id, const std::string& period, const Date& today) {
    std::optional<Date> earliest;
    auto txns = ledger_->list(user_id);
    if (!txns.empty()) {
        earliest = txns.front().transaction_date;
    }
    return period_start(period, today, earliest);
}

std::vector<HistoryPoint> ValuationFacade::totals_by_date(int64_t user_id, const Date& start, const Date& end) {
    std::vector<HistoryPoint> points;
    auto accounts = snapshots_->accounts_for_user(user_id);
    if (accounts.empty()) return points;

    std::map<Date, HistoryPoint> by_date;
    for (const auto& record : history_->records_between(user_id, start, end)) {
        auto& point = by_date[record.date];
        point.date = record.date;
        point.value += record.computed_balance;
        point.price_substituted = point.price_substituted || record.price_substituted;
    }

    for (const auto& [date, point] : by_date) {
        points.push_back(point);
    }
    return points;
}

std::vector<HistoryPoint> ValuationFacade::history(int64_t user_id, const std::string& period) {
    Date today = snapshots_->today();
    Date start = resolve_start(user_id, period, today);
    return totals_by_date(user_id, start, today);
}

PerformanceReport ValuationFacade::performance(int64_t user_id, const std::string& period) {
    PerformanceReport report;
    report.period = util::to_upper(util::trim(period));
    report.end_date = snapshots_->today();
    report.start_date = resolve_start(user_id, period, report.end_date);

    auto accounts = snapshots_->accounts_for_user(user_id);
    if (accounts.empty()) {
        return report;
    }

    if (history_->records_between(user_id, report.start_date, report.start_date).empty()) {
        try {
            auto result = snapshots_->backfill(report.start_date, report.start_date);
            report.backfilled_start = result.records_written > 0;
        } catch (const std::exception& e) {
            spdlog::warn("On-demand backfill of {} failed: {}", report.start_date.to_string(), e.what());
        }
    }

    auto points = totals_by_date(user_id, report.start_date, report.end_date);
    report.points = static_cast<int>(points.size());
    if (points.empty()) {
        return report;
    }

    // Baseline is the first day with a positive balance.
    auto baseline = std::find_if(points.begin(), points.end(),
                                 [](const HistoryPoint& p) { return p.value.is_positive(); });
    if (baseline == points.end()) baseline = points.begin();
    const auto& last = points.back();

    report.first_date = baseline->date;
    report.last_date = last.date;
    report.start_value = baseline->value;
    report.end_value = last.value;
    report.change = last.value - baseline->value;
    report.change_percent = percent_of(report.change, baseline->value);

    for (auto it = baseline; it != points.end(); ++it) {
        if (it->price_substituted) report.price_substituted = true;
    }

    for (const auto& txn : ledger_->list(user_id)) {
        if (txn.transaction_date <= baseline->date || txn.transaction_date > last.date) continue;
        if (txn.type == TransactionType::BUY) {
            report.net_flow += txn.effective_total_cost();
        } else {
            report.net_flow -= txn.effective_total_cost();
        }
    }
    report.adjusted_gain = report.change - report.net_flow;
    report.adjusted_percent = percent_of(report.adjusted_gain, baseline->value + report.net_flow);

    spdlog::info("Performance {} for user {}: {} -> {} ({} points)", report.period, user_id,
                 report.start_value.to_string(2), report.end_value.to_string(2), report.points);
    return report;
}
