#pragma once

#include "clock.hpp"
#include "market_hours.hpp"
#include "quote_provider.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

struct ClosePrice {
    Decimal price;
    Date price_date;
    // A trading day's own close was missing and an earlier one stands in.
    bool substituted = false;
};

// Daily closes per symbol. Each (symbol, date) is asked of the provider at
// most once, including dates that turned out to have no data. Dates from
// today on are never marked as known, since their close may still arrive.
class ClosePriceCache {
public:
    ClosePriceCache(std::shared_ptr<QuoteProvider> provider,
                    std::shared_ptr<MarketCalendar> calendar,
                    std::shared_ptr<Clock> clock,
                    int carry_forward_max_days);

    std::optional<ClosePrice> close_on_or_before(const std::string& symbol, const Date& date);

    // Loads [from - carry-forward window, to] in one provider call.
    void prefetch(const std::string& symbol, const Date& from, const Date& to);

    int carry_forward_max_days() const { return carry_forward_max_days_; }

private:
    struct SymbolCloses {
        std::mutex mutex;
        std::set<Date> covered;
        std::map<Date, Decimal> closes;
    };

    std::shared_ptr<QuoteProvider> provider_;
    std::shared_ptr<MarketCalendar> calendar_;
    std::shared_ptr<Clock> clock_;
    int carry_forward_max_days_;

    std::mutex symbols_mutex_;
    std::unordered_map<std::string, std::shared_ptr<SymbolCloses>> symbols_;

    std::shared_ptr<SymbolCloses> closes_for(const std::string& symbol);
    // Caller holds closes.mutex.
    void ensure_covered(const std::string& symbol, SymbolCloses& closes, const Date& from, const Date& to);
};
