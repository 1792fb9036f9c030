#include "close_price_cache.hpp"
#include <spdlog/spdlog.h>

ClosePriceCache::ClosePriceCache(std::shared_ptr<QuoteProvider> provider,
                                 std::shared_ptr<MarketCalendar> calendar,
                                 std::shared_ptr<Clock> clock,
                                 int carry_forward_max_days)
    : provider_(std::move(provider))
    , calendar_(std::move(calendar))
    , clock_(std::move(clock))
    , carry_forward_max_days_(carry_forward_max_days)
{}

std::shared_ptr<ClosePriceCache::SymbolCloses> ClosePriceCache::closes_for(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(symbols_mutex_);
    auto& entry = symbols_[symbol];
    if (!entry) entry = std::make_shared<SymbolCloses>();
    return entry;
}

void ClosePriceCache::ensure_covered(const std::string& symbol, SymbolCloses& closes,
                                     const Date& from, const Date& to) {
    std::optional<Date> first_missing;
    std::optional<Date> last_missing;
    for (Date d = from; d <= to; ++d) {
        if (closes.covered.count(d) == 0) {
            if (!first_missing) first_missing = d;
            last_missing = d;
        }
    }
    if (!first_missing) return;

    auto fetched = provider_->fetch_daily_closes(symbol, *first_missing, *last_missing);
    closes.closes.insert(fetched.begin(), fetched.end());

    Date today = calendar_->trading_date(clock_->now());
    for (Date d = *first_missing; d <= *last_missing && d < today; ++d) {
        closes.covered.insert(d);
    }

    spdlog::debug("Loaded {} closes for {} between {} and {}", fetched.size(), symbol,
                  first_missing->to_string(), last_missing->to_string());
}

void ClosePriceCache::prefetch(const std::string& symbol, const Date& from, const Date& to) {
    auto closes = closes_for(symbol);
    std::lock_guard<std::mutex> lock(closes->mutex);
    try {
        ensure_covered(symbol, *closes, from.add_days(-carry_forward_max_days_), to);
    } catch (const std::exception& e) {
        spdlog::warn("Failed to prefetch closes for {}: {}", symbol, e.what());
    }
}

std::optional<ClosePrice> ClosePriceCache::close_on_or_before(const std::string& symbol, const Date& date) {
    auto closes = closes_for(symbol);
    std::lock_guard<std::mutex> lock(closes->mutex);

    Date window_start = date.add_days(-carry_forward_max_days_);
    ensure_covered(symbol, *closes, window_start, date);

    auto it = closes->closes.upper_bound(date);
    if (it == closes->closes.begin()) {
        return std::nullopt;
    }
    --it;
    if (it->first < window_start) {
        return std::nullopt;
    }

    ClosePrice close;
    close.price = it->second;
    close.price_date = it->first;
    close.substituted = it->first < calendar_->most_recent_trading_day(date);
    if (close.substituted) {
        spdlog::warn("No close for {} on {}, carrying forward {} from {}",
                     symbol, date.to_string(), close.price.to_string(), close.price_date.to_string());
    }
    return close;
}
