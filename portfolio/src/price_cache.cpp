#include "price_cache.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>

PriceCache::PriceCache(std::shared_ptr<QuoteProvider> provider,
                       std::shared_ptr<Clock> clock,
                       std::shared_ptr<MarketCalendar> calendar,
                       std::chrono::seconds ttl,
                       std::chrono::milliseconds request_deadline,
                       std::shared_ptr<PriceMirror> mirror)
    : provider_(std::move(provider))
    , clock_(std::move(clock))
    , calendar_(std::move(calendar))
    , ttl_(ttl)
    , request_deadline_(request_deadline)
    , mirror_(std::move(mirror))
{}

std::shared_ptr<PriceCache::Slot> PriceCache::find_slot(const std::string& symbol) const {
    std::shared_lock<std::shared_mutex> lock(slots_mutex_);
    auto it = slots_.find(symbol);
    return it == slots_.end() ? nullptr : it->second;
}

std::shared_ptr<PriceCache::Slot> PriceCache::slot_for(const std::string& symbol) {
    if (auto slot = find_slot(symbol)) {
        return slot;
    }
    std::unique_lock<std::shared_mutex> lock(slots_mutex_);
    auto& slot = slots_[symbol];
    if (!slot) slot = std::make_shared<Slot>();
    return slot;
}

bool PriceCache::is_fresh(const PriceCacheEntry& entry) const {
    if (!entry.price.is_positive() || entry.stale) {
        return false;
    }

    auto now = clock_->now();
    if (calendar_->is_open_for(entry.symbol, now)) {
        return now - entry.fetched_at < ttl_;
    }
    // Closed: a price taken after the last close holds until the next open.
    return entry.fetched_at >= calendar_->last_close(now);
}

void PriceCache::mirror_entry(const PriceCacheEntry& entry) {
    if (!mirror_) return;
    try {
        mirror_->save_price(entry);
    } catch (const std::exception& e) {
        spdlog::warn("Failed to mirror price for {}: {}", entry.symbol, e.what());
    }
}

std::map<std::string, PriceCacheEntry> PriceCache::resolve(const std::vector<std::string>& symbols,
                                                           bool force) {
    std::set<std::string> wanted;
    for (const auto& symbol : symbols) {
        auto normalized = util::to_upper(util::trim(symbol));
        if (!normalized.empty()) wanted.insert(normalized);
    }

    std::map<std::string, PriceCacheEntry> result;
    std::vector<std::string> to_fetch;
    std::vector<std::shared_ptr<std::promise<void>>> promises;
    std::vector<std::pair<std::string, std::shared_future<void>>> to_wait;

    for (const auto& symbol : wanted) {
        auto slot = slot_for(symbol);
        std::lock_guard<std::mutex> lock(slot->mutex);

        if (!force && slot->entry && is_fresh(*slot->entry)) {
            result[symbol] = *slot->entry;
        } else if (slot->refreshing) {
            to_wait.emplace_back(symbol, slot->inflight);
        } else {
            auto promise = std::make_shared<std::promise<void>>();
            slot->refreshing = true;
            slot->inflight = promise->get_future().share();
            to_fetch.push_back(symbol);
            promises.push_back(promise);
        }
    }

    if (!to_fetch.empty()) {
        std::map<std::string, Quote> quotes;
        try {
            quotes = provider_->fetch_quotes(to_fetch);
        } catch (const std::exception& e) {
            spdlog::error("Price refresh for {} symbols failed: {}", to_fetch.size(), e.what());
        }

        auto now = clock_->now();
        std::vector<PriceCacheEntry> refreshed;

        for (size_t i = 0; i < to_fetch.size(); i++) {
            const auto& symbol = to_fetch[i];
            auto slot = slot_for(symbol);
            {
                std::lock_guard<std::mutex> lock(slot->mutex);
                auto it = quotes.find(symbol);
                if (it != quotes.end()) {
                    PriceCacheEntry entry;
                    entry.symbol = symbol;
                    entry.price = it->second.price;
                    entry.daily_change = it->second.daily_change;
                    entry.daily_change_percent = it->second.daily_change_percent;
                    entry.company_name = it->second.company_name;
                    entry.fetched_at = now;
                    entry.market_open_when_fetched = calendar_->is_open_for(symbol, now);
                    entry.stale = false;
                    slot->entry = entry;
                    refreshed.push_back(entry);
                } else if (slot->entry) {
                    slot->entry->stale = true;
                    spdlog::warn("No fresh price for {}, serving last known value from {}",
                                 symbol, util::to_iso8601(slot->entry->fetched_at));
                }

                if (slot->entry) {
                    result[symbol] = *slot->entry;
                }
                slot->refreshing = false;
            }
            promises[i]->set_value();
        }

        for (const auto& entry : refreshed) {
            mirror_entry(entry);
        }
    }

    if (!to_wait.empty()) {
        auto deadline = std::chrono::steady_clock::now() + request_deadline_;
        for (const auto& [symbol, inflight] : to_wait) {
            bool completed = inflight.wait_until(deadline) == std::future_status::ready;

            auto slot = slot_for(symbol);
            std::lock_guard<std::mutex> lock(slot->mutex);
            if (!slot->entry) continue;

            PriceCacheEntry entry = *slot->entry;
            if (!completed) {
                entry.stale = true;
                spdlog::warn("Refresh of {} still running after {}ms, serving last known value",
                             symbol, request_deadline_.count());
            }
            result[symbol] = entry;
        }
    }

    for (const auto& symbol : wanted) {
        if (result.find(symbol) == result.end()) {
            spdlog::warn("No price available for {}", symbol);
        }
    }

    return result;
}

std::map<std::string, PriceCacheEntry> PriceCache::get_prices(const std::vector<std::string>& symbols) {
    return resolve(symbols, false);
}

PriceCacheEntry PriceCache::refresh(const std::string& symbol) {
    auto normalized = util::to_upper(util::trim(symbol));
    auto result = resolve({normalized}, true);
    auto it = result.find(normalized);
    if (it == result.end()) {
        throw PriceUnavailableError(normalized);
    }
    return it->second;
}

std::optional<PriceCacheEntry> PriceCache::cached(const std::string& symbol) const {
    auto slot = find_slot(util::to_upper(util::trim(symbol)));
    if (!slot) return std::nullopt;
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->entry;
}

void PriceCache::warm(const std::vector<PriceCacheEntry>& entries) {
    int loaded = 0;
    for (const auto& entry : entries) {
        if (entry.symbol.empty() || !entry.price.is_positive()) continue;

        auto slot = slot_for(entry.symbol);
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (!slot->entry || slot->entry->fetched_at < entry.fetched_at) {
            slot->entry = entry;
            loaded++;
        }
    }
    spdlog::info("Warmed price cache with {} entries", loaded);
}

size_t PriceCache::size() const {
    std::shared_lock<std::shared_mutex> lock(slots_mutex_);
    return slots_.size();
}
