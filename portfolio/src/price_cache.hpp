#pragma once

#include "types.hpp"
#include "clock.hpp"
#include "market_hours.hpp"
#include "quote_provider.hpp"
#include "store.hpp"
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Last-known price per symbol. Stale symbols of one request are refreshed
// through a single batched provider call; a symbol already being refreshed
// by another caller is waited on, never fetched twice.
class PriceCache {
public:
    PriceCache(std::shared_ptr<QuoteProvider> provider,
               std::shared_ptr<Clock> clock,
               std::shared_ptr<MarketCalendar> calendar,
               std::chrono::seconds ttl,
               std::chrono::milliseconds request_deadline,
               std::shared_ptr<PriceMirror> mirror = nullptr);

    // Symbols with no price at all are left out of the result.
    std::map<std::string, PriceCacheEntry> get_prices(const std::vector<std::string>& symbols);

    // Forces a refresh. Throws PriceUnavailableError when the provider has
    // nothing and no earlier value exists.
    PriceCacheEntry refresh(const std::string& symbol);

    std::optional<PriceCacheEntry> cached(const std::string& symbol) const;
    void warm(const std::vector<PriceCacheEntry>& entries);

    bool is_fresh(const PriceCacheEntry& entry) const;
    size_t size() const;

private:
    struct Slot {
        std::mutex mutex;
        std::optional<PriceCacheEntry> entry;
        bool refreshing = false;
        std::shared_future<void> inflight;
    };

    std::shared_ptr<QuoteProvider> provider_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<MarketCalendar> calendar_;
    std::chrono::seconds ttl_;
    std::chrono::milliseconds request_deadline_;
    std::shared_ptr<PriceMirror> mirror_;

    mutable std::shared_mutex slots_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;

    std::shared_ptr<Slot> slot_for(const std::string& symbol);
    std::shared_ptr<Slot> find_slot(const std::string& symbol) const;
    std::map<std::string, PriceCacheEntry> resolve(const std::vector<std::string>& symbols, bool force);
    void mirror_entry(const PriceCacheEntry& entry);
};
