#pragma once

#include "../src/clock.hpp"
#include "../src/quote_provider.hpp"
#include "../src/date.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

// UTC wall time on a civil date.
inline std::chrono::system_clock::time_point utc(const Date& date, int hour, int minute = 0) {
    return date.to_time_point() + std::chrono::hours(hour) + std::chrono::minutes(minute);
}

class ManualClock : public Clock {
public:
    explicit ManualClock(std::chrono::system_clock::time_point start) : now_(start) {}

    std::chrono::system_clock::time_point now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void set(std::chrono::system_clock::time_point tp) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = tp;
    }

    void advance(std::chrono::system_clock::duration d) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += d;
    }

private:
    mutable std::mutex mutex_;
    std::chrono::system_clock::time_point now_;
};

class FakeQuoteProvider : public QuoteProvider {
public:
    void set_quote(const std::string& symbol, const Decimal& price,
                   const Decimal& change = Decimal(), const std::string& name = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        Quote q;
        q.symbol = symbol;
        q.price = price;
        q.daily_change = change;
        q.company_name = name;
        quotes_[symbol] = q;
    }

    void clear_quote(const std::string& symbol) {
        std::lock_guard<std::mutex> lock(mutex_);
        quotes_.erase(symbol);
    }

    void set_close(const std::string& symbol, const Date& date, const Decimal& price) {
        std::lock_guard<std::mutex> lock(mutex_);
        closes_[symbol][date] = price;
    }

    // History requests for this symbol fail like an unknown ticker would.
    void set_failing_closes(const std::string& symbol) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_closes_.insert(symbol);
    }

    // Runs once, inside the next history request.
    void on_next_close_fetch(std::function<void()> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        close_hook_ = std::move(hook);
    }

    void set_delay(std::chrono::milliseconds delay) { delay_ms_ = delay.count(); }
    void set_failing(bool failing) { failing_ = failing; }

    std::map<std::string, Quote> fetch_quotes(const std::vector<std::string>& symbols) override {
        quote_calls++;
        if (delay_ms_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_.load()));
        }
        if (failing_) {
            throw std::runtime_error("quote endpoint unavailable");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, Quote> result;
        for (const auto& symbol : symbols) {
            requested_.insert(symbol);
            auto it = quotes_.find(symbol);
            if (it != quotes_.end()) result[symbol] = it->second;
        }
        return result;
    }

    std::map<Date, Decimal> fetch_daily_closes(const std::string& symbol,
                                               const Date& from, const Date& to) override {
        close_calls++;
        if (failing_) {
            throw std::runtime_error("chart endpoint unavailable");
        }

        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hook.swap(close_hook_);
            if (failing_closes_.count(symbol) > 0) {
                throw std::runtime_error("HTTP 404 for " + symbol);
            }
        }
        if (hook) hook();

        std::lock_guard<std::mutex> lock(mutex_);
        std::map<Date, Decimal> result;
        auto it = closes_.find(symbol);
        if (it == closes_.end()) return result;
        for (const auto& [date, price] : it->second) {
            if (date >= from && date <= to) result[date] = price;
        }
        return result;
    }

    bool is_healthy() override { return !failing_; }

    std::atomic<int> quote_calls{0};
    std::atomic<int> close_calls{0};

private:
    std::mutex mutex_;
    std::map<std::string, Quote> quotes_;
    std::map<std::string, std::map<Date, Decimal>> closes_;
    std::set<std::string> requested_;
    std::set<std::string> failing_closes_;
    std::function<void()> close_hook_;
    std::atomic<long long> delay_ms_{0};
    std::atomic<bool> failing_{false};
};
