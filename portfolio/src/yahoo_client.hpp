#pragma once

#include "quote_provider.hpp"
#include "rate_limiter.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

// Yahoo Finance v7 batch quotes and v8 daily chart history. Every outbound
// request goes through the shared rate limiter.
class YahooFinanceClient : public QuoteProvider {
public:
    YahooFinanceClient(const std::string& base_url, int timeout_ms,
                       std::shared_ptr<RateLimiter> limiter);
    ~YahooFinanceClient() override;

    YahooFinanceClient(const YahooFinanceClient&) = delete;
    YahooFinanceClient& operator=(const YahooFinanceClient&) = delete;

    std::map<std::string, Quote> fetch_quotes(const std::vector<std::string>& symbols) override;
    std::map<Date, Decimal> fetch_daily_closes(const std::string& symbol,
                                               const Date& from, const Date& to) override;
    bool is_healthy() override;

    // Daily closes in [from, to] from a v8 chart payload. Malformed or
    // partial payloads yield an empty or shorter map, never an exception.
    static std::map<Date, Decimal> parse_chart_closes(const nlohmann::json& root, const std::string& symbol,
                                                      const Date& from, const Date& to);

private:
    struct Response {
        long status = 0;
        std::string body;
    };

    std::string base_url_;
    int timeout_ms_;
    std::shared_ptr<RateLimiter> limiter_;
    CURL* curl_;
    std::mutex curl_mutex_;
    std::string crumb_;
    bool last_call_ok_ = true;

    static constexpr size_t kMaxSymbolsPerRequest = 50;

    Response perform(const std::string& url);
    nlohmann::json get_json(const std::string& url);
    void ensure_authenticated();
    std::string escape(const std::string& text);
    std::map<std::string, Quote> fetch_quote_chunk(const std::vector<std::string>& symbols);

    static Decimal to_decimal(const nlohmann::json& value);
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
