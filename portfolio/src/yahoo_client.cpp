#include "yahoo_client.hpp"
#include "market_hours.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <stdexcept>

namespace {

constexpr const char* kUserAgent =
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0 Safari/537.36";

// indicators.quote[0].close of a chart result, or nullptr when absent.
const nlohmann::json* close_series(const nlohmann::json& result) {
    auto indicators = result.find("indicators");
    if (indicators == result.end() || !indicators->is_object()) return nullptr;
    auto quote = indicators->find("quote");
    if (quote == indicators->end() || !quote->is_array() || quote->empty()) return nullptr;
    const auto& first = quote->front();
    if (!first.is_object()) return nullptr;
    auto close = first.find("close");
    if (close == first.end() || !close->is_array()) return nullptr;
    return &*close;
}

} // namespace

YahooFinanceClient::YahooFinanceClient(const std::string& base_url, int timeout_ms,
                                       std::shared_ptr<RateLimiter> limiter)
    : base_url_(base_url)
    , timeout_ms_(timeout_ms)
    , limiter_(std::move(limiter))
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL for Yahoo Finance");
    }

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    // Empty file name turns on the in-memory cookie engine.
    curl_easy_setopt(curl_, CURLOPT_COOKIEFILE, "");
}

YahooFinanceClient::~YahooFinanceClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t YahooFinanceClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

std::string YahooFinanceClient::escape(const std::string& text) {
    char* escaped = curl_easy_escape(curl_, text.c_str(), static_cast<int>(text.size()));
    if (!escaped) {
        throw std::runtime_error("Failed to URL-encode " + text);
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

// Caller holds curl_mutex_.
YahooFinanceClient::Response YahooFinanceClient::perform(const std::string& url) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);
    if (!limiter_->acquire_until(deadline)) {
        throw std::runtime_error("Yahoo Finance rate limit reached");
    }

    Response response;
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        last_call_ok_ = false;
        throw std::runtime_error(fmt::format("Yahoo request failed: {}", curl_easy_strerror(res)));
    }
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

void YahooFinanceClient::ensure_authenticated() {
    if (!crumb_.empty()) return;

    spdlog::info("Authenticating with Yahoo Finance");
    // fc.yahoo.com answers 404 but sets the session cookie.
    perform("https://fc.yahoo.com");

    auto crumb = perform(base_url_ + "/v1/test/getcrumb");
    if (crumb.status == 200 && !crumb.body.empty()) {
        crumb_ = util::trim(crumb.body);
        spdlog::info("Obtained Yahoo Finance crumb");
    } else {
        spdlog::warn("Failed to obtain Yahoo Finance crumb (HTTP {})", crumb.status);
    }
}

nlohmann::json YahooFinanceClient::get_json(const std::string& url) {
    std::string full_url = url;
    if (!crumb_.empty()) {
        full_url += "&crumb=" + escape(crumb_);
    }

    auto response = perform(full_url);
    if (response.status == 401 || response.status == 403) {
        spdlog::warn("Yahoo Finance returned {}, clearing credentials", response.status);
        crumb_.clear();
        last_call_ok_ = false;
        throw std::runtime_error(fmt::format("Yahoo Finance unauthorized (HTTP {})", response.status));
    }
    if (response.status == 429) {
        last_call_ok_ = false;
        throw std::runtime_error("Yahoo Finance rate limited (HTTP 429)");
    }
    if (response.status >= 400) {
        last_call_ok_ = false;
        throw std::runtime_error(fmt::format("Yahoo Finance HTTP {}", response.status));
    }

    try {
        auto json = nlohmann::json::parse(response.body);
        last_call_ok_ = true;
        return json;
    } catch (const std::exception& e) {
        last_call_ok_ = false;
        spdlog::error("Failed to parse Yahoo Finance response: {}", e.what());
        throw;
    }
}

Decimal YahooFinanceClient::to_decimal(const nlohmann::json& value) {
    if (!value.is_number()) {
        throw std::invalid_argument("Expected a numeric value");
    }
    return Decimal::parse(fmt::format("{:.8f}", value.get<double>()));
}

std::map<std::string, Quote> YahooFinanceClient::fetch_quote_chunk(const std::vector<std::string>& symbols) {
    std::string joined;
    for (const auto& symbol : symbols) {
        if (!joined.empty()) joined += ",";
        joined += escape(symbol);
    }

    auto root = get_json(base_url_ + "/v7/finance/quote?symbols=" + joined);

    std::map<std::string, Quote> quotes;
    if (!root.contains("quoteResponse") || !root["quoteResponse"].contains("result") ||
        !root["quoteResponse"]["result"].is_array()) {
        spdlog::warn("Yahoo Finance quote response had no results");
        return quotes;
    }

    for (const auto& item : root["quoteResponse"]["result"]) {
        try {
            if (!item.contains("symbol") || !item.contains("regularMarketPrice")) continue;

            Quote quote;
            quote.symbol = util::to_upper(item["symbol"].get<std::string>());
            quote.price = to_decimal(item["regularMarketPrice"]);
            if (item.contains("regularMarketChange")) {
                quote.daily_change = to_decimal(item["regularMarketChange"]);
            }
            if (item.contains("regularMarketChangePercent")) {
                quote.daily_change_percent = to_decimal(item["regularMarketChangePercent"]);
            }
            quote.company_name = item.value("shortName", item.value("longName", quote.symbol));

            if (!quote.price.is_positive()) continue;
            quotes[quote.symbol] = quote;
        } catch (const std::exception& e) {
            spdlog::warn("Skipping malformed Yahoo Finance quote: {}", e.what());
        }
    }
    return quotes;
}

std::map<std::string, Quote> YahooFinanceClient::fetch_quotes(const std::vector<std::string>& symbols) {
    std::map<std::string, Quote> quotes;
    if (symbols.empty()) return quotes;

    std::lock_guard<std::mutex> lock(curl_mutex_);
    ensure_authenticated();

    for (size_t i = 0; i < symbols.size(); i += kMaxSymbolsPerRequest) {
        auto last = std::min(symbols.size(), i + kMaxSymbolsPerRequest);
        std::vector<std::string> chunk(symbols.begin() + i, symbols.begin() + last);
        auto part = fetch_quote_chunk(chunk);
        quotes.insert(part.begin(), part.end());
    }

    spdlog::debug("Fetched {}/{} quotes from Yahoo Finance", quotes.size(), symbols.size());
    return quotes;
}

std::map<Date, Decimal> YahooFinanceClient::fetch_daily_closes(const std::string& symbol,
                                                               const Date& from, const Date& to) {
    auto period1 = std::chrono::duration_cast<std::chrono::seconds>(
        from.to_time_point().time_since_epoch()).count();
    auto period2 = std::chrono::duration_cast<std::chrono::seconds>(
        to.add_days(1).to_time_point().time_since_epoch()).count();

    std::lock_guard<std::mutex> lock(curl_mutex_);
    ensure_authenticated();

    auto root = get_json(fmt::format("{}/v8/finance/chart/{}?period1={}&period2={}&interval=1d&events=history",
                                     base_url_, escape(symbol), period1, period2));
    return parse_chart_closes(root, symbol, from, to);
}

std::map<Date, Decimal> YahooFinanceClient::parse_chart_closes(const nlohmann::json& root,
                                                               const std::string& symbol,
                                                               const Date& from, const Date& to) {
    std::map<Date, Decimal> closes;

    auto chart = root.find("chart");
    if (chart == root.end() || !chart->is_object()) {
        spdlog::warn("No chart in history response for {}", symbol);
        return closes;
    }
    auto results = chart->find("result");
    if (results == chart->end() || !results->is_array() || results->empty()) {
        spdlog::warn("No chart result for {}", symbol);
        return closes;
    }

    const auto& result = results->front();
    auto timestamps = result.find("timestamp");
    const nlohmann::json* close_values = close_series(result);
    if (timestamps == result.end() || !timestamps->is_array() || close_values == nullptr) {
        spdlog::warn("No historical data points for {} between {} and {}",
                     symbol, from.to_string(), to.to_string());
        return closes;
    }

    for (size_t i = 0; i < timestamps->size() && i < close_values->size(); i++) {
        const auto& stamp = (*timestamps)[i];
        const auto& value = (*close_values)[i];
        if (!stamp.is_number_integer() || !value.is_number()) continue;

        auto tp = std::chrono::system_clock::time_point(std::chrono::seconds(stamp.get<int64_t>()));
        Date day = Date::from_time_point(tp, MarketCalendar::eastern_offset_minutes(tp));
        if (day < from || day > to) continue;
        closes[day] = to_decimal(value);
    }

    spdlog::debug("Fetched {} daily closes for {}", closes.size(), symbol);
    return closes;
}

bool YahooFinanceClient::is_healthy() {
    std::lock_guard<std::mutex> lock(curl_mutex_);
    return last_call_ok_;
}
