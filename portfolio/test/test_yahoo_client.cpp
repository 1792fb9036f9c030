#include <catch2/catch_test_macros.hpp>
#include "../src/yahoo_client.hpp"

namespace {

// 09:30 New York on Mon 12th, Tue 13th and Wed 14th January 2026.
const int64_t kMon = 1768228200;
const int64_t kTue = 1768314600;
const int64_t kWed = 1768401000;

nlohmann::json chart_with(const nlohmann::json& result) {
    nlohmann::json root;
    root["chart"]["result"] = nlohmann::json::array({result});
    return root;
}

} // namespace

TEST_CASE("Yahoo Finance chart parsing", "[yahoo]") {
    Date from(2026, 1, 12);
    Date to(2026, 1, 14);

    SECTION("One close per day, null points skipped") {
        nlohmann::json quote;
        quote["close"] = {100.5, nullptr, 102.25};
        nlohmann::json result;
        result["timestamp"] = {kMon, kTue, kWed};
        result["indicators"]["quote"] = nlohmann::json::array({quote});

        auto closes = YahooFinanceClient::parse_chart_closes(chart_with(result), "AAPL", from, to);
        REQUIRE(closes.size() == 2);
        REQUIRE(closes.at(Date(2026, 1, 12)) == Decimal::parse("100.5"));
        REQUIRE(closes.at(Date(2026, 1, 14)) == Decimal::parse("102.25"));
    }

    SECTION("Points outside the range are dropped") {
        nlohmann::json quote;
        quote["close"] = {100.5, 101, 102.25};
        nlohmann::json result;
        result["timestamp"] = {kMon, kTue, kWed};
        result["indicators"]["quote"] = nlohmann::json::array({quote});

        auto closes = YahooFinanceClient::parse_chart_closes(chart_with(result), "AAPL",
                                                             Date(2026, 1, 13), Date(2026, 1, 13));
        REQUIRE(closes.size() == 1);
        REQUIRE(closes.at(Date(2026, 1, 13)) == Decimal(101));
    }

    SECTION("Incomplete payloads give no closes") {
        nlohmann::json result;
        result["timestamp"] = {kMon};

        result["indicators"] = nlohmann::json::object();
        REQUIRE(YahooFinanceClient::parse_chart_closes(chart_with(result), "AAPL", from, to).empty());

        result["indicators"]["quote"] = nlohmann::json::array();
        REQUIRE(YahooFinanceClient::parse_chart_closes(chart_with(result), "AAPL", from, to).empty());

        nlohmann::json no_close;
        no_close["open"] = {99.0};
        result["indicators"]["quote"] = nlohmann::json::array({no_close});
        REQUIRE(YahooFinanceClient::parse_chart_closes(chart_with(result), "AAPL", from, to).empty());

        result["indicators"] = "none";
        REQUIRE(YahooFinanceClient::parse_chart_closes(chart_with(result), "AAPL", from, to).empty());

        nlohmann::json null_result;
        null_result["chart"]["result"] = nullptr;
        REQUIRE(YahooFinanceClient::parse_chart_closes(null_result, "AAPL", from, to).empty());
        REQUIRE(YahooFinanceClient::parse_chart_closes(nlohmann::json::array(), "AAPL", from, to).empty());
    }

    SECTION("Malformed points are skipped") {
        nlohmann::json quote;
        quote["close"] = {"n/a", 101};
        nlohmann::json result;
        result["timestamp"] = {kMon, "tomorrow"};
        result["indicators"]["quote"] = nlohmann::json::array({quote});

        REQUIRE(YahooFinanceClient::parse_chart_closes(chart_with(result), "AAPL", from, to).empty());
    }
}
