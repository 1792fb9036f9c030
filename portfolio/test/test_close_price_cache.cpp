#include <catch2/catch_test_macros.hpp>
#include "../src/close_price_cache.hpp"
#include "fakes.hpp"

TEST_CASE("Close price lookup", "[close_price_cache]") {
    auto provider = std::make_shared<FakeQuoteProvider>();
    auto calendar = std::make_shared<MarketCalendar>();
    auto clock = std::make_shared<ManualClock>(utc(Date(2026, 1, 20), 18));
    ClosePriceCache closes(provider, calendar, clock, 10);

    // Mon 12th to Fri 16th, no close on the 15th.
    provider->set_close("AAPL", Date(2026, 1, 12), Decimal(100));
    provider->set_close("AAPL", Date(2026, 1, 13), Decimal(101));
    provider->set_close("AAPL", Date(2026, 1, 14), Decimal(102));
    provider->set_close("AAPL", Date(2026, 1, 16), Decimal(104));

    SECTION("Exact trading day") {
        auto close = closes.close_on_or_before("AAPL", Date(2026, 1, 14));
        REQUIRE(close.has_value());
        REQUIRE(close->price == Decimal(102));
        REQUIRE(close->price_date == Date(2026, 1, 14));
        REQUIRE_FALSE(close->substituted);
    }

    SECTION("Weekends and holidays use the prior close without substitution") {
        auto saturday = closes.close_on_or_before("AAPL", Date(2026, 1, 17));
        REQUIRE(saturday->price == Decimal(104));
        REQUIRE_FALSE(saturday->substituted);

        auto holiday = closes.close_on_or_before("AAPL", Date(2026, 1, 19));
        REQUIRE(holiday->price_date == Date(2026, 1, 16));
        REQUIRE_FALSE(holiday->substituted);
    }

    SECTION("A missing trading-day close is carried forward and flagged") {
        auto close = closes.close_on_or_before("AAPL", Date(2026, 1, 15));
        REQUIRE(close->price == Decimal(102));
        REQUIRE(close->price_date == Date(2026, 1, 14));
        REQUIRE(close->substituted);
    }

    SECTION("Nothing beyond the carry-forward window") {
        provider->set_close("OLD", Date(2026, 1, 2), Decimal(50));
        REQUIRE_FALSE(closes.close_on_or_before("OLD", Date(2026, 1, 16)).has_value());
        REQUIRE(closes.close_on_or_before("OLD", Date(2026, 1, 12)).has_value());
        REQUIRE_FALSE(closes.close_on_or_before("AAPL", Date(2026, 1, 11)).has_value());
    }

    SECTION("Prefetched ranges are served from memory") {
        closes.prefetch("AAPL", Date(2026, 1, 12), Date(2026, 1, 16));
        REQUIRE(provider->close_calls.load() == 1);

        for (Date d(2026, 1, 12); d <= Date(2026, 1, 16); ++d) {
            closes.close_on_or_before("AAPL", d);
        }
        REQUIRE(provider->close_calls.load() == 1);
    }

    SECTION("Today's close is fetched again on every lookup") {
        closes.close_on_or_before("AAPL", Date(2026, 1, 20));
        closes.close_on_or_before("AAPL", Date(2026, 1, 20));
        REQUIRE(provider->close_calls.load() == 2);

        // Once today's bar exists it is picked up.
        provider->set_close("AAPL", Date(2026, 1, 20), Decimal(106));
        auto close = closes.close_on_or_before("AAPL", Date(2026, 1, 20));
        REQUIRE(close->price == Decimal(106));
        REQUIRE_FALSE(close->substituted);
    }

    SECTION("Provider failures surface on lookup but not on prefetch") {
        provider->set_failing(true);
        REQUIRE_NOTHROW(closes.prefetch("AAPL", Date(2026, 1, 12), Date(2026, 1, 16)));
        REQUIRE_THROWS(closes.close_on_or_before("AAPL", Date(2026, 1, 14)));

        provider->set_failing(false);
        REQUIRE(closes.close_on_or_before("AAPL", Date(2026, 1, 14))->price == Decimal(102));
    }
}
