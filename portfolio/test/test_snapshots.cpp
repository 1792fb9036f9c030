#include <catch2/catch_test_macros.hpp>
#include "../src/snapshots.hpp"
#include "../src/errors.hpp"
#include "engine_fixture.hpp"

TEST_CASE("Historical reconstruction", "[snapshots]") {
    Engine e;
    e.standard_closes();
    e.buy("AAPL", "10", "95", Date(2026, 1, 12));

    SECTION("Backfill values each day at its close") {
        auto result = e.snapshots->backfill(Date(2026, 1, 12), Date(2026, 1, 16));

        REQUIRE(result.dates_processed == 5);
        REQUIRE(result.records_written == 5);
        REQUIRE_FALSE(result.cancelled);
        REQUIRE(e.balance(1, Date(2026, 1, 12)) == Decimal(1000));
        REQUIRE(e.balance(1, Date(2026, 1, 14)) == Decimal(1020));
        REQUIRE(e.balance(1, Date(2026, 1, 16)) == Decimal(1040));

        auto rec = e.row(1, Date(2026, 1, 13));
        REQUIRE(rec->source == SnapshotSource::BACKFILLED);
        REQUIRE_FALSE(rec->price_substituted);
    }

    SECTION("Carried-forward closes are flagged") {
        e.snapshots->backfill(Date(2026, 1, 15), Date(2026, 1, 15));

        auto rec = e.row(1, Date(2026, 1, 15));
        REQUIRE(rec->computed_balance == Decimal(1020));
        REQUIRE(rec->price_substituted);
    }

    SECTION("Backfill is idempotent") {
        e.snapshots->backfill(Date(2026, 1, 12), Date(2026, 1, 16));
        auto again = e.snapshots->backfill(Date(2026, 1, 12), Date(2026, 1, 16));

        REQUIRE(again.records_written == 0);
        REQUIRE(again.dates_skipped == 5);
        REQUIRE(e.store->history_size() == 5);
    }

    SECTION("Days before the first transaction get no rows") {
        auto result = e.snapshots->backfill(Date(2026, 1, 5), Date(2026, 1, 11));
        REQUIRE(result.records_written == 0);
        REQUIRE(e.store->history_size() == 0);
    }

    SECTION("Backfill stops at today and uses the live price for it") {
        auto result = e.snapshots->backfill(Date(2026, 1, 17), Date(2026, 1, 31));

        REQUIRE(result.dates_processed == 4);
        REQUIRE(e.balance(1, Date(2026, 1, 17)) == Decimal(1040));
        REQUIRE(e.balance(1, Date(2026, 1, 19)) == Decimal(1040));
        REQUIRE(e.balance(1, Date(2026, 1, 20)) == Decimal(1100));
        REQUIRE_FALSE(e.row(1, Date(2026, 1, 21)).has_value());
    }

    SECTION("Malformed ranges are rejected") {
        REQUIRE_THROWS_AS(e.snapshots->backfill(Date(2026, 1, 16), Date(2026, 1, 12)), ValidationError);
        REQUIRE_THROWS_AS(e.snapshots->backfill(Date(2026, 1, 21), Date(2026, 1, 25)), ValidationError);
    }

    SECTION("Accounts holding a symbol without any close are deferred") {
        e.buy("ZZZ", "5", "10", Date(2026, 1, 12), 2);
        auto result = e.snapshots->backfill(Date(2026, 1, 13), Date(2026, 1, 13));

        REQUIRE(result.records_written == 1);
        REQUIRE(result.records_deferred == 1);
        REQUIRE_FALSE(e.row(2, Date(2026, 1, 13)).has_value());
        REQUIRE(e.balance(1, Date(2026, 1, 13)) == Decimal(1010));

        // Once closes exist the next fill writes the missing row.
        e.provider->set_close("ZZZ", Date(2026, 1, 20), Decimal(12));
        e.snapshots->fill_missing();
        REQUIRE(e.balance(2, Date(2026, 1, 20)) == Decimal(60));
    }

    SECTION("A failing history request only holds back its own accounts") {
        e.provider->set_failing_closes("BAD");
        e.buy("BAD", "5", "10", Date(2026, 1, 12), 2);

        BackfillResult result;
        REQUIRE_NOTHROW(result = e.snapshots->backfill(Date(2026, 1, 12), Date(2026, 1, 13)));
        REQUIRE(result.records_written == 2);
        REQUIRE(result.records_deferred == 2);
        REQUIRE(e.balance(1, Date(2026, 1, 12)) == Decimal(1000));
        REQUIRE(e.balance(1, Date(2026, 1, 13)) == Decimal(1010));
        REQUIRE_FALSE(e.row(2, Date(2026, 1, 12)).has_value());
    }

    SECTION("Sells reduce the balance from their date") {
        e.sell("AAPL", "4", "102", Date(2026, 1, 14));
        e.snapshots->backfill(Date(2026, 1, 13), Date(2026, 1, 14));

        REQUIRE(e.balance(1, Date(2026, 1, 13)) == Decimal(1010));
        REQUIRE(e.balance(1, Date(2026, 1, 14)) == Decimal(612));
    }

    SECTION("A raised cancel flag stops before the first date") {
        std::atomic<bool> cancel{true};
        auto result = e.snapshots->backfill(Date(2026, 1, 12), Date(2026, 1, 16), &cancel);

        REQUIRE(result.cancelled);
        REQUIRE(result.records_written == 0);
    }
}

TEST_CASE("Missing snapshot fill", "[snapshots]") {
    SECTION("Every calendar day from the first transaction to today") {
        Engine e;
        e.standard_closes();
        e.buy("AAPL", "10", "95", Date(2026, 1, 12));

        auto result = e.snapshots->fill_missing();
        REQUIRE(result.records_written == 9);
        REQUIRE(e.store->history_size() == 9);

        auto again = e.snapshots->fill_missing();
        REQUIRE(again.records_written == 0);
    }

    SECTION("The configured start date is a floor") {
        Engine e(Date(2026, 1, 15));
        e.standard_closes();
        e.buy("AAPL", "10", "95", Date(2026, 1, 12));

        e.snapshots->fill_missing();
        REQUIRE(e.store->history_size() == 6);
        REQUIRE_FALSE(e.row(1, Date(2026, 1, 14)).has_value());
    }

    SECTION("Accounts start at their own first transaction") {
        Engine e;
        e.standard_closes();
        e.buy("AAPL", "10", "95", Date(2026, 1, 12));
        e.buy("AAPL", "1", "95", Date(2026, 1, 14), 2, 8);

        e.snapshots->fill_missing();
        REQUIRE(e.store->history_size() == 16);
        REQUIRE_FALSE(e.row(2, Date(2026, 1, 13), 8).has_value());
        REQUIRE(e.balance(2, Date(2026, 1, 16), 8) == Decimal(104));

        auto accounts = e.snapshots->accounts();
        REQUIRE(accounts.size() == 2);
        REQUIRE(accounts[0] == AccountKey{7, 1});
        REQUIRE(accounts[1] == AccountKey{8, 2});
        REQUIRE(e.snapshots->accounts_for_user(8) == std::vector<int64_t>{2});
    }

    SECTION("Users sharing the default account keep separate balances") {
        Engine e;
        e.standard_closes();
        e.buy("AAPL", "10", "95", Date(2026, 1, 12));
        e.buy("AAPL", "5", "95", Date(2026, 1, 12), std::nullopt, 8);

        e.snapshots->backfill(Date(2026, 1, 12), Date(2026, 1, 16));
        REQUIRE(e.balance(1, Date(2026, 1, 12)) == Decimal(1000));
        REQUIRE(e.balance(1, Date(2026, 1, 12), 8) == Decimal(500));
        REQUIRE(e.store->history_size() == 10);

        e.buy("AAPL", "1", "101", Date(2026, 1, 13), std::nullopt, 8);
        REQUIRE(e.row(1, Date(2026, 1, 13)).has_value());
        REQUIRE_FALSE(e.row(1, Date(2026, 1, 13), 8).has_value());
    }

    SECTION("Removing a transaction rebuilds history from its date") {
        Engine e;
        e.standard_closes();
        e.buy("AAPL", "10", "95", Date(2026, 1, 12));
        auto extra = e.buy("AAPL", "5", "101", Date(2026, 1, 14));

        e.snapshots->fill_missing();
        REQUIRE(e.balance(1, Date(2026, 1, 16)) == Decimal(1560));

        e.ledger->remove(extra.id);
        REQUIRE(e.row(1, Date(2026, 1, 13)).has_value());
        REQUIRE_FALSE(e.row(1, Date(2026, 1, 14)).has_value());

        e.snapshots->fill_missing();
        REQUIRE(e.balance(1, Date(2026, 1, 14)) == Decimal(1020));
        REQUIRE(e.balance(1, Date(2026, 1, 16)) == Decimal(1040));
    }
}

TEST_CASE("Ledger changes during reconstruction", "[snapshots]") {
    Engine e;
    e.standard_closes();
    auto txn = e.buy("AAPL", "10", "95", Date(2026, 1, 12));

    SECTION("Rows computed from a superseded ledger are not kept") {
        e.provider->on_next_close_fetch([&]() { e.ledger->remove(txn.id); });
        auto result = e.snapshots->backfill(Date(2026, 1, 12), Date(2026, 1, 16));

        REQUIRE(e.ledger->all().empty());
        REQUIRE(result.records_written == 0);
        REQUIRE(e.store->history_size() == 0);
    }

    SECTION("Dates after the change use the new ledger") {
        e.provider->on_next_close_fetch([&]() {
            e.buy("AAPL", "5", "101", Date(2026, 1, 13));
        });
        e.snapshots->backfill(Date(2026, 1, 12), Date(2026, 1, 14));

        REQUIRE(e.balance(1, Date(2026, 1, 12)) == Decimal(1000));
        REQUIRE(e.balance(1, Date(2026, 1, 13)) == Decimal(1515));
        REQUIRE(e.balance(1, Date(2026, 1, 14)) == Decimal(1530));
    }
}

TEST_CASE("Snapshot of a single date", "[snapshots]") {
    Engine e;
    e.standard_closes();
    e.buy("AAPL", "10", "95", Date(2026, 1, 12));

    SECTION("Today's row is replaced on every run") {
        REQUIRE(e.snapshots->create_for_date(e.snapshots->today()) == 1);
        REQUIRE(e.balance(1, Date(2026, 1, 20)) == Decimal(1100));

        e.provider->set_quote("AAPL", Decimal(120));
        e.clock->advance(std::chrono::seconds(61));
        REQUIRE(e.snapshots->create_for_date(Date(2026, 1, 20)) == 1);
        REQUIRE(e.balance(1, Date(2026, 1, 20)) == Decimal(1200));
        REQUIRE(e.row(1, Date(2026, 1, 20))->source == SnapshotSource::COMPUTED);
    }

    SECTION("Past rows are never overwritten") {
        e.snapshots->backfill(Date(2026, 1, 14), Date(2026, 1, 14));
        REQUIRE(e.snapshots->create_for_date(Date(2026, 1, 14)) == 0);
        REQUIRE(e.row(1, Date(2026, 1, 14))->source == SnapshotSource::BACKFILLED);
    }

    SECTION("Future dates are rejected") {
        REQUIRE_THROWS_AS(e.snapshots->create_for_date(Date(2026, 1, 21)), ValidationError);
    }
}
