#include <catch2/catch_test_macros.hpp>
#include "../src/ledger.hpp"
#include "../src/memory_store.hpp"
#include "../src/errors.hpp"
#include "fakes.hpp"
#include <tuple>

namespace {

Transaction make_txn(int64_t user_id, const std::string& symbol, TransactionType type,
                     const std::string& qty, const std::string& price, const Date& date) {
    Transaction txn;
    txn.user_id = user_id;
    txn.symbol = symbol;
    txn.type = type;
    txn.quantity = Decimal::parse(qty);
    txn.price_per_share = Decimal::parse(price);
    txn.transaction_date = date;
    return txn;
}

BalanceHistoryRecord balance_row(int64_t user_id, int64_t account_id, const Date& date, int value) {
    BalanceHistoryRecord rec;
    rec.user_id = user_id;
    rec.account_id = account_id;
    rec.date = date;
    rec.computed_balance = Decimal(value);
    return rec;
}

} // namespace

TEST_CASE("Transaction ledger", "[ledger]") {
    auto store = std::make_shared<InMemoryStore>();
    auto clock = std::make_shared<ManualClock>(utc(Date(2026, 1, 20), 18));
    TransactionLedger ledger(store, store, store, clock, 1);

    const auto BUY = TransactionType::BUY;
    const auto SELL = TransactionType::SELL;

    SECTION("Append assigns an id and normalizes the symbol") {
        auto txn = ledger.append(make_txn(7, " aapl ", BUY, "10", "100", Date(2026, 1, 5)));

        REQUIRE(txn.id > 0);
        REQUIRE(txn.symbol == "AAPL");
        REQUIRE(ledger.list(7).size() == 1);
        REQUIRE(ledger.list(7, std::string("aapl")).size() == 1);
        REQUIRE(ledger.list(7, std::string("MSFT")).empty());
        REQUIRE(ledger.account_of(txn) == 1);
    }

    SECTION("Malformed transactions are rejected") {
        REQUIRE_THROWS_AS(ledger.append(make_txn(7, "AAPL", BUY, "0", "100", Date(2026, 1, 5))),
                          ValidationError);
        REQUIRE_THROWS_AS(ledger.append(make_txn(7, "AAPL", BUY, "10", "-1", Date(2026, 1, 5))),
                          ValidationError);
        REQUIRE_THROWS_AS(ledger.append(make_txn(7, "AA PL", BUY, "10", "100", Date(2026, 1, 5))),
                          ValidationError);
        REQUIRE_THROWS_AS(ledger.append(make_txn(7, "ABCDEFGHIJKLMNOP", BUY, "10", "100", Date(2026, 1, 5))),
                          ValidationError);

        auto noisy = make_txn(7, "AAPL", BUY, "10", "100", Date(2026, 1, 5));
        noisy.notes = std::string(501, 'x');
        REQUIRE_THROWS_AS(ledger.append(noisy), ValidationError);

        auto bad_account = make_txn(7, "AAPL", BUY, "10", "100", Date(2026, 1, 5));
        bad_account.account_id = 0;
        REQUIRE_THROWS_AS(ledger.append(bad_account), ValidationError);

        REQUIRE(ledger.list(7).empty());
    }

    SECTION("Future-dated transactions are rejected") {
        REQUIRE_THROWS_AS(ledger.append(make_txn(7, "AAPL", BUY, "1", "100", Date(2026, 1, 21))),
                          ValidationError);
        REQUIRE_NOTHROW(ledger.append(make_txn(7, "AAPL", BUY, "1", "100", Date(2026, 1, 20))));
    }

    SECTION("Oversell leaves the ledger unchanged") {
        ledger.append(make_txn(7, "AAPL", BUY, "10", "100", Date(2026, 1, 5)));
        auto version = ledger.version(7);

        REQUIRE_THROWS_AS(ledger.append(make_txn(7, "AAPL", SELL, "15", "120", Date(2026, 1, 6))),
                          InsufficientHoldingsError);
        REQUIRE(ledger.list(7).size() == 1);
        REQUIRE(ledger.version(7) == version);
    }

    SECTION("Backdated sell before the buy is rejected") {
        ledger.append(make_txn(7, "AAPL", BUY, "10", "100", Date(2026, 1, 10)));
        REQUIRE_THROWS_AS(ledger.append(make_txn(7, "AAPL", SELL, "5", "120", Date(2026, 1, 5))),
                          InsufficientHoldingsError);
    }

    SECTION("Removing a buy that later sells depend on is rejected") {
        auto buy = ledger.append(make_txn(7, "AAPL", BUY, "10", "100", Date(2026, 1, 5)));
        ledger.append(make_txn(7, "AAPL", SELL, "5", "120", Date(2026, 1, 10)));

        REQUIRE_THROWS_AS(ledger.remove(buy.id), InsufficientHoldingsError);
        REQUIRE(ledger.list(7).size() == 2);
    }

    SECTION("Sells are checked per account") {
        auto in_two = make_txn(7, "AAPL", BUY, "10", "100", Date(2026, 1, 5));
        in_two.account_id = 2;
        ledger.append(in_two);

        auto from_three = make_txn(7, "AAPL", SELL, "5", "120", Date(2026, 1, 6));
        from_three.account_id = 3;
        REQUIRE_THROWS_AS(ledger.append(from_three), InsufficientHoldingsError);
    }

    SECTION("Unknown ids are not found") {
        REQUIRE_THROWS_AS(ledger.remove(999), NotFoundError);
        REQUIRE_THROWS_AS(ledger.update(999, TransactionPatch{}), NotFoundError);
        REQUIRE_FALSE(ledger.find(999).has_value());
    }

    SECTION("Update applies the patch and bumps the version") {
        auto txn = ledger.append(make_txn(7, "AAPL", BUY, "10", "100", Date(2026, 1, 5)));
        auto version = ledger.version(7);

        TransactionPatch patch;
        patch.quantity = Decimal(12);
        patch.notes = std::string("corrected");
        auto updated = ledger.update(txn.id, patch);

        REQUIRE(updated.quantity == Decimal(12));
        REQUIRE(updated.notes == "corrected");
        REQUIRE(updated.price_per_share == Decimal(100));
        REQUIRE(ledger.find(txn.id)->quantity == Decimal(12));
        REQUIRE(ledger.version(7) > version);
    }

    SECTION("Mutations drop derived history from the transaction date") {
        for (Date d(2026, 1, 5); d <= Date(2026, 1, 12); ++d) {
            store->write_day(d, {balance_row(7, 1, d, 1000)}, false);
        }
        store->write_day(Date(2026, 1, 9), {balance_row(7, 2, Date(2026, 1, 9), 500)}, false);
        store->write_day(Date(2026, 1, 10), {balance_row(8, 1, Date(2026, 1, 10), 300)}, false);

        ledger.append(make_txn(7, "AAPL", BUY, "1", "100", Date(2026, 1, 8)));

        REQUIRE(store->record({7, 1}, Date(2026, 1, 7)).has_value());
        REQUIRE_FALSE(store->record({7, 1}, Date(2026, 1, 8)).has_value());
        REQUIRE_FALSE(store->record({7, 1}, Date(2026, 1, 12)).has_value());
        REQUIRE(store->record({7, 2}, Date(2026, 1, 9)).has_value());
        REQUIRE(store->record({8, 1}, Date(2026, 1, 10)).has_value());
        REQUIRE(store->history_size() == 5);
    }

    SECTION("Explicit accounts belong to a single user") {
        auto own = make_txn(7, "AAPL", BUY, "10", "100", Date(2026, 1, 5));
        own.account_id = 2;
        ledger.append(own);

        auto intruder = make_txn(8, "AAPL", BUY, "1", "100", Date(2026, 1, 6));
        intruder.account_id = 2;
        REQUIRE_THROWS_AS(ledger.append(intruder), ValidationError);

        auto in_default = make_txn(8, "AAPL", BUY, "1", "100", Date(2026, 1, 6));
        auto other = ledger.append(in_default);
        in_default.account_id = 1;
        REQUIRE_NOTHROW(ledger.append(in_default));

        TransactionPatch patch;
        patch.account_id.emplace(2);
        REQUIRE_THROWS_AS(ledger.update(other.id, patch), ValidationError);
        REQUIRE_FALSE(ledger.find(other.id)->account_id.has_value());

        own.account_id = 2;
        REQUIRE_NOTHROW(ledger.append(own));
    }

    SECTION("Commits across users check every version") {
        ledger.append(make_txn(7, "AAPL", BUY, "1", "100", Date(2026, 1, 5)));
        ledger.append(make_txn(8, "AAPL", BUY, "1", "100", Date(2026, 1, 5)));
        std::map<int64_t, uint64_t> seen{{7, ledger.version(7)}, {8, ledger.version(8)}};

        int runs = 0;
        REQUIRE(ledger.commit_if_unchanged(seen, [&runs]() { runs++; }));

        ledger.append(make_txn(8, "AAPL", BUY, "1", "100", Date(2026, 1, 6)));
        REQUIRE_FALSE(ledger.commit_if_unchanged(seen, [&runs]() { runs++; }));
        REQUIRE(runs == 1);
    }

    SECTION("A snapshot carries the version of every user in it") {
        ledger.append(make_txn(7, "AAPL", BUY, "1", "100", Date(2026, 1, 5)));
        ledger.append(make_txn(7, "AAPL", BUY, "1", "100", Date(2026, 1, 6)));
        ledger.append(make_txn(8, "AAPL", BUY, "1", "100", Date(2026, 1, 5)));

        auto snap = ledger.snapshot();
        REQUIRE(snap.transactions.size() == 3);
        REQUIRE(snap.versions.size() == 2);
        REQUIRE(snap.versions.at(7) == ledger.version(7));
        REQUIRE(snap.versions.at(8) == ledger.version(8));
    }

    SECTION("Mutations invalidate stored holdings") {
        store->replace_holdings(7, {});
        REQUIRE(store->holdings_for(7).has_value());

        ledger.append(make_txn(7, "AAPL", BUY, "1", "100", Date(2026, 1, 8)));
        REQUIRE_FALSE(store->holdings_for(7).has_value());
    }

    SECTION("Listeners see the earliest affected date of each account") {
        std::vector<std::tuple<int64_t, int64_t, Date>> seen;
        ledger.add_listener([&seen](int64_t user_id, int64_t account_id, const Date& from) {
            seen.emplace_back(user_id, account_id, from);
        });

        auto txn = ledger.append(make_txn(7, "AAPL", BUY, "10", "100", Date(2026, 1, 8)));
        REQUIRE(seen.size() == 1);
        REQUIRE(std::get<2>(seen[0]) == Date(2026, 1, 8));

        TransactionPatch patch;
        patch.transaction_date = Date(2026, 1, 3);
        patch.account_id.emplace(4);
        ledger.update(txn.id, patch);

        REQUIRE(seen.size() == 3);
        REQUIRE(std::get<1>(seen[1]) == 1);
        REQUIRE(std::get<1>(seen[2]) == 4);
        REQUIRE(std::get<2>(seen[1]) == Date(2026, 1, 3));
        REQUIRE(std::get<2>(seen[2]) == Date(2026, 1, 3));
    }

    SECTION("A failing listener does not fail the mutation") {
        ledger.add_listener([](int64_t, int64_t, const Date&) {
            throw std::runtime_error("listener down");
        });
        REQUIRE_NOTHROW(ledger.append(make_txn(7, "AAPL", BUY, "1", "100", Date(2026, 1, 8))));
        REQUIRE(ledger.list(7).size() == 1);
    }

    SECTION("Same-day transactions replay in creation order") {
        ledger.append(make_txn(7, "AAPL", BUY, "10", "100", Date(2026, 1, 8)));
        clock->advance(std::chrono::seconds(1));
        ledger.append(make_txn(7, "AAPL", SELL, "10", "110", Date(2026, 1, 8)));

        auto txns = ledger.list(7);
        REQUIRE(txns.size() == 2);
        REQUIRE(txns[0].type == BUY);
        REQUIRE(txns[1].type == SELL);
    }
}
