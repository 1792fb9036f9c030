#include <catch2/catch_test_macros.hpp>
#include "../src/holdings.hpp"
#include "../src/ledger.hpp"
#include "../src/memory_store.hpp"
#include "../src/errors.hpp"
#include "fakes.hpp"

namespace {

Transaction make_txn(const std::string& symbol, TransactionType type, const std::string& qty,
                     const std::string& price, const Date& date, int64_t id = 0) {
    Transaction txn;
    txn.id = id;
    txn.user_id = 7;
    txn.symbol = symbol;
    txn.type = type;
    txn.quantity = Decimal::parse(qty);
    txn.price_per_share = Decimal::parse(price);
    txn.transaction_date = date;
    return txn;
}

// Appends to the ledger from inside the recalculation's ledger read, so the
// version moves between read and commit.
class ChurningStore : public InMemoryStore {
public:
    std::vector<Transaction> transactions_for_user(int64_t user_id) override {
        auto result = InMemoryStore::transactions_for_user(user_id);
        if (ledger && churns_left > 0 && !inside_) {
            inside_ = true;
            churns_left--;
            ledger->append(make_txn("MSFT", TransactionType::BUY, "1", "300", Date(2026, 1, 2)));
            inside_ = false;
        }
        return result;
    }

    TransactionLedger* ledger = nullptr;
    int churns_left = 0;

private:
    bool inside_ = false;
};

} // namespace

TEST_CASE("Holdings replay", "[holdings]") {
    const auto BUY = TransactionType::BUY;
    const auto SELL = TransactionType::SELL;

    SECTION("Weighted average cost and realized gain") {
        std::vector<Transaction> txns = {
            make_txn("AAPL", BUY, "10", "100", Date(2026, 1, 5), 1),
            make_txn("AAPL", BUY, "20", "115", Date(2026, 1, 6), 2),
            make_txn("AAPL", SELL, "10", "120", Date(2026, 1, 7), 3),
        };
        auto positions = compute_holdings(txns);

        REQUIRE(positions.size() == 1);
        const auto& aapl = positions.at("AAPL");
        REQUIRE(aapl.quantity == Decimal(20));
        REQUIRE(aapl.average_cost_basis == Decimal(110));
        REQUIRE(aapl.realized_gain == Decimal(100));
        REQUIRE(aapl.cost_basis() == Decimal(2200));
    }

    SECTION("Closed positions are dropped") {
        std::vector<Transaction> txns = {
            make_txn("AAPL", BUY, "10", "100", Date(2026, 1, 5), 1),
            make_txn("AAPL", SELL, "10", "90", Date(2026, 1, 6), 2),
            make_txn("MSFT", BUY, "1.5", "300", Date(2026, 1, 6), 3),
        };
        auto positions = compute_holdings(txns);

        REQUIRE(positions.size() == 1);
        REQUIRE(positions.count("MSFT") == 1);
    }

    SECTION("Replay as of a date ignores later transactions") {
        std::vector<Transaction> txns = {
            make_txn("AAPL", BUY, "10", "100", Date(2026, 1, 5), 1),
            make_txn("AAPL", BUY, "10", "200", Date(2026, 1, 9), 2),
        };
        auto positions = compute_holdings(txns, Date(2026, 1, 8));

        REQUIRE(positions.at("AAPL").quantity == Decimal(10));
        REQUIRE(positions.at("AAPL").average_cost_basis == Decimal(100));
        REQUIRE(compute_holdings(txns, Date(2026, 1, 4)).empty());
    }

    SECTION("Oversell names the symbol") {
        std::vector<Transaction> txns = {
            make_txn("AAPL", BUY, "10", "100", Date(2026, 1, 5), 1),
            make_txn("AAPL", SELL, "10.5", "100", Date(2026, 1, 6), 2),
        };
        try {
            compute_holdings(txns);
            FAIL("oversell accepted");
        } catch (const InsufficientHoldingsError& e) {
            REQUIRE(e.symbol() == "AAPL");
        }
    }
}

TEST_CASE("Holdings calculator", "[holdings]") {
    auto store = std::make_shared<ChurningStore>();
    auto clock = std::make_shared<ManualClock>(utc(Date(2026, 1, 20), 18));
    auto ledger = std::make_shared<TransactionLedger>(store, store, store, clock, 1);
    HoldingsCalculator calc(ledger, store, clock, 3);

    ledger->append(make_txn("AAPL", TransactionType::BUY, "10", "100", Date(2026, 1, 5)));
    ledger->append(make_txn("AAPL", TransactionType::BUY, "20", "115", Date(2026, 1, 6)));

    SECTION("Recalculation stores the replayed set") {
        auto positions = calc.recalculate(7);
        REQUIRE(positions.at("AAPL").average_cost_basis == Decimal(110));

        auto stored = store->holdings_for(7);
        REQUIRE(stored.has_value());
        REQUIRE(stored->size() == 1);
        REQUIRE((*stored)[0].quantity == Decimal(30));
    }

    SECTION("Recalculation is idempotent") {
        auto first = calc.recalculate(7);
        auto second = calc.recalculate(7);
        REQUIRE(first.at("AAPL").quantity == second.at("AAPL").quantity);
        REQUIRE(first.at("AAPL").average_cost_basis == second.at("AAPL").average_cost_basis);
        REQUIRE(store->holdings_for(7)->size() == 1);
    }

    SECTION("Current recomputes after invalidation") {
        REQUIRE(calc.current(7).size() == 1);

        ledger->append(make_txn("MSFT", TransactionType::BUY, "2", "300", Date(2026, 1, 7)));
        REQUIRE_FALSE(store->holdings_for(7).has_value());
        REQUIRE(calc.current(7).size() == 2);
    }

    SECTION("Unknown user has no holdings") {
        REQUIRE(calc.current(42).empty());
    }

    SECTION("A concurrent change forces a retry") {
        store->ledger = ledger.get();
        store->churns_left = 1;

        auto positions = calc.recalculate(7);
        REQUIRE(positions.count("MSFT") == 1);
        REQUIRE(store->holdings_for(7)->size() == 2);
    }

    SECTION("Persistent churn gives up with a conflict") {
        store->ledger = ledger.get();
        store->churns_left = 10;

        REQUIRE_THROWS_AS(calc.recalculate(7), RecomputationConflictError);
    }
}
