#include <catch2/catch_test_macros.hpp>
#include "../src/commands.hpp"
#include "../src/valuation.hpp"
#include "../src/backfill_queue.hpp"
#include "engine_fixture.hpp"

using namespace std::chrono_literals;

namespace {

struct Router : Engine {
    std::shared_ptr<ValuationFacade> valuation;
    std::shared_ptr<BackfillQueue> queue;
    std::shared_ptr<CommandRouter> router;
    std::vector<nlohmann::json> audits;

    Router() {
        valuation = std::make_shared<ValuationFacade>(ledger, holdings, prices, snapshots,
                                                      store, calendar, clock);
        queue = std::make_shared<BackfillQueue>(snapshots);
        router = std::make_shared<CommandRouter>(ledger, holdings, valuation, snapshots, queue);
        router->set_audit_sink([this](const nlohmann::json& event) { audits.push_back(event); });
    }

    ~Router() { queue->shutdown(); }

    nlohmann::json send(const std::string& cmd, nlohmann::json args = nlohmann::json::object(),
                        int64_t user_id = 7) {
        return router->handle({
            {"corr_id", "c-" + cmd},
            {"cmd", cmd},
            {"from", {{"user_id", user_id}}},
            {"args", args}
        });
    }
};

nlohmann::json aapl_buy(const std::string& qty, const std::string& date) {
    return {
        {"symbol", "aapl"},
        {"type", "BUY"},
        {"quantity", qty},
        {"price_per_share", "100"},
        {"transaction_date", date}
    };
}

} // namespace

TEST_CASE("Command routing", "[commands]") {
    Router r;
    r.standard_closes();

    SECTION("Adding a transaction replies with the stored row and audits it") {
        auto reply = r.send("add_transaction", aapl_buy("10", "2026-01-12"));

        REQUIRE(reply["ok"] == true);
        REQUIRE(reply["corr_id"] == "c-add_transaction");
        REQUIRE(reply["data"]["symbol"] == "AAPL");
        REQUIRE(reply["data"]["quantity"] == "10");
        REQUIRE(reply["data"]["total_cost"] == "1000");
        REQUIRE(r.audits.size() == 1);
        REQUIRE(r.audits[0]["event"] == "transaction_added");
        REQUIRE(r.audits[0]["actor"]["user_id"] == 7);
    }

    SECTION("Numeric JSON values are accepted for amounts") {
        auto args = aapl_buy("10", "2026-01-12");
        args["quantity"] = 2.5;
        args["price_per_share"] = 100;
        auto reply = r.send("add_transaction", args);

        REQUIRE(reply["ok"] == true);
        REQUIRE(reply["data"]["quantity"] == "2.5");
    }

    SECTION("Validation failures") {
        auto args = aapl_buy("10", "2026-01-12");
        args["type"] = "HOLD";
        auto reply = r.send("add_transaction", args);
        REQUIRE(reply["ok"] == false);
        REQUIRE(reply["error"] == "validation");

        reply = r.send("add_transaction", aapl_buy("10", "12/01/2026"));
        REQUIRE(reply["error"] == "validation");

        reply = r.send("add_transaction", aapl_buy("-1", "2026-01-12"));
        REQUIRE(reply["error"] == "validation");

        reply = r.send("add_transaction", aapl_buy("1", "2026-02-01"));
        REQUIRE(reply["error"] == "validation");

        REQUIRE(r.send("performance", {{"period", "2W"}})["error"] == "validation");
        REQUIRE(r.send("teleport")["error"] == "validation");
        REQUIRE(r.audits.empty());
    }

    SECTION("Malformed envelopes") {
        auto reply = r.router->handle({{"corr_id", "x1"}, {"cmd", "summary"}});
        REQUIRE(reply["error"] == "validation");
        REQUIRE(reply["corr_id"] == "x1");

        reply = r.router->handle({{"corr_id", 5}, {"cmd", "summary"}, {"from", {{"user_id", "7"}}}});
        REQUIRE(reply["error"] == "validation");
        REQUIRE(reply["corr_id"] == "");

        reply = r.router->handle(nlohmann::json::array());
        REQUIRE(reply["ok"] == false);
    }

    SECTION("Overselling is reported distinctly") {
        r.send("add_transaction", aapl_buy("10", "2026-01-12"));
        auto sell = aapl_buy("11", "2026-01-13");
        sell["type"] = "SELL";

        auto reply = r.send("add_transaction", sell);
        REQUIRE(reply["ok"] == false);
        REQUIRE(reply["error"] == "insufficient_holdings");
        REQUIRE(r.send("list_transactions")["data"].size() == 1);
    }

    SECTION("Other users' transactions are not found") {
        auto added = r.send("add_transaction", aapl_buy("10", "2026-01-12"));
        int64_t id = added["data"]["id"].get<int64_t>();

        auto reply = r.send("remove_transaction", {{"id", id}}, 8);
        REQUIRE(reply["error"] == "not_found");
        reply = r.send("update_transaction", {{"id", id}, {"quantity", "1"}}, 8);
        REQUIRE(reply["error"] == "not_found");
        REQUIRE(r.send("remove_transaction", {{"id", 12345}})["error"] == "not_found");
    }

    SECTION("Update and remove") {
        auto added = r.send("add_transaction", aapl_buy("10", "2026-01-12"));
        int64_t id = added["data"]["id"].get<int64_t>();

        auto updated = r.send("update_transaction", {{"id", id}, {"quantity", "12"}, {"notes", "fix"}});
        REQUIRE(updated["ok"] == true);
        REQUIRE(updated["data"]["quantity"] == "12");
        REQUIRE(updated["data"]["notes"] == "fix");

        auto removed = r.send("remove_transaction", {{"id", id}});
        REQUIRE(removed["ok"] == true);
        REQUIRE(r.send("list_transactions")["data"].empty());
        REQUIRE(r.audits.size() == 3);
        REQUIRE(r.audits[2]["event"] == "transaction_removed");
    }

    SECTION("Listing filters by symbol") {
        r.send("add_transaction", aapl_buy("10", "2026-01-12"));
        auto msft = aapl_buy("1", "2026-01-13");
        msft["symbol"] = "MSFT";
        r.send("add_transaction", msft);

        REQUIRE(r.send("list_transactions")["data"].size() == 2);
        REQUIRE(r.send("list_transactions", {{"symbol", "msft"}})["data"].size() == 1);
    }

    SECTION("Summaries and recalculation") {
        r.send("add_transaction", aapl_buy("10", "2026-01-12"));

        auto summary = r.send("summary");
        REQUIRE(summary["ok"] == true);
        REQUIRE(summary["data"]["total_market_value"] == "1100");
        REQUIRE_FALSE(summary["data"].contains("positions"));

        auto detailed = r.send("detailed_summary");
        REQUIRE(detailed["data"]["positions"].size() == 1);
        REQUIRE(detailed["data"]["positions"][0]["weight_percent"] == "100");

        auto recalc = r.send("recalculate");
        REQUIRE(recalc["data"].size() == 1);
        REQUIRE(recalc["data"][0]["average_cost_basis"] == "100");
    }

    SECTION("Snapshot, history and performance") {
        r.send("add_transaction", aapl_buy("10", "2026-01-12"));

        auto snap = r.send("snapshot_today");
        REQUIRE(snap["data"]["date"] == "2026-01-20");
        REQUIRE(snap["data"]["records_written"] == 1);

        auto perf = r.send("performance");
        REQUIRE(perf["ok"] == true);
        REQUIRE(perf["data"]["period"] == "1M");

        auto history = r.send("history", {{"period", "ALL"}});
        REQUIRE(history["ok"] == true);
        REQUIRE(history["data"].is_array());
    }

    SECTION("Backfill jobs through the queue") {
        r.send("add_transaction", aapl_buy("10", "2026-01-12"));

        auto queued = r.send("backfill", {{"start", "2026-01-12"}, {"end", "2026-01-16"}});
        REQUIRE(queued["ok"] == true);
        int64_t job_id = queued["data"]["job_id"].get<int64_t>();
        REQUIRE(r.queue->wait(job_id, 3000ms));

        auto status = r.send("job_status", {{"job_id", job_id}});
        REQUIRE(status["data"]["status"] == "DONE");
        REQUIRE(status["data"]["result"]["records_written"] == 5);

        auto cancel = r.send("cancel_job", {{"job_id", job_id}});
        REQUIRE(cancel["data"]["cancelled"] == false);

        REQUIRE(r.send("job_status", {{"job_id", 999}})["error"] == "not_found");
        REQUIRE(r.send("cancel_job", {{"job_id", 999}})["error"] == "not_found");
        REQUIRE(r.send("backfill", {{"start", "2026-01-16"}, {"end", "2026-01-12"}})["error"] == "validation");
        REQUIRE(r.send("fill_missing")["ok"] == true);
    }
}
