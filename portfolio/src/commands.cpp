#include "commands.hpp"
#include "ledger.hpp"
#include "holdings.hpp"
#include "valuation.hpp"
#include "snapshots.hpp"
#include "backfill_queue.hpp"
#include "serialization.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {

int64_t required_id(const nlohmann::json& args, const char* name) {
    if (!args.contains(name) || !args[name].is_number_integer()) {
        throw ValidationError(fmt::format("Field '{}' must be an integer", name));
    }
    return args[name].get<int64_t>();
}

std::string period_arg(const nlohmann::json& args) {
    if (!args.contains("period")) return "1M";
    if (!args["period"].is_string()) {
        throw ValidationError("Field 'period' must be a string");
    }
    return args["period"].get<std::string>();
}

nlohmann::json error_reply(const std::string& corr_id, const std::string& kind, const std::string& message) {
    return nlohmann::json{
        {"corr_id", corr_id},
        {"ok", false},
        {"error", kind},
        {"message", message},
        {"ts", util::current_iso8601()}
    };
}

} // namespace

CommandRouter::CommandRouter(std::shared_ptr<TransactionLedger> ledger,
                             std::shared_ptr<HoldingsCalculator> holdings,
                             std::shared_ptr<ValuationFacade> valuation,
                             std::shared_ptr<SnapshotReconstructor> snapshots,
                             std::shared_ptr<BackfillQueue> queue)
    : ledger_(std::move(ledger))
    , holdings_(std::move(holdings))
    , valuation_(std::move(valuation))
    , snapshots_(std::move(snapshots))
    , queue_(std::move(queue))
{}

void CommandRouter::audit(const std::string& event, int64_t user_id, const std::string& detail) {
    if (!audit_) return;
    try {
        audit_(nlohmann::json{
            {"event", event},
            {"actor", {{"user_id", user_id}}},
            {"detail", detail},
            {"ts", util::current_iso8601()}
        });
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish audit event {}: {}", event, e.what());
    }
}

CommandRouter::Outcome CommandRouter::dispatch(const std::string& name, int64_t user_id,
                                               const nlohmann::json& args) {
    if (name == "summary") {
        auto summary = valuation_->summary(user_id);
        return {fmt::format("Portfolio value {} across {} positions",
                            summary.total_market_value.to_string(2), summary.total_positions),
                summary};
    }

    if (name == "detailed_summary") {
        auto summary = valuation_->detailed_summary(user_id);
        return {fmt::format("Portfolio value {} across {} positions",
                            summary.total_market_value.to_string(2), summary.total_positions),
                summary};
    }

    if (name == "recalculate") {
        auto positions = holdings_->recalculate(user_id);
        nlohmann::json rows = nlohmann::json::array();
        for (const auto& [symbol, holding] : positions) {
            rows.push_back(holding);
        }
        return {fmt::format("Recalculated {} holdings", positions.size()), rows};
    }

    if (name == "snapshot_today") {
        Date today = snapshots_->today();
        int written = snapshots_->create_for_date(today, SnapshotSource::COMPUTED);
        return {fmt::format("Wrote {} snapshots for {}", written, today.to_string()),
                {{"date", today.to_string()}, {"records_written", written}}};
    }

    if (name == "backfill") {
        Date start = date_field(args, "start");
        Date end = date_field(args, "end");
        int64_t job_id = queue_->submit_backfill(start, end);
        return {fmt::format("Backfill {} to {} queued as job {}", start.to_string(), end.to_string(), job_id),
                {{"job_id", job_id}}};
    }

    if (name == "fill_missing") {
        int64_t job_id = queue_->submit_fill_missing();
        return {fmt::format("Fill-missing queued as job {}", job_id), {{"job_id", job_id}}};
    }

    if (name == "performance") {
        auto report = valuation_->performance(user_id, period_arg(args));
        std::string pct = report.change_percent ? report.change_percent->to_string(2) + "%" : "n/a";
        return {fmt::format("{} change {} ({})", report.period, report.change.to_string(2), pct), report};
    }

    if (name == "history") {
        auto points = valuation_->history(user_id, period_arg(args));
        return {fmt::format("{} history points", points.size()), points};
    }

    if (name == "add_transaction") {
        auto txn = ledger_->append(transaction_from_json(args, user_id));
        audit("transaction_added", user_id,
              fmt::format("id={} {} {} {}", txn.id, to_string(txn.type), txn.quantity.to_string(), txn.symbol));
        return {fmt::format("Recorded {} {} {}", to_string(txn.type), txn.quantity.to_string(), txn.symbol), txn};
    }

    if (name == "update_transaction") {
        int64_t id = required_id(args, "id");
        auto existing = ledger_->find(id);
        if (!existing || existing->user_id != user_id) {
            throw NotFoundError("Transaction " + std::to_string(id) + " not found");
        }
        auto txn = ledger_->update(id, patch_from_json(args));
        audit("transaction_updated", user_id, fmt::format("id={}", id));
        return {fmt::format("Updated transaction {}", id), txn};
    }

    if (name == "remove_transaction") {
        int64_t id = required_id(args, "id");
        auto existing = ledger_->find(id);
        if (!existing || existing->user_id != user_id) {
            throw NotFoundError("Transaction " + std::to_string(id) + " not found");
        }
        auto txn = ledger_->remove(id);
        audit("transaction_removed", user_id, fmt::format("id={} {}", id, txn.symbol));
        return {fmt::format("Removed transaction {}", id), txn};
    }

    if (name == "list_transactions") {
        std::optional<std::string> symbol;
        if (args.contains("symbol") && args["symbol"].is_string()) {
            symbol = args["symbol"].get<std::string>();
        }
        auto txns = ledger_->list(user_id, symbol);
        return {fmt::format("{} transactions", txns.size()), txns};
    }

    if (name == "job_status") {
        int64_t job_id = required_id(args, "job_id");
        auto job = queue_->status(job_id);
        if (!job) {
            throw NotFoundError("Job " + std::to_string(job_id) + " not found");
        }
        return {fmt::format("Job {} is {}", job_id, to_string(job->status)), *job};
    }

    if (name == "cancel_job") {
        int64_t job_id = required_id(args, "job_id");
        bool cancelled = queue_->cancel(job_id);
        return {cancelled ? fmt::format("Job {} cancelled", job_id)
                          : fmt::format("Job {} already finished", job_id),
                {{"job_id", job_id}, {"cancelled", cancelled}}};
    }

    throw ValidationError("Unknown command: " + name);
}

nlohmann::json CommandRouter::handle(const nlohmann::json& cmd) {
    std::string corr_id;
    if (cmd.is_object() && cmd.contains("corr_id") && cmd["corr_id"].is_string()) {
        corr_id = cmd["corr_id"].get<std::string>();
    }

    try {
        if (!cmd.is_object() || !cmd.contains("cmd") || !cmd["cmd"].is_string()) {
            throw ValidationError("Command must be an object with a 'cmd' string");
        }
        std::string name = cmd["cmd"].get<std::string>();

        if (!cmd.contains("from") || !cmd["from"].is_object()) {
            throw ValidationError("Command is missing 'from'");
        }
        int64_t user_id = required_id(cmd["from"], "user_id");
        if (user_id <= 0) {
            throw ValidationError("User id must be positive");
        }

        nlohmann::json args = cmd.contains("args") && cmd["args"].is_object() ? cmd["args"]
                                                                              : nlohmann::json::object();

        auto outcome = dispatch(name, user_id, args);
        spdlog::info("Processed {} for user {}", name, user_id);

        return nlohmann::json{
            {"corr_id", corr_id},
            {"ok", true},
            {"message", outcome.message},
            {"data", outcome.data},
            {"ts", util::current_iso8601()}
        };

    } catch (const ValidationError& e) {
        spdlog::warn("Rejected command {}: {}", corr_id, e.what());
        return error_reply(corr_id, "validation", e.what());
    } catch (const InsufficientHoldingsError& e) {
        spdlog::warn("Rejected command {}: {}", corr_id, e.what());
        return error_reply(corr_id, "insufficient_holdings", e.what());
    } catch (const NotFoundError& e) {
        return error_reply(corr_id, "not_found", e.what());
    } catch (const PriceUnavailableError& e) {
        return error_reply(corr_id, "price_unavailable", e.what());
    } catch (const RecomputationConflictError& e) {
        spdlog::error("Command {} hit a recomputation conflict: {}", corr_id, e.what());
        return error_reply(corr_id, "conflict", e.what());
    } catch (const nlohmann::json::exception& e) {
        return error_reply(corr_id, "validation", e.what());
    } catch (const std::exception& e) {
        spdlog::error("Failed to handle command {}: {}", corr_id, e.what());
        return error_reply(corr_id, "internal", e.what());
    }
}
