#include "serialization.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <fmt/format.h>

namespace {

nlohmann::json optional_decimal(const std::optional<Decimal>& value) {
    return value ? nlohmann::json(value->to_string()) : nlohmann::json(nullptr);
}

nlohmann::json optional_date(const std::optional<Date>& value) {
    return value ? nlohmann::json(value->to_string()) : nlohmann::json(nullptr);
}

Decimal parse_decimal_value(const nlohmann::json& value, const char* name) {
    Decimal out;
    if (value.is_string()) {
        if (Decimal::try_parse(value.get<std::string>(), out)) return out;
    } else if (value.is_number_integer()) {
        return Decimal(value.get<int64_t>());
    } else if (value.is_number_float()) {
        if (Decimal::try_parse(fmt::format("{:.8f}", value.get<double>()), out)) return out;
    }
    throw ValidationError(fmt::format("Field '{}' must be a decimal", name));
}

std::optional<int64_t> parse_account(const nlohmann::json& value) {
    if (value.is_null()) return std::nullopt;
    if (!value.is_number_integer()) {
        throw ValidationError("Field 'account_id' must be an integer");
    }
    return value.get<int64_t>();
}

TransactionType parse_type(const nlohmann::json& value) {
    if (!value.is_string()) {
        throw ValidationError("Field 'type' must be BUY or SELL");
    }
    auto type = parse_transaction_type(value.get<std::string>());
    if (!type) {
        throw ValidationError("Field 'type' must be BUY or SELL");
    }
    return *type;
}

std::string string_field(const nlohmann::json& j, const char* name) {
    if (!j.contains(name) || !j[name].is_string()) {
        throw ValidationError(fmt::format("Field '{}' must be a string", name));
    }
    return j[name].get<std::string>();
}

} // namespace

Decimal decimal_field(const nlohmann::json& j, const char* name) {
    if (!j.contains(name)) {
        throw ValidationError(fmt::format("Field '{}' is required", name));
    }
    return parse_decimal_value(j[name], name);
}

Date date_field(const nlohmann::json& j, const char* name) {
    auto text = string_field(j, name);
    auto date = Date::try_parse(text);
    if (!date) {
        throw ValidationError(fmt::format("Field '{}' must be YYYY-MM-DD, got '{}'", name, text));
    }
    return *date;
}

void to_json(nlohmann::json& j, const Transaction& txn) {
    j = nlohmann::json{
        {"id", txn.id},
        {"user_id", txn.user_id},
        {"account_id", txn.account_id ? nlohmann::json(*txn.account_id) : nlohmann::json(nullptr)},
        {"symbol", txn.symbol},
        {"type", to_string(txn.type)},
        {"quantity", txn.quantity.to_string()},
        {"price_per_share", txn.price_per_share.to_string()},
        {"total_cost", txn.effective_total_cost().to_string()},
        {"transaction_date", txn.transaction_date.to_string()},
        {"created_at", util::to_iso8601(txn.created_at)},
        {"notes", txn.notes}
    };
}

void to_json(nlohmann::json& j, const Holding& holding) {
    j = nlohmann::json{
        {"symbol", holding.symbol},
        {"quantity", holding.quantity.to_string()},
        {"average_cost_basis", holding.average_cost_basis.to_string()},
        {"cost_basis", holding.cost_basis().to_string()},
        {"realized_gain", holding.realized_gain.to_string()},
        {"last_recalculated_at", util::to_iso8601(holding.last_recalculated_at)}
    };
}

void to_json(nlohmann::json& j, const PriceCacheEntry& entry) {
    j = nlohmann::json{
        {"symbol", entry.symbol},
        {"price", entry.price.to_string()},
        {"daily_change", entry.daily_change.to_string()},
        {"daily_change_percent", entry.daily_change_percent.to_string()},
        {"company_name", entry.company_name},
        {"fetched_at", util::to_iso8601(entry.fetched_at)},
        {"market_open_when_fetched", entry.market_open_when_fetched},
        {"stale", entry.stale}
    };
}

void to_json(nlohmann::json& j, const BalanceHistoryRecord& record) {
    j = nlohmann::json{
        {"user_id", record.user_id},
        {"account_id", record.account_id},
        {"date", record.date.to_string()},
        {"balance", record.computed_balance.to_string()},
        {"source", to_string(record.source)},
        {"price_substituted", record.price_substituted}
    };
}

void to_json(nlohmann::json& j, const PositionValuation& position) {
    j = nlohmann::json{
        {"symbol", position.symbol},
        {"company_name", position.company_name},
        {"quantity", position.quantity.to_string()},
        {"average_cost_basis", position.average_cost_basis.to_string()},
        {"cost_basis", position.cost_basis.to_string()},
        {"realized_gain", position.realized_gain.to_string()},
        {"price", optional_decimal(position.price)},
        {"market_value", optional_decimal(position.market_value)},
        {"unrealized_gain", optional_decimal(position.unrealized_gain)},
        {"unrealized_gain_percent", optional_decimal(position.unrealized_gain_percent)},
        {"daily_change", optional_decimal(position.daily_change)},
        {"daily_change_percent", optional_decimal(position.daily_change_percent)},
        {"weight_percent", optional_decimal(position.weight_percent)},
        {"stale", position.stale}
    };
}

void to_json(nlohmann::json& j, const PortfolioSummary& summary) {
    j = nlohmann::json{
        {"user_id", summary.user_id},
        {"total_cost_basis", summary.total_cost_basis.to_string()},
        {"total_market_value", summary.total_market_value.to_string()},
        {"total_unrealized_gain", summary.total_unrealized_gain.to_string()},
        {"total_gain_percent", optional_decimal(summary.total_gain_percent)},
        {"realized_gain", summary.realized_gain.to_string()},
        {"daily_change", summary.daily_change.to_string()},
        {"daily_change_percent", optional_decimal(summary.daily_change_percent)},
        {"total_positions", summary.total_positions},
        {"priced_positions", summary.priced_positions},
        {"stale", summary.stale},
        {"market_open", summary.market_open},
        {"as_of", util::to_iso8601(summary.as_of)}
    };
    if (!summary.positions.empty()) {
        j["positions"] = summary.positions;
    }
}

void to_json(nlohmann::json& j, const PerformanceReport& report) {
    j = nlohmann::json{
        {"period", report.period},
        {"start_date", report.start_date.to_string()},
        {"end_date", report.end_date.to_string()},
        {"points", report.points},
        {"first_date", optional_date(report.first_date)},
        {"last_date", optional_date(report.last_date)},
        {"start_value", report.start_value.to_string()},
        {"end_value", report.end_value.to_string()},
        {"change", report.change.to_string()},
        {"change_percent", optional_decimal(report.change_percent)},
        {"net_flow", report.net_flow.to_string()},
        {"adjusted_gain", report.adjusted_gain.to_string()},
        {"adjusted_percent", optional_decimal(report.adjusted_percent)},
        {"price_substituted", report.price_substituted},
        {"backfilled_start", report.backfilled_start}
    };
}

void to_json(nlohmann::json& j, const HistoryPoint& point) {
    j = nlohmann::json{
        {"date", point.date.to_string()},
        {"value", point.value.to_string()},
        {"price_substituted", point.price_substituted}
    };
}

void to_json(nlohmann::json& j, const BackfillResult& result) {
    j = nlohmann::json{
        {"dates_processed", result.dates_processed},
        {"dates_skipped", result.dates_skipped},
        {"records_written", result.records_written},
        {"records_deferred", result.records_deferred},
        {"cancelled", result.cancelled}
    };
}

void to_json(nlohmann::json& j, const JobInfo& job) {
    j = nlohmann::json{
        {"job_id", job.id},
        {"kind", to_string(job.kind)},
        {"status", to_string(job.status)},
        {"start", optional_date(job.start)},
        {"end", optional_date(job.end)},
        {"result", job.result},
        {"error", job.error},
        {"submitted_at", util::to_iso8601(job.submitted_at)},
        {"finished_at", job.finished_at ? nlohmann::json(util::to_iso8601(*job.finished_at))
                                        : nlohmann::json(nullptr)}
    };
}

Transaction transaction_from_json(const nlohmann::json& j, int64_t user_id) {
    if (!j.is_object()) {
        throw ValidationError("Transaction must be an object");
    }

    Transaction txn;
    txn.user_id = user_id;
    txn.symbol = string_field(j, "symbol");
    if (!j.contains("type")) {
        throw ValidationError("Field 'type' is required");
    }
    txn.type = parse_type(j["type"]);
    txn.quantity = decimal_field(j, "quantity");
    txn.price_per_share = decimal_field(j, "price_per_share");
    txn.transaction_date = date_field(j, "transaction_date");

    if (j.contains("account_id")) {
        txn.account_id = parse_account(j["account_id"]);
    }
    if (j.contains("total_cost") && !j["total_cost"].is_null()) {
        txn.total_cost = parse_decimal_value(j["total_cost"], "total_cost");
    }
    if (j.contains("notes") && !j["notes"].is_null()) {
        txn.notes = string_field(j, "notes");
    }
    return txn;
}

TransactionPatch patch_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ValidationError("Patch must be an object");
    }

    TransactionPatch patch;
    if (j.contains("account_id")) patch.account_id.emplace(parse_account(j["account_id"]));
    if (j.contains("symbol")) patch.symbol = string_field(j, "symbol");
    if (j.contains("type")) patch.type = parse_type(j["type"]);
    if (j.contains("quantity")) patch.quantity = decimal_field(j, "quantity");
    if (j.contains("price_per_share")) patch.price_per_share = decimal_field(j, "price_per_share");
    if (j.contains("total_cost")) {
        if (j["total_cost"].is_null()) {
            patch.total_cost.emplace(std::nullopt);
        } else {
            patch.total_cost.emplace(parse_decimal_value(j["total_cost"], "total_cost"));
        }
    }
    if (j.contains("transaction_date")) patch.transaction_date = date_field(j, "transaction_date");
    if (j.contains("notes")) patch.notes = string_field(j, "notes");
    return patch;
}
