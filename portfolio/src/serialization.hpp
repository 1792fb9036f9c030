#pragma once

#include "types.hpp"
#include "valuation.hpp"
#include "backfill_queue.hpp"
#include <nlohmann/json.hpp>

// Wire form of engine types. Money and quantities travel as decimal strings.

void to_json(nlohmann::json& j, const Transaction& txn);
void to_json(nlohmann::json& j, const Holding& holding);
void to_json(nlohmann::json& j, const PriceCacheEntry& entry);
void to_json(nlohmann::json& j, const BalanceHistoryRecord& record);
void to_json(nlohmann::json& j, const PositionValuation& position);
void to_json(nlohmann::json& j, const PortfolioSummary& summary);
void to_json(nlohmann::json& j, const PerformanceReport& report);
void to_json(nlohmann::json& j, const HistoryPoint& point);
void to_json(nlohmann::json& j, const BackfillResult& result);
void to_json(nlohmann::json& j, const JobInfo& job);

// Throw ValidationError on missing or malformed fields.
Transaction transaction_from_json(const nlohmann::json& j, int64_t user_id);
TransactionPatch patch_from_json(const nlohmann::json& j);

Decimal decimal_field(const nlohmann::json& j, const char* name);
Date date_field(const nlohmann::json& j, const char* name);
