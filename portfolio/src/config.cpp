#include "config.hpp"
#include "date.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

int64_t Config::get_env_int64(const char* name, int64_t default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoll(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_req = get_env("STREAM_REQ", "folio.cmd.requests");
    cfg.stream_rep = get_env("STREAM_REP", "folio.cmd.replies");
    cfg.stream_audit = get_env("STREAM_AUDIT", "folio.audit");

    cfg.pg_dsn = get_env("PG_DSN");

    cfg.yahoo_base = get_env("YAHOO_BASE", "https://query1.finance.yahoo.com");
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 8000);
    cfg.provider_max_per_minute = get_env_int("PROVIDER_MAX_PER_MINUTE", 60);

    cfg.price_ttl_seconds = get_env_int("PRICE_TTL_SECONDS", 60);
    cfg.request_deadline_ms = get_env_int("REQUEST_DEADLINE_MS", 3000);

    cfg.recalc_max_attempts = get_env_int("RECALC_MAX_ATTEMPTS", 3);
    cfg.carry_forward_max_days = get_env_int("CARRY_FORWARD_MAX_DAYS", 10);
    cfg.default_account_id = get_env_int64("DEFAULT_ACCOUNT_ID", 1);
    cfg.history_start_date = get_env("HISTORY_START_DATE");
    cfg.snapshot_delay_minutes = get_env_int("SNAPSHOT_DELAY_MINUTES", 30);
    cfg.scheduler_poll_seconds = get_env_int("SCHEDULER_POLL_SECONDS", 60);

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8084);

    cfg.service_name = get_env("SERVICE_NAME", "portfolio");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (pg_dsn.empty()) {
        throw std::runtime_error("PG_DSN is required");
    }
    if (price_ttl_seconds <= 0) {
        throw std::runtime_error("PRICE_TTL_SECONDS must be positive");
    }
    if (request_deadline_ms <= 0 || request_timeout_ms <= 0) {
        throw std::runtime_error("REQUEST_DEADLINE_MS and REQUEST_TIMEOUT_MS must be positive");
    }
    if (provider_max_per_minute <= 0) {
        throw std::runtime_error("PROVIDER_MAX_PER_MINUTE must be positive");
    }
    if (recalc_max_attempts < 1) {
        throw std::runtime_error("RECALC_MAX_ATTEMPTS must be at least 1");
    }
    if (carry_forward_max_days < 0) {
        throw std::runtime_error("CARRY_FORWARD_MAX_DAYS must not be negative");
    }
    if (scheduler_poll_seconds <= 0) {
        throw std::runtime_error("SCHEDULER_POLL_SECONDS must be positive");
    }
    if (!history_start_date.empty() && !Date::try_parse(history_start_date)) {
        throw std::runtime_error("HISTORY_START_DATE must be YYYY-MM-DD: " + history_start_date);
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Database: {}", util::redact_dsn(pg_dsn));
    spdlog::info("  Provider: {} (max {}/min, timeout {}ms)",
                 yahoo_base, provider_max_per_minute, request_timeout_ms);
    spdlog::info("  Price TTL: {}s, request deadline: {}ms", price_ttl_seconds, request_deadline_ms);
    spdlog::info("  Carry-forward window: {} days, default account: {}",
                 carry_forward_max_days, default_account_id);
}
