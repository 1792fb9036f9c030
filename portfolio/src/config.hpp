#pragma once

#include <string>
#include <cstdlib>
#include <cstdint>

struct Config {
    // Redis
    std::string redis_url;
    std::string stream_req;
    std::string stream_rep;
    std::string stream_audit;

    // Postgres
    std::string pg_dsn;

    // Market data provider
    std::string yahoo_base;
    int request_timeout_ms;
    int provider_max_per_minute;

    // Price cache
    int price_ttl_seconds;
    int request_deadline_ms;

    // Holdings and snapshots
    int recalc_max_attempts;
    int carry_forward_max_days;
    int64_t default_account_id;
    std::string history_start_date;  // empty = no floor
    int snapshot_delay_minutes;
    int scheduler_poll_seconds;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static int64_t get_env_int64(const char* name, int64_t default_val);
};
