#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(std::string service_name,
                         std::shared_ptr<RedisBus> redis,
                         std::shared_ptr<PostgresStore> pg,
                         std::shared_ptr<QuoteProvider> provider,
                         std::shared_ptr<BackfillQueue> queue)
    : service_name_(std::move(service_name))
    , redis_(std::move(redis))
    , pg_(std::move(pg))
    , provider_(std::move(provider))
    , queue_(std::move(queue)) {}

std::pair<nlohmann::json, bool> HealthCheck::get_status() const {
    bool redis_ok = redis_->ping();
    bool pg_ok = pg_->ping();
    bool provider_ok = provider_->is_healthy();
    bool healthy = redis_ok && pg_ok;

    nlohmann::json status = {
        {"ok", healthy},
        {"service", service_name_},
        {"redis", redis_ok},
        {"postgres", pg_ok},
        {"market_data", provider_ok ? "up" : "degraded"},
        {"backfill_pending", queue_->pending()},
        {"ts", util::current_iso8601()}
    };

    return {status, healthy};
}
