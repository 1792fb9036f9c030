#pragma once

#include "redis_bus.hpp"
#include "postgres_store.hpp"
#include "quote_provider.hpp"
#include "backfill_queue.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

class HealthCheck {
public:
    HealthCheck(std::string service_name,
                std::shared_ptr<RedisBus> redis,
                std::shared_ptr<PostgresStore> pg,
                std::shared_ptr<QuoteProvider> provider,
                std::shared_ptr<BackfillQueue> queue);

    // Status document and whether the service can take traffic.
    std::pair<nlohmann::json, bool> get_status() const;

private:
    std::string service_name_;
    std::shared_ptr<RedisBus> redis_;
    std::shared_ptr<PostgresStore> pg_;
    std::shared_ptr<QuoteProvider> provider_;
    std::shared_ptr<BackfillQueue> queue_;
};
