#include "config.hpp"
#include "redis_bus.hpp"
#include "postgres_store.hpp"
#include "rate_limiter.hpp"
#include "yahoo_client.hpp"
#include "market_hours.hpp"
#include "clock.hpp"
#include "ledger.hpp"
#include "holdings.hpp"
#include "price_cache.hpp"
#include "close_price_cache.hpp"
#include "snapshots.hpp"
#include "backfill_queue.hpp"
#include "scheduler.hpp"
#include "valuation.hpp"
#include "commands.hpp"
#include "health.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("folio", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void command_consumer_loop(std::shared_ptr<Config> config,
                           std::shared_ptr<RedisBus> redis,
                           std::shared_ptr<CommandRouter> router,
                           std::atomic<bool>& running) {
    spdlog::info("Starting command consumer");

    const std::string group = "portfolio";
    const std::string consumer = config->service_name + "-1";
    redis->create_consumer_group(config->stream_req, group);

    while (running) {
        try {
            auto messages = redis->read_commands(config->stream_req, group, consumer, 10, 1000);

            for (const auto& msg : messages) {
                auto reply = router->handle(msg.payload);
                try {
                    redis->publish_reply(config->stream_rep, reply);
                } catch (const std::exception& e) {
                    // Left pending so it is redelivered once Redis is back.
                    spdlog::error("Reply for {} not delivered: {}", msg.id, e.what());
                    continue;
                }
                redis->ack_message(config->stream_req, group, msg.id);
            }
        } catch (const std::exception& e) {
            spdlog::error("Command consumer error: {}", e.what());
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }

    spdlog::info("Command consumer stopped");
}

int main(int argc, char* argv[]) {
    try {
        auto config = std::make_shared<Config>(Config::from_env());
        setup_logging(config->log_level);

        spdlog::info("==============================================");
        spdlog::info("FolioTrack Portfolio Engine v1.0");
        spdlog::info("==============================================");

        config->validate();
        spdlog::info("Postgres: {}", util::redact_dsn(config->pg_dsn));

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        std::optional<Date> history_start;
        if (!config->history_start_date.empty()) {
            history_start = Date::parse(config->history_start_date);
        }

        // Infrastructure
        auto redis = std::make_shared<RedisBus>(config->redis_url);
        auto pg = std::make_shared<PostgresStore>(config->pg_dsn);
        pg->init_schema();

        auto clock = std::make_shared<SystemClock>();
        auto calendar = std::make_shared<MarketCalendar>();
        auto limiter = std::make_shared<RateLimiter>(config->provider_max_per_minute);
        auto yahoo = std::make_shared<YahooFinanceClient>(config->yahoo_base,
                                                          config->request_timeout_ms, limiter);

        // Prices
        auto prices = std::make_shared<PriceCache>(yahoo, clock, calendar,
                                                   std::chrono::seconds(config->price_ttl_seconds),
                                                   std::chrono::milliseconds(config->request_deadline_ms),
                                                   pg);
        prices->warm(pg->load_prices());
        auto closes = std::make_shared<ClosePriceCache>(yahoo, calendar, clock,
                                                        config->carry_forward_max_days);

        // Ledger and derived state
        auto ledger = std::make_shared<TransactionLedger>(pg, pg, pg, clock, config->default_account_id);
        auto holdings = std::make_shared<HoldingsCalculator>(ledger, pg, clock, config->recalc_max_attempts);
        auto snapshots = std::make_shared<SnapshotReconstructor>(ledger, pg, prices, closes,
                                                                 calendar, clock, history_start);
        auto queue = std::make_shared<BackfillQueue>(snapshots);
        auto valuation = std::make_shared<ValuationFacade>(ledger, holdings, prices, snapshots,
                                                           pg, calendar, clock);
        auto scheduler = std::make_shared<SnapshotScheduler>(snapshots, queue, calendar, clock,
                                                             config->snapshot_delay_minutes);

        ledger->add_listener([holdings](int64_t user_id, int64_t, const Date&) {
            holdings->recalculate(user_id);
        });
        ledger->add_listener([queue](int64_t user_id, int64_t account_id, const Date& from) {
            spdlog::info("History for account {} invalidated from {} (user {})",
                         account_id, from.to_string(), user_id);
            queue->submit_fill_missing();
        });

        auto router = std::make_shared<CommandRouter>(ledger, holdings, valuation, snapshots, queue);
        router->set_audit_sink([redis, config](const nlohmann::json& event) {
            redis->publish_audit(config->stream_audit, event);
        });

        auto health = std::make_shared<HealthCheck>(config->service_name, redis, pg, yahoo, queue);

        // Workers
        std::atomic<bool> consumer_running{true};
        std::thread consumer_thread(command_consumer_loop, config, redis, router,
                                    std::ref(consumer_running));

        std::atomic<bool> scheduler_running{true};
        std::thread scheduler_thread([scheduler, config, &scheduler_running]() {
            scheduler->run(std::chrono::seconds(config->scheduler_poll_seconds), scheduler_running);
        });

        // HTTP health server
        httplib::Server server;

        server.Get("/health", [health](const httplib::Request&, httplib::Response& res) {
            auto [status, healthy] = health->get_status();
            res.set_content(status.dump(), "application/json");
            res.status = healthy ? 200 : 503;
        });

        std::thread http_thread([&server, config]() {
            spdlog::info("Starting HTTP server on {}:{}", config->listen_addr, config->listen_port);
            server.listen(config->listen_addr.c_str(), config->listen_port);
        });

        spdlog::info("Portfolio engine started");

        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        spdlog::info("Stopping services...");
        consumer_running = false;
        scheduler_running = false;
        server.stop();

        if (consumer_thread.joinable()) consumer_thread.join();
        if (scheduler_thread.joinable()) scheduler_thread.join();
        if (http_thread.joinable()) http_thread.join();
        queue->shutdown();

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
