#include "scheduler.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <thread>

SnapshotScheduler::SnapshotScheduler(std::shared_ptr<SnapshotReconstructor> reconstructor,
                                     std::shared_ptr<BackfillQueue> queue,
                                     std::shared_ptr<MarketCalendar> calendar,
                                     std::shared_ptr<Clock> clock,
                                     int snapshot_delay_minutes)
    : reconstructor_(std::move(reconstructor))
    , queue_(std::move(queue))
    , calendar_(std::move(calendar))
    , clock_(std::move(clock))
    , snapshot_delay_(snapshot_delay_minutes)
{}

void SnapshotScheduler::tick() {
    auto now = clock_->now();
    Date today = calendar_->trading_date(now);

    // First tick after start-up, then once per calendar day.
    if (last_fill_date_ != today) {
        queue_->submit_fill_missing();
        last_fill_date_ = today;
    }

    if (last_snapshot_date_ == today || !calendar_->is_trading_day(today)) {
        return;
    }
    if (now < calendar_->session_close(today) + snapshot_delay_) {
        return;
    }

    int written = reconstructor_->create_for_date(today, SnapshotSource::COMPUTED);
    last_snapshot_date_ = today;
    spdlog::info("Daily snapshot for {} written ({} accounts)", today.to_string(), written);
}

void SnapshotScheduler::run(std::chrono::seconds poll, std::atomic<bool>& running) {
    spdlog::info("Starting snapshot scheduler (poll every {}s)", poll.count());

    while (running) {
        auto tick_start = util::current_timestamp_ms();

        try {
            tick();
        } catch (const std::exception& e) {
            spdlog::error("Snapshot scheduler error: {}", e.what());
        }

        // Sleep in short steps so shutdown is prompt.
        auto wake = tick_start + poll.count() * 1000;
        while (running && util::current_timestamp_ms() < wake) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }

    spdlog::info("Snapshot scheduler stopped");
}
