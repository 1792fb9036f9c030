#pragma once

#include "snapshots.hpp"
#include "backfill_queue.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

// Creates today's snapshot after the close and keeps history gap-free.
class SnapshotScheduler {
public:
    SnapshotScheduler(std::shared_ptr<SnapshotReconstructor> reconstructor,
                      std::shared_ptr<BackfillQueue> queue,
                      std::shared_ptr<MarketCalendar> calendar,
                      std::shared_ptr<Clock> clock,
                      int snapshot_delay_minutes);

    // One scheduling pass.
    void tick();

    // Ticks every poll interval until running goes false.
    void run(std::chrono::seconds poll, std::atomic<bool>& running);

    std::optional<Date> last_snapshot_date() const { return last_snapshot_date_; }

private:
    std::shared_ptr<SnapshotReconstructor> reconstructor_;
    std::shared_ptr<BackfillQueue> queue_;
    std::shared_ptr<MarketCalendar> calendar_;
    std::shared_ptr<Clock> clock_;
    std::chrono::minutes snapshot_delay_;

    std::optional<Date> last_snapshot_date_;
    std::optional<Date> last_fill_date_;
};
