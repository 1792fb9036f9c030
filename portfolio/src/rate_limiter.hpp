#pragma once

#include <chrono>
#include <deque>
#include <mutex>

// Sliding one-minute window over outbound provider calls.
class RateLimiter {
public:
    explicit RateLimiter(int max_per_minute);

    bool try_acquire();
    // Blocks until a slot frees up or the deadline passes.
    bool acquire_until(std::chrono::steady_clock::time_point deadline);
    int get_current_count() const;

private:
    int max_per_minute_;
    mutable std::mutex mutex_;
    std::deque<std::chrono::steady_clock::time_point> call_times_;

    void cleanup_old(std::chrono::steady_clock::time_point now);
};
