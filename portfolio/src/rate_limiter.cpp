#include "rate_limiter.hpp"
#include <algorithm>
#include <thread>

RateLimiter::RateLimiter(int max_per_minute) : max_per_minute_(max_per_minute) {}

void RateLimiter::cleanup_old(std::chrono::steady_clock::time_point now) {
    auto window_start = now - std::chrono::minutes(1);
    while (!call_times_.empty() && call_times_.front() <= window_start) {
        call_times_.pop_front();
    }
}

bool RateLimiter::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::steady_clock::now();
    cleanup_old(now);

    if (static_cast<int>(call_times_.size()) >= max_per_minute_) {
        return false;
    }

    call_times_.push_back(now);
    return true;
}

bool RateLimiter::acquire_until(std::chrono::steady_clock::time_point deadline) {
    while (true) {
        std::chrono::steady_clock::time_point next_free;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto now = std::chrono::steady_clock::now();
            cleanup_old(now);
            if (static_cast<int>(call_times_.size()) < max_per_minute_) {
                call_times_.push_back(now);
                return true;
            }
            next_free = call_times_.front() + std::chrono::minutes(1);
        }
        if (next_free > deadline) {
            return false;
        }
        std::this_thread::sleep_until(std::min(next_free, deadline));
    }
}

int RateLimiter::get_current_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto window_start = std::chrono::steady_clock::now() - std::chrono::minutes(1);
    return static_cast<int>(std::count_if(call_times_.begin(), call_times_.end(),
        [&](const auto& t) { return t > window_start; }));
}
