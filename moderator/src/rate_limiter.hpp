#pragma once

#include "util.hpp"
#include <deque>
#include <mutex>
#include <cstdint>

struct RateDecision {
    bool permitted;
    double retry_after_seconds;
};

struct RateWindowSnapshot {
    int minute_count;
    int hour_count;
    int max_per_minute;
    int max_per_hour;
    double cooldown_remaining_seconds;
};

// Minute/hour budget on upstream calls plus a cooldown after failures.
// Never blocks; callers decide whether to wait out retry_after_seconds.
class SlidingWindowLimiter {
public:
    SlidingWindowLimiter(int max_per_minute,
                         int max_per_hour,
                         int failure_cooldown_seconds = 30,
                         int throttled_cooldown_seconds = 60,
                         util::MillisClock clock = util::current_timestamp_ms);

    RateDecision try_acquire();

    // throttled marks a failure caused by an upstream 429
    void record_outcome(bool success, bool throttled = false);

    RateWindowSnapshot snapshot();
    void reset();

private:
    const int max_per_minute_;
    const int max_per_hour_;
    const int64_t failure_cooldown_ms_;
    const int64_t throttled_cooldown_ms_;
    util::MillisClock clock_;

    std::mutex mutex_;
    std::deque<int64_t> minute_calls_ms_;
    std::deque<int64_t> hour_calls_ms_;
    int64_t cooldown_until_ms_ = 0;

    void prune(int64_t now_ms);
};
