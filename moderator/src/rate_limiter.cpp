#include "rate_limiter.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace {
constexpr int64_t kMinuteMs = 60 * 1000;
constexpr int64_t kHourMs = 3600 * 1000;
}

SlidingWindowLimiter::SlidingWindowLimiter(int max_per_minute,
                                           int max_per_hour,
                                           int failure_cooldown_seconds,
                                           int throttled_cooldown_seconds,
                                           util::MillisClock clock)
    : max_per_minute_(max_per_minute)
    , max_per_hour_(max_per_hour)
    , failure_cooldown_ms_(static_cast<int64_t>(failure_cooldown_seconds) * 1000)
    , throttled_cooldown_ms_(static_cast<int64_t>(throttled_cooldown_seconds) * 1000)
    , clock_(std::move(clock))
{}

void SlidingWindowLimiter::prune(int64_t now_ms) {
    // Remove old entries
    while (!minute_calls_ms_.empty() && minute_calls_ms_.front() <= now_ms - kMinuteMs) {
        minute_calls_ms_.pop_front();
    }
    while (!hour_calls_ms_.empty() && hour_calls_ms_.front() <= now_ms - kHourMs) {
        hour_calls_ms_.pop_front();
    }
}

RateDecision SlidingWindowLimiter::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);

    int64_t now_ms = clock_();

    if (cooldown_until_ms_ > now_ms) {
        return {false, (cooldown_until_ms_ - now_ms) / 1000.0};
    }

    prune(now_ms);

    int64_t wait_ms = 0;
    if (static_cast<int>(minute_calls_ms_.size()) >= max_per_minute_) {
        wait_ms = std::max(wait_ms, minute_calls_ms_.front() + kMinuteMs - now_ms);
    }
    if (static_cast<int>(hour_calls_ms_.size()) >= max_per_hour_) {
        wait_ms = std::max(wait_ms, hour_calls_ms_.front() + kHourMs - now_ms);
    }

    if (wait_ms > 0) {
        return {false, wait_ms / 1000.0};
    }
    return {true, 0.0};
}

void SlidingWindowLimiter::record_outcome(bool success, bool throttled) {
    std::lock_guard<std::mutex> lock(mutex_);

    int64_t now_ms = clock_();

    if (success) {
        minute_calls_ms_.push_back(now_ms);
        hour_calls_ms_.push_back(now_ms);
        cooldown_until_ms_ = 0;
        return;
    }

    int64_t cooldown_ms = throttled ? throttled_cooldown_ms_ : failure_cooldown_ms_;
    cooldown_until_ms_ = now_ms + cooldown_ms;
    spdlog::warn("Upstream {} - pausing calls for {}s",
                 throttled ? "throttled us" : "call failed", cooldown_ms / 1000);
}

RateWindowSnapshot SlidingWindowLimiter::snapshot() {
    std::lock_guard<std::mutex> lock(mutex_);

    int64_t now_ms = clock_();
    prune(now_ms);

    RateWindowSnapshot snap;
    snap.minute_count = static_cast<int>(minute_calls_ms_.size());
    snap.hour_count = static_cast<int>(hour_calls_ms_.size());
    snap.max_per_minute = max_per_minute_;
    snap.max_per_hour = max_per_hour_;
    snap.cooldown_remaining_seconds =
        cooldown_until_ms_ > now_ms ? (cooldown_until_ms_ - now_ms) / 1000.0 : 0.0;
    return snap;
}

void SlidingWindowLimiter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    minute_calls_ms_.clear();
    hour_calls_ms_.clear();
    cooldown_until_ms_ = 0;
}
