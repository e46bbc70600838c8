#include "retry_policy.hpp"
#include <algorithm>
#include <utility>

RetryPolicy::RetryPolicy(RetryOptions options, RetrySleeper sleeper)
    : options_(std::move(options))
    , sleeper_(std::move(sleeper))
{}

std::chrono::milliseconds RetryPolicy::delay_for(int attempt) const {
    int shift = std::min(attempt, 30);
    int64_t base = options_.base_delay.count();
    int64_t exponential = std::min<int64_t>(options_.max_delay.count(), base << shift);

    // Deterministic spread so callers failing together do not retry in lockstep
    int64_t jitter = 0;
    if (options_.jitter_max.count() > 0) {
        jitter = (static_cast<int64_t>(attempt + 1) * 7919) % (options_.jitter_max.count() + 1);
    }

    return std::chrono::milliseconds(exponential + jitter);
}
