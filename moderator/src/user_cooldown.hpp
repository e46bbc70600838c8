#pragma once

#include "util.hpp"
#include <mutex>
#include <string>
#include <unordered_map>

// Per-user message gate, independent of the upstream API limiter.
// A user is checked at most once per cooldown window.
class UserCooldownGate {
public:
    UserCooldownGate(bool enabled,
                     int cooldown_seconds,
                     util::MillisClock clock = util::current_timestamp_ms);

    // Records the check when allowed
    bool allow(const std::string& group_id, const std::string& user_id);

    size_t prune();
    size_t tracked() const;
    bool enabled() const { return enabled_; }

private:
    const bool enabled_;
    const int64_t cooldown_ms_;
    util::MillisClock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, int64_t> last_check_ms_;
};
