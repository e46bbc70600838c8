#include "user_cooldown.hpp"
#include <spdlog/spdlog.h>
#include <utility>

UserCooldownGate::UserCooldownGate(bool enabled, int cooldown_seconds, util::MillisClock clock)
    : enabled_(enabled)
    , cooldown_ms_(static_cast<int64_t>(cooldown_seconds) * 1000)
    , clock_(std::move(clock))
{}

bool UserCooldownGate::allow(const std::string& group_id, const std::string& user_id) {
    if (!enabled_) {
        return true;
    }

    std::string key = group_id + ":" + user_id;
    int64_t now_ms = clock_();

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = last_check_ms_.find(key);
    if (it != last_check_ms_.end() && now_ms - it->second < cooldown_ms_) {
        return false;
    }

    last_check_ms_[key] = now_ms;
    return true;
}

size_t UserCooldownGate::prune() {
    int64_t now_ms = clock_();

    std::lock_guard<std::mutex> lock(mutex_);

    size_t removed = 0;
    for (auto it = last_check_ms_.begin(); it != last_check_ms_.end();) {
        if (now_ms - it->second >= cooldown_ms_) {
            it = last_check_ms_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        spdlog::debug("Pruned {} user cooldown entries", removed);
    }
    return removed;
}

size_t UserCooldownGate::tracked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_check_ms_.size();
}
