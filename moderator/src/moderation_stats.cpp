#include "moderation_stats.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {

template <typename TallyMap>
nlohmann::json top_entries(const TallyMap& tallies, size_t top_n, const char* key_name) {
    std::vector<std::pair<std::string, int64_t>> ranked;
    ranked.reserve(tallies.size());
    for (const auto& [key, tally] : tallies) {
        ranked.emplace_back(key, tally.total);
    }

    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) {
            return a.second > b.second;
        }
        return a.first < b.first;
    });

    nlohmann::json out = nlohmann::json::array();
    for (size_t i = 0; i < ranked.size() && i < top_n; i++) {
        const auto& tally = tallies.at(ranked[i].first);
        out.push_back({{key_name, ranked[i].first}, {"total", tally.total}, {"bans", tally.bans}});
    }
    return out;
}

template <typename TallyMap>
size_t drop_smallest(TallyMap& tallies, size_t max_entries) {
    if (tallies.size() <= max_entries) {
        return 0;
    }

    std::vector<std::pair<int64_t, std::string>> ranked;
    ranked.reserve(tallies.size());
    for (const auto& [key, tally] : tallies) {
        ranked.emplace_back(tally.total, key);
    }

    size_t excess = tallies.size() - max_entries;
    std::nth_element(ranked.begin(), ranked.begin() + excess - 1, ranked.end());
    for (size_t i = 0; i < excess; i++) {
        tallies.erase(ranked[i].second);
    }
    return excess;
}

} // namespace

ModerationStats::ModerationStats(bool enabled) : enabled_(enabled) {}

void ModerationStats::record_clean() {
    if (!enabled_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    total_checks_++;
}

void ModerationStats::record_unknown() {
    if (!enabled_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    total_checks_++;
    unknown_++;
}

void ModerationStats::record_violation(const std::string& group_id,
                                       const std::string& user_id,
                                       const std::vector<std::string>& words,
                                       bool banned) {
    if (!enabled_) return;
    std::lock_guard<std::mutex> lock(mutex_);

    total_checks_++;
    detected_++;
    if (banned) {
        auto_bans_++;
    }

    auto& group = by_group_[group_id];
    group.total++;
    group.users.insert(user_id);
    if (banned) {
        group.bans++;
    }

    auto& user = by_user_[group_id + ":" + user_id];
    user.total++;
    if (banned) {
        user.bans++;
    }

    for (const auto& word : words) {
        auto& tally = by_word_[word];
        tally.total++;
        if (banned) {
            tally.bans++;
        }
    }
}

int64_t ModerationStats::total_checks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_checks_;
}

int64_t ModerationStats::detected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return detected_;
}

int64_t ModerationStats::unknown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unknown_;
}

int64_t ModerationStats::auto_bans() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return auto_bans_;
}

nlohmann::json ModerationStats::to_json(size_t top_n) const {
    std::lock_guard<std::mutex> lock(mutex_);

    double rate = total_checks_ > 0
        ? static_cast<double>(detected_) * 100.0 / static_cast<double>(total_checks_)
        : 0.0;

    nlohmann::json groups = nlohmann::json::object();
    for (const auto& [group_id, tally] : by_group_) {
        groups[group_id] = {
            {"total", tally.total},
            {"bans", tally.bans},
            {"users", tally.users.size()}
        };
    }

    return {
        {"enabled", enabled_},
        {"total_checks", total_checks_},
        {"detected", detected_},
        {"unknown", unknown_},
        {"auto_bans", auto_bans_},
        {"detection_rate", rate},
        {"groups", groups},
        {"top_users", top_entries(by_user_, top_n, "user")},
        {"top_words", top_entries(by_word_, top_n, "word")}
    };
}

size_t ModerationStats::prune(size_t max_entries) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t removed = drop_smallest(by_user_, max_entries) + drop_smallest(by_word_, max_entries);
    if (removed > 0) {
        spdlog::debug("Pruned {} user and word tallies", removed);
    }
    return removed;
}

void ModerationStats::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    total_checks_ = 0;
    detected_ = 0;
    unknown_ = 0;
    auto_bans_ = 0;
    by_group_.clear();
    by_user_.clear();
    by_word_.clear();
}
