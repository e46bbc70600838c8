#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

// In-process moderation counters. Ephemeral: nothing here survives a restart.
class ModerationStats {
public:
    explicit ModerationStats(bool enabled = true);

    void record_clean();
    void record_unknown();
    void record_violation(const std::string& group_id,
                          const std::string& user_id,
                          const std::vector<std::string>& words,
                          bool banned);

    int64_t total_checks() const;
    int64_t detected() const;
    int64_t unknown() const;
    int64_t auto_bans() const;

    // Summary with the top_n users and words by hit count
    nlohmann::json to_json(size_t top_n = 10) const;

    // Keeps the max_entries users and words with the most hits; returns entries dropped
    size_t prune(size_t max_entries);

    void reset();
    bool enabled() const { return enabled_; }

private:
    struct Tally {
        int64_t total = 0;
        int64_t bans = 0;
    };

    struct GroupTally {
        int64_t total = 0;
        int64_t bans = 0;
        std::set<std::string> users;
    };

    const bool enabled_;

    mutable std::mutex mutex_;
    int64_t total_checks_ = 0;
    int64_t detected_ = 0;
    int64_t unknown_ = 0;
    int64_t auto_bans_ = 0;
    std::map<std::string, GroupTally> by_group_;
    std::map<std::string, Tally> by_user_;
    std::map<std::string, Tally> by_word_;
};
