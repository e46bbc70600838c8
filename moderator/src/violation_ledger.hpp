#pragma once

#include "connection_pool.hpp"
#include "ledger_connection.hpp"
#include "util.hpp"
#include <array>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Ban durations by tier; tiers past the third reuse the third duration
struct TierLadder {
    int tier1_seconds = 60;
    int tier2_seconds = 600;
    int tier3_seconds = 86400;

    int duration_for(int tier) const;
};

struct LedgerOptions {
    TierLadder ladder;
    int reset_hour = 4;
    int max_log_days = 30;
    size_t max_text = 500;
};

struct TierStatus {
    int tier = 1;               // tier the next violation would receive
    int stored_count = 0;       // 0 when no record exists
    util::CivilDate as_of;      // violation-day the answer applies to
};

struct RecordedViolation {
    int tier = 1;
    int ban_duration = 0;
    util::CivilDate violation_day;
};

class ViolationLedger {
public:
    ViolationLedger(std::shared_ptr<ConnectionPool> pool,
                    LedgerOptions options,
                    util::LocalClock clock = util::local_now);

    void init_schema();

    // Escalates the pair and persists the new record. Storage failures,
    // PoolExhausted included, propagate.
    RecordedViolation record_violation(const std::string& group_id,
                                       const std::string& user_id,
                                       const std::string& user_name,
                                       const std::vector<std::string>& words,
                                       const std::string& text,
                                       std::optional<int> duration_override = std::nullopt);

    // Read-only; storage failures are logged and answered with tier 1
    TierStatus current_tier(const std::string& group_id, const std::string& user_id);

    std::vector<ViolationRecord> history(const std::string& group_id, const std::string& user_id);
    std::vector<ViolationRecord> group_records(const std::string& group_id, int limit = 20);

    int reset_user(const std::string& group_id, const std::string& user_id);
    int reset_group(const std::string& group_id);

    // Deletes rows older than the retention window; returns rows removed
    int cleanup_expired();

    bool ping();

    PoolStats pool_stats() const { return pool_->stats(); }
    const LedgerOptions& options() const { return options_; }

    static int next_tier(const std::optional<ViolationRecord>& previous, const util::CivilDate& today);

private:
    static constexpr size_t kLockStripes = 64;

    std::shared_ptr<ConnectionPool> pool_;
    LedgerOptions options_;
    util::LocalClock clock_;

    std::array<std::mutex, kLockStripes> pair_locks_;

    std::mutex& lock_for(const std::string& group_id, const std::string& user_id);
    util::CivilDate today() const;
    int purge_before(const util::CivilDate& cutoff);
};
